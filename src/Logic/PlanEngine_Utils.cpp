#include "PlanEngine.h"

#include <wx/string.h>
#include <wx/tokenzr.h> // For splitting comma-separated extension string

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

// Case-insensitive string comparison
bool PlanEngine::iequals(const std::string &a, const std::string &b)
{
	if (a.length() != b.length())
	{
		return false;
	}
	return std::equal(a.begin(), a.end(), b.begin(), b.end(),
					  [](char char_a, char char_b)
					  {
						  return std::tolower(static_cast<unsigned char>(char_a)) ==
								 std::tolower(static_cast<unsigned char>(char_b));
					  });
}

// Converts string to lowercase
std::string ToLower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return s;
}

bool PlanEngine::IsCaseInsensitiveFilesystem()
{
#if defined(_WIN32) || defined(__APPLE__)
	return true;
#else
	return false;
#endif
}

// Parses ".txt, md,.CSV" into {".txt", ".md", ".csv"}
std::set<std::string> PlanEngine::ParseExtensionList(const std::string &commaSeparated)
{
	std::set<std::string> extensions;
	wxStringTokenizer tokenizer(wxString::FromUTF8(commaSeparated), ",");
	while (tokenizer.HasMoreTokens())
	{
		wxString token = tokenizer.GetNextToken();
		std::string ext = ToLower(std::string(token.Trim().Trim(false).utf8_str()));
		if (ext.empty())
		{
			continue;
		}
		if (ext[0] != '.')
		{
			ext = "." + ext; // Ensure leading dot for consistent matching
		}
		extensions.insert(ext);
	}
	return extensions;
}

std::string PlanEngine::FormatTimestamp(const std::tm &time)
{
	std::ostringstream oss;
	oss << std::put_time(&time, "%Y-%m-%d_%H-%M-%S");
	return oss.str();
}

// 1536 -> "1.5 KB"
std::string PlanEngine::HumanReadableSize(std::uintmax_t numBytes)
{
	static const char *const units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
	double value = static_cast<double>(numBytes);
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1);
	for (const char *unit : units)
	{
		if (value < 1024.0)
		{
			oss << value << ' ' << unit;
			return oss.str();
		}
		value /= 1024.0;
	}
	oss << value << " PB";
	return oss.str();
}

std::time_t PlanEngine::FileTimeToTimeT(const fs::file_time_type &fileTime)
{
	auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
		fileTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
	return std::chrono::system_clock::to_time_t(sctp);
}

std::tm PlanEngine::ToLocalTime(std::time_t time)
{
	std::tm time_tm = {};
#ifdef _WIN32
	localtime_s(&time_tm, &time);
#else
	localtime_r(&time, &time_tm);
#endif
	return time_tm;
}

const char *PlanEngine::ErrorKindName(RenameErrorKind kind)
{
	switch (kind)
	{
	case RenameErrorKind::Validation:
		return "Validation";
	case RenameErrorKind::NotFound:
		return "NotFound";
	case RenameErrorKind::Access:
		return "Access";
	case RenameErrorKind::Dependency:
		return "Dependency";
	case RenameErrorKind::ResourceExhausted:
		return "ResourceExhausted";
	case RenameErrorKind::Partial:
		return "Partial";
	}
	return "Unknown";
}

// Maps a filesystem error code onto the engine's error kinds
RenameError PlanEngine::ErrorFromCode(const std::error_code &ec, const std::string &context, const fs::path &path)
{
	const RenameErrorKind kind = (ec == std::errc::no_such_file_or_directory) ? RenameErrorKind::NotFound
																			  : RenameErrorKind::Access;
	return RenameError{kind, context + ": " + ec.message(), path};
}
