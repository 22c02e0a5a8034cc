#include "PlanEngine.h"

#include <wx/log.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace
{
// Builds an Entry for 'dirEntry'; returns false when the entry cannot be classified
bool SnapshotEntry(const fs::directory_entry &dirEntry, Entry &out)
{
	std::error_code typeEc;
	const bool isDirectory = dirEntry.is_directory(typeEc);
	if (typeEc)
	{
		wxLogDebug("Skipping '%s': %s", dirEntry.path().string().c_str(), typeEc.message().c_str());
		return false;
	}

	out.FullPath = dirEntry.path();
	out.IsDirectory = isDirectory;
	out.SizeBytes = 0;
	out.LastModified.reset();

	std::error_code sizeEc;
	if (!isDirectory && dirEntry.is_regular_file(sizeEc) && !sizeEc)
	{
		const std::uintmax_t size = dirEntry.file_size(sizeEc);
		out.SizeBytes = sizeEc ? 0 : size;
	}

	std::error_code timeEc;
	const fs::file_time_type lastWrite = dirEntry.last_write_time(timeEc);
	if (!timeEc)
	{
		out.LastModified = PlanEngine::FileTimeToTimeT(lastWrite);
	}
	return true;
}
} // namespace

std::size_t PlanEngine::PathDepth(const fs::path &path)
{
	return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

// Enumerates the children (or all descendants) of 'root', deepest paths first
std::vector<Entry> PlanEngine::Walk(const fs::path &root, bool recursive, bool includeFiles, bool includeDirs)
{
	std::error_code ec;
	const fs::file_status rootStatus = fs::status(root, ec);
	if (ec || !fs::exists(rootStatus))
	{
		if (!ec || ec == std::errc::no_such_file_or_directory)
		{
			throw RenameException(RenameErrorKind::NotFound, "Folder does not exist: " + root.string(), root);
		}
		throw RenameException(RenameErrorKind::Access, "Cannot access folder '" + root.string() + "': " + ec.message(), root);
	}
	if (!fs::is_directory(rootStatus))
	{
		throw RenameException(RenameErrorKind::NotFound, "Not a folder: " + root.string(), root);
	}

	std::vector<Entry> entries;
	auto processEntry = [&](const fs::directory_entry &dirEntry)
	{
		Entry entry;
		if (!SnapshotEntry(dirEntry, entry))
		{
			return;
		}
		if (entry.IsDirectory ? !includeDirs : !includeFiles)
		{
			return;
		}
		entries.push_back(std::move(entry));
	};

	const auto scanOptions = fs::directory_options::skip_permission_denied;
	try
	{
		if (recursive)
		{
			for (const auto &dirEntry : fs::recursive_directory_iterator(root, scanOptions))
			{
				processEntry(dirEntry);
			}
		}
		else
		{
			for (const auto &dirEntry : fs::directory_iterator(root, scanOptions))
			{
				processEntry(dirEntry);
			}
		}
	}
	catch (const fs::filesystem_error &e)
	{
		const fs::path where = e.path1().empty() ? root : e.path1();
		if (e.code() == std::errc::no_such_file_or_directory)
		{
			throw RenameException(RenameErrorKind::NotFound, "Folder vanished during scan: " + where.string(), where);
		}
		throw RenameException(RenameErrorKind::Access, "Cannot read folder '" + where.string() + "': " + e.code().message(), where);
	}

	// Deepest first so renaming a folder never disturbs descendants still waiting their turn
	std::sort(entries.begin(), entries.end(),
			  [](const Entry &a, const Entry &b)
			  {
				  const std::size_t depthA = PathDepth(a.FullPath);
				  const std::size_t depthB = PathDepth(b.FullPath);
				  if (depthA != depthB)
				  {
					  return depthA > depthB;
				  }
				  return a.FullPath.native() < b.FullPath.native();
			  });
	return entries;
}
