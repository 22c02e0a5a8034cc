#include "PlanEngine.h"

#include <set>
#include <string>
#include <vector>

namespace // Anonymous namespace for internal linkage helper functions
{
// Length of the UTF-8 sequence introduced by 'lead'; stray continuation bytes count as one
std::size_t SequenceLength(unsigned char lead)
{
	if (lead >= 0xF0 && lead <= 0xF7)
		return 4;
	if (lead >= 0xE0)
		return (lead <= 0xEF) ? 3 : 1;
	if (lead >= 0xC0)
		return 2;
	return 1;
}

// Splits a UTF-8 string into one substring per code point
std::vector<std::string> SplitCodePoints(const std::string &text)
{
	std::vector<std::string> out;
	out.reserve(text.size());
	std::size_t pos = 0;
	while (pos < text.size())
	{
		std::size_t len = SequenceLength(static_cast<unsigned char>(text[pos]));
		if (pos + len > text.size())
		{
			len = text.size() - pos;
		}
		out.push_back(text.substr(pos, len));
		pos += len;
	}
	return out;
}

bool IsStripWhitespace(char c)
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string Strip(const std::string &text)
{
	std::size_t begin = 0;
	while (begin < text.size() && IsStripWhitespace(text[begin]))
	{
		++begin;
	}
	std::size_t end = text.size();
	while (end > begin && IsStripWhitespace(text[end - 1]))
	{
		--end;
	}
	return text.substr(begin, end - begin);
}

// Collapses every run of the characters accepted by 'inRun' into a single '_'
template <typename Pred>
std::string CollapseRuns(const std::string &text, Pred inRun)
{
	std::string out;
	out.reserve(text.size());
	bool previousInRun = false;
	for (char c : text)
	{
		if (inRun(c))
		{
			if (!previousInRun)
			{
				out.push_back('_');
			}
			previousInRun = true;
		}
		else
		{
			out.push_back(c);
			previousInRun = false;
		}
	}
	return out;
}

// Appends '_' to reserved device stems, then drops trailing spaces and dots from the stem
std::string GuardReservedName(const std::string &name)
{
	const std::size_t dot = name.find('.');
	std::string stem = (dot == std::string::npos) ? name : name.substr(0, dot);
	const std::string rest = (dot == std::string::npos) ? std::string() : name.substr(dot);

	if (PlanEngine::ReservedDeviceNames.count(ToLower(stem)))
	{
		stem += '_';
	}
	while (!stem.empty() && (stem.back() == ' ' || stem.back() == '.'))
	{
		stem.pop_back();
	}
	return stem + rest;
}

std::string SanitizeOnce(const std::string &name, const std::set<std::string> &bad, const std::string &replacement)
{
	const bool useReplacement = PlanEngine::CountCodePoints(replacement) == 1;

	std::string text;
	text.reserve(name.size());
	for (const auto &cp : SplitCodePoints(name))
	{
		if (bad.count(cp))
		{
			if (useReplacement)
			{
				text += replacement;
			}
		}
		else
		{
			text += cp;
		}
	}

	text = CollapseRuns(Strip(text), [](char c) { return c == ' ' || c == '\t'; });
	text = CollapseRuns(text, [](char c) { return c == '_'; });
	text = GuardReservedName(text);
	if (text.empty() || text == "." || text == "..")
	{
		return "_";
	}
	return text;
}
} // namespace

std::size_t PlanEngine::CountCodePoints(const std::string &text)
{
	return SplitCodePoints(text).size();
}

// Cleans 'name' by removing or replacing bad characters and normalising whitespace and underscores
std::string PlanEngine::Sanitize(const std::string &name, const std::string &badChars, const std::string &replacement)
{
	const std::vector<std::string> badList = SplitCodePoints(badChars);
	const std::set<std::string> bad(badList.begin(), badList.end());

	// Underscores produced by collapsing can themselves be bad characters; settle on a fixed point
	std::string current = SanitizeOnce(name, bad, replacement);
	for (int pass = 0; pass < 4; ++pass)
	{
		std::string next = SanitizeOnce(current, bad, replacement);
		if (next == current)
		{
			break;
		}
		current = std::move(next);
	}
	return current;
}
