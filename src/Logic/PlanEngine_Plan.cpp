#include "PlanEngine.h"
#include "MetadataReader.h"

#include <wx/log.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace
{
bool HasPathSeparator(const std::string &text)
{
#ifdef _WIN32
	return text.find_first_of("/\\") != std::string::npos;
#else
	return text.find('/') != std::string::npos;
#endif
}

// A generated name must stay a single component of the source's own folder
bool IsUsableName(const std::string &name)
{
	return !name.empty() && name != "." && name != ".." && !HasPathSeparator(name);
}

// Entries sorted by natural path order, as numbering and metadata modes visit them
std::vector<Entry> SortedByPath(const std::vector<Entry> &entries)
{
	std::vector<Entry> ordered = entries;
	std::sort(ordered.begin(), ordered.end(),
			  [](const Entry &a, const Entry &b) { return a.FullPath < b.FullPath; });
	return ordered;
}
} // namespace

// Extension allow-list applies to files only; folders always pass
bool PlanEngine::PassesExtensionFilter(const Entry &entry, const RenameConfig &config)
{
	if (entry.IsDirectory || config.extensionFilter.empty())
	{
		return true;
	}
	return config.extensionFilter.count(ToLower(entry.FullPath.extension().string())) != 0;
}

// Allocates a collision-free target for 'desiredPath' and records the operation unless it is a no-op
void PlanEngine::AppendOperation(std::vector<RenameOperation> &plan, const Entry &entry, const fs::path &desiredPath,
								 ClaimedPathSet &claimed)
{
	if (desiredPath == entry.FullPath)
	{
		claimed.insert(ClaimKey(desiredPath));
		return;
	}
	fs::path target = Allocate(desiredPath, claimed);
	if (target != entry.FullPath)
	{
		plan.push_back({entry, std::move(target)});
	}
}

void PlanEngine::OrderDeepestFirst(std::vector<RenameOperation> &plan)
{
	std::stable_sort(plan.begin(), plan.end(),
					 [](const RenameOperation &a, const RenameOperation &b)
					 {
						 return PathDepth(a.Source.FullPath) > PathDepth(b.Source.FullPath);
					 });
}

std::vector<RenameOperation> PlanEngine::GenerateStandard(const std::vector<Entry> &entries, const RenameConfig &config,
														  const StandardStrategy &strategy, PlanResult &results)
{
	std::vector<RenameOperation> plan;
	ClaimedPathSet claimed;
	const std::string badChars = strategy.badChars.empty() ? std::string(DefaultBadChars) : strategy.badChars;

	for (const auto &entry : entries)
	{
		if (!PassesExtensionFilter(entry, config))
		{
			continue;
		}
		const std::string originalName = entry.FullPath.filename().string();
		const std::string newName = Sanitize(originalName, badChars, strategy.replacement);
		if (newName == originalName)
		{
			continue;
		}
		if (!IsUsableName(newName))
		{
			results.warningLog.push_back("Skipping '" + originalName + "': cleaning produced an invalid name '" + newName + "'");
			continue;
		}
		if (IsCaseInsensitiveFilesystem() && iequals(newName, originalName))
		{
			results.generalInfoLog.push_back("Skipping '" + originalName + "' (new name differs only in case)");
			continue;
		}
		AppendOperation(plan, entry, entry.FullPath.parent_path() / newName, claimed);
	}
	return plan;
}

std::vector<RenameOperation> PlanEngine::GenerateSequential(const std::vector<Entry> &entries, const RenameConfig &config,
															const SequentialStrategy &strategy, PlanResult &results)
{
	std::vector<Entry> numbered;
	for (const auto &entry : SortedByPath(entries))
	{
		if (PassesExtensionFilter(entry, config))
		{
			numbered.push_back(entry);
		}
	}

	// The last number handed out is startNumber + count - 1
	if (!numbered.empty() && strategy.startNumber > 0 &&
		numbered.size() - 1 > static_cast<unsigned long>(std::numeric_limits<long>::max() - strategy.startNumber))
	{
		throw RenameException(RenameErrorKind::Validation, "Start number " + std::to_string(strategy.startNumber) +
															   " is too large to number " + std::to_string(numbered.size()) + " item(s).");
	}

	std::vector<RenameOperation> plan;
	ClaimedPathSet claimed;
	for (std::size_t i = 0; i < numbered.size(); ++i)
	{
		const Entry &entry = numbered[i];
		const long number = strategy.startNumber + static_cast<long>(i);
		const std::string suffix = entry.IsDirectory ? std::string() : entry.FullPath.extension().string();
		const std::string newName = strategy.prefix + std::to_string(number) + suffix;
		if (!IsUsableName(newName))
		{
			results.warningLog.push_back("Skipping '" + entry.FullPath.filename().string() + "': numbering produced an invalid name '" + newName + "'");
			continue;
		}
		AppendOperation(plan, entry, entry.FullPath.parent_path() / newName, claimed);
	}

	OrderDeepestFirst(plan);
	results.generalInfoLog.push_back("Numbered " + std::to_string(numbered.size()) + " item(s) starting at " +
									 std::to_string(strategy.startNumber) + ".");
	return plan;
}

std::vector<RenameOperation> PlanEngine::GenerateRegex(const std::vector<Entry> &entries, const RenameConfig &config,
													   const RegexStrategy &strategy, PlanResult &results)
{
	// Compiled before any entry is visited; calculateRenamePlan has already rejected invalid patterns
	const std::regex pattern(strategy.pattern, std::regex::ECMAScript);
	std::vector<RenameOperation> plan;
	ClaimedPathSet claimed;

	for (const auto &entry : entries)
	{
		if (!PassesExtensionFilter(entry, config))
		{
			continue;
		}
		const std::string originalName = entry.FullPath.filename().string();
		const std::string newName = std::regex_replace(originalName, pattern, strategy.replacementTemplate);
		if (newName == originalName)
		{
			continue;
		}
		if (!IsUsableName(newName))
		{
			results.warningLog.push_back("Skipping '" + originalName + "': substitution produced an invalid name '" + newName + "'");
			continue;
		}
		AppendOperation(plan, entry, entry.FullPath.parent_path() / newName, claimed);
	}
	return plan;
}

std::vector<RenameOperation> PlanEngine::GenerateMetadata(const std::vector<Entry> &entries, const RenameConfig &config,
														  const MetadataStrategy &strategy, const MetadataReader &reader,
														  PlanResult &results)
{
	std::vector<RenameOperation> plan;
	ClaimedPathSet claimed;

	for (const auto &entry : SortedByPath(entries))
	{
		if (entry.IsDirectory || !PassesExtensionFilter(entry, config))
		{
			continue;
		}
		const std::string extension = ToLower(entry.FullPath.extension().string());
		if (PhotoExtensions.count(extension) == 0)
		{
			continue;
		}

		std::optional<std::tm> captured = reader.ReadCaptureTime(entry.FullPath);
		if (!captured && entry.LastModified)
		{
			captured = ToLocalTime(*entry.LastModified);
		}
		if (!captured)
		{
			results.warningLog.push_back("Skipping '" + entry.FullPath.filename().string() + "': no capture or modification time available");
			continue;
		}

		const std::string newName = strategy.prefix + FormatTimestamp(*captured) + extension;
		if (!IsUsableName(newName))
		{
			results.warningLog.push_back("Skipping '" + entry.FullPath.filename().string() + "': produced an invalid name '" + newName + "'");
			continue;
		}
		AppendOperation(plan, entry, entry.FullPath.parent_path() / newName, claimed);
	}

	OrderDeepestFirst(plan);
	return plan;
}

// Validates the configuration, walks the tree and builds the ordered operation list for the selected strategy
PlanResult PlanEngine::calculateRenamePlan(const RenameConfig &config, const MetadataReader *metadataReader)
{
	PlanResult results;
	auto fail = [&results](RenameErrorKind kind, const std::string &message, const fs::path &path = fs::path())
	{
		results.error = RenameError{kind, message, path};
		results.renamePlan.clear();
		results.success = false;
		return results;
	};

	// Plan-start validation: nothing is scanned until every check passes
	if (config.rootDirectory.empty())
	{
		return fail(RenameErrorKind::Validation, "No target folder was given.");
	}
	if (const auto *standard = std::get_if<StandardStrategy>(&config.strategy))
	{
		if (CountCodePoints(standard->replacement) > 1)
		{
			return fail(RenameErrorKind::Validation, "Replacement must be exactly one character.");
		}
		if (HasPathSeparator(standard->replacement))
		{
			return fail(RenameErrorKind::Validation, "Replacement cannot be a path separator.");
		}
	}
	if (const auto *sequential = std::get_if<SequentialStrategy>(&config.strategy))
	{
		if (HasPathSeparator(sequential->prefix))
		{
			return fail(RenameErrorKind::Validation, "Prefix '" + sequential->prefix + "' cannot contain a path separator.");
		}
	}
	if (const auto *metadata = std::get_if<MetadataStrategy>(&config.strategy))
	{
		if (HasPathSeparator(metadata->prefix))
		{
			return fail(RenameErrorKind::Validation, "Prefix '" + metadata->prefix + "' cannot contain a path separator.");
		}
	}
	if (const auto *regex = std::get_if<RegexStrategy>(&config.strategy))
	{
		if (regex->pattern.empty())
		{
			return fail(RenameErrorKind::Validation, "Regex pattern cannot be empty.");
		}
		try
		{
			std::regex compiled(regex->pattern, std::regex::ECMAScript);
		}
		catch (const std::regex_error &e)
		{
			return fail(RenameErrorKind::Validation, "Invalid regex pattern '" + regex->pattern + "': " + e.what());
		}
	}
	if (std::holds_alternative<MetadataStrategy>(config.strategy) && metadataReader == nullptr)
	{
		return fail(RenameErrorKind::Dependency, "Metadata mode requires a photo metadata reader, but none is available.");
	}

	try
	{
		const std::vector<Entry> entries = Walk(config.rootDirectory, config.recursive, config.includeFiles, config.includeDirectories);
		results.generalInfoLog.push_back("Scanned " + std::to_string(entries.size()) + " item(s) under " + config.rootDirectory.string() + ".");

		results.renamePlan = std::visit(
			[&](const auto &strategy) -> std::vector<RenameOperation>
			{
				using T = std::decay_t<decltype(strategy)>;
				if constexpr (std::is_same_v<T, StandardStrategy>)
					return GenerateStandard(entries, config, strategy, results);
				else if constexpr (std::is_same_v<T, SequentialStrategy>)
					return GenerateSequential(entries, config, strategy, results);
				else if constexpr (std::is_same_v<T, RegexStrategy>)
					return GenerateRegex(entries, config, strategy, results);
				else
					return GenerateMetadata(entries, config, strategy, *metadataReader, results);
			},
			config.strategy);
	}
	catch (const RenameException &e)
	{
		return fail(e.Kind(), e.what(), e.Path());
	}
	catch (const std::regex_error &e)
	{
		return fail(RenameErrorKind::Validation, "Regex substitution failed: " + std::string(e.what()));
	}

	for (const auto &warning : results.warningLog)
	{
		wxLogDebug("Plan warning: %s", warning.c_str());
	}

	if (results.renamePlan.empty())
	{
		results.generalInfoLog.push_back("No items need renaming.");
	}
	else
	{
		results.generalInfoLog.push_back("Calculated " + std::to_string(results.renamePlan.size()) + " item(s) to be renamed.");
	}
	results.success = true;
	return results;
}
