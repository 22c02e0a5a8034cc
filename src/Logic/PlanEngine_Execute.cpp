#include "PlanEngine.h"

#include <wx/log.h>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Hidden same-directory name used while an item is in flight between its old and new name
std::optional<fs::path> PlanEngine::StagingPathFor(const fs::path &source)
{
	const fs::path parent = source.parent_path();
	const std::string base = "." + source.filename().string() + ".swap_tmp";
	fs::path candidate = parent / base;
	for (int n = 1; PathExists(candidate); ++n)
	{
		if (n > MaxAllocationAttempts)
		{
			return std::nullopt;
		}
		candidate = parent / (base + std::to_string(n));
	}
	return candidate;
}

// Copy+delete used when the rename primitive cannot cross filesystems; not atomic
std::optional<RenameError> PlanEngine::CopyThenRemove(const fs::path &source, const fs::path &target)
{
	wxLogWarning("Falling back to copy+delete for '%s' -> '%s'", source.string().c_str(), target.string().c_str());

	std::error_code copyEc;
	fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, copyEc);
	if (copyEc)
	{
		std::error_code cleanupEc;
		fs::remove_all(target, cleanupEc);
		return ErrorFromCode(copyEc, "Copy fallback failed for '" + source.string() + "'", source);
	}

	std::error_code removeEc;
	fs::remove_all(source, removeEc);
	if (removeEc)
	{
		return ErrorFromCode(removeEc, "Copied '" + source.string() + "' but could not remove the original", source);
	}
	return std::nullopt;
}

std::optional<RenameError> PlanEngine::MovePath(const fs::path &source, const fs::path &target)
{
	std::error_code ec;
	fs::rename(source, target, ec);
	if (!ec)
	{
		return std::nullopt;
	}
	if (ec == std::errc::cross_device_link || ec == std::errc::operation_not_supported || ec == std::errc::function_not_supported)
	{
		return CopyThenRemove(source, target);
	}
	return ErrorFromCode(ec, "Rename failed '" + source.string() + "' -> '" + target.string() + "'", source);
}

// PENDING -> STAGED -> COMMITTED for a single item; a failed commit puts the item back under its source name
std::optional<RenameError> PlanEngine::MoveViaStaging(const fs::path &source, const fs::path &target)
{
	if (!PathExists(source))
	{
		return RenameError{RenameErrorKind::NotFound, "Source disappeared: " + source.string(), source};
	}

	const std::optional<fs::path> staging = StagingPathFor(source);
	if (!staging)
	{
		return RenameError{RenameErrorKind::ResourceExhausted, "No free staging name next to " + source.string(), source};
	}

	if (auto stageError = MovePath(source, *staging))
	{
		return stageError;
	}

	std::optional<RenameError> commitError;
	if (PathExists(target))
	{
		commitError = RenameError{RenameErrorKind::Validation, "Target already exists: " + target.string(), target};
	}
	else
	{
		commitError = MovePath(*staging, target);
	}

	if (commitError)
	{
		if (auto restoreError = MovePath(*staging, source))
		{
			wxLogWarning("Could not restore '%s' from staging name '%s': %s", source.string().c_str(),
						 staging->string().c_str(), restoreError->message.c_str());
			commitError->message += " (item left at " + staging->string() + ")";
		}
	}
	return commitError;
}

// Executes 'plan' in order, stopping at the first failure; emits an undo record only on full success
ExecutionResult PlanEngine::performRename(const std::vector<RenameOperation> &plan, const ProgressCallback &onProgress)
{
	ExecutionResult results;
	results.totalCount = plan.size();

	UndoRecord record;
	record.entries.reserve(plan.size());

	for (const auto &op : plan)
	{
		std::optional<RenameError> failure;
		try
		{
			if (op.Target.parent_path() != op.Source.FullPath.parent_path())
			{
				failure = RenameError{RenameErrorKind::Validation,
									  "Target '" + op.Target.string() + "' is not in the same folder as '" + op.Source.FullPath.string() + "'",
									  op.Source.FullPath};
			}
			else
			{
				failure = MoveViaStaging(op.Source.FullPath, op.Target);
			}
		}
		catch (const std::exception &ex)
		{
			failure = RenameError{RenameErrorKind::Access, "Unexpected error: " + std::string(ex.what()), op.Source.FullPath};
		}

		if (failure)
		{
			results.failedOperation = failure;
			results.error = RenameError{RenameErrorKind::Partial,
										"Stopped after " + std::to_string(results.completedCount) + " of " +
											std::to_string(results.totalCount) + " operation(s): " + failure->message,
										op.Source.FullPath};
			results.overallSuccess = false;
			return results;
		}

		record.entries.push_back({op.Target, op.Source.FullPath});
		++results.completedCount;
		if (onProgress)
		{
			onProgress(results.completedCount, results.totalCount);
		}
	}

	results.undoRecord = std::move(record);
	results.overallSuccess = true;
	return results;
}
