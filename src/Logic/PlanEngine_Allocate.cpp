#include "PlanEngine.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// True if anything (including a dangling symlink) occupies 'path'; unreadable paths count as occupied
bool PlanEngine::PathExists(const fs::path &path)
{
	std::error_code ec;
	const fs::file_status status = fs::symlink_status(path, ec);
	if (ec)
	{
		return ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory;
	}
	return fs::exists(status);
}

// Key under which a path is stored in a ClaimedPathSet; folded to lower case where names compare case-insensitively
fs::path PlanEngine::ClaimKey(const fs::path &path)
{
	if (IsCaseInsensitiveFilesystem())
	{
		return fs::path(ToLower(path.string()));
	}
	return path;
}

// Resolves 'desiredPath' to a path that is neither claimed in this pass nor present on disk
fs::path PlanEngine::Allocate(const fs::path &desiredPath, ClaimedPathSet &claimed)
{
	auto isFree = [&claimed](const fs::path &candidate)
	{
		return claimed.count(ClaimKey(candidate)) == 0 && !PathExists(candidate);
	};

	if (isFree(desiredPath))
	{
		claimed.insert(ClaimKey(desiredPath));
		return desiredPath;
	}

	const fs::path parent = desiredPath.parent_path();
	const std::string stem = desiredPath.stem().string();
	const std::string extension = desiredPath.extension().string();
	for (int n = 1; n <= MaxAllocationAttempts; ++n)
	{
		fs::path candidate = parent / (stem + "_" + std::to_string(n) + extension);
		if (isFree(candidate))
		{
			claimed.insert(ClaimKey(candidate));
			return candidate;
		}
	}

	throw RenameException(RenameErrorKind::ResourceExhausted,
						  "Could not find a free name for '" + desiredPath.string() + "' after " +
							  std::to_string(MaxAllocationAttempts) + " attempts",
						  desiredPath);
}
