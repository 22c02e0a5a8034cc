#ifndef PLANENGINE_H
#define PLANENGINE_H

#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <set>
#include <functional>
#include <stdexcept>
#include <variant>
#include <ctime>
#include <cstdint>
#include <cstddef>
#include <system_error>

namespace fs = std::filesystem;

class MetadataReader;

enum class RenameErrorKind
{
	Validation,
	NotFound,
	Access,
	Dependency,
	ResourceExhausted,
	Partial
};

struct RenameError
{
	RenameErrorKind kind = RenameErrorKind::Validation;
	std::string message;
	fs::path path;
};

// Thrown inside the engine (walker, allocator) and converted to a RenameError at the API boundary
class RenameException : public std::runtime_error
{
public:
	RenameException(RenameErrorKind kind, const std::string &message, const fs::path &path = fs::path());

	RenameErrorKind Kind() const { return m_kind; }
	const fs::path &Path() const { return m_path; }
	RenameError ToError() const;

private:
	RenameErrorKind m_kind;
	fs::path m_path;
};

// Snapshot of one filesystem object taken during traversal
struct Entry
{
	fs::path FullPath;
	bool IsDirectory = false;
	std::uintmax_t SizeBytes = 0;
	std::optional<std::time_t> LastModified;
};

// Same-directory rename of Source.FullPath to Target
struct RenameOperation
{
	Entry Source;
	fs::path Target;
};

struct UndoEntry
{
	fs::path CurrentPath;
	fs::path OriginalPath;
};

struct UndoRecord
{
	std::vector<UndoEntry> entries;
};

struct StandardStrategy
{
	std::string badChars;
	std::string replacement; // empty = delete bad characters
};

struct SequentialStrategy
{
	std::string prefix;
	long startNumber = 1;
};

struct RegexStrategy
{
	std::string pattern;
	std::string replacementTemplate; // ECMAScript format: $1, $&, ...
};

struct MetadataStrategy
{
	std::string prefix;
};

using NamingStrategy = std::variant<StandardStrategy, SequentialStrategy, RegexStrategy, MetadataStrategy>;

struct RenameConfig
{
	fs::path rootDirectory;
	NamingStrategy strategy;
	bool recursive = false;
	bool includeFiles = true;
	bool includeDirectories = false;
	std::set<std::string> extensionFilter; // lower-case with leading dot, empty = every file
};

struct PlanResult
{
	std::vector<RenameOperation> renamePlan;
	std::vector<std::string> generalInfoLog;
	std::vector<std::string> warningLog;
	std::optional<RenameError> error;
	bool success = false;
};

using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

struct ExecutionResult
{
	std::size_t completedCount = 0;
	std::size_t totalCount = 0;
	std::optional<UndoRecord> undoRecord;		 // Only set when every operation committed
	std::optional<RenameError> error;			 // Partial
	std::optional<RenameError> failedOperation; // The per-item error that stopped execution
	bool overallSuccess = false;
};

struct UndoResult
{
	std::vector<UndoEntry> successfulUndos;
	std::vector<RenameError> failedUndos;
	bool overallSuccess = false;
};

struct UndoRecordParseResult
{
	UndoRecord record;
	std::optional<RenameError> error;
	bool success = false;
};

using ClaimedPathSet = std::set<fs::path>;

std::string ToLower(std::string s);

class PlanEngine
{
private:
	static std::vector<RenameOperation> GenerateStandard(const std::vector<Entry> &entries, const RenameConfig &config,
														 const StandardStrategy &strategy, PlanResult &results);
	static std::vector<RenameOperation> GenerateSequential(const std::vector<Entry> &entries, const RenameConfig &config,
														   const SequentialStrategy &strategy, PlanResult &results);
	static std::vector<RenameOperation> GenerateRegex(const std::vector<Entry> &entries, const RenameConfig &config,
													  const RegexStrategy &strategy, PlanResult &results);
	static std::vector<RenameOperation> GenerateMetadata(const std::vector<Entry> &entries, const RenameConfig &config,
														 const MetadataStrategy &strategy, const MetadataReader &reader,
														 PlanResult &results);

	static bool PassesExtensionFilter(const Entry &entry, const RenameConfig &config);
	static void AppendOperation(std::vector<RenameOperation> &plan, const Entry &entry, const fs::path &desiredPath,
								ClaimedPathSet &claimed);
	static void OrderDeepestFirst(std::vector<RenameOperation> &plan);

	static std::optional<RenameError> MoveViaStaging(const fs::path &source, const fs::path &target);
	static std::optional<RenameError> MovePath(const fs::path &source, const fs::path &target);
	static std::optional<RenameError> CopyThenRemove(const fs::path &source, const fs::path &target);
	static std::optional<fs::path> StagingPathFor(const fs::path &source);

public:
	static constexpr int MaxAllocationAttempts = 10000;
	static constexpr int UndoRecordFormatVersion = 1;

	static const char *const DefaultBadChars;
	static const char *const DefaultSequentialPrefix;
	static const std::set<std::string> ReservedDeviceNames;
	static const std::set<std::string> PhotoExtensions;
	static const std::vector<std::string> SuggestedExtensions;

	// Name Sanitizer
	static std::string Sanitize(const std::string &name, const std::string &badChars, const std::string &replacement);
	static std::size_t CountCodePoints(const std::string &text);

	// Tree Walker
	static std::vector<Entry> Walk(const fs::path &root, bool recursive, bool includeFiles, bool includeDirs);
	static std::size_t PathDepth(const fs::path &path);

	// Target Allocator
	static fs::path Allocate(const fs::path &desiredPath, ClaimedPathSet &claimed);
	static fs::path ClaimKey(const fs::path &path);
	static bool PathExists(const fs::path &path);

	static PlanResult calculateRenamePlan(const RenameConfig &config, const MetadataReader *metadataReader = nullptr);
	static ExecutionResult performRename(const std::vector<RenameOperation> &plan, const ProgressCallback &onProgress = ProgressCallback());
	static UndoResult performUndo(const UndoRecord &record);

	static std::string serializeUndoRecord(const UndoRecord &record);
	static UndoRecordParseResult deserializeUndoRecord(const std::string &bytes);

	static bool iequals(const std::string &a, const std::string &b);
	static bool IsCaseInsensitiveFilesystem();
	static std::set<std::string> ParseExtensionList(const std::string &commaSeparated);
	static std::string FormatTimestamp(const std::tm &time);
	static std::string HumanReadableSize(std::uintmax_t numBytes);
	static std::time_t FileTimeToTimeT(const fs::file_time_type &fileTime);
	static std::tm ToLocalTime(std::time_t time);
	static const char *ErrorKindName(RenameErrorKind kind);
	static RenameError ErrorFromCode(const std::error_code &ec, const std::string &context, const fs::path &path);
};

#endif // PLANENGINE_H
