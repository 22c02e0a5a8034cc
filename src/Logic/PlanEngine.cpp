#include "PlanEngine.h"

// Characters that are invalid or awkward in names on at least one common filesystem
const char *const PlanEngine::DefaultBadChars = "\"#%*:<>?/|";
const char *const PlanEngine::DefaultSequentialPrefix = "item";

const std::set<std::string> PlanEngine::ReservedDeviceNames = {
	"con", "prn", "aux", "nul",
	"com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
	"lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"};

const std::set<std::string> PlanEngine::PhotoExtensions = {".jpg", ".jpeg", ".tif", ".tiff", ".png"};

// Offered as the initial extension allow-list choices; none of them is active by default
const std::vector<std::string> PlanEngine::SuggestedExtensions = {".txt", ".py", ".md", ".csv", ".json"};

RenameException::RenameException(RenameErrorKind kind, const std::string &message, const fs::path &path)
	: std::runtime_error(message),
	  m_kind(kind),
	  m_path(path)
{
}

RenameError RenameException::ToError() const
{
	return RenameError{m_kind, what(), m_path};
}
