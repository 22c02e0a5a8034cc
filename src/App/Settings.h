#ifndef SETTINGS_H
#define SETTINGS_H

#include <wx/string.h>

#include "PlanEngine.h"

#include <optional>
#include <string>

class wxConfigBase;

enum class NamingMode
{
	Standard,
	Sequential,
	Regex,
	Metadata
};

// Last used inputs plus the persistent preferences
struct AppSettings
{
	std::string targetDir;
	NamingMode mode = NamingMode::Standard;
	bool recursive = false;
	bool includeFiles = true;
	bool includeDirs = false;

	std::string badChars = PlanEngine::DefaultBadChars;
	std::string replacement;
	std::string sequentialPrefix = PlanEngine::DefaultSequentialPrefix;
	long startNumber = 1;
	std::string regexPattern;
	std::string regexTemplate;
	std::string metadataPrefix;
	std::string extensions; // Comma-separated allow-list, empty = all files

	// Preferences
	bool rememberLast = true;	   // Restore the last folder on start
	bool defaultRecursive = false; // Recursion default when nothing else says otherwise
};

std::optional<NamingMode> ModeFromName(const wxString &name);
const char *ModeName(NamingMode mode);

AppSettings LoadSettings(wxConfigBase *cfg);
void SaveSettings(wxConfigBase *cfg, const AppSettings &settings);

// Builds the engine configuration for the selected mode
RenameConfig MakeRenameConfig(const AppSettings &settings);

#endif // SETTINGS_H
