#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>

#include "Settings.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace
{
std::string ReadString(wxConfigBase *cfg, const wxString &key, const std::string &fallback)
{
	return std::string(cfg->Read(key, wxString::FromUTF8(fallback)).utf8_str());
}

void WriteString(wxConfigBase *cfg, const wxString &key, const std::string &value)
{
	cfg->Write(key, wxString::FromUTF8(value));
}
} // namespace

std::optional<NamingMode> ModeFromName(const wxString &name)
{
	const wxString lower = name.Lower();
	if (lower == "standard" || lower == "std")
		return NamingMode::Standard;
	if (lower == "sequential" || lower == "seq")
		return NamingMode::Sequential;
	if (lower == "regex" || lower == "rex")
		return NamingMode::Regex;
	if (lower == "metadata" || lower == "meta")
		return NamingMode::Metadata;
	return std::nullopt;
}

const char *ModeName(NamingMode mode)
{
	switch (mode)
	{
	case NamingMode::Standard:
		return "standard";
	case NamingMode::Sequential:
		return "sequential";
	case NamingMode::Regex:
		return "regex";
	case NamingMode::Metadata:
		return "metadata";
	}
	return "standard";
}

// Loads stored inputs, falling back to built-in defaults for anything missing
AppSettings LoadSettings(wxConfigBase *cfg)
{
	AppSettings settings;
	if (!cfg)
		return settings; // Config system unavailable: defaults only

	settings.rememberLast = cfg->ReadBool("/Options/RememberLast", true);
	settings.defaultRecursive = cfg->ReadBool("/Options/DefaultRecursive", false);
	settings.recursive = settings.defaultRecursive;

	if (settings.rememberLast)
	{
		settings.targetDir = ReadString(cfg, "/Inputs/TargetDir", "");
	}

	const std::optional<NamingMode> mode = ModeFromName(cfg->Read("/Inputs/Mode", ModeName(NamingMode::Standard)));
	settings.mode = mode.value_or(NamingMode::Standard);
	settings.includeFiles = cfg->ReadBool("/Inputs/IncludeFiles", true);
	settings.includeDirs = cfg->ReadBool("/Inputs/IncludeDirs", false);
	settings.badChars = ReadString(cfg, "/Inputs/BadChars", PlanEngine::DefaultBadChars);
	settings.replacement = ReadString(cfg, "/Inputs/Replacement", "");
	settings.sequentialPrefix = ReadString(cfg, "/Inputs/SequentialPrefix", PlanEngine::DefaultSequentialPrefix);
	settings.startNumber = cfg->ReadLong("/Inputs/StartNumber", 1);
	settings.regexPattern = ReadString(cfg, "/Inputs/RegexPattern", "");
	settings.regexTemplate = ReadString(cfg, "/Inputs/RegexTemplate", "");
	settings.metadataPrefix = ReadString(cfg, "/Inputs/MetadataPrefix", "");
	settings.extensions = ReadString(cfg, "/Inputs/Extensions", "");
	return settings;
}

// Writes the used inputs back; the folder is only kept when RememberLast is on
void SaveSettings(wxConfigBase *cfg, const AppSettings &settings)
{
	if (!cfg)
		return;

	cfg->Write("/Options/RememberLast", settings.rememberLast);
	cfg->Write("/Options/DefaultRecursive", settings.defaultRecursive);

	if (settings.rememberLast)
	{
		WriteString(cfg, "/Inputs/TargetDir", settings.targetDir);
	}
	else
	{
		cfg->DeleteEntry("/Inputs/TargetDir");
	}
	cfg->Write("/Inputs/Mode", wxString(ModeName(settings.mode)));
	cfg->Write("/Inputs/IncludeFiles", settings.includeFiles);
	cfg->Write("/Inputs/IncludeDirs", settings.includeDirs);
	WriteString(cfg, "/Inputs/BadChars", settings.badChars);
	WriteString(cfg, "/Inputs/Replacement", settings.replacement);
	WriteString(cfg, "/Inputs/SequentialPrefix", settings.sequentialPrefix);
	cfg->Write("/Inputs/StartNumber", settings.startNumber);
	WriteString(cfg, "/Inputs/RegexPattern", settings.regexPattern);
	WriteString(cfg, "/Inputs/RegexTemplate", settings.regexTemplate);
	WriteString(cfg, "/Inputs/MetadataPrefix", settings.metadataPrefix);
	WriteString(cfg, "/Inputs/Extensions", settings.extensions);

	cfg->Flush();
}

RenameConfig MakeRenameConfig(const AppSettings &settings)
{
	RenameConfig config;
	config.rootDirectory = fs::u8path(settings.targetDir);
	config.recursive = settings.recursive;
	config.includeFiles = settings.includeFiles;
	config.includeDirectories = settings.includeDirs;
	config.extensionFilter = PlanEngine::ParseExtensionList(settings.extensions);

	switch (settings.mode)
	{
	case NamingMode::Standard:
		config.strategy = StandardStrategy{settings.badChars, settings.replacement};
		break;
	case NamingMode::Sequential:
		config.strategy = SequentialStrategy{settings.sequentialPrefix.empty() ? std::string(PlanEngine::DefaultSequentialPrefix)
																			   : settings.sequentialPrefix,
											 settings.startNumber};
		break;
	case NamingMode::Regex:
		config.strategy = RegexStrategy{settings.regexPattern, settings.regexTemplate};
		break;
	case NamingMode::Metadata:
		config.strategy = MetadataStrategy{settings.metadataPrefix};
		break;
	}
	return config;
}
