#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/cmdline.h>

#include "CommandLine.h"

namespace
{
const wxCmdLineEntryDesc CommandLineDesc[] = {
	{wxCMD_LINE_OPTION, "d", "dir", "folder to process", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "m", "mode", "naming mode: standard, sequential, regex or metadata", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_SWITCH, "r", "recursive", "include subfolders (--recursive- to turn off)", wxCMD_LINE_VAL_NONE, wxCMD_LINE_SWITCH_NEGATABLE},
	{wxCMD_LINE_SWITCH, NULL, "no-files", "leave files alone", wxCMD_LINE_VAL_NONE, wxCMD_LINE_SWITCH_NEGATABLE},
	{wxCMD_LINE_SWITCH, NULL, "dirs", "rename folders too", wxCMD_LINE_VAL_NONE, wxCMD_LINE_SWITCH_NEGATABLE},
	{wxCMD_LINE_OPTION, NULL, "bad-chars", "characters to clean in standard mode", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, NULL, "replacement", "single replacement character, empty to delete", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, NULL, "prefix", "name prefix in sequential mode", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, NULL, "start", "first number in sequential mode", wxCMD_LINE_VAL_NUMBER, 0},
	{wxCMD_LINE_OPTION, NULL, "pattern", "regular expression in regex mode", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, NULL, "template", "replacement template in regex mode ($1 for groups)", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, NULL, "meta-prefix", "name prefix in metadata mode", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "e", "ext", "comma-separated file extensions to include", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "f", "filter", "only show preview rows containing this text", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_SWITCH, "y", "yes", "do not ask for confirmation", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_PARAM, NULL, NULL, "preview|rename|undo|discard-undo|watch", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL},
	wxCMD_LINE_DESC_END};

std::string ToUtf8(const wxString &value)
{
	return std::string(value.utf8_str());
}

void ApplySwitch(const wxCmdLineParser &parser, const wxString &name, bool &target, bool valueWhenOn)
{
	switch (parser.FoundSwitch(name))
	{
	case wxCMD_SWITCH_ON:
		target = valueWhenOn;
		break;
	case wxCMD_SWITCH_OFF:
		target = !valueWhenOn;
		break;
	case wxCMD_SWITCH_NOT_FOUND:
		break;
	}
}

void ApplyString(const wxCmdLineParser &parser, const wxString &name, std::string &target)
{
	wxString value;
	if (parser.Found(name, &value))
	{
		target = ToUtf8(value);
	}
}
} // namespace

std::optional<ConsoleCommand> CommandFromName(const wxString &name)
{
	const wxString lower = name.Lower();
	if (lower == "preview")
		return ConsoleCommand::Preview;
	if (lower == "rename")
		return ConsoleCommand::Rename;
	if (lower == "undo")
		return ConsoleCommand::Undo;
	if (lower == "discard-undo")
		return ConsoleCommand::DiscardUndo;
	if (lower == "watch")
		return ConsoleCommand::Watch;
	return std::nullopt;
}

void AddCommandLineOptions(wxCmdLineParser &parser)
{
	parser.SetDesc(CommandLineDesc);
	parser.SetLogo("CleanNames - batch file and folder renamer");
}

bool ApplyCommandLine(const wxCmdLineParser &parser, const AppSettings &stored, CommandOptions &options, wxString &error)
{
	options = CommandOptions();
	options.settings = stored;

	if (parser.GetParamCount() > 0)
	{
		const std::optional<ConsoleCommand> command = CommandFromName(parser.GetParam(0));
		if (!command)
		{
			error = wxString::Format("Unknown command '%s'.", parser.GetParam(0));
			return false;
		}
		options.command = *command;
	}

	AppSettings &settings = options.settings;

	ApplyString(parser, "dir", settings.targetDir);

	wxString modeName;
	if (parser.Found("mode", &modeName))
	{
		const std::optional<NamingMode> mode = ModeFromName(modeName);
		if (!mode)
		{
			error = wxString::Format("Unknown mode '%s'.", modeName);
			return false;
		}
		settings.mode = *mode;
	}

	ApplySwitch(parser, "recursive", settings.recursive, true);
	ApplySwitch(parser, "no-files", settings.includeFiles, false);
	ApplySwitch(parser, "dirs", settings.includeDirs, true);

	ApplyString(parser, "bad-chars", settings.badChars);
	ApplyString(parser, "replacement", settings.replacement);
	ApplyString(parser, "prefix", settings.sequentialPrefix);
	ApplyString(parser, "pattern", settings.regexPattern);
	ApplyString(parser, "template", settings.regexTemplate);
	ApplyString(parser, "meta-prefix", settings.metadataPrefix);
	ApplyString(parser, "ext", settings.extensions);

	long start = 0;
	if (parser.Found("start", &start))
	{
		if (start < 0)
		{
			error = "Start number cannot be negative.";
			return false;
		}
		settings.startNumber = start;
	}

	if (!settings.includeFiles && !settings.includeDirs)
	{
		error = "Nothing to rename: files are excluded and folders are not included.";
		return false;
	}

	ApplyString(parser, "filter", options.filter);
	options.assumeYes = parser.Found("yes");
	return true;
}
