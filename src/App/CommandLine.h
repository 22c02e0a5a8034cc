#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <wx/string.h>

#include "Settings.h"

#include <optional>
#include <string>

class wxCmdLineParser;

enum class ConsoleCommand
{
	Preview,
	Rename,
	Undo,
	DiscardUndo,
	Watch
};

struct CommandOptions
{
	ConsoleCommand command = ConsoleCommand::Preview;
	AppSettings settings;
	std::string filter; // Preview row filter
	bool assumeYes = false;
};

std::optional<ConsoleCommand> CommandFromName(const wxString &name);

// Registers the command parameter and every option on 'parser'
void AddCommandLineOptions(wxCmdLineParser &parser);

// Layers parsed options over 'stored'; returns false with 'error' set when a value is invalid
bool ApplyCommandLine(const wxCmdLineParser &parser, const AppSettings &stored, CommandOptions &options, wxString &error);

#endif // COMMANDLINE_H
