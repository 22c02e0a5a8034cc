#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include "App.h"
#include "RenameController.h"
#include <wx/cmdline.h>
#include <wx/config.h>
#include <wx/log.h>

#include <csignal>
#include <iostream>

wxIMPLEMENT_APP_CONSOLE(App);

App::App() = default;

App::~App() = default;

bool App::OnInit()
{
	SetAppName("CleanNames");

	// Initialize the configuration system for storing/retrieving application settings
	wxConfigBase::Set(new wxConfig(GetAppName()));

	wxLog::DisableTimestamp();

	// Parses the command line; OnCmdLineParsed fills m_options
	if (!wxAppConsole::OnInit())
	{
		delete wxConfigBase::Set(nullptr);
		return false;
	}

#ifdef __UNIX__
	SetSignalHandler(SIGINT, &App::OnInterrupt);
#endif

	m_undoStore = std::make_unique<UndoStore>(UndoStore::DefaultPath());
	m_controller = std::make_unique<RenameController>(m_options, *m_undoStore, &m_metadataReader, std::cin);

	// Workers post their results as events, so the command starts once the main loop runs
	CallAfter([this]()
			  {
				  if (m_controller)
					  m_controller->Start();
			  });
	return true;
}

int App::OnRun()
{
	wxAppConsole::OnRun();
	return m_controller ? m_controller->GetExitCode() : 1;
}

int App::OnExit()
{
	m_controller.reset(); // Waits for any worker still running
	m_undoStore.reset();
	delete wxConfigBase::Set(nullptr);
	return wxAppConsole::OnExit();
}

void App::OnInitCmdLine(wxCmdLineParser &parser)
{
	wxAppConsole::OnInitCmdLine(parser); // --help and --verbose
	AddCommandLineOptions(parser);
}

bool App::OnCmdLineParsed(wxCmdLineParser &parser)
{
	if (!wxAppConsole::OnCmdLineParsed(parser))
		return false;

	wxString error;
	if (!ApplyCommandLine(parser, LoadSettings(wxConfigBase::Get()), m_options, error))
	{
		wxLogError("%s", error);
		parser.Usage();
		return false;
	}
	return true;
}

#ifdef __UNIX__
// Delivered from the main loop, not from the signal context
void App::OnInterrupt(int WXUNUSED(signal))
{
	App &app = wxGetApp();
	if (app.m_controller)
	{
		app.m_controller->RequestStop();
		return;
	}
	app.ExitMainLoop();
}
#endif
