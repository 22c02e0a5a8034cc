#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>
#include <wx/fswatcher.h>
#include <wx/log.h>

#include "RenameController.h"
#include "Settings.h"
#include "WorkerThread.h"

#include <cstdio>
#include <istream>
#include <string>

RenameController::RenameController(const CommandOptions &options, UndoStore &undoStore,
								   const MetadataReader *metadataReader, std::istream &confirmInput)
	: m_options(options),
	  m_undoStore(undoStore),
	  m_metadataReader(metadataReader),
	  m_confirmInput(confirmInput)
{
	Bind(EVT_PREVIEW_COMPLETE, &RenameController::OnPreviewThreadComplete, this);
	Bind(EVT_RENAME_COMPLETE, &RenameController::OnRenameThreadComplete, this);
	Bind(EVT_UNDO_COMPLETE, &RenameController::OnUndoThreadComplete, this);
	Bind(EVT_PROGRESS_UPDATE, &RenameController::OnProgressUpdate, this);

	m_debounceTimer.SetOwner(this);
	Bind(wxEVT_TIMER, &RenameController::OnDebounceTimer, this, m_debounceTimer.GetId());
}

RenameController::~RenameController()
{
	m_stopRequested = true;
	m_debounceTimer.Stop();
	m_watcher.reset();

	// Joinable threads must be waited for; an execution run always finishes its plan
	JoinThread(m_planThread);
	JoinThread(m_executionThread);

	// Completion events posted after the main loop ended still own their results, and a finished
	// batch still needs its undo record stored
	if (wxTheApp)
	{
		wxTheApp->ProcessPendingEvents();
	}
}

// Kicks off the selected command; completion is signalled through Finish()
void RenameController::Start()
{
	switch (m_options.command)
	{
	case ConsoleCommand::Preview:
	case ConsoleCommand::Rename:
		if (!StartPlanWorker())
			Finish(1);
		break;
	case ConsoleCommand::Undo:
		BeginUndo();
		break;
	case ConsoleCommand::DiscardUndo:
		DiscardUndo();
		break;
	case ConsoleCommand::Watch:
		if (!BeginWatch())
			Finish(1);
		break;
	}
}

void RenameController::RequestStop()
{
	m_stopRequested = true;
	m_replanQueued = false;
	m_debounceTimer.Stop();
	m_watcher.reset();

	if (m_executionThread)
	{
		wxLogMessage("Stopping once the running batch has finished...");
		return;
	}
	Finish(m_exitCode);
}

// Asks a yes/no question on the console; anything but y/yes (or end of input) means no
bool RenameController::Confirm(const wxString &question)
{
	if (m_options.assumeYes)
		return true;

	wxPrintf("%s [y/N] ", question);
	fflush(stdout);

	std::string answer;
	if (!std::getline(m_confirmInput, answer))
		return false;

	wxString reply = wxString::FromUTF8(answer);
	reply.Trim().Trim(false).MakeLower();
	return reply == "y" || reply == "yes";
}

void RenameController::PersistSettings()
{
	SaveSettings(wxConfigBase::Get(), m_options.settings);
}

void RenameController::CloseProgressLine()
{
	if (m_progressLineOpen)
	{
		wxPrintf("\n");
		m_progressLineOpen = false;
	}
}

void RenameController::Finish(int exitCode)
{
	if (m_finished)
		return;
	m_finished = true;
	m_exitCode = exitCode;
	if (wxTheApp)
	{
		wxTheApp->ExitMainLoop();
	}
}
