#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/filename.h>
#include <wx/fswatcher.h>
#include <wx/log.h>

#include "RenameController.h"
#include "WorkerThread.h"

#include <system_error>

namespace
{
constexpr int WatchedEvents = wxFSW_EVENT_CREATE | wxFSW_EVENT_DELETE | wxFSW_EVENT_RENAME | wxFSW_EVENT_MODIFY;
}

// Watches the target folder and applies a fresh plan, without confirmation, whenever it settles after a change
bool RenameController::BeginWatch()
{
	const fs::path root = MakeRenameConfig(m_options.settings).rootDirectory;
	std::error_code ec;
	if (root.empty() || !fs::is_directory(root, ec))
	{
		wxLogError("Cannot watch '%s': not an existing folder.", root.string().c_str());
		return false;
	}

	m_watcher = std::make_unique<wxFileSystemWatcher>();
	m_watcher->SetOwner(this);
	Bind(wxEVT_FSWATCHER, &RenameController::OnFileSystemChange, this);

	const wxFileName dir = wxFileName::DirName(wxString::FromUTF8(root.u8string()));
	const bool added = m_options.settings.recursive ? m_watcher->AddTree(dir, WatchedEvents)
													: m_watcher->Add(dir, WatchedEvents);
	if (!added)
	{
		wxLogError("Failed to watch '%s'.", root.string().c_str());
		return false;
	}

	wxLogMessage("Watching %s in %s mode (Ctrl+C to stop).", root.string().c_str(), ModeName(m_options.settings.mode));
	PersistSettings();

	// Initial pass over what is already there
	return StartPlanWorker();
}

void RenameController::OnFileSystemChange(wxFileSystemWatcherEvent &event)
{
	if (event.IsError())
	{
		wxLogWarning("Folder watch: %s", event.GetErrorDescription());
		return;
	}
	if (m_stopRequested)
	{
		return;
	}
	if (m_executionThread || wxGetUTCTimeMillis() < m_ignoreChangesUntil)
	{
		wxLogDebug("Ignoring own change: %s", event.GetPath().GetFullPath());
		return;
	}

	wxLogVerbose("Change detected: %s", event.GetPath().GetFullPath());
	m_debounceTimer.StartOnce(WatchDebounceMs); // Restarting coalesces a burst into one pass
}

void RenameController::OnDebounceTimer(wxTimerEvent &WXUNUSED(event))
{
	RequestReplan();
}

// Starts a plan pass, or queues exactly one if a pass or its execution is still in flight
void RenameController::RequestReplan()
{
	if (m_stopRequested)
	{
		return;
	}
	if (m_planThread || m_executionThread)
	{
		m_replanQueued = true;
		return;
	}
	if (!StartPlanWorker())
	{
		wxLogWarning("Could not start a watch pass; waiting for the next change.");
	}
}
