#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/log.h>

#include "RenameController.h"
#include "ConsoleReport.h"
#include "WorkerThread.h"

#include <cstdio>
#include <vector>

// Creates and runs 'thread', storing it in 'slot'; deletes it again if it cannot be started
bool RenameController::LaunchThread(WorkerThread *thread, WorkerThread *&slot, const char *what)
{
	if (thread->Create() != wxTHREAD_NO_ERROR)
	{
		wxLogError("Failed to create %s worker thread resource.", what);
		delete thread;
		return false;
	}
	if (thread->Run() != wxTHREAD_NO_ERROR)
	{
		wxLogError("Failed to run %s worker thread!", what);
		delete thread;
		return false;
	}
	slot = thread;
	return true;
}

void RenameController::JoinThread(WorkerThread *&slot)
{
	if (slot)
	{
		slot->Wait();
		delete slot;
		slot = nullptr;
	}
}

bool RenameController::StartPlanWorker()
{
	if (m_planThread)
	{
		wxLogError("A preview is already being calculated.");
		return false;
	}
	return LaunchThread(new WorkerThread(this, MakeRenameConfig(m_options.settings), m_metadataReader), m_planThread, "preview");
}

bool RenameController::StartRenameWorker(const std::vector<RenameOperation> &plan)
{
	if (m_executionThread)
	{
		wxLogError("A rename or undo is already running.");
		return false;
	}
	return LaunchThread(new WorkerThread(this, plan), m_executionThread, "rename");
}

bool RenameController::StartUndoWorker(const UndoRecord &record)
{
	if (m_executionThread)
	{
		wxLogError("A rename or undo is already running.");
		return false;
	}
	return LaunchThread(new WorkerThread(this, record), m_executionThread, "undo");
}

// Handles the completion of the preview calculation worker thread
void RenameController::OnPreviewThreadComplete(wxCommandEvent &event)
{
	JoinThread(m_planThread);

	PlanResult *received = static_cast<PlanResult *>(event.GetClientData());
	if (!received)
	{
		wxLogError("Received null data pointer for preview results.");
		if (!IsWatching())
			Finish(1);
		return;
	}
	PlanResult results = *received;
	delete received;

	if (m_stopRequested)
	{
		return;
	}

	const fs::path root = MakeRenameConfig(m_options.settings).rootDirectory;

	if (IsWatching())
	{
		if (!results.success)
		{
			ConsoleReport::PrintPlan(results, root, m_options.filter);
		}
		else if (!results.renamePlan.empty())
		{
			wxLogMessage("Change detected: applying %zu operation(s).", results.renamePlan.size());
			if (!StartRenameWorker(results.renamePlan))
			{
				wxLogWarning("Skipping this watch pass; changes are retried on the next notification.");
			}
		}
		else
		{
			wxLogVerbose("Watch pass: no changes required.");
		}

		if (!m_executionThread && m_replanQueued)
		{
			m_replanQueued = false;
			RequestReplan();
		}
		return;
	}

	ConsoleReport::PrintPlan(results, root, m_options.filter);
	if (!results.success)
	{
		Finish(1);
		return;
	}
	PersistSettings();

	if (m_options.command == ConsoleCommand::Preview || results.renamePlan.empty())
	{
		Finish(0);
		return;
	}

	if (!Confirm(wxString::Format("Proceed with renaming %zu item(s)?", results.renamePlan.size())))
	{
		wxLogMessage("Rename cancelled.");
		Finish(0);
		return;
	}
	if (!StartRenameWorker(results.renamePlan))
	{
		Finish(1);
	}
}

void RenameController::OnProgressUpdate(wxCommandEvent &event)
{
	if (IsWatching())
		return;
	wxPrintf("\rRenaming... %d/%ld", event.GetInt(), event.GetExtraLong());
	fflush(stdout);
	m_progressLineOpen = true;
}

// Handles the completion of the rename operation worker thread
void RenameController::OnRenameThreadComplete(wxCommandEvent &event)
{
	JoinThread(m_executionThread);
	CloseProgressLine();

	ExecutionResult *results = static_cast<ExecutionResult *>(event.GetClientData());
	if (!results)
	{
		wxLogError("Received null data pointer for rename results.");
		if (!IsWatching())
			Finish(1);
		return;
	}

	ConsoleReport::PrintExecution(*results);

	// Only a fully applied batch can be undone; the new record replaces the previous one
	if (results->overallSuccess && results->undoRecord && !results->undoRecord->entries.empty())
	{
		if (m_undoStore.Save(*results->undoRecord) && !IsWatching())
		{
			wxLogMessage("Run 'cleannames undo' to revert this batch.");
		}
	}
	const bool succeeded = results->overallSuccess;
	delete results;

	if (m_stopRequested)
	{
		Finish(succeeded ? 0 : 1);
		return;
	}

	if (IsWatching())
	{
		// Notifications caused by our own renames arrive after the fact; ignore them for one debounce window
		m_ignoreChangesUntil = wxGetUTCTimeMillis() + WatchDebounceMs;
		if (m_replanQueued)
		{
			m_replanQueued = false;
			RequestReplan();
		}
		return;
	}

	Finish(succeeded ? 0 : 1);
}
