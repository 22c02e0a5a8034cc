#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/log.h>

#include "RenameController.h"
#include "ConsoleReport.h"
#include "WorkerThread.h"

// Loads the stored record of the last batch and reverts it on a worker thread
void RenameController::BeginUndo()
{
	if (!m_undoStore.HasPending())
	{
		wxLogMessage("Nothing to undo.");
		Finish(0);
		return;
	}

	const std::optional<UndoRecord> record = m_undoStore.Load();
	if (!record)
	{
		// Load() has already reported why; the record is kept for inspection or discard-undo
		Finish(1);
		return;
	}
	if (record->entries.empty())
	{
		wxLogMessage("The stored batch is empty; nothing to undo.");
		Finish(m_undoStore.Discard() ? 0 : 1);
		return;
	}

	if (!Confirm(wxString::Format("Revert last batch (%zu item(s))?", record->entries.size())))
	{
		wxLogMessage("Undo cancelled.");
		Finish(0);
		return;
	}
	if (!StartUndoWorker(*record))
	{
		Finish(1);
	}
}

// Handles the completion of the undo operation worker thread
void RenameController::OnUndoThreadComplete(wxCommandEvent &event)
{
	JoinThread(m_executionThread);

	UndoResult *results = static_cast<UndoResult *>(event.GetClientData());
	if (!results)
	{
		wxLogError("Received null data pointer for undo results.");
		Finish(1);
		return;
	}

	ConsoleReport::PrintUndo(*results);
	const bool succeeded = results->overallSuccess;
	delete results;

	// Undo is one-shot for a batch, even when some items could not be reverted
	const bool discarded = m_undoStore.Discard();
	Finish(succeeded && discarded ? 0 : 1);
}

void RenameController::DiscardUndo()
{
	if (!m_undoStore.HasPending())
	{
		wxLogMessage("No pending undo record.");
		Finish(0);
		return;
	}
	if (!Confirm("Discard the undo record of the last batch?"))
	{
		wxLogMessage("Kept the undo record.");
		Finish(0);
		return;
	}
	if (!m_undoStore.Discard())
	{
		Finish(1);
		return;
	}
	wxLogMessage("Undo record discarded.");
	Finish(0);
}
