#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include "WorkerThread.h"
#include "PlanEngine.h"

wxDEFINE_EVENT(EVT_PREVIEW_COMPLETE, wxCommandEvent);
wxDEFINE_EVENT(EVT_RENAME_COMPLETE, wxCommandEvent);
wxDEFINE_EVENT(EVT_UNDO_COMPLETE, wxCommandEvent);
wxDEFINE_EVENT(EVT_PROGRESS_UPDATE, wxCommandEvent);

// Constructor for CALCULATE_PREVIEW task
WorkerThread::WorkerThread(wxEvtHandler *handler, const RenameConfig &config, const MetadataReader *metadataReader)
	: wxThread(wxTHREAD_JOINABLE),
	  m_handler(handler),
	  m_task(WorkerTask::CALCULATE_PREVIEW),
	  m_config(config),
	  m_metadataReader(metadataReader)
{
}

// Constructor for PERFORM_RENAME task
WorkerThread::WorkerThread(wxEvtHandler *handler, const std::vector<RenameOperation> &plan)
	: wxThread(wxTHREAD_JOINABLE),
	  m_handler(handler),
	  m_task(WorkerTask::PERFORM_RENAME),
	  m_renamePlan(plan)
{
}

// Constructor for UNDO_RENAME task
WorkerThread::WorkerThread(wxEvtHandler *handler, const UndoRecord &record)
	: wxThread(wxTHREAD_JOINABLE),
	  m_handler(handler),
	  m_task(WorkerTask::UNDO_RENAME),
	  m_undoRecord(record)
{
}

const char *WorkerThread::TaskName() const
{
	switch (m_task)
	{
	case WorkerTask::CALCULATE_PREVIEW:
		return "Preview";
	case WorkerTask::PERFORM_RENAME:
		return "Rename";
	case WorkerTask::UNDO_RENAME:
		return "Undo";
	}
	return "Unknown";
}

// Queues a completion event; ownership of 'data' passes to the handler
void WorkerThread::PostResultEvent(wxEventType eventType, void *data)
{
	if (m_handler)
	{
		wxCommandEvent event(eventType);
		event.SetClientData(data);
		wxQueueEvent(m_handler, event.Clone());
		return;
	}

	wxLogDebug("WorkerThread::PostResultEvent: Handler is null, deleting event data.");
	if (eventType == EVT_PREVIEW_COMPLETE)
		delete static_cast<PlanResult *>(data);
	else if (eventType == EVT_RENAME_COMPLETE)
		delete static_cast<ExecutionResult *>(data);
	else if (eventType == EVT_UNDO_COMPLETE)
		delete static_cast<UndoResult *>(data);
}

void WorkerThread::PostProgress(std::size_t completed, std::size_t total)
{
	if (!m_handler)
		return;
	wxCommandEvent event(EVT_PROGRESS_UPDATE);
	event.SetInt(static_cast<int>(completed));
	event.SetExtraLong(static_cast<long>(total));
	wxQueueEvent(m_handler, event.Clone());
}

wxThread::ExitCode WorkerThread::Entry()
{
	if (TestDestroy())
		return (ExitCode)0;

	try
	{
		if (m_task == WorkerTask::CALCULATE_PREVIEW)
		{
			PlanResult *results = new PlanResult(PlanEngine::calculateRenamePlan(m_config, m_metadataReader));
			PostResultEvent(EVT_PREVIEW_COMPLETE, results);
		}
		else if (m_task == WorkerTask::PERFORM_RENAME)
		{
			// An execution run is never abandoned part-way; TestDestroy is not consulted between operations
			ExecutionResult *results = new ExecutionResult(PlanEngine::performRename(
				m_renamePlan,
				[this](std::size_t completed, std::size_t total) { PostProgress(completed, total); }));
			PostResultEvent(EVT_RENAME_COMPLETE, results);
		}
		else if (m_task == WorkerTask::UNDO_RENAME)
		{
			UndoResult *results = new UndoResult(PlanEngine::performUndo(m_undoRecord));
			PostResultEvent(EVT_UNDO_COMPLETE, results);
		}
	}
	catch (const std::exception &e)
	{
		wxLogError("Unhandled std::exception in worker thread (%s): %s", TaskName(), e.what());

		// Post an error result so the handler is never left waiting
		const RenameError fatal{RenameErrorKind::Access, "FATAL EXCEPTION (" + std::string(TaskName()) + "): " + e.what(), fs::path()};
		if (m_task == WorkerTask::CALCULATE_PREVIEW)
		{
			PlanResult *errRes = new PlanResult();
			errRes->success = false;
			errRes->error = fatal;
			PostResultEvent(EVT_PREVIEW_COMPLETE, errRes);
		}
		else if (m_task == WorkerTask::PERFORM_RENAME)
		{
			ExecutionResult *errRes = new ExecutionResult();
			errRes->totalCount = m_renamePlan.size();
			errRes->overallSuccess = false;
			errRes->error = fatal;
			PostResultEvent(EVT_RENAME_COMPLETE, errRes);
		}
		else
		{
			UndoResult *errRes = new UndoResult();
			errRes->overallSuccess = false;
			errRes->failedUndos.push_back(fatal);
			PostResultEvent(EVT_UNDO_COMPLETE, errRes);
		}
	}

	return (ExitCode)0;
}
