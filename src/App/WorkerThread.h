#ifndef WORKERTHREAD_H
#define WORKERTHREAD_H

#include <wx/thread.h>
#include <wx/event.h>
#include "PlanEngine.h" // RenameConfig, PlanResult, ExecutionResult, UndoResult etc.

class MetadataReader;

enum class WorkerTask
{
	CALCULATE_PREVIEW,
	PERFORM_RENAME,
	UNDO_RENAME
};

// Completion events carry a heap-allocated result in their client data; the receiver deletes it
wxDECLARE_EVENT(EVT_PREVIEW_COMPLETE, wxCommandEvent); // PlanResult*
wxDECLARE_EVENT(EVT_RENAME_COMPLETE, wxCommandEvent);  // ExecutionResult*
wxDECLARE_EVENT(EVT_UNDO_COMPLETE, wxCommandEvent);	   // UndoResult*
wxDECLARE_EVENT(EVT_PROGRESS_UPDATE, wxCommandEvent);  // GetInt() = completed, GetExtraLong() = total

class WorkerThread : public wxThread
{
public:
	// Constructor for CALCULATE_PREVIEW task
	WorkerThread(wxEvtHandler *handler, const RenameConfig &config, const MetadataReader *metadataReader);

	// Constructor for PERFORM_RENAME task
	WorkerThread(wxEvtHandler *handler, const std::vector<RenameOperation> &plan);

	// Constructor for UNDO_RENAME task
	WorkerThread(wxEvtHandler *handler, const UndoRecord &record);

	virtual ~WorkerThread() {};

	WorkerTask GetTask() const { return m_task; }

protected:
	virtual ExitCode Entry() override;

private:
	wxEvtHandler *m_handler;
	WorkerTask m_task;

	// Parameters for CALCULATE_PREVIEW
	RenameConfig m_config;
	const MetadataReader *m_metadataReader = nullptr;

	// Parameters for PERFORM_RENAME
	std::vector<RenameOperation> m_renamePlan;

	// Parameters for UNDO_RENAME
	UndoRecord m_undoRecord;

	const char *TaskName() const;

	// Helper to post results back to the main thread
	void PostResultEvent(wxEventType eventType, void *data);
	void PostProgress(std::size_t completed, std::size_t total);
};

#endif // WORKERTHREAD_H
