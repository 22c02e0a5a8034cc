#ifndef RENAMECONTROLLER_H
#define RENAMECONTROLLER_H

#include <wx/event.h>
#include <wx/timer.h>
#include <wx/longlong.h>

#include "CommandLine.h"
#include "PlanEngine.h"
#include "UndoStore.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

class MetadataReader;
class WorkerThread;
class wxFileSystemWatcher;
class wxFileSystemWatcherEvent;

// Drives one console command: starts workers, reacts to their completion events and ends the main loop
class RenameController : public wxEvtHandler
{
public:
	static constexpr int WatchDebounceMs = 750;

	RenameController(const CommandOptions &options, UndoStore &undoStore, const MetadataReader *metadataReader,
					 std::istream &confirmInput);
	~RenameController() override;

	void Start();

	// Ctrl+C: stops watching and ends the command, but lets a running rename or undo complete first
	void RequestStop();

	bool IsFinished() const { return m_finished; }
	bool IsExecuting() const { return m_executionThread != nullptr; }
	int GetExitCode() const { return m_exitCode; }
	const CommandOptions &GetOptions() const { return m_options; }

private:
	CommandOptions m_options;
	UndoStore &m_undoStore;
	const MetadataReader *m_metadataReader;
	std::istream &m_confirmInput;

	// At most one worker of each kind
	WorkerThread *m_planThread = nullptr;
	WorkerThread *m_executionThread = nullptr;

	bool m_progressLineOpen = false;
	bool m_stopRequested = false;
	bool m_finished = false;
	int m_exitCode = 0;

	// Watch mode
	std::unique_ptr<wxFileSystemWatcher> m_watcher;
	wxTimer m_debounceTimer;
	wxLongLong m_ignoreChangesUntil = 0;
	bool m_replanQueued = false;

	// Workers
	bool StartPlanWorker();
	bool StartRenameWorker(const std::vector<RenameOperation> &plan);
	bool StartUndoWorker(const UndoRecord &record);
	bool LaunchThread(WorkerThread *thread, WorkerThread *&slot, const char *what);
	static void JoinThread(WorkerThread *&slot);

	// Completion handlers
	void OnPreviewThreadComplete(wxCommandEvent &event);
	void OnRenameThreadComplete(wxCommandEvent &event);
	void OnUndoThreadComplete(wxCommandEvent &event);
	void OnProgressUpdate(wxCommandEvent &event);

	// Undo
	void BeginUndo();
	void DiscardUndo();

	// Watch mode
	bool BeginWatch();
	void RequestReplan();
	void OnFileSystemChange(wxFileSystemWatcherEvent &event);
	void OnDebounceTimer(wxTimerEvent &event);

	// Helpers
	bool Confirm(const wxString &question);
	void PersistSettings();
	void CloseProgressLine();
	void Finish(int exitCode);
	bool IsWatching() const { return m_options.command == ConsoleCommand::Watch; }
};

#endif // RENAMECONTROLLER_H
