#ifndef UNDOSTORE_H
#define UNDOSTORE_H

#include "PlanEngine.h"

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

// Keeps the undo record of the most recent fully successful batch on disk
class UndoStore
{
public:
	explicit UndoStore(const fs::path &recordPath);

	// <user data dir>/last_batch.json
	static fs::path DefaultPath();

	bool Save(const UndoRecord &record);
	std::optional<UndoRecord> Load() const;
	bool HasPending() const;
	bool Discard();

	const fs::path &GetPath() const { return m_recordPath; }

private:
	fs::path m_recordPath;
};

#endif // UNDOSTORE_H
