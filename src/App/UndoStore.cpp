#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/stdpaths.h>
#include <wx/log.h>

#include "UndoStore.h"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

UndoStore::UndoStore(const fs::path &recordPath)
	: m_recordPath(recordPath)
{
}

fs::path UndoStore::DefaultPath()
{
	const wxString dataDir = wxStandardPaths::Get().GetUserDataDir();
	return fs::u8path(std::string(dataDir.utf8_str())) / "last_batch.json";
}

// Replaces any previous record; written to a temporary file first so a crash never leaves half a record
bool UndoStore::Save(const UndoRecord &record)
{
	std::error_code ec;
	if (m_recordPath.has_parent_path())
	{
		fs::create_directories(m_recordPath.parent_path(), ec);
		if (ec)
		{
			wxLogError("Cannot create folder for undo record '%s': %s", m_recordPath.parent_path().string().c_str(), ec.message().c_str());
			return false;
		}
	}

	fs::path tempPath = m_recordPath;
	tempPath += ".tmp";
	{
		std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
		if (!out)
		{
			wxLogError("Cannot open '%s' for writing.", tempPath.string().c_str());
			return false;
		}
		out << PlanEngine::serializeUndoRecord(record);
		out.flush();
		if (!out)
		{
			wxLogError("Failed writing undo record to '%s'.", tempPath.string().c_str());
			out.close();
			fs::remove(tempPath, ec);
			return false;
		}
	}

	fs::rename(tempPath, m_recordPath, ec);
	if (ec)
	{
		wxLogError("Cannot store undo record at '%s': %s", m_recordPath.string().c_str(), ec.message().c_str());
		std::error_code cleanupEc;
		fs::remove(tempPath, cleanupEc);
		return false;
	}
	wxLogVerbose("Undo record with %zu entr(ies) saved to %s", record.entries.size(), m_recordPath.string().c_str());
	return true;
}

std::optional<UndoRecord> UndoStore::Load() const
{
	if (!HasPending())
	{
		return std::nullopt;
	}

	std::ifstream in(m_recordPath, std::ios::binary);
	if (!in)
	{
		wxLogError("Cannot open undo record '%s'.", m_recordPath.string().c_str());
		return std::nullopt;
	}
	const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

	UndoRecordParseResult parsed = PlanEngine::deserializeUndoRecord(bytes);
	if (!parsed.success)
	{
		wxLogError("Undo record '%s' is unusable: %s", m_recordPath.string().c_str(),
				   parsed.error ? parsed.error->message.c_str() : "unknown error");
		return std::nullopt;
	}
	return parsed.record;
}

bool UndoStore::HasPending() const
{
	std::error_code ec;
	return fs::is_regular_file(m_recordPath, ec);
}

bool UndoStore::Discard()
{
	std::error_code ec;
	fs::remove(m_recordPath, ec);
	if (ec)
	{
		wxLogError("Cannot delete undo record '%s': %s", m_recordPath.string().c_str(), ec.message().c_str());
		return false;
	}
	return true;
}
