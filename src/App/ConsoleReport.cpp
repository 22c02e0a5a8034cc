#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/log.h>

#include "ConsoleReport.h"

#include <algorithm>
#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace
{
std::string FormatModified(const std::optional<std::time_t> &time)
{
	if (!time)
		return "-";
	const std::tm local = PlanEngine::ToLocalTime(*time);
	std::ostringstream oss;
	oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
	return oss.str();
}

std::string PadRight(const std::string &text, std::size_t width)
{
	return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}
} // namespace

PlanRow ConsoleReport::MakePlanRow(const RenameOperation &op, const fs::path &root)
{
	PlanRow row;
	fs::path relative = root.empty() ? fs::path() : op.Source.FullPath.lexically_relative(root);
	if (relative.empty() || *relative.begin() == "..")
	{
		relative = op.Source.FullPath.filename();
	}
	row.original = relative.string();
	row.newName = op.Target.filename().string();
	row.type = op.Source.IsDirectory ? "Folder" : "File";
	row.size = op.Source.IsDirectory ? "-" : PlanEngine::HumanReadableSize(op.Source.SizeBytes);
	row.modified = FormatModified(op.Source.LastModified);
	return row;
}

bool ConsoleReport::PlanRowMatchesFilter(const PlanRow &row, const std::string &filter)
{
	if (filter.empty())
		return true;
	const std::string needle = ToLower(filter);
	return ToLower(row.original).find(needle) != std::string::npos ||
		   ToLower(row.newName).find(needle) != std::string::npos;
}

// Header line followed by one aligned line per operation passing 'filter'
std::vector<std::string> ConsoleReport::FormatPlanTable(const std::vector<RenameOperation> &plan, const fs::path &root,
														const std::string &filter)
{
	std::vector<PlanRow> rows;
	for (const auto &op : plan)
	{
		PlanRow row = MakePlanRow(op, root);
		if (PlanRowMatchesFilter(row, filter))
		{
			rows.push_back(std::move(row));
		}
	}

	std::array<std::size_t, 4> widths = {8, 8, 4, 4}; // Header widths: ORIGINAL, NEW NAME, TYPE, SIZE
	for (const auto &row : rows)
	{
		widths[0] = std::max(widths[0], row.original.size());
		widths[1] = std::max(widths[1], row.newName.size());
		widths[2] = std::max(widths[2], row.type.size());
		widths[3] = std::max(widths[3], row.size.size());
	}

	auto line = [&widths](const std::string &a, const std::string &b, const std::string &c, const std::string &d,
						  const std::string &e)
	{
		return PadRight(a, widths[0]) + "  " + PadRight(b, widths[1]) + "  " + PadRight(c, widths[2]) + "  " +
			   PadRight(d, widths[3]) + "  " + e;
	};

	std::vector<std::string> lines;
	lines.reserve(rows.size() + 1);
	lines.push_back(line("ORIGINAL", "NEW NAME", "TYPE", "SIZE", "MODIFIED"));
	for (const auto &row : rows)
	{
		lines.push_back(line(row.original, row.newName, row.type, row.size, row.modified));
	}
	return lines;
}

wxString ConsoleReport::DescribeError(const RenameError &error)
{
	wxString text = wxString::Format("[%s] %s", PlanEngine::ErrorKindName(error.kind), wxString::FromUTF8(error.message));
	if (!error.path.empty() && error.message.find(error.path.string()) == std::string::npos)
	{
		text += wxString::Format(" (%s)", error.path.string().c_str());
	}
	return text;
}

void ConsoleReport::PrintPlan(const PlanResult &results, const fs::path &root, const std::string &filter)
{
	for (const auto &msg : results.generalInfoLog)
	{
		wxLogVerbose("%s", msg.c_str());
	}
	for (const auto &msg : results.warningLog)
	{
		wxLogWarning("%s", msg.c_str());
	}
	if (!results.success)
	{
		if (results.error)
			wxLogError("Preview failed: %s", DescribeError(*results.error));
		return;
	}
	if (results.renamePlan.empty())
	{
		wxPrintf("No changes required.\n");
		return;
	}

	const std::vector<std::string> lines = FormatPlanTable(results.renamePlan, root, filter);
	for (const auto &text : lines)
	{
		wxPrintf("%s\n", wxString::FromUTF8(text));
	}
	if (lines.size() - 1 != results.renamePlan.size())
	{
		wxPrintf("(%zu of %zu operation(s) shown, filter '%s')\n", lines.size() - 1, results.renamePlan.size(), filter.c_str());
	}
	wxPrintf("%zu operation(s) ready.\n", results.renamePlan.size());
}

void ConsoleReport::PrintExecution(const ExecutionResult &results)
{
	if (results.overallSuccess)
	{
		wxLogMessage("Renamed %zu item(s).", results.completedCount);
		return;
	}
	if (results.failedOperation)
	{
		wxLogError("FAILED: %s", DescribeError(*results.failedOperation));
	}
	if (results.error)
	{
		wxLogError("%s", DescribeError(*results.error));
	}
	wxLogWarning("%zu of %zu item(s) were renamed before the failure; no undo record was kept for this batch.",
				 results.completedCount, results.totalCount);
}

void ConsoleReport::PrintUndo(const UndoResult &results)
{
	for (const auto &entry : results.successfulUndos)
	{
		wxLogVerbose("Reverted '%s' back to '%s'", entry.CurrentPath.string().c_str(), entry.OriginalPath.string().c_str());
	}
	for (const auto &failure : results.failedUndos)
	{
		wxLogError("FAILED Undo: %s", DescribeError(failure));
	}
	if (results.overallSuccess)
	{
		wxLogMessage("Undo complete: %zu item(s) reverted.", results.successfulUndos.size());
	}
	else
	{
		wxLogWarning("Undo finished: %zu reverted, %zu failed. Check the affected items manually.",
					 results.successfulUndos.size(), results.failedUndos.size());
	}
}
