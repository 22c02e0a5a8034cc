#ifndef CONSOLEREPORT_H
#define CONSOLEREPORT_H

#include <wx/string.h>

#include "PlanEngine.h"

#include <string>
#include <vector>

// One displayed line of the preview table
struct PlanRow
{
	std::string original; // Relative to the scanned folder
	std::string newName;
	std::string type; // "File" or "Folder"
	std::string size; // "-" for folders
	std::string modified;
};

class ConsoleReport
{
public:
	static PlanRow MakePlanRow(const RenameOperation &op, const fs::path &root);

	// Case-insensitive substring match on the original or new name; an empty filter matches everything
	static bool PlanRowMatchesFilter(const PlanRow &row, const std::string &filter);

	static std::vector<std::string> FormatPlanTable(const std::vector<RenameOperation> &plan, const fs::path &root,
													const std::string &filter);

	static wxString DescribeError(const RenameError &error);

	static void PrintPlan(const PlanResult &results, const fs::path &root, const std::string &filter);
	static void PrintExecution(const ExecutionResult &results);
	static void PrintUndo(const UndoResult &results);
};

#endif // CONSOLEREPORT_H
