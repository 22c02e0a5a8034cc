#include "PlanEngine.h"

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Reverts a recorded batch, newest rename first, collecting failures instead of stopping
UndoResult PlanEngine::performUndo(const UndoRecord &record)
{
	UndoResult results;

	for (auto it = record.entries.rbegin(); it != record.entries.rend(); ++it)
	{
		const fs::path &currentPath = it->CurrentPath;
		const fs::path &originalPath = it->OriginalPath;

		std::optional<RenameError> failure;
		try
		{
			failure = MoveViaStaging(currentPath, originalPath);
		}
		catch (const std::exception &ex)
		{
			failure = RenameError{RenameErrorKind::Access, "Unexpected error during undo: " + std::string(ex.what()), currentPath};
		}

		if (failure)
		{
			results.failedUndos.push_back(*failure);
		}
		else
		{
			results.successfulUndos.push_back(*it);
		}
	}

	results.overallSuccess = results.failedUndos.empty();
	return results;
}

std::string PlanEngine::serializeUndoRecord(const UndoRecord &record)
{
	Json::Value root(Json::objectValue);
	root["version"] = UndoRecordFormatVersion;

	Json::Value entries(Json::arrayValue);
	for (const auto &entry : record.entries)
	{
		Json::Value item(Json::objectValue);
		item["current"] = entry.CurrentPath.u8string();
		item["original"] = entry.OriginalPath.u8string();
		entries.append(item);
	}
	root["entries"] = entries;

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, root);
}

UndoRecordParseResult PlanEngine::deserializeUndoRecord(const std::string &bytes)
{
	UndoRecordParseResult result;
	auto fail = [&result](const std::string &message)
	{
		result.error = RenameError{RenameErrorKind::Validation, message, fs::path()};
		result.record.entries.clear();
		result.success = false;
		return result;
	};

	Json::CharReaderBuilder readerBuilder;
	std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());
	Json::Value root;
	std::string errors;
	if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &root, &errors))
	{
		return fail("Undo record is not valid JSON: " + errors);
	}
	if (!root.isObject() || !root.isMember("version") || !root["version"].isInt())
	{
		return fail("Undo record has no format version.");
	}
	if (root["version"].asInt() != UndoRecordFormatVersion)
	{
		return fail("Unsupported undo record version " + std::to_string(root["version"].asInt()) + ".");
	}

	const Json::Value &entries = root["entries"];
	if (!entries.isArray())
	{
		return fail("Undo record has no entry list.");
	}

	for (Json::ArrayIndex i = 0; i < entries.size(); ++i)
	{
		const Json::Value &item = entries[i];
		if (!item.isObject() || !item["current"].isString() || !item["original"].isString())
		{
			return fail("Undo record entry " + std::to_string(i) + " is malformed.");
		}
		const std::string current = item["current"].asString();
		const std::string original = item["original"].asString();
		if (current.empty() || original.empty())
		{
			return fail("Undo record entry " + std::to_string(i) + " has an empty path.");
		}
		result.record.entries.push_back({fs::u8path(current), fs::u8path(original)});
	}

	result.success = true;
	return result;
}
