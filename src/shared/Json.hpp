#pragma once

#include "DTOs.hpp"
#include "crow.h"
#include <string>
#include <vector>

namespace Skirmish {

	std::string toString(EntitySource source);
	EntitySource entitySourceFromString(const std::string& value);

	std::string controlType(const ControlInfo& control);
	std::optional<std::string> controllerId(const ControlInfo& control);

	// Readers throw ClientFault on a malformed payload.
	std::string requireString(const crow::json::rvalue& obj, const char* key);
	std::string optionalString(const crow::json::rvalue& obj, const char* key, const std::string& fallback = "");
	int optionalInt(const crow::json::rvalue& obj, const char* key, int fallback);
	std::vector<std::string> stringListFromJson(const crow::json::rvalue& obj, const char* key);

	ControlInfo controlInfoFromJson(const crow::json::rvalue& value);
	PresetPawn presetPawnFromJson(const std::string& square, const crow::json::rvalue& value);
	std::vector<PresetPawn> presetFieldFromJson(const crow::json::rvalue& field);
	EntityDefinition entityFromJson(const crow::json::rvalue& value);

	crow::json::wvalue stringListJson(const std::vector<std::string>& values);
	crow::json::wvalue toJson(const ControlInfo& control);
	crow::json::wvalue toJson(const EntityDefinition& entity);
	crow::json::wvalue toJson(const BattlefieldSeed& seed);
	crow::json::wvalue toJson(const CombatSummary& summary);
	crow::json::wvalue toJson(const LobbyInfoView& info);
	crow::json::wvalue toJson(const JoinedLobbyView& lobby);
	crow::json::wvalue errorJson(const std::string& message);
}
