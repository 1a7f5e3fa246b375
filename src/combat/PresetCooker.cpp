#include "PresetCooker.hpp"
#include "../infra/Log.hpp"
#include "../shared/Errors.hpp"
#include "../shared/Json.hpp"

#include <unordered_set>

using namespace Skirmish;

PresetSource Skirmish::presetSourceFromJson(const std::string& mode, const crow::json::rvalue& payload) {
	if (mode == "importable") {
		if (payload.t() == crow::json::type::String) {
			return ImportablePreset{ std::string(payload.s()) };
		}
		if (payload.t() == crow::json::type::Object && payload.has("id")) {
			return ImportablePreset{ requireString(payload, "id") };
		}
		throw ClientFault("Importable preset must be a preset id");
	}

	if (mode == "requested") {
		if (payload.t() != crow::json::type::Object || !payload.has("field")) {
			throw ClientFault("Requested preset must contain a field");
		}
		return RequestedPreset{ presetFieldFromJson(payload["field"]) };
	}

	throw ClientFault("Unknown type. Use \"importable\" or \"requested\". Provided: " + mode);
}

void Skirmish::validateUniqueSquares(const std::vector<PresetPawn>& field) {
	std::unordered_set<std::string> occupied;
	for (const auto& pawn : field) {
		if (!occupied.insert(pawn.square).second) {
			throw ClientFault("Multiple pawns on the same square: " + pawn.square);
		}
	}
}

PresetCooker::PresetCooker(std::shared_ptr<const GameStore> storage)
	: storage(std::move(storage)) {}

BattlefieldSeed PresetCooker::cook(const PresetSource& source) const {
	if (auto importable = std::get_if<ImportablePreset>(&source)) {
		auto preset = storage->getCombatPreset(importable->presetId);
		if (!preset) {
			throw NotFound("Combat preset not found");
		}
		return cookField(preset->field);
	}

	return cookField(std::get<RequestedPreset>(source).field);
}

BattlefieldSeed PresetCooker::cookField(const std::vector<PresetPawn>& field) const {
	validateUniqueSquares(field);

	BattlefieldSeed seed;

	for (const auto& pawn : field) {
		seed.fieldPawns[pawn.square] = FieldPawn{
			EntityPresetRef{ pawn.source, pawn.path },
			pawn.controlledBy
		};

		if (pawn.source != EntitySource::Embedded || seed.customEntities.contains(pawn.path)) {
			continue;
		}

		auto entity = storage->getCharacter(pawn.path);
		if (!entity) {
			Log::log("[COMBAT] Preset references missing entity {} on {}", pawn.path, pawn.square);
			throw NotFound("Entity not found: " + pawn.path);
		}
		seed.customEntities[pawn.path] = std::move(*entity);
	}

	return seed;
}
