#pragma once

#include "../shared/DTOs.hpp"
#include "../storage/GameStore.hpp"
#include "crow.h"
#include <memory>
#include <string>

namespace Skirmish {

	// Builds the mode-tagged preset source from a request payload.
	// mode is "importable" (payload is a preset id) or "requested" (payload is the field).
	PresetSource presetSourceFromJson(const std::string& mode, const crow::json::rvalue& payload);

	// Throws ClientFault when two pawns share a square.
	void validateUniqueSquares(const std::vector<PresetPawn>& field);

	class PresetCooker {
	public:
		explicit PresetCooker(std::shared_ptr<const GameStore> storage);

		// Read-only against storage. Throws ClientFault or NotFound; never returns a partial seed.
		BattlefieldSeed cook(const PresetSource& source) const;

	private:
		BattlefieldSeed cookField(const std::vector<PresetPawn>& field) const;

		std::shared_ptr<const GameStore> storage;
	};
}
