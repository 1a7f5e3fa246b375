#pragma once

#include "shared/DTOs.hpp"
#include "storage/InMemoryStore.hpp"
#include <memory>
#include <string>

namespace Skirmish::Testing {

	inline PresetPawn pawn(const std::string& square, const std::string& path, EntitySource source, ControlInfo control) {
		PresetPawn p;
		p.square = square;
		p.path = path;
		p.source = source;
		p.controlledBy = std::move(control);
		return p;
	}

	inline EntityDefinition goblin() {
		EntityDefinition entity;
		entity.descriptor = "goblin";
		entity.decorations.name = "Goblin";
		entity.decorations.sprite = "goblin.png";
		entity.attributes.push_back(Attribute{ "builtins", "hp", 7 });
		return entity;
	}

	inline EntityDefinition hero(const std::string& descriptor) {
		EntityDefinition entity;
		entity.descriptor = descriptor;
		return entity;
	}

	// A1 belongs to p1, B2 to p2, C3 to the AI.
	inline BattlefieldSeed duelSeed() {
		BattlefieldSeed seed;
		seed.fieldPawns["A1"] = FieldPawn{ EntityPresetRef{ EntitySource::Dlc, "knight" }, ControlledByPlayer{ "p1" } };
		seed.fieldPawns["B2"] = FieldPawn{ EntityPresetRef{ EntitySource::Dlc, "archer" }, ControlledByPlayer{ "p2" } };
		seed.fieldPawns["C3"] = FieldPawn{ EntityPresetRef{ EntitySource::Dlc, "goblin" }, ControlledByAi{ "g1" } };
		return seed;
	}

	inline UserRecord user(const std::string& id, const std::string& handle) {
		UserRecord u;
		u.id = id;
		u.handle = handle;
		return u;
	}

	// lobby1: gm1 organizes, p1 and p2 play.
	inline void seedLobby(InMemoryStore& store) {
		store.putUser(user("gm1", "gamemaster"));
		store.putUser(user("p1", "alice"));
		store.putUser(user("p2", "bob"));

		LobbyRecord lobby;
		lobby.id = "lobby1";
		lobby.name = "Friday Night";
		lobby.gmId = "gm1";
		lobby.players.push_back(LobbyPlayer{ "gm1", "GM", std::nullopt });
		lobby.players.push_back(LobbyPlayer{ "p1", "Alice", std::nullopt });
		lobby.players.push_back(LobbyPlayer{ "p2", "Bob", std::nullopt });
		store.putLobby(std::move(lobby));
	}
}
