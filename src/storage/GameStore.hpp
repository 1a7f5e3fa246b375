#pragma once

#include "../shared/DTOs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Skirmish {

	// Document store for users, lobbies, characters and combat presets.
	// Absence is an empty optional and write failure is false or an empty optional;
	// implementations never throw for either.
	class GameStore {
	public:
		virtual ~GameStore() = default;

		virtual std::optional<LobbyRecord> getLobby(const std::string& lobbyId) const = 0;
		virtual std::optional<UserRecord> getUser(const std::string& userId) const = 0;
		virtual std::optional<UserRecord> getUserByHandle(const std::string& handle) const = 0;
		virtual std::optional<EntityDefinition> getCharacter(const std::string& characterId) const = 0;
		virtual std::optional<CombatPresetRecord> getCombatPreset(const std::string& presetId) const = 0;
		virtual std::vector<LobbyRecord> getLobbiesOfUser(const std::string& userId) const = 0;

		virtual std::optional<std::string> createUser(const std::string& handle) = 0;
		virtual std::optional<std::string> createLobby(const std::string& name, const std::string& gmId, const LobbyPlayer& gm) = 0;
		virtual std::optional<std::string> createCharacter(const EntityDefinition& character) = 0;
		virtual std::optional<std::string> createCombatPreset(const std::vector<PresetPawn>& field) = 0;

		// Single-document field updates.
		virtual bool setLobbyPlayers(const std::string& lobbyId, const std::vector<LobbyPlayer>& players) = 0;
		virtual bool setLobbyCharacterBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank) = 0;
		virtual bool updateCharacterField(const EntityDefinition& character, CharacterField field) = 0;
	};

}
