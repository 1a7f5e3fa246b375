#pragma once

#include "GameStore.hpp"
#include <optional>
#include <memory>
#include <string>

namespace Skirmish {
	class MongoStore : public GameStore {
	public:
		explicit MongoStore(const std::string& connectionUri, const std::string& dbName);
		~MongoStore() override;

		std::optional<LobbyRecord> getLobby(const std::string& lobbyId) const override;
		std::optional<UserRecord> getUser(const std::string& userId) const override;
		std::optional<UserRecord> getUserByHandle(const std::string& handle) const override;
		std::optional<EntityDefinition> getCharacter(const std::string& characterId) const override;
		std::optional<CombatPresetRecord> getCombatPreset(const std::string& presetId) const override;
		std::vector<LobbyRecord> getLobbiesOfUser(const std::string& userId) const override;

		std::optional<std::string> createUser(const std::string& handle) override;
		std::optional<std::string> createLobby(const std::string& name, const std::string& gmId, const LobbyPlayer& gm) override;
		std::optional<std::string> createCharacter(const EntityDefinition& character) override;
		std::optional<std::string> createCombatPreset(const std::vector<PresetPawn>& field) override;

		bool setLobbyPlayers(const std::string& lobbyId, const std::vector<LobbyPlayer>& players) override;
		bool setLobbyCharacterBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank) override;
		bool updateCharacterField(const EntityDefinition& character, CharacterField field) override;

	private:
		class Impl;
		std::unique_ptr<Impl> pImpl;
	};
}
