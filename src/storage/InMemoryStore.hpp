#pragma once

#include "GameStore.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace Skirmish {

	class InMemoryStore : public GameStore {
	public:
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

		// Seeding and inspection helpers.
		void putCharacter(const std::string& id, EntityDefinition character);
		void removeCharacter(const std::string& id);
		void putLobby(LobbyRecord lobby);
		void putUser(UserRecord user);
		void putCombatPreset(CombatPresetRecord preset);

		size_t characterLookups() const { return characterLookups_.load(); }
		void failWrites(bool fail) { failWrites_ = fail; }

	private:
		std::string nextId(const std::string& prefix);

		mutable std::mutex mutex_;
		std::unordered_map<std::string, LobbyRecord> lobbies_;
		std::unordered_map<std::string, UserRecord> users_;
		std::unordered_map<std::string, EntityDefinition> characters_;
		std::unordered_map<std::string, CombatPresetRecord> presets_;

		uint64_t counter_{ 0 };
		mutable std::atomic<size_t> characterLookups_{ 0 };
		std::atomic<bool> failWrites_{ false };
	};
}
