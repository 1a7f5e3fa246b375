#pragma once

#include "LobbyCombatIndex.hpp"
#include "../combat/CombatRegistry.hpp"
#include "../combat/PresetCooker.hpp"
#include "../storage/GameStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Skirmish {

	class LobbyService {
	public:
		LobbyService(std::shared_ptr<GameStore> storage, std::shared_ptr<CombatRegistry> registry);
		~LobbyService();

		LobbyService(const LobbyService&) = delete;
		LobbyService& operator=(const LobbyService&) = delete;

		// Combats

		std::optional<std::string> createCombat(
			const std::string& lobbyId,
			const std::string& nickname,
			BattlefieldSeed seed,
			const std::string& gmId,
			const std::vector<std::string>& players
		);

		std::vector<std::string> getActiveCombats(const std::string& lobbyId) const;
		std::shared_ptr<CombatSession> get(const std::string& combatId) const;

		// Full creation flow: lobby and GM checks, preset cooking, registration.
		// An empty player list means every lobby member except the GM.
		std::string requestCombat(
			const std::string& lobbyId,
			const std::string& requesterId,
			const std::string& nickname,
			const PresetSource& preset,
			std::vector<std::string> players
		);

		bool cancelCombat(const std::string& lobbyId, const std::string& requesterId, const std::string& combatId);

		// Omits sessions that end while the summary is being built.
		std::vector<CombatSummary> summarizeCombats(const LobbyRecord& lobby) const;
		// Members only.
		std::vector<CombatSummary> listCombats(const std::string& lobbyId, const std::string& requesterId) const;

		// Lobbies

		LobbyInfoView getLobbyInfo(const std::string& lobbyId, const std::string& userId) const;
		std::string createLobby(const std::string& name, const std::string& gmId);
		void addPlayerToLobby(
			const std::string& lobbyId,
			const std::string& userId,
			const std::string& nickname,
			const std::optional<std::string>& mainCharacter
		);
		std::vector<JoinedLobbyView> getJoinedLobbies(const std::string& userId) const;

		std::string createCombatPreset(const std::vector<PresetPawn>& field);

	private:
		LobbyRecord requireLobby(const std::string& lobbyId) const;

		std::shared_ptr<GameStore> storage;
		std::shared_ptr<CombatRegistry> registry;
		PresetCooker cooker;
		// Shared with the registry listener so an in-flight notification never outlives it.
		std::shared_ptr<LobbyCombatIndex> index;
		CombatRegistry::SubscriptionId subscription{ 0 };
	};
}
