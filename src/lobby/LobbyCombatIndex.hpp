#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Skirmish {

	// lobbyId -> combat ids in creation order.
	class LobbyCombatIndex {
	public:
		void add(const std::string& lobbyId, const std::string& combatId);
		bool prune(const std::string& combatId);

		std::vector<std::string> list(const std::string& lobbyId) const;
		std::optional<std::string> lobbyOf(const std::string& combatId) const;

	private:
		mutable std::mutex mutex_;
		std::unordered_map<std::string, std::vector<std::string>> combatsByLobby_;
		std::unordered_map<std::string, std::string> lobbyByCombat_;
	};
}
