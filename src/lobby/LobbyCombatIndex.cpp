#include "LobbyCombatIndex.hpp"

#include <algorithm>

using namespace Skirmish;

void LobbyCombatIndex::add(const std::string& lobbyId, const std::string& combatId) {
	std::lock_guard lock(mutex_);
	auto& combats = combatsByLobby_[lobbyId];
	if (std::find(combats.begin(), combats.end(), combatId) == combats.end()) {
		combats.push_back(combatId);
	}
	lobbyByCombat_[combatId] = lobbyId;
}

bool LobbyCombatIndex::prune(const std::string& combatId) {
	std::lock_guard lock(mutex_);

	auto owner = lobbyByCombat_.find(combatId);
	if (owner == lobbyByCombat_.end()) return false;

	auto it = combatsByLobby_.find(owner->second);
	if (it != combatsByLobby_.end()) {
		auto& combats = it->second;
		combats.erase(std::remove(combats.begin(), combats.end(), combatId), combats.end());
		if (combats.empty()) combatsByLobby_.erase(it);
	}

	lobbyByCombat_.erase(owner);
	return true;
}

std::vector<std::string> LobbyCombatIndex::list(const std::string& lobbyId) const {
	std::lock_guard lock(mutex_);
	auto it = combatsByLobby_.find(lobbyId);
	if (it == combatsByLobby_.end()) return {};
	return it->second;
}

std::optional<std::string> LobbyCombatIndex::lobbyOf(const std::string& combatId) const {
	std::lock_guard lock(mutex_);
	auto it = lobbyByCombat_.find(combatId);
	if (it == lobbyByCombat_.end()) return std::nullopt;
	return it->second;
}
