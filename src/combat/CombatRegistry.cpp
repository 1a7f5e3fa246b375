#include "CombatRegistry.hpp"
#include "../infra/Log.hpp"

using namespace Skirmish;

std::string CombatRegistry::create(
	const std::string& nickname,
	BattlefieldSeed seed,
	const std::string& gmId,
	const std::vector<std::string>& players
) {
	std::lock_guard lock(mutex_);

	std::string combatId = std::to_string(managedSoFar_++);

	combats_[combatId] = std::make_shared<CombatSession>(
		combatId,
		nickname,
		std::move(seed),
		gmId,
		players,
		[this](const SessionEnded& event) { onSessionEnded(event); }
	);

	Log::log("[COMBAT] Combat created {} ({})", combatId, nickname);
	return combatId;
}

std::shared_ptr<CombatSession> CombatRegistry::get(const std::string& combatId) const {
	std::shared_ptr<CombatSession> session;
	{
		std::lock_guard lock(mutex_);
		auto it = combats_.find(combatId);
		if (it == combats_.end()) return nullptr;
		session = it->second;
	}
	if (session->isFinished()) return nullptr;
	return session;
}

bool CombatRegistry::teardown(const std::string& combatId, const std::string& reason) {
	auto session = get(combatId);
	if (!session) return false;
	return session->finish(reason);
}

CombatRegistry::SubscriptionId CombatRegistry::subscribe(EndedListener listener) {
	std::lock_guard lock(listenersMutex_);
	SubscriptionId id = nextSubscription_++;
	listeners_.emplace_back(id, std::move(listener));
	return id;
}

void CombatRegistry::unsubscribe(SubscriptionId id) {
	std::lock_guard lock(listenersMutex_);
	std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

size_t CombatRegistry::size() const {
	std::lock_guard lock(mutex_);
	return combats_.size();
}

void CombatRegistry::onSessionEnded(const SessionEnded& event) {
	std::shared_ptr<CombatSession> removed;
	{
		std::lock_guard lock(mutex_);
		auto it = combats_.find(event.combatId);
		if (it != combats_.end()) {
			removed = std::move(it->second);
			combats_.erase(it);
		}
	}

	std::vector<EndedListener> listeners;
	{
		std::lock_guard lock(listenersMutex_);
		for (const auto& entry : listeners_) listeners.push_back(entry.second);
	}
	for (const auto& listener : listeners) {
		listener(event);
	}

	Log::log("[COMBAT] Combat removed {}", event.combatId);
}
