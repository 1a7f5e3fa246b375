#pragma once

#include "CombatSession.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Skirmish {

	// Owns every live combat session, addressed by a never-reused id.
	class CombatRegistry {
	public:
		using EndedListener = std::function<void(const SessionEnded&)>;
		using SubscriptionId = uint64_t;

		CombatRegistry() = default;
		~CombatRegistry() = default;

		CombatRegistry(const CombatRegistry&) = delete;
		CombatRegistry& operator=(const CombatRegistry&) = delete;

		// No network or storage I/O.
		std::string create(
			const std::string& nickname,
			BattlefieldSeed seed,
			const std::string& gmId,
			const std::vector<std::string>& players
		);

		// Null when the id is unknown or its session has begun finishing.
		std::shared_ptr<CombatSession> get(const std::string& combatId) const;

		// Finishes the session; removal follows through the normal end path.
		bool teardown(const std::string& combatId, const std::string& reason);

		// Listeners run after the session is already unresolvable, in registration order.
		SubscriptionId subscribe(EndedListener listener);

		// A notification already being delivered may still reach the removed listener.
		void unsubscribe(SubscriptionId id);

		size_t size() const;

	private:
		void onSessionEnded(const SessionEnded& event);

		mutable std::mutex mutex_;
		std::unordered_map<std::string, std::shared_ptr<CombatSession>> combats_;
		uint64_t managedSoFar_{ 0 };

		std::mutex listenersMutex_;
		std::vector<std::pair<SubscriptionId, EndedListener>> listeners_;
		SubscriptionId nextSubscription_{ 0 };
	};
}
