#pragma once

#include "PlayerChannel.hpp"
#include "../shared/DTOs.hpp"
#include "crow.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Skirmish {

	/*
	 * One running encounter.
	 *
	 * Pending -> Active on start() by the game master, Active -> Finished on finish().
	 * Pending can also go straight to Finished when the encounter is cancelled.
	 * At most one live channel per player; closing a channel frees the slot and
	 * never ends the session.
	 */
	class CombatSession {
	public:
		using EndedSink = std::function<void(const SessionEnded&)>;

		CombatSession(
			std::string id,
			std::string nickname,
			BattlefieldSeed seed,
			std::string gmId,
			std::vector<std::string> players,
			EndedSink onEnded
		);
		~CombatSession() = default;

		CombatSession(const CombatSession&) = delete;
		CombatSession& operator=(const CombatSession&) = delete;

		const std::string& getId() const { return id_; }
		const std::string& getNickname() const { return nickname_; }
		const std::string& getGmId() const { return gmId_; }
		const BattlefieldSeed& getSeed() const { return seed_; }

		CombatStatus getStatus() const;
		bool isActive() const;
		bool isFinished() const;
		int getRoundCount() const;
		std::optional<std::string> getCurrentSquare() const;

		bool isRosterMember(const std::string& playerId) const;
		bool isPlayerInCombat(const std::string& playerId) const;
		std::vector<std::string> getPlayersInCombat() const;

		// Caller has already authenticated and deduplicated. Returns false if the slot
		// is taken or the session is finished.
		bool handlePlayer(const std::string& playerId, std::shared_ptr<PlayerChannel> channel);

		// Frees the slot only if it is still bound to this channel.
		void releasePlayer(const std::string& playerId, const PlayerChannel* channel);

		// Applies one inbound message. Rejections go to the sender only.
		void handleMessage(const std::string& playerId, const std::string& data);

		std::optional<std::string> start(const std::string& requesterId);
		std::optional<std::string> endTurn(const std::string& playerId, const std::string& square);
		bool finish(const std::string& outcome);

	private:
		std::optional<std::string> startLocked(const std::string& requesterId);
		std::optional<std::string> takeActionLocked(const std::string& playerId, const crow::json::rvalue& msg);
		std::optional<std::string> endTurnLocked(const std::string& playerId, const std::string& square);
		std::optional<std::string> checkControlLocked(const std::string& playerId, const std::string& square) const;

		bool canControl(const std::string& playerId, const FieldPawn& pawn) const;
		std::optional<std::string> currentPlayerLocked() const;
		std::string statusName() const;

		crow::json::wvalue stateJsonLocked() const;
		void broadcastLocked(const std::string& text, const std::string& exceptPlayer = "");
		void rejectLocked(const std::string& playerId, const std::string& reason);

		const std::string id_;
		const std::string nickname_;
		const BattlefieldSeed seed_;
		const std::string gmId_;
		const std::set<std::string> roster_;
		const std::vector<std::string> turnOrder_;
		EndedSink onEnded_;

		mutable std::mutex mutex_;
		CombatStatus status_{ CombatStatus::Pending };
		int roundCount_{ 0 };
		size_t currentTurn_{ 0 };
		std::map<std::string, std::shared_ptr<PlayerChannel>> connections_;
	};
}
