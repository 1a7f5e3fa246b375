#include "CombatSession.hpp"
#include "../infra/Log.hpp"
#include "../shared/Json.hpp"

using namespace Skirmish;

static std::vector<std::string> buildTurnOrder(const BattlefieldSeed& seed) {
	std::vector<std::string> order;
	order.reserve(seed.fieldPawns.size());
	for (const auto& [square, pawn] : seed.fieldPawns) {
		order.push_back(square);
	}
	return order;
}

CombatSession::CombatSession(
	std::string id,
	std::string nickname,
	BattlefieldSeed seed,
	std::string gmId,
	std::vector<std::string> players,
	EndedSink onEnded
) : id_(std::move(id)),
nickname_(std::move(nickname)),
seed_(std::move(seed)),
gmId_(std::move(gmId)),
roster_(players.begin(), players.end()),
turnOrder_(buildTurnOrder(seed_)),
onEnded_(std::move(onEnded))
{
}

// Observers

CombatStatus CombatSession::getStatus() const {
	std::lock_guard lock(mutex_);
	return status_;
}

bool CombatSession::isActive() const {
	std::lock_guard lock(mutex_);
	return status_ == CombatStatus::Active;
}

bool CombatSession::isFinished() const {
	std::lock_guard lock(mutex_);
	return status_ == CombatStatus::Finished;
}

int CombatSession::getRoundCount() const {
	std::lock_guard lock(mutex_);
	return roundCount_;
}

std::optional<std::string> CombatSession::getCurrentSquare() const {
	std::lock_guard lock(mutex_);
	if (status_ != CombatStatus::Active || turnOrder_.empty()) return std::nullopt;
	return turnOrder_[currentTurn_];
}

bool CombatSession::isRosterMember(const std::string& playerId) const {
	return playerId == gmId_ || roster_.contains(playerId);
}

bool CombatSession::isPlayerInCombat(const std::string& playerId) const {
	std::lock_guard lock(mutex_);
	return connections_.contains(playerId);
}

std::vector<std::string> CombatSession::getPlayersInCombat() const {
	std::lock_guard lock(mutex_);
	std::vector<std::string> players;
	players.reserve(connections_.size());
	for (const auto& [playerId, channel] : connections_) {
		players.push_back(playerId);
	}
	return players;
}

// Connections

bool CombatSession::handlePlayer(const std::string& playerId, std::shared_ptr<PlayerChannel> channel) {
	if (!channel) return false;

	std::lock_guard lock(mutex_);

	if (status_ == CombatStatus::Finished || connections_.contains(playerId)) {
		return false;
	}

	connections_[playerId] = channel;

	crow::json::wvalue handshake = stateJsonLocked();
	handshake["type"] = "handshake";
	handshake["gameId"] = id_;
	handshake["nickname"] = nickname_;
	handshake["currentBattlefield"] = toJson(seed_);
	handshake["isGm"] = playerId == gmId_;
	channel->send(handshake.dump());

	crow::json::wvalue joined;
	joined["type"] = "player_joined";
	joined["playerId"] = playerId;
	broadcastLocked(joined.dump(), playerId);

	Log::log("[COMBAT] Player {} attached to combat {}", playerId, id_);
	return true;
}

void CombatSession::releasePlayer(const std::string& playerId, const PlayerChannel* channel) {
	std::lock_guard lock(mutex_);

	auto it = connections_.find(playerId);
	if (it == connections_.end() || it->second.get() != channel) {
		return;
	}
	connections_.erase(it);

	crow::json::wvalue left;
	left["type"] = "player_left";
	left["playerId"] = playerId;
	broadcastLocked(left.dump());

	Log::log("[COMBAT] Player {} released from combat {}", playerId, id_);
}

// Messages

void CombatSession::handleMessage(const std::string& playerId, const std::string& data) {
	auto msg = crow::json::load(data);

	std::unique_lock lock(mutex_);

	if (!connections_.contains(playerId)) {
		return;
	}

	if (!msg || msg.t() != crow::json::type::Object || !msg.has("type") || msg["type"].t() != crow::json::type::String) {
		rejectLocked(playerId, "Invalid message");
		return;
	}

	std::string type = msg["type"].s();
	std::optional<std::string> rejection;

	if (type == "start_combat") {
		rejection = startLocked(playerId);
	}
	else if (type == "take_action") {
		rejection = takeActionLocked(playerId, msg);
	}
	else if (type == "end_turn") {
		std::string square = optionalString(msg, "square");
		rejection = endTurnLocked(playerId, square);
	}
	else if (type == "end_combat") {
		if (playerId != gmId_) {
			rejection = "Only the game master can end the combat";
		}
		else {
			std::string outcome = optionalString(msg, "outcome", "ended_by_gm");
			lock.unlock();
			finish(outcome);
			return;
		}
	}
	else {
		rejection = "Unknown message type: " + type;
	}

	if (rejection) {
		rejectLocked(playerId, *rejection);
	}
}

std::optional<std::string> CombatSession::start(const std::string& requesterId) {
	std::lock_guard lock(mutex_);
	return startLocked(requesterId);
}

std::optional<std::string> CombatSession::endTurn(const std::string& playerId, const std::string& square) {
	std::lock_guard lock(mutex_);
	return endTurnLocked(playerId, square);
}

bool CombatSession::finish(const std::string& outcome) {
	std::vector<std::shared_ptr<PlayerChannel>> channels;
	{
		std::lock_guard lock(mutex_);
		if (status_ == CombatStatus::Finished) {
			return false;
		}
		status_ = CombatStatus::Finished;

		crow::json::wvalue finished;
		finished["type"] = "combat_finished";
		finished["gameId"] = id_;
		finished["outcome"] = outcome;
		finished["roundCount"] = roundCount_;
		broadcastLocked(finished.dump());

		for (auto& [playerId, channel] : connections_) {
			channels.push_back(channel);
		}
		connections_.clear();
	}

	for (auto& channel : channels) {
		channel->disconnect("Combat finished");
	}

	Log::log("[COMBAT] Combat {} finished ({})", id_, outcome);

	// The registry may drop its reference to this session inside the sink.
	EndedSink sink = onEnded_;
	if (sink) {
		sink(SessionEnded{ id_, outcome });
	}
	return true;
}

// Turn logic

std::optional<std::string> CombatSession::startLocked(const std::string& requesterId) {
	if (requesterId != gmId_) {
		return "Only the game master can start the combat";
	}
	if (status_ != CombatStatus::Pending) {
		return "Combat already started";
	}

	status_ = CombatStatus::Active;
	currentTurn_ = 0;

	crow::json::wvalue state = stateJsonLocked();
	broadcastLocked(state.dump());

	Log::log("[COMBAT] Combat {} started by {}", id_, requesterId);
	return std::nullopt;
}

std::optional<std::string> CombatSession::takeActionLocked(const std::string& playerId, const crow::json::rvalue& msg) {
	std::string square = optionalString(msg, "square");
	std::string action = optionalString(msg, "action");
	if (action.empty()) {
		return "Action is required";
	}

	if (auto rejection = checkControlLocked(playerId, square)) {
		return rejection;
	}

	crow::json::wvalue event;
	event["type"] = "action";
	event["gameId"] = id_;
	event["square"] = square;
	event["action"] = action;
	event["by"] = playerId;
	event["roundCount"] = roundCount_;
	if (msg.has("target") && msg["target"].t() == crow::json::type::String) {
		event["target"] = std::string(msg["target"].s());
	}
	broadcastLocked(event.dump());
	return std::nullopt;
}

std::optional<std::string> CombatSession::endTurnLocked(const std::string& playerId, const std::string& square) {
	if (auto rejection = checkControlLocked(playerId, square)) {
		return rejection;
	}

	++currentTurn_;
	if (currentTurn_ >= turnOrder_.size()) {
		currentTurn_ = 0;
		++roundCount_;
	}

	crow::json::wvalue state = stateJsonLocked();
	broadcastLocked(state.dump());
	return std::nullopt;
}

std::optional<std::string> CombatSession::checkControlLocked(const std::string& playerId, const std::string& square) const {
	if (status_ != CombatStatus::Active) {
		return "Combat is not active";
	}
	if (!isRosterMember(playerId)) {
		return "Player is not part of this combat";
	}

	auto it = seed_.fieldPawns.find(square);
	if (it == seed_.fieldPawns.end()) {
		return "No pawn on square " + square;
	}
	if (!canControl(playerId, it->second)) {
		return "Pawn on " + square + " is not controlled by this player";
	}
	if (turnOrder_[currentTurn_] != square) {
		return "It is not the turn of the pawn on " + square;
	}
	return std::nullopt;
}

bool CombatSession::canControl(const std::string& playerId, const FieldPawn& pawn) const {
	if (auto player = std::get_if<ControlledByPlayer>(&pawn.owner)) {
		if (player->id) {
			return *player->id == playerId;
		}
		return playerId == gmId_;
	}
	// AI and game-logic pawns are driven by the game master.
	return playerId == gmId_;
}

std::optional<std::string> CombatSession::currentPlayerLocked() const {
	if (status_ != CombatStatus::Active || turnOrder_.empty()) return std::nullopt;

	const FieldPawn& pawn = seed_.fieldPawns.at(turnOrder_[currentTurn_]);
	if (auto player = std::get_if<ControlledByPlayer>(&pawn.owner); player && player->id) {
		return player->id;
	}
	return gmId_;
}

std::string CombatSession::statusName() const {
	switch (status_) {
	case CombatStatus::Pending: return "pending";
	case CombatStatus::Active: return "ongoing";
	case CombatStatus::Finished: return "finished";
	}
	return "pending";
}

crow::json::wvalue CombatSession::stateJsonLocked() const {
	crow::json::wvalue state;
	state["type"] = "state";
	state["gameId"] = id_;
	state["combatStatus"] = statusName();
	state["roundCount"] = roundCount_;

	if (status_ == CombatStatus::Active && !turnOrder_.empty()) {
		state["currentEntity"] = turnOrder_[currentTurn_];
	}
	else {
		state["currentEntity"] = nullptr;
	}

	auto current = currentPlayerLocked();
	if (current) state["currentPlayer"] = *current;
	else state["currentPlayer"] = nullptr;

	return state;
}

void CombatSession::broadcastLocked(const std::string& text, const std::string& exceptPlayer) {
	for (const auto& [playerId, channel] : connections_) {
		if (!exceptPlayer.empty() && playerId == exceptPlayer) continue;
		channel->send(text);
	}
}

void CombatSession::rejectLocked(const std::string& playerId, const std::string& reason) {
	auto it = connections_.find(playerId);
	if (it == connections_.end()) return;

	crow::json::wvalue rejection;
	rejection["type"] = "action_rejected";
	rejection["reason"] = reason;
	it->second->send(rejection.dump());
}
