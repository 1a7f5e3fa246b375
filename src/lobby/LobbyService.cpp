#include "LobbyService.hpp"
#include "../infra/Log.hpp"
#include "../shared/Errors.hpp"

#include <algorithm>

using namespace Skirmish;

LobbyService::LobbyService(std::shared_ptr<GameStore> storage, std::shared_ptr<CombatRegistry> registry)
	: storage(std::move(storage)),
	registry(std::move(registry)),
	cooker(this->storage),
	index(std::make_shared<LobbyCombatIndex>())
{
	subscription = this->registry->subscribe([index = this->index](const SessionEnded& event) {
		if (index->prune(event.combatId)) {
			Log::log("[LOBBY] Combat {} pruned from its lobby", event.combatId);
		}
	});
}

LobbyService::~LobbyService() {
	registry->unsubscribe(subscription);
}

LobbyRecord LobbyService::requireLobby(const std::string& lobbyId) const {
	auto lobby = storage->getLobby(lobbyId);
	if (!lobby) throw NotFound("Lobby not found");
	return *lobby;
}

// Combats

std::optional<std::string> LobbyService::createCombat(
	const std::string& lobbyId,
	const std::string& nickname,
	BattlefieldSeed seed,
	const std::string& gmId,
	const std::vector<std::string>& players
) {
	if (lobbyId.empty()) return std::nullopt;

	std::string combatId = registry->create(nickname, std::move(seed), gmId, players);
	index->add(lobbyId, combatId);

	if (!registry->get(combatId)) {
		index->prune(combatId);
		return std::nullopt;
	}

	Log::log("[LOBBY] Combat {} registered under lobby {}", combatId, lobbyId);
	return combatId;
}

std::vector<std::string> LobbyService::getActiveCombats(const std::string& lobbyId) const {
	return index->list(lobbyId);
}

std::shared_ptr<CombatSession> LobbyService::get(const std::string& combatId) const {
	return registry->get(combatId);
}

std::string LobbyService::requestCombat(
	const std::string& lobbyId,
	const std::string& requesterId,
	const std::string& nickname,
	const PresetSource& preset,
	std::vector<std::string> players
) {
	if (nickname.empty()) {
		throw ClientFault("Combat nickname is required");
	}

	LobbyRecord lobby = requireLobby(lobbyId);
	if (lobby.gmId != requesterId) {
		throw ClientFault("Only the lobby GM can create combats");
	}

	if (players.empty()) {
		for (const auto& p : lobby.players) {
			if (p.userId != lobby.gmId) players.push_back(p.userId);
		}
	}
	else {
		for (const auto& playerId : players) {
			if (!lobby.findPlayer(playerId)) {
				throw ClientFault("Player " + playerId + " is not in this lobby");
			}
		}
	}

	BattlefieldSeed seed = cooker.cook(preset);

	auto combatId = createCombat(lobbyId, nickname, std::move(seed), lobby.gmId, players);
	if (!combatId) {
		throw InternalFault("Combat could not be created");
	}
	return *combatId;
}

bool LobbyService::cancelCombat(const std::string& lobbyId, const std::string& requesterId, const std::string& combatId) {
	LobbyRecord lobby = requireLobby(lobbyId);
	if (lobby.gmId != requesterId) {
		throw ClientFault("Only the lobby GM can cancel combats");
	}

	auto owner = index->lobbyOf(combatId);
	if (!owner || *owner != lobbyId) {
		throw NotFound("Combat not found");
	}

	return registry->teardown(combatId, "cancelled");
}

std::vector<CombatSummary> LobbyService::summarizeCombats(const LobbyRecord& lobby) const {
	std::vector<CombatSummary> summaries;

	for (const auto& combatId : index->list(lobby.id)) {
		auto combat = registry->get(combatId);
		if (!combat) continue;

		CombatSummary summary;
		summary.id = combatId;
		summary.nickname = combat->getNickname();

		for (const auto& playerId : combat->getPlayersInCombat()) {
			auto user = storage->getUser(playerId);
			const LobbyPlayer* member = lobby.findPlayer(playerId);

			summary.activePlayers.push_back(ActivePlayerView{
				user ? user->handle : std::string(),
				member ? member->nickname : std::string()
			});
		}

		// Storage lookups above may have outlived the session.
		if (combat->isFinished()) continue;

		summary.isActive = combat->isActive();
		summary.roundCount = summary.isActive ? combat->getRoundCount() : 0;
		summaries.push_back(std::move(summary));
	}

	return summaries;
}

std::vector<CombatSummary> LobbyService::listCombats(const std::string& lobbyId, const std::string& requesterId) const {
	LobbyRecord lobby = requireLobby(lobbyId);
	if (!lobby.findPlayer(requesterId)) {
		throw ClientFault("Not a member of this lobby");
	}
	return summarizeCombats(lobby);
}

// Lobbies

LobbyInfoView LobbyService::getLobbyInfo(const std::string& lobbyId, const std::string& userId) const {
	LobbyRecord lobby = requireLobby(lobbyId);
	if (!lobby.findPlayer(userId)) {
		throw ClientFault("Not a member of this lobby");
	}

	LobbyInfoView info;
	info.lobbyId = lobbyId;
	info.name = lobby.name;
	info.gmId = lobby.gmId;
	info.layout = userId == lobby.gmId ? "gm" : "default";
	info.combats = summarizeCombats(lobby);

	if (const LobbyPlayer* self = lobby.findPlayer(userId); self && self->characterId) {
		auto entity = storage->getCharacter(*self->characterId);
		if (entity) {
			info.controlledEntity = ControlledEntityView{ *self->characterId, entity->descriptor };
		}
		else {
			info.controlledEntity = ControlledEntityView{ "", "Character not found" };
		}
	}

	for (const auto& p : lobby.players) {
		LobbyMemberView member;
		member.userId = p.userId;
		member.nickname = p.nickname;

		if (auto user = storage->getUser(p.userId)) {
			member.handle = user->handle;
		}
		if (p.characterId) {
			if (auto character = storage->getCharacter(*p.characterId)) {
				member.character = CharacterCard{ character->displayName(), character->displaySprite() };
			}
		}
		info.players.push_back(std::move(member));
	}

	return info;
}

std::string LobbyService::createLobby(const std::string& name, const std::string& gmId) {
	if (name.empty()) {
		throw ClientFault("Lobby name is required");
	}

	auto gm = storage->getUser(gmId);
	if (!gm) throw NotFound("User not found");

	auto lobbyId = storage->createLobby(name, gmId, LobbyPlayer{ gmId, gm->handle, std::nullopt });
	if (!lobbyId) {
		Log::log("[LOBBY] Failed to persist lobby {}", name);
		throw InternalFault();
	}

	Log::log("[LOBBY] Created {} by {}", *lobbyId, gmId);
	return *lobbyId;
}

void LobbyService::addPlayerToLobby(
	const std::string& lobbyId,
	const std::string& userId,
	const std::string& nickname,
	const std::optional<std::string>& mainCharacter
) {
	auto user = storage->getUser(userId);
	if (!user) throw NotFound("User not found");

	LobbyRecord lobby = requireLobby(lobbyId);
	if (lobby.findPlayer(userId)) {
		throw ClientFault("Player already in lobby");
	}

	if (mainCharacter && !storage->getCharacter(*mainCharacter)) {
		throw NotFound("Character not found");
	}

	lobby.players.push_back(LobbyPlayer{
		userId,
		nickname.empty() ? user->handle : nickname,
		mainCharacter
	});

	if (!storage->setLobbyPlayers(lobbyId, lobby.players)) {
		Log::log("[LOBBY] Failed to add {} to lobby {}", userId, lobbyId);
		throw InternalFault();
	}
}

std::vector<JoinedLobbyView> LobbyService::getJoinedLobbies(const std::string& userId) const {
	std::vector<JoinedLobbyView> result;

	for (const auto& lobby : storage->getLobbiesOfUser(userId)) {
		JoinedLobbyView view;
		view.id = lobby.id;
		view.name = lobby.name;
		view.isGm = lobby.gmId == userId;

		for (const auto& entry : lobby.characterBank) {
			if (!entry.isControlledBy(userId)) continue;

			auto character = storage->getCharacter(entry.characterId);
			if (!character) continue;
			view.characters.push_back(character->displayName());
		}

		result.push_back(std::move(view));
	}

	return result;
}

std::string LobbyService::createCombatPreset(const std::vector<PresetPawn>& field) {
	validateUniqueSquares(field);

	auto presetId = storage->createCombatPreset(field);
	if (!presetId) {
		Log::log("[LOBBY] Failed to persist combat preset");
		throw InternalFault();
	}
	return *presetId;
}
