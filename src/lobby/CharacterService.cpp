#include "CharacterService.hpp"
#include "../infra/Log.hpp"
#include "../shared/Errors.hpp"

#include <algorithm>

using namespace Skirmish;

CharacterService::CharacterService(std::shared_ptr<GameStore> storage)
	: storage(std::move(storage)) {}

std::string CharacterService::createCharacter(const EntityDefinition& character) {
	if (character.descriptor.empty()) {
		throw ClientFault("Character descriptor is required");
	}

	auto characterId = storage->createCharacter(character);
	if (!characterId) {
		Log::log("[LOBBY] Failed to persist character {}", character.descriptor);
		throw InternalFault();
	}
	return *characterId;
}

EntityDefinition CharacterService::getMyCharacterInfo(const std::string& lobbyId, const std::string& userId) const {
	auto lobby = storage->getLobby(lobbyId);
	if (!lobby) throw NotFound("Lobby not found");

	const LobbyPlayer* player = lobby->findPlayer(userId);
	if (!player) throw NotFound("Player not found");
	if (!player->characterId) throw ClientFault("Player has no character");

	auto character = storage->getCharacter(*player->characterId);
	if (!character) throw NotFound("Character not found");
	return *character;
}

EntityDefinition CharacterService::getCharacterInfo(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId) const {
	LobbyRecord lobby = requireMembership(lobbyId, requesterId);
	if (!lobby.findBankEntry(characterId)) throw NotFound("Character not found");

	auto character = storage->getCharacter(characterId);
	if (!character) throw NotFound("Character not found");
	return *character;
}

void CharacterService::addCharacterToLobby(
	const std::string& lobbyId,
	const std::string& requesterId,
	const std::string& characterId,
	const std::vector<std::string>& controlledBy
) {
	LobbyRecord lobby = requireMembership(lobbyId, requesterId);

	if (lobby.gmId != requesterId) {
		for (const auto& controller : controlledBy) {
			if (controller != requesterId) {
				throw ClientFault("Only the lobby GM can bank characters for other players");
			}
		}
	}

	for (const auto& controller : controlledBy) {
		if (!lobby.findPlayer(controller)) throw NotFound("Player not found");
	}

	if (!storage->getCharacter(characterId)) throw NotFound("Character not found");
	if (lobby.findBankEntry(characterId)) throw ClientFault("Character already in lobby");

	lobby.characterBank.push_back(CharacterBankEntry{ characterId, controlledBy });
	saveBank(lobbyId, lobby.characterBank);
}

void CharacterService::assignCharacterToPlayer(
	const std::string& lobbyId,
	const std::string& requesterId,
	const std::string& userId,
	const std::string& characterId
) {
	auto lobby = storage->getLobby(lobbyId);
	if (!lobby) throw NotFound("Lobby not found");
	if (requesterId != userId && requesterId != lobby->gmId) {
		throw ClientFault("Only the lobby GM can assign characters to other players");
	}
	if (!lobby->findPlayer(userId)) throw NotFound("Player not found");

	CharacterBankEntry* entry = lobby->findBankEntry(characterId);
	if (!entry) throw NotFound("Character not found");

	if (!storage->getCharacter(characterId)) {
		std::erase_if(lobby->characterBank, [&](const CharacterBankEntry& c) { return c.characterId == characterId; });
		saveBank(lobbyId, lobby->characterBank);
		throw NotFound("Entity you were looking for was removed from Database, but not from lobby. Removing.");
	}

	if (!entry->isControlledBy(userId)) {
		entry->controlledBy.push_back(userId);
	}
	saveBank(lobbyId, lobby->characterBank);
}

std::vector<EntityDefinition> CharacterService::getCharactersOfPlayer(const std::string& lobbyId, const std::string& userId) {
	auto lobby = storage->getLobby(lobbyId);
	if (!lobby) throw NotFound("Lobby not found");
	if (!lobby->findPlayer(userId)) throw NotFound("Player not found");

	std::vector<EntityDefinition> characters;
	std::vector<std::string> dangling;

	for (const auto& entry : lobby->characterBank) {
		if (!entry.isControlledBy(userId)) continue;

		auto character = storage->getCharacter(entry.characterId);
		if (!character) {
			dangling.push_back(entry.characterId);
			continue;
		}
		characters.push_back(std::move(*character));
	}

	if (!dangling.empty()) {
		std::erase_if(lobby->characterBank, [&](const CharacterBankEntry& c) {
			return std::find(dangling.begin(), dangling.end(), c.characterId) != dangling.end();
		});
		saveBank(lobbyId, lobby->characterBank);
		Log::log("[LOBBY] Pruned {} missing characters from lobby {}", dangling.size(), lobbyId);
	}

	return characters;
}

// Loadout

void CharacterService::addItem(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int quantity) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	character.inventory.push_back(ItemEntry{ descriptor, quantity });
	save(character, CharacterField::Inventory);
}

void CharacterService::addWeapon(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int quantity) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	character.weaponry.push_back(ItemEntry{ descriptor, quantity });
	save(character, CharacterField::Weaponry);
}

void CharacterService::addSpell(
	const std::string& lobbyId,
	const std::string& requesterId,
	const std::string& characterId,
	const std::string& descriptor,
	const std::vector<std::string>& conflictsWith,
	const std::vector<std::string>& requiresToUse
) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	character.spellBook.push_back(SpellEntry{ descriptor, conflictsWith, requiresToUse });
	save(character, CharacterField::SpellBook);
}

void CharacterService::addStatusEffect(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int duration) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	character.statusEffects.push_back(StatusEffectEntry{ descriptor, duration });
	save(character, CharacterField::StatusEffects);
}

void CharacterService::addAttribute(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& dlc, const std::string& descriptor, int value) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	character.attributes.push_back(Attribute{ dlc.empty() ? "builtins" : dlc, descriptor, value });
	save(character, CharacterField::Attributes);
}

void CharacterService::changeSpellLayout(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::vector<std::string>& spells) {
	EntityDefinition character = loadForUpdate(lobbyId, requesterId, characterId);
	if (spells.size() > static_cast<size_t>(character.spellLayout.max)) {
		throw ClientFault("Too many spells");
	}
	character.spellLayout.layout = spells;
	save(character, CharacterField::SpellLayout);
}

// Helpers

LobbyRecord CharacterService::requireMembership(const std::string& lobbyId, const std::string& requesterId) const {
	auto lobby = storage->getLobby(lobbyId);
	if (!lobby) throw NotFound("Lobby not found");
	if (!lobby->findPlayer(requesterId)) throw ClientFault("Not a member of this lobby");
	return *lobby;
}

EntityDefinition CharacterService::loadForUpdate(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId) const {
	LobbyRecord lobby = requireMembership(lobbyId, requesterId);

	const CharacterBankEntry* entry = lobby.findBankEntry(characterId);
	if (!entry) throw NotFound("Character not found");
	if (lobby.gmId != requesterId && !entry->isControlledBy(requesterId)) {
		throw ClientFault("Only the lobby GM or the character's controllers can edit it");
	}

	auto character = storage->getCharacter(characterId);
	if (!character) throw NotFound("Character not found");
	return *character;
}

void CharacterService::save(const EntityDefinition& character, CharacterField field) {
	if (!storage->updateCharacterField(character, field)) {
		Log::log("[LOBBY] Failed to update character {}", character.id);
		throw InternalFault();
	}
}

void CharacterService::saveBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank) {
	if (!storage->setLobbyCharacterBank(lobbyId, bank)) {
		Log::log("[LOBBY] Failed to update character bank of {}", lobbyId);
		throw InternalFault();
	}
}
