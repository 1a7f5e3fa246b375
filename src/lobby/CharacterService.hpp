#pragma once

#include "../storage/GameStore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Skirmish {

	// Lobby character bank and per-character loadout edits.
	class CharacterService {
	public:
		explicit CharacterService(std::shared_ptr<GameStore> storage);

		std::string createCharacter(const EntityDefinition& character);

		EntityDefinition getMyCharacterInfo(const std::string& lobbyId, const std::string& userId) const;

		// Members only, and only for characters banked in this lobby.
		EntityDefinition getCharacterInfo(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId) const;

		// Players may only bank characters they control themselves; the GM may bank any.
		void addCharacterToLobby(
			const std::string& lobbyId,
			const std::string& requesterId,
			const std::string& characterId,
			const std::vector<std::string>& controlledBy
		);

		// Players may claim for themselves; assigning to someone else is reserved to the GM.
		void assignCharacterToPlayer(
			const std::string& lobbyId,
			const std::string& requesterId,
			const std::string& userId,
			const std::string& characterId
		);

		// Bank entries whose character no longer exists are removed from the lobby.
		std::vector<EntityDefinition> getCharactersOfPlayer(const std::string& lobbyId, const std::string& userId);

		// Loadout edits need the lobby GM or one of the character's controllers.

		void addItem(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int quantity);
		void addWeapon(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int quantity);
		void addSpell(
			const std::string& lobbyId,
			const std::string& requesterId,
			const std::string& characterId,
			const std::string& descriptor,
			const std::vector<std::string>& conflictsWith,
			const std::vector<std::string>& requiresToUse
		);
		void addStatusEffect(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::string& descriptor, int duration);
		void addAttribute(
			const std::string& lobbyId,
			const std::string& requesterId,
			const std::string& characterId,
			const std::string& dlc,
			const std::string& descriptor,
			int value
		);
		void changeSpellLayout(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId, const std::vector<std::string>& spells);

	private:
		LobbyRecord requireMembership(const std::string& lobbyId, const std::string& requesterId) const;
		EntityDefinition loadForUpdate(const std::string& lobbyId, const std::string& requesterId, const std::string& characterId) const;
		void save(const EntityDefinition& character, CharacterField field);
		void saveBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank);

		std::shared_ptr<GameStore> storage;
	};
}
