#pragma once

#include "Enums.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Skirmish {

	// Control

	struct ControlledByPlayer {
		std::optional<std::string> id;
		bool operator==(const ControlledByPlayer&) const = default;
	};

	struct ControlledByAi {
		std::string id;
		bool operator==(const ControlledByAi&) const = default;
	};

	struct ControlledByGameLogic {
		bool operator==(const ControlledByGameLogic&) const = default;
	};

	using ControlInfo = std::variant<ControlledByPlayer, ControlledByAi, ControlledByGameLogic>;

	// Characters

	struct Decorations {
		std::string name;
		std::string description;
		std::string sprite;
		bool operator==(const Decorations&) const = default;
	};

	struct Attribute {
		std::string dlc{ "builtins" };
		std::string descriptor;
		int value{ 0 };
		bool operator==(const Attribute&) const = default;
	};

	struct ItemEntry {
		std::string descriptor;
		int quantity{ 1 };
		bool operator==(const ItemEntry&) const = default;
	};

	struct SpellEntry {
		std::string descriptor;
		std::vector<std::string> conflictsWith;
		std::vector<std::string> requiresToUse;
		bool operator==(const SpellEntry&) const = default;
	};

	struct StatusEffectEntry {
		std::string descriptor;
		int duration{ 0 };
		bool operator==(const StatusEffectEntry&) const = default;
	};

	struct SpellLayout {
		int max{ 4 };
		std::vector<std::string> layout;
		bool operator==(const SpellLayout&) const = default;
	};

	struct Level {
		int current{ 1 };
		int availableUpgrades{ 0 };
		bool operator==(const Level&) const = default;
	};

	struct AbilitiesPoints {
		int will{ 0 };
		int reflexes{ 0 };
		int strength{ 0 };
		int max{ 0 };
		bool operator==(const AbilitiesPoints&) const = default;
	};

	struct EntityDefinition {
		std::string id;
		std::string descriptor;
		Decorations decorations;
		Level level;
		int gold{ 0 };
		std::vector<std::string> alignments;
		AbilitiesPoints abilitiesPoints;
		std::vector<Attribute> attributes;
		std::vector<ItemEntry> inventory;
		std::vector<ItemEntry> weaponry;
		std::vector<SpellEntry> spellBook;
		SpellLayout spellLayout;
		std::vector<StatusEffectEntry> statusEffects;

		bool operator==(const EntityDefinition&) const = default;

		std::string displayName() const {
			return decorations.name.empty() ? descriptor + ".name" : decorations.name;
		}

		std::string displaySprite() const {
			return decorations.sprite.empty() ? descriptor + ".sprite" : decorations.sprite;
		}
	};

	// Presets

	struct PresetPawn {
		std::string square;
		std::string path;
		EntitySource source{ EntitySource::Dlc };
		ControlInfo controlledBy{ ControlledByGameLogic{} };
	};

	struct CombatPresetRecord {
		std::string id;
		std::vector<PresetPawn> field;
	};

	struct ImportablePreset {
		std::string presetId;
	};

	struct RequestedPreset {
		std::vector<PresetPawn> field;
	};

	using PresetSource = std::variant<ImportablePreset, RequestedPreset>;

	struct EntityPresetRef {
		EntitySource source{ EntitySource::Dlc };
		std::string name;
		bool operator==(const EntityPresetRef&) const = default;
	};

	struct FieldPawn {
		EntityPresetRef entityPreset;
		ControlInfo owner{ ControlledByGameLogic{} };
		bool operator==(const FieldPawn&) const = default;
	};

	struct BattlefieldSeed {
		std::map<std::string, FieldPawn> fieldPawns;
		std::map<std::string, EntityDefinition> customEntities;
	};

	// Users and lobbies

	struct UserRecord {
		std::string id;
		std::string handle;
		std::chrono::system_clock::time_point createdAt;
	};

	struct LobbyPlayer {
		std::string userId;
		std::string nickname;
		std::optional<std::string> characterId;
	};

	struct CharacterBankEntry {
		std::string characterId;
		std::vector<std::string> controlledBy;

		bool isControlledBy(const std::string& userId) const {
			return std::find(controlledBy.begin(), controlledBy.end(), userId) != controlledBy.end();
		}
	};

	struct LobbyRecord {
		std::string id;
		std::string name;
		std::string gmId;
		std::chrono::system_clock::time_point createdAt;
		std::vector<LobbyPlayer> players;
		std::vector<CharacterBankEntry> characterBank;
		std::vector<std::string> relatedPresets;

		const LobbyPlayer* findPlayer(const std::string& userId) const {
			auto it = std::find_if(players.begin(), players.end(),
				[&](const LobbyPlayer& p) { return p.userId == userId; });
			return it != players.end() ? &(*it) : nullptr;
		}

		LobbyPlayer* findPlayer(const std::string& userId) {
			auto it = std::find_if(players.begin(), players.end(),
				[&](const LobbyPlayer& p) { return p.userId == userId; });
			return it != players.end() ? &(*it) : nullptr;
		}

		const CharacterBankEntry* findBankEntry(const std::string& characterId) const {
			auto it = std::find_if(characterBank.begin(), characterBank.end(),
				[&](const CharacterBankEntry& c) { return c.characterId == characterId; });
			return it != characterBank.end() ? &(*it) : nullptr;
		}

		CharacterBankEntry* findBankEntry(const std::string& characterId) {
			auto it = std::find_if(characterBank.begin(), characterBank.end(),
				[&](const CharacterBankEntry& c) { return c.characterId == characterId; });
			return it != characterBank.end() ? &(*it) : nullptr;
		}
	};

	// Lobby-facing views

	struct ActivePlayerView {
		std::string handle;
		std::string nickname;
	};

	struct CombatSummary {
		std::string id;
		std::string nickname;
		bool isActive{ false };
		int roundCount{ 0 };
		std::vector<ActivePlayerView> activePlayers;
	};

	struct CharacterCard {
		std::string name;
		std::string sprite;
	};

	struct LobbyMemberView {
		std::string userId;
		std::string handle;
		std::string nickname;
		std::optional<CharacterCard> character;
	};

	struct ControlledEntityView {
		std::string id;
		std::string name;
	};

	struct LobbyInfoView {
		std::string lobbyId;
		std::string name;
		std::string gmId;
		std::string layout{ "default" };
		std::vector<CombatSummary> combats;
		std::vector<LobbyMemberView> players;
		std::optional<ControlledEntityView> controlledEntity;
	};

	struct JoinedLobbyView {
		std::string id;
		std::string name;
		bool isGm{ false };
		std::vector<std::string> characters;
	};

	// Events

	struct SessionEnded {
		std::string combatId;
		std::string outcome;
	};

	struct AdmissionResult {
		AdmissionStatus status{ AdmissionStatus::SessionNotFound };
		std::string playerId;
	};
}
