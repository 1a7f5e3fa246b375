#include "InMemoryStore.hpp"

using namespace Skirmish;

std::string InMemoryStore::nextId(const std::string& prefix) {
	return prefix + "-" + std::to_string(++counter_);
}

std::optional<LobbyRecord> InMemoryStore::getLobby(const std::string& lobbyId) const {
	std::lock_guard lock(mutex_);
	auto it = lobbies_.find(lobbyId);
	if (it == lobbies_.end()) return std::nullopt;
	return it->second;
}

std::optional<UserRecord> InMemoryStore::getUser(const std::string& userId) const {
	std::lock_guard lock(mutex_);
	auto it = users_.find(userId);
	if (it == users_.end()) return std::nullopt;
	return it->second;
}

std::optional<UserRecord> InMemoryStore::getUserByHandle(const std::string& handle) const {
	std::lock_guard lock(mutex_);
	for (const auto& [id, user] : users_) {
		if (user.handle == handle) return user;
	}
	return std::nullopt;
}

std::optional<EntityDefinition> InMemoryStore::getCharacter(const std::string& characterId) const {
	++characterLookups_;
	std::lock_guard lock(mutex_);
	auto it = characters_.find(characterId);
	if (it == characters_.end()) return std::nullopt;
	return it->second;
}

std::optional<CombatPresetRecord> InMemoryStore::getCombatPreset(const std::string& presetId) const {
	std::lock_guard lock(mutex_);
	auto it = presets_.find(presetId);
	if (it == presets_.end()) return std::nullopt;
	return it->second;
}

std::vector<LobbyRecord> InMemoryStore::getLobbiesOfUser(const std::string& userId) const {
	std::lock_guard lock(mutex_);
	std::vector<LobbyRecord> result;
	for (const auto& [id, lobby] : lobbies_) {
		if (lobby.findPlayer(userId)) result.push_back(lobby);
	}
	return result;
}

std::optional<std::string> InMemoryStore::createUser(const std::string& handle) {
	if (failWrites_) return std::nullopt;
	std::lock_guard lock(mutex_);
	UserRecord user;
	user.id = nextId("user");
	user.handle = handle;
	user.createdAt = std::chrono::system_clock::now();
	users_[user.id] = user;
	return user.id;
}

std::optional<std::string> InMemoryStore::createLobby(const std::string& name, const std::string& gmId, const LobbyPlayer& gm) {
	if (failWrites_) return std::nullopt;
	std::lock_guard lock(mutex_);
	LobbyRecord lobby;
	lobby.id = nextId("lobby");
	lobby.name = name;
	lobby.gmId = gmId;
	lobby.createdAt = std::chrono::system_clock::now();
	lobby.players.push_back(gm);
	lobbies_[lobby.id] = lobby;
	return lobby.id;
}

std::optional<std::string> InMemoryStore::createCharacter(const EntityDefinition& character) {
	if (failWrites_) return std::nullopt;
	std::lock_guard lock(mutex_);
	EntityDefinition stored = character;
	stored.id = nextId("character");
	characters_[stored.id] = stored;
	return stored.id;
}

std::optional<std::string> InMemoryStore::createCombatPreset(const std::vector<PresetPawn>& field) {
	if (failWrites_) return std::nullopt;
	std::lock_guard lock(mutex_);
	CombatPresetRecord preset;
	preset.id = nextId("preset");
	preset.field = field;
	presets_[preset.id] = preset;
	return preset.id;
}

bool InMemoryStore::setLobbyPlayers(const std::string& lobbyId, const std::vector<LobbyPlayer>& players) {
	if (failWrites_) return false;
	std::lock_guard lock(mutex_);
	auto it = lobbies_.find(lobbyId);
	if (it == lobbies_.end()) return false;
	it->second.players = players;
	return true;
}

bool InMemoryStore::setLobbyCharacterBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank) {
	if (failWrites_) return false;
	std::lock_guard lock(mutex_);
	auto it = lobbies_.find(lobbyId);
	if (it == lobbies_.end()) return false;
	it->second.characterBank = bank;
	return true;
}

bool InMemoryStore::updateCharacterField(const EntityDefinition& character, CharacterField field) {
	if (failWrites_) return false;
	std::lock_guard lock(mutex_);
	auto it = characters_.find(character.id);
	if (it == characters_.end()) return false;

	EntityDefinition& stored = it->second;
	switch (field) {
	case CharacterField::Attributes: stored.attributes = character.attributes; break;
	case CharacterField::Inventory: stored.inventory = character.inventory; break;
	case CharacterField::Weaponry: stored.weaponry = character.weaponry; break;
	case CharacterField::SpellBook: stored.spellBook = character.spellBook; break;
	case CharacterField::SpellLayout: stored.spellLayout = character.spellLayout; break;
	case CharacterField::StatusEffects: stored.statusEffects = character.statusEffects; break;
	}
	return true;
}

void InMemoryStore::putCharacter(const std::string& id, EntityDefinition character) {
	std::lock_guard lock(mutex_);
	character.id = id;
	characters_[id] = std::move(character);
}

void InMemoryStore::removeCharacter(const std::string& id) {
	std::lock_guard lock(mutex_);
	characters_.erase(id);
}

void InMemoryStore::putLobby(LobbyRecord lobby) {
	std::lock_guard lock(mutex_);
	std::string id = lobby.id;
	lobbies_[id] = std::move(lobby);
}

void InMemoryStore::putUser(UserRecord user) {
	std::lock_guard lock(mutex_);
	std::string id = user.id;
	users_[id] = std::move(user);
}

void InMemoryStore::putCombatPreset(CombatPresetRecord preset) {
	std::lock_guard lock(mutex_);
	std::string id = preset.id;
	presets_[id] = std::move(preset);
}
