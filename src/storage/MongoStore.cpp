#include "MongoStore.hpp"
#include "../infra/Log.hpp"
#include "../shared/Json.hpp"

#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/oid.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/stream/helpers.hpp>
#include <bsoncxx/builder/stream/array.hpp>

#include <chrono>

using namespace Skirmish;
using namespace bsoncxx::builder::stream;

static mongocxx::instance instance{};

class MongoStore::Impl {
public:
    std::shared_ptr<mongocxx::pool> pool;
    std::string dbName;

    Impl(const std::string& uriString, const std::string& name)
        : dbName(name) {
        mongocxx::uri uri{ uriString };
        pool = std::make_shared<mongocxx::pool>(uri);
    }

    auto acquire() {
        return pool->acquire();
    }
};

MongoStore::MongoStore(const std::string& connectionUri, const std::string& dbName)
    : pImpl(std::make_unique<Impl>(connectionUri, dbName)) {
}

MongoStore::~MongoStore() = default;

// Helpers

namespace {

    std::optional<bsoncxx::oid> toOid(const std::string& id) {
        if (id.size() != 24) return std::nullopt;
        try {
            return bsoncxx::oid{ id };
        }
        catch (const bsoncxx::exception&) {
            return std::nullopt;
        }
    }

    std::string readString(const bsoncxx::document::view& doc, const char* key) {
        auto elem = doc[key];
        if (!elem) return {};
        if (elem.type() == bsoncxx::type::k_string) return std::string(elem.get_string().value);
        if (elem.type() == bsoncxx::type::k_oid) return elem.get_oid().value.to_string();
        return {};
    }

    std::optional<std::string> readOptionalString(const bsoncxx::document::view& doc, const char* key) {
        auto elem = doc[key];
        if (!elem || elem.type() == bsoncxx::type::k_null) return std::nullopt;
        std::string value = readString(doc, key);
        if (value.empty()) return std::nullopt;
        return value;
    }

    int readInt(const bsoncxx::document::view& doc, const char* key, int fallback = 0) {
        auto elem = doc[key];
        if (!elem) return fallback;
        switch (elem.type()) {
        case bsoncxx::type::k_int32: return elem.get_int32().value;
        case bsoncxx::type::k_int64: return static_cast<int>(elem.get_int64().value);
        case bsoncxx::type::k_double: return static_cast<int>(elem.get_double().value);
        default: return fallback;
        }
    }

    std::vector<std::string> readStringArray(const bsoncxx::document::view& doc, const char* key) {
        std::vector<std::string> values;
        auto elem = doc[key];
        if (!elem || elem.type() != bsoncxx::type::k_array) return values;
        for (const auto& item : elem.get_array().value) {
            if (item.type() == bsoncxx::type::k_string) values.push_back(std::string(item.get_string().value));
        }
        return values;
    }

    std::chrono::system_clock::time_point readDate(const bsoncxx::document::view& doc, const char* key) {
        auto elem = doc[key];
        if (!elem || elem.type() != bsoncxx::type::k_date) return {};
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(elem.get_date().value) };
    }

    template <typename Fn>
    void forEachDocument(const bsoncxx::document::view& doc, const char* key, Fn&& fn) {
        auto elem = doc[key];
        if (!elem || elem.type() != bsoncxx::type::k_array) return;
        for (const auto& item : elem.get_array().value) {
            if (item.type() == bsoncxx::type::k_document) fn(item.get_document().view());
        }
    }

    bsoncxx::array::value stringArray(const std::vector<std::string>& values) {
        bsoncxx::builder::stream::array arr;
        for (const auto& v : values) arr << v;
        return arr << bsoncxx::builder::stream::finalize;
    }

    bsoncxx::document::value controlDocument(const ControlInfo& control) {
        auto id = controllerId(control);
        if (std::holds_alternative<ControlledByGameLogic>(control)) {
            return document{} << "type" << controlType(control) << finalize;
        }
        if (id) {
            return document{} << "type" << controlType(control) << "id" << *id << finalize;
        }
        return document{} << "type" << controlType(control) << "id" << bsoncxx::types::b_null{} << finalize;
    }

    ControlInfo readControl(const bsoncxx::document::view& doc) {
        std::string type = readString(doc, "type");
        if (type == "player") return ControlledByPlayer{ readOptionalString(doc, "id") };
        if (type == "ai") return ControlledByAi{ readString(doc, "id") };
        return ControlledByGameLogic{};
    }

    LobbyRecord readLobby(const bsoncxx::document::view& view) {
        LobbyRecord lobby;
        lobby.id = readString(view, "_id");
        lobby.name = readString(view, "name");
        lobby.gmId = readString(view, "gm_id");
        lobby.createdAt = readDate(view, "createdAt");
        lobby.relatedPresets = readStringArray(view, "relatedPresets");

        forEachDocument(view, "players", [&](const bsoncxx::document::view& doc) {
            LobbyPlayer p;
            p.userId = readString(doc, "userId");
            p.nickname = readString(doc, "nickname");
            p.characterId = readOptionalString(doc, "characterId");
            lobby.players.push_back(p);
        });

        forEachDocument(view, "characterBank", [&](const bsoncxx::document::view& doc) {
            CharacterBankEntry entry;
            entry.characterId = readString(doc, "characterId");
            entry.controlledBy = readStringArray(doc, "controlledBy");
            lobby.characterBank.push_back(entry);
        });

        return lobby;
    }

    std::vector<ItemEntry> readItems(const bsoncxx::document::view& view, const char* key) {
        std::vector<ItemEntry> items;
        forEachDocument(view, key, [&](const bsoncxx::document::view& doc) {
            items.push_back(ItemEntry{ readString(doc, "descriptor"), readInt(doc, "quantity", 1) });
        });
        return items;
    }

    EntityDefinition readCharacter(const bsoncxx::document::view& view) {
        EntityDefinition c;
        c.id = readString(view, "_id");
        c.descriptor = readString(view, "descriptor");

        if (view["decorations"] && view["decorations"].type() == bsoncxx::type::k_document) {
            auto deco = view["decorations"].get_document().view();
            c.decorations.name = readString(deco, "name");
            c.decorations.description = readString(deco, "description");
            c.decorations.sprite = readString(deco, "sprite");
        }

        if (view["level"] && view["level"].type() == bsoncxx::type::k_document) {
            auto level = view["level"].get_document().view();
            c.level.current = readInt(level, "current", 1);
            c.level.availableUpgrades = readInt(level, "availableUpgrades");
        }

        c.gold = readInt(view, "gold");
        c.alignments = readStringArray(view, "alignments");

        if (view["abilitiesPoints"] && view["abilitiesPoints"].type() == bsoncxx::type::k_document) {
            auto points = view["abilitiesPoints"].get_document().view();
            c.abilitiesPoints.will = readInt(points, "will");
            c.abilitiesPoints.reflexes = readInt(points, "reflexes");
            c.abilitiesPoints.strength = readInt(points, "strength");
            c.abilitiesPoints.max = readInt(points, "max");
        }

        forEachDocument(view, "attributes", [&](const bsoncxx::document::view& doc) {
            Attribute a;
            a.dlc = readString(doc, "dlc");
            if (a.dlc.empty()) a.dlc = "builtins";
            a.descriptor = readString(doc, "descriptor");
            a.value = readInt(doc, "value");
            c.attributes.push_back(a);
        });

        c.inventory = readItems(view, "inventory");
        c.weaponry = readItems(view, "weaponry");

        forEachDocument(view, "spellBook", [&](const bsoncxx::document::view& doc) {
            SpellEntry s;
            s.descriptor = readString(doc, "descriptor");
            s.conflictsWith = readStringArray(doc, "conflictsWith");
            s.requiresToUse = readStringArray(doc, "requiresToUse");
            c.spellBook.push_back(s);
        });

        if (view["spellLayout"] && view["spellLayout"].type() == bsoncxx::type::k_document) {
            auto layout = view["spellLayout"].get_document().view();
            c.spellLayout.max = readInt(layout, "max", 4);
            c.spellLayout.layout = readStringArray(layout, "layout");
        }

        forEachDocument(view, "statusEffects", [&](const bsoncxx::document::view& doc) {
            c.statusEffects.push_back(StatusEffectEntry{ readString(doc, "descriptor"), readInt(doc, "duration") });
        });

        return c;
    }

    bsoncxx::array::value attributesArray(const std::vector<Attribute>& attributes) {
        bsoncxx::builder::stream::array arr;
        for (const auto& a : attributes) {
            arr << open_document
                << "dlc" << a.dlc
                << "descriptor" << a.descriptor
                << "value" << a.value
                << close_document;
        }
        return arr << bsoncxx::builder::stream::finalize;
    }

    bsoncxx::array::value itemsArray(const std::vector<ItemEntry>& items) {
        bsoncxx::builder::stream::array arr;
        for (const auto& i : items) {
            arr << open_document
                << "descriptor" << i.descriptor
                << "quantity" << i.quantity
                << close_document;
        }
        return arr << bsoncxx::builder::stream::finalize;
    }

    bsoncxx::array::value spellsArray(const std::vector<SpellEntry>& spells) {
        bsoncxx::builder::stream::array arr;
        for (const auto& s : spells) {
            auto conflicts = stringArray(s.conflictsWith);
            auto requires_ = stringArray(s.requiresToUse);
            arr << open_document
                << "descriptor" << s.descriptor
                << "conflictsWith" << bsoncxx::types::b_array{ conflicts.view() }
                << "requiresToUse" << bsoncxx::types::b_array{ requires_.view() }
                << close_document;
        }
        return arr << bsoncxx::builder::stream::finalize;
    }

    bsoncxx::array::value statusEffectsArray(const std::vector<StatusEffectEntry>& effects) {
        bsoncxx::builder::stream::array arr;
        for (const auto& e : effects) {
            arr << open_document
                << "descriptor" << e.descriptor
                << "duration" << e.duration
                << close_document;
        }
        return arr << bsoncxx::builder::stream::finalize;
    }

    bsoncxx::document::value spellLayoutDocument(const SpellLayout& layout) {
        auto slots = stringArray(layout.layout);
        return document{}
            << "max" << layout.max
            << "layout" << bsoncxx::types::b_array{ slots.view() }
            << finalize;
    }

    bsoncxx::array::value playersArray(const std::vector<LobbyPlayer>& players) {
        bsoncxx::builder::stream::array arr;
        for (const auto& p : players) {
            if (p.characterId) {
                arr << open_document
                    << "userId" << p.userId
                    << "nickname" << p.nickname
                    << "characterId" << *p.characterId
                    << close_document;
            }
            else {
                arr << open_document
                    << "userId" << p.userId
                    << "nickname" << p.nickname
                    << close_document;
            }
        }
        return arr << bsoncxx::builder::stream::finalize;
    }
}

// Reads

std::optional<LobbyRecord> MongoStore::getLobby(const std::string& lobbyId) const {
    auto oid = toOid(lobbyId);
    if (!oid) return std::nullopt;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["lobbies"];

        auto result = collection.find_one(document{} << "_id" << *oid << finalize);
        if (!result) return std::nullopt;

        return readLobby(result->view());
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getLobby: {}", e.what());
        return std::nullopt;
    }
}

std::optional<UserRecord> MongoStore::getUser(const std::string& userId) const {
    auto oid = toOid(userId);
    if (!oid) return std::nullopt;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["users"];

        auto result = collection.find_one(document{} << "_id" << *oid << finalize);
        if (!result) return std::nullopt;

        auto view = result->view();
        UserRecord user;
        user.id = readString(view, "_id");
        user.handle = readString(view, "handle");
        user.createdAt = readDate(view, "createdAt");
        return user;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getUser: {}", e.what());
        return std::nullopt;
    }
}

std::optional<UserRecord> MongoStore::getUserByHandle(const std::string& handle) const {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["users"];

        auto result = collection.find_one(document{} << "handle" << handle << finalize);
        if (!result) return std::nullopt;

        auto view = result->view();
        UserRecord user;
        user.id = readString(view, "_id");
        user.handle = readString(view, "handle");
        user.createdAt = readDate(view, "createdAt");
        return user;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getUserByHandle: {}", e.what());
        return std::nullopt;
    }
}

std::optional<EntityDefinition> MongoStore::getCharacter(const std::string& characterId) const {
    auto oid = toOid(characterId);
    if (!oid) return std::nullopt;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["characters"];

        auto result = collection.find_one(document{} << "_id" << *oid << finalize);
        if (!result) return std::nullopt;

        return readCharacter(result->view());
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getCharacter: {}", e.what());
        return std::nullopt;
    }
}

std::optional<CombatPresetRecord> MongoStore::getCombatPreset(const std::string& presetId) const {
    auto oid = toOid(presetId);
    if (!oid) return std::nullopt;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["combats"];

        auto result = collection.find_one(document{} << "_id" << *oid << finalize);
        if (!result) return std::nullopt;

        auto view = result->view();
        CombatPresetRecord preset;
        preset.id = readString(view, "_id");

        forEachDocument(view, "field", [&](const bsoncxx::document::view& doc) {
            PresetPawn pawn;
            pawn.square = readString(doc, "square");
            pawn.path = readString(doc, "path");
            pawn.source = readString(doc, "source") == "embedded" ? EntitySource::Embedded : EntitySource::Dlc;
            if (doc["controlled_by"] && doc["controlled_by"].type() == bsoncxx::type::k_document) {
                pawn.controlledBy = readControl(doc["controlled_by"].get_document().view());
            }
            preset.field.push_back(pawn);
        });

        return preset;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getCombatPreset: {}", e.what());
        return std::nullopt;
    }
}

std::vector<LobbyRecord> MongoStore::getLobbiesOfUser(const std::string& userId) const {
    std::vector<LobbyRecord> lobbies;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["lobbies"];

        auto cursor = collection.find(document{} << "players.userId" << userId << finalize);
        for (auto&& doc : cursor) {
            lobbies.push_back(readLobby(doc));
        }
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in getLobbiesOfUser: {}", e.what());
    }
    return lobbies;
}

// Writes

std::optional<std::string> MongoStore::createUser(const std::string& handle) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["users"];

        auto doc = document{}
            << "handle" << handle
            << "createdAt" << bsoncxx::types::b_date(std::chrono::system_clock::now())
            << finalize;

        auto result = collection.insert_one(doc.view());
        if (!result) return std::nullopt;
        return result->inserted_id().get_oid().value.to_string();
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in createUser: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> MongoStore::createLobby(const std::string& name, const std::string& gmId, const LobbyPlayer& gm) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["lobbies"];

        auto players = playersArray({ gm });

        auto doc = document{}
            << "name" << name
            << "createdAt" << bsoncxx::types::b_date(std::chrono::system_clock::now())
            << "gm_id" << gmId
            << "players" << bsoncxx::types::b_array{ players.view() }
            << "characterBank" << open_array << close_array
            << "relatedPresets" << open_array << close_array
            << finalize;

        auto result = collection.insert_one(doc.view());
        if (!result) return std::nullopt;
        return result->inserted_id().get_oid().value.to_string();
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in createLobby: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> MongoStore::createCharacter(const EntityDefinition& character) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["characters"];

        auto alignments = stringArray(character.alignments);
        auto attributes = attributesArray(character.attributes);
        auto inventory = itemsArray(character.inventory);
        auto weaponry = itemsArray(character.weaponry);
        auto spells = spellsArray(character.spellBook);
        auto layout = spellLayoutDocument(character.spellLayout);
        auto effects = statusEffectsArray(character.statusEffects);

        auto doc = document{}
            << "descriptor" << character.descriptor
            << "decorations" << open_document
            << "name" << character.decorations.name
            << "description" << character.decorations.description
            << "sprite" << character.decorations.sprite
            << close_document
            << "level" << open_document
            << "current" << character.level.current
            << "availableUpgrades" << character.level.availableUpgrades
            << close_document
            << "gold" << character.gold
            << "alignments" << bsoncxx::types::b_array{ alignments.view() }
            << "abilitiesPoints" << open_document
            << "will" << character.abilitiesPoints.will
            << "reflexes" << character.abilitiesPoints.reflexes
            << "strength" << character.abilitiesPoints.strength
            << "max" << character.abilitiesPoints.max
            << close_document
            << "attributes" << bsoncxx::types::b_array{ attributes.view() }
            << "inventory" << bsoncxx::types::b_array{ inventory.view() }
            << "weaponry" << bsoncxx::types::b_array{ weaponry.view() }
            << "spellBook" << bsoncxx::types::b_array{ spells.view() }
            << "spellLayout" << bsoncxx::types::b_document{ layout.view() }
            << "statusEffects" << bsoncxx::types::b_array{ effects.view() }
            << finalize;

        auto result = collection.insert_one(doc.view());
        if (!result) return std::nullopt;
        return result->inserted_id().get_oid().value.to_string();
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in createCharacter: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> MongoStore::createCombatPreset(const std::vector<PresetPawn>& field) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["combats"];

        bsoncxx::builder::stream::array fieldArray;
        for (const auto& pawn : field) {
            auto control = controlDocument(pawn.controlledBy);
            fieldArray << open_document
                << "path" << pawn.path
                << "square" << pawn.square
                << "source" << toString(pawn.source)
                << "controlled_by" << bsoncxx::types::b_document{ control.view() }
                << close_document;
        }
        auto fieldValue = fieldArray << bsoncxx::builder::stream::finalize;

        auto doc = document{}
            << "field" << bsoncxx::types::b_array{ fieldValue.view() }
            << finalize;

        auto result = collection.insert_one(doc.view());
        if (!result) return std::nullopt;
        return result->inserted_id().get_oid().value.to_string();
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in createCombatPreset: {}", e.what());
        return std::nullopt;
    }
}

bool MongoStore::setLobbyPlayers(const std::string& lobbyId, const std::vector<LobbyPlayer>& players) {
    auto oid = toOid(lobbyId);
    if (!oid) return false;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["lobbies"];

        auto playersValue = playersArray(players);

        auto result = collection.update_one(
            document{} << "_id" << *oid << finalize,
            document{} << "$set" << open_document
            << "players" << bsoncxx::types::b_array{ playersValue.view() }
            << close_document << finalize
        );

        return result && result->matched_count() > 0;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in setLobbyPlayers: {}", e.what());
        return false;
    }
}

bool MongoStore::setLobbyCharacterBank(const std::string& lobbyId, const std::vector<CharacterBankEntry>& bank) {
    auto oid = toOid(lobbyId);
    if (!oid) return false;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["lobbies"];

        bsoncxx::builder::stream::array bankArray;
        for (const auto& entry : bank) {
            auto controlledBy = stringArray(entry.controlledBy);
            bankArray << open_document
                << "characterId" << entry.characterId
                << "controlledBy" << bsoncxx::types::b_array{ controlledBy.view() }
                << close_document;
        }
        auto bankValue = bankArray << bsoncxx::builder::stream::finalize;

        auto result = collection.update_one(
            document{} << "_id" << *oid << finalize,
            document{} << "$set" << open_document
            << "characterBank" << bsoncxx::types::b_array{ bankValue.view() }
            << close_document << finalize
        );

        return result && result->matched_count() > 0;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in setLobbyCharacterBank: {}", e.what());
        return false;
    }
}

bool MongoStore::updateCharacterField(const EntityDefinition& character, CharacterField field) {
    auto oid = toOid(character.id);
    if (!oid) return false;

    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName]["characters"];

        std::optional<bsoncxx::document::value> update;
        switch (field) {
        case CharacterField::Attributes: {
            auto value = attributesArray(character.attributes);
            update = document{} << "$set" << open_document
                << "attributes" << bsoncxx::types::b_array{ value.view() }
                << close_document << finalize;
            break;
        }
        case CharacterField::Inventory: {
            auto value = itemsArray(character.inventory);
            update = document{} << "$set" << open_document
                << "inventory" << bsoncxx::types::b_array{ value.view() }
                << close_document << finalize;
            break;
        }
        case CharacterField::Weaponry: {
            auto value = itemsArray(character.weaponry);
            update = document{} << "$set" << open_document
                << "weaponry" << bsoncxx::types::b_array{ value.view() }
                << close_document << finalize;
            break;
        }
        case CharacterField::SpellBook: {
            auto value = spellsArray(character.spellBook);
            update = document{} << "$set" << open_document
                << "spellBook" << bsoncxx::types::b_array{ value.view() }
                << close_document << finalize;
            break;
        }
        case CharacterField::SpellLayout: {
            auto value = spellLayoutDocument(character.spellLayout);
            update = document{} << "$set" << open_document
                << "spellLayout" << bsoncxx::types::b_document{ value.view() }
                << close_document << finalize;
            break;
        }
        case CharacterField::StatusEffects: {
            auto value = statusEffectsArray(character.statusEffects);
            update = document{} << "$set" << open_document
                << "statusEffects" << bsoncxx::types::b_array{ value.view() }
                << close_document << finalize;
            break;
        }
        }

        if (!update) return false;

        auto result = collection.update_one(
            document{} << "_id" << *oid << finalize,
            update->view()
        );

        return result && result->matched_count() > 0;
    }
    catch (const std::exception& e) {
        Log::log("[MONGO] Error in updateCharacterField: {}", e.what());
        return false;
    }
}
