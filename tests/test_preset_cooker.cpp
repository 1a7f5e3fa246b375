#include <catch2/catch.hpp>

#include "combat/PresetCooker.hpp"
#include "shared/Errors.hpp"
#include "shared/Json.hpp"
#include "Fixtures.hpp"

using namespace Skirmish;
using namespace Skirmish::Testing;

TEST_CASE("Requested goblin preset cooks into a seed", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    store->putCharacter("goblin", goblin());
    PresetCooker cooker(store);

    auto payload = crow::json::load(R"({"field":{"A1":{"path":"goblin","source":"embedded","controlledBy":{"type":"ai","id":"g1"}}}})");
    REQUIRE(payload);

    BattlefieldSeed seed = cooker.cook(presetSourceFromJson("requested", payload));

    REQUIRE(seed.fieldPawns.size() == 1);
    const FieldPawn& a1 = seed.fieldPawns.at("A1");
    REQUIRE(a1.entityPreset.source == EntitySource::Embedded);
    REQUIRE(a1.entityPreset.name == "goblin");
    REQUIRE(std::get<ControlledByAi>(a1.owner).id == "g1");

    REQUIRE(seed.customEntities.size() == 1);
    EntityDefinition expected = goblin();
    expected.id = "goblin";
    REQUIRE(seed.customEntities.at("goblin") == expected);

    auto json = crow::json::load(toJson(seed).dump());
    REQUIRE(json["field_pawns"]["A1"]["entity_preset"]["source"].s() == "embedded");
    REQUIRE(json["field_pawns"]["A1"]["entity_preset"]["name"].s() == "goblin");
    REQUIRE(json["field_pawns"]["A1"]["owner"]["type"].s() == "ai");
    REQUIRE(json["field_pawns"]["A1"]["owner"]["id"].s() == "g1");
    REQUIRE(json["custom_entities"]["goblin"]["descriptor"].s() == "goblin");
}

TEST_CASE("Duplicate squares are rejected before any lookup", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    store->putCharacter("goblin", goblin());
    PresetCooker cooker(store);

    RequestedPreset requested;
    requested.field.push_back(pawn("A1", "goblin", EntitySource::Embedded, ControlledByAi{ "g1" }));
    requested.field.push_back(pawn("A1", "orc", EntitySource::Dlc, ControlledByGameLogic{}));

    REQUIRE_THROWS_AS(cooker.cook(requested), ClientFault);
    REQUIRE(store->characterLookups() == 0);
}

TEST_CASE("Importable presets follow the same square rule", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    CombatPresetRecord preset;
    preset.id = "preset-dup";
    preset.field.push_back(pawn("B2", "knight", EntitySource::Dlc, ControlledByPlayer{}));
    preset.field.push_back(pawn("B2", "archer", EntitySource::Dlc, ControlledByPlayer{}));
    store->putCombatPreset(preset);

    PresetCooker cooker(store);
    REQUIRE_THROWS_AS(cooker.cook(ImportablePreset{ "preset-dup" }), ClientFault);
}

TEST_CASE("Missing embedded entity is a NotFound", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    PresetCooker cooker(store);

    RequestedPreset requested;
    requested.field.push_back(pawn("A1", "dragon", EntitySource::Embedded, ControlledByGameLogic{}));

    REQUIRE_THROWS_AS(cooker.cook(requested), NotFound);
}

TEST_CASE("Missing importable preset is a NotFound", "[preset]")
{
    PresetCooker cooker(std::make_shared<InMemoryStore>());
    REQUIRE_THROWS_AS(cooker.cook(ImportablePreset{ "nope" }), NotFound);
}

TEST_CASE("Importable and requested modes produce the same seed", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    store->putCharacter("goblin", goblin());

    std::vector<PresetPawn> field{
        pawn("A1", "goblin", EntitySource::Embedded, ControlledByAi{ "g1" }),
        pawn("C4", "wolf", EntitySource::Dlc, ControlledByPlayer{ "p1" })
    };
    store->putCombatPreset(CombatPresetRecord{ "preset-1", field });

    PresetCooker cooker(store);
    BattlefieldSeed imported = cooker.cook(ImportablePreset{ "preset-1" });
    BattlefieldSeed requested = cooker.cook(RequestedPreset{ field });

    REQUIRE(imported.fieldPawns == requested.fieldPawns);
    REQUIRE(imported.customEntities == requested.customEntities);
    REQUIRE_FALSE(imported.customEntities.contains("wolf"));
}

TEST_CASE("Each embedded path is looked up once", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    store->putCharacter("goblin", goblin());
    PresetCooker cooker(store);

    RequestedPreset requested;
    requested.field.push_back(pawn("A1", "goblin", EntitySource::Embedded, ControlledByAi{ "g1" }));
    requested.field.push_back(pawn("A2", "goblin", EntitySource::Embedded, ControlledByAi{ "g2" }));
    requested.field.push_back(pawn("A3", "goblin", EntitySource::Embedded, ControlledByAi{ "g3" }));

    BattlefieldSeed seed = cooker.cook(requested);
    REQUIRE(seed.fieldPawns.size() == 3);
    REQUIRE(store->characterLookups() == 1);
}

TEST_CASE("Preset source parsing", "[preset][json]")
{
    SECTION("importable accepts a bare id or an object")
    {
        auto bare = crow::json::load(R"("preset-7")");
        REQUIRE(std::get<ImportablePreset>(presetSourceFromJson("importable", bare)).presetId == "preset-7");

        auto object = crow::json::load(R"({"id":"preset-8"})");
        REQUIRE(std::get<ImportablePreset>(presetSourceFromJson("importable", object)).presetId == "preset-8");
    }

    SECTION("unknown mode names the offending value")
    {
        auto payload = crow::json::load(R"({"field":{}})");
        try {
            presetSourceFromJson("imported", payload);
            FAIL("expected ClientFault");
        }
        catch (const ClientFault& e) {
            REQUIRE(std::string(e.what()).find("imported") != std::string::npos);
        }
    }

    SECTION("requested without a field is rejected")
    {
        auto payload = crow::json::load(R"({"pawns":[]})");
        REQUIRE_THROWS_AS(presetSourceFromJson("requested", payload), ClientFault);
    }

    SECTION("unknown pawn source is rejected")
    {
        auto payload = crow::json::load(R"({"field":{"A1":{"path":"goblin","source":"cloud"}}})");
        REQUIRE_THROWS_AS(presetSourceFromJson("requested", payload), ClientFault);
    }

    SECTION("AI control needs an id")
    {
        auto payload = crow::json::load(R"({"field":{"A1":{"path":"goblin","source":"dlc","controlledBy":{"type":"ai"}}}})");
        REQUIRE_THROWS_AS(presetSourceFromJson("requested", payload), ClientFault);
    }

    SECTION("a pawn without a controller is rejected")
    {
        auto payload = crow::json::load(R"({"field":{"A1":{"path":"goblin","source":"dlc"}}})");
        REQUIRE(payload);
        REQUIRE_THROWS_AS(presetSourceFromJson("requested", payload), ClientFault);
    }

    SECTION("list form with explicit squares")
    {
        auto payload = crow::json::load(R"({"field":[{"square":"D4","path":"wolf","source":"dlc","controlled_by":{"type":"player","id":"p1"}}]})");
        auto requested = std::get<RequestedPreset>(presetSourceFromJson("requested", payload));
        REQUIRE(requested.field.size() == 1);
        REQUIRE(requested.field[0].square == "D4");
        REQUIRE(std::get<ControlledByPlayer>(requested.field[0].controlledBy).id == std::optional<std::string>("p1"));
    }
}

TEST_CASE("Repeated square keys in the inline form are duplicates", "[preset]")
{
    auto store = std::make_shared<InMemoryStore>();
    store->putCharacter("goblin", goblin());
    PresetCooker cooker(store);

    auto payload = crow::json::load(R"({"field":{)"
        R"("A1":{"path":"goblin","source":"embedded","controlledBy":{"type":"ai","id":"g1"}},)"
        R"("A1":{"path":"goblin","source":"embedded","controlledBy":{"type":"game_logic"}}}})");
    REQUIRE(payload);

    auto requested = presetSourceFromJson("requested", payload);
    REQUIRE(std::get<RequestedPreset>(requested).field.size() == 2);

    REQUIRE_THROWS_AS(cooker.cook(requested), ClientFault);
    REQUIRE(store->characterLookups() == 0);
}
