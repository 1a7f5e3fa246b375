#include <catch2/catch.hpp>

#include "shared/Errors.hpp"
#include "shared/Json.hpp"

using namespace Skirmish;

namespace {

    // A literal 0 is ambiguous between rvalue's key and index overloads.
    const size_t first = 0;

    crow::json::rvalue reparse(const crow::json::wvalue& value) {
        return crow::json::load(value.dump());
    }
}

TEST_CASE("Control info JSON", "[json]")
{
    auto unassigned = reparse(toJson(ControlInfo{ ControlledByPlayer{} }));
    REQUIRE(unassigned["type"].s() == "player");
    REQUIRE(unassigned["id"].t() == crow::json::type::Null);

    auto logic = reparse(toJson(ControlInfo{ ControlledByGameLogic{} }));
    REQUIRE(logic["type"].s() == "game_logic");
    REQUIRE_FALSE(logic.has("id"));

    REQUIRE_THROWS_AS(controlInfoFromJson(crow::json::load(R"({"type":"spirit"})")), ClientFault);
    REQUIRE(std::get<ControlledByPlayer>(controlInfoFromJson(crow::json::load(R"({"type":"player"})"))).id == std::nullopt);
}

TEST_CASE("Character payloads", "[json]")
{
    auto payload = crow::json::load(R"({
        "descriptor": "paladin",
        "decorations": { "name": "Sir Reginald", "sprite": "paladin.png" },
        "attributes": [ { "descriptor": "hp", "value": 30 }, { "dlc": "frost", "descriptor": "cold", "value": 2 } ]
    })");

    EntityDefinition entity = entityFromJson(payload);
    REQUIRE(entity.descriptor == "paladin");
    REQUIRE(entity.displayName() == "Sir Reginald");
    REQUIRE(entity.displaySprite() == "paladin.png");
    REQUIRE(entity.attributes.size() == 2);
    REQUIRE(entity.attributes[first].dlc == "builtins");
    REQUIRE(entity.attributes[1].dlc == "frost");
    REQUIRE(entity.attributes[1].value == 2);

    auto json = reparse(toJson(entity));
    REQUIRE(json["spellLayout"]["max"].i() == 4);
    REQUIRE(json["attributes"].size() == 2);

    REQUIRE_THROWS_AS(entityFromJson(crow::json::load(R"({"decorations":{}})")), ClientFault);
}

TEST_CASE("Lobby views", "[json]")
{
    LobbyInfoView info;
    info.lobbyId = "lobby1";
    info.name = "Friday Night";
    info.gmId = "gm1";
    info.layout = "gm";
    info.combats.push_back(CombatSummary{ "0", "Boss Fight", true, 2, { ActivePlayerView{ "alice", "Alice" } } });
    info.players.push_back(LobbyMemberView{ "p1", "alice", "Alice", CharacterCard{ "Sir Reginald", "paladin.png" } });

    auto json = reparse(toJson(info));
    REQUIRE(json["layout"].s() == "gm");
    REQUIRE(json["combats"][first]["nickname"].s() == "Boss Fight");
    REQUIRE(json["combats"][first]["roundCount"].i() == 2);
    REQUIRE(json["combats"][first]["activePlayers"][first]["handle"].s() == "alice");
    REQUIRE(json["players"][first]["character"]["sprite"].s() == "paladin.png");
    REQUIRE(json["controlledEntity"].t() == crow::json::type::Null);

    auto error = reparse(errorJson("Lobby not found"));
    REQUIRE(error["error"].s() == "Lobby not found");
}

TEST_CASE("Error kinds map to HTTP statuses", "[json][errors]")
{
    REQUIRE(httpStatusFor(ClientFault("x").kind()) == 400);
    REQUIRE(httpStatusFor(Unauthorized("x").kind()) == 401);
    REQUIRE(httpStatusFor(NotFound("x").kind()) == 404);
    REQUIRE(httpStatusFor(InternalFault().kind()) == 500);
}
