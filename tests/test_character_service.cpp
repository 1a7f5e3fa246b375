#include <catch2/catch.hpp>

#include "lobby/CharacterService.hpp"
#include "shared/Errors.hpp"
#include "Fixtures.hpp"

using namespace Skirmish;
using namespace Skirmish::Testing;

namespace {

    struct CharacterFixture {
        std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
        CharacterService characters{ store };
        std::string heroId;

        CharacterFixture() {
            seedLobby(*store);
            heroId = characters.createCharacter(hero("paladin"));
        }
    };
}

TEST_CASE("Created characters get a stored id", "[character]")
{
    CharacterFixture f;
    REQUIRE_FALSE(f.heroId.empty());

    auto stored = f.store->getCharacter(f.heroId);
    REQUIRE(stored);
    REQUIRE(stored->descriptor == "paladin");
    REQUIRE(stored->id == f.heroId);

    REQUIRE_THROWS_AS(f.characters.createCharacter(EntityDefinition{}), ClientFault);
}

TEST_CASE("Own character lookup", "[character]")
{
    CharacterFixture f;

    REQUIRE_THROWS_AS(f.characters.getMyCharacterInfo("lobby9", "p1"), NotFound);
    REQUIRE_THROWS_AS(f.characters.getMyCharacterInfo("lobby1", "p9"), NotFound);
    REQUIRE_THROWS_AS(f.characters.getMyCharacterInfo("lobby1", "p1"), ClientFault);

    auto lobby = *f.store->getLobby("lobby1");
    lobby.findPlayer("p1")->characterId = f.heroId;
    lobby.findPlayer("p2")->characterId = "char-gone";
    f.store->putLobby(lobby);

    REQUIRE(f.characters.getMyCharacterInfo("lobby1", "p1").descriptor == "paladin");
    REQUIRE_THROWS_AS(f.characters.getMyCharacterInfo("lobby1", "p2"), NotFound);
}

TEST_CASE("Character bank", "[character]")
{
    CharacterFixture f;
    std::string rogueId = f.characters.createCharacter(hero("rogue"));

    f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, { "p1" });
    f.characters.addCharacterToLobby("lobby1", "gm1", rogueId, {});

    REQUIRE_THROWS_AS(f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, {}), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addCharacterToLobby("lobby1", "gm1", "char-none", {}), NotFound);

    SECTION("assigning adds a controller once")
    {
        f.characters.assignCharacterToPlayer("lobby1", "gm1", "p2", rogueId);
        f.characters.assignCharacterToPlayer("lobby1", "p2", "p2", rogueId);

        auto lobby = *f.store->getLobby("lobby1");
        auto entry = lobby.findBankEntry(rogueId);
        REQUIRE(entry);
        REQUIRE(entry->controlledBy == std::vector<std::string>{ "p2" });

        auto mine = f.characters.getCharactersOfPlayer("lobby1", "p2");
        REQUIRE(mine.size() == 1);
        REQUIRE(mine[0].descriptor == "rogue");
    }

    SECTION("assigning a deleted character prunes it from the bank")
    {
        f.store->removeCharacter(rogueId);
        REQUIRE_THROWS_AS(f.characters.assignCharacterToPlayer("lobby1", "gm1", "p2", rogueId), NotFound);
        REQUIRE_FALSE(f.store->getLobby("lobby1")->findBankEntry(rogueId));
        REQUIRE(f.store->getLobby("lobby1")->findBankEntry(f.heroId));
    }

    SECTION("listing prunes dangling entries")
    {
        f.characters.assignCharacterToPlayer("lobby1", "p1", "p1", rogueId);
        f.store->removeCharacter(f.heroId);

        auto mine = f.characters.getCharactersOfPlayer("lobby1", "p1");
        REQUIRE(mine.size() == 1);
        REQUIRE(mine[0].id == rogueId);
        REQUIRE(f.store->getLobby("lobby1")->characterBank.size() == 1);
    }

    SECTION("non-members are rejected")
    {
        REQUIRE_THROWS_AS(f.characters.assignCharacterToPlayer("lobby1", "p9", "p9", rogueId), NotFound);
        REQUIRE_THROWS_AS(f.characters.getCharactersOfPlayer("lobby1", "p9"), NotFound);
        REQUIRE_THROWS_AS(f.characters.getCharacterInfo("lobby1", "p9", rogueId), ClientFault);
    }
}

TEST_CASE("Players cannot hand characters to others", "[character]")
{
    CharacterFixture f;
    std::string rogueId = f.characters.createCharacter(hero("rogue"));
    f.characters.addCharacterToLobby("lobby1", "gm1", rogueId, {});

    REQUIRE_THROWS_AS(f.characters.assignCharacterToPlayer("lobby1", "p1", "p2", rogueId), ClientFault);
    REQUIRE(f.store->getLobby("lobby1")->findBankEntry(rogueId)->controlledBy.empty());

    std::vector<std::string> forBob{ "p2" };
    std::string monkId = f.characters.createCharacter(hero("monk"));
    REQUIRE_THROWS_AS(f.characters.addCharacterToLobby("lobby1", "p1", monkId, forBob), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addCharacterToLobby("lobby1", "p9", monkId, {}), ClientFault);
    REQUIRE_FALSE(f.store->getLobby("lobby1")->findBankEntry(monkId));

    std::vector<std::string> forAlice{ "p1" };
    f.characters.addCharacterToLobby("lobby1", "p1", monkId, forAlice);
    REQUIRE(f.store->getLobby("lobby1")->findBankEntry(monkId)->isControlledBy("p1"));
}

TEST_CASE("Loadout edits persist", "[character]")
{
    CharacterFixture f;
    f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, { "p1" });

    f.characters.addItem("lobby1", "p1", f.heroId, "potion", 3);
    f.characters.addWeapon("lobby1", "p1", f.heroId, "longsword", 1);
    f.characters.addSpell("lobby1", "p1", f.heroId, "fireball", { "frostbolt" }, {});
    f.characters.addStatusEffect("lobby1", "gm1", f.heroId, "blessed", 2);
    f.characters.addAttribute("lobby1", "gm1", f.heroId, "", "charisma", 14);

    EntityDefinition stored = f.characters.getCharacterInfo("lobby1", "p2", f.heroId);
    REQUIRE(stored.inventory == std::vector<ItemEntry>{ ItemEntry{ "potion", 3 } });
    REQUIRE(stored.weaponry == std::vector<ItemEntry>{ ItemEntry{ "longsword", 1 } });
    REQUIRE(stored.spellBook.size() == 1);
    REQUIRE(stored.spellBook[0].conflictsWith == std::vector<std::string>{ "frostbolt" });
    REQUIRE(stored.statusEffects[0].duration == 2);
    REQUIRE(stored.attributes[0].dlc == "builtins");
    REQUIRE(stored.attributes[0].value == 14);

    REQUIRE_THROWS_AS(f.characters.addItem("lobby9", "p1", f.heroId, "potion", 1), NotFound);
    REQUIRE_THROWS_AS(f.characters.addItem("lobby1", "p1", "char-none", "potion", 1), NotFound);
}

TEST_CASE("Loadout edits need the GM or a controller", "[character]")
{
    CharacterFixture f;
    f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, { "p1" });
    std::string strayId = f.characters.createCharacter(hero("rogue"));

    REQUIRE_THROWS_AS(f.characters.addItem("lobby1", "p2", f.heroId, "potion", 1), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addWeapon("lobby1", "p2", f.heroId, "dagger", 1), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addSpell("lobby1", "p2", f.heroId, "curse", {}, {}), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addStatusEffect("lobby1", "p2", f.heroId, "cursed", 3), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addAttribute("lobby1", "p2", f.heroId, "", "hp", 1), ClientFault);
    REQUIRE_THROWS_AS(f.characters.addItem("lobby1", "p9", f.heroId, "potion", 1), ClientFault);

    std::vector<std::string> layout{ "a" };
    REQUIRE_THROWS_AS(f.characters.changeSpellLayout("lobby1", "p2", f.heroId, layout), ClientFault);

    // Characters outside the bank are not reachable through the lobby.
    REQUIRE_THROWS_AS(f.characters.addItem("lobby1", "gm1", strayId, "potion", 1), NotFound);
    REQUIRE_THROWS_AS(f.characters.getCharacterInfo("lobby1", "gm1", strayId), NotFound);

    EntityDefinition stored = *f.store->getCharacter(f.heroId);
    REQUIRE(stored.inventory.empty());
    REQUIRE(stored.weaponry.empty());
    REQUIRE(stored.spellBook.empty());
    REQUIRE(stored.statusEffects.empty());
    REQUIRE(stored.attributes.empty());
    REQUIRE(stored.spellLayout.layout.empty());
}

TEST_CASE("Spell layout respects the slot limit", "[character]")
{
    CharacterFixture f;
    f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, { "p1" });

    f.characters.changeSpellLayout("lobby1", "p1", f.heroId, { "a", "b", "c", "d" });
    REQUIRE(f.characters.getCharacterInfo("lobby1", "p1", f.heroId).spellLayout.layout.size() == 4);

    std::vector<std::string> tooMany{ "a", "b", "c", "d", "e" };
    REQUIRE_THROWS_AS(f.characters.changeSpellLayout("lobby1", "p1", f.heroId, tooMany), ClientFault);
    REQUIRE(f.characters.getCharacterInfo("lobby1", "p1", f.heroId).spellLayout.layout.size() == 4);
}

TEST_CASE("Character write failures are internal faults", "[character]")
{
    CharacterFixture f;
    f.characters.addCharacterToLobby("lobby1", "gm1", f.heroId, { "p1" });
    f.store->failWrites(true);

    REQUIRE_THROWS_AS(f.characters.createCharacter(hero("monk")), InternalFault);
    REQUIRE_THROWS_AS(f.characters.addItem("lobby1", "p1", f.heroId, "potion", 1), InternalFault);
}
