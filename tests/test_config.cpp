#include <catch2/catch.hpp>

#include "infra/Config.hpp"

#include <map>
#include <stdexcept>
#include <string>

using namespace Skirmish;

namespace {

    Config::Lookup lookupFrom(const std::map<std::string, std::string>& values) {
        return [values](const char* key) -> const char* {
            auto it = values.find(key);
            return it == values.end() ? nullptr : it->second.c_str();
        };
    }
}

TEST_CASE("Config defaults", "[config]")
{
    Config config = Config::fromLookup(lookupFrom({ { "MONGO_URI", "mongodb://localhost:27017" } }));

    REQUIRE(config.mongoUri == "mongodb://localhost:27017");
    REQUIRE(config.dbName == "SkirmishDB");
    REQUIRE(config.port == 8080);
    REQUIRE(config.workers == 4);
    REQUIRE(config.tokenTtlSeconds == 3600);
}

TEST_CASE("Config reads overrides", "[config]")
{
    Config config = Config::fromLookup(lookupFrom({
        { "DB_NAME", "Arena" },
        { "PORT", "9001" },
        { "WORKERS", "8" },
        { "TOKEN_TTL_SECONDS", "120" }
    }));

    REQUIRE(config.mongoUri.empty());
    REQUIRE(config.dbName == "Arena");
    REQUIRE(config.port == 9001);
    REQUIRE(config.workers == 8);
    REQUIRE(config.tokenTtlSeconds == 120);
}

TEST_CASE("Config rejects malformed numbers", "[config]")
{
    REQUIRE_THROWS_AS(Config::fromLookup(lookupFrom({ { "PORT", "http" } })), std::invalid_argument);
    REQUIRE_THROWS_AS(Config::fromLookup(lookupFrom({ { "PORT", "70000" } })), std::invalid_argument);
    REQUIRE_THROWS_AS(Config::fromLookup(lookupFrom({ { "WORKERS", "0" } })), std::invalid_argument);
    REQUIRE_THROWS_AS(Config::fromLookup(lookupFrom({ { "TOKEN_TTL_SECONDS", "12s" } })), std::invalid_argument);
}
