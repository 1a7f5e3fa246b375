#include <catch2/catch.hpp>

#include "auth/TokenService.hpp"
#include "shared/Errors.hpp"

using namespace Skirmish;
using namespace std::chrono_literals;

TEST_CASE("Issued tokens resolve to their user", "[auth]")
{
    TokenService tokens;
    std::string a = tokens.issueToken("p1");
    std::string b = tokens.issueToken("p1");

    REQUIRE(a.size() == 64);
    REQUIRE(a != b);
    REQUIRE(tokens.verifyAccessToken(a) == "p1");
    REQUIRE(tokens.verifyAccessToken(b) == "p1");
}

TEST_CASE("Unknown and revoked tokens are unauthorized", "[auth]")
{
    TokenService tokens;
    REQUIRE_THROWS_AS(tokens.verifyAccessToken(""), Unauthorized);
    REQUIRE_THROWS_AS(tokens.verifyAccessToken("deadbeef"), Unauthorized);

    std::string token = tokens.issueToken("p1");
    tokens.revoke(token);
    REQUIRE_THROWS_AS(tokens.verifyAccessToken(token), Unauthorized);
}

TEST_CASE("Tokens expire after their lifetime", "[auth]")
{
    TokenService tokens(60s);
    auto start = std::chrono::steady_clock::now();
    std::string token = tokens.issueToken("p1", start);

    REQUIRE(tokens.verifyAccessToken(token, start + 59s) == "p1");
    REQUIRE_THROWS_AS(tokens.verifyAccessToken(token, start + 60s), Unauthorized);

    // Expired tokens are forgotten.
    REQUIRE_THROWS_AS(tokens.verifyAccessToken(token, start), Unauthorized);
}
