#include <catch2/catch.hpp>

#include "auth/TokenService.hpp"
#include "server/SocketAdmission.hpp"
#include "Fixtures.hpp"
#include "FakeChannel.hpp"

#include <atomic>
#include <thread>

using namespace Skirmish;
using namespace Skirmish::Testing;

namespace {

    // Counts verifications so tests can tell whether the token was ever checked.
    class CountingVerifier : public TokenVerifier {
    public:
        explicit CountingVerifier(std::shared_ptr<TokenService> inner) : inner(std::move(inner)) {}

        std::string verifyAccessToken(const std::string& token) const override {
            ++calls;
            return inner->verifyAccessToken(token);
        }

        mutable std::atomic<int> calls{ 0 };

    private:
        std::shared_ptr<TokenService> inner;
    };

    struct AdmissionFixture {
        std::shared_ptr<CombatRegistry> registry = std::make_shared<CombatRegistry>();
        std::shared_ptr<TokenService> tokens = std::make_shared<TokenService>();
        std::shared_ptr<CountingVerifier> verifier = std::make_shared<CountingVerifier>(tokens);
        SocketAdmission admission{ registry, verifier };
        std::string combatId = registry->create("Boss Fight", duelSeed(), "gm1", { "p1", "p2" });
    };
}

TEST_CASE("Valid token for a new player is admitted", "[admission]")
{
    AdmissionFixture f;
    auto channel = std::make_shared<FakeChannel>();

    AdmissionResult result = f.admission.admit(channel, f.combatId, f.tokens->issueToken("p1"));

    REQUIRE(result.status == AdmissionStatus::Admitted);
    REQUIRE(result.playerId == "p1");
    REQUIRE(channel->received("handshake"));
    REQUIRE(channel->disconnects() == 0);
    REQUIRE(f.registry->get(f.combatId)->isPlayerInCombat("p1"));
}

TEST_CASE("Unknown combat is rejected before the token is checked", "[admission]")
{
    AdmissionFixture f;
    auto channel = std::make_shared<FakeChannel>();

    AdmissionResult result = f.admission.admit(channel, "999", f.tokens->issueToken("p1"));

    REQUIRE(result.status == AdmissionStatus::SessionNotFound);
    REQUIRE(channel->disconnects() == 1);
    REQUIRE(channel->sent().empty());
    REQUIRE(f.verifier->calls == 0);
}

TEST_CASE("Invalid token signals then disconnects without attaching", "[admission]")
{
    AdmissionFixture f;
    auto channel = std::make_shared<FakeChannel>();

    SECTION("garbage token")
    {
        AdmissionResult result = f.admission.admit(channel, f.combatId, "not-a-token");
        REQUIRE(result.status == AdmissionStatus::InvalidToken);
    }

    SECTION("revoked token")
    {
        std::string token = f.tokens->issueToken("p1");
        f.tokens->revoke(token);
        AdmissionResult result = f.admission.admit(channel, f.combatId, token);
        REQUIRE(result.status == AdmissionStatus::InvalidToken);
    }

    REQUIRE(channel->types() == std::vector<std::string>{ "invalid_token" });
    REQUIRE(channel->disconnects() == 1);
    REQUIRE(f.registry->get(f.combatId)->getPlayersInCombat().empty());
}

TEST_CASE("A second connection for the same player is refused", "[admission]")
{
    AdmissionFixture f;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();

    REQUIRE(f.admission.admit(first, f.combatId, f.tokens->issueToken("p1")).status == AdmissionStatus::Admitted);
    AdmissionResult result = f.admission.admit(second, f.combatId, f.tokens->issueToken("p1"));

    REQUIRE(result.status == AdmissionStatus::AlreadyConnected);
    REQUIRE(second->disconnects() == 1);
    REQUIRE_FALSE(second->received("handshake"));
    REQUIRE(first->disconnects() == 0);

    // The surviving channel still drives the session.
    auto session = f.registry->get(f.combatId);
    REQUIRE(session->isPlayerInCombat("p1"));
    session->handleMessage("p1", R"({"type":"bogus"})");
    REQUIRE(first->received("action_rejected"));
    REQUIRE_FALSE(second->received("action_rejected"));
}

TEST_CASE("Racing admissions attach exactly one channel", "[admission][concurrency]")
{
    AdmissionFixture f;
    std::string token = f.tokens->issueToken("p2");

    std::vector<std::shared_ptr<FakeChannel>> channels;
    for (int i = 0; i < 8; ++i) channels.push_back(std::make_shared<FakeChannel>());

    std::atomic<int> admitted{ 0 };
    std::vector<std::thread> threads;
    for (auto& channel : channels) {
        threads.emplace_back([&, channel]() {
            if (f.admission.admit(channel, f.combatId, token).status == AdmissionStatus::Admitted) {
                ++admitted;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    REQUIRE(admitted == 1);

    int disconnected = 0;
    for (const auto& channel : channels) disconnected += channel->disconnects();
    REQUIRE(disconnected == 7);
}

TEST_CASE("Reconnect after close is admitted", "[admission]")
{
    AdmissionFixture f;
    auto first = std::make_shared<FakeChannel>();
    REQUIRE(f.admission.admit(first, f.combatId, f.tokens->issueToken("p1")).status == AdmissionStatus::Admitted);

    f.registry->get(f.combatId)->releasePlayer("p1", first.get());

    auto second = std::make_shared<FakeChannel>();
    REQUIRE(f.admission.admit(second, f.combatId, f.tokens->issueToken("p1")).status == AdmissionStatus::Admitted);
    REQUIRE(second->received("handshake"));
}

TEST_CASE("Finished combats are not admissible", "[admission]")
{
    AdmissionFixture f;
    REQUIRE(f.registry->teardown(f.combatId, "cancelled"));

    auto channel = std::make_shared<FakeChannel>();
    AdmissionResult result = f.admission.admit(channel, f.combatId, f.tokens->issueToken("p1"));

    REQUIRE(result.status == AdmissionStatus::SessionNotFound);
    REQUIRE(channel->disconnects() == 1);
}
