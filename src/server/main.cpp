#include "crow.h"
#include <iostream>
#include <string>
#include <memory>

#include "../auth/TokenService.hpp"
#include "../combat/CombatRegistry.hpp"
#include "../infra/Config.hpp"
#include "../infra/TaskQueue.hpp"
#include "../lobby/CharacterService.hpp"
#include "../lobby/LobbyService.hpp"
#include "../storage/MongoStore.hpp"
#include "HttpServer.hpp"

using namespace Skirmish;

int main()
{
    try
    {
        Config config = Config::fromEnvironment();

        if (config.mongoUri.empty()) {
            std::cerr << "[FATAL] MONGO_URI is not set.\n";
            return -1;
        }

        auto taskQueue = std::make_shared<TaskQueue>(config.workers);

        auto storage = std::make_shared<MongoStore>(config.mongoUri, config.dbName);

        auto registry = std::make_shared<CombatRegistry>();

        auto lobbies = std::make_shared<LobbyService>(storage, registry);

        auto characters = std::make_shared<CharacterService>(storage);

        auto tokens = std::make_shared<TokenService>(std::chrono::seconds{ config.tokenTtlSeconds });

        HttpServer server(storage, registry, lobbies, characters, tokens, taskQueue);

        server.run(config.port);

    }
    catch (const std::exception& e) {
        std::cerr << "[CRASH] Main: " << e.what() << "\n";
        return -1;
    }

    return 0;
}
