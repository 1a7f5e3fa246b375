#pragma once

#include <functional>
#include <memory>
#include <crow.h>
#include <string>

#include "../auth/TokenService.hpp"
#include "../combat/CombatRegistry.hpp"
#include "../infra/TaskQueue.hpp"
#include "../lobby/CharacterService.hpp"
#include "../lobby/LobbyService.hpp"
#include "../storage/GameStore.hpp"
#include "SocketAdmission.hpp"
#include "SocketBindings.hpp"

namespace Skirmish {

    class HttpServer {
    public:
        HttpServer(
            std::shared_ptr<GameStore> storage,
            std::shared_ptr<CombatRegistry> registry,
            std::shared_ptr<LobbyService> lobbies,
            std::shared_ptr<CharacterService> characters,
            std::shared_ptr<TokenService> tokens,
            std::shared_ptr<TaskQueue> taskQueue
        );
        ~HttpServer() = default;

        void run(uint16_t port = 8080);

    private:
        using Handler = std::function<crow::json::wvalue()>;

        void registerUserRoutes(crow::SimpleApp& app);
        void registerLobbyRoutes(crow::SimpleApp& app);
        void registerCharacterRoutes(crow::SimpleApp& app);

        // WebSocket handlers
        void handleWebSocketOpen(crow::websocket::connection& conn);
        void handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason);
        void handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary);
        void processJoinCombat(crow::websocket::connection& conn, const crow::json::rvalue& msg);

        // Helpers
        // Resolves the user behind an "Authorization: Bearer <token>" header.
        std::string authenticate(const std::string& authorization) const;
        void respond(crow::response& res, int successCode, Handler handler);

        // Components
        std::shared_ptr<GameStore> storage;
        std::shared_ptr<CombatRegistry> registry;
        std::shared_ptr<LobbyService> lobbies;
        std::shared_ptr<CharacterService> characters;
        std::shared_ptr<TokenService> tokens;
        std::shared_ptr<TaskQueue> taskQueue;
        SocketAdmission admission;
        SocketBindings bindings;
    };
}
