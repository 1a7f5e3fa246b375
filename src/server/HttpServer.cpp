#include "HttpServer.hpp"
#include "../infra/Log.hpp"
#include "../shared/Errors.hpp"
#include "../shared/Json.hpp"

using namespace Skirmish;

static crow::json::rvalue parseBody(const std::string& body) {
    auto json = crow::json::load(body);
    if (!json || json.t() != crow::json::type::Object) {
        throw ClientFault("Invalid JSON");
    }
    return json;
}

static void writeJson(crow::response& res, int code, const crow::json::wvalue& body) {
    res.code = code;
    res.set_header("Content-Type", "application/json");
    res.write(body.dump());
    res.end();
}

static crow::json::wvalue idJson(const std::string& id) {
    crow::json::wvalue json;
    json["_id"] = id;
    return json;
}

HttpServer::HttpServer(
    std::shared_ptr<GameStore> storage,
    std::shared_ptr<CombatRegistry> registry,
    std::shared_ptr<LobbyService> lobbies,
    std::shared_ptr<CharacterService> characters,
    std::shared_ptr<TokenService> tokens,
    std::shared_ptr<TaskQueue> taskQueue
) : storage(std::move(storage)),
registry(std::move(registry)),
lobbies(std::move(lobbies)),
characters(std::move(characters)),
tokens(std::move(tokens)),
taskQueue(std::move(taskQueue)),
admission(this->registry, this->tokens)
{
    Log::log("[INIT] HttpServer ready with {} workers", this->taskQueue->workerCount());
}

void HttpServer::run(uint16_t port) {
    crow::SimpleApp app;

    registerUserRoutes(app);
    registerLobbyRoutes(app);
    registerCharacterRoutes(app);

    auto wsOpenHandler = std::bind(&HttpServer::handleWebSocketOpen, this, std::placeholders::_1);
    auto wsCloseHandler = std::bind(&HttpServer::handleWebSocketClose, this,
        std::placeholders::_1, std::placeholders::_2);
    auto wsMessageHandler = std::bind(&HttpServer::handleWebSocketMessage, this,
        std::placeholders::_1, std::placeholders::_2,
        std::placeholders::_3);

    CROW_WEBSOCKET_ROUTE(app, "/combat")
        .onopen(wsOpenHandler)
        .onclose(wsCloseHandler)
        .onmessage(wsMessageHandler);

    Log::log("[INIT] Listening on port {}", port);

    app.port(port).multithreaded().run();
}

// Routes

void HttpServer::registerUserRoutes(crow::SimpleApp& app) {

    // Handles are the only credential; there are no passwords.
    CROW_ROUTE(app, "/users").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res) {
        std::string body = req.body;
        respond(res, 201, [this, body]() {
            auto json = parseBody(body);
            std::string handle = requireString(json, "handle");
            if (handle.empty()) throw ClientFault("Handle must not be empty");
            if (storage->getUserByHandle(handle)) throw ClientFault("Handle already taken");

            auto userId = storage->createUser(handle);
            if (!userId) throw InternalFault();

            Log::log("[HTTP] User {} registered as {}", *userId, handle);
            crow::json::wvalue result = idJson(*userId);
            result["handle"] = handle;
            return result;
            });
            });

    CROW_ROUTE(app, "/auth/token").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res) {
        std::string body = req.body;
        respond(res, 200, [this, body]() {
            auto json = parseBody(body);
            auto user = storage->getUserByHandle(requireString(json, "handle"));
            if (!user) throw NotFound("User not found");

            crow::json::wvalue result;
            result["token"] = tokens->issueToken(user->id);
            result["userId"] = user->id;
            return result;
            });
            });
}

void HttpServer::registerLobbyRoutes(crow::SimpleApp& app) {

    CROW_ROUTE(app, "/lobbies").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            return idJson(lobbies->createLobby(requireString(json, "name"), userId));
            });
            });

    CROW_ROUTE(app, "/lobbies").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization]() {
            std::string userId = authenticate(authorization);

            crow::json::wvalue list = crow::json::wvalue::list();
            unsigned index = 0;
            for (const auto& lobby : lobbies->getJoinedLobbies(userId)) {
                list[index++] = toJson(lobby);
            }
            return list;
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId]() {
            std::string userId = authenticate(authorization);
            return toJson(lobbies->getLobbyInfo(lobbyId, userId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/players").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body, lobbyId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);

            std::optional<std::string> mainCharacter;
            std::string characterId = optionalString(json, "mainCharacter");
            if (!characterId.empty()) mainCharacter = characterId;

            lobbies->addPlayerToLobby(lobbyId, userId, optionalString(json, "nickname"), mainCharacter);

            crow::json::wvalue result;
            result["lobbyId"] = lobbyId;
            result["userId"] = userId;
            return result;
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/combats").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId]() {
            std::string userId = authenticate(authorization);

            crow::json::wvalue list = crow::json::wvalue::list();
            unsigned index = 0;
            for (const auto& summary : lobbies->listCombats(lobbyId, userId)) {
                list[index++] = toJson(summary);
            }
            return list;
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/combats").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body, lobbyId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);

            std::string mode = optionalString(json, "type", "requested");
            PresetSource preset = presetSourceFromJson(mode, json.has("preset") ? json["preset"] : json);

            std::string combatId = lobbies->requestCombat(
                lobbyId,
                userId,
                requireString(json, "nickname"),
                preset,
                stringListFromJson(json, "players")
            );

            crow::json::wvalue result;
            result["combatId"] = combatId;
            return result;
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/combats/<string>").methods(crow::HTTPMethod::DELETE)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string combatId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId, combatId]() {
            std::string userId = authenticate(authorization);

            crow::json::wvalue result;
            result["cancelled"] = lobbies->cancelCombat(lobbyId, userId, combatId);
            return result;
            });
            });

    CROW_ROUTE(app, "/presets").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body]() {
            authenticate(authorization);
            auto json = parseBody(body);
            if (!json.has("field")) throw ClientFault("Missing or invalid field: field");
            return idJson(lobbies->createCombatPreset(presetFieldFromJson(json["field"])));
            });
            });
}

void HttpServer::registerCharacterRoutes(crow::SimpleApp& app) {

    CROW_ROUTE(app, "/characters").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body]() {
            authenticate(authorization);
            return idJson(characters->createCharacter(entityFromJson(parseBody(body))));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 201, [this, authorization, body, lobbyId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);

            std::string characterId = requireString(json, "characterId");
            characters->addCharacterToLobby(lobbyId, userId, characterId, stringListFromJson(json, "controlledBy"));
            return idJson(characterId);
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId]() {
            std::string userId = authenticate(authorization);

            crow::json::wvalue list = crow::json::wvalue::list();
            unsigned index = 0;
            for (const auto& character : characters->getCharactersOfPlayer(lobbyId, userId)) {
                list[index++] = toJson(character);
            }
            return list;
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/my_character").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId]() {
            std::string userId = authenticate(authorization);
            return toJson(characters->getMyCharacterInfo(lobbyId, userId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        respond(res, 200, [this, authorization, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/assign").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body.empty() ? "{}" : body);

            characters->assignCharacterToPlayer(lobbyId, userId, optionalString(json, "userId", userId), characterId);
            return idJson(characterId);
            });
            });

    // Loadout edits answer with the updated character.

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/items").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->addItem(lobbyId, userId, characterId, requireString(json, "descriptor"), optionalInt(json, "quantity", 1));
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/weapons").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->addWeapon(lobbyId, userId, characterId, requireString(json, "descriptor"), optionalInt(json, "quantity", 1));
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/spells").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->addSpell(
                lobbyId,
                userId,
                characterId,
                requireString(json, "descriptor"),
                stringListFromJson(json, "conflictsWith"),
                stringListFromJson(json, "requiresToUse")
            );
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/status_effects").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->addStatusEffect(lobbyId, userId, characterId, requireString(json, "descriptor"), optionalInt(json, "duration", 1));
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/attributes").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->addAttribute(
                lobbyId,
                userId,
                characterId,
                optionalString(json, "dlc", "builtins"),
                requireString(json, "descriptor"),
                optionalInt(json, "value", 0)
            );
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });

    CROW_ROUTE(app, "/lobbies/<string>/characters/<string>/spell_layout").methods(crow::HTTPMethod::PUT)
        ([this](const crow::request& req, crow::response& res, std::string lobbyId, std::string characterId) {
        std::string authorization = req.get_header_value("Authorization");
        std::string body = req.body;
        respond(res, 200, [this, authorization, body, lobbyId, characterId]() {
            std::string userId = authenticate(authorization);
            auto json = parseBody(body);
            characters->changeSpellLayout(lobbyId, userId, characterId, stringListFromJson(json, "layout"));
            return toJson(characters->getCharacterInfo(lobbyId, userId, characterId));
            });
            });
}

// WebSocket handlers

void HttpServer::handleWebSocketOpen(crow::websocket::connection& conn) {
    bindings.open(&conn);
    Log::log("[WS] New connection: {}", reinterpret_cast<uintptr_t>(&conn));
}

void HttpServer::handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason) {
    auto binding = bindings.close(&conn);
    if (!binding) return;

    binding->channel->markClosed();

    if (binding->admitted) {
        if (auto session = registry->get(binding->combatId)) {
            session->releasePlayer(binding->playerId, binding->channel.get());
        }
    }

    Log::log("[WS] Closed ({})", reason);
}

void HttpServer::handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary) {
    if (is_binary) return;

    auto binding = bindings.find(&conn);
    if (!binding) return;

    if (binding->admitted) {
        auto session = registry->get(binding->combatId);
        if (!session) {
            binding->channel->disconnect("Combat not found");
            return;
        }
        session->handleMessage(binding->playerId, data);
        return;
    }

    // Admission already ran or is running for this socket.
    if (!binding->combatId.empty()) return;

    auto msg = crow::json::load(data);
    if (!msg || msg.t() != crow::json::type::Object || optionalString(msg, "type") != "JOIN_COMBAT") {
        binding->channel->send(errorJson("Send JOIN_COMBAT first").dump());
        return;
    }

    processJoinCombat(conn, msg);
}

void HttpServer::processJoinCombat(crow::websocket::connection& conn, const crow::json::rvalue& msg) {
    auto channel = bindings.open(&conn);

    std::string combatId = optionalString(msg, "combatId");
    std::string token = optionalString(msg, "token");
    if (combatId.empty()) {
        channel->send(errorJson("JOIN_COMBAT requires combatId and token").dump());
        return;
    }

    if (!bindings.claim(&conn, combatId)) return;

    AdmissionResult result = admission.admit(channel, combatId, token);
    if (result.status != AdmissionStatus::Admitted) return;

    bindings.admit(&conn, result.playerId);
    Log::log("[WS] Player {} joined combat {}", result.playerId, combatId);
}

// Helpers

std::string HttpServer::authenticate(const std::string& authorization) const {
    const std::string prefix = "Bearer ";
    if (!authorization.starts_with(prefix)) {
        throw Unauthorized("Missing bearer token");
    }
    return tokens->verifyAccessToken(authorization.substr(prefix.size()));
}

void HttpServer::respond(crow::response& res, int successCode, Handler handler) {
    bool queued = taskQueue->enqueue([&res, successCode, handler = std::move(handler)]() {
        try {
            writeJson(res, successCode, handler());
        }
        catch (const SkirmishError& e) {
            writeJson(res, httpStatusFor(e.kind()), errorJson(e.what()));
        }
        catch (const std::exception& e) {
            Log::log("[HTTP] Unhandled error: {}", e.what());
            writeJson(res, 500, errorJson("Internal server error"));
        }
        });

    if (!queued) {
        writeJson(res, 503, errorJson("Server is shutting down"));
    }
}
