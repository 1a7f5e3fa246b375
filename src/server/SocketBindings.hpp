#pragma once

#include "CrowChannel.hpp"
#include "crow.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Skirmish {

	// Which combat and player each open /combat socket belongs to.
	class SocketBindings {
	public:
		struct Binding {
			std::shared_ptr<CrowChannel> channel;
			std::string combatId;
			std::string playerId;
			bool admitted{ false };
		};

		SocketBindings() = default;
		~SocketBindings() = default;

		SocketBindings(const SocketBindings&) = delete;
		SocketBindings& operator=(const SocketBindings&) = delete;

		std::shared_ptr<CrowChannel> open(crow::websocket::connection* conn);

		// False if the socket already asked to join a combat.
		bool claim(crow::websocket::connection* conn, const std::string& combatId);
		void admit(crow::websocket::connection* conn, const std::string& playerId);

		std::optional<Binding> find(crow::websocket::connection* conn) const;
		std::optional<Binding> close(crow::websocket::connection* conn);

		size_t size() const;

	private:
		mutable std::mutex mutex_;
		std::unordered_map<crow::websocket::connection*, Binding> bindings_;
	};
}
