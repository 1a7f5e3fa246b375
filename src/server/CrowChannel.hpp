#pragma once

#include "../combat/PlayerChannel.hpp"
#include "crow.h"
#include <mutex>
#include <string>

namespace Skirmish {

	// PlayerChannel over a Crow websocket. Crow frees the connection after its
	// close handler runs, so the handler must call markClosed() first.
	class CrowChannel : public PlayerChannel {
	public:
		explicit CrowChannel(crow::websocket::connection* conn);

		void send(const std::string& text) override;
		void disconnect(const std::string& reason) override;

		void markClosed();

	private:
		std::mutex mutex_;
		crow::websocket::connection* conn_;
		bool open_{ true };
	};
}
