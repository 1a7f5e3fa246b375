#pragma once

#include <string>

namespace Skirmish {

	// A live connection a session can deliver messages over.
	class PlayerChannel {
	public:
		virtual ~PlayerChannel() = default;

		virtual void send(const std::string& text) = 0;
		virtual void disconnect(const std::string& reason) = 0;

		// Named signal with no payload, e.g. "invalid_token".
		void emit(const std::string& signal) {
			send("{\"type\":\"" + signal + "\"}");
		}
	};
}
