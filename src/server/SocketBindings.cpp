#include "SocketBindings.hpp"

using namespace Skirmish;

std::shared_ptr<CrowChannel> SocketBindings::open(crow::websocket::connection* conn) {
	std::lock_guard lock(mutex_);

	auto& binding = bindings_[conn];
	if (!binding.channel) {
		binding.channel = std::make_shared<CrowChannel>(conn);
	}
	return binding.channel;
}

bool SocketBindings::claim(crow::websocket::connection* conn, const std::string& combatId) {
	std::lock_guard lock(mutex_);

	auto it = bindings_.find(conn);
	if (it == bindings_.end() || !it->second.combatId.empty()) {
		return false;
	}
	it->second.combatId = combatId;
	return true;
}

void SocketBindings::admit(crow::websocket::connection* conn, const std::string& playerId) {
	std::lock_guard lock(mutex_);

	auto it = bindings_.find(conn);
	if (it == bindings_.end()) return;

	it->second.playerId = playerId;
	it->second.admitted = true;
}

std::optional<SocketBindings::Binding> SocketBindings::find(crow::websocket::connection* conn) const {
	std::lock_guard lock(mutex_);

	auto it = bindings_.find(conn);
	if (it == bindings_.end()) return std::nullopt;
	return it->second;
}

std::optional<SocketBindings::Binding> SocketBindings::close(crow::websocket::connection* conn) {
	std::lock_guard lock(mutex_);

	auto it = bindings_.find(conn);
	if (it == bindings_.end()) return std::nullopt;

	Binding binding = std::move(it->second);
	bindings_.erase(it);
	return binding;
}

size_t SocketBindings::size() const {
	std::lock_guard lock(mutex_);
	return bindings_.size();
}
