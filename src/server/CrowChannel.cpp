#include "CrowChannel.hpp"

using namespace Skirmish;

CrowChannel::CrowChannel(crow::websocket::connection* conn)
	: conn_(conn) {}

void CrowChannel::send(const std::string& text) {
	std::lock_guard lock(mutex_);
	if (!open_ || !conn_) return;
	conn_->send_text(text);
}

void CrowChannel::disconnect(const std::string& reason) {
	std::lock_guard lock(mutex_);
	if (!open_ || !conn_) return;
	open_ = false;
	conn_->close(reason);
}

void CrowChannel::markClosed() {
	std::lock_guard lock(mutex_);
	open_ = false;
	conn_ = nullptr;
}
