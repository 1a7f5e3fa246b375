#include "TokenService.hpp"
#include "../shared/Errors.hpp"

#include <sstream>

using namespace Skirmish;

TokenService::TokenService(std::chrono::seconds ttl)
	: rng_(std::random_device{}()), dist_(0, 255), ttl_(ttl) {}

std::string TokenService::issueToken(const std::string& userId) {
	return issueToken(userId, std::chrono::steady_clock::now());
}

std::string TokenService::issueToken(const std::string& userId, std::chrono::steady_clock::time_point now) {
	std::lock_guard lock(mutex_);
	std::string token = generateToken();
	while (tokens_.contains(token)) token = generateToken();
	tokens_[token] = TokenRecord{ userId, now + ttl_ };
	return token;
}

std::string TokenService::verifyAccessToken(const std::string& token) const {
	return verifyAccessToken(token, std::chrono::steady_clock::now());
}

std::string TokenService::verifyAccessToken(const std::string& token, std::chrono::steady_clock::time_point now) const {
	std::lock_guard lock(mutex_);

	auto it = tokens_.find(token);
	if (it == tokens_.end()) {
		throw Unauthorized("Invalid access token");
	}
	if (now >= it->second.expiresAt) {
		tokens_.erase(it);
		throw Unauthorized("Access token expired");
	}
	return it->second.userId;
}

void TokenService::revoke(const std::string& token) {
	std::lock_guard lock(mutex_);
	tokens_.erase(token);
}

std::string TokenService::generateToken() {
	std::ostringstream oss;
	for (int i = 0; i < 32; ++i) {
		auto value = dist_(rng_);
		oss << std::hex << std::uppercase << (value >> 4);
		oss << std::hex << std::uppercase << (value & 0xF);
	}
	return oss.str();
}
