#pragma once

#include "TokenVerifier.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace Skirmish {

	// Opaque bearer tokens with a fixed lifetime.
	class TokenService : public TokenVerifier {
	public:
		explicit TokenService(std::chrono::seconds ttl = std::chrono::seconds{ 3600 });

		std::string issueToken(const std::string& userId);
		std::string issueToken(const std::string& userId, std::chrono::steady_clock::time_point now);

		std::string verifyAccessToken(const std::string& token) const override;
		std::string verifyAccessToken(const std::string& token, std::chrono::steady_clock::time_point now) const;

		void revoke(const std::string& token);

	private:
		struct TokenRecord {
			std::string userId;
			std::chrono::steady_clock::time_point expiresAt;
		};

		std::string generateToken();

		mutable std::mutex mutex_;
		std::mt19937_64 rng_;
		std::uniform_int_distribution<int> dist_;
		mutable std::unordered_map<std::string, TokenRecord> tokens_;
		std::chrono::seconds ttl_;
	};
}
