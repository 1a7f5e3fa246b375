#include "Config.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace Skirmish;

static std::string getEnvVar(const Config::Lookup& lookup, const char* key, const std::string& defaultValue = "") {
	const char* val = lookup(key);
	return (val && *val) ? std::string(val) : defaultValue;
}

static long parsePositive(const std::string& key, const std::string& raw, long max) {
	size_t consumed = 0;
	long value = 0;
	try {
		value = std::stol(raw, &consumed);
	}
	catch (const std::exception&) {
		throw std::invalid_argument(key + " must be a number, got '" + raw + "'");
	}
	if (consumed != raw.size() || value <= 0 || value > max) {
		throw std::invalid_argument(key + " out of range: " + raw);
	}
	return value;
}

Config Config::fromEnvironment() {
	return fromLookup([](const char* key) { return std::getenv(key); });
}

Config Config::fromLookup(const Lookup& lookup) {
	Config config;
	config.mongoUri = getEnvVar(lookup, "MONGO_URI");
	config.dbName = getEnvVar(lookup, "DB_NAME", config.dbName);
	config.port = static_cast<uint16_t>(parsePositive("PORT", getEnvVar(lookup, "PORT", "8080"), 65535));
	config.workers = static_cast<size_t>(parsePositive("WORKERS", getEnvVar(lookup, "WORKERS", "4"), 256));
	config.tokenTtlSeconds = static_cast<int>(
		parsePositive("TOKEN_TTL_SECONDS", getEnvVar(lookup, "TOKEN_TTL_SECONDS", "3600"), 60L * 60 * 24 * 30));
	return config;
}
