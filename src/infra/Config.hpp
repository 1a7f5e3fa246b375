#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace Skirmish {

	struct Config {
		std::string mongoUri;
		std::string dbName{ "SkirmishDB" };
		uint16_t port{ 8080 };
		size_t workers{ 4 };
		int tokenTtlSeconds{ 3600 };

		using Lookup = std::function<const char*(const char*)>;

		// Throws std::invalid_argument when a numeric variable does not parse.
		static Config fromEnvironment();
		static Config fromLookup(const Lookup& lookup);
	};
}
