#pragma once

#include <string>

namespace Skirmish {

	class TokenVerifier {
	public:
		virtual ~TokenVerifier() = default;

		// Returns the subject (user id) of a valid token, throws Unauthorized otherwise.
		virtual std::string verifyAccessToken(const std::string& token) const = 0;
	};
}
