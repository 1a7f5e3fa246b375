#pragma once

#include "../auth/TokenVerifier.hpp"
#include "../combat/CombatRegistry.hpp"
#include "../combat/PlayerChannel.hpp"
#include "../shared/DTOs.hpp"
#include <memory>
#include <string>

namespace Skirmish {

	/*
	 * Decides whether a freshly opened socket may join a combat.
	 *
	 * Checks run in a fixed order: session, token, duplicate connection.
	 * Every rejection closes the channel; a rejected token is first told so
	 * with an "invalid_token" signal.
	 */
	class SocketAdmission {
	public:
		SocketAdmission(std::shared_ptr<CombatRegistry> registry, std::shared_ptr<const TokenVerifier> verifier);

		AdmissionResult admit(const std::shared_ptr<PlayerChannel>& channel, const std::string& combatId, const std::string& token);

	private:
		std::shared_ptr<CombatRegistry> registry;
		std::shared_ptr<const TokenVerifier> verifier;
	};
}
