#include "SocketAdmission.hpp"
#include "../infra/Log.hpp"

using namespace Skirmish;

SocketAdmission::SocketAdmission(std::shared_ptr<CombatRegistry> registry, std::shared_ptr<const TokenVerifier> verifier)
	: registry(std::move(registry)),
	verifier(std::move(verifier)) {}

AdmissionResult SocketAdmission::admit(const std::shared_ptr<PlayerChannel>& channel, const std::string& combatId, const std::string& token) {
	auto session = registry->get(combatId);
	if (!session) {
		Log::log("[ADMISSION] Combat {} not found", combatId);
		channel->disconnect("Combat not found");
		return AdmissionResult{ AdmissionStatus::SessionNotFound, "" };
	}

	std::string playerId;
	try {
		playerId = verifier->verifyAccessToken(token);
	}
	catch (const std::exception& e) {
		Log::log("[ADMISSION] Rejected token for combat {}: {}", combatId, e.what());
		channel->emit("invalid_token");
		channel->disconnect("Invalid token");
		return AdmissionResult{ AdmissionStatus::InvalidToken, "" };
	}

	if (session->isPlayerInCombat(playerId)) {
		Log::log("[ADMISSION] Player {} already connected to combat {}", playerId, combatId);
		channel->disconnect("Already connected");
		return AdmissionResult{ AdmissionStatus::AlreadyConnected, playerId };
	}

	// Another socket for the same player may have attached since the check above,
	// or the session may have finished.
	if (!session->handlePlayer(playerId, channel)) {
		if (session->isFinished()) {
			channel->disconnect("Combat not found");
			return AdmissionResult{ AdmissionStatus::SessionNotFound, playerId };
		}
		Log::log("[ADMISSION] Player {} lost the slot race for combat {}", playerId, combatId);
		channel->disconnect("Already connected");
		return AdmissionResult{ AdmissionStatus::AlreadyConnected, playerId };
	}

	return AdmissionResult{ AdmissionStatus::Admitted, playerId };
}
