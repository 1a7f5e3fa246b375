#pragma once

namespace Skirmish {

	enum class CombatStatus {
		Pending,
		Active,
		Finished
	};

	enum class EntitySource {
		Embedded,
		Dlc
	};

	enum class ErrorKind {
		ClientFault,
		NotFound,
		Unauthorized,
		InternalFault
	};

	enum class AdmissionStatus {
		Admitted,
		SessionNotFound,
		InvalidToken,
		AlreadyConnected
	};

	enum class CharacterField {
		Attributes,
		Inventory,
		Weaponry,
		SpellBook,
		SpellLayout,
		StatusEffects
	};
}
