#include "Json.hpp"
#include "Errors.hpp"

using namespace Skirmish;

std::string Skirmish::toString(EntitySource source) {
	return source == EntitySource::Embedded ? "embedded" : "dlc";
}

EntitySource Skirmish::entitySourceFromString(const std::string& value) {
	if (value == "embedded") return EntitySource::Embedded;
	if (value == "dlc") return EntitySource::Dlc;
	throw ClientFault("Unknown pawn source: " + value);
}

std::string Skirmish::controlType(const ControlInfo& control) {
	if (std::holds_alternative<ControlledByPlayer>(control)) return "player";
	if (std::holds_alternative<ControlledByAi>(control)) return "ai";
	return "game_logic";
}

std::optional<std::string> Skirmish::controllerId(const ControlInfo& control) {
	if (auto player = std::get_if<ControlledByPlayer>(&control)) return player->id;
	if (auto ai = std::get_if<ControlledByAi>(&control)) return ai->id;
	return std::nullopt;
}

// Readers

std::string Skirmish::requireString(const crow::json::rvalue& obj, const char* key) {
	if (obj.t() != crow::json::type::Object || !obj.has(key) || obj[key].t() != crow::json::type::String) {
		throw ClientFault(std::string("Missing or invalid field: ") + key);
	}
	return std::string(obj[key].s());
}

std::string Skirmish::optionalString(const crow::json::rvalue& obj, const char* key, const std::string& fallback) {
	if (obj.t() != crow::json::type::Object || !obj.has(key) || obj[key].t() != crow::json::type::String) {
		return fallback;
	}
	return std::string(obj[key].s());
}

std::vector<std::string> Skirmish::stringListFromJson(const crow::json::rvalue& obj, const char* key) {
	std::vector<std::string> values;
	if (obj.t() != crow::json::type::Object || !obj.has(key)) return values;

	const auto& list = obj[key];
	if (list.t() != crow::json::type::List) {
		throw ClientFault(std::string("Field must be a list: ") + key);
	}
	for (const auto& item : list) {
		if (item.t() != crow::json::type::String) {
			throw ClientFault(std::string("List must contain strings: ") + key);
		}
		values.push_back(std::string(item.s()));
	}
	return values;
}

int Skirmish::optionalInt(const crow::json::rvalue& obj, const char* key, int fallback) {
	if (obj.t() != crow::json::type::Object || !obj.has(key) || obj[key].t() != crow::json::type::Number) return fallback;
	return static_cast<int>(obj[key].i());
}

ControlInfo Skirmish::controlInfoFromJson(const crow::json::rvalue& value) {
	if (value.t() != crow::json::type::Object) {
		throw ClientFault("controlledBy must be an object");
	}

	std::string type = requireString(value, "type");

	if (type == "player") {
		ControlledByPlayer player;
		if (value.has("id") && value["id"].t() == crow::json::type::String) {
			player.id = std::string(value["id"].s());
		}
		return player;
	}
	if (type == "ai") {
		return ControlledByAi{ requireString(value, "id") };
	}
	if (type == "game_logic") {
		return ControlledByGameLogic{};
	}

	throw ClientFault("Unknown control type: " + type);
}

PresetPawn Skirmish::presetPawnFromJson(const std::string& square, const crow::json::rvalue& value) {
	if (square.empty()) {
		throw ClientFault("Pawn square must not be empty");
	}
	if (value.t() != crow::json::type::Object) {
		throw ClientFault("Pawn on " + square + " must be an object");
	}

	PresetPawn pawn;
	pawn.square = square;
	pawn.path = requireString(value, "path");
	pawn.source = entitySourceFromString(requireString(value, "source"));

	if (value.has("controlledBy")) {
		pawn.controlledBy = controlInfoFromJson(value["controlledBy"]);
	}
	else if (value.has("controlled_by")) {
		pawn.controlledBy = controlInfoFromJson(value["controlled_by"]);
	}
	else {
		throw ClientFault("Pawn on " + square + " has no controller");
	}

	return pawn;
}

std::vector<PresetPawn> Skirmish::presetFieldFromJson(const crow::json::rvalue& field) {
	std::vector<PresetPawn> pawns;

	if (field.t() == crow::json::type::Object) {
		for (const auto& entry : field) {
			pawns.push_back(presetPawnFromJson(entry.key(), entry));
		}
	}
	else if (field.t() == crow::json::type::List) {
		for (const auto& entry : field) {
			pawns.push_back(presetPawnFromJson(requireString(entry, "square"), entry));
		}
	}
	else {
		throw ClientFault("Preset field must be an object or a list");
	}

	return pawns;
}

EntityDefinition Skirmish::entityFromJson(const crow::json::rvalue& value) {
	if (value.t() != crow::json::type::Object) {
		throw ClientFault("Character must be an object");
	}

	EntityDefinition entity;
	entity.descriptor = requireString(value, "descriptor");

	if (value.has("decorations") && value["decorations"].t() == crow::json::type::Object) {
		const auto& deco = value["decorations"];
		entity.decorations.name = optionalString(deco, "name");
		entity.decorations.description = optionalString(deco, "description");
		entity.decorations.sprite = optionalString(deco, "sprite");
	}

	if (value.has("attributes") && value["attributes"].t() == crow::json::type::List) {
		for (const auto& item : value["attributes"]) {
			Attribute attr;
			attr.dlc = optionalString(item, "dlc", "builtins");
			attr.descriptor = requireString(item, "descriptor");
			attr.value = optionalInt(item, "value", 0);
			entity.attributes.push_back(attr);
		}
	}

	return entity;
}

// Writers

crow::json::wvalue Skirmish::stringListJson(const std::vector<std::string>& values) {
	crow::json::wvalue list = crow::json::wvalue::list();
	unsigned index = 0;
	for (const auto& v : values) list[index++] = v;
	return list;
}

crow::json::wvalue Skirmish::toJson(const ControlInfo& control) {
	crow::json::wvalue json;
	json["type"] = controlType(control);

	if (!std::holds_alternative<ControlledByGameLogic>(control)) {
		auto id = controllerId(control);
		if (id) json["id"] = *id;
		else json["id"] = nullptr;
	}
	return json;
}

crow::json::wvalue Skirmish::toJson(const EntityDefinition& entity) {
	crow::json::wvalue json;
	json["_id"] = entity.id;
	json["descriptor"] = entity.descriptor;
	json["decorations"]["name"] = entity.decorations.name;
	json["decorations"]["description"] = entity.decorations.description;
	json["decorations"]["sprite"] = entity.decorations.sprite;
	json["level"]["current"] = entity.level.current;
	json["level"]["availableUpgrades"] = entity.level.availableUpgrades;
	json["gold"] = entity.gold;
	json["alignments"] = stringListJson(entity.alignments);
	json["abilitiesPoints"]["will"] = entity.abilitiesPoints.will;
	json["abilitiesPoints"]["reflexes"] = entity.abilitiesPoints.reflexes;
	json["abilitiesPoints"]["strength"] = entity.abilitiesPoints.strength;
	json["abilitiesPoints"]["max"] = entity.abilitiesPoints.max;

	crow::json::wvalue attributes = crow::json::wvalue::list();
	unsigned index = 0;
	for (const auto& a : entity.attributes) {
		crow::json::wvalue item;
		item["dlc"] = a.dlc;
		item["descriptor"] = a.descriptor;
		item["value"] = a.value;
		attributes[index++] = std::move(item);
	}
	json["attributes"] = std::move(attributes);

	auto items = [](const std::vector<ItemEntry>& entries) {
		crow::json::wvalue list = crow::json::wvalue::list();
		unsigned i = 0;
		for (const auto& e : entries) {
			crow::json::wvalue item;
			item["descriptor"] = e.descriptor;
			item["quantity"] = e.quantity;
			list[i++] = std::move(item);
		}
		return list;
	};
	json["inventory"] = items(entity.inventory);
	json["weaponry"] = items(entity.weaponry);

	crow::json::wvalue spells = crow::json::wvalue::list();
	index = 0;
	for (const auto& s : entity.spellBook) {
		crow::json::wvalue item;
		item["descriptor"] = s.descriptor;
		item["conflictsWith"] = stringListJson(s.conflictsWith);
		item["requiresToUse"] = stringListJson(s.requiresToUse);
		spells[index++] = std::move(item);
	}
	json["spellBook"] = std::move(spells);

	json["spellLayout"]["max"] = entity.spellLayout.max;
	json["spellLayout"]["layout"] = stringListJson(entity.spellLayout.layout);

	crow::json::wvalue effects = crow::json::wvalue::list();
	index = 0;
	for (const auto& e : entity.statusEffects) {
		crow::json::wvalue item;
		item["descriptor"] = e.descriptor;
		item["duration"] = e.duration;
		effects[index++] = std::move(item);
	}
	json["statusEffects"] = std::move(effects);

	return json;
}

crow::json::wvalue Skirmish::toJson(const BattlefieldSeed& seed) {
	crow::json::wvalue json;

	crow::json::wvalue pawns = crow::json::wvalue::object();
	for (const auto& [square, pawn] : seed.fieldPawns) {
		pawns[square]["entity_preset"]["source"] = toString(pawn.entityPreset.source);
		pawns[square]["entity_preset"]["name"] = pawn.entityPreset.name;
		pawns[square]["owner"] = toJson(pawn.owner);
	}
	json["field_pawns"] = std::move(pawns);

	crow::json::wvalue entities = crow::json::wvalue::object();
	for (const auto& [name, entity] : seed.customEntities) {
		entities[name] = toJson(entity);
	}
	json["custom_entities"] = std::move(entities);

	return json;
}

crow::json::wvalue Skirmish::toJson(const CombatSummary& summary) {
	crow::json::wvalue json;
	json["_id"] = summary.id;
	json["nickname"] = summary.nickname;
	json["isActive"] = summary.isActive;
	json["roundCount"] = summary.roundCount;

	crow::json::wvalue players = crow::json::wvalue::list();
	unsigned index = 0;
	for (const auto& p : summary.activePlayers) {
		crow::json::wvalue item;
		item["handle"] = p.handle;
		item["nickname"] = p.nickname;
		players[index++] = std::move(item);
	}
	json["activePlayers"] = std::move(players);
	return json;
}

crow::json::wvalue Skirmish::toJson(const LobbyInfoView& info) {
	crow::json::wvalue json;
	json["lobbyId"] = info.lobbyId;
	json["name"] = info.name;
	json["gm"] = info.gmId;
	json["layout"] = info.layout;

	crow::json::wvalue combats = crow::json::wvalue::list();
	unsigned index = 0;
	for (const auto& c : info.combats) combats[index++] = toJson(c);
	json["combats"] = std::move(combats);

	crow::json::wvalue players = crow::json::wvalue::list();
	index = 0;
	for (const auto& p : info.players) {
		crow::json::wvalue item;
		item["player"]["userId"] = p.userId;
		item["player"]["handle"] = p.handle;
		item["player"]["nickname"] = p.nickname;
		item["player"]["avatar"] = "";
		if (p.character) {
			item["character"]["name"] = p.character->name;
			item["character"]["sprite"] = p.character->sprite;
		}
		else {
			item["character"] = nullptr;
		}
		players[index++] = std::move(item);
	}
	json["players"] = std::move(players);

	if (info.controlledEntity) {
		json["controlledEntity"]["id"] = info.controlledEntity->id;
		json["controlledEntity"]["name"] = info.controlledEntity->name;
	}
	else {
		json["controlledEntity"] = nullptr;
	}
	return json;
}

crow::json::wvalue Skirmish::toJson(const JoinedLobbyView& lobby) {
	crow::json::wvalue json;
	json["_id"] = lobby.id;
	json["name"] = lobby.name;
	json["isGm"] = lobby.isGm;
	json["characters"] = stringListJson(lobby.characters);
	return json;
}

crow::json::wvalue Skirmish::errorJson(const std::string& message) {
	crow::json::wvalue json;
	json["error"] = message;
	return json;
}
