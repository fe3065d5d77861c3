#include "session_snapshot.h"
#include "bastion_systems.h"
#include "combat.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <variant>

using json = nlohmann::json;

namespace bastion {

// ─── JSON mapping ─────────────────────────────────────────
static void to_json(json &j, const GridPos &p) { j = json::array({p.x, p.y}); }
static void from_json(const json &j, GridPos &p) {
  p.x = j.at(0).get<int>();
  p.y = j.at(1).get<int>();
}

static void to_json(json &j, const Vec3 &v) {
  j = json::array({v.x, v.y, v.z});
}
static void from_json(const json &j, Vec3 &v) {
  v.x = j.at(0).get<float>();
  v.y = j.at(1).get<float>();
  v.z = j.at(2).get<float>();
}

static void to_json(json &j, const UnitRecord &u) {
  j = json{{"cell", u.cell},
           {"kind", u.kind == UNIT_BASE ? "base" : "turret"},
           {"level", u.level}};
}
static void from_json(const json &j, UnitRecord &u) {
  j.at("cell").get_to(u.cell);
  std::string kind = j.at("kind").get<std::string>();
  if (kind == "base")
    u.kind = UNIT_BASE;
  else if (kind == "turret")
    u.kind = UNIT_TURRET;
  else
    throw std::runtime_error("Unknown unit kind in session: " + kind);
  u.level = j.at("level").get<uint32_t>();
}

// ─── Capture / restore ────────────────────────────────────

std::optional<SessionSnapshot> capture_session(flecs::world &ecs) {
  const GameState *game = ecs.try_get<GameState>();
  if (game == nullptr)
    return std::nullopt;

  SessionSnapshot snapshot;
  snapshot.resource_count = game->resource_count;
  snapshot.selected = game->selected;
  snapshot.cursor = game->cursor;
  snapshot.rng_state = game->rng_state;

  for (const auto &cell : game->grid) {
    flecs::entity e = entity_ref(ecs, cell.second);
    if (!e.is_alive())
      continue;
    const PlayerUnit *unit = e.try_get<PlayerUnit>();
    if (unit == nullptr)
      continue;
    if (const BaseUnit *base = std::get_if<BaseUnit>(unit))
      snapshot.units.push_back({cell.first, UNIT_BASE, base->level});
    else if (const TurretUnit *turret = std::get_if<TurretUnit>(unit))
      snapshot.units.push_back({cell.first, UNIT_TURRET, turret->level});
  }

  ecs.get<EnemyIndex>().query.each(
      [&](const Transform &t) { snapshot.enemies.push_back(t.position); });

  return snapshot;
}

void restore_session(flecs::world &ecs, const SessionSnapshot &snapshot) {
  GameState &game = ecs.ensure<GameState>();
  game.grid.clear();
  game.resource_count = snapshot.resource_count;
  game.selected = snapshot.selected;
  game.cursor = snapshot.cursor;
  game.rng_state = snapshot.rng_state;
  game.spawn_alarm = AlarmId{};

  for (const UnitRecord &u : snapshot.units) {
    if (u.kind == UNIT_BASE)
      create_base(ecs, game, u.cell, u.level);
    else
      create_turret(ecs, game, u.cell, u.level);
  }
  for (const Point &p : snapshot.enemies)
    create_enemy(ecs, p);

  ecs_trace("bastion: restored %d units, %d enemies",
            (int)snapshot.units.size(), (int)snapshot.enemies.size());
}

std::string session_to_json(const SessionSnapshot &snapshot) {
  json j;
  j["resource_count"] = snapshot.resource_count;
  j["selected"] = snapshot.selected;
  j["cursor"] = snapshot.cursor;
  j["rng_state"] = snapshot.rng_state;
  j["units"] = snapshot.units;
  j["enemies"] = snapshot.enemies;
  return j.dump(2);
}

SessionSnapshot session_from_json(const std::string &text) {
  try {
    json j = json::parse(text);
    SessionSnapshot snapshot;
    snapshot.resource_count = j.at("resource_count").get<uint32_t>();
    j.at("selected").get_to(snapshot.selected);
    j.at("cursor").get_to(snapshot.cursor);
    snapshot.rng_state = j.value("rng_state", (uint64_t)0);
    j.at("units").get_to(snapshot.units);
    j.at("enemies").get_to(snapshot.enemies);
    return snapshot;
  } catch (json::exception &e) {
    throw std::runtime_error(std::string("Malformed session: ") + e.what());
  }
}

} // namespace bastion
