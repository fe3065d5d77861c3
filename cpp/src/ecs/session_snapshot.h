#ifndef BASTION_SESSION_SNAPSHOT_H
#define BASTION_SESSION_SNAPSHOT_H

#include "bastion_components.h"
#include <flecs.h>
#include <optional>
#include <string>
#include <vector>

namespace bastion {

// ═════════════════════════════════════════════════════════════
// SESSION SNAPSHOT: the game state that survives a hot reload.
//
// Entity ids, alarms and callbacks are not carried over; they
// are rebuilt by restore_session() + reattach_callbacks().
// ═════════════════════════════════════════════════════════════

enum UnitKind : uint8_t { UNIT_BASE = 0, UNIT_TURRET = 1 };

struct UnitRecord {
  GridPos cell;
  UnitKind kind;
  uint32_t level;
};

struct SessionSnapshot {
  uint32_t resource_count = 0;
  GridPos selected = {0, 0};
  Point cursor = {0.0f, 0.0f, 0.0f};
  uint64_t rng_state = 0;
  std::vector<UnitRecord> units;
  std::vector<Point> enemies;
};

// Empty when `ecs` holds no GameState (nothing to carry over).
std::optional<SessionSnapshot> capture_session(flecs::world &ecs);

// Rebuilds units, enemies and GameState in `ecs`. Expects components,
// singletons and models to be registered already.
void restore_session(flecs::world &ecs, const SessionSnapshot &snapshot);

std::string session_to_json(const SessionSnapshot &snapshot);

// Throws std::runtime_error on malformed input.
SessionSnapshot session_from_json(const std::string &text);

} // namespace bastion

#endif // BASTION_SESSION_SNAPSHOT_H
