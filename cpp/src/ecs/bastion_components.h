#ifndef BASTION_COMPONENTS_H
#define BASTION_COMPONENTS_H

#include "bastion_math.h"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <flecs.h>
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

/**
 * Bastion: ECS Component Definitions
 *
 * Per-entity components stay small PODs. Singletons (GameState, AlarmTable,
 * DebugDraw, ...) are set once on the world and may own containers.
 */

namespace bastion {

// ─── Grid ─────────────────────────────────────────────────
constexpr float CELL_SIZE = 5.0f; // world units per cell edge

// Cells per axis on each side of the origin. Keeps int conversion and
// manhattan() well inside int range.
constexpr int GRID_LIMIT = 1 << 20;
constexpr float WORLD_LIMIT = static_cast<float>(GRID_LIMIT) * CELL_SIZE;

// Clamps to [-limit, limit]; NaN maps to -limit.
inline float clamp_extent(float v, float limit) {
  if (!(v >= -limit))
    return -limit;
  return v > limit ? limit : v;
}

/// A coordinate in the 2D game grid on the world x-y plane.
///
/// A grid pos names the minimum corner of its cell, so (5, 3) covers
/// [5*CELL_SIZE, 6*CELL_SIZE) x [3*CELL_SIZE, 4*CELL_SIZE).
struct GridPos {
  int x, y;

  // Points beyond WORLD_LIMIT saturate to the outermost cell.
  static GridPos from_world(const Point &p) {
    const float lim = static_cast<float>(GRID_LIMIT);
    return {static_cast<int>(clamp_extent(std::floor(p.x / CELL_SIZE), lim)),
            static_cast<int>(clamp_extent(std::floor(p.y / CELL_SIZE), lim))};
  }

  Point to_world() const {
    return {static_cast<float>(x) * CELL_SIZE,
            static_cast<float>(y) * CELL_SIZE, 0.0f};
  }

  Point cell_center() const {
    return {static_cast<float>(x) * CELL_SIZE + CELL_SIZE * 0.5f,
            static_cast<float>(y) * CELL_SIZE + CELL_SIZE * 0.5f, 0.0f};
  }

  int manhattan() const { return std::abs(x) + std::abs(y); }
}; // 8 bytes

inline GridPos operator-(const GridPos &a, const GridPos &b) {
  return {a.x - b.x, a.y - b.y};
}
inline bool operator==(const GridPos &a, const GridPos &b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const GridPos &a, const GridPos &b) { return !(a == b); }

constexpr GridPos BASE_CELL = {0, 0};

struct GridPosHash {
  std::size_t operator()(const GridPos &p) const {
    uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) |
                   static_cast<uint32_t>(p.y);
    return std::hash<uint64_t>()(key);
  }
};

// Non-owning entity handle → flecs::entity (may be dead; check is_alive()).
inline flecs::entity entity_ref(const flecs::world &ecs, flecs::entity_t id) {
  return flecs::entity(ecs.c_ptr(), id);
}

// ─── Alarms ───────────────────────────────────────────────
// Generational handle into the AlarmTable. A stale handle (slot reused or
// released) fails alarm_is_valid().
struct AlarmId {
  uint32_t index = 0;
  uint32_t generation = 0; // 0 = null handle
}; // 8 bytes

inline bool operator==(const AlarmId &a, const AlarmId &b) {
  return a.index == b.index && a.generation == b.generation;
}

using AlarmCallback = void (*)(flecs::world &ecs, flecs::entity owner);

struct AlarmSlot {
  AlarmCallback callback = nullptr;
  flecs::entity_t owner = 0; // 0 = world-level alarm, never reaped
  float remaining = 0.0f;
  float interval = 0.0f; // > 0 for repeating alarms
  uint32_t generation = 1;
  bool active = false;
};

struct AlarmTable {
  std::vector<AlarmSlot> slots;
  std::vector<uint32_t> free_slots;
};

// ─── Collision ────────────────────────────────────────────
struct Collider {
  float radius;
}; // 4 bytes, sphere centered on Transform::position

using CollisionCallback = void (*)(flecs::world &ecs, flecs::entity self,
                                   const std::vector<flecs::entity> &others);

struct CollisionHandler {
  CollisionCallback callback;
};

// ─── Rendering ────────────────────────────────────────────
struct Mesh {
  uint32_t model_id; // index into ModelRegistry::names
};

struct Camera {
  float fov_degrees;
};

struct Light {
  float radius;
  float intensity;
}; // point light at the entity's Transform

struct ModelRegistry {
  std::vector<std::string> names; // "cube" for "meshes/cube.dae"
  std::vector<std::string> paths;
};

enum DebugShapeKind : uint8_t { DEBUG_SPHERE = 0, DEBUG_BOX = 1 };

struct DebugShape {
  DebugShapeKind kind;
  Vec3 a;       // sphere center / box min
  Vec3 b;       // box max
  float radius; // sphere only
};

// Rebuilt every frame; the host reads it after advance_frame().
struct DebugDraw {
  std::vector<DebugShape> shapes;
};

// ─── Input ────────────────────────────────────────────────
// Written by the host before each frame, consumed at the end of it.
struct InputState {
  float mouse_dx = 0.0f;
  float mouse_dy = 0.0f;
  bool pressed[3] = {false, false, false}; // went down this frame
};

// ─── Units ────────────────────────────────────────────────
struct BaseUnit {
  uint32_t level;
};

struct TurretUnit {
  uint32_t level;
  AlarmId shoot_alarm;        // repeating fire alarm (non-owning)
  flecs::entity_t target = 0; // enemy being engaged (non-owning), 0 = none
};

using PlayerUnit = std::variant<BaseUnit, TurretUnit>;

struct Enemy {}; // Tag

struct Bullet {
  float speed;
}; // projectile data, no system drives it yet

// ─── Combat extension points ──────────────────────────────
struct DamageEvent {
  flecs::entity_t source;
  flecs::entity_t target;
  uint32_t amount;
};

// Cleared at the start of every frame.
struct DamageChannel {
  std::vector<DamageEvent> events;
};

using TargetSelector = flecs::entity_t (*)(flecs::world &ecs,
                                           flecs::entity turret, float range);

struct TargetAcquisition {
  TargetSelector select;
};

// Cached (Transform, Enemy) query, built once per world by init_world().
struct EnemyIndex {
  flecs::query<const Transform> query;
};

// ─── Configuration (singleton) ────────────────────────────
struct GameConfig {
  float mouse_speed = 0.1f;
  float base_scale_per_level = 0.1f;
  float turret_scale = 0.3f;
  float turret_fire_interval = 1.0f; // seconds
  float turret_range = 4.0f;         // cells
  uint32_t starting_resources = 10;

  float camera_base_offset = 30.0f;
  float camera_offset_per_cursor_offset = 1.0f;
  float camera_xy_move_speed = 5.0f;
  float camera_z_move_speed = 2.0f;

  int min_enemy_count = 5;
  float enemy_spawn_delay = 1.0f; // seconds
  float enemy_move_speed = 1.0f;  // world units per second
  float spawn_x_min = -10.0f;     // cells
  float spawn_x_max = 10.0f;
  float spawn_y_min = 10.0f;
  float spawn_y_max = 15.0f;
  float enemy_radius = 0.5f; // world units
  float unit_radius = 0.5f * CELL_SIZE;

  uint64_t rng_seed = 0x2545F4914F6CDD1DULL;
  std::vector<std::string> model_paths = {"meshes/cube.dae",
                                          "meshes/sphere.dae"};
};

// ─── Game State (singleton) ───────────────────────────────
struct GameState {
  /// A map between a grid coordinate and the unit occupying it.
  std::unordered_map<GridPos, flecs::entity_t, GridPosHash> grid;

  /// The grid cell currently selected by the player.
  GridPos selected = {0, 0};

  /// World-space cursor. Moves the selected cell in discrete increments.
  Point cursor = {0.0f, 0.0f, 0.0f};

  uint32_t resource_count = 0;

  AlarmId spawn_alarm; // pending spawner alarm, null when idle
  uint64_t rng_state = 0;
};

} // namespace bastion

#endif // BASTION_COMPONENTS_H
