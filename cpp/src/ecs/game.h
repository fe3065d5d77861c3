#ifndef BASTION_GAME_H
#define BASTION_GAME_H

#include "bastion_components.h"
#include <flecs.h>

namespace bastion {

// ═════════════════════════════════════════════════════════════
// ENTRY POINTS consumed by the host.
//
// game_init   : first load. Registers everything, loads models,
//               builds the scene. Throws std::runtime_error if a
//               model cannot be loaded.
// game_reload : hot reload into a fresh world. Session state is
//               carried over from `old_ecs` when it has any,
//               otherwise the scene is rebuilt from defaults.
//               Callbacks are always re-attached.
// ═════════════════════════════════════════════════════════════

void game_init(flecs::world &ecs, const GameConfig &config);

void game_reload(flecs::world &old_ecs, flecs::world &ecs);

// One host frame: systems, then collisions, then alarms.
void advance_frame(flecs::world &ecs, float dt);

// ─── Building blocks ──────────────────────────────────────
void register_components(flecs::world &ecs);

// Singletons, systems and observers; loads `config.model_paths`.
void init_world(flecs::world &ecs, const GameConfig &config);

// Light, camera and the level-1 base at the origin cell.
void scene_setup(flecs::world &ecs);

// Re-checks the enemy floor. Returns true if a spawn was scheduled.
bool reset_scene(flecs::world &ecs);

// Idempotent: fire alarms for turrets lacking one, collision callbacks
// on every enemy, spawner kick.
void reattach_callbacks(flecs::world &ecs);

} // namespace bastion

#endif // BASTION_GAME_H
