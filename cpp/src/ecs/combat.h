#ifndef BASTION_COMBAT_H
#define BASTION_COMBAT_H

#include "bastion_components.h"
#include <flecs.h>
#include <vector>

namespace bastion {

// ═════════════════════════════════════════════════════════════
// SPAWNER: keeps at least GameConfig::min_enemy_count enemies
// alive through a self-limiting chain of one-shot alarms.
// ═════════════════════════════════════════════════════════════

int enemy_count(const flecs::world &ecs);

// Schedules one spawn alarm if the enemy count is below the floor and no
// spawn alarm is already pending. Returns true if it scheduled.
bool kick_spawner(flecs::world &ecs);

// Alarm callback: creates one enemy, re-arms itself while understocked.
void spawn_enemy(flecs::world &ecs, flecs::entity owner);

// Creates an enemy at `position` with its collider and collision callback.
flecs::entity create_enemy(flecs::world &ecs, const Point &position);

// Collision callback for enemies: first non-enemy contact destroys the enemy.
void enemy_collision(flecs::world &ecs, flecs::entity self,
                     const std::vector<flecs::entity> &others);

// ═════════════════════════════════════════════════════════════
// TURRETS
// ═════════════════════════════════════════════════════════════

// Repeating alarm callback: fire at a live target, else acquire one.
void fire_turret(flecs::world &ecs, flecs::entity turret);

// Default TargetSelector: nearest enemy within `range` cells (x-y plane).
flecs::entity_t select_nearest_enemy(flecs::world &ecs, flecs::entity turret,
                                     float range);

// Uniform float in [lo, hi) from the GameState generator.
float next_random(GameState &game, float lo, float hi);

} // namespace bastion

#endif // BASTION_COMBAT_H
