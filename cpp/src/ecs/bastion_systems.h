#ifndef BASTION_SYSTEMS_H
#define BASTION_SYSTEMS_H

#include "bastion_components.h"
#include <flecs.h>

namespace bastion {

// Input, placement/upgrade and camera follow ("ManagerUpdate")
void register_manager_systems(flecs::world &ecs);

// Enemy steering toward the base ("EnemyUpdate")
void register_enemy_systems(flecs::world &ecs);

// Turret alarm release, grid cleanup, stale target clearing
void register_unit_observers(flecs::world &ecs);

// ─── Unit construction ────────────────────────────────────
// Both register `cell` in the grid; neither touches resource_count.
flecs::entity create_base(flecs::world &ecs, GameState &game, GridPos cell,
                          uint32_t level);

// Also arms the turret's repeating fire alarm.
flecs::entity create_turret(flecs::world &ecs, GameState &game, GridPos cell,
                            uint32_t level);

// ─── ManagerUpdate building blocks ─────────────────────────
void update_cursor(GameState &game, const GameConfig &config, float mouse_dx,
                   float mouse_dy);

// Button 0. Returns the new turret, or a null entity if a guard failed.
flecs::entity place_turret(flecs::world &ecs, GameState &game);

// Button 1. Returns true if a unit was upgraded.
bool upgrade_unit(flecs::world &ecs, GameState &game);

void follow_camera(flecs::world &ecs, const GameState &game, float dt);

} // namespace bastion

#endif // BASTION_SYSTEMS_H
