// ═════════════════════════════════════════════════════════════════════════════
// BASTION: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file for the core library. Flecs caches component IDs in
// static template variables (flecs::type_id<T>::id); one TU keeps every
// component registration and every query on the same IDs.
//
// ORDER MATTERS: host services first, then gameplay, then entry points.
// Godot-free: ../godot/bastion_gdextension.cpp includes this file.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Host services (alarms, collisions, models)
#include "alarm_scheduler.cpp"
#include "collision.cpp"
#include "resources.cpp"

// 2. Gameplay (spawner, combat, per-frame systems)
#include "combat.cpp"
#include "bastion_systems.cpp"

// 3. Data (JSON config + session snapshots)
#include "config_loader.cpp"
#include "session_snapshot.cpp"

// 4. Entry points (init, reload, frame driver)
#include "game.cpp"
