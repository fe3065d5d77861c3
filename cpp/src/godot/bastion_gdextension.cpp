// ═════════════════════════════════════════════════════════════════════════════
// BASTION: GDEXTENSION UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// The shared library compiles ONLY this file. The core unity build is pulled
// in here rather than linked, so component registration and every ecs.each<>
// in the Godot bridge resolve flecs::type_id<T> in the same TU.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Core (alarms, collisions, gameplay, entry points)
#include "../ecs/bastion_master.cpp"

// 2. Rendering Bridge (transform + debug shape packing)
#include "scene_bridge.cpp"

// 3. Node + registration
#include "bastion_server.cpp"
#include "register_types.cpp"
