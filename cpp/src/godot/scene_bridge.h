#ifndef BASTION_SCENE_BRIDGE_H
#define BASTION_SCENE_BRIDGE_H

#include <flecs.h>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/vector3.hpp>

namespace bastion {

// ═══════════════════════════════════════════════════════════════
// SCENE BRIDGE: packs ECS render data into flat float arrays
// that GDScript hands to RenderingServer in one call each.
//
// The simulation is z-up; Godot is y-up. Every position and
// basis vector goes through to_godot() on the way out.
// ═══════════════════════════════════════════════════════════════
constexpr int FLOATS_PER_INSTANCE = 16;
constexpr int FLOATS_PER_SHAPE = 8;

// Instance custom data, slot [13]
enum InstanceKind : int { KIND_PROP = 0, KIND_BASE, KIND_TURRET, KIND_ENEMY };

// Every (Transform, Mesh) entity as one 16-float multimesh instance.
void sync_mesh_transforms(flecs::world &ecs,
                          godot::PackedFloat32Array &buffer_out,
                          int &visible_count_out);

// DebugDraw shapes: [kind, a.xyz, b.xyz, radius] per shape.
void sync_debug_shapes(flecs::world &ecs,
                       godot::PackedFloat32Array &buffer_out);

// First camera's position, or the origin if there is none.
godot::Vector3 camera_position(flecs::world &ecs);

} // namespace bastion

#endif // BASTION_SCENE_BRIDGE_H
