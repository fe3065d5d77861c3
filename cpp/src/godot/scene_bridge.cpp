#include "scene_bridge.h"
#include "../ecs/bastion_components.h"
#include <variant>

namespace bastion {

// ═══════════════════════════════════════════════════════════════
// BUFFER FORMAT CONTRACT
//
// 16 floats per instance, row-major 3×4 + 4 custom:
//
//   [0]  right.x   [1]  up.x   [2]  fwd.x   [3]  origin.x
//   [4]  right.y   [5]  up.y   [6]  fwd.y   [7]  origin.y
//   [8]  right.z   [9]  up.z   [10] fwd.z   [11] origin.z
//   [12] model_id  [13] kind   [14] level   [15] 0
//
// Basis columns are pre-multiplied by Transform::scale.
// ═══════════════════════════════════════════════════════════════

static Vec3 to_godot(const Vec3 &v) { return {v.x, v.z, -v.y}; }

static void write_instance(float *dest, int offset, const Transform &t,
                           float model_id, float kind, float level) {
  Vec3 fwd = normalized(t.forward);
  Vec3 up = normalized(t.up);
  Vec3 right = normalized(cross(fwd, up));
  if (dot(right, right) == 0.0f) {
    right = {1.0f, 0.0f, 0.0f};
    fwd = {0.0f, 1.0f, 0.0f};
    up = {0.0f, 0.0f, 1.0f};
  }

  Vec3 c0 = to_godot(right * t.scale.x);
  Vec3 c1 = to_godot(up * t.scale.z);
  Vec3 c2 = to_godot(fwd * t.scale.y);
  Vec3 origin = to_godot(t.position);

  dest[offset + 0] = c0.x;
  dest[offset + 1] = c1.x;
  dest[offset + 2] = c2.x;
  dest[offset + 3] = origin.x;

  dest[offset + 4] = c0.y;
  dest[offset + 5] = c1.y;
  dest[offset + 6] = c2.y;
  dest[offset + 7] = origin.y;

  dest[offset + 8] = c0.z;
  dest[offset + 9] = c1.z;
  dest[offset + 10] = c2.z;
  dest[offset + 11] = origin.z;

  dest[offset + 12] = model_id;
  dest[offset + 13] = kind;
  dest[offset + 14] = level;
  dest[offset + 15] = 0.0f;
}

void sync_mesh_transforms(flecs::world &ecs,
                          godot::PackedFloat32Array &buffer_out,
                          int &visible_count_out) {
  auto q = ecs.query_builder<const Transform, const Mesh>().build();

  int count = q.count();
  buffer_out.resize(count * FLOATS_PER_INSTANCE);
  float *dest = buffer_out.ptrw();

  int idx = 0;
  q.each([&](flecs::entity e, const Transform &t, const Mesh &m) {
    if (idx >= count)
      return;

    float kind = (float)KIND_PROP;
    float level = 0.0f;
    if (e.has<Enemy>()) {
      kind = (float)KIND_ENEMY;
    } else if (const PlayerUnit *unit = e.try_get<PlayerUnit>()) {
      if (const BaseUnit *base = std::get_if<BaseUnit>(unit)) {
        kind = (float)KIND_BASE;
        level = (float)base->level;
      } else if (const TurretUnit *turret = std::get_if<TurretUnit>(unit)) {
        kind = (float)KIND_TURRET;
        level = (float)turret->level;
      }
    }

    write_instance(dest, idx * FLOATS_PER_INSTANCE, t, (float)m.model_id, kind,
                   level);
    idx++;
  });

  visible_count_out = idx;
}

void sync_debug_shapes(flecs::world &ecs,
                       godot::PackedFloat32Array &buffer_out) {
  const DebugDraw &draw = ecs.get<DebugDraw>();
  buffer_out.resize((int64_t)draw.shapes.size() * FLOATS_PER_SHAPE);
  float *dest = buffer_out.ptrw();

  int offset = 0;
  for (const DebugShape &shape : draw.shapes) {
    Vec3 a = to_godot(shape.a);
    Vec3 b = to_godot(shape.b);
    dest[offset + 0] = (float)shape.kind;
    dest[offset + 1] = a.x;
    dest[offset + 2] = a.y;
    dest[offset + 3] = a.z;
    dest[offset + 4] = b.x;
    dest[offset + 5] = b.y;
    dest[offset + 6] = b.z;
    dest[offset + 7] = shape.radius;
    offset += FLOATS_PER_SHAPE;
  }
}

godot::Vector3 camera_position(flecs::world &ecs) {
  Vec3 found = {0.0f, 0.0f, 0.0f};
  bool done = false;
  ecs.each([&](const Camera &, const Transform &t) {
    if (done)
      return;
    found = to_godot(t.position);
    done = true;
  });
  return godot::Vector3(found.x, found.y, found.z);
}

} // namespace bastion
