#include "bastion_systems.h"
#include "alarm_scheduler.h"
#include "combat.h"
#include "resources.h"
#include <variant>

namespace bastion {

// ═════════════════════════════════════════════════════════════
// CURSOR & SELECTION
// ═════════════════════════════════════════════════════════════

void update_cursor(GameState &game, const GameConfig &config, float mouse_dx,
                   float mouse_dy) {
  // Screen y grows downward, world y grows "forward"
  game.cursor += Vec3{mouse_dx * config.mouse_speed,
                      -mouse_dy * config.mouse_speed, 0.0f};
  game.cursor.x = clamp_extent(game.cursor.x, WORLD_LIMIT);
  game.cursor.y = clamp_extent(game.cursor.y, WORLD_LIMIT);
  game.selected = GridPos::from_world(game.cursor);
}

static void draw_selection(DebugDraw &draw, const GameState &game) {
  draw.shapes.push_back({DEBUG_SPHERE, game.cursor, game.cursor, 0.25f});

  // TODO: Replace with a wireframe cell outline once the host renders lines.
  Point min = game.selected.to_world();
  Point max = min + Vec3{CELL_SIZE, CELL_SIZE, CELL_SIZE};
  draw.shapes.push_back({DEBUG_BOX, min, max, 0.0f});
}

// ═════════════════════════════════════════════════════════════
// PLACEMENT & UPGRADES
//
// Both actions cost one resource. Every guard is checked before
// the first mutation, so a failed action leaves no trace.
// ═════════════════════════════════════════════════════════════

static void apply_base_scale(flecs::entity base, uint32_t level,
                             const GameConfig &config) {
  float s = (float)level * CELL_SIZE * config.base_scale_per_level;
  set_scale(base.ensure<Transform>(), {s, s, s});
}

flecs::entity create_base(flecs::world &ecs, GameState &game, GridPos cell,
                          uint32_t level) {
  const GameConfig &config = ecs.get<GameConfig>();

  flecs::entity base = instantiate_model(ecs, "cube");
  set_position(base.ensure<Transform>(), cell.cell_center());
  apply_base_scale(base, level, config);
  base.set<Collider>({config.unit_radius});
  base.set<PlayerUnit>(BaseUnit{level});

  // Add to the grid for future lookups.
  game.grid[cell] = base.id();
  return base;
}

flecs::entity create_turret(flecs::world &ecs, GameState &game, GridPos cell,
                            uint32_t level) {
  const GameConfig &config = ecs.get<GameConfig>();

  flecs::entity turret = instantiate_model(ecs, "cube");
  Transform &t = turret.ensure<Transform>();
  set_position(t, cell.cell_center());
  float s = CELL_SIZE * config.turret_scale;
  set_scale(t, {s, s, s});
  turret.set<Collider>({config.unit_radius});

  AlarmId shoot_alarm = schedule_repeating_alarm(
      ecs, turret, config.turret_fire_interval, fire_turret);
  turret.set<PlayerUnit>(TurretUnit{level, shoot_alarm, 0});

  game.grid[cell] = turret.id();
  return turret;
}

flecs::entity place_turret(flecs::world &ecs, GameState &game) {
  if (game.resource_count == 0)
    return flecs::entity::null();
  if (game.grid.find(game.selected) != game.grid.end())
    return flecs::entity::null();

  flecs::entity turret = create_turret(ecs, game, game.selected, 1);
  game.resource_count--;

  ecs_trace("bastion: turret #%u placed at (%d, %d), %u resources left",
            (unsigned)turret.id(), game.selected.x, game.selected.y,
            game.resource_count);
  return turret;
}

struct UpgradeVisitor {
  flecs::entity unit;
  const GameConfig &config;

  void operator()(BaseUnit &base) const {
    base.level++;
    apply_base_scale(unit, base.level, config);
  }

  // Turret levels feed TurretUnit::level into damage events only.
  void operator()(TurretUnit &turret) const { turret.level++; }
};

bool upgrade_unit(flecs::world &ecs, GameState &game) {
  if (game.resource_count == 0)
    return false;
  auto cell = game.grid.find(game.selected);
  if (cell == game.grid.end())
    return false;

  flecs::entity unit_entity = entity_ref(ecs, cell->second);
  PlayerUnit *unit =
      unit_entity.is_alive() ? unit_entity.try_get_mut<PlayerUnit>() : nullptr;
  if (unit == nullptr) {
    // The grid only ever points at player units.
    ecs_abort(ECS_INVALID_OPERATION, "grid cell (%d, %d) has no PlayerUnit",
              game.selected.x, game.selected.y);
  }

  std::visit(UpgradeVisitor{unit_entity, ecs.get<GameConfig>()}, *unit);
  game.resource_count--;
  return true;
}

// ═════════════════════════════════════════════════════════════
// CAMERA FOLLOW
//
// xy chases the selected cell; z backs away the further the
// selection is from the base (Manhattan distance in cells).
// ═════════════════════════════════════════════════════════════

void follow_camera(flecs::world &ecs, const GameState &game, float dt) {
  const GameConfig &config = ecs.get<GameConfig>();
  Point target = game.selected.cell_center();
  float target_z = config.camera_base_offset +
                   (float)(BASE_CELL - game.selected).manhattan() *
                       config.camera_offset_per_cursor_offset;
  float xy_frac = config.camera_xy_move_speed * dt;
  float z_frac = config.camera_z_move_speed * dt;

  ecs.each([&](const Camera &, Transform &t) {
    t.position.x = lerp(t.position.x, target.x, xy_frac);
    t.position.y = lerp(t.position.y, target.y, xy_frac);
    t.position.z = lerp(t.position.z, target_z, z_frac);
    look_at(t, target, {0.0f, 1.0f, 0.0f});
  });
}

void register_manager_systems(flecs::world &ecs) {

  // ── System 1: ManagerUpdate ─────────────────────────────────
  // Immediate: a turret placed this tick must be upgradable in the
  // same tick, and its alarm must exist before the alarm pass.
  ecs.system<GameState>("ManagerUpdate")
      .immediate()
      .each([](flecs::iter &it, size_t, GameState &game) {
        flecs::world w = it.world();
        float dt = it.delta_time();
        const GameConfig &config = w.get<GameConfig>();
        const InputState &input = w.get<InputState>();

        w.defer_suspend();
        update_cursor(game, config, input.mouse_dx, input.mouse_dy);
        draw_selection(w.ensure<DebugDraw>(), game);

        if (input.pressed[0])
          place_turret(w, game);
        if (input.pressed[1])
          upgrade_unit(w, game);

        follow_camera(w, game, dt);
        w.defer_resume();
      });
}

// ═════════════════════════════════════════════════════════════
// ENEMY AI: straight-line approach to the base cell. No
// pathfinding; movement stays in the x-y plane.
// ═════════════════════════════════════════════════════════════

void register_enemy_systems(flecs::world &ecs) {
  ecs.system<Transform>("EnemyUpdate")
      .with<Enemy>()
      .each([](flecs::entity e, Transform &t) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;

        const GameConfig &config = e.world().get<GameConfig>();
        Point target = BASE_CELL.cell_center();
        Vec3 to_base = {target.x - t.position.x, target.y - t.position.y,
                        0.0f};
        Vec3 direction = normalized(to_base);
        translate(t, direction * (config.enemy_move_speed * dt));
      });
}

// ═════════════════════════════════════════════════════════════
// LIFECYCLE OBSERVERS
//
// Back-references (grid cells, shoot alarms, turret targets) are
// non-owning; these keep them from outliving what they name.
// ═════════════════════════════════════════════════════════════

void register_unit_observers(flecs::world &ecs) {

  ecs.observer<const PlayerUnit>("UnitRelease")
      .event(flecs::OnRemove)
      .each([](flecs::entity e, const PlayerUnit &unit) {
        flecs::world w = e.world();
        if (ecs_is_fini(w.c_ptr()))
          return;

        if (const TurretUnit *turret = std::get_if<TurretUnit>(&unit))
          cancel_alarm(w, turret->shoot_alarm);

        GameState *game = w.try_get_mut<GameState>();
        if (game == nullptr)
          return;
        for (auto it = game->grid.begin(); it != game->grid.end(); ++it) {
          if (it->second == e.id()) {
            game->grid.erase(it);
            break;
          }
        }
      });

  ecs.observer("TargetRelease")
      .with<Enemy>()
      .event(flecs::OnRemove)
      .each([](flecs::entity e) {
        flecs::world w = e.world();
        if (ecs_is_fini(w.c_ptr()))
          return;

        flecs::entity_t gone = e.id();
        w.each([gone](PlayerUnit &unit) {
          TurretUnit *turret = std::get_if<TurretUnit>(&unit);
          if (turret != nullptr && turret->target == gone)
            turret->target = 0;
        });
      });
}

} // namespace bastion
