// ═════════════════════════════════════════════════════════════
// BASTION: HEADLESS TEST HARNESS
// ═════════════════════════════════════════════════════════════
// RAII fixture for doctest. Each TEST_CASE_FIXTURE gets a
// pristine flecs::world initialized exactly like the host does
// it, with a fixed seed. No Godot dependency.
// ═════════════════════════════════════════════════════════════
#pragma once
#include <doctest/doctest.h>
#include <cmath>
#include <variant>

constexpr uint64_t TEST_SEED = 42;

// ── RAII Test Fixture ───────────────────────────────────────
struct GameTestHarness {
  flecs::world ecs;

  GameTestHarness() {
    GameConfig config;
    config.rng_seed = TEST_SEED;
    game_init(ecs, config);
  }

  // Deterministic frame stepping, same order as the host
  void step(int frames = 1, float dt = 1.0f / 60.0f) {
    for (int i = 0; i < frames; i++)
      advance_frame(ecs, dt);
  }

  GameState &game() { return ecs.ensure<GameState>(); }
  const GameConfig &config() { return ecs.get<GameConfig>(); }

  // ── Input (consumed by the next step) ─────────────────────
  void move_mouse(float dx, float dy) {
    InputState &in = ecs.ensure<InputState>();
    in.mouse_dx += dx;
    in.mouse_dy += dy;
  }

  void press(int button) { ecs.ensure<InputState>().pressed[button] = true; }

  // Steers the cursor onto the center of `cell` and runs one frame.
  void select_cell(GridPos cell) {
    Vec3 delta = cell.cell_center() - game().cursor;
    float speed = config().mouse_speed;
    move_mouse(delta.x / speed, -delta.y / speed);
    step();
  }

  // ── World helpers ─────────────────────────────────────────
  // Cancels the pending spawn alarm so tests control the enemy count.
  void stop_spawner() {
    cancel_alarm(ecs, game().spawn_alarm);
    game().spawn_alarm = AlarmId{};
  }

  flecs::entity enemy_at(float x, float y, float z = 0.0f) {
    return create_enemy(ecs, {x, y, z});
  }

  flecs::entity unit_at(GridPos cell) {
    auto it = game().grid.find(cell);
    if (it == game().grid.end())
      return flecs::entity::null();
    return entity_ref(ecs, it->second);
  }

  // -1 if the cell is empty
  int level_at(GridPos cell) {
    flecs::entity e = unit_at(cell);
    if (!e.is_alive())
      return -1;
    const PlayerUnit &unit = e.get<PlayerUnit>();
    if (const BaseUnit *base = std::get_if<BaseUnit>(&unit))
      return (int)base->level;
    return (int)std::get<TurretUnit>(unit).level;
  }

  const std::vector<DamageEvent> &damage_events() {
    return ecs.get<DamageChannel>().events;
  }
};
