#include "game.h"
#include "alarm_scheduler.h"
#include "bastion_systems.h"
#include "collision.h"
#include "combat.h"
#include "resources.h"
#include "session_snapshot.h"
#include <variant>

namespace bastion {

void register_components(flecs::world &ecs) {
  // Host-side components
  ecs.component<Transform>("Transform");
  ecs.component<Mesh>("Mesh");
  ecs.component<Camera>("Camera");
  ecs.component<Light>("Light");
  ecs.component<Collider>("Collider");
  ecs.component<CollisionHandler>("CollisionHandler");

  // Gameplay components
  ecs.component<PlayerUnit>("PlayerUnit");
  ecs.component<Enemy>("Enemy");
  ecs.component<Bullet>("Bullet");

  // Singletons
  ecs.component<GameConfig>("GameConfig");
  ecs.component<GameState>("GameState");
  ecs.component<AlarmTable>("AlarmTable");
  ecs.component<InputState>("InputState");
  ecs.component<DebugDraw>("DebugDraw");
  ecs.component<DamageChannel>("DamageChannel");
  ecs.component<TargetAcquisition>("TargetAcquisition");
  ecs.component<ModelRegistry>("ModelRegistry");
  ecs.component<EnemyIndex>("EnemyIndex");
}

void init_world(flecs::world &ecs, const GameConfig &config) {
  register_components(ecs);

  ecs.set<GameConfig>(config);
  {
    GameState game;
    game.resource_count = config.starting_resources;
    game.rng_state = config.rng_seed;
    ecs.set<GameState>(game);
  }
  ecs.set<AlarmTable>({});
  ecs.set<InputState>({});
  ecs.set<DebugDraw>({});
  ecs.set<DamageChannel>({});
  ecs.set<TargetAcquisition>({select_nearest_enemy});
  ecs.set<ModelRegistry>({});
  ecs.set<EnemyIndex>(
      {ecs.query_builder<const Transform>().with<Enemy>().cached().build()});

  // Function pointers do not survive a reload: always register fresh.
  register_manager_systems(ecs);
  register_enemy_systems(ecs);
  register_unit_observers(ecs);

  for (const std::string &path : config.model_paths)
    load_resource_file(ecs, path);

  // Systems instantiate these by name; fail at startup, not mid-frame.
  find_model(ecs, "cube");
  find_model(ecs, "sphere");
}

// Light and camera. Not part of the session; rebuilt on every load.
static void create_scene_furniture(flecs::world &ecs) {
  // Create light.
  ecs.entity()
      .set<Transform>({{0.0f, 0.0f, 10.0f}})
      .set<Light>({50.0f, 1.0f});

  // Create camera.
  Transform camera_transform;
  set_position(camera_transform, {0.0f, 0.0f, 30.0f});
  look_at(camera_transform, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
  ecs.entity().set<Transform>(camera_transform).set<Camera>({60.0f});
}

void scene_setup(flecs::world &ecs) {
  create_scene_furniture(ecs);

  // Setup main base.
  create_base(ecs, ecs.ensure<GameState>(), BASE_CELL, 1);

  reset_scene(ecs);
}

bool reset_scene(flecs::world &ecs) { return kick_spawner(ecs); }

void reattach_callbacks(flecs::world &ecs) {
  const GameConfig &config = ecs.get<GameConfig>();

  // Collect first, write back after iteration.
  std::vector<flecs::entity_t> unarmed;
  ecs.each([&](flecs::entity e, const PlayerUnit &unit) {
    const TurretUnit *turret = std::get_if<TurretUnit>(&unit);
    if (turret != nullptr && !alarm_is_valid(ecs, turret->shoot_alarm))
      unarmed.push_back(e.id());
  });
  for (flecs::entity_t id : unarmed) {
    flecs::entity e = entity_ref(ecs, id);
    AlarmId alarm = schedule_repeating_alarm(
        ecs, e, config.turret_fire_interval, fire_turret);
    std::get<TurretUnit>(e.ensure<PlayerUnit>()).shoot_alarm = alarm;
  }

  std::vector<flecs::entity_t> enemies;
  auto q = ecs.query_builder<>().with<Enemy>().build();
  q.each([&](flecs::entity e) { enemies.push_back(e.id()); });
  for (flecs::entity_t id : enemies)
    assign_collision_callback(entity_ref(ecs, id), enemy_collision);

  kick_spawner(ecs);
}

void game_init(flecs::world &ecs, const GameConfig &config) {
  ecs_trace("bastion: initializing");
  init_world(ecs, config);
  scene_setup(ecs);
  ecs_trace("bastion: ready, %d alarms pending", pending_alarm_count(ecs));
}

void game_reload(flecs::world &old_ecs, flecs::world &ecs) {
  const GameConfig *old_config = old_ecs.try_get<GameConfig>();
  GameConfig config = old_config ? *old_config : GameConfig{};

  std::optional<SessionSnapshot> snapshot = capture_session(old_ecs);
  init_world(ecs, config);

  if (snapshot) {
    create_scene_furniture(ecs);
    restore_session(ecs, *snapshot);
  } else {
    ecs_warn("bastion: no session to carry over, rebuilding defaults");
    scene_setup(ecs);
  }

  reattach_callbacks(ecs);
}

void advance_frame(flecs::world &ecs, float dt) {
  ecs.ensure<DebugDraw>().shapes.clear();
  ecs.ensure<DamageChannel>().events.clear();

  ecs.progress(dt);
  process_collisions(ecs);
  tick_alarms(ecs, dt);

  ecs.set<InputState>({});
}

} // namespace bastion
