#include "combat.h"
#include "alarm_scheduler.h"
#include "collision.h"
#include "resources.h"
#include <variant>

namespace bastion {

// splitmix64: deterministic under a fixed GameConfig::rng_seed
float next_random(GameState &game, float lo, float hi) {
  uint64_t z = (game.rng_state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  z ^= z >> 31;
  float unit = (float)(z >> 40) / (float)(1ULL << 24); // [0, 1)
  return lo + (hi - lo) * unit;
}

int enemy_count(const flecs::world &ecs) { return ecs.count<Enemy>(); }

bool kick_spawner(flecs::world &ecs) {
  const GameConfig &config = ecs.get<GameConfig>();
  GameState &game = ecs.ensure<GameState>();

  if (enemy_count(ecs) >= config.min_enemy_count)
    return false;
  if (alarm_is_valid(ecs, game.spawn_alarm))
    return false; // chain already running

  game.spawn_alarm = schedule_alarm(ecs, flecs::entity::null(),
                                    config.enemy_spawn_delay, spawn_enemy);
  return true;
}

flecs::entity create_enemy(flecs::world &ecs, const Point &position) {
  const GameConfig &config = ecs.get<GameConfig>();
  flecs::entity enemy = instantiate_model(ecs, "sphere");
  Transform &t = enemy.ensure<Transform>();
  set_position(t, position);
  enemy.add<Enemy>().set<Collider>({config.enemy_radius});
  assign_collision_callback(enemy, enemy_collision);
  return enemy;
}

void spawn_enemy(flecs::world &ecs, flecs::entity) {
  const GameConfig &config = ecs.get<GameConfig>();
  GameState &game = ecs.ensure<GameState>();

  float x = next_random(game, config.spawn_x_min, config.spawn_x_max);
  float y = next_random(game, config.spawn_y_min, config.spawn_y_max);
  flecs::entity enemy = create_enemy(ecs, {x * CELL_SIZE, y * CELL_SIZE, 0.0f});

  ecs_trace("bastion: spawned enemy #%u at (%.1f, %.1f), %d alive",
            (unsigned)enemy.id(), (double)(x * CELL_SIZE),
            (double)(y * CELL_SIZE), enemy_count(ecs));

  // The firing alarm released itself, so its handle is already stale.
  kick_spawner(ecs);
}

void enemy_collision(flecs::world &ecs, flecs::entity self,
                     const std::vector<flecs::entity> &others) {
  for (flecs::entity other : others) {
    // No enemy-enemy interaction
    if (other.has<Enemy>())
      continue;

    // Unit damage is not modelled yet; the event is the hook for it.
    ecs.ensure<DamageChannel>().events.push_back({self.id(), other.id(), 1});

    self.destruct();
    kick_spawner(ecs);
    return; // first match wins
  }
}

flecs::entity_t select_nearest_enemy(flecs::world &ecs, flecs::entity turret,
                                     float range) {
  const Transform *tt = turret.try_get<Transform>();
  if (tt == nullptr)
    return 0;

  float best_dist_sq = (range * CELL_SIZE) * (range * CELL_SIZE);
  flecs::entity_t best = 0;
  ecs.get<EnemyIndex>().query.each([&](flecs::entity e, const Transform &t) {
    float dx = t.position.x - tt->position.x;
    float dy = t.position.y - tt->position.y;
    float d2 = dx * dx + dy * dy;
    if (d2 <= best_dist_sq) {
      best_dist_sq = d2;
      best = e.id();
    }
  });
  return best;
}

void fire_turret(flecs::world &ecs, flecs::entity turret) {
  PlayerUnit *unit = turret.try_get_mut<PlayerUnit>();
  if (unit == nullptr)
    return;
  TurretUnit *t = std::get_if<TurretUnit>(unit);
  if (t == nullptr)
    return;

  if (t->target != 0) {
    flecs::entity target = entity_ref(ecs, t->target);
    if (target.is_alive() && target.has<Enemy>()) {
      // Damage resolution is left to whoever drains the channel.
      ecs.ensure<DamageChannel>().events.push_back(
          {turret.id(), target.id(), t->level});
      return;
    }
    t->target = 0;
  }

  const TargetAcquisition &acquisition = ecs.get<TargetAcquisition>();
  if (acquisition.select != nullptr)
    t->target =
        acquisition.select(ecs, turret, ecs.get<GameConfig>().turret_range);
}

} // namespace bastion
