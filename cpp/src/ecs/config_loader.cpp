#include "config_loader.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bastion {

static void apply_config(const json &j, GameConfig &c) {
  if (j.contains("input")) {
    auto &in = j["input"];
    c.mouse_speed = in.value("mouse_speed", c.mouse_speed);
  }

  if (j.contains("units")) {
    auto &u = j["units"];
    c.starting_resources = u.value("starting_resources", c.starting_resources);
    c.base_scale_per_level =
        u.value("base_scale_per_level", c.base_scale_per_level);
    c.turret_scale = u.value("turret_scale", c.turret_scale);
    c.turret_fire_interval =
        u.value("turret_fire_interval", c.turret_fire_interval);
    c.turret_range = u.value("turret_range", c.turret_range);
    c.unit_radius = u.value("unit_radius", c.unit_radius);
  }

  if (j.contains("camera")) {
    auto &cam = j["camera"];
    c.camera_base_offset = cam.value("base_offset", c.camera_base_offset);
    c.camera_offset_per_cursor_offset = cam.value(
        "offset_per_cursor_offset", c.camera_offset_per_cursor_offset);
    c.camera_xy_move_speed = cam.value("xy_move_speed", c.camera_xy_move_speed);
    c.camera_z_move_speed = cam.value("z_move_speed", c.camera_z_move_speed);
  }

  if (j.contains("enemies")) {
    auto &e = j["enemies"];
    c.min_enemy_count = e.value("min_count", c.min_enemy_count);
    c.enemy_spawn_delay = e.value("spawn_delay", c.enemy_spawn_delay);
    c.enemy_move_speed = e.value("move_speed", c.enemy_move_speed);
    c.enemy_radius = e.value("radius", c.enemy_radius);
    if (e.contains("spawn_x")) {
      c.spawn_x_min = e["spawn_x"].at(0).get<float>();
      c.spawn_x_max = e["spawn_x"].at(1).get<float>();
    }
    if (e.contains("spawn_y")) {
      c.spawn_y_min = e["spawn_y"].at(0).get<float>();
      c.spawn_y_max = e["spawn_y"].at(1).get<float>();
    }
  }

  c.rng_seed = j.value("seed", c.rng_seed);
  if (j.contains("models"))
    c.model_paths = j["models"].get<std::vector<std::string>>();
}

GameConfig parse_game_config(const std::string &text) {
  GameConfig config;
  try {
    json j = json::parse(text);
    GameConfig parsed;
    apply_config(j, parsed);
    config = parsed;
  } catch (json::exception &e) {
    ecs_err("bastion: invalid game config: %s", e.what());
  }
  return config;
}

} // namespace bastion
