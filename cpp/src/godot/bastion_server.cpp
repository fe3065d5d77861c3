#include "bastion_server.h"
#include "../ecs/bastion_components.h"
#include "../ecs/combat.h"
#include "../ecs/config_loader.h"
#include "../ecs/game.h"
#include "../ecs/session_snapshot.h"
#include "scene_bridge.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/classes/input_event_mouse_button.hpp>
#include <godot_cpp/classes/input_event_mouse_motion.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <stdexcept>
#include <variant>

using namespace godot;

BastionServer::BastionServer() {}

BastionServer::~BastionServer() {}

void BastionServer::_bind_methods() {
  ClassDB::bind_method(D_METHOD("set_config_path", "path"),
                       &BastionServer::set_config_path);
  ClassDB::bind_method(D_METHOD("get_config_path"),
                       &BastionServer::get_config_path);
  ADD_PROPERTY(PropertyInfo(Variant::STRING, "config_path",
                            PROPERTY_HINT_FILE, "*.json"),
               "set_config_path", "get_config_path");

  ClassDB::bind_method(D_METHOD("get_resource_count"),
                       &BastionServer::get_resource_count);
  ClassDB::bind_method(D_METHOD("get_selected_cell"),
                       &BastionServer::get_selected_cell);
  ClassDB::bind_method(D_METHOD("get_enemy_count"),
                       &BastionServer::get_enemy_count);
  ClassDB::bind_method(D_METHOD("get_unit_level", "cell_x", "cell_y"),
                       &BastionServer::get_unit_level);

  ClassDB::bind_method(D_METHOD("get_transform_buffer"),
                       &BastionServer::get_transform_buffer);
  ClassDB::bind_method(D_METHOD("get_visible_count"),
                       &BastionServer::get_visible_count);
  ClassDB::bind_method(D_METHOD("get_debug_buffer"),
                       &BastionServer::get_debug_buffer);
  ClassDB::bind_method(D_METHOD("get_camera_position"),
                       &BastionServer::get_camera_position);

  ClassDB::bind_method(D_METHOD("export_session"),
                       &BastionServer::export_session);
  ClassDB::bind_method(D_METHOD("hot_reload"), &BastionServer::hot_reload);
}

void BastionServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_game();
}

// Model files are only registered by name in the core; check the
// actual files here where res:// paths resolve.
bool BastionServer::models_present() const {
  bool ok = true;
  for (const std::string &path : ecs->get<bastion::GameConfig>().model_paths) {
    String res_path = String("res://") + String(path.c_str());
    if (!FileAccess::file_exists(res_path)) {
      UtilityFunctions::printerr("[Bastion] Missing model file: ", res_path);
      ok = false;
    }
  }
  return ok;
}

void BastionServer::init_game() {
  UtilityFunctions::print("[Bastion] Initializing ECS...");

  bastion::GameConfig config;
  if (FileAccess::file_exists(config_path)) {
    String text = FileAccess::get_file_as_string(config_path);
    config = bastion::parse_game_config(text.utf8().get_data());
  } else {
    UtilityFunctions::print("[Bastion] No config at ", config_path,
                            ", using defaults");
  }

  ecs = std::make_unique<flecs::world>();
  try {
    bastion::game_init(*ecs, config);
  } catch (const std::runtime_error &e) {
    UtilityFunctions::printerr("[Bastion] Startup failed: ", e.what());
    active = false;
    return;
  }

  active = models_present();
  if (!active) {
    UtilityFunctions::printerr("[Bastion] Not running: model files missing.");
    return;
  }

  UtilityFunctions::print(
      "[Bastion] Ready, ",
      (int64_t)ecs->get<bastion::GameState>().resource_count, " resources.");
}

void BastionServer::_input(const Ref<InputEvent> &event) {
  Ref<InputEventMouseMotion> motion = event;
  if (motion.is_valid()) {
    Vector2 rel = motion->get_relative();
    pending_dx += rel.x;
    pending_dy += rel.y;
    return;
  }

  Ref<InputEventMouseButton> button = event;
  if (button.is_valid() && button->is_pressed()) {
    switch (button->get_button_index()) {
    case MOUSE_BUTTON_LEFT:
      pending_press[0] = true;
      break;
    case MOUSE_BUTTON_RIGHT:
      pending_press[1] = true;
      break;
    case MOUSE_BUTTON_MIDDLE:
      pending_press[2] = true;
      break;
    default:
      break;
    }
  }
}

void BastionServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint() || !active) {
    return;
  }

  bastion::InputState input;
  input.mouse_dx = pending_dx;
  input.mouse_dy = pending_dy;
  for (int i = 0; i < 3; i++)
    input.pressed[i] = pending_press[i];
  ecs->set<bastion::InputState>(input);

  pending_dx = 0.0f;
  pending_dy = 0.0f;
  for (int i = 0; i < 3; i++)
    pending_press[i] = false;

  bastion::advance_frame(*ecs, (float)delta);

  bastion::sync_mesh_transforms(*ecs, transform_buffer, visible_count);
  bastion::sync_debug_shapes(*ecs, debug_buffer);
}

// ═══════════════════════════════════════════════════════════════
// GDScript API
// ═══════════════════════════════════════════════════════════════

void BastionServer::set_config_path(const String &path) {
  config_path = path;
}

String BastionServer::get_config_path() const { return config_path; }

int BastionServer::get_resource_count() const {
  if (!active)
    return 0;
  return (int)ecs->get<bastion::GameState>().resource_count;
}

Vector2i BastionServer::get_selected_cell() const {
  if (!active)
    return Vector2i(0, 0);
  const bastion::GridPos &cell = ecs->get<bastion::GameState>().selected;
  return Vector2i(cell.x, cell.y);
}

int BastionServer::get_enemy_count() const {
  if (!active)
    return 0;
  return bastion::enemy_count(*ecs);
}

int BastionServer::get_unit_level(int cell_x, int cell_y) const {
  if (!active)
    return -1;
  const bastion::GameState &game = ecs->get<bastion::GameState>();
  auto it = game.grid.find(bastion::GridPos{cell_x, cell_y});
  if (it == game.grid.end())
    return -1;

  flecs::entity e = bastion::entity_ref(*ecs, it->second);
  const bastion::PlayerUnit *unit =
      e.is_alive() ? e.try_get<bastion::PlayerUnit>() : nullptr;
  if (unit == nullptr)
    return -1;
  if (const bastion::BaseUnit *base = std::get_if<bastion::BaseUnit>(unit))
    return (int)base->level;
  return (int)std::get<bastion::TurretUnit>(*unit).level;
}

PackedFloat32Array BastionServer::get_transform_buffer() const {
  return transform_buffer;
}

int BastionServer::get_visible_count() const { return visible_count; }

PackedFloat32Array BastionServer::get_debug_buffer() const {
  return debug_buffer;
}

Vector3 BastionServer::get_camera_position() const {
  if (!active)
    return Vector3();
  return bastion::camera_position(*ecs);
}

String BastionServer::export_session() const {
  if (!active)
    return String();
  std::optional<bastion::SessionSnapshot> snapshot =
      bastion::capture_session(*ecs);
  if (!snapshot)
    return String();
  return String(bastion::session_to_json(*snapshot).c_str());
}

bool BastionServer::hot_reload() {
  if (!ecs) {
    UtilityFunctions::printerr("[Bastion] Nothing to reload.");
    return false;
  }

  auto next = std::make_unique<flecs::world>();
  try {
    bastion::game_reload(*ecs, *next);
  } catch (const std::runtime_error &e) {
    UtilityFunctions::printerr("[Bastion] Reload failed, keeping old world: ",
                               e.what());
    return false;
  }

  ecs = std::move(next);
  active = models_present();
  UtilityFunctions::print("[Bastion] Reloaded, ",
                          (int64_t)bastion::enemy_count(*ecs),
                          " enemies carried over.");
  return active;
}
