#ifndef BASTION_SERVER_H
#define BASTION_SERVER_H

#include <flecs.h>
#include <godot_cpp/classes/input_event.hpp>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/string.hpp>
#include <godot_cpp/variant/vector2i.hpp>
#include <godot_cpp/variant/vector3.hpp>
#include <memory>

namespace godot {

// Hosts the bastion world: forwards mouse input, ticks one frame per
// _process, and exposes packed render buffers to GDScript.
class BastionServer : public Node {
  GDCLASS(BastionServer, Node)

private:
  // Swapped wholesale by hot_reload().
  std::unique_ptr<flecs::world> ecs;
  bool active = false;

  String config_path = "res://data/bastion.json";

  // Input accumulated between frames
  float pending_dx = 0.0f;
  float pending_dy = 0.0f;
  bool pending_press[3] = {false, false, false};

  PackedFloat32Array transform_buffer;
  int visible_count = 0;
  PackedFloat32Array debug_buffer;

  bool models_present() const;

protected:
  static void _bind_methods();

public:
  BastionServer();
  ~BastionServer();

  void _ready() override;
  void _input(const Ref<InputEvent> &event) override;
  void _process(double delta) override;

  void init_game();

  // --- GDScript API ---
  void set_config_path(const String &path);
  String get_config_path() const;

  int get_resource_count() const;
  Vector2i get_selected_cell() const;
  int get_enemy_count() const;
  // -1 if the cell is empty.
  int get_unit_level(int cell_x, int cell_y) const;

  PackedFloat32Array get_transform_buffer() const;
  int get_visible_count() const;
  PackedFloat32Array get_debug_buffer() const;
  Vector3 get_camera_position() const;

  String export_session() const;
  bool hot_reload();
};

} // namespace godot

#endif // BASTION_SERVER_H
