#include "resources.h"
#include <stdexcept>

namespace bastion {

static std::string model_stem(const std::string &path) {
  size_t slash = path.find_last_of("/\\");
  std::string file =
      slash == std::string::npos ? path : path.substr(slash + 1);
  size_t dot = file.find_last_of('.');
  return dot == std::string::npos ? file : file.substr(0, dot);
}

void load_resource_file(flecs::world &ecs, const std::string &path) {
  std::string name = model_stem(path);
  if (name.empty())
    throw std::runtime_error("Invalid model path: '" + path + "'");

  ModelRegistry &models = ecs.ensure<ModelRegistry>();
  for (size_t i = 0; i < models.names.size(); i++) {
    if (models.names[i] != name)
      continue;
    if (models.paths[i] == path)
      return;
    throw std::runtime_error("Model '" + name + "' already loaded from " +
                             models.paths[i]);
  }

  models.names.push_back(name);
  models.paths.push_back(path);
  ecs_trace("bastion: loaded model '%s' from %s", name.c_str(), path.c_str());
}

uint32_t find_model(const flecs::world &ecs, const std::string &name) {
  const ModelRegistry *models = ecs.try_get<ModelRegistry>();
  if (models != nullptr) {
    for (size_t i = 0; i < models->names.size(); i++) {
      if (models->names[i] == name)
        return (uint32_t)i;
    }
  }
  throw std::runtime_error("Unknown model: '" + name + "'");
}

flecs::entity instantiate_model(flecs::world &ecs, const std::string &name) {
  uint32_t model_id = find_model(ecs, name);
  return ecs.entity().set<Transform>({}).set<Mesh>({model_id});
}

} // namespace bastion
