#ifndef BASTION_RESOURCES_H
#define BASTION_RESOURCES_H

#include "bastion_components.h"
#include <flecs.h>
#include <string>

namespace bastion {

// Registers the model file at `path` under its file stem ("meshes/cube.dae"
// becomes "cube"). Throws std::runtime_error for paths without a stem.
// Loading the same path twice is a no-op.
void load_resource_file(flecs::world &ecs, const std::string &path);

// Returns the model id for `name`; throws std::runtime_error if unknown.
uint32_t find_model(const flecs::world &ecs, const std::string &name);

// Creates an entity carrying a Transform and a Mesh of model `name`.
flecs::entity instantiate_model(flecs::world &ecs, const std::string &name);

} // namespace bastion

#endif // BASTION_RESOURCES_H
