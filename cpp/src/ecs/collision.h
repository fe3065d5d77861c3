#ifndef BASTION_COLLISION_H
#define BASTION_COLLISION_H

#include "bastion_components.h"
#include <flecs.h>

namespace bastion {

// Registers `callback` to receive overlaps of `e` with any other collider.
void assign_collision_callback(flecs::entity e, CollisionCallback callback);

// Sphere-sphere overlap pass over every (Transform, Collider) entity.
// Each entity with a CollisionHandler receives one callback listing all
// colliders it overlaps. Delivery is sequential; an entity destroyed by an
// earlier callback is neither notified nor reported as an "other".
void process_collisions(flecs::world &ecs);

} // namespace bastion

#endif // BASTION_COLLISION_H
