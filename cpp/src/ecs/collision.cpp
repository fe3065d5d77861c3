#include "collision.h"
#include <vector>

namespace bastion {

void assign_collision_callback(flecs::entity e, CollisionCallback callback) {
  e.set<CollisionHandler>({callback});
}

struct ColliderSample {
  flecs::entity_t id;
  Vec3 position;
  float radius;
  CollisionCallback callback; // nullptr if the entity only gets hit
};

struct PendingContact {
  flecs::entity_t self;
  CollisionCallback callback;
  std::vector<flecs::entity_t> others;
};

void process_collisions(flecs::world &ecs) {
  // 1. Snapshot collider positions (no structural changes during the scan)
  std::vector<ColliderSample> samples;
  ecs.each([&](flecs::entity e, const Transform &t, const Collider &c) {
    const CollisionHandler *handler = e.try_get<CollisionHandler>();
    samples.push_back({e.id(), t.position, c.radius,
                       handler ? handler->callback : nullptr});
  });

  // 2. Broad phase is O(N²): enemy counts stay in the tens
  std::vector<PendingContact> contacts;
  for (size_t i = 0; i < samples.size(); i++) {
    const ColliderSample &a = samples[i];
    if (a.callback == nullptr)
      continue;
    PendingContact contact{a.id, a.callback, {}};
    for (size_t j = 0; j < samples.size(); j++) {
      if (i == j)
        continue;
      const ColliderSample &b = samples[j];
      Vec3 d = b.position - a.position;
      float reach = a.radius + b.radius;
      if (dot(d, d) <= reach * reach)
        contact.others.push_back(b.id);
    }
    if (!contact.others.empty())
      contacts.push_back(std::move(contact));
  }

  // 3. Deliver one at a time, dropping anything destroyed along the way
  for (const PendingContact &contact : contacts) {
    flecs::entity self = entity_ref(ecs, contact.self);
    if (!self.is_alive())
      continue;

    std::vector<flecs::entity> others;
    others.reserve(contact.others.size());
    for (flecs::entity_t id : contact.others) {
      flecs::entity other = entity_ref(ecs, id);
      if (other.is_alive())
        others.push_back(other);
    }
    if (others.empty())
      continue;

    contact.callback(ecs, self, others);
  }
}

} // namespace bastion
