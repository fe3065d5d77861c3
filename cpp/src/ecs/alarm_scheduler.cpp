#include "alarm_scheduler.h"
#include <vector>

namespace bastion {

static AlarmId alloc_alarm(flecs::world &ecs, flecs::entity owner, float delay,
                           float interval, AlarmCallback callback) {
  AlarmTable &table = ecs.ensure<AlarmTable>();

  uint32_t index;
  if (!table.free_slots.empty()) {
    index = table.free_slots.back();
    table.free_slots.pop_back();
  } else {
    index = (uint32_t)table.slots.size();
    table.slots.push_back(AlarmSlot{});
  }

  AlarmSlot &slot = table.slots[index];
  slot.callback = callback;
  slot.owner = owner.id();
  slot.remaining = delay;
  slot.interval = interval;
  slot.active = true;
  return {index, slot.generation};
}

// Bumps the generation so every outstanding handle goes stale.
static void release_alarm(AlarmTable &table, uint32_t index) {
  AlarmSlot &slot = table.slots[index];
  slot.active = false;
  slot.callback = nullptr;
  slot.owner = 0;
  slot.generation++;
  if (slot.generation == 0)
    slot.generation = 1; // 0 is reserved for the null handle
  table.free_slots.push_back(index);
}

AlarmId schedule_alarm(flecs::world &ecs, flecs::entity owner, float delay,
                       AlarmCallback callback) {
  return alloc_alarm(ecs, owner, delay, 0.0f, callback);
}

AlarmId schedule_repeating_alarm(flecs::world &ecs, flecs::entity owner,
                                 float interval, AlarmCallback callback) {
  return alloc_alarm(ecs, owner, interval, interval, callback);
}

bool alarm_is_valid(const flecs::world &ecs, AlarmId id) {
  if (id.generation == 0)
    return false;
  const AlarmTable *table = ecs.try_get<AlarmTable>();
  if (table == nullptr || id.index >= table->slots.size())
    return false;
  const AlarmSlot &slot = table->slots[id.index];
  return slot.active && slot.generation == id.generation;
}

bool cancel_alarm(flecs::world &ecs, AlarmId id) {
  if (!alarm_is_valid(ecs, id))
    return false;
  release_alarm(ecs.ensure<AlarmTable>(), id.index);
  return true;
}

int pending_alarm_count(const flecs::world &ecs) {
  const AlarmTable *table = ecs.try_get<AlarmTable>();
  if (table == nullptr)
    return 0;
  int count = 0;
  for (const AlarmSlot &slot : table->slots) {
    if (slot.active)
      count++;
  }
  return count;
}

void tick_alarms(flecs::world &ecs, float dt) {
  std::vector<AlarmId> due;
  {
    AlarmTable &table = ecs.ensure<AlarmTable>();
    for (uint32_t i = 0; i < (uint32_t)table.slots.size(); i++) {
      AlarmSlot &slot = table.slots[i];
      if (!slot.active)
        continue;
      slot.remaining -= dt;
      if (slot.remaining <= 0.0f)
        due.push_back({i, slot.generation});
    }
  }

  // Callbacks may schedule (growing the slot vector) or cancel alarms, so
  // every due handle is re-validated and its slot re-fetched before firing.
  for (const AlarmId &id : due) {
    if (!alarm_is_valid(ecs, id))
      continue;

    AlarmTable &table = ecs.ensure<AlarmTable>();
    AlarmSlot &slot = table.slots[id.index];
    AlarmCallback callback = slot.callback;

    flecs::entity owner = flecs::entity::null();
    if (slot.owner != 0) {
      owner = entity_ref(ecs, slot.owner);
      if (!owner.is_alive()) {
        release_alarm(table, id.index);
        continue;
      }
    }

    if (slot.interval > 0.0f) {
      // At most one fire per tick; the fractional remainder carries over.
      slot.remaining += slot.interval;
      if (slot.remaining <= 0.0f)
        slot.remaining = slot.interval;
    } else {
      release_alarm(table, id.index);
    }

    if (callback != nullptr)
      callback(ecs, owner);
  }
}

} // namespace bastion
