#ifndef BASTION_ALARM_SCHEDULER_H
#define BASTION_ALARM_SCHEDULER_H

#include "bastion_components.h"
#include <flecs.h>

namespace bastion {

// ═════════════════════════════════════════════════════════════
// ALARMS: delay-triggered callbacks bound to an entity.
//
// Alarms live in the AlarmTable singleton and are advanced by
// tick_alarms() between frames, never inside ecs.progress().
// An alarm whose owner entity has been destroyed is released
// without firing. A null owner makes a world-level alarm.
// ═════════════════════════════════════════════════════════════

AlarmId schedule_alarm(flecs::world &ecs, flecs::entity owner, float delay,
                       AlarmCallback callback);

AlarmId schedule_repeating_alarm(flecs::world &ecs, flecs::entity owner,
                                 float interval, AlarmCallback callback);

// Returns false if the handle was already stale.
bool cancel_alarm(flecs::world &ecs, AlarmId id);

bool alarm_is_valid(const flecs::world &ecs, AlarmId id);

int pending_alarm_count(const flecs::world &ecs);

// Fires every alarm whose delay elapsed during `dt`, one at a time.
// Callbacks may schedule or cancel alarms.
void tick_alarms(flecs::world &ecs, float dt);

} // namespace bastion

#endif // BASTION_ALARM_SCHEDULER_H
