// ═════════════════════════════════════════════════════════════
// BASTION: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary. No Godot dependency.
// Build: cmake --build build --target bastion_tests
// Run:   ctest --test-dir build
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

// ── Flecs ───────────────────────────────────────────────────
#include <flecs.h>

// ── Pure C++ game code (Godot-free) ─────────────────────────
#include "../src/ecs/alarm_scheduler.h"
#include "../src/ecs/bastion_components.h"
#include "../src/ecs/bastion_systems.h"
#include "../src/ecs/collision.h"
#include "../src/ecs/combat.h"
#include "../src/ecs/config_loader.h"
#include "../src/ecs/game.h"
#include "../src/ecs/resources.h"
#include "../src/ecs/session_snapshot.h"

// Include the core implementation (single TU, same as the extension)
#include "../src/ecs/bastion_master.cpp"

using namespace bastion;

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_grid.cpp"
#include "test_alarms.cpp"
#include "test_player.cpp"
#include "test_enemies.cpp"
#include "test_turrets.cpp"
#include "test_data.cpp"
#include "test_perf.cpp"
