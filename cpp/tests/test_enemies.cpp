// ═════════════════════════════════════════════════════════════
// Category 4: ENEMIES: Spawner, Steering, Collisions
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: spawner fills up to the floor, then stops") {
  // 0.5 is exact in binary: spawns land on t = 1, 2, 3, 4, 5
  step(3, 0.5f);
  CHECK(enemy_count(ecs) == 1);

  step(7, 0.5f);
  CHECK(enemy_count(ecs) == 5);
  CHECK_FALSE(alarm_is_valid(ecs, game().spawn_alarm));

  step(10, 0.5f);
  CHECK(enemy_count(ecs) == 5);
  CHECK(pending_alarm_count(ecs) == 0);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: spawned enemies land inside the spawn band") {
  step(10, 0.5f);
  REQUIRE(enemy_count(ecs) == 5);

  auto q = ecs.query_builder<const Transform>().with<Enemy>().build();
  q.each([](const Transform &t) {
    // Up to 4s of travel at 1 unit/s toward the base since spawning
    CHECK(t.position.x >= -50.0f - 4.0f);
    CHECK(t.position.x <= 50.0f + 4.0f);
    CHECK(t.position.y >= 50.0f - 4.0f);
    CHECK(t.position.y <= 75.0f);
    CHECK(t.position.z == 0.0f);
  });
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: direct spawn respects the band and re-arms") {
  stop_spawner();
  spawn_enemy(ecs, flecs::entity::null());
  CHECK(enemy_count(ecs) == 1);
  CHECK(alarm_is_valid(ecs, game().spawn_alarm));

  auto q = ecs.query_builder<const Transform>().with<Enemy>().build();
  q.each([](const Transform &t) {
    CHECK(t.position.x >= -50.0f);
    CHECK(t.position.x < 50.0f);
    CHECK(t.position.y >= 50.0f);
    CHECK(t.position.y < 75.0f);
  });

  // A second call joins the running chain instead of forking it
  int before = pending_alarm_count(ecs);
  spawn_enemy(ecs, flecs::entity::null());
  CHECK(pending_alarm_count(ecs) == before);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: same seed, same spawn positions") {
  GameTestHarness twin;
  step(4, 0.5f);
  twin.step(4, 0.5f);
  REQUIRE(enemy_count(ecs) == 2);
  REQUIRE(enemy_count(twin.ecs) == 2);

  std::vector<float> xs, twin_xs;
  ecs.query_builder<const Transform>().with<Enemy>().build().each(
      [&](const Transform &t) { xs.push_back(t.position.x); });
  twin.ecs.query_builder<const Transform>().with<Enemy>().build().each(
      [&](const Transform &t) { twin_xs.push_back(t.position.x); });
  CHECK(xs == twin_xs);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: kick with four enemies schedules exactly one spawn") {
  stop_spawner();
  for (int i = 0; i < 4; i++)
    enemy_at(-40.0f + 20.0f * (float)i, 60.0f);
  int before = pending_alarm_count(ecs);

  CHECK(kick_spawner(ecs));
  CHECK_FALSE(kick_spawner(ecs));
  CHECK_FALSE(reset_scene(ecs));
  CHECK(pending_alarm_count(ecs) == before + 1);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: kick at the floor schedules nothing") {
  stop_spawner();
  for (int i = 0; i < 5; i++)
    enemy_at(-40.0f + 20.0f * (float)i, 60.0f);

  CHECK_FALSE(kick_spawner(ecs));
  CHECK_FALSE(alarm_is_valid(ecs, game().spawn_alarm));
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemies steer toward the base in the ground plane") {
  stop_spawner();
  flecs::entity enemy = enemy_at(50.0f, 2.5f, 0.0f);
  flecs::entity flyer = enemy_at(2.5f, 40.0f, 10.0f);

  step(60, 1.0f / 60.0f);

  const Transform &t = enemy.get<Transform>();
  CHECK(t.position.x == doctest::Approx(49.0f).epsilon(0.001));
  CHECK(t.position.y == doctest::Approx(2.5f));
  CHECK(t.position.z == 0.0f);

  const Transform &f = flyer.get<Transform>();
  CHECK(f.position.y == doctest::Approx(39.0f).epsilon(0.001));
  CHECK(f.position.z == 10.0f);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemy directly above the base holds still") {
  stop_spawner();
  flecs::entity enemy = enemy_at(2.5f, 2.5f, 10.0f);
  step(30);

  REQUIRE(enemy.is_alive());
  const Transform &t = enemy.get<Transform>();
  CHECK(t.position.x == doctest::Approx(2.5f));
  CHECK(t.position.y == doctest::Approx(2.5f));
  CHECK(t.position.z == 10.0f);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemy touching the base is destroyed") {
  stop_spawner();
  flecs::entity base = unit_at(BASE_CELL);
  flecs::entity enemy = enemy_at(4.5f, 2.5f);

  step();

  CHECK_FALSE(enemy.is_alive());
  CHECK(enemy_count(ecs) == 0);
  REQUIRE(damage_events().size() == 1);
  CHECK(damage_events()[0].source == enemy.id());
  CHECK(damage_events()[0].target == base.id());
  CHECK(damage_events()[0].amount == 1);

  // The loss restarts the spawner
  CHECK(alarm_is_valid(ecs, game().spawn_alarm));
  CHECK(base.is_alive());
  CHECK(level_at(BASE_CELL) == 1);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemy walks into the base eventually") {
  stop_spawner();
  flecs::entity enemy = enemy_at(2.5f, 20.0f);
  step(60 * 16);
  CHECK_FALSE(enemy.is_alive());
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemies pass through each other") {
  stop_spawner();
  flecs::entity a = enemy_at(30.0f, 30.0f);
  flecs::entity b = enemy_at(30.2f, 30.0f);
  step();

  CHECK(a.is_alive());
  CHECK(b.is_alive());
  CHECK(damage_events().empty());
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: a pile-up on the base kicks the spawner once") {
  stop_spawner();
  for (int i = 0; i < 4; i++)
    enemy_at(-40.0f + 20.0f * (float)i, 60.0f);
  // Both overlap the base and each other
  flecs::entity first = enemy_at(4.0f, 2.5f);
  flecs::entity second = enemy_at(4.2f, 2.5f);
  int before = pending_alarm_count(ecs);

  step();

  CHECK_FALSE(first.is_alive());
  CHECK_FALSE(second.is_alive());
  CHECK(enemy_count(ecs) == 4);
  CHECK(damage_events().size() == 2);
  CHECK(alarm_is_valid(ecs, game().spawn_alarm));
  CHECK(pending_alarm_count(ecs) == before + 1);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: colliders without a handler only get hit") {
  stop_spawner();
  select_cell({1, 0});
  press(0);
  step();

  // Base and turret overlap edge to edge; neither reacts
  step(5);
  CHECK(unit_at(BASE_CELL).is_alive());
  CHECK(unit_at({1, 0}).is_alive());
  CHECK(damage_events().empty());
}

static int g_contacts = 0;
static size_t g_last_others = 0;

static void record_contact(flecs::world &, flecs::entity,
                           const std::vector<flecs::entity> &others) {
  g_contacts++;
  g_last_others = others.size();
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: callback sees every overlapping collider") {
  g_contacts = 0;
  g_last_others = 0;
  flecs::entity watcher = ecs.entity()
                              .set<Transform>({{100.0f, 100.0f, 0.0f}})
                              .set<Collider>({1.0f});
  assign_collision_callback(watcher, record_contact);
  ecs.entity().set<Transform>({{100.5f, 100.0f, 0.0f}}).set<Collider>({1.0f});
  ecs.entity().set<Transform>({{100.0f, 101.5f, 0.0f}}).set<Collider>({1.0f});
  ecs.entity().set<Transform>({{104.0f, 100.0f, 0.0f}}).set<Collider>({1.0f});

  process_collisions(ecs);

  CHECK(g_contacts == 1);
  CHECK(g_last_others == 2);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: enemies ahead of the base in the contact list are skipped") {
  stop_spawner();
  flecs::entity base = unit_at(BASE_CELL);
  flecs::entity turret = create_turret(ecs, game(), {1, 0}, 1);
  flecs::entity self = enemy_at(40.0f, 60.0f);
  flecs::entity enemy_a = enemy_at(-40.0f, 60.0f);
  flecs::entity enemy_b = enemy_at(0.0f, 80.0f);
  ecs.ensure<DamageChannel>().events.clear();
  int before = pending_alarm_count(ecs);

  SUBCASE("base before turret") {
    enemy_collision(ecs, self, {enemy_a, enemy_b, base, turret});
    REQUIRE(damage_events().size() == 1);
    CHECK(damage_events()[0].target == base.id());
  }

  SUBCASE("turret before base") {
    enemy_collision(ecs, self, {enemy_a, turret, enemy_b, base});
    REQUIRE(damage_events().size() == 1);
    CHECK(damage_events()[0].target == turret.id());
  }

  CHECK_FALSE(self.is_alive());
  CHECK(enemy_a.is_alive());
  CHECK(enemy_b.is_alive());
  CHECK(base.is_alive());
  CHECK(turret.is_alive());
  CHECK(damage_events()[0].source == self.id());
  CHECK(damage_events()[0].amount == 1);

  // Two enemies left, below the floor: exactly one new spawn alarm
  CHECK(enemy_count(ecs) == 2);
  CHECK(alarm_is_valid(ecs, game().spawn_alarm));
  CHECK(pending_alarm_count(ecs) == before + 1);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: contact list of only enemies changes nothing") {
  stop_spawner();
  flecs::entity self = enemy_at(40.0f, 60.0f);
  flecs::entity other = enemy_at(-40.0f, 60.0f);
  int before = pending_alarm_count(ecs);

  enemy_collision(ecs, self, {other});

  CHECK(self.is_alive());
  CHECK(other.is_alive());
  CHECK(damage_events().empty());
  CHECK(pending_alarm_count(ecs) == before);
}

TEST_CASE_FIXTURE(GameTestHarness, "Cat4: nearest-enemy lookup reuses one cached query") {
  stop_spawner();
  const ecs_query_t *cached = ecs.get<EnemyIndex>().query.c_ptr();
  create_turret(ecs, game(), {1, 0}, 1);
  enemy_at(7.5f, 12.5f);

  step(4, 0.5f);
  enemy_at(-20.0f, 60.0f);
  step(4, 0.5f);

  CHECK(ecs.get<EnemyIndex>().query.c_ptr() == cached);
  CHECK(ecs.get<EnemyIndex>().query.count() == enemy_count(ecs));
}
