// ═════════════════════════════════════════════════════════════
// Category 6: CONFIG: JSON overlay on defaults
// ═════════════════════════════════════════════════════════════
#include <cstdio>
#include <fstream>

TEST_CASE("Cat6: Defaults") {
  CombatConfig cfg = default_combat_config();

  CHECK(cfg.event_bus.throttle_ms == 10.0);
  CHECK(cfg.event_bus.log_capacity == 256);
  CHECK(cfg.event_bus.batch_size == 16);
  CHECK(cfg.priorities.at(ACTION_SPECIAL_ABILITY) == 100);
  CHECK(cfg.priorities.at(ACTION_CONTEXTUAL) == 10);
  CHECK(cfg.cooldowns.at(ACTION_BASIC_ATTACK) == doctest::Approx(1.0f));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat6: Overrides extend the defaults") {
  CombatConfig cfg = parse_combat_config(R"({
    "event_bus": { "throttle_ms": 33.0, "batch_size": 4 },
    "priorities": { "overwatch": 60, "basic_attack": 55 },
    "cooldowns": { "overwatch": 2.5 }
  })");

  CHECK(cfg.event_bus.throttle_ms == 33.0);
  CHECK(cfg.event_bus.batch_size == 4);
  CHECK(cfg.event_bus.log_capacity == 256); // Untouched
  CHECK(cfg.priorities.at("overwatch") == 60);
  CHECK(cfg.priorities.at(ACTION_BASIC_ATTACK) == 55);
  CHECK(cfg.priorities.at(ACTION_SPECIAL_ABILITY) == 100);
  CHECK(cfg.cooldowns.at("overwatch") == doctest::Approx(2.5f));
  CHECK(count_logs(LOG_ERROR) == 0);

  PriorityResolver resolver(cfg.priorities);
  CHECK(resolver.priority_of(*make_request("overwatch", "sniper"), ecs) == 60);
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat6: Malformed JSON keeps defaults") {
  CombatConfig cfg = parse_combat_config("{ \"event_bus\": { ");

  CHECK(cfg.event_bus.batch_size == 16);
  CHECK(count_logs(LOG_ERROR) == 1);
  CHECK(logged("Parse error"));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat6: Wrong types keep defaults") {
  CombatConfig cfg =
      parse_combat_config(R"({ "event_bus": { "batch_size": "lots" } })");

  CHECK(cfg.event_bus.batch_size == 16);
  CHECK(logged("Type error"));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat6: Out-of-range values are refused") {
  CombatConfig cfg = parse_combat_config(R"({
    "event_bus": { "throttle_ms": -5, "log_capacity": 0, "batch_size": 8 },
    "cooldowns": { "basic_attack": -1.0 }
  })");

  CHECK(cfg.event_bus.throttle_ms == 10.0);
  CHECK(cfg.event_bus.log_capacity == 256);
  CHECK(cfg.event_bus.batch_size == 8);
  CHECK(cfg.cooldowns.at(ACTION_BASIC_ATTACK) == doctest::Approx(1.0f));
  CHECK(count_logs(LOG_ERROR) == 3);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat6: Sections that aren't objects are ignored") {
  CombatConfig cfg = parse_combat_config(R"({
    "event_bus": 3,
    "priorities": 5,
    "cooldowns": [1.0, 2.0]
  })");

  CHECK(cfg.event_bus.throttle_ms == 10.0);
  CHECK(cfg.priorities == default_priority_table());
  CHECK(cfg.priorities.count("") == 0);
  CHECK(cfg.cooldowns.size() == 3);
  CHECK(count_logs(LOG_ERROR) == 3);
  CHECK(logged("priorities must be an object"));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat6: Loading from disk") {
  const char *path = "skirmish_test_combat.json";
  {
    std::ofstream out(path);
    out << R"({ "event_bus": { "log_capacity": 64 } })";
  }
  CombatConfig cfg = load_combat_config(path);
  std::remove(path);

  CHECK(cfg.event_bus.log_capacity == 64);
  CombatEventBus sized(cfg.event_bus);
  CHECK(sized.config().log_capacity == 64);

  CombatConfig missing = load_combat_config("does/not/exist.json");
  CHECK(missing.event_bus.log_capacity == 256);
  CHECK(logged("Failed to find"));
}
