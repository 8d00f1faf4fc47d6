// ═════════════════════════════════════════════════════════════
// Category 3: PIPELINE: stage order, failure paths, timing
// ═════════════════════════════════════════════════════════════
#include <stdexcept>

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Rejected pre-check skips execute and post-react") {
  StageSpy spy;
  spy.allow = false;
  ActionPipeline pipeline(spy.stages(), profiler, reporter);

  auto request = make_request(ACTION_BASIC_ATTACK, "hero");
  CHECK_FALSE(pipeline.run(*request, ecs));

  CHECK(spy.pre_checks == 1);
  CHECK(spy.executes == 0);
  CHECK(spy.post_reacts == 0);
  CHECK(reporter.count(ERROR_STATE_CONFLICT) == 1);
  CHECK(profiler.open_spans() == 0); // Span closed on the abort path
  REQUIRE(profiler.stats_for(ACTION_BASIC_ATTACK).has_value());
  CHECK(profiler.stats_for(ACTION_BASIC_ATTACK)->count == 1);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Accepted request runs execute then post-react once") {
  StageSpy spy;
  ActionPipeline pipeline(spy.stages(), profiler, reporter);

  auto request = make_request(ACTION_SPECIAL_ABILITY, "hero");
  CHECK(pipeline.run(*request, ecs));

  const std::vector<std::string> expected = {"pre_check", "execute",
                                             "post_react"};
  CHECK(spy.calls == expected);
  CHECK(reporter.total() == 0);
  CHECK(profiler.open_spans() == 0);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Execute fault is reported, rethrown, span closed") {
  int post_reacts = 0;
  ActionStages stages{
      [](const ActionRequest &, flecs::world &) { return true; },
      [](const ActionRequest &, flecs::world &) {
        throw std::runtime_error("damage formula exploded");
      },
      [&](const ActionRequest &, flecs::world &) { post_reacts++; }};
  ActionPipeline pipeline(std::move(stages), profiler, reporter);

  auto request = make_request(ACTION_BASIC_ATTACK, "hero");
  CHECK_THROWS_AS(pipeline.run(*request, ecs), std::runtime_error);

  CHECK(post_reacts == 0);
  CHECK(reporter.count(ERROR_EXECUTION_FAULT) == 1);
  CHECK(profiler.open_spans() == 0);
  CHECK(logged("damage formula exploded"));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat3: Missing stage is rejected") {
  StageSpy spy;
  ActionStages stages = spy.stages();
  stages.post_react = nullptr;

  CHECK_THROWS_AS(ActionPipeline(std::move(stages), profiler, reporter),
                  std::invalid_argument);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Default stages announce and arm the cooldown") {
  spawn_combatant("hero");
  CountingSystemsTrigger trigger;
  ActionPipeline pipeline(
      make_default_stages(gate, bus, trigger, {{ACTION_BASIC_ATTACK, 1.0f}}),
      profiler, reporter);

  auto request = make_request(ACTION_BASIC_ATTACK, "hero");
  CHECK(pipeline.run(*request, ecs));
  CHECK(trigger.calls == 1);

  // Announcements are queued, not delivered inline
  CHECK(bus.pending_count() == 2);
  bus.dispatch_queued(1.0);
  auto started = bus.recent(EVENT_ACTION_STARTED, 1);
  REQUIRE(started.size() == 1);
  CHECK(started[0].actor == "hero");
  CHECK(std::get<ActionPayload>(started[0].payload).request_id ==
        request->id());
  CHECK(bus.recent(EVENT_ACTION_COMPLETED, 1).size() == 1);

  auto hero = ecs.lookup("hero");
  CHECK(hero.get<ActionCooldown>().remaining == doctest::Approx(1.0f));
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Cooldown blocks until the tick drains it") {
  spawn_combatant("hero");
  NullSystemsTrigger trigger;
  ActionPipeline pipeline(
      make_default_stages(gate, bus, trigger, {{ACTION_BASIC_ATTACK, 1.0f}}),
      profiler, reporter);

  CHECK(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "hero"), ecs));
  CHECK_FALSE(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "hero"), ecs));

  step(30); // 0.5s
  CHECK_FALSE(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "hero"), ecs));

  step(40); // ~1.17s total
  CHECK(ecs.lookup("hero").get<ActionCooldown>().remaining == 0.0f);
  CHECK(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "hero"), ecs));

  CHECK(reporter.count(ERROR_STATE_CONFLICT) == 2);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Cancelling the top request lets the next one run") {
  spawn_combatant("hero");
  CountingSystemsTrigger trigger;
  PriorityResolver resolver;
  ActionPipeline pipeline(make_default_stages(gate, bus, trigger, {}), profiler,
                          reporter);

  auto special = make_request(ACTION_SPECIAL_ABILITY, "hero");
  auto basic = make_request(ACTION_BASIC_ATTACK, "hero");
  special->cancel();

  for (const auto &winner : resolver.resolve_per_source({special, basic}, ecs))
    CHECK(pipeline.run(*winner, ecs));

  CHECK(trigger.calls == 1);
  CHECK(reporter.total() == 0);
  bus.dispatch_queued(1.0);
  auto started = bus.recent(EVENT_ACTION_STARTED, 2);
  REQUIRE(started.size() == 1);
  CHECK(std::get<ActionPayload>(started[0].payload).action_kind ==
        ACTION_BASIC_ATTACK);
  CHECK(bus.recent(EVENT_ACTION_ERROR, 1).empty());
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Default gate rejects stunned, dead and unknown") {
  spawn_combatant("stunned").add<Stunned>();
  ecs.entity("corpse").set<ActionCooldown>({0.0f}); // No IsAlive
  NullSystemsTrigger trigger;
  ActionPipeline pipeline(make_default_stages(gate, bus, trigger, {}),
                          profiler, reporter);

  CHECK_FALSE(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "stunned"), ecs));
  CHECK_FALSE(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "corpse"), ecs));
  CHECK_FALSE(pipeline.run(*make_request(ACTION_BASIC_ATTACK, "nobody"), ecs));
  CHECK(reporter.count(ERROR_STATE_CONFLICT) == 3);

  // Each rejection also lands on the bus as an action_error
  bus.dispatch_queued(1.0);
  auto errors = bus.recent(EVENT_ACTION_ERROR, 10);
  REQUIRE(errors.size() == 3);
  CHECK(errors[0].actor == "nobody");
  CHECK(std::get<ErrorPayload>(errors[0].payload).error_kind ==
        ERROR_STATE_CONFLICT);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Cancelled request fails the default pre-check") {
  spawn_combatant("hero");
  CountingSystemsTrigger trigger;
  ActionPipeline pipeline(make_default_stages(gate, bus, trigger, {}),
                          profiler, reporter);

  auto request = make_request(ACTION_SPECIAL_ABILITY, "hero");
  request->cancel();

  CHECK_FALSE(pipeline.run(*request, ecs));
  CHECK(trigger.calls == 0);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Cancel mid-flight stops the default execute") {
  spawn_combatant("hero");
  CountingSystemsTrigger trigger;
  auto request = make_request(ACTION_BASIC_ATTACK, "hero");
  ActionStages stages = make_default_stages(gate, bus, trigger, {});
  // Another thread cancels between validation and execution
  PreCheckStage check = stages.pre_check;
  stages.pre_check = [check, request](const ActionRequest &r,
                                      flecs::world &world) {
    bool ok = check(r, world);
    request->cancel();
    return ok;
  };
  ActionPipeline pipeline(std::move(stages), profiler, reporter);

  CHECK(pipeline.run(*request, ecs));
  CHECK(trigger.calls == 0);
  CHECK(bus.pending_count() == 0);
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Chain strategy hands the definition to the chain system") {
  spawn_combatant("monk");
  RecordingChainExecutor chains;
  ActionPipeline pipeline(make_chain_stages(gate, bus, chains, {}), profiler,
                          reporter);

  ChainDefinition def{"palm_combo", {"jab", "jab", "palm"}, "bandit"};
  auto request = make_request(ACTION_CHAIN, "monk", def);

  CHECK(pipeline.run(*request, ecs));
  REQUIRE(chains.started.size() == 1);
  CHECK(chains.started[0].first == "palm_combo");
  CHECK(chains.started[0].second == "monk");

  bus.dispatch_queued(1.0);
  auto started = bus.recent(EVENT_ACTION_STARTED, 1);
  REQUIRE(started.size() == 1);
  CHECK(started[0].target == "bandit");
}

TEST_CASE_FIXTURE(CombatTestHarness,
                  "Cat3: Chain strategy with the wrong context does nothing") {
  spawn_combatant("monk");
  RecordingChainExecutor chains;
  ActionPipeline pipeline(make_chain_stages(gate, bus, chains, {}), profiler,
                          reporter);

  auto request = make_request(ACTION_CHAIN, "monk", std::string("not a chain"));

  CHECK_NOTHROW(pipeline.run(*request, ecs));
  CHECK(chains.started.empty());
  CHECK(bus.pending_count() == 0);
  CHECK(count_logs(LOG_ERROR) == 1);
  CHECK(logged("no ChainDefinition"));
}

TEST_CASE_FIXTURE(CombatTestHarness, "Cat3: Profiler aggregates per kind") {
  StageSpy spy;
  ActionPipeline pipeline(spy.stages(), profiler, reporter);

  for (int i = 0; i < 3; i++)
    pipeline.run(*make_request(ACTION_BASIC_ATTACK, "hero"), ecs);
  pipeline.run(*make_request(ACTION_SPECIAL_ABILITY, "hero"), ecs);

  CHECK(profiler.stats_for(ACTION_BASIC_ATTACK)->count == 3);
  CHECK(profiler.stats_for(ACTION_SPECIAL_ABILITY)->count == 1);
  CHECK_FALSE(profiler.stats_for(ACTION_CHAIN).has_value());

  auto snap = profiler.snapshot();
  CHECK(snap["kinds"][ACTION_BASIC_ATTACK]["count"] == 3);
  CHECK(snap["open_spans"] == 0);
}
