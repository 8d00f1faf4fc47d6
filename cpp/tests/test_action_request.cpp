// ═════════════════════════════════════════════════════════════
// Category 1: ACTION REQUEST: identity & cancellation
// ═════════════════════════════════════════════════════════════
#include <atomic>
#include <thread>


TEST_CASE("Cat1: Request ids are unique and never zero") {
  auto a = make_request(ACTION_BASIC_ATTACK, "hero");
  auto b = make_request(ACTION_BASIC_ATTACK, "hero");

  CHECK(a->id() != 0);
  CHECK(b->id() != 0);
  CHECK(a->id() != b->id());
  CHECK(b->id() > a->id());
}

TEST_CASE("Cat1: Constructor keeps kind, source, timestamp and context") {
  auto when = Clock::now() - std::chrono::seconds(3);
  ActionRequest request(ACTION_SPECIAL_ABILITY, "mage", when,
                        std::string("fireball"));

  CHECK(request.kind() == ACTION_SPECIAL_ABILITY);
  CHECK(request.source() == "mage");
  CHECK(request.created_at() == when);
  CHECK_FALSE(request.is_cancelled());

  REQUIRE(request.context_as<std::string>() != nullptr);
  CHECK(*request.context_as<std::string>() == "fireball");
  CHECK(request.context_as<ChainDefinition>() == nullptr);
}

TEST_CASE("Cat1: cancel() is idempotent") {
  auto request = make_request(ACTION_BASIC_ATTACK, "hero");

  CHECK(request->cancel());       // Performed the transition
  CHECK_FALSE(request->cancel()); // Already cancelled
  CHECK_NOTHROW(request->cancel());
  CHECK(request->is_cancelled());
}

TEST_CASE("Cat1: Cross-thread cancel transitions exactly once") {
  auto request = make_request(ACTION_BASIC_ATTACK, "hero");
  std::atomic<int> transitions{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&] {
      for (int j = 0; j < 100; j++) {
        if (request->cancel())
          transitions++;
      }
    });
  }
  // Simulation thread polls while the others cancel
  while (!request->is_cancelled()) {
    std::this_thread::yield();
  }
  for (auto &t : threads)
    t.join();

  CHECK(transitions.load() == 1);
  CHECK(request->is_cancelled());
}
