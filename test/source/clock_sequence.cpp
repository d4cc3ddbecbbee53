#include <doctest/doctest.h>
#include <uuidcraft/clock_sequence.h>
#include <uuidcraft/errors.h>

#include <mutex>
#include <set>
#include <thread>
#include <tuple>
#include <vector>

using namespace uuidcraft;

TEST_CASE("Clock sequence first use is random and in range") {
  std::set<uint16_t> seen;
  for (int i = 0; i < 32; i++) {
    ClockSequenceController controller;
    uint16_t value = controller.next(1000, 0x123456789ABC);
    CHECK(value <= CLOCK_SEQUENCE_MAX);
    seen.insert(value);
  }
  // 32 draws out of 16384 values
  CHECK(seen.size() > 1);
}

TEST_CASE("Clock sequence increments on a repeated timestamp") {
  ClockSequenceController controller;
  const uint64_t node = 0x0000AABBCCDDEEFF;

  uint16_t first = controller.next(5000, node);
  uint16_t second = controller.next(5000, node);
  uint16_t third = controller.next(4999, node);  // regressed clock

  CHECK(second == ((first + 1) & CLOCK_SEQUENCE_MAX));
  CHECK(third == ((first + 2) & CLOCK_SEQUENCE_MAX));
}

TEST_CASE("Clock sequence issues 16384 distinct values per timestamp") {
  ClockSequenceController controller;
  const uint64_t node = 0x0000010203040506;

  std::set<uint16_t> issued;
  uint16_t first = controller.next(42, node);
  uint16_t last = first;
  issued.insert(first);
  for (uint32_t i = 1; i < CLOCK_SEQUENCE_COUNT; i++) {
    last = controller.next(42, node);
    issued.insert(last);
  }

  CHECK(issued.size() == CLOCK_SEQUENCE_COUNT);
  CHECK(last == ((first + CLOCK_SEQUENCE_MAX) & CLOCK_SEQUENCE_MAX));

  SUBCASE("Overrun on the next request") {
    CHECK_THROWS_AS(controller.next(42, node), OverrunError);
    CHECK_FALSE(controller.try_next(42, node).has_value());
    CHECK_FALSE(controller.try_next(41, node).has_value());
  }

  SUBCASE("Advancing the timestamp restores capacity") {
    uint16_t after = controller.next(43, node);
    CHECK(after == last);
    CHECK(controller.next(43, node) == ((after + 1) & CLOCK_SEQUENCE_MAX));
  }
}

TEST_CASE("Clock sequence never repeats after an overrun, an advance and a regression") {
  const uint64_t node = 0x0000112233445566;
  ClockSequencePolicy policy = ClockSequencePolicy::KEEP;
  SUBCASE("Kept on advance") {}
  SUBCASE("Reseeded on advance") { policy = ClockSequencePolicy::RESEED; }
  ClockSequenceController controller(policy);

  std::set<std::tuple<uint64_t, uint16_t>> issued;
  auto issue = [&](uint64_t ts) {
    auto value = controller.try_next(ts, node);
    if (value) {
      CHECK(issued.emplace(ts, *value).second);
    }
    return value.has_value();
  };

  for (uint32_t i = 0; i < CLOCK_SEQUENCE_COUNT; i++) {
    REQUIRE(issue(1000));
  }
  CHECK_FALSE(issue(1000));

  CHECK(issue(2000));
  CHECK_FALSE(issue(1000));
  CHECK_FALSE(issue(999));

  // Everything up to 1000 is spent, later timestamps are not
  CHECK(issue(1500));
  CHECK(issue(1500));
  CHECK(issue(2000));
  CHECK_FALSE(issue(1000));
}

TEST_CASE("Clock sequence regression after a reseed") {
  ClockSequenceController controller(ClockSequencePolicy::RESEED);
  const uint64_t node = 0x0000ABCDEF012345;

  std::set<std::tuple<uint64_t, uint16_t>> issued;
  for (int i = 0; i < 10; i++) {
    issued.emplace(uint64_t{10}, controller.next(10, node));
  }
  issued.emplace(uint64_t{20}, controller.next(20, node));

  // The new seed may land anywhere, so timestamps up to 10 are off limits
  CHECK_FALSE(controller.try_next(10, node).has_value());
  CHECK_FALSE(controller.try_next(5, node).has_value());

  for (int i = 0; i < 10; i++) {
    CHECK(issued.emplace(uint64_t{15}, controller.next(15, node)).second);
  }
  CHECK(issued.size() == 21);
}

TEST_CASE("Clock sequence keeps stepping past a full cycle when the clock moves") {
  ClockSequenceController controller;
  const uint64_t node = 0x0000C0FFEE000001;

  // Two values per timestamp: each advance keeps the value, each repeat steps it
  std::set<std::tuple<uint64_t, uint16_t>> issued;
  for (uint64_t ts = 1; ts <= CLOCK_SEQUENCE_COUNT; ts++) {
    issued.emplace(ts, controller.next(ts, node));
    issued.emplace(ts, controller.next(ts, node));
  }
  CHECK(issued.size() == 2 * static_cast<size_t>(CLOCK_SEQUENCE_COUNT));
}

TEST_CASE("Clock sequence kept on advance with the default policy") {
  ClockSequenceController controller;
  CHECK(controller.policy() == ClockSequencePolicy::KEEP);

  const uint64_t node = 0x0000F0F0F0F0F0F0;
  uint16_t value = controller.next(100, node);
  CHECK(controller.next(101, node) == value);
  CHECK(controller.next(200, node) == value);
}

TEST_CASE("Clock sequence reseeded on advance") {
  ClockSequenceController controller(ClockSequencePolicy::RESEED);
  const uint64_t node = 0x0000F0F0F0F0F0F0;

  std::set<uint16_t> seen;
  for (uint64_t ts = 1; ts <= 32; ts++) {
    seen.insert(controller.next(ts, node));
  }
  CHECK(seen.size() > 1);
}

TEST_CASE("Clock sequence pool can be cleared") {
  ClockSequenceController controller;
  const uint64_t node = 0x0000123412341234;

  for (uint32_t i = 0; i < CLOCK_SEQUENCE_COUNT; i++) {
    controller.next(7, node);
  }
  CHECK_FALSE(controller.try_next(7, node).has_value());

  controller.clear_pool();
  CHECK(controller.try_next(7, node).has_value());
}

TEST_CASE("Clock sequence slots") {
  CHECK(ClockSequenceController::slot_index(0) < ClockSequenceController::POOL_SIZE);
  CHECK(ClockSequenceController::slot_index(0x0000FFFFFFFFFFFF) < ClockSequenceController::POOL_SIZE);
  CHECK(ClockSequenceController::slot_index(12345) == ClockSequenceController::slot_index(12345));

  std::set<size_t> slots;
  for (uint64_t node = 0; node < 1024; node++) {
    slots.insert(ClockSequenceController::slot_index(node));
  }
  CHECK(slots.size() > ClockSequenceController::POOL_SIZE / 2);
}

TEST_CASE("Clock sequence triples are unique across threads") {
  ClockSequenceController controller;
  const uint64_t node = 0x0000A1A2A3A4A5A6;
  const int threads = 8;
  const int per_thread = 1000;

  // Every thread reuses a handful of timestamps so the same slot is contended
  std::mutex mutex;
  std::set<std::tuple<uint64_t, uint16_t>> triples;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; t++) {
    workers.emplace_back([&] {
      std::vector<std::tuple<uint64_t, uint16_t>> local;
      for (int i = 0; i < per_thread; i++) {
        uint64_t ts = 1000 + static_cast<uint64_t>(i / 250);
        local.emplace_back(ts, controller.next(ts, node));
      }
      std::lock_guard<std::mutex> lock(mutex);
      triples.insert(local.begin(), local.end());
    });
  }
  for (auto& worker : workers) worker.join();

  CHECK(triples.size() == static_cast<size_t>(threads * per_thread));
}

TEST_CASE("Default clock sequence controller is shared") {
  auto a = default_clock_sequence_controller();
  auto b = default_clock_sequence_controller();
  REQUIRE(a);
  CHECK(a.get() == b.get());
}

TEST_CASE("Clock sequence strategies") {
  SUBCASE("Default strategy needs a controller") {
    CHECK_THROWS_AS(DefaultClockSequenceStrategy(nullptr), InvalidArgumentError);
  }

  SUBCASE("Default strategy delegates") {
    auto controller = std::make_shared<ClockSequenceController>();
    DefaultClockSequenceStrategy strategy(controller);
    CHECK(strategy.controller() == controller);

    auto first = strategy.next(10, 1);
    auto second = strategy.next(10, 1);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*second == ((*first + 1) & CLOCK_SEQUENCE_MAX));
  }

  SUBCASE("Fixed strategy") {
    FixedClockSequenceStrategy strategy(0xFFFF);
    CHECK(strategy.next(1, 1) == CLOCK_SEQUENCE_MAX);
    CHECK(strategy.next(1, 1) == CLOCK_SEQUENCE_MAX);
  }
}
