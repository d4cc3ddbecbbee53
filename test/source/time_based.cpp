#include <doctest/doctest.h>
#include <uuidcraft/errors.h>
#include <uuidcraft/time_based.h>
#include <uuidcraft/uuid_util.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace uuidcraft;

namespace {
  TimeBasedConfig isolated_config() {
    return TimeBasedConfig{}.with_controller(std::make_shared<ClockSequenceController>());
  }

  template <typename Creator> std::vector<Uuid> create_many(Creator& creator, size_t count) {
    std::vector<Uuid> out;
    out.reserve(count);
    for (size_t i = 0; i < count; i++) {
      out.push_back(creator.create());
    }
    return out;
  }
}  // namespace

TEST_CASE("Time-based version and variant") {
  TimeBasedUuidCreator v1(isolated_config());
  TimeOrderedUuidCreator v6(isolated_config());
  CHECK(v1.version() == UuidVersion::TIME_BASED);
  CHECK(v6.version() == UuidVersion::TIME_ORDERED);

  for (int i = 0; i < 100; i++) {
    Uuid a = v1.create();
    Uuid b = v6.create();
    CHECK(uuid_util::extract_version(a) == UuidVersion::TIME_BASED);
    CHECK(uuid_util::extract_version(b) == UuidVersion::TIME_ORDERED);
    CHECK(uuid_util::is_rfc4122(a));
    CHECK(uuid_util::is_rfc4122(b));
  }
}

TEST_CASE("Time-based values are unique") {
  TimeBasedUuidCreator v1(isolated_config());
  TimeOrderedUuidCreator v6(isolated_config());

  auto first = create_many(v1, 10000);
  auto second = create_many(v6, 10000);
  CHECK(std::set<Uuid>(first.begin(), first.end()).size() == first.size());
  CHECK(std::set<Uuid>(second.begin(), second.end()).size() == second.size());
}

TEST_CASE("Time-ordered values sort in creation order") {
  TimeOrderedUuidCreator creator(isolated_config());

  auto created = create_many(creator, 10000);
  auto sorted = created;
  std::sort(sorted.begin(), sorted.end());
  CHECK(sorted == created);

  // Same for the canonical strings
  std::vector<std::string> strings;
  for (const Uuid& uuid : created) strings.push_back(uuid.to_string());
  CHECK(std::is_sorted(strings.begin(), strings.end()));
}

TEST_CASE("Time-based creation time") {
  TimeBasedUuidCreator v1(isolated_config());
  TimeOrderedUuidCreator v6(isolated_config());

  int64_t before = timestamp::current_unix_milliseconds();
  Uuid a = v1.create();
  Uuid b = v6.create();
  int64_t after = timestamp::current_unix_milliseconds();

  CHECK(uuid_util::extract_unix_milliseconds(a) >= before);
  CHECK(uuid_util::extract_unix_milliseconds(a) <= after);
  CHECK(uuid_util::extract_unix_milliseconds(b) >= before);
  CHECK(uuid_util::extract_unix_milliseconds(b) <= after);
}

TEST_CASE("Time-based default node identifier is random multicast") {
  TimeBasedUuidCreator creator(isolated_config());
  Uuid uuid = creator.create();
  CHECK(is_multicast(creator.node_identifier()));
  CHECK(uuid_util::extract_node_identifier(uuid) == creator.node_identifier());

  // Stable across calls
  CHECK(uuid_util::extract_node_identifier(creator.create()) == creator.node_identifier());
}

TEST_CASE("Time-based fixed node identifier") {
  TimeBasedUuidCreator plain(isolated_config().with_fixed_node_identifier(0x112233445566));
  CHECK(uuid_util::extract_node_identifier(plain.create()) == 0x112233445566);

  TimeBasedUuidCreator multicast(isolated_config().with_fixed_node_identifier(0x112233445566, true));
  CHECK(uuid_util::extract_node_identifier(multicast.create()) == 0x112233445566 + MULTICAST_BIT);
}

TEST_CASE("Time-based known layout") {
  // 2022-02-22T19:22:22Z, clock sequence 0x33C8, node 9f6bdeced846
  const uint64_t ts = 0x1EC9414C232AB00ULL;
  auto config = isolated_config()
                    .with_fixed_timestamp(ts)
                    .with_fixed_node_identifier(0x9F6BDECED846);
  config.clock_sequence_strategy = std::make_shared<FixedClockSequenceStrategy>(0x33C8);

  TimeBasedUuidCreator v1(config);
  TimeOrderedUuidCreator v6(config);
  Uuid a = v1.create();
  Uuid b = v6.create();

  CHECK(a.to_string() == "c232ab00-9414-11ec-b3c8-9f6bdeced846");
  CHECK(b.to_string() == "1ec9414c-232a-6b00-b3c8-9f6bdeced846");

  for (const Uuid& uuid : {a, b}) {
    CHECK(uuid_util::extract_timestamp(uuid) == ts);
    CHECK(uuid_util::extract_unix_milliseconds(uuid) == 1645557742000LL);
    CHECK(timestamp::format_instant(uuid_util::extract_instant(uuid))
          == "2022-02-22T19:22:22.000000000Z");
    CHECK(uuid_util::extract_clock_sequence(uuid) == 0x33C8);
    CHECK(uuid_util::extract_node_identifier(uuid) == 0x9F6BDECED846);
  }
}

TEST_CASE("Time-based fixed timestamp round trip") {
  const uint64_t samples[] = {0, 1, 0x0123456789ABCDEFULL & timestamp::TIMESTAMP_MASK,
                              timestamp::TIMESTAMP_MASK};
  for (uint64_t ts : samples) {
    TimeBasedUuidCreator v1(isolated_config().with_fixed_timestamp(ts));
    TimeOrderedUuidCreator v6(isolated_config().with_fixed_timestamp(ts));
    CHECK(uuid_util::extract_timestamp(v1.create()) == ts);
    CHECK(uuid_util::extract_timestamp(v6.create()) == ts);
  }

  timestamp::Instant max = timestamp::to_instant(timestamp::TIMESTAMP_MASK);
  TimeOrderedUuidCreator creator(isolated_config().with_fixed_timestamp(max));
  Uuid uuid = creator.create();
  CHECK(uuid_util::extract_instant(uuid) == max);
  CHECK(timestamp::format_instant(uuid_util::extract_instant(uuid))
        == "5236-03-31T21:21:00.684697500Z");
}

TEST_CASE("Time-based fixed timestamp exhausts the clock sequence") {
  const uint64_t ts = 0x01EC9414C232AB00ULL;
  TimeBasedUuidCreator creator(isolated_config().with_fixed_timestamp(ts));

  std::set<Uuid> created;
  uint16_t first = 0;
  uint16_t last = 0;
  for (uint32_t i = 0; i < CLOCK_SEQUENCE_COUNT; i++) {
    Uuid uuid = creator.create();
    created.insert(uuid);
    last = uuid_util::extract_clock_sequence(uuid);
    if (i == 0) first = last;
  }

  CHECK(created.size() == CLOCK_SEQUENCE_COUNT);
  CHECK(last == ((first + CLOCK_SEQUENCE_MAX) & CLOCK_SEQUENCE_MAX));
  CHECK_THROWS_AS(creator.create(), OverrunError);
}

TEST_CASE("Time-based overrun with a stuck clock still fails when suppressed") {
  auto config = isolated_config().with_fixed_timestamp(uint64_t{1000}).without_overrun_exception();
  config.overrun_retries = 3;
  TimeOrderedUuidCreator creator(config);

  for (uint32_t i = 0; i < CLOCK_SEQUENCE_COUNT; i++) {
    creator.create();
  }
  CHECK_THROWS_AS(creator.create(), OverrunError);
}

TEST_CASE("Time-based values stay unique when the clock goes back after an overrun") {
  // Two creators on one node: a at timestamp 1000, b later at 2000
  auto config = isolated_config().with_fixed_node_identifier(0x112233445566);

  SUBCASE("Overrun raised") {}
  SUBCASE("Overrun suppressed") {
    config = config.without_overrun_exception();
    config.overrun_retries = 3;
  }

  TimeBasedUuidCreator a(config.with_fixed_timestamp(uint64_t{1000}));
  TimeBasedUuidCreator b(config.with_fixed_timestamp(uint64_t{2000}));
  TimeBasedUuidCreator between(config.with_fixed_timestamp(uint64_t{1500}));

  std::set<Uuid> created;
  for (uint32_t i = 0; i < CLOCK_SEQUENCE_COUNT; i++) {
    created.insert(a.create());
  }
  REQUIRE(created.size() == CLOCK_SEQUENCE_COUNT);
  CHECK_THROWS_AS(a.create(), OverrunError);

  CHECK(created.insert(b.create()).second);
  CHECK_THROWS_AS(a.create(), OverrunError);

  // A timestamp past the exhausted one may step on
  CHECK(created.insert(between.create()).second);
  CHECK(created.insert(b.create()).second);
  CHECK(created.size() == CLOCK_SEQUENCE_COUNT + 3);
}

TEST_CASE("Time-based overrun is waited out when the clock moves") {
  // Timestamp stays put for 16385 reads, then moves on
  class SteppingTimestampSource : public TimestampSource {
  public:
    uint64_t timestamp() override { return calls_++ <= CLOCK_SEQUENCE_COUNT ? 5000 : 5001; }

  private:
    uint32_t calls_ = 0;
  };

  auto config = isolated_config().without_overrun_exception();
  config.timestamp_source = std::make_shared<SteppingTimestampSource>();
  TimeBasedUuidCreator creator(config);

  std::set<Uuid> created;
  for (uint32_t i = 0; i <= CLOCK_SEQUENCE_COUNT; i++) {
    created.insert(creator.create());
  }
  CHECK(created.size() == CLOCK_SEQUENCE_COUNT + 1);
}

TEST_CASE("Time-based values are unique across threads") {
  const int threads = 8;
  const int per_thread = 1000;

  std::mutex mutex;
  std::set<Uuid> created;
  auto collect = [&](const std::vector<Uuid>& local) {
    std::lock_guard<std::mutex> lock(mutex);
    created.insert(local.begin(), local.end());
  };

  SUBCASE("One shared creator") {
    TimeBasedUuidCreator creator(isolated_config());
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
      workers.emplace_back([&] { collect(create_many(creator, per_thread)); });
    }
    for (auto& worker : workers) worker.join();
  }

  SUBCASE("One creator per thread") {
    auto config = isolated_config();
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
      workers.emplace_back([&] {
        TimeOrderedUuidCreator creator(config);
        collect(create_many(creator, per_thread));
      });
    }
    for (auto& worker : workers) worker.join();
  }

  SUBCASE("Same node on every thread with one controller") {
    auto config = isolated_config().with_fixed_node_identifier(0x0000AABBCCDDEEFF);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
      workers.emplace_back([&] {
        TimeBasedUuidCreator creator(config);
        collect(create_many(creator, per_thread));
      });
    }
    for (auto& worker : workers) worker.join();
  }

  CHECK(created.size() == static_cast<size_t>(threads * per_thread));
}

TEST_CASE("Time-based creators fall back to the shared controller") {
  TimeBasedUuidCreator creator;
  CHECK_FALSE(creator.config().clock_sequence_strategy);
  CHECK_FALSE(creator.config().clock_sequence_controller);
  CHECK(uuid_util::extract_version(creator.create()) == UuidVersion::TIME_BASED);
}
