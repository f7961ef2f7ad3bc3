#include "state.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::filesystem::path make_temp_dir(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id{ counter.fetch_add(1, std::memory_order_relaxed) };
  auto const dir{ std::filesystem::temp_directory_path() /
                  ("strata-state-test-" + std::string(tag) + "-" + std::to_string(id)) };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

struct temp_dir {
  std::filesystem::path path;
  explicit temp_dir(char const *tag) : path{ make_temp_dir(tag) } {}
  ~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

strata::state_snapshot sample_snapshot(std::string lineage, std::int64_t serial) {
  strata::state_snapshot s{ .lineage = std::move(lineage), .serial = serial };
  s.resources[{ "aws_vpc", "main" }] = strata::resource_state{
    .type = "aws_vpc",
    .id = "vpc-1",
    .inputs = { { "cidr", "10.0.0.0/16" } },
    .attributes = { { "cidr", "10.0.0.0/16" }, { "id", "vpc-1" }, { "arn", "arn:x" } },
  };
  s.resources[{ "aws_subnet", "a", 0 }] = strata::resource_state{
    .type = "aws_subnet",
    .id = "subnet-1",
    .inputs = { { "vpc_id", "vpc-1" },
                { "size", 24 },
                { "ratio", 0.5 },
                { "public", true },
                { "tags", strata::value_map{ { "env", "prod" } } },
                { "zones", strata::value_list{ "a", "b" } },
                { "note", strata::value{} } },
    .attributes = { { "id", "subnet-1" } },
    .dependencies = { "aws_vpc.main" },
    .deposed = { "subnet-0" },
  };
  return s;
}

}  // namespace

TEST_CASE("state_snapshot JSON preserves every field") {
  auto const original{ sample_snapshot("abc", 7) };
  auto const parsed{ strata::state_snapshot_from_json(
      strata::state_snapshot_to_json(original)) };

  CHECK(parsed.lineage == "abc");
  CHECK(parsed.serial == 7);
  REQUIRE(parsed.resources.size() == 2);

  auto const *subnet{ parsed.find({ "aws_subnet", "a", 0 }) };
  REQUIRE(subnet != nullptr);
  CHECK(subnet->type == "aws_subnet");
  CHECK(subnet->id == "subnet-1");
  CHECK(subnet->dependencies == std::vector<std::string>{ "aws_vpc.main" });
  CHECK(subnet->deposed == std::vector<std::string>{ "subnet-0" });
  CHECK(subnet->inputs.at("size").is<std::int64_t>());
  CHECK(subnet->inputs.at("ratio") == strata::value{ 0.5 });
  CHECK(subnet->inputs.at("public") == strata::value{ true });
  CHECK(subnet->inputs.at("tags") ==
        strata::value{ strata::value_map{ { "env", "prod" } } });
  CHECK(subnet->inputs.at("zones") == strata::value{ strata::value_list{ "a", "b" } });
  CHECK(subnet->inputs.at("note").is_null());
  CHECK(subnet->inputs == original.resources.at({ "aws_subnet", "a", 0 }).inputs);
}

TEST_CASE("state_snapshot_to_json refuses unresolved values") {
  strata::state_snapshot s{ .lineage = "x", .serial = 1 };
  s.resources[{ "t", "n" }] = strata::resource_state{
    .type = "t",
    .id = "t-1",
    .inputs = { { "r", strata::reference::parse("a.b.id") } },
  };
  CHECK_THROWS_AS(strata::state_snapshot_to_json(s), std::runtime_error);
}

TEST_CASE("state_snapshot_from_json rejects malformed documents") {
  CHECK_THROWS_AS(strata::state_snapshot_from_json("not json"), std::runtime_error);
  CHECK_THROWS_AS(strata::state_snapshot_from_json("[]"), std::runtime_error);
  CHECK_THROWS_AS(strata::state_snapshot_from_json(
                      R"({"version":2,"lineage":"x","serial":1,"resources":[]})"),
                  std::runtime_error);
  CHECK_THROWS_AS(
      strata::state_snapshot_from_json(R"({"version":1,"serial":1,"resources":[]})"),
      std::runtime_error);
  CHECK_THROWS_AS(
      strata::state_snapshot_from_json(R"({"version":1,"lineage":"x","resources":[]})"),
      std::runtime_error);
  CHECK_THROWS_AS(strata::state_snapshot_from_json(
                      R"({"version":1,"lineage":"x","serial":1,"resources":[
                           {"address":"bad","type":"t","id":"i"}]})"),
                  std::runtime_error);
  CHECK_THROWS_AS(strata::state_snapshot_from_json(
                      R"({"version":1,"lineage":"x","serial":1,"resources":[
                           {"address":"t.n","type":"t","id":"i"},
                           {"address":"t.n","type":"t","id":"j"}]})"),
                  std::runtime_error);
}

TEST_CASE("state_attribute prefers provider attributes over inputs") {
  strata::resource_state const entry{ .type = "t",
                                      .id = "t-9",
                                      .inputs = { { "name", "declared" }, { "size", 1 } },
                                      .attributes = { { "name", "reported" } } };

  CHECK(*strata::state_attribute(entry, { "name" }) == strata::value{ "reported" });
  CHECK(*strata::state_attribute(entry, { "size" }) == strata::value{ 1 });
  CHECK(*strata::state_attribute(entry, { "id" }) == strata::value{ "t-9" });
  CHECK_FALSE(strata::state_attribute(entry, { "missing" }).has_value());
}

TEST_CASE("state_new_lineage is random") {
  auto const a{ strata::state_new_lineage() };
  CHECK(a.size() == 32);
  CHECK(a != strata::state_new_lineage());
}

TEST_CASE("memory_state_store starts empty and enforces serial succession") {
  strata::memory_state_store store;
  auto s{ store.load() };
  CHECK(s.serial == 0);
  CHECK(s.resources.empty());
  CHECK_FALSE(s.lineage.empty());
  CHECK(store.load().lineage == s.lineage);

  SUBCASE("serial must advance by exactly one") {
    s.serial = 2;
    CHECK_THROWS_AS(store.save(s), strata::state_conflict_error);
    s.serial = 1;
    CHECK_NOTHROW(store.save(s));
    CHECK_THROWS_AS(store.save(s), strata::state_conflict_error);
    CHECK(store.load().serial == 1);
    CHECK(store.save_count() == 1);
  }

  SUBCASE("lineage must match once saved") {
    s.serial = 1;
    store.save(s);
    auto other{ s };
    other.serial = 2;
    other.lineage = "different";
    CHECK_THROWS_AS(store.save(other), strata::state_conflict_error);
  }
}

TEST_CASE("memory_state_store lock excludes a second holder until released") {
  strata::memory_state_store store;
  {
    auto const held{ store.lock(std::chrono::seconds{ 60 }) };
    CHECK(held->info().path == "memory");
    CHECK(held->info().expires_at - held->info().acquired_at == 60);
    CHECK_THROWS_AS(store.lock(std::chrono::seconds{ 60 }), strata::state_conflict_error);
  }
  CHECK_NOTHROW(store.lock(std::chrono::seconds{ 60 }));
}

TEST_CASE("memory_state_store lock lease expires") {
  strata::memory_state_store store;
  auto const stale{ store.lock(std::chrono::seconds{ 0 }) };
  std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });

  auto const fresh{ store.lock(std::chrono::seconds{ 60 }) };
  CHECK(fresh != nullptr);
  CHECK_THROWS_AS(store.lock(std::chrono::seconds{ 60 }), strata::state_conflict_error);
}

TEST_CASE("file_state_store round trips through disk") {
  temp_dir dir{ "roundtrip" };
  auto const path{ dir.path / "nested" / "strata.state.json" };

  strata::file_state_store store{ path };
  auto s{ store.load() };
  CHECK(s.serial == 0);
  CHECK_FALSE(std::filesystem::exists(path));

  auto next{ sample_snapshot(s.lineage, 1) };
  store.save(next);
  CHECK(std::filesystem::exists(path));

  strata::file_state_store reopened{ path };
  auto const loaded{ reopened.load() };
  CHECK(loaded.lineage == s.lineage);
  CHECK(loaded.serial == 1);
  CHECK(loaded.resources.size() == 2);

  next.serial = 1;
  CHECK_THROWS_AS(reopened.save(next), strata::state_conflict_error);
  next.serial = 2;
  CHECK_NOTHROW(reopened.save(next));
  CHECK(store.load().serial == 2);
}

TEST_CASE("file_state_store reports corrupt files") {
  temp_dir dir{ "corrupt" };
  auto const path{ dir.path / "strata.state.json" };
  {
    std::ofstream out{ path };
    out << "{ truncated";
  }
  strata::file_state_store store{ path };
  CHECK_THROWS_AS(store.load(), std::runtime_error);
}

TEST_CASE("file_state_store lock excludes a second holder") {
  temp_dir dir{ "lock" };
  auto const path{ dir.path / "strata.state.json" };
  strata::file_state_store first{ path };
  strata::file_state_store second{ path };

  {
    auto const held{ first.lock(std::chrono::seconds{ 30 }) };
    auto info_path{ first.lock_path() };
    info_path += ".info";
    CHECK(std::filesystem::exists(info_path));
    CHECK(held->info().expires_at - held->info().acquired_at == 30);

    try {
      second.lock(std::chrono::seconds{ 30 });
      FAIL("expected state_conflict_error");
    } catch (strata::state_conflict_error const &e) {
      CHECK(std::string{ e.what() }.find(held->info().holder) != std::string::npos);
    }
  }

  CHECK_NOTHROW(second.lock(std::chrono::seconds{ 30 }));
}
