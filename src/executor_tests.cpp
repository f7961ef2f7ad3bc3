#include "executor.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using strata::test::action_position;
using strata::test::make_decl;
using strata::test::make_entry;
using strata::test::ref;

namespace {

struct applied {
  strata::plan p;
  strata::apply_report report;
  strata::state_snapshot working;

  strata::action_report const &at(std::string const &label) const {
    return report.actions[action_position(p, label)];
  }
};

struct executor_fixture {
  strata::test::fake_provider cloud;
  strata::provider_registry registry;
  strata::memory_state_store store;
  strata::cancellation cancel;
  strata::executor_cfg cfg{ .parallelism = 4,
                            .max_attempts = 3,
                            .initial_backoff = 1ms,
                            .max_backoff = 4ms };

  executor_fixture() { strata::test::register_test_types(registry, cloud); }

  applied apply(std::vector<strata::resource_decl> const &decls,
                strata::state_store &target) {
    auto p{ strata::make_plan(decls, target.load(), registry) };
    REQUIRE(p.valid());
    auto working{ p.prior_state };
    auto report{ strata::executor{ registry, target, cfg }.run(p, working, cancel) };
    return { std::move(p), std::move(report), std::move(working) };
  }

  applied apply(std::vector<strata::resource_decl> const &decls) {
    return apply(decls, store);
  }
};

std::vector<strata::resource_decl> network() {
  return { make_decl("aws_vpc", "main", { { "cidr", "10.0.0.0/16" } }),
           make_decl("aws_subnet",
                     "a",
                     { { "vpc_id", ref("aws_vpc.main.id") }, { "cidr", "10.0.1.0/24" } }),
           make_decl("aws_instance",
                     "web",
                     { { "subnet_id", ref("aws_subnet.a.id") }, { "ami", "ami-1" } }) };
}

std::vector<strata::resource_decl> independent(int count) {
  std::vector<strata::resource_decl> decls;
  for (int i{ 0 }; i < count; ++i) {
    auto const name{ "n" + std::to_string(i) };
    decls.push_back(make_decl("aws_vpc", name, { { "tag", name } }));
  }
  return decls;
}

// vpc <- {subnet, security group} <- instance
std::vector<strata::resource_decl> diamond() {
  return { make_decl("aws_vpc", "main", { { "cidr", "10.0.0.0/16" } }),
           make_decl("aws_subnet",
                     "a",
                     { { "vpc_id", ref("aws_vpc.main.id") }, { "cidr", "10.0.1.0/24" } }),
           make_decl("aws_security_group",
                     "web",
                     { { "vpc_id", ref("aws_vpc.main.id") }, { "ingress", "443" } }),
           make_decl("aws_instance",
                     "web",
                     { { "subnet_id", ref("aws_subnet.a.id") },
                       { "security_group_id", ref("aws_security_group.web.id") },
                       { "ami", "ami-1" } }) };
}

// Random DAG: node i only references or depends on nodes before it. aws_vpc replaces
// destroy-first, aws_instance create-first.
std::vector<strata::resource_decl> random_dag(std::mt19937 &rng) {
  std::uniform_int_distribution<int> size{ 3, 12 };
  std::uniform_int_distribution<int> roll{ 0, 5 };

  std::vector<strata::resource_decl> decls;
  int const count{ size(rng) };
  for (int i{ 0 }; i < count; ++i) {
    auto const type{ roll(rng) < 2 ? "aws_instance" : "aws_vpc" };
    auto decl{ make_decl(type, "n" + std::to_string(i), { { "generation", "g0" } }) };
    for (int j{ 0 }; j < i; ++j) {
      auto const target{ decls[j].type + "." + decls[j].name };
      switch (roll(rng)) {
        case 0: decl.attributes["ref_" + std::to_string(j)] = ref(target + ".id"); break;
        case 1: decl.depends_on.push_back(target); break;
        default: break;
      }
    }
    decls.push_back(std::move(decl));
  }
  return decls;
}

void check_linear_extension(strata::plan const &p) {
  for (auto const &a : p.actions) {
    for (auto const dep : a.depends_on) { CHECK(dep < a.index); }
  }
}

// Fails every save after the first `allowed`
class failing_store : public strata::memory_state_store {
 public:
  explicit failing_store(std::size_t allowed) : allowed_{ allowed } {}

  void save(strata::state_snapshot const &snapshot) override {
    if (save_count() >= allowed_) { throw std::runtime_error("disk full"); }
    memory_state_store::save(snapshot);
  }

 private:
  std::size_t allowed_;
};

}  // namespace

TEST_CASE("executor_backoff doubles and caps") {
  strata::executor_cfg const cfg{ .initial_backoff = 200ms, .max_backoff = 1000ms };
  CHECK(strata::executor_backoff(cfg, 2) == 200ms);
  CHECK(strata::executor_backoff(cfg, 3) == 400ms);
  CHECK(strata::executor_backoff(cfg, 4) == 800ms);
  CHECK(strata::executor_backoff(cfg, 5) == 1000ms);
  CHECK(strata::executor_backoff(cfg, 30) == 1000ms);
}

TEST_CASE("executor_pool_size stays within limits") {
  strata::executor_cfg cfg{ .parallelism = 8 };
  CHECK(strata::executor_pool_size(cfg, 100) == 8);
  CHECK(strata::executor_pool_size(cfg, 3) == 3);
  CHECK(strata::executor_pool_size(cfg, 0) == 1);

  cfg.parallelism = 0;
  CHECK(strata::executor_pool_size(cfg, 10) == 1);

  cfg.parallelism = 1000000;
  CHECK(strata::executor_pool_size(cfg, 1000000) == strata::kMaxParallelism);
}

TEST_CASE("executor applies a network and records real ids") {
  executor_fixture f;
  auto const r{ f.apply(network()) };

  CHECK(r.report.result == strata::apply_result::success);
  CHECK(r.report.count(strata::node_status::applied) == 3);
  CHECK(r.report.final_serial == 3);
  CHECK(f.store.save_count() == 3);

  auto const stored{ f.store.load() };
  CHECK(stored.serial == 3);
  REQUIRE(stored.resources.size() == 3);

  auto const *vpc{ stored.find({ "aws_vpc", "main" }) };
  auto const *subnet{ stored.find({ "aws_subnet", "a" }) };
  REQUIRE(vpc != nullptr);
  REQUIRE(subnet != nullptr);
  CHECK(subnet->inputs.at("vpc_id") == strata::value{ vpc->id });
  CHECK(subnet->dependencies == std::vector<std::string>{ "aws_vpc.main" });
  CHECK(vpc->attributes.at("arn") == strata::value{ "arn:fake:" + vpc->id });
  CHECK(r.at("create aws_vpc.main").id == vpc->id);
  CHECK(r.at("create aws_vpc.main").attempts == 1);

  auto const creates{ f.cloud.calls(strata::operation::create) };
  REQUIRE(creates.size() == 3);
  CHECK(creates[0].type == "aws_vpc");
  CHECK(creates[1].type == "aws_subnet");
  CHECK(creates[1].started >= creates[0].finished);
  CHECK(creates[1].attrs.at("vpc_id") == strata::value{ vpc->id });

  CHECK(r.working.serial == stored.serial);
}

TEST_CASE("executor orders a diamond and converges") {
  executor_fixture f;
  auto const p{ strata::make_plan(diamond(), f.store.load(), f.registry) };
  REQUIRE(p.valid());

  auto const vpc{ action_position(p, "create aws_vpc.main") };
  auto const subnet{ action_position(p, "create aws_subnet.a") };
  auto const group{ action_position(p, "create aws_security_group.web") };
  auto const instance{ action_position(p, "create aws_instance.web") };
  CHECK(vpc < subnet);
  CHECK(vpc < group);
  CHECK(subnet < instance);
  CHECK(group < instance);

  auto expected{ std::vector<std::size_t>{ subnet, group } };
  std::ranges::sort(expected);
  CHECK(p.actions[instance].depends_on == expected);
  check_linear_extension(p);

  auto const r{ f.apply(diamond()) };
  CHECK(r.report.result == strata::apply_result::success);
  CHECK(r.report.count(strata::node_status::applied) == 4);

  auto const stored{ f.store.load() };
  auto const *web{ stored.find({ "aws_instance", "web" }) };
  REQUIRE(web != nullptr);
  CHECK(web->inputs.at("subnet_id") ==
        strata::value{ stored.find({ "aws_subnet", "a" })->id });
  CHECK(web->inputs.at("security_group_id") ==
        strata::value{ stored.find({ "aws_security_group", "web" })->id });

  auto const creates{ f.cloud.calls(strata::operation::create) };
  REQUIRE(creates.size() == 4);
  CHECK(creates[0].type == "aws_vpc");
  CHECK(creates[3].type == "aws_instance");
  CHECK(creates[3].started >= creates[1].finished);
  CHECK(creates[3].started >= creates[2].finished);

  auto const again{ f.apply(diamond()) };
  CHECK_FALSE(again.p.has_changes());
  CHECK(again.report.result == strata::apply_result::success);
}

TEST_CASE("executor converges generated dependency graphs") {
  for (unsigned seed{ 1 }; seed <= 40; ++seed) {
    INFO("seed " << seed);
    std::mt19937 rng{ seed };
    executor_fixture f;
    auto decls{ random_dag(rng) };

    auto const created{ f.apply(decls) };
    check_linear_extension(created.p);
    REQUIRE(created.report.result == strata::apply_result::success);
    CHECK_FALSE(f.apply(decls).p.has_changes());

    // Force replacements of both kinds on a random subset
    std::bernoulli_distribution pick{ 0.4 };
    for (auto &d : decls) {
      if (pick(rng)) { d.attributes["generation"] = "g1"; }
    }

    auto const replaced{ f.apply(decls) };
    check_linear_extension(replaced.p);
    REQUIRE(replaced.report.result == strata::apply_result::success);

    auto const settled{ f.apply(decls) };
    CHECK_FALSE(settled.p.has_changes());
    CHECK(f.cloud.object_count() == decls.size());
    CHECK(f.store.load().resources.size() == decls.size());
  }
}

TEST_CASE("executor reapplying a converged plan changes nothing") {
  executor_fixture f;
  f.apply(network());
  auto const calls_before{ f.cloud.calls().size() };

  auto const r{ f.apply(network()) };
  CHECK(r.report.result == strata::apply_result::success);
  CHECK_FALSE(r.p.has_changes());
  CHECK(f.cloud.calls().size() == calls_before);
  CHECK(f.store.load().serial == 3);
}

TEST_CASE("executor bounds concurrent provider calls") {
  executor_fixture f;
  f.cloud.set_latency(30ms);

  SUBCASE("parallelism 3") {
    f.cfg.parallelism = 3;
    auto const r{ f.apply(independent(9)) };
    CHECK(r.report.result == strata::apply_result::success);
    CHECK(f.cloud.max_concurrency() <= 3);
    CHECK(f.cloud.max_concurrency() >= 2);
    CHECK(f.cloud.object_count() == 9);
  }

  SUBCASE("parallelism 1 serializes") {
    f.cfg.parallelism = 1;
    auto const r{ f.apply(independent(4)) };
    CHECK(r.report.result == strata::apply_result::success);
    CHECK(f.cloud.max_concurrency() == 1);
  }
}

TEST_CASE("executor skips dependents of a failed action and continues elsewhere") {
  executor_fixture f;
  f.cloud.fail_permanent("broken", strata::operation::create);

  auto const r{ f.apply(
      { make_decl("aws_vpc", "bad", { { "tag", "broken" } }),
        make_decl("aws_subnet", "a", { { "vpc_id", ref("aws_vpc.bad.id") } }),
        make_decl("aws_instance", "web", { { "subnet_id", ref("aws_subnet.a.id") } }),
        make_decl("aws_vpc", "good", { { "cidr", "10.1.0.0/16" } }) }) };

  CHECK(r.report.result == strata::apply_result::partial_failure);

  auto const &bad{ r.at("create aws_vpc.bad") };
  CHECK(bad.status == strata::node_status::failed);
  CHECK(bad.error.find("injected failure") != std::string::npos);

  CHECK(r.at("create aws_subnet.a").status == strata::node_status::skipped);
  CHECK(r.at("create aws_subnet.a").error == "create aws_vpc.bad");
  CHECK(r.at("create aws_instance.web").status == strata::node_status::skipped);
  CHECK(r.at("create aws_vpc.good").status == strata::node_status::applied);

  CHECK(f.cloud.call_count(strata::operation::create) == 2);
  auto const stored{ f.store.load() };
  CHECK(stored.resources.size() == 1);
  CHECK(stored.find({ "aws_vpc", "good" }) != nullptr);
}

TEST_CASE("executor resumes after a failure on the next apply") {
  executor_fixture f;
  f.cloud.fail_permanent("flaky", strata::operation::create);

  auto decls{ network() };
  decls[1].attributes["tag"] = "flaky";

  auto const first{ f.apply(decls) };
  CHECK(first.report.result == strata::apply_result::partial_failure);
  CHECK(f.store.load().resources.size() == 1);

  f.cloud.clear_failures();
  auto const second{ f.apply(decls) };
  CHECK(second.report.result == strata::apply_result::success);
  CHECK(second.at("none aws_vpc.main").status == strata::node_status::applied);
  CHECK(second.at("create aws_subnet.a").status == strata::node_status::applied);
  CHECK(f.store.load().resources.size() == 3);
  CHECK(f.cloud.object_count() == 3);
}

TEST_CASE("executor retries transient failures with backoff") {
  executor_fixture f;

  SUBCASE("succeeds within the attempt budget") {
    f.cloud.fail_transient("slow", strata::operation::create, 2);
    auto const r{ f.apply({ make_decl("aws_vpc", "main", { { "tag", "slow" } }) }) };

    CHECK(r.report.result == strata::apply_result::success);
    CHECK(r.at("create aws_vpc.main").attempts == 3);
    CHECK(f.cloud.call_count(strata::operation::create) == 3);
    CHECK(f.cloud.object_count() == 1);
  }

  SUBCASE("gives up when attempts run out") {
    f.cloud.fail_transient("slow", strata::operation::create, 10);
    auto const r{ f.apply({ make_decl("aws_vpc", "main", { { "tag", "slow" } }) }) };

    CHECK(r.report.result == strata::apply_result::partial_failure);
    auto const &a{ r.at("create aws_vpc.main") };
    CHECK(a.status == strata::node_status::failed);
    CHECK(a.attempts == 3);
    CHECK(a.error.find("gave up after 3 attempts") != std::string::npos);
    CHECK(f.cloud.call_count(strata::operation::create) == 3);
  }
}

TEST_CASE("executor treats a missing object on destroy as destroyed") {
  executor_fixture f;
  strata::state_snapshot seeded{ f.store.load() };
  seeded.serial = 1;
  seeded.resources[{ "aws_vpc", "gone" }] =
      make_entry("aws_vpc", "vpc-that-vanished", { { "cidr", "x" } });
  f.store.save(seeded);

  auto const r{ f.apply({}) };
  CHECK(r.report.result == strata::apply_result::success);
  CHECK(r.at("destroy aws_vpc.gone").status == strata::node_status::applied);
  CHECK(f.store.load().resources.empty());
  CHECK(f.store.load().serial == 2);
}

TEST_CASE("executor fails an update whose object is missing") {
  executor_fixture f;
  strata::state_snapshot seeded{ f.store.load() };
  seeded.serial = 1;
  seeded.resources[{ "aws_vpc", "main" }] =
      make_entry("aws_vpc", "vpc-missing", { { "cidr", "x" } });
  f.store.save(seeded);

  auto const r{ f.apply(
      { make_decl("aws_vpc", "main", { { "cidr", "x" }, { "tags", "t" } }) }) };
  CHECK(r.report.result == strata::apply_result::partial_failure);
  CHECK(r.at("update aws_vpc.main").status == strata::node_status::failed);
}

TEST_CASE("executor keeps the old object deposed when its destroy fails") {
  executor_fixture f;
  auto const web{ [](char const *ami) {
    return std::vector<strata::resource_decl>{
      make_decl("aws_instance", "web", { { "ami", ami }, { "tag", "web" } })
    };
  } };

  f.apply(web("ami-1"));
  auto const old_id{ f.store.load().find({ "aws_instance", "web" })->id };

  f.cloud.fail_permanent("web", strata::operation::destroy);
  auto const replaced{ f.apply(web("ami-2")) };
  CHECK(replaced.report.result == strata::apply_result::partial_failure);
  CHECK(replaced.at("create aws_instance.web").status == strata::node_status::applied);
  CHECK(replaced.at("destroy aws_instance.web").status == strata::node_status::failed);

  auto const *entry{ f.store.load().find({ "aws_instance", "web" }) };
  REQUIRE(entry != nullptr);
  CHECK(entry->id != old_id);
  CHECK(entry->deposed == std::vector<std::string>{ old_id });
  CHECK(f.cloud.exists(old_id));

  f.cloud.clear_failures();
  auto const cleanup{ f.apply(web("ami-2")) };
  CHECK(cleanup.report.result == strata::apply_result::success);
  CHECK(cleanup.at("destroy aws_instance.web (deposed " + old_id + ")").status ==
        strata::node_status::applied);
  CHECK(f.store.load().find({ "aws_instance", "web" })->deposed.empty());
  CHECK_FALSE(f.cloud.exists(old_id));
}

TEST_CASE("executor honors cancellation requested before it starts") {
  executor_fixture f;
  f.cancel.request();

  auto const r{ f.apply(network()) };
  CHECK(r.report.result == strata::apply_result::cancelled);
  CHECK(r.report.count(strata::node_status::cancelled) == 3);
  CHECK(f.cloud.calls().empty());
  CHECK(f.store.save_count() == 0);
}

TEST_CASE("executor lets in-flight calls finish after cancellation") {
  executor_fixture f;
  f.cloud.set_latency(200ms);

  std::thread canceller{ [&f] {
    std::this_thread::sleep_for(40ms);
    f.cancel.request();
  } };
  auto const r{ f.apply(network()) };
  canceller.join();

  CHECK(r.report.result == strata::apply_result::cancelled);
  CHECK(r.at("create aws_vpc.main").status == strata::node_status::applied);
  CHECK(r.at("create aws_subnet.a").status == strata::node_status::cancelled);
  CHECK(r.at("create aws_instance.web").status == strata::node_status::cancelled);

  // The finished call was committed before the executor stopped
  CHECK(f.store.load().find({ "aws_vpc", "main" }) != nullptr);
  CHECK(f.cloud.call_count(strata::operation::create) == 1);
}

TEST_CASE("executor stops dispatching when the timeout passes") {
  executor_fixture f;
  f.cloud.set_latency(150ms);
  f.cfg.timeout = 50ms;

  auto const r{ f.apply(network()) };
  CHECK(r.report.result == strata::apply_result::cancelled);
  CHECK(r.at("create aws_vpc.main").status == strata::node_status::applied);
  CHECK(r.report.count(strata::node_status::cancelled) == 2);
}

TEST_CASE("executor halts when a state commit fails") {
  executor_fixture f;
  f.cfg.parallelism = 1;
  failing_store store{ 1 };

  auto const r{ f.apply(independent(3), store) };
  CHECK(r.report.result == strata::apply_result::partial_failure);
  CHECK(r.report.count(strata::node_status::applied) == 1);
  CHECK(r.report.count(strata::node_status::failed) == 1);
  CHECK(r.report.count(strata::node_status::skipped) == 1);

  auto const &failed{ r.at("create aws_vpc.n1") };
  CHECK(failed.status == strata::node_status::failed);
  CHECK(failed.error == "state commit failed: disk full");
  CHECK(store.load().serial == 1);
}
