#include "executor.h"

#include "trace.h"
#include "tui.h"

#include "tbb/concurrent_queue.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <utility>

namespace strata {

std::string_view node_status_name(node_status s) {
  switch (s) {
    case node_status::pending: return "pending";
    case node_status::ready: return "ready";
    case node_status::running: return "running";
    case node_status::applied: return "applied";
    case node_status::failed: return "failed";
    case node_status::skipped: return "skipped";
    case node_status::cancelled: return "cancelled";
  }
  return "unknown";
}

std::string_view apply_result_name(apply_result r) {
  switch (r) {
    case apply_result::success: return "success";
    case apply_result::partial_failure: return "partial_failure";
    case apply_result::cancelled: return "cancelled";
    case apply_result::failed_validation: return "failed_validation";
  }
  return "unknown";
}

std::size_t apply_report::count(node_status s) const {
  return static_cast<std::size_t>(
      std::ranges::count_if(actions, [s](auto const &a) { return a.status == s; }));
}

std::size_t executor_pool_size(executor_cfg const &cfg, std::size_t action_count) {
  auto const wanted{ std::clamp<std::size_t>(cfg.parallelism, 1, kMaxParallelism) };
  return std::min(wanted, std::max<std::size_t>(action_count, 1));
}

std::chrono::milliseconds executor_backoff(executor_cfg const &cfg, int next_attempt) {
  auto delay{ cfg.initial_backoff };
  for (int i{ 2 }; i < next_attempt && delay < cfg.max_backoff; ++i) { delay *= 2; }
  return std::min(delay, cfg.max_backoff);
}

namespace {

using steady_clock = std::chrono::steady_clock;

constexpr std::size_t kStop{ std::numeric_limits<std::size_t>::max() };
constexpr auto kPollInterval{ std::chrono::milliseconds{ 20 } };

struct work_item {
  std::size_t index{ kStop };
  action const *act{ nullptr };
  int attempt{ 0 };
  attribute_map inputs;
};

enum class outcome { ok, transient, permanent };

struct completion {
  std::size_t index{ 0 };
  outcome result{ outcome::ok };
  std::string error;
  std::string id;
  attribute_map attributes;
};

// Completed provider calls, handed from workers back to the dispatcher
class completion_channel {
 public:
  void push(completion c) {
    {
      std::lock_guard lock{ mutex_ };
      done_.push_back(std::move(c));
    }
    cv_.notify_one();
  }

  // Waits until something completes or the deadline passes
  std::deque<completion> take(steady_clock::time_point until) {
    std::unique_lock lock{ mutex_ };
    cv_.wait_until(lock, until, [this] { return !done_.empty(); });
    return std::exchange(done_, {});
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<completion> done_;
};

completion perform(provider_registry const &registry, work_item const &item) {
  auto const &a{ *item.act };
  completion c{ .index = item.index };

  try {
    provider &p{ registry.provider_for(a.type) };
    action_trace_scope trace{ a.address.str(), a.op, item.attempt };

    switch (a.op) {
      case operation::create: {
        auto created{ p.create(a.type, item.inputs) };
        c.id = std::move(created.id);
        c.attributes = std::move(created.attributes);
        break;
      }
      case operation::update:
        c.attributes = p.update(a.type, a.prior_id, item.inputs);
        c.id = a.prior_id;
        break;
      case operation::destroy: p.remove(a.type, a.prior_id); break;
      case operation::none: break;
    }
  } catch (provider_transient_error const &e) {
    c.result = outcome::transient;
    c.error = e.what();
  } catch (not_found_error const &e) {
    if (a.op != operation::destroy) {  // already gone is what a destroy wants
      c.result = outcome::permanent;
      c.error = e.what();
    }
  } catch (provider_error const &e) {
    c.result = outcome::permanent;
    c.error = e.what();
  } catch (std::exception const &e) {
    c.result = outcome::permanent;
    c.error = e.what();
  }
  return c;
}

// Fixed set of threads draining a bounded queue; joined on destruction
class worker_pool : unmovable {
 public:
  worker_pool(std::size_t count,
              provider_registry const &registry,
              completion_channel &channel) {
    queue_.set_capacity(static_cast<std::ptrdiff_t>(count));
    for (std::size_t i{ 0 }; i < count; ++i) {
      threads_.emplace_back([this, &registry, &channel] {
        for (;;) {
          work_item item;
          queue_.pop(item);
          if (item.index == kStop) { return; }
          channel.push(perform(registry, item));
        }
      });
    }
  }

  ~worker_pool() {
    for (std::size_t i{ 0 }; i < threads_.size(); ++i) { queue_.push(work_item{}); }
    for (auto &t : threads_) { t.join(); }
  }

  void submit(work_item item) { queue_.push(std::move(item)); }

 private:
  tbb::concurrent_bounded_queue<work_item> queue_;
  std::vector<std::thread> threads_;
};

struct retry_entry {
  steady_clock::time_point due;
  std::size_t index;

  bool operator>(retry_entry const &o) const { return due > o.due; }
};

enum class halt_reason { none, cancelled, commit_failed };

class apply_run {
 public:
  apply_run(provider_registry const &registry,
            state_store &store,
            executor_cfg const &cfg,
            plan const &p,
            state_snapshot &working,
            cancellation const &cancel)
      : registry_{ registry },
        store_{ store },
        cfg_{ cfg },
        plan_{ p },
        working_{ working },
        cancel_{ cancel },
        status_(p.actions.size(), node_status::pending),
        waiting_on_(p.actions.size(), 0),
        dependents_(p.actions.size()),
        inputs_(p.actions.size()) {
    report_.actions.reserve(p.actions.size());
    for (auto const &a : p.actions) {
      report_.actions.push_back({ .index = a.index,
                                  .address = a.address,
                                  .op = a.op,
                                  .kind = a.kind });
      waiting_on_[a.index] = a.depends_on.size();
      for (std::size_t const dep : a.depends_on) { dependents_[dep].push_back(a.index); }
    }
  }

  apply_report run() {
    auto const parallelism{ executor_pool_size(cfg_, status_.size()) };
    auto const started{ steady_clock::now() };
    std::optional<steady_clock::time_point> deadline;
    if (cfg_.timeout) { deadline = started + *cfg_.timeout; }

    {
      worker_pool pool{ parallelism, registry_, channel_ };

      for (std::size_t i{ 0 }; i < status_.size(); ++i) {
        if (waiting_on_[i] == 0) { make_ready(i); }
      }

      for (;;) {
        if (halt_ == halt_reason::none) {
          if (cancel_.requested()) {
            tui::warn("Cancellation requested; waiting for in-flight operations");
            halt_ = halt_reason::cancelled;
          } else if (deadline && steady_clock::now() >= *deadline) {
            tui::warn("Apply timed out; waiting for in-flight operations");
            halt_ = halt_reason::cancelled;
          }
        }

        if (halt_ == halt_reason::none) {
          promote_due_retries();
          while (!ready_.empty() && in_flight_ < parallelism) {
            auto const i{ ready_.front() };
            ready_.pop_front();
            dispatch(i, pool);
          }
        }

        bool const idle{ ready_.empty() && retries_.empty() };
        if (in_flight_ == 0 && (halt_ != halt_reason::none || idle)) { break; }

        auto wake{ steady_clock::now() + kPollInterval };
        if (!retries_.empty()) { wake = std::min(wake, retries_.top().due); }
        if (deadline) { wake = std::min(wake, *deadline); }

        for (auto &c : channel_.take(wake)) {
          --in_flight_;
          complete(std::move(c));
        }
      }
    }

    finish_leftovers();

    report_.final_serial = working_.serial;
    if (report_.count(node_status::cancelled) > 0) {
      report_.result = apply_result::cancelled;
    } else if (report_.count(node_status::failed) > 0 ||
               report_.count(node_status::skipped) > 0) {
      report_.result = apply_result::partial_failure;
    } else {
      report_.result = apply_result::success;
    }
    return std::move(report_);
  }

 private:
  action const &at(std::size_t i) const { return plan_.actions[i]; }

  void make_ready(std::size_t i) {
    status_[i] = node_status::ready;
    report_.actions[i].status = node_status::ready;
    STRATA_TRACE_ACTION_READY(at(i).address.str(), at(i).op);
    ready_.push_back(i);
  }

  void promote_due_retries() {
    auto const now{ steady_clock::now() };
    while (!retries_.empty() && retries_.top().due <= now) {
      ready_.push_back(retries_.top().index);
      retries_.pop();
    }
  }

  // References resolve against what has been committed so far; every referenced
  // resource has already been applied, so its id and attributes are real.
  attribute_map resolve_inputs(action const &a) const {
    return attribute_map_substitute_references(a.desired, [this](reference const &ref) {
      auto const *entry{ working_.find(ref.target()) };
      if (!entry || entry->id.empty()) {
        throw std::runtime_error("reference " + ref.str() + " has no applied object");
      }
      return state_attribute(*entry, ref.attribute_path).value_or(value{});
    });
  }

  void dispatch(std::size_t i, worker_pool &pool) {
    auto const &a{ at(i) };

    if (a.op == operation::none) {
      succeed(i);
      return;
    }

    if (report_.actions[i].attempts == 0 && a.op != operation::destroy) {
      try {
        inputs_[i] = resolve_inputs(a);
      } catch (std::runtime_error const &e) {
        fail(i, e.what());
        return;
      }
    }

    int const attempt{ ++report_.actions[i].attempts };
    status_[i] = node_status::running;
    report_.actions[i].status = node_status::running;
    tui::debug("%s (attempt %d)", a.label().c_str(), attempt);

    pool.submit({ .index = i, .act = &a, .attempt = attempt, .inputs = inputs_[i] });
    ++in_flight_;
  }

  void complete(completion c) {
    auto const i{ c.index };
    auto const &a{ at(i) };
    auto &r{ report_.actions[i] };

    switch (c.result) {
      case outcome::ok:
        try {
          commit(a, c);
        } catch (std::exception const &e) {
          tui::error("Failed to record %s: %s", a.label().c_str(), e.what());
          fail(i, std::string{ "state commit failed: " } + e.what());
          halt_ = halt_reason::commit_failed;
          return;
        }
        r.id = c.id;
        succeed(i);
        return;

      case outcome::transient:
        if (halt_ != halt_reason::none) {
          abandon(i);
        } else if (r.attempts < cfg_.max_attempts) {
          auto const delay{ executor_backoff(cfg_, r.attempts + 1) };
          STRATA_TRACE_ACTION_RETRY(a.address.str(),
                                    a.op,
                                    r.attempts + 1,
                                    static_cast<std::int64_t>(delay.count()),
                                    c.error);
          tui::debug("%s: %s; retrying in %lldms",
                     a.label().c_str(),
                     c.error.c_str(),
                     static_cast<long long>(delay.count()));
          status_[i] = node_status::pending;
          r.status = node_status::pending;
          retries_.push({ .due = steady_clock::now() + delay, .index = i });
        } else {
          fail(i,
               "gave up after " + std::to_string(r.attempts) + " attempts: " + c.error);
        }
        return;

      case outcome::permanent: fail(i, c.error); return;
    }
  }

  void commit(action const &a, completion const &c) {
    state_snapshot next{ working_ };

    switch (a.op) {
      case operation::create: {
        auto &entry{ next.resources[a.address] };
        if (a.replace == replace_mode::create_before_destroy && !entry.id.empty()) {
          entry.deposed.push_back(entry.id);
        }
        entry.type = a.type;
        entry.id = c.id;
        entry.inputs = inputs_[a.index];
        entry.attributes = c.attributes;
        entry.dependencies = a.dependencies;
        break;
      }

      case operation::update: {
        auto &entry{ next.resources[a.address] };
        entry.type = a.type;
        if (!c.id.empty()) { entry.id = c.id; }
        entry.inputs = inputs_[a.index];
        entry.attributes = c.attributes;
        entry.dependencies = a.dependencies;
        break;
      }

      case operation::destroy: {
        auto const it{ next.resources.find(a.address) };
        if (it == next.resources.end()) { break; }
        auto &entry{ it->second };
        if (auto const d{ std::ranges::find(entry.deposed, a.prior_id) };
            d != entry.deposed.end()) {
          entry.deposed.erase(d);
        } else if (entry.id == a.prior_id) {
          entry.id.clear();
          entry.inputs.clear();
          entry.attributes.clear();
          entry.dependencies.clear();
        }
        if (entry.id.empty() && entry.deposed.empty()) { next.resources.erase(it); }
        break;
      }

      case operation::none: return;
    }

    next.serial = working_.serial + 1;
    store_.save(next);
    working_ = std::move(next);
    STRATA_TRACE_STATE_COMMITTED(a.address.str(), working_.serial);
  }

  void succeed(std::size_t i) {
    status_[i] = node_status::applied;
    report_.actions[i].status = node_status::applied;
    for (std::size_t const k : dependents_[i]) {
      if (--waiting_on_[k] == 0 && status_[k] == node_status::pending) { make_ready(k); }
    }
  }

  void fail(std::size_t i, std::string const &error) {
    auto const &a{ at(i) };
    auto &r{ report_.actions[i] };
    status_[i] = node_status::failed;
    r.status = node_status::failed;
    r.error = error;
    STRATA_TRACE_ACTION_FAILED(a.address.str(), a.op, r.attempts, error);
    tui::error("%s failed: %s", a.label().c_str(), error.c_str());

    // Everything downstream is still pending: nothing runs before all its
    // dependencies have been applied
    auto const label{ a.label() };
    std::vector<std::size_t> todo{ dependents_[i] };
    while (!todo.empty()) {
      auto const k{ todo.back() };
      todo.pop_back();
      if (status_[k] != node_status::pending) { continue; }
      status_[k] = node_status::skipped;
      report_.actions[k].status = node_status::skipped;
      report_.actions[k].error = label;
      STRATA_TRACE_ACTION_SKIPPED(at(k).address.str(), at(k).op, label);
      todo.insert(todo.end(), dependents_[k].begin(), dependents_[k].end());
    }
  }

  void cancel(std::size_t i) {
    status_[i] = node_status::cancelled;
    report_.actions[i].status = node_status::cancelled;
    STRATA_TRACE_ACTION_CANCELLED(at(i).address.str(), at(i).op);
  }

  // Not going to run: skipped after a commit failure, cancelled otherwise
  void abandon(std::size_t i) {
    if (halt_ != halt_reason::commit_failed) {
      cancel(i);
      return;
    }
    status_[i] = node_status::skipped;
    report_.actions[i].status = node_status::skipped;
    report_.actions[i].error = "state commit failed";
    STRATA_TRACE_ACTION_SKIPPED(at(i).address.str(), at(i).op, "state commit failed");
  }

  void finish_leftovers() {
    for (std::size_t i{ 0 }; i < status_.size(); ++i) {
      if (status_[i] == node_status::pending || status_[i] == node_status::ready) {
        abandon(i);
      }
    }
  }

  provider_registry const &registry_;
  state_store &store_;
  executor_cfg const &cfg_;
  plan const &plan_;
  state_snapshot &working_;
  cancellation const &cancel_;

  apply_report report_;
  std::vector<node_status> status_;
  std::vector<std::size_t> waiting_on_;
  std::vector<std::vector<std::size_t>> dependents_;
  std::vector<attribute_map> inputs_;

  std::deque<std::size_t> ready_;
  std::priority_queue<retry_entry, std::vector<retry_entry>, std::greater<>> retries_;
  std::size_t in_flight_{ 0 };
  halt_reason halt_{ halt_reason::none };
  completion_channel channel_;
};

}  // namespace

executor::executor(provider_registry const &registry,
                   state_store &store,
                   executor_cfg cfg)
    : registry_{ registry }, store_{ store }, cfg_{ std::move(cfg) } {}

apply_report executor::run(plan const &p,
                           state_snapshot &working,
                           cancellation const &cancel) {
  return apply_run{ registry_, store_, cfg_, p, working, cancel }.run();
}

}  // namespace strata
