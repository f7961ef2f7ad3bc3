#include "engine.h"

#include "trace.h"
#include "tui.h"

#include <thread>
#include <utility>

namespace strata {

namespace {

// Provider read with the same retry policy the executor applies to writes
attribute_map read_with_retry(provider &p,
                              std::string const &type,
                              std::string const &id,
                              executor_cfg const &cfg) {
  for (int attempt{ 1 };; ++attempt) {
    try {
      return p.read(type, id);
    } catch (provider_transient_error const &e) {
      if (attempt >= cfg.max_attempts) { throw; }
      auto const delay{ executor_backoff(cfg, attempt + 1) };
      tui::debug("read %s %s: %s; retrying in %lldms",
                 type.c_str(),
                 id.c_str(),
                 e.what(),
                 static_cast<long long>(delay.count()));
      std::this_thread::sleep_for(delay);
    }
  }
}

}  // namespace

engine::engine(state_store &store, provider_registry const &registry, engine_cfg cfg)
    : store_{ store }, registry_{ registry }, cfg_{ std::move(cfg) } {}

plan engine::make_plan(std::vector<resource_decl> const &decls,
                       state_snapshot const &current) const {
  return strata::make_plan(decls, current, registry_);
}

bool engine::refresh(state_snapshot &snapshot) const {
  bool changed{ false };

  for (auto it{ snapshot.resources.begin() }; it != snapshot.resources.end();) {
    auto const &address{ it->first };
    auto &entry{ it->second };
    if (entry.id.empty() || !registry_.find_type(entry.type)) {
      ++it;
      continue;
    }

    attribute_map observed;
    try {
      observed = read_with_retry(registry_.provider_for(entry.type),
                                 entry.type,
                                 entry.id,
                                 cfg_.exec);
    } catch (not_found_error const &) {
      STRATA_TRACE_RESOURCE_MISSING(address.str(), entry.id);
      tui::warn("%s (%s) no longer exists", address.str().c_str(), entry.id.c_str());
      changed = true;
      if (entry.deposed.empty()) {
        it = snapshot.resources.erase(it);
      } else {
        entry.id.clear();
        entry.inputs.clear();
        entry.attributes.clear();
        ++it;
      }
      continue;
    }

    for (auto const &[name, v] : observed) {
      auto const recorded{ entry.attributes.find(name) };
      if (recorded != entry.attributes.end() && recorded->second == v) { continue; }

      auto const input{ entry.inputs.find(name) };
      if (input != entry.inputs.end() && !(input->second == v)) {
        STRATA_TRACE_DRIFT_DETECTED(address.str(), name);
        tui::info("%s: %s changed outside of strata",
                  address.str().c_str(),
                  name.c_str());
        input->second = v;
      }
      changed = true;
    }

    // Attributes removed out of band
    for (auto input{ entry.inputs.begin() }; input != entry.inputs.end();) {
      if (observed.contains(input->first)) {
        ++input;
        continue;
      }
      STRATA_TRACE_DRIFT_DETECTED(address.str(), input->first);
      tui::info("%s: %s removed outside of strata",
                address.str().c_str(),
                input->first.c_str());
      input = entry.inputs.erase(input);
      changed = true;
    }
    for (auto const &[name, _] : entry.attributes) {
      if (!observed.contains(name)) { changed = true; }
    }

    entry.attributes = std::move(observed);
    ++it;
  }

  return changed;
}

apply_report engine::execute(plan const &p, cancellation const &cancel) {
  if (!p.valid()) {
    return apply_report{ .result = apply_result::failed_validation,
                         .diagnostics = p.diagnostics,
                         .final_serial = p.prior_state.serial };
  }

  auto const stored{ store_.load() };
  if (stored.serial != p.prior_state.serial ||
      (stored.serial > 0 && stored.lineage != p.prior_state.lineage)) {
    throw state_conflict_error("State changed since the plan was made (stored serial " +
                               std::to_string(stored.serial) + ", plan computed at " +
                               std::to_string(p.prior_state.serial) + ")");
  }

  state_snapshot working{ p.prior_state };
  return executor{ registry_, store_, cfg_.exec }.run(p, working, cancel);
}

apply_report engine::apply(plan const &p, cancellation const &cancel) {
  auto const lock{ store_.lock(cfg_.lock_ttl) };
  return execute(p, cancel);
}

engine_result engine::run(std::vector<resource_decl> const &decls,
                          bool apply_changes,
                          cancellation const &cancel) {
  auto const lock{ store_.lock(cfg_.lock_ttl) };
  tui::debug("State lock held by %s", lock->info().holder.c_str());

  auto snapshot{ store_.load() };
  if (cfg_.refresh && refresh(snapshot) && apply_changes) {
    ++snapshot.serial;
    store_.save(snapshot);
  }

  engine_result result{ .planned = make_plan(decls, snapshot) };
  if (apply_changes) { result.applied = execute(result.planned, cancel); }
  return result;
}

}  // namespace strata
