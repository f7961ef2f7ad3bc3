#include "planner.h"

#include "graph.h"
#include "resolver.h"
#include "trace.h"
#include "util.h"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

constexpr std::size_t kNone{ std::numeric_limits<std::size_t>::max() };

struct node_plan {
  action_kind kind{ action_kind::noop };
  replace_mode mode{ replace_mode::none };
  attribute_map desired;   // [*] expanded, references intact
  attribute_map resolved;  // references replaced by best-known values
  std::vector<std::string> changed;
};

std::vector<std::string> diff_attributes(attribute_map const &desired,
                                         attribute_map const &recorded) {
  std::vector<std::string> changed;
  for (auto const &[name, v] : desired) {
    auto const it{ recorded.find(name) };
    if (it == recorded.end() || !(v == it->second)) { changed.push_back(name); }
  }
  for (auto const &[name, _] : recorded) {
    if (!desired.contains(name)) { changed.push_back(name); }
  }
  std::ranges::sort(changed);
  return changed;
}

// ref("t.n[*].a") becomes a list of indexed references, one per instance
value expand_all_instances(value const &v, expansion const &exp) {
  return value_substitute_references(v, [&exp](reference const &ref) -> value {
    if (ref.k != reference::kind::all_instances) { return ref; }

    auto const it{ exp.collections.find(ref.type + "." + ref.name) };
    std::int64_t const count{ it == exp.collections.end() ? 0 : it->second };

    value_list items;
    for (std::int64_t i{ 0 }; i < count; ++i) {
      reference instance{ ref };
      instance.k = reference::kind::indexed;
      instance.index = i;
      items.emplace_back(std::move(instance));
    }
    return items;
  });
}

class planner {
 public:
  planner(std::vector<resource_decl> const &decls,
          state_snapshot const &current,
          provider_registry const &registry)
      : decls_{ decls }, current_{ current }, registry_{ registry } {}

  plan run() {
    plan result;
    result.prior_state = current_;

    exp_ = expand_declarations(decls_);
    diagnostics_ = exp_.diagnostics;
    check_types();

    auto res{ resolve_references(exp_, current_.addresses()) };
    diagnostics_.insert(diagnostics_.end(),
                        res.diagnostics.begin(),
                        res.diagnostics.end());

    graph_ = build_resource_graph(exp_, res.edges);
    if (graph_.cycle) {
      diagnostics_.push_back({ .kind = diagnostic_kind::cycle,
                               .address = graph_.cycle->front(),
                               .message = "dependency cycle",
                               .cycle_path = *graph_.cycle });
    }

    for (auto const &d : res.dangling) {
      diagnostics_.push_back(
          { .kind = diagnostic_kind::dangling_reference,
            .address = exp_.nodes[d.dependent].address.str(),
            .attribute = d.attribute,
            .message = "references " + d.target.str() +
                       ", which is no longer declared and would be destroyed" });
    }

    if (!diagnostics_.empty()) {
      result.diagnostics = std::move(diagnostics_);
      return result;
    }

    for (std::size_t i{ 0 }; i < exp_.nodes.size(); ++i) {
      index_.emplace(exp_.nodes[i].address, i);
    }

    order_ = graph_.forward.topo_order();
    teardown_ = graph_.reverse.topo_order();
    nodes_.resize(exp_.nodes.size());
    for (std::size_t const i : order_) { classify(i); }
    propagate_create_before_destroy();

    build_actions();
    if (auto cycle{ graph_actions_.find_cycle() }) {
      result.diagnostics.push_back({ .kind = diagnostic_kind::cycle,
                                     .address = cycle->front(),
                                     .message = "conflicting replacement ordering",
                                     .cycle_path = std::move(*cycle) });
      return result;
    }

    result.actions = linearize();
    for (auto const &a : result.actions) {
      STRATA_TRACE_ACTION_PLANNED(a.address.str(), a.kind, a.op, a.reason);
    }
    return result;
  }

 private:
  void check_types() {
    for (auto const &node : exp_.nodes) {
      if (!registry_.find_type(node.type())) {
        diagnostics_.push_back({ .kind = diagnostic_kind::unknown_type,
                                 .address = node.address.str(),
                                 .message = "no provider handles type " + node.type() });
      }
    }
    for (auto const &[address, entry] : current_.resources) {
      if (registry_.find_type(entry.type)) { continue; }
      bool const declared{ std::ranges::any_of(
          exp_.nodes, [&](auto const &node) { return node.address == address; }) };
      if (!declared) {
        diagnostics_.push_back({ .kind = diagnostic_kind::unknown_type,
                                 .address = address.str(),
                                 .message = "recorded object of type " + entry.type +
                                            " has no provider to destroy it" });
      }
    }
  }

  value lookup(reference const &ref) const {
    auto const t{ index_.at(ref.target()) };
    auto const &target{ nodes_[t] };
    auto const *entry{ current_.find(ref.target()) };

    switch (target.kind) {
      case action_kind::noop:
        return state_attribute(*entry, ref.attribute_path).value_or(value{});

      case action_kind::update:
        if (ref.attribute_path.size() == 1 && ref.attribute_path.front() == "id") {
          return entry->id;
        }
        // Attributes the update does not send keep their recorded values
        if (!target.resolved.contains(ref.attribute_path.front())) {
          if (auto v{ state_attribute(*entry, ref.attribute_path) }) { return *v; }
        }
        [[fallthrough]];

      default:
        if (auto v{ value_lookup(target.resolved, ref.attribute_path) };
            v && v->is_known()) {
          return *v;
        }
        return unknown_value{ ref.str() };
    }
  }

  void classify(std::size_t i) {
    auto const &node{ exp_.nodes[i] };
    auto &np{ nodes_[i] };

    for (auto const &[name, v] : node.attributes) {
      np.desired[name] = expand_all_instances(v, exp_);
    }
    np.resolved = attribute_map_substitute_references(
        np.desired,
        [this](reference const &ref) { return lookup(ref); });

    auto const *entry{ current_.find(node.address) };
    if (!entry || entry->id.empty()) {
      np.kind = action_kind::create;
      return;
    }

    np.changed = diff_attributes(np.resolved, entry->inputs);
    if (np.changed.empty()) {
      np.kind = action_kind::noop;
      return;
    }

    auto const *type{ registry_.find_type(node.type()) };
    bool const in_place{ std::ranges::all_of(np.changed, [type](auto const &attr) {
      return type->is_mutable(attr);
    }) };

    if (in_place) {
      np.kind = action_kind::update;
    } else {
      np.kind = action_kind::replace;
      np.mode = type->create_before_destroy ? replace_mode::create_before_destroy
                                            : replace_mode::destroy_before_create;
    }
  }

  bool replaced_cbd(resource_address const &address) const {
    auto const it{ index_.find(address) };
    if (it == index_.end()) { return false; }
    auto const &np{ nodes_[it->second] };
    return np.kind == action_kind::replace &&
           np.mode == replace_mode::create_before_destroy;
  }

  // A destroy-first replacement cannot sit under a create-first one: the two orderings
  // conflict, so the dependency is switched to create-first as well.
  void propagate_create_before_destroy() {
    bool changed{ true };
    while (changed) {
      changed = false;
      for (std::size_t const i : teardown_) {
        auto &np{ nodes_[i] };
        if (np.kind != action_kind::replace ||
            np.mode != replace_mode::destroy_before_create) {
          continue;
        }

        bool needs_cbd{ std::ranges::any_of(graph_.reverse.dependencies(i), [&](auto k) {
          return replaced_cbd(exp_.nodes[k].address);
        }) };

        auto const me{ exp_.nodes[i].address.str() };
        for (auto const &[address, entry] : current_.resources) {
          if (needs_cbd) { break; }
          needs_cbd = replaced_cbd(address) &&
                      std::ranges::find(entry.dependencies, me) !=
                          entry.dependencies.end();
        }

        if (needs_cbd) {
          np.mode = replace_mode::create_before_destroy;
          changed = true;
        }
      }
    }
  }

  std::size_t add_action(action a) {
    a.index = actions_.size();
    graph_actions_.add_node(a.label());
    actions_.push_back(std::move(a));
    return actions_.size() - 1;
  }

  action make_action(std::size_t i, operation op) const {
    auto const &node{ exp_.nodes[i] };
    auto const &np{ nodes_[i] };
    auto const *entry{ current_.find(node.address) };

    action a{ .address = node.address,
              .type = node.type(),
              .kind = np.kind,
              .op = op,
              .replace = np.mode,
              .prior_id = entry ? entry->id : std::string{},
              .changed_attributes = np.changed };

    if (op == operation::create || op == operation::update || op == operation::none) {
      a.desired = np.desired;
      for (std::size_t const dep : graph_.forward.dependencies(i)) {
        a.dependencies.push_back(exp_.nodes[dep].address.str());
      }
      std::ranges::sort(a.dependencies);
    }

    switch (np.kind) {
      case action_kind::create: a.reason = "not yet created"; break;
      case action_kind::update:
        a.reason = "update in place: " + util_join(np.changed, ", ");
        break;
      case action_kind::replace:
        a.reason = "forces replacement: " + util_join(np.changed, ", ");
        break;
      default: break;
    }
    return a;
  }

  void build_actions() {
    std::vector<std::size_t> create_side(exp_.nodes.size(), kNone);
    std::vector<std::size_t> destroy_side(exp_.nodes.size(), kNone);
    std::map<resource_address, std::size_t> destroys;  // current-object destroys only

    for (std::size_t const i : order_) {
      auto const &np{ nodes_[i] };
      switch (np.kind) {
        case action_kind::noop:
          create_side[i] = add_action(make_action(i, operation::none));
          break;
        case action_kind::create:
          create_side[i] = add_action(make_action(i, operation::create));
          break;
        case action_kind::update:
          create_side[i] = add_action(make_action(i, operation::update));
          break;
        case action_kind::replace:
          if (np.mode == replace_mode::destroy_before_create) {
            destroy_side[i] = add_action(make_action(i, operation::destroy));
            create_side[i] = add_action(make_action(i, operation::create));
          } else {
            create_side[i] = add_action(make_action(i, operation::create));
            destroy_side[i] = add_action(make_action(i, operation::destroy));
          }
          destroys[exp_.nodes[i].address] = destroy_side[i];
          break;
        case action_kind::destroy: break;
      }
    }

    // Orphans: recorded but no longer declared
    std::vector<std::pair<resource_address, std::size_t>> orphans;
    for (auto const &[address, entry] : current_.resources) {
      if (index_.contains(address) || entry.id.empty()) { continue; }
      auto const idx{ add_action(action{ .address = address,
                                         .type = entry.type,
                                         .kind = action_kind::destroy,
                                         .op = operation::destroy,
                                         .prior_id = entry.id,
                                         .reason = "no longer declared" }) };
      destroys[address] = idx;
      orphans.emplace_back(address, idx);
    }

    // Leftovers from create-before-destroy replacements whose destroy never succeeded
    std::vector<std::pair<resource_address, std::size_t>> deposed;
    for (auto const &[address, entry] : current_.resources) {
      for (auto const &id : entry.deposed) {
        auto const idx{ add_action(action{ .address = address,
                                           .type = entry.type,
                                           .kind = action_kind::destroy,
                                           .op = operation::destroy,
                                           .deposed = true,
                                           .prior_id = id,
                                           .reason = "deposed object " + id }) };
        deposed.emplace_back(address, idx);
      }
    }

    // Dependents are created or updated after what they reference
    for (std::size_t i{ 0 }; i < exp_.nodes.size(); ++i) {
      for (std::size_t const dep : graph_.forward.dependencies(i)) {
        graph_actions_.add_edge(create_side[i], create_side[dep]);
      }
    }

    for (std::size_t i{ 0 }; i < exp_.nodes.size(); ++i) {
      if (nodes_[i].kind != action_kind::replace) { continue; }
      if (nodes_[i].mode == replace_mode::destroy_before_create) {
        graph_actions_.add_edge(create_side[i], destroy_side[i]);
      } else {
        graph_actions_.add_edge(destroy_side[i], create_side[i]);
        for (std::size_t const k : graph_.reverse.dependencies(i)) {
          graph_actions_.add_edge(destroy_side[i], create_side[k]);
        }
      }
    }

    // An object is destroyed only after everything that depended on it when it was
    // applied has been destroyed
    for (auto const &[address, entry] : current_.resources) {
      auto const user{ destroys.find(address) };
      if (user == destroys.end()) { continue; }
      for (auto const &dep : entry.dependencies) {
        resource_address dep_address;
        try {
          dep_address = resource_address::parse(dep);
        } catch (std::runtime_error const &) {
          continue;  // recorded by an older run under a malformed name; nothing to order
        }
        if (auto const used{ destroys.find(dep_address) };
            used != destroys.end() && used->second != user->second) {
          graph_actions_.add_edge(used->second, user->second);
        }
      }
    }

    // An orphan is destroyed only after declared resources stop pointing at it
    for (auto const &[address, idx] : orphans) {
      auto const name{ address.str() };
      for (auto const &[user_address, entry] : current_.resources) {
        auto const it{ index_.find(user_address) };
        if (it == index_.end()) { continue; }
        if (std::ranges::find(entry.dependencies, name) != entry.dependencies.end()) {
          graph_actions_.add_edge(idx, create_side[it->second]);
        }
      }
    }

    for (auto const &[address, idx] : deposed) {
      auto const it{ index_.find(address) };
      if (it == index_.end()) { continue; }
      for (std::size_t const k : graph_.reverse.dependencies(it->second)) {
        graph_actions_.add_edge(idx, create_side[k]);
      }
    }
  }

  std::vector<action> linearize() {
    auto const order{ graph_actions_.topo_order() };

    std::vector<std::size_t> position(order.size());
    for (std::size_t p{ 0 }; p < order.size(); ++p) { position[order[p]] = p; }

    std::vector<action> result;
    result.reserve(order.size());
    for (std::size_t const old : order) {
      action a{ std::move(actions_[old]) };
      a.index = position[old];
      for (std::size_t const dep : graph_actions_.dependencies(old)) {
        a.depends_on.push_back(position[dep]);
      }
      std::ranges::sort(a.depends_on);
      result.push_back(std::move(a));
    }
    return result;
  }

  std::vector<resource_decl> const &decls_;
  state_snapshot const &current_;
  provider_registry const &registry_;

  expansion exp_;
  std::vector<diagnostic> diagnostics_;
  resource_graph graph_;
  std::map<resource_address, std::size_t> index_;
  std::vector<std::size_t> order_;     // dependencies first
  std::vector<std::size_t> teardown_;  // dependents first
  std::vector<node_plan> nodes_;

  std::vector<action> actions_;
  dependency_graph graph_actions_;
};

}  // namespace

std::string action::label() const {
  std::string out{ operation_name(op) };
  out.push_back(' ');
  out.append(address.str());
  if (deposed) { out += " (deposed " + prior_id + ")"; }
  return out;
}

bool plan::has_changes() const {
  return std::ranges::any_of(actions,
                             [](auto const &a) { return a.op != operation::none; });
}

plan make_plan(std::vector<resource_decl> const &decls,
               state_snapshot const &current,
               provider_registry const &registry) {
  return planner{ decls, current, registry }.run();
}

plan_summary plan_summarize(plan const &p) {
  plan_summary s;
  for (auto const &a : p.actions) {
    switch (a.kind) {
      case action_kind::create: ++s.add; break;
      case action_kind::update: ++s.change; break;
      case action_kind::replace:
        if (a.op == operation::create) { ++s.replace; }
        break;
      case action_kind::destroy: ++s.destroy; break;
      case action_kind::noop: break;
    }
  }
  return s;
}

std::string plan_summary_line(plan_summary const &s) {
  return "Plan: " + std::to_string(s.add) + " to add, " + std::to_string(s.change) +
         " to change, " + std::to_string(s.replace) + " to replace, " +
         std::to_string(s.destroy) + " to destroy.";
}

std::vector<std::string> plan_render(plan const &p) {
  std::vector<std::string> lines;
  for (auto const &a : p.actions) {
    std::string marker;
    switch (a.kind) {
      case action_kind::noop: continue;
      case action_kind::create: marker = "+"; break;
      case action_kind::update: marker = "~"; break;
      case action_kind::destroy: marker = "-"; break;
      case action_kind::replace:
        if (a.op != operation::create) { continue; }  // one line per replaced resource
        marker = a.replace == replace_mode::create_before_destroy ? "+/-" : "-/+";
        break;
    }

    std::string line{ marker + " " + a.address.str() };
    if (a.deposed) {
      line += " (deposed " + a.prior_id + ")";
    } else if (!a.changed_attributes.empty()) {
      line += " (" + util_join(a.changed_attributes, ", ") + ")";
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace strata
