#include "resolver.h"

#include "trace.h"

#include <map>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

class resolver_pass {
 public:
  resolver_pass(expansion const &exp, std::set<resource_address> const &state_addresses)
      : exp_{ exp }, state_{ state_addresses } {
    for (std::size_t i{ 0 }; i < exp.nodes.size(); ++i) { index_[exp.nodes[i].address] = i; }
  }

  resolution run() {
    for (std::size_t i{ 0 }; i < exp_.nodes.size(); ++i) {
      auto const &node{ exp_.nodes[i] };
      for (auto const &[name, v] : node.attributes) { walk(i, v, name); }
      for (auto const &dep : node.depends_on) { resolve_explicit(i, dep); }
    }
    return std::move(result_);
  }

 private:
  void walk(std::size_t dependent, value const &v, std::string const &path) {
    if (auto const *ref{ v.get_if<reference>() }) {
      resolve(dependent, *ref, path);
    } else if (auto const *list{ v.get_if<value_list>() }) {
      for (std::size_t i{ 0 }; i < list->size(); ++i) {
        walk(dependent, (*list)[i], path + "[" + std::to_string(i) + "]");
      }
    } else if (auto const *map{ v.get_if<value_map>() }) {
      for (auto const &[key, item] : *map) { walk(dependent, item, path + "." + key); }
    }
  }

  void resolve(std::size_t dependent, reference const &ref, std::string const &path) {
    std::string const base{ ref.type + "." + ref.name };
    auto const collection{ exp_.collections.find(base) };
    bool const is_collection{ collection != exp_.collections.end() };

    switch (ref.k) {
      case reference::kind::direct:
        if (is_collection) {
          return unresolved(dependent,
                            path,
                            ref.str() + " refers to a counted resource; use [index] or [*]");
        }
        return link(dependent, { ref.type, ref.name }, path, false, ref.str());

      case reference::kind::indexed:
        if (!is_collection && index_.contains({ ref.type, ref.name })) {
          return unresolved(dependent, path, ref.str() + " indexes a resource without count");
        }
        return link(dependent, ref.target(), path, false, ref.str());

      case reference::kind::all_instances:
        if (is_collection) {
          for (std::int64_t i{ 0 }; i < collection->second; ++i) {
            add_edge(dependent, index_.at({ ref.type, ref.name, i }), path, false);
          }
          return;
        }
        if (index_.contains({ ref.type, ref.name })) {
          return unresolved(dependent, path, ref.str() + " expands a resource without count");
        }
        return link_state_instances(dependent, ref.type, ref.name, path, ref.str());
    }
  }

  void resolve_explicit(std::size_t dependent, std::string const &text) {
    resource_address target;
    try {
      target = resource_address::parse(text);
    } catch (std::runtime_error const &e) {
      result_.diagnostics.push_back({ .kind = diagnostic_kind::invalid_declaration,
                                      .address = exp_.nodes[dependent].address.str(),
                                      .attribute = "depends_on",
                                      .message = e.what() });
      return;
    }

    if (!target.index()) {
      if (auto const c{ exp_.collections.find(target.base()) }; c != exp_.collections.end()) {
        for (std::int64_t i{ 0 }; i < c->second; ++i) {
          add_edge(dependent,
                   index_.at({ target.type(), target.name(), i }),
                   "depends_on",
                   true);
        }
        return;
      }
    }
    link(dependent, target, "depends_on", true, text);
  }

  void link(std::size_t dependent,
            resource_address const &target,
            std::string const &path,
            bool explicit_dependency,
            std::string const &expr) {
    if (auto const it{ index_.find(target) }; it != index_.end()) {
      add_edge(dependent, it->second, path, explicit_dependency);
    } else if (state_.contains(target)) {
      result_.dangling.push_back({ .dependent = dependent, .attribute = path, .target = target });
    } else {
      unresolved(dependent, path, expr + " names a resource that is not declared");
    }
  }

  void link_state_instances(std::size_t dependent,
                            std::string const &type,
                            std::string const &name,
                            std::string const &path,
                            std::string const &expr) {
    bool found{ false };
    for (auto const &addr : state_) {
      if (addr.type() == type && addr.name() == name) {
        result_.dangling.push_back({ .dependent = dependent, .attribute = path, .target = addr });
        found = true;
      }
    }
    if (!found) { unresolved(dependent, path, expr + " names a resource that is not declared"); }
  }

  void add_edge(std::size_t dependent,
                std::size_t dependency,
                std::string const &path,
                bool explicit_dependency) {
    STRATA_TRACE_EDGE_ADDED(exp_.nodes[dependent].address.str(),
                            exp_.nodes[dependency].address.str(),
                            path);
    result_.edges.push_back({ .dependent = dependent,
                              .dependency = dependency,
                              .attribute = path,
                              .explicit_dependency = explicit_dependency });
  }

  void unresolved(std::size_t dependent, std::string const &path, std::string message) {
    result_.diagnostics.push_back({ .kind = diagnostic_kind::unresolved_reference,
                                    .address = exp_.nodes[dependent].address.str(),
                                    .attribute = path,
                                    .message = std::move(message) });
  }

  expansion const &exp_;
  std::set<resource_address> const &state_;
  std::map<resource_address, std::size_t> index_;
  resolution result_;
};

}  // namespace

resolution resolve_references(expansion const &exp,
                              std::set<resource_address> const &state_addresses) {
  return resolver_pass{ exp, state_addresses }.run();
}

resource_graph build_resource_graph(expansion const &exp,
                                    std::vector<resolved_edge> const &edges) {
  resource_graph result;
  for (auto const &node : exp.nodes) { result.forward.add_node(node.address.str()); }
  for (auto const &e : edges) { result.forward.add_edge(e.dependent, e.dependency); }
  result.cycle = result.forward.find_cycle();
  result.reverse = result.forward.reversed();
  return result;
}

}  // namespace strata
