#include "manifest.h"

#include "executor.h"
#include "sol_util.h"
#include "tui.h"
#include "value.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
}

#include <algorithm>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace strata {

namespace {

value lua_to_value(sol::object const &obj, std::string const &where);

// Array-like tables (keys 1..n) become lists, string-keyed tables become maps
value table_to_value(sol::table const &table, std::string const &where) {
  value_map named;
  std::map<std::int64_t, value> positional;

  for (auto const &[k, v] : table) {
    if (sol_util_is_integer(k)) {
      auto const i{ k.as<std::int64_t>() };
      positional[i] = lua_to_value(v, where + "[" + std::to_string(i) + "]");
    } else if (k.get_type() == sol::type::string) {
      auto const key{ k.as<std::string>() };
      named[key] = lua_to_value(v, where + "." + key);
    } else {
      throw std::runtime_error(where + ": table keys must be strings or integers");
    }
  }

  if (!named.empty() && !positional.empty()) {
    throw std::runtime_error(where + ": table mixes list entries and named entries");
  }
  if (!named.empty()) { return named; }

  value_list list;
  std::int64_t expected{ 1 };
  for (auto &[i, v] : positional) {
    if (i != expected++) { throw std::runtime_error(where + ": list has holes"); }
    list.push_back(std::move(v));
  }
  return list;
}

value lua_to_value(sol::object const &obj, std::string const &where) {
  switch (obj.get_type()) {
    case sol::type::none:
    case sol::type::lua_nil: return {};
    case sol::type::boolean: return obj.as<bool>();
    case sol::type::number:
      if (sol_util_is_integer(obj)) { return obj.as<std::int64_t>(); }
      return obj.as<double>();
    case sol::type::string: return obj.as<std::string>();
    case sol::type::table: return table_to_value(obj.as<sol::table>(), where);
    case sol::type::userdata:
      if (obj.is<reference>()) { return obj.as<reference>(); }
      if (obj.is<count_index>()) { return count_index{}; }
      break;
    default: break;
  }
  throw std::runtime_error(where + ": unsupported " +
                           sol::type_name(obj.lua_state(), obj.get_type()) + " value");
}

void install_bindings(sol::state &lua) {
  lua.new_usertype<reference>("strata_reference",
                              sol::no_constructor,
                              sol::meta_function::to_string,
                              &reference::str);
  lua.new_usertype<count_index>("strata_count_index", sol::no_constructor);

  lua.set_function("ref", [](std::string const &expr) { return reference::parse(expr); });
  lua.set_function("count_index", [] { return count_index{}; });

  lua.set_function("print", [](sol::this_state state, sol::variadic_args args) {
    lua_State *L{ state };
    std::string line;
    bool first{ true };
    for (auto const &arg : args) {
      if (!first) { line.push_back('\t'); }
      first = false;
      std::size_t len{ 0 };
      char const *s{ luaL_tolstring(L, arg.stack_index(), &len) };
      line.append(s, len);
      lua_pop(L, 1);
    }
    tui::info("%s", line.c_str());
  });
}

std::vector<std::string> string_list(sol::table const &table,
                                     std::string const &context) {
  std::vector<std::string> result;
  for (std::size_t i{ 1 }; i <= table.size(); ++i) {
    sol::object item = table[i];
    if (item.get_type() != sol::type::string) {
      throw std::runtime_error(context + " must contain only strings");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

resource_decl parse_resource(sol::table const &t, std::string const &context) {
  resource_decl decl{ .type = sol_util_get_required<std::string>(t, "type", context),
                      .name = sol_util_get_required<std::string>(t, "name", context) };
  std::string const where{ decl.type + "." + decl.name };

  if (auto attrs{ sol_util_get_optional<sol::table>(t, "attributes", context) }) {
    auto v{ table_to_value(*attrs, where) };
    if (auto const *named{ v.get_if<value_map>() }) {
      decl.attributes = *named;
    } else if (!v.get_if<value_list>()->empty()) {
      throw std::runtime_error(context + ": attributes must be keyed by name");
    }
  }

  if (auto deps{ sol_util_get_optional<sol::table>(t, "depends_on", context) }) {
    decl.depends_on = string_list(*deps, context + ": depends_on");
  }

  sol::object count = t["count"];
  if (count.valid() && count.get_type() != sol::type::lua_nil) {
    if (!sol_util_is_integer(count)) {
      throw std::runtime_error(context + ": count must be an integer");
    }
    decl.count = count.as<std::int64_t>();
  }

  return decl;
}

std::vector<resource_type> parse_types(sol::table const &types) {
  std::vector<resource_type> result;
  for (auto const &[k, v] : types) {
    if (k.get_type() != sol::type::string || v.get_type() != sol::type::table) {
      throw std::runtime_error("TYPES must map type names to tables");
    }

    auto const name{ k.as<std::string>() };
    std::string const context{ "TYPES." + name };
    sol::table const spec{ v.as<sol::table>() };

    resource_type type{ .name = name };
    type.create_before_destroy =
        sol_util_get_optional<bool>(spec, "create_before_destroy", context)
            .value_or(false);
    if (auto mut{ sol_util_get_optional<sol::table>(spec, "mutable", context) }) {
      for (auto &attr : string_list(*mut, context + ".mutable")) {
        type.mutable_attributes.insert(std::move(attr));
      }
    }
    result.push_back(std::move(type));
  }

  std::ranges::sort(result, {}, &resource_type::name);
  return result;
}

manifest_cfg parse_config(sol::table const &c) {
  auto positive{ [&c](char const *key) {
    auto const v{ sol_util_get_optional<std::int64_t>(c, key, "CONFIG") };
    if (v && *v < 1) {
      throw std::runtime_error(std::string("CONFIG: ") + key + " must be at least 1");
    }
    return v;
  } };

  manifest_cfg cfg;
  if (auto v{ positive("parallelism") }) {
    if (static_cast<std::uint64_t>(*v) > kMaxParallelism) {
      throw std::runtime_error("CONFIG: parallelism must be at most " +
                               std::to_string(kMaxParallelism));
    }
    cfg.parallelism = static_cast<std::size_t>(*v);
  }
  if (auto v{ positive("max_attempts") }) { cfg.max_attempts = static_cast<int>(*v); }
  if (auto v{ positive("backoff_ms") }) { cfg.backoff = std::chrono::milliseconds{ *v }; }
  if (auto v{ positive("max_backoff_ms") }) {
    cfg.max_backoff = std::chrono::milliseconds{ *v };
  }
  if (auto v{ positive("timeout_s") }) { cfg.timeout = std::chrono::seconds{ *v }; }
  if (auto v{ positive("lock_ttl_s") }) { cfg.lock_ttl = std::chrono::seconds{ *v }; }
  if (auto v{ sol_util_get_optional<std::string>(c, "state", "CONFIG") }) {
    cfg.state_path = *v;
  }
  if (auto v{ sol_util_get_optional<std::string>(c, "cloud", "CONFIG") }) {
    cfg.cloud_root = *v;
  }
  return cfg;
}

}  // namespace

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / "strata.lua" };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  }
  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error("manifest not found (discovery failed)");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  auto const script{ util_load_file(manifest_path) };
  return load(script.c_str(), manifest_path);
}

std::unique_ptr<manifest> manifest::load(char const *script,
                                         std::filesystem::path const &manifest_path) {
  auto lua{ sol_util_make_lua_state() };
  install_bindings(*lua);

  if (sol::protected_function_result const result{
          lua->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute manifest script: ") +
                             err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  sol::table globals{ lua->globals() };
  auto resources{ sol_util_get_required<sol::table>(globals, "RESOURCES", "manifest") };
  for (std::size_t i{ 1 }; i <= resources.size(); ++i) {
    std::string const context{ "RESOURCES[" + std::to_string(i) + "]" };
    sol::object item = resources[i];
    if (item.get_type() != sol::type::table) {
      throw std::runtime_error(context + " must be a table");
    }
    m->resources.push_back(parse_resource(item.as<sol::table>(), context));
  }

  if (auto types{ sol_util_get_optional<sol::table>(globals, "TYPES", "manifest") }) {
    m->types = parse_types(*types);
  }
  if (auto config{ sol_util_get_optional<sol::table>(globals, "CONFIG", "manifest") }) {
    m->cfg = parse_config(*config);
  }

  tui::debug("Manifest declares %zu resources and %zu types",
             m->resources.size(),
             m->types.size());
  return m;
}

}  // namespace strata
