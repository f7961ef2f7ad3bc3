#include "state.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "value_json.h"

#include "picojson.h"

#include <stdexcept>
#include <utility>

namespace strata {

namespace {

constexpr std::int64_t kStateFormatVersion{ 1 };

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string lock_holder() {
  return platform::host_name() + ":" + std::to_string(platform::process_id());
}

attribute_map attributes_from_json(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end()) { return {}; }
  if (!it->second.is<picojson::object>()) {
    throw std::runtime_error(std::string("State entry field '") + key +
                             "' must be an object");
  }
  return attribute_map_from_json(it->second.get<picojson::object>());
}

picojson::value strings_to_json(std::vector<std::string> const &items) {
  picojson::array arr;
  for (auto const &s : items) { arr.emplace_back(s); }
  return picojson::value(arr);
}

std::vector<std::string> strings_from_json(picojson::object const &obj, char const *key) {
  std::vector<std::string> result;
  auto const it{ obj.find(key) };
  if (it == obj.end()) { return result; }
  if (!it->second.is<picojson::array>()) {
    throw std::runtime_error(std::string("State entry field '") + key +
                             "' must be an array");
  }
  for (auto const &item : it->second.get<picojson::array>()) {
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string("State entry field '") + key +
                               "' must contain strings");
    }
    result.push_back(item.get<std::string>());
  }
  return result;
}

std::string required_string(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::string>()) {
    throw std::runtime_error(std::string("State document missing string field: ") + key);
  }
  return it->second.get<std::string>();
}

// A store that has never been saved accepts any lineage for serial 1
void check_successor(std::optional<state_snapshot> const &stored,
                     state_snapshot const &next) {
  if (stored && next.lineage != stored->lineage) {
    throw state_conflict_error("State lineage mismatch: stored " + stored->lineage +
                               ", got " + next.lineage);
  }

  std::int64_t const serial{ stored ? stored->serial : 0 };
  if (next.serial != serial + 1) {
    throw state_conflict_error("Stale state snapshot: stored serial " +
                               std::to_string(serial) + ", attempted save of serial " +
                               std::to_string(next.serial));
  }
}

}  // namespace

resource_state const *state_snapshot::find(resource_address const &address) const {
  auto const it{ resources.find(address) };
  return it == resources.end() ? nullptr : &it->second;
}

std::set<resource_address> state_snapshot::addresses() const {
  std::set<resource_address> result;
  for (auto const &[address, _] : resources) { result.insert(address); }
  return result;
}

std::optional<value> state_attribute(resource_state const &entry,
                                     std::vector<std::string> const &path) {
  if (auto v{ value_lookup(entry.attributes, path) }) { return v; }
  if (auto v{ value_lookup(entry.inputs, path) }) { return v; }
  if (path.size() == 1 && path.front() == "id") { return value{ entry.id }; }
  return std::nullopt;
}

std::string state_new_lineage() {
  return util_hex64(util_random64()) + util_hex64(util_random64());
}

std::string state_snapshot_to_json(state_snapshot const &snapshot) {
  picojson::array resources;
  for (auto const &[address, entry] : snapshot.resources) {
    std::string const where{ address.str() };
    picojson::object obj;
    obj["address"] = picojson::value(where);
    obj["type"] = picojson::value(entry.type);
    obj["id"] = picojson::value(entry.id);
    obj["inputs"] = attribute_map_to_json(entry.inputs, where);
    obj["attributes"] = attribute_map_to_json(entry.attributes, where);
    obj["dependencies"] = strings_to_json(entry.dependencies);
    if (!entry.deposed.empty()) { obj["deposed"] = strings_to_json(entry.deposed); }
    resources.emplace_back(obj);
  }

  picojson::object root;
  root["version"] = picojson::value(kStateFormatVersion);
  root["lineage"] = picojson::value(snapshot.lineage);
  root["serial"] = picojson::value(snapshot.serial);
  root["resources"] = picojson::value(resources);
  return picojson::value(root).serialize(true);
}

state_snapshot state_snapshot_from_json(std::string_view json) {
  picojson::value root;
  std::string const json_str{ json };
  std::string const err{ picojson::parse(root, json_str) };
  if (!err.empty()) { throw std::runtime_error("Failed to parse state: " + err); }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("State document must be a JSON object");
  }

  auto const &obj{ root.get<picojson::object>() };

  if (auto const v{ obj.find("version") };
      v == obj.end() || !v->second.is<std::int64_t>() ||
      v->second.get<std::int64_t>() != kStateFormatVersion) {
    throw std::runtime_error("Unsupported state format version");
  }

  state_snapshot result;
  result.lineage = required_string(obj, "lineage");

  auto const serial{ obj.find("serial") };
  if (serial == obj.end() || !serial->second.is<std::int64_t>()) {
    throw std::runtime_error("State document missing integer field: serial");
  }
  result.serial = serial->second.get<std::int64_t>();

  auto const resources{ obj.find("resources") };
  if (resources == obj.end() || !resources->second.is<picojson::array>()) {
    throw std::runtime_error("State document missing array field: resources");
  }

  for (auto const &item : resources->second.get<picojson::array>()) {
    if (!item.is<picojson::object>()) {
      throw std::runtime_error("State resource entries must be objects");
    }
    auto const &entry_obj{ item.get<picojson::object>() };
    auto address{ resource_address::parse(required_string(entry_obj, "address")) };

    resource_state entry{ .type = required_string(entry_obj, "type"),
                          .id = required_string(entry_obj, "id"),
                          .inputs = attributes_from_json(entry_obj, "inputs"),
                          .attributes = attributes_from_json(entry_obj, "attributes"),
                          .dependencies = strings_from_json(entry_obj, "dependencies"),
                          .deposed = strings_from_json(entry_obj, "deposed") };

    if (!result.resources.emplace(std::move(address), std::move(entry)).second) {
      throw std::runtime_error("State document lists a resource twice");
    }
  }

  return result;
}

// file_state_store

namespace {

class file_lock_handle : public state_lock {
 public:
  file_lock_handle(platform::file_lock lock,
                   std::filesystem::path info_path,
                   lock_info info)
      : lock_{ std::move(lock) },
        info_path_{ std::move(info_path) },
        info_{ std::move(info) },
        acquired_{ std::chrono::steady_clock::now() } {
    STRATA_TRACE_LOCK_ACQUIRED(info_.holder, info_.path, info_.expires_at - info_.acquired_at);
  }

  ~file_lock_handle() override {
    std::error_code ec;
    std::filesystem::remove(info_path_, ec);
    if (ec) {
      tui::warn("Failed to remove lock info %s: %s",
                info_path_.c_str(),
                ec.message().c_str());
    }

    auto const held_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - acquired_)
                            .count() };
    STRATA_TRACE_LOCK_RELEASED(info_.holder, info_.path, static_cast<std::int64_t>(held_ms));
  }

  lock_info const &info() const override { return info_; }

 private:
  platform::file_lock lock_;
  std::filesystem::path info_path_;
  lock_info info_;
  std::chrono::steady_clock::time_point acquired_;
};

std::string describe_holder(std::filesystem::path const &info_path) {
  if (!std::filesystem::exists(info_path)) { return "unknown holder"; }
  try {
    picojson::value root;
    std::string const err{ picojson::parse(root, util_load_file(info_path)) };
    if (!err.empty() || !root.is<picojson::object>()) { return "unknown holder"; }
    auto const &obj{ root.get<picojson::object>() };
    auto const holder{ obj.find("holder") };
    if (holder == obj.end() || !holder->second.is<std::string>()) { return "unknown holder"; }
    return holder->second.get<std::string>();
  } catch (std::runtime_error const &e) {
    return std::string("unknown holder (") + e.what() + ")";
  }
}

}  // namespace

file_state_store::file_state_store(std::filesystem::path path)
    : path_{ std::move(path) }, fresh_lineage_{ state_new_lineage() } {}

std::filesystem::path file_state_store::lock_path() const {
  auto p{ path_ };
  p += ".lock";
  return p;
}

state_snapshot file_state_store::load() {
  std::lock_guard const lock{ mutex_ };
  if (!std::filesystem::exists(path_)) {
    return state_snapshot{ .lineage = fresh_lineage_, .serial = 0, .resources = {} };
  }
  try {
    return state_snapshot_from_json(util_load_file(path_));
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("Failed to load state " + path_.string() + ": " + e.what());
  }
}

void file_state_store::save(state_snapshot const &snapshot) {
  std::lock_guard const lock{ mutex_ };

  std::optional<state_snapshot> stored;
  if (std::filesystem::exists(path_)) {
    stored = state_snapshot_from_json(util_load_file(path_));
  }
  check_successor(stored, snapshot);

  if (path_.has_parent_path()) { std::filesystem::create_directories(path_.parent_path()); }
  util_write_file_atomic(path_, state_snapshot_to_json(snapshot));
}

state_lock::ptr_t file_state_store::lock(std::chrono::seconds ttl) {
  auto const lp{ lock_path() };
  auto info_path{ lp };
  info_path += ".info";

  if (lp.has_parent_path()) { std::filesystem::create_directories(lp.parent_path()); }

  auto file_lock{ platform::file_lock::try_acquire(lp) };
  if (!file_lock) {
    throw state_conflict_error("State is locked by " + describe_holder(info_path) + " (" +
                               lp.string() + ")");
  }

  auto const now{ unix_now() };
  lock_info info{ .holder = lock_holder(),
                  .path = lp.string(),
                  .acquired_at = now,
                  .expires_at = now + ttl.count() };

  picojson::object obj;
  obj["holder"] = picojson::value(info.holder);
  obj["acquired_at"] = picojson::value(info.acquired_at);
  obj["expires_at"] = picojson::value(info.expires_at);
  util_write_file_atomic(info_path, picojson::value(obj).serialize(true));

  return std::make_unique<file_lock_handle>(std::move(file_lock),
                                            std::move(info_path),
                                            std::move(info));
}

// memory_state_store

class memory_state_store::memory_lock : public state_lock {
 public:
  memory_lock(memory_state_store &store, std::uint64_t token, lock_info info)
      : store_{ store },
        token_{ token },
        info_{ std::move(info) },
        acquired_{ std::chrono::steady_clock::now() } {
    STRATA_TRACE_LOCK_ACQUIRED(info_.holder, info_.path, info_.expires_at - info_.acquired_at);
  }

  ~memory_lock() override {
    {
      std::lock_guard const lock{ store_.mutex_ };
      if (store_.lock_token_ == token_) { store_.lock_token_ = 0; }
    }
    auto const held_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - acquired_)
                            .count() };
    STRATA_TRACE_LOCK_RELEASED(info_.holder, info_.path, static_cast<std::int64_t>(held_ms));
  }

  lock_info const &info() const override { return info_; }

 private:
  memory_state_store &store_;
  std::uint64_t token_;
  lock_info info_;
  std::chrono::steady_clock::time_point acquired_;
};

memory_state_store::memory_state_store() : fresh_lineage_{ state_new_lineage() } {}

memory_state_store::memory_state_store(state_snapshot initial)
    : stored_{ std::move(initial) }, fresh_lineage_{ stored_->lineage } {}

state_snapshot memory_state_store::load() {
  std::lock_guard const lock{ mutex_ };
  if (stored_) { return *stored_; }
  return state_snapshot{ .lineage = fresh_lineage_, .serial = 0, .resources = {} };
}

void memory_state_store::save(state_snapshot const &snapshot) {
  std::lock_guard const lock{ mutex_ };
  check_successor(stored_, snapshot);
  stored_ = snapshot;
  ++saves_;
}

std::size_t memory_state_store::save_count() const {
  std::lock_guard const lock{ mutex_ };
  return saves_;
}

state_lock::ptr_t memory_state_store::lock(std::chrono::seconds ttl) {
  std::lock_guard const lock{ mutex_ };

  auto const now{ std::chrono::steady_clock::now() };
  if (lock_token_ != 0 && now < lock_expires_) {
    throw state_conflict_error("State is locked by " + lock_info_.holder);
  }
  if (lock_token_ != 0) {
    tui::warn("Taking over expired state lock held by %s", lock_info_.holder.c_str());
  }

  lock_token_ = util_random64() | 1;
  lock_expires_ = now + ttl;

  auto const unix{ unix_now() };
  lock_info_ = lock_info{ .holder = lock_holder(),
                          .path = "memory",
                          .acquired_at = unix,
                          .expires_at = unix + ttl.count() };

  return std::make_unique<memory_lock>(*this, lock_token_, lock_info_);
}

}  // namespace strata
