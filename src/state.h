#pragma once

#include "address.h"
#include "platform.h"
#include "util.h"
#include "value.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Last-applied record of one managed object
struct resource_state {
  std::string type;
  std::string id;
  attribute_map inputs;      // resolved attributes last sent to the provider
  attribute_map attributes;  // provider-reported, includes computed attributes
  std::vector<std::string> dependencies;  // addresses depended on when last applied
  std::vector<std::string> deposed;       // replaced object ids still awaiting delete
};

struct state_snapshot {
  std::string lineage;       // minted once per state, never changes afterwards
  std::int64_t serial{ 0 };  // bumped by every successful save
  std::map<resource_address, resource_state> resources;

  resource_state const *find(resource_address const &address) const;
  std::set<resource_address> addresses() const;
};

// Value at an attribute path of a recorded object. Provider-reported attributes win over
// recorded inputs; the bare path "id" falls back to the provider id.
std::optional<value> state_attribute(resource_state const &entry,
                                     std::vector<std::string> const &path);

std::string state_new_lineage();

std::string state_snapshot_to_json(state_snapshot const &snapshot);

// Throws std::runtime_error on malformed documents
state_snapshot state_snapshot_from_json(std::string_view json);

struct lock_info {
  std::string holder;  // "host:pid"
  std::string path;
  std::int64_t acquired_at{ 0 };  // unix seconds
  std::int64_t expires_at{ 0 };
};

// Held for the duration of a plan/apply cycle; released on destruction
class state_lock : unmovable {
 public:
  using ptr_t = std::unique_ptr<state_lock>;

  virtual ~state_lock() = default;
  virtual lock_info const &info() const = 0;
};

class state_store {
 public:
  virtual ~state_store() = default;

  // Empty snapshot (serial 0) when nothing has been stored yet
  virtual state_snapshot load() = 0;

  // Atomically replaces the stored snapshot. Throws state_conflict_error unless
  // snapshot.serial is exactly the stored serial + 1 and the lineage matches.
  virtual void save(state_snapshot const &snapshot) = 0;

  // Throws state_conflict_error when another holder has the lock
  virtual state_lock::ptr_t lock(std::chrono::seconds ttl) = 0;

  virtual std::string describe() const = 0;
};

// JSON document on disk, replaced via temp file + rename; lock on "<path>.lock"
class file_state_store : public state_store {
 public:
  explicit file_state_store(std::filesystem::path path);

  state_snapshot load() override;
  void save(state_snapshot const &snapshot) override;
  state_lock::ptr_t lock(std::chrono::seconds ttl) override;
  std::string describe() const override { return path_.string(); }

  std::filesystem::path const &path() const { return path_; }
  std::filesystem::path lock_path() const;

 private:
  std::filesystem::path path_;
  std::string fresh_lineage_;  // used until the first save creates the file
  std::mutex mutex_;
};

// In-process store with the same semantics; lock leases expire after their TTL
class memory_state_store : public state_store {
 public:
  memory_state_store();
  explicit memory_state_store(state_snapshot initial);

  state_snapshot load() override;
  void save(state_snapshot const &snapshot) override;
  state_lock::ptr_t lock(std::chrono::seconds ttl) override;
  std::string describe() const override { return "memory"; }

  std::size_t save_count() const;

 private:
  class memory_lock;

  mutable std::mutex mutex_;
  std::optional<state_snapshot> stored_;
  std::string fresh_lineage_;
  std::size_t saves_{ 0 };

  std::uint64_t lock_token_{ 0 };  // 0 = unlocked
  std::chrono::steady_clock::time_point lock_expires_;
  lock_info lock_info_;
};

}  // namespace strata
