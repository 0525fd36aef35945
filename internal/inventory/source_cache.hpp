#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "fleet/v1/inventory.pb.h"
#include "internal/inventory/inventory_source.hpp"
#include "internal/util/time.hpp"

namespace fleet::inventory {

/*
  Memoizes loaded sources for the current resolution pass.

  Each source key has its own mutex, so a slow dynamic source never blocks
  loads of unrelated sources. Entries are reloaded when:
    - Clear() starts a new pass,
    - a static file's modification time changed, or any file in an
      inventory directory did,
    - ttl is non-zero and the entry is older than ttl.
*/
class SourceCache {
 public:
  using Loader = std::function<fleet::v1::Inventory(const InventorySource&)>;

  explicit SourceCache(std::chrono::milliseconds ttl = std::chrono::milliseconds{0});

  fleet::v1::Inventory GetOrLoad(const InventorySource& source, const Loader& load);

  void Invalidate(const InventorySource& source);
  void Clear();

  // Number of times a loader actually ran.
  uint64_t loads() const;

 private:
  struct Entry {
    std::mutex                                     mutex;
    std::optional<fleet::v1::Inventory>            inventory;
    util::TimePoint                                loaded_at;
    std::optional<std::filesystem::file_time_type> mtime;
  };

  std::shared_ptr<Entry> EntryFor(const std::string& key);
  bool                   IsStale(const InventorySource& source, const Entry& entry) const;

  std::chrono::milliseconds ttl_;

  mutable std::mutex                                      entries_guard_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  uint64_t                                                loads_ = 0;
};

} // namespace fleet::inventory
