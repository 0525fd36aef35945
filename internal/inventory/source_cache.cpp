#include "source_cache.hpp"

#include <variant>

namespace fleet::inventory {

namespace {

namespace fs = std::filesystem;

// Newest mtime in the tree; directories count, so removed files are noticed.
std::optional<fs::file_time_type> NewestModifiedTime(const std::string& dir) {
  std::error_code ec;
  auto            newest = fs::last_write_time(dir, ec);
  if (ec) return std::nullopt;

  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    const auto      mtime = fs::last_write_time(it->path(), entry_ec);
    if (!entry_ec && mtime > newest) newest = mtime;
  }
  return newest;
}

std::optional<fs::file_time_type> ModifiedTime(const InventorySource& source) {
  if (std::holds_alternative<DirectorySource>(source)) return NewestModifiedTime(SourcePath(source));
  if (!std::holds_alternative<StaticSource>(source)) return std::nullopt;

  std::error_code ec;
  auto            mtime = fs::last_write_time(SourcePath(source), ec);
  if (ec) return std::nullopt;
  return mtime;
}

} // namespace

SourceCache::SourceCache(std::chrono::milliseconds ttl) : ttl_(ttl) {
}

std::shared_ptr<SourceCache::Entry> SourceCache::EntryFor(const std::string& key) {
  std::lock_guard lock(entries_guard_);
  auto&           entry = entries_[key];
  if (!entry) entry = std::make_shared<Entry>();
  return entry;
}

bool SourceCache::IsStale(const InventorySource& source, const Entry& entry) const {
  if (!entry.inventory) return true;
  if (ttl_.count() > 0 && util::Now() - entry.loaded_at >= ttl_) return true;
  return entry.mtime != ModifiedTime(source);
}

fleet::v1::Inventory SourceCache::GetOrLoad(const InventorySource& source, const Loader& load) {
  auto entry = EntryFor(SourceKey(source));

  std::lock_guard lock(entry->mutex);
  if (!IsStale(source, *entry)) return *entry->inventory;

  // mtime first, so a write racing with the load triggers another reload
  auto mtime       = ModifiedTime(source);
  entry->inventory = load(source);
  entry->loaded_at = util::Now();
  entry->mtime     = mtime;

  {
    std::lock_guard guard(entries_guard_);
    ++loads_;
  }
  return *entry->inventory;
}

void SourceCache::Invalidate(const InventorySource& source) {
  std::lock_guard lock(entries_guard_);
  entries_.erase(SourceKey(source));
}

void SourceCache::Clear() {
  std::lock_guard lock(entries_guard_);
  entries_.clear();
}

uint64_t SourceCache::loads() const {
  std::lock_guard lock(entries_guard_);
  return loads_;
}

} // namespace fleet::inventory
