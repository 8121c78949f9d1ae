#include "internal/lock/key_lock_table.hpp"

#include <utility>

namespace graphvc::lock {

KeyLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(std::exchange(other.table_, nullptr)), key_(std::move(other.key_)), entry_(std::exchange(other.entry_, nullptr)) {
}

KeyLockTable::Guard& KeyLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_ = std::exchange(other.table_, nullptr);
    key_   = std::move(other.key_);
    entry_ = std::exchange(other.entry_, nullptr);
  }
  return *this;
}

KeyLockTable::Guard::~Guard() {
  Release();
}

void KeyLockTable::Guard::Release() {
  if (entry_ == nullptr) return;
  entry_->mutex.unlock();
  entry_ = nullptr;
  std::exchange(table_, nullptr)->Unref(key_);
}

KeyLockTable::Guard KeyLockTable::Acquire(const std::string& key) {
  Entry* entry = nullptr;
  {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       slot = entries_[key];
    if (!slot) slot = std::make_unique<Entry>();
    ++slot->users;
    entry = slot.get();
  }

  // the counted reference keeps the entry alive while waiting
  entry->mutex.lock();
  return Guard(this, key, entry);
}

std::size_t KeyLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return entries_.size();
}

void KeyLockTable::Unref(const std::string& key) {
  std::lock_guard<std::mutex> lock(guard_);
  auto                        it = entries_.find(key);
  if (it != entries_.end() && --it->second->users == 0) entries_.erase(it);
}

} // namespace graphvc::lock
