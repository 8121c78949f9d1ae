#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace graphvc::lock {

/*
  In-process key-scoped serialization tokens.

  One mutex per key, created on first use. An entry counts its holder
  and waiters and is erased when the last of them releases, so the
  table only holds keys that are currently contended or held. Holders
  of different keys never block each other.
*/

class KeyLockTable {
  struct Entry {
    std::mutex  mutex;
    std::size_t users = 0;
  };

 public:
  class Guard {
   public:
    Guard() = default;
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    friend class KeyLockTable;
    Guard(KeyLockTable* table, std::string key, Entry* entry) : table_(table), key_(std::move(key)), entry_(entry) {
    }

    void Release();

    KeyLockTable* table_ = nullptr;
    std::string   key_;
    Entry*        entry_ = nullptr;
  };

  // Blocks until the key is free.
  Guard Acquire(const std::string& key);

  // keys with a holder or a waiter
  std::size_t Size() const;

 private:
  void Unref(const std::string& key);

  mutable std::mutex                                      guard_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace graphvc::lock
