#pragma once

#include <bequest/schema/primitives.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace bequest::execution {

/// One exclusive lock per vault id. The table itself is only locked long
/// enough to find, insert or retire an entry, so callers on different vaults
/// never wait on each other. An entry lives only while some guard holds or
/// waits on it, so ids that are never locked again leave nothing behind.
class vault_lock_table final {
  struct entry final {
    std::mutex mutex;
    std::atomic<std::thread::id> holder{};
    std::size_t users{0};
  };

 public:
  /// Exclusive hold on one vault. Movable, released on destruction.
  class guard final {
   public:
    guard() = default;
    guard(guard&& other) noexcept;
    guard& operator=(guard&& other) noexcept;
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    ~guard();

    /// False when the calling thread already held this vault's lock.
    explicit operator bool() const;

    /// Unlock early; the destructor then does nothing.
    void release();

   private:
    friend class vault_lock_table;
    guard(vault_lock_table* table,
          bequest::schema::vault_id_t vault_id,
          entry* slot);

    vault_lock_table* table_{nullptr};
    bequest::schema::vault_id_t vault_id_{0};
    entry* slot_{nullptr};
  };

  /// Block until the vault's lock is held. Returns an empty guard instead of
  /// self-deadlocking when the calling thread already holds it.
  guard acquire(bequest::schema::vault_id_t vault_id);

  /// Number of vault ids currently held or waited on.
  std::size_t size() const;

 private:
  void retire(bequest::schema::vault_id_t vault_id);

  mutable std::mutex mutex_;
  std::unordered_map<bequest::schema::vault_id_t, std::unique_ptr<entry>>
      locks_;
};

}  // namespace bequest::execution
