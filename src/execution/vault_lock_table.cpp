#include <spdlog/spdlog.h>
#include <bequest/execution/vault_lock_table.hpp>
#include <utility>

namespace bequest::execution {

vault_lock_table::guard::guard(vault_lock_table* table,
                               const bequest::schema::vault_id_t vault_id,
                               entry* slot)
    : table_{table}, vault_id_{vault_id}, slot_{slot} {}

vault_lock_table::guard::guard(guard&& other) noexcept
    : table_{std::exchange(other.table_, nullptr)},
      vault_id_{other.vault_id_},
      slot_{std::exchange(other.slot_, nullptr)} {}

vault_lock_table::guard& vault_lock_table::guard::operator=(
    guard&& other) noexcept {
  if (this != &other) {
    release();
    table_ = std::exchange(other.table_, nullptr);
    vault_id_ = other.vault_id_;
    slot_ = std::exchange(other.slot_, nullptr);
  }
  return *this;
}

vault_lock_table::guard::~guard() {
  release();
}

vault_lock_table::guard::operator bool() const {
  return slot_ != nullptr;
}

void vault_lock_table::guard::release() {
  if (!slot_) {
    return;
  }
  slot_->holder.store(std::thread::id{});
  slot_->mutex.unlock();
  slot_ = nullptr;
  std::exchange(table_, nullptr)->retire(vault_id_);
}

vault_lock_table::guard vault_lock_table::acquire(
    const bequest::schema::vault_id_t vault_id) {
  auto self = std::this_thread::get_id();
  auto* slot = static_cast<entry*>(nullptr);
  {
    auto lock = std::scoped_lock{mutex_};
    auto& owned = locks_[vault_id];
    if (!owned) {
      owned = std::make_unique<entry>();
    } else if (owned->holder.load() == self) {
      spdlog::error("Vault {} lock requested again by the thread holding it",
                    vault_id);
      return guard{};
    }
    ++owned->users;
    slot = owned.get();
  }
  slot->mutex.lock();
  slot->holder.store(self);
  return guard{this, vault_id, slot};
}

void vault_lock_table::retire(const bequest::schema::vault_id_t vault_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = locks_.find(vault_id);
  if (it != std::end(locks_) && --it->second->users == 0) {
    locks_.erase(it);
  }
}

std::size_t vault_lock_table::size() const {
  auto lock = std::scoped_lock{mutex_};
  return locks_.size();
}

}  // namespace bequest::execution
