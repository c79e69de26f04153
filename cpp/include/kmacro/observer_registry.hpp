/**
 * @file observer_registry.hpp
 * @brief Реестр подписчиков на события контроллера
 *
 * Реестр принадлежит владельцу (MacroController) и передаётся
 * потребителям явно. Подписка снимается деструктором Subscription.
 * Реестр однопоточный: подписка, отписка и notify() выполняются в потоке
 * главного цикла.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace kmacro {

template <class... Args> class ObserverRegistry {
public:
  using Callback = std::function<void(Args...)>;

  /**
   * @brief RAII-подписка
   *
   * Не должна переживать реестр.
   */
  class Subscription {
  public:
    Subscription() noexcept = default;

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept
        : owner_{std::exchange(other.owner_, nullptr)},
          id_{std::exchange(other.id_, 0)} {}

    Subscription &operator=(Subscription &&other) noexcept {
      if (this != &other) {
        reset();
        owner_ = std::exchange(other.owner_, nullptr);
        id_ = std::exchange(other.id_, 0);
      }
      return *this;
    }

    ~Subscription() { reset(); }

    /// Отписывается (повторный вызов безопасен)
    void reset() noexcept {
      if (owner_) {
        owner_->unsubscribe(id_);
        owner_ = nullptr;
        id_ = 0;
      }
    }

    [[nodiscard]] bool active() const noexcept { return owner_ != nullptr; }

  private:
    friend class ObserverRegistry;
    Subscription(ObserverRegistry *owner, std::uint64_t id) noexcept
        : owner_{owner}, id_{id} {}

    ObserverRegistry *owner_ = nullptr;
    std::uint64_t id_ = 0;
  };

  ObserverRegistry() = default;

  ObserverRegistry(const ObserverRegistry &) = delete;
  ObserverRegistry &operator=(const ObserverRegistry &) = delete;

  [[nodiscard]] Subscription subscribe(Callback callback) {
    const std::uint64_t id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return Subscription{this, id};
  }

  /**
   * @brief Вызывает всех подписчиков в порядке подписки
   *
   * Подписчик может отписаться (в том числе сам) внутри вызова: список
   * копируется перед обходом, отписанные пропускаются.
   */
  void notify(const Args &...args) const {
    std::vector<std::uint64_t> ids;
    ids.reserve(callbacks_.size());
    for (const auto &[id, cb] : callbacks_) {
      ids.push_back(id);
    }
    for (const auto id : ids) {
      auto it = callbacks_.find(id);
      if (it == callbacks_.end() || !it->second) {
        continue;
      }
      Callback cb = it->second;
      cb(args...);
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return callbacks_.size(); }

private:
  void unsubscribe(std::uint64_t id) noexcept { callbacks_.erase(id); }

  std::map<std::uint64_t, Callback> callbacks_;
  std::uint64_t next_id_ = 1;
};

} // namespace kmacro
