/**
 * @file periodic_scheduler.hpp
 * @brief Отложенные и периодические задачи потока главного цикла
 *
 * Планировщик не создаёт потоков: задачи выполняет run_due(), который
 * EventLoop вызывает на каждой итерации. Каждая задача имеет RAII-хендл,
 * деструктор которого отменяет задачу.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace kmacro {

class PeriodicScheduler {
public:
  using Clock = std::chrono::steady_clock;
  using Task = std::function<void()>;

  /// Хендл задачи: отменяет её при уничтожении. Не должен переживать планировщик.
  class Handle {
  public:
    Handle() noexcept = default;

    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    Handle(Handle &&other) noexcept;
    Handle &operator=(Handle &&other) noexcept;

    ~Handle() { cancel(); }

    /// Отменяет задачу (повторный вызов безопасен)
    void cancel() noexcept;

    /// Задача ещё запланирована
    [[nodiscard]] bool active() const noexcept;

  private:
    friend class PeriodicScheduler;
    Handle(PeriodicScheduler *owner, std::uint64_t id) noexcept
        : owner_{owner}, id_{id} {}

    PeriodicScheduler *owner_ = nullptr;
    std::uint64_t id_ = 0;
  };

  PeriodicScheduler() = default;

  PeriodicScheduler(const PeriodicScheduler &) = delete;
  PeriodicScheduler &operator=(const PeriodicScheduler &) = delete;

  /**
   * @brief Задача, повторяющаяся каждые interval (первый запуск через interval)
   */
  [[nodiscard]] Handle schedule_every(std::chrono::milliseconds interval,
                                      Task task, Clock::time_point now = Clock::now());

  /// Однократная задача через delay
  [[nodiscard]] Handle schedule_once(std::chrono::milliseconds delay, Task task,
                                     Clock::time_point now = Clock::now());

  /**
   * @brief Выполняет задачи, срок которых наступил к моменту now
   *
   * Задача может отменять и планировать другие задачи (в том числе себя).
   * Пропущенные периоды не догоняются: следующий запуск через interval от now.
   *
   * @return Количество выполненных задач
   */
  std::size_t run_due(Clock::time_point now = Clock::now());

  /// Ближайший срок среди запланированных задач
  [[nodiscard]] std::optional<Clock::time_point> next_due() const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
  struct Entry {
    Clock::time_point next_at;
    std::chrono::milliseconds interval{0};
    bool repeat = false;
    Task task;
  };

  Handle add(std::chrono::milliseconds delay, bool repeat, Task task,
             Clock::time_point now);
  void cancel(std::uint64_t id) noexcept { entries_.erase(id); }
  [[nodiscard]] bool contains(std::uint64_t id) const noexcept {
    return entries_.contains(id);
  }

  std::map<std::uint64_t, Entry> entries_;
  std::uint64_t next_id_ = 1;
};

} // namespace kmacro
