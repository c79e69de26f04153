/**
 * @file periodic_scheduler.cpp
 * @brief Реализация планировщика задач главного цикла
 */

#include "kmacro/periodic_scheduler.hpp"

#include <utility>
#include <vector>

namespace kmacro {

PeriodicScheduler::Handle::Handle(Handle &&other) noexcept
    : owner_{std::exchange(other.owner_, nullptr)},
      id_{std::exchange(other.id_, 0)} {}

PeriodicScheduler::Handle &
PeriodicScheduler::Handle::operator=(Handle &&other) noexcept {
  if (this != &other) {
    cancel();
    owner_ = std::exchange(other.owner_, nullptr);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

void PeriodicScheduler::Handle::cancel() noexcept {
  if (owner_) {
    owner_->cancel(id_);
    owner_ = nullptr;
    id_ = 0;
  }
}

bool PeriodicScheduler::Handle::active() const noexcept {
  return owner_ != nullptr && owner_->contains(id_);
}

PeriodicScheduler::Handle
PeriodicScheduler::schedule_every(std::chrono::milliseconds interval, Task task,
                                  Clock::time_point now) {
  return add(interval, true, std::move(task), now);
}

PeriodicScheduler::Handle
PeriodicScheduler::schedule_once(std::chrono::milliseconds delay, Task task,
                                 Clock::time_point now) {
  return add(delay, false, std::move(task), now);
}

PeriodicScheduler::Handle PeriodicScheduler::add(std::chrono::milliseconds delay,
                                                 bool repeat, Task task,
                                                 Clock::time_point now) {
  // Нулевой период зациклил бы run_due()
  if (repeat && delay.count() <= 0) {
    delay = std::chrono::milliseconds{1};
  }

  const std::uint64_t id = next_id_++;
  entries_.emplace(id, Entry{now + delay, delay, repeat, std::move(task)});
  return Handle{this, id};
}

std::size_t PeriodicScheduler::run_due(Clock::time_point now) {
  std::vector<std::uint64_t> due;
  for (const auto &[id, entry] : entries_) {
    if (entry.next_at <= now) {
      due.push_back(id);
    }
  }

  std::size_t ran = 0;
  for (const auto id : due) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      continue; // отменена предыдущей задачей
    }

    Task task = it->second.task;
    if (it->second.repeat) {
      it->second.next_at = now + it->second.interval;
    } else {
      entries_.erase(it);
    }

    if (task) {
      task();
      ++ran;
    }
  }
  return ran;
}

std::optional<PeriodicScheduler::Clock::time_point>
PeriodicScheduler::next_due() const {
  std::optional<Clock::time_point> earliest;
  for (const auto &[id, entry] : entries_) {
    if (!earliest || entry.next_at < *earliest) {
      earliest = entry.next_at;
    }
  }
  return earliest;
}

} // namespace kmacro
