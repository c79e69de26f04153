/**
 * @file message_queue.hpp
 * @brief Потокобезопасная очередь сообщений в поток главного цикла
 *
 * Много производителей, один потребитель. После close() новые сообщения
 * не принимаются, уже лежащие в очереди можно забрать.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace kmacro {

template <class T> class MessageQueue {
public:
  MessageQueue() = default;

  MessageQueue(const MessageQueue &) = delete;
  MessageQueue &operator=(const MessageQueue &) = delete;

  /**
   * @brief Кладёт сообщение в очередь
   * @return false, если очередь закрыта (сообщение уничтожается)
   */
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (q_.empty()) {
      return std::nullopt;
    }
    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  [[nodiscard]] std::optional<T> pop_wait(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);

    cv_.wait(lock, st, [this] { return !q_.empty() || closed_; });

    if (q_.empty()) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Забирает всё накопленное одним захватом мьютекса
  [[nodiscard]] std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<T> out;
    out.reserve(q_.size());
    while (!q_.empty()) {
      out.push_back(std::move(q_.front()));
      q_.pop_front();
    }
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace kmacro
