/**
 * @file direct_injection.hpp
 * @brief Уровень 1: прямая синтетическая инъекция событий
 */

#pragma once

#include <chrono>

#include "kmacro/input_event.hpp"
#include "kmacro/replay_strategy.hpp"

namespace kmacro {

/**
 * @brief Получатель синтетических событий
 *
 * Один вызов post() соответствует ровно одному событию последовательности.
 */
class InputSink {
public:
  virtual ~InputSink() = default;

  /**
   * @brief Отправляет событие
   * @return false, если событие нельзя синтезировать или запись не удалась
   */
  [[nodiscard]] virtual bool post(const InputEvent &ev) = 0;

  /// Завершение серии: отпустить то, что осталось зажатым
  virtual void finish() {}
};

class DirectInjectionStrategy final : public ReplayStrategy {
public:
  /**
   * @param sink Получатель событий (должен пережить стратегию)
   * @param event_delay Пауза между событиями
   * @param wait Функция ожидания (пустая: usleep)
   */
  DirectInjectionStrategy(InputSink &sink,
                          std::chrono::microseconds event_delay,
                          WaitFunc wait = {});

  [[nodiscard]] ReplayTier tier() const noexcept override {
    return ReplayTier::DirectInjection;
  }

  [[nodiscard]] TierAttempt
  attempt(std::span<const InputEvent> sequence) override;

private:
  InputSink &sink_;
  std::chrono::microseconds event_delay_;
  WaitFunc wait_;
};

} // namespace kmacro
