/**
 * @file replay_strategy.hpp
 * @brief Интерфейс уровня (tier) воспроизведения
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "kmacro/input_event.hpp"

namespace kmacro {

/// Уровни воспроизведения от самого точного к самому грубому
enum class ReplayTier { DirectInjection, ScriptedKeystrokes, FallbackDelivery };

[[nodiscard]] constexpr std::string_view tier_name(ReplayTier tier) noexcept {
  switch (tier) {
  case ReplayTier::DirectInjection:
    return "direct";
  case ReplayTier::ScriptedKeystrokes:
    return "scripted";
  case ReplayTier::FallbackDelivery:
    return "fallback";
  }
  return "unknown";
}

/// Результат одной попытки уровня
struct TierAttempt {
  bool success = false;
  std::size_t delivered = 0; ///< Сколько действий дошло до получателя
  std::string error;
};

/// Тип функции ожидания (для интеграции с Input Guard)
using WaitFunc = std::function<void(std::chrono::microseconds)>;

/**
 * @brief Ожидание через wait, либо через usleep, если wait не задан
 */
void wait_for(const WaitFunc &wait, std::chrono::microseconds us);

/**
 * @brief Способ воспроизведения последовательности
 *
 * Реализации взаимозаменяемы: ReplayEngine перебирает их по порядку до
 * первого успеха.
 */
class ReplayStrategy {
public:
  virtual ~ReplayStrategy() = default;

  [[nodiscard]] virtual ReplayTier tier() const noexcept = 0;

  /**
   * @brief Воспроизводит последовательность целиком
   * @param sequence Непустая последовательность событий
   */
  [[nodiscard]] virtual TierAttempt
  attempt(std::span<const InputEvent> sequence) = 0;
};

} // namespace kmacro
