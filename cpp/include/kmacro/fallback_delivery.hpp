/**
 * @file fallback_delivery.hpp
 * @brief Уровень 3: посылка событий окну в фокусе
 */

#pragma once

#include <chrono>

#include "kmacro/input_event.hpp"
#include "kmacro/replay_strategy.hpp"

namespace kmacro {

/**
 * @brief Доставка одиночного нажатия/отпускания в обход устройства ввода
 */
class FallbackPoster {
public:
  virtual ~FallbackPoster() = default;

  /**
   * @param ev Событие (используются канал, код и модификаторы)
   * @param down true для нажатия, false для отпускания
   * @return false, если событие не доставлено
   */
  [[nodiscard]] virtual bool send(const InputEvent &ev, bool down) = 0;
};

/**
 * @brief Воспроизводит только нажатия: down, пауза, up, пауза
 *
 * Уровень проваливается, только если не доставлено ни одно нажатие.
 */
class FallbackDeliveryStrategy final : public ReplayStrategy {
public:
  FallbackDeliveryStrategy(FallbackPoster &poster,
                           std::chrono::microseconds hold,
                           std::chrono::microseconds gap, WaitFunc wait = {});

  [[nodiscard]] ReplayTier tier() const noexcept override {
    return ReplayTier::FallbackDelivery;
  }

  [[nodiscard]] TierAttempt
  attempt(std::span<const InputEvent> sequence) override;

private:
  FallbackPoster &poster_;
  std::chrono::microseconds hold_;
  std::chrono::microseconds gap_;
  WaitFunc wait_;
};

} // namespace kmacro
