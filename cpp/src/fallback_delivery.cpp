/**
 * @file fallback_delivery.cpp
 * @brief Реализация уровня 3
 */

#include "kmacro/fallback_delivery.hpp"

#include <utility>

namespace kmacro {

FallbackDeliveryStrategy::FallbackDeliveryStrategy(
    FallbackPoster &poster, std::chrono::microseconds hold,
    std::chrono::microseconds gap, WaitFunc wait)
    : poster_{poster}, hold_{hold}, gap_{gap}, wait_{std::move(wait)} {}

TierAttempt
FallbackDeliveryStrategy::attempt(std::span<const InputEvent> sequence) {
  TierAttempt result;
  std::size_t downs = 0;

  for (const auto &ev : sequence) {
    if (!ev.pressed()) {
      continue;
    }
    ++downs;

    const bool delivered = poster_.send(ev, true);
    wait_for(wait_, hold_);
    // Отпускание посылаем даже после неудачного нажатия
    const bool released = poster_.send(ev, false);
    if (delivered) {
      ++result.delivered;
    }
    if (delivered && !released) {
      result.error = "key release not delivered: " + ev.label();
    }
    wait_for(wait_, gap_);
  }

  result.success = downs == 0 || result.delivered > 0;
  if (!result.success) {
    result.error = "no event could be delivered";
  }
  return result;
}

} // namespace kmacro
