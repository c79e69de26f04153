/**
 * @file direct_injection.cpp
 * @brief Реализация уровня 1
 */

#include "kmacro/direct_injection.hpp"

#include <utility>

#include "kmacro/event_normalizer.hpp"

namespace kmacro {

DirectInjectionStrategy::DirectInjectionStrategy(
    InputSink &sink, std::chrono::microseconds event_delay, WaitFunc wait)
    : sink_{sink}, event_delay_{event_delay}, wait_{std::move(wait)} {}

TierAttempt
DirectInjectionStrategy::attempt(std::span<const InputEvent> sequence) {
  TierAttempt result;

  for (std::size_t i = 0; i < sequence.size(); ++i) {
    const InputEvent &ev = sequence[i];
    if (!sink_.post(ev)) {
      sink_.finish();
      result.error = "cannot synthesize event #" + std::to_string(i) + " (" +
                     describe_event(ev) + (ev.pressed() ? " down)" : " up)");
      return result;
    }
    ++result.delivered;

    if (i + 1 < sequence.size()) {
      wait_for(wait_, event_delay_);
    }
  }

  sink_.finish();
  result.success = true;
  return result;
}

} // namespace kmacro
