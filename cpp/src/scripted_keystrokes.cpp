/**
 * @file scripted_keystrokes.cpp
 * @brief Реализация уровня 2
 */

#include "kmacro/scripted_keystrokes.hpp"

#include <iostream>

#include "kmacro/event_normalizer.hpp"

namespace kmacro {

std::vector<Keystroke> derive_keystrokes(std::span<const InputEvent> sequence) {
  std::vector<Keystroke> keystrokes;
  std::vector<bool> consumed(sequence.size(), false);

  for (std::size_t i = 0; i < sequence.size(); ++i) {
    const InputEvent &down = sequence[i];
    if (!down.pressed()) {
      continue;
    }

    Keystroke ks;
    ks.channel = down.channel();
    ks.code = down.code();
    ks.modifiers = down.modifiers();
    ks.label = describe_event(down);

    for (std::size_t j = i + 1; j < sequence.size(); ++j) {
      const InputEvent &up = sequence[j];
      if (!consumed[j] && !up.pressed() && up.same_source(down)) {
        consumed[j] = true;
        ks.paired = true;
        break;
      }
    }

    keystrokes.push_back(std::move(ks));
  }

  return keystrokes;
}

TierAttempt
ScriptedKeystrokeStrategy::attempt(std::span<const InputEvent> sequence) {
  TierAttempt result;
  const auto keystrokes = derive_keystrokes(sequence);

  std::size_t failed = 0;
  for (const auto &ks : keystrokes) {
    if (automation_.run(ks)) {
      ++result.delivered;
      continue;
    }
    ++failed;
    std::cerr << "[kmacro] Scripted keystroke failed: " << ks.label << '\n';
  }

  result.success = failed == 0;
  if (!result.success) {
    result.error = std::to_string(failed) + " of " +
                   std::to_string(keystrokes.size()) + " keystrokes failed";
  }
  return result;
}

} // namespace kmacro
