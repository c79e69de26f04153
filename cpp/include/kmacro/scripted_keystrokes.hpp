/**
 * @file scripted_keystrokes.hpp
 * @brief Уровень 2: воспроизведение через средство автоматизации (xdotool)
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "kmacro/input_event.hpp"
#include "kmacro/replay_strategy.hpp"

namespace kmacro {

/// Одно действие автоматизации: нажатие+отпускание клавиши или клик
struct Keystroke {
  Channel channel = Channel::Keyboard;
  std::uint16_t code = 0;
  ModifierMask modifiers = 0;
  std::string label;
  bool paired = false; ///< Найдено ли отпускание для нажатия
};

/**
 * @brief Строит действия из последовательности
 *
 * Каждое нажатие сопоставляется с ближайшим следующим отпусканием того же
 * источника; такая пара даёт одно действие. Нажатие без отпускания тоже
 * даёт одно действие. Отпускания без нажатия пропускаются.
 */
[[nodiscard]] std::vector<Keystroke>
derive_keystrokes(std::span<const InputEvent> sequence);

/**
 * @brief Средство автоматизации, исполняющее одно действие
 */
class KeystrokeAutomation {
public:
  virtual ~KeystrokeAutomation() = default;

  /**
   * @return false, если действие не поддерживается или инструмент
   *         завершился с ошибкой
   */
  [[nodiscard]] virtual bool run(const Keystroke &keystroke) = 0;
};

class ScriptedKeystrokeStrategy final : public ReplayStrategy {
public:
  explicit ScriptedKeystrokeStrategy(KeystrokeAutomation &automation)
      : automation_{automation} {}

  [[nodiscard]] ReplayTier tier() const noexcept override {
    return ReplayTier::ScriptedKeystrokes;
  }

  /**
   * Неудачное действие не прерывает остальные, но уровень считается
   * успешным только если прошли все действия.
   */
  [[nodiscard]] TierAttempt
  attempt(std::span<const InputEvent> sequence) override;

private:
  KeystrokeAutomation &automation_;
};

} // namespace kmacro
