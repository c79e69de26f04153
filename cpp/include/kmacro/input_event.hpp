/**
 * @file input_event.hpp
 * @brief Нормализованное событие ввода
 *
 * InputEvent неизменяем после создания. Каждый экземпляр получает
 * уникальный sequence_key и момент захвата; в сравнение они не входят,
 * поэтому два одинаковых нажатия равны, но различимы в UI.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kmacro/types.hpp"

namespace kmacro {

class InputEvent {
public:
  using Clock = std::chrono::system_clock;

  /**
   * @brief Создаёт событие, подпись выводится из channel и code
   * @param channel Клавиатура или мышь
   * @param code Скан-код evdev (клавиатура) или порядковый номер кнопки
   * @param modifiers Маска модификаторов на момент события
   * @param pressed true для нажатия, false для отпускания
   */
  InputEvent(Channel channel, std::uint16_t code, ModifierMask modifiers,
             bool pressed);

  /**
   * @brief Восстанавливает событие из хранилища
   *
   * Подпись берётся как есть (её уже вычислили при захвате),
   * идентичность выдаётся новая.
   */
  [[nodiscard]] static InputEvent restore(Channel channel, std::uint16_t code,
                                          ModifierMask modifiers, bool pressed,
                                          std::string label);

  [[nodiscard]] Channel channel() const noexcept { return channel_; }
  [[nodiscard]] std::uint16_t code() const noexcept { return code_; }
  [[nodiscard]] ModifierMask modifiers() const noexcept { return modifiers_; }
  [[nodiscard]] bool pressed() const noexcept { return pressed_; }
  [[nodiscard]] const std::string &label() const noexcept { return label_; }
  [[nodiscard]] std::uint64_t sequence_key() const noexcept {
    return sequence_key_;
  }
  [[nodiscard]] Clock::time_point captured_at() const noexcept {
    return captured_at_;
  }

  [[nodiscard]] bool is_keyboard() const noexcept {
    return channel_ == Channel::Keyboard;
  }
  [[nodiscard]] bool is_mouse() const noexcept {
    return channel_ == Channel::Mouse;
  }

  /// Та же физическая клавиша/кнопка (канал и код)
  [[nodiscard]] bool same_source(const InputEvent &other) const noexcept {
    return channel_ == other.channel_ && code_ == other.code_;
  }

  /// Равенство по содержимому: идентичность и время захвата не учитываются
  [[nodiscard]] bool operator==(const InputEvent &other) const noexcept {
    return channel_ == other.channel_ && code_ == other.code_ &&
           modifiers_ == other.modifiers_ && pressed_ == other.pressed_ &&
           label_ == other.label_;
  }

private:
  InputEvent(Channel channel, std::uint16_t code, ModifierMask modifiers,
             bool pressed, std::string label);

  Channel channel_;
  std::uint16_t code_;
  ModifierMask modifiers_;
  bool pressed_;
  std::string label_;
  std::uint64_t sequence_key_;
  Clock::time_point captured_at_;
};

// ===========================================================================
// Текстовое представление (хранилище, IPC)
// ===========================================================================

/**
 * @brief Кодирует событие в строку `keyboard|mouse <code> <mask> down|up <label>`
 */
[[nodiscard]] std::string encode_event(const InputEvent &ev);

/**
 * @brief Разбирает строку, созданную encode_event()
 * @return std::nullopt при некорректном формате
 */
[[nodiscard]] std::optional<InputEvent> decode_event(std::string_view text);

} // namespace kmacro
