/**
 * @file event_normalizer.cpp
 * @brief Реализация нормализации и подписей событий
 */

#include "kmacro/event_normalizer.hpp"

#include <cctype>

#include "kmacro/key_labels.hpp"

namespace kmacro {

namespace {

std::string mouse_label(std::uint16_t ordinal) {
  switch (ordinal) {
  case 0:
    return "Left Click";
  case 1:
    return "Right Click";
  case 2:
    return "Middle Click";
  default:
    // Нумерация для пользователя начинается с 1
    return "Mouse Button " + std::to_string(ordinal + 1);
  }
}

std::string keyboard_label(std::uint16_t code) {
  if (auto mod = modifier_label(code)) {
    return std::string{*mod};
  }

  if (const char c = code_to_char(code); c != 0) {
    return std::string(1, static_cast<char>(
                              std::toupper(static_cast<unsigned char>(c))));
  }

  if (auto name = named_key_label(code); !name.empty()) {
    return std::string{name};
  }

  return "Key " + std::to_string(code);
}

} // namespace

std::optional<InputEvent> normalize(const RawInputEvent &raw) {
  if (raw.type != EV_KEY) {
    return std::nullopt;
  }

  // Автоповтор не является отдельным нажатием
  if (raw.value != static_cast<std::int32_t>(KeyState::Press) &&
      raw.value != static_cast<std::int32_t>(KeyState::Release)) {
    return std::nullopt;
  }

  const bool pressed = raw.value == static_cast<std::int32_t>(KeyState::Press);

  if (is_mouse_button(raw.code)) {
    return InputEvent{Channel::Mouse,
                      static_cast<std::uint16_t>(raw.code - BTN_MOUSE),
                      raw.modifiers, pressed};
  }

  // Джойстики, тачпады и прочие BTN_* не захватываются
  if (raw.code >= BTN_MISC && raw.code < KEY_OK) {
    return std::nullopt;
  }

  // Событие самой клавиши-модификатора маску не несёт
  const ModifierMask mask =
      (is_modifier(raw.code) || raw.code == KEY_CAPSLOCK) ? 0 : raw.modifiers;
  return InputEvent{Channel::Keyboard, raw.code, mask, pressed};
}

std::string derive_label(Channel channel, std::uint16_t code) {
  return channel == Channel::Mouse ? mouse_label(code) : keyboard_label(code);
}

std::string describe_modifiers(ModifierMask mask) {
  std::string out;
  if (mask & kModCtrl)
    out += "Ctrl+";
  if (mask & kModAlt)
    out += "Alt+";
  if (mask & kModShift)
    out += "Shift+";
  if (mask & kModMeta)
    out += "Super+";
  return out;
}

std::string describe_event(const InputEvent &ev) {
  return describe_modifiers(ev.modifiers()) + ev.label();
}

} // namespace kmacro
