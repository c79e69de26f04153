/**
 * @file key_labels.hpp
 * @brief Таблицы скан-кодов: символы, подписи и имена keysym
 *
 * Constexpr таблицы для преобразования скан-кодов evdev в человекочитаемые
 * подписи (для InputEvent::label) и в имена X keysym (для xdotool и
 * XStringToKeysym).
 */

#pragma once

#include <linux/input.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kmacro {

// ===========================================================================
// Маппинг скан-кодов на ASCII-символы (клавиши, печатающие один символ)
// ===========================================================================

inline constexpr std::array<char, 256> kScancodeToChar = [] {
  std::array<char, 256> map{};
  // Буквы QWERTY
  map[KEY_Q] = 'q';
  map[KEY_W] = 'w';
  map[KEY_E] = 'e';
  map[KEY_R] = 'r';
  map[KEY_T] = 't';
  map[KEY_Y] = 'y';
  map[KEY_U] = 'u';
  map[KEY_I] = 'i';
  map[KEY_O] = 'o';
  map[KEY_P] = 'p';
  map[KEY_A] = 'a';
  map[KEY_S] = 's';
  map[KEY_D] = 'd';
  map[KEY_F] = 'f';
  map[KEY_G] = 'g';
  map[KEY_H] = 'h';
  map[KEY_J] = 'j';
  map[KEY_K] = 'k';
  map[KEY_L] = 'l';
  map[KEY_Z] = 'z';
  map[KEY_X] = 'x';
  map[KEY_C] = 'c';
  map[KEY_V] = 'v';
  map[KEY_B] = 'b';
  map[KEY_N] = 'n';
  map[KEY_M] = 'm';
  // Скобки и знаки препинания
  map[KEY_LEFTBRACE] = '[';
  map[KEY_RIGHTBRACE] = ']';
  map[KEY_SEMICOLON] = ';';
  map[KEY_APOSTROPHE] = '\'';
  map[KEY_GRAVE] = '`';
  map[KEY_SLASH] = '/';
  map[KEY_BACKSLASH] = '\\';
  map[KEY_COMMA] = ',';
  map[KEY_DOT] = '.';
  map[KEY_MINUS] = '-';
  map[KEY_EQUAL] = '=';
  // Цифры основной клавиатуры
  map[KEY_1] = '1';
  map[KEY_2] = '2';
  map[KEY_3] = '3';
  map[KEY_4] = '4';
  map[KEY_5] = '5';
  map[KEY_6] = '6';
  map[KEY_7] = '7';
  map[KEY_8] = '8';
  map[KEY_9] = '9';
  map[KEY_0] = '0';
  return map;
}();

// ===========================================================================
// Подписи для непечатных клавиш
// ===========================================================================

inline constexpr std::array<std::string_view, 256> kKeyLabels = [] {
  std::array<std::string_view, 256> map{};
  map[KEY_ESC] = "Escape";
  map[KEY_ENTER] = "Return";
  map[KEY_TAB] = "Tab";
  map[KEY_SPACE] = "Space";
  map[KEY_BACKSPACE] = "Backspace";
  map[KEY_DELETE] = "Delete";
  map[KEY_INSERT] = "Insert";
  map[KEY_HOME] = "Home";
  map[KEY_END] = "End";
  map[KEY_PAGEUP] = "Page Up";
  map[KEY_PAGEDOWN] = "Page Down";
  map[KEY_LEFT] = "Left Arrow";
  map[KEY_RIGHT] = "Right Arrow";
  map[KEY_UP] = "Up Arrow";
  map[KEY_DOWN] = "Down Arrow";
  map[KEY_F1] = "F1";
  map[KEY_F2] = "F2";
  map[KEY_F3] = "F3";
  map[KEY_F4] = "F4";
  map[KEY_F5] = "F5";
  map[KEY_F6] = "F6";
  map[KEY_F7] = "F7";
  map[KEY_F8] = "F8";
  map[KEY_F9] = "F9";
  map[KEY_F10] = "F10";
  map[KEY_F11] = "F11";
  map[KEY_F12] = "F12";
  map[KEY_F13] = "F13";
  map[KEY_F14] = "F14";
  map[KEY_F15] = "F15";
  map[KEY_F16] = "F16";
  map[KEY_F17] = "F17";
  map[KEY_F18] = "F18";
  map[KEY_F19] = "F19";
  map[KEY_F20] = "F20";
  map[KEY_F21] = "F21";
  map[KEY_F22] = "F22";
  map[KEY_F23] = "F23";
  map[KEY_F24] = "F24";
  map[KEY_SYSRQ] = "Print Screen";
  map[KEY_PAUSE] = "Pause";
  map[KEY_SCROLLLOCK] = "Scroll Lock";
  map[KEY_NUMLOCK] = "Num Lock";
  map[KEY_COMPOSE] = "Menu";
  map[KEY_KP0] = "Keypad 0";
  map[KEY_KP1] = "Keypad 1";
  map[KEY_KP2] = "Keypad 2";
  map[KEY_KP3] = "Keypad 3";
  map[KEY_KP4] = "Keypad 4";
  map[KEY_KP5] = "Keypad 5";
  map[KEY_KP6] = "Keypad 6";
  map[KEY_KP7] = "Keypad 7";
  map[KEY_KP8] = "Keypad 8";
  map[KEY_KP9] = "Keypad 9";
  map[KEY_KPENTER] = "Keypad Enter";
  map[KEY_KPPLUS] = "Keypad +";
  map[KEY_KPMINUS] = "Keypad -";
  map[KEY_KPASTERISK] = "Keypad *";
  map[KEY_KPSLASH] = "Keypad /";
  map[KEY_KPDOT] = "Keypad .";
  map[KEY_MUTE] = "Mute";
  map[KEY_VOLUMEDOWN] = "Volume Down";
  map[KEY_VOLUMEUP] = "Volume Up";
  return map;
}();

// ===========================================================================
// Имена X keysym (xdotool key, XStringToKeysym)
// ===========================================================================

inline constexpr std::array<std::string_view, 256> kKeysymNames = [] {
  std::array<std::string_view, 256> map{};
  // Буквы и цифры совпадают с символом, их отдаёт keysym_name()
  map[KEY_LEFTBRACE] = "bracketleft";
  map[KEY_RIGHTBRACE] = "bracketright";
  map[KEY_SEMICOLON] = "semicolon";
  map[KEY_APOSTROPHE] = "apostrophe";
  map[KEY_GRAVE] = "grave";
  map[KEY_SLASH] = "slash";
  map[KEY_BACKSLASH] = "backslash";
  map[KEY_COMMA] = "comma";
  map[KEY_DOT] = "period";
  map[KEY_MINUS] = "minus";
  map[KEY_EQUAL] = "equal";
  map[KEY_ESC] = "Escape";
  map[KEY_ENTER] = "Return";
  map[KEY_TAB] = "Tab";
  map[KEY_SPACE] = "space";
  map[KEY_BACKSPACE] = "BackSpace";
  map[KEY_DELETE] = "Delete";
  map[KEY_INSERT] = "Insert";
  map[KEY_HOME] = "Home";
  map[KEY_END] = "End";
  map[KEY_PAGEUP] = "Prior";
  map[KEY_PAGEDOWN] = "Next";
  map[KEY_LEFT] = "Left";
  map[KEY_RIGHT] = "Right";
  map[KEY_UP] = "Up";
  map[KEY_DOWN] = "Down";
  map[KEY_F1] = "F1";
  map[KEY_F2] = "F2";
  map[KEY_F3] = "F3";
  map[KEY_F4] = "F4";
  map[KEY_F5] = "F5";
  map[KEY_F6] = "F6";
  map[KEY_F7] = "F7";
  map[KEY_F8] = "F8";
  map[KEY_F9] = "F9";
  map[KEY_F10] = "F10";
  map[KEY_F11] = "F11";
  map[KEY_F12] = "F12";
  map[KEY_SYSRQ] = "Print";
  map[KEY_PAUSE] = "Pause";
  map[KEY_SCROLLLOCK] = "Scroll_Lock";
  map[KEY_NUMLOCK] = "Num_Lock";
  map[KEY_COMPOSE] = "Menu";
  map[KEY_CAPSLOCK] = "Caps_Lock";
  map[KEY_LEFTSHIFT] = "Shift_L";
  map[KEY_RIGHTSHIFT] = "Shift_R";
  map[KEY_LEFTCTRL] = "Control_L";
  map[KEY_RIGHTCTRL] = "Control_R";
  map[KEY_LEFTALT] = "Alt_L";
  map[KEY_RIGHTALT] = "ISO_Level3_Shift";
  map[KEY_LEFTMETA] = "Super_L";
  map[KEY_RIGHTMETA] = "Super_R";
  map[KEY_KP0] = "KP_0";
  map[KEY_KP1] = "KP_1";
  map[KEY_KP2] = "KP_2";
  map[KEY_KP3] = "KP_3";
  map[KEY_KP4] = "KP_4";
  map[KEY_KP5] = "KP_5";
  map[KEY_KP6] = "KP_6";
  map[KEY_KP7] = "KP_7";
  map[KEY_KP8] = "KP_8";
  map[KEY_KP9] = "KP_9";
  map[KEY_KPENTER] = "KP_Enter";
  map[KEY_KPPLUS] = "KP_Add";
  map[KEY_KPMINUS] = "KP_Subtract";
  map[KEY_KPASTERISK] = "KP_Multiply";
  map[KEY_KPSLASH] = "KP_Divide";
  map[KEY_KPDOT] = "KP_Decimal";
  map[KEY_MUTE] = "XF86AudioMute";
  map[KEY_VOLUMEDOWN] = "XF86AudioLowerVolume";
  map[KEY_VOLUMEUP] = "XF86AudioRaiseVolume";
  return map;
}();

// ===========================================================================
// Inline функции
// ===========================================================================

/// Печатный символ клавиши (0 для непечатных)
[[nodiscard]] constexpr char code_to_char(std::uint16_t code) noexcept {
  if (code >= kScancodeToChar.size()) {
    return 0;
  }
  return kScancodeToChar[code];
}

/// Подпись клавиши-модификатора, если code модификатор (включая Caps Lock)
[[nodiscard]] constexpr std::optional<std::string_view>
modifier_label(std::uint16_t code) noexcept {
  switch (code) {
  case KEY_LEFTSHIFT:
  case KEY_RIGHTSHIFT:
    return "Shift";
  case KEY_LEFTCTRL:
  case KEY_RIGHTCTRL:
    return "Ctrl";
  case KEY_LEFTALT:
    return "Alt";
  case KEY_RIGHTALT:
    return "AltGr";
  case KEY_LEFTMETA:
  case KEY_RIGHTMETA:
    return "Super";
  case KEY_CAPSLOCK:
    return "Caps Lock";
  default:
    return std::nullopt;
  }
}

/// Подпись непечатной клавиши (пустая, если клавиша неизвестна)
[[nodiscard]] constexpr std::string_view named_key_label(std::uint16_t code) noexcept {
  if (code >= kKeyLabels.size()) {
    return {};
  }
  return kKeyLabels[code];
}

/**
 * @brief Имя X keysym для скан-кода
 *
 * Для букв и цифр keysym совпадает с символом, поэтому имя указывает в
 * статическую таблицу односимвольных строк.
 */
[[nodiscard]] constexpr std::optional<std::string_view>
keysym_name(std::uint16_t code) noexcept {
  constexpr std::string_view kSingleChars =
      "abcdefghijklmnopqrstuvwxyz0123456789";
  if (code >= kKeysymNames.size()) {
    return std::nullopt;
  }
  if (!kKeysymNames[code].empty()) {
    return kKeysymNames[code];
  }
  const char c = kScancodeToChar[code];
  if (c == 0) {
    return std::nullopt;
  }
  const auto pos = kSingleChars.find(c);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return kSingleChars.substr(pos, 1);
}

// ===========================================================================
// Маппинг имён клавиш (для конфигурации)
// ===========================================================================

struct KeyNameMapping {
  std::string_view name;
  std::uint16_t code;
};

inline constexpr std::array kKeyNames = std::to_array<KeyNameMapping>({
    {"leftctrl", KEY_LEFTCTRL},
    {"rightctrl", KEY_RIGHTCTRL},
    {"leftalt", KEY_LEFTALT},
    {"rightalt", KEY_RIGHTALT},
    {"leftshift", KEY_LEFTSHIFT},
    {"rightshift", KEY_RIGHTSHIFT},
    {"leftmeta", KEY_LEFTMETA},
    {"rightmeta", KEY_RIGHTMETA},
    {"grave", KEY_GRAVE},
    {"space", KEY_SPACE},
    {"tab", KEY_TAB},
    {"backslash", KEY_BACKSLASH},
    {"capslock", KEY_CAPSLOCK},
    {"backspace", KEY_BACKSPACE},
    {"delete", KEY_DELETE},
    {"escape", KEY_ESC},
    {"pause", KEY_PAUSE},
    {"insert", KEY_INSERT},
});

/// Поиск кода клавиши по имени
[[nodiscard]] constexpr std::optional<std::uint16_t>
key_name_to_code(std::string_view name) noexcept {
  for (const auto &mapping : kKeyNames) {
    if (mapping.name == name) {
      return mapping.code;
    }
  }
  return std::nullopt;
}

} // namespace kmacro
