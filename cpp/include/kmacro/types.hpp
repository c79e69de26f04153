/**
 * @file types.hpp
 * @brief Базовые типы и константы kmacro
 *
 * Этот файл содержит фундаментальные типы, используемые во всём приложении:
 * скан-коды, каналы ввода, маска модификаторов и трекер их состояния.
 */

#pragma once

#include <linux/input.h>

#include <cstdint>
#include <string_view>

namespace kmacro {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/kmacro/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/kmacro/config.yaml";

/// Хранилище макросов по умолчанию
inline constexpr std::string_view kDefaultStorePath =
    "/var/lib/kmacro/macros.txt";

// ===========================================================================
// Типы для работы с событиями ввода
// ===========================================================================

/// Значение события клавиши
enum class KeyState : std::int32_t { Release = 0, Press = 1, Repeat = 2 };

/// Скан-код клавиши (обёртка над linux/input.h константами)
using ScanCode = std::uint16_t;

/// Источник события: клавиатура или кнопка мыши
enum class Channel : std::uint8_t { Keyboard, Mouse };

/**
 * @brief Маска модификаторов, активных в момент события
 *
 * Биты стабильны: они пишутся в хранилище макросов.
 */
using ModifierMask = std::uint8_t;

inline constexpr ModifierMask kModShift = 1U << 0;
inline constexpr ModifierMask kModCtrl = 1U << 1;
inline constexpr ModifierMask kModAlt = 1U << 2;
inline constexpr ModifierMask kModMeta = 1U << 3;
inline constexpr ModifierMask kModAll = kModShift | kModCtrl | kModAlt | kModMeta;

/// Порядковый номер основной (левой) кнопки мыши
inline constexpr std::uint16_t kMousePrimary = 0;

/// Порядковый номер последней кнопки мыши, которую умеет uinput (BTN_TASK)
inline constexpr std::uint16_t kMouseMaxOrdinal = BTN_TASK - BTN_MOUSE;

/// Состояние модификаторов
struct ModifierState {
  bool left_shift : 1 = false;
  bool right_shift : 1 = false;
  bool left_ctrl : 1 = false;
  bool right_ctrl : 1 = false;
  bool left_alt : 1 = false;
  bool right_alt : 1 = false;
  bool left_meta : 1 = false;
  bool right_meta : 1 = false;

  [[nodiscard]] constexpr bool any_shift() const noexcept {
    return left_shift || right_shift;
  }

  [[nodiscard]] constexpr bool any_ctrl() const noexcept {
    return left_ctrl || right_ctrl;
  }

  [[nodiscard]] constexpr bool any_alt() const noexcept {
    return left_alt || right_alt;
  }

  [[nodiscard]] constexpr bool any_meta() const noexcept {
    return left_meta || right_meta;
  }

  /// Маска в формате InputEvent
  [[nodiscard]] constexpr ModifierMask mask() const noexcept {
    ModifierMask m = 0;
    if (any_shift())
      m |= kModShift;
    if (any_ctrl())
      m |= kModCtrl;
    if (any_alt())
      m |= kModAlt;
    if (any_meta())
      m |= kModMeta;
    return m;
  }

  /**
   * @brief Обновляет состояние по событию клавиши-модификатора
   * @return false, если code не модификатор
   */
  constexpr bool update(ScanCode code, bool pressed) noexcept {
    switch (code) {
    case KEY_LEFTSHIFT:
      left_shift = pressed;
      break;
    case KEY_RIGHTSHIFT:
      right_shift = pressed;
      break;
    case KEY_LEFTCTRL:
      left_ctrl = pressed;
      break;
    case KEY_RIGHTCTRL:
      right_ctrl = pressed;
      break;
    case KEY_LEFTALT:
      left_alt = pressed;
      break;
    case KEY_RIGHTALT:
      right_alt = pressed;
      break;
    case KEY_LEFTMETA:
      left_meta = pressed;
      break;
    case KEY_RIGHTMETA:
      right_meta = pressed;
      break;
    default:
      return false;
    }
    return true;
  }
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

// ===========================================================================
// Inline утилиты
// ===========================================================================

/// Проверка, является ли скан-код модификатором
[[nodiscard]] constexpr bool is_modifier(ScanCode code) noexcept {
  return code == KEY_LEFTSHIFT || code == KEY_RIGHTSHIFT ||
         code == KEY_LEFTCTRL || code == KEY_RIGHTCTRL || code == KEY_LEFTALT ||
         code == KEY_RIGHTALT || code == KEY_LEFTMETA || code == KEY_RIGHTMETA;
}

/// Проверка, относится ли скан-код к кнопкам мыши (BTN_LEFT..BTN_TASK)
[[nodiscard]] constexpr bool is_mouse_button(ScanCode code) noexcept {
  return code >= BTN_MOUSE && code <= BTN_TASK;
}

} // namespace kmacro
