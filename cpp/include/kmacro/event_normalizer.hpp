/**
 * @file event_normalizer.hpp
 * @brief Преобразование сырых событий evdev в InputEvent
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "kmacro/input_event.hpp"
#include "kmacro/types.hpp"

namespace kmacro {

/**
 * @brief Сырое событие устройства вместе с маской модификаторов
 *
 * type/code/value повторяют поля input_event; modifiers заполняет
 * EventLoop из своего ModifierState до обработки самого события.
 */
struct RawInputEvent {
  std::uint16_t type = 0;
  std::uint16_t code = 0;
  std::int32_t value = 0;
  ModifierMask modifiers = 0;
};

/**
 * @brief Нормализует сырое событие
 *
 * Отбрасывает всё, кроме EV_KEY нажатий/отпусканий (автоповтор и
 * служебные события игнорируются). Кнопки мыши переводятся в порядковые
 * номера (0 = основная кнопка). Событие самой клавиши-модификатора
 * получает пустую маску.
 *
 * @return std::nullopt, если событие не относится к захвату
 */
[[nodiscard]] std::optional<InputEvent> normalize(const RawInputEvent &raw);

/**
 * @brief Подпись события
 *
 * Клавиатура: "C", "Shift", "Return", "Key 240".
 * Мышь: "Left Click", "Right Click", "Middle Click", "Mouse Button N".
 * Маска модификаторов в подпись не входит: её добавляет describe_event().
 */
[[nodiscard]] std::string derive_label(Channel channel, std::uint16_t code);

/**
 * @brief Подпись с префиксом модификаторов, например "Ctrl+Super+C"
 */
[[nodiscard]] std::string describe_event(const InputEvent &ev);

/// Префикс модификаторов: "Ctrl+Shift+" (пустая строка для mask == 0)
[[nodiscard]] std::string describe_modifiers(ModifierMask mask);

} // namespace kmacro
