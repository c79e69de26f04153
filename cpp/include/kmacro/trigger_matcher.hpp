/**
 * @file trigger_matcher.hpp
 * @brief Поиск макроса, привязанного к событию
 */

#pragma once

#include <span>

#include "kmacro/input_event.hpp"
#include "kmacro/macro.hpp"

namespace kmacro {

/**
 * @brief Проверяет, срабатывает ли привязка на событие
 *
 * Совпадают канал и код. Модификаторы: привязка без модификаторов
 * срабатывает при любых модификаторах, иначе маски должны совпасть точно.
 * Фаза (нажатие/отпускание) не сравнивается: фильтр по нажатиям делает
 * вызывающая сторона.
 */
[[nodiscard]] bool binding_matches(const InputEvent &binding,
                                   const InputEvent &event) noexcept;

/**
 * @brief Первый макрос из candidates, чья привязка совпала с событием
 * @return nullptr, если совпадений нет
 */
[[nodiscard]] const Macro *match_trigger(const InputEvent &event,
                                         std::span<const Macro> candidates) noexcept;

} // namespace kmacro
