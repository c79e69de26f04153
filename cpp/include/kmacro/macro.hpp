/**
 * @file macro.hpp
 * @brief Модель макроса
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kmacro/input_event.hpp"

namespace kmacro {

/// Идентификатор макроса (UUID v4 в текстовом виде)
using MacroId = std::string;

/// Генерирует новый случайный идентификатор
[[nodiscard]] MacroId generate_macro_id();

/// Тип шага упрощённого представления
enum class StepType : std::uint8_t { Key, Mouse, Text, Delay };

/**
 * @brief Шаг упрощённого представления макроса
 *
 * Шаги только отображаются. Воспроизведение всегда идёт по key_sequence.
 */
struct MacroStep {
  std::string id;
  StepType type = StepType::Key;
  std::optional<std::uint16_t> code;
  ModifierMask modifiers = 0;
  std::optional<std::string> text;
  std::optional<std::chrono::milliseconds> delay;
};

/**
 * @brief Именованный макрос
 *
 * Пустой key_sequence допустим: воспроизводить нечего.
 */
struct Macro {
  MacroId id;
  std::string name;
  std::vector<InputEvent> key_sequence;
  std::optional<InputEvent> binding;
  InputEvent::Clock::time_point created_at{};
  std::vector<MacroStep> steps;

  /// Пустой макрос с новым id и текущим временем создания
  [[nodiscard]] static Macro create(std::string name);

  [[nodiscard]] bool empty() const noexcept { return key_sequence.empty(); }
};

/// Имя макроса по умолчанию
inline constexpr std::string_view kDefaultMacroName = "New Macro";

/**
 * @brief Переименовывает макрос
 * @return false, если новое имя пустое (имя не меняется)
 */
bool rename_macro(Macro &macro, std::string_view name);

/**
 * @brief Строит шаги из последовательности: одна запись на каждое нажатие
 */
[[nodiscard]] std::vector<MacroStep>
project_steps(std::span<const InputEvent> sequence);

/// Описание шагов для отображения: "Ctrl+C, Delay 100ms, ..."
[[nodiscard]] std::string describe_steps(std::span<const MacroStep> steps);

/// Подписи нажатий последовательности через запятую
[[nodiscard]] std::string describe_sequence(std::span<const InputEvent> sequence);

} // namespace kmacro
