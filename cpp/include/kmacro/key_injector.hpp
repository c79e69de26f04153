/**
 * @file key_injector.hpp
 * @brief Генератор событий ввода через пайп uinput
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>

#include "kmacro/direct_injection.hpp"
#include "kmacro/replay_strategy.hpp"
#include "kmacro/types.hpp"

namespace kmacro {

/**
 * @brief Класс для эмуляции ввода через uinput
 *
 * Использует stdout для записи событий в пайп `uinput -d`.
 * Модификаторы события, которые синтетический поток ещё не держит,
 * нажимаются перед событием и отпускаются после него.
 */
class KeyInjector final : public InputSink {
public:
  /**
   * @brief Конструктор
   * @param modifier_hold Пауза между модификатором и клавишей
   */
  explicit KeyInjector(std::chrono::microseconds modifier_hold) noexcept;

  // =========================================================================
  // Низкоуровневые операции
  // =========================================================================

  /**
   * @brief Записывает событие в stdout
   * @return false, если запись не удалась (например, пайп закрыт)
   */
  [[nodiscard]] static bool emit_event(const input_event &ev);

  /**
   * @brief Записывает пачку событий в stdout одним системным вызовом
   * @return false, если запись не удалась
   */
  [[nodiscard]] static bool emit_events(std::span<const input_event> events);

  /**
   * @brief Отправляет событие нажатия/отпускания и SYN
   */
  [[nodiscard]] bool send_key(ScanCode code, KeyState state) const;

  /**
   * @brief Устанавливает функцию ожидания
   * @param func Функция, которая будет вызываться вместо usleep
   */
  void set_wait_func(WaitFunc func) noexcept { wait_func_ = std::move(func); }

  // =========================================================================
  // InputSink
  // =========================================================================

  /**
   * @brief Отправляет событие макроса
   *
   * Отказ: неизвестный скан-код, кнопка мыши вне BTN_LEFT..BTN_TASK,
   * ошибка записи.
   */
  [[nodiscard]] bool post(const InputEvent &ev) override;

  /// Отпускает модификаторы, оставшиеся зажатыми после последовательности
  void finish() override;

  /**
   * @brief Отпускает все модификаторы
   */
  void release_all_modifiers();

  /// Задержка (использует wait_func_ если установлена, иначе usleep)
  void delay(std::chrono::microseconds us) const;

  /// Скан-код evdev для события (std::nullopt, если синтезировать нельзя)
  [[nodiscard]] static std::optional<ScanCode> device_code(const InputEvent &ev) noexcept;

private:
  static bool write_all(int fd, const void *data, std::size_t bytes);

  std::chrono::microseconds modifier_hold_;
  WaitFunc wait_func_;

  /// Модификаторы, которые синтетический поток сейчас держит нажатыми
  ModifierState held_;
};

} // namespace kmacro
