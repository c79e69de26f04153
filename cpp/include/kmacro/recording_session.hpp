/**
 * @file recording_session.hpp
 * @brief Сессия записи последовательности событий
 */

#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "kmacro/input_event.hpp"
#include "kmacro/macro.hpp"

namespace kmacro {

/**
 * @brief Буфер записи: Idle → Recording → Idle
 *
 * Сессия однопоточная, ею владеет MacroController.
 */
class RecordingSession {
public:
  /// Колбэк, получающий каждое записанное событие (live-режим)
  using EventCallback = std::function<void(const InputEvent &)>;

  RecordingSession() = default;

  RecordingSession(const RecordingSession &) = delete;
  RecordingSession &operator=(const RecordingSession &) = delete;

  /**
   * @brief Начинает запись нового макроса
   * @return false, если запись уже идёт (состояние не меняется)
   */
  bool start(std::string name = {});

  /**
   * @brief Начинает запись с передачей каждого события в колбэк
   * @return false, если запись уже идёт
   */
  bool start(EventCallback on_event);

  /// Добавляет событие в буфер (игнорируется вне записи)
  void append(const InputEvent &ev);

  /**
   * @brief Завершает запись
   *
   * Если последнее событие буфера это нажатие основной кнопки мыши
   * (клик по кнопке "Stop"), оно отбрасывается.
   *
   * @return Макрос с записанной последовательностью, либо std::nullopt,
   *         если запись не велась или записывать оказалось нечего
   */
  std::optional<Macro> stop();

  [[nodiscard]] bool is_recording() const noexcept {
    return state_ == State::Recording;
  }

  [[nodiscard]] std::span<const InputEvent> buffer() const noexcept {
    return buffer_;
  }

  [[nodiscard]] const std::string &name() const noexcept { return name_; }

private:
  enum class State { Idle, Recording };

  State state_ = State::Idle;
  std::vector<InputEvent> buffer_;
  std::string name_;
  EventCallback on_event_;
};

} // namespace kmacro
