/**
 * @file xdotool_automation.hpp
 * @brief Уровень 2: действия через xdotool от имени пользователя сессии
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "kmacro/replay_strategy.hpp"
#include "kmacro/scripted_keystrokes.hpp"

namespace kmacro {

class X11Session;

/**
 * @brief Аргумент xdotool для действия
 *
 * Клавиатура: "ctrl+super+c" (для `xdotool key`).
 * Мышь: номер кнопки X11 (для `xdotool click`).
 *
 * @return std::nullopt, если для клавиши нет keysym
 */
[[nodiscard]] std::optional<std::string> xdotool_argument(const Keystroke &ks);

/**
 * @brief Запуск xdotool
 *
 * Процесс запускается с UID/GID/группами пользователя X11 сессии и
 * stdio, направленными в /dev/null: stdout демона это пайп uinput.
 */
class XdotoolAutomation final : public KeystrokeAutomation {
public:
  /**
   * @param session X11 сессия (должна пережить объект)
   * @param timeout Сколько ждать завершения xdotool
   */
  XdotoolAutomation(const X11Session &session,
                    std::chrono::milliseconds timeout);
  ~XdotoolAutomation() override;

  XdotoolAutomation(const XdotoolAutomation &) = delete;
  XdotoolAutomation &operator=(const XdotoolAutomation &) = delete;

  [[nodiscard]] bool run(const Keystroke &keystroke) override;

  /// Функция ожидания между опросами дочернего процесса
  void set_wait_func(WaitFunc func) noexcept { wait_func_ = std::move(func); }

  [[nodiscard]] bool available() const noexcept { return !tool_path_.empty(); }

private:
  /// Готовит uid/gid/группы и окружение из текущего состояния сессии
  void prepare_identity();

  [[nodiscard]] bool spawn_and_wait(const std::vector<std::string> &args);

  const X11Session &session_;
  std::chrono::milliseconds timeout_;
  WaitFunc wait_func_;

  std::string tool_path_;
  int devnull_fd_ = -1;

  bool drop_privileges_ = false;
  uid_t user_uid_ = 0;
  gid_t user_gid_ = 0;
  std::vector<gid_t> user_groups_;
  std::vector<std::string> env_;
};

} // namespace kmacro
