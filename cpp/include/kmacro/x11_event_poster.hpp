/**
 * @file x11_event_poster.hpp
 * @brief Уровень 3: XSendEvent окну в фокусе
 */

#pragma once

#include "kmacro/fallback_delivery.hpp"
#include "kmacro/x11_session.hpp"

namespace kmacro {

/**
 * @brief Посылает синтетические KeyPress/ButtonPress окну в фокусе
 *
 * Многие приложения игнорируют события с флагом send_event, поэтому это
 * последний уровень. Клавиша без keysym посылается как пробел.
 * Соединение с X сервером открывается при первом событии и
 * переоткрывается после ошибки.
 */
class X11EventPoster final : public FallbackPoster {
public:
  explicit X11EventPoster(const X11Session &session) noexcept
      : session_{session} {}

  [[nodiscard]] bool send(const InputEvent &ev, bool down) override;

  /// Закрывает соединение (следующий send() откроет новое)
  void disconnect() noexcept { display_.reset(); }

private:
  [[nodiscard]] bool ensure_display();

  const X11Session &session_;
  DisplayPtr display_;
};

} // namespace kmacro
