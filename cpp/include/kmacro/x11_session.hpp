/**
 * @file x11_session.hpp
 * @brief Поиск графической сессии пользователя для уровней 2 и 3
 *
 * Демон работает от root и не наследует DISPLAY. Сессия ищется по /proc:
 * берётся процесс пользователя, в окружении которого есть DISPLAY.
 * Окружение процесса демона не меняется.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Forward declaration, чтобы не тянуть Xlib.h в заголовки
struct _XDisplay;

namespace kmacro {

struct X11SessionInfo {
  std::string username;
  std::uint32_t uid = 0;
  std::uint32_t gid = 0;
  std::string home_dir;
  std::string display;    // ":0"
  std::string xauthority; // пусто, если файл не найден
  std::string runtime_dir;
};

/// Закрывает соединение с X сервером
struct DisplayCloser {
  void operator()(_XDisplay *display) const noexcept;
};

using DisplayPtr = std::unique_ptr<_XDisplay, DisplayCloser>;

/// Cookie из файла Xauthority
struct XauthCookie {
  std::string name; // "MIT-MAGIC-COOKIE-1"
  std::string data;
};

using EnvironMap = std::unordered_map<std::string, std::string>;

/// Разбирает блок /proc/<pid>/environ (записи "KEY=VALUE" через '\0')
[[nodiscard]] EnvironMap parse_environ(std::string_view block);

/// Номер дисплея: ":1.0" -> "1", "host:10" -> "10"
[[nodiscard]] std::string display_number(std::string_view display);

/// Ищет MIT-MAGIC-COOKIE-1 для номера дисплея в потоке формата Xauthority
[[nodiscard]] std::optional<XauthCookie>
find_xauth_cookie(std::istream &in, std::string_view number);

/// Окружение xdotool для найденной сессии
[[nodiscard]] std::vector<std::string>
session_environment(const X11SessionInfo &info);

class X11Session {
public:
  /**
   * @brief Ищет активную графическую сессию
   * @return true если найдена (повторный вызов после успеха ничего не делает)
   */
  bool discover();

  [[nodiscard]] bool is_valid() const noexcept { return found_; }

  [[nodiscard]] const X11SessionInfo &info() const noexcept { return info_; }

  /**
   * @brief Окружение дочернего процесса в формате "KEY=VALUE"
   *
   * Без сессии передаётся только DISPLAY демона, если он задан.
   */
  [[nodiscard]] std::vector<std::string> child_environment() const;

  /**
   * @brief Открывает соединение с X сервером сессии
   *
   * Cookie читается из Xauthority пользователя и передаётся через
   * XSetAuthorization.
   * @return nullptr, если сессия не найдена или сервер недоступен
   */
  [[nodiscard]] DisplayPtr open_display() const;

private:
  X11SessionInfo info_;
  bool found_ = false;
};

} // namespace kmacro
