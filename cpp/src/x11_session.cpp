/**
 * @file x11_session.cpp
 * @brief Поиск графической сессии через /proc и подключение к X серверу
 */

#include "kmacro/x11_session.hpp"

#include <X11/Xlib.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <pwd.h>
#include <sys/stat.h>

namespace kmacro {

namespace {

namespace fs = std::filesystem;

// Системные учётные записи и nobody не бывают владельцами сессии
constexpr std::uint32_t kFirstUserUid = 1000;
constexpr std::uint32_t kNobodyUid = 65534;

constexpr std::string_view kCookieName = "MIT-MAGIC-COOKIE-1";

// Значения /proc/<pid>/comm (обрезаны ядром до 15 символов)
constexpr std::array<std::string_view, 7> kSessionProcesses = {
    "gnome-session-b", "gnome-shell",     "plasmashell", "ksmserver",
    "xfce4-session",   "cinnamon-sessio", "mate-session"};

struct DisplayProcess {
  std::uint32_t uid = 0;
  bool session_leader = false;
  EnvironMap env;
};

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }
  return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

bool is_pid_name(const std::string &name) {
  return !name.empty() &&
         std::all_of(name.begin(), name.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_session_process(std::string comm) {
  while (!comm.empty() && (comm.back() == '\n' || comm.back() == ' ')) {
    comm.pop_back();
  }
  return std::find(kSessionProcesses.begin(), kSessionProcesses.end(), comm) !=
         kSessionProcesses.end();
}

/// Процесс пользователя с DISPLAY; менеджер сессии предпочтительнее
std::optional<DisplayProcess> find_display_process() {
  std::optional<DisplayProcess> best;
  std::error_code ec;
  fs::directory_iterator it{"/proc", ec};
  for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
    const fs::path &dir = it->path();
    if (!is_pid_name(dir.filename().string())) {
      continue;
    }

    struct stat st{};
    if (::stat(dir.c_str(), &st) != 0 || st.st_uid < kFirstUserUid ||
        st.st_uid >= kNobodyUid) {
      continue;
    }

    // Процесс мог завершиться: пустое окружение просто пропускаем
    EnvironMap env = parse_environ(read_file(dir / "environ"));
    auto display = env.find("DISPLAY");
    if (display == env.end() || display->second.empty()) {
      continue;
    }

    const bool leader = is_session_process(read_file(dir / "comm"));
    if (!best || (leader && !best->session_leader)) {
      best = DisplayProcess{static_cast<std::uint32_t>(st.st_uid), leader,
                            std::move(env)};
    }
    if (best->session_leader) {
      break;
    }
  }
  return best;
}

bool file_exists(const std::string &path) {
  std::error_code ec;
  return !path.empty() && fs::is_regular_file(path, ec) && !ec;
}

bool read_u16(std::istream &in, std::uint16_t &out) {
  std::array<unsigned char, 2> bytes{};
  if (!in.read(reinterpret_cast<char *>(bytes.data()), 2)) {
    return false;
  }
  out = static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
  return true;
}

bool read_counted(std::istream &in, std::string &out) {
  std::uint16_t len = 0;
  if (!read_u16(in, len)) {
    return false;
  }
  out.assign(len, '\0');
  return len == 0 || static_cast<bool>(in.read(out.data(), len));
}

} // namespace

EnvironMap parse_environ(std::string_view block) {
  EnvironMap env;
  while (!block.empty()) {
    const auto end = block.find('\0');
    const std::string_view entry = block.substr(0, end);
    if (const auto eq = entry.find('='); eq != std::string_view::npos && eq > 0) {
      env.insert_or_assign(std::string{entry.substr(0, eq)},
                           std::string{entry.substr(eq + 1)});
    }
    if (end == std::string_view::npos) {
      break;
    }
    block.remove_prefix(end + 1);
  }
  return env;
}

std::string display_number(std::string_view display) {
  const auto colon = display.rfind(':');
  if (colon == std::string_view::npos) {
    return {};
  }
  std::string_view number = display.substr(colon + 1);
  number = number.substr(0, number.find('.'));
  return std::string{number};
}

std::optional<XauthCookie> find_xauth_cookie(std::istream &in,
                                             std::string_view number) {
  std::optional<XauthCookie> wildcard;
  for (;;) {
    std::uint16_t family = 0;
    std::string address;
    std::string entry_number;
    XauthCookie cookie;
    if (!read_u16(in, family) || !read_counted(in, address) ||
        !read_counted(in, entry_number) || !read_counted(in, cookie.name) ||
        !read_counted(in, cookie.data)) {
      break;
    }
    if (cookie.name != kCookieName) {
      continue;
    }
    if (entry_number == number) {
      return cookie;
    }
    // Запись без номера подходит любому дисплею
    if (entry_number.empty() && !wildcard) {
      wildcard = std::move(cookie);
    }
  }
  return wildcard;
}

std::vector<std::string> session_environment(const X11SessionInfo &info) {
  std::vector<std::string> env;
  env.emplace_back("PATH=/usr/local/bin:/usr/bin:/bin");
  env.emplace_back("DISPLAY=" + info.display);
  if (!info.xauthority.empty()) {
    env.emplace_back("XAUTHORITY=" + info.xauthority);
  }
  env.emplace_back("HOME=" + info.home_dir);
  env.emplace_back("USER=" + info.username);
  env.emplace_back("LOGNAME=" + info.username);
  env.emplace_back("XDG_RUNTIME_DIR=" + info.runtime_dir);
  return env;
}

void DisplayCloser::operator()(_XDisplay *display) const noexcept {
  if (display) {
    XCloseDisplay(display);
  }
}

bool X11Session::discover() {
  if (found_) {
    return true;
  }

  auto process = find_display_process();
  if (!process) {
    std::cerr << "[kmacro] X11: no user process with DISPLAY found\n";
    return false;
  }

  const passwd *pw = ::getpwuid(static_cast<uid_t>(process->uid));
  if (!pw) {
    std::cerr << "[kmacro] X11: uid " << process->uid << " has no passwd entry\n";
    return false;
  }

  X11SessionInfo info;
  info.username = pw->pw_name;
  info.uid = process->uid;
  info.gid = static_cast<std::uint32_t>(pw->pw_gid);
  info.home_dir = pw->pw_dir;
  info.display = process->env["DISPLAY"];
  info.runtime_dir = process->env["XDG_RUNTIME_DIR"];
  if (info.runtime_dir.empty()) {
    info.runtime_dir = "/run/user/" + std::to_string(info.uid);
  }

  // XAUTHORITY процесса, иначе стандартные места GDM и startx
  for (const std::string &path :
       {process->env["XAUTHORITY"], info.runtime_dir + "/gdm/Xauthority",
        info.home_dir + "/.Xauthority"}) {
    if (file_exists(path)) {
      info.xauthority = path;
      break;
    }
  }

  std::cerr << "[kmacro] X11 session: user=" << info.username
            << " display=" << info.display << " xauthority="
            << (info.xauthority.empty() ? "-" : info.xauthority) << '\n';
  info_ = std::move(info);
  found_ = true;
  return true;
}

std::vector<std::string> X11Session::child_environment() const {
  if (found_) {
    return session_environment(info_);
  }
  std::vector<std::string> env;
  env.emplace_back("PATH=/usr/local/bin:/usr/bin:/bin");
  if (const char *display = std::getenv("DISPLAY")) {
    env.emplace_back(std::string{"DISPLAY="} + display);
  }
  return env;
}

DisplayPtr X11Session::open_display() const {
  if (!found_) {
    return nullptr;
  }

  if (!info_.xauthority.empty()) {
    std::optional<XauthCookie> cookie;
    if (std::ifstream in{info_.xauthority, std::ios::binary}) {
      cookie = find_xauth_cookie(in, display_number(info_.display));
    }
    if (cookie) {
      XSetAuthorization(cookie->name.data(), static_cast<int>(cookie->name.size()),
                        cookie->data.data(), static_cast<int>(cookie->data.size()));
    } else {
      std::cerr << "[kmacro] X11: no cookie for " << info_.display << " in "
                << info_.xauthority << '\n';
    }
  }

  DisplayPtr display{XOpenDisplay(info_.display.c_str())};
  if (!display) {
    std::cerr << "[kmacro] X11: cannot open display " << info_.display << '\n';
  }
  return display;
}

} // namespace kmacro
