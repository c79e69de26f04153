/**
 * @file xdotool_automation.cpp
 * @brief Реализация запуска xdotool
 */

#include "kmacro/xdotool_automation.hpp"

#include "kmacro/key_labels.hpp"
#include "kmacro/x11_session.hpp"

#include <fcntl.h>
#include <grp.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace kmacro {

namespace {

inline constexpr std::array<const char *, 2> kToolPaths{
    "/usr/bin/xdotool",
    "/usr/local/bin/xdotool",
};

/// Шаг опроса завершения дочернего процесса
inline constexpr std::chrono::microseconds kPollStep{2000};

[[nodiscard]] bool is_executable(const char *path) {
  return ::access(path, X_OK) == 0;
}

[[nodiscard]] std::vector<gid_t> get_user_groups(const std::string &username,
                                                gid_t primary_gid) {
  std::vector<gid_t> groups;

  // Стартуем с небольшого буфера и увеличиваем при необходимости.
  int ngroups = 16;
  groups.resize(static_cast<std::size_t>(ngroups));

  while (true) {
    int tmp = ngroups;
    int ret = ::getgrouplist(username.c_str(), primary_gid, groups.data(), &tmp);

    if (ret >= 0) {
      groups.resize(static_cast<std::size_t>(tmp));
      return groups;
    }

    if (tmp <= 0) {
      groups.clear();
      return groups;
    }

    ngroups = tmp;
    groups.resize(static_cast<std::size_t>(ngroups));
  }
}

/// Номер кнопки X11 для порядкового номера кнопки мыши
[[nodiscard]] std::optional<int> x11_button(std::uint16_t ordinal) noexcept {
  switch (ordinal) {
  case 0:
    return 1; // левая
  case 1:
    return 3; // правая
  case 2:
    return 2; // средняя
  case 3:
    return 8; // назад
  case 4:
    return 9; // вперёд
  default:
    return std::nullopt;
  }
}

} // namespace

std::optional<std::string> xdotool_argument(const Keystroke &ks) {
  if (ks.channel == Channel::Mouse) {
    auto button = x11_button(ks.code);
    if (!button) {
      return std::nullopt;
    }
    return std::to_string(*button);
  }

  auto keysym = keysym_name(ks.code);
  if (!keysym) {
    return std::nullopt;
  }

  std::string arg;
  if (ks.modifiers & kModCtrl)
    arg += "ctrl+";
  if (ks.modifiers & kModAlt)
    arg += "alt+";
  if (ks.modifiers & kModShift)
    arg += "shift+";
  if (ks.modifiers & kModMeta)
    arg += "super+";
  arg += *keysym;
  return arg;
}

XdotoolAutomation::XdotoolAutomation(const X11Session &session,
                                     std::chrono::milliseconds timeout)
    : session_{session}, timeout_{timeout} {
  devnull_fd_ = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  if (devnull_fd_ < 0) {
    std::cerr << "[kmacro] xdotool: failed to open /dev/null: "
              << std::strerror(errno) << "\n";
  }

  for (const char *path : kToolPaths) {
    if (is_executable(path)) {
      tool_path_ = path;
      break;
    }
  }
  if (tool_path_.empty()) {
    std::cerr << "[kmacro] xdotool not found. Scripted replay tier will fail.\n";
  }
}

XdotoolAutomation::~XdotoolAutomation() {
  if (devnull_fd_ >= 0) {
    ::close(devnull_fd_);
  }
}

void XdotoolAutomation::prepare_identity() {
  env_ = session_.child_environment();

  drop_privileges_ = false;
  user_groups_.clear();
  if (::geteuid() != 0 || !session_.is_valid()) {
    return;
  }

  const X11SessionInfo &info = session_.info();
  user_uid_ = static_cast<uid_t>(info.uid);
  user_gid_ = static_cast<gid_t>(info.gid);
  if (!info.username.empty()) {
    user_groups_ = get_user_groups(info.username, user_gid_);
  }
  drop_privileges_ = true;
}

bool XdotoolAutomation::run(const Keystroke &keystroke) {
  if (tool_path_.empty() || devnull_fd_ < 0) {
    return false;
  }

  auto arg = xdotool_argument(keystroke);
  if (!arg) {
    std::cerr << "[kmacro] xdotool: unsupported input " << keystroke.label
              << '\n';
    return false;
  }

  std::vector<std::string> args;
  args.push_back(tool_path_);
  if (keystroke.channel == Channel::Mouse) {
    args.emplace_back("click");
  } else {
    args.emplace_back("key");
    args.emplace_back("--clearmodifiers");
  }
  args.push_back(std::move(*arg));

  return spawn_and_wait(args);
}

bool XdotoolAutomation::spawn_and_wait(const std::vector<std::string> &args) {
  prepare_identity();

  // Готовим argv/envp в родителе (в дочернем процессе никаких аллокаций/iostream).
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &a : args) {
    argv.push_back(const_cast<char *>(a.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<char *> envp;
  envp.reserve(env_.size() + 1);
  for (auto &e : env_) {
    envp.push_back(e.data());
  }
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    std::cerr << "[kmacro] xdotool: fork() failed: " << std::strerror(errno)
              << "\n";
    return false;
  }

  if (pid == 0) {
    // stdout демона это пайп uinput: дочерний процесс не должен туда писать
    (void)::dup2(devnull_fd_, STDIN_FILENO);
    (void)::dup2(devnull_fd_, STDOUT_FILENO);
    (void)::dup2(devnull_fd_, STDERR_FILENO);

    if (drop_privileges_) {
      if (!user_groups_.empty() &&
          ::setgroups(user_groups_.size(), user_groups_.data()) != 0) {
        _exit(1);
      }
      if (::setgid(user_gid_) != 0) {
        _exit(1);
      }
      if (::setuid(user_uid_) != 0) {
        _exit(1);
      }
    }

    ::execve(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  // Ждём завершения, не блокируя приём ввода
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  int status = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      break;
    }
    if (r < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[kmacro] xdotool: waitpid() failed: "
                << std::strerror(errno) << "\n";
      return false;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      std::cerr << "[kmacro] xdotool: timeout, killing pid " << pid << '\n';
      (void)::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return false;
    }
    wait_for(wait_func_, kPollStep);
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return true;
  }

  std::cerr << "[kmacro] xdotool " << args[1] << ' ' << args.back()
            << " exited with status "
            << (WIFEXITED(status) ? WEXITSTATUS(status) : -1) << '\n';
  return false;
}

} // namespace kmacro
