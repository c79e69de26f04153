/**
 * @file ipc_server.cpp
 * @brief Реализация IPC сервера на Unix Domain Socket
 */

#include "kmacro/ipc_server.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

namespace kmacro {

namespace {

/// Максимальная длина строки команды
constexpr std::size_t kMaxRequestBytes = 1024;

/// Сколько ждать окончания строки от клиента
constexpr int kReadTimeoutMs = 1000;

struct CommandName {
  std::string_view name;
  IpcCommand command;
};

constexpr std::array kCommandNames = std::to_array<CommandName>({
    {"STATUS", IpcCommand::Status},
    {"LIST", IpcCommand::List},
    {"CREATE", IpcCommand::Create},
    {"RENAME", IpcCommand::Rename},
    {"DELETE", IpcCommand::Delete},
    {"RECORD_START", IpcCommand::RecordStart},
    {"RECORD_STOP", IpcCommand::RecordStop},
    {"RECORD_INTO", IpcCommand::RecordInto},
    {"BIND", IpcCommand::Bind},
    {"EXECUTE", IpcCommand::Execute},
    {"AUTHORIZE", IpcCommand::Authorize},
    {"DEBUG", IpcCommand::Debug},
    {"PRESSED", IpcCommand::Pressed},
    {"RELOAD", IpcCommand::Reload},
    {"SHUTDOWN", IpcCommand::Shutdown},
});

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

} // namespace

IpcRequest parse_request(std::string_view line) {
  line = trim(line);

  const auto space_pos = line.find(' ');
  const std::string_view name = line.substr(0, space_pos);

  IpcRequest request;
  for (const auto &entry : kCommandNames) {
    if (entry.name == name) {
      request.command = entry.command;
      break;
    }
  }

  if (space_pos != std::string_view::npos) {
    request.argument = std::string{trim(line.substr(space_pos + 1))};
  }
  return request;
}

std::string format_response(const IpcResult &result) {
  std::string response = result.success ? "OK" : "ERROR";
  if (!result.message.empty()) {
    response += " ";
    response += result.message;
  }
  response += "\n";
  return response;
}

IpcServer::IpcServer(RequestHandler handler) : handler_(std::move(handler)) {}

IpcServer::~IpcServer() { stop(); }

bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  server_fd_ = create_socket();
  if (server_fd_ < 0) {
    return false;
  }

  running_.store(true);
  server_thread_ =
      std::jthread([this](std::stop_token st) { server_loop(std::move(st)); });

  std::cerr << "[kmacro-ipc] Server started on " << socket_path_ << "\n";
  return true;
}

void IpcServer::stop() {
  if (!running_.load()) {
    return;
  }

  running_.store(false);

  // Ждём завершения потока (poll просыпается каждые 500ms)
  if (server_thread_.joinable()) {
    server_thread_.request_stop();
    server_thread_.join();
  }

  if (server_fd_ >= 0) {
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  // Удаляем файл сокета
  if (!socket_path_.empty()) {
    unlink(socket_path_.c_str());
    socket_path_.clear();
  }

  std::cerr << "[kmacro-ipc] Server stopped\n";
}

bool IpcServer::is_running() const noexcept { return running_.load(); }

int IpcServer::create_socket() {
  auto is_socket_active = [](const char *socket_path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      // Если не можем проверить, считаем сокет "живым" и не удаляем путь.
      return true;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path, sizeof(addr.sun_path) - 1);

    bool active = false;
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
      active = true;
    } else {
      // ECONNREFUSED/ENOENT: стейл-файл без слушателя.
      active = !(errno == ECONNREFUSED || errno == ENOENT);
    }

    close(fd);
    return active;
  };

  auto create_bound_socket = [&](const std::string &socket_path,
                                 bool unlink_first, int *out_errno) -> int {
    if (unlink_first) {
      (void)unlink(socket_path.c_str());
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      if (out_errno) {
        *out_errno = errno;
      }
      std::cerr << "[kmacro-ipc] Failed to create socket: " << strerror(errno)
                << "\n";
      return -1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      const int err = errno;
      if (out_errno) {
        *out_errno = err;
      }
      std::cerr << "[kmacro-ipc] Failed to bind socket (" << socket_path
                << "): " << strerror(err) << "\n";
      close(fd);
      return -1;
    }

    // rw для всех (0666): трей работает от пользователя, сервис от root
    if (chmod(socket_path.c_str(), 0666) < 0) {
      std::cerr << "[kmacro-ipc] Warning: failed to chmod socket ("
                << socket_path << "): " << strerror(errno) << "\n";
    }

    if (listen(fd, 5) < 0) {
      const int err = errno;
      if (out_errno) {
        *out_errno = err;
      }
      std::cerr << "[kmacro-ipc] Failed to listen (" << socket_path
                << "): " << strerror(err) << "\n";
      close(fd);
      (void)unlink(socket_path.c_str());
      return -1;
    }

    socket_path_ = socket_path;
    if (out_errno) {
      *out_errno = 0;
    }
    return fd;
  };

  // 1) Пытаемся поднять основной сокет.
  int bind_errno = 0;
  int fd =
      create_bound_socket(kIpcSocketPath, /*unlink_first=*/false, &bind_errno);
  if (fd >= 0) {
    return fd;
  }

  // 2) Если основной сокет занят, не трогаем его (multi-instance),
  // а поднимаем отдельный сокет для текущего процесса.
  if (bind_errno == EADDRINUSE) {
    if (!is_socket_active(kIpcSocketPath)) {
      std::cerr << "[kmacro-ipc] Stale primary socket detected, replacing: "
                << kIpcSocketPath << "\n";
      (void)unlink(kIpcSocketPath);
      bind_errno = 0;
      fd = create_bound_socket(kIpcSocketPath, /*unlink_first=*/false,
                               &bind_errno);
      if (fd >= 0) {
        return fd;
      }
    }

    const std::string fallback =
        std::string("/var/run/kmacro-") + std::to_string(::getpid()) + ".sock";
    std::cerr << "[kmacro-ipc] Primary socket busy, using: " << fallback
              << "\n";

    bind_errno = 0;
    fd = create_bound_socket(fallback, /*unlink_first=*/true, &bind_errno);
    if (fd >= 0) {
      return fd;
    }
  }

  return -1;
}

void IpcServer::server_loop(std::stop_token st) {
  std::cerr << "[kmacro-ipc] Server thread started\n";

  while (running_.load() && !st.stop_requested()) {
    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, 500); // Timeout 500ms для проверки running_

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[kmacro-ipc] Poll error: " << strerror(errno) << "\n";
      break;
    }

    if (ret == 0) {
      continue;
    }

    if (pfd.revents & POLLIN) {
      sockaddr_un client_addr{};
      socklen_t client_len = sizeof(client_addr);

      int client_fd = accept4(server_fd_,
                              reinterpret_cast<sockaddr *>(&client_addr),
                              &client_len, SOCK_CLOEXEC);
      if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && running_.load()) {
          std::cerr << "[kmacro-ipc] Accept error: " << strerror(errno) << "\n";
        }
        continue;
      }

      handle_client(client_fd);
      close(client_fd);
    }
  }

  std::cerr << "[kmacro-ipc] Server thread exiting\n";
}

void IpcServer::handle_client(int client_fd) {
  // Читаем до перевода строки (команда может прийти несколькими пакетами)
  std::string line;
  std::array<char, 256> buffer{};
  while (line.size() < kMaxRequestBytes &&
         line.find('\n') == std::string::npos) {
    pollfd pfd = {client_fd, POLLIN, 0};
    int ret = poll(&pfd, 1, kReadTimeoutMs);
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      break;
    }

    ssize_t bytes_read = read(client_fd, buffer.data(), buffer.size());
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      break;
    }
    line.append(buffer.data(), static_cast<std::size_t>(bytes_read));
  }

  if (auto nl = line.find('\n'); nl != std::string::npos) {
    line.resize(nl);
  }
  if (trim(line).empty()) {
    return;
  }

  IpcRequest request = parse_request(line);
  std::cerr << "[kmacro-ipc] Received command: " << trim(line) << "\n";

  IpcResult result;
  if (request.command == IpcCommand::Unknown) {
    result = {false, "Unknown command"};
  } else if (request.command == IpcCommand::Shutdown) {
    // Сервис не должен выключаться по IPC команде от пользователя:
    // это нарушит работу udevmon
    result = {false, "Shutdown not allowed via IPC"};
  } else if (!handler_) {
    result = {false, "Not supported"};
  } else {
    result = handler_(std::move(request));
  }

  const std::string response = format_response(result);
  std::size_t sent = 0;
  while (sent < response.size()) {
    ssize_t written = send(client_fd, response.data() + sent,
                           response.size() - sent, MSG_NOSIGNAL);
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written <= 0) {
      std::cerr << "[kmacro-ipc] Failed to send response: " << strerror(errno)
                << "\n";
      return;
    }
    sent += static_cast<std::size_t>(written);
  }
}

} // namespace kmacro
