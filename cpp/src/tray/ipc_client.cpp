/**
 * @file ipc_client.cpp
 * @brief Реализация IPC клиента для связи с kmacro сервисом
 */

#include "kmacro/ipc_client.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <vector>

namespace kmacro {

namespace {

/// Создаёт подключение к серверу
int connect_to_server(const char* socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path, sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }

  return fd;
}

std::size_t parse_size(std::string_view sv) {
  std::size_t value = 0;
  (void)std::from_chars(sv.data(), sv.data() + sv.size(), value);
  return value;
}

bool parse_flag(std::string_view sv) { return sv == "1"; }

} // namespace

std::optional<IpcResponse> parse_response(std::string_view raw) {
  while (!raw.empty() && (raw.back() == '\n' || raw.back() == '\r')) {
    raw.remove_suffix(1);
  }

  IpcResponse response;
  std::string_view rest;
  if (raw.starts_with("OK")) {
    response.ok = true;
    rest = raw.substr(2);
  } else if (raw.starts_with("ERROR")) {
    response.ok = false;
    rest = raw.substr(5);
  } else {
    return std::nullopt;
  }

  if (!rest.empty() && rest.front() != ' ' && rest.front() != '\n') {
    return std::nullopt;
  }
  if (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
  response.message = std::string{rest};
  return response;
}

ServiceStatus parse_status(const IpcResponse& response) {
  ServiceStatus status;
  if (!response.ok) {
    return status;
  }
  status.available = true;

  std::istringstream lines{response.message};
  std::string line;

  // Первая строка: key=value через пробел
  if (std::getline(lines, line)) {
    std::istringstream fields{line};
    std::string field;
    while (fields >> field) {
      const auto eq = field.find('=');
      if (eq == std::string::npos) {
        continue;
      }
      std::string_view key{field.data(), eq};
      std::string_view value{field.data() + eq + 1, field.size() - eq - 1};

      if (key == "recording") {
        status.recording = parse_flag(value);
      } else if (key == "replaying") {
        status.replaying = parse_flag(value);
      } else if (key == "authorized") {
        status.authorized = parse_flag(value);
      } else if (key == "debug") {
        status.debug = parse_flag(value);
      } else if (key == "binding") {
        status.binding_target = value == "-" ? std::string{} : std::string{value};
      } else if (key == "macros") {
        status.macro_count = parse_size(value);
      }
    }
  }

  // Остальные строки: "ключ: текст"
  while (std::getline(lines, line)) {
    const auto colon = line.find(": ");
    if (colon == std::string::npos) {
      continue;
    }
    const std::string_view key{line.data(), colon};
    std::string value = line.substr(colon + 2);

    if (key == "status") {
      status.status_message = std::move(value);
    } else if (key == "error") {
      status.error = std::move(value);
    } else if (key == "last") {
      status.last_event = std::move(value);
    }
  }

  return status;
}

std::vector<MacroEntry> parse_macro_list(const IpcResponse& response) {
  std::vector<MacroEntry> entries;
  if (!response.ok) {
    return entries;
  }

  std::istringstream lines{response.message};
  std::string line;

  // Первая строка: количество
  if (!std::getline(lines, line)) {
    return entries;
  }
  entries.reserve(parse_size(line));

  while (std::getline(lines, line)) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
      const auto tab = line.find('\t', start);
      fields.push_back(line.substr(start, tab - start));
      if (tab == std::string::npos) {
        break;
      }
      start = tab + 1;
    }

    if (fields.size() < 4 || fields[0].empty()) {
      continue;
    }

    MacroEntry entry;
    entry.id = std::move(fields[0]);
    entry.name = std::move(fields[1]);
    entry.binding = fields[2] == "-" ? std::string{} : std::move(fields[2]);
    entry.events = parse_size(fields[3]);
    if (fields.size() > 4) {
      entry.sequence = std::move(fields[4]);
    }
    entries.push_back(std::move(entry));
  }

  return entries;
}

std::vector<std::string> IpcClient::list_socket_paths() {
  std::vector<std::string> sockets;
  sockets.emplace_back(kSocketPath);

  std::vector<std::string> extra;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/var/run", ec)) {
    if (ec) {
      break;
    }

    std::error_code type_ec;
    if (!entry.is_socket(type_ec) || type_ec) {
      continue;
    }

    const std::string name = entry.path().filename().string();
    if (!name.starts_with("kmacro-") || !name.ends_with(".sock")) {
      continue;
    }

    extra.push_back(entry.path().string());
  }

  std::sort(extra.begin(), extra.end());
  extra.erase(std::unique(extra.begin(), extra.end()), extra.end());

  for (auto& p : extra) {
    if (p != kSocketPath) {
      sockets.push_back(std::move(p));
    }
  }

  return sockets;
}

std::optional<std::string>
IpcClient::send_command_to_socket(const std::string& command,
                                  const std::string& socket_path, int timeout_ms) {
  int fd = connect_to_server(socket_path.c_str());
  if (fd < 0) {
    return std::nullopt;
  }

  // Отправляем команду
  std::string cmd_with_newline = command + "\n";
  ssize_t written = send(fd, cmd_with_newline.c_str(), cmd_with_newline.size(),
                         MSG_NOSIGNAL);
  if (written != static_cast<ssize_t>(cmd_with_newline.size())) {
    close(fd);
    return std::nullopt;
  }

  // Читаем ответ до закрытия соединения (LIST бывает многострочным)
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds{timeout_ms};
  std::string response;
  char buffer[1024];

  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      close(fd);
      return std::nullopt;
    }

    pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, static_cast<int>(left.count()));
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      close(fd);
      return std::nullopt;
    }

    ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(bytes_read));
  }
  close(fd);

  if (response.empty()) {
    return std::nullopt;
  }
  return response;
}

std::optional<IpcResponse> IpcClient::send_command(const std::string& command,
                                                   int timeout_ms) {
  // Идентификаторы макросов у разных экземпляров свои, поэтому команду
  // получает первый ответивший сервис.
  for (const auto& socket_path : list_socket_paths()) {
    auto raw = send_command_to_socket(command, socket_path, timeout_ms);
    if (!raw) {
      continue;
    }
    return parse_response(*raw);
  }
  return std::nullopt;
}

ServiceStatus IpcClient::get_status() {
  auto response = send_command("STATUS");
  if (!response) {
    return {};
  }
  return parse_status(*response);
}

std::vector<MacroEntry> IpcClient::list_macros() {
  auto response = send_command("LIST");
  if (!response) {
    return {};
  }
  return parse_macro_list(*response);
}

std::optional<IpcResponse> IpcClient::create_macro(const std::string& name) {
  return send_command("CREATE " + name);
}

std::optional<IpcResponse> IpcClient::rename_macro(const std::string& id,
                                                   const std::string& name) {
  return send_command("RENAME " + id + " " + name);
}

std::optional<IpcResponse> IpcClient::delete_macro(const std::string& id) {
  return send_command("DELETE " + id);
}

std::optional<IpcResponse> IpcClient::start_recording(const std::string& name) {
  std::string cmd = "RECORD_START";
  if (!name.empty()) {
    cmd += " ";
    cmd += name;
  }
  return send_command(cmd);
}

std::optional<IpcResponse> IpcClient::stop_recording() {
  return send_command("RECORD_STOP", kLongTimeoutMs);
}

std::optional<IpcResponse> IpcClient::record_into(const std::string& id) {
  return send_command("RECORD_INTO " + id);
}

std::optional<IpcResponse> IpcClient::begin_binding(const std::string& id) {
  return send_command("BIND " + id);
}

std::optional<IpcResponse> IpcClient::execute(const std::string& id, bool force) {
  std::string cmd = "EXECUTE " + id;
  if (force) {
    cmd += " force";
  }
  return send_command(cmd, kLongTimeoutMs);
}

std::optional<IpcResponse> IpcClient::authorize() {
  return send_command("AUTHORIZE");
}

std::optional<IpcResponse> IpcClient::set_debug(bool enabled) {
  return send_command(enabled ? "DEBUG 1" : "DEBUG 0");
}

bool IpcClient::reload_config(const std::string& config_path) {
  std::string cmd = "RELOAD";
  if (!config_path.empty()) {
    cmd += " ";
    cmd += config_path;
  }

  auto response = send_command(cmd);
  return response && response->ok;
}

bool IpcClient::is_service_available() {
  for (const auto& socket_path : list_socket_paths()) {
    int fd = connect_to_server(socket_path.c_str());
    if (fd < 0) {
      continue;
    }
    close(fd);
    return true;
  }
  return false;
}

} // namespace kmacro
