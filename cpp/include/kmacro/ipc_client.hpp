/**
 * @file ipc_client.hpp
 * @brief IPC клиент для связи с kmacro сервисом
 *
 * Используется tray-приложением для отправки команд и получения статуса.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kmacro {

/// Ответ сервиса: "OK ..." или "ERROR ..."
struct IpcResponse {
  bool ok = false;
  std::string message;
};

/// Статус сервиса kmacro
struct ServiceStatus {
  bool available = false; // Сервис ответил на STATUS
  bool recording = false;
  bool replaying = false;
  bool authorized = false;
  bool debug = false;
  std::string binding_target; // id макроса, ожидающего привязку
  std::size_t macro_count = 0;
  std::string status_message;
  std::string error;
  std::string last_event;
};

/// Строка ответа LIST
struct MacroEntry {
  std::string id;
  std::string name;
  std::string binding; // пусто, если привязки нет
  std::size_t events = 0;
  std::string sequence;

  bool operator==(const MacroEntry&) const = default;
};

/// Разбирает сырой ответ сервиса
[[nodiscard]] std::optional<IpcResponse> parse_response(std::string_view raw);

/// Разбирает ответ STATUS
[[nodiscard]] ServiceStatus parse_status(const IpcResponse& response);

/// Разбирает ответ LIST
[[nodiscard]] std::vector<MacroEntry> parse_macro_list(const IpcResponse& response);

/**
 * @brief IPC клиент для связи с kmacro сервисом через Unix Domain Socket
 */
class IpcClient {
public:
  /**
   * @brief Путь к сокету сервиса
   */
  static constexpr const char* kSocketPath = "/var/run/kmacro.sock";

  /**
   * @brief Timeout для операций (в миллисекундах)
   */
  static constexpr int kTimeoutMs = 1000;

  /// Воспроизведение и запись могут занимать заметное время
  static constexpr int kLongTimeoutMs = 12000;

  /**
   * @brief Получает текущий статус сервиса
   * @return Статус (available = false при ошибке)
   */
  static ServiceStatus get_status();

  /// Список макросов (пустой при ошибке)
  static std::vector<MacroEntry> list_macros();

  static std::optional<IpcResponse> create_macro(const std::string& name);
  static std::optional<IpcResponse> rename_macro(const std::string& id,
                                                 const std::string& name);
  static std::optional<IpcResponse> delete_macro(const std::string& id);

  static std::optional<IpcResponse> start_recording(const std::string& name = {});
  static std::optional<IpcResponse> stop_recording();
  static std::optional<IpcResponse> record_into(const std::string& id);
  static std::optional<IpcResponse> begin_binding(const std::string& id);
  static std::optional<IpcResponse> execute(const std::string& id, bool force = false);

  static std::optional<IpcResponse> authorize();
  static std::optional<IpcResponse> set_debug(bool enabled);

  /**
   * @brief Отправляет команду перезагрузки конфигурации
   * @param config_path Абсолютный путь к конфигу; если пусто, сервер сам решит
   * @return true при успехе
   */
  static bool reload_config(const std::string& config_path = {});

  /**
   * @brief Проверяет, доступен ли сервис
   * @return true если сервис отвечает
   */
  static bool is_service_available();

private:
  [[nodiscard]] static std::vector<std::string> list_socket_paths();

  /**
   * @brief Отправляет команду первому доступному сервису
   * @return Ответ сервиса или nullopt при ошибке
   */
  static std::optional<IpcResponse> send_command(const std::string& command,
                                                 int timeout_ms = kTimeoutMs);

  [[nodiscard]] static std::optional<std::string>
  send_command_to_socket(const std::string& command, const std::string& socket_path,
                         int timeout_ms);
};

} // namespace kmacro
