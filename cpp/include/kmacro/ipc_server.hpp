/**
 * @file ipc_server.hpp
 * @brief IPC сервер для управления kmacro через Unix Domain Socket
 *
 * Позволяет внешним приложениям (kmacro-tray) управлять сервисом:
 * - Записывать, переименовывать и удалять макросы
 * - Назначать привязки и запускать макросы
 * - Перезагружать конфигурацию и получать статус
 */

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace kmacro {

/// Путь к Unix Domain Socket
inline constexpr const char *kIpcSocketPath = "/var/run/kmacro.sock";

/// Команды IPC протокола
enum class IpcCommand {
  Unknown,
  Status,      // STATUS -> recording=0|1 replaying=0|1 ...
  List,        // LIST -> строка на макрос
  Create,      // CREATE <name> -> <id>
  Rename,      // RENAME <id> <name>
  Delete,      // DELETE <id>
  RecordStart, // RECORD_START [name]
  RecordStop,  // RECORD_STOP -> <id>
  RecordInto,  // RECORD_INTO <id>
  Bind,        // BIND <id>
  Execute,     // EXECUTE <id> [force]
  Authorize,   // AUTHORIZE -> authorized=0|1
  Debug,       // DEBUG 0|1
  Pressed,     // PRESSED -> подписи зажатых клавиш
  Reload,      // RELOAD [path]
  Shutdown     // SHUTDOWN -> ERROR (не поддерживается)
};

/// Разобранная команда
struct IpcRequest {
  IpcCommand command = IpcCommand::Unknown;
  std::string argument; ///< Всё после имени команды (без крайних пробелов)
};

/// Результат выполнения команды
struct IpcResult {
  bool success = false;
  std::string message;
};

/// Разбирает строку команды
[[nodiscard]] IpcRequest parse_request(std::string_view line);

/// Формирует ответ: "OK <message>\n" или "ERROR <message>\n"
[[nodiscard]] std::string format_response(const IpcResult &result);

/**
 * @brief IPC сервер на Unix Domain Socket
 *
 * Работает в отдельном потоке, не блокирует основной event loop.
 */
class IpcServer {
public:
  /// Обработчик команды.
  /// Важно: вызывается в IPC-потоке, поэтому должен быть потокобезопасным.
  using RequestHandler = std::function<IpcResult(IpcRequest)>;

  explicit IpcServer(RequestHandler handler);

  ~IpcServer();

  // Запрет копирования
  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /**
   * @brief Запускает IPC сервер в отдельном потоке
   * @return true если сервер успешно запущен
   */
  bool start();

  /**
   * @brief Останавливает IPC сервер
   *
   * Ожидает завершения потока (join).
   */
  void stop();

  /**
   * @brief Проверяет, запущен ли сервер
   */
  [[nodiscard]] bool is_running() const noexcept;

  /// Фактический путь сокета
  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  /// Основной цикл сервера (выполняется в отдельном потоке)
  void server_loop(std::stop_token st);

  /// Обрабатывает входящее соединение
  void handle_client(int client_fd);

  /// Создаёт и настраивает серверный сокет
  [[nodiscard]] int create_socket();

  RequestHandler handler_;

  std::atomic<bool> running_{false};
  std::jthread server_thread_;
  int server_fd_ = -1;

  // Фактический путь сокета, на котором запущен этот экземпляр.
  // Может отличаться от kIpcSocketPath, если основной сокет уже занят.
  std::string socket_path_;
};

} // namespace kmacro
