/**
 * @file event_loop.hpp
 * @brief Главный цикл обработки событий ввода
 *
 * Читает input_event из stdin (interception-tools), пропускает их дальше в
 * stdout, отслеживает модификаторы и передаёт нормализованные события
 * контроллеру макросов. Команды IPC выполняются в этом же потоке.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <string>

#include "kmacro/authorization.hpp"
#include "kmacro/config.hpp"
#include "kmacro/ipc_server.hpp"
#include "kmacro/key_injector.hpp"
#include "kmacro/macro_controller.hpp"
#include "kmacro/macro_store.hpp"
#include "kmacro/message_queue.hpp"
#include "kmacro/periodic_scheduler.hpp"
#include "kmacro/replay_engine.hpp"
#include "kmacro/types.hpp"
#include "kmacro/x11_event_poster.hpp"
#include "kmacro/x11_session.hpp"
#include "kmacro/xdotool_automation.hpp"

namespace kmacro {

/**
 * @brief Главный класс приложения
 *
 * Владеет всеми компонентами сервиса. Контроллер, планировщик и уровни
 * воспроизведения работают только в потоке run().
 */
class EventLoop {
public:
  /**
   * @brief Конструктор
   * @param config Конфигурация приложения
   */
  explicit EventLoop(Config config);

  ~EventLoop();

  // Запрет копирования
  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  /**
   * @brief Инициализирует компоненты (X11 сессия, уровни воспроизведения, IPC)
   * @return true если инициализация успешна
   */
  bool initialize();

  /**
   * @brief Запрашивает остановку цикла обработки событий
   *
   * Thread-safe. Может вызываться из signal handler.
   */
  void request_stop() noexcept;

  /**
   * @brief Запускает главный цикл
   * @return Код возврата (0 = успех)
   *
   * Блокирующий вызов: читает stdin до EOF или ошибки.
   */
  [[nodiscard]] int run();

private:
  /// Команда из IPC-потока, ожидающая выполнения в главном цикле
  struct PendingCommand {
    IpcRequest request;
    std::promise<IpcResult> reply;
  };

  /// Обрабатывает входящее событие (passthrough + контроллер)
  void handle_event(const input_event &ev);

  /// Кладёт событие в очередь отложенных (во время воспроизведения)
  void buffer_event(const input_event &ev);

  /// Ожидает указанное время, буферизуя входящие события
  void wait_and_buffer(std::chrono::microseconds us);

  /// Обрабатывает все накопленные события
  void drain_pending_events();

  /// Пересобирает цепочку уровней воспроизведения по текущему конфигу
  void build_strategies();

  /// Применяет конфиг к контроллеру и периодическим задачам
  void apply_config();

  /// Повторная попытка подключиться к X11, если сессия ещё не найдена
  void retry_x11_session();

  // =========================================================================
  // IPC
  // =========================================================================

  /// Передаёт команду в главный цикл и ждёт ответа (вызывается из IPC потока)
  IpcResult submit_command(IpcRequest request);

  /// Выполняет накопленные команды (главный поток)
  void process_commands();

  /// Отвечает на все невыполненные команды при остановке
  void reject_pending_commands();

  /// Выполняет одну команду (главный поток)
  IpcResult execute_command(const IpcRequest &request);

  IpcResult command_status() const;
  IpcResult command_list() const;
  IpcResult command_rename(const std::string &argument);
  IpcResult command_execute(const std::string &argument);

  /// Перезагружает конфигурацию.
  /// Если config_path не пуст, пытается загрузить именно этот файл.
  IpcResult reload_config(const std::string &config_path = {});

  // =========================================================================
  // Состояние
  // =========================================================================

  Config config_;
  ModifierState modifiers_;

  // Планировщик объявлен до контроллера: задачи контроллера снимаются
  // в его деструкторе, пока планировщик ещё жив.
  PeriodicScheduler scheduler_;
  FileMacroStore store_;
  X11Session x11_session_;

  std::unique_ptr<KeyInjector> injector_;
  std::unique_ptr<XdotoolAutomation> automation_;
  X11EventPoster poster_;
  UinputAuthorization authorization_;

  ReplayEngine engine_;
  MacroController controller_;

  /// Описание последнего события (для STATUS)
  std::string last_event_;
  MacroController::EventObservers::Subscription last_event_subscription_;

  /// Очередь событий, накопленных во время воспроизведения макроса
  std::deque<input_event> pending_events_;

  /// Время последней попытки повторной инициализации X11
  std::chrono::steady_clock::time_point last_x11_retry_{};

  bool initialized_ = false;

  /// Атомарный флаг запроса остановки (от signal handler)
  std::atomic<bool> stop_requested_{false};

  MessageQueue<PendingCommand> commands_;

  /// IPC сервер для управления из tray-приложения
  std::unique_ptr<IpcServer> ipc_server_;
};

} // namespace kmacro
