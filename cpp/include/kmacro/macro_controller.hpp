/**
 * @file macro_controller.hpp
 * @brief Оркестратор: запись, привязки, поиск триггеров и воспроизведение
 *
 * Всё состояние контроллера живёт в потоке главного цикла. Ввод-вывод
 * (устройства, сокеты) выполняют внешние объекты; контроллер получает их
 * через интерфейсы MacroStore, ReplayEngine и AuthorizationProbe.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "kmacro/authorization.hpp"
#include "kmacro/input_event.hpp"
#include "kmacro/macro.hpp"
#include "kmacro/macro_store.hpp"
#include "kmacro/observer_registry.hpp"
#include "kmacro/periodic_scheduler.hpp"
#include "kmacro/recording_session.hpp"
#include "kmacro/replay_engine.hpp"
#include "kmacro/types.hpp"

namespace kmacro {

/// Настройки контроллера (раздел recording/binding конфига)
struct ControllerSettings {
  /// Автоостановка записи в макрос и отмена ожидания привязки
  std::chrono::milliseconds auto_stop{3000};
  /// Клавиша, снимающая привязку в режиме ожидания
  ScanCode clear_binding_key = KEY_BACKSPACE;
  bool debug = false;
};

/// Итог execute_macro()
enum class ExecuteResult {
  Ok,
  NothingToDo,      ///< Пустая последовательность (успех без действий)
  AlreadyReplaying, ///< Отброшено защитой от повторного входа
  NotAuthorized,
  ReplayFailed,
  NotFound
};

struct ExecuteOutcome {
  ExecuteResult result = ExecuteResult::ReplayFailed;
  std::optional<ReplayTier> tier;
  std::string message;

  [[nodiscard]] bool ok() const noexcept {
    return result == ExecuteResult::Ok || result == ExecuteResult::NothingToDo;
  }
};

class MacroController {
public:
  /// Наблюдатели получают каждое живое событие до его обработки
  using EventObservers = ObserverRegistry<InputEvent>;

  /**
   * @param store Хранилище макросов
   * @param engine Уровни воспроизведения
   * @param authorization Источник разрешения на синтетический ввод
   * @param scheduler Планировщик для таймеров (должен пережить контроллер)
   * @param settings Настройки
   */
  MacroController(MacroStore &store, ReplayEngine &engine,
                  AuthorizationProbe &authorization,
                  PeriodicScheduler &scheduler, ControllerSettings settings);

  MacroController(const MacroController &) = delete;
  MacroController &operator=(const MacroController &) = delete;

  // =========================================================================
  // Живые события
  // =========================================================================

  /**
   * @brief Обрабатывает нормализованное событие
   *
   * Порядок: набор зажатых клавиш, наблюдатели, ожидание привязки
   * (событие поглощается), запись, поиск триггера (только нажатия вне
   * записи и воспроизведения).
   */
  void handle_event(const InputEvent &ev);

  // =========================================================================
  // Воспроизведение
  // =========================================================================

  /**
   * @brief Воспроизводит макрос
   * @param macro Макрос (копируется перед воспроизведением)
   * @param force Игнорировать отсутствие разрешения (срабатывание триггера)
   */
  ExecuteOutcome execute_macro(const Macro &macro, bool force);

  /// Воспроизводит макрос из кэша по id
  ExecuteOutcome execute_macro_by_id(const MacroId &id, bool force);

  /**
   * @brief Функция, которая обрабатывает ввод, накопленный за время
   *        воспроизведения
   *
   * Вызывается после воспроизведения, пока защита от повторного входа ещё
   * поднята, поэтому накопленные события не могут запустить триггер.
   */
  void set_replay_drain(std::function<void()> drain) {
    replay_drain_ = std::move(drain);
  }

  // =========================================================================
  // Запись
  // =========================================================================

  /**
   * @brief Начинает запись нового макроса
   * @return false, если запись уже идёт
   */
  bool start_recording(std::string name);

  /**
   * @brief Перезаписывает последовательность существующего макроса
   *
   * Последовательность очищается, каждое событие сразу сохраняется в
   * макрос. Запись останавливается сама через settings.auto_stop.
   */
  bool record_into(const MacroId &id);

  /**
   * @brief Останавливает запись и сохраняет результат
   * @return Сохранённый макрос, либо std::nullopt (нечего сохранять)
   */
  std::optional<Macro> stop_recording();

  // =========================================================================
  // Привязки
  // =========================================================================

  /**
   * @brief Ждёт следующее нажатие как привязку макроса
   *
   * Клавиша clear_binding_key снимает привязку. Ожидание отменяется само
   * через settings.auto_stop.
   */
  bool begin_binding(const MacroId &id);

  void cancel_binding() noexcept;

  // =========================================================================
  // Каталог
  // =========================================================================

  std::optional<Macro> create_macro(std::string name);
  StoreOutcome rename_macro(const MacroId &id, std::string_view name);
  StoreOutcome delete_macro(const MacroId &id);

  [[nodiscard]] const Macro *find_macro(const MacroId &id) const noexcept;

  // =========================================================================
  // Периодические задачи
  // =========================================================================

  /// Перечитывает хранилище (при ошибке остаётся прежний кэш)
  void refresh_macros();

  /// Перепроверяет разрешение; при изменении пишет в лог
  void check_authorization();

  /// Запрашивает разрешение у пользователя
  bool request_authorization();

  /**
   * @brief Запускает перепроверку разрешения и обновление кэша
   *
   * Повторный вызов перезапускает задачи с новыми интервалами.
   */
  void start_periodic_tasks(std::chrono::milliseconds authorization_interval,
                            std::chrono::milliseconds refresh_interval);

  void stop_periodic_tasks() noexcept;

  // =========================================================================
  // Состояние
  // =========================================================================

  [[nodiscard]] bool is_recording() const noexcept {
    return session_.is_recording();
  }
  [[nodiscard]] bool is_replaying() const noexcept { return is_replaying_; }
  [[nodiscard]] bool is_authorized() const noexcept { return authorized_; }
  [[nodiscard]] const std::optional<MacroId> &awaiting_binding() const noexcept {
    return binding_target_;
  }
  [[nodiscard]] std::span<const Macro> macros() const noexcept {
    return macros_;
  }
  [[nodiscard]] std::span<const InputEvent> pressed_keys() const noexcept {
    return pressed_;
  }
  [[nodiscard]] const std::string &last_error() const noexcept {
    return last_error_;
  }
  [[nodiscard]] const std::string &status_message() const noexcept {
    return status_message_;
  }

  [[nodiscard]] EventObservers &observers() noexcept { return observers_; }

  void apply_settings(const ControllerSettings &settings);
  [[nodiscard]] bool debug() const noexcept { return settings_.debug; }
  void set_debug(bool enabled);

private:
  /// Поднимает флаг воспроизведения и всегда опускает его в деструкторе
  class ReplayGuard {
  public:
    explicit ReplayGuard(bool &flag) noexcept : flag_{flag} { flag_ = true; }
    ~ReplayGuard() { flag_ = false; }

    ReplayGuard(const ReplayGuard &) = delete;
    ReplayGuard &operator=(const ReplayGuard &) = delete;

  private:
    bool &flag_;
  };

  void update_pressed(const InputEvent &ev);
  void assign_binding(const InputEvent &ev);
  void mirror_live_event(const InputEvent &ev);
  void set_error(std::string message);
  void set_status(std::string message);
  void log_macros() const;

  MacroStore &store_;
  ReplayEngine &engine_;
  AuthorizationProbe &authorization_;
  PeriodicScheduler &scheduler_;
  ControllerSettings settings_;

  std::vector<Macro> macros_;
  RecordingSession session_;
  std::optional<Macro> live_target_;
  std::optional<MacroId> binding_target_;
  std::vector<InputEvent> pressed_;

  bool is_replaying_ = false;
  bool authorized_ = false;
  std::string last_error_;
  std::string status_message_;

  std::function<void()> replay_drain_;
  EventObservers observers_;

  PeriodicScheduler::Handle auto_stop_task_;
  PeriodicScheduler::Handle binding_timeout_task_;
  PeriodicScheduler::Handle authorization_task_;
  PeriodicScheduler::Handle refresh_task_;
};

} // namespace kmacro
