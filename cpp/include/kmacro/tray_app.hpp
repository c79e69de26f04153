/**
 * @file tray_app.hpp
 * @brief Tray-приложение для управления kmacro сервисом
 *
 * Отображает иконку в системном трее и предоставляет
 * меню для записи, привязки и запуска макросов.
 */

#pragma once

#include <gtk/gtk.h>

// Поддержка как Ayatana (Ubuntu 22.04+), так и legacy AppIndicator
#ifdef HAVE_AYATANA_APPINDICATOR
#include <libayatana-appindicator/app-indicator.h>
#else
#include <libappindicator/app-indicator.h>
#endif

#include <optional>
#include <string>
#include <vector>

#include "kmacro/ipc_client.hpp"

namespace kmacro {

/**
 * @brief Класс tray-приложения
 *
 * Управляет иконкой в трее, контекстным меню и
 * периодическим обновлением статуса.
 */
class TrayApp {
public:
  TrayApp();
  ~TrayApp();

  // Запрет копирования
  TrayApp(const TrayApp&) = delete;
  TrayApp& operator=(const TrayApp&) = delete;

  /**
   * @brief Инициализирует приложение
   * @return true при успехе
   */
  bool initialize();

  /**
   * @brief Запускает главный цикл GTK
   * @return Код возврата
   */
  int run();

private:
  // Callbacks для пунктов меню
  static void on_record_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_new_macro_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_execute_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_rerecord_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_bind_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_rename_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_delete_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_authorize_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_debug_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_reload_clicked(GtkMenuItem* item, gpointer user_data);
  static void on_quit_clicked(GtkMenuItem* item, gpointer user_data);

  // Callback для периодического обновления статуса
  static gboolean on_status_update(gpointer user_data);

  /// Запрашивает статус и список макросов, обновляет меню
  void refresh();

  /// Обновляет иконку в соответствии с текущим статусом
  void update_icon();

  /// Обновляет подписи пунктов меню
  void update_labels();

  /// Пересобирает подменю макросов
  void rebuild_macro_menu();

  /// Показывает ошибку, если ответ сервиса неуспешный
  void report(const std::optional<IpcResponse>& response);

  /// Диалог ввода строки (nullopt = отмена)
  [[nodiscard]] static std::optional<std::string>
  prompt_text(const char* title, const std::string& initial);

  /// id макроса, к которому привязан пункт меню
  [[nodiscard]] static std::string macro_id_of(GtkMenuItem* item);

  /// Создаёт контекстное меню
  GtkWidget* create_menu();

  // GTK компоненты
  AppIndicator* indicator_ = nullptr;
  GtkWidget* menu_ = nullptr;
  GtkWidget* status_item_ = nullptr;
  GtkWidget* record_item_ = nullptr;
  GtkWidget* macros_item_ = nullptr;
  GtkWidget* authorize_item_ = nullptr;
  GtkWidget* debug_item_ = nullptr;

  // Текущий статус
  ServiceStatus status_;
  std::vector<MacroEntry> macros_;

  // ID таймера обновления статуса
  guint status_timer_id_ = 0;
};

} // namespace kmacro
