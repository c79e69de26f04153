/**
 * @file tray_app.cpp
 * @brief Реализация tray-приложения
 */

#include "kmacro/tray_app.hpp"

#include <glib.h>

namespace kmacro {

namespace {

/// Интервал обновления статуса (мс)
constexpr guint kStatusUpdateIntervalMs = 2000;

/// Имена иконок (используем стандартные темы)
constexpr const char* kIconIdle = "input-keyboard";
constexpr const char* kIconRecording = "media-record";
constexpr const char* kIconUnauthorized = "dialog-warning";
constexpr const char* kIconUnknown = "dialog-question";

/// ID приложения для AppIndicator
constexpr const char* kAppIndicatorId = "kmacro";

/// Ключ данных пункта меню с id макроса
constexpr const char* kMacroIdKey = "kmacro-macro-id";

GtkWidget* append_item(GtkWidget* menu, const char* label, GCallback callback,
                       gpointer user_data) {
  GtkWidget* item = gtk_menu_item_new_with_label(label);
  if (callback) {
    g_signal_connect(item, "activate", callback, user_data);
  }
  gtk_menu_shell_append(GTK_MENU_SHELL(menu), item);
  return item;
}

GtkWidget* append_macro_item(GtkWidget* menu, const char* label, GCallback callback,
                             gpointer user_data, const std::string& id) {
  GtkWidget* item = append_item(menu, label, callback, user_data);
  g_object_set_data_full(G_OBJECT(item), kMacroIdKey, g_strdup(id.c_str()), g_free);
  return item;
}

std::string macro_title(const MacroEntry& entry) {
  std::string title = entry.name;
  if (!entry.binding.empty()) {
    title += "  [" + entry.binding + "]";
  }
  if (entry.events == 0) {
    title += "  (пусто)";
  }
  return title;
}

} // namespace

TrayApp::TrayApp() = default;

TrayApp::~TrayApp() {
  if (status_timer_id_ != 0) {
    g_source_remove(status_timer_id_);
  }

  if (menu_) {
    gtk_widget_destroy(menu_);
  }

  if (indicator_) {
    g_object_unref(indicator_);
  }
}

bool TrayApp::initialize() {
  // Создаём AppIndicator
  indicator_ = app_indicator_new(
      kAppIndicatorId,
      kIconUnknown,
      APP_INDICATOR_CATEGORY_APPLICATION_STATUS
  );

  if (!indicator_) {
    return false;
  }

  app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_ACTIVE);
  app_indicator_set_title(indicator_, "kmacro");

  // Создаём меню
  menu_ = create_menu();
  app_indicator_set_menu(indicator_, GTK_MENU(menu_));

  // Получаем начальный статус
  refresh();

  // Запускаем периодическое обновление статуса
  status_timer_id_ = g_timeout_add(kStatusUpdateIntervalMs, on_status_update, this);

  return true;
}

int TrayApp::run() {
  gtk_main();
  return 0;
}

GtkWidget* TrayApp::create_menu() {
  GtkWidget* menu = gtk_menu_new();

  // Строка статуса (не кликабельна)
  status_item_ = append_item(menu, "Сервис: ...", nullptr, this);
  gtk_widget_set_sensitive(status_item_, FALSE);

  gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());

  record_item_ = append_item(menu, "Начать запись", G_CALLBACK(on_record_clicked), this);
  (void)append_item(menu, "Новый макрос...", G_CALLBACK(on_new_macro_clicked), this);

  macros_item_ = append_item(menu, "Макросы", nullptr, this);
  rebuild_macro_menu();

  gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());

  authorize_item_ = append_item(menu, "Разрешить синтетический ввод",
                                G_CALLBACK(on_authorize_clicked), this);
  debug_item_ = append_item(menu, "Отладка: вкл", G_CALLBACK(on_debug_clicked), this);
  (void)append_item(menu, "Перечитать конфигурацию", G_CALLBACK(on_reload_clicked), this);

  gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());

  (void)append_item(menu, "Выход", G_CALLBACK(on_quit_clicked), this);

  gtk_widget_show_all(menu);
  return menu;
}

void TrayApp::rebuild_macro_menu() {
  if (!macros_item_) {
    return;
  }

  // Старое подменю уничтожается вместе с заменой
  GtkWidget* submenu = gtk_menu_new();

  if (macros_.empty()) {
    GtkWidget* empty = append_item(submenu, "Нет макросов", nullptr, this);
    gtk_widget_set_sensitive(empty, FALSE);
  }

  for (const auto& entry : macros_) {
    GtkWidget* macro_menu = gtk_menu_new();

    if (!entry.sequence.empty()) {
      GtkWidget* seq = append_item(macro_menu, entry.sequence.c_str(), nullptr, this);
      gtk_widget_set_sensitive(seq, FALSE);
      gtk_menu_shell_append(GTK_MENU_SHELL(macro_menu), gtk_separator_menu_item_new());
    }

    (void)append_macro_item(macro_menu, "Выполнить", G_CALLBACK(on_execute_clicked),
                            this, entry.id);
    (void)append_macro_item(macro_menu, "Перезаписать", G_CALLBACK(on_rerecord_clicked),
                            this, entry.id);
    (void)append_macro_item(macro_menu, "Назначить клавишу...",
                            G_CALLBACK(on_bind_clicked), this, entry.id);
    (void)append_macro_item(macro_menu, "Переименовать...",
                            G_CALLBACK(on_rename_clicked), this, entry.id);
    (void)append_macro_item(macro_menu, "Удалить", G_CALLBACK(on_delete_clicked),
                            this, entry.id);

    const std::string title = macro_title(entry);
    GtkWidget* macro_item = append_item(submenu, title.c_str(), nullptr, this);
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(macro_item), macro_menu);
  }

  gtk_widget_show_all(submenu);
  gtk_menu_item_set_submenu(GTK_MENU_ITEM(macros_item_), submenu);
}

void TrayApp::refresh() {
  status_ = IpcClient::get_status();

  std::vector<MacroEntry> macros;
  if (status_.available) {
    macros = IpcClient::list_macros();
  }

  if (macros != macros_) {
    macros_ = std::move(macros);
    rebuild_macro_menu();
  }

  update_icon();
  update_labels();
}

void TrayApp::update_icon() {
  const char* icon_name = kIconIdle;

  if (!status_.available) {
    icon_name = kIconUnknown;
  } else if (status_.recording) {
    icon_name = kIconRecording;
  } else if (!status_.authorized) {
    icon_name = kIconUnauthorized;
  }

  app_indicator_set_icon(indicator_, icon_name);
}

void TrayApp::update_labels() {
  if (status_item_) {
    std::string label = "Сервис недоступен";
    if (status_.available) {
      if (!status_.binding_target.empty()) {
        label = "Нажмите клавишу для привязки...";
      } else if (status_.recording) {
        label = "Идёт запись...";
      } else if (status_.replaying) {
        label = "Воспроизведение...";
      } else if (!status_.error.empty()) {
        label = status_.error;
      } else if (!status_.status_message.empty()) {
        label = status_.status_message;
      } else {
        label = "Готов";
      }
    }
    gtk_menu_item_set_label(GTK_MENU_ITEM(status_item_), label.c_str());
  }

  if (record_item_) {
    gtk_menu_item_set_label(GTK_MENU_ITEM(record_item_),
                            status_.recording ? "Остановить запись" : "Начать запись");
    gtk_widget_set_sensitive(record_item_, status_.available ? TRUE : FALSE);
  }

  if (authorize_item_) {
    gtk_widget_set_visible(authorize_item_,
                           status_.available && !status_.authorized ? TRUE : FALSE);
  }

  if (debug_item_) {
    gtk_menu_item_set_label(GTK_MENU_ITEM(debug_item_),
                            status_.debug ? "Отладка: выкл" : "Отладка: вкл");
  }
}

void TrayApp::report(const std::optional<IpcResponse>& response) {
  std::string msg;
  if (!response) {
    msg = "Сервис kmacro недоступен.";
  } else if (!response->ok) {
    msg = response->message.empty() ? "Команда не выполнена." : response->message;
  } else {
    refresh();
    return;
  }

  GtkWidget* warn = gtk_message_dialog_new(
      nullptr,
      GTK_DIALOG_MODAL,
      GTK_MESSAGE_WARNING,
      GTK_BUTTONS_OK,
      "%s",
      msg.c_str());
  (void)gtk_dialog_run(GTK_DIALOG(warn));
  gtk_widget_destroy(warn);

  refresh();
}

std::optional<std::string> TrayApp::prompt_text(const char* title,
                                                const std::string& initial) {
  GtkWidget* dialog = gtk_dialog_new_with_buttons(
      title,
      nullptr,
      GTK_DIALOG_MODAL,
      "_Отмена", GTK_RESPONSE_CANCEL,
      "_OK", GTK_RESPONSE_ACCEPT,
      nullptr);

  gtk_window_set_default_size(GTK_WINDOW(dialog), 320, -1);
  gtk_window_set_position(GTK_WINDOW(dialog), GTK_WIN_POS_CENTER);
  gtk_dialog_set_default_response(GTK_DIALOG(dialog), GTK_RESPONSE_ACCEPT);

  GtkWidget* content = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  gtk_container_set_border_width(GTK_CONTAINER(content), 12);

  GtkWidget* entry = gtk_entry_new();
  gtk_entry_set_text(GTK_ENTRY(entry), initial.c_str());
  gtk_entry_set_activates_default(GTK_ENTRY(entry), TRUE);
  gtk_box_pack_start(GTK_BOX(content), entry, FALSE, FALSE, 0);

  gtk_widget_show_all(dialog);

  std::optional<std::string> result;
  if (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_ACCEPT) {
    result = std::string{gtk_entry_get_text(GTK_ENTRY(entry))};
  }

  gtk_widget_destroy(dialog);
  return result;
}

std::string TrayApp::macro_id_of(GtkMenuItem* item) {
  const auto* id = static_cast<const char*>(g_object_get_data(G_OBJECT(item), kMacroIdKey));
  return id ? std::string{id} : std::string{};
}

void TrayApp::on_record_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  auto* app = static_cast<TrayApp*>(user_data);

  if (app->status_.recording) {
    app->report(IpcClient::stop_recording());
  } else {
    app->report(IpcClient::start_recording());
  }
}

void TrayApp::on_new_macro_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  auto* app = static_cast<TrayApp*>(user_data);

  auto name = prompt_text("Новый макрос", "New Macro");
  if (!name) {
    return;
  }
  app->report(IpcClient::create_macro(*name));
}

void TrayApp::on_execute_clicked(GtkMenuItem* item, gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  app->report(IpcClient::execute(macro_id_of(item)));
}

void TrayApp::on_rerecord_clicked(GtkMenuItem* item, gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  app->report(IpcClient::record_into(macro_id_of(item)));
}

void TrayApp::on_bind_clicked(GtkMenuItem* item, gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  app->report(IpcClient::begin_binding(macro_id_of(item)));
}

void TrayApp::on_rename_clicked(GtkMenuItem* item, gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  const std::string id = macro_id_of(item);

  std::string current;
  for (const auto& entry : app->macros_) {
    if (entry.id == id) {
      current = entry.name;
      break;
    }
  }

  auto name = prompt_text("Переименовать макрос", current);
  if (!name) {
    return;
  }
  app->report(IpcClient::rename_macro(id, *name));
}

void TrayApp::on_delete_clicked(GtkMenuItem* item, gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  const std::string id = macro_id_of(item);

  GtkWidget* ask = gtk_message_dialog_new(
      nullptr,
      GTK_DIALOG_MODAL,
      GTK_MESSAGE_QUESTION,
      GTK_BUTTONS_YES_NO,
      "%s",
      "Удалить макрос?");
  const gint response = gtk_dialog_run(GTK_DIALOG(ask));
  gtk_widget_destroy(ask);

  if (response != GTK_RESPONSE_YES) {
    return;
  }
  app->report(IpcClient::delete_macro(id));
}

void TrayApp::on_authorize_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  auto* app = static_cast<TrayApp*>(user_data);
  app->report(IpcClient::authorize());
}

void TrayApp::on_debug_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  auto* app = static_cast<TrayApp*>(user_data);
  app->report(IpcClient::set_debug(!app->status_.debug));
}

void TrayApp::on_reload_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  auto* app = static_cast<TrayApp*>(user_data);

  if (!IpcClient::reload_config()) {
    app->report(IpcResponse{false, "Не удалось перечитать конфигурацию."});
    return;
  }
  app->refresh();
}

void TrayApp::on_quit_clicked(GtkMenuItem* item, gpointer user_data) {
  (void)item;
  (void)user_data;

  gtk_main_quit();
}

gboolean TrayApp::on_status_update(gpointer user_data) {
  auto* app = static_cast<TrayApp*>(user_data);
  app->refresh();
  return G_SOURCE_CONTINUE;
}

} // namespace kmacro
