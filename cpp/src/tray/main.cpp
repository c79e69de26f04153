/**
 * @file main.cpp
 * @brief Точка входа kmacro-tray
 *
 * kmacro Tray - приложение для управления сервисом kmacro
 * через иконку в системном трее.
 */

#include "kmacro/tray_app.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace {

void print_version() {
  std::cout << "kmacro Tray 1.0.0\n"
            << "Приложение для управления макросами kmacro\n";
}

void print_usage(const char* argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -h, --help     Показать эту справку\n"
            << "  -v, --version  Показать версию\n"
            << "\n"
            << "Приложение отображает иконку в системном трее\n"
            << "для записи, привязки и запуска макросов.\n";
}

} // namespace

int main(int argc, char* argv[]) {
  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
  }

  // Инициализация GTK
  gtk_init(&argc, &argv);

  // Проверяем доступность сервиса (silent; сервис может появиться позже)
  if (!kmacro::IpcClient::is_service_available()) {
    std::cerr << "[kmacro-tray] Service is not running yet\n";
  }

  // Создаём и запускаем приложение
  kmacro::TrayApp app;

  if (!app.initialize()) {
    return 1;
  }

  return app.run();
}
