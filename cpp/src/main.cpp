/**
 * @file main.cpp
 * @brief Точка входа kmacro
 *
 * Запись и воспроизведение макросов клавиатуры и мыши
 * Плагин для interception-tools
 *
 * Запуск: sudo intercept -g /dev/input/eventX | kmacro | uinput -d
 * /dev/input/eventX
 */

#include "kmacro/config.hpp"
#include "kmacro/event_loop.hpp"

#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <string_view>

namespace {

kmacro::EventLoop *g_loop = nullptr;

void signal_handler(int sig) {
  if ((sig == SIGINT || sig == SIGTERM) && g_loop) {
    g_loop->request_stop();
  }
}

void print_version() {
  std::cout << "kmacro 1.0.0 (C++20)\n"
            << "Запись и воспроизведение макросов для interception-tools\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -c, --config PATH  Путь к конфигурации\n"
            << "  -d, --debug        Подробный лог событий\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n"
            << "\n"
            << "Управление: kmacro-tray (IPC " << kmacro::kIpcSocketPath
            << ")\n"
            << "Конфигурация: " << kmacro::kConfigPath << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string_view config_path = kmacro::kConfigPath;
  bool debug = false;

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
    if (arg == "-d" || arg == "--debug") {
      debug = true;
      continue;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "[kmacro] Missing value for " << arg << "\n";
        return 2;
      }
      config_path = argv[++i];
      continue;
    }
    std::cerr << "[kmacro] Unknown option: " << arg << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // Загрузка конфигурации
  auto config = kmacro::load_config(config_path);
  if (debug) {
    config.general.debug = true;
  }

  kmacro::EventLoop loop{std::move(config)};
  g_loop = &loop;

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  // Закрытый stdout не должен убивать процесс: ошибка записи видна в emit
  signal(SIGPIPE, SIG_IGN);

  const int rc = loop.run();
  g_loop = nullptr;
  return rc;
}
