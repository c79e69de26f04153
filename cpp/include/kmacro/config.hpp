/**
 * @file config.hpp
 * @brief Конфигурация kmacro
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <linux/input.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "kmacro/types.hpp"

namespace kmacro {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

struct GeneralConfig {
  /// Подробный лог событий и содержимого хранилища
  bool debug = false;
};

/// Настройки воспроизведения (задержки в микросекундах для совместимости с usleep)
struct ReplayConfig {
  std::chrono::microseconds event_delay{20000};   // 20ms между событиями (tier 1)
  std::chrono::microseconds modifier_hold{10000}; // 10ms модификатор → клавиша
  std::chrono::microseconds fallback_hold{50000}; // 50ms down → up (tier 3)
  std::chrono::microseconds fallback_gap{100000}; // 100ms между клавишами (tier 3)

  /// Сколько ждать завершения xdotool на одно действие
  std::chrono::milliseconds scripted_timeout{2000};

  bool tier_scripted = true;
  bool tier_fallback = true;
};

struct RecordingConfig {
  /// Автоостановка записи в существующий макрос и ожидания привязки
  std::chrono::milliseconds auto_stop{3000};
};

struct BindingConfig {
  /// Клавиша, снимающая привязку (0 = неизвестное имя в конфиге)
  std::uint16_t clear_key = KEY_BACKSPACE;
};

struct ScheduleConfig {
  std::chrono::milliseconds authorization_interval{3000};
  std::chrono::milliseconds cache_refresh_interval{5000};
};

struct StorageConfig {
  std::filesystem::path path{std::string{kDefaultStorePath}};
};

/// Полная конфигурация приложения
struct Config {
  GeneralConfig general;
  ReplayConfig replay;
  RecordingConfig recording;
  BindingConfig binding;
  ScheduleConfig schedule;
  StorageConfig storage;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback /
/// ошибка в IPC).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Best-effort поведение: при ошибках чтения/валидации возвращает дефолты.
 * Для пути по умолчанию сначала пробуется ~/.config/kmacro/config.yaml.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Разбирает конфигурацию из потока (без валидации)
 */
[[nodiscard]] Config parse_config(std::istream &in);

/**
 * @brief Парсит значение задержки из строки
 *
 * @param value Строка с числом (миллисекунды)
 * @return Значение в микросекундах или std::nullopt
 */
[[nodiscard]] std::optional<std::chrono::microseconds>
parse_delay_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace kmacro
