/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "kmacro/config.hpp"
#include "kmacro/key_labels.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace kmacro {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Парсит целое число из строки
std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Интервал в миллисекундах (только положительный)
std::optional<std::chrono::milliseconds> parse_interval_ms(std::string_view sv) {
  auto ms = parse_int(sv);
  if (ms && *ms > 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

/// Снимает кавычки вокруг значения ("..." или '...')
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    return sv.substr(1, sv.size() - 2);
  }
  return sv;
}

/// Получает путь к user config (~/.config/kmacro/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

} // namespace

std::optional<std::chrono::microseconds>
parse_delay_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms > 0) {
    return std::chrono::microseconds{*ms * 1000};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  // Проверка задержек
  if (config.replay.event_delay.count() <= 0 ||
      config.replay.modifier_hold.count() <= 0 ||
      config.replay.fallback_hold.count() <= 0 ||
      config.replay.fallback_gap.count() <= 0 ||
      config.replay.scripted_timeout.count() <= 0) {
    return false;
  }

  // Проверка таймеров
  if (config.recording.auto_stop.count() <= 0 ||
      config.schedule.authorization_interval.count() <= 0 ||
      config.schedule.cache_refresh_interval.count() <= 0) {
    return false;
  }

  // Проверка кода клавиши
  if (config.binding.clear_key == 0) {
    return false;
  }

  if (config.storage.path.empty()) {
    return false;
  }

  return true;
}

Config parse_config(std::istream &file) {
  Config config;

  std::string line;
  std::string current_section;

  while (std::getline(file, line)) {
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Определение секции: "name:" без значения и без отступа
    const bool indented =
        !line.empty() && std::isspace(static_cast<unsigned char>(line.front()));
    if (!indented && sv.back() == ':') {
      current_section = std::string{sv.substr(0, sv.size() - 1)};
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));

    // Комментарий в конце строки
    if (auto hash = value.find(" #"); hash != std::string_view::npos) {
      value = trim(value.substr(0, hash));
    }

    if (current_section == "general") {
      if (key == "debug") {
        if (auto val = parse_bool(value)) {
          config.general.debug = *val;
        }
      }
    } else if (current_section == "replay") {
      if (key == "tier_scripted") {
        if (auto val = parse_bool(value)) {
          config.replay.tier_scripted = *val;
        }
      } else if (key == "tier_fallback") {
        if (auto val = parse_bool(value)) {
          config.replay.tier_fallback = *val;
        }
      } else if (key == "scripted_timeout_ms") {
        if (auto val = parse_interval_ms(value)) {
          config.replay.scripted_timeout = *val;
        }
      } else if (auto delay = parse_delay_ms(value)) {
        if (key == "event_delay_ms") {
          config.replay.event_delay = *delay;
        } else if (key == "modifier_hold_ms") {
          config.replay.modifier_hold = *delay;
        } else if (key == "fallback_hold_ms") {
          config.replay.fallback_hold = *delay;
        } else if (key == "fallback_gap_ms") {
          config.replay.fallback_gap = *delay;
        }
      }
    } else if (current_section == "recording") {
      if (key == "auto_stop_ms") {
        if (auto val = parse_interval_ms(value)) {
          config.recording.auto_stop = *val;
        }
      }
    } else if (current_section == "binding") {
      if (key == "clear_key") {
        // Неизвестное имя: 0, validate_config() отклонит конфиг
        config.binding.clear_key = key_name_to_code(value).value_or(0);
      }
    } else if (current_section == "schedule") {
      if (key == "authorization_interval_ms") {
        if (auto val = parse_interval_ms(value)) {
          config.schedule.authorization_interval = *val;
        }
      } else if (key == "cache_refresh_interval_ms") {
        if (auto val = parse_interval_ms(value)) {
          config.schedule.cache_refresh_interval = *val;
        }
      }
    } else if (current_section == "storage") {
      if (key == "path") {
        config.storage.path = std::string{unquote(value)};
      }
    }
  }

  return config;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  out.config = parse_config(file);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[kmacro] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый: используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[kmacro] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace kmacro
