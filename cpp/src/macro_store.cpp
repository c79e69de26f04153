/**
 * @file macro_store.cpp
 * @brief Реализация файлового хранилища макросов
 */

#include "kmacro/macro_store.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

namespace kmacro {

namespace {

constexpr std::string_view kHeader = "# kmacro macros v1";

/// Удаление пробелов в начале и конце строки
std::string_view trim(std::string_view str) noexcept {
  const auto start = str.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  const auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(start, end - start + 1);
}

/// Однострочное значение: переводы строк заменяются пробелами
std::string single_line(std::string_view value) {
  std::string out{value};
  std::replace(out.begin(), out.end(), '\n', ' ');
  std::replace(out.begin(), out.end(), '\r', ' ');
  return out;
}

template <typename T>
std::optional<T> parse_number(std::string_view str) noexcept {
  T value{};
  const auto *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), last, value);
  if (str.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string_view take_word(std::string_view &rest) noexcept {
  rest = trim(rest);
  const auto end = rest.find(' ');
  std::string_view word = rest.substr(0, end);
  rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
  return word;
}

std::string encode_step(const MacroStep &step) {
  std::string out = step.id;
  switch (step.type) {
  case StepType::Key:
  case StepType::Mouse:
    out += step.type == StepType::Key ? " key " : " mouse ";
    out += std::to_string(step.code.value_or(0));
    out += ' ';
    out += std::to_string(static_cast<unsigned>(step.modifiers));
    break;
  case StepType::Text:
    out += " text ";
    out += single_line(step.text.value_or(""));
    break;
  case StepType::Delay:
    out += " delay ";
    out += std::to_string(step.delay ? step.delay->count() : 0);
    break;
  }
  return out;
}

std::optional<MacroStep> decode_step(std::string_view text) {
  std::string_view rest = text;
  MacroStep step;
  step.id = std::string{take_word(rest)};
  const std::string_view type = take_word(rest);

  if (type == "key" || type == "mouse") {
    step.type = type == "key" ? StepType::Key : StepType::Mouse;
    const auto code = parse_number<std::uint16_t>(take_word(rest));
    const auto mask = parse_number<unsigned>(take_word(rest));
    if (!code || !mask || *mask > kModAll) {
      return std::nullopt;
    }
    step.code = *code;
    step.modifiers = static_cast<ModifierMask>(*mask);
  } else if (type == "text") {
    step.type = StepType::Text;
    step.text = std::string{trim(rest)};
  } else if (type == "delay") {
    step.type = StepType::Delay;
    const auto ms = parse_number<long long>(take_word(rest));
    if (!ms) {
      return std::nullopt;
    }
    step.delay = std::chrono::milliseconds{*ms};
  } else {
    return std::nullopt;
  }

  if (step.id.empty()) {
    step.id = generate_macro_id();
  }
  return step;
}

} // namespace

// ===========================================================================
// Формат файла
// ===========================================================================

void sort_newest_first(std::vector<Macro> &macros) {
  std::stable_sort(macros.begin(), macros.end(),
                   [](const Macro &a, const Macro &b) {
                     return a.created_at > b.created_at;
                   });
}

std::string serialize_macros(std::span<const Macro> macros) {
  std::ostringstream out;
  out << kHeader << '\n';

  for (const auto &macro : macros) {
    const auto created_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            macro.created_at.time_since_epoch())
            .count();

    out << "\nmacro:\n";
    out << "  id: " << macro.id << '\n';
    out << "  name: " << single_line(macro.name) << '\n';
    out << "  created_at: " << created_ms << '\n';
    if (macro.binding) {
      out << "  binding: " << encode_event(*macro.binding) << '\n';
    }
    for (const auto &ev : macro.key_sequence) {
      out << "  event: " << encode_event(ev) << '\n';
    }
    for (const auto &step : macro.steps) {
      out << "  step: " << encode_step(step) << '\n';
    }
  }

  return out.str();
}

FetchOutcome parse_macros(std::istream &in) {
  FetchOutcome outcome;
  std::optional<Macro> current;
  std::string line;
  int line_num = 0;

  auto fail = [&](const std::string &what) {
    outcome.macros.clear();
    outcome.result = StoreResult::ParseError;
    outcome.error = "line " + std::to_string(line_num) + ": " + what;
    return outcome;
  };

  auto flush = [&]() -> bool {
    if (!current) {
      return true;
    }
    if (current->id.empty()) {
      return false;
    }
    outcome.macros.push_back(std::move(*current));
    current.reset();
    return true;
  };

  while (std::getline(in, line)) {
    ++line_num;
    const std::string_view trimmed = trim(line);

    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    if (trimmed == "macro:") {
      if (!flush()) {
        return fail("macro block without id");
      }
      current.emplace();
      continue;
    }

    const auto colon = trimmed.find(':');
    if (colon == std::string_view::npos) {
      return fail("expected 'key: value'");
    }
    if (!current) {
      return fail("value outside of a macro block");
    }

    const std::string_view key = trim(trimmed.substr(0, colon));
    const std::string_view value = trim(trimmed.substr(colon + 1));

    if (key == "id") {
      current->id = std::string{value};
    } else if (key == "name") {
      current->name = std::string{value};
    } else if (key == "created_at") {
      const auto ms = parse_number<long long>(value);
      if (!ms) {
        return fail("invalid created_at");
      }
      current->created_at =
          InputEvent::Clock::time_point{std::chrono::milliseconds{*ms}};
    } else if (key == "binding") {
      auto ev = decode_event(value);
      if (!ev) {
        return fail("invalid binding");
      }
      current->binding = std::move(*ev);
    } else if (key == "event") {
      auto ev = decode_event(value);
      if (!ev) {
        return fail("invalid event");
      }
      current->key_sequence.push_back(std::move(*ev));
    } else if (key == "step") {
      auto step = decode_step(value);
      if (!step) {
        return fail("invalid step");
      }
      current->steps.push_back(std::move(*step));
    }
    // Неизвестные ключи пропускаем
  }

  if (!flush()) {
    return fail("macro block without id");
  }

  sort_newest_first(outcome.macros);
  return outcome;
}

// ===========================================================================
// FileMacroStore
// ===========================================================================

FileMacroStore::FileMacroStore(std::filesystem::path path)
    : path_{std::move(path)} {}

FetchOutcome FileMacroStore::read_all() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) {
      return {{}, StoreResult::IoError, ec.message()};
    }
    return {};
  }

  std::ifstream file{path_};
  if (!file.is_open()) {
    return {{}, StoreResult::IoError, "Cannot open " + path_.string()};
  }

  FetchOutcome outcome = parse_macros(file);
  if (!outcome.ok()) {
    outcome.error = path_.string() + ": " + outcome.error;
  }
  return outcome;
}

StoreOutcome FileMacroStore::write_all(std::span<const Macro> macros) const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return {StoreResult::IoError,
              "Cannot create " + path_.parent_path().string() + ": " +
                  ec.message()};
    }
  }

  std::filesystem::path tmp_path = path_;
  tmp_path += ".tmp";

  {
    std::ofstream file{tmp_path, std::ios::trunc};
    if (!file.is_open()) {
      return {StoreResult::IoError, "Cannot write " + tmp_path.string()};
    }

    file.imbue(std::locale::classic());
    file << serialize_macros(macros);

    file.flush();
    if (!file.good()) {
      return {StoreResult::IoError, "Write failed: " + tmp_path.string()};
    }
  }

  // rename в пределах одной ФС атомарен
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    return {StoreResult::IoError,
            "Cannot replace " + path_.string() + ": " + ec.message()};
  }

  return {};
}

FetchOutcome FileMacroStore::fetch_all() { return read_all(); }

StoreOutcome FileMacroStore::save(const Macro &macro) {
  if (macro.id.empty()) {
    return {StoreResult::InvalidValue, "Macro without id"};
  }

  FetchOutcome loaded = read_all();
  if (!loaded.ok()) {
    return {loaded.result, loaded.error};
  }

  auto it = std::find_if(loaded.macros.begin(), loaded.macros.end(),
                         [&](const Macro &m) { return m.id == macro.id; });
  if (it != loaded.macros.end()) {
    *it = macro;
  } else {
    loaded.macros.push_back(macro);
  }

  sort_newest_first(loaded.macros);
  return write_all(loaded.macros);
}

StoreOutcome FileMacroStore::remove(const MacroId &id) {
  FetchOutcome loaded = read_all();
  if (!loaded.ok()) {
    return {loaded.result, loaded.error};
  }

  const auto erased = std::erase_if(
      loaded.macros, [&](const Macro &m) { return m.id == id; });
  if (erased == 0) {
    return {StoreResult::NotFound, "No macro with id " + id};
  }

  return write_all(loaded.macros);
}

} // namespace kmacro
