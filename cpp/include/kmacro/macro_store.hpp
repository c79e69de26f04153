/**
 * @file macro_store.hpp
 * @brief Постоянное хранилище макросов
 */

#pragma once

#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <vector>

#include "kmacro/macro.hpp"

namespace kmacro {

/// Результат операции с хранилищем
enum class StoreResult { Ok, NotFound, IoError, ParseError, InvalidValue };

struct StoreOutcome {
  StoreResult result = StoreResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == StoreResult::Ok; }
};

struct FetchOutcome {
  std::vector<Macro> macros;
  StoreResult result = StoreResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == StoreResult::Ok; }
};

/**
 * @brief Хранилище макросов
 *
 * fetch_all() возвращает макросы от новых к старым (по created_at).
 */
class MacroStore {
public:
  virtual ~MacroStore() = default;

  [[nodiscard]] virtual FetchOutcome fetch_all() = 0;

  /// Создаёт или заменяет макрос с тем же id
  virtual StoreOutcome save(const Macro &macro) = 0;

  virtual StoreOutcome remove(const MacroId &id) = 0;
};

/**
 * @brief Хранилище в текстовом файле
 *
 * Каждое изменение перезаписывает файл целиком через временный файл и
 * rename(). Отсутствующий файл означает пустое хранилище.
 */
class FileMacroStore final : public MacroStore {
public:
  explicit FileMacroStore(std::filesystem::path path);

  [[nodiscard]] FetchOutcome fetch_all() override;
  StoreOutcome save(const Macro &macro) override;
  StoreOutcome remove(const MacroId &id) override;

  [[nodiscard]] const std::filesystem::path &path() const noexcept {
    return path_;
  }

private:
  [[nodiscard]] FetchOutcome read_all() const;
  [[nodiscard]] StoreOutcome write_all(std::span<const Macro> macros) const;

  std::filesystem::path path_;
};

// ===========================================================================
// Формат файла
// ===========================================================================

/// Сериализует макросы в формате хранилища (с заголовком)
[[nodiscard]] std::string serialize_macros(std::span<const Macro> macros);

/**
 * @brief Разбирает формат хранилища
 *
 * Неизвестные ключи пропускаются. Некорректное событие или блок без id
 * дают ParseError с номером строки.
 */
[[nodiscard]] FetchOutcome parse_macros(std::istream &in);

/// Сортирует по created_at от новых к старым (стабильно)
void sort_newest_first(std::vector<Macro> &macros);

} // namespace kmacro
