/**
 * @file replay_engine.hpp
 * @brief Перебор уровней воспроизведения
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kmacro/macro.hpp"
#include "kmacro/replay_strategy.hpp"

namespace kmacro {

/// Итог воспроизведения
enum class ReplayStatus { Ok, NothingToDo, Failed };

struct ReplayOutcome {
  ReplayStatus status = ReplayStatus::Failed;
  std::optional<ReplayTier> tier;   ///< Уровень, который справился
  std::vector<std::string> errors;  ///< Ошибки уровней, которые не справились
  std::size_t delivered = 0;

  [[nodiscard]] bool ok() const noexcept {
    return status != ReplayStatus::Failed;
  }
};

/**
 * @brief Упорядоченный список стратегий
 *
 * Первая успешная стратегия прерывает перебор. Уровни не смешиваются и
 * не повторяются.
 */
class ReplayEngine {
public:
  ReplayEngine() = default;

  ReplayEngine(const ReplayEngine &) = delete;
  ReplayEngine &operator=(const ReplayEngine &) = delete;

  /// Добавляет стратегию в конец списка
  void add_strategy(std::unique_ptr<ReplayStrategy> strategy);

  /// Удаляет все стратегии (перед пересборкой при RELOAD)
  void clear() noexcept { strategies_.clear(); }

  [[nodiscard]] std::size_t strategy_count() const noexcept {
    return strategies_.size();
  }

  /**
   * @brief Воспроизводит макрос
   *
   * Пустая последовательность: NothingToDo, ни одна стратегия не вызывается.
   */
  [[nodiscard]] ReplayOutcome replay(const Macro &macro);

  void set_debug(bool enabled) noexcept { debug_ = enabled; }

private:
  std::vector<std::unique_ptr<ReplayStrategy>> strategies_;
  bool debug_ = false;
};

} // namespace kmacro
