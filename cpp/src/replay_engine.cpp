/**
 * @file replay_engine.cpp
 * @brief Реализация перебора уровней воспроизведения
 */

#include "kmacro/replay_engine.hpp"

#include <unistd.h>

#include <iostream>

namespace kmacro {

void wait_for(const WaitFunc &wait, std::chrono::microseconds us) {
  if (us.count() <= 0)
    return;

  if (wait) {
    wait(us);
  } else {
    usleep(static_cast<useconds_t>(us.count()));
  }
}

void ReplayEngine::add_strategy(std::unique_ptr<ReplayStrategy> strategy) {
  if (strategy) {
    strategies_.push_back(std::move(strategy));
  }
}

ReplayOutcome ReplayEngine::replay(const Macro &macro) {
  ReplayOutcome outcome;

  if (macro.key_sequence.empty()) {
    outcome.status = ReplayStatus::NothingToDo;
    return outcome;
  }

  // Стратегия работает со своей копией: кэш может обновиться во время
  // воспроизведения
  const std::vector<InputEvent> sequence = macro.key_sequence;

  for (const auto &strategy : strategies_) {
    const ReplayTier tier = strategy->tier();
    if (debug_) {
      std::cerr << "[kmacro] Replay '" << macro.name << "': trying tier "
                << tier_name(tier) << " (" << sequence.size() << " events)\n";
    }

    TierAttempt attempt = strategy->attempt(sequence);
    if (attempt.success) {
      outcome.status = ReplayStatus::Ok;
      outcome.tier = tier;
      outcome.delivered = attempt.delivered;
      return outcome;
    }

    std::cerr << "[kmacro] Replay tier " << tier_name(tier)
              << " failed: " << attempt.error << '\n';
    outcome.errors.push_back(std::string{tier_name(tier)} + ": " +
                             attempt.error);
  }

  if (strategies_.empty()) {
    outcome.errors.emplace_back("no replay strategy configured");
  }
  outcome.status = ReplayStatus::Failed;
  return outcome;
}

} // namespace kmacro
