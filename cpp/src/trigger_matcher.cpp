/**
 * @file trigger_matcher.cpp
 * @brief Реализация поиска привязки
 */

#include "kmacro/trigger_matcher.hpp"

namespace kmacro {

bool binding_matches(const InputEvent &binding,
                     const InputEvent &event) noexcept {
  if (!binding.same_source(event)) {
    return false;
  }
  return binding.modifiers() == 0 || binding.modifiers() == event.modifiers();
}

const Macro *match_trigger(const InputEvent &event,
                           std::span<const Macro> candidates) noexcept {
  for (const auto &macro : candidates) {
    if (macro.binding && binding_matches(*macro.binding, event)) {
      return &macro;
    }
  }
  return nullptr;
}

} // namespace kmacro
