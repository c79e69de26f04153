/**
 * @file macro.cpp
 * @brief Реализация модели макроса
 */

#include "kmacro/macro.hpp"

#include <array>
#include <cstdio>
#include <random>

#include "kmacro/event_normalizer.hpp"

namespace kmacro {

MacroId generate_macro_id() {
  thread_local std::mt19937_64 rng{[] {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
  }()};

  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    std::uint64_t chunk = rng();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(chunk >> (j * 8));
    }
  }

  // RFC 4122: версия 4, вариант 10xx
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return MacroId{buf};
}

Macro Macro::create(std::string name) {
  Macro macro;
  macro.id = generate_macro_id();
  macro.name = name.empty() ? std::string{kDefaultMacroName} : std::move(name);
  macro.created_at = InputEvent::Clock::now();
  return macro;
}

bool rename_macro(Macro &macro, std::string_view name) {
  if (name.empty()) {
    return false;
  }
  macro.name = std::string{name};
  return true;
}

std::vector<MacroStep> project_steps(std::span<const InputEvent> sequence) {
  std::vector<MacroStep> steps;
  for (const auto &ev : sequence) {
    if (!ev.pressed()) {
      continue;
    }
    MacroStep step;
    step.id = generate_macro_id();
    step.type = ev.is_mouse() ? StepType::Mouse : StepType::Key;
    step.code = ev.code();
    step.modifiers = ev.modifiers();
    steps.push_back(std::move(step));
  }
  return steps;
}

std::string describe_steps(std::span<const MacroStep> steps) {
  std::string out;
  for (const auto &step : steps) {
    if (!out.empty()) {
      out += ", ";
    }
    switch (step.type) {
    case StepType::Key:
      out += describe_modifiers(step.modifiers);
      out += step.code ? derive_label(Channel::Keyboard, *step.code) : "?";
      break;
    case StepType::Mouse:
      out += describe_modifiers(step.modifiers);
      out += step.code ? derive_label(Channel::Mouse, *step.code) : "?";
      break;
    case StepType::Text:
      out += "Text \"";
      out += step.text.value_or("");
      out += '"';
      break;
    case StepType::Delay:
      out += "Delay ";
      out += std::to_string(step.delay ? step.delay->count() : 0);
      out += "ms";
      break;
    }
  }
  return out;
}

std::string describe_sequence(std::span<const InputEvent> sequence) {
  std::string out;
  for (const auto &ev : sequence) {
    if (!ev.pressed()) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += describe_event(ev);
  }
  return out;
}

} // namespace kmacro
