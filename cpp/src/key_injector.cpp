/**
 * @file key_injector.cpp
 * @brief Реализация генератора событий ввода
 */

#include "kmacro/key_injector.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <unistd.h>

#include <array>
#include <iostream>

#include "kmacro/event_normalizer.hpp"

namespace kmacro {

namespace {

struct ModifierKey {
  ModifierMask bit;
  ScanCode code;
};

/// Модификаторы, которые нажимаются для маски события (левые клавиши)
constexpr std::array<ModifierKey, 4> kWrapKeys{{
    {kModCtrl, KEY_LEFTCTRL},
    {kModAlt, KEY_LEFTALT},
    {kModShift, KEY_LEFTSHIFT},
    {kModMeta, KEY_LEFTMETA},
}};

} // namespace

KeyInjector::KeyInjector(std::chrono::microseconds modifier_hold) noexcept
    : modifier_hold_{modifier_hold} {}

bool KeyInjector::write_all(int fd, const void *data, std::size_t bytes) {
  const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
  std::size_t remaining = bytes;

  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      remaining -= static_cast<std::size_t>(n);
      continue;
    }

    if (n < 0 && errno == EINTR) {
      continue;
    }

    const int e = errno;
    std::cerr << "[kmacro] KeyInjector: write failed (fd=" << fd
              << " bytes=" << bytes << " remaining=" << remaining
              << ") errno=" << e << " (" << std::strerror(e) << ")\n";
    return false;
  }
  return true;
}

bool KeyInjector::emit_events(std::span<const input_event> events) {
  if (events.empty()) {
    return true;
  }

  return write_all(STDOUT_FILENO, events.data(),
                   events.size() * sizeof(input_event));
}

bool KeyInjector::emit_event(const input_event &ev) {
  return emit_events(std::span<const input_event>{&ev, 1});
}

bool KeyInjector::send_key(ScanCode code, KeyState state) const {
  input_event evs[2]{};

  evs[0].type = EV_KEY;
  evs[0].code = code;
  evs[0].value = static_cast<std::int32_t>(state);

  evs[1].type = EV_SYN;
  evs[1].code = SYN_REPORT;
  evs[1].value = 0;

  return emit_events(std::span<const input_event>{evs, 2});
}

std::optional<ScanCode> KeyInjector::device_code(const InputEvent &ev) noexcept {
  if (ev.is_mouse()) {
    if (ev.code() > kMouseMaxOrdinal) {
      return std::nullopt;
    }
    return static_cast<ScanCode>(BTN_MOUSE + ev.code());
  }

  const ScanCode code = ev.code();
  if (code == KEY_RESERVED || code > KEY_MAX) {
    return std::nullopt;
  }
  // Диапазон BTN_* клавиатурой не является
  if (code >= BTN_MISC && code < KEY_OK) {
    return std::nullopt;
  }
  return code;
}

bool KeyInjector::post(const InputEvent &ev) {
  const auto code = device_code(ev);
  if (!code) {
    std::cerr << "[kmacro] KeyInjector: cannot synthesize "
              << describe_event(ev) << " (code " << ev.code() << ")\n";
    return false;
  }

  const KeyState state = ev.pressed() ? KeyState::Press : KeyState::Release;

  if (ev.is_keyboard() && is_modifier(*code)) {
    if (!send_key(*code, state)) {
      return false;
    }
    held_.update(*code, ev.pressed());
    return true;
  }

  // Маску оборачиваем только вокруг нажатия
  const ModifierMask missing =
      ev.pressed() ? static_cast<ModifierMask>(ev.modifiers() & ~held_.mask())
                   : ModifierMask{0};

  for (const auto &mod : kWrapKeys) {
    if ((missing & mod.bit) && !send_key(mod.code, KeyState::Press)) {
      return false;
    }
  }
  if (missing) {
    delay(modifier_hold_);
  }

  bool ok = send_key(*code, state);

  if (missing) {
    delay(modifier_hold_);
    for (auto it = kWrapKeys.rbegin(); it != kWrapKeys.rend(); ++it) {
      if ((missing & it->bit) && !send_key(it->code, KeyState::Release)) {
        ok = false;
      }
    }
  }

  return ok;
}

void KeyInjector::finish() {
  if (held_.mask() != 0) {
    release_all_modifiers();
  }
}

void KeyInjector::release_all_modifiers() {
  // Ошибки записи уже залогированы в write_all, отпускаем всё что можем
  bool ok = true;
  ok &= send_key(KEY_LEFTSHIFT, KeyState::Release);
  ok &= send_key(KEY_RIGHTSHIFT, KeyState::Release);
  ok &= send_key(KEY_LEFTCTRL, KeyState::Release);
  ok &= send_key(KEY_RIGHTCTRL, KeyState::Release);
  ok &= send_key(KEY_LEFTALT, KeyState::Release);
  ok &= send_key(KEY_RIGHTALT, KeyState::Release);
  ok &= send_key(KEY_LEFTMETA, KeyState::Release);
  ok &= send_key(KEY_RIGHTMETA, KeyState::Release);
  if (!ok) {
    std::cerr << "[kmacro] KeyInjector: could not release all modifiers\n";
  }
  held_ = ModifierState{};
}

void KeyInjector::delay(std::chrono::microseconds us) const {
  wait_for(wait_func_, us);
}

} // namespace kmacro
