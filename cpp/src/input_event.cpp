/**
 * @file input_event.cpp
 * @brief Реализация InputEvent и его текстового представления
 */

#include "kmacro/input_event.hpp"

#include <atomic>
#include <charconv>
#include <utility>

#include "kmacro/event_normalizer.hpp"

namespace kmacro {

namespace {

std::uint64_t next_sequence_key() noexcept {
  static std::atomic<std::uint64_t> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

/// Отрезает следующее слово (до пробела), пропуская ведущие пробелы
std::string_view take_word(std::string_view &rest) noexcept {
  while (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
  const auto end = rest.find(' ');
  std::string_view word = rest.substr(0, end);
  rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
  return word;
}

template <typename T>
std::optional<T> parse_number(std::string_view word) noexcept {
  T value{};
  const auto *first = word.data();
  const auto *last = word.data() + word.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (word.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace

InputEvent::InputEvent(Channel channel, std::uint16_t code,
                       ModifierMask modifiers, bool pressed)
    : InputEvent(channel, code, modifiers, pressed,
                 derive_label(channel, code)) {}

InputEvent::InputEvent(Channel channel, std::uint16_t code,
                       ModifierMask modifiers, bool pressed, std::string label)
    : channel_{channel}, code_{code},
      modifiers_{static_cast<ModifierMask>(modifiers & kModAll)},
      pressed_{pressed}, label_{std::move(label)},
      sequence_key_{next_sequence_key()}, captured_at_{Clock::now()} {}

InputEvent InputEvent::restore(Channel channel, std::uint16_t code,
                               ModifierMask modifiers, bool pressed,
                               std::string label) {
  if (label.empty()) {
    label = derive_label(channel, code);
  }
  return InputEvent{channel, code, modifiers, pressed, std::move(label)};
}

std::string encode_event(const InputEvent &ev) {
  std::string out;
  out.reserve(32 + ev.label().size());
  out += ev.is_keyboard() ? "keyboard" : "mouse";
  out += ' ';
  out += std::to_string(ev.code());
  out += ' ';
  out += std::to_string(static_cast<unsigned>(ev.modifiers()));
  out += ev.pressed() ? " down " : " up ";
  out += ev.label();
  return out;
}

std::optional<InputEvent> decode_event(std::string_view text) {
  std::string_view rest = text;

  const std::string_view channel_word = take_word(rest);
  Channel channel;
  if (channel_word == "keyboard") {
    channel = Channel::Keyboard;
  } else if (channel_word == "mouse") {
    channel = Channel::Mouse;
  } else {
    return std::nullopt;
  }

  const auto code = parse_number<std::uint16_t>(take_word(rest));
  const auto mask = parse_number<unsigned>(take_word(rest));
  if (!code || !mask || *mask > kModAll) {
    return std::nullopt;
  }

  const std::string_view phase = take_word(rest);
  bool pressed;
  if (phase == "down") {
    pressed = true;
  } else if (phase == "up") {
    pressed = false;
  } else {
    return std::nullopt;
  }

  // Подпись может содержать пробелы: это весь остаток строки
  if (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }

  return InputEvent::restore(channel, *code, static_cast<ModifierMask>(*mask),
                             pressed, std::string{rest});
}

} // namespace kmacro
