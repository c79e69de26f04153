#include "kmacro/event_normalizer.hpp"
#include "kmacro/input_event.hpp"
#include "kmacro/key_labels.hpp"

#include <linux/input.h>

#include <cstdlib>
#include <iostream>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using kmacro::Channel;
using kmacro::InputEvent;
using kmacro::RawInputEvent;
using kmacro::kModAlt;
using kmacro::kModCtrl;
using kmacro::kModShift;

void test_normalize_keyboard() {
  auto ev = kmacro::normalize(RawInputEvent{EV_KEY, KEY_C, 1, kModCtrl});
  CHECK(ev.has_value());
  CHECK(ev->is_keyboard());
  CHECK(ev->code() == KEY_C);
  CHECK(ev->modifiers() == kModCtrl);
  CHECK(ev->pressed());
  CHECK(ev->label() == "C");

  auto up = kmacro::normalize(RawInputEvent{EV_KEY, KEY_C, 0, kModCtrl});
  CHECK(up.has_value());
  CHECK(!up->pressed());

  // Автоповтор и не-клавишные события не захватываются
  CHECK(!kmacro::normalize(RawInputEvent{EV_KEY, KEY_C, 2, 0}).has_value());
  CHECK(!kmacro::normalize(RawInputEvent{EV_SYN, SYN_REPORT, 0, 0}).has_value());
  CHECK(!kmacro::normalize(RawInputEvent{EV_MSC, MSC_SCAN, 46, 0}).has_value());
}

void test_normalize_modifier_keys_carry_no_mask() {
  auto shift = kmacro::normalize(RawInputEvent{EV_KEY, KEY_LEFTSHIFT, 1, kModCtrl});
  CHECK(shift.has_value());
  CHECK(shift->modifiers() == 0);
  CHECK(shift->label() == "Shift");

  auto caps = kmacro::normalize(RawInputEvent{EV_KEY, KEY_CAPSLOCK, 1, kModShift});
  CHECK(caps.has_value());
  CHECK(caps->modifiers() == 0);
  CHECK(caps->label() == "Caps Lock");

  auto altgr = kmacro::normalize(RawInputEvent{EV_KEY, KEY_RIGHTALT, 1, 0});
  CHECK(altgr.has_value());
  CHECK(altgr->label() == "AltGr");
}

void test_normalize_mouse() {
  auto left = kmacro::normalize(RawInputEvent{EV_KEY, BTN_LEFT, 1, 0});
  CHECK(left.has_value());
  CHECK(left->is_mouse());
  CHECK(left->code() == kmacro::kMousePrimary);
  CHECK(left->label() == "Left Click");

  auto right = kmacro::normalize(RawInputEvent{EV_KEY, BTN_RIGHT, 1, kModShift});
  CHECK(right.has_value());
  CHECK(right->code() == 1);
  CHECK(right->modifiers() == kModShift);
  CHECK(right->label() == "Right Click");

  auto middle = kmacro::normalize(RawInputEvent{EV_KEY, BTN_MIDDLE, 0, 0});
  CHECK(middle.has_value());
  CHECK(middle->label() == "Middle Click");

  auto side = kmacro::normalize(RawInputEvent{EV_KEY, BTN_SIDE, 1, 0});
  CHECK(side.has_value());
  CHECK(side->code() == 3);
  CHECK(side->label() == "Mouse Button 4");

  // Геймпады и тачпады
  CHECK(!kmacro::normalize(RawInputEvent{EV_KEY, BTN_SOUTH, 1, 0}).has_value());
  CHECK(!kmacro::normalize(RawInputEvent{EV_KEY, BTN_TOUCH, 1, 0}).has_value());
}

void test_labels() {
  CHECK(kmacro::derive_label(Channel::Keyboard, KEY_ENTER) == "Return");
  CHECK(kmacro::derive_label(Channel::Keyboard, KEY_1) == "1");
  CHECK(kmacro::derive_label(Channel::Keyboard, KEY_F5) == "F5");
  CHECK(kmacro::derive_label(Channel::Keyboard, KEY_PROG1) == "Key 148");

  InputEvent ev{Channel::Keyboard, KEY_V, static_cast<kmacro::ModifierMask>(kModCtrl | kModAlt), true};
  CHECK(kmacro::describe_event(ev) == "Ctrl+Alt+V");
  CHECK(kmacro::describe_modifiers(0).empty());
}

void test_identity_and_equality() {
  InputEvent a{Channel::Keyboard, KEY_A, 0, true};
  InputEvent b{Channel::Keyboard, KEY_A, 0, true};

  // Одинаковое содержимое, но разные идентичности
  CHECK(a == b);
  CHECK(a.sequence_key() != b.sequence_key());
  CHECK(b.sequence_key() > a.sequence_key());

  InputEvent up{Channel::Keyboard, KEY_A, 0, false};
  CHECK(!(a == up));
  CHECK(a.same_source(up));

  InputEvent mouse{Channel::Mouse, KEY_A, 0, true};
  CHECK(!a.same_source(mouse));

  // Лишние биты маски отбрасываются
  InputEvent masked{Channel::Keyboard, KEY_A, 0xF3, true};
  CHECK(masked.modifiers() == 0x03);
}

void test_encode_decode() {
  InputEvent ev{Channel::Keyboard, KEY_PAGEUP, kModShift, true};
  const std::string text = kmacro::encode_event(ev);
  CHECK(text == "keyboard 104 1 down Page Up");

  auto decoded = kmacro::decode_event(text);
  CHECK(decoded.has_value());
  CHECK(*decoded == ev);
  CHECK(decoded->label() == "Page Up");
  CHECK(decoded->sequence_key() != ev.sequence_key());

  auto mouse = kmacro::decode_event("mouse 1 0 up Right Click");
  CHECK(mouse.has_value());
  CHECK(mouse->is_mouse());
  CHECK(!mouse->pressed());

  // Без подписи она выводится из кода
  auto bare = kmacro::decode_event("keyboard 30 0 down");
  CHECK(bare.has_value());
  CHECK(bare->label() == "A");

  CHECK(!kmacro::decode_event("joystick 1 0 down X").has_value());
  CHECK(!kmacro::decode_event("keyboard x 0 down X").has_value());
  CHECK(!kmacro::decode_event("keyboard 30 16 down A").has_value());
  CHECK(!kmacro::decode_event("keyboard 30 0 pressed A").has_value());
  CHECK(!kmacro::decode_event("").has_value());
}

void test_keysym_names() {
  CHECK(kmacro::keysym_name(KEY_A) == std::optional<std::string_view>{"a"});
  CHECK(kmacro::keysym_name(KEY_7) == std::optional<std::string_view>{"7"});
  CHECK(kmacro::keysym_name(KEY_ENTER) == std::optional<std::string_view>{"Return"});
  CHECK(kmacro::keysym_name(KEY_COMMA) == std::optional<std::string_view>{"comma"});
  CHECK(!kmacro::keysym_name(KEY_PROG1).has_value());
  CHECK(!kmacro::keysym_name(KEY_MAX).has_value());

  CHECK(kmacro::key_name_to_code("backspace") == std::optional<std::uint16_t>{KEY_BACKSPACE});
  CHECK(!kmacro::key_name_to_code("nope").has_value());
}

void test_modifier_state() {
  kmacro::ModifierState state;
  CHECK(state.mask() == 0);
  CHECK(state.update(KEY_RIGHTCTRL, true));
  CHECK(state.update(KEY_LEFTMETA, true));
  CHECK(state.mask() == (kModCtrl | kmacro::kModMeta));
  CHECK(!state.update(KEY_A, true));
  CHECK(state.update(KEY_RIGHTCTRL, false));
  CHECK(state.mask() == kmacro::kModMeta);
}

} // namespace

#undef CHECK

int main() {
  test_normalize_keyboard();
  test_normalize_modifier_keys_carry_no_mask();
  test_normalize_mouse();
  test_labels();
  test_identity_and_equality();
  test_encode_decode();
  test_keysym_names();
  test_modifier_state();

  std::cout << "OK\n";
  return 0;
}
