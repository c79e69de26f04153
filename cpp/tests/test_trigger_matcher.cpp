#include "kmacro/trigger_matcher.hpp"

#include <linux/input.h>

#include <cstdlib>
#include <iostream>
#include <vector>

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
using kmacro::Macro;
using kmacro::kModAlt;
using kmacro::kModCtrl;
using kmacro::kModShift;

Macro bound(std::string name, InputEvent binding) {
  Macro m = Macro::create(std::move(name));
  m.binding = binding;
  return m;
}

void test_plain_binding_matches_any_modifiers() {
  InputEvent binding{Channel::Keyboard, KEY_F9, 0, true};

  CHECK(kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_F9, 0, true}));
  CHECK(kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_F9, kModShift, true}));
  CHECK(kmacro::binding_matches(
      binding, InputEvent{Channel::Keyboard, KEY_F9,
                          static_cast<kmacro::ModifierMask>(kModCtrl | kModAlt), true}));
  // Фаза не сравнивается
  CHECK(kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_F9, 0, false}));

  CHECK(!kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_F10, 0, true}));
  CHECK(!kmacro::binding_matches(binding, InputEvent{Channel::Mouse, KEY_F9, 0, true}));
}

void test_modified_binding_requires_exact_mask() {
  InputEvent binding{Channel::Keyboard, KEY_J, kModCtrl, true};

  CHECK(kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_J, kModCtrl, true}));
  CHECK(!kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, KEY_J, 0, true}));
  CHECK(!kmacro::binding_matches(
      binding, InputEvent{Channel::Keyboard, KEY_J,
                          static_cast<kmacro::ModifierMask>(kModCtrl | kModShift), true}));
}

void test_mouse_binding() {
  InputEvent binding{Channel::Mouse, 3, 0, true};

  CHECK(kmacro::binding_matches(binding, InputEvent{Channel::Mouse, 3, 0, true}));
  CHECK(!kmacro::binding_matches(binding, InputEvent{Channel::Mouse, 4, 0, true}));
  // Код 3 на клавиатуре это другая клавиша
  CHECK(!kmacro::binding_matches(binding, InputEvent{Channel::Keyboard, 3, 0, true}));
}

void test_match_trigger() {
  std::vector<Macro> macros;
  macros.push_back(Macro::create("unbound"));
  macros.push_back(bound("paste", InputEvent{Channel::Keyboard, KEY_F8, kModCtrl, true}));
  macros.push_back(bound("copy", InputEvent{Channel::Keyboard, KEY_F7, 0, true}));

  const Macro* hit = kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_F7, kModAlt, true}, macros);
  CHECK(hit != nullptr);
  CHECK(hit->name == "copy");

  hit = kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_F8, kModCtrl, true}, macros);
  CHECK(hit != nullptr);
  CHECK(hit->name == "paste");

  CHECK(kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_F8, 0, true}, macros) == nullptr);
  CHECK(kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_A, 0, true}, macros) == nullptr);
  CHECK(kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_F7, 0, true}, std::vector<Macro>{}) == nullptr);
}

void test_first_match_wins() {
  std::vector<Macro> macros;
  macros.push_back(bound("first", InputEvent{Channel::Keyboard, KEY_F6, 0, true}));
  macros.push_back(bound("second", InputEvent{Channel::Keyboard, KEY_F6, 0, true}));

  const Macro* hit = kmacro::match_trigger(InputEvent{Channel::Keyboard, KEY_F6, 0, true}, macros);
  CHECK(hit != nullptr);
  CHECK(hit == &macros[0]);
}

} // namespace

#undef CHECK

int main() {
  test_plain_binding_matches_any_modifiers();
  test_modified_binding_requires_exact_mask();
  test_mouse_binding();
  test_match_trigger();
  test_first_match_wins();

  std::cout << "OK\n";
  return 0;
}
