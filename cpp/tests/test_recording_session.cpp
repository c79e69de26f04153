#include "kmacro/macro.hpp"
#include "kmacro/recording_session.hpp"

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
using kmacro::RecordingSession;
using kmacro::kModCtrl;

InputEvent key(std::uint16_t code, bool down, kmacro::ModifierMask mods = 0) {
  return InputEvent{Channel::Keyboard, code, mods, down};
}

InputEvent click(std::uint16_t ordinal, bool down) {
  return InputEvent{Channel::Mouse, ordinal, 0, down};
}

void test_start_stop_lifecycle() {
  RecordingSession session;
  CHECK(!session.is_recording());
  CHECK(!session.stop().has_value());

  CHECK(session.start("Copy"));
  CHECK(session.is_recording());
  // Повторный start не сбрасывает буфер
  session.append(key(KEY_A, true));
  CHECK(!session.start("Other"));
  CHECK(session.buffer().size() == 1);
  CHECK(session.name() == "Copy");

  session.append(key(KEY_A, false));
  auto macro = session.stop();
  CHECK(macro.has_value());
  CHECK(!session.is_recording());
  CHECK(macro->name == "Copy");
  CHECK(macro->key_sequence.size() == 2);
  CHECK(!macro->id.empty());
  CHECK(!macro->binding.has_value());

  // После остановки события игнорируются
  session.append(key(KEY_B, true));
  CHECK(session.buffer().empty());
}

void test_order_preserved() {
  RecordingSession session;
  CHECK(session.start());

  std::vector<InputEvent> fed{key(KEY_LEFTCTRL, true), key(KEY_C, true, kModCtrl),
                              key(KEY_C, false, kModCtrl), key(KEY_LEFTCTRL, false)};
  for (const auto& ev : fed) {
    session.append(ev);
  }

  auto macro = session.stop();
  CHECK(macro.has_value());
  CHECK(macro->name == std::string{kmacro::kDefaultMacroName});
  CHECK(macro->key_sequence.size() == fed.size());
  for (std::size_t i = 0; i < fed.size(); ++i) {
    CHECK(macro->key_sequence[i].sequence_key() == fed[i].sequence_key());
  }

  // Шаги строятся только из нажатий
  CHECK(macro->steps.size() == 2);
  CHECK(macro->steps[0].type == kmacro::StepType::Key);
  CHECK(macro->steps[1].code == std::optional<std::uint16_t>{KEY_C});
  CHECK(macro->steps[1].modifiers == kModCtrl);
}

void test_trailing_primary_click_trimmed() {
  RecordingSession session;
  CHECK(session.start());
  session.append(key(KEY_A, true));
  session.append(key(KEY_A, false));
  session.append(click(kmacro::kMousePrimary, true));

  auto macro = session.stop();
  CHECK(macro.has_value());
  CHECK(macro->key_sequence.size() == 2);
  CHECK(macro->key_sequence.back().is_keyboard());
}

void test_only_one_trailing_event_trimmed() {
  RecordingSession session;
  CHECK(session.start());
  session.append(click(kmacro::kMousePrimary, true));
  session.append(click(kmacro::kMousePrimary, false));
  session.append(click(kmacro::kMousePrimary, true));

  auto macro = session.stop();
  CHECK(macro.has_value());
  CHECK(macro->key_sequence.size() == 2);
}

void test_other_trailing_events_kept() {
  RecordingSession session;
  CHECK(session.start());
  session.append(click(1, true));
  auto right = session.stop();
  CHECK(right.has_value());
  CHECK(right->key_sequence.size() == 1);

  CHECK(session.start());
  session.append(click(kmacro::kMousePrimary, false));
  auto release = session.stop();
  CHECK(release.has_value());
  CHECK(release->key_sequence.size() == 1);
}

void test_empty_results() {
  RecordingSession session;
  CHECK(session.start());
  CHECK(!session.stop().has_value());

  CHECK(session.start());
  session.append(click(kmacro::kMousePrimary, true));
  CHECK(!session.stop().has_value());
  CHECK(!session.is_recording());
}

void test_live_callback() {
  RecordingSession session;
  std::vector<std::uint64_t> seen;
  CHECK(session.start([&](const InputEvent& ev) { seen.push_back(ev.sequence_key()); }));

  InputEvent a = key(KEY_A, true);
  InputEvent b = key(KEY_A, false);
  session.append(a);
  session.append(b);
  CHECK(seen.size() == 2);
  CHECK(seen[0] == a.sequence_key());

  (void)session.stop();
  session.append(key(KEY_B, true));
  CHECK(seen.size() == 2);
}

void test_macro_model() {
  auto m = kmacro::Macro::create("");
  CHECK(m.name == "New Macro");
  CHECK(m.empty());
  CHECK(m.id.size() == 36);
  CHECK(m.id[14] == '4');

  auto other = kmacro::Macro::create("x");
  CHECK(other.id != m.id);

  CHECK(!kmacro::rename_macro(m, ""));
  CHECK(m.name == "New Macro");
  CHECK(kmacro::rename_macro(m, "Paste"));
  CHECK(m.name == "Paste");

  std::vector<InputEvent> seq{key(KEY_V, true, kModCtrl), key(KEY_V, false, kModCtrl),
                              click(1, true), click(1, false)};
  CHECK(kmacro::describe_sequence(seq) == "Ctrl+V, Right Click");

  auto steps = kmacro::project_steps(seq);
  CHECK(steps.size() == 2);
  CHECK(steps[1].type == kmacro::StepType::Mouse);
  CHECK(kmacro::describe_steps(steps) == "Ctrl+V, Right Click");

  kmacro::MacroStep delay;
  delay.type = kmacro::StepType::Delay;
  delay.delay = std::chrono::milliseconds{250};
  steps.push_back(delay);
  CHECK(kmacro::describe_steps(steps) == "Ctrl+V, Right Click, Delay 250ms");
}

} // namespace

#undef CHECK

int main() {
  test_start_stop_lifecycle();
  test_order_preserved();
  test_trailing_primary_click_trimmed();
  test_only_one_trailing_event_trimmed();
  test_other_trailing_events_kept();
  test_empty_results();
  test_live_callback();
  test_macro_model();

  std::cout << "OK\n";
  return 0;
}
