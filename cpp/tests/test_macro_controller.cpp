#include "kmacro/direct_injection.hpp"
#include "kmacro/fallback_delivery.hpp"
#include "kmacro/macro_controller.hpp"

#include <linux/input.h>

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <memory>
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
using kmacro::ExecuteResult;
using kmacro::InputEvent;
using kmacro::Macro;
using kmacro::MacroController;
using kmacro::PeriodicScheduler;
using kmacro::kModCtrl;
using kmacro::kModMeta;

const kmacro::WaitFunc kNoWait = [](std::chrono::microseconds) {};

InputEvent key(std::uint16_t code, bool down, kmacro::ModifierMask mods = 0) {
  return InputEvent{Channel::Keyboard, code, mods, down};
}

struct MemoryStore : kmacro::MacroStore {
  std::vector<Macro> macros;
  int saves = 0;
  bool fail_saves = false;

  kmacro::FetchOutcome fetch_all() override {
    kmacro::FetchOutcome out;
    out.macros = macros;
    kmacro::sort_newest_first(out.macros);
    return out;
  }

  kmacro::StoreOutcome save(const Macro& macro) override {
    if (fail_saves) {
      return {kmacro::StoreResult::IoError, "disk full"};
    }
    ++saves;
    auto it = std::find_if(macros.begin(), macros.end(),
                           [&](const Macro& m) { return m.id == macro.id; });
    if (it != macros.end()) {
      *it = macro;
    } else {
      macros.push_back(macro);
    }
    return {};
  }

  kmacro::StoreOutcome remove(const kmacro::MacroId& id) override {
    auto removed = std::erase_if(macros, [&](const Macro& m) { return m.id == id; });
    if (removed == 0) {
      return {kmacro::StoreResult::NotFound, "not found"};
    }
    return {};
  }

  const Macro* get(const kmacro::MacroId& id) const {
    for (const auto& m : macros) {
      if (m.id == id) {
        return &m;
      }
    }
    return nullptr;
  }
};

struct FakeProbe : kmacro::AuthorizationProbe {
  bool granted = true;
  bool grant_on_request = false;

  bool is_authorized() override { return granted; }
  bool request() override {
    if (grant_on_request) {
      granted = true;
    }
    return granted;
  }
};

/// Приёмник, события которого возвращаются на вход как с реального устройства
struct LoopbackSink : kmacro::InputSink {
  std::vector<InputEvent> posted;
  std::deque<InputEvent> echoed;
  bool ok = true;

  bool post(const InputEvent& ev) override {
    if (!ok) {
      return false;
    }
    posted.push_back(ev);
    echoed.push_back(InputEvent{ev.channel(), ev.code(), ev.modifiers(), ev.pressed()});
    return true;
  }
};

struct CountingPoster : kmacro::FallbackPoster {
  int sends = 0;
  bool send(const InputEvent&, bool) override {
    ++sends;
    return true;
  }
};

struct Fixture {
  MemoryStore store;
  FakeProbe probe;
  LoopbackSink sink;
  kmacro::ReplayEngine engine;
  PeriodicScheduler scheduler;
  std::unique_ptr<MacroController> controller;

  explicit Fixture(bool with_direct = true) {
    if (with_direct) {
      engine.add_strategy(std::make_unique<kmacro::DirectInjectionStrategy>(
          sink, std::chrono::microseconds{0}, kNoWait));
    }
  }

  MacroController& make(kmacro::ControllerSettings settings = {}) {
    controller = std::make_unique<MacroController>(store, engine, probe, scheduler, settings);
    controller->set_replay_drain([this] {
      while (!sink.echoed.empty()) {
        InputEvent ev = sink.echoed.front();
        sink.echoed.pop_front();
        controller->handle_event(ev);
      }
    });
    return *controller;
  }

  void feed(std::initializer_list<InputEvent> events) {
    for (const auto& ev : events) {
      controller->handle_event(ev);
    }
  }
};

Macro stored(MemoryStore& store, std::string name, std::vector<InputEvent> seq,
             std::optional<InputEvent> binding = std::nullopt) {
  Macro m = Macro::create(std::move(name));
  m.key_sequence = std::move(seq);
  m.binding = binding;
  store.macros.push_back(m);
  return m;
}

void test_record_and_save() {
  Fixture f;
  auto& c = f.make();

  CHECK(c.start_recording("Greeting"));
  CHECK(c.is_recording());
  CHECK(!c.start_recording("Other"));

  f.feed({key(KEY_H, true), key(KEY_H, false), key(KEY_I, true), key(KEY_I, false)});
  auto macro = c.stop_recording();
  CHECK(macro.has_value());
  CHECK(!c.is_recording());
  CHECK(macro->key_sequence.size() == 4);
  CHECK(f.store.macros.size() == 1);
  CHECK(c.macros().size() == 1);
  CHECK(c.macros()[0].name == "Greeting");
  CHECK(c.find_macro(macro->id) != nullptr);
}

void test_stop_without_events() {
  Fixture f;
  auto& c = f.make();

  CHECK(!c.stop_recording().has_value());
  CHECK(c.start_recording(""));
  CHECK(!c.stop_recording().has_value());
  CHECK(c.status_message() == "Nothing recorded");
  CHECK(f.store.macros.empty());
}

void test_recording_does_not_trigger() {
  Fixture f;
  stored(f.store, "bound", {key(KEY_A, true), key(KEY_A, false)}, key(KEY_F7, true));
  auto& c = f.make();

  CHECK(c.start_recording("rec"));
  f.feed({key(KEY_F7, true), key(KEY_F7, false)});
  CHECK(f.sink.posted.empty());

  auto macro = c.stop_recording();
  CHECK(macro.has_value());
  CHECK(macro->key_sequence.size() == 2);
}

void test_trigger_replays_copy_paste() {
  Fixture f;
  stored(f.store, "copy-paste",
         {key(KEY_C, true, kModCtrl), key(KEY_C, false, kModCtrl),
          key(KEY_V, true, kModCtrl), key(KEY_V, false, kModCtrl)},
         key(KEY_F8, true));
  auto& c = f.make();

  f.feed({key(KEY_F8, true)});
  CHECK(f.sink.posted.size() == 4);
  CHECK(f.sink.posted[0] == key(KEY_C, true, kModCtrl));
  CHECK(f.sink.posted[3] == key(KEY_V, false, kModCtrl));
  CHECK(!c.is_replaying());
  CHECK(c.last_error().empty());

  // Отпускание триггер не запускает
  f.feed({key(KEY_F8, false)});
  CHECK(f.sink.posted.size() == 4);
}

void test_record_and_replay_meta_sequence() {
  Fixture f;
  auto& c = f.make();
  const std::vector<InputEvent> fed{
      key(KEY_C, true, kModMeta), key(KEY_C, false, kModMeta),
      key(KEY_V, true, kModMeta), key(KEY_V, false, kModMeta)};

  CHECK(c.start_recording("meta copy-paste"));
  for (const auto& ev : fed) {
    c.handle_event(ev);
  }
  auto macro = c.stop_recording();
  CHECK(macro.has_value());
  CHECK(f.sink.posted.empty());

  auto outcome = c.execute_macro_by_id(macro->id, false);
  CHECK(outcome.result == ExecuteResult::Ok);
  CHECK(f.sink.posted.size() == 4);
  for (std::size_t i = 0; i < fed.size(); ++i) {
    CHECK(f.sink.posted[i] == fed[i]);
  }
  CHECK(!c.is_replaying());
}

void test_fallback_posts_each_keystroke_once() {
  Fixture f{false};
  CountingPoster poster;
  f.engine.add_strategy(std::make_unique<kmacro::FallbackDeliveryStrategy>(
      poster, std::chrono::microseconds{0}, std::chrono::microseconds{0}, kNoWait));
  Macro m = stored(f.store, "copy-paste",
                   {key(KEY_C, true, kModCtrl), key(KEY_C, false, kModCtrl),
                    key(KEY_V, true, kModCtrl), key(KEY_V, false, kModCtrl)});
  auto& c = f.make();

  auto outcome = c.execute_macro_by_id(m.id, false);
  CHECK(outcome.ok());
  CHECK(outcome.tier == std::optional<kmacro::ReplayTier>{kmacro::ReplayTier::FallbackDelivery});
  CHECK(poster.sends == 4);
}

void test_replayed_events_do_not_retrigger() {
  Fixture f;
  // Макрос сам нажимает свою клавишу-триггер
  stored(f.store, "loop", {key(KEY_F9, true), key(KEY_F9, false)}, key(KEY_F9, true));
  auto& c = f.make();

  f.feed({key(KEY_F9, true)});
  CHECK(f.sink.posted.size() == 2);
  CHECK(f.sink.echoed.empty());
  CHECK(!c.is_replaying());

  // После воспроизведения триггер снова работает
  f.feed({key(KEY_F9, false), key(KEY_F9, true)});
  CHECK(f.sink.posted.size() == 4);
}

void test_empty_macro_is_noop() {
  Fixture f;
  Macro empty = stored(f.store, "empty", {}, key(KEY_F6, true));
  auto& c = f.make();

  auto outcome = c.execute_macro_by_id(empty.id, false);
  CHECK(outcome.ok());
  CHECK(outcome.result == ExecuteResult::NothingToDo);
  CHECK(f.sink.posted.empty());

  f.feed({key(KEY_F6, true)});
  CHECK(f.sink.posted.empty());
  CHECK(c.last_error().empty());
}

void test_not_authorized() {
  Fixture f;
  f.probe.granted = false;
  Macro m = stored(f.store, "m", {key(KEY_A, true), key(KEY_A, false)}, key(KEY_F5, true));
  auto& c = f.make();
  CHECK(!c.is_authorized());

  auto outcome = c.execute_macro_by_id(m.id, false);
  CHECK(outcome.result == ExecuteResult::NotAuthorized);
  CHECK(!outcome.ok());
  CHECK(f.sink.posted.empty());
  CHECK(!c.last_error().empty());

  // Принудительный запуск проверку пропускает
  auto forced = c.execute_macro_by_id(m.id, true);
  CHECK(forced.ok());
  CHECK(f.sink.posted.size() == 2);

  f.probe.grant_on_request = true;
  CHECK(c.request_authorization());
  CHECK(c.is_authorized());
  CHECK(c.last_error().empty());

  CHECK(c.execute_macro_by_id("missing", false).result == ExecuteResult::NotFound);
}

void test_replay_failure_reported() {
  Fixture f;
  f.sink.ok = false;
  Macro m = stored(f.store, "m", {key(KEY_A, true), key(KEY_A, false)});
  auto& c = f.make();

  auto outcome = c.execute_macro_by_id(m.id, false);
  CHECK(outcome.result == ExecuteResult::ReplayFailed);
  CHECK(outcome.message.find("direct: ") != std::string::npos);
  CHECK(c.last_error() == outcome.message);
  CHECK(!c.is_replaying());
}

void test_binding_assignment() {
  Fixture f;
  Macro m = stored(f.store, "m", {key(KEY_A, true), key(KEY_A, false)});
  auto& c = f.make();

  CHECK(!c.begin_binding("missing"));
  CHECK(c.begin_binding(m.id));
  CHECK(c.awaiting_binding() == std::optional<kmacro::MacroId>{m.id});

  // Ctrl зажат до начала ожидания, привязкой становится Ctrl+J
  f.feed({key(KEY_J, true, kModCtrl)});
  CHECK(!c.awaiting_binding().has_value());
  const Macro* saved = f.store.get(m.id);
  CHECK(saved != nullptr);
  CHECK(saved->binding.has_value());
  CHECK(saved->binding->code() == KEY_J);
  CHECK(saved->binding->modifiers() == kModCtrl);
  // Событие привязки поглощено
  CHECK(f.sink.posted.empty());

  f.feed({key(KEY_J, false, kModCtrl)});
  f.feed({key(KEY_J, true, kModCtrl)});
  CHECK(f.sink.posted.size() == 2);

  // Без Ctrl не срабатывает
  f.feed({key(KEY_J, false, kModCtrl), key(KEY_J, true)});
  CHECK(f.sink.posted.size() == 2);
}

void test_binding_takes_modifier_press() {
  Fixture f;
  Macro target = stored(f.store, "target", {key(KEY_A, true), key(KEY_A, false)});
  stored(f.store, "ctrl-bound", {key(KEY_B, true), key(KEY_B, false)},
         key(KEY_LEFTCTRL, true));
  auto& c = f.make();

  CHECK(c.begin_binding(target.id));
  f.feed({key(KEY_LEFTCTRL, true)});
  CHECK(!c.awaiting_binding().has_value());
  const Macro* saved = f.store.get(target.id);
  CHECK(saved != nullptr);
  CHECK(saved->binding.has_value());
  CHECK(saved->binding->code() == KEY_LEFTCTRL);
  // Нажатие поглощено и чужой макрос не запустило
  CHECK(f.sink.posted.empty());
  CHECK(!c.is_replaying());
}

void test_binding_clear_key() {
  Fixture f;
  Macro m = stored(f.store, "m", {key(KEY_A, true)}, key(KEY_F4, true));
  auto& c = f.make();

  CHECK(c.begin_binding(m.id));
  f.feed({key(KEY_BACKSPACE, true)});
  CHECK(!c.awaiting_binding().has_value());
  CHECK(!f.store.get(m.id)->binding.has_value());
  CHECK(c.macros()[0].binding == std::nullopt);
}

void test_binding_timeout() {
  Fixture f;
  Macro m = stored(f.store, "m", {key(KEY_A, true)});
  kmacro::ControllerSettings settings;
  settings.auto_stop = std::chrono::milliseconds{3000};
  auto& c = f.make(settings);

  const auto start = PeriodicScheduler::Clock::now();
  CHECK(c.begin_binding(m.id));
  f.scheduler.run_due(start + std::chrono::milliseconds{1000});
  CHECK(c.awaiting_binding().has_value());

  f.scheduler.run_due(start + std::chrono::milliseconds{5000});
  CHECK(!c.awaiting_binding().has_value());
  CHECK(c.status_message() == "Binding cancelled");

  f.feed({key(KEY_K, true)});
  CHECK(!f.store.get(m.id)->binding.has_value());
}

void test_record_into_live_updates() {
  Fixture f;
  Macro m = stored(f.store, "m", {key(KEY_Z, true), key(KEY_Z, false)});
  auto& c = f.make();

  const auto start = PeriodicScheduler::Clock::now();
  CHECK(c.record_into(m.id));
  CHECK(c.is_recording());
  CHECK(f.store.get(m.id)->key_sequence.empty());

  f.feed({key(KEY_Q, true)});
  // Каждое событие сразу попадает в хранилище и в кэш
  CHECK(f.store.get(m.id)->key_sequence.size() == 1);
  CHECK(c.find_macro(m.id)->key_sequence.size() == 1);

  f.feed({key(KEY_Q, false)});
  CHECK(f.store.get(m.id)->key_sequence.size() == 2);

  f.scheduler.run_due(start + std::chrono::milliseconds{10000});
  CHECK(!c.is_recording());
  const Macro* saved = f.store.get(m.id);
  CHECK(saved->key_sequence.size() == 2);
  CHECK(saved->steps.size() == 1);
  CHECK(saved->name == "m");

  CHECK(!c.record_into("missing"));
}

void test_catalog_operations() {
  Fixture f;
  auto& c = f.make();

  auto created = c.create_macro("");
  CHECK(created.has_value());
  CHECK(created->name == "New Macro");
  CHECK(c.macros().size() == 1);

  CHECK(c.rename_macro(created->id, "Renamed").ok());
  CHECK(c.find_macro(created->id)->name == "Renamed");
  CHECK(c.rename_macro(created->id, "").result == kmacro::StoreResult::InvalidValue);
  CHECK(c.rename_macro("missing", "x").result == kmacro::StoreResult::NotFound);

  CHECK(c.begin_binding(created->id));
  CHECK(c.delete_macro(created->id).ok());
  CHECK(!c.awaiting_binding().has_value());
  CHECK(c.macros().empty());
  CHECK(!c.delete_macro(created->id).ok());

  f.store.fail_saves = true;
  CHECK(!c.create_macro("x").has_value());
  CHECK(c.last_error().find("disk full") != std::string::npos);
}

void test_periodic_tasks_and_observers() {
  Fixture f;
  f.probe.granted = false;
  auto& c = f.make();

  std::vector<std::uint16_t> seen;
  auto sub = c.observers().subscribe([&](const InputEvent& ev) { seen.push_back(ev.code()); });

  const auto start = PeriodicScheduler::Clock::now();
  c.start_periodic_tasks(std::chrono::milliseconds{1000}, std::chrono::milliseconds{2000});

  f.probe.granted = true;
  stored(f.store, "external", {key(KEY_A, true)});
  f.scheduler.run_due(start + std::chrono::milliseconds{2500});
  CHECK(c.is_authorized());
  CHECK(c.macros().size() == 1);

  f.feed({key(KEY_B, true)});
  CHECK(seen.size() == 1);
  CHECK(seen[0] == KEY_B);
  CHECK(c.pressed_keys().size() == 1);
  f.feed({key(KEY_B, false)});
  CHECK(c.pressed_keys().empty());

  c.stop_periodic_tasks();
  CHECK(f.scheduler.size() == 0);
}

} // namespace

#undef CHECK

int main() {
  test_record_and_save();
  test_stop_without_events();
  test_recording_does_not_trigger();
  test_trigger_replays_copy_paste();
  test_record_and_replay_meta_sequence();
  test_fallback_posts_each_keystroke_once();
  test_replayed_events_do_not_retrigger();
  test_empty_macro_is_noop();
  test_not_authorized();
  test_replay_failure_reported();
  test_binding_assignment();
  test_binding_takes_modifier_press();
  test_binding_clear_key();
  test_binding_timeout();
  test_record_into_live_updates();
  test_catalog_operations();
  test_periodic_tasks_and_observers();

  std::cout << "OK\n";
  return 0;
}
