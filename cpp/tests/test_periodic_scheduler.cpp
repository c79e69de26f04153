#include "kmacro/message_queue.hpp"
#include "kmacro/observer_registry.hpp"
#include "kmacro/periodic_scheduler.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
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

using kmacro::PeriodicScheduler;
using namespace std::chrono_literals;

void test_once_and_every() {
  PeriodicScheduler scheduler;
  const auto t0 = PeriodicScheduler::Clock::time_point{} + 1h;

  int once = 0;
  int every = 0;
  auto h1 = scheduler.schedule_once(100ms, [&] { ++once; }, t0);
  auto h2 = scheduler.schedule_every(50ms, [&] { ++every; }, t0);
  CHECK(scheduler.size() == 2);
  CHECK(scheduler.next_due() == std::optional{t0 + 50ms});

  CHECK(scheduler.run_due(t0 + 10ms) == 0);
  CHECK(scheduler.run_due(t0 + 50ms) == 1);
  CHECK(every == 1);

  CHECK(scheduler.run_due(t0 + 120ms) == 2);
  CHECK(once == 1);
  CHECK(every == 2);
  CHECK(!h1.active());
  CHECK(h2.active());

  // Пропущенные периоды не догоняются
  CHECK(scheduler.run_due(t0 + 1000ms) == 1);
  CHECK(every == 3);
  CHECK(scheduler.next_due() == std::optional{t0 + 1050ms});
}

void test_handle_cancels() {
  PeriodicScheduler scheduler;
  const auto t0 = PeriodicScheduler::Clock::time_point{} + 1h;
  int ran = 0;

  {
    auto handle = scheduler.schedule_every(10ms, [&] { ++ran; }, t0);
    CHECK(scheduler.size() == 1);
  }
  CHECK(scheduler.size() == 0);
  CHECK(scheduler.run_due(t0 + 1s) == 0);
  CHECK(!scheduler.next_due().has_value());

  auto moved_from = scheduler.schedule_once(10ms, [&] { ++ran; }, t0);
  PeriodicScheduler::Handle moved = std::move(moved_from);
  CHECK(!moved_from.active());
  CHECK(moved.active());
  moved.cancel();
  moved.cancel();
  CHECK(scheduler.run_due(t0 + 1s) == 0);
  CHECK(ran == 0);
}

void test_task_cancels_other_task() {
  PeriodicScheduler scheduler;
  const auto t0 = PeriodicScheduler::Clock::time_point{} + 1h;
  int second = 0;

  PeriodicScheduler::Handle victim;
  auto killer = scheduler.schedule_once(10ms, [&] { victim.cancel(); }, t0);
  victim = scheduler.schedule_once(10ms, [&] { ++second; }, t0);

  CHECK(scheduler.run_due(t0 + 10ms) == 1);
  CHECK(second == 0);
  CHECK(scheduler.size() == 0);
}

void test_message_queue() {
  kmacro::MessageQueue<std::string> queue;
  CHECK(!queue.try_pop().has_value());

  CHECK(queue.push("a"));
  CHECK(queue.push("b"));
  CHECK(queue.size() == 2);
  CHECK(queue.try_pop() == std::optional<std::string>{"a"});

  auto rest = queue.drain();
  CHECK(rest.size() == 1);
  CHECK(rest[0] == "b");

  std::jthread producer{[&] {
    for (int i = 0; i < 100; ++i) {
      (void)queue.push(std::to_string(i));
    }
  }};
  std::stop_source never;
  for (int i = 0; i < 100; ++i) {
    auto item = queue.pop_wait(never.get_token());
    CHECK(item == std::optional<std::string>{std::to_string(i)});
  }
  producer.join();

  queue.close();
  CHECK(queue.closed());
  CHECK(!queue.push("late"));
  CHECK(!queue.pop_wait(never.get_token()).has_value());
}

void test_message_queue_stop_token() {
  kmacro::MessageQueue<int> queue;
  std::stop_source source;
  std::jthread stopper{[&] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  }};
  CHECK(!queue.pop_wait(source.get_token()).has_value());
}

void test_observer_registry() {
  kmacro::ObserverRegistry<int> registry;
  std::vector<int> log;

  auto first = registry.subscribe([&](int v) { log.push_back(v); });
  kmacro::ObserverRegistry<int>::Subscription second;
  second = registry.subscribe([&](int v) {
    log.push_back(v * 10);
    second.reset();
  });
  CHECK(registry.size() == 2);

  registry.notify(1);
  CHECK(log == (std::vector<int>{1, 10}));
  CHECK(registry.size() == 1);
  CHECK(!second.active());

  registry.notify(2);
  CHECK(log == (std::vector<int>{1, 10, 2}));

  {
    auto temp = registry.subscribe([&](int) { log.push_back(-1); });
    CHECK(registry.size() == 2);
  }
  CHECK(registry.size() == 1);

  first.reset();
  registry.notify(3);
  CHECK(log.size() == 3);
}

} // namespace

#undef CHECK

int main() {
  test_once_and_every();
  test_handle_cancels();
  test_task_cancels_other_task();
  test_message_queue();
  test_message_queue_stop_token();
  test_observer_registry();

  std::cout << "OK\n";
  return 0;
}
