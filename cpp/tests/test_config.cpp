#include "kmacro/config.hpp"

#include <linux/input.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

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

using namespace std::chrono_literals;

void test_defaults() {
  kmacro::Config config;
  CHECK(kmacro::validate_config(config));
  CHECK(!config.general.debug);
  CHECK(config.replay.event_delay == 20ms);
  CHECK(config.replay.tier_scripted);
  CHECK(config.recording.auto_stop == 3000ms);
  CHECK(config.binding.clear_key == KEY_BACKSPACE);
  CHECK(config.schedule.authorization_interval == 3000ms);
}

void test_parse_all_sections() {
  std::istringstream in{
      "# kmacro\n"
      "general:\n"
      "  debug: yes\n"
      "\n"
      "replay:\n"
      "  event_delay_ms: 5     # быстрее\n"
      "  modifier_hold_ms: 15\n"
      "  fallback_hold_ms: 30\n"
      "  fallback_gap_ms: 60\n"
      "  scripted_timeout_ms: 500\n"
      "  tier_scripted: false\n"
      "  tier_fallback: off\n"
      "recording:\n"
      "  auto_stop_ms: 4500\n"
      "binding:\n"
      "  clear_key: delete\n"
      "schedule:\n"
      "  authorization_interval_ms: 1000\n"
      "  cache_refresh_interval_ms: 7000\n"
      "storage:\n"
      "  path: \"/tmp/kmacro macros.txt\"\n"};

  kmacro::Config config = kmacro::parse_config(in);
  CHECK(config.general.debug);
  CHECK(config.replay.event_delay == 5ms);
  CHECK(config.replay.modifier_hold == 15ms);
  CHECK(config.replay.fallback_hold == 30ms);
  CHECK(config.replay.fallback_gap == 60ms);
  CHECK(config.replay.scripted_timeout == 500ms);
  CHECK(!config.replay.tier_scripted);
  CHECK(!config.replay.tier_fallback);
  CHECK(config.recording.auto_stop == 4500ms);
  CHECK(config.binding.clear_key == KEY_DELETE);
  CHECK(config.schedule.authorization_interval == 1000ms);
  CHECK(config.schedule.cache_refresh_interval == 7000ms);
  CHECK(config.storage.path == "/tmp/kmacro macros.txt");
  CHECK(kmacro::validate_config(config));
}

void test_bad_values_keep_defaults() {
  std::istringstream in{
      "replay:\n"
      "  event_delay_ms: -5\n"
      "  tier_scripted: maybe\n"
      "recording:\n"
      "  auto_stop_ms: 0\n"
      "unknown:\n"
      "  debug: true\n"};

  kmacro::Config config = kmacro::parse_config(in);
  CHECK(config.replay.event_delay == 20ms);
  CHECK(config.replay.tier_scripted);
  CHECK(config.recording.auto_stop == 3000ms);
  CHECK(!config.general.debug);
}

void test_validation() {
  std::istringstream unknown_key{"binding:\n  clear_key: no-such-key\n"};
  kmacro::Config config = kmacro::parse_config(unknown_key);
  CHECK(config.binding.clear_key == 0);
  CHECK(!kmacro::validate_config(config));

  kmacro::Config empty_path;
  empty_path.storage.path.clear();
  CHECK(!kmacro::validate_config(empty_path));

  kmacro::Config zero_delay;
  zero_delay.replay.fallback_gap = 0us;
  CHECK(!kmacro::validate_config(zero_delay));
}

void test_parse_delay_ms() {
  CHECK(kmacro::parse_delay_ms("12") == std::optional<std::chrono::microseconds>{12000us});
  CHECK(kmacro::parse_delay_ms(" 3 ") == std::optional<std::chrono::microseconds>{3000us});
  CHECK(!kmacro::parse_delay_ms("0").has_value());
  CHECK(!kmacro::parse_delay_ms("abc").has_value());
  CHECK(!kmacro::parse_delay_ms("").has_value());
}

void test_load_missing_file() {
  auto out = kmacro::load_config_checked("/nonexistent/kmacro/config.yaml");
  CHECK(out.result == kmacro::ConfigResult::FileNotFound);
  CHECK(!out.error.empty());

  auto empty = kmacro::load_config_checked("");
  CHECK(empty.result == kmacro::ConfigResult::FileNotFound);
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_parse_all_sections();
  test_bad_values_keep_defaults();
  test_validation();
  test_parse_delay_ms();
  test_load_missing_file();

  std::cout << "OK\n";
  return 0;
}
