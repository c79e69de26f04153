#include "kmacro/x11_session.hpp"

#include <algorithm>
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

using namespace std::string_literals;

// Запись Xauthority: family, address, number, name, data (длины big-endian)
std::string xauth_entry(const std::string& number, const std::string& name,
                        const std::string& data) {
  auto counted = [](const std::string& s) {
    std::string out;
    out += static_cast<char>((s.size() >> 8) & 0xff);
    out += static_cast<char>(s.size() & 0xff);
    return out + s;
  };
  return "\x01\x00"s + counted("host") + counted(number) + counted(name) + counted(data);
}

void test_parse_environ() {
  auto env = kmacro::parse_environ("DISPLAY=:1\0XAUTHORITY=/run/user/1000/gdm/Xauthority\0"
                                   "EMPTY=\0=skipped\0NOEQ\0A=b=c"s);
  CHECK(env.size() == 4);
  CHECK(env["DISPLAY"] == ":1");
  CHECK(env["XAUTHORITY"] == "/run/user/1000/gdm/Xauthority");
  CHECK(env["EMPTY"].empty());
  CHECK(env["A"] == "b=c");
  CHECK(kmacro::parse_environ("").empty());
}

void test_display_number() {
  CHECK(kmacro::display_number(":0") == "0");
  CHECK(kmacro::display_number(":1.0") == "1");
  CHECK(kmacro::display_number("localhost:10.2") == "10");
  CHECK(kmacro::display_number("garbage").empty());
}

void test_find_xauth_cookie() {
  std::istringstream file{xauth_entry("0", "XDM-AUTHORIZATION-1", "xxxx") +
                          xauth_entry("", "MIT-MAGIC-COOKIE-1", "wild") +
                          xauth_entry("1", "MIT-MAGIC-COOKIE-1", "\x00\x01secret"s)};
  auto cookie = kmacro::find_xauth_cookie(file, "1");
  CHECK(cookie.has_value());
  CHECK(cookie->name == "MIT-MAGIC-COOKIE-1");
  CHECK(cookie->data == "\x00\x01secret"s);

  // Для дисплея 0 подходит только запись без номера
  std::istringstream again{file.str()};
  auto wild = kmacro::find_xauth_cookie(again, "0");
  CHECK(wild.has_value());
  CHECK(wild->data == "wild");

  // Обрезанный файл: целые записи до обрыва ещё читаются
  std::string truncated = xauth_entry("2", "MIT-MAGIC-COOKIE-1", "ok") +
                          xauth_entry("3", "MIT-MAGIC-COOKIE-1", "cut").substr(0, 9);
  std::istringstream partial{truncated};
  CHECK(kmacro::find_xauth_cookie(partial, "3") == std::nullopt);
  std::istringstream partial2{truncated};
  CHECK(kmacro::find_xauth_cookie(partial2, "2").has_value());
}

void test_session_environment() {
  kmacro::X11SessionInfo info;
  info.username = "alice";
  info.home_dir = "/home/alice";
  info.display = ":0";
  info.runtime_dir = "/run/user/1000";

  auto env = kmacro::session_environment(info);
  auto has = [&](const std::string& entry) {
    return std::find(env.begin(), env.end(), entry) != env.end();
  };
  CHECK(has("DISPLAY=:0"));
  CHECK(has("HOME=/home/alice"));
  CHECK(has("USER=alice"));
  CHECK(has("XDG_RUNTIME_DIR=/run/user/1000"));
  CHECK(std::none_of(env.begin(), env.end(), [](const std::string& e) {
    return e.rfind("XAUTHORITY=", 0) == 0;
  }));

  info.xauthority = "/home/alice/.Xauthority";
  CHECK(kmacro::session_environment(info).size() == env.size() + 1);
}

void test_undiscovered_session() {
  kmacro::X11Session session;
  CHECK(!session.is_valid());
  CHECK(session.open_display() == nullptr);
  auto env = session.child_environment();
  CHECK(!env.empty());
  CHECK(env[0].rfind("PATH=", 0) == 0);
}

} // namespace

#undef CHECK

int main() {
  test_parse_environ();
  test_display_number();
  test_find_xauth_cookie();
  test_session_environment();
  test_undiscovered_session();

  std::cout << "OK\n";
  return 0;
}
