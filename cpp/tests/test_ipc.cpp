#include "kmacro/ipc_client.hpp"
#include "kmacro/ipc_server.hpp"

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

using kmacro::IpcCommand;
using kmacro::IpcResponse;

void test_parse_request() {
  auto status = kmacro::parse_request("STATUS\n");
  CHECK(status.command == IpcCommand::Status);
  CHECK(status.argument.empty());

  auto rename = kmacro::parse_request("  RENAME  abc-123   My macro  \r\n");
  CHECK(rename.command == IpcCommand::Rename);
  CHECK(rename.argument == "abc-123   My macro");

  CHECK(kmacro::parse_request("RECORD_START").command == IpcCommand::RecordStart);
  CHECK(kmacro::parse_request("EXECUTE id force").command == IpcCommand::Execute);
  CHECK(kmacro::parse_request("SHUTDOWN").command == IpcCommand::Shutdown);

  // Команды чувствительны к регистру
  CHECK(kmacro::parse_request("status").command == IpcCommand::Unknown);
  CHECK(kmacro::parse_request("").command == IpcCommand::Unknown);
  CHECK(kmacro::parse_request("STATUSX").command == IpcCommand::Unknown);
}

void test_format_response() {
  CHECK(kmacro::format_response({true, ""}) == "OK\n");
  CHECK(kmacro::format_response({true, "done"}) == "OK done\n");
  CHECK(kmacro::format_response({false, "Unknown command"}) == "ERROR Unknown command\n");
}

void test_parse_response() {
  auto ok = kmacro::parse_response("OK\n");
  CHECK(ok.has_value());
  CHECK(ok->ok);
  CHECK(ok->message.empty());

  auto err = kmacro::parse_response("ERROR No macro with id x\n");
  CHECK(err.has_value());
  CHECK(!err->ok);
  CHECK(err->message == "No macro with id x");

  auto multi = kmacro::parse_response("OK 1\nline two\n");
  CHECK(multi.has_value());
  CHECK(multi->message == "1\nline two");

  CHECK(!kmacro::parse_response("OKAY").has_value());
  CHECK(!kmacro::parse_response("garbage").has_value());
  CHECK(!kmacro::parse_response("").has_value());
}

void test_parse_status() {
  IpcResponse response{true,
                       "recording=1 replaying=0 authorized=1 debug=0 binding=abc macros=3\n"
                       "status: Recording\n"
                       "error: Replay of 'x' failed: direct: boom\n"
                       "last: Ctrl+C down"};
  auto status = kmacro::parse_status(response);
  CHECK(status.available);
  CHECK(status.recording);
  CHECK(!status.replaying);
  CHECK(status.authorized);
  CHECK(!status.debug);
  CHECK(status.binding_target == "abc");
  CHECK(status.macro_count == 3);
  CHECK(status.status_message == "Recording");
  CHECK(status.error == "Replay of 'x' failed: direct: boom");
  CHECK(status.last_event == "Ctrl+C down");

  auto idle = kmacro::parse_status(
      IpcResponse{true, "recording=0 replaying=0 authorized=0 debug=1 binding=- macros=0"});
  CHECK(idle.available);
  CHECK(idle.binding_target.empty());
  CHECK(idle.debug);
  CHECK(idle.status_message.empty());

  auto down = kmacro::parse_status(IpcResponse{false, "whatever"});
  CHECK(!down.available);
}

void test_parse_macro_list() {
  IpcResponse response{true,
                       "3\n"
                       "id-1\tCopy\tF8\t4\tCtrl+C, Ctrl+V\n"
                       "id-2\tEmpty\t-\t0\t\n"
                       "broken line\n"
                       "id-3\tNo sequence\t-\t2"};
  auto list = kmacro::parse_macro_list(response);
  CHECK(list.size() == 3);
  CHECK(list[0] == (kmacro::MacroEntry{"id-1", "Copy", "F8", 4, "Ctrl+C, Ctrl+V"}));
  CHECK(list[1].binding.empty());
  CHECK(list[1].events == 0);
  CHECK(list[1].sequence.empty());
  CHECK(list[2].name == "No sequence");
  CHECK(list[2].events == 2);

  CHECK(kmacro::parse_macro_list(IpcResponse{true, "0"}).empty());
  CHECK(kmacro::parse_macro_list(IpcResponse{false, "3\nid\tx\t-\t1"}).empty());
}

} // namespace

#undef CHECK

int main() {
  test_parse_request();
  test_format_response();
  test_parse_response();
  test_parse_status();
  test_parse_macro_list();

  std::cout << "OK\n";
  return 0;
}
