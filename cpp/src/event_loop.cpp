/**
 * @file event_loop.cpp
 * @brief Реализация главного цикла обработки событий
 */

#include "kmacro/event_loop.hpp"
#include "kmacro/direct_injection.hpp"
#include "kmacro/event_normalizer.hpp"
#include "kmacro/fallback_delivery.hpp"
#include "kmacro/scripted_keystrokes.hpp"

#include <cerrno>
#include <cstdio>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace kmacro {

namespace {

/// Сколько IPC-поток ждёт выполнения команды главным циклом
constexpr auto kCommandTimeout = std::chrono::seconds{10};

constexpr std::size_t kPendingEventsCap = 5000;

constexpr auto kX11RetryInterval = std::chrono::seconds{3};

ControllerSettings controller_settings(const Config &config) {
  ControllerSettings settings;
  settings.auto_stop = config.recording.auto_stop;
  settings.clear_binding_key = config.binding.clear_key;
  settings.debug = config.general.debug;
  return settings;
}

/// Отделяет первое слово аргумента: "id rest" -> {"id", "rest"}
std::pair<std::string, std::string> split_first(const std::string &argument) {
  const auto pos = argument.find(' ');
  if (pos == std::string::npos) {
    return {argument, {}};
  }
  std::string rest = argument.substr(pos + 1);
  const auto first = rest.find_first_not_of(' ');
  rest = first == std::string::npos ? std::string{} : rest.substr(first);
  return {argument.substr(0, pos), rest};
}

/// Поля строки LIST не должны содержать разделителей
std::string sanitize_field(std::string_view text) {
  std::string out{text};
  for (char &c : out) {
    if (c == '\t' || c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return out;
}

} // namespace

EventLoop::EventLoop(Config config)
    : config_{std::move(config)}, store_{config_.storage.path},
      poster_{x11_session_},
      controller_{store_, engine_, authorization_, scheduler_,
                  controller_settings(config_)} {}

EventLoop::~EventLoop() {
  if (ipc_server_) {
    ipc_server_->stop();
  }
  reject_pending_commands();
}

bool EventLoop::initialize() {
  if (initialized_) {
    return true;
  }

  // Ищем графическую сессию (нужна уровням 2 и 3)
  const bool x11_ok = x11_session_.discover();
  last_x11_retry_ = std::chrono::steady_clock::now();
  if (!x11_ok) {
    std::cerr << "[kmacro] Warning: X11 session not found. "
                 "Scripted and fallback replay will retry later.\n";
  }

  // После X11 инициализации известен $HOME активного пользователя:
  // перечитываем ~/.config/kmacro/config.yaml, если он есть.
  {
    IpcResult res = reload_config();
    if (!res.success) {
      std::cerr << "[kmacro] Warning: initial config reload failed: "
                << res.message << "\n";
      build_strategies();
      apply_config();
    }
  }

  controller_.set_replay_drain([this] { drain_pending_events(); });

  last_event_subscription_ = controller_.observers().subscribe(
      [this](const InputEvent &ev) { last_event_ = describe_event(ev); });

  std::cerr << "[kmacro] Storage: " << store_.path() << ", "
            << controller_.macros().size() << " macros\n";
  if (!controller_.is_authorized()) {
    std::cerr << "[kmacro] Warning: synthetic input is not authorized "
                 "(no write access to "
              << authorization_.device() << ")\n";
  }

  // Создаём IPC сервер для управления из tray-приложения
  ipc_server_ = std::make_unique<IpcServer>(
      [this](IpcRequest request) { return submit_command(std::move(request)); });
  if (!ipc_server_->start()) {
    std::cerr << "[kmacro] Warning: IPC server failed to start. "
                 "Tray control will be unavailable.\n";
    // Не фатальная ошибка: привязки работают и без трея
  }

  initialized_ = true;
  return true;
}

void EventLoop::request_stop() noexcept {
  stop_requested_.store(true, std::memory_order_relaxed);
}

int EventLoop::run() {
  if (!initialize()) {
    std::cerr << "[kmacro] Failed to initialize event loop\n";
    return 1;
  }

  // Полностью отключаем буферизацию stdin для корректной работы poll() +
  // fread()
  std::setvbuf(stdin, nullptr, _IONBF, 0);
  std::setbuf(stdout, nullptr);

  input_event ev{};
  pollfd pfd{STDIN_FILENO, POLLIN, 0};

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    retry_x11_session();
    process_commands();
    scheduler_.run_due();

    pfd.revents = 0;
    int ret = poll(&pfd, 1, 1); // 1ms тик

    if (ret > 0) {
      // POLLHUP возникает когда udevmon закрывает пайп (остановка сервиса).
      // Если установлен POLLIN вместе с POLLHUP, сначала читаем оставшиеся
      // данные.
      if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        if (!(pfd.revents & POLLIN)) {
          std::cerr << "[kmacro] stdin closed (revents=0x" << std::hex
                    << pfd.revents << std::dec << "), exiting gracefully\n";
          break;
        }
      }

      if (pfd.revents & POLLIN) {
        if (std::fread(&ev, sizeof(ev), 1, stdin) != 1) {
          break; // EOF или ошибка
        }
        handle_event(ev);
        continue;
      }
    }

    if (ret == 0) {
      continue; // timeout
    }

    if (ret < 0) {
      if (errno == EINTR) {
        // Сигнал прервал poll: проверяем флаг остановки на следующей итерации
        continue;
      }
      break;
    }
  }

  controller_.stop_periodic_tasks();
  if (ipc_server_) {
    ipc_server_->stop();
  }
  reject_pending_commands();

  std::cerr << "[kmacro] Event loop terminated gracefully\n";
  return 0;
}

void EventLoop::handle_event(const input_event &ev) {
  // Passthrough: исходное событие всегда уходит дальше в uinput
  if (!KeyInjector::emit_event(ev)) {
    std::cerr << "[kmacro] Output pipe closed, stopping\n";
    request_stop();
    return;
  }

  if (ev.type != EV_KEY) {
    return;
  }

  // Маска снимается до обновления: у самих модификаторов она всегда 0
  const ModifierMask mask = modifiers_.mask();
  if (ev.value != 2) {
    (void)modifiers_.update(ev.code, ev.value != 0);
  }

  RawInputEvent raw{ev.type, ev.code, ev.value, mask};
  if (auto normalized = normalize(raw)) {
    controller_.handle_event(*normalized);
  }
}

void EventLoop::buffer_event(const input_event &ev) {
  if (pending_events_.size() < kPendingEventsCap) {
    pending_events_.push_back(ev);
    return;
  }

  // Лучше потерять события, чем зависнуть
  static bool warned = false;
  if (!warned) {
    warned = true;
    std::cerr << "[kmacro] Input Guard: pending_events overflow cap="
              << kPendingEventsCap << " (dropping input events)\n";
  }
}

void EventLoop::wait_and_buffer(std::chrono::microseconds us) {
  if (us.count() <= 0)
    return;

  const auto end = std::chrono::steady_clock::now() + us;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= end)
      break;

    auto remaining_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end - now);
    int timeout_ms = static_cast<int>(remaining_us.count() / 1000);
    if (timeout_ms < 1) {
      timeout_ms = 1;
    }

    pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ret = poll(&pfd, 1, timeout_ms);

    if (ret > 0 && (pfd.revents & POLLIN)) {
      input_event ev;
      while (true) {
        if (std::fread(&ev, sizeof(ev), 1, stdin) == 1) {
          buffer_event(ev);
        }
        pfd.revents = 0;
        if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN)) {
          break;
        }
      }
    } else if (ret < 0) {
      if (errno == EINTR)
        continue;
      break;
    } else {
      // Таймаут или HUP без данных
      break;
    }
  }
}

void EventLoop::drain_pending_events() {
  while (!pending_events_.empty()) {
    input_event ev = pending_events_.front();
    pending_events_.pop_front();
    handle_event(ev);
  }
}

void EventLoop::build_strategies() {
  const auto wait = [this](std::chrono::microseconds us) {
    wait_and_buffer(us);
  };

  // Сначала убираем уровни: они держат ссылки на исполнителей
  engine_.clear();

  injector_ = std::make_unique<KeyInjector>(config_.replay.modifier_hold);
  injector_->set_wait_func(wait);
  engine_.add_strategy(std::make_unique<DirectInjectionStrategy>(
      *injector_, config_.replay.event_delay, wait));

  automation_.reset();
  if (config_.replay.tier_scripted) {
    automation_ = std::make_unique<XdotoolAutomation>(
        x11_session_, config_.replay.scripted_timeout);
    if (automation_->available()) {
      automation_->set_wait_func(wait);
      engine_.add_strategy(
          std::make_unique<ScriptedKeystrokeStrategy>(*automation_));
    } else {
      std::cerr << "[kmacro] xdotool not found, scripted replay disabled\n";
      automation_.reset();
    }
  }

  if (config_.replay.tier_fallback) {
    engine_.add_strategy(std::make_unique<FallbackDeliveryStrategy>(
        poster_, config_.replay.fallback_hold, config_.replay.fallback_gap,
        wait));
  }

  std::cerr << "[kmacro] Replay tiers: " << engine_.strategy_count() << "\n";
}

void EventLoop::apply_config() {
  controller_.apply_settings(controller_settings(config_));
  controller_.stop_periodic_tasks();
  controller_.start_periodic_tasks(config_.schedule.authorization_interval,
                                   config_.schedule.cache_refresh_interval);
}

void EventLoop::retry_x11_session() {
  if (x11_session_.is_valid()) {
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  if (now - last_x11_retry_ < kX11RetryInterval) {
    return;
  }
  last_x11_retry_ = now;

  if (x11_session_.discover()) {
    // Старое соединение (если было) открыто от другого окружения
    poster_.disconnect();
    std::cerr << "[kmacro] X11 session found for user "
              << x11_session_.info().username << "\n";
  }
}

// ===========================================================================
// IPC
// ===========================================================================

IpcResult EventLoop::submit_command(IpcRequest request) {
  PendingCommand cmd{std::move(request), {}};
  std::future<IpcResult> reply = cmd.reply.get_future();

  if (!commands_.push(std::move(cmd))) {
    return {false, "Service is stopping"};
  }

  if (reply.wait_for(kCommandTimeout) != std::future_status::ready) {
    return {false, "Command timed out"};
  }

  try {
    return reply.get();
  } catch (const std::future_error &e) {
    return {false, std::string{"Command dropped: "} + e.what()};
  }
}

void EventLoop::process_commands() {
  while (auto cmd = commands_.try_pop()) {
    cmd->reply.set_value(execute_command(cmd->request));
  }
}

void EventLoop::reject_pending_commands() {
  commands_.close();
  for (auto &cmd : commands_.drain()) {
    cmd.reply.set_value({false, "Service is stopping"});
  }
}

IpcResult EventLoop::execute_command(const IpcRequest &request) {
  const std::string &arg = request.argument;

  switch (request.command) {
  case IpcCommand::Status:
    return command_status();

  case IpcCommand::List:
    return command_list();

  case IpcCommand::Create: {
    auto created = controller_.create_macro(arg);
    if (!created) {
      return {false, controller_.last_error()};
    }
    return {true, created->id};
  }

  case IpcCommand::Rename:
    return command_rename(arg);

  case IpcCommand::Delete: {
    StoreOutcome out = controller_.delete_macro(arg);
    if (!out.ok()) {
      return {false, out.error};
    }
    return {true, "deleted"};
  }

  case IpcCommand::RecordStart:
    if (!controller_.start_recording(arg)) {
      return {false, "Already recording"};
    }
    return {true, "recording"};

  case IpcCommand::RecordStop: {
    if (!controller_.is_recording()) {
      return {false, "Not recording"};
    }
    auto recorded = controller_.stop_recording();
    if (!recorded) {
      // Пустая запись не ошибка, ошибкой считается только сбой сохранения
      if (controller_.status_message() == "Nothing recorded") {
        return {true, "-"};
      }
      return {false, controller_.last_error()};
    }
    return {true, recorded->id};
  }

  case IpcCommand::RecordInto:
    if (!controller_.record_into(arg)) {
      if (controller_.is_recording()) {
        return {false, "Already recording"};
      }
      return {false, controller_.last_error()};
    }
    return {true, "recording"};

  case IpcCommand::Bind:
    if (!controller_.begin_binding(arg)) {
      return {false, "No macro with id " + arg};
    }
    return {true, "waiting for key"};

  case IpcCommand::Execute:
    return command_execute(arg);

  case IpcCommand::Authorize: {
    const bool ok = controller_.request_authorization();
    return {true, ok ? "authorized=1" : "authorized=0"};
  }

  case IpcCommand::Debug:
    if (arg == "1" || arg == "on") {
      controller_.set_debug(true);
    } else if (arg == "0" || arg == "off") {
      controller_.set_debug(false);
    } else {
      return {false, "Usage: DEBUG 0|1"};
    }
    return {true, controller_.debug() ? "debug=1" : "debug=0"};

  case IpcCommand::Pressed: {
    std::string keys;
    for (const auto &ev : controller_.pressed_keys()) {
      if (!keys.empty()) {
        keys += " + ";
      }
      keys += ev.label();
    }
    return {true, keys.empty() ? "-" : keys};
  }

  case IpcCommand::Reload:
    return reload_config(arg);

  case IpcCommand::Shutdown:
  case IpcCommand::Unknown:
    break;
  }

  return {false, "Unknown command"};
}

IpcResult EventLoop::command_status() const {
  std::ostringstream out;
  out << "recording=" << (controller_.is_recording() ? 1 : 0)
      << " replaying=" << (controller_.is_replaying() ? 1 : 0)
      << " authorized=" << (controller_.is_authorized() ? 1 : 0)
      << " debug=" << (controller_.debug() ? 1 : 0)
      << " binding=" << controller_.awaiting_binding().value_or("-")
      << " macros=" << controller_.macros().size();

  // Дополнительные строки: "ключ: текст"
  if (!controller_.status_message().empty()) {
    out << "\nstatus: " << sanitize_field(controller_.status_message());
  }
  if (!controller_.last_error().empty()) {
    out << "\nerror: " << sanitize_field(controller_.last_error());
  }
  if (!last_event_.empty()) {
    out << "\nlast: " << last_event_;
  }
  return {true, out.str()};
}

IpcResult EventLoop::command_list() const {
  // Первая строка: количество, далее по строке на макрос:
  // id \t name \t binding \t events \t sequence
  std::ostringstream out;
  out << controller_.macros().size();
  for (const auto &macro : controller_.macros()) {
    out << '\n'
        << macro.id << '\t' << sanitize_field(macro.name) << '\t'
        << (macro.binding ? describe_event(*macro.binding) : "-") << '\t'
        << macro.key_sequence.size() << '\t'
        << sanitize_field(describe_sequence(macro.key_sequence));
  }
  return {true, out.str()};
}

IpcResult EventLoop::command_rename(const std::string &argument) {
  auto [id, name] = split_first(argument);
  if (id.empty()) {
    return {false, "Usage: RENAME <id> <name>"};
  }

  StoreOutcome out = controller_.rename_macro(id, name);
  if (!out.ok()) {
    return {false, out.error};
  }
  return {true, "renamed"};
}

IpcResult EventLoop::command_execute(const std::string &argument) {
  auto [id, flag] = split_first(argument);
  if (id.empty()) {
    return {false, "Usage: EXECUTE <id> [force]"};
  }
  if (!flag.empty() && flag != "force") {
    return {false, "Unknown flag: " + flag};
  }

  ExecuteOutcome out = controller_.execute_macro_by_id(id, flag == "force");
  if (!out.ok()) {
    return {false, out.message};
  }
  return {true, out.message};
}

IpcResult EventLoop::reload_config(const std::string &config_path) {
  std::filesystem::path load_path{std::string{kConfigPath}};

  if (!config_path.empty()) {
    load_path = std::filesystem::path{config_path};
    std::error_code ec;
    if (!std::filesystem::exists(load_path, ec) || ec) {
      std::string msg = "Config file not found: " + config_path;
      std::cerr << "[kmacro] " << msg << "\n";
      return {false, std::move(msg)};
    }
  } else if (x11_session_.is_valid()) {
    const auto &info = x11_session_.info();
    if (!info.home_dir.empty()) {
      std::filesystem::path user_path =
          std::filesystem::path{info.home_dir} /
          std::filesystem::path{std::string{kUserConfigRelPath}};
      std::error_code ec;
      if (std::filesystem::exists(user_path, ec) && !ec) {
        load_path = std::move(user_path);
      }
    }
  }

  ConfigLoadOutcome loaded = load_config_checked(load_path);
  if (loaded.result != ConfigResult::Ok) {
    std::cerr << "[kmacro] Config reload failed: " << loaded.error << "\n";
    return {false,
            loaded.error.empty() ? "Config reload failed" : loaded.error};
  }

  if (loaded.config.storage.path != store_.path()) {
    std::cerr << "[kmacro] Warning: storage path change to "
              << loaded.config.storage.path << " requires restart\n";
    loaded.config.storage.path = store_.path();
  }

  config_ = std::move(loaded.config);
  build_strategies();
  apply_config();

  std::cerr << "[kmacro] Configuration reloaded: " << loaded.used_path << "\n";
  std::cerr << "[kmacro] replay: event_delay="
            << config_.replay.event_delay.count() / 1000
            << "ms, scripted=" << config_.replay.tier_scripted
            << ", fallback=" << config_.replay.tier_fallback
            << ", auto_stop=" << config_.recording.auto_stop.count() << "ms\n";

  return {true, "reloaded"};
}

} // namespace kmacro
