/**
 * @file macro_controller.cpp
 * @brief Реализация оркестратора макросов
 */

#include "kmacro/macro_controller.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "kmacro/event_normalizer.hpp"
#include "kmacro/trigger_matcher.hpp"

namespace kmacro {

namespace {

constexpr std::string_view kNotAuthorizedMessage =
    "Synthetic input is not authorized";

} // namespace

MacroController::MacroController(MacroStore &store, ReplayEngine &engine,
                                 AuthorizationProbe &authorization,
                                 PeriodicScheduler &scheduler,
                                 ControllerSettings settings)
    : store_{store}, engine_{engine}, authorization_{authorization},
      scheduler_{scheduler}, settings_{settings} {
  engine_.set_debug(settings_.debug);
  authorized_ = authorization_.is_authorized();
  refresh_macros();
}

// ===========================================================================
// Живые события
// ===========================================================================

void MacroController::handle_event(const InputEvent &ev) {
  update_pressed(ev);
  observers_.notify(ev);

  if (settings_.debug) {
    std::cerr << "[kmacro] Event: " << describe_event(ev)
              << (ev.pressed() ? " down" : " up") << '\n';
  }

  // Любое нажатие, включая одиночный модификатор, становится привязкой
  if (binding_target_ && ev.pressed()) {
    assign_binding(ev);
    return;
  }

  if (session_.is_recording()) {
    session_.append(ev);
    return;
  }

  if (!ev.pressed() || is_replaying_) {
    return;
  }

  if (const Macro *hit = match_trigger(ev, macros_)) {
    if (settings_.debug) {
      std::cerr << "[kmacro] Trigger " << describe_event(ev) << " -> '"
                << hit->name << "'\n";
    }
    (void)execute_macro(*hit, true);
  }
}

void MacroController::update_pressed(const InputEvent &ev) {
  auto same = [&](const InputEvent &held) { return held.same_source(ev); };
  if (ev.pressed()) {
    if (std::none_of(pressed_.begin(), pressed_.end(), same)) {
      pressed_.push_back(ev);
    }
  } else {
    std::erase_if(pressed_, same);
  }
}

// ===========================================================================
// Воспроизведение
// ===========================================================================

ExecuteOutcome MacroController::execute_macro(const Macro &macro, bool force) {
  if (macro.key_sequence.empty()) {
    set_status("Macro '" + macro.name + "' has no recorded events");
    return {ExecuteResult::NothingToDo, std::nullopt, status_message_};
  }

  if (is_replaying_) {
    if (settings_.debug) {
      std::cerr << "[kmacro] Replay of '" << macro.name
                << "' dropped: another replay is in progress\n";
    }
    return {ExecuteResult::AlreadyReplaying, std::nullopt,
            "Replay already in progress"};
  }

  if (!force && !authorized_) {
    authorized_ = authorization_.is_authorized();
    if (!authorized_) {
      set_error(std::string{kNotAuthorizedMessage} +
                ": grant write access to /dev/uinput");
      return {ExecuteResult::NotAuthorized, std::nullopt, last_error_};
    }
  }

  // Ссылка может указывать в кэш, который обновится во время прокачки ввода
  const Macro snapshot = macro;
  ReplayOutcome replayed;
  {
    ReplayGuard guard{is_replaying_};
    replayed = engine_.replay(snapshot);
    if (replay_drain_) {
      replay_drain_();
    }
  }

  if (!replayed.ok()) {
    std::string message = "Replay of '" + snapshot.name + "' failed";
    for (const auto &err : replayed.errors) {
      message += "; ";
      message += err;
    }
    set_error(message);
    return {ExecuteResult::ReplayFailed, std::nullopt, std::move(message)};
  }

  std::string message = "Replayed '" + snapshot.name + "'";
  if (replayed.tier) {
    message += " via ";
    message += tier_name(*replayed.tier);
  }
  last_error_.clear();
  set_status(message);
  return {ExecuteResult::Ok, replayed.tier, std::move(message)};
}

ExecuteOutcome MacroController::execute_macro_by_id(const MacroId &id,
                                                    bool force) {
  const Macro *macro = find_macro(id);
  if (!macro) {
    return {ExecuteResult::NotFound, std::nullopt, "No macro with id " + id};
  }
  return execute_macro(*macro, force);
}

// ===========================================================================
// Запись
// ===========================================================================

bool MacroController::start_recording(std::string name) {
  if (!session_.start(std::move(name))) {
    return false;
  }
  set_status("Recording");
  return true;
}

bool MacroController::record_into(const MacroId &id) {
  if (session_.is_recording()) {
    return false;
  }

  const Macro *found = find_macro(id);
  if (!found) {
    set_error("No macro with id " + id);
    return false;
  }

  Macro target = *found;
  target.key_sequence.clear();
  target.steps.clear();

  StoreOutcome saved = store_.save(target);
  if (!saved.ok()) {
    set_error("Cannot save macro: " + saved.error);
    return false;
  }

  live_target_ = std::move(target);
  (void)session_.start(
      [this](const InputEvent &ev) { mirror_live_event(ev); });
  auto_stop_task_ =
      scheduler_.schedule_once(settings_.auto_stop, [this] {
        if (settings_.debug) {
          std::cerr << "[kmacro] Recording auto-stopped\n";
        }
        (void)stop_recording();
      });

  refresh_macros();
  set_status("Recording into '" + live_target_->name + "'");
  return true;
}

void MacroController::mirror_live_event(const InputEvent &ev) {
  if (!live_target_) {
    return;
  }

  live_target_->key_sequence.push_back(ev);
  live_target_->steps = project_steps(live_target_->key_sequence);

  StoreOutcome saved = store_.save(*live_target_);
  if (!saved.ok()) {
    std::cerr << "[kmacro] Live save failed: " << saved.error << '\n';
    return;
  }

  auto it = std::find_if(macros_.begin(), macros_.end(), [&](const Macro &m) {
    return m.id == live_target_->id;
  });
  if (it != macros_.end()) {
    *it = *live_target_;
  }
}

std::optional<Macro> MacroController::stop_recording() {
  auto_stop_task_.cancel();
  std::optional<Macro> recorded = session_.stop();

  if (live_target_) {
    Macro target = std::move(*live_target_);
    live_target_.reset();

    // Итог берётся из сессии: в нём уже отброшен клик по кнопке "Stop"
    target.key_sequence.clear();
    if (recorded) {
      target.key_sequence = std::move(recorded->key_sequence);
    }
    target.steps = project_steps(target.key_sequence);

    StoreOutcome saved = store_.save(target);
    if (!saved.ok()) {
      set_error("Cannot save macro: " + saved.error);
      return std::nullopt;
    }
    refresh_macros();
    set_status("Recorded " + std::to_string(target.key_sequence.size()) +
               " events into '" + target.name + "'");
    return target;
  }

  if (!recorded) {
    set_status("Nothing recorded");
    return std::nullopt;
  }

  StoreOutcome saved = store_.save(*recorded);
  if (!saved.ok()) {
    set_error("Cannot save macro: " + saved.error);
    return std::nullopt;
  }
  refresh_macros();
  set_status("Recorded '" + recorded->name + "' (" +
             std::to_string(recorded->key_sequence.size()) + " events)");
  return recorded;
}

// ===========================================================================
// Привязки
// ===========================================================================

bool MacroController::begin_binding(const MacroId &id) {
  if (!find_macro(id)) {
    set_error("No macro with id " + id);
    return false;
  }

  binding_target_ = id;
  binding_timeout_task_ =
      scheduler_.schedule_once(settings_.auto_stop, [this] {
        if (binding_target_) {
          cancel_binding();
          set_status("Binding cancelled");
        }
      });
  set_status("Press a key to bind");
  return true;
}

void MacroController::cancel_binding() noexcept {
  binding_target_.reset();
  binding_timeout_task_.cancel();
}

void MacroController::assign_binding(const InputEvent &ev) {
  const MacroId id = *binding_target_;
  cancel_binding();

  const Macro *found = find_macro(id);
  if (!found) {
    set_error("No macro with id " + id);
    return;
  }

  Macro updated = *found;
  const bool clear =
      ev.is_keyboard() && ev.code() == settings_.clear_binding_key;
  if (clear) {
    updated.binding.reset();
  } else {
    updated.binding = ev;
  }

  StoreOutcome saved = store_.save(updated);
  if (!saved.ok()) {
    set_error("Cannot save binding: " + saved.error);
    return;
  }

  refresh_macros();
  set_status(clear ? "Binding of '" + updated.name + "' cleared"
                   : "'" + updated.name + "' bound to " + describe_event(ev));
}

// ===========================================================================
// Каталог
// ===========================================================================

std::optional<Macro> MacroController::create_macro(std::string name) {
  Macro macro = Macro::create(std::move(name));
  StoreOutcome saved = store_.save(macro);
  if (!saved.ok()) {
    set_error("Cannot save macro: " + saved.error);
    return std::nullopt;
  }
  refresh_macros();
  return macro;
}

StoreOutcome MacroController::rename_macro(const MacroId &id,
                                           std::string_view name) {
  const Macro *found = find_macro(id);
  if (!found) {
    return {StoreResult::NotFound, "No macro with id " + id};
  }

  Macro updated = *found;
  if (!kmacro::rename_macro(updated, name)) {
    return {StoreResult::InvalidValue, "Name must not be empty"};
  }

  StoreOutcome saved = store_.save(updated);
  if (saved.ok()) {
    refresh_macros();
  }
  return saved;
}

StoreOutcome MacroController::delete_macro(const MacroId &id) {
  if (binding_target_ && *binding_target_ == id) {
    cancel_binding();
  }
  if (live_target_ && live_target_->id == id) {
    auto_stop_task_.cancel();
    live_target_.reset();
    (void)session_.stop();
  }

  StoreOutcome removed = store_.remove(id);
  if (removed.ok()) {
    refresh_macros();
  }
  return removed;
}

const Macro *MacroController::find_macro(const MacroId &id) const noexcept {
  auto it = std::find_if(macros_.begin(), macros_.end(),
                         [&](const Macro &m) { return m.id == id; });
  return it != macros_.end() ? &*it : nullptr;
}

// ===========================================================================
// Периодические задачи
// ===========================================================================

void MacroController::refresh_macros() {
  FetchOutcome fetched = store_.fetch_all();
  if (!fetched.ok()) {
    set_error("Cannot load macros: " + fetched.error);
    return;
  }

  macros_ = std::move(fetched.macros);
  if (settings_.debug) {
    log_macros();
  }
}

void MacroController::check_authorization() {
  const bool now = authorization_.is_authorized();
  if (now == authorized_) {
    return;
  }

  authorized_ = now;
  std::cerr << "[kmacro] Synthetic input authorization "
            << (now ? "granted" : "revoked") << '\n';
  if (now && last_error_.starts_with(kNotAuthorizedMessage)) {
    last_error_.clear();
  }
}

bool MacroController::request_authorization() {
  authorized_ = authorization_.request();
  if (authorized_ && last_error_.starts_with(kNotAuthorizedMessage)) {
    last_error_.clear();
  }
  return authorized_;
}

void MacroController::start_periodic_tasks(
    std::chrono::milliseconds authorization_interval,
    std::chrono::milliseconds refresh_interval) {
  authorization_task_ = scheduler_.schedule_every(
      authorization_interval, [this] { check_authorization(); });
  refresh_task_ = scheduler_.schedule_every(refresh_interval,
                                            [this] { refresh_macros(); });
}

void MacroController::stop_periodic_tasks() noexcept {
  authorization_task_.cancel();
  refresh_task_.cancel();
}

// ===========================================================================
// Состояние
// ===========================================================================

void MacroController::apply_settings(const ControllerSettings &settings) {
  settings_ = settings;
  engine_.set_debug(settings_.debug);
}

void MacroController::set_debug(bool enabled) {
  settings_.debug = enabled;
  engine_.set_debug(enabled);
  if (enabled) {
    log_macros();
  }
}

void MacroController::set_error(std::string message) {
  std::cerr << "[kmacro] " << message << '\n';
  last_error_ = std::move(message);
}

void MacroController::set_status(std::string message) {
  if (settings_.debug) {
    std::cerr << "[kmacro] Status: " << message << '\n';
  }
  status_message_ = std::move(message);
}

void MacroController::log_macros() const {
  std::cerr << "[kmacro] Stored macros: " << macros_.size() << '\n';
  for (const auto &macro : macros_) {
    std::cerr << "[kmacro]   '" << macro.name << "' id=" << macro.id
              << " events=" << macro.key_sequence.size() << " binding="
              << (macro.binding ? describe_event(*macro.binding) : "none")
              << '\n';
    if (!macro.steps.empty()) {
      std::cerr << "[kmacro]     steps: " << describe_steps(macro.steps)
                << '\n';
    }
  }
}

} // namespace kmacro
