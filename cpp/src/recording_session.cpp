/**
 * @file recording_session.cpp
 * @brief Реализация сессии записи
 */

#include "kmacro/recording_session.hpp"

#include <utility>

namespace kmacro {

bool RecordingSession::start(std::string name) {
  if (state_ == State::Recording) {
    return false;
  }
  buffer_.clear();
  name_ = std::move(name);
  on_event_ = nullptr;
  state_ = State::Recording;
  return true;
}

bool RecordingSession::start(EventCallback on_event) {
  if (!start(std::string{})) {
    return false;
  }
  on_event_ = std::move(on_event);
  return true;
}

void RecordingSession::append(const InputEvent &ev) {
  if (state_ != State::Recording) {
    return;
  }
  buffer_.push_back(ev);
  if (on_event_) {
    on_event_(ev);
  }
}

std::optional<Macro> RecordingSession::stop() {
  if (state_ != State::Recording) {
    return std::nullopt;
  }
  state_ = State::Idle;
  on_event_ = nullptr;

  if (!buffer_.empty()) {
    const InputEvent &last = buffer_.back();
    if (last.is_mouse() && last.code() == kMousePrimary && last.pressed()) {
      buffer_.pop_back();
    }
  }

  if (buffer_.empty()) {
    name_.clear();
    return std::nullopt;
  }

  Macro macro = Macro::create(std::move(name_));
  macro.key_sequence = std::move(buffer_);
  macro.steps = project_steps(macro.key_sequence);

  buffer_.clear();
  name_.clear();
  return macro;
}

} // namespace kmacro
