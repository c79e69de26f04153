/**
 * @file x11_event_poster.cpp
 * @brief Реализация посылки событий через XSendEvent
 */

#include "kmacro/x11_event_poster.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>

#include <iostream>
#include <string>

#include "kmacro/key_labels.hpp"

namespace kmacro {

namespace {

[[nodiscard]] unsigned int x11_state(ModifierMask mask) noexcept {
  unsigned int state = 0;
  if (mask & kModShift)
    state |= ShiftMask;
  if (mask & kModCtrl)
    state |= ControlMask;
  if (mask & kModAlt)
    state |= Mod1Mask;
  if (mask & kModMeta)
    state |= Mod4Mask;
  return state;
}

[[nodiscard]] unsigned int x11_button(std::uint16_t ordinal) noexcept {
  switch (ordinal) {
  case 0:
    return Button1;
  case 1:
    return Button3;
  case 2:
    return Button2;
  default:
    // Кнопки 4..7 в X11 заняты прокруткой
    return ordinal + 5;
  }
}

} // namespace

bool X11EventPoster::ensure_display() {
  if (display_) {
    return true;
  }
  display_ = session_.open_display();
  return display_ != nullptr;
}

bool X11EventPoster::send(const InputEvent &ev, bool down) {
  if (!ensure_display()) {
    return false;
  }

  Display *dpy = display_.get();

  Window focus = None;
  int revert = 0;
  XGetInputFocus(dpy, &focus, &revert);
  if (focus == None || focus == PointerRoot) {
    focus = DefaultRootWindow(dpy);
  }

  XEvent xev{};
  long mask = 0;

  if (ev.is_mouse()) {
    XButtonEvent &b = xev.xbutton;
    b.type = down ? ButtonPress : ButtonRelease;
    b.display = dpy;
    b.window = focus;
    b.root = DefaultRootWindow(dpy);
    b.subwindow = None;
    b.time = CurrentTime;
    b.same_screen = True;
    b.state = x11_state(ev.modifiers());
    b.button = x11_button(ev.code());
    mask = down ? ButtonPressMask : ButtonReleaseMask;
  } else {
    const std::string name{keysym_name(ev.code()).value_or("space")};
    KeySym sym = XStringToKeysym(name.c_str());
    if (sym == NoSymbol) {
      sym = XK_space;
    }
    const KeyCode keycode = XKeysymToKeycode(dpy, sym);
    if (keycode == 0) {
      std::cerr << "[kmacro] XSendEvent: no keycode for " << name << '\n';
      return false;
    }

    XKeyEvent &k = xev.xkey;
    k.type = down ? KeyPress : KeyRelease;
    k.display = dpy;
    k.window = focus;
    k.root = DefaultRootWindow(dpy);
    k.subwindow = None;
    k.time = CurrentTime;
    k.x = k.y = k.x_root = k.y_root = 1;
    k.same_screen = True;
    k.state = x11_state(ev.modifiers());
    k.keycode = keycode;
    mask = down ? KeyPressMask : KeyReleaseMask;
  }

  const Status sent = XSendEvent(dpy, focus, True, mask, &xev);
  XFlush(dpy);

  if (sent == 0) {
    std::cerr << "[kmacro] XSendEvent failed, reconnecting on next event\n";
    disconnect();
    return false;
  }
  return true;
}

} // namespace kmacro
