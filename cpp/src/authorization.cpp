/**
 * @file authorization.cpp
 * @brief Реализация проверки доступа к uinput
 */

#include "kmacro/authorization.hpp"

#include <unistd.h>

#include <iostream>
#include <utility>

namespace kmacro {

UinputAuthorization::UinputAuthorization(std::string device)
    : device_{std::move(device)} {}

bool UinputAuthorization::is_authorized() {
  if (geteuid() == 0) {
    return true;
  }
  return access(device_.c_str(), W_OK) == 0;
}

bool UinputAuthorization::request() {
  const bool granted = is_authorized();
  if (!granted) {
    std::cerr << "[kmacro] No write access to " << device_
              << ". Run kmacro from the udevmon pipeline as root, or add the "
                 "user to the 'input' group and reload udev rules.\n";
  }
  return granted;
}

} // namespace kmacro
