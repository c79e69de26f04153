/**
 * @file authorization.hpp
 * @brief Проверка права на синтетический ввод
 */

#pragma once

#include <string>

namespace kmacro {

/**
 * @brief Источник разрешения на воспроизведение
 *
 * Захват событий от разрешения не зависит: он работает всегда.
 */
class AuthorizationProbe {
public:
  virtual ~AuthorizationProbe() = default;

  /// Разрешён ли синтетический ввод прямо сейчас
  [[nodiscard]] virtual bool is_authorized() = 0;

  /**
   * @brief Запрашивает разрешение у пользователя
   * @return Состояние разрешения после запроса
   */
  virtual bool request() = 0;
};

/**
 * @brief Разрешение на запись в /dev/uinput
 *
 * Процесс, работающий от root, считается авторизованным.
 */
class UinputAuthorization final : public AuthorizationProbe {
public:
  explicit UinputAuthorization(std::string device = "/dev/uinput");

  [[nodiscard]] bool is_authorized() override;

  /// Права выдать нельзя: печатает подсказку и перепроверяет
  bool request() override;

  [[nodiscard]] const std::string &device() const noexcept { return device_; }

private:
  std::string device_;
};

} // namespace kmacro
