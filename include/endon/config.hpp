#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace endon {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// JSON-файл с ключами как у полей Config; нет файла — значения по умолчанию.
// Битый JSON или ключ не того типа — ConfigError.
Config load_config(const std::string &path);

using EnvLookup = std::function<std::optional<std::string>(const char *)>;

// переменные окружения процесса
std::optional<std::string> process_env(const char *name);

// DOCKER_INFLUXDB_{HOST,TOKEN,ORGANIZATION,BUCKET}, ENDON_PORT, ENDON_STORE
void apply_env(Config &cfg, const EnvLookup &lookup = process_env);

// ConfigError со списком всех проблем сразу
void validate_config(const Config &cfg);

} // namespace endon
