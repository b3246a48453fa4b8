#include "codec/json_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace MsBin::JsonConfig {

namespace {

AppConfig FromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }
  if (!j.contains("dir") || !j["dir"].is_string()) {
    throw std::runtime_error("Config is missing the \"dir\" string");
  }

  AppConfig config;
  config.dir = j["dir"].get<std::string>();

  config.precision = j.value("precision", config.precision);
  if (config.precision < 0 || config.precision > 15) {
    throw std::runtime_error("Invalid precision: " + std::to_string(config.precision));
  }

  if (j.contains("symbols")) {
    config.symbols = j["symbols"].get<std::vector<std::string>>();
  }
  // an explicit symbol list turns off "all" unless asked for
  config.all_symbols = j.value("all_symbols", config.symbols.empty());

  config.output_dir = j.value("output_dir", config.output_dir);
  config.log_dir = j.value("log_dir", config.log_dir);

  const int workers = j.value("workers", 1);
  if (workers < 1) {
    throw std::runtime_error("Invalid workers: " + std::to_string(workers));
  }
  config.workers = static_cast<size_t>(workers);

  config.list_only = j.value("list_only", config.list_only);
  config.cross_reference = j.value("cross_reference", config.cross_reference);
  return config;
}

} // namespace

AppConfig ParseAppConfig(const std::string &config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + config_file);
  }

  nlohmann::json j;
  try {
    file >> j;
    return FromJson(j);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid config file " + config_file + ": " + e.what());
  }
}

AppConfig ParseAppConfigText(const std::string &json_text) {
  try {
    return FromJson(nlohmann::json::parse(json_text));
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Invalid config: ") + e.what());
  }
}

} // namespace MsBin::JsonConfig
