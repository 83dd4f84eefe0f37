/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json, errors as std::runtime_error
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/ConfigLoader.hpp"

using namespace poegate::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    auto root = nlohmann::json::parse(in);
    if (!root.is_object())
      throw std::runtime_error("[ConfigLoader] top-level JSON value must be an object: " + path_);
    return root;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
  }
}
