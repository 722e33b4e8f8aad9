/* @file ConfigLoader.cpp
 * @brief JSON config file reader
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/ConfigLoader.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using namespace kpm::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] malformed JSON in " + path_ + ": " + e.what());
  }
}
