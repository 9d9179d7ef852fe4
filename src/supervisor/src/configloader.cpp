#include "../include/configloader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
  nlohmann::json config = readFileContents(filename);
  if (!config.is_object()) {
    throw std::runtime_error("ConfigLoader: " + filename +
                             " must contain a JSON object");
  }
  lastLoadedFile = filename;
  return config;
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile; }

nlohmann::json ConfigLoader::readFileContents(
    const std::string &filename) const {
  std::error_code ec;
  if (std::filesystem::is_directory(filename, ec)) {
    throw std::runtime_error("ConfigLoader: " + filename + " is a directory");
  }

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  try {
    // Комментарии // и /* */ допускаются
    return nlohmann::json::parse(file, nullptr, true, true);
  } catch (const nlohmann::json::parse_error &e) {
    std::ostringstream ss;
    ss << "ConfigLoader: JSON parse error in " << filename << " at byte "
       << e.byte << ": " << e.what();
    throw std::runtime_error(ss.str());
  }
}
