// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace statesync {

bool StateSyncConfig::Validate(std::string &error) const {
  if (root.empty()) {
    error = "root must not be empty";
    return false;
  }
  if (chunk_size == 0 || (chunk_size & (chunk_size - 1)) != 0) {
    error = "chunk_size must be a power of two";
    return false;
  }
  if (chunk_size % manifest::PAGE_SIZE != 0) {
    error = "chunk_size must be a multiple of the page size (" +
            std::to_string(manifest::PAGE_SIZE) + ")";
    return false;
  }
  if (!manifest::IsSupportedVersion(manifest_version)) {
    error = "unsupported manifest_version " + std::to_string(manifest_version);
    return false;
  }
  return true;
}

std::optional<StateSyncConfig>
LoadStateSyncConfig(const std::filesystem::path &path) {
  using json = nlohmann::json;

  try {
    std::ifstream file(path);
    if (!file.is_open()) {
      LOG_ERROR("Config file not found: {}", path.string());
      return std::nullopt;
    }

    json root;
    file >> root;
    file.close();

    if (!root.is_object()) {
      LOG_ERROR("Config file {} is not a JSON object", path.string());
      return std::nullopt;
    }

    StateSyncConfig config;
    config.root = root.value("root", config.root.string());
    config.chunk_size = root.value("chunk_size", config.chunk_size);
    config.manifest_version =
        root.value("manifest_version", config.manifest_version);
    config.hashing_threads =
        root.value("hashing_threads", config.hashing_threads);

    std::string error;
    if (!config.Validate(error)) {
      LOG_ERROR("Invalid config {}: {}", path.string(), error);
      return std::nullopt;
    }
    return config;

  } catch (const std::exception &e) {
    LOG_ERROR("Exception loading config {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

} // namespace statesync
