#include "ConfigStore.hpp"
#include <fstream>
#include <iostream>
#include <iterator>

namespace morpho {

bool ConfigStore::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(EngineConfig& config, const std::string& path) {
    std::cout << "[ConfigStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    const bool success = deserialize(config, content);
    if (success) {
        std::cout << "[ConfigStore] Loaded config version " << config.version << std::endl;
    } else {
        std::cerr << "[ConfigStore] Failed to parse config from: " << path << std::endl;
    }
    return success;
}

} // namespace morpho
