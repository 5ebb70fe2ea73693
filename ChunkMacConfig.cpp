#include "ChunkMacConfig.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

ChunkMacConfig load_config_from_json(const std::string& json_text) {
    nlohmann::json json_config = nlohmann::json::parse(json_text);

    ChunkMacConfig config;
    if (json_config.contains("operation")) {
        config.operation = get_operation_from_string(json_config["operation"].get<std::string>());
    }
    // Paths
    if (json_config.contains("input_file")) {
        config.input_file = json_config["input_file"].get<std::string>();
    }
    if (json_config.contains("output_file")) {
        config.output_file = json_config["output_file"].get<std::string>();
    }
    // Key material
    // 例: "key": "a18d6d2c543e8782249eeba637ebce2b", "iv": "b6a231ecae7c1d640000000000000000"
    if (json_config.contains("key")) {
        config.key_hex = json_config["key"].get<std::string>();
    }
    if (json_config.contains("iv")) {
        config.iv_hex = json_config["iv"].get<std::string>();
    }
    if (json_config.contains("expected_tag")) {
        config.expected_tag_hex = json_config["expected_tag"].get<std::string>();
    }
    if (json_config.contains("total_size")) {
        if (!json_config["total_size"].is_number_unsigned()) {
            throw std::invalid_argument("total_size must be a non-negative integer");
        }
        config.total_size = json_config["total_size"].get<uint64_t>();
    }
    // Options
    if (json_config.contains("show_progress")) {
        config.show_progress = json_config["show_progress"].get<bool>();
    }

    for (auto& [key, value] : json_config.items()) {
        if (key != "operation" && key != "input_file" && key != "output_file" && key != "key" &&
            key != "iv" && key != "expected_tag" && key != "total_size" && key != "show_progress") {
            std::cerr << "Warning: unknown configuration entry '" << key << "'. Skipping." << std::endl;
        }
    }
    return config;
}
