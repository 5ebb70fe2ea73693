#ifndef CHUNKMACCONFIG_HPP
#define CHUNKMACCONFIG_HPP

#include <string>
#include <optional>
#include <cstdint>
#include <stdexcept>

enum class Operation {
    Decrypt,
    Encrypt,
    VerifyPlain,
    Plan,
    None
};

inline Operation get_operation_from_string(const std::string& op_str) {
    if (op_str == "decrypt") return Operation::Decrypt;
    if (op_str == "encrypt") return Operation::Encrypt;
    if (op_str == "verify_plain") return Operation::VerifyPlain;
    if (op_str == "plan") return Operation::Plan;
    throw std::invalid_argument("Invalid operation: " + op_str);
}

inline std::string to_string(Operation op) {
    switch (op) {
        case Operation::Decrypt: return "decrypt";
        case Operation::Encrypt: return "encrypt";
        case Operation::VerifyPlain: return "verify_plain";
        case Operation::Plan: return "plan";
        case Operation::None: return "none";
    }
    return "unknown";
}

struct ChunkMacConfig {
    Operation operation = Operation::None;

    // Paths
    std::string input_file;
    std::string output_file;

    // Key material, hex encoded
    std::string key_hex;
    std::string iv_hex;
    std::string expected_tag_hex;

    // Overrides the input file size when set
    std::optional<uint64_t> total_size;

    // Options
    bool show_progress = false;
};

// Throws nlohmann::json::exception on malformed documents and
// std::invalid_argument on unknown operations.
ChunkMacConfig load_config_from_json(const std::string& json_text);

#endif // CHUNKMACCONFIG_HPP
