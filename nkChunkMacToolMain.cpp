// nkChunkMacToolMain.cpp
/*
 * Copyright (c) 2024-2025 Naohiro KORIYAMA <nkoriyama@gmail.com>
 *
 * This file is part of nkChunkMacTool.
 *
 * nkChunkMacTool is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * nkChunkMacTool is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with nkChunkMacTool. If not, see <https://www.gnu.org/licenses/>.
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include <format>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <openssl/provider.h>
#include "ChunkMacConfig.hpp"
#include "ChunkMacError.hpp"
#include "ChunkMacProcessor.hpp"
#include "nkChunkMacToolUtils.hpp"

namespace {
constexpr int EXIT_STREAM_TRUNCATED = 2;
constexpr int EXIT_INTEGRITY_MISMATCH = 3;

std::string read_text_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error(std::format("Cannot open configuration file '{}'", path));
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}
}

int main(int argc, char* argv[]) {
    OSSL_PROVIDER* default_provider = OSSL_PROVIDER_load(nullptr, "default");
    int return_code = 0;

    try {
        cxxopts::Options options("nkChunkMacTool",
            "Chunked AES-CTR decryption with chained CBC-MAC file verification.\n\n"
            "Usage examples:\n"
            "  # Show how a 10 MiB file is split into chunks\n"
            "  nkChunkMacTool --plan --size 10485760\n\n"
            "  # Decrypt a downloaded file and check its MAC\n"
            "  nkChunkMacTool --decrypt -o file.bin file.enc --key <32 hex> --iv <32 hex> --tag <16 hex>\n\n"
            "  # Encrypt a file and print the tag to publish with it\n"
            "  nkChunkMacTool --encrypt -o file.enc file.bin --key <32 hex> --iv <32 hex>\n\n"
            "  # Check an already decrypted file\n"
            "  nkChunkMacTool --verify-plain file.bin --key <32 hex> --iv <32 hex> --tag <16 hex>"
        );

        options.add_options("General")
            ("h,help", "Display this help message")
            ("c,config", "Read the operation and its parameters from a JSON file", cxxopts::value<std::string>())
            ("o,output-file", "Path to the output file", cxxopts::value<std::string>())
            ("progress", "Show a progress bar")
            ("input", "Input file", cxxopts::value<std::vector<std::string>>());

        options.add_options("Operations")
            ("decrypt", "Decrypt the input file and verify its MAC")
            ("encrypt", "Encrypt the input file and print its verification tag")
            ("verify-plain", "Verify an already decrypted file against the tag")
            ("plan", "Print the chunk plan for --size");

        options.add_options("Key Material")
            ("k,key", "16-byte AES key as hex. Prompted for when omitted.", cxxopts::value<std::string>())
            ("iv", "16-byte initialization value as hex", cxxopts::value<std::string>())
            ("t,tag", "8-byte expected verification tag as hex", cxxopts::value<std::string>())
            ("s,size", "Total file size in bytes (default: size of the input file)", cxxopts::value<uint64_t>());

        options.parse_positional({"input"});
        auto result = options.parse(argc, argv);

        if (result.count("help") || argc == 1) {
            std::cout << options.help() << std::endl;
            OSSL_PROVIDER_unload(default_provider);
            return 0;
        }

        ChunkMacConfig config;
        if (result.count("config")) {
            config = load_config_from_json(read_text_file(result["config"].as<std::string>()));
        }

        // --- 引数検証 ---
        int operation_count = static_cast<int>(result.count("decrypt") + result.count("encrypt") +
                                               result.count("verify-plain") + result.count("plan"));
        if (operation_count > 1) {
            std::cerr << "Error: Specify only one of --decrypt, --encrypt, --verify-plain or --plan." << std::endl;
            return 1;
        }
        if (result.count("decrypt")) config.operation = Operation::Decrypt;
        if (result.count("encrypt")) config.operation = Operation::Encrypt;
        if (result.count("verify-plain")) config.operation = Operation::VerifyPlain;
        if (result.count("plan")) config.operation = Operation::Plan;

        if (config.operation == Operation::None) {
            std::cerr << "Error: No operation specified." << std::endl;
            return 1;
        }

        std::vector<std::string> input_files;
        if (result.count("input")) {
            input_files = result["input"].as<std::vector<std::string>>();
        }
        if (input_files.size() > 1) {
            std::cerr << "Error: Too many input files specified. Please provide only one." << std::endl;
            return 1;
        }
        if (!input_files.empty()) config.input_file = input_files[0];
        if (result.count("output-file")) config.output_file = result["output-file"].as<std::string>();
        if (result.count("key")) config.key_hex = result["key"].as<std::string>();
        if (result.count("iv")) config.iv_hex = result["iv"].as<std::string>();
        if (result.count("tag")) config.expected_tag_hex = result["tag"].as<std::string>();
        if (result.count("size")) config.total_size = result["size"].as<uint64_t>();
        if (result.count("progress")) config.show_progress = true;

        bool needs_input_file = config.operation != Operation::Plan;
        bool needs_output_file = config.operation == Operation::Decrypt || config.operation == Operation::Encrypt;
        bool needs_tag = config.operation == Operation::Decrypt || config.operation == Operation::VerifyPlain;

        if (needs_input_file && config.input_file.empty()) {
            std::cerr << "Error: Input file must be specified for this operation." << std::endl;
            return 1;
        }
        if (needs_output_file && config.output_file.empty()) {
            std::cerr << "Error: --output-file must be specified for encryption/decryption." << std::endl;
            return 1;
        }
        if (config.operation == Operation::Plan && !config.total_size) {
            std::cerr << "Error: --size must be specified for --plan." << std::endl;
            return 1;
        }
        if (needs_input_file) {
            if (config.iv_hex.empty()) {
                std::cerr << "Error: --iv must be specified." << std::endl;
                return 1;
            }
            if (needs_tag && config.expected_tag_hex.empty()) {
                std::cerr << "Error: --tag must be specified for verification." << std::endl;
                return 1;
            }
            if (config.key_hex.empty()) {
                config.key_hex = get_masked_input("Enter file key (hex): ");
            }
        }

        // --- パスを絶対パスに変換 ---
        auto get_absolute_path = [](const std::string& path_str) -> std::string {
            if (path_str.empty()) return "";
            return std::filesystem::absolute(path_str).string();
        };
        config.input_file = get_absolute_path(config.input_file);
        config.output_file = get_absolute_path(config.output_file);

        // --- 処理の実行 ---
        ChunkMacProcessor processor(config);
        auto future = processor.run();
        try {
            future.get();
        } catch (const std::system_error& e) {
            if (e.code() == ChunkMacError::StreamTruncated) {
                std::cerr << std::format("Error: Input is truncated. {}\n", e.what());
                return_code = EXIT_STREAM_TRUNCATED;
            } else if (e.code() == ChunkMacError::IntegrityMismatch) {
                std::cerr << std::format("Error: Integrity check failed, output is not trustworthy. {}\n", e.what());
                return_code = EXIT_INTEGRITY_MISMATCH;
            } else {
                std::cerr << std::format("Error: {}\n", e.what());
                return_code = 1;
            }
        }

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return_code = 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error in configuration file: " << e.what() << std::endl;
        return_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return_code = 1;
    }

    OSSL_PROVIDER_unload(default_provider);
    return return_code;
}
