#include "ChunkMacProcessor.hpp"
#include "ChunkPlanner.hpp"
#include "async_file_types.hpp"
#include "nkChunkMacToolBase.hpp"
#include "nkChunkMacToolUtils.hpp"

#include <asio.hpp>
#include <filesystem>
#include <thread>
#include <iostream>
#include <format>

namespace {

[[noreturn]] void fail(ChunkMacError err, const std::string& what) {
    throw std::system_error(make_error_code(err), what);
}

FileKeyMaterial load_key_material(const ChunkMacConfig& config, bool needs_tag) {
    FileKeyMaterial material;
    try {
        material.key = parse_hex_array<AES_KEY_LEN>(config.key_hex, "key");
        material.iv = parse_hex_array<AES_BLOCK_LEN>(config.iv_hex, "iv");
        if (needs_tag) {
            material.expected_tag = parse_hex_array<FILE_TAG_LEN>(config.expected_tag_hex, "expected tag");
        }
    } catch (const std::invalid_argument& e) {
        fail(ChunkMacError::ParameterError, e.what());
    }
    return material;
}

void open_input(async_file_t& file, const std::string& path) {
    std::error_code ec;
    file.open(path, O_RDONLY, ec);
    if (ec) fail(ChunkMacError::FileReadError, std::format("Failed to open input file '{}': {}", path, ec.message()));
}

void reject_same_file(const std::string& input_path, const std::string& output_path) {
    std::error_code ec;
    if (std::filesystem::exists(output_path, ec) && std::filesystem::equivalent(input_path, output_path, ec)) {
        fail(ChunkMacError::ParameterError,
             std::format("Output file '{}' is the input file; choose a different output path.", output_path));
    }
}

void warn_trailing_input(bool trailing_input, uint64_t total_size) {
    if (trailing_input) {
        std::cerr << std::format("Warning: input is longer than {} bytes. Only the first {} bytes were processed.\n",
                                 total_size, total_size);
    }
}

void open_output(async_file_t& file, const std::string& path) {
    std::error_code ec;
    file.open(path, O_WRONLY | O_CREAT | O_TRUNC, ec);
    if (ec) fail(ChunkMacError::FileCreationError, std::format("Failed to create output file '{}': {}", path, ec.message()));
}

uint64_t resolve_total_size(const ChunkMacConfig& config, async_file_t& input_file) {
    if (config.total_size) {
        return *config.total_size;
    }
    std::error_code ec;
    uint64_t size = input_file.file_size(ec);
    if (ec) fail(ChunkMacError::ParameterError, "Input size is unknown; pass the total size explicitly: " + ec.message());
    return size;
}

void remove_partial_output(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << std::format("Warning: could not remove partial output '{}': {}\n", path, ec.message());
    }
}

std::string mismatch_message(const FileTag& expected, const FileTag& actual) {
    return std::format("file mac mismatch, expected {} but got {}", to_hex(expected), to_hex(actual));
}

} // anonymous namespace

ChunkMacProcessor::ChunkMacProcessor(ChunkMacConfig config)
    : config_(std::move(config)) {}

ChunkMacProcessor::~ChunkMacProcessor() = default;

std::future<void> ChunkMacProcessor::run() {
    std::promise<void> promise;
    auto future = promise.get_future();

    // The worker owns copies so the processor may go away before it finishes.
    std::thread([config = config_, cb = progress_callback_, p = std::move(promise)]() mutable {
        run_internal(std::move(config), std::move(cb), std::move(p));
    }).detach();

    return future;
}

void ChunkMacProcessor::set_progress_callback(ProgressCallback cb) {
    progress_callback_ = std::move(cb);
}

void ChunkMacProcessor::run_internal(ChunkMacConfig config, ProgressCallback progress_callback, std::promise<void> promise) {
    try {
        if (!progress_callback && config.show_progress) {
            progress_callback = [](uint64_t done, uint64_t total) {
                printProgress(total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total));
            };
        }

        asio::io_context io_context;

        switch (config.operation) {
            case Operation::Plan: {
                if (!config.total_size) fail(ChunkMacError::ParameterError, "The plan operation needs a total size.");
                ChunkPlan plan = ChunkPlanner::plan(*config.total_size);
                std::cout << std::format("{} chunk(s) for {} bytes\n", plan.size(), *config.total_size);
                for (const auto& chunk : plan) {
                    std::cout << std::format("{:>12} {:>10}\n", chunk.offset, chunk.length);
                }
                break;
            }
            case Operation::Decrypt: {
                FileKeyMaterial material = load_key_material(config, true);
                async_file_t input_file(io_context);
                async_file_t output_file(io_context);
                open_input(input_file, config.input_file);
                uint64_t total_size = resolve_total_size(config, input_file);
                reject_same_file(config.input_file, config.output_file);
                open_output(output_file, config.output_file);

                std::cout << std::format("Starting decryption of {} bytes...\n", total_size);
                StreamingVerifier verifier(material.key, material.iv);
                verifier.set_progress_callback(progress_callback);
                AsioFileSource source(input_file);
                AsioFileSink sink(output_file);
                auto result = verifier.verify(ChunkPlanner::plan(total_size), source, sink, material.expected_tag);
                output_file.close();
                if (!result) {
                    remove_partial_output(config.output_file);
                    fail(result.error(), std::format("Decryption of '{}' aborted", config.input_file));
                }
                warn_trailing_input(result->trailing_input, total_size);
                if (!result->match) {
                    // The plaintext stays on disk but must not be trusted.
                    fail(ChunkMacError::IntegrityMismatch, mismatch_message(material.expected_tag, result->computed_tag));
                }
                std::cout << std::format("Decrypted {} bytes to {}. File MAC verified.\n", result->bytes_written, config.output_file);
                break;
            }
            case Operation::Encrypt: {
                FileKeyMaterial material = load_key_material(config, false);
                async_file_t input_file(io_context);
                async_file_t output_file(io_context);
                open_input(input_file, config.input_file);
                uint64_t total_size = resolve_total_size(config, input_file);
                reject_same_file(config.input_file, config.output_file);
                open_output(output_file, config.output_file);

                std::cout << std::format("Starting encryption of {} bytes...\n", total_size);
                StreamingVerifier verifier(material.key, material.iv);
                verifier.set_progress_callback(progress_callback);
                AsioFileSource source(input_file);
                AsioFileSink sink(output_file);
                auto result = verifier.encrypt(ChunkPlanner::plan(total_size), source, sink);
                output_file.close();
                if (!result) {
                    remove_partial_output(config.output_file);
                    fail(result.error(), std::format("Encryption of '{}' aborted", config.input_file));
                }
                warn_trailing_input(result->trailing_input, total_size);
                std::cout << std::format("Encrypted {} bytes to {}.\nVerification tag: {}\n",
                                         result->bytes_written, config.output_file, to_hex(result->tag));
                break;
            }
            case Operation::VerifyPlain: {
                FileKeyMaterial material = load_key_material(config, true);
                async_file_t input_file(io_context);
                open_input(input_file, config.input_file);
                uint64_t total_size = resolve_total_size(config, input_file);

                std::cout << std::format("Verifying {} bytes of plaintext...\n", total_size);
                StreamingVerifier verifier(material.key, material.iv);
                verifier.set_progress_callback(progress_callback);
                AsioFileSource source(input_file);
                auto result = verifier.verifyPlaintext(ChunkPlanner::plan(total_size), source, material.expected_tag);
                if (!result) {
                    fail(result.error(), std::format("Verification of '{}' aborted", config.input_file));
                }
                warn_trailing_input(result->trailing_input, total_size);
                if (!result->match) {
                    fail(ChunkMacError::IntegrityMismatch, mismatch_message(material.expected_tag, result->computed_tag));
                }
                std::cout << "Ok" << std::endl;
                break;
            }
            case Operation::None:
                // No operation specified, should be handled by CLI logic before calling processor.
                break;
        }
        promise.set_value();
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
}
