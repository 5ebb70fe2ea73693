#include "nkchunkmac_ffi.hpp"
#include "ChunkMacConfig.hpp"
#include "ChunkMacError.hpp"
#include "ChunkMacProcessor.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

extern "C" {

int run_chunkmac_op_json(const char* json_config_str, chunkmac_progress_cb progress, void* userdata) {
    if (!json_config_str) {
        std::cerr << "JSON parsing error: null configuration" << std::endl;
        return 1;
    }

    ChunkMacConfig config;
    try {
        config = load_config_from_json(json_config_str);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parsing error: " << e.what() << std::endl;
        return 1; // JSONパースエラー
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "JSON mapping error: " << e.what() << std::endl;
        return 2; // JSONデータから設定へのマッピングエラー
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 3; // 不正な引数による構成エラー
    }

    if (config.operation == Operation::None) {
        std::cerr << "Configuration error: no operation specified" << std::endl;
        return 3;
    }

    try {
        ChunkMacProcessor processor(config);
        if (progress) {
            processor.set_progress_callback([progress, userdata](uint64_t done, uint64_t total) {
                progress(done, total, userdata);
            });
        }
        auto future = processor.run();
        future.get();
        return 0;
    } catch (const std::system_error& e) {
        std::cerr << "ChunkMacProcessor execution error: " << e.what() << std::endl;
        if (e.code() == ChunkMacError::StreamTruncated) return 5;
        if (e.code() == ChunkMacError::IntegrityMismatch) return 6;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "ChunkMacProcessor execution error: " << e.what() << std::endl;
        return 4;
    }
}

} // extern "C"
