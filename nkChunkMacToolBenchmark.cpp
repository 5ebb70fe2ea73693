#include <benchmark/benchmark.h>
#include <algorithm>
#include <fstream>
#include <vector>
#include <string>
#include <map>
#include <filesystem>
#include <iostream>
#include <asio.hpp>
#include <openssl/provider.h>
#include "ChunkPlanner.hpp"
#include "StreamingVerifier.hpp"
#include "async_file_types.hpp"

namespace {
const AesKey BENCH_KEY = {161, 141, 109, 44, 84, 62, 135, 130, 36, 158, 235, 166, 55, 235, 206, 43};
const AesIv BENCH_IV = {182, 162, 49, 236, 174, 124, 29, 100, 0, 0, 0, 0, 0, 0, 0, 0};
}

// ダミーファイルを作成するヘルパー関数
void createDummyFile(const std::string& filename, size_t size) {
    std::filesystem::path p(filename);
    if (std::filesystem::exists(p) && std::filesystem::file_size(p) == size) {
        return;
    }

    std::ofstream ofs(filename, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("Failed to create dummy file: " + filename);
    }
    std::vector<char> buffer(1024, 'A');
    for (size_t i = 0; i < size; i += buffer.size()) {
        ofs.write(buffer.data(), std::min(buffer.size(), size - i));
    }
}

std::vector<size_t> dummy_file_sizes = {
    1024,
    1024 * 1024,
    1024 * 1024 * 10,
};
std::filesystem::path dummy_input_files_dir = "./benchmark_data";
std::map<size_t, std::string> dummy_input_file_paths;

// チャンク分割のベンチマーク
static void BM_ChunkPlan(benchmark::State& state) {
    const uint64_t total_size = static_cast<uint64_t>(state.range(0));
    for (auto _ : state) {
        ChunkPlan plan = ChunkPlanner::plan(total_size);
        benchmark::DoNotOptimize(plan.data());
    }
}
BENCHMARK(BM_ChunkPlan)->Arg(985472)->Arg(1024 * 1024 * 10)->Arg(int64_t{1} << 32);

// メモリ上での復号 + MAC 検証
static void BM_VerifyInMemory(benchmark::State& state) {
    const size_t size = static_cast<size_t>(state.range(0));
    std::vector<unsigned char> plain(size, 'A');
    ChunkPlan plan = ChunkPlanner::plan(size);

    StreamingVerifier verifier(BENCH_KEY, BENCH_IV);
    std::vector<unsigned char> cipher;
    FileTag tag{};
    {
        MemorySource source(plain);
        MemorySink sink;
        auto encrypted = verifier.encrypt(plan, source, sink);
        if (!encrypted) {
            state.SkipWithError(("Setup Encryption failed: " + toString(encrypted.error())).c_str());
            return;
        }
        cipher = sink.data();
        tag = encrypted->tag;
    }

    for (auto _ : state) {
        MemorySource source(cipher);
        MemorySink sink;
        auto result = verifier.verify(plan, source, sink, tag);
        if (!result || !result->match) {
            state.SkipWithError("Verification failed");
            break;
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(size));
}
BENCHMARK(BM_VerifyInMemory)->Arg(1024)->Arg(1024 * 1024)->Arg(1024 * 1024 * 10);

// ファイルを使った暗号化 → 復号検証
static void BM_VerifyFile(benchmark::State& state) {
    const size_t file_size = static_cast<size_t>(state.range(0));
    std::string input_filename = dummy_input_file_paths[file_size];
    std::string encrypted_filename = (dummy_input_files_dir / ("encrypted_" + std::to_string(file_size) + ".enc")).string();
    std::string decrypted_filename = (dummy_input_files_dir / ("decrypted_" + std::to_string(file_size) + ".bin")).string();
    ChunkPlan plan = ChunkPlanner::plan(file_size);
    StreamingVerifier verifier(BENCH_KEY, BENCH_IV);

    FileTag tag{};
    {
        asio::io_context io_context;
        async_file_t in(io_context), out(io_context);
        std::error_code ec;
        in.open(input_filename, O_RDONLY, ec);
        if (!ec) out.open(encrypted_filename, O_WRONLY | O_CREAT | O_TRUNC, ec);
        if (ec) {
            state.SkipWithError(("Setup failed: " + ec.message()).c_str());
            return;
        }
        AsioFileSource source(in);
        AsioFileSink sink(out);
        auto encrypted = verifier.encrypt(plan, source, sink);
        if (!encrypted) {
            std::filesystem::remove(encrypted_filename);
            state.SkipWithError(("Setup Encryption failed: " + toString(encrypted.error())).c_str());
            return;
        }
        tag = encrypted->tag;
    }

    for (auto _ : state) {
        asio::io_context io_context;
        async_file_t in(io_context), out(io_context);
        std::error_code ec;
        in.open(encrypted_filename, O_RDONLY, ec);
        if (!ec) out.open(decrypted_filename, O_WRONLY | O_CREAT | O_TRUNC, ec);
        if (ec) {
            state.SkipWithError(("Open failed: " + ec.message()).c_str());
            break;
        }
        AsioFileSource source(in);
        AsioFileSink sink(out);
        auto result = verifier.verify(plan, source, sink, tag);
        if (!result || !result->match) {
            state.SkipWithError("Decryption failed");
            break;
        }
        std::filesystem::remove(decrypted_filename);
    }
    std::filesystem::remove(encrypted_filename);
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(file_size));
}
BENCHMARK(BM_VerifyFile)->Arg(1024)->Arg(1024 * 1024)->Arg(1024 * 1024 * 10);

void SetupDummyFiles() {
    std::filesystem::create_directories(dummy_input_files_dir);
    for (size_t size : dummy_file_sizes) {
        std::string filename = (dummy_input_files_dir / ("input_" + std::to_string(size) + ".bin")).string();
        createDummyFile(filename, size);
        dummy_input_file_paths[size] = filename;
        std::cout << "Created dummy file: " << filename << " (" << size << " bytes)" << std::endl;
    }
}

void TeardownDummyFiles() {
    std::filesystem::remove_all(dummy_input_files_dir);
}

// ベンチマークのメイン関数
int main(int argc, char** argv) {
    benchmark::Initialize(&argc, argv);
    OSSL_PROVIDER* default_provider = OSSL_PROVIDER_load(nullptr, "default");
    SetupDummyFiles();
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    TeardownDummyFiles();
    OSSL_PROVIDER_unload(default_provider);
    return 0;
}
