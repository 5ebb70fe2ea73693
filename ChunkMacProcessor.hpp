#ifndef CHUNKMACPROCESSOR_HPP
#define CHUNKMACPROCESSOR_HPP

#include "ChunkMacConfig.hpp"
#include "StreamingVerifier.hpp"
#include <system_error>
#include <functional>
#include <future>

class ChunkMacProcessor {
public:
    explicit ChunkMacProcessor(ChunkMacConfig config);
    ~ChunkMacProcessor();

    // Runs the operation on a worker thread. Failures arrive as
    // std::system_error carrying a ChunkMacError code.
    std::future<void> run();

    void set_progress_callback(ProgressCallback cb);

private:
    static void run_internal(ChunkMacConfig config, ProgressCallback progress_callback, std::promise<void> promise);

    ChunkMacConfig config_;
    ProgressCallback progress_callback_ = nullptr;
};

#endif // CHUNKMACPROCESSOR_HPP
