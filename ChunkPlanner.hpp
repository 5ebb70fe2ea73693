#ifndef CHUNKPLANNER_HPP
#define CHUNKPLANNER_HPP

#include <cstdint>
#include <vector>

struct ChunkEntry {
    uint64_t offset;
    uint64_t length;

    bool operator==(const ChunkEntry&) const = default;
};

// Ordered by offset, contiguous from 0, no zero-length entries.
using ChunkPlan = std::vector<ChunkEntry>;

class ChunkPlanner {
public:
    static constexpr uint64_t RAMP_STEP = 0x20000;      // 128 KiB
    static constexpr uint64_t RAMP_STEPS = 8;
    static constexpr uint64_t PLATEAU_SIZE = 0x100000;  // 1 MiB

    // Chunks grow by RAMP_STEP for up to RAMP_STEPS chunks, then stay at
    // PLATEAU_SIZE. The last chunk is trimmed so the plan ends at total_size.
    static ChunkPlan plan(uint64_t total_size);

    static uint64_t maxChunkLength(const ChunkPlan& plan);
    static uint64_t totalLength(const ChunkPlan& plan);
};

#endif // CHUNKPLANNER_HPP
