#include "ChunkPlanner.hpp"
#include <algorithm>

ChunkPlan ChunkPlanner::plan(uint64_t total_size) {
    ChunkPlan chunks;
    uint64_t position = 0;

    // A ramp step is taken only if it leaves something behind for a later chunk.
    for (uint64_t i = 1; i <= RAMP_STEPS && position + i * RAMP_STEP < total_size; ++i) {
        chunks.push_back({position, i * RAMP_STEP});
        position += i * RAMP_STEP;
    }
    while (position < total_size) {
        chunks.push_back({position, PLATEAU_SIZE});
        position += PLATEAU_SIZE;
    }

    if (chunks.empty()) {
        return chunks;
    }
    ChunkEntry& last = chunks.back();
    last.length = total_size - last.offset;
    if (last.length == 0) {
        chunks.pop_back();
    }
    return chunks;
}

uint64_t ChunkPlanner::maxChunkLength(const ChunkPlan& plan) {
    uint64_t longest = 0;
    for (const auto& entry : plan) {
        longest = std::max(longest, entry.length);
    }
    return longest;
}

uint64_t ChunkPlanner::totalLength(const ChunkPlan& plan) {
    return plan.empty() ? 0 : plan.back().offset + plan.back().length;
}
