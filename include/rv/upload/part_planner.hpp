#pragma once

/**
 * @file part_planner.hpp
 * @brief Splits a file into the byte ranges of a multipart upload
 *
 * The planner is a pure function of (file size, config). Resume depends on
 * this: a restarted worker re-derives the same plan and can match it against
 * the parts the store already holds.
 *
 * RULES:
 * - 0 bytes → exactly one part of length 0
 * - fixed mode: chunk_size for every part, the last one takes the remainder
 * - adaptive mode: chunk grows with the file so the count stays ≤ kMaxParts,
 *   rounded up to a whole MiB, clamped to [min_chunk_size, max_chunk_size]
 * - more than kMaxParts parts → Permanent error
 */

#include "rv/core/result.hpp"
#include "rv/jobs/config.hpp"

#include <cstdint>
#include <vector>

namespace rv::upload {

constexpr std::uint32_t kMaxParts = 10000;

struct PartRange {
    std::uint32_t number = 0;     ///< 1-based, as the object store numbers parts
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

struct PartPlan {
    std::uint64_t chunk_size = 0;
    std::vector<PartRange> parts;

    std::uint64_t total_bytes() const noexcept {
        std::uint64_t total = 0;
        for (const auto& part : parts) {
            total += part.length;
        }
        return total;
    }
};

/// Chunk size the planner uses for a file of this size.
std::uint64_t effective_chunk_size(std::uint64_t file_size, const jobs::UploadConfig& config);

Result<PartPlan> plan_parts(std::uint64_t file_size, const jobs::UploadConfig& config);

} // namespace rv::upload
