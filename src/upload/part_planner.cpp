#include "rv/upload/part_planner.hpp"

#include <algorithm>

namespace rv::upload {

namespace {

std::uint64_t ceil_div(std::uint64_t value, std::uint64_t divisor) {
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

} // namespace

std::uint64_t effective_chunk_size(std::uint64_t file_size, const jobs::UploadConfig& config) {
    if (!config.adaptive_chunk_size) {
        return config.chunk_size;
    }

    const auto floor_for_count = ceil_div(file_size, kMaxParts);
    auto chunk = std::max(config.chunk_size, floor_for_count);
    chunk = std::clamp(chunk, config.min_chunk_size, config.max_chunk_size);

    // Round up to a whole MiB, then clamp again
    chunk = ceil_div(chunk, jobs::kMiB) * jobs::kMiB;
    return std::clamp(chunk, config.min_chunk_size, config.max_chunk_size);
}

Result<PartPlan> plan_parts(std::uint64_t file_size, const jobs::UploadConfig& config) {
    if (config.chunk_size == 0) {
        return Err<PartPlan>(Error::invalid_argument("chunk_size must be > 0"));
    }
    if (config.adaptive_chunk_size && config.min_chunk_size > config.max_chunk_size) {
        return Err<PartPlan>(Error::invalid_argument("min_chunk_size exceeds max_chunk_size"));
    }

    PartPlan plan;
    plan.chunk_size = effective_chunk_size(file_size, config);

    if (file_size == 0) {
        plan.parts.push_back(PartRange{1, 0, 0});
        return Ok(std::move(plan));
    }

    const auto count = ceil_div(file_size, plan.chunk_size);
    if (count > kMaxParts) {
        return Err<PartPlan>(Error::permanent(
            "File of " + std::to_string(file_size) + " bytes needs " + std::to_string(count) +
            " parts of " + std::to_string(plan.chunk_size) + " bytes; the store allows " +
            std::to_string(kMaxParts)));
    }

    plan.parts.reserve(static_cast<std::size_t>(count));
    std::uint64_t offset = 0;
    for (std::uint32_t number = 1; offset < file_size; ++number) {
        const auto length = std::min(plan.chunk_size, file_size - offset);
        plan.parts.push_back(PartRange{number, offset, length});
        offset += length;
    }
    return Ok(std::move(plan));
}

} // namespace rv::upload
