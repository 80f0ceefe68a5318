#include "vidyeet/upload/chunk_planner.hpp"

#include <algorithm>
#include <limits>

#include "vidyeet/error_codes.hpp"

namespace vidyeet::upload
{

    std::string ChunkRange::content_range() const
    {
        if (total == 0)
        {
            return "bytes */0";
        }
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
    }

    ChunkPlan plan_chunks(std::uint64_t total_bytes, std::uint64_t chunk_size, std::uint64_t granularity)
    {
        if (chunk_size == 0)
        {
            throw Error(ErrorCode::InvalidConfiguration, "chunk size must be greater than zero");
        }
        if (granularity != 0 && chunk_size % granularity != 0)
        {
            throw Error(ErrorCode::InvalidConfiguration, "chunk size " + std::to_string(chunk_size) +
                                                             " is not a multiple of " + std::to_string(granularity));
        }

        ChunkPlan plan{.total_bytes = total_bytes, .chunk_size = chunk_size, .ranges = {}};
        if (total_bytes == 0)
        {
            plan.ranges.push_back(ChunkRange{.index = 0, .start = 0, .end = 0, .total = 0});
            return plan;
        }

        const auto count = total_bytes / chunk_size + (total_bytes % chunk_size != 0 ? 1 : 0);
        if (count > std::numeric_limits<std::uint32_t>::max())
        {
            throw Error(ErrorCode::InvalidConfiguration, "chunk size too small for a file of " +
                                                             std::to_string(total_bytes) + " bytes");
        }

        plan.ranges.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i)
        {
            const auto start = i * chunk_size;
            const auto end = std::min(start + chunk_size, total_bytes) - 1;
            plan.ranges.push_back(ChunkRange{
                .index = static_cast<std::uint32_t>(i),
                .start = start,
                .end = end,
                .total = total_bytes,
            });
        }
        return plan;
    }

} // namespace vidyeet::upload
