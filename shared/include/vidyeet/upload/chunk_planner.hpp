/**
 * vidyeet - Splits a file into the byte ranges sent as individual PUT requests.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vidyeet/settings.hpp"

namespace vidyeet::upload
{

    // `end` is inclusive. The single range of an empty file has start == end == total == 0.
    struct ChunkRange
    {
        std::uint32_t index{};
        std::uint64_t start{};
        std::uint64_t end{};
        std::uint64_t total{};

        std::uint64_t length() const noexcept
        {
            return total == 0 ? 0 : end - start + 1;
        }

        // Value of the Content-Range header, "bytes */0" for the empty range.
        std::string content_range() const;

        bool operator==(const ChunkRange &) const = default;
    };

    struct ChunkPlan
    {
        std::uint64_t total_bytes{};
        std::uint64_t chunk_size{};
        std::vector<ChunkRange> ranges;

        std::size_t size() const noexcept { return ranges.size(); }

        bool operator==(const ChunkPlan &) const = default;
    };

    // Throws Error(InvalidConfiguration) for a zero or misaligned chunk size.
    ChunkPlan plan_chunks(std::uint64_t total_bytes, std::uint64_t chunk_size,
                          std::uint64_t granularity = kChunkGranularity);

} // namespace vidyeet::upload
