/**
 * PanDrive - Splitting byte spans into download chunks and upload parts.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace pandrive
{

    inline constexpr std::uint64_t kDefaultChunkSize = 50ULL * 1024 * 1024;
    inline constexpr std::uint64_t kDefaultPartSize = 80ULL * 1024 * 1024;
    inline constexpr std::uint64_t kMaxPartCount = 10000;

    struct Chunk
    {
        std::uint64_t offset{};
        std::uint64_t length{};

        std::uint64_t end() const noexcept { return offset + length; }
    };

    using ChunkPlan = std::vector<Chunk>;

    // Contiguous chunks covering [begin, end); only the last one may be
    // shorter than chunk_size. Throws std::invalid_argument for a zero chunk
    // size or begin > end.
    ChunkPlan make_plan(std::uint64_t begin, std::uint64_t end, std::uint64_t chunk_size);

    // Part size raised to ceil(size / kMaxPartCount) when needed.
    std::uint64_t adjust_part_size(std::uint64_t size, std::uint64_t part_size);

    // Parts of an upload plan; an empty object is still one (empty) part.
    ChunkPlan make_part_plan(std::uint64_t size, std::uint64_t part_size);

} // namespace pandrive
