#include "pandrive/chunk_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace pandrive
{

    ChunkPlan make_plan(std::uint64_t begin, std::uint64_t end, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        if (begin > end)
        {
            throw std::invalid_argument("Chunk plan span is reversed");
        }
        ChunkPlan plan;
        plan.reserve(static_cast<std::size_t>((end - begin + chunk_size - 1) / chunk_size));
        for (auto offset = begin; offset < end; offset += std::min(chunk_size, end - offset))
        {
            plan.push_back(Chunk{offset, std::min(chunk_size, end - offset)});
        }
        return plan;
    }

    std::uint64_t adjust_part_size(std::uint64_t size, std::uint64_t part_size)
    {
        if (part_size == 0)
        {
            throw std::invalid_argument("Part size must be positive");
        }
        const auto minimum = (size + kMaxPartCount - 1) / kMaxPartCount;
        return std::max(part_size, minimum);
    }

    ChunkPlan make_part_plan(std::uint64_t size, std::uint64_t part_size)
    {
        if (size == 0)
        {
            return ChunkPlan{Chunk{0, 0}};
        }
        return make_plan(0, size, adjust_part_size(size, part_size));
    }

} // namespace pandrive
