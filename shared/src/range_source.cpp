#include "pandrive/range_source.hpp"

#include <stdexcept>
#include <string>

namespace pandrive
{

    std::vector<std::byte> RangeSource::read_range(std::uint64_t offset, std::uint64_t length)
    {
        std::vector<std::byte> result;
        result.reserve(static_cast<std::size_t>(length));
        stream_range(offset, length, [&](std::span<const std::byte> block)
                     { result.insert(result.end(), block.begin(), block.end()); });
        return result;
    }

    MemoryRangeSource::MemoryRangeSource(std::span<const std::byte> data)
        : data_(data)
    {
    }

    std::uint64_t MemoryRangeSource::size() const
    {
        return data_.size();
    }

    void MemoryRangeSource::stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink)
    {
        if (offset > data_.size() || length > data_.size() - offset)
        {
            throw std::out_of_range("range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                                    ") exceeds source of " + std::to_string(data_.size()) + " bytes");
        }
        if (length > 0)
        {
            sink(data_.subspan(static_cast<std::size_t>(offset), static_cast<std::size_t>(length)));
        }
    }

    OffsetRangeSource::OffsetRangeSource(RangeSource &inner, std::uint64_t base)
        : inner_(inner),
          base_(base)
    {
    }

    std::uint64_t OffsetRangeSource::size() const
    {
        const auto total = inner_.size();
        return total > base_ ? total - base_ : 0;
    }

    void OffsetRangeSource::stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink)
    {
        inner_.stream_range(base_ + offset, length, sink);
    }

} // namespace pandrive
