/**
 * PanDrive - Random-access byte sources.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace pandrive
{

    using ByteSink = std::function<void(std::span<const std::byte>)>;

    class RangeSource
    {
    public:
        virtual ~RangeSource() = default;

        virtual std::uint64_t size() const = 0;

        // Delivers exactly [offset, offset + length) to `sink`, possibly in
        // several blocks. Throws if the range cannot be delivered completely.
        virtual void stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink) = 0;

        std::vector<std::byte> read_range(std::uint64_t offset, std::uint64_t length);
    };

    class MemoryRangeSource : public RangeSource
    {
    public:
        explicit MemoryRangeSource(std::span<const std::byte> data);

        std::uint64_t size() const override;
        void stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink) override;

    private:
        std::span<const std::byte> data_;
    };

    // View of `inner` shifted by `base`, e.g. the body behind an encryption header.
    class OffsetRangeSource : public RangeSource
    {
    public:
        OffsetRangeSource(RangeSource &inner, std::uint64_t base);

        std::uint64_t size() const override;
        void stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink) override;

    private:
        RangeSource &inner_;
        std::uint64_t base_;
    };

} // namespace pandrive
