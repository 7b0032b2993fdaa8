#pragma once

#include <cstddef>
#include <new>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Profile.hpp"
#include "Region.hpp"

namespace Flux
{
    /**
     * Aligned heap block attributed to the region that was current when it
     * was allocated. The region is remembered so the block is released
     * against the same counters regardless of the region active at free time.
     */
    struct TrackedBlock
    {
        void* ptr = nullptr;
        std::size_t size = 0;
        std::size_t alignment = alignof(std::max_align_t);
        MemoryRegion region = MemoryRegion::General;
    };

    FLUX_NODISCARD inline TrackedBlock AllocateTracked(std::size_t size, std::size_t alignment)
    {
        TrackedBlock block;
        if (size == 0)
            return block;

        FLUX_ASSERT(IsPowerOfTwo(alignment), "Alignment must be a power of two");
        if (alignment < alignof(std::max_align_t))
            alignment = alignof(std::max_align_t);

        block.ptr = ::operator new(size, std::align_val_t{alignment});
        block.size = size;
        block.alignment = alignment;
        block.region = GetCurrentRegion();

        AllocationTracker::Get().RecordAllocation(block.region, size);
        FLUX_PROFILE_ALLOC(block.ptr, size);
        return block;
    }

    inline void FreeTracked(TrackedBlock& block) noexcept
    {
        if (!block.ptr)
            return;

        FLUX_PROFILE_FREE(block.ptr);
        AllocationTracker::Get().RecordDeallocation(block.region, block.size);
        ::operator delete(block.ptr, std::align_val_t{block.alignment});
        block = TrackedBlock{};
    }
}
