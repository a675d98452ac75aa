// shadegraph

#pragma once

#include "shadegraph/export.hh"

#include <cstdint>

namespace shadegraph {
    // Source of all catalog and compiler memory. free() receives the same
    // size and alignment that were passed to allocate().
    class sgAllocator
    {
    public:
        [[nodiscard]] virtual void* allocate(uint32_t size, uint32_t alignment) = 0;
        virtual void free(void* block, uint32_t size, uint32_t alignment) = 0;

    protected:
        ~sgAllocator() = default;
    };

    // global aligned new/delete
    class SG_API sgDefaultAllocator final : public sgAllocator
    {
    public:
        [[nodiscard]] void* allocate(uint32_t size, uint32_t alignment) override;
        void free(void* block, uint32_t size, uint32_t alignment) override;
    };
} // namespace shadegraph
