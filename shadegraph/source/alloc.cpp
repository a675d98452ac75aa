// shadegraph

#include "shadegraph/alloc.hh"

#include <new>

namespace shadegraph {
    void* sgDefaultAllocator::allocate(uint32_t size, uint32_t alignment)
    {
        return ::operator new(size, std::align_val_t(alignment < alignof(void*) ? alignof(void*) : alignment));
    }

    void sgDefaultAllocator::free(void* block, uint32_t size, uint32_t alignment)
    {
        if (block != nullptr)
            ::operator delete(block, size, std::align_val_t(alignment < alignof(void*) ? alignof(void*) : alignment));
    }
} // namespace shadegraph
