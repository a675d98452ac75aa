// shadegraph

#pragma once

#include "shadegraph/alloc.hh"

#include "string.hh"

#include <fmt/format.h>

#include <cstddef>
#include <iterator>

namespace shadegraph {
    // std-style allocator adapter so fmt buffers draw from an sgAllocator
    template <typename T>
    class sgStdAllocator
    {
    public:
        using value_type = T;

        explicit sgStdAllocator(sgAllocator& alloc) noexcept : allocator_(&alloc) {}
        template <typename U>
        sgStdAllocator(sgStdAllocator<U> const& rhs) noexcept : allocator_(&rhs.allocator())
        {
        }

        [[nodiscard]] T* allocate(std::size_t count)
        {
            return static_cast<T*>(allocator_->allocate(static_cast<uint32_t>(count * sizeof(T)), alignof(T)));
        }
        void deallocate(T* block, std::size_t count) noexcept { allocator_->free(block, static_cast<uint32_t>(count * sizeof(T)), alignof(T)); }

        sgAllocator& allocator() const noexcept { return *allocator_; }

        template <typename U>
        bool operator==(sgStdAllocator<U> const& rhs) const noexcept
        {
            return allocator_ == &rhs.allocator();
        }

    private:
        sgAllocator* allocator_ = nullptr;
    };

    using sgTextBuffer = fmt::basic_memory_buffer<char, 256, sgStdAllocator<char>>;

    inline void sgAppend(sgTextBuffer& buffer, char const* text, char const* textEnd = nullptr)
    {
        if (text == nullptr)
            return;
        textEnd = sgStrEnd(text, textEnd);
        buffer.append(text, textEnd);
    }

    inline void sgAppend(sgTextBuffer& buffer, sgString const& text) { buffer.append(text.begin(), text.end()); }

    template <typename... Args>
    void sgFormatTo(sgTextBuffer& buffer, fmt::format_string<Args...> format, Args&&... args)
    {
        fmt::format_to(std::back_inserter(buffer), format, static_cast<Args&&>(args)...);
    }
} // namespace shadegraph
