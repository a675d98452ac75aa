// shadegraph

#pragma once

#include "shadegraph/alloc.hh"

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <string>

namespace shadegraph {
    constexpr char const* sgStrEnd(char const* string, char const* stringEnd) noexcept
    {
        if (string == nullptr)
            return nullptr;
        return stringEnd != nullptr ? stringEnd : string + std::char_traits<char>::length(string);
    }

    constexpr bool sgIsEmpty(char const* string, char const* stringEnd = nullptr) noexcept
    {
        return string == nullptr || string == stringEnd || (stringEnd == nullptr && *string == '\0');
    }

    inline bool sgStrEqual(char const* first, char const* firstEnd, char const* second, char const* secondEnd) noexcept
    {
        if (first == nullptr || second == nullptr)
            return sgIsEmpty(first, firstEnd) && sgIsEmpty(second, secondEnd);

        firstEnd = sgStrEnd(first, firstEnd);
        secondEnd = sgStrEnd(second, secondEnd);

        size_t const length = static_cast<size_t>(firstEnd - first);
        return length == static_cast<size_t>(secondEnd - second) && std::memcmp(first, second, length) == 0;
    }

    // Owning, NUL terminated string allocated from an sgAllocator.
    class sgString
    {
    public:
        explicit sgString(sgAllocator& alloc) noexcept : allocator_(&alloc) {}

        sgString(sgAllocator& alloc, char const* string, char const* sentinel = nullptr) : allocator_(&alloc) { reset(string, sentinel); }
        sgString(sgAllocator& alloc, decltype(nullptr), char const*) = delete;

        sgString(sgString&& rhs) noexcept : allocator_(rhs.allocator_), first_(rhs.first_), last_(rhs.last_)
        {
            rhs.first_ = rhs.last_ = emptyString;
        }
        sgString& operator=(sgString&& rhs) noexcept
        {
            if (this != &rhs)
            {
                reset();
                allocator_ = rhs.allocator_;
                first_ = rhs.first_;
                last_ = rhs.last_;
                rhs.first_ = rhs.last_ = emptyString;
            }
            return *this;
        }

        ~sgString() { reset(); }

        bool empty() const noexcept { return first_ == last_; }

        char const* cStr() const noexcept { return first_; }

        char const* data() const noexcept { return first_; }
        uint32_t size() const noexcept { return static_cast<uint32_t>(last_ - first_); }

        char const* begin() const noexcept { return first_; }
        char const* end() const noexcept { return last_; }

        bool equals(char const* string, char const* stringEnd = nullptr) const noexcept
        {
            return sgStrEqual(first_, last_, string, stringEnd);
        }

        inline void reset() noexcept;
        inline void reset(char const* string, char const* sentinel = nullptr);
        inline void reset(decltype(nullptr), char const* sentinel = nullptr) = delete;

    private:
        // to avoid allocating for empty strings
        static constexpr char emptyString[] = "";

        sgAllocator* allocator_ = nullptr;
        char const* first_ = emptyString;
        char const* last_ = emptyString;
    };

    void sgString::reset() noexcept
    {
        if (first_ != emptyString)
            allocator_->free(const_cast<char*>(first_), size() + 1 /*NUL*/, 1);
        first_ = last_ = emptyString;
    }

    void sgString::reset(char const* string, char const* sentinel)
    {
        if (sgIsEmpty(string, sentinel))
            return reset();

        sentinel = sgStrEnd(string, sentinel);

        uint32_t const length = static_cast<uint32_t>(sentinel - string);

        // allocate and copy before releasing so a sub-range of this string
        // may be assigned to itself
        char* alloc = static_cast<char*>(allocator_->allocate(length + 1 /*NUL*/, 1));

        std::memcpy(alloc, string, length);
        alloc[length] = '\0';

        reset();

        first_ = alloc;
        last_ = first_ + length;
    }
} // namespace shadegraph
