// shadegraph

#pragma once

#include <cstdint>
#include <type_traits>

namespace shadegraph {
    constexpr char sgToAsciiLower(char c) noexcept { return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

    template <typename ValueT, typename IndexT = uint32_t>
    class sgEnumerated
    {
    public:
        struct Entry
        {
            IndexT index;
            ValueT& item;
        };

        class Iterator
        {
        public:
            constexpr Iterator(ValueT* item, uint32_t index) noexcept : item_(item), index_(index) {}

            constexpr Iterator& operator++() noexcept
            {
                ++index_;
                ++item_;
                return *this;
            }

            constexpr Entry operator*() const noexcept { return {.index = IndexT{index_}, .item = *item_}; }

            constexpr bool operator==(Iterator const&) const noexcept = default;

        private:
            ValueT* item_ = nullptr;
            uint32_t index_ = 0;
        };

        constexpr sgEnumerated(ValueT* items, uint32_t size) noexcept : items_(items), size_(size) {}

        constexpr Iterator begin() const noexcept { return Iterator(items_, 0); }
        constexpr Iterator end() const noexcept { return Iterator(items_ + size_, size_); }

    private:
        ValueT* items_ = nullptr;
        uint32_t size_ = 0;
    };

    // yields {index, item} pairs; the index has the container's index type
    template <typename ContainerT>
    constexpr auto sgEnumerate(ContainerT& container) noexcept
    {
        using Value = std::remove_reference_t<decltype(*container.data())>;
        using Index = typename std::remove_const_t<ContainerT>::index_type;
        return sgEnumerated<Value, Index>{container.data(), container.size()};
    }
} // namespace shadegraph
