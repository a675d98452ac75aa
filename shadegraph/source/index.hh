// shadegraph

#pragma once

#include <cstdint>

namespace shadegraph {
    // converts to any typed index; sgArray::contains() rejects it
    static constexpr struct
    {
        constexpr explicit operator uint32_t() const noexcept { return ~uint32_t{0u}; }
    } sgInvalidIndex;

    // Position of an element in a compiler snapshot array. Each array gets its
    // own index type so that an input index cannot address the outputs.
    template <typename DerivedT>
    class sgIndex
    {
    public:
        constexpr explicit sgIndex(uint32_t value) noexcept : value_(value) {}
        constexpr sgIndex(decltype(sgInvalidIndex)) noexcept {}

        constexpr explicit operator uint32_t() const noexcept { return value_; }

        constexpr bool operator==(sgIndex const&) const noexcept = default;

    private:
        uint32_t value_ = ~uint32_t{0u};
    };
} // namespace shadegraph

// clang-format off
#define SG_DEFINE_INDEX(name) \
    class name final : public sgIndex<class name> { public: using sgIndex::sgIndex; }
// clang-format on
