// shadegraph

#pragma once

#include "shadegraph/export.hh"

#include <cstdint>

namespace shadegraph {
    // A stored or default socket value: empty, a scalar, or a 2/3 component
    // vector. Two components is the legacy shorthand for a 3-vector whose
    // third component is zero.
    class sgValue final
    {
    public:
        static constexpr uint32_t maxComponents = 3;

        constexpr sgValue() noexcept = default;
        constexpr /*implicit*/ sgValue(float scalar) noexcept : components_{scalar, 0.f, 0.f}, count_(1) {}
        constexpr sgValue(float x, float y) noexcept : components_{x, y, 0.f}, count_(2) {}
        constexpr sgValue(float x, float y, float z) noexcept : components_{x, y, z}, count_(3) {}

        [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }
        [[nodiscard]] constexpr bool isScalar() const noexcept { return count_ == 1; }
        [[nodiscard]] constexpr bool isVector() const noexcept { return count_ >= 2; }

        [[nodiscard]] constexpr uint32_t componentCount() const noexcept { return count_; }

        // components past componentCount() read as zero
        [[nodiscard]] constexpr float component(uint32_t index) const noexcept { return index < count_ ? components_[index] : 0.f; }

        [[nodiscard]] SG_API bool operator==(sgValue const& right) const noexcept;

    private:
        float components_[maxComponents] = {0.f, 0.f, 0.f};
        uint8_t count_ = 0;
    };
} // namespace shadegraph
