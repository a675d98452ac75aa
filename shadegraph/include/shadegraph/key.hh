// shadegraph

#pragma once

#include <cstdint>

namespace shadegraph {
    // Identifier handed out by an sgGraph. Ids start at 1 and are never
    // reused within a graph, so 0 marks an unset id.
    template <typename TagT>
    class sgKey
    {
    public:
        constexpr explicit sgKey(uint64_t value) noexcept : value_(value) {}

        constexpr uint64_t value() const noexcept { return value_; }
        constexpr bool valid() const noexcept { return value_ != 0; }

        constexpr bool operator==(sgKey const&) const noexcept = default;

    private:
        uint64_t value_ = 0;
    };

    // clang-format off
#define SG_DEFINE_KEY(name) \
    class name final : public sgKey<class name> { public: using sgKey::sgKey; }
    // clang-format on

    SG_DEFINE_KEY(sgNodeId);
    SG_DEFINE_KEY(sgSocketId);
    SG_DEFINE_KEY(sgConnectionId);

    static constexpr sgNodeId sgInvalidNodeId{0};
    static constexpr sgSocketId sgInvalidSocketId{0};
    static constexpr sgConnectionId sgInvalidConnectionId{0};
} // namespace shadegraph
