// shadegraph

#pragma once

#include "shadegraph/key.hh"

#include <cstdint>

namespace shadegraph {
    // token substituted with the node instance identifier in code templates
    static constexpr char sgTemplatePlaceholder[] = "{{id}}";

    // stored value read by color picker nodes
    static constexpr char sgColorValueName[] = "_color";

    // vertex count of the full-screen triangle emitted by every backend
    static constexpr uint32_t sgFullscreenVertexCount = 3;

    enum class sgSocketType : uint8_t
    {
        Scalar,
        Vector2,
        Vector3,
        Color,
        Sampler,
        Texture,
    };

    enum class sgSocketDirection : uint8_t
    {
        Input,
        Output,
    };

    enum class sgNodeKind : uint8_t
    {
        Function,
        ColorPicker,
        Output,
    };

    enum class sgBackend : uint8_t
    {
        Wgsl,
        Glsl,
    };

    struct sgPosition
    {
        float x = 0.f;
        float y = 0.f;

        constexpr bool operator==(sgPosition const&) const noexcept = default;
    };

    // color is interchangeable with the 3-vector everywhere types are compared
    constexpr bool sgIsVector3(sgSocketType type) noexcept { return type == sgSocketType::Vector3 || type == sgSocketType::Color; }

    constexpr bool sgIsResource(sgSocketType type) noexcept { return type == sgSocketType::Sampler || type == sgSocketType::Texture; }
} // namespace shadegraph
