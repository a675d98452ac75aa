// shadegraph

#pragma once

#include "shadegraph/types.hh"
#include "shadegraph/value.hh"

#include "text.hh"

namespace shadegraph {
    // constructor names a backend uses for vector literals
    struct sgLiteralSyntax
    {
        char const* vector2 = "vec2";
        char const* vector3 = "vec3";
        char const* vector4 = "vec4";
    };

    // shortest round-trip form, always with a decimal point; non-finite values write 0.0
    void sgWriteFloatLiteral(sgTextBuffer& out, float value);

    // Formats a value for a socket of the given type. Missing components,
    // scalars in vector sockets and vectors in scalar sockets follow a
    // single coercion table; an empty value writes the type's zero literal.
    void sgWriteLiteral(sgTextBuffer& out, sgLiteralSyntax const& syntax, sgSocketType type, sgValue const& value);

    // fixed four-decimal 3-vector, as written for color picker nodes
    void sgWriteColorLiteral(sgTextBuffer& out, sgLiteralSyntax const& syntax, sgValue const& value);
} // namespace shadegraph
