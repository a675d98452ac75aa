// shadegraph

#pragma once

#include "shadegraph/types.hh"

#include "literal.hh"
#include "text.hh"

#include <cstdint>

namespace shadegraph {
    struct sgEmitOutput
    {
        sgTextBuffer& module;
        sgTextBuffer& vertex;
        sgTextBuffer& fragment;
    };

    // Backend syntax for the shader compiler. The resolver is shared; an
    // emitter only decides how bindings, the sink color and the enclosing
    // document are spelled.
    class sgEmitter
    {
    public:
        virtual sgBackend backend() const noexcept = 0;
        virtual sgLiteralSyntax const& syntax() const noexcept = 0;
        virtual char const* typeName(sgSocketType type) const noexcept = 0;

        // one intermediate binding statement, vN = expression
        virtual void writeBinding(sgTextBuffer& body, sgSocketType type, uint32_t variable, char const* expression,
            char const* expressionEnd) const = 0;

        // the sink's combined rgb/alpha result
        virtual void writeSinkColor(sgTextBuffer& body, char const* colorName, char const* rgb, char const* rgbEnd, char const* alpha,
            char const* alphaEnd) const = 0;

        // functions holds the declarations already separated by blank lines
        virtual void assemble(sgEmitOutput const& out, sgTextBuffer const& functions, sgTextBuffer const& body, char const* colorName) const = 0;
        virtual void assembleFallback(sgEmitOutput const& out) const = 0;

    protected:
        ~sgEmitter() = default;
    };

    sgEmitter const& sgWgslEmitter() noexcept;
    sgEmitter const& sgGlslEmitter() noexcept;

    inline sgEmitter const& sgGetEmitter(sgBackend backend) noexcept
    {
        return backend == sgBackend::Glsl ? sgGlslEmitter() : sgWgslEmitter();
    }
} // namespace shadegraph
