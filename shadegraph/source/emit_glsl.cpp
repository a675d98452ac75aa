// shadegraph

#include "emitter.hh"

namespace shadegraph {
    namespace {
        constexpr char preamble[] = "#version 300 es\nprecision highp float;\n\n";

        // full-screen triangle; draw sgFullscreenVertexCount vertices
        constexpr char vertexStage[] = R"(out vec2 vUv;

void main() {
  vec2 positions[3] = vec2[](
    vec2(-1.0, -1.0),
    vec2( 3.0, -1.0),
    vec2(-1.0,  3.0)
  );

  vec2 pos = positions[gl_VertexID];
  gl_Position = vec4(pos, 0.0, 1.0);
  vUv = pos * 0.5 + 0.5;
}
)";

        constexpr char fragmentInterface[] = R"(uniform float u_time;
uniform vec2 u_resolution;
uniform vec2 u_mouse;

in vec2 vUv;
out vec4 fragColor;

)";

        class GlslEmitter final : public sgEmitter
        {
        public:
            sgBackend backend() const noexcept override { return sgBackend::Glsl; }
            sgLiteralSyntax const& syntax() const noexcept override { return syntax_; }
            char const* typeName(sgSocketType type) const noexcept override;

            void writeBinding(sgTextBuffer& body, sgSocketType type, uint32_t variable, char const* expression,
                char const* expressionEnd) const override;
            void writeSinkColor(sgTextBuffer& body, char const* colorName, char const* rgb, char const* rgbEnd, char const* alpha,
                char const* alphaEnd) const override;

            void assemble(sgEmitOutput const& out, sgTextBuffer const& functions, sgTextBuffer const& body, char const* colorName) const override;
            void assembleFallback(sgEmitOutput const& out) const override;

        private:
            void writeVertex(sgTextBuffer& vertex) const;

            sgLiteralSyntax syntax_{};
        };

        char const* GlslEmitter::typeName(sgSocketType type) const noexcept
        {
            switch (type)
            {
            case sgSocketType::Scalar: return "float";
            case sgSocketType::Vector2: return "vec2";
            case sgSocketType::Vector3:
            case sgSocketType::Color: return "vec3";
            case sgSocketType::Sampler:
            case sgSocketType::Texture: return "sampler2D";
            }
            return "float";
        }

        void GlslEmitter::writeBinding(sgTextBuffer& body, sgSocketType type, uint32_t variable, char const* expression,
            char const* expressionEnd) const
        {
            sgFormatTo(body, "  {} v{} = ", typeName(type), variable);
            sgAppend(body, expression, expressionEnd);
            sgAppend(body, ";\n");
        }

        void GlslEmitter::writeSinkColor(sgTextBuffer& body, char const* colorName, char const* rgb, char const* rgbEnd, char const* alpha,
            char const* alphaEnd) const
        {
            sgFormatTo(body, "  {} {} = {}(", syntax_.vector4, colorName, syntax_.vector4);
            sgAppend(body, rgb, rgbEnd);
            sgAppend(body, ", ");
            sgAppend(body, alpha, alphaEnd);
            sgAppend(body, ");\n");
        }

        void GlslEmitter::writeVertex(sgTextBuffer& vertex) const
        {
            sgAppend(vertex, preamble);
            sgAppend(vertex, vertexStage);
        }

        void GlslEmitter::assemble(sgEmitOutput const& out, sgTextBuffer const& functions, sgTextBuffer const& body, char const* colorName) const
        {
            writeVertex(out.vertex);

            sgAppend(out.fragment, preamble);
            sgAppend(out.fragment, fragmentInterface);

            if (functions.size() != 0)
            {
                sgAppend(out.fragment, "// Node functions\n");
                out.fragment.append(functions.begin(), functions.end());
                sgAppend(out.fragment, "\n\n");
            }

            sgAppend(out.fragment, "void main() {\n  vec2 uv = vUv;\n\n");
            out.fragment.append(body.begin(), body.end());
            sgFormatTo(out.fragment, "\n  fragColor = {};\n}}\n", colorName);
        }

        void GlslEmitter::assembleFallback(sgEmitOutput const& out) const
        {
            writeVertex(out.vertex);

            sgAppend(out.fragment, preamble);
            sgAppend(out.fragment, fragmentInterface);
            sgAppend(out.fragment, "void main() {\n  fragColor = vec4(vUv, 0.5 + 0.5 * sin(u_time), 1.0);\n}\n");
        }
    } // namespace

    sgEmitter const& sgGlslEmitter() noexcept
    {
        static GlslEmitter const emitter;
        return emitter;
    }
} // namespace shadegraph
