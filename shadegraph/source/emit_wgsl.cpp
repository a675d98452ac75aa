// shadegraph

#include "emitter.hh"

namespace shadegraph {
    namespace {
        constexpr char moduleHeader[] = "// Generated WGSL Shader\n";
        constexpr char fallbackHeader[] = "// Default WGSL Shader\n";

        constexpr char uniforms[] = R"(struct Uniforms {
  time: f32,
  resolution: vec2f,
  mouse: vec2f,
}

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

)";

        // full-screen triangle; draw sgFullscreenVertexCount vertices
        constexpr char vertexStage[] = R"(struct VertexOutput {
  @builtin(position) position: vec4f,
  @location(0) uv: vec2f,
}

@vertex
fn vertexMain(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
  var pos = array<vec2f, 3>(
    vec2f(-1.0, -1.0),
    vec2f( 3.0, -1.0),
    vec2f(-1.0,  3.0)
  );

  var output: VertexOutput;
  output.position = vec4f(pos[vertexIndex], 0.0, 1.0);
  output.uv = pos[vertexIndex] * 0.5 + 0.5;
  return output;
}

)";

        constexpr char fragmentBegin[] = R"(@fragment
fn fragmentMain(input: VertexOutput) -> @location(0) vec4f {
)";

        class WgslEmitter final : public sgEmitter
        {
        public:
            sgBackend backend() const noexcept override { return sgBackend::Wgsl; }
            sgLiteralSyntax const& syntax() const noexcept override { return syntax_; }
            char const* typeName(sgSocketType type) const noexcept override;

            void writeBinding(sgTextBuffer& body, sgSocketType type, uint32_t variable, char const* expression,
                char const* expressionEnd) const override;
            void writeSinkColor(sgTextBuffer& body, char const* colorName, char const* rgb, char const* rgbEnd, char const* alpha,
                char const* alphaEnd) const override;

            void assemble(sgEmitOutput const& out, sgTextBuffer const& functions, sgTextBuffer const& body, char const* colorName) const override;
            void assembleFallback(sgEmitOutput const& out) const override;

        private:
            sgLiteralSyntax syntax_{.vector2 = "vec2f", .vector3 = "vec3f", .vector4 = "vec4f"};
        };

        char const* WgslEmitter::typeName(sgSocketType type) const noexcept
        {
            switch (type)
            {
            case sgSocketType::Scalar: return "f32";
            case sgSocketType::Vector2: return "vec2f";
            case sgSocketType::Vector3:
            case sgSocketType::Color: return "vec3f";
            case sgSocketType::Sampler: return "sampler";
            case sgSocketType::Texture: return "texture_2d<f32>";
            }
            return "f32";
        }

        void WgslEmitter::writeBinding(sgTextBuffer& body, sgSocketType type, uint32_t variable, char const* expression,
            char const* expressionEnd) const
        {
            sgFormatTo(body, "  let v{}: {} = ", variable, typeName(type));
            sgAppend(body, expression, expressionEnd);
            sgAppend(body, ";\n");
        }

        void WgslEmitter::writeSinkColor(sgTextBuffer& body, char const* colorName, char const* rgb, char const* rgbEnd, char const* alpha,
            char const* alphaEnd) const
        {
            sgFormatTo(body, "  let {} = {}(", colorName, syntax_.vector4);
            sgAppend(body, rgb, rgbEnd);
            sgAppend(body, ", ");
            sgAppend(body, alpha, alphaEnd);
            sgAppend(body, ");\n");
        }

        void WgslEmitter::assemble(sgEmitOutput const& out, sgTextBuffer const& functions, sgTextBuffer const& body, char const* colorName) const
        {
            sgAppend(out.module, moduleHeader);
            sgAppend(out.module, uniforms);
            sgAppend(out.module, vertexStage);

            if (functions.size() != 0)
            {
                sgAppend(out.module, "// Node functions\n");
                out.module.append(functions.begin(), functions.end());
                sgAppend(out.module, "\n\n");
            }

            sgAppend(out.module, fragmentBegin);
            sgAppend(out.module, "  let uv = input.uv;\n\n");
            out.module.append(body.begin(), body.end());
            sgFormatTo(out.module, "\n  return {};\n}}\n", colorName);
        }

        void WgslEmitter::assembleFallback(sgEmitOutput const& out) const
        {
            sgAppend(out.module, fallbackHeader);
            sgAppend(out.module, uniforms);
            sgAppend(out.module, vertexStage);
            sgAppend(out.module, fragmentBegin);
            sgAppend(out.module, "  return vec4f(input.uv, 0.5 + 0.5 * sin(uniforms.time), 1.0);\n}\n");
        }
    } // namespace

    sgEmitter const& sgWgslEmitter() noexcept
    {
        static WgslEmitter const emitter;
        return emitter;
    }
} // namespace shadegraph
