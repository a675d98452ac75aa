// shadegraph

#include <shadegraph/alloc.hh>
#include <shadegraph/catalog.hh>
#include <shadegraph/edit.hh>
#include <shadegraph/graph.hh>
#include <shadegraph/shader_compiler.hh>

#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>

using namespace shadegraph;

namespace sample {
    constexpr sgSocketSpec uvOutputs[] = {{.name = "UV", .type = sgSocketType::Vector2}};

    constexpr sgSocketSpec separateInputs[] = {{.name = "Vector", .type = sgSocketType::Vector2}};
    constexpr sgSocketSpec separateOutputs[] = {{.name = "X", .type = sgSocketType::Scalar}, {.name = "Y", .type = sgSocketType::Scalar}};

    constexpr sgSocketSpec combineInputs[] = {
        {.name = "X", .type = sgSocketType::Scalar},
        {.name = "Y", .type = sgSocketType::Scalar},
        {.name = "Z", .type = sgSocketType::Scalar, .defaultValue = sgValue{0.5f}},
    };
    constexpr sgSocketSpec combineOutputs[] = {{.name = "Vector", .type = sgSocketType::Vector3}};

    constexpr sgSocketSpec multiplyInputs[] = {{.name = "A", .type = sgSocketType::Vector3}, {.name = "B", .type = sgSocketType::Color}};
    constexpr sgSocketSpec multiplyOutputs[] = {{.name = "Result", .type = sgSocketType::Vector3}};

    constexpr sgSocketSpec pickerOutputs[] = {{.name = "Color", .type = sgSocketType::Color}};

    constexpr sgSocketSpec outputInputs[] = {
        {.name = "Color", .type = sgSocketType::Color},
        {.name = "Alpha", .type = sgSocketType::Scalar, .defaultValue = sgValue{1.f}},
    };

    constexpr sgNodeDefinition definitions[] = {
        {
            .id = "input_uv",
            .name = "UV",
            .category = "Input",
            .outputs = uvOutputs,
            .outputCount = 1,
            .code =
                {
                    .wgsl = "fn node_{{id}}() -> vec2f {\n  return fragUv;\n}",
                    .glsl = "vec2 node_{{id}}() {\n  return vUv;\n}",
                },
        },
        {
            .id = "vec_separate2",
            .name = "Separate XY",
            .category = "Vector",
            .inputs = separateInputs,
            .inputCount = 1,
            .outputs = separateOutputs,
            .outputCount = 2,
            .code =
                {
                    .wgsl = "fn node_{{id}}_x(v: vec2f) -> f32 {\n  return v.x;\n}\n\nfn node_{{id}}_y(v: vec2f) -> f32 {\n  return v.y;\n}",
                    .glsl = "float node_{{id}}_x(vec2 v) {\n  return v.x;\n}\n\nfloat node_{{id}}_y(vec2 v) {\n  return v.y;\n}",
                },
        },
        {
            .id = "vec_combine3",
            .name = "Combine XYZ",
            .category = "Vector",
            .inputs = combineInputs,
            .inputCount = 3,
            .outputs = combineOutputs,
            .outputCount = 1,
            .code =
                {
                    .wgsl = "fn node_{{id}}(x: f32, y: f32, z: f32) -> vec3f {\n  return vec3f(x, y, z);\n}",
                    .glsl = "vec3 node_{{id}}(float x, float y, float z) {\n  return vec3(x, y, z);\n}",
                },
        },
        {
            .id = "vec_multiply3",
            .name = "Multiply",
            .category = "Math",
            .inputs = multiplyInputs,
            .inputCount = 2,
            .outputs = multiplyOutputs,
            .outputCount = 1,
            .code =
                {
                    .wgsl = "fn node_{{id}}(a: vec3f, b: vec3f) -> vec3f {\n  return a * b;\n}",
                    .glsl = "vec3 node_{{id}}(vec3 a, vec3 b) {\n  return a * b;\n}",
                },
        },
        {
            .id = "color_picker",
            .name = "Color",
            .category = "Input",
            .kind = sgNodeKind::ColorPicker,
            .outputs = pickerOutputs,
            .outputCount = 1,
        },
        {
            .id = "output_color",
            .name = "Output",
            .category = "Output",
            .kind = sgNodeKind::Output,
            .inputs = outputInputs,
            .inputCount = 2,
        },
    };

    class App
    {
    public:
        int run(int argc, char** argv);

    private:
        bool createCatalog();
        bool createGraph();
        bool compileGraph(sgBackend backend);

        sgDefaultAllocator alloc_;
        std::unique_ptr<sgDefinitionCatalog, decltype(&sgDestroyDefinitionCatalog)> catalog_ = {nullptr, &sgDestroyDefinitionCatalog};
        std::unique_ptr<sgShaderCompiler, decltype(&sgDestroyShaderCompiler)> compiler_ = {nullptr, &sgDestroyShaderCompiler};
        sgGraph graph_;
    };

    int App::run(int argc, char** argv)
    {
        spdlog::set_level(argc > 1 && std::strcmp(argv[1], "-v") == 0 ? spdlog::level::debug : spdlog::level::info);

        if (!createCatalog() || !createGraph())
            return 1;

        compiler_.reset(sgCreateShaderCompiler(alloc_, *catalog_));

        bool const wgsl = compileGraph(sgBackend::Wgsl);
        bool const glsl = compileGraph(sgBackend::Glsl);
        return wgsl && glsl ? 0 : 1;
    }

    bool App::createCatalog()
    {
        catalog_.reset(sgCreateDefinitionCatalog(alloc_));

        for (sgNodeDefinition const& definition : definitions)
        {
            if (catalog_->registerDefinition(definition) != sgCatalogError::None)
            {
                spdlog::error("Failed to register '{}'", definition.id);
                return false;
            }
        }

        spdlog::info("Registered {} node definitions", catalog_->definitionCount());
        return true;
    }

    bool App::createGraph()
    {
        sgNode* const uv = sgCreateNode(graph_, *catalog_, "input_uv", {.x = 0.f, .y = 0.f});
        sgNode* const separate = sgCreateNode(graph_, *catalog_, "vec_separate2", {.x = 200.f, .y = 0.f});
        sgNode* const combine = sgCreateNode(graph_, *catalog_, "vec_combine3", {.x = 400.f, .y = 0.f});
        sgNode* const tint = sgCreateNode(graph_, *catalog_, "color_picker", {.x = 400.f, .y = 200.f});
        sgNode* const multiply = sgCreateNode(graph_, *catalog_, "vec_multiply3", {.x = 600.f, .y = 100.f});
        sgNode* const output = sgCreateNode(graph_, *catalog_, "output_color", {.x = 800.f, .y = 100.f});
        if (uv == nullptr || separate == nullptr || combine == nullptr || tint == nullptr || multiply == nullptr || output == nullptr)
            return false;

        if (!sgSetNodeValue(graph_, tint->id(), sgColorValueName, sgValue{1.f, 0.6f, 0.2f}))
            return false;

        struct Link
        {
            sgSocketId from;
            sgSocketId to;
        };
        Link const links[] = {
            {uv->outputs()[0].id, separate->inputs()[0].id},
            {separate->outputs()[0].id, combine->inputs()[0].id},
            {separate->outputs()[1].id, combine->inputs()[1].id},
            {combine->outputs()[0].id, multiply->inputs()[0].id},
            {tint->outputs()[0].id, multiply->inputs()[1].id},
            {multiply->outputs()[0].id, output->inputs()[0].id},
        };

        for (Link const& link : links)
        {
            sgGraphError const error = sgConnect(graph_, link.from, link.to);
            if (error != sgGraphError::None)
            {
                spdlog::error("Connecting socket {} to {} failed ({})", link.from.value(), link.to.value(), static_cast<int>(error));
                return false;
            }
        }

        spdlog::info("Built graph with {} nodes and {} connections", graph_.nodes().size(), graph_.connections().size());
        return true;
    }

    bool App::compileGraph(sgBackend backend)
    {
        char const* const name = backend == sgBackend::Wgsl ? "WGSL" : "GLSL";
        spdlog::info("Compiling {}...", name);

        bool const result = sgCompileGraph(*compiler_, graph_, {.backend = backend});
        spdlog::info("Compile {}", result ? "succeeded" : "failed");

        for (uint32_t index = 0, count = compiler_->getErrorCount(); index != count; ++index)
        {
            sgCompileError const error = compiler_->getError(index);
            spdlog::warn("Error {} on node {}", static_cast<int>(error.code), error.nodeId.value());
        }

        sgShaderDocument const document = compiler_->document();
        if (backend == sgBackend::Wgsl)
        {
            spdlog::info("Module:\n{}", document.module.text);
        }
        else
        {
            spdlog::info("Vertex:\n{}", document.vertex.text);
            spdlog::info("Fragment:\n{}", document.fragment.text);
        }
        spdlog::info("Draw {} vertices", sgFullscreenVertexCount);

        return result;
    }
} // namespace sample

int main(int argc, char** argv)
{
    sample::App app;
    return app.run(argc, argv);
}
