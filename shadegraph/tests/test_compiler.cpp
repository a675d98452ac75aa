// shadegraph

#include <catch2/catch_test_macros.hpp>

#include "shadegraph/catalog.hh"
#include "shadegraph/edit.hh"
#include "shadegraph/graph.hh"
#include "shadegraph/shader_compiler.hh"

#include "leak_alloc.hh"
#include "test_catalog.hh"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>
#include <string>

using namespace shadegraph;

namespace {
    std::string str(sgShaderText const& text) { return std::string(text.text, text.size); }

    size_t countOf(std::string const& haystack, std::string const& needle)
    {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size()))
            ++count;
        return count;
    }

    bool endsWith(std::string const& text, std::string const& suffix)
    {
        return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // two function definitions sharing a helper template with no placeholder
    class SharedHelperCatalog final : public sgNodeCatalog
    {
    public:
        bool lookupDefinition(char const* id, char const* idEnd, sgNodeDefinition& out_definition) const noexcept override
        {
            if (id == nullptr)
                return false;

            std::string const name(id, idEnd != nullptr ? idEnd : id + std::strlen(id));
            for (sgNodeDefinition const& definition : definitions)
            {
                if (name == definition.id)
                {
                    out_definition = definition;
                    return true;
                }
            }
            return false;
        }

    private:
        static constexpr char helper[] = "fn tint_helper() -> f32 { return 0.5; }";

        static constexpr sgSocketSpec valueOutputs[] = {{.name = "Out", .type = sgSocketType::Scalar}};
        static constexpr sgSocketSpec sinkInputs[] = {
            {.name = "Color", .type = sgSocketType::Color},
            {.name = "Alpha", .type = sgSocketType::Scalar},
            {.name = "Mask", .type = sgSocketType::Scalar},
        };

        static constexpr sgNodeDefinition definitions[] = {
            {.id = "tint_a", .outputs = valueOutputs, .outputCount = 1, .code = {.wgsl = helper}},
            {.id = "tint_b", .outputs = valueOutputs, .outputCount = 1, .code = {.wgsl = helper}},
            {.id = "sink", .kind = sgNodeKind::Output, .inputs = sinkInputs, .inputCount = 3},
        };
    };

    struct Chain
    {
        sgNode* uv = nullptr;
        sgNode* separate = nullptr;
        sgNode* combine = nullptr;
        sgNode* output = nullptr;
    };

    // UV -> separate XY -> combine XYZ (Z unconnected) -> output color
    Chain buildChain(sgGraph& graph, sgNodeCatalog const& catalog)
    {
        Chain chain;
        chain.uv = sgCreateNode(graph, catalog, "input_uv", {.x = 0.f, .y = 0.f});
        chain.separate = sgCreateNode(graph, catalog, "vec_separate2", {.x = 200.f, .y = 0.f});
        chain.combine = sgCreateNode(graph, catalog, "vec_combine3", {.x = 400.f, .y = 0.f});
        chain.output = sgCreateNode(graph, catalog, "output_color", {.x = 600.f, .y = 0.f});

        REQUIRE(chain.uv != nullptr);
        REQUIRE(chain.separate != nullptr);
        REQUIRE(chain.combine != nullptr);
        REQUIRE(chain.output != nullptr);

        REQUIRE(sgConnect(graph, chain.uv->outputs()[0].id, chain.separate->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, chain.separate->outputs()[0].id, chain.combine->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, chain.separate->outputs()[1].id, chain.combine->inputs()[1].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, chain.combine->outputs()[0].id, chain.output->inputs()[0].id) == sgGraphError::None);
        return chain;
    }
} // namespace

TEST_CASE("Shader compiler", "[compiler]")
{
    test::LeakTestAllocator alloc;
    sgDefinitionCatalog* catalog = sgCreateDefinitionCatalog(alloc);
    test::registerTestDefinitions(*catalog);

    sgShaderCompiler* compiler = sgCreateShaderCompiler(alloc, *catalog);
    REQUIRE(compiler != nullptr);

    sgGraph graph;

    SECTION("WGSL module")
    {
        Chain const chain = buildChain(graph, *catalog);
        CHECK(chain.output->id() == sgNodeId{12});

        CHECK(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Wgsl}));
        CHECK(compiler->getErrorCount() == 0);

        sgShaderDocument const document = compiler->document();
        CHECK(document.backend == sgBackend::Wgsl);
        CHECK_FALSE(document.fallback);
        CHECK(document.vertex.empty());
        CHECK(document.fragment.empty());

        std::string const module = str(document.module);
        CHECK(module.rfind("// Generated WGSL Shader\n", 0) == 0);
        CHECK(module.find("@group(0) @binding(0) var<uniform> uniforms: Uniforms;") != std::string::npos);
        CHECK(module.find("fn vertexMain(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput") != std::string::npos);
        CHECK(module.find("array<vec2f, 3>") != std::string::npos);
        CHECK(module.find("output.uv = pos[vertexIndex] * 0.5 + 0.5;") != std::string::npos);

        // declarations follow discovery order from the sink
        CHECK(module.find("// Node functions\n"
                          "fn node_7(x: f32, y: f32, z: f32) -> vec3f { return vec3f(x, y, z); }\n\n"
                          "fn node_3_x(v: vec2f) -> f32 { return v.x; }\nfn node_3_y(v: vec2f) -> f32 { return v.y; }\n\n"
                          "fn node_1() -> vec2f {\n  return fragUv;\n}\n\n"
                          "@fragment\n") != std::string::npos);

        CHECK(endsWith(module,
            "fn fragmentMain(input: VertexOutput) -> @location(0) vec4f {\n"
            "  let uv = input.uv;\n"
            "\n"
            "  let v1: vec2f = node_1();\n"
            "  let v2: f32 = node_3_x(v1);\n"
            "  let v3: f32 = node_3_y(v1);\n"
            "  let v4: vec3f = node_7(v2, v3, 0.0);\n"
            "  let finalColor = vec4f(v4, 1.0);\n"
            "\n"
            "  return finalColor;\n"
            "}\n"));

        CHECK(document.module.text[document.module.size] == '\0');
    }

    SECTION("GLSL bundle")
    {
        buildChain(graph, *catalog);

        CHECK(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Glsl}));

        sgShaderDocument const document = compiler->document();
        CHECK(document.backend == sgBackend::Glsl);
        CHECK(document.module.empty());

        std::string const vertex = str(document.vertex);
        CHECK(vertex.rfind("#version 300 es\nprecision highp float;\n\nout vec2 vUv;\n", 0) == 0);
        CHECK(vertex.find("positions[gl_VertexID]") != std::string::npos);
        CHECK(vertex.find("vUv = pos * 0.5 + 0.5;") != std::string::npos);

        std::string const fragment = str(document.fragment);
        CHECK(fragment.rfind("#version 300 es\nprecision highp float;\n\n"
                             "uniform float u_time;\nuniform vec2 u_resolution;\nuniform vec2 u_mouse;\n\n"
                             "in vec2 vUv;\nout vec4 fragColor;\n\n"
                             "// Node functions\n"
                             "vec3 node_7(float x, float y, float z) { return vec3(x, y, z); }\n\n",
                  0) == 0);
        CHECK(fragment.find("vec2 node_1() {\n  return vUv;\n}\n\nvoid main() {\n") != std::string::npos);

        CHECK(endsWith(fragment,
            "void main() {\n"
            "  vec2 uv = vUv;\n"
            "\n"
            "  vec2 v1 = node_1();\n"
            "  float v2 = node_3_x(v1);\n"
            "  float v3 = node_3_y(v1);\n"
            "  vec3 v4 = node_7(v2, v3, 0.0);\n"
            "  vec4 finalColor = vec4(v4, 1.0);\n"
            "\n"
            "  fragColor = finalColor;\n"
            "}\n"));
    }

    SECTION("Deterministic output")
    {
        buildChain(graph, *catalog);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const first = str(compiler->document().module);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        CHECK(str(compiler->document().module) == first);

        sgGraph copy;
        buildChain(copy, *catalog);
        REQUIRE(sgCompileGraph(*compiler, copy, {}));
        CHECK(str(compiler->document().module) == first);
    }

    SECTION("Fallback without an output node")
    {
        sgCreateNode(graph, *catalog, "math_add", {});

        SECTION("WGSL")
        {
            CHECK_FALSE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Wgsl}));
            REQUIRE(compiler->getErrorCount() == 1);
            CHECK(compiler->getError(0).code == sgCompileErrorCode::NoSinkNode);

            sgShaderDocument const document = compiler->document();
            CHECK(document.fallback);

            std::string const module = str(document.module);
            CHECK(module.rfind("// Default WGSL Shader\n", 0) == 0);
            CHECK(module.find("fn vertexMain") != std::string::npos);
            CHECK(module.find("return vec4f(input.uv, 0.5 + 0.5 * sin(uniforms.time), 1.0);") != std::string::npos);
            CHECK(module.find("node_") == std::string::npos);
        }

        SECTION("GLSL")
        {
            CHECK_FALSE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Glsl}));

            sgShaderDocument const document = compiler->document();
            CHECK(document.fallback);
            CHECK(str(document.vertex).find("gl_VertexID") != std::string::npos);
            CHECK(str(document.fragment).find("fragColor = vec4(vUv, 0.5 + 0.5 * sin(u_time), 1.0);") != std::string::npos);
        }
    }

    SECTION("Empty graph")
    {
        CHECK_FALSE(sgCompileGraph(*compiler, graph, {}));
        CHECK(compiler->document().fallback);
        CHECK_FALSE(compiler->document().module.empty());
    }

    SECTION("Shared sources are emitted once")
    {
        sgNode* uv = sgCreateNode(graph, *catalog, "input_uv", {});
        sgNode* separate = sgCreateNode(graph, *catalog, "vec_separate2", {});
        sgNode* add = sgCreateNode(graph, *catalog, "math_add", {});
        sgNode* combine = sgCreateNode(graph, *catalog, "vec_combine3", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});

        REQUIRE(sgConnect(graph, uv->outputs()[0].id, separate->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, separate->outputs()[0].id, add->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, separate->outputs()[0].id, add->inputs()[1].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, add->outputs()[0].id, combine->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, separate->outputs()[1].id, combine->inputs()[1].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, combine->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const module = str(compiler->document().module);

        CHECK(countOf(module, "fn node_1(") == 1);
        CHECK(countOf(module, "fn node_3_x(") == 1);
        CHECK(countOf(module, "fn node_3_y(") == 1);
        CHECK(countOf(module, "= node_1()") == 1);
        CHECK(countOf(module, "= node_3_x(v1);") == 1);
        CHECK(countOf(module, "= node_3_y(v1);") == 1);
        CHECK(module.find("  let v4: f32 = node_7(v2, v2);\n") != std::string::npos);
        CHECK(module.find("  let v5: vec3f = node_11(v4, v3, 0.0);\n") != std::string::npos);
        CHECK(module.find("  let finalColor = vec4f(v5, 1.0);\n") != std::string::npos);
    }

    SECTION("Color picker")
    {
        sgNode* picker = sgCreateNode(graph, *catalog, "color_picker", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, picker->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        SECTION("Defaults to white")
        {
            REQUIRE(sgCompileGraph(*compiler, graph, {}));
            std::string const module = str(compiler->document().module);
            CHECK(module.find("  let v1: vec3f = vec3f(1.0000, 1.0000, 1.0000);\n  let finalColor = vec4f(v1, 1.0);\n") != std::string::npos);
            CHECK(module.find("// Node functions") == std::string::npos);
        }

        SECTION("Stored color")
        {
            REQUIRE(sgSetNodeValue(graph, picker->id(), sgColorValueName, sgValue{1.f, 0.5f, 0.25f}));
            REQUIRE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Glsl}));
            CHECK(str(compiler->document().fragment).find("  vec3 v1 = vec3(1.0000, 0.5000, 0.2500);\n") != std::string::npos);
        }

        SECTION("Two component color")
        {
            REQUIRE(sgSetNodeValue(graph, picker->id(), sgColorValueName, sgValue{0.f, 1.f}));
            REQUIRE(sgCompileGraph(*compiler, graph, {}));
            CHECK(str(compiler->document().module).find("vec3f(0.0000, 1.0000, 0.0000)") != std::string::npos);
        }
    }

    SECTION("Unconnected inputs")
    {
        sgNode* add = sgCreateNode(graph, *catalog, "math_add", {});
        sgNode* combine = sgCreateNode(graph, *catalog, "vec_combine3", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, add->outputs()[0].id, combine->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, combine->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        SECTION("Defaults and zero literals")
        {
            REQUIRE(sgCompileGraph(*compiler, graph, {}));
            CHECK(str(compiler->document().module).find("  let v1: f32 = node_1(0.0, 1.0);\n") != std::string::npos);
        }

        SECTION("Stored values win over defaults")
        {
            REQUIRE(sgSetNodeValue(graph, add->id(), "A", 0.25f));
            REQUIRE(sgSetNodeValue(graph, add->id(), "B", 3.f));
            REQUIRE(sgSetNodeValue(graph, combine->id(), "Z", 2.f));
            REQUIRE(sgCompileGraph(*compiler, graph, {}));

            std::string const module = str(compiler->document().module);
            CHECK(module.find("  let v1: f32 = node_1(0.25, 3.0);\n") != std::string::npos);
            CHECK(module.find("  let v2: vec3f = node_5(v1, 0.0, 2.0);\n") != std::string::npos);
        }

        SECTION("Connected alpha")
        {
            sgNode* alpha = sgCreateNode(graph, *catalog, "math_add", {});
            REQUIRE(sgConnect(graph, alpha->outputs()[0].id, output->inputs()[1].id) == sgGraphError::None);
            REQUIRE(sgCompileGraph(*compiler, graph, {}));

            std::string const module = str(compiler->document().module);
            CHECK(module.find("  let v3: f32 = node_15(0.0, 1.0);\n  let finalColor = vec4f(v2, v3);\n") != std::string::npos);
        }

        SECTION("Stored alpha")
        {
            REQUIRE(sgSetNodeValue(graph, output->id(), "Alpha", 0.5f));
            REQUIRE(sgCompileGraph(*compiler, graph, {}));
            CHECK(str(compiler->document().module).find("let finalColor = vec4f(v2, 0.5);") != std::string::npos);
        }
    }

    SECTION("Unconnected sink")
    {
        sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Glsl}));

        std::string const fragment = str(compiler->document().fragment);
        CHECK(fragment.find("  vec4 finalColor = vec4(vec3(0.0, 0.0, 0.0), 1.0);\n") != std::string::npos);
        CHECK(fragment.find("// Node functions") == std::string::npos);
    }

    SECTION("First output node is the sink")
    {
        sgNode* first = sgCreateNode(graph, *catalog, "output_color", {});
        sgNode* picker = sgCreateNode(graph, *catalog, "color_picker", {});
        sgNode* second = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, picker->outputs()[0].id, second->inputs()[0].id) == sgGraphError::None);
        REQUIRE(first != nullptr);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const module = str(compiler->document().module);
        CHECK(module.find("let finalColor = vec4f(vec3f(0.0, 0.0, 0.0), 1.0);") != std::string::npos);
        CHECK(module.find("1.0000") == std::string::npos);
    }

    SECTION("Declarations cover every node of a used definition")
    {
        Chain const chain = buildChain(graph, *catalog);
        sgNode* spare = sgCreateNode(graph, *catalog, "vec_separate2", {});
        sgCreateNode(graph, *catalog, "math_add", {});

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const module = str(compiler->document().module);

        std::string const spareName = "fn node_" + std::to_string(spare->id().value()) + "_x(";
        CHECK(module.find(spareName) != std::string::npos);
        CHECK(module.find(spareName) > module.find("fn node_3_x("));
        CHECK(module.find("a + b") == std::string::npos);
        CHECK(countOf(module, "= node_" + std::to_string(spare->id().value())) == 0);
        CHECK(chain.output != nullptr);
    }

    SECTION("Multi-output names are lowercased")
    {
        sgSocketSpec const inputs[] = {{.name = "Value", .type = sgSocketType::Scalar}};
        sgSocketSpec const outputs[] = {{.name = "Sin", .type = sgSocketType::Scalar}, {.name = "COS", .type = sgSocketType::Scalar}};
        REQUIRE(catalog->registerDefinition(sgNodeDefinition{
                    .id = "math_sincos",
                    .inputs = inputs,
                    .inputCount = 1,
                    .outputs = outputs,
                    .outputCount = 2,
                    .code = {.wgsl = "fn node_{{id}}_sin(v: f32) -> f32 { return sin(v); }\nfn node_{{id}}_cos(v: f32) -> f32 { return cos(v); }"},
                }) == sgCatalogError::None);

        sgNode* sincos = sgCreateNode(graph, *catalog, "math_sincos", {});
        sgNode* combine = sgCreateNode(graph, *catalog, "vec_combine3", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, sincos->outputs()[1].id, combine->inputs()[2].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, combine->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const module = str(compiler->document().module);
        CHECK(module.find("  let v1: f32 = node_1_sin(0.0);\n  let v2: f32 = node_1_cos(0.0);\n") != std::string::npos);
        CHECK(module.find("  let v3: vec3f = node_5(0.0, 0.0, v2);\n") != std::string::npos);
    }

    SECTION("Cycles terminate")
    {
        sgNode* first = sgCreateNode(graph, *catalog, "math_add", {});
        sgNode* second = sgCreateNode(graph, *catalog, "math_add", {});
        sgNode* combine = sgCreateNode(graph, *catalog, "vec_combine3", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, first->outputs()[0].id, second->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, second->outputs()[0].id, first->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, second->outputs()[0].id, combine->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, combine->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        REQUIRE(sgCompileGraph(*compiler, graph, {}));
        std::string const module = str(compiler->document().module);
        CHECK(module.find("  let v1: f32 = node_1(0.0, 1.0);\n  let v2: f32 = node_5(v1, 1.0);\n") != std::string::npos);
    }

    SECTION("Custom sink color name")
    {
        buildChain(graph, *catalog);
        REQUIRE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Wgsl, .sinkColorName = "outColor"}));

        std::string const module = str(compiler->document().module);
        CHECK(module.find("  let outColor = vec4f(v4, 1.0);\n") != std::string::npos);
        CHECK(endsWith(module, "  return outColor;\n}\n"));
    }

    SECTION("Unbound resources")
    {
        sgNode* texture = sgCreateNode(graph, *catalog, "texture_sample", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, texture->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        CHECK_FALSE(sgCompileGraph(*compiler, graph, {}));
        REQUIRE(compiler->getErrorCount() == 2);
        CHECK(compiler->getError(0).code == sgCompileErrorCode::UnboundResource);
        CHECK(compiler->getError(0).nodeId == texture->id());
        CHECK(compiler->getError(1).code == sgCompileErrorCode::UnboundResource);

        sgShaderDocument const document = compiler->document();
        CHECK_FALSE(document.fallback);
        CHECK(str(document.module).find("  let v1: vec3f = node_1(0.0, 0.0, vec2f(0.0, 0.0));\n") != std::string::npos);
    }

    SECTION("Missing backend template")
    {
        sgSocketSpec const outputs[] = {{.name = "Value", .type = sgSocketType::Scalar}};
        REQUIRE(catalog->registerDefinition(sgNodeDefinition{
                    .id = "wgsl_only",
                    .outputs = outputs,
                    .outputCount = 1,
                    .code = {.wgsl = "fn node_{{id}}() -> f32 { return 0.5; }"},
                }) == sgCatalogError::None);

        sgNode* source = sgCreateNode(graph, *catalog, "wgsl_only", {});
        sgNode* combine = sgCreateNode(graph, *catalog, "vec_combine3", {});
        sgNode* output = sgCreateNode(graph, *catalog, "output_color", {});
        REQUIRE(sgConnect(graph, source->outputs()[0].id, combine->inputs()[0].id) == sgGraphError::None);
        REQUIRE(sgConnect(graph, combine->outputs()[0].id, output->inputs()[0].id) == sgGraphError::None);

        REQUIRE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Wgsl}));

        CHECK_FALSE(sgCompileGraph(*compiler, graph, {.backend = sgBackend::Glsl}));
        REQUIRE(compiler->getErrorCount() == 1);
        CHECK(compiler->getError(0).code == sgCompileErrorCode::MissingTemplate);
        CHECK(compiler->getError(0).nodeId == source->id());
        CHECK(str(compiler->document().fragment).find("  vec3 v1 = node_3(0.0, 0.0, 0.0);\n") != std::string::npos);
    }

    SECTION("Builder input")
    {
        constexpr sgNodeId mystery{10};
        constexpr sgNodeId combine{20};
        constexpr sgNodeId output{30};

        compiler->beginNode(mystery, "mystery_node");
        compiler->addOutputSocket(sgSocketId{11}, sgSocketType::Scalar, "Out");

        compiler->beginNode(combine, "vec_combine3");
        compiler->addInputSocket(sgSocketId{21}, sgSocketType::Scalar, {}, "X");
        compiler->addInputSocket(sgSocketId{22}, sgSocketType::Scalar, {}, "Y");
        compiler->addInputSocket(sgSocketId{23}, sgSocketType::Scalar, {}, "Z");
        compiler->addOutputSocket(sgSocketId{24}, sgSocketType::Vector3, "Vector");
        compiler->bindValue(0.5f, "Y");

        compiler->beginNode(output, "output_color");
        compiler->addInputSocket(sgSocketId{31}, sgSocketType::Color, {}, "Color");
        compiler->addInputSocket(sgSocketId{32}, sgSocketType::Scalar, 1.f, "Alpha");

        compiler->addConnection(mystery, sgSocketId{11}, combine, sgSocketId{21});
        compiler->addConnection(combine, sgSocketId{24}, output, sgSocketId{31});

        SECTION("Unknown definitions feed zero literals")
        {
            CHECK_FALSE(compiler->compile({}));
            REQUIRE(compiler->getErrorCount() == 1);
            CHECK(compiler->getError(0).code == sgCompileErrorCode::UnknownDefinition);
            CHECK(compiler->getError(0).nodeId == mystery);
            CHECK(str(compiler->document().module).find("  let v1: vec3f = node_20(0.0, 0.5, 0.0);\n") != std::string::npos);
        }

        SECTION("Rebinding replaces the value")
        {
            compiler->beginNode(combine, "vec_combine3");
            compiler->bindValue(0.75f, "Y");

            CHECK_FALSE(compiler->compile({}));
            CHECK(str(compiler->document().module).find("node_20(0.0, 0.75, 0.0)") != std::string::npos);
        }

        SECTION("Broken connections")
        {
            compiler->addConnection(sgNodeId{99}, sgSocketId{11}, combine, sgSocketId{22});
            compiler->addConnection(mystery, sgSocketId{98}, combine, sgSocketId{22});
            compiler->addConnection(mystery, sgSocketId{11}, combine, sgSocketId{97});

            CHECK_FALSE(compiler->compile({}));
            REQUIRE(compiler->getErrorCount() == 4);
            CHECK(compiler->getError(1).code == sgCompileErrorCode::NodeNotFound);
            CHECK(compiler->getError(1).nodeId == sgNodeId{99});
            CHECK(compiler->getError(2).code == sgCompileErrorCode::SocketNotFound);
            CHECK(compiler->getError(2).nodeId == mystery);
            CHECK(compiler->getError(3).code == sgCompileErrorCode::SocketNotFound);
            CHECK(compiler->getError(3).nodeId == combine);
        }

        SECTION("Reopening redeclares sockets by id")
        {
            compiler->beginNode(combine, "vec_combine3");
            compiler->addInputSocket(sgSocketId{23}, sgSocketType::Scalar, 2.f, "Z");
            compiler->addOutputSocket(sgSocketId{24}, sgSocketType::Vector3, "Vector");

            CHECK_FALSE(compiler->compile({}));
            CHECK(compiler->getErrorCount() == 1);

            std::string const module = str(compiler->document().module);
            CHECK(module.find("  let v1: vec3f = node_20(0.0, 0.5, 2.0);\n") != std::string::npos);
            CHECK(countOf(module, "= node_20(") == 1);
        }

        SECTION("Reset clears the previous graph")
        {
            compiler->reset();

            compiler->beginNode(output, "output_color");
            compiler->addInputSocket(sgSocketId{31}, sgSocketType::Color, sgValue{1.f, 0.f, 0.f}, "Color");

            CHECK(compiler->compile({}));
            CHECK(compiler->getErrorCount() == 0);
            CHECK(str(compiler->document().module).find("let finalColor = vec4f(vec3f(1.0, 0.0, 0.0), 1.0);") != std::string::npos);
        }
    }

    CHECK(sgFullscreenVertexCount == 3);

    sgDestroyShaderCompiler(compiler);
    sgDestroyDefinitionCatalog(catalog);
}

TEST_CASE("Identical declarations", "[compiler]")
{
    test::LeakTestAllocator alloc;
    SharedHelperCatalog catalog;

    sgShaderCompiler* compiler = sgCreateShaderCompiler(alloc, catalog);
    REQUIRE(compiler != nullptr);

    compiler->beginNode(sgNodeId{1}, "tint_a");
    compiler->addOutputSocket(sgSocketId{2}, sgSocketType::Scalar, "Out");

    compiler->beginNode(sgNodeId{3}, "tint_b");
    compiler->addOutputSocket(sgSocketId{4}, sgSocketType::Scalar, "Out");

    // not reachable from the sink, but still instantiated
    compiler->beginNode(sgNodeId{5}, "tint_a");
    compiler->addOutputSocket(sgSocketId{6}, sgSocketType::Scalar, "Out");

    compiler->beginNode(sgNodeId{7}, "sink");
    compiler->addInputSocket(sgSocketId{8}, sgSocketType::Color, {}, "Color");
    compiler->addInputSocket(sgSocketId{9}, sgSocketType::Scalar, {}, "Alpha");
    compiler->addInputSocket(sgSocketId{10}, sgSocketType::Scalar, {}, "Mask");

    compiler->addConnection(sgNodeId{1}, sgSocketId{2}, sgNodeId{7}, sgSocketId{9});
    compiler->addConnection(sgNodeId{3}, sgSocketId{4}, sgNodeId{7}, sgSocketId{10});

    CHECK(compiler->compile({}));
    CHECK(compiler->getErrorCount() == 0);

    std::string const module = str(compiler->document().module);
    CHECK(countOf(module, "fn tint_helper()") == 1);
    CHECK(module.find("// Node functions\nfn tint_helper() -> f32 { return 0.5; }\n\n") != std::string::npos);
    CHECK(module.find("  let v1: f32 = node_1();\n  let v2: f32 = node_3();\n") != std::string::npos);
    CHECK(module.find("  let finalColor = vec4f(vec3f(0.0, 0.0, 0.0), v1);\n") != std::string::npos);

    sgDestroyShaderCompiler(compiler);
}

TEST_CASE("Diagnostics stay below info level", "[compiler]")
{
    test::LeakTestAllocator alloc;
    sgDefinitionCatalog* catalog = sgCreateDefinitionCatalog(alloc);
    test::registerTestDefinitions(*catalog);

    sgShaderCompiler* compiler = sgCreateShaderCompiler(alloc, *catalog);
    REQUIRE(compiler != nullptr);

    auto const sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto const capture = std::make_shared<spdlog::logger>("capture", sink);
    capture->set_level(spdlog::level::info);

    auto const previous = spdlog::default_logger();
    spdlog::set_default_logger(capture);

    compiler->beginNode(sgNodeId{1}, "mystery_node");
    compiler->addOutputSocket(sgSocketId{2}, sgSocketType::Scalar, "Out");
    bool const compiled = compiler->compile({});

    spdlog::set_default_logger(previous);

    CHECK_FALSE(compiled);
    CHECK(compiler->getErrorCount() == 2);
    CHECK(sink->last_raw().empty());

    sgDestroyShaderCompiler(compiler);
    sgDestroyDefinitionCatalog(catalog);
}
