// shadegraph

#pragma once

#include "shadegraph/export.hh"
#include "shadegraph/types.hh"
#include "shadegraph/value.hh"

#include <cstdint>

namespace shadegraph {
    class sgAllocator;
    class sgGraph;
    class sgNodeCatalog;

    enum class sgCompileErrorCode
    {
        Unknown,
        NoSinkNode,
        UnknownDefinition,
        NodeNotFound,
        SocketNotFound,
        UnboundResource,
        MissingTemplate,
    };

    struct sgCompileError final
    {
        sgCompileErrorCode code = sgCompileErrorCode::Unknown;
        sgNodeId nodeId = sgInvalidNodeId;
    };

    struct sgCompileOptions
    {
        sgBackend backend = sgBackend::Wgsl;
        char const* sinkColorName = "finalColor";
    };

    struct sgShaderText
    {
        char const* text = "";
        uint32_t size = 0;

        bool empty() const noexcept { return size == 0; }
    };

    // WGSL produces a single module; GLSL produces a vertex/fragment pair.
    // Texts are NUL terminated and remain valid until the next reset().
    struct sgShaderDocument
    {
        sgBackend backend = sgBackend::Wgsl;
        sgShaderText module;
        sgShaderText vertex;
        sgShaderText fragment;
        bool fallback = false;
    };

    class sgShaderCompiler
    {
    public:
        virtual void reset() = 0;

        // Begin a node instance of a catalog definition. Beginning an id again
        // reopens that node: sockets added with an existing socket id replace
        // the earlier declaration instead of adding a second socket.
        virtual void beginNode(sgNodeId nodeId, char const* definitionId, char const* definitionIdEnd = nullptr) = 0;

        // add sockets to the current node, in declaration order
        virtual void addInputSocket(sgSocketId socketId, sgSocketType type, sgValue const& defaultValue, char const* name,
            char const* nameEnd = nullptr) = 0;
        virtual void addOutputSocket(sgSocketId socketId, sgSocketType type, char const* name, char const* nameEnd = nullptr) = 0;

        // store a value on the current node, used when the named input is unconnected
        virtual void bindValue(sgValue const& value, char const* name, char const* nameEnd = nullptr) = 0;

        // add a connection from an output socket to an input socket
        virtual void addConnection(sgNodeId fromNodeId, sgSocketId fromSocketId, sgNodeId toNodeId, sgSocketId toSocketId) = 0;

        // Resolves and emits the defined graph. Returns false if any diagnostic
        // was recorded; a complete document is produced either way.
        [[nodiscard]] virtual bool compile(sgCompileOptions const& options) = 0;

        [[nodiscard]] virtual uint32_t getErrorCount() const noexcept = 0;
        [[nodiscard]] virtual sgCompileError getError(uint32_t index) const noexcept = 0;

        // only valid after compile()
        [[nodiscard]] virtual sgShaderDocument document() const noexcept = 0;

    protected:
        ~sgShaderCompiler() = default;
    };

    [[nodiscard]] SG_API sgShaderCompiler* sgCreateShaderCompiler(sgAllocator& alloc, sgNodeCatalog const& catalog);
    SG_API void sgDestroyShaderCompiler(sgShaderCompiler* compiler);

    // resets the compiler, feeds it a snapshot of the graph and compiles it
    [[nodiscard]] SG_API bool sgCompileGraph(sgShaderCompiler& compiler, sgGraph const& graph, sgCompileOptions const& options);
} // namespace shadegraph
