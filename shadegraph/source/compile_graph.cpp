// shadegraph

#include "shadegraph/graph.hh"
#include "shadegraph/shader_compiler.hh"

namespace shadegraph {
    namespace {
        char const* endOf(std::string const& text) noexcept { return text.data() + text.size(); }
    } // namespace

    bool sgCompileGraph(sgShaderCompiler& compiler, sgGraph const& graph, sgCompileOptions const& options)
    {
        compiler.reset();

        for (auto const& nodePtr : graph.nodes())
        {
            compiler.beginNode(nodePtr->id(), nodePtr->definitionId().c_str(), endOf(nodePtr->definitionId()));

            for (sgSocket const& socket : nodePtr->inputs())
                compiler.addInputSocket(socket.id, socket.type, socket.defaultValue, socket.name.c_str(), endOf(socket.name));

            for (sgSocket const& socket : nodePtr->outputs())
                compiler.addOutputSocket(socket.id, socket.type, socket.name.c_str(), endOf(socket.name));

            for (sgNodeValue const& value : nodePtr->values())
                compiler.bindValue(value.value, value.name.c_str(), endOf(value.name));
        }

        for (sgConnection const& connection : graph.connections())
            compiler.addConnection(connection.fromNodeId, connection.fromSocketId, connection.toNodeId, connection.toSocketId);

        return compiler.compile(options);
    }
} // namespace shadegraph
