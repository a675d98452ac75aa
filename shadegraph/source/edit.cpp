// shadegraph

#include "shadegraph/edit.hh"
#include "shadegraph/catalog.hh"

#include <spdlog/spdlog.h>

namespace shadegraph {
    namespace {
        // host catalogs are not required to validate their specs
        std::string nameOf(sgSocketSpec const& spec) { return spec.name != nullptr ? std::string(spec.name) : std::string(); }
    } // namespace

    bool sgIsTypeCompatible(sgSocketType from, sgSocketType to) noexcept
    {
        return from == to || (sgIsVector3(from) && sgIsVector3(to));
    }

    bool sgCanConnect(sgSocket const& first, sgSocket const& second) noexcept
    {
        if (first.nodeId == second.nodeId || first.direction == second.direction)
            return false;

        sgSocket const& from = first.direction == sgSocketDirection::Output ? first : second;
        sgSocket const& to = first.direction == sgSocketDirection::Output ? second : first;
        return sgIsTypeCompatible(from.type, to.type);
    }

    sgNode* sgCreateNode(sgGraph& graph, sgNodeCatalog const& catalog, std::string_view definitionId, sgPosition position)
    {
        sgNodeDefinition definition;
        if (definitionId.empty() || !catalog.lookupDefinition(definitionId.data(), definitionId.data() + definitionId.size(), definition))
        {
            spdlog::warn("cannot create node: unknown definition '{}'", definitionId);
            return nullptr;
        }

        sgNode& node = graph.addNode(std::string(definitionId), position);

        for (uint32_t index = 0; index != definition.inputCount; ++index)
        {
            sgSocketSpec const& spec = definition.inputs[index];
            node.addSocket(graph.allocateSocketId(), nameOf(spec), spec.type, sgSocketDirection::Input, spec.defaultValue);
        }

        for (uint32_t index = 0; index != definition.outputCount; ++index)
        {
            sgSocketSpec const& spec = definition.outputs[index];
            node.addSocket(graph.allocateSocketId(), nameOf(spec), spec.type, sgSocketDirection::Output, spec.defaultValue);
        }

        return &node;
    }

    sgNode* sgCloneNode(sgGraph& graph, sgNodeId nodeId, sgPosition offset)
    {
        sgNode const* const source = graph.findNode(nodeId);
        if (source == nullptr)
            return nullptr;

        sgPosition const position{.x = source->position().x + offset.x, .y = source->position().y + offset.y};
        sgNode& clone = graph.addNode(source->definitionId(), position);

        // nodes are heap allocated, so source survives addNode
        for (sgSocket const& socket : source->inputs())
            clone.addSocket(graph.allocateSocketId(), socket.name, socket.type, socket.direction, socket.defaultValue);
        for (sgSocket const& socket : source->outputs())
            clone.addSocket(graph.allocateSocketId(), socket.name, socket.type, socket.direction, socket.defaultValue);

        for (sgNodeValue const& value : source->values())
            clone.setValue(value.name, value.value);

        return &clone;
    }

    bool sgDeleteNode(sgGraph& graph, sgNodeId nodeId)
    {
        if (graph.findNode(nodeId) == nullptr)
            return false;

        std::vector<sgConnectionId> doomed;
        for (sgConnection const* connection : graph.connectionsTouching(nodeId))
            doomed.push_back(connection->id);

        for (sgConnectionId const connectionId : doomed)
            graph.removeConnection(connectionId);

        return graph.removeNode(nodeId);
    }

    sgGraphError sgConnect(sgGraph& graph, sgSocketId first, sgSocketId second, sgConnectionId* out_connection, uint32_t* out_replaced)
    {
        if (out_connection != nullptr)
            *out_connection = sgInvalidConnectionId;
        if (out_replaced != nullptr)
            *out_replaced = 0;

        sgSocket const* const a = graph.findSocket(first);
        sgSocket const* const b = graph.findSocket(second);
        if (a == nullptr || b == nullptr)
            return sgGraphError::SocketNotFound;

        if (a->nodeId == b->nodeId)
            return sgGraphError::SameNode;

        if (a->direction == b->direction)
            return sgGraphError::DirectionMismatch;

        sgSocket const& from = a->direction == sgSocketDirection::Output ? *a : *b;
        sgSocket const& to = a->direction == sgSocketDirection::Output ? *b : *a;

        if (!sgIsTypeCompatible(from.type, to.type))
            return sgGraphError::IncompatibleTypes;

        uint32_t replaced = 0;
        while (sgConnection const* const existing = graph.connectionFeeding(to.id))
        {
            graph.removeConnection(existing->id);
            ++replaced;
        }

        if (replaced != 0)
            spdlog::debug("connection to socket {} replaced {} existing connection(s)", to.id.value(), replaced);

        sgConnection const& connection = graph.addConnection(from.nodeId, from.id, to.nodeId, to.id);

        if (out_connection != nullptr)
            *out_connection = connection.id;
        if (out_replaced != nullptr)
            *out_replaced = replaced;
        return sgGraphError::None;
    }

    bool sgDisconnect(sgGraph& graph, sgConnectionId connectionId) { return graph.removeConnection(connectionId); }

    bool sgMoveNode(sgGraph& graph, sgNodeId nodeId, sgPosition position)
    {
        sgNode* const node = graph.findNode(nodeId);
        if (node == nullptr)
            return false;

        node->moveTo(position);
        return true;
    }

    bool sgSetNodeValue(sgGraph& graph, sgNodeId nodeId, std::string_view name, sgValue const& value)
    {
        sgNode* const node = graph.findNode(nodeId);
        if (node == nullptr || name.empty())
            return false;

        node->setValue(name, value);
        return true;
    }
} // namespace shadegraph
