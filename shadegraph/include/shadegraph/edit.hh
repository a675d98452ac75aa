// shadegraph

#pragma once

#include "shadegraph/export.hh"
#include "shadegraph/graph.hh"
#include "shadegraph/types.hh"

#include <cstdint>
#include <string_view>

namespace shadegraph {
    class sgNodeCatalog;

    enum class sgGraphError
    {
        None,
        NodeNotFound,
        SocketNotFound,
        SameNode,
        DirectionMismatch,
        IncompatibleTypes,
    };

    // types are equal, or one is color and the other the 3-vector
    [[nodiscard]] SG_API bool sgIsTypeCompatible(sgSocketType from, sgSocketType to) noexcept;

    // sockets on different nodes, opposite directions, compatible types
    [[nodiscard]] SG_API bool sgCanConnect(sgSocket const& first, sgSocket const& second) noexcept;

    // instantiates a definition's sockets; nullptr if the catalog does not know the definition
    SG_API sgNode* sgCreateNode(sgGraph& graph, sgNodeCatalog const& catalog, std::string_view definitionId, sgPosition position);

    // copies definition, sockets and values under new ids; connections are not copied
    SG_API sgNode* sgCloneNode(sgGraph& graph, sgNodeId nodeId, sgPosition offset);

    // removes every connection touching the node, then the node
    SG_API bool sgDeleteNode(sgGraph& graph, sgNodeId nodeId);

    // Connects two sockets given in either order. A connection already feeding
    // the input socket is replaced; out_replaced receives how many were removed.
    SG_API sgGraphError sgConnect(sgGraph& graph, sgSocketId first, sgSocketId second, sgConnectionId* out_connection = nullptr,
        uint32_t* out_replaced = nullptr);

    SG_API bool sgDisconnect(sgGraph& graph, sgConnectionId connectionId);
    SG_API bool sgMoveNode(sgGraph& graph, sgNodeId nodeId, sgPosition position);
    SG_API bool sgSetNodeValue(sgGraph& graph, sgNodeId nodeId, std::string_view name, sgValue const& value);
} // namespace shadegraph
