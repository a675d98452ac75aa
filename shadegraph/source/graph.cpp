// shadegraph

#include "shadegraph/graph.hh"

#include <algorithm>

namespace shadegraph {
    sgSocket const* sgNode::findInput(std::string_view name) const noexcept
    {
        auto const it = std::find_if(inputs_.begin(), inputs_.end(), [name](auto const& item) { return item.name == name; });
        return it != inputs_.end() ? &*it : nullptr;
    }

    sgSocket const* sgNode::findOutput(std::string_view name) const noexcept
    {
        auto const it = std::find_if(outputs_.begin(), outputs_.end(), [name](auto const& item) { return item.name == name; });
        return it != outputs_.end() ? &*it : nullptr;
    }

    sgSocket const* sgNode::findSocket(sgSocketId socketId) const noexcept
    {
        for (sgSocket const& socket : inputs_)
            if (socket.id == socketId)
                return &socket;
        for (sgSocket const& socket : outputs_)
            if (socket.id == socketId)
                return &socket;
        return nullptr;
    }

    sgValue const* sgNode::findValue(std::string_view name) const noexcept
    {
        auto const it = std::find_if(values_.begin(), values_.end(), [name](auto const& item) { return item.name == name; });
        return it != values_.end() ? &it->value : nullptr;
    }

    void sgNode::setValue(std::string_view name, sgValue const& value)
    {
        auto const it = std::find_if(values_.begin(), values_.end(), [name](auto const& item) { return item.name == name; });
        if (it != values_.end())
            it->value = value;
        else
            values_.push_back(sgNodeValue{.name = std::string(name), .value = value});
    }

    sgSocket const& sgNode::addSocket(sgSocketId socketId, std::string name, sgSocketType type, sgSocketDirection direction, sgValue defaultValue)
    {
        std::vector<sgSocket>& sockets = direction == sgSocketDirection::Input ? inputs_ : outputs_;
        sockets.push_back(sgSocket{
            .id = socketId,
            .nodeId = id_,
            .name = std::move(name),
            .type = type,
            .direction = direction,
            .defaultValue = defaultValue,
        });
        return sockets.back();
    }

    sgNode* sgGraph::findNode(sgNodeId nodeId) noexcept
    {
        for (auto& node : nodes_)
            if (node->id() == nodeId)
                return node.get();
        return nullptr;
    }

    sgNode const* sgGraph::findNode(sgNodeId nodeId) const noexcept
    {
        for (auto const& node : nodes_)
            if (node->id() == nodeId)
                return node.get();
        return nullptr;
    }

    sgSocket const* sgGraph::findSocket(sgSocketId socketId) const noexcept
    {
        for (auto const& node : nodes_)
            if (sgSocket const* socket = node->findSocket(socketId); socket != nullptr)
                return socket;
        return nullptr;
    }

    sgConnection const* sgGraph::findConnection(sgConnectionId connectionId) const noexcept
    {
        auto const it = std::find_if(connections_.begin(), connections_.end(), [connectionId](auto const& item) { return item.id == connectionId; });
        return it != connections_.end() ? &*it : nullptr;
    }

    sgConnection const* sgGraph::connectionFeeding(sgSocketId inputSocketId) const noexcept
    {
        auto const it = std::find_if(connections_.begin(), connections_.end(), [inputSocketId](auto const& item) { return item.toSocketId == inputSocketId; });
        return it != connections_.end() ? &*it : nullptr;
    }

    std::vector<sgConnection const*> sgGraph::connectionsTouching(sgNodeId nodeId) const
    {
        std::vector<sgConnection const*> touching;
        for (sgConnection const& connection : connections_)
            if (connection.involvesNode(nodeId))
                touching.push_back(&connection);
        return touching;
    }

    sgNode& sgGraph::addNode(std::string definitionId, sgPosition position)
    {
        nodes_.push_back(std::make_unique<sgNode>(sgNodeId{nextId_++}, std::move(definitionId), position));
        return *nodes_.back();
    }

    bool sgGraph::removeNode(sgNodeId nodeId)
    {
        auto const it = std::find_if(nodes_.begin(), nodes_.end(), [nodeId](auto const& item) { return item->id() == nodeId; });
        if (it == nodes_.end())
            return false;

        nodes_.erase(it);
        return true;
    }

    sgConnection const& sgGraph::addConnection(sgNodeId fromNodeId, sgSocketId fromSocketId, sgNodeId toNodeId, sgSocketId toSocketId)
    {
        connections_.push_back(sgConnection{
            .id = sgConnectionId{nextId_++},
            .fromNodeId = fromNodeId,
            .fromSocketId = fromSocketId,
            .toNodeId = toNodeId,
            .toSocketId = toSocketId,
        });
        return connections_.back();
    }

    bool sgGraph::removeConnection(sgConnectionId connectionId)
    {
        auto const it = std::find_if(connections_.begin(), connections_.end(), [connectionId](auto const& item) { return item.id == connectionId; });
        if (it == connections_.end())
            return false;

        connections_.erase(it);
        return true;
    }
} // namespace shadegraph
