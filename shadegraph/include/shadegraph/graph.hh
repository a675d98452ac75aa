// shadegraph

#pragma once

#include "shadegraph/export.hh"
#include "shadegraph/types.hh"
#include "shadegraph/value.hh"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shadegraph {
    struct sgSocket
    {
        sgSocketId id = sgInvalidSocketId;
        sgNodeId nodeId = sgInvalidNodeId;
        std::string name;
        sgSocketType type = sgSocketType::Scalar;
        sgSocketDirection direction = sgSocketDirection::Input;
        sgValue defaultValue;
    };

    struct sgNodeValue
    {
        std::string name;
        sgValue value;
    };

    class SG_API sgNode
    {
    public:
        sgNode(sgNodeId id, std::string definitionId, sgPosition position) : id_(id), definitionId_(std::move(definitionId)), position_(position) {}

        sgNodeId id() const noexcept { return id_; }
        std::string const& definitionId() const noexcept { return definitionId_; }

        sgPosition position() const noexcept { return position_; }
        void moveTo(sgPosition position) noexcept { position_ = position; }

        std::vector<sgSocket> const& inputs() const noexcept { return inputs_; }
        std::vector<sgSocket> const& outputs() const noexcept { return outputs_; }
        std::vector<sgNodeValue> const& values() const noexcept { return values_; }

        sgSocket const* findInput(std::string_view name) const noexcept;
        sgSocket const* findOutput(std::string_view name) const noexcept;
        sgSocket const* findSocket(sgSocketId socketId) const noexcept;

        sgValue const* findValue(std::string_view name) const noexcept;
        void setValue(std::string_view name, sgValue const& value);

        // sockets are fixed once the node is populated by its factory
        sgSocket const& addSocket(sgSocketId socketId, std::string name, sgSocketType type, sgSocketDirection direction, sgValue defaultValue);

    private:
        sgNodeId id_;
        std::string definitionId_;
        sgPosition position_;
        std::vector<sgSocket> inputs_;
        std::vector<sgSocket> outputs_;
        std::vector<sgNodeValue> values_;
    };

    struct sgConnection
    {
        sgConnectionId id = sgInvalidConnectionId;
        sgNodeId fromNodeId = sgInvalidNodeId;
        sgSocketId fromSocketId = sgInvalidSocketId;
        sgNodeId toNodeId = sgInvalidNodeId;
        sgSocketId toSocketId = sgInvalidSocketId;

        bool involvesNode(sgNodeId nodeId) const noexcept { return fromNodeId == nodeId || toNodeId == nodeId; }
        bool involvesSocket(sgSocketId socketId) const noexcept { return fromSocketId == socketId || toSocketId == socketId; }
    };

    // Storage for nodes and connections. Enforces no editing rules; see edit.hh.
    class SG_API sgGraph
    {
    public:
        sgGraph() = default;
        sgGraph(sgGraph const&) = delete;
        sgGraph& operator=(sgGraph const&) = delete;

        sgNode* findNode(sgNodeId nodeId) noexcept;
        sgNode const* findNode(sgNodeId nodeId) const noexcept;
        sgSocket const* findSocket(sgSocketId socketId) const noexcept;
        sgConnection const* findConnection(sgConnectionId connectionId) const noexcept;

        // the single connection feeding an input socket, if any
        sgConnection const* connectionFeeding(sgSocketId inputSocketId) const noexcept;
        std::vector<sgConnection const*> connectionsTouching(sgNodeId nodeId) const;

        std::vector<std::unique_ptr<sgNode>> const& nodes() const noexcept { return nodes_; }
        std::vector<sgConnection> const& connections() const noexcept { return connections_; }

        sgNode& addNode(std::string definitionId, sgPosition position);
        bool removeNode(sgNodeId nodeId);

        sgConnection const& addConnection(sgNodeId fromNodeId, sgSocketId fromSocketId, sgNodeId toNodeId, sgSocketId toSocketId);
        bool removeConnection(sgConnectionId connectionId);

        sgSocketId allocateSocketId() noexcept { return sgSocketId{nextId_++}; }

    private:
        std::vector<std::unique_ptr<sgNode>> nodes_;
        std::vector<sgConnection> connections_;
        uint64_t nextId_ = 1;
    };
} // namespace shadegraph
