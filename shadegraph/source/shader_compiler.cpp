// shadegraph

#include "shadegraph/shader_compiler.hh"

#include "shadegraph/alloc.hh"
#include "shadegraph/catalog.hh"

#include "array.hh"
#include "assert.hh"
#include "emitter.hh"
#include "index.hh"
#include "literal.hh"
#include "string.hh"
#include "text.hh"
#include "utility.hh"

#include <spdlog/spdlog.h>

#include <cstring>
#include <new>

namespace shadegraph {
    namespace {
        char const* describe(sgCompileErrorCode code) noexcept
        {
            switch (code)
            {
            case sgCompileErrorCode::Unknown: return "unknown error";
            case sgCompileErrorCode::NoSinkNode: return "no output node";
            case sgCompileErrorCode::UnknownDefinition: return "unknown node definition";
            case sgCompileErrorCode::NodeNotFound: return "connection references a missing node";
            case sgCompileErrorCode::SocketNotFound: return "connection references a missing socket";
            case sgCompileErrorCode::UnboundResource: return "resource input has no connection";
            case sgCompileErrorCode::MissingTemplate: return "definition has no code for the backend";
            }
            return "unknown error";
        }

        class ShaderCompiler final : public sgShaderCompiler
        {
        public:
            explicit ShaderCompiler(sgAllocator& alloc, sgNodeCatalog const& catalog) noexcept
                : allocator_(alloc), catalog_(catalog), nodes_(alloc), inputs_(alloc), outputs_(alloc), values_(alloc), connections_(alloc),
                  usedDefinitions_(alloc), declarations_(alloc), errors_(alloc), functions_(sgStdAllocator<char>(alloc)),
                  body_(sgStdAllocator<char>(alloc)), module_(sgStdAllocator<char>(alloc)), vertex_(sgStdAllocator<char>(alloc)),
                  fragment_(sgStdAllocator<char>(alloc))
            {
            }

            void reset() override;

            void beginNode(sgNodeId nodeId, char const* definitionId, char const* definitionIdEnd = nullptr) override;

            void addInputSocket(sgSocketId socketId, sgSocketType type, sgValue const& defaultValue, char const* name,
                char const* nameEnd = nullptr) override;
            void addOutputSocket(sgSocketId socketId, sgSocketType type, char const* name, char const* nameEnd = nullptr) override;

            void bindValue(sgValue const& value, char const* name, char const* nameEnd = nullptr) override;

            void addConnection(sgNodeId fromNodeId, sgSocketId fromSocketId, sgNodeId toNodeId, sgSocketId toSocketId) override;

            bool compile(sgCompileOptions const& options) override;

            uint32_t getErrorCount() const noexcept override { return errors_.size(); }
            sgCompileError getError(uint32_t index) const noexcept override;

            sgShaderDocument document() const noexcept override;

            sgAllocator& allocator() noexcept { return allocator_; }

        private:
            SG_DEFINE_INDEX(NodeIndex);
            SG_DEFINE_INDEX(InputIndex);
            SG_DEFINE_INDEX(OutputIndex);
            SG_DEFINE_INDEX(ValueIndex);
            SG_DEFINE_INDEX(ConnectionIndex);

            enum class CompileStatus
            {
                Reset,
                Compiled,
                Errored,
            };

            struct Node
            {
                // source data
                sgNodeId nodeId;
                sgString definitionId;

                // cached data
                sgNodeDefinition definition;
                bool known = false;

                // socket and value lists, in declaration order
                InputIndex firstInput = sgInvalidIndex;
                InputIndex lastInput = sgInvalidIndex;
                OutputIndex firstOutput = sgInvalidIndex;
                OutputIndex lastOutput = sgInvalidIndex;
                ValueIndex firstValue = sgInvalidIndex;
                uint32_t inputCount = 0;
                uint32_t outputCount = 0;

                // compiled data
                bool collected = false;
                bool visited = false;
            };

            struct Input
            {
                // source data
                sgSocketId socketId;
                sgSocketType type = sgSocketType::Scalar;
                sgValue defaultValue;
                sgString name;
                NodeIndex nodeIndex = sgInvalidIndex;

                // socket list
                InputIndex nextInput = sgInvalidIndex;

                // compiled data
                ConnectionIndex feed = sgInvalidIndex;
            };

            struct Output
            {
                // source data
                sgSocketId socketId;
                sgSocketType type = sgSocketType::Scalar;
                sgString name;
                NodeIndex nodeIndex = sgInvalidIndex;

                // socket list
                OutputIndex nextOutput = sgInvalidIndex;

                // compiled data; 0 until the owning node has been emitted
                uint32_t variable = 0;
            };

            struct Value
            {
                sgString name;
                sgValue value;
                NodeIndex nodeIndex = sgInvalidIndex;
                ValueIndex nextValue = sgInvalidIndex;
            };

            struct Connection
            {
                // source data
                sgNodeId fromNodeId;
                sgSocketId fromSocketId;
                sgNodeId toNodeId;
                sgSocketId toSocketId;

                // compiled data
                OutputIndex outputIndex = sgInvalidIndex;
                InputIndex inputIndex = sgInvalidIndex;
            };

            void resolveDefinitions();
            void linkElements();
            NodeIndex findSink() const noexcept;
            void collectDefinitions(NodeIndex nodeIndex);
            void writeDeclarations(sgBackend backend);
            void instantiate(sgTextBuffer& out, char const* code, sgNodeId nodeId) const;
            void evaluate(NodeIndex nodeIndex);
            void emitFunction(Node const& node);
            void emitColorPicker(Node const& node);
            void emitSink(Node const& node);
            void writeInput(sgTextBuffer& out, Input const& input);
            void writeArguments(sgTextBuffer& out, Node const& node);
            uint32_t bind(sgSocketType type, sgTextBuffer const& expression);
            void terminate(sgTextBuffer& text);

            // return false, for convenience
            bool error(sgCompileError const& error);

            NodeIndex findNode(sgNodeId nodeId) const noexcept;
            InputIndex findInput(NodeIndex nodeIndex, sgSocketId socketId) const noexcept;
            OutputIndex findOutput(NodeIndex nodeIndex, sgSocketId socketId) const noexcept;
            Value const* findValue(Node const& node, char const* name, char const* nameEnd) const noexcept;

            sgAllocator& allocator_;
            sgNodeCatalog const& catalog_;
            sgEmitter const* emitter_ = nullptr;
            char const* colorName_ = "finalColor";
            sgArray<Node, NodeIndex> nodes_;
            sgArray<Input, InputIndex> inputs_;
            sgArray<Output, OutputIndex> outputs_;
            sgArray<Value, ValueIndex> values_;
            sgArray<Connection, ConnectionIndex> connections_;
            sgArray<NodeIndex> usedDefinitions_;
            sgArray<sgString> declarations_;
            sgArray<sgCompileError> errors_;
            sgTextBuffer functions_;
            sgTextBuffer body_;
            sgTextBuffer module_;
            sgTextBuffer vertex_;
            sgTextBuffer fragment_;
            sgBackend backend_ = sgBackend::Wgsl;
            uint32_t nextVariable_ = 1;
            bool fallback_ = false;
            NodeIndex openNode_ = sgInvalidIndex;
            bool reopened_ = false;
            CompileStatus status_ = CompileStatus::Reset;
        };
    } // namespace

    sgShaderCompiler* sgCreateShaderCompiler(sgAllocator& alloc, sgNodeCatalog const& catalog)
    {
        return new (alloc.allocate(sizeof(ShaderCompiler), alignof(ShaderCompiler))) ShaderCompiler(alloc, catalog);
    }

    void sgDestroyShaderCompiler(sgShaderCompiler* compiler)
    {
        if (compiler != nullptr)
        {
            ShaderCompiler* impl = static_cast<ShaderCompiler*>(compiler);
            sgAllocator& alloc = impl->allocator();
            impl->~ShaderCompiler();
            alloc.free(impl, sizeof(ShaderCompiler), alignof(ShaderCompiler));
        }
    }

    void ShaderCompiler::reset()
    {
        status_ = CompileStatus::Reset;

        nodes_.clear();
        inputs_.clear();
        outputs_.clear();
        values_.clear();
        connections_.clear();
        usedDefinitions_.clear();
        declarations_.clear();
        errors_.clear();
        functions_.clear();
        body_.clear();
        module_.clear();
        vertex_.clear();
        fragment_.clear();
        emitter_ = nullptr;
        colorName_ = "finalColor";
        backend_ = sgBackend::Wgsl;
        nextVariable_ = 1;
        fallback_ = false;
        openNode_ = sgInvalidIndex;
        reopened_ = false;
    }

    void ShaderCompiler::beginNode(sgNodeId nodeId, char const* definitionId, char const* definitionIdEnd)
    {
        SG_GUARD_VOID(status_ == CompileStatus::Reset);
        SG_GUARD_VOID(nodeId.valid());

        for (auto&& [index, node] : sgEnumerate(nodes_))
        {
            if (node.nodeId == nodeId)
            {
                openNode_ = index;
                reopened_ = true;
                node.definitionId.reset(definitionId, definitionIdEnd);
                return;
            }
        }

        openNode_ = NodeIndex{nodes_.size()};
        reopened_ = false;
        nodes_.pushBack(Node{.nodeId = nodeId, .definitionId = sgString(allocator_, definitionId, definitionIdEnd)});
    }

    void ShaderCompiler::addInputSocket(sgSocketId socketId, sgSocketType type, sgValue const& defaultValue, char const* name, char const* nameEnd)
    {
        SG_GUARD_VOID(status_ == CompileStatus::Reset);
        SG_GUARD_VOID(openNode_ != sgInvalidIndex);

        if (reopened_)
        {
            for (Input& input : inputs_)
            {
                if (input.nodeIndex == openNode_ && input.socketId == socketId)
                {
                    input.type = type;
                    input.defaultValue = defaultValue;
                    input.name.reset(name, nameEnd);
                    return;
                }
            }
        }

        inputs_.pushBack(Input{
            .socketId = socketId,
            .type = type,
            .defaultValue = defaultValue,
            .name = sgString(allocator_, name, nameEnd),
            .nodeIndex = openNode_,
        });
    }

    void ShaderCompiler::addOutputSocket(sgSocketId socketId, sgSocketType type, char const* name, char const* nameEnd)
    {
        SG_GUARD_VOID(status_ == CompileStatus::Reset);
        SG_GUARD_VOID(openNode_ != sgInvalidIndex);

        if (reopened_)
        {
            for (Output& output : outputs_)
            {
                if (output.nodeIndex == openNode_ && output.socketId == socketId)
                {
                    output.type = type;
                    output.name.reset(name, nameEnd);
                    return;
                }
            }
        }

        outputs_.pushBack(Output{
            .socketId = socketId,
            .type = type,
            .name = sgString(allocator_, name, nameEnd),
            .nodeIndex = openNode_,
        });
    }

    void ShaderCompiler::bindValue(sgValue const& value, char const* name, char const* nameEnd)
    {
        SG_GUARD_VOID(status_ == CompileStatus::Reset);
        SG_GUARD_VOID(openNode_ != sgInvalidIndex);
        SG_GUARD_VOID(!sgIsEmpty(name, nameEnd));

        // rebinding a name replaces the earlier value
        for (Value& bound : values_)
        {
            if (bound.nodeIndex == openNode_ && bound.name.equals(name, nameEnd))
            {
                bound.value = value;
                return;
            }
        }

        values_.pushBack(Value{.name = sgString(allocator_, name, nameEnd), .value = value, .nodeIndex = openNode_});
    }

    void ShaderCompiler::addConnection(sgNodeId fromNodeId, sgSocketId fromSocketId, sgNodeId toNodeId, sgSocketId toSocketId)
    {
        SG_GUARD_VOID(status_ == CompileStatus::Reset);

        openNode_ = sgInvalidIndex;

        connections_.pushBack(Connection{.fromNodeId = fromNodeId, .fromSocketId = fromSocketId, .toNodeId = toNodeId, .toSocketId = toSocketId});
    }

    bool ShaderCompiler::compile(sgCompileOptions const& options)
    {
        SG_GUARD_OR(status_ == CompileStatus::Reset, false);

        openNode_ = sgInvalidIndex;
        backend_ = options.backend;
        emitter_ = &sgGetEmitter(options.backend);

        colorName_ = sgIsEmpty(options.sinkColorName) ? "finalColor" : options.sinkColorName;
        sgEmitOutput const out{.module = module_, .vertex = vertex_, .fragment = fragment_};

        resolveDefinitions();
        linkElements();

        NodeIndex const sink = findSink();
        if (sink == sgInvalidIndex)
        {
            error({.code = sgCompileErrorCode::NoSinkNode});
            spdlog::debug("no output node among {} nodes, emitting the default shader", nodes_.size());

            fallback_ = true;
            emitter_->assembleFallback(out);
        }
        else
        {
            collectDefinitions(sink);
            writeDeclarations(options.backend);
            evaluate(sink);

            emitter_->assemble(out, functions_, body_, colorName_);

            spdlog::debug("compiled {} nodes: {} definitions, {} functions, {} bindings", nodes_.size(), usedDefinitions_.size(),
                declarations_.size(), nextVariable_ - 1);
        }

        terminate(module_);
        terminate(vertex_);
        terminate(fragment_);

        bool const success = errors_.empty();
        status_ = success ? CompileStatus::Compiled : CompileStatus::Errored;
        return success;
    }

    sgCompileError ShaderCompiler::getError(uint32_t index) const noexcept
    {
        SG_GUARD_OR(index < errors_.size(), sgCompileError{});
        return errors_[index];
    }

    sgShaderDocument ShaderCompiler::document() const noexcept
    {
        SG_GUARD_OR(status_ != CompileStatus::Reset, sgShaderDocument{});

        auto text = [](sgTextBuffer const& buffer) noexcept {
            // every buffer carries a terminating NUL once compiled
            return buffer.size() > 1 ? sgShaderText{.text = buffer.data(), .size = static_cast<uint32_t>(buffer.size() - 1)} : sgShaderText{};
        };

        return sgShaderDocument{
            .backend = backend_,
            .module = text(module_),
            .vertex = text(vertex_),
            .fragment = text(fragment_),
            .fallback = fallback_,
        };
    }

    void ShaderCompiler::resolveDefinitions()
    {
        for (Node& node : nodes_)
        {
            node.known = catalog_.lookupDefinition(node.definitionId.begin(), node.definitionId.end(), node.definition);
            if (!node.known)
                error({.code = sgCompileErrorCode::UnknownDefinition, .nodeId = node.nodeId});
        }
    }

    void ShaderCompiler::linkElements()
    {
        for (auto&& [index, input] : sgEnumerate(inputs_))
        {
            Node& node = nodes_[input.nodeIndex];
            if (node.lastInput != sgInvalidIndex)
                inputs_[node.lastInput].nextInput = index;
            else
                node.firstInput = index;
            node.lastInput = index;
            ++node.inputCount;
        }

        for (auto&& [index, output] : sgEnumerate(outputs_))
        {
            Node& node = nodes_[output.nodeIndex];
            if (node.lastOutput != sgInvalidIndex)
                outputs_[node.lastOutput].nextOutput = index;
            else
                node.firstOutput = index;
            node.lastOutput = index;
            ++node.outputCount;
        }

        // lookup order of values does not matter, names are unique per node
        for (auto&& [index, value] : sgEnumerate(values_))
        {
            Node& node = nodes_[value.nodeIndex];
            value.nextValue = node.firstValue;
            node.firstValue = index;
        }

        for (auto&& [index, connection] : sgEnumerate(connections_))
        {
            NodeIndex const fromNode = findNode(connection.fromNodeId);
            NodeIndex const toNode = findNode(connection.toNodeId);
            if (!nodes_.contains(fromNode))
            {
                error({.code = sgCompileErrorCode::NodeNotFound, .nodeId = connection.fromNodeId});
                continue;
            }
            if (!nodes_.contains(toNode))
            {
                error({.code = sgCompileErrorCode::NodeNotFound, .nodeId = connection.toNodeId});
                continue;
            }

            connection.outputIndex = findOutput(fromNode, connection.fromSocketId);
            if (!outputs_.contains(connection.outputIndex))
            {
                error({.code = sgCompileErrorCode::SocketNotFound, .nodeId = connection.fromNodeId});
                continue;
            }

            connection.inputIndex = findInput(toNode, connection.toSocketId);
            if (!inputs_.contains(connection.inputIndex))
            {
                error({.code = sgCompileErrorCode::SocketNotFound, .nodeId = connection.toNodeId});
                continue;
            }

            // an input is fed by at most one connection; the last one added wins
            inputs_[connection.inputIndex].feed = index;
        }
    }

    ShaderCompiler::NodeIndex ShaderCompiler::findSink() const noexcept
    {
        for (auto&& [index, node] : sgEnumerate(nodes_))
            if (node.known && node.definition.kind == sgNodeKind::Output)
                return index;
        return sgInvalidIndex;
    }

    void ShaderCompiler::collectDefinitions(NodeIndex nodeIndex)
    {
        Node& node = nodes_[nodeIndex];
        if (node.collected)
            return;

        node.collected = true;

        if (node.known)
        {
            bool seen = false;
            for (NodeIndex const used : usedDefinitions_)
            {
                if (node.definitionId.equals(nodes_[used].definitionId.begin(), nodes_[used].definitionId.end()))
                {
                    seen = true;
                    break;
                }
            }
            if (!seen)
                usedDefinitions_.pushBack(nodeIndex);
        }

        // every node is walked, even when its definition was already recorded
        for (InputIndex inputIndex = node.firstInput; inputs_.contains(inputIndex); inputIndex = inputs_[inputIndex].nextInput)
        {
            ConnectionIndex const feed = inputs_[inputIndex].feed;
            if (connections_.contains(feed))
                collectDefinitions(outputs_[connections_[feed].outputIndex].nodeIndex);
        }
    }

    void ShaderCompiler::writeDeclarations(sgBackend backend)
    {
        sgTextBuffer text{sgStdAllocator<char>(allocator_)};

        for (NodeIndex const used : usedDefinitions_)
        {
            Node const& representative = nodes_[used];
            char const* const code = representative.definition.codeFor(backend);
            if (sgIsEmpty(code))
                continue;

            // one instance per graph node of the definition, not only the reachable ones
            for (Node const& node : nodes_)
            {
                if (!node.definitionId.equals(representative.definitionId.begin(), representative.definitionId.end()))
                    continue;

                text.clear();
                instantiate(text, code, node.nodeId);

                bool duplicate = false;
                for (sgString const& declaration : declarations_)
                {
                    if (declaration.equals(text.data(), text.data() + text.size()))
                    {
                        duplicate = true;
                        break;
                    }
                }
                if (duplicate)
                    continue;

                if (!declarations_.empty())
                    sgAppend(functions_, "\n\n");
                functions_.append(text.data(), text.data() + text.size());
                declarations_.pushBack(sgString(allocator_, text.data(), text.data() + text.size()));
            }
        }
    }

    void ShaderCompiler::instantiate(sgTextBuffer& out, char const* code, sgNodeId nodeId) const
    {
        constexpr uint32_t placeholderLength = sizeof(sgTemplatePlaceholder) - 1;

        for (char const* match = std::strstr(code, sgTemplatePlaceholder); match != nullptr; match = std::strstr(code, sgTemplatePlaceholder))
        {
            sgAppend(out, code, match);
            sgFormatTo(out, "{}", nodeId.value());
            code = match + placeholderLength;
        }
        sgAppend(out, code);
    }

    void ShaderCompiler::evaluate(NodeIndex nodeIndex)
    {
        Node& node = nodes_[nodeIndex];

        // set before inputs are resolved so that a cycle terminates
        if (node.visited)
            return;

        node.visited = true;

        // consumers of unknown nodes receive zero literals
        if (!node.known)
            return;

        switch (node.definition.kind)
        {
        case sgNodeKind::Function: emitFunction(node); break;
        case sgNodeKind::ColorPicker: emitColorPicker(node); break;
        case sgNodeKind::Output: emitSink(node); break;
        }
    }

    void ShaderCompiler::emitFunction(Node const& node)
    {
        sgTextBuffer arguments{sgStdAllocator<char>(allocator_)};
        writeArguments(arguments, node);

        if (sgIsEmpty(node.definition.codeFor(backend_)))
        {
            error({.code = sgCompileErrorCode::MissingTemplate, .nodeId = node.nodeId});
            return;
        }

        sgTextBuffer call{sgStdAllocator<char>(allocator_)};
        for (OutputIndex outputIndex = node.firstOutput; outputs_.contains(outputIndex); outputIndex = outputs_[outputIndex].nextOutput)
        {
            call.clear();
            sgFormatTo(call, "node_{}", node.nodeId.value());

            // multi-output definitions declare one function per output
            if (node.outputCount > 1)
            {
                call.push_back('_');
                for (char const c : outputs_[outputIndex].name)
                    call.push_back(sgToAsciiLower(c));
            }

            call.push_back('(');
            call.append(arguments.data(), arguments.data() + arguments.size());
            call.push_back(')');

            uint32_t const variable = bind(outputs_[outputIndex].type, call);
            outputs_[outputIndex].variable = variable;
        }
    }

    void ShaderCompiler::emitColorPicker(Node const& node)
    {
        if (!outputs_.contains(node.firstOutput))
            return;

        Value const* const stored = findValue(node, sgColorValueName, nullptr);
        sgValue const color = stored != nullptr && !stored->value.empty() ? stored->value : sgValue{1.f, 1.f, 1.f};

        sgTextBuffer literal{sgStdAllocator<char>(allocator_)};
        sgWriteColorLiteral(literal, emitter_->syntax(), color);

        Output& output = outputs_[node.firstOutput];
        output.variable = bind(output.type, literal);
    }

    void ShaderCompiler::emitSink(Node const& node)
    {
        sgTextBuffer rgb{sgStdAllocator<char>(allocator_)};
        sgTextBuffer alpha{sgStdAllocator<char>(allocator_)};

        InputIndex const colorIndex = node.firstInput;
        if (inputs_.contains(colorIndex))
            writeInput(rgb, inputs_[colorIndex]);
        else
            sgWriteLiteral(rgb, emitter_->syntax(), sgSocketType::Vector3, sgValue{});

        InputIndex const alphaIndex = inputs_.contains(colorIndex) ? inputs_[colorIndex].nextInput : InputIndex{sgInvalidIndex};
        if (inputs_.contains(alphaIndex))
        {
            Input const& input = inputs_[alphaIndex];
            Value const* const stored = findValue(node, input.name.begin(), input.name.end());
            bool const opaque = input.feed == sgInvalidIndex && (stored == nullptr || stored->value.empty()) && input.defaultValue.empty();
            if (opaque)
                sgAppend(alpha, "1.0");
            else
                writeInput(alpha, input);
        }
        else
        {
            sgAppend(alpha, "1.0");
        }

        // the sink's remaining inputs are resolved so their sources are emitted
        for (InputIndex inputIndex = inputs_.contains(alphaIndex) ? inputs_[alphaIndex].nextInput : InputIndex{sgInvalidIndex};
             inputs_.contains(inputIndex); inputIndex = inputs_[inputIndex].nextInput)
        {
            sgTextBuffer unused{sgStdAllocator<char>(allocator_)};
            writeInput(unused, inputs_[inputIndex]);
        }

        emitter_->writeSinkColor(body_, colorName_, rgb.data(), rgb.data() + rgb.size(), alpha.data(), alpha.data() + alpha.size());
    }

    void ShaderCompiler::writeArguments(sgTextBuffer& out, Node const& node)
    {
        for (InputIndex inputIndex = node.firstInput; inputs_.contains(inputIndex); inputIndex = inputs_[inputIndex].nextInput)
        {
            if (inputIndex != node.firstInput)
                sgAppend(out, ", ");
            writeInput(out, inputs_[inputIndex]);
        }
    }

    void ShaderCompiler::writeInput(sgTextBuffer& out, Input const& input)
    {
        Node const& owner = nodes_[input.nodeIndex];

        if (connections_.contains(input.feed))
        {
            OutputIndex const outputIndex = connections_[input.feed].outputIndex;
            evaluate(outputs_[outputIndex].nodeIndex);

            uint32_t const variable = outputs_[outputIndex].variable;
            if (variable != 0)
                sgFormatTo(out, "v{}", variable);
            else
                sgWriteLiteral(out, emitter_->syntax(), input.type, sgValue{});
            return;
        }

        if (sgIsResource(input.type))
            error({.code = sgCompileErrorCode::UnboundResource, .nodeId = owner.nodeId});

        Value const* const stored = findValue(owner, input.name.begin(), input.name.end());
        sgValue const& value = stored != nullptr && !stored->value.empty() ? stored->value : input.defaultValue;
        sgWriteLiteral(out, emitter_->syntax(), input.type, value);
    }

    uint32_t ShaderCompiler::bind(sgSocketType type, sgTextBuffer const& expression)
    {
        uint32_t const variable = nextVariable_++;
        emitter_->writeBinding(body_, type, variable, expression.data(), expression.data() + expression.size());
        return variable;
    }

    void ShaderCompiler::terminate(sgTextBuffer& text)
    {
        if (text.size() != 0)
            text.push_back('\0');
    }

    bool ShaderCompiler::error(sgCompileError const& error)
    {
        spdlog::debug("shader compile: {} (node {})", describe(error.code), error.nodeId.value());
        errors_.pushBack(error);
        return false;
    }

    ShaderCompiler::NodeIndex ShaderCompiler::findNode(sgNodeId nodeId) const noexcept
    {
        for (auto&& [index, node] : sgEnumerate(nodes_))
            if (node.nodeId == nodeId)
                return index;
        return sgInvalidIndex;
    }

    ShaderCompiler::InputIndex ShaderCompiler::findInput(NodeIndex nodeIndex, sgSocketId socketId) const noexcept
    {
        for (InputIndex index = nodes_[nodeIndex].firstInput; inputs_.contains(index); index = inputs_[index].nextInput)
            if (inputs_[index].socketId == socketId)
                return index;
        return sgInvalidIndex;
    }

    ShaderCompiler::OutputIndex ShaderCompiler::findOutput(NodeIndex nodeIndex, sgSocketId socketId) const noexcept
    {
        for (OutputIndex index = nodes_[nodeIndex].firstOutput; outputs_.contains(index); index = outputs_[index].nextOutput)
            if (outputs_[index].socketId == socketId)
                return index;
        return sgInvalidIndex;
    }

    ShaderCompiler::Value const* ShaderCompiler::findValue(Node const& node, char const* name, char const* nameEnd) const noexcept
    {
        for (ValueIndex index = node.firstValue; values_.contains(index); index = values_[index].nextValue)
            if (values_[index].name.equals(name, nameEnd))
                return &values_[index];
        return nullptr;
    }
} // namespace shadegraph
