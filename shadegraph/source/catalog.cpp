// shadegraph

#include "shadegraph/catalog.hh"

#include "array.hh"
#include "fnv.hh"
#include "string.hh"

#include <spdlog/spdlog.h>

#include <cstring>

namespace shadegraph {
    namespace {
        struct DefinitionEntry
        {
            uint64_t hash = 0;
            sgString id;
            sgString name;
            sgString category;
            sgNodeKind kind = sgNodeKind::Function;
            sgString wgsl;
            sgString glsl;

            // inputs followed by outputs; spec names point into socketNames.
            // Both arrays are filled once at registration and keep their
            // storage when the entry itself is moved.
            sgArray<sgString> socketNames;
            sgArray<sgSocketSpec> sockets;
            uint32_t inputCount = 0;
            uint32_t outputCount = 0;
        };

        char const* describe(sgCatalogError error) noexcept
        {
            switch (error)
            {
            case sgCatalogError::None: return "none";
            case sgCatalogError::EmptyId: return "empty id";
            case sgCatalogError::DuplicateId: return "duplicate id";
            case sgCatalogError::EmptySocketName: return "empty socket name";
            case sgCatalogError::MissingPlaceholder: return "template without {{id}} placeholder";
            }
            return "unknown";
        }

        bool hasPlaceholder(char const* code) noexcept
        {
            return sgIsEmpty(code) || std::strstr(code, sgTemplatePlaceholder) != nullptr;
        }

        bool namesValid(sgSocketSpec const* specs, uint32_t count) noexcept
        {
            for (uint32_t index = 0; index != count; ++index)
                if (sgIsEmpty(specs[index].name))
                    return false;
            return true;
        }

        class DefinitionCatalog final : public sgDefinitionCatalog
        {
        public:
            explicit DefinitionCatalog(sgAllocator& alloc) noexcept : allocator_(alloc), definitions_(alloc) {}

            sgCatalogError registerDefinition(sgNodeDefinition const& definition) override;

            bool lookupDefinition(char const* id, char const* idEnd, sgNodeDefinition& out_definition) const noexcept override;

            uint32_t definitionCount() const noexcept override { return definitions_.size(); }
            bool definitionAt(uint32_t index, sgNodeDefinition& out_definition) const noexcept override;
            uint32_t definitionsInCategory(char const* category, sgNodeDefinition* out_definitions, uint32_t maxCount) const noexcept override;

            sgAllocator& allocator() noexcept { return allocator_; }

        private:
            sgCatalogError validate(sgNodeDefinition const& definition) const noexcept;
            DefinitionEntry const* find(char const* id, char const* idEnd) const noexcept;
            void copySockets(DefinitionEntry& entry, sgSocketSpec const* specs, uint32_t count);
            void makeView(DefinitionEntry const& entry, sgNodeDefinition& out_definition) const noexcept;

            sgAllocator& allocator_;
            sgArray<DefinitionEntry> definitions_;
        };
    } // namespace

    sgDefinitionCatalog* sgCreateDefinitionCatalog(sgAllocator& alloc)
    {
        return new (alloc.allocate(sizeof(DefinitionCatalog), alignof(DefinitionCatalog))) DefinitionCatalog(alloc);
    }

    void sgDestroyDefinitionCatalog(sgDefinitionCatalog* catalog)
    {
        if (catalog != nullptr)
        {
            DefinitionCatalog& impl = *static_cast<DefinitionCatalog*>(catalog);
            sgAllocator& alloc = impl.allocator();
            impl.~DefinitionCatalog();
            alloc.free(&impl, sizeof(DefinitionCatalog), alignof(DefinitionCatalog));
        }
    }

    sgCatalogError DefinitionCatalog::registerDefinition(sgNodeDefinition const& definition)
    {
        sgCatalogError const error = validate(definition);
        if (error != sgCatalogError::None)
        {
            spdlog::warn("rejected node definition '{}': {}", definition.id != nullptr ? definition.id : "", describe(error));
            return error;
        }

        DefinitionEntry& entry = definitions_.pushBack(DefinitionEntry{
            .hash = sgHashFnv1a64(definition.id),
            .id = sgString(allocator_, definition.id),
            .name = sgString(allocator_, sgIsEmpty(definition.name) ? definition.id : definition.name),
            .category = sgString(allocator_, definition.category),
            .kind = definition.kind,
            .wgsl = sgString(allocator_, definition.code.wgsl),
            .glsl = sgString(allocator_, definition.code.glsl),
            .socketNames = sgArray<sgString>(allocator_),
            .sockets = sgArray<sgSocketSpec>(allocator_),
            .inputCount = definition.inputCount,
            .outputCount = definition.outputCount,
        });

        copySockets(entry, definition.inputs, definition.inputCount);
        copySockets(entry, definition.outputs, definition.outputCount);

        spdlog::debug("registered node definition '{}' ({} inputs, {} outputs)", entry.id.cStr(), entry.inputCount, entry.outputCount);
        return sgCatalogError::None;
    }

    bool DefinitionCatalog::lookupDefinition(char const* id, char const* idEnd, sgNodeDefinition& out_definition) const noexcept
    {
        DefinitionEntry const* const entry = find(id, idEnd);
        if (entry == nullptr)
            return false;

        makeView(*entry, out_definition);
        return true;
    }

    bool DefinitionCatalog::definitionAt(uint32_t index, sgNodeDefinition& out_definition) const noexcept
    {
        if (!definitions_.contains(index))
            return false;

        makeView(definitions_[index], out_definition);
        return true;
    }

    uint32_t DefinitionCatalog::definitionsInCategory(char const* category, sgNodeDefinition* out_definitions, uint32_t maxCount) const noexcept
    {
        uint32_t count = 0;
        for (DefinitionEntry const& entry : definitions_)
        {
            if (!entry.category.equals(category))
                continue;

            if (out_definitions != nullptr && count < maxCount)
                makeView(entry, out_definitions[count]);
            ++count;
        }
        return count;
    }

    sgCatalogError DefinitionCatalog::validate(sgNodeDefinition const& definition) const noexcept
    {
        if (sgIsEmpty(definition.id))
            return sgCatalogError::EmptyId;

        if (find(definition.id, nullptr) != nullptr)
            return sgCatalogError::DuplicateId;

        SG_GUARD_OR(definition.inputs != nullptr || definition.inputCount == 0, sgCatalogError::EmptySocketName);
        SG_GUARD_OR(definition.outputs != nullptr || definition.outputCount == 0, sgCatalogError::EmptySocketName);

        if (!namesValid(definition.inputs, definition.inputCount) || !namesValid(definition.outputs, definition.outputCount))
            return sgCatalogError::EmptySocketName;

        if (definition.kind == sgNodeKind::Function && (!hasPlaceholder(definition.code.wgsl) || !hasPlaceholder(definition.code.glsl)))
            return sgCatalogError::MissingPlaceholder;

        return sgCatalogError::None;
    }

    DefinitionEntry const* DefinitionCatalog::find(char const* id, char const* idEnd) const noexcept
    {
        if (sgIsEmpty(id, idEnd))
            return nullptr;

        idEnd = sgStrEnd(id, idEnd);
        uint64_t const hash = sgHashFnv1a64(id, idEnd);

        for (DefinitionEntry const& entry : definitions_)
            if (entry.hash == hash && entry.id.equals(id, idEnd))
                return &entry;

        return nullptr;
    }

    void DefinitionCatalog::copySockets(DefinitionEntry& entry, sgSocketSpec const* specs, uint32_t count)
    {
        for (uint32_t index = 0; index != count; ++index)
        {
            sgString const& name = entry.socketNames.pushBack(sgString(allocator_, specs[index].name));
            entry.sockets.pushBack(sgSocketSpec{.name = name.cStr(), .type = specs[index].type, .defaultValue = specs[index].defaultValue});
        }
    }

    void DefinitionCatalog::makeView(DefinitionEntry const& entry, sgNodeDefinition& out_definition) const noexcept
    {
        out_definition = sgNodeDefinition{
            .id = entry.id.cStr(),
            .name = entry.name.cStr(),
            .category = entry.category.cStr(),
            .kind = entry.kind,
            .inputs = entry.sockets.data(),
            .inputCount = entry.inputCount,
            .outputs = entry.sockets.data() + entry.inputCount,
            .outputCount = entry.outputCount,
            .code = {.wgsl = entry.wgsl.cStr(), .glsl = entry.glsl.cStr()},
        };
    }
} // namespace shadegraph
