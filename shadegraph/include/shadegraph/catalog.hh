// shadegraph

#pragma once

#include "shadegraph/alloc.hh"
#include "shadegraph/export.hh"
#include "shadegraph/types.hh"
#include "shadegraph/value.hh"

#include <cstdint>

namespace shadegraph {
    struct sgSocketSpec
    {
        char const* name = nullptr;
        sgSocketType type = sgSocketType::Scalar;
        sgValue defaultValue;
    };

    // per-backend function templates; null or empty means the definition
    // emits no function for that backend
    struct sgCodeTemplates
    {
        char const* wgsl = nullptr;
        char const* glsl = nullptr;
    };

    // A read-only view of a node definition. Pointers are owned by whoever
    // produced the view and must outlive its use.
    struct sgNodeDefinition
    {
        char const* id = nullptr;
        char const* name = nullptr;
        char const* category = nullptr;
        sgNodeKind kind = sgNodeKind::Function;
        sgSocketSpec const* inputs = nullptr;
        uint32_t inputCount = 0;
        sgSocketSpec const* outputs = nullptr;
        uint32_t outputCount = 0;
        sgCodeTemplates code;

        [[nodiscard]] char const* codeFor(sgBackend backend) const noexcept { return backend == sgBackend::Wgsl ? code.wgsl : code.glsl; }
    };

    enum class sgCatalogError
    {
        None,
        EmptyId,
        DuplicateId,
        EmptySocketName,
        MissingPlaceholder,
    };

    class sgNodeCatalog
    {
    public:
        virtual bool lookupDefinition(char const* id, char const* idEnd, sgNodeDefinition& out_definition) const noexcept = 0;

    protected:
        ~sgNodeCatalog() = default;
    };

    // In-memory catalog; registered definitions are copied into catalog-owned storage.
    // Views it hands out stay valid until the catalog is destroyed, including
    // across later registrations.
    class sgDefinitionCatalog : public sgNodeCatalog
    {
    public:
        [[nodiscard]] virtual sgCatalogError registerDefinition(sgNodeDefinition const& definition) = 0;

        [[nodiscard]] virtual uint32_t definitionCount() const noexcept = 0;
        virtual bool definitionAt(uint32_t index, sgNodeDefinition& out_definition) const noexcept = 0;

        // counts definitions in a category and writes up to maxCount of them
        virtual uint32_t definitionsInCategory(char const* category, sgNodeDefinition* out_definitions, uint32_t maxCount) const noexcept = 0;

    protected:
        ~sgDefinitionCatalog() = default;
    };

    [[nodiscard]] SG_API sgDefinitionCatalog* sgCreateDefinitionCatalog(sgAllocator& alloc);
    SG_API void sgDestroyDefinitionCatalog(sgDefinitionCatalog* catalog);
} // namespace shadegraph
