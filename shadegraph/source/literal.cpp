// shadegraph

#include "literal.hh"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace shadegraph {
    namespace {
        void writeVector(sgTextBuffer& out, char const* constructor, sgValue const& value, uint32_t components)
        {
            sgAppend(out, constructor);
            out.push_back('(');
            for (uint32_t index = 0; index != components; ++index)
            {
                if (index != 0)
                    sgAppend(out, ", ");

                // a lone scalar fills every component
                sgWriteFloatLiteral(out, value.isScalar() ? value.component(0) : value.component(index));
            }
            out.push_back(')');
        }
    } // namespace

    void sgWriteFloatLiteral(sgTextBuffer& out, float value)
    {
        if (!std::isfinite(value))
        {
            sgAppend(out, "0.0");
            return;
        }

        char digits[64];
        auto const result = fmt::format_to_n(digits, sizeof(digits), "{}", value);
        char const* const end = digits + result.size;

        char const* const exponent = std::find(static_cast<char const*>(digits), end, 'e');
        if (std::find(static_cast<char const*>(digits), exponent, '.') != exponent)
        {
            out.append(static_cast<char const*>(digits), end);
            return;
        }

        out.append(static_cast<char const*>(digits), exponent);
        sgAppend(out, ".0");
        out.append(exponent, end);
    }

    void sgWriteLiteral(sgTextBuffer& out, sgLiteralSyntax const& syntax, sgSocketType type, sgValue const& value)
    {
        switch (type)
        {
        case sgSocketType::Vector2: writeVector(out, syntax.vector2, value, 2); return;
        case sgSocketType::Vector3:
        case sgSocketType::Color: writeVector(out, syntax.vector3, value, 3); return;
        case sgSocketType::Scalar:
        case sgSocketType::Sampler:
        case sgSocketType::Texture: break;
        }

        sgWriteFloatLiteral(out, value.component(0));
    }

    void sgWriteColorLiteral(sgTextBuffer& out, sgLiteralSyntax const& syntax, sgValue const& value)
    {
        sgAppend(out, syntax.vector3);
        out.push_back('(');
        for (uint32_t index = 0; index != 3; ++index)
        {
            float const component = value.isScalar() ? value.component(0) : value.component(index);
            if (index != 0)
                sgAppend(out, ", ");
            sgFormatTo(out, "{:.4f}", std::isfinite(component) ? component : 0.f);
        }
        out.push_back(')');
    }
} // namespace shadegraph
