// shadegraph

#include "shadegraph/value.hh"

namespace shadegraph {
    bool sgValue::operator==(sgValue const& right) const noexcept
    {
        if (count_ != right.count_)
            return false;

        for (uint32_t index = 0; index != count_; ++index)
            if (components_[index] != right.components_[index])
                return false;

        return true;
    }
} // namespace shadegraph
