// shadegraph

#pragma once

#include "shadegraph/alloc.hh"

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace shadegraph {
    // Growable array drawing its storage from an sgAllocator, optionally
    // indexed by a typed index (see index.hh).
    template <typename Value, typename IndexT = uint32_t>
    class sgArray
    {
    public:
        static_assert(std::is_nothrow_destructible_v<Value>);
        static_assert(std::is_nothrow_move_constructible_v<Value>);

        using index_type = IndexT;

        explicit sgArray(sgAllocator& allocator) noexcept : allocator_(&allocator) {}
        ~sgArray() noexcept { deallocate(); }

        sgArray(sgArray&& rhs) noexcept : first_(rhs.first_), sentinel_(rhs.sentinel_), last_(rhs.last_), allocator_(rhs.allocator_)
        {
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
        }

        sgArray& operator=(sgArray&& rhs) noexcept
        {
            deallocate();
            first_ = rhs.first_;
            sentinel_ = rhs.sentinel_;
            last_ = rhs.last_;
            allocator_ = rhs.allocator_;
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
            return *this;
        }

        uint32_t size() const noexcept { return static_cast<uint32_t>(sentinel_ - first_); }
        bool empty() const noexcept { return first_ == sentinel_; }

        Value* data() noexcept { return first_; }
        Value const* data() const noexcept { return first_; }

        Value* begin() noexcept { return first_; }
        Value const* begin() const noexcept { return first_; }

        Value* end() noexcept { return sentinel_; }
        Value const* end() const noexcept { return sentinel_; }

        Value& operator[](index_type index) noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }
        Value const& operator[](index_type index) const noexcept
        {
            SG_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }

        Value& back() noexcept
        {
            SG_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }

        bool contains(index_type index) const noexcept { return static_cast<uint32_t>(index) < size(); }

        void clear() noexcept;

        Value& pushBack(Value const& value) { return emplaceBack(value); }
        Value& pushBack(Value&& value) { return emplaceBack(static_cast<Value&&>(value)); }

        template <typename... Args>
        Value& emplaceBack(Args&&... args);

        sgAllocator& allocator() const noexcept { return *allocator_; }

    private:
        void reallocate(uint32_t required);
        void deallocate() noexcept;

        Value* first_ = nullptr;
        Value* sentinel_ = nullptr;
        Value* last_ = nullptr;
        sgAllocator* allocator_ = nullptr;
    };

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::clear() noexcept
    {
        if constexpr (std::is_trivially_destructible_v<Value>)
        {
            sentinel_ = first_;
        }
        else
        {
            while (sentinel_ != first_)
                (--sentinel_)->~Value();
        }
    }

    template <typename Value, typename IndexT>
    template <typename... Args>
    Value& sgArray<Value, IndexT>::emplaceBack(Args&&... args)
    {
        if (sentinel_ == last_)
        {
            uint32_t const cap = static_cast<uint32_t>(last_ - first_);
            reallocate(cap < 16 ? 16 : (cap + (cap >> 1))); // grow by 50%
        }

        return *new (sentinel_++) Value(static_cast<Args&&>(args)...);
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::reallocate(uint32_t required)
    {
        uint32_t const count = size();

        if (static_cast<uint32_t>(last_ - first_) >= required)
            return;

        Value* memory = static_cast<Value*>(allocator_->allocate(required * sizeof(Value), alignof(Value)));
        if (first_ != nullptr)
        {
            if constexpr (std::is_trivially_move_constructible_v<Value>)
            {
                std::memcpy(static_cast<void*>(memory), first_, count * sizeof(Value));
            }
            else
            {
                for (Value *item = first_, *out = memory; item != sentinel_; ++item, ++out)
                    new (out) Value(static_cast<Value&&>(*item));
            }
        }

        deallocate();

        first_ = memory;
        sentinel_ = memory + count;
        last_ = memory + required;
    }

    template <typename Value, typename IndexT>
    void sgArray<Value, IndexT>::deallocate() noexcept
    {
        clear();
        if (first_ != nullptr)
            allocator_->free(first_, static_cast<uint32_t>(last_ - first_) * sizeof(Value), alignof(Value));
        first_ = sentinel_ = last_ = nullptr;
    }
} // namespace shadegraph
