#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>

namespace Cellvox::ChunkStorage {

/**
 * @file BindingSlots.h
 * @brief Fixed-arity slot array with a live prefix and placeholder tail
 *
 * Downstream pipelines are built against a binding of constant arity. The
 * first LiveCount() entries hold real resources, the rest up to Arity() hold
 * a placeholder so the binding shape never changes when groups are added.
 *
 * Usage:
 * @code
 * BindingSlots<GroupHandle, MAX_BINDING_ARITY> slots;
 * slots.AddLive(group0);
 * slots.AddLive(group1);
 * slots.FillPlaceholders(dummy, 8);   // Arity() == 8, LiveCount() == 2
 * device.createBinding(atlas, slots, true);
 * @endcode
 */
template<typename T, size_t N>
class BindingSlots {
public:
    using value_type = T;
    using const_iterator = const T*;

    BindingSlots() = default;

    // ========================================================================
    // Element access
    // ========================================================================

    const T& At(size_t index) const {
        if (index >= arity_) {
            throw std::out_of_range("BindingSlots::At index beyond arity");
        }
        return data_[index];
    }

    const T& operator[](size_t index) const { return data_[index]; }

    bool IsPlaceholder(size_t index) const {
        return index >= liveCount_ && index < arity_;
    }

    const T* Data() const { return data_.data(); }

    // ========================================================================
    // Capacity
    // ========================================================================

    size_t LiveCount() const { return liveCount_; }
    size_t Arity() const { return arity_; }
    static constexpr size_t Capacity() { return N; }

    // ========================================================================
    // Modifiers
    // ========================================================================

    /**
     * @brief Append a live entry; only valid before FillPlaceholders()
     */
    void AddLive(const T& value) {
        if (liveCount_ >= N) {
            throw std::overflow_error("BindingSlots::AddLive overflow - capacity exceeded");
        }
        if (arity_ != liveCount_) {
            throw std::logic_error("BindingSlots::AddLive after placeholders were filled");
        }
        data_[liveCount_++] = value;
        arity_ = liveCount_;
    }

    /**
     * @brief Pad with placeholder up to the requested arity
     */
    void FillPlaceholders(const T& placeholder, size_t arity) {
        if (arity > N) {
            throw std::overflow_error("BindingSlots::FillPlaceholders exceeds capacity");
        }
        if (arity < liveCount_) {
            throw std::logic_error("BindingSlots::FillPlaceholders arity below live count");
        }
        for (size_t i = liveCount_; i < arity; ++i) {
            data_[i] = placeholder;
        }
        arity_ = arity;
    }

    void Clear() {
        liveCount_ = 0;
        arity_ = 0;
    }

    // ========================================================================
    // Iterators (cover the full arity, placeholders included)
    // ========================================================================

    const_iterator begin() const { return data_.data(); }
    const_iterator end() const { return data_.data() + arity_; }

private:
    std::array<T, N> data_{};
    size_t liveCount_ = 0;
    size_t arity_ = 0;
};

} // namespace Cellvox::ChunkStorage
