#pragma once

#include "Handle.h"
#include <vector>
#include <optional>
#include <cstdint>
#include <limits>
#include <memory>
#include <algorithm>
#include <span>
#include <stdexcept>
#include <functional>

#include "orrery/core/common.hpp"

namespace orrery::core {

// Generational slot storage. Slot 0 is a permanently vacant sentinel, a freed
// slot bumps its generation and is recycled LIFO.
template <typename T, typename Tag>
class Pool {
public:
    using HandleType = Handle<Tag>;
    static constexpr uint32_t kMaxCapacity = std::numeric_limits<uint32_t>::max();

    struct Slot {
        std::optional<T> storage;
        uint32_t generation = 1;

        Slot() = default;
        ~Slot() = default;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        Slot(Slot&& other) noexcept : storage(std::move(other.storage)), generation(other.generation) {
        }

        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                storage = std::move(other.storage);
                generation = other.generation;
            }
            return *this;
        }

        bool occupied() const { return storage.has_value(); }
    };

    Pool() {
        slots_.emplace_back();
    }
    ~Pool() = default;

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // A moved-from pool is left empty but usable, sentinel included.
    Pool(Pool&& other) noexcept
        : slots_(std::move(other.slots_)), free_list_(std::move(other.free_list_)) {
        other.resetToSentinel();
    }

    Pool& operator=(Pool&& other) noexcept {
        if (this != &other) {
            slots_ = std::move(other.slots_);
            free_list_ = std::move(other.free_list_);
            other.resetToSentinel();
        }
        return *this;
    }

    template <typename... Args>
    HandleType emplace(Args&&... args) {
        uint32_t index = 0;

        if (!free_list_.empty()) {
            index = free_list_.back();
            free_list_.pop_back();
        } else {
            if (slots_.size() >= kMaxCapacity) {
                throw std::runtime_error("Pool capacity exhausted");
            }
            index = static_cast<uint32_t>(slots_.size());
            slots_.emplace_back();
        }

        ORRERY_ASSERT(index != HandleType::kNullIndex, "Pool handed out the sentinel slot");
        ORRERY_ASSERT(index < slots_.size(), "Pool index out of range");
        Slot& slot = slots_[index];
        slot.storage.emplace(std::forward<Args>(args)...);

        return HandleType(index, slot.generation);
    }

    bool erase(HandleType handle) {
        if (!validate(handle)) {
            return false;
        }

        Slot& slot = slots_[handle.index];
        slot.storage.reset();
        bumpGeneration(slot);
        free_list_.push_back(handle.index);

        return true;
    }

    [[nodiscard]] T* get(HandleType handle) {
        if (!validate(handle)) {
            return nullptr;
        }
        return &(*slots_[handle.index].storage);
    }

    [[nodiscard]] const T* get(HandleType handle) const {
        if (!validate(handle)) {
            return nullptr;
        }
        return &(*slots_[handle.index].storage);
    }

    [[nodiscard]] std::optional<std::reference_wrapper<T>> getRef(HandleType handle) {
        if (!validate(handle)) {
            return std::nullopt;
        }
        return std::ref(*slots_[handle.index].storage);
    }

    [[nodiscard]] std::optional<std::reference_wrapper<const T>> getRef(HandleType handle) const {
        if (!validate(handle)) {
            return std::nullopt;
        }
        return std::cref(*slots_[handle.index].storage);
    }

    bool validate(HandleType handle) const noexcept {
        if (!handle.isValid() || handle.index >= slots_.size()) {
            return false;
        }
        const Slot& slot = slots_[handle.index];
        return slot.occupied() && slot.generation == handle.generation;
    }

    // Live elements, the sentinel excluded.
    size_t size() const noexcept {
        return slots_.size() - 1 - free_list_.size();
    }

    size_t capacity() const noexcept {
        return slots_.size() - 1;
    }

    bool empty() const noexcept {
        return size() == 0;
    }

    void clear() {
        free_list_.clear();
        for (size_t i = slots_.size() - 1; i >= 1; --i) {
            Slot& slot = slots_[i];
            if (slot.occupied()) {
                slot.storage.reset();
                bumpGeneration(slot);
            }
            free_list_.push_back(static_cast<uint32_t>(i));
        }
    }

    void reserve(size_t capacity) {
        slots_.reserve(std::min(capacity + 1, static_cast<size_t>(kMaxCapacity)));
    }

    template <typename Func>
    void for_each(Func&& func) {
        for (size_t i = 1; i < slots_.size(); ++i) {
            Slot& slot = slots_[i];
            if (slot.occupied()) {
                HandleType handle(static_cast<uint32_t>(i), slot.generation);
                func(*slot.storage, handle);
            }
        }
    }

    template <typename Func>
    void for_each(Func&& func) const {
        for (size_t i = 1; i < slots_.size(); ++i) {
            const Slot& slot = slots_[i];
            if (slot.occupied()) {
                HandleType handle(static_cast<uint32_t>(i), slot.generation);
                func(*slot.storage, handle);
            }
        }
    }

    std::span<Slot> slots() { return slots_; }
    std::span<const Slot> slots() const { return slots_; }

private:
    void resetToSentinel() noexcept {
        slots_.clear();
        free_list_.clear();
        slots_.emplace_back();
    }

    static void bumpGeneration(Slot& slot) {
        // Generation 0 is never issued, so a zeroed handle can't match a slot.
        if (++slot.generation == 0) {
            slot.generation = 1;
        }
    }

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_list_;
};

}
