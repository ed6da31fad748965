#pragma once

#include "Handle.h"
#include <cpptrace/cpptrace.hpp>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace minir::core {

// Generational slot storage backing the drawable registry and the render
// backend's mesh and shader tables. Erasing a value bumps its slot's
// generation, so handles minted before the erase stop resolving even after
// the index is reused.
template <typename T, typename Tag>
class Pool {
public:
    using HandleType = Handle<Tag>;
    static constexpr uint32_t kMaxCapacity = HandleType::kInvalidIndex;

    Pool() = default;

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) noexcept = default;
    Pool& operator=(Pool&&) noexcept = default;

    template <typename... Args>
    HandleType emplace(Args&&... args) {
        uint32_t index;
        if (m_free.empty()) {
            if (m_values.size() >= kMaxCapacity) {
                throw cpptrace::runtime_error("Pool: all handle indices in use");
            }
            index = static_cast<uint32_t>(m_values.size());
            m_values.emplace_back();
            m_generations.push_back(0);
        } else {
            index = m_free.back();
            m_free.pop_back();
        }

        m_values[index].emplace(std::forward<Args>(args)...);
        ++m_live;
        return HandleType(index, m_generations[index]);
    }

    bool erase(HandleType handle) { return take(handle).has_value(); }

    // Moves the value out and frees its slot.
    std::optional<T> take(HandleType handle) {
        if (!validate(handle)) {
            return std::nullopt;
        }
        std::optional<T> out = std::exchange(m_values[handle.index], std::nullopt);
        release(handle.index);
        return out;
    }

    [[nodiscard]] T* get(HandleType handle) {
        return validate(handle) ? &*m_values[handle.index] : nullptr;
    }

    [[nodiscard]] const T* get(HandleType handle) const {
        return validate(handle) ? &*m_values[handle.index] : nullptr;
    }

    [[nodiscard]] bool validate(HandleType handle) const noexcept {
        return handle.isValid() && handle.index < m_values.size() &&
               m_values[handle.index].has_value() &&
               m_generations[handle.index] == handle.generation;
    }

    [[nodiscard]] size_t size() const noexcept { return m_live; }
    [[nodiscard]] size_t capacity() const noexcept { return m_values.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_live == 0; }

    // Drops every live value. Slot count is kept; all outstanding handles go stale.
    void clear() {
        for (uint32_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i]) {
                m_values[i].reset();
                release(i);
            }
        }
    }

    // Calls func(value, handle) for every live value in slot order.
    template <typename Func>
    void for_each(Func&& func) const {
        for (uint32_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i]) {
                func(*m_values[i], HandleType(i, m_generations[i]));
            }
        }
    }

private:
    void release(uint32_t index) {
        m_generations[index] = (m_generations[index] + 1) & HandleType::kGenerationMask;
        m_free.push_back(index);
        --m_live;
    }

    std::vector<std::optional<T>> m_values;
    std::vector<uint32_t> m_generations;
    std::vector<uint32_t> m_free;
    size_t m_live = 0;
};

}
