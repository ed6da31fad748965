#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace minir::core {

// Generational index into a Pool. A handle outlives the slot it points to
// safely: once the slot is freed its generation moves on and the handle
// stops validating.
template <typename Tag>
struct Handle {
    static constexpr uint32_t kIndexBits = 20;
    static constexpr uint32_t kGenerationBits = 12;
    static constexpr uint32_t kInvalidIndex = (1u << kIndexBits) - 1u;
    static constexpr uint32_t kGenerationMask = (1u << kGenerationBits) - 1u;

    uint32_t index : kIndexBits = kInvalidIndex;
    uint32_t generation : kGenerationBits = 0;

    constexpr Handle() = default;
    constexpr Handle(uint32_t idx, uint32_t gen)
        : index(idx & kInvalidIndex), generation(gen & kGenerationMask) {}

    [[nodiscard]] constexpr bool isValid() const { return index != kInvalidIndex; }
    constexpr void invalidate() { index = kInvalidIndex; generation = 0; }

    [[nodiscard]] constexpr uint32_t packed() const {
        return (static_cast<uint32_t>(generation) << kIndexBits) | index;
    }

    friend constexpr bool operator==(const Handle& a, const Handle& b) {
        return a.packed() == b.packed();
    }
    friend constexpr auto operator<=>(const Handle& a, const Handle& b) {
        return a.packed() <=> b.packed();
    }

    explicit operator bool() const { return isValid(); }
};

struct DrawableTag {};
struct GpuMeshTag {};
struct ShaderTag {};
struct TextureTag {};

} // namespace minir::core

using DrawableHandle = minir::core::Handle<minir::core::DrawableTag>;
using GpuMeshHandle = minir::core::Handle<minir::core::GpuMeshTag>;
using ShaderHandle = minir::core::Handle<minir::core::ShaderTag>;
using TextureHandle = minir::core::Handle<minir::core::TextureTag>;

inline constexpr DrawableHandle INVALID_DRAWABLE_HANDLE{};
inline constexpr GpuMeshHandle INVALID_GPU_MESH_HANDLE{};
inline constexpr ShaderHandle INVALID_SHADER_HANDLE{};
inline constexpr TextureHandle INVALID_TEXTURE_HANDLE{};

template <typename Tag>
struct std::hash<minir::core::Handle<Tag>> {
    size_t operator()(const minir::core::Handle<Tag>& h) const noexcept {
        return std::hash<uint32_t>{}(h.packed());
    }
};
