#pragma once

#include "minir/core/Handle.h"
#include "minir/core/Pool.hpp"
#include "minir/renderer/scene/Drawable.hpp"

#include <memory>

namespace minir::renderer::scene
{
    // Owns every Drawable handed to the scene. SceneObjects refer to content by
    // DrawableHandle and register themselves as users, so sharing one Drawable
    // between objects is explicit and observable instead of implied by a copy.
    //
    // The registry must outlive every SceneObject that references it.
    class ContentRegistry
    {
    public:
        ContentRegistry() = default;
        ~ContentRegistry();

        ContentRegistry(const ContentRegistry&) = delete;
        ContentRegistry& operator=(const ContentRegistry&) = delete;

        DrawableHandle add(std::unique_ptr<Drawable> drawable);

        // Destroys the drawable. Fails for stale handles and for drawables
        // still referenced by a SceneObject.
        bool remove(DrawableHandle handle);

        [[nodiscard]] Drawable* get(DrawableHandle handle);
        [[nodiscard]] const Drawable* get(DrawableHandle handle) const;
        [[nodiscard]] bool contains(DrawableHandle handle) const { return m_entries.validate(handle); }

        // User bookkeeping; returns false for stale handles.
        bool acquire(DrawableHandle handle);
        bool release(DrawableHandle handle);

        [[nodiscard]] uint32_t userCount(DrawableHandle handle) const;
        [[nodiscard]] bool isShared(DrawableHandle handle) const { return userCount(handle) > 1; }

        [[nodiscard]] size_t size() const { return m_entries.size(); }
        [[nodiscard]] bool empty() const { return m_entries.empty(); }

        // Destroys all content regardless of outstanding users.
        void clear();

    private:
        struct Entry
        {
            std::unique_ptr<Drawable> drawable;
            uint32_t users = 0;
        };

        core::Pool<Entry, core::DrawableTag> m_entries;
    };
}
