#include "minir/renderer/scene/ContentRegistry.hpp"

#include "minir/core/logger.hpp"

namespace minir::renderer::scene
{
    ContentRegistry::~ContentRegistry()
    {
        clear();
    }

    DrawableHandle ContentRegistry::add(std::unique_ptr<Drawable> drawable)
    {
        if (!drawable)
        {
            return INVALID_DRAWABLE_HANDLE;
        }

        const DrawableKind kind = drawable->kind();
        const DrawableHandle handle = m_entries.emplace(Entry{std::move(drawable), 0});
        core::Logger::Scene.trace("ContentRegistry: added {} (handle {})", toString(kind), handle.packed());
        return handle;
    }

    bool ContentRegistry::remove(DrawableHandle handle)
    {
        const Entry* entry = m_entries.get(handle);
        if (entry == nullptr)
        {
            return false;
        }
        if (entry->users > 0)
        {
            core::Logger::Scene.warn("ContentRegistry: refusing to remove drawable {} with {} user(s)",
                                     handle.packed(), entry->users);
            return false;
        }
        return m_entries.erase(handle);
    }

    Drawable* ContentRegistry::get(DrawableHandle handle)
    {
        Entry* entry = m_entries.get(handle);
        return entry != nullptr ? entry->drawable.get() : nullptr;
    }

    const Drawable* ContentRegistry::get(DrawableHandle handle) const
    {
        const Entry* entry = m_entries.get(handle);
        return entry != nullptr ? entry->drawable.get() : nullptr;
    }

    bool ContentRegistry::acquire(DrawableHandle handle)
    {
        Entry* entry = m_entries.get(handle);
        if (entry == nullptr)
        {
            return false;
        }
        ++entry->users;
        return true;
    }

    bool ContentRegistry::release(DrawableHandle handle)
    {
        Entry* entry = m_entries.get(handle);
        if (entry == nullptr || entry->users == 0)
        {
            return false;
        }
        --entry->users;
        return true;
    }

    uint32_t ContentRegistry::userCount(DrawableHandle handle) const
    {
        const Entry* entry = m_entries.get(handle);
        return entry != nullptr ? entry->users : 0u;
    }

    void ContentRegistry::clear()
    {
        if (m_entries.empty())
        {
            return;
        }

        uint32_t referenced = 0;
        m_entries.for_each([&referenced](const Entry& entry, DrawableHandle) {
            if (entry.users > 0)
            {
                ++referenced;
            }
        });
        if (referenced > 0)
        {
            core::Logger::Scene.warn("ContentRegistry: clearing {} drawable(s) still referenced by scene objects",
                                     referenced);
        }

        core::Logger::Scene.debug("ContentRegistry: releasing {} drawable(s)", m_entries.size());
        m_entries.clear();
    }
}
