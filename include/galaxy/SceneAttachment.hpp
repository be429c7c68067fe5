#pragma once

#include "Drawable.hpp"
#include "Scene.hpp"
#include <memory>

namespace galaxy {

/**
 * @brief Scoped ownership of one drawable attached to a scene
 *
 * Attaches on construction. On destruction or reset() the drawable is
 * detached first and destroyed afterwards, so the scene never references a
 * destroyed drawable.
 */
class SceneAttachment {
public:
    SceneAttachment() = default;
    SceneAttachment(Scene& scene, std::unique_ptr<Drawable> drawable);
    ~SceneAttachment();

    // Non-copyable, movable
    SceneAttachment(const SceneAttachment&) = delete;
    SceneAttachment& operator=(const SceneAttachment&) = delete;
    SceneAttachment(SceneAttachment&& other) noexcept;
    SceneAttachment& operator=(SceneAttachment&& other) noexcept;

    /**
     * @brief Detach and destroy the owned drawable (no-op when empty)
     */
    void reset();

    [[nodiscard]] Drawable* get() const { return m_drawable.get(); }
    [[nodiscard]] explicit operator bool() const { return m_drawable != nullptr; }

private:
    Scene* m_scene = nullptr;
    std::unique_ptr<Drawable> m_drawable;
};

} // namespace galaxy
