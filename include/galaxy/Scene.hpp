#pragma once

#include "Drawable.hpp"
#include <cstddef>
#include <vector>

namespace galaxy {

/**
 * @brief Retained set of drawables the renderer draws every frame
 *
 * The scene does not own its drawables; see SceneAttachment for the owning
 * side. Drawables are kept in attach order.
 */
class Scene {
public:
    /**
     * @brief Attach a drawable (no-op if already attached)
     */
    void attach(Drawable& drawable);

    /**
     * @brief Detach a drawable (logs a warning if it was not attached)
     */
    void detach(Drawable& drawable);

    [[nodiscard]] bool contains(const Drawable& drawable) const;
    [[nodiscard]] size_t size() const { return m_drawables.size(); }
    [[nodiscard]] bool empty() const { return m_drawables.empty(); }

    [[nodiscard]] const std::vector<Drawable*>& drawables() const { return m_drawables; }

private:
    std::vector<Drawable*> m_drawables;
};

} // namespace galaxy
