#include <galaxy/Scene.hpp>
#include <galaxy/Logger.hpp>
#include <algorithm>

namespace galaxy {

void Scene::attach(Drawable& drawable) {
    if (contains(drawable)) {
        return;
    }
    m_drawables.push_back(&drawable);
    Logger::instance().trace("Attached {} ({} points), scene size {}",
        drawable.name(), drawable.point_count(), m_drawables.size());
}

void Scene::detach(Drawable& drawable) {
    auto it = std::ranges::find(m_drawables, &drawable);
    if (it == m_drawables.end()) {
        Logger::instance().warn("Detach of {} which is not attached to the scene", drawable.name());
        return;
    }
    m_drawables.erase(it);
    Logger::instance().trace("Detached {}, scene size {}", drawable.name(), m_drawables.size());
}

bool Scene::contains(const Drawable& drawable) const {
    return std::ranges::find(m_drawables, &drawable) != m_drawables.end();
}

} // namespace galaxy
