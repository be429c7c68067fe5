#include <galaxy/SceneAttachment.hpp>
#include <galaxy/Logger.hpp>
#include <utility>

namespace galaxy {

SceneAttachment::SceneAttachment(Scene& scene, std::unique_ptr<Drawable> drawable)
    : m_scene(&scene)
    , m_drawable(std::move(drawable))
{
    if (m_drawable) {
        m_scene->attach(*m_drawable);
    }
}

SceneAttachment::~SceneAttachment() {
    reset();
}

SceneAttachment::SceneAttachment(SceneAttachment&& other) noexcept
    : m_scene(std::exchange(other.m_scene, nullptr))
    , m_drawable(std::move(other.m_drawable))
{}

SceneAttachment& SceneAttachment::operator=(SceneAttachment&& other) noexcept {
    if (this != &other) {
        reset();
        m_scene = std::exchange(other.m_scene, nullptr);
        m_drawable = std::move(other.m_drawable);
    }
    return *this;
}

void SceneAttachment::reset() {
    if (!m_drawable) {
        return;
    }

    Logger::instance().trace("Releasing {} ({} points)", m_drawable->name(), m_drawable->point_count());
    if (m_scene) {
        m_scene->detach(*m_drawable);
    }
    m_drawable.reset();
}

} // namespace galaxy
