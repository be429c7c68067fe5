#pragma once

#include "PointBuffer.hpp"
#include "PointMaterial.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace galaxy {

/**
 * @brief Render-side handle for a point cloud
 *
 * Owns the point buffer it was built from together with its material.
 * Implementations add whatever storage the renderer needs (GPU buffers) and
 * release it in their destructor.
 */
class Drawable {
public:
    Drawable(PointBuffer points, const PointMaterial& material)
        : m_points(std::move(points)), m_material(material) {}

    virtual ~Drawable() = default;

    Drawable(const Drawable&) = delete;
    Drawable& operator=(const Drawable&) = delete;

    /**
     * @brief Get drawable name for logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] const PointBuffer& points() const { return m_points; }
    [[nodiscard]] const PointMaterial& material() const { return m_material; }
    [[nodiscard]] uint32_t point_count() const { return m_points.count(); }

private:
    PointBuffer m_points;
    PointMaterial m_material;
};

/**
 * @brief Capability to build drawables for a renderer
 */
class DrawableFactory {
public:
    virtual ~DrawableFactory() = default;

    /**
     * @brief Create a point cloud drawable
     *
     * @param points Point buffer, moved into the drawable
     * @param material Rendering options
     * @return Drawable or error message
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<Drawable>, std::string> create_points(
        PointBuffer&& points,
        const PointMaterial& material
    ) = 0;
};

} // namespace galaxy
