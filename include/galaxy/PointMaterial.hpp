#pragma once

namespace galaxy {

/**
 * @brief Rendering options for a point cloud
 */
struct PointMaterial {
    float size = 0.02f;              ///< Point size (world units when attenuated, else pixels)
    bool size_attenuation = true;    ///< Shrink points with distance to the camera
    bool additive_blending = true;   ///< Blend src * alpha + dst instead of replacing
    bool depth_write = false;        ///< Write to the depth buffer (depth test stays enabled)
    bool vertex_colors = true;       ///< Use per-point colors (white otherwise)

    bool operator==(const PointMaterial&) const = default;
};

} // namespace galaxy
