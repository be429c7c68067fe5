#pragma once

#include "Drawable.hpp"
#include "GalaxyParameters.hpp"
#include "PointMaterial.hpp"
#include "RandomSource.hpp"
#include "Scene.hpp"
#include "SceneAttachment.hpp"
#include "UICallback.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace galaxy {

/**
 * @brief Owner of the galaxy parameters and the currently displayed point set
 *
 * The model is the only writer of the displayed galaxy. Each regenerate()
 * call releases the previous point cloud (detach, then destroy) before a new
 * one is generated, built by the drawable factory and attached to the scene.
 */
class GalaxyModel {
public:
    /**
     * @brief Create a model (nothing is generated until regenerate())
     *
     * @param factory Builds drawables for the active renderer
     * @param scene Scene the galaxy is attached to
     * @param random Random source used by every regeneration
     * @param params Initial parameters (clamped into their domains)
     */
    GalaxyModel(DrawableFactory& factory,
                Scene& scene,
                std::unique_ptr<RandomSource> random,
                const GalaxyParameters& params = {});

    // Non-copyable, non-movable (UI callbacks capture this)
    GalaxyModel(const GalaxyModel&) = delete;
    GalaxyModel& operator=(const GalaxyModel&) = delete;
    GalaxyModel(GalaxyModel&&) = delete;
    GalaxyModel& operator=(GalaxyModel&&) = delete;

    /**
     * @brief Replace the displayed galaxy with a freshly generated one
     *
     * On a factory error the old galaxy is already gone and the scene is left
     * without a galaxy; the next successful call restores it.
     *
     * @return Error message if the drawable could not be created
     */
    std::expected<void, std::string> regenerate();

    [[nodiscard]] const GalaxyParameters& parameters() const { return m_params; }

    /**
     * @brief Replace the parameter record (clamped, does not regenerate)
     */
    void set_parameters(const GalaxyParameters& params);

    /**
     * @brief Material derived from the current parameters
     */
    [[nodiscard]] PointMaterial material() const;

    /**
     * @brief Get UI callbacks for the tweak panel
     *
     * One entry per parameter. Setters write the (snapped, clamped) value,
     * on_commit regenerates and logs a failure.
     */
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

    /**
     * @brief Currently displayed drawable, or nullptr
     */
    [[nodiscard]] Drawable* displayed() const { return m_displayed.get(); }

    /**
     * @brief Number of successful regenerations
     */
    [[nodiscard]] uint64_t generation() const { return m_generation; }

private:
    void commit();

    DrawableFactory& m_factory;
    Scene& m_scene;
    std::unique_ptr<RandomSource> m_random;
    GalaxyParameters m_params;
    SceneAttachment m_displayed;
    uint64_t m_generation = 0;
};

} // namespace galaxy
