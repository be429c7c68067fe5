#include <galaxy/GalaxyModel.hpp>
#include <galaxy/GalaxyGenerator.hpp>
#include <galaxy/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace galaxy {

namespace {

float snap(float value, const ParameterDomain<float>& domain) {
    if (domain.step > 0.0f) {
        value = domain.min + std::round((value - domain.min) / domain.step) * domain.step;
    }
    return std::clamp(value, domain.min, domain.max);
}

uint32_t snap(int value, const ParameterDomain<uint32_t>& domain) {
    auto min = static_cast<int>(domain.min);
    auto max = static_cast<int>(domain.max);
    auto step = static_cast<int>(domain.step);
    value = std::clamp(value, min, max);
    if (step > 1) {
        value = min + ((value - min + step / 2) / step) * step;
        value = std::min(value, max);
    }
    return static_cast<uint32_t>(value);
}

ContinuousCallback float_field(float& field, const ParameterDomain<float>& domain) {
    return ContinuousCallback{
        .setter = [&field, domain](float v) { field = snap(v, domain); },
        .getter = [&field]() { return field; },
        .min = domain.min,
        .max = domain.max,
        .step = domain.step
    };
}

DiscreteCallback int_field(uint32_t& field, const ParameterDomain<uint32_t>& domain) {
    return DiscreteCallback{
        .setter = [&field, domain](int v) { field = snap(v, domain); },
        .getter = [&field]() { return static_cast<int>(field); },
        .min = static_cast<int>(domain.min),
        .max = static_cast<int>(domain.max),
        .step = static_cast<int>(domain.step)
    };
}

ColorCallback color_field(Color& field) {
    return ColorCallback{
        .setter = [&field](Color c) { field = glm::clamp(c, Color(0.0f), Color(1.0f)); },
        .getter = [&field]() { return field; }
    };
}

} // anonymous namespace

GalaxyModel::GalaxyModel(DrawableFactory& factory,
                         Scene& scene,
                         std::unique_ptr<RandomSource> random,
                         const GalaxyParameters& params)
    : m_factory(factory)
    , m_scene(scene)
    , m_random(std::move(random))
    , m_params(params.clamped())
{}

void GalaxyModel::set_parameters(const GalaxyParameters& params) {
    m_params = params.clamped();
}

PointMaterial GalaxyModel::material() const {
    return PointMaterial{
        .size = m_params.size,
        .size_attenuation = true,
        .additive_blending = true,
        .depth_write = false,
        .vertex_colors = true
    };
}

std::expected<void, std::string> GalaxyModel::regenerate() {
    // Dispose before replace
    m_displayed.reset();

    auto points = generate(m_params, *m_random);

    auto drawable = m_factory.create_points(std::move(points), material());
    if (!drawable) {
        return std::unexpected(fmt::format("Failed to create galaxy drawable: {}", drawable.error()));
    }

    m_displayed = SceneAttachment(m_scene, std::move(drawable.value()));
    m_generation++;

    Logger::instance().info("Galaxy #{}: {} points, radius {:.2f}, {} branches, spin {:.3f}",
        m_generation, m_params.count, m_params.radius, m_params.branches, m_params.spin);
    return {};
}

void GalaxyModel::commit() {
    if (auto result = regenerate(); !result) {
        Logger::instance().error("{}", result.error());
    }
}

std::vector<UICallback> GalaxyModel::get_ui_callbacks() {
    auto on_commit = [this]() { commit(); };

    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Count", int_field(m_params.count, GalaxyParameters::count_domain), on_commit);
    callbacks.emplace_back("Size", float_field(m_params.size, GalaxyParameters::size_domain), on_commit);
    callbacks.emplace_back("Radius", float_field(m_params.radius, GalaxyParameters::radius_domain), on_commit);
    callbacks.emplace_back("Branches", int_field(m_params.branches, GalaxyParameters::branches_domain), on_commit);
    callbacks.emplace_back("Spin", float_field(m_params.spin, GalaxyParameters::spin_domain), on_commit);
    callbacks.emplace_back("Randomness", float_field(m_params.randomness, GalaxyParameters::randomness_domain), on_commit);
    callbacks.emplace_back("Randomness Power",
        float_field(m_params.randomness_power, GalaxyParameters::randomness_power_domain), on_commit);
    callbacks.emplace_back("Inside Color", color_field(m_params.inside_color), on_commit);
    callbacks.emplace_back("Outside Color", color_field(m_params.outside_color), on_commit);
    return callbacks;
}

} // namespace galaxy
