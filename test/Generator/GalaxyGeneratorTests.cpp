#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <galaxy/GalaxyGenerator.hpp>
#include <galaxy/Logger.hpp>

#include <cmath>
#include <vector>

using namespace galaxy;
using Catch::Approx;

namespace
{

/**
 * @brief Replays a fixed list of draws (cycling) and counts how many were taken
 */
class ScriptedRandomSource : public RandomSource
{
public:
	explicit ScriptedRandomSource(std::vector<float> draws) : m_draws(std::move(draws)) {}

	float next_uniform() override
	{
		float value = m_draws[m_taken % m_draws.size()];
		m_taken++;
		return value;
	}

	[[nodiscard]] size_t taken() const { return m_taken; }

private:
	std::vector<float> m_draws;
	size_t m_taken = 0;
};

GalaxyParameters flat_disc(uint32_t count, uint32_t branches, float radius)
{
	GalaxyParameters params;
	params.count = count;
	params.branches = branches;
	params.radius = radius;
	params.spin = 0.0f;
	params.randomness = 0.0f;
	return params;
}

} // namespace

TEST_CASE("Generated buffer has one position and one color per point", "[generator]")
{
	Logger::instance().set_level(spdlog::level::trace);
	DefaultRandomSource random(42);

	SECTION("default parameters")
	{
		GalaxyParameters params;
		auto points = generate(params, random);
		REQUIRE(points.count() == params.count);
		REQUIRE(points.positions().size() == 3 * params.count);
		REQUIRE(points.colors().size() == 3 * params.count);
	}

	SECTION("maximum count")
	{
		GalaxyParameters params;
		params.count = GalaxyParameters::count_domain.max;
		auto points = generate(params, random);
		REQUIRE(points.count() == 100'000);
		REQUIRE(points.positions().size() == points.colors().size());
	}
}

TEST_CASE("Points stay inside radius plus randomness", "[generator]")
{
	DefaultRandomSource random(7);
	GalaxyParameters params;
	params.count = 5000;
	params.radius = 3.0f;
	params.randomness = 0.8f;
	params.randomness_power = 1.0f;
	params.spin = 2.5f;

	auto points = generate(params, random);
	const float bound = params.radius + params.randomness + 1e-4f;

	for (uint32_t i = 0; i < points.count(); i++)
	{
		auto p = points.position(i);
		REQUIRE(std::abs(p.x) <= bound);
		REQUIRE(std::abs(p.z) <= bound);
		REQUIRE(std::abs(p.y) <= params.randomness + 1e-4f);
	}
}

TEST_CASE("Branch angle is periodic in the branch count", "[generator]")
{
	SECTION("first arm starts at zero")
	{
		REQUIRE(branch_angle(0, 3) == 0.0f);
	}

	SECTION("arms are evenly spaced")
	{
		REQUIRE(branch_angle(1, 4) == Approx(glm::half_pi<float>()));
		REQUIRE(branch_angle(2, 4) == Approx(glm::pi<float>()));
	}

	SECTION("index i and i + branches share an arm")
	{
		for (uint32_t branches : {2u, 3u, 7u, 20u})
		{
			for (uint32_t i = 0; i < 50; i++)
			{
				REQUIRE(branch_angle(i, branches) == branch_angle(i + branches, branches));
				REQUIRE(branch_angle(i, branches) < glm::two_pi<float>());
			}
		}
	}
}

TEST_CASE("Full-radius draws land on a circle", "[generator]")
{
	// Largest draw the source may return
	const float top = std::nextafter(1.0f, 0.0f);
	ScriptedRandomSource random({top});
	auto params = flat_disc(5, 5, 10.0f);

	auto points = generate(params, random);
	REQUIRE(points.count() == 5);

	for (uint32_t i = 0; i < 5; i++)
	{
		float angle = static_cast<float>(i) * glm::two_pi<float>() / 5.0f;
		auto p = points.position(i);
		REQUIRE(p.x == Approx(10.0f * std::cos(angle)).margin(1e-4));
		REQUIRE(p.y == 0.0f);
		REQUIRE(p.z == Approx(10.0f * std::sin(angle)).margin(1e-4));

		auto c = points.color(i);
		REQUIRE(c.r == Approx(params.outside_color.r).margin(1e-5));
		REQUIRE(c.g == Approx(params.outside_color.g).margin(1e-5));
		REQUIRE(c.b == Approx(params.outside_color.b).margin(1e-5));
	}
}

TEST_CASE("Each point keeps its arm angle and its own radius", "[generator]")
{
	const std::vector<float> draws{0.1f, 0.35f, 0.6f, 0.85f, 0.5f};
	ScriptedRandomSource random(draws);
	auto params = flat_disc(5, 5, 10.0f);

	auto points = generate(params, random);
	REQUIRE(random.taken() == 5);

	for (uint32_t i = 0; i < 5; i++)
	{
		auto p = points.position(i);
		float expected_radius = draws[i] * params.radius;
		REQUIRE(std::sqrt(p.x * p.x + p.z * p.z) == Approx(expected_radius).margin(1e-4));

		float angle = std::atan2(p.z, p.x);
		if (angle < 0.0f)
		{
			angle += glm::two_pi<float>();
		}
		REQUIRE(angle == Approx(branch_angle(i, params.branches)).margin(1e-4));

		auto c = points.color(i);
		auto expected = radial_color(params.inside_color, params.outside_color, draws[i]);
		REQUIRE(c.r == Approx(expected.r).margin(1e-5));
		REQUIRE(c.g == Approx(expected.g).margin(1e-5));
		REQUIRE(c.b == Approx(expected.b).margin(1e-5));
	}
}

TEST_CASE("Color blends linearly with normalized radius", "[generator]")
{
	SECTION("half radius gives the midpoint color")
	{
		ScriptedRandomSource random({0.5f});
		auto params = flat_disc(1, 4, 10.0f);
		params.inside_color = Color(1.0f, 0.0f, 0.0f);
		params.outside_color = Color(0.0f, 0.0f, 1.0f);

		auto points = generate(params, random);
		auto p = points.position(0);
		REQUIRE(p.x == Approx(5.0f));
		REQUIRE(p.z == Approx(0.0f).margin(1e-6));

		auto c = points.color(0);
		REQUIRE(c.r == Approx(0.5f));
		REQUIRE(c.g == Approx(0.0f));
		REQUIRE(c.b == Approx(0.5f));
	}

	SECTION("center takes the inside color")
	{
		ScriptedRandomSource random({0.0f});
		auto params = flat_disc(3, 3, 5.0f);

		auto points = generate(params, random);
		for (uint32_t i = 0; i < points.count(); i++)
		{
			REQUIRE(points.position(i) == glm::vec3(0.0f));
			REQUIRE(points.color(i) == params.inside_color);
		}
	}

	SECTION("radial_color endpoints")
	{
		Color inside(0.2f, 0.4f, 0.6f);
		Color outside(1.0f, 1.0f, 1.0f);
		REQUIRE(radial_color(inside, outside, 0.0f) == inside);
		REQUIRE(radial_color(inside, outside, 1.0f) == outside);
	}
}

TEST_CASE("Spin rotates points by radius", "[generator]")
{
	ScriptedRandomSource random({0.5f});
	auto params = flat_disc(1, 3, 2.0f);
	params.spin = 0.5f;

	// r = 1, angle = 0 + 1 * 0.5
	auto points = generate(params, random);
	auto p = points.position(0);
	REQUIRE(p.x == Approx(std::cos(0.5f)));
	REQUIRE(p.z == Approx(std::sin(0.5f)));
}

TEST_CASE("Jitter magnitude follows randomness power", "[generator]")
{
	SECTION("higher power pulls jitter toward zero")
	{
		float previous = 1.0f;
		for (float power : {1.0f, 2.0f, 3.0f, 5.0f, 10.0f})
		{
			ScriptedRandomSource random({0.6f, 0.9f});
			float jitter = sample_jitter(random, 1.0f, power);
			REQUIRE(jitter == Approx(std::pow(0.6f, power)));
			REQUIRE(jitter < previous);
			previous = jitter;
		}
	}

	SECTION("jitter is scaled by randomness")
	{
		ScriptedRandomSource random({0.5f, 0.9f});
		REQUIRE(sample_jitter(random, 2.0f, 1.0f) == Approx(1.0f));
	}

	SECTION("sign draw below one half negates")
	{
		ScriptedRandomSource random({0.5f, 0.1f});
		REQUIRE(sample_jitter(random, 1.0f, 1.0f) == Approx(-0.5f));
	}

	SECTION("jitter consumes two draws")
	{
		ScriptedRandomSource random({0.3f});
		(void)sample_jitter(random, 1.0f, 3.0f);
		REQUIRE(random.taken() == 2);
	}
}

TEST_CASE("Draw count depends on randomness", "[generator]")
{
	SECTION("no jitter draws when randomness is zero")
	{
		ScriptedRandomSource random({0.25f, 0.75f});
		auto params = flat_disc(100, 3, 5.0f);
		auto points = generate(params, random);
		REQUIRE(random.taken() == 100);
		for (uint32_t i = 0; i < points.count(); i++)
		{
			REQUIRE(points.position(i).y == 0.0f);
		}
	}

	SECTION("seven draws per point with jitter")
	{
		ScriptedRandomSource random({0.25f, 0.75f});
		auto params = flat_disc(100, 3, 5.0f);
		params.randomness = 0.5f;
		(void)generate(params, random);
		REQUIRE(random.taken() == 700);
	}
}

TEST_CASE("Seeded sources reproduce a galaxy", "[generator]")
{
	GalaxyParameters params;
	DefaultRandomSource first(1234);
	DefaultRandomSource second(1234);

	auto a = generate(params, first);
	auto b = generate(params, second);
	REQUIRE(a.positions() == b.positions());
	REQUIRE(a.colors() == b.colors());
}
