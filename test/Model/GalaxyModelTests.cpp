#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <galaxy/GalaxyModel.hpp>
#include <galaxy/Logger.hpp>

#include <string>
#include <vector>

using namespace galaxy;
using Catch::Approx;

namespace
{

/**
 * @brief Shared bookkeeping between the fake factory and its drawables
 */
struct FactoryLog
{
	int live = 0;
	int created = 0;
	int destroyed = 0;
	std::vector<int> live_at_create;
	std::vector<std::string> events;
};

class FakeDrawable : public Drawable
{
public:
	FakeDrawable(PointBuffer points, const PointMaterial& material, FactoryLog& log)
		: Drawable(std::move(points), material), m_log(log)
	{
		m_log.live++;
		m_log.created++;
		m_log.events.emplace_back("create");
	}

	~FakeDrawable() override
	{
		m_log.live--;
		m_log.destroyed++;
		m_log.events.emplace_back("destroy");
	}

	std::string_view name() const override { return "Fake Points"; }

private:
	FactoryLog& m_log;
};

class FakeFactory : public DrawableFactory
{
public:
	std::expected<std::unique_ptr<Drawable>, std::string> create_points(
		PointBuffer&& points,
		const PointMaterial& material) override
	{
		log.live_at_create.push_back(log.live);
		if (fail)
		{
			return std::unexpected("out of device memory");
		}
		return std::make_unique<FakeDrawable>(std::move(points), material, log);
	}

	FactoryLog log;
	bool fail = false;
};

std::unique_ptr<RandomSource> seeded()
{
	return std::make_unique<DefaultRandomSource>(99);
}

const UICallback& find_callback(const std::vector<UICallback>& callbacks, std::string_view name)
{
	for (const auto& callback : callbacks)
	{
		if (callback.field_name == name)
		{
			return callback;
		}
	}
	FAIL("no callback named " << name);
	return callbacks.front();
}

} // namespace

TEST_CASE("Regenerate keeps exactly one live galaxy", "[model]")
{
	Logger::instance().set_level(spdlog::level::trace);
	FakeFactory factory;
	Scene scene;

	{
		GalaxyModel model(factory, scene, seeded());

		SECTION("nothing is generated before the first regenerate")
		{
			REQUIRE(model.displayed() == nullptr);
			REQUIRE(scene.empty());
			REQUIRE(model.generation() == 0);
		}

		SECTION("repeated regenerations replace the galaxy")
		{
			for (int i = 0; i < 5; i++)
			{
				REQUIRE(model.regenerate().has_value());
				REQUIRE(factory.log.live == 1);
				REQUIRE(scene.size() == 1);
				REQUIRE(scene.contains(*model.displayed()));
			}
			REQUIRE(factory.log.created == 5);
			REQUIRE(factory.log.destroyed == 4);
			REQUIRE(model.generation() == 5);
		}

		SECTION("old galaxy is disposed before the new one is built")
		{
			REQUIRE(model.regenerate().has_value());
			REQUIRE(model.regenerate().has_value());
			REQUIRE(factory.log.live_at_create == std::vector<int>{0, 0});
			REQUIRE(factory.log.events == std::vector<std::string>{"create", "destroy", "create"});
		}

		SECTION("displayed point count follows the parameters")
		{
			REQUIRE(model.regenerate().has_value());
			REQUIRE(model.displayed()->point_count() == model.parameters().count);
		}
	}

	// Destroying the model releases its galaxy
	REQUIRE(factory.log.live == 0);
	REQUIRE(scene.empty());
}

TEST_CASE("Factory failure leaves the scene without a galaxy", "[model]")
{
	FakeFactory factory;
	Scene scene;
	GalaxyModel model(factory, scene, seeded());

	REQUIRE(model.regenerate().has_value());
	REQUIRE(scene.size() == 1);

	factory.fail = true;
	auto result = model.regenerate();
	REQUIRE_FALSE(result.has_value());
	REQUIRE(result.error().find("out of device memory") != std::string::npos);
	REQUIRE(scene.empty());
	REQUIRE(model.displayed() == nullptr);
	REQUIRE(factory.log.live == 0);
	REQUIRE(model.generation() == 1);

	SECTION("next successful regenerate restores it")
	{
		factory.fail = false;
		REQUIRE(model.regenerate().has_value());
		REQUIRE(scene.size() == 1);
		REQUIRE(model.generation() == 2);
	}
}

TEST_CASE("Parameters are clamped into their domains", "[model]")
{
	FakeFactory factory;
	Scene scene;

	GalaxyParameters params;
	params.count = 5;
	params.radius = 100.0f;
	params.branches = 1;
	params.spin = -9.0f;
	params.randomness = -1.0f;
	params.randomness_power = 0.5f;
	params.inside_color = Color(2.0f, -1.0f, 0.5f);

	SECTION("on construction")
	{
		GalaxyModel model(factory, scene, seeded(), params);
		const auto& p = model.parameters();
		REQUIRE(p.count == 100);
		REQUIRE(p.radius == 20.0f);
		REQUIRE(p.branches == 2);
		REQUIRE(p.spin == -5.0f);
		REQUIRE(p.randomness == 0.0f);
		REQUIRE(p.randomness_power == 1.0f);
		REQUIRE(p.inside_color == Color(1.0f, 0.0f, 0.5f));
	}

	SECTION("on set_parameters, without regenerating")
	{
		GalaxyModel model(factory, scene, seeded());
		model.set_parameters(params);
		REQUIRE(model.parameters() == params.clamped());
		REQUIRE(factory.log.created == 0);
	}

	SECTION("in-domain parameters are unchanged")
	{
		GalaxyParameters defaults;
		REQUIRE(defaults.clamped() == defaults);
	}
}

TEST_CASE("Material follows the parameters", "[model]")
{
	FakeFactory factory;
	Scene scene;
	GalaxyParameters params;
	params.size = 0.05f;
	GalaxyModel model(factory, scene, seeded(), params);

	auto material = model.material();
	REQUIRE(material.size == 0.05f);
	REQUIRE(material.size_attenuation);
	REQUIRE(material.additive_blending);
	REQUIRE_FALSE(material.depth_write);
	REQUIRE(material.vertex_colors);

	REQUIRE(model.regenerate().has_value());
	REQUIRE(model.displayed()->material() == material);
}

TEST_CASE("UI callbacks expose every parameter", "[model][ui]")
{
	FakeFactory factory;
	Scene scene;
	GalaxyModel model(factory, scene, seeded());
	auto callbacks = model.get_ui_callbacks();

	SECTION("one callback per parameter, in panel order")
	{
		std::vector<std::string> names;
		for (const auto& callback : callbacks)
		{
			names.push_back(callback.field_name);
		}
		REQUIRE(names == std::vector<std::string>{
			"Count", "Size", "Radius", "Branches", "Spin",
			"Randomness", "Randomness Power", "Inside Color", "Outside Color"});
	}

	SECTION("widget kinds")
	{
		REQUIRE(find_callback(callbacks, "Count").get_callback_type() == CallbackType::Discrete);
		REQUIRE(find_callback(callbacks, "Branches").get_callback_type() == CallbackType::Discrete);
		REQUIRE(find_callback(callbacks, "Radius").get_callback_type() == CallbackType::Continuous);
		REQUIRE(find_callback(callbacks, "Inside Color").get_callback_type() == CallbackType::Color);
	}

	SECTION("ranges match the parameter domains")
	{
		const auto* count = find_callback(callbacks, "Count").as_discrete();
		REQUIRE(count != nullptr);
		REQUIRE(count->min == 100);
		REQUIRE(count->max == 100'000);
		REQUIRE(count->step == 100);

		const auto* spin = find_callback(callbacks, "Spin").as_continuous();
		REQUIRE(spin != nullptr);
		REQUIRE(spin->min == -5.0f);
		REQUIRE(spin->max == 5.0f);
	}

	SECTION("getters read the live parameters")
	{
		REQUIRE(find_callback(callbacks, "Count").as_discrete()->getter() == 1000);
		REQUIRE(find_callback(callbacks, "Size").as_continuous()->getter() == Approx(0.02f));
	}
}

TEST_CASE("UI setters write without regenerating", "[model][ui]")
{
	FakeFactory factory;
	Scene scene;
	GalaxyModel model(factory, scene, seeded());
	REQUIRE(model.regenerate().has_value());
	auto callbacks = model.get_ui_callbacks();

	const auto& count = find_callback(callbacks, "Count");
	count.as_discrete()->setter(500);

	REQUIRE(model.parameters().count == 500);
	REQUIRE(factory.log.created == 1);
	REQUIRE(model.displayed()->point_count() == 1000);

	SECTION("commit regenerates with the new value")
	{
		count.commit();
		REQUIRE(factory.log.created == 2);
		REQUIRE(model.generation() == 2);
		REQUIRE(model.displayed()->point_count() == 500);
	}

	SECTION("commit after a factory failure keeps the model usable")
	{
		factory.fail = true;
		count.commit();
		REQUIRE(scene.empty());

		factory.fail = false;
		count.commit();
		REQUIRE(scene.size() == 1);
	}
}

TEST_CASE("UI setters snap and clamp", "[model][ui]")
{
	FakeFactory factory;
	Scene scene;
	GalaxyModel model(factory, scene, seeded());
	auto callbacks = model.get_ui_callbacks();

	SECTION("count snaps to its step")
	{
		const auto* count = find_callback(callbacks, "Count").as_discrete();
		count->setter(1234);
		REQUIRE(model.parameters().count == 1200);
		count->setter(-5);
		REQUIRE(model.parameters().count == 100);
		count->setter(250'000);
		REQUIRE(model.parameters().count == 100'000);
	}

	SECTION("branches clamp to at least two")
	{
		const auto* branches = find_callback(callbacks, "Branches").as_discrete();
		branches->setter(0);
		REQUIRE(model.parameters().branches == 2);
		branches->setter(7);
		REQUIRE(model.parameters().branches == 7);
	}

	SECTION("float fields snap and clamp")
	{
		const auto* radius = find_callback(callbacks, "Radius").as_continuous();
		radius->setter(100.0f);
		REQUIRE(model.parameters().radius == 20.0f);
		radius->setter(7.3349f);
		REQUIRE(model.parameters().radius == Approx(7.33f).margin(1e-4));

		const auto* size = find_callback(callbacks, "Size").as_continuous();
		size->setter(0.0f);
		REQUIRE(model.parameters().size == GalaxyParameters::size_domain.min);
	}

	SECTION("colors clamp per channel")
	{
		const auto* outside = find_callback(callbacks, "Outside Color").as_color();
		outside->setter(Color(1.5f, 0.25f, -0.5f));
		REQUIRE(model.parameters().outside_color == Color(1.0f, 0.25f, 0.0f));
		REQUIRE(outside->getter() == Color(1.0f, 0.25f, 0.0f));
	}
}
