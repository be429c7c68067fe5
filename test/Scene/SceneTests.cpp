#include <catch2/catch_test_macros.hpp>

#include <galaxy/Scene.hpp>
#include <galaxy/SceneAttachment.hpp>

#include <memory>

using namespace galaxy;

namespace
{

class TestDrawable : public Drawable
{
public:
	explicit TestDrawable(uint32_t count, const Scene* scene = nullptr, bool* attached_at_destruction = nullptr)
		: Drawable(PointBuffer(count), PointMaterial{}), m_scene(scene), m_attached_at_destruction(attached_at_destruction)
	{}

	~TestDrawable() override
	{
		if (m_scene && m_attached_at_destruction)
		{
			*m_attached_at_destruction = m_scene->contains(*this);
		}
	}

	std::string_view name() const override { return "Test Drawable"; }

private:
	const Scene* m_scene;
	bool* m_attached_at_destruction;
};

} // namespace

TEST_CASE("Scene attach and detach", "[scene]")
{
	Scene scene;
	TestDrawable a(10);
	TestDrawable b(20);

	SECTION("new scene is empty")
	{
		REQUIRE(scene.empty());
		REQUIRE(scene.size() == 0);
	}

	SECTION("attach keeps insertion order")
	{
		scene.attach(a);
		scene.attach(b);
		REQUIRE(scene.size() == 2);
		REQUIRE(scene.drawables()[0] == &a);
		REQUIRE(scene.drawables()[1] == &b);
	}

	SECTION("attaching twice is a no-op")
	{
		scene.attach(a);
		scene.attach(a);
		REQUIRE(scene.size() == 1);
	}

	SECTION("detach removes only that drawable")
	{
		scene.attach(a);
		scene.attach(b);
		scene.detach(a);
		REQUIRE(scene.size() == 1);
		REQUIRE_FALSE(scene.contains(a));
		REQUIRE(scene.contains(b));
	}

	SECTION("detaching an unknown drawable leaves the scene unchanged")
	{
		scene.attach(a);
		scene.detach(b);
		REQUIRE(scene.size() == 1);
		REQUIRE(scene.contains(a));
	}
}

TEST_CASE("SceneAttachment owns one attached drawable", "[scene]")
{
	Scene scene;

	SECTION("default attachment is empty")
	{
		SceneAttachment attachment;
		REQUIRE_FALSE(static_cast<bool>(attachment));
		REQUIRE(attachment.get() == nullptr);
		attachment.reset();
		REQUIRE(scene.empty());
	}

	SECTION("construction attaches")
	{
		SceneAttachment attachment(scene, std::make_unique<TestDrawable>(5));
		REQUIRE(static_cast<bool>(attachment));
		REQUIRE(scene.size() == 1);
		REQUIRE(scene.contains(*attachment.get()));
		REQUIRE(attachment.get()->point_count() == 5);
	}

	SECTION("reset detaches before destroying")
	{
		bool attached_at_destruction = true;
		SceneAttachment attachment(scene, std::make_unique<TestDrawable>(5, &scene, &attached_at_destruction));
		attachment.reset();
		REQUIRE_FALSE(static_cast<bool>(attachment));
		REQUIRE(scene.empty());
		REQUIRE_FALSE(attached_at_destruction);
	}

	SECTION("destructor detaches before destroying")
	{
		bool attached_at_destruction = true;
		{
			SceneAttachment attachment(scene, std::make_unique<TestDrawable>(5, &scene, &attached_at_destruction));
			REQUIRE(scene.size() == 1);
		}
		REQUIRE(scene.empty());
		REQUIRE_FALSE(attached_at_destruction);
	}

	SECTION("move construction transfers ownership")
	{
		SceneAttachment first(scene, std::make_unique<TestDrawable>(5));
		Drawable* drawable = first.get();

		SceneAttachment second(std::move(first));
		REQUIRE(second.get() == drawable);
		REQUIRE(scene.size() == 1);

		first.reset();
		REQUIRE(scene.contains(*drawable));
	}

	SECTION("move assignment releases the previous drawable")
	{
		SceneAttachment slot(scene, std::make_unique<TestDrawable>(5));
		slot = SceneAttachment(scene, std::make_unique<TestDrawable>(7));
		REQUIRE(scene.size() == 1);
		REQUIRE(slot.get()->point_count() == 7);
		REQUIRE(scene.contains(*slot.get()));
	}
}
