#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <galaxy/Camera3D.hpp>

using namespace galaxy;
using Catch::Approx;

namespace
{

// Runs update() until the queued motion has decayed
int settle(Camera3D& camera)
{
	int frames = 0;
	while (camera.update() && frames < 10'000)
	{
		frames++;
	}
	return frames;
}

} // namespace

TEST_CASE("Camera3D starts at the default viewpoint", "[camera]")
{
	Camera3D camera(1280, 720);

	REQUIRE(camera.target() == glm::vec3(0.0f));
	REQUIRE(camera.distance() == Approx(6.7082f).margin(1e-3));
	REQUIRE(camera.azimuth() == Approx(51.34f).margin(1e-2));
	REQUIRE(camera.elevation() == Approx(17.35f).margin(1e-2));
	REQUIRE(camera.fov() == 75.0f);
	REQUIRE(camera.aspect_ratio() == Approx(1280.0f / 720.0f));

	auto position = camera.position();
	REQUIRE(position.x == Approx(4.0f).margin(1e-4));
	REQUIRE(position.y == Approx(2.0f).margin(1e-4));
	REQUIRE(position.z == Approx(5.0f).margin(1e-4));
}

TEST_CASE("Camera3D projects the target to the screen center", "[camera]")
{
	Camera3D camera(800, 600);
	glm::vec4 clip = camera.view_projection_matrix() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
	REQUIRE(clip.w > 0.0f);

	glm::vec3 ndc = glm::vec3(clip) / clip.w;
	REQUIRE(ndc.x == Approx(0.0f).margin(1e-5));
	REQUIRE(ndc.y == Approx(0.0f).margin(1e-5));
	REQUIRE(ndc.z > 0.0f);
	REQUIRE(ndc.z < 1.0f);
}

TEST_CASE("Camera3D damps queued motion", "[camera]")
{
	Camera3D camera;
	const float start = camera.azimuth();

	SECTION("no input means no update")
	{
		REQUIRE_FALSE(camera.update());
	}

	SECTION("one frame applies the damping share")
	{
		camera.handle_mouse_movement(4.0, 0.0); // -1 degree queued
		REQUIRE(camera.update());
		REQUIRE(camera.azimuth() == Approx(start - camera.damping_factor()));
	}

	SECTION("motion continues after input stops and converges")
	{
		camera.handle_mouse_movement(4.0, 0.0);
		int frames = settle(camera);
		REQUIRE(frames > 1);
		REQUIRE(frames < 10'000);
		REQUIRE(camera.azimuth() == Approx(start - 1.0f).margin(1e-3));
		REQUIRE_FALSE(camera.update());
	}

	SECTION("scroll zooms in")
	{
		const float distance = camera.distance();
		camera.handle_mouse_scroll(2.0);
		settle(camera);
		REQUIRE(camera.distance() == Approx(distance - 1.0f).margin(1e-3));
	}
}

TEST_CASE("Camera3D clamps distance and elevation", "[camera]")
{
	Camera3D camera;

	SECTION("distance")
	{
		camera.set_distance(1000.0f);
		REQUIRE(camera.distance() == Camera3D::max_distance);
		camera.set_distance(0.0f);
		REQUIRE(camera.distance() == Camera3D::min_distance);
	}

	SECTION("zooming through the target stops at the minimum distance")
	{
		camera.handle_mouse_scroll(1000.0);
		settle(camera);
		REQUIRE(camera.distance() == Camera3D::min_distance);
	}

	SECTION("elevation stays short of the poles")
	{
		camera.set_rotation(0.0f, 120.0f);
		REQUIRE(camera.elevation() == 89.0f);
		camera.set_rotation(0.0f, -120.0f);
		REQUIRE(camera.elevation() == -89.0f);
	}

	SECTION("azimuth wraps into [0, 360)")
	{
		camera.set_rotation(-30.0f, 0.0f);
		REQUIRE(camera.azimuth() == Approx(330.0f));
		camera.set_rotation(370.0f, 0.0f);
		REQUIRE(camera.azimuth() == Approx(10.0f));
	}
}

TEST_CASE("Camera3D reset restores the default viewpoint", "[camera]")
{
	Camera3D camera;
	camera.set_target(glm::vec3(1.0f, 2.0f, 3.0f));
	camera.set_distance(20.0f);
	camera.handle_mouse_movement(100.0, 50.0);

	camera.reset();
	REQUIRE_FALSE(camera.update());
	REQUIRE(camera.target() == glm::vec3(0.0f));
	REQUIRE(camera.distance() == Approx(6.7082f).margin(1e-3));

	auto position = camera.position();
	REQUIRE(position.x == Approx(4.0f).margin(1e-4));
	REQUIRE(position.y == Approx(2.0f).margin(1e-4));
	REQUIRE(position.z == Approx(5.0f).margin(1e-4));
}

TEST_CASE("Camera3D tracks the viewport aspect ratio", "[camera]")
{
	Camera3D camera(800, 600);

	camera.handle_resize(800, 400);
	REQUIRE(camera.aspect_ratio() == Approx(2.0f));

	SECTION("minimized window keeps the last aspect")
	{
		camera.handle_resize(0, 100);
		REQUIRE(camera.aspect_ratio() == Approx(2.0f));
	}

	SECTION("projection follows the new aspect")
	{
		auto projection = camera.projection_matrix();
		REQUIRE(projection[1][1] / projection[0][0] == Approx(2.0f));
	}
}
