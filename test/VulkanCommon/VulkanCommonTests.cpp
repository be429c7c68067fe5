#include <catch2/catch_test_macros.hpp>
#include <galaxy/VulkanCommon.hpp>

#include <expected>
#include <string>

namespace
{

/**
 * @brief Vulkan call stand-in that fails on its first call only
 */
struct FlakyCall
{
	int calls = 0;

	vk::Result operator()()
	{
		return ++calls == 1 ? vk::Result::eErrorDeviceLost : vk::Result::eSuccess;
	}
};

struct FlakyValueCall
{
	int calls = 0;

	vk::ResultValue<int> operator()()
	{
		return ++calls == 1 ? vk::ResultValue<int>(vk::Result::eErrorOutOfHostMemory, 0)
							: vk::ResultValue<int>(vk::Result::eSuccess, 42);
	}
};

std::expected<void, std::string> check_void(FlakyCall& call)
{
	GALAXY_CHECK_VK_RESULT_VOID(call(), "Failed to submit: {}");
	return {};
}

std::expected<void, std::string> check_value(FlakyValueCall& call)
{
	GALAXY_CHECK_VK_RESULT(call(), "Failed to create: {}");
	return {};
}

} // namespace

TEST_CASE("Result checks evaluate the call once", "[vulkan][common]")
{
	SECTION("void result")
	{
		FlakyCall call;
		auto result = check_void(call);
		REQUIRE(call.calls == 1);
		REQUIRE_FALSE(result.has_value());
		REQUIRE(result.error() == "Failed to submit: " + vk::to_string(vk::Result::eErrorDeviceLost));
	}

	SECTION("result with value")
	{
		FlakyValueCall call;
		auto result = check_value(call);
		REQUIRE(call.calls == 1);
		REQUIRE_FALSE(result.has_value());
		REQUIRE(result.error() == "Failed to create: " + vk::to_string(vk::Result::eErrorOutOfHostMemory));
	}

	SECTION("success falls through")
	{
		FlakyCall call;
		call.calls = 1;
		REQUIRE(check_void(call).has_value());
		REQUIRE(call.calls == 2);
	}
}
