#ifndef GALAXYGENERATOR_VULKANCOMMON_HPP
#define GALAXYGENERATOR_VULKANCOMMON_HPP
#include <vulkan/vulkan.hpp>
#include <GLFW/glfw3.h>
#include <fmt/format.h>

#include "Common.hpp"

// Both macros evaluate `res` exactly once

#define GALAXY_CHECK_VK_RESULT(res, msg) \
if (const auto& galaxy_checked_result_ = (res); galaxy_checked_result_.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string(galaxy_checked_result_.result))); \
} \

#define GALAXY_CHECK_VK_RESULT_VOID(res, msg) \
if (const vk::Result galaxy_checked_result_ = (res); galaxy_checked_result_ != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string(galaxy_checked_result_))); \
} \

#endif // GALAXYGENERATOR_VULKANCOMMON_HPP
