#ifndef GALAXYGENERATOR_UICALLBACK_HPP
#define GALAXYGENERATOR_UICALLBACK_HPP

#include <functional>
#include <variant>
#include <string>

#include "Common.hpp"

namespace galaxy
{

/**
 * @brief Callback for continuous (float) UI parameters
 */
struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	float step = 0.0f;  // Optional: snap to multiples of step (0 = no snapping)
};

/**
 * @brief Callback for discrete (int) UI parameters
 */
struct DiscreteCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	int min;
	int max;
	int step = 1;
};

/**
 * @brief Callback for RGB color UI parameters
 */
struct ColorCallback
{
	std::function<void(Color)> setter;
	std::function<Color()> getter;
};

enum class CallbackType
{
	Continuous,
	Discrete,
	Color
};

/**
 * @brief Generic UI callback that can hold continuous, discrete, or color callbacks
 *
 * The model returns a vector of these to expose its parameters generically.
 * The UI rendering code interprets the callback type and renders appropriate ImGui widgets.
 * Setters only store the value; `on_commit` runs once editing of the field settles.
 */
struct UICallback
{
	std::string field_name;
	std::variant<ContinuousCallback, DiscreteCallback, ColorCallback> callback;
	std::function<void()> on_commit;

	UICallback(std::string name, ContinuousCallback cb, std::function<void()> commit = {})
		: field_name(std::move(name)), callback(std::move(cb)), on_commit(std::move(commit)) {}

	UICallback(std::string name, DiscreteCallback cb, std::function<void()> commit = {})
		: field_name(std::move(name)), callback(std::move(cb)), on_commit(std::move(commit)) {}

	UICallback(std::string name, ColorCallback cb, std::function<void()> commit = {})
		: field_name(std::move(name)), callback(std::move(cb)), on_commit(std::move(commit)) {}

	[[nodiscard]] CallbackType get_callback_type() const
	{
		return std::visit(
			overloaded{
				[](const ContinuousCallback&) { return CallbackType::Continuous; },
				[](const DiscreteCallback&) { return CallbackType::Discrete; },
				[](const ColorCallback&) { return CallbackType::Color; },
			},
			callback);
	}

	// Getters for specific callback types
	[[nodiscard]] const ContinuousCallback* as_continuous() const {
		return std::get_if<ContinuousCallback>(&callback);
	}

	[[nodiscard]] const DiscreteCallback* as_discrete() const {
		return std::get_if<DiscreteCallback>(&callback);
	}

	[[nodiscard]] const ColorCallback* as_color() const {
		return std::get_if<ColorCallback>(&callback);
	}

	/**
	 * @brief Notify that editing of this field has settled
	 */
	void commit() const {
		if (on_commit) on_commit();
	}
};

} // namespace galaxy

#endif // GALAXYGENERATOR_UICALLBACK_HPP
