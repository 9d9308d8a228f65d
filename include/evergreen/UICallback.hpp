//
// Created by chris on 1/20/26.
//

#ifndef EVERGREEN_UICALLBACK_HPP
#define EVERGREEN_UICALLBACK_HPP

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "Common.hpp"

namespace evergreen
{

/**
 * @brief Tunable float (rendered as a slider)
 */
struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	bool logarithmic = false;
};

/**
 * @brief Tunable integer (rendered as an integer slider)
 */
struct DiscreteCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	int min;
	int max;
};

/**
 * @brief Tunable flag (rendered as a checkbox)
 */
struct ToggleCallback
{
	std::function<void(bool)> setter;
	std::function<bool()> getter;
};

enum class CallbackType
{
	Continuous,
	Discrete,
	Toggle
};

/**
 * @brief One named tuning control exposed by a scene component
 *
 * Components return vectors of these from get_ui_callbacks(). The viewer
 * draws them without knowing which component they belong to, which keeps
 * the simulation free of any UI dependency.
 */
struct UICallback
{
	std::string field_name;
	std::variant<ContinuousCallback, DiscreteCallback, ToggleCallback> callback;

	UICallback(std::string name, ContinuousCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, DiscreteCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ToggleCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	[[nodiscard]] CallbackType get_callback_type() const
	{
		return std::visit(
			overloaded{
				[](const ContinuousCallback&) { return CallbackType::Continuous; },
				[](const DiscreteCallback&) { return CallbackType::Discrete; },
				[](const ToggleCallback&) { return CallbackType::Toggle; },
			},
			callback);
	}

	[[nodiscard]] const ContinuousCallback* as_continuous() const { return std::get_if<ContinuousCallback>(&callback); }
	[[nodiscard]] const DiscreteCallback* as_discrete() const { return std::get_if<DiscreteCallback>(&callback); }
	[[nodiscard]] const ToggleCallback* as_toggle() const { return std::get_if<ToggleCallback>(&callback); }
};

/**
 * @brief Controls of one component under a common heading
 */
struct UICallbackGroup
{
	std::string title;
	std::vector<UICallback> callbacks;
};

} // namespace evergreen

#endif // EVERGREEN_UICALLBACK_HPP
