//
// Created by chris on 1/6/26.
//

#ifndef EVERGREEN_COMMON_HPP
#define EVERGREEN_COMMON_HPP
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace evergreen {

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

/// Frame rate the per-tick constants of the scene were tuned at.
inline constexpr float REFERENCE_TICK_RATE = 60.0f;

/// Converts a frame delta into "ticks at REFERENCE_TICK_RATE".
[[nodiscard]] constexpr float tick_scale(float delta_time) { return delta_time * REFERENCE_TICK_RATE; }

} // namespace evergreen

#endif // EVERGREEN_COMMON_HPP
