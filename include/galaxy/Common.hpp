#ifndef GALAXYGENERATOR_COMMON_HPP
#define GALAXYGENERATOR_COMMON_HPP
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace galaxy
{

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

// Deduction guide for C++17
template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

/// Linear RGB color with channels in [0, 1]
using Color = glm::vec3;

} // namespace galaxy

#endif // GALAXYGENERATOR_COMMON_HPP
