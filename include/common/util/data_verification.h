#pragma once

#include <algorithm>

namespace RDSH {
	template<typename T>
	T Clamp(const T &value, const T &lower, const T &upper)
	{
		return std::max(lower, std::min(value, upper));
	}

	template<typename T>
	T ClampLower(const T &value, const T &lower)
	{
		return std::max(lower, value);
	}
}
