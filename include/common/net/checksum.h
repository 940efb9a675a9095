#pragma once

#include <cstddef>
#include <string>

namespace RDSH
{
	namespace Net
	{
		constexpr size_t ChecksumLength = 32;

		// Lowercase hex MD5 digest. Detects accidental corruption only.
		std::string Md5Hex(const void *data, size_t size);

		inline std::string Md5Hex(const std::string &data) {
			return Md5Hex(data.data(), data.size());
		}
	}
}
