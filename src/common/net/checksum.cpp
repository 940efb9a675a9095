#include "common/net/checksum.h"
#include <openssl/evp.h>
#include <stdexcept>

std::string RDSH::Net::Md5Hex(const void *data, size_t size)
{
	static const char hex_digits[] = "0123456789abcdef";

	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_length = 0;

	if (EVP_Digest(data, size, digest, &digest_length, EVP_md5(), nullptr) != 1) {
		throw std::runtime_error("EVP_Digest(md5) failed");
	}

	std::string out;
	out.reserve(digest_length * 2);
	for (unsigned int i = 0; i < digest_length; ++i) {
		out.push_back(hex_digits[digest[i] >> 4]);
		out.push_back(hex_digits[digest[i] & 0x0f]);
	}

	return out;
}
