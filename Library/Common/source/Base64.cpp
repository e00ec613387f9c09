#include "Base64.hpp"

#include "openssl/evp.h"

std::string Base64Encode(std::string_view data)
{
	if (data.empty())
		return {};

	std::string out(4 * ((data.size() + 2) / 3), '\0');

	const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
				      reinterpret_cast<const unsigned char*>(data.data()),
				      static_cast<int>(data.size()));
	out.resize(static_cast<size_t>(n));

	return out;
}

std::optional<std::string> Base64Decode(std::string_view encoded)
{
	if (encoded.empty())
		return std::string{};

	if (encoded.size() % 4 != 0)
		return std::nullopt;

	std::string out(3 * encoded.size() / 4, '\0');

	const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
				      reinterpret_cast<const unsigned char*>(encoded.data()),
				      static_cast<int>(encoded.size()));
	if (n < 0)
		return std::nullopt;

	// EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
	size_t padding = 0;
	if (encoded.back() == '=')
		padding++;
	if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=')
		padding++;

	out.resize(static_cast<size_t>(n) - padding);

	return out;
}
