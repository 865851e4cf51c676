/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_BINARY_READER_H
#define MAILSIFT_BINARY_READER_H

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>

namespace mailsift::binary
{

#if defined(__cpp_lib_byteswap) && __cpp_lib_byteswap >= 202110L
	using std::byteswap;
#else
	template <std::unsigned_integral T>
	constexpr T byteswap(T value) noexcept
	{
		T result{};
		for (size_t i = 0; i < sizeof(T); ++i)
			result |= static_cast<T>((value >> (8 * i)) & 0xFF) << (8 * (sizeof(T) - 1 - i));
		return result;
	}
#endif

/**
 * @brief Reads a little-endian integer at the offset, or nothing if the data is too short.
 */
template <std::unsigned_integral T>
std::optional<T> read_little_endian(std::string_view data, size_t offset) noexcept
{
	if (offset > data.size() || data.size() - offset < sizeof(T))
		return std::nullopt;
	T value;
	std::memcpy(&value, data.data() + offset, sizeof(T));
	if constexpr (std::endian::native == std::endian::big)
		return byteswap(value);
	return value;
}

/**
 * @brief Whether the bytes at the offset equal the signature. Never reads past the end.
 */
inline bool has_bytes_at(std::string_view data, size_t offset, std::string_view signature) noexcept
{
	return offset <= data.size() && data.substr(offset).starts_with(signature);
}

} // namespace mailsift::binary

#endif // MAILSIFT_BINARY_READER_H
