/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_SOURCE_LOCATION_H
#define MAILSIFT_SOURCE_LOCATION_H

#if __has_include(<source_location>) && (!defined(__clang__) || __clang_major__ >= 16) // https://github.com/llvm/llvm-project/issues/56379
	#define MAILSIFT_USE_STD_SOURCE_LOCATION 1
#else
	#define MAILSIFT_USE_STD_SOURCE_LOCATION 0
#endif

#include <cstdint>
#if MAILSIFT_USE_STD_SOURCE_LOCATION
	#include <source_location>
#endif

namespace mailsift
{

/// @brief Replacement for std::source_location built on compiler intrinsics, used where the standard one is broken.
struct builtin_source_location
{
	static constexpr builtin_source_location current(
		const char* file = __builtin_FILE(),
		const char* function = __builtin_FUNCTION(),
		std::uint_least32_t line = __builtin_LINE()) noexcept
	{
		builtin_source_location location;
		location.m_file = file;
		location.m_function = function;
		location.m_line = line;
		return location;
	}

	constexpr const char* file_name() const noexcept { return m_file; }
	constexpr const char* function_name() const noexcept { return m_function; }
	constexpr std::uint_least32_t line() const noexcept { return m_line; }
	constexpr std::uint_least32_t column() const noexcept { return 0; }

private:
	const char* m_file = "";
	const char* m_function = "";
	std::uint_least32_t m_line = 0;
};

#if MAILSIFT_USE_STD_SOURCE_LOCATION
	using source_location = std::source_location;
#else
	using source_location = builtin_source_location;
#endif

} // namespace mailsift

#undef MAILSIFT_USE_STD_SOURCE_LOCATION

#endif // MAILSIFT_SOURCE_LOCATION_H
