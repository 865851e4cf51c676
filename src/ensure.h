/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_ENSURE_H
#define MAILSIFT_ENSURE_H

#include <cassert>
#include "concepts.h"
#include <initializer_list>
#include "source_location.h"
#include <string_view>
#include "throw_if.h"
#include <vector>

namespace mailsift
{

/**
 * @brief Fluent check that throws an error with both values and the call location when it fails.
 *
 * @code
 * ensure(blocks.size()) == 2;
 * ensure(tag) != format_tag::unsupported;
 * ensure(message).contains("a@b.com");
 * @endcode
 *
 * In debug builds the destructor asserts that a comparison was actually performed, so a
 * mistaken `ensure(a == b);` does not silently pass.
 */
template<typename T>
class [[nodiscard]] ensure
{
public:
	explicit ensure(const T& value, const source_location& loc = source_location::current())
		: m_value(value), m_location(loc)
	{}

	~ensure()
	{
		assert(m_comparison_performed && "mailsift::ensure() used without a comparison operator");
	}

	template<typename U>
	void operator==(const U& other) const
	{
		set_comparison_performed();
		MAILSIFT_THROW_IF_AT_LOCATION(!(m_value == other), m_location, m_value, other);
	}

	template<typename U>
	void operator!=(const U& other) const
	{
		set_comparison_performed();
		MAILSIFT_THROW_IF_AT_LOCATION(!(m_value != other), m_location, m_value, other);
	}

	template<typename U>
	void operator>(const U& other) const
	{
		set_comparison_performed();
		MAILSIFT_THROW_IF_AT_LOCATION(!(m_value > other), m_location, m_value, other);
	}

	template<typename U>
	void operator<(const U& other) const
	{
		set_comparison_performed();
		MAILSIFT_THROW_IF_AT_LOCATION(!(m_value < other), m_location, m_value, other);
	}

	template<typename U>
	requires string_like<T> && string_like<U>
	void contains(const U& substring) const
	{
		set_comparison_performed();
		MAILSIFT_THROW_IF_AT_LOCATION(std::string_view(m_value).find(substring) == std::string_view::npos, m_location, m_value, substring);
	}

	void is_one_of(std::initializer_list<T> expected_values) const
	{
		set_comparison_performed();
		for (const auto& expected : expected_values)
		{
			if (m_value == expected)
				return;
		}
		std::vector<T> candidates{expected_values};
		MAILSIFT_THROW_IF_AT_LOCATION(true, m_location, m_value, candidates);
	}

private:
	void set_comparison_performed() const
	{
		m_comparison_performed = true;
	}

	const T& m_value;
	source_location m_location;
	mutable bool m_comparison_performed = false;
};

template<typename T>
ensure(const T&, const source_location&) -> ensure<T>;

} // namespace mailsift

#endif // MAILSIFT_ENSURE_H
