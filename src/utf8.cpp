/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "utf8.h"

#include <boost/locale/utf.hpp>
#include <iterator>

namespace mailsift::utf8
{

namespace
{

using traits = boost::locale::utf::utf_traits<char>;

bool is_decoded(boost::locale::utf::code_point c)
{
	return c != boost::locale::utf::illegal && c != boost::locale::utf::incomplete;
}

struct sequence_rule
{
	int length;
	unsigned char second_min;
	unsigned char second_max;
};

// Well-formed byte sequences of Unicode Table 3-7, keyed by the lead byte. Length 0 marks a byte that cannot start one.
sequence_rule rule_for(unsigned char lead)
{
	if (lead >= 0xC2 && lead <= 0xDF)
		return {2, 0x80, 0xBF};
	if (lead == 0xE0)
		return {3, 0xA0, 0xBF};
	if (lead == 0xED)
		return {3, 0x80, 0x9F};
	if (lead >= 0xE1 && lead <= 0xEF)
		return {3, 0x80, 0xBF};
	if (lead == 0xF0)
		return {4, 0x90, 0xBF};
	if (lead == 0xF4)
		return {4, 0x80, 0x8F};
	if (lead >= 0xF1 && lead <= 0xF3)
		return {4, 0x80, 0xBF};
	return {0, 0, 0};
}

bool in_range(char c, unsigned char min, unsigned char max)
{
	unsigned char byte = static_cast<unsigned char>(c);
	return byte >= min && byte <= max;
}

// Length of the maximal subpart of an ill-formed sequence: the lead byte and the continuation bytes that still form a valid prefix.
template <typename Iterator>
size_t maximal_subpart_length(Iterator begin, Iterator end)
{
	sequence_rule rule = rule_for(static_cast<unsigned char>(*begin));
	size_t length = 1;
	for (auto p = std::next(begin); p != end && static_cast<int>(length) < rule.length; ++p, ++length)
	{
		bool valid = length == 1 ? in_range(*p, rule.second_min, rule.second_max) : in_range(*p, 0x80, 0xBF);
		if (!valid)
			break;
	}
	return length;
}

} // anonymous namespace

std::string decode_lossy(std::string_view data)
{
	std::string result;
	result.reserve(data.size());
	auto p = data.begin();
	const auto end = data.end();
	while (p != end)
	{
		auto sequence_start = p;
		boost::locale::utf::code_point c = traits::decode(p, end);
		if (is_decoded(c))
		{
			result.append(sequence_start, p);
			continue;
		}
		p = sequence_start + maximal_subpart_length(sequence_start, end);
		result.append(replacement_character);
	}
	return result;
}

bool is_valid(std::string_view data)
{
	auto p = data.begin();
	const auto end = data.end();
	while (p != end)
	{
		if (!is_decoded(traits::decode(p, end)))
			return false;
	}
	return true;
}

std::vector<std::string> split_lines(std::string_view text)
{
	std::vector<std::string> lines;
	while (!text.empty())
	{
		size_t newline = text.find('\n');
		std::string_view line = text.substr(0, newline);
		if (line.ends_with('\r'))
			line.remove_suffix(1);
		lines.emplace_back(line);
		if (newline == std::string_view::npos)
			break;
		text.remove_prefix(newline + 1);
	}
	return lines;
}

} // namespace mailsift::utf8
