/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "email_scanner.h"

#include <algorithm>
#include <boost/locale/utf.hpp>
#include <boost/regex.hpp>
#include "error_tags.h"
#include <fstream>
#include <iterator>
#include "log_entry.h"
#include "make_error.h"
#include "serialization_filesystem.h" // IWYU pragma: keep
#include <ostream>

namespace mailsift::email
{

namespace
{

// Addresses are matched over marked text: every character outside ASCII is replaced by one of these bytes,
// so regex word boundaries see letters of any script as word characters.
constexpr char word_marker = '\x01';
constexpr char non_word_marker = '\x02';

struct code_point_range
{
	char32_t first;
	char32_t last;
};

// Punctuation, symbol, space and control code points outside ASCII. Anything else counts as a word character.
constexpr code_point_range non_word_ranges[] = {
	{0x80, 0xA9}, {0xAB, 0xB4}, {0xB6, 0xB9}, {0xBB, 0xBF}, {0xD7, 0xD7}, {0xF7, 0xF7},
	{0x2000, 0x200B}, {0x200E, 0x203E}, {0x2041, 0x2053}, {0x2055, 0x206F},
	{0x20A0, 0x20CF}, {0x2190, 0x23FF}, {0x2500, 0x2BFF},
	{0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030},
	{0xFE10, 0xFE19}, {0xFE30, 0xFE32}, {0xFE35, 0xFE4C}, {0xFE50, 0xFE6F},
	{0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF3E}, {0xFF40, 0xFF40}, {0xFF5B, 0xFF65},
	{0xFFF0, 0xFFFF}, {0x1F000, 0x1FAFF}};

bool is_word_code_point(char32_t c)
{
	return std::none_of(std::begin(non_word_ranges), std::end(non_word_ranges), [c](const code_point_range& range)
	{
		return c >= range.first && c <= range.last;
	});
}

// ASCII is kept as it is and addresses are ASCII only, so a match in the marked text is the original address.
std::string mark_non_ascii(const std::string& text)
{
	using traits = boost::locale::utf::utf_traits<char>;
	std::string marked;
	marked.reserve(text.size());
	auto p = text.begin();
	while (p != text.end())
	{
		auto start = p;
		boost::locale::utf::code_point c = traits::decode(p, text.end());
		if (c == boost::locale::utf::illegal || c == boost::locale::utf::incomplete)
		{
			p = std::next(start);
			marked += non_word_marker;
		}
		else if (c < 0x80)
			marked += static_cast<char>(c) == word_marker ? non_word_marker : static_cast<char>(c);
		else
			marked += is_word_code_point(static_cast<char32_t>(c)) ? word_marker : non_word_marker;
	}
	return marked;
}

const boost::regex& address_pattern()
{
	static const std::string word = R"([a-zA-Z0-9_\x01])";
	static const std::string boundary = "(?:(?<=" + word + ")(?!" + word + ")|(?<!" + word + ")(?=" + word + "))";
	static const boost::regex pattern{boundary + R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})" + boundary};
	return pattern;
}

} // anonymous namespace

std::set<std::string> scan(const std::vector<text_block>& blocks)
{
	std::set<std::string> addresses;
	for (const text_block& block : blocks)
	{
		std::string marked = mark_non_ascii(block.v);
		boost::sregex_iterator end;
		for (boost::sregex_iterator match{marked.begin(), marked.end(), address_pattern()}; match != end; ++match)
			addresses.insert(match->str());
	}
	log_entry(blocks.size(), addresses.size());
	return addresses;
}

void write(const std::set<std::string>& addresses, std::ostream& stream)
{
	for (const std::string& address : addresses)
		stream << address << '\n';
}

void write_to_file(const std::set<std::string>& addresses, const std::filesystem::path& path)
{
	std::ofstream file{path, std::ios::binary | std::ios::trunc};
	if (!file)
		throw make_error("Cannot create output file", path, errors::output_write{});
	write(addresses, file);
	file.close();
	if (!file)
		throw make_error("Cannot write output file", path, errors::output_write{});
}

} // namespace mailsift::email
