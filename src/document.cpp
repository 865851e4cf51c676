/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "document.h"

#include "error_tags.h"
#include "extractor.h"
#include <fstream>
#include "log_entry.h"
#include "log_scope.h"
#include "make_error.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include "serialization_filesystem.h" // IWYU pragma: keep
#include <string>
#include <system_error>

namespace mailsift
{

namespace
{

std::string read_file(const std::filesystem::path& path, const limits& limits)
{
	std::error_code error_code;
	if (!std::filesystem::exists(path, error_code))
	{
		if (error_code)
			throw make_error("Cannot access input file", path, error_code.message(), errors::file_read{});
		throw make_error("Input file does not exist", path, errors::file_not_found{});
	}
	std::uintmax_t size = std::filesystem::file_size(path, error_code);
	if (error_code)
		throw make_error("Cannot get input file size", path, error_code.message(), errors::file_read{});
	if (limits.max_input_size != 0 && size > limits.max_input_size)
		throw make_error("Input file is too large", path, size, limits.max_input_size, errors::input_too_large{});

	std::ifstream file{path, std::ios::binary};
	if (!file)
		throw make_error("Cannot open input file", path, errors::file_read{});
	std::string contents(static_cast<size_t>(size), '\0');
	file.read(contents.data(), static_cast<std::streamsize>(contents.size()));
	if (file.gcount() != static_cast<std::streamsize>(contents.size()))
		throw make_error("Cannot read input file", path, size, file.gcount(), errors::file_read{});
	return contents;
}

} // anonymous namespace

document load_document(const std::filesystem::path& path, const limits& limits)
{
	log_scope(path);
	std::string contents = read_file(path, limits);
	byte_span buffer = as_byte_span(contents);
	content_type::signature_match match = content_type::detect(buffer);
	log_entry("Input document read", path, buffer.size(), match.type, match.tag, log::audit{});
	std::vector<text_block> text = extract(match.tag, buffer);
	log_entry(text.size());
	return document{path, static_cast<std::uint64_t>(buffer.size()), std::move(match), std::move(text)};
}

} // namespace mailsift
