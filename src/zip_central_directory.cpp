/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "zip_central_directory.h"

#include "binary_reader.h"
#include <utility>

namespace mailsift::zip_archive
{

namespace
{

constexpr std::string_view end_of_directory_signature = "PK\x05\x06";
constexpr std::string_view zip64_locator_signature = "PK\x06\x07";
constexpr std::string_view zip64_end_of_directory_signature = "PK\x06\x06";
constexpr std::string_view file_header_signature = "PK\x01\x02";
constexpr size_t end_of_directory_size = 22;
constexpr size_t zip64_locator_size = 20;
constexpr size_t file_header_size = 46;
constexpr size_t max_comment_size = 0xFFFF;
constexpr std::uint16_t zip64_extra_field_id = 0x0001;

struct directory_location
{
	std::uint64_t entries;
	std::uint64_t offset;
};

// The record is searched from the end: it is followed only by a comment whose length it stores.
std::optional<size_t> find_end_of_directory(std::string_view data)
{
	if (data.size() < end_of_directory_size)
		return std::nullopt;
	size_t last = data.size() - end_of_directory_size;
	size_t first = last > max_comment_size ? last - max_comment_size : 0;
	for (size_t position = last + 1; position-- > first;)
	{
		if (!binary::has_bytes_at(data, position, end_of_directory_signature))
			continue;
		std::optional<std::uint16_t> comment_size = binary::read_little_endian<std::uint16_t>(data, position + 20);
		if (comment_size && static_cast<size_t>(*comment_size) == last - position)
			return position;
	}
	return std::nullopt;
}

std::optional<directory_location> read_zip64_location(std::string_view data, size_t end_of_directory)
{
	if (end_of_directory < zip64_locator_size)
		return std::nullopt;
	size_t locator = end_of_directory - zip64_locator_size;
	if (!binary::has_bytes_at(data, locator, zip64_locator_signature))
		return std::nullopt;
	std::optional<std::uint64_t> record = binary::read_little_endian<std::uint64_t>(data, locator + 8);
	if (!record || *record > data.size() || !binary::has_bytes_at(data, *record, zip64_end_of_directory_signature))
		return std::nullopt;
	std::optional<std::uint64_t> entries = binary::read_little_endian<std::uint64_t>(data, *record + 32);
	std::optional<std::uint64_t> offset = binary::read_little_endian<std::uint64_t>(data, *record + 48);
	if (!entries || !offset)
		return std::nullopt;
	return directory_location{*entries, *offset};
}

std::optional<directory_location> read_location(std::string_view data, size_t end_of_directory)
{
	std::optional<std::uint16_t> entries = binary::read_little_endian<std::uint16_t>(data, end_of_directory + 10);
	std::optional<std::uint32_t> offset = binary::read_little_endian<std::uint32_t>(data, end_of_directory + 16);
	if (!entries || !offset)
		return std::nullopt;
	if (*entries == 0xFFFF || *offset == 0xFFFFFFFF)
		return read_zip64_location(data, end_of_directory);
	return directory_location{*entries, *offset};
}

// A local header offset of 0xFFFFFFFF is stored in the zip64 extra field, after the sizes that also overflowed.
std::optional<std::uint64_t> zip64_local_header_offset(std::string_view data, size_t header, std::string_view extra)
{
	size_t skipped = 0;
	if (binary::read_little_endian<std::uint32_t>(data, header + 24) == 0xFFFFFFFF)
		skipped += 8;
	if (binary::read_little_endian<std::uint32_t>(data, header + 20) == 0xFFFFFFFF)
		skipped += 8;
	size_t position = 0;
	while (position + 4 <= extra.size())
	{
		std::optional<std::uint16_t> id = binary::read_little_endian<std::uint16_t>(extra, position);
		std::optional<std::uint16_t> size = binary::read_little_endian<std::uint16_t>(extra, position + 2);
		if (!id || !size)
			return std::nullopt;
		if (*id == zip64_extra_field_id && skipped + 8 <= static_cast<size_t>(*size))
			return binary::read_little_endian<std::uint64_t>(extra, position + 4 + skipped);
		position += 4 + *size;
	}
	return std::nullopt;
}

} // anonymous namespace

std::optional<std::vector<central_directory_entry>> read_central_directory(std::string_view data)
{
	std::optional<size_t> end_of_directory = find_end_of_directory(data);
	if (!end_of_directory)
		return std::nullopt;
	std::optional<directory_location> location = read_location(data, *end_of_directory);
	if (!location || location->entries > data.size() / file_header_size || location->offset > data.size())
		return std::nullopt;

	std::vector<central_directory_entry> entries;
	entries.reserve(location->entries);
	size_t header = location->offset;
	for (std::uint64_t index = 0; index < location->entries; ++index)
	{
		if (!binary::has_bytes_at(data, header, file_header_signature))
			return std::nullopt;
		std::optional<std::uint16_t> name_size = binary::read_little_endian<std::uint16_t>(data, header + 28);
		std::optional<std::uint16_t> extra_size = binary::read_little_endian<std::uint16_t>(data, header + 30);
		std::optional<std::uint16_t> comment_size = binary::read_little_endian<std::uint16_t>(data, header + 32);
		std::optional<std::uint32_t> local_header_offset = binary::read_little_endian<std::uint32_t>(data, header + 42);
		if (!name_size || !extra_size || !comment_size || !local_header_offset)
			return std::nullopt;
		size_t record_size = file_header_size + *name_size + *extra_size + *comment_size;
		if (data.size() - header < record_size)
			return std::nullopt;
		central_directory_entry entry{std::string{data.substr(header + file_header_size, *name_size)}, *local_header_offset};
		if (*local_header_offset == 0xFFFFFFFF)
		{
			std::optional<std::uint64_t> offset = zip64_local_header_offset(data, header, data.substr(header + file_header_size + *name_size, *extra_size));
			if (!offset)
				return std::nullopt;
			entry.local_header_offset = *offset;
		}
		entries.push_back(std::move(entry));
		header += record_size;
	}
	return entries;
}

} // namespace mailsift::zip_archive
