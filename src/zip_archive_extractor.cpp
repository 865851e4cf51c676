/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "zip_archive_extractor.h"

#include <archive.h>
#include <archive_entry.h>
#include "error_tags.h"
#include "log_entry.h"
#include "log_scope.h"
#include "make_error.h"
#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include "utf8.h"
#include "zip_central_directory.h"

namespace mailsift::zip_archive
{

namespace
{

using archive_ptr = std::unique_ptr<archive, decltype(&archive_read_free)>;

std::string archive_error(archive* reader)
{
	const char* message = archive_error_string(reader);
	return message ? message : "no error message";
}

std::string member_name(archive_entry* entry)
{
	const char* name = archive_entry_pathname_utf8(entry);
	if (!name)
		name = archive_entry_pathname(entry);
	if (!name)
		throw make_error("Archive member has no name", errors::member_read{});
	return name;
}

std::string read_member_data(archive* reader, const std::string& name)
{
	std::string data;
	char chunk[16 * 1024];
	for (;;)
	{
		la_ssize_t size = archive_read_data(reader, chunk, sizeof(chunk));
		if (size < 0)
			throw make_error("Cannot read archive member", name, archive_error(reader), errors::member_read{});
		if (size == 0)
			return data;
		data.append(chunk, static_cast<size_t>(size));
	}
}

struct extracted_member
{
	size_t index;
	text_block block;
};

// libarchive visits members in local header order. Names are matched to the directory records in that order
// to find each member's index; a member the directory does not name keeps its place after the named ones.
class directory_index
{
public:
	explicit directory_index(const std::optional<std::vector<central_directory_entry>>& directory)
	{
		if (!directory)
			return;
		m_size = directory->size();
		std::vector<size_t> by_offset(directory->size());
		for (size_t i = 0; i < by_offset.size(); ++i)
			by_offset[i] = i;
		std::stable_sort(by_offset.begin(), by_offset.end(), [&](size_t a, size_t b)
		{
			return (*directory)[a].local_header_offset < (*directory)[b].local_header_offset;
		});
		for (size_t i : by_offset)
			m_indexes[(*directory)[i].name].push_back(i);
	}

	size_t index_of(const std::string& name, size_t visit_order)
	{
		auto found = m_indexes.find(name);
		if (found == m_indexes.end() || found->second.empty())
			return m_size + visit_order;
		size_t index = found->second.front();
		found->second.pop_front();
		return index;
	}

private:
	std::map<std::string, std::deque<size_t>> m_indexes;
	size_t m_size = 0;
};

} // anonymous namespace

bool is_extracted_member(std::string_view member_name)
{
	return member_name.ends_with(".xml");
}

std::vector<text_block> extract(byte_span buffer)
{
	log_scope(buffer.size());
	std::optional<std::vector<central_directory_entry>> directory = read_central_directory(as_string_view(buffer));
	archive_ptr reader{archive_read_new(), archive_read_free};
	if (!reader)
		throw make_error("archive_read_new() failed", errors::archive_open{});
	// The seekable reader lists members from the central directory, so a truncated archive fails to open.
	if (archive_read_support_format_zip_seekable(reader.get()) != ARCHIVE_OK)
		throw make_error("Zip format is not supported by libarchive", archive_error(reader.get()), errors::archive_open{});
	if (archive_read_open_memory(reader.get(), buffer.data(), buffer.size()) != ARCHIVE_OK)
	{
		// libarchive refuses an archive that is only an end of central directory record.
		if (directory && directory->empty())
		{
			log_entry("Empty zip archive");
			return {};
		}
		throw make_error("Cannot open zip archive", archive_error(reader.get()), errors::archive_open{});
	}

	directory_index indexes{directory};
	std::vector<extracted_member> members;
	for (size_t visit_order = 0;; ++visit_order)
	{
		archive_entry* entry = nullptr;
		int result = archive_read_next_header(reader.get(), &entry);
		if (result == ARCHIVE_EOF)
			break;
		if (result < ARCHIVE_WARN)
			throw make_error("Cannot read archive member header", archive_error(reader.get()), errors::member_read{});
		std::string name = member_name(entry);
		size_t index = indexes.index_of(name, visit_order);
		if (!is_extracted_member(name))
		{
			log_entry("Skipping archive member", name);
			continue;
		}
		std::string data = read_member_data(reader.get(), name);
		if (!utf8::is_valid(data))
			throw make_error("Archive member is not valid UTF-8", name, errors::member_read{});
		log_entry("Extracted archive member", name, index, data.size());
		members.push_back(extracted_member{index, text_block{std::move(data)}});
	}
	std::stable_sort(members.begin(), members.end(), [](const extracted_member& a, const extracted_member& b) { return a.index < b.index; });
	std::vector<text_block> blocks;
	blocks.reserve(members.size());
	for (extracted_member& member : members)
		blocks.push_back(std::move(member.block));
	return blocks;
}

} // namespace mailsift::zip_archive
