/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_TESTS_ZIP_FIXTURE_H
#define MAILSIFT_TESTS_ZIP_FIXTURE_H

#include <archive.h>
#include <archive_entry.h>
#include "binary_reader.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "throw_if.h"
#include <utility>
#include <vector>

namespace mailsift::test
{

using zip_member = std::pair<std::string, std::string>;

/// @brief Builds an uncompressed zip archive in memory, members in the given order.
inline std::string make_zip(const std::vector<zip_member>& members)
{
  size_t capacity = 4096;
  for (const auto& member : members)
    capacity += member.first.size() * 2 + member.second.size() + 1024;
  std::string buffer(capacity, '\0');
  size_t used = 0;

  std::unique_ptr<archive, decltype(&archive_write_free)> writer{archive_write_new(), archive_write_free};
  throw_if(!writer, "archive_write_new() failed");
  throw_if(archive_write_set_format_zip(writer.get()) != ARCHIVE_OK, archive_error_string(writer.get()));
  throw_if(archive_write_set_format_option(writer.get(), "zip", "compression", "store") != ARCHIVE_OK, archive_error_string(writer.get()));
  throw_if(archive_write_open_memory(writer.get(), buffer.data(), buffer.size(), &used) != ARCHIVE_OK, archive_error_string(writer.get()));
  for (const auto& [name, contents] : members)
  {
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry{archive_entry_new(), archive_entry_free};
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));
    throw_if(archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK, name, archive_error_string(writer.get()));
    throw_if(archive_write_data(writer.get(), contents.data(), contents.size()) != static_cast<la_ssize_t>(contents.size()), name, archive_error_string(writer.get()));
  }
  throw_if(archive_write_close(writer.get()) != ARCHIVE_OK, archive_error_string(writer.get()));
  buffer.resize(used);
  return buffer;
}

/**
 * @brief Reverses the order of the central directory records of an archive made by make_zip.
 *
 * Member data and the local header offsets the records point to stay where they are, so only
 * the member indexes change.
 */
inline std::string reverse_central_directory(std::string zip)
{
  throw_if(zip.size() < 22 || !binary::has_bytes_at(zip, zip.size() - 22, "PK\x05\x06"), "No end of central directory record");
  std::optional<std::uint16_t> entries = binary::read_little_endian<std::uint16_t>(zip, zip.size() - 22 + 10);
  std::optional<std::uint32_t> directory_size = binary::read_little_endian<std::uint32_t>(zip, zip.size() - 22 + 12);
  std::optional<std::uint32_t> directory_offset = binary::read_little_endian<std::uint32_t>(zip, zip.size() - 22 + 16);
  throw_if(!entries || !directory_size || !directory_offset, "Truncated end of central directory record");
  std::vector<std::string> records;
  size_t position = *directory_offset;
  for (std::uint16_t i = 0; i < *entries; ++i)
  {
    throw_if(!binary::has_bytes_at(zip, position, "PK\x01\x02"), "No central directory file header", position);
    std::optional<std::uint16_t> name_size = binary::read_little_endian<std::uint16_t>(zip, position + 28);
    std::optional<std::uint16_t> extra_size = binary::read_little_endian<std::uint16_t>(zip, position + 30);
    std::optional<std::uint16_t> comment_size = binary::read_little_endian<std::uint16_t>(zip, position + 32);
    throw_if(!name_size || !extra_size || !comment_size, "Truncated central directory file header", position);
    size_t record_size = 46 + *name_size + *extra_size + *comment_size;
    records.push_back(zip.substr(position, record_size));
    position += record_size;
  }
  throw_if(position != *directory_offset + *directory_size, "Central directory size mismatch");
  std::string reversed;
  for (auto record = records.rbegin(); record != records.rend(); ++record)
    reversed += *record;
  zip.replace(*directory_offset, reversed.size(), reversed);
  return zip;
}

} // namespace mailsift::test

#endif // MAILSIFT_TESTS_ZIP_FIXTURE_H
