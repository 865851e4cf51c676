/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "content_type.h"

#include "binary_reader.h"
#include <boost/algorithm/string/predicate.hpp>
#include <array>
#include <optional>
#include <string_view>

namespace mailsift::content_type
{

using namespace std::string_view_literals;

namespace
{

using binary::has_bytes_at;

constexpr std::string_view zip_local_file_header = "PK\x03\x04"sv;

// Signatures near the start of a zip based office file are searched for within this many bytes.
constexpr size_t zip_header_search_range = 6000;

constexpr size_t zip_first_member_name_offset = 30;

enum class ooxml_kind { none, generic, document, presentation, spreadsheet };

ooxml_kind ooxml_kind_at(std::string_view data, size_t offset)
{
	if (has_bytes_at(data, offset, "word/"))
		return ooxml_kind::document;
	if (has_bytes_at(data, offset, "ppt/"))
		return ooxml_kind::presentation;
	if (has_bytes_at(data, offset, "xl/"))
		return ooxml_kind::spreadsheet;
	return ooxml_kind::none;
}

std::optional<size_t> find_local_file_header(std::string_view data, size_t start)
{
	if (start >= data.size())
		return std::nullopt;
	size_t position = data.substr(start, zip_header_search_range).find(zip_local_file_header);
	if (position == std::string_view::npos)
		return std::nullopt;
	return position;
}

/**
 * Office Open XML packages start with a zip member describing the package ([Content_Types].xml,
 * _rels/.rels or docProps); the directory of a later member names the kind of document.
 * Writers order the members differently, so the second to fourth local file headers are
 * searched for rather than computed, as some writers add a 520 byte extra field after a header.
 */
ooxml_kind detect_ooxml(std::string_view data)
{
	if (!has_bytes_at(data, 0, zip_local_file_header))
		return ooxml_kind::none;
	if (ooxml_kind kind = ooxml_kind_at(data, zip_first_member_name_offset); kind != ooxml_kind::none)
		return kind;
	if (!has_bytes_at(data, zip_first_member_name_offset, "[Content_Types].xml") &&
		!has_bytes_at(data, zip_first_member_name_offset, "_rels/.rels") &&
		!has_bytes_at(data, zip_first_member_name_offset, "docProps"))
		return ooxml_kind::none;

	std::optional<std::uint32_t> compressed_size = binary::read_little_endian<std::uint32_t>(data, 18);
	if (!compressed_size)
		return ooxml_kind::none;
	size_t offset = size_t{*compressed_size} + 49;

	std::optional<size_t> next = find_local_file_header(data, offset);
	if (!next)
		return ooxml_kind::none;
	offset += *next + zip_first_member_name_offset;
	next = find_local_file_header(data, offset);
	if (!next)
		return ooxml_kind::none;
	offset += *next + zip_first_member_name_offset;
	if (ooxml_kind kind = ooxml_kind_at(data, offset); kind != ooxml_kind::none)
		return kind;

	offset += 26;
	next = find_local_file_header(data, offset);
	if (!next)
		return ooxml_kind::generic;
	offset += *next + zip_first_member_name_offset;
	if (ooxml_kind kind = ooxml_kind_at(data, offset); kind != ooxml_kind::none)
		return kind;
	return ooxml_kind::generic;
}

bool is_docx(std::string_view data) { return detect_ooxml(data) == ooxml_kind::document; }
bool is_pptx(std::string_view data) { return detect_ooxml(data) == ooxml_kind::presentation; }
bool is_xlsx(std::string_view data) { return detect_ooxml(data) == ooxml_kind::spreadsheet; }

// OpenDocument packages store an uncompressed "mimetype" member first.
bool is_open_document(std::string_view data, std::string_view kind)
{
	constexpr size_t mimetype_content_offset = 38;
	return has_bytes_at(data, 0, zip_local_file_header) &&
		has_bytes_at(data, zip_first_member_name_offset, "mimetype") &&
		has_bytes_at(data, mimetype_content_offset, "application/vnd.oasis.opendocument.") &&
		has_bytes_at(data, mimetype_content_offset + 35, kind);
}

bool is_odt(std::string_view data) { return is_open_document(data, "text"); }
bool is_ods(std::string_view data) { return is_open_document(data, "spreadsheet"); }
bool is_odp(std::string_view data) { return is_open_document(data, "presentation"); }

bool is_pdf(std::string_view data) { return has_bytes_at(data, 0, "%PDF"); }

bool is_zip(std::string_view data)
{
	return has_bytes_at(data, 0, "PK\x03\x04"sv) || has_bytes_at(data, 0, "PK\x05\x06"sv) || has_bytes_at(data, 0, "PK\x07\x08"sv);
}

std::string_view skip_bom_and_whitespace(std::string_view data)
{
	if (data.starts_with("\xEF\xBB\xBF"sv))
		data.remove_prefix(3);
	size_t first = data.find_first_not_of(" \t\r\n\f\v"sv);
	return first == std::string_view::npos ? std::string_view{} : data.substr(first);
}

bool is_xml(std::string_view data)
{
	return boost::algorithm::istarts_with(skip_bom_and_whitespace(data), "<?xml");
}

bool is_html(std::string_view data)
{
	static constexpr std::array<std::string_view, 17> tags = {
		"<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV", "<FONT",
		"<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY", "<BR", "<P", "<!--"
	};
	std::string_view text = skip_bom_and_whitespace(data);
	for (std::string_view tag : tags)
	{
		// The tag must end right after the name so that e.g. "<Bob>" is not taken for "<B".
		if (text.size() > tag.size() && boost::algorithm::istarts_with(text, tag) &&
			(text[tag.size()] == ' ' || text[tag.size()] == '>'))
			return true;
	}
	return false;
}

bool is_riff(std::string_view data, std::string_view form)
{
	return has_bytes_at(data, 0, "RIFF") && has_bytes_at(data, 8, form);
}

bool is_bmp(std::string_view data)
{
	// "BM" alone is too common at the start of text; the reserved header fields must be zero.
	return data.size() >= 26 && has_bytes_at(data, 0, "BM") && has_bytes_at(data, 6, "\0\0\0\0"sv);
}

bool is_portable_executable(std::string_view data)
{
	if (!has_bytes_at(data, 0, "MZ"))
		return false;
	std::optional<std::uint32_t> pe_header_offset = binary::read_little_endian<std::uint32_t>(data, 0x3C);
	return pe_header_offset && has_bytes_at(data, *pe_header_offset, "PE\0\0"sv);
}

bool is_mach_o(std::string_view data)
{
	return has_bytes_at(data, 0, "\xFE\xED\xFA\xCE"sv) || has_bytes_at(data, 0, "\xFE\xED\xFA\xCF"sv) ||
		has_bytes_at(data, 0, "\xCE\xFA\xED\xFE"sv) || has_bytes_at(data, 0, "\xCF\xFA\xED\xFE"sv);
}

bool is_mp3(std::string_view data)
{
	return has_bytes_at(data, 0, "ID3") || has_bytes_at(data, 0, "\xFF\xFB"sv) ||
		has_bytes_at(data, 0, "\xFF\xF3"sv) || has_bytes_at(data, 0, "\xFF\xF2"sv);
}

template <size_t Offset, const std::string_view& Magic>
bool magic_at(std::string_view data)
{
	return has_bytes_at(data, Offset, Magic);
}

constexpr std::string_view jpeg_magic = "\xFF\xD8\xFF"sv;
constexpr std::string_view png_magic = "\x89PNG\r\n\x1A\n"sv;
constexpr std::string_view gif87_magic = "GIF87a"sv;
constexpr std::string_view gif89_magic = "GIF89a"sv;
constexpr std::string_view tiff_le_magic = "II*\0"sv;
constexpr std::string_view tiff_be_magic = "MM\0*"sv;
constexpr std::string_view psd_magic = "8BPS"sv;
constexpr std::string_view ico_magic = "\0\0\x01\0"sv;
constexpr std::string_view iso_media_magic = "ftyp"sv;
constexpr std::string_view matroska_magic = "\x1A\x45\xDF\xA3"sv;
constexpr std::string_view flv_magic = "FLV\x01"sv;
constexpr std::string_view ogg_magic = "OggS"sv;
constexpr std::string_view flac_magic = "fLaC"sv;
constexpr std::string_view midi_magic = "MThd"sv;
constexpr std::string_view amr_magic = "#!AMR"sv;
constexpr std::string_view gzip_magic = "\x1F\x8B\x08"sv;
constexpr std::string_view bzip2_magic = "BZh"sv;
constexpr std::string_view xz_magic = "\xFD" "7zXZ\0"sv;
constexpr std::string_view seven_zip_magic = "7z\xBC\xAF\x27\x1C"sv;
constexpr std::string_view rar_magic = "Rar!\x1A\x07"sv;
constexpr std::string_view tar_magic = "ustar"sv;
constexpr std::string_view zstd_magic = "\x28\xB5\x2F\xFD"sv;
constexpr std::string_view lz4_magic = "\x04\x22\x4D\x18"sv;
constexpr std::string_view cab_magic = "MSCF"sv;
constexpr std::string_view rpm_magic = "\xED\xAB\xEE\xDB"sv;
constexpr std::string_view ole_magic = "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"sv;
constexpr std::string_view rtf_magic = "{\\rtf"sv;
constexpr std::string_view elf_magic = "\x7F" "ELF"sv;
constexpr std::string_view java_class_magic = "\xCA\xFE\xBA\xBE"sv;
constexpr std::string_view wasm_magic = "\0" "asm"sv;
constexpr std::string_view dex_magic = "dex\n"sv;
constexpr std::string_view sqlite_magic = "SQLite format 3\0"sv;
constexpr std::string_view woff_magic = "wOFF"sv;
constexpr std::string_view woff2_magic = "wOF2"sv;
constexpr std::string_view ttf_magic = "\0\x01\0\0\0"sv;
constexpr std::string_view otf_magic = "OTTO"sv;

struct signature
{
	bool (*matches)(std::string_view data);
	format_tag tag;
	std::string_view mime;
};

// Order matters: office packages are zip archives, so they are tested before the generic zip signature.
const signature signatures[] = {
	{is_docx, format_tag::zip_archive, "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
	{is_pptx, format_tag::zip_archive, "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
	{is_xlsx, format_tag::zip_archive, "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
	{is_odt, format_tag::zip_archive, "application/vnd.oasis.opendocument.text"},
	{is_ods, format_tag::zip_archive, "application/vnd.oasis.opendocument.spreadsheet"},
	{is_odp, format_tag::zip_archive, "application/vnd.oasis.opendocument.presentation"},
	{is_pdf, format_tag::pdf, "application/pdf"},
	{is_zip, format_tag::zip_archive, "application/zip"},
	{is_xml, format_tag::plain_text, "text/xml"},
	{is_html, format_tag::plain_text, "text/html"},

	{magic_at<0, jpeg_magic>, format_tag::unsupported, "image/jpeg"},
	{magic_at<0, png_magic>, format_tag::unsupported, "image/png"},
	{magic_at<0, gif87_magic>, format_tag::unsupported, "image/gif"},
	{magic_at<0, gif89_magic>, format_tag::unsupported, "image/gif"},
	{[](std::string_view data) { return is_riff(data, "WEBP"); }, format_tag::unsupported, "image/webp"},
	{is_bmp, format_tag::unsupported, "image/bmp"},
	{magic_at<0, tiff_le_magic>, format_tag::unsupported, "image/tiff"},
	{magic_at<0, tiff_be_magic>, format_tag::unsupported, "image/tiff"},
	{magic_at<0, psd_magic>, format_tag::unsupported, "image/vnd.adobe.photoshop"},
	{magic_at<0, ico_magic>, format_tag::unsupported, "image/vnd.microsoft.icon"},
	{magic_at<4, iso_media_magic>, format_tag::unsupported, "video/mp4"},
	{magic_at<0, matroska_magic>, format_tag::unsupported, "video/x-matroska"},
	{magic_at<0, flv_magic>, format_tag::unsupported, "video/x-flv"},
	{[](std::string_view data) { return is_riff(data, "AVI "); }, format_tag::unsupported, "video/x-msvideo"},
	{[](std::string_view data) { return is_riff(data, "WAVE"); }, format_tag::unsupported, "audio/x-wav"},
	{is_mp3, format_tag::unsupported, "audio/mpeg"},
	{magic_at<0, ogg_magic>, format_tag::unsupported, "audio/ogg"},
	{magic_at<0, flac_magic>, format_tag::unsupported, "audio/x-flac"},
	{magic_at<0, midi_magic>, format_tag::unsupported, "audio/midi"},
	{magic_at<0, amr_magic>, format_tag::unsupported, "audio/amr"},
	{magic_at<0, gzip_magic>, format_tag::unsupported, "application/gzip"},
	{magic_at<0, bzip2_magic>, format_tag::unsupported, "application/x-bzip2"},
	{magic_at<0, xz_magic>, format_tag::unsupported, "application/x-xz"},
	{magic_at<0, seven_zip_magic>, format_tag::unsupported, "application/x-7z-compressed"},
	{magic_at<0, rar_magic>, format_tag::unsupported, "application/vnd.rar"},
	{magic_at<257, tar_magic>, format_tag::unsupported, "application/x-tar"},
	{magic_at<0, zstd_magic>, format_tag::unsupported, "application/zstd"},
	{magic_at<0, lz4_magic>, format_tag::unsupported, "application/x-lz4"},
	{magic_at<0, cab_magic>, format_tag::unsupported, "application/vnd.ms-cab-compressed"},
	{magic_at<0, rpm_magic>, format_tag::unsupported, "application/x-rpm"},
	{magic_at<0, ole_magic>, format_tag::unsupported, "application/x-ole-storage"},
	{magic_at<0, rtf_magic>, format_tag::unsupported, "application/rtf"},
	{magic_at<0, elf_magic>, format_tag::unsupported, "application/x-executable"},
	{is_portable_executable, format_tag::unsupported, "application/vnd.microsoft.portable-executable"},
	{is_mach_o, format_tag::unsupported, "application/x-mach-binary"},
	{magic_at<0, java_class_magic>, format_tag::unsupported, "application/java-vm"},
	{magic_at<0, wasm_magic>, format_tag::unsupported, "application/wasm"},
	{magic_at<0, dex_magic>, format_tag::unsupported, "application/vnd.android.dex"},
	{magic_at<0, sqlite_magic>, format_tag::unsupported, "application/vnd.sqlite3"},
	{magic_at<0, woff_magic>, format_tag::unsupported, "font/woff"},
	{magic_at<0, woff2_magic>, format_tag::unsupported, "font/woff2"},
	{magic_at<0, ttf_magic>, format_tag::unsupported, "font/ttf"},
	{magic_at<0, otf_magic>, format_tag::unsupported, "font/otf"}
};

} // anonymous namespace

signature_match detect(byte_span buffer)
{
	std::string_view data = as_string_view(buffer);
	for (const signature& candidate : signatures)
	{
		if (candidate.matches(data))
			return {candidate.tag, mime_type{std::string{candidate.mime}}};
	}
	return {format_tag::plain_text, mime_type{"text/plain"}};
}

format_tag classify(byte_span buffer)
{
	return detect(buffer).tag;
}

} // namespace mailsift::content_type
