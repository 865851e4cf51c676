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
#include "diagnostic_message.h"
#include "ensure.h"
#include <iostream>
#include "serialization_enum.h" // IWYU pragma: keep
#include <string>
#include "zip_fixture.h"

using namespace std::string_literals;

namespace
{

mailsift::content_type::signature_match detect(const std::string& data)
{
  return mailsift::content_type::detect(mailsift::as_byte_span(data));
}

std::string mime(const std::string& data)
{
  return detect(data).type.v;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  using namespace mailsift;
  try
  {
    // Buffers without a signature, including empty and one byte buffers, are plain text.
    ensure(detect("").tag) == format_tag::plain_text;
    ensure(mime("")) == "text/plain";
    ensure(detect("x").tag) == format_tag::plain_text;
    ensure(detect("name,email\nJohn,john@example.com\n").tag) == format_tag::plain_text;
    ensure(detect("{\"email\": \"a@b.com\"}").tag) == format_tag::plain_text;

    ensure(detect("%PDF-1.7\n").tag) == format_tag::pdf;
    ensure(mime("%PDF-1.7\n")) == "application/pdf";

    // A zip signature with nothing after it is still a zip archive; opening it is the extractor's concern.
    ensure(detect("PK\x03\x04"s).tag) == format_tag::zip_archive;
    ensure(mime("PK\x05\x06"s + std::string(18, '\0'))) == "application/zip";
    ensure(detect("PK\x07\x08"s).tag) == format_tag::zip_archive;
    ensure(detect("PK").tag) == format_tag::plain_text;

    std::string zip = test::make_zip({{"a.xml", "<a/>"}, {"b.bin", "binary"}});
    ensure(detect(zip).tag) == format_tag::zip_archive;
    ensure(mime(zip)) == "application/zip";

    // Office documents are zip archives too, recognized before the generic zip signature.
    std::string docx = test::make_zip({
      {"[Content_Types].xml", "<Types/>"},
      {"_rels/.rels", "<Relationships/>"},
      {"word/document.xml", "<w:document>mail me at a@b.com</w:document>"}});
    ensure(detect(docx).tag) == format_tag::zip_archive;
    ensure(mime(docx)) == "application/vnd.openxmlformats-officedocument.wordprocessingml.document";

    std::string xlsx = test::make_zip({
      {"[Content_Types].xml", "<Types/>"},
      {"_rels/.rels", "<Relationships/>"},
      {"xl/workbook.xml", "<workbook/>"}});
    ensure(mime(xlsx)) == "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";

    std::string pptx = test::make_zip({{"ppt/presentation.xml", "<p:presentation/>"}});
    ensure(mime(pptx)) == "application/vnd.openxmlformats-officedocument.presentationml.presentation";

    // OpenDocument writers store the mimetype member first, uncompressed and without extra fields.
    std::string odf_header = "PK\x03\x04"s + std::string(26, '\0') + "mimetype";
    ensure(detect(odf_header + "application/vnd.oasis.opendocument.text").tag) == format_tag::zip_archive;
    ensure(mime(odf_header + "application/vnd.oasis.opendocument.text")) == "application/vnd.oasis.opendocument.text";
    ensure(mime(odf_header + "application/vnd.oasis.opendocument.spreadsheet")) == "application/vnd.oasis.opendocument.spreadsheet";
    ensure(mime(odf_header + "application/vnd.oasis.opendocument.presentation")) == "application/vnd.oasis.opendocument.presentation";
    ensure(mime(odf_header + "application/vnd.oasis.opendocument.graphics")) == "application/zip";

    // Markup is extracted as plain text.
    ensure(detect("\xEF\xBB\xBF\n  <?xml version=\"1.0\"?><a/>").tag) == format_tag::plain_text;
    ensure(mime("\xEF\xBB\xBF\n  <?xml version=\"1.0\"?><a/>")) == "text/xml";
    ensure(mime("<!doctype html><html><body>a@b.com</body></html>")) == "text/html";
    ensure(mime("<p>hello</p>")) == "text/html";
    ensure(mime("<Bob> hello")) == "text/plain";

    ensure(detect("\xFF\xD8\xFF\xE0\x00\x10JFIF"s).tag) == format_tag::unsupported;
    ensure(mime("\xFF\xD8\xFF\xE0\x00\x10JFIF"s)) == "image/jpeg";
    ensure(mime("\x89PNG\r\n\x1A\n"s)) == "image/png";
    ensure(mime("\x1F\x8B\x08\x00"s)) == "application/gzip";
    ensure(mime("\x7F" "ELF\x02\x01\x01"s)) == "application/x-executable";
    ensure(mime("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"s)) == "application/x-ole-storage";
    ensure(mime("{\\rtf1\\ansi Hello}")) == "application/rtf";
    ensure(mime(std::string(257, ' ') + "ustar\x00" "00"s)) == "application/x-tar";

    // Signatures too weak on their own need the rest of their header.
    ensure(mime("BMW is a car brand")) == "text/plain";
    ensure(mime("MZ is not an executable here")) == "text/plain";
    std::string pe = "MZ"s + std::string(0x3A, '\0') + "\x40\x00\x00\x00"s + "PE\x00\x00"s;
    ensure(mime(pe)) == "application/vnd.microsoft.portable-executable";

    // Classification is repeatable and agrees with detection.
    for (const std::string& data : {""s, "hello"s, zip, docx, "%PDF"s, "\xFF\xD8\xFF"s})
    {
      ensure(content_type::classify(as_byte_span(data))) == content_type::classify(as_byte_span(data));
      ensure(content_type::classify(as_byte_span(data))) == detect(data).tag;
    }

    // Every prefix of a valid document classifies without reading out of bounds.
    for (size_t length = 0; length <= docx.size(); ++length)
    {
      format_tag tag = content_type::classify(as_byte_span(std::string_view{docx}.substr(0, length)));
      ensure(tag).is_one_of({format_tag::plain_text, format_tag::zip_archive});
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
