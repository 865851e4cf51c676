/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "contains_type.h"
#include "content_type.h"
#include "diagnostic_message.h"
#include "ensure.h"
#include "error_tags.h"
#include "extractor.h"
#include <iostream>
#include "serialization_enum.h" // IWYU pragma: keep
#include "zip_archive_extractor.h"
#include "zip_fixture.h"

using namespace std::string_literals;

namespace
{

template <typename Tag>
bool fails_with(const std::string& zip)
{
  try
  {
    mailsift::zip_archive::extract(mailsift::as_byte_span(zip));
  }
  catch (const std::exception& e)
  {
    return mailsift::errors::contains_type<Tag>(e);
  }
  return false;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  using namespace mailsift;
  try
  {
    std::string zip = test::make_zip({
      {"a.xml", "<a>first a@b.com</a>"},
      {"b.bin", "\x00\x01\x02 c@d.org"s},
      {"c.xml", "<c>second</c>"}});
    byte_span buffer = as_byte_span(zip);
    ensure(content_type::classify(buffer)) == format_tag::zip_archive;

    std::vector<text_block> blocks = extract(format_tag::zip_archive, buffer);
    ensure(blocks) == std::vector<text_block>{{"<a>first a@b.com</a>"}, {"<c>second</c>"}};
    ensure(zip_archive::extract(buffer)) == blocks;

    // Members in subdirectories count, the suffix is matched case sensitively and only at the end.
    std::string office = test::make_zip({
      {"word/document.xml", "<w:t>text</w:t>"},
      {"word/media/image1.png", "\x89PNG\r\n\x1A\n"s},
      {"NOTES.XML", "<notes/>"},
      {"backup.xml.bak", "<old/>"},
      {"customXml/item1.xml", "<item/>"}});
    ensure(zip_archive::extract(as_byte_span(office))) == std::vector<text_block>{{"<w:t>text</w:t>"}, {"<item/>"}};
    ensure(zip_archive::is_extracted_member("a.xml")) == true;
    ensure(zip_archive::is_extracted_member("a.XML")) == false;
    ensure(zip_archive::is_extracted_member("xml")) == false;
    ensure(zip_archive::is_extracted_member(".xml")) == true;

    // Blocks follow the central directory index, not the order of the member data.
    std::string reordered = test::reverse_central_directory(test::make_zip({
      {"a.xml", "<a/>"},
      {"b.bin", "binary"},
      {"c.xml", "<c/>"},
      {"d.xml", "<d/>"}}));
    ensure(zip_archive::extract(as_byte_span(reordered))) == std::vector<text_block>{{"<d/>"}, {"<c/>"}, {"<a/>"}};
    std::string same_names = test::reverse_central_directory(test::make_zip({{"x.xml", "<first/>"}, {"y.xml", "<y/>"}, {"x.xml", "<second/>"}}));
    ensure(zip_archive::extract(as_byte_span(same_names))) == std::vector<text_block>{{"<second/>"}, {"<y/>"}, {"<first/>"}};

    // An archive without members is valid and has no text.
    std::string end_of_directory_only = "PK\x05\x06"s + std::string(18, '\0');
    ensure(content_type::classify(as_byte_span(end_of_directory_only))) == format_tag::zip_archive;
    ensure(zip_archive::extract(as_byte_span(end_of_directory_only))) == std::vector<text_block>{};
    ensure(extract(format_tag::zip_archive, as_byte_span(end_of_directory_only))) == std::vector<text_block>{};
    ensure(zip_archive::extract(as_byte_span(test::make_zip({})))) == std::vector<text_block>{};
    // A record that announces members the data does not hold is still not an archive.
    std::string missing_directory = "PK\x05\x06"s + std::string(4, '\0') + "\x01\x00\x01\x00"s + std::string(10, '\0');
    ensure(fails_with<errors::archive_open>(missing_directory)) == true;

    // An archive without XML members gives no text.
    ensure(zip_archive::extract(as_byte_span(test::make_zip({{"readme.txt", "a@b.com"}})))) == std::vector<text_block>{};

    // Content is validated as UTF-8 but otherwise kept as it is.
    std::string unicode = test::make_zip({{"u.xml", "<t>za\xC5\xBC\xC3\xB3\xC5\x82\xC4\x87</t>\r\n"}});
    ensure(zip_archive::extract(as_byte_span(unicode))) == std::vector<text_block>{{"<t>za\xC5\xBC\xC3\xB3\xC5\x82\xC4\x87</t>\r\n"}};

    // A truncated archive keeps its signature but cannot be opened.
    std::string truncated = zip.substr(0, zip.size() / 2);
    ensure(content_type::classify(as_byte_span(truncated))) == format_tag::zip_archive;
    ensure(fails_with<errors::archive_open>(truncated)) == true;
    ensure(fails_with<errors::archive_open>("PK\x03\x04 this is not an archive"s)) == true;

    // One unreadable member fails the whole extraction, even after good members.
    std::string invalid_utf8 = test::make_zip({{"a.xml", "<a/>"}, {"bad.xml", "<b>\xC3\x28</b>"}, {"c.xml", "<c/>"}});
    ensure(fails_with<errors::member_read>(invalid_utf8)) == true;
    ensure(fails_with<errors::archive_open>(invalid_utf8)) == false;

    // Invalid UTF-8 outside XML members is not read at all.
    std::string binary_member = test::make_zip({{"a.xml", "<a/>"}, {"b.bin", "\xC3\x28"}});
    ensure(zip_archive::extract(as_byte_span(binary_member))) == std::vector<text_block>{{"<a/>"}};
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
