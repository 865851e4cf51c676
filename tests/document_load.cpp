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
#include "diagnostic_message.h"
#include "document.h"
#include "email_scanner.h"
#include "ensure.h"
#include "error_tags.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include "serialization_enum.h" // IWYU pragma: keep
#include "serialization_filesystem.h" // IWYU pragma: keep

namespace
{

template <typename Tag>
bool fails_with(const std::filesystem::path& path, const mailsift::limits& limits = {})
{
  try
  {
    mailsift::load_document(path, limits);
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
    std::filesystem::path directory = std::filesystem::temp_directory_path() / "mailsift_document_load_test";
    std::filesystem::create_directories(directory);
    std::filesystem::path path = directory / "contacts.csv";
    {
      std::ofstream file{path, std::ios::binary};
      file << "name,email\r\nJohn,john@example.com\r\nJane,jane@example.org\r\n";
    }

    document doc = load_document(path);
    ensure(doc.path) == path;
    ensure(doc.size) == 58;
    ensure(doc.signature.tag) == format_tag::plain_text;
    ensure(doc.signature.type.v) == "text/plain";
    ensure(doc.text) == std::vector<text_block>{{"name,email"}, {"John,john@example.com"}, {"Jane,jane@example.org"}};
    ensure(email::scan(doc.text)) == std::set<std::string>{"jane@example.org", "john@example.com"};

    // The size limit is inclusive and 0 disables it.
    ensure(load_document(path, limits{58}).size) == 58;
    ensure(load_document(path, limits{0}).size) == 58;
    ensure(fails_with<errors::input_too_large>(path, limits{57})) == true;

    std::filesystem::path empty_file = directory / "empty.txt";
    {
      std::ofstream file{empty_file, std::ios::binary};
    }
    ensure(load_document(empty_file).text) == std::vector<text_block>{};

    ensure(fails_with<errors::file_not_found>(directory / "missing.txt")) == true;
    ensure(fails_with<errors::file_read>(directory)) == true;

    std::filesystem::path jpeg = directory / "photo.txt";
    {
      std::ofstream file{jpeg, std::ios::binary};
      file << "\xFF\xD8\xFF\xE0 looks like text by name only";
    }
    ensure(fails_with<errors::unsupported_format>(jpeg)) == true;

    std::filesystem::remove_all(directory);
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
