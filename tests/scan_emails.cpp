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
#include "email_scanner.h"
#include "ensure.h"
#include "error_tags.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

int main(int argc, char* argv[])
{
  using namespace mailsift;
  try
  {
    std::set<std::string> addresses = email::scan({{"contact: a@b.com, again a@b.com, plus c@d.org"}});
    ensure(addresses) == std::set<std::string>{"a@b.com", "c@d.org"};

    // Addresses from every block are collected into one set.
    addresses = email::scan({{"From: John Doe <john.doe@example.com>"}, {"Cc: jane_smith+news@mail.example.co.uk;"}, {"john.doe@example.com"}});
    ensure(addresses) == std::set<std::string>{"jane_smith+news@mail.example.co.uk", "john.doe@example.com"};

    ensure(email::scan({})) == std::set<std::string>{};
    ensure(email::scan({{"nobody at example dot com"}, {""}})) == std::set<std::string>{};
    // The top level domain needs at least two letters.
    ensure(email::scan({{"x@y.c and x@y.42"}})) == std::set<std::string>{};
    ensure(email::scan({{"<w:t>sales@shop.example.org</w:t>"}})) == std::set<std::string>{"sales@shop.example.org"};

    // Letters outside ASCII continue a word, punctuation outside ASCII ends it.
    ensure(email::scan({{"\xC3\xA9" "a@b.com"}})) == std::set<std::string>{};
    ensure(email::scan({{"a@b.com\xC3\xA9"}})) == std::set<std::string>{};
    ensure(email::scan({{"\xC5\xBC" "a@b.com \xC3\xA9 c@d.org"}})) == std::set<std::string>{"c@d.org"};
    ensure(email::scan({{"\xC2\xAB" "a@b.com\xC2\xBB"}})) == std::set<std::string>{"a@b.com"};
    ensure(email::scan({{"\xE2\x80\x9C" "a@b.com\xE2\x80\x9D, \xE4\xBD\xA0" "x@y.org"}})) == std::set<std::string>{"a@b.com"};
    // A boundary inside the domain still ends the address early.
    ensure(email::scan({{"a@x.ab.cd\xC3\xA9"}})) == std::set<std::string>{"a@x.ab"};
    // An address is found after a leading dot, not including it.
    ensure(email::scan({{" .a@b.com"}})) == std::set<std::string>{"a@b.com"};
    ensure(email::scan({{"\x01" "a@b.com\xEF\xBF\xBD"}})) == std::set<std::string>{"a@b.com"};

    std::ostringstream stream;
    email::write({"c@d.org", "a@b.com"}, stream);
    ensure(stream.str()) == "a@b.com\nc@d.org\n";

    std::filesystem::path directory = std::filesystem::temp_directory_path() / "mailsift_scan_emails_test";
    std::filesystem::create_directories(directory);
    std::filesystem::path output = directory / "emails.txt";
    email::write_to_file({"a@b.com", "c@d.org"}, output);
    {
      std::ifstream file{output, std::ios::binary};
      std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
      ensure(contents) == "a@b.com\nc@d.org\n";
    }
    // The file is replaced, not appended to.
    email::write_to_file({"e@f.net"}, output);
    {
      std::ifstream file{output, std::ios::binary};
      std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
      ensure(contents) == "e@f.net\n";
    }

    bool output_write_failed = false;
    try
    {
      email::write_to_file({"a@b.com"}, directory / "missing" / "emails.txt");
    }
    catch (const errors::base& e)
    {
      output_write_failed = errors::contains_type<errors::output_write>(e);
    }
    ensure(output_write_failed) == true;
    std::filesystem::remove_all(directory);
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
