/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "config.h"
#include "contains_type.h"
#include "diagnostic_message.h"
#include "ensure.h"
#include "error_tags.h"
#include <iostream>
#include "serialization_filesystem.h" // IWYU pragma: keep
#include <stdlib.h>
#include <vector>

namespace
{

std::optional<mailsift::config> parse(std::vector<const char*> args)
{
  args.insert(args.begin(), "mailsift");
  return mailsift::parse_config(static_cast<int>(args.size()), args.data());
}

bool is_invalid(std::vector<const char*> args)
{
  try
  {
    parse(std::move(args));
  }
  catch (const std::exception& e)
  {
    return mailsift::errors::contains_type<mailsift::errors::invalid_argument>(e);
  }
  return false;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  using namespace mailsift;
  try
  {
    unsetenv("MAILSIFT_OUTPUT");
    unsetenv("MAILSIFT_LOG_FILTER");
    unsetenv("MAILSIFT_MAX_INPUT_SIZE");

    std::optional<config> defaults = parse({"report.pdf"});
    ensure(defaults.has_value()) == true;
    ensure(defaults->input) == std::filesystem::path{"report.pdf"};
    ensure(defaults->output) == std::filesystem::path{"emails.txt"};
    ensure(defaults->log_filter) == "audit";
    ensure(defaults->max_input_size) == 0;

    std::optional<config> options = parse({"-o", "found.txt", "--log-filter", "*", "--max-input-size", "1048576", "report.pdf"});
    ensure(options->input) == std::filesystem::path{"report.pdf"};
    ensure(options->output) == std::filesystem::path{"found.txt"};
    ensure(options->log_filter) == "*";
    ensure(options->max_input_size) == 1048576;

    ensure(parse({"--help"}).has_value()) == false;
    ensure(parse({"-h", "report.pdf"}).has_value()) == false;
    ensure(usage()).contains("--output");
    ensure(usage()).contains("MAILSIFT_MAX_INPUT_SIZE");

    // The environment fills in options missing from the command line.
    setenv("MAILSIFT_OUTPUT", "from_environment.txt", 1);
    setenv("MAILSIFT_LOG_FILTER", "-audit", 1);
    setenv("MAILSIFT_MAX_INPUT_SIZE", "100", 1);
    std::optional<config> from_environment = parse({"report.pdf"});
    ensure(from_environment->output) == std::filesystem::path{"from_environment.txt"};
    ensure(from_environment->log_filter) == "-audit";
    ensure(from_environment->max_input_size) == 100;
    std::optional<config> overridden = parse({"--output=cli.txt", "--max-input-size=5", "report.pdf"});
    ensure(overridden->output) == std::filesystem::path{"cli.txt"};
    ensure(overridden->max_input_size) == 5;

    setenv("MAILSIFT_MAX_INPUT_SIZE", "a lot", 1);
    ensure(is_invalid({"report.pdf"})) == true;
    unsetenv("MAILSIFT_MAX_INPUT_SIZE");
    unsetenv("MAILSIFT_OUTPUT");
    unsetenv("MAILSIFT_LOG_FILTER");

    ensure(is_invalid({})) == true;
    ensure(is_invalid({"--unknown-option", "report.pdf"})) == true;
    ensure(is_invalid({"--max-input-size=-5", "report.pdf"})) == true;
    ensure(is_invalid({"--max-input-size=10kB", "report.pdf"})) == true;
    ensure(is_invalid({"--output=", "report.pdf"})) == true;
    ensure(is_invalid({"first.pdf", "second.pdf"})) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
