/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "diagnostic_message.h"
#include "ensure.h"
#include <functional>
#include <iostream>
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include <memory>
#include <sstream>
#include <vector>

namespace
{

std::vector<mailsift::serialization::array> captured;

void capture(const mailsift::log::record& rec)
{
  captured.push_back(rec.m_context);
}

std::string first_item(const mailsift::serialization::array& context)
{
  if (context.v.empty())
    return {};
  const std::string* item = std::get_if<std::string>(&context.v.front());
  return item ? *item : std::string{};
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  using namespace mailsift;
  try
  {
    std::function<void(const log::record&)> initial_sink = log::get_sink();
    std::string initial_filter = log::get_filter();
    ensure(static_cast<bool>(initial_sink)) == false;
    log::set_sink(capture);
    ensure(static_cast<bool>(log::get_sink())) == true;

    log::set_filter("audit");
    log_entry("Input document read", log::audit{});
    log_entry("Developer detail");
    ensure(captured.size()) == 1;
    ensure(first_item(captured[0])) == "Input document read";

    // Deny rules win over allow rules.
    captured.clear();
    log::set_filter("*,-audit");
    log_entry("Input document read", log::audit{});
    ensure(captured.size()) == 0;

    captured.clear();
    log::set_filter("-@file:*log_filter*, audit");
    log_entry("Input document read", log::audit{});
    ensure(captured.size()) == 0;
    ensure(log::get_filter()) == "-@file:*log_filter*, audit";

#ifndef NDEBUG
    // Entries without the audit tag exist in debug builds only.
    captured.clear();
    log::set_filter("*");
    log_entry("Developer detail");
    ensure(captured.size()) == 1;

    captured.clear();
    log::set_filter("@file:log_filter.cpp");
    size_t answer = 42;
    log_entry("Developer detail", answer);
    ensure(captured.size()) == 1;
    ensure(captured[0].v.size()) == 2;
#endif

    // No sink, no logging.
    captured.clear();
    log::set_sink({});
    log::set_filter("*");
    log_entry("Input document read", log::audit{});
    ensure(captured.size()) == 0;

    std::ostringstream stream;
    log::set_filter("audit");
    log::set_sink(log::json_stream_sink(stream));
    log_entry("Email addresses written", log::audit{});
    log::set_sink({});
    ensure(stream.str()).contains("\"Email addresses written\"");
    ensure(stream.str()).contains("\"timestamp\"");
    ensure(stream.str().front()) == '[';
    ensure(stream.str()).contains("]");

    log::set_sink(initial_sink);
    log::set_filter(initial_filter);
    ensure(log::get_filter()) == initial_filter;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
