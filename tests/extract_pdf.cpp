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
#include <iomanip>
#include <iostream>
#include "pdf_extractor.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include <sstream>

namespace
{

/// @brief Writes a PDF with one page per text, each shown in Helvetica, with a correct cross-reference table.
std::string make_pdf(const std::vector<std::string>& page_texts)
{
  std::vector<std::string> objects;
  size_t page_count = page_texts.size();
  // 1: catalog, 2: page tree, 3: font, then a page and its content stream per text.
  objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
  std::string kids;
  for (size_t i = 0; i < page_count; ++i)
    kids += std::to_string(4 + 2 * i) + " 0 R ";
  objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_count) + " >>");
  objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
  for (size_t i = 0; i < page_count; ++i)
  {
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents " + std::to_string(5 + 2 * i) +
      " 0 R /Resources << /Font << /F1 3 0 R >> >> >>");
    std::string content = "BT /F1 12 Tf 72 720 Td (" + page_texts[i] + ") Tj ET";
    objects.push_back("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "\nendstream");
  }

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i)
  {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }
  size_t xref_offset = pdf.size();
  std::ostringstream xref;
  xref << "xref\n0 " << objects.size() + 1 << "\n0000000000 65535 f \n";
  for (size_t offset : offsets)
    xref << std::setw(10) << std::setfill('0') << offset << " 00000 n \n";
  xref << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R >>\nstartxref\n" << xref_offset << "\n%%EOF\n";
  return pdf + xref.str();
}

template <typename Tag>
bool fails_with(const std::string& pdf)
{
  try
  {
    mailsift::pdf::extract(mailsift::as_byte_span(pdf));
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
    std::string pdf = make_pdf({"Contact: a@b.com"});
    ensure(content_type::classify(as_byte_span(pdf))) == format_tag::pdf;
    std::vector<text_block> blocks = extract(format_tag::pdf, as_byte_span(pdf));
    ensure(blocks.size()) == 1;
    ensure(blocks[0].v).contains("Contact: a@b.com");

    // All pages go to one block, in page order, separated by a newline.
    std::string two_pages = make_pdf({"First page", "Second page"});
    blocks = pdf::extract(as_byte_span(two_pages));
    ensure(blocks.size()) == 1;
    const std::string& text = blocks[0].v;
    size_t first = text.find("First page");
    size_t second = text.find("Second page");
    ensure(first) != std::string::npos;
    ensure(second) != std::string::npos;
    ensure(first) < second;
    ensure(text.substr(first + 10, second - first - 10)).contains("\n");

    std::string garbage = "%PDF-1.4\nthis is not a PDF document\n";
    ensure(content_type::classify(as_byte_span(garbage))) == format_tag::pdf;
    ensure(fails_with<errors::pdf_decode>(garbage)) == true;
    ensure(fails_with<errors::pdf_decode>(pdf.substr(0, 8))) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
