/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "pdf_extractor.h"

#include "charset_converter.h"
#include "error_tags.h"
#include "log_entry.h"
#include "log_scope.h"
#include "make_error.h"
#include <fpdf_text.h>
#include <fpdfview.h>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace mailsift::pdf
{

namespace
{

// PDFium keeps global state and is not thread safe.
std::mutex pdfium_mutex;

struct pdfium_library
{
	pdfium_library()
	{
		FPDF_LIBRARY_CONFIG config{};
		config.version = 2;
		FPDF_InitLibraryWithConfig(&config);
	}

	~pdfium_library()
	{
		FPDF_DestroyLibrary();
	}

	pdfium_library(const pdfium_library&) = delete;
	pdfium_library& operator=(const pdfium_library&) = delete;
};

void ensure_library_initialized()
{
	static pdfium_library library;
}

std::string last_error_message()
{
	switch (FPDF_GetLastError())
	{
		case FPDF_ERR_SUCCESS: return "no error reported";
		case FPDF_ERR_FILE: return "file not found or could not be opened";
		case FPDF_ERR_FORMAT: return "file not in PDF format or corrupted";
		case FPDF_ERR_PASSWORD: return "password required or incorrect password";
		case FPDF_ERR_SECURITY: return "unsupported security scheme";
		case FPDF_ERR_PAGE: return "page not found or content error";
		default: return "unknown error";
	}
}

template <typename Handle, auto Close>
struct pdfium_closer
{
	void operator()(Handle handle) const { Close(handle); }
};

using document_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_DOCUMENT>, pdfium_closer<FPDF_DOCUMENT, FPDF_CloseDocument>>;
using page_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_PAGE>, pdfium_closer<FPDF_PAGE, FPDF_ClosePage>>;
using text_page_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_TEXTPAGE>, pdfium_closer<FPDF_TEXTPAGE, FPDFText_ClosePage>>;

// FPDFText_GetText returns UTF-16LE code units.
std::string page_text(FPDF_DOCUMENT document, int page_index, const charset_converter& utf16_to_utf8)
{
	page_ptr page{FPDF_LoadPage(document, page_index)};
	if (!page)
		throw make_error("Cannot load page", page_index, last_error_message(), errors::pdf_decode{});
	text_page_ptr text_page{FPDFText_LoadPage(page.get())};
	if (!text_page)
		throw make_error("Cannot load text of page", page_index, errors::pdf_decode{});
	int char_count = FPDFText_CountChars(text_page.get());
	if (char_count < 0)
		throw make_error("Cannot count characters of page", page_index, errors::pdf_decode{});
	if (char_count == 0)
		return {};
	std::u16string utf16(static_cast<size_t>(char_count) + 1, u'\0');
	int written = FPDFText_GetText(text_page.get(), 0, char_count, reinterpret_cast<unsigned short*>(utf16.data()));
	if (written <= 0)
		throw make_error("Cannot get text of page", page_index, errors::pdf_decode{});
	// The count includes the terminating null.
	utf16.resize(static_cast<size_t>(written - 1));
	std::string_view utf16_bytes{reinterpret_cast<const char*>(utf16.data()), utf16.size() * sizeof(char16_t)};
	try
	{
		return utf16_to_utf8.convert(utf16_bytes);
	}
	catch (const std::exception&)
	{
		std::throw_with_nested(make_error("Page text is not valid UTF-16", page_index, errors::pdf_decode{}));
	}
}

} // anonymous namespace

std::vector<text_block> extract(byte_span buffer)
{
	log_scope(buffer.size());
	std::lock_guard<std::mutex> lock(pdfium_mutex);
	ensure_library_initialized();
	document_ptr document{FPDF_LoadMemDocument64(buffer.data(), buffer.size(), nullptr)};
	if (!document)
		throw make_error("Cannot load PDF document", last_error_message(), errors::pdf_decode{});
	int page_count = FPDF_GetPageCount(document.get());
	log_entry(page_count);
	charset_converter utf16_to_utf8{"UTF-16LE", "UTF-8"};
	std::string text;
	for (int page_index = 0; page_index < page_count; ++page_index)
	{
		if (page_index > 0)
			text += '\n';
		text += page_text(document.get(), page_index, utf16_to_utf8);
	}
	return {text_block{std::move(text)}};
}

} // namespace mailsift::pdf
