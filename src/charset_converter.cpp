/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "charset_converter.h"

#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <mutex>
#include "make_error.h"

namespace mailsift
{

template<>
struct pimpl_impl<charset_converter> : pimpl_impl_base
{
	struct iconv_descriptor
	{
		iconv_t descriptor;

		// glibc iconv_open races on its gconv module cache.
		static std::mutex iconv_open_mutex;

		iconv_descriptor(const std::string& from, const std::string& to)
		{
			std::lock_guard<std::mutex> lock(iconv_open_mutex);
			descriptor = iconv_open(to.c_str(), from.c_str());
			if (descriptor == (iconv_t)(-1))
			{
				std::string system_error = strerror(errno);
				throw make_error("iconv_open() failed", system_error, from, to);
			}
		}

		~iconv_descriptor()
		{
			iconv_close(descriptor);
		}

		iconv_descriptor(const iconv_descriptor&) = delete;
		iconv_descriptor& operator=(const iconv_descriptor&) = delete;
	};

	pimpl_impl(const std::string& from, const std::string& to)
		: m_descriptor(from, to)
	{}

	iconv_descriptor m_descriptor;
};

std::mutex pimpl_impl<charset_converter>::iconv_descriptor::iconv_open_mutex;

charset_converter::charset_converter(const std::string& from, const std::string& to)
	: with_pimpl<charset_converter>(from, to)
{
}

charset_converter::~charset_converter() = default;

std::string charset_converter::convert(std::string_view input) const
{
	if (input.empty())
		return {};

	// iconv() takes a non-const input pointer but does not write through it.
	char* inptr = const_cast<char*>(input.data());
	size_t inbytesleft = input.size();

	iconv_t descriptor = impl().m_descriptor.descriptor;
	iconv(descriptor, nullptr, nullptr, nullptr, nullptr);

	std::string output(input.size() * 2, '\0');
	size_t total_written = 0;
	while (inbytesleft > 0)
	{
		char* outptr = output.data() + total_written;
		size_t outbytesleft = output.size() - total_written;
		size_t result = iconv(descriptor, &inptr, &inbytesleft, &outptr, &outbytesleft);
		total_written = output.size() - outbytesleft;
		if (result == (size_t)(-1))
		{
			if (errno != E2BIG)
			{
				std::string system_error = strerror(errno);
				throw make_error("iconv() failed", system_error);
			}
			output.resize(output.size() * 2);
		}
	}
	output.resize(total_written);
	return output;
}

} // namespace mailsift
