/*********************************************************************************************************************************************/
/*  mailsift: finds email addresses in documents of any format. Detects the content type from binary signatures, extracts the text           */
/*  of plain text files, PDF documents and zip based office files (docx, xlsx, pptx, odt, ods, odp) and scans it for addresses.              */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project homepage: https://github.com/docwire/docwire                                                                                     */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef MAILSIFT_PIMPL_H
#define MAILSIFT_PIMPL_H

#include <memory>
#include <utility>

namespace mailsift
{

/// @brief Implementation of T, specialized in T's source file.
template <typename T>
struct pimpl_impl;

struct pimpl_impl_base
{
	virtual ~pimpl_impl_base() = default;
};

/**
 * @brief Base class hiding the implementation of T behind a pointer.
 *
 * @code
 * class charset_converter : public with_pimpl<charset_converter> { ... };
 * template<> struct pimpl_impl<charset_converter> : pimpl_impl_base { ... };
 * @endcode
 */
template <typename T>
class with_pimpl
{
protected:
	template <typename... Args>
	explicit with_pimpl(Args&&... args)
		: m_impl(std::make_unique<pimpl_impl<T>>(std::forward<Args>(args)...))
	{}

	~with_pimpl() = default;

	with_pimpl(with_pimpl&&) noexcept = default;
	with_pimpl& operator=(with_pimpl&&) noexcept = default;

	pimpl_impl<T>& impl() { return static_cast<pimpl_impl<T>&>(*m_impl); }
	const pimpl_impl<T>& impl() const { return static_cast<const pimpl_impl<T>&>(*m_impl); }

private:
	std::unique_ptr<pimpl_impl_base> m_impl;
};

} // namespace mailsift

#endif // MAILSIFT_PIMPL_H
