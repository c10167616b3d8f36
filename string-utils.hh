/* Copyright © 2008-2016 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2026 The pdfdetext authors
 *
 * This file is part of pdfdetext.
 *
 * pdfdetext is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdfdetext is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#ifndef PDFDETEXT_STRING_UTILS_HH
#define PDFDETEXT_STRING_UTILS_HH

#include <cstdarg>
#include <string>
#include <vector>

std::string string_vprintf(const char *message, va_list args);
#if defined(__GNUC__)
__attribute__ ((format (printf, 1, 2)))
#endif
std::string string_printf(const char *message, ...);

namespace string {

    std::string join(const std::vector<std::string> &items, const std::string &separator);

    // "1, 4, 7" for page indices {0, 3, 6}
    std::string format_page_numbers(const std::vector<int> &indices);

}

#endif

// vim:ts=4 sts=4 sw=4 et
