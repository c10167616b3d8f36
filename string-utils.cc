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

#include "string-utils.hh"

#include <cerrno>
#include <climits>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

#include "system.hh"

std::string string_vprintf(const char *message, va_list args)
{
    va_list args_copy;
    va_copy(args_copy, args);
    int length = vsnprintf(nullptr, 0, message, args_copy);
    va_end(args_copy);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    if (length == INT_MAX) {
        errno = ENOMEM;
        throw_posix_error("vsnprintf()");
    }
    std::vector<char> buffer(length + 1);
    length = vsnprintf(buffer.data(), buffer.size(), message, args);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    return std::string(buffer.data(), length);
}

std::string string_printf(const char *message, ...)
{
    va_list args;
    va_start(args, message);
    std::string result = string_vprintf(message, args);
    va_end(args);
    return result;
}

std::string string::join(const std::vector<std::string> &items, const std::string &separator)
{
    std::string result;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0)
            result += separator;
        result += items[i];
    }
    return result;
}

std::string string::format_page_numbers(const std::vector<int> &indices)
{
    std::vector<std::string> items;
    for (int index : indices) {
        std::ostringstream stream;
        stream << index + 1;
        items.push_back(stream.str());
    }
    return join(items, ", ");
}

// vim:ts=4 sts=4 sw=4 et
