/* Copyright © 2015 Jakub Wilk <jwilk@jwilk.net>
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

#include "version.hh"

#include <cstdio>
#include <sstream>

#include <png.h>
#include <jpeglib.h>
#include <qpdf/QPDF.hh>

#include "autoconf.hh"

static std::string get_qpdf_version()
{
    return QPDF::QPDFVersion();
}

static std::string get_libpng_version()
{
    return png_get_libver(nullptr);
}

const std::string get_version()
{
    std::ostringstream stream;
    stream << PACKAGE_STRING;
    stream << " (Poppler " POPPLER_VERSION_STRING;
    stream << ", qpdf " << get_qpdf_version();
    stream << ")";
    return stream.str();
}

const std::string get_multiline_version()
{
    std::ostringstream stream;
    stream << PACKAGE_STRING << "\n";
    stream << "+ Poppler " POPPLER_VERSION_STRING << "\n";
    stream << "+ qpdf " << get_qpdf_version() << "\n";
    stream << "+ libjpeg " << JPEG_LIB_VERSION << "\n";
    stream << "+ libpng " << get_libpng_version() << "\n";
    return stream.str();
}

// vim:ts=4 sts=4 sw=4 et
