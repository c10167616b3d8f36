/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#include "pdf-backend.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <Error.h>
#include <ErrorCodes.h>
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <goo/GooString.h>
#include <splash/SplashTypes.h>

#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"
#include "system.hh"


/* class pdf::Environment
 * ======================
 */

int pdf::Environment::verbose = 1;

#if POPPLER_VERSION >= 8500
static void poppler_error_handler(ErrorCategory category, pdf::Offset pos, const char *message)
#else
static void poppler_error_handler(void *data, ErrorCategory category, pdf::Offset pos, const char *message)
#endif
{
  const char *category_name = _("PDF error");
  int threshold = 1;
  switch (category)
  {
    case errSyntaxWarning:
      category_name = _("PDF syntax warning");
      threshold = 2;
      break;
    case errSyntaxError:
      category_name = _("PDF syntax error");
      break;
    case errConfig:
      category_name = _("Poppler configuration error");
      break;
    case errCommandLine:
      break; /* should not happen */
    case errIO:
      category_name = _("Input/output error");
      break;
    case errNotAllowed:
      category_name = _("Permission denied");
      break;
    case errUnimplemented:
      category_name = _("PDF feature not implemented");
      threshold = 2;
      break;
    case errInternal:
      category_name = _("Internal Poppler error");
      break;
  }
  if (pdf::Environment::verbose < threshold)
    return;

  if (pos >= 0)
  {
    error_log <<
      /* L10N: "<error-category> (<position>): <error-message>" */
      string_printf(_("%s (%jd): %s"), category_name, static_cast<intmax_t>(pos), message);
  }
  else
  {
    error_log <<
      /* L10N: "<error-category>: <error-message>" */
      string_printf(_("%s: %s"), category_name, message);
  }
  error_log << std::endl;
}

pdf::Environment::Environment()
{
#if POPPLER_VERSION >= 8300
  globalParams = std::unique_ptr<GlobalParams>(new GlobalParams);
#else
  globalParams = new GlobalParams;
#endif
#if POPPLER_VERSION >= 8500
  setErrorCallback(poppler_error_handler);
#else
  setErrorCallback(poppler_error_handler, nullptr);
#endif
}

void pdf::Environment::set_verbose(int value)
{
  this->verbose = value;
}


/* class pdf::Document
 * ===================
 */

pdf::Document::Document(const std::string &file_name)
#if POPPLER_VERSION >= 220300
: ::PDFDoc(std::make_unique<pdf::String>(file_name.c_str())),
#else
: ::PDFDoc(new pdf::String(file_name.c_str())),
#endif
  path(file_name)
{
  if (!this->isOk())
    throw LoadError();
}

pdf::Document::InvalidPage::InvalidPage(int n)
: std::runtime_error(string_printf(_("Page %d is missing or invalid"), n))
{ }

pdf::PageGeometry pdf::Document::get_page_geometry(int n, bool crop)
{
  if (n < 1 || n > this->getNumPages() || this->getPage(n) == nullptr)
    throw InvalidPage(n);
  pdf::PageGeometry result;
  result.width = crop ?
      this->getPageCropWidth(n) :
      this->getPageMediaWidth(n);
  result.height = crop ?
      this->getPageCropHeight(n) :
      this->getPageMediaHeight(n);
  result.rotation = ((this->getPageRotate(n) % 360) + 360) % 360;
  if ((result.rotation / 90) & 1)
    std::swap(result.width, result.height);
  return result;
}

void pdf::Document::display_page(pdf::Renderer *renderer, int n, double hdpi, double vdpi, bool crop,
  pdf::AbortCheck abort_check, void *abort_check_data)
{
  this->displayPage(renderer, n, hdpi, vdpi, 0, !crop, crop, false,
    abort_check, abort_check_data
  );
}

void pdf::Document::save_page(int n, const std::string &file_name)
{
  pdf::String goo_file_name(file_name.c_str());
#if POPPLER_VERSION >= 211100
  int rc = this->savePageAs(goo_file_name, n);
#else
  int rc = this->savePageAs(&goo_file_name, n);
#endif
  if (rc != errNone)
    throw SaveError(string_printf(
      _("Unable to extract page %d into %s (Poppler error code %d)"),
      n, file_name.c_str(), rc
    ));
}


/* class pdf::Renderer : pdf::splash::OutputDevice
 * ===============================================
 */

pdf::Renderer::Renderer(pdf::splash::Color &paper_color, raster::ColorMode color_mode, bool antialias)
: pdf::splash::OutputDevice(color_mode == raster::COLOR_GRAY ? splashModeMono8 : splashModeRGB8, 4, false, paper_color)
{
  this->setFontAntialias(antialias);
  this->setVectorAntialias(antialias);
}

raster::Image pdf::Renderer::take_image(int page_index)
{
  std::unique_ptr<pdf::splash::Bitmap> bitmap(this->takeBitmap());
  raster::ColorMode color_mode;
  switch (bitmap->getMode())
  {
  case splashModeMono8:
    color_mode = raster::COLOR_GRAY;
    break;
  case splashModeRGB8:
    color_mode = raster::COLOR_RGB;
    break;
  default:
    throw std::logic_error(_("Unexpected Splash color mode"));
  }
  raster::Image image(bitmap->getWidth(), bitmap->getHeight(), color_mode, page_index);
  const uint8_t *row_ptr = bitmap->getDataPtr();
  size_t row_size = image.get_row_size();
  for (int y = 0; y < image.get_height(); y++)
  {
    memcpy(image.get_row(y), row_ptr, row_size);
    row_ptr += bitmap->getRowSize();
  }
  return image;
}


/* utility functions
 * =================
 */

void pdf::set_color(splash::Color &result, uint8_t r, uint8_t g, uint8_t b)
{
  result[0] = r;
  result[1] = g;
  result[2] = b;
}

// vim:ts=2 sts=2 sw=2 et
