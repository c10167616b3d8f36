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

#ifndef PDFDETEXT_PDF_BACKEND_HH
#define PDFDETEXT_PDF_BACKEND_HH

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "autoconf.hh"

// Poppler:
#include <PDFDoc.h>
#include <OutputDev.h>
#include <SplashOutputDev.h>
#include <goo/GooString.h>
#include <splash/SplashBitmap.h>
#include <splash/SplashTypes.h>

#include "i18n.hh"
#include "raster.hh"

namespace pdf
{

/* type definitions: splash output device
 * ======================================
 */

  namespace splash
  {
    typedef ::SplashColor Color;
    typedef ::SplashBitmap Bitmap;
    typedef ::SplashOutputDev OutputDevice;
  }

/* miscellaneous type definitions
 * ==============================
 */

  typedef ::OutputDev OutputDevice;
  typedef ::GooString String;
  typedef ::Goffset Offset;

  /* Returns true to make Poppler stop drawing the current page. */
  typedef bool (*AbortCheck)(void *data);

/* class pdf::Renderer : pdf::splash::OutputDevice
 * ===============================================
 */

  class Renderer : public pdf::splash::OutputDevice
  {
  public:
    Renderer(pdf::splash::Color &paper_color, raster::ColorMode color_mode, bool antialias);
    void start_doc(::PDFDoc *doc)
    {
      this->startDoc(doc);
    }
    /* Moves the last rendered bitmap into a raster image. */
    raster::Image take_image(int page_index);
  };


/* class pdf::Environment
 * ======================
 */

  class Environment
  {
  public:
    Environment();
    static int verbose;
    void set_verbose(int value);
  };


/* class pdf::PageGeometry
 * =======================
 */

  /* Size of a page as displayed, i.e. with the /Rotate entry applied. */
  class PageGeometry
  {
  public:
    double width;  // points
    double height; // points
    int rotation;  // 0, 90, 180 or 270
    PageGeometry()
    : width(0), height(0), rotation(0)
    { }
  };


/* class pdf::Document
 * ===================
 */

  class Document : public ::PDFDoc
  {
  protected:
    std::string path;
  public:
    explicit Document(const std::string &file_name);
    const std::string &get_path() const
    {
      return this->path;
    }
    /* `n` is 1-based, as everywhere in Poppler. */
    PageGeometry get_page_geometry(int n, bool crop);
    void display_page(Renderer *renderer, int n, double hdpi, double vdpi, bool crop,
      AbortCheck abort_check = nullptr, void *abort_check_data = nullptr);
    /* Writes page `n` alone into a new PDF file. */
    void save_page(int n, const std::string &file_name);
    class LoadError : public std::runtime_error
    {
    public:
      LoadError()
      : std::runtime_error(_("Unable to load document"))
      { }
    };
    class InvalidPage : public std::runtime_error
    {
    public:
      explicit InvalidPage(int n);
    };
    class SaveError : public std::runtime_error
    {
    public:
      explicit SaveError(const std::string &message)
      : std::runtime_error(message)
      { }
    };
  };


/* utility functions
 * =================
 */

  void set_color(pdf::splash::Color &result, uint8_t r, uint8_t g, uint8_t b);

}

#endif

// vim:ts=2 sts=2 sw=2 et
