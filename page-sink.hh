/* Copyright © 2026 The pdfdetext authors
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

#ifndef PDFDETEXT_PAGE_SINK_HH
#define PDFDETEXT_PAGE_SINK_HH

#include <stdexcept>
#include <string>
#include <utility>

#include "raster.hh"

/* class OutputPageSpec
 * ====================
 */

/* A rendered page together with the size (in points) of the source page
 * as displayed. The size never comes from the pixel dimensions.
 */
class OutputPageSpec
{
public:
  double width;
  double height;
  raster::Image image;
  OutputPageSpec(double width, double height, raster::Image &&image)
  : width(width), height(height), image(std::move(image))
  { }
  int get_page_index() const
  {
    return this->image.get_page_index();
  }
};


/* class WriteError
 * ================
 */

class WriteError : public std::runtime_error
{
public:
  enum kind_t
  {
    IO_FAILURE,
    ENCODING_FAILURE,
  };
  kind_t kind;
  WriteError(kind_t kind, const std::string &message)
  : std::runtime_error(message), kind(kind)
  { }
};


/* class PageSink
 * ==============
 */

/* Receives the pages of one document in increasing page order. */
class PageSink
{
public:
  /* Takes over the pixels of `page`; the image is released afterwards. */
  virtual void add_page(OutputPageSpec &page) = 0;
  /* Writes out the result. No pages may be added afterwards. */
  virtual void commit() = 0;
  virtual int get_n_pages() const = 0;
  virtual ~PageSink()
  { }
};

#endif

// vim:ts=2 sts=2 sw=2 et
