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

#ifndef PDFDETEXT_PAGE_RENDERER_HH
#define PDFDETEXT_PAGE_RENDERER_HH

#include <memory>
#include <string>

#include "cancellation.hh"
#include "pdf-backend.hh"
#include "raster.hh"

/* class RenderError
 * =================
 */

class RenderError
{
public:
  enum kind_t
  {
    UNSUPPORTED,
    CORRUPT,
    TIMEOUT,
    CANCELLED,
    TOOL_UNAVAILABLE,
    TOOL_FAILED,
  };
  kind_t kind;
  std::string message;
  RenderError()
  : kind(UNSUPPORTED)
  { }
  RenderError(kind_t kind, const std::string &message)
  : kind(kind), message(message)
  { }
  static const char *get_kind_name(kind_t kind);
  /* "<kind>: <message>" */
  std::string describe() const;
};


/* class RenderResult
 * ==================
 */

/* Either an image or a RenderError; failures are values, not exceptions. */
class RenderResult
{
protected:
  std::unique_ptr<raster::Image> image;
  RenderError error;
  RenderResult()
  { }
public:
  static RenderResult success(raster::Image &&image);
  static RenderResult failure(RenderError::kind_t kind, const std::string &message);
  bool is_ok() const
  {
    return this->image.get() != nullptr;
  }
  const RenderError &get_error() const
  {
    return this->error;
  }
  raster::Image take_image();
};


/* class RenderRequest
 * ===================
 */

class RenderRequest
{
public:
  int page_index; // 0-based
  double scale; // pixels per point
  raster::ColorMode color_mode;
  double timeout; // seconds; 0 means no limit
  bool crop; // crop box rather than media box
  bool antialias;
  const Cancellation *cancellation;
  RenderRequest(int page_index, double scale, raster::ColorMode color_mode)
  : page_index(page_index),
    scale(scale),
    color_mode(color_mode),
    timeout(0),
    crop(true),
    antialias(true),
    cancellation(nullptr)
  { }
};


/* class PageRenderer
 * ==================
 */

class PageRenderer
{
public:
  /* Never mutates the document; the same request yields the same pixels. */
  virtual RenderResult render(pdf::Document &document, const RenderRequest &request) = 0;
  virtual const char *get_name() const = 0;
  virtual ~PageRenderer()
  { }
};


/* class PopplerRenderer : PageRenderer
 * ====================================
 */

/* In-process rendering with Poppler's Splash backend.
 * An instance must not be shared between threads.
 */
class PopplerRenderer : public PageRenderer
{
protected:
  std::unique_ptr<pdf::Renderer> device;
  const pdf::Document *device_document;
  raster::ColorMode device_color_mode;
  bool device_antialias;
  pdf::Renderer &get_device(pdf::Document &document, const RenderRequest &request);
public:
  PopplerRenderer();
  virtual RenderResult render(pdf::Document &document, const RenderRequest &request);
  virtual const char *get_name() const
  {
    return "poppler";
  }
};

/* Checks the request and computes the pixel grid of the page. On success,
 * returns true and fills `geometry` and `size`; otherwise fills `failure`.
 */
bool prepare_render(pdf::Document &document, const RenderRequest &request,
  pdf::PageGeometry &geometry, raster::Size &size, RenderError &failure);

#endif

// vim:ts=2 sts=2 sw=2 et
