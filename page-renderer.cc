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

#include "page-renderer.hh"

#include <chrono>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

#include "i18n.hh"
#include "string-utils.hh"

/* class RenderError
 * =================
 */

const char *RenderError::get_kind_name(kind_t kind)
{
  switch (kind)
  {
  case UNSUPPORTED:
    return "Unsupported";
  case CORRUPT:
    return "Corrupt";
  case TIMEOUT:
    return "Timeout";
  case CANCELLED:
    return "Cancelled";
  case TOOL_UNAVAILABLE:
    return "ToolUnavailable";
  case TOOL_FAILED:
    return "ToolFailed";
  }
  return "?";
}

std::string RenderError::describe() const
{
  return string_printf("%s: %s", get_kind_name(this->kind), this->message.c_str());
}


/* class RenderResult
 * ==================
 */

RenderResult RenderResult::success(raster::Image &&image)
{
  RenderResult result;
  result.image.reset(new raster::Image(std::move(image)));
  return result;
}

RenderResult RenderResult::failure(RenderError::kind_t kind, const std::string &message)
{
  RenderResult result;
  result.error = RenderError(kind, message);
  return result;
}

raster::Image RenderResult::take_image()
{
  if (!this->is_ok())
    throw std::logic_error("RenderResult::take_image(): no image");
  raster::Image image(std::move(*this->image));
  this->image.reset();
  return image;
}


/* abort checks
 * ============
 */

namespace
{
  typedef std::chrono::steady_clock clock_type;

  class AbortState
  {
  public:
    bool has_deadline;
    clock_type::time_point deadline;
    const Cancellation *cancellation;
    bool timed_out;
    bool cancelled;
    explicit AbortState(const RenderRequest &request)
    : has_deadline(request.timeout > 0),
      deadline(clock_type::now()),
      cancellation(request.cancellation),
      timed_out(false),
      cancelled(false)
    {
      if (this->has_deadline)
        this->deadline += std::chrono::duration_cast<clock_type::duration>(
          std::chrono::duration<double>(request.timeout)
        );
    }
  };
}

static bool check_abort(void *data)
{
  AbortState &state = *static_cast<AbortState*>(data);
  if (state.cancellation != nullptr && state.cancellation->is_requested())
    state.cancelled = true;
  else if (state.has_deadline && clock_type::now() >= state.deadline)
    state.timed_out = true;
  return state.cancelled || state.timed_out;
}


/* rendering
 * =========
 */

bool prepare_render(pdf::Document &document, const RenderRequest &request,
  pdf::PageGeometry &geometry, raster::Size &size, RenderError &failure)
{
  if (!(request.scale > 0))
  {
    failure = RenderError(RenderError::UNSUPPORTED, _("Resolution must be positive"));
    return false;
  }
  try
  {
    geometry = document.get_page_geometry(request.page_index + 1, request.crop);
  }
  catch (const pdf::Document::InvalidPage &ex)
  {
    failure = RenderError(RenderError::CORRUPT, ex.what());
    return false;
  }
  if (!(geometry.width > 0 && geometry.height > 0))
  {
    failure = RenderError(RenderError::UNSUPPORTED,
      string_printf(_("Page box is empty (%gx%g pt)"), geometry.width, geometry.height)
    );
    return false;
  }
  try
  {
    size = raster::get_pixel_size(geometry.width, geometry.height, request.scale);
  }
  catch (const std::overflow_error &ex)
  {
    failure = RenderError(RenderError::UNSUPPORTED, ex.what());
    return false;
  }
  return true;
}

/* class PopplerRenderer : PageRenderer
 * ====================================
 */

PopplerRenderer::PopplerRenderer()
: device_document(nullptr),
  device_color_mode(raster::COLOR_RGB),
  device_antialias(true)
{ }

pdf::Renderer &PopplerRenderer::get_device(pdf::Document &document, const RenderRequest &request)
{
  if (this->device.get() == nullptr
    || this->device_document != &document
    || this->device_color_mode != request.color_mode
    || this->device_antialias != request.antialias)
  {
    pdf::splash::Color paper_color;
    pdf::set_color(paper_color, 0xFF, 0xFF, 0xFF);
    this->device.reset(new pdf::Renderer(paper_color, request.color_mode, request.antialias));
    this->device->start_doc(&document);
    this->device_document = &document;
    this->device_color_mode = request.color_mode;
    this->device_antialias = request.antialias;
  }
  return *this->device;
}

RenderResult PopplerRenderer::render(pdf::Document &document, const RenderRequest &request)
{
  pdf::PageGeometry geometry;
  raster::Size size(0, 0);
  RenderError failure;
  if (!prepare_render(document, request, geometry, size, failure))
    return RenderResult::failure(failure.kind, failure.message);
  /* Splash rounds the page size to the nearest pixel;
   * these resolutions make it land exactly on the ceil-rounded grid.
   */
  double hdpi = 72.0 * size.width / geometry.width;
  double vdpi = 72.0 * size.height / geometry.height;
  AbortState abort_state(request);
  try
  {
    pdf::Renderer &device = this->get_device(document, request);
    document.display_page(&device, request.page_index + 1, hdpi, vdpi, request.crop,
      check_abort, &abort_state
    );
    if (abort_state.cancelled)
      return RenderResult::failure(RenderError::CANCELLED, _("Rendering was cancelled"));
    if (abort_state.timed_out)
      return RenderResult::failure(RenderError::TIMEOUT,
        string_printf(_("Rendering did not finish within %g seconds"), request.timeout)
      );
    int width = device.getBitmapWidth();
    int height = device.getBitmapHeight();
    if (width == 1 && height == 1 && (size.width > 1 || size.height > 1))
    {
      /* When the Splash backend runs out of memory,
       * it produces a 1x1 bitmap without signalling an error in any way
       * (other than printing “Out of memory” on stderr).
       */
      return RenderResult::failure(RenderError::UNSUPPORTED,
        string_printf(_("Out of memory while rendering a %dx%d bitmap"), size.width, size.height)
      );
    }
    if (width != size.width || height != size.height)
      return RenderResult::failure(RenderError::CORRUPT,
        string_printf(_("Unexpected bitmap size: %dx%d instead of %dx%d"),
          width, height, size.width, size.height)
      );
    return RenderResult::success(device.take_image(request.page_index));
  }
  catch (const std::bad_alloc &)
  {
    this->device.reset();
    return RenderResult::failure(RenderError::UNSUPPORTED,
      string_printf(_("Out of memory while rendering a %dx%d bitmap"), size.width, size.height)
    );
  }
}

// vim:ts=2 sts=2 sw=2 et
