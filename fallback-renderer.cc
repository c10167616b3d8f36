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

#include "fallback-renderer.hh"

#include <cstdlib>
#include <ios>
#include <string>
#include <utility>

#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"
#include "system.hh"

static inline DebugStream &debug(int n)
{
  return debug(n, pdf::Environment::verbose);
}

ExternalRenderer::ExternalRenderer(const std::string &command)
: command(command)
{ }

RenderResult ExternalRenderer::render(pdf::Document &document, const RenderRequest &request)
{
  pdf::PageGeometry geometry;
  raster::Size size(0, 0);
  RenderError failure;
  if (!prepare_render(document, request, geometry, size, failure))
    return RenderResult::failure(failure.kind, failure.message);
  if (request.cancellation != nullptr && request.cancellation->is_requested())
    return RenderResult::failure(RenderError::CANCELLED, _("Rendering was cancelled"));
  bool gray = request.color_mode == raster::COLOR_GRAY;
  /* The files must be removed before the directory,
   * so they have to be declared after it.
   */
  TemporaryDirectory work_dir;
  TemporaryFile page_file(work_dir, "page.pdf");
  TemporaryFile image_file(work_dir, gray ? "page.pgm" : "page.ppm");
  page_file.close();
  image_file.close();
  try
  {
    document.save_page(request.page_index + 1, page_file);
  }
  catch (const pdf::Document::SaveError &ex)
  {
    return RenderResult::failure(RenderError::TOOL_FAILED, ex.what());
  }
  Command cmd(this->command);
  cmd << "-f" << 1 << "-l" << 1 << "-singlefile";
  if (gray)
    cmd << "-gray";
  if (request.crop)
    cmd << "-cropbox";
  if (!request.antialias)
    cmd << "-aa" << "no" << "-aaVector" << "no";
  cmd
    << "-scale-to-x" << size.width
    << "-scale-to-y" << size.height
    << page_file
    << join_path(work_dir.get_name(), "page");
  cmd.set_timeout(request.timeout);
  try
  {
    cmd(true);
  }
  catch (const Command::NotFound &ex)
  {
    return RenderResult::failure(RenderError::TOOL_UNAVAILABLE, ex.what());
  }
  catch (const Command::Timeout &ex)
  {
    return RenderResult::failure(RenderError::TIMEOUT, ex.what());
  }
  catch (const Command::CommandFailed &ex)
  {
    return RenderResult::failure(RenderError::TOOL_FAILED, ex.what());
  }
  try
  {
    image_file.reopen();
    raster::Image image = raster::read_pnm(image_file, request.page_index);
    image_file.close();
    if (image.get_color_mode() != request.color_mode)
      return RenderResult::failure(RenderError::TOOL_FAILED,
        string_printf(_("External renderer produced a %s image instead of %s"),
          raster::get_color_mode_name(image.get_color_mode()),
          raster::get_color_mode_name(request.color_mode))
      );
    if (std::abs(image.get_width() - size.width) > 1 || std::abs(image.get_height() - size.height) > 1)
      return RenderResult::failure(RenderError::TOOL_FAILED,
        string_printf(_("Unexpected image size: %dx%d instead of %dx%d"),
          image.get_width(), image.get_height(), size.width, size.height)
      );
    /* pdftoppm rounds its grid up after a floating-point division,
     * so it may come out one pixel larger (or smaller) per axis.
     */
    if (image.get_width() != size.width || image.get_height() != size.height)
    {
      debug(2) << string_printf(_("adjusting %dx%d image to %dx%d"),
        image.get_width(), image.get_height(), size.width, size.height) << std::endl;
      return RenderResult::success(raster::fit_canvas(image, size.width, size.height));
    }
    return RenderResult::success(std::move(image));
  }
  catch (const raster::FormatError &ex)
  {
    return RenderResult::failure(RenderError::TOOL_FAILED,
      string_printf(_("Unable to read the output of the external renderer: %s"), ex.what())
    );
  }
  catch (const std::ios_base::failure &ex)
  {
    return RenderResult::failure(RenderError::TOOL_FAILED,
      string_printf(_("Unable to read the output of the external renderer: %s"), ex.what())
    );
  }
}

// vim:ts=2 sts=2 sw=2 et
