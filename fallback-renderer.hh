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

#ifndef PDFDETEXT_FALLBACK_RENDERER_HH
#define PDFDETEXT_FALLBACK_RENDERER_HH

#include <string>

#include "page-renderer.hh"

/* Renders a page by running a pdftoppm-compatible program on a single-page
 * copy of it:
 *
 *   <command> -f 1 -l 1 -singlefile [-gray] [-cropbox]
 *     -scale-to-x W -scale-to-y H page.pdf page
 *
 * and reading back page.ppm (or page.pgm).
 */
class ExternalRenderer : public PageRenderer
{
protected:
  std::string command;
public:
  explicit ExternalRenderer(const std::string &command);
  virtual RenderResult render(pdf::Document &document, const RenderRequest &request);
  virtual const char *get_name() const
  {
    return "external";
  }
  const std::string &get_command() const
  {
    return this->command;
  }
};

#endif

// vim:ts=2 sts=2 sw=2 et
