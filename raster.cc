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

#include "raster.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <istream>
#include <limits>
#include <string>

#include "i18n.hh"
#include "string-utils.hh"

/* Slack for products such as 595.276 * 200 / 72 that should be integers
 * but come out a hair above.
 */
static const double pixel_epsilon = 1e-6;

static const uint8_t placeholder_background = 0xFF;
static const uint8_t placeholder_ink = 0x80;

unsigned int raster::get_n_components(ColorMode color_mode)
{
  switch (color_mode)
  {
  case COLOR_GRAY:
    return 1;
  case COLOR_RGB:
  default:
    return 3;
  }
}

const char *raster::get_color_mode_name(ColorMode color_mode)
{
  switch (color_mode)
  {
  case COLOR_GRAY:
    return "gray";
  case COLOR_RGB:
  default:
    return "rgb";
  }
}

static int scale_dimension(double points, double scale)
{
  double pixels = std::ceil(points * scale - pixel_epsilon);
  if (pixels < 1)
    return 1;
  if (pixels > std::numeric_limits<int>::max())
    throw std::overflow_error(_("Page is too large to be rendered at this resolution"));
  return static_cast<int>(pixels);
}

raster::Size raster::get_pixel_size(double width, double height, double scale)
{
  return raster::Size(scale_dimension(width, scale), scale_dimension(height, scale));
}


/* class raster::Image
 * ===================
 */

raster::Image::Image(int width, int height, ColorMode color_mode, int page_index)
: width(width),
  height(height),
  color_mode(color_mode),
  page_index(page_index)
{
  if (width <= 0 || height <= 0)
    throw std::invalid_argument(string_printf("invalid image size: %dx%d", width, height));
  this->pixels.resize(this->get_row_size() * height);
}

void raster::Image::release()
{
  std::vector<uint8_t>().swap(this->pixels);
}

void raster::Image::fill(uint8_t value)
{
  std::fill(this->pixels.begin(), this->pixels.end(), value);
}


/* PNM input
 * =========
 */

static void skip_pnm_whitespace(std::istream &stream)
{
  while (true)
  {
    int c = stream.peek();
    if (c == '#')
    {
      while (c != '\n' && c != std::char_traits<char>::eof())
        c = stream.get();
    }
    else if (c != std::char_traits<char>::eof() && std::isspace(c))
      stream.get();
    else
      break;
  }
}

static int read_pnm_number(std::istream &stream)
{
  skip_pnm_whitespace(stream);
  int value = 0;
  int n_digits = 0;
  while (std::isdigit(stream.peek()))
  {
    if (value > (std::numeric_limits<int>::max() - 9) / 10)
      throw raster::FormatError(_("PNM image header is malformed"));
    value = value * 10 + (stream.get() - '0');
    n_digits++;
  }
  if (n_digits == 0)
    throw raster::FormatError(_("PNM image header is malformed"));
  return value;
}

raster::Image raster::read_pnm(std::istream &stream, int page_index)
{
  char magic[2];
  stream.read(magic, 2);
  if (stream.gcount() != 2 || magic[0] != 'P')
    throw FormatError(_("Not a PNM image"));
  ColorMode color_mode;
  switch (magic[1])
  {
  case '5':
    color_mode = COLOR_GRAY;
    break;
  case '6':
    color_mode = COLOR_RGB;
    break;
  default:
    throw FormatError(string_printf(_("Unsupported PNM image type: P%c"), magic[1]));
  }
  int width = read_pnm_number(stream);
  int height = read_pnm_number(stream);
  int max_value = read_pnm_number(stream);
  if (width <= 0 || height <= 0)
    throw FormatError(_("PNM image header is malformed"));
  if (max_value != 255)
    throw FormatError(string_printf(_("Unsupported PNM sample range: %d"), max_value));
  /* Exactly one whitespace character separates the header from the data. */
  if (!std::isspace(stream.get()))
    throw FormatError(_("PNM image header is malformed"));
  Image image(width, height, color_mode, page_index);
  std::streamsize row_size = image.get_row_size();
  for (int y = 0; y < height; y++)
  {
    stream.read(reinterpret_cast<char *>(image.get_row(y)), row_size);
    if (stream.gcount() != row_size)
      throw FormatError(_("PNM image data is truncated"));
  }
  return image;
}


/* placeholder pages
 * =================
 */

static void paint_square(raster::Image &image, int x, int y, int size)
{
  unsigned int n_components = raster::get_n_components(image.get_color_mode());
  int x_end = std::min(x + size, image.get_width());
  int y_end = std::min(y + size, image.get_height());
  for (int j = std::max(y, 0); j < y_end; j++)
  {
    uint8_t *row = image.get_row(j);
    for (int i = std::max(x, 0); i < x_end; i++)
    for (unsigned int c = 0; c < n_components; c++)
      row[i * n_components + c] = placeholder_ink;
  }
}

raster::Image raster::fit_canvas(const Image &image, int width, int height)
{
  Image result(width, height, image.get_color_mode(), image.get_page_index());
  result.fill(0xFF);
  int copy_height = std::min(height, image.get_height());
  size_t copy_size = std::min(result.get_row_size(), image.get_row_size());
  for (int y = 0; y < copy_height; y++)
    std::copy(image.get_row(y), image.get_row(y) + copy_size, result.get_row(y));
  return result;
}

raster::Image raster::make_placeholder(int width, int height, ColorMode color_mode, int page_index)
{
  Image image(width, height, color_mode, page_index);
  image.fill(placeholder_background);
  int pen = std::max(1, std::min(width, height) / 200);
  for (int x = 0; x < width; x += pen)
  {
    paint_square(image, x, 0, pen);
    paint_square(image, x, height - pen, pen);
  }
  for (int y = 0; y < height; y += pen)
  {
    paint_square(image, 0, y, pen);
    paint_square(image, width - pen, y, pen);
  }
  /* Walk along the longer side so that the diagonals have no gaps. */
  int steps = std::max(width, height);
  for (int i = 0; i < steps; i++)
  {
    int x = steps > 1 ? static_cast<int>(static_cast<long long>(i) * (width - 1) / (steps - 1)) : 0;
    int y = steps > 1 ? static_cast<int>(static_cast<long long>(i) * (height - 1) / (steps - 1)) : 0;
    paint_square(image, x - pen / 2, y - pen / 2, pen);
    paint_square(image, width - 1 - x - pen / 2, y - pen / 2, pen);
  }
  return image;
}

// vim:ts=2 sts=2 sw=2 et
