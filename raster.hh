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

#ifndef PDFDETEXT_RASTER_HH
#define PDFDETEXT_RASTER_HH

#include <cstddef>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace raster
{

  enum ColorMode
  {
    COLOR_RGB,
    COLOR_GRAY,
  };

  unsigned int get_n_components(ColorMode color_mode);
  const char *get_color_mode_name(ColorMode color_mode);

  class Size
  {
  public:
    int width;
    int height;
    Size(int width, int height)
    : width(width), height(height)
    { }
  };

  /* Pixel grid for a page of the given size (in points):
   * ceil(width * scale) x ceil(height * scale).
   */
  Size get_pixel_size(double width, double height, double scale);


/* class raster::Image
 * ===================
 */

  /* Tightly packed 8-bit samples, top row first. */
  class Image
  {
  private:
    Image(const Image &) = delete;
    Image& operator=(const Image &) = delete;
  protected:
    int width;
    int height;
    ColorMode color_mode;
    int page_index;
    std::vector<uint8_t> pixels;
  public:
    Image(int width, int height, ColorMode color_mode, int page_index);
    Image(Image &&) = default;
    Image& operator=(Image &&) = default;

    int get_width() const
    {
      return this->width;
    }
    int get_height() const
    {
      return this->height;
    }
    ColorMode get_color_mode() const
    {
      return this->color_mode;
    }
    int get_page_index() const
    {
      return this->page_index;
    }
    size_t get_row_size() const
    {
      return static_cast<size_t>(this->width) * get_n_components(this->color_mode);
    }
    uint8_t *get_row(int y)
    {
      return this->pixels.data() + y * this->get_row_size();
    }
    const uint8_t *get_row(int y) const
    {
      return this->pixels.data() + y * this->get_row_size();
    }
    const std::vector<uint8_t> &get_pixels() const
    {
      return this->pixels;
    }
    bool is_released() const
    {
      return this->pixels.empty();
    }
    /* Drops the pixel data; the geometry stays available. */
    void release();
    void fill(uint8_t value);
  };

  class FormatError : public std::runtime_error
  {
  public:
    explicit FormatError(const std::string &message)
    : std::runtime_error(message)
    { }
  };

  /* Reads a binary PPM (P6) or PGM (P5) image with 8-bit samples. */
  Image read_pnm(std::istream &stream, int page_index);

  /* Copy of `image` on a `width` x `height` canvas: extra rows and columns
   * are cut off at the bottom and right, missing ones are padded with white.
   */
  Image fit_canvas(const Image &image, int width, int height);

  /* Blank page with a grey frame and a grey cross. */
  Image make_placeholder(int width, int height, ColorMode color_mode, int page_index);

}

#endif

// vim:ts=2 sts=2 sw=2 et
