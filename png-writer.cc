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

#include "png-writer.hh"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <png.h>
#include <unistd.h>

#include "debug.hh"
#include "i18n.hh"
#include "pdf-backend.hh"
#include "string-utils.hh"

namespace
{
  class PngErrorState
  {
  public:
    char message[256];
    PngErrorState()
    {
      this->message[0] = '\0';
    }
  };
}

static void png_error_callback(png_structp png_ptr, png_const_charp message)
{
  PngErrorState *state = static_cast<PngErrorState*>(png_get_error_ptr(png_ptr));
  snprintf(state->message, sizeof state->message, "%s", message);
  png_longjmp(png_ptr, 1);
}

static void png_warning_callback(png_structp, png_const_charp message)
{
  debug(2, pdf::Environment::verbose) << "libpng: " << message << std::endl;
}

/* No C++ objects with destructors may live in this frame, because of
 * longjmp(). Returns false and fills `state` on error.
 */
static bool write_png_stream(FILE *fp, const raster::Image &image, double dpi, PngErrorState &state)
{
  png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING,
    &state, png_error_callback, png_warning_callback);
  if (png_ptr == nullptr)
  {
    snprintf(state.message, sizeof state.message, "png_create_write_struct() failed");
    return false;
  }
  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (info_ptr == nullptr)
  {
    png_destroy_write_struct(&png_ptr, nullptr);
    snprintf(state.message, sizeof state.message, "png_create_info_struct() failed");
    return false;
  }
  if (setjmp(png_jmpbuf(png_ptr)))
  {
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return false;
  }
  png_init_io(png_ptr, fp);
  png_set_IHDR(png_ptr, info_ptr, image.get_width(), image.get_height(), 8,
    image.get_color_mode() == raster::COLOR_GRAY ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB,
    PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  if (dpi > 0)
  {
    png_uint_32 ppm = static_cast<png_uint_32>(dpi / 0.0254 + 0.5);
    png_set_pHYs(png_ptr, info_ptr, ppm, ppm, PNG_RESOLUTION_METER);
  }
  png_write_info(png_ptr, info_ptr);
  for (int y = 0; y < image.get_height(); y++)
    png_write_row(png_ptr, const_cast<png_bytep>(image.get_row(y)));
  png_write_end(png_ptr, nullptr);
  png_destroy_write_struct(&png_ptr, &info_ptr);
  return true;
}

void write_png(const std::string &path, const raster::Image &image, double dpi)
{
  if (image.is_released())
    throw std::logic_error("write_png(): image was already released");
  FILE *fp = fopen(path.c_str(), "wb");
  if (fp == nullptr)
    throw WriteError(WriteError::IO_FAILURE, POSIXError::error_message(path));
  PngErrorState state;
  bool ok = write_png_stream(fp, image, dpi, state);
  if (fclose(fp) != 0 && ok)
    throw WriteError(WriteError::IO_FAILURE, POSIXError::error_message(path));
  if (!ok)
    throw WriteError(WriteError::ENCODING_FAILURE, string_printf(
      _("Unable to write %s: %s"), path.c_str(), state.message));
}


/* class PngDirectoryWriter : PageSink
 * ===================================
 */

PngDirectoryWriter::PngDirectoryWriter(const std::string &path, double dpi)
: path(path), dpi(dpi), committed(false)
{
  try
  {
    this->staging = TemporaryDirectory::beside(path);
  }
  catch (const OSError &ex)
  {
    throw WriteError(WriteError::IO_FAILURE, ex.what());
  }
}

std::string PngDirectoryWriter::get_file_name(int page_index)
{
  return string_printf("page_%d.png", page_index + 1);
}

void PngDirectoryWriter::add_page(OutputPageSpec &page)
{
  if (this->committed)
    throw std::logic_error("PngDirectoryWriter::add_page(): already committed");
  std::string file_path = join_path(this->staging->get_name(), get_file_name(page.get_page_index()));
  /* Tracked before writing, so that a partial file is removed, too. */
  this->files.push_back(file_path);
  write_png(file_path, page.image, this->dpi);
  page.image.release();
}

void PngDirectoryWriter::commit()
{
  if (this->committed)
    throw std::logic_error("PngDirectoryWriter::commit(): already committed");
  try
  {
    this->staging->persist(this->path);
  }
  catch (const OSError &ex)
  {
    throw WriteError(WriteError::IO_FAILURE, ex.what());
  }
  this->committed = true;
}

PngDirectoryWriter::~PngDirectoryWriter()
{
  if (this->committed)
    return;
  for (const std::string &file_path : this->files)
  {
    if (unlink(file_path.c_str()) == -1 && errno != ENOENT)
      error_log << string_printf(_("Warning: %s"), POSIXError::error_message(file_path).c_str()) << std::endl;
  }
}

// vim:ts=2 sts=2 sw=2 et
