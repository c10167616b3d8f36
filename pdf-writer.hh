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

#ifndef PDFDETEXT_PDF_WRITER_HH
#define PDFDETEXT_PDF_WRITER_HH

#include <string>
#include <vector>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "page-sink.hh"
#include "raster.hh"

class EncoderSettings
{
public:
  enum format_t
  {
    FORMAT_JPEG,
    FORMAT_LOSSLESS,
  };
  format_t format;
  int jpeg_quality;
  EncoderSettings()
  : format(FORMAT_JPEG), jpeg_quality(85)
  { }
};

/* Builds an image-only PDF: one page per image, each page painting exactly
 * one image XObject over its whole media box.
 *
 * Images are compressed as soon as they arrive; the raw pixels are not kept.
 */
class PdfWriter : public PageSink
{
private:
  PdfWriter(const PdfWriter &) = delete;
  PdfWriter& operator=(const PdfWriter &) = delete;
protected:
  std::string path;
  EncoderSettings settings;
  QPDF pdf;
  int n_pages;
  bool committed;
  QPDFObjectHandle encode_image(const raster::Image &image);
public:
  PdfWriter(const std::string &path, const EncoderSettings &settings);
  virtual void add_page(OutputPageSpec &page);
  virtual void commit();
  virtual int get_n_pages() const
  {
    return this->n_pages;
  }
  static void build(const std::string &path, const EncoderSettings &settings, std::vector<OutputPageSpec> &pages);
};

#endif

// vim:ts=2 sts=2 sw=2 et
