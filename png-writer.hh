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

#ifndef PDFDETEXT_PNG_WRITER_HH
#define PDFDETEXT_PNG_WRITER_HH

#include <memory>
#include <string>
#include <vector>

#include "page-sink.hh"
#include "system.hh"

/* Writes every page as page_<n>.png into a new directory.
 *
 * The directory is populated under a temporary name next to its final
 * location, and renamed into place by commit().
 */
class PngDirectoryWriter : public PageSink
{
private:
  PngDirectoryWriter(const PngDirectoryWriter &) = delete;
  PngDirectoryWriter& operator=(const PngDirectoryWriter &) = delete;
protected:
  std::string path;
  double dpi;
  std::unique_ptr<TemporaryDirectory> staging;
  std::vector<std::string> files;
  bool committed;
public:
  PngDirectoryWriter(const std::string &path, double dpi);
  virtual void add_page(OutputPageSpec &page);
  virtual void commit();
  virtual int get_n_pages() const
  {
    return static_cast<int>(this->files.size());
  }
  virtual ~PngDirectoryWriter();
  /* 0 -> "page_1.png" */
  static std::string get_file_name(int page_index);
};

/* Throws WriteError. */
void write_png(const std::string &path, const raster::Image &image, double dpi);

#endif

// vim:ts=2 sts=2 sw=2 et
