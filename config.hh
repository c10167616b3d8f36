/* Copyright © 2007-2019 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
 * Copyright © 2026 The pdfdetext authors
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

#ifndef PDFDETEXT_CONFIG_HH
#define PDFDETEXT_CONFIG_HH

#include <stdexcept>
#include <string>
#include <vector>

#include "i18n.hh"
#include "pipeline.hh"
#include "raster.hh"

class Config
{
public:
  static constexpr int min_dpi = 18;
  static constexpr int max_dpi = 2400;
  std::string output;
  int verbose;
  double dpi;
  raster::ColorMode color_mode;
  EncoderSettings::format_t image_format;
  int jpeg_quality;
  pipeline::FailurePolicy on_page_failure;
  pipeline::RendererPreference renderer_preference;
  std::string fallback_command;
  double timeout;
  bool use_media_box;
  bool antialias;
  bool export_png;
  int n_jobs;
  std::vector<std::string> filenames;

  Config();

  /* Several inputs, or PNG export: --output names a directory. */
  bool output_is_directory() const
  {
    return this->export_png || this->filenames.size() > 1;
  }
  pipeline::Settings get_pipeline_settings() const;

  class NeedVersion
  { };

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
    virtual bool is_quiet() const
    {
      return false;
    }
    virtual bool is_already_printed() const
    {
      return false;
    }
  };

  class NeedHelp : public Error
  {
  public:
    NeedHelp()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
  };

  class InvalidOption : public Error
  {
  public:
    InvalidOption()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
    virtual bool is_already_printed() const
    {
      return true;
    }
  };

  void read_config(int argc, char * const argv[]);
  void usage(const Error &error) const;
  void usage() const;
};

#endif

// vim:ts=2 sts=2 sw=2 et
