/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#include "config.hh"

#include <climits>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <getopt.h>

#include "autoconf.hh"
#include "debug.hh"
#include "i18n.hh"
#include "paths.hh"
#include "string-utils.hh"
#include "system.hh"

Config::Config()
{
  this->verbose = 1;
  this->dpi = 200;
  this->color_mode = raster::COLOR_RGB;
  this->image_format = EncoderSettings::FORMAT_JPEG;
  this->jpeg_quality = 85;
  this->on_page_failure = pipeline::ON_FAILURE_ABORT;
  this->renderer_preference = pipeline::PRIMARY_THEN_FALLBACK;
  this->fallback_command = paths::fallback_command;
  this->timeout = 60;
  this->use_media_box = false;
  this->antialias = true;
  this->export_png = false;
  this->n_jobs = 1;
}

pipeline::Settings Config::get_pipeline_settings() const
{
  pipeline::Settings settings;
  settings.scale = this->dpi / 72.0;
  settings.color_mode = this->color_mode;
  settings.on_page_failure = this->on_page_failure;
  settings.renderer_preference = this->renderer_preference;
  settings.timeout = this->timeout;
  settings.crop = !this->use_media_box;
  settings.antialias = this->antialias;
  settings.n_jobs = this->n_jobs;
  settings.export_png = this->export_png;
  settings.encoder.format = this->image_format;
  settings.encoder.jpeg_quality = this->jpeg_quality;
  settings.fallback_command = this->fallback_command;
  return settings;
}

namespace string
{
  template <typename tp>
  tp as(const std::string &);
}

template <typename tp>
tp string::as(const std::string &s)
{
  tp n;
  std::istringstream stream(s);
  stream >> n;
  if (stream.fail() || !stream.eof())
    throw Config::Error(string_printf(
      _("\"%s\" is not a valid number"),
      s.c_str())
    );
  return n;
}

static void check_dpi(double dpi)
{
  if (!(dpi >= Config::min_dpi && dpi <= Config::max_dpi))
    throw Config::Error(string_printf(
      _("The specified resolution is outside the allowed range: %d .. %d"),
      Config::min_dpi, Config::max_dpi
    ));
}

static raster::ColorMode parse_color_mode(const std::string &s)
{
  if (s == "rgb")
    return raster::COLOR_RGB;
  else if (s == "gray" || s == "grey")
    return raster::COLOR_GRAY;
  throw Config::Error(string_printf(_("Unknown color mode: %s"), s.c_str()));
}

static EncoderSettings::format_t parse_image_format(const std::string &s)
{
  if (s == "jpeg" || s == "jpg")
    return EncoderSettings::FORMAT_JPEG;
  else if (s == "png" || s == "lossless")
    return EncoderSettings::FORMAT_LOSSLESS;
  throw Config::Error(string_printf(_("Unknown image format: %s"), s.c_str()));
}

static pipeline::FailurePolicy parse_failure_policy(const std::string &s)
{
  if (s == "abort")
    return pipeline::ON_FAILURE_ABORT;
  else if (s == "placeholder")
    return pipeline::ON_FAILURE_PLACEHOLDER;
  throw Config::Error(string_printf(_("Unknown page failure policy: %s"), s.c_str()));
}

static pipeline::RendererPreference parse_renderer_preference(const std::string &s)
{
  if (s == "primary-only")
    return pipeline::PRIMARY_ONLY;
  else if (s == "primary-then-fallback")
    return pipeline::PRIMARY_THEN_FALLBACK;
  else if (s == "fallback-only")
    return pipeline::FALLBACK_ONLY;
  throw Config::Error(string_printf(_("Unknown renderer preference: %s"), s.c_str()));
}

void Config::read_config(int argc, char * const argv[])
{
  enum
  {
    OPT_DPI = 'd',
    OPT_HELP = 'h',
    OPT_JOBS = 'j',
    OPT_OUTPUT = 'o',
    OPT_QUIET = 'q',
    OPT_VERBOSE = 'v',
    OPT_DUMMY = CHAR_MAX,
    OPT_ANTIALIAS,
    OPT_COLOR_MODE,
    OPT_EXPORT_PNG,
    OPT_FALLBACK_COMMAND,
    OPT_GRAYSCALE,
    OPT_IMAGE_FORMAT,
    OPT_JPEG_QUALITY,
    OPT_MEDIA_BOX,
    OPT_NO_ANTIALIAS,
    OPT_ON_PAGE_FAILURE,
    OPT_RENDERER,
    OPT_SCALE,
    OPT_TIMEOUT,
    OPT_VERSION,
  };
  static struct option options [] =
  {
    { "anti-alias", 0, nullptr, OPT_ANTIALIAS },
    { "color-mode", 1, nullptr, OPT_COLOR_MODE },
    { "dpi", 1, nullptr, OPT_DPI },
    { "export-png", 0, nullptr, OPT_EXPORT_PNG },
    { "fallback-command", 1, nullptr, OPT_FALLBACK_COMMAND },
    { "grayscale", 0, nullptr, OPT_GRAYSCALE },
    { "help", 0, nullptr, OPT_HELP },
    { "image-format", 1, nullptr, OPT_IMAGE_FORMAT },
    { "jobs", 1, nullptr, OPT_JOBS },
    { "jpeg-quality", 1, nullptr, OPT_JPEG_QUALITY },
    { "media-box", 0, nullptr, OPT_MEDIA_BOX },
    { "no-anti-alias", 0, nullptr, OPT_NO_ANTIALIAS },
    { "on-page-failure", 1, nullptr, OPT_ON_PAGE_FAILURE },
    { "output", 1, nullptr, OPT_OUTPUT },
    { "quiet", 0, nullptr, OPT_QUIET },
    { "renderer", 1, nullptr, OPT_RENDERER },
    { "scale", 1, nullptr, OPT_SCALE },
    { "timeout", 1, nullptr, OPT_TIMEOUT },
    { "verbose", 0, nullptr, OPT_VERBOSE },
    { "version", 0, nullptr, OPT_VERSION },
    { nullptr, 0, nullptr, '\0' }
  };
  /* glibc reinitialises its scanner when optind is 0. */
  optind = 0;
  while (true)
  {
    int c = getopt_long(argc, argv, "o:d:qvj:h", options, nullptr);
    if (c < 0)
      break;
    if (c == 0)
      throw Config::Error(_("Unable to parse command-line options"));
    switch (c)
    {
    case OPT_DPI:
      this->dpi = string::as<int>(optarg);
      check_dpi(this->dpi);
      break;
    case OPT_SCALE:
      this->dpi = 72.0 * string::as<double>(optarg);
      check_dpi(this->dpi);
      break;
    case OPT_COLOR_MODE:
      this->color_mode = parse_color_mode(optarg);
      break;
    case OPT_GRAYSCALE:
      this->color_mode = raster::COLOR_GRAY;
      break;
    case OPT_IMAGE_FORMAT:
      this->image_format = parse_image_format(optarg);
      break;
    case OPT_JPEG_QUALITY:
      this->jpeg_quality = string::as<int>(optarg);
      if (this->jpeg_quality < 1 || this->jpeg_quality > 100)
        throw Config::Error(string_printf(
          _("The specified JPEG quality is outside the allowed range: %d .. %d"),
          1, 100
        ));
      break;
    case OPT_ON_PAGE_FAILURE:
      this->on_page_failure = parse_failure_policy(optarg);
      break;
    case OPT_RENDERER:
      this->renderer_preference = parse_renderer_preference(optarg);
      break;
    case OPT_FALLBACK_COMMAND:
      this->fallback_command = optarg;
      if (this->fallback_command.empty())
        throw Config::Error(_("The fallback command must not be empty"));
      break;
    case OPT_TIMEOUT:
      this->timeout = string::as<double>(optarg);
      if (this->timeout < 0)
        throw Config::Error(_("The timeout must not be negative"));
      break;
    case OPT_MEDIA_BOX:
      this->use_media_box = true;
      break;
    case OPT_ANTIALIAS:
      this->antialias = true;
      break;
    case OPT_NO_ANTIALIAS:
      this->antialias = false;
      break;
    case OPT_EXPORT_PNG:
      this->export_png = true;
      break;
    case OPT_QUIET:
      this->verbose = 0;
      break;
    case OPT_VERBOSE:
      this->verbose++;
      break;
    case OPT_OUTPUT:
      this->output = optarg;
      if (this->output.empty())
        throw Config::Error(_("Invalid output file name"));
      break;
    case OPT_JOBS:
      this->n_jobs = string::as<int>(optarg);
      if (this->n_jobs < 0)
        throw Config::Error(_("The number of jobs must not be negative"));
      break;
    case OPT_HELP:
      throw NeedHelp();
    case OPT_VERSION:
      throw NeedVersion();
    case '?':
    case ':':
      throw InvalidOption();
    default:
      throw std::logic_error(_("Unknown option"));
    }
  }
  if (optind > argc - 1)
    throw Config::Error(_("No input file name was specified"));
  while (optind < argc)
  {
    this->filenames.push_back(argv[optind]);
    if (is_same_file(this->output, argv[optind]))
      throw Config::Error(string_printf(
        _("Input file is the same as output file: %s"),
        this->output.c_str()
      ));
    optind++;
  }
  if (this->output.empty())
    throw Config::Error(_("No output file name was specified"));
  if (this->output_is_directory() && !is_directory(this->output))
    throw Config::Error(string_printf(
      this->export_png
        ? _("With --export-png, the output must be an existing directory: %s")
        : _("With several input files, the output must be an existing directory: %s"),
      this->output.c_str()
    ));
}

template <typename streamtp>
static void print_usage(streamtp &stream)
{
  stream
    << _("Usage: ") << std::endl
    << _("   pdfdetext -o <output-pdf-file> [options] <pdf-file>") << std::endl
    << _("   pdfdetext -o <output-directory> [options] <pdf-file>...") << std::endl
    << std::endl << _("Options: ")
    << std::endl << _(" -o, --output=FILE")
    << std::endl << _(" -d, --dpi=RESOLUTION")
    << std::endl << _("     --scale=FACTOR")
    << std::endl <<   "     --color-mode=rgb"
    << std::endl <<   "     --color-mode=gray"
    << std::endl <<   "     --grayscale"
    << std::endl <<   "     --image-format=jpeg"
    << std::endl <<   "     --image-format=png"
    << std::endl <<   "     --jpeg-quality=N"
    << std::endl <<   "     --on-page-failure=abort"
    << std::endl <<   "     --on-page-failure=placeholder"
    << std::endl <<   "     --renderer=primary-only"
    << std::endl <<   "     --renderer=primary-then-fallback"
    << std::endl <<   "     --renderer=fallback-only"
    << std::endl << _("     --fallback-command=COMMAND")
    << std::endl << _("     --timeout=SECONDS")
    << std::endl <<   "     --media-box"
    << std::endl <<   "     --anti-alias"
    << std::endl <<   "     --no-anti-alias"
    << std::endl <<   "     --export-png"
    << std::endl <<   " -v, --verbose"
#if _OPENMP
    << std::endl <<   " -j, --jobs=N"
#endif
    << std::endl <<   " -q, --quiet"
    << std::endl <<   " -h, --help"
    << std::endl <<   "     --version"
    << std::endl;
}

void Config::usage(const Config::Error &error) const
{
  DebugStream &log = debug(0, this->verbose);
  if (error.is_already_printed())
    log << std::endl;
  if (!error.is_quiet())
    log << error << std::endl << std::endl;
  print_usage(log);
}

void Config::usage() const
{
  print_usage(std::cout);
}

// vim:ts=2 sts=2 sw=2 et
