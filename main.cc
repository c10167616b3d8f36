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

#include <csignal>
#include <initializer_list>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "autoconf.hh"
#include "cancellation.hh"
#include "config.hh"
#include "debug.hh"
#include "i18n.hh"
#include "pdf-backend.hh"
#include "pipeline.hh"
#include "string-utils.hh"
#include "system.hh"
#include "version.hh"

static Config config;

static Cancellation cancellation;

static inline DebugStream &debug(int n)
{
  return debug(n, config.verbose);
}

enum exit_status_t
{
  EXIT_STATUS_OK = 0,
  EXIT_STATUS_FAILED = 1,
  EXIT_STATUS_IO_ERROR = 2,
  EXIT_STATUS_PARTIAL = 3,
};

extern "C" void handle_termination_signal(int)
{
  cancellation.request();
}

static void install_signal_handlers()
{
  struct sigaction action;
  action.sa_handler = handle_termination_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  for (int sig : { SIGINT, SIGTERM })
    if (sigaction(sig, &action, nullptr) < 0)
      throw_posix_error("sigaction()");
}

static std::string get_output_path(const std::string &input)
{
  if (!config.output_is_directory())
    return config.output;
  if (config.export_png)
    return join_path(config.output, path_stem(input));
  std::string directory_name, file_name;
  split_path(input, directory_name, file_name);
  return join_path(config.output, file_name);
}

static void report_result(const std::string &input, const pipeline::Result &result)
{
  std::vector<int> fallback_pages = result.get_pages(pipeline::PageStatus::FALLBACK_USED);
  if (!fallback_pages.empty())
    debug(2) << string_printf(_("pages rendered with the fallback renderer: %s"),
      string::format_page_numbers(fallback_pages).c_str()) << std::endl;
  switch (result.outcome)
  {
  case pipeline::Result::SUCCESS:
    debug(1) << string_printf(
      ngettext("%zu page -> %s", "%zu pages -> %s", result.pages.size()),
      result.pages.size(), result.output_path.c_str()) << std::endl;
    break;
  case pipeline::Result::PARTIAL_SUCCESS:
    error_log << string_printf(
      _("Warning: %s: placeholders were substituted for pages %s"),
      input.c_str(),
      string::format_page_numbers(result.get_placeholder_pages()).c_str()
    ) << std::endl;
    debug(1) << string_printf(
      ngettext("%zu page -> %s", "%zu pages -> %s", result.pages.size()),
      result.pages.size(), result.output_path.c_str()) << std::endl;
    break;
  case pipeline::Result::ABORTED:
    error_log << string_printf(_("%s: conversion aborted: %s"),
      input.c_str(), result.abort_reason.c_str()) << std::endl;
    break;
  }
}

static int xmain(int argc, char * const argv[])
{
  std::ios_base::sync_with_stdio(false);

  try
  {
    config.read_config(argc, argv);
  }
  catch (const Config::NeedVersion &)
  {
    std::cout << get_multiline_version();
    exit(0);
  }
  catch (const Config::NeedHelp &)
  {
    config.usage();
    exit(0);
  }
  catch (const Config::Error &ex)
  {
    config.usage(ex);
    exit(1);
  }

#if !_OPENMP
  if (config.n_jobs != 1)
  {
    debug(1) << string_printf(_("Warning: %s"), _("pdfdetext was built without OpenMP support; multi-threading is disabled.")) << std::endl;
    config.n_jobs = 1;
  }
#endif

  pdf::Environment environment;
  environment.set_verbose(config.verbose);
  install_signal_handlers();

  pipeline::Settings settings = config.get_pipeline_settings();
  pipeline::DefaultRendererFactory factory(settings.fallback_command);
  pipeline::Controller controller(settings, factory, &cancellation);

  size_t n_documents = config.filenames.size();
  size_t n_processed = 0;
  size_t n_failed = 0;
  size_t n_partial = 0;
  bool io_error = false;
  for (const std::string &input : config.filenames)
  {
    if (cancellation.is_requested())
      break;
    n_processed++;
    std::string output = get_output_path(input);
    if (n_documents > 1)
      debug(1) << input << ":" << std::endl;
    debug(0)++;
    /* These exception handlers duplicate the ones in main(),
     * except that the next document is still processed.
     */
    try
    {
      if (is_same_file(output, input))
        throw Config::Error(string_printf(
          _("Input file is the same as output file: %s"),
          output.c_str()
        ));
      pipeline::Result result = controller.run(input, output);
      report_result(input, result);
      if (result.outcome == pipeline::Result::ABORTED)
        n_failed++;
      else if (result.outcome == pipeline::Result::PARTIAL_SUCCESS)
        n_partial++;
    }
    catch (const std::ios_base::failure &ex)
    {
      error_log << string_printf(_("I/O error (%s)"), ex.what()) << std::endl;
      io_error = true;
      n_failed++;
    }
    catch (const std::runtime_error &ex)
    {
      error_log << input << ": " << ex << std::endl;
      n_failed++;
    }
    debug(0)--;
  }
  if (n_documents > 1)
    debug(1) << string_printf(
      _("%zu of %zu documents processed, %zu failed"),
      n_processed, n_documents, n_failed
    ) << std::endl;
  if (cancellation.is_requested())
    error_log << _("Interrupted") << std::endl;
  if (io_error)
    return EXIT_STATUS_IO_ERROR;
  if (n_failed > 0 || n_processed < n_documents)
    return EXIT_STATUS_FAILED;
  if (n_partial > 0)
    return EXIT_STATUS_PARTIAL;
  return EXIT_STATUS_OK;
}

int main(int argc, char * const argv[])
try
{
  i18n::setup();
  return xmain(argc, argv);
}
/* Please keep the exception handlers in sync with the ones in xmain(). */
catch (std::ios_base::failure &ex)
{
  error_log << string_printf(_("I/O error (%s)"), ex.what()) << std::endl;
  exit(2);
}
catch (std::runtime_error &ex)
{
  error_log << ex << std::endl;
  exit(1);
}

// vim:ts=2 sts=2 sw=2 et
