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

#include "pipeline.hh"

#include <atomic>
#include <exception>
#include <stdexcept>
#include <utility>

#if _OPENMP
#include <omp.h>
#endif

#include "debug.hh"
#include "fallback-renderer.hh"
#include "i18n.hh"
#include "page-sink.hh"
#include "png-writer.hh"
#include "raster-store.hh"
#include "string-utils.hh"
#include "system.hh"

static inline DebugStream &debug(int n)
{
  return debug(n, pdf::Environment::verbose);
}

/* class pipeline::Settings
 * ========================
 */

pipeline::Settings::Settings()
: scale(200.0 / 72.0),
  color_mode(raster::COLOR_RGB),
  on_page_failure(ON_FAILURE_ABORT),
  renderer_preference(PRIMARY_THEN_FALLBACK),
  timeout(60),
  crop(true),
  antialias(true),
  n_jobs(1),
  export_png(false),
  fallback_command("pdftoppm")
{ }


/* class pipeline::PageStatus
 * ==========================
 */

const char *pipeline::PageStatus::get_status_name(status_t status)
{
  switch (status)
  {
  case PENDING:
    return "Pending";
  case SUCCESS:
    return "Success";
  case FALLBACK_USED:
    return "FallbackUsed";
  case FAILED:
    return "Failed";
  }
  return "?";
}


/* class pipeline::Result
 * ======================
 */

std::vector<int> pipeline::Result::get_pages(PageStatus::status_t status) const
{
  std::vector<int> indices;
  for (size_t i = 0; i < this->pages.size(); i++)
    if (this->pages[i].status == status)
      indices.push_back(static_cast<int>(i));
  return indices;
}

std::vector<int> pipeline::Result::get_placeholder_pages() const
{
  std::vector<int> indices;
  for (size_t i = 0; i < this->pages.size(); i++)
    if (this->pages[i].placeholder)
      indices.push_back(static_cast<int>(i));
  return indices;
}

const char *pipeline::Result::get_outcome_name(outcome_t outcome)
{
  switch (outcome)
  {
  case SUCCESS:
    return "Success";
  case PARTIAL_SUCCESS:
    return "PartialSuccess";
  case ABORTED:
    return "Aborted";
  }
  return "?";
}


/* class pipeline::DefaultRendererFactory : pipeline::RendererFactory
 * ===================================================================
 */

pipeline::DefaultRendererFactory::DefaultRendererFactory(const std::string &fallback_command)
: fallback_command(fallback_command)
{ }

std::unique_ptr<PageRenderer> pipeline::DefaultRendererFactory::create_primary()
{
  return std::unique_ptr<PageRenderer>(new PopplerRenderer());
}

std::unique_ptr<PageRenderer> pipeline::DefaultRendererFactory::create_fallback()
{
  return std::unique_ptr<PageRenderer>(new ExternalRenderer(this->fallback_command));
}


/* class pipeline::Controller
 * ==========================
 */

pipeline::Controller::Controller(const Settings &settings, RendererFactory &factory, const Cancellation *cancellation)
: settings(settings),
  factory(factory),
  cancellation(cancellation)
{ }

RenderResult pipeline::Controller::render_page(pdf::Document &document, PageRenderer &primary, PageRenderer &fallback,
  int page_index, PageStatus &status) const
{
  RenderRequest request(page_index, this->settings.scale, this->settings.color_mode);
  request.timeout = this->settings.timeout;
  request.crop = this->settings.crop;
  request.antialias = this->settings.antialias;
  request.cancellation = this->cancellation;
  std::string primary_reason;
  if (this->settings.renderer_preference != FALLBACK_ONLY)
  {
    RenderResult result = primary.render(document, request);
    if (result.is_ok())
    {
      status.status = PageStatus::SUCCESS;
      return result;
    }
    primary_reason = result.get_error().describe();
    if (result.get_error().kind == RenderError::CANCELLED || this->settings.renderer_preference == PRIMARY_ONLY)
    {
      status.status = PageStatus::FAILED;
      status.reason = primary_reason;
      return result;
    }
    debug(1) << string_printf(_("Warning: page %d: %s; trying the %s renderer"),
      page_index + 1, primary_reason.c_str(), fallback.get_name()) << std::endl;
  }
  RenderResult result = fallback.render(document, request);
  if (result.is_ok())
  {
    status.status = PageStatus::FALLBACK_USED;
    return result;
  }
  status.status = PageStatus::FAILED;
  if (primary_reason.empty())
    status.reason = result.get_error().describe();
  else
    status.reason = string_printf("%s; %s", primary_reason.c_str(), result.get_error().describe().c_str());
  return result;
}

namespace
{
  /* Shared between the worker threads; only touched inside the
   * pdfdetext_pipeline critical section, except for the flag.
   */
  class RunState
  {
  public:
    std::atomic<bool> aborted;
    int abort_index;
    std::string abort_reason;
    std::exception_ptr error;
    RunState()
    : aborted(false), abort_index(-1)
    { }
    void abort(int index, const std::string &reason)
    {
      this->aborted = true;
      if (this->abort_index < 0 || index < this->abort_index)
      {
        this->abort_index = index;
        this->abort_reason = reason;
      }
    }
    void fail(std::exception_ptr error)
    {
      this->aborted = true;
      if (!this->error)
        this->error = error;
    }
  };
}

pipeline::Result pipeline::Controller::run(const std::string &input_path, const std::string &output_path)
{
  Result result;
  pdf::Document document(input_path);
  int n_pages = document.getNumPages();
  result.pages.assign(n_pages, PageStatus());
  debug(2) << string_printf(
    ngettext("opened %s (%d page)", "opened %s (%d pages)", n_pages),
    input_path.c_str(), n_pages) << std::endl;
  if (n_pages <= 0)
  {
    result.abort_reason = _("Document has no pages");
    debug(2) << _("aborted") << std::endl;
    return result;
  }

  /* The temporary output must outlive the sink writing into it. */
  std::unique_ptr<TemporaryFile> output_file;
  std::unique_ptr<PageSink> sink;
  if (this->settings.export_png)
    sink.reset(new PngDirectoryWriter(output_path, this->settings.scale * 72.0));
  else
  {
    try
    {
      output_file = TemporaryFile::beside(output_path);
    }
    catch (const OSError &ex)
    {
      throw WriteError(WriteError::IO_FAILURE, ex.what());
    }
    output_file->close();
    sink.reset(new PdfWriter(*output_file, this->settings.encoder));
  }
  RasterPageStore store(n_pages);
  RunState state;

#if _OPENMP
  int n_threads = this->settings.n_jobs >= 1 ? this->settings.n_jobs : omp_get_max_threads();
#else
  int n_threads = 1;
#endif
  debug(2) << string_printf(ngettext("using %d thread", "using %d threads", n_threads), n_threads) << std::endl;
  debug(0)++;
  #pragma omp parallel num_threads(n_threads)
  {
    std::unique_ptr<pdf::Document> own_document;
    pdf::Document *thread_document = &document;
    std::unique_ptr<PageRenderer> primary, fallback;
    try
    {
#if _OPENMP
      /* Poppler documents must not be shared between threads. */
      if (omp_get_thread_num() != 0)
      {
        own_document.reset(new pdf::Document(input_path));
        thread_document = own_document.get();
      }
#endif
    }
    catch (const std::exception &)
    {
      #pragma omp critical(pdfdetext_pipeline)
      state.fail(std::current_exception());
    }
    #pragma omp critical(pdfdetext_pipeline)
    try
    {
      primary = this->factory.create_primary();
      fallback = this->factory.create_fallback();
    }
    catch (const std::exception &)
    {
      state.fail(std::current_exception());
    }
    #pragma omp for schedule(dynamic)
    for (int i = 0; i < n_pages; i++)
    {
      if (state.aborted || !primary || !fallback)
        continue;
      if (this->is_cancelled())
      {
        #pragma omp critical(pdfdetext_pipeline)
        state.abort(i, _("Cancelled by user"));
        continue;
      }
      try
      {
        PageStatus status;
        debug(2) << string_printf(_("rendering page %d"), i + 1) << std::endl;
        RenderResult rendered = this->render_page(*thread_document, *primary, *fallback, i, status);
        std::unique_ptr<OutputPageSpec> page;
        std::string abort_reason;
        if (rendered.is_ok())
        {
          pdf::PageGeometry geometry = thread_document->get_page_geometry(i + 1, this->settings.crop);
          page.reset(new OutputPageSpec(geometry.width, geometry.height, rendered.take_image()));
        }
        else
        {
          debug(1) << string_printf(_("page %d failed: %s"), i + 1, status.reason.c_str()) << std::endl;
          if (rendered.get_error().kind == RenderError::CANCELLED)
            abort_reason = _("Cancelled by user");
          else if (this->settings.on_page_failure == ON_FAILURE_ABORT)
            abort_reason = string_printf(_("Page %d could not be rendered: %s"), i + 1, status.reason.c_str());
          else
          {
            pdf::PageGeometry geometry;
            raster::Size size(0, 0);
            RenderRequest request(i, this->settings.scale, this->settings.color_mode);
            request.crop = this->settings.crop;
            RenderError failure;
            if (prepare_render(*thread_document, request, geometry, size, failure))
            {
              page.reset(new OutputPageSpec(geometry.width, geometry.height,
                raster::make_placeholder(size.width, size.height, this->settings.color_mode, i)));
              status.placeholder = true;
              debug(1) << string_printf(_("Warning: page %d replaced by a placeholder"), i + 1) << std::endl;
            }
            else
              abort_reason = string_printf(_("Page %d could not be rendered, and no placeholder fits it: %s"),
                i + 1, failure.describe().c_str());
          }
        }
        #pragma omp critical(pdfdetext_pipeline)
        try
        {
          result.pages[i] = status;
          if (!page)
          {
            state.abort(i, abort_reason);
            store.skip(i);
          }
          else if (!state.aborted)
          {
            store.append(i, std::move(*page));
            std::vector<OutputPageSpec> ready = store.drain();
            for (OutputPageSpec &ready_page : ready)
              sink->add_page(ready_page);
          }
        }
        catch (const std::exception &)
        {
          state.fail(std::current_exception());
        }
      }
      catch (const std::exception &)
      {
        #pragma omp critical(pdfdetext_pipeline)
        state.fail(std::current_exception());
      }
    }
  }
  debug(0)--;
  if (state.error)
  {
    debug(2) << _("aborted") << std::endl;
    std::rethrow_exception(state.error);
  }
  if (!state.aborted && this->is_cancelled())
    state.abort(n_pages, _("Cancelled by user"));
  if (state.aborted)
  {
    result.outcome = Result::ABORTED;
    result.abort_reason = state.abort_reason;
    debug(2) << _("aborted") << std::endl;
    return result;
  }
  if (!store.is_complete() || sink->get_n_pages() != n_pages)
    throw std::logic_error("pipeline::Controller::run(): not every page reached the output");
  debug(2) << _("reconstructing the document") << std::endl;
  sink->commit();
  if (output_file)
  {
    try
    {
      output_file->persist(output_path);
    }
    catch (const OSError &ex)
    {
      throw WriteError(WriteError::IO_FAILURE, ex.what());
    }
  }
  result.output_path = output_path;
  result.outcome = result.get_placeholder_pages().empty() ? Result::SUCCESS : Result::PARTIAL_SUCCESS;
  debug(2) << _("done") << std::endl;
  return result;
}

// vim:ts=2 sts=2 sw=2 et
