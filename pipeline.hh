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

#ifndef PDFDETEXT_PIPELINE_HH
#define PDFDETEXT_PIPELINE_HH

#include <memory>
#include <string>
#include <vector>

#include "cancellation.hh"
#include "page-renderer.hh"
#include "pdf-writer.hh"
#include "raster.hh"

namespace pipeline
{

  enum FailurePolicy
  {
    ON_FAILURE_ABORT,
    ON_FAILURE_PLACEHOLDER,
  };

  enum RendererPreference
  {
    PRIMARY_ONLY,
    PRIMARY_THEN_FALLBACK,
    FALLBACK_ONLY,
  };

  class Settings
  {
  public:
    double scale;
    raster::ColorMode color_mode;
    FailurePolicy on_page_failure;
    RendererPreference renderer_preference;
    double timeout;
    bool crop;
    bool antialias;
    int n_jobs;
    bool export_png;
    EncoderSettings encoder;
    std::string fallback_command;
    Settings();
  };


/* class pipeline::PageStatus
 * ==========================
 */

  class PageStatus
  {
  public:
    enum status_t
    {
      PENDING,
      SUCCESS,
      FALLBACK_USED,
      FAILED,
    };
    status_t status;
    /* Only for FAILED pages: a placeholder was emitted instead. */
    bool placeholder;
    std::string reason;
    PageStatus()
    : status(PENDING), placeholder(false)
    { }
    bool is_terminal() const
    {
      return this->status != PENDING;
    }
    static const char *get_status_name(status_t status);
  };


/* class pipeline::Result
 * ======================
 */

  class Result
  {
  public:
    enum outcome_t
    {
      SUCCESS,
      PARTIAL_SUCCESS,
      ABORTED,
    };
    outcome_t outcome;
    std::vector<PageStatus> pages;
    /* Empty unless an output was produced. */
    std::string output_path;
    std::string abort_reason;
    Result()
    : outcome(ABORTED)
    { }
    std::vector<int> get_pages(PageStatus::status_t status) const;
    std::vector<int> get_placeholder_pages() const;
    static const char *get_outcome_name(outcome_t outcome);
  };


/* class pipeline::RendererFactory
 * ===============================
 */

  /* Every worker thread gets its own pair of renderers. */
  class RendererFactory
  {
  public:
    virtual std::unique_ptr<PageRenderer> create_primary() = 0;
    virtual std::unique_ptr<PageRenderer> create_fallback() = 0;
    virtual ~RendererFactory()
    { }
  };

  class DefaultRendererFactory : public RendererFactory
  {
  protected:
    std::string fallback_command;
  public:
    explicit DefaultRendererFactory(const std::string &fallback_command);
    virtual std::unique_ptr<PageRenderer> create_primary();
    virtual std::unique_ptr<PageRenderer> create_fallback();
  };


/* class pipeline::Controller
 * ==========================
 */

  /* Opened -> Rendering(i) -> ... -> Reconstructing -> Done
   *                                               \--> Aborted
   */
  class Controller
  {
  protected:
    const Settings &settings;
    RendererFactory &factory;
    const Cancellation *cancellation;
    bool is_cancelled() const
    {
      return this->cancellation != nullptr && this->cancellation->is_requested();
    }
    RenderResult render_page(pdf::Document &document, PageRenderer &primary, PageRenderer &fallback,
      int page_index, PageStatus &status) const;
  public:
    Controller(const Settings &settings, RendererFactory &factory, const Cancellation *cancellation = nullptr);
    /* Throws pdf::Document::LoadError if the input cannot be opened,
     * and WriteError if the output cannot be written. A document that
     * could not be converted is reported in the result instead.
     */
    Result run(const std::string &input_path, const std::string &output_path);
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
