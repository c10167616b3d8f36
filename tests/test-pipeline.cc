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

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#if _OPENMP
#include <omp.h>
#endif

#include "cancellation.hh"
#include "page-renderer.hh"
#include "page-sink.hh"
#include "pdf-backend.hh"
#include "pipeline.hh"
#include "raster.hh"
#include "sample-documents.hh"
#include "system.hh"

using pipeline::PageStatus;
using pipeline::Result;

/* Renders blank pages of the right size, except for the pages it is told
 * to fail on.
 */
class FakeRenderer : public PageRenderer
{
protected:
  const char *name;
  std::set<int> failing_pages;
  std::atomic<int> &n_calls;
public:
  FakeRenderer(const char *name, const std::set<int> &failing_pages, std::atomic<int> &n_calls)
  : name(name), failing_pages(failing_pages), n_calls(n_calls)
  { }
  virtual RenderResult render(pdf::Document &document, const RenderRequest &request)
  {
    this->n_calls++;
    if (this->failing_pages.count(request.page_index))
      return RenderResult::failure(RenderError::CORRUPT, std::string(this->name) + " refused the page");
    pdf::PageGeometry geometry;
    raster::Size size(0, 0);
    RenderError failure;
    if (!prepare_render(document, request, geometry, size, failure))
      return RenderResult::failure(failure.kind, failure.message);
    raster::Image image(size.width, size.height, request.color_mode, request.page_index);
    image.fill(0xFF);
    return RenderResult::success(std::move(image));
  }
  virtual const char *get_name() const
  {
    return this->name;
  }
};

class FakeFactory : public pipeline::RendererFactory
{
public:
  std::set<int> primary_failures;
  std::set<int> fallback_failures;
  std::atomic<int> primary_calls;
  std::atomic<int> fallback_calls;
  FakeFactory()
  : primary_calls(0), fallback_calls(0)
  { }
  virtual std::unique_ptr<PageRenderer> create_primary()
  {
    return std::unique_ptr<PageRenderer>(new FakeRenderer("primary", this->primary_failures, this->primary_calls));
  }
  virtual std::unique_ptr<PageRenderer> create_fallback()
  {
    return std::unique_ptr<PageRenderer>(new FakeRenderer("fallback", this->fallback_failures, this->fallback_calls));
  }
};

class PipelineTest : public ::testing::Test
{
protected:
  samples::ScratchDirectory scratch;
  std::string input;
  std::string output;
  pipeline::Settings settings;
  FakeFactory factory;
  PipelineTest()
  : input(scratch / "input.pdf"), output(scratch / "output.pdf")
  {
    this->settings.scale = 0.25;
    this->settings.timeout = 30;
  }
  Result run(pipeline::RendererFactory &factory, const Cancellation *cancellation = nullptr)
  {
    pipeline::Controller controller(this->settings, factory, cancellation);
    return controller.run(this->input, this->output);
  }
  Result run()
  {
    return this->run(this->factory);
  }
  void expect_mixed_page_sizes()
  {
    std::vector<samples::PageBox> boxes = samples::read_media_boxes(this->output);
    ASSERT_EQ(3u, boxes.size());
    EXPECT_NEAR(samples::a4_width, boxes[0].width, 1);
    EXPECT_NEAR(samples::a4_height, boxes[0].height, 1);
    EXPECT_NEAR(samples::letter_width, boxes[1].width, 1);
    EXPECT_NEAR(samples::letter_height, boxes[1].height, 1);
    EXPECT_NEAR(samples::a4_height, boxes[2].width, 1);
    EXPECT_NEAR(samples::a4_width, boxes[2].height, 1);
  }
};

TEST_F(PipelineTest, StripsTextKeepsGeometry)
{
  samples::write_document(this->input, samples::mixed_pages());
  pipeline::DefaultRendererFactory real_factory(this->settings.fallback_command);
  Result result = this->run(real_factory);
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  EXPECT_EQ(this->output, result.output_path);
  ASSERT_EQ(3u, result.pages.size());
  for (const PageStatus &page : result.pages)
    EXPECT_EQ(PageStatus::SUCCESS, page.status);
  this->expect_mixed_page_sizes();
  std::vector<std::string> text = samples::extract_text(this->output);
  ASSERT_EQ(3u, text.size());
  for (const std::string &page_text : text)
    EXPECT_EQ("", page_text);
}

TEST_F(PipelineTest, FallbackRescuesPage)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->factory.primary_failures = { 1 };
  Result result = this->run();
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  std::vector<int> rescued = { 1 };
  EXPECT_EQ(rescued, result.get_pages(PageStatus::FALLBACK_USED));
  EXPECT_EQ(2u, result.get_pages(PageStatus::SUCCESS).size());
  EXPECT_EQ(1, this->factory.fallback_calls.load());
  this->expect_mixed_page_sizes();
}

TEST_F(PipelineTest, AbortLeavesNoOutput)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->factory.primary_failures = { 1 };
  this->factory.fallback_failures = { 1 };
  Result result = this->run();
  EXPECT_EQ(Result::ABORTED, result.outcome);
  EXPECT_TRUE(result.output_path.empty());
  EXPECT_NE(std::string::npos, result.abort_reason.find("Page 2"));
  ASSERT_EQ(3u, result.pages.size());
  EXPECT_EQ(PageStatus::SUCCESS, result.pages[0].status);
  EXPECT_EQ(PageStatus::FAILED, result.pages[1].status);
  EXPECT_FALSE(result.pages[1].placeholder);
  EXPECT_EQ(PageStatus::PENDING, result.pages[2].status);
  EXPECT_FALSE(file_exists(this->output));
  std::vector<std::string> expected = { "input.pdf" };
  EXPECT_EQ(expected, samples::list_directory(this->scratch.get_path()));
}

TEST_F(PipelineTest, PlaceholderKeepsPageCount)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->factory.primary_failures = { 1 };
  this->factory.fallback_failures = { 1 };
  this->settings.on_page_failure = pipeline::ON_FAILURE_PLACEHOLDER;
  Result result = this->run();
  EXPECT_EQ(Result::PARTIAL_SUCCESS, result.outcome);
  std::vector<int> placeholders = { 1 };
  EXPECT_EQ(placeholders, result.get_placeholder_pages());
  EXPECT_EQ(PageStatus::FAILED, result.pages[1].status);
  EXPECT_NE(std::string::npos, result.pages[1].reason.find("primary refused the page"));
  EXPECT_NE(std::string::npos, result.pages[1].reason.find("fallback refused the page"));
  EXPECT_EQ(PageStatus::SUCCESS, result.pages[0].status);
  EXPECT_EQ(PageStatus::SUCCESS, result.pages[2].status);
  this->expect_mixed_page_sizes();
  for (const std::string &page_text : samples::extract_text(this->output))
    EXPECT_EQ("", page_text);
}

TEST_F(PipelineTest, PrimaryOnly)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->factory.primary_failures = { 1 };
  this->settings.renderer_preference = pipeline::PRIMARY_ONLY;
  this->settings.on_page_failure = pipeline::ON_FAILURE_PLACEHOLDER;
  Result result = this->run();
  EXPECT_EQ(Result::PARTIAL_SUCCESS, result.outcome);
  EXPECT_EQ(PageStatus::FAILED, result.pages[1].status);
  EXPECT_TRUE(result.pages[1].placeholder);
  EXPECT_EQ(0, this->factory.fallback_calls.load());
}

TEST_F(PipelineTest, FallbackOnly)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->settings.renderer_preference = pipeline::FALLBACK_ONLY;
  Result result = this->run();
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  EXPECT_EQ(3u, result.get_pages(PageStatus::FALLBACK_USED).size());
  EXPECT_EQ(0, this->factory.primary_calls.load());
  EXPECT_EQ(3, this->factory.fallback_calls.load());
}

TEST_F(PipelineTest, FallbackOnlyWithPdftoppm)
{
  if (!samples::has_program("pdftoppm"))
    GTEST_SKIP() << "pdftoppm is not installed";
  samples::write_document(this->input, samples::mixed_pages());
  this->settings.renderer_preference = pipeline::FALLBACK_ONLY;
  pipeline::DefaultRendererFactory real_factory("pdftoppm");
  Result result = this->run(real_factory);
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  EXPECT_EQ(3u, result.get_pages(PageStatus::FALLBACK_USED).size());
  this->expect_mixed_page_sizes();
  for (const std::string &page_text : samples::extract_text(this->output))
    EXPECT_EQ("", page_text);
}

TEST_F(PipelineTest, CancelledBeforeStart)
{
  samples::write_document(this->input, samples::mixed_pages());
  Cancellation cancellation;
  cancellation.request();
  Result result = this->run(this->factory, &cancellation);
  EXPECT_EQ(Result::ABORTED, result.outcome);
  EXPECT_EQ("Cancelled by user", result.abort_reason);
  EXPECT_EQ(0, this->factory.primary_calls.load());
  EXPECT_FALSE(file_exists(this->output));
}

TEST_F(PipelineTest, MissingInput)
{
  EXPECT_THROW(this->run(), pdf::Document::LoadError);
  EXPECT_FALSE(file_exists(this->output));
}

TEST_F(PipelineTest, UnwritableOutput)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->output = this->scratch / "missing-directory/output.pdf";
  EXPECT_THROW(this->run(), WriteError);
}

TEST_F(PipelineTest, ExportPng)
{
  samples::write_document(this->input, samples::mixed_pages());
  this->output = this->scratch / "input";
  this->settings.export_png = true;
  Result result = this->run();
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  std::vector<std::string> expected = { "page_1.png", "page_2.png", "page_3.png" };
  EXPECT_EQ(expected, samples::list_directory(this->output));
}

TEST_F(PipelineTest, ParallelJobsKeepOrder)
{
  std::vector<samples::PageSpec> pages;
  for (int i = 0; i < 12; i++)
    pages.push_back(samples::PageSpec(100 + 10 * i, 200));
  samples::write_document(this->input, pages);
  this->settings.n_jobs = 4;
  this->factory.primary_failures = { 3, 7 };
  Result result = this->run();
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  std::vector<int> rescued = { 3, 7 };
  EXPECT_EQ(rescued, result.get_pages(PageStatus::FALLBACK_USED));
  std::vector<samples::PageBox> boxes = samples::read_media_boxes(this->output);
  ASSERT_EQ(12u, boxes.size());
  for (int i = 0; i < 12; i++)
    EXPECT_NEAR(100 + 10 * i, boxes[i].width, 0.01) << "page " << i + 1;
}

#if _OPENMP
TEST_F(PipelineTest, JobsDoNotChangeOpenMPDefault)
{
  samples::write_document(this->input, samples::a4_pages(2));
  int default_threads = omp_get_max_threads();
  this->settings.n_jobs = default_threads + 3;
  Result result = this->run();
  EXPECT_EQ(Result::SUCCESS, result.outcome);
  EXPECT_EQ(default_threads, omp_get_max_threads());
}
#endif

TEST(PipelineNamesTest, Names)
{
  EXPECT_STREQ("FallbackUsed", PageStatus::get_status_name(PageStatus::FALLBACK_USED));
  EXPECT_STREQ("PartialSuccess", Result::get_outcome_name(Result::PARTIAL_SUCCESS));
  EXPECT_STREQ("Aborted", Result::get_outcome_name(Result::ABORTED));
}

// vim:ts=2 sts=2 sw=2 et
