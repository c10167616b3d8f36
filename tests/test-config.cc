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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "config.hh"
#include "sample-documents.hh"
#include "system.hh"

class ConfigTest : public ::testing::Test
{
protected:
  samples::ScratchDirectory scratch;
  Config config;
  void parse(const std::vector<std::string> &args)
  {
    this->config = Config();
    std::vector<std::string> storage;
    storage.push_back("pdfdetext");
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (std::string &arg : storage)
      argv.push_back(&arg[0]);
    argv.push_back(nullptr);
    this->config.read_config(static_cast<int>(storage.size()), argv.data());
  }
};

TEST_F(ConfigTest, Defaults)
{
  parse({"-o", scratch / "out.pdf", "in.pdf"});
  EXPECT_EQ(scratch / "out.pdf", config.output);
  ASSERT_EQ(1u, config.filenames.size());
  EXPECT_EQ("in.pdf", config.filenames[0]);
  pipeline::Settings settings = config.get_pipeline_settings();
  EXPECT_DOUBLE_EQ(200.0 / 72.0, settings.scale);
  EXPECT_EQ(raster::COLOR_RGB, settings.color_mode);
  EXPECT_EQ(pipeline::ON_FAILURE_ABORT, settings.on_page_failure);
  EXPECT_EQ(pipeline::PRIMARY_THEN_FALLBACK, settings.renderer_preference);
  EXPECT_EQ(EncoderSettings::FORMAT_JPEG, settings.encoder.format);
  EXPECT_EQ(85, settings.encoder.jpeg_quality);
  EXPECT_DOUBLE_EQ(60, settings.timeout);
  EXPECT_TRUE(settings.crop);
  EXPECT_FALSE(settings.export_png);
  EXPECT_EQ(1, settings.n_jobs);
  EXPECT_FALSE(settings.fallback_command.empty());
}

TEST_F(ConfigTest, AllOptions)
{
  parse({
    "--output", scratch / "out.pdf",
    "--dpi=300",
    "--color-mode=gray",
    "--image-format=png",
    "--jpeg-quality=50",
    "--on-page-failure=placeholder",
    "--renderer=fallback-only",
    "--fallback-command=/opt/bin/pdftoppm",
    "--timeout=2.5",
    "--media-box",
    "--no-anti-alias",
    "-j", "4",
    "-v", "-v",
    "in.pdf"
  });
  pipeline::Settings settings = config.get_pipeline_settings();
  EXPECT_DOUBLE_EQ(300.0 / 72.0, settings.scale);
  EXPECT_EQ(raster::COLOR_GRAY, settings.color_mode);
  EXPECT_EQ(EncoderSettings::FORMAT_LOSSLESS, settings.encoder.format);
  EXPECT_EQ(50, settings.encoder.jpeg_quality);
  EXPECT_EQ(pipeline::ON_FAILURE_PLACEHOLDER, settings.on_page_failure);
  EXPECT_EQ(pipeline::FALLBACK_ONLY, settings.renderer_preference);
  EXPECT_EQ("/opt/bin/pdftoppm", settings.fallback_command);
  EXPECT_DOUBLE_EQ(2.5, settings.timeout);
  EXPECT_FALSE(settings.crop);
  EXPECT_EQ(4, settings.n_jobs);
  EXPECT_FALSE(config.antialias);
  EXPECT_FALSE(settings.antialias);
  EXPECT_EQ(3, config.verbose);
}

TEST_F(ConfigTest, Scale)
{
  parse({"-o", scratch / "out.pdf", "--scale=2", "in.pdf"});
  EXPECT_DOUBLE_EQ(2.0, config.get_pipeline_settings().scale);
}

TEST_F(ConfigTest, Grayscale)
{
  parse({"-o", scratch / "out.pdf", "--grayscale", "in.pdf"});
  EXPECT_EQ(raster::COLOR_GRAY, config.color_mode);
}

TEST_F(ConfigTest, Quiet)
{
  parse({"-q", "-o", scratch / "out.pdf", "in.pdf"});
  EXPECT_EQ(0, config.verbose);
}

TEST_F(ConfigTest, ResolutionOutOfRange)
{
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--dpi=10", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--dpi=3000", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--scale=0", "in.pdf"}), Config::Error);
}

TEST_F(ConfigTest, NotANumber)
{
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--dpi=high", "in.pdf"}), Config::Error);
}

TEST_F(ConfigTest, UnknownChoices)
{
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--color-mode=cmyk", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--on-page-failure=retry", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--renderer=gpu", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--jpeg-quality=0", "in.pdf"}), Config::Error);
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "--timeout=-1", "in.pdf"}), Config::Error);
}

TEST_F(ConfigTest, MissingInput)
{
  EXPECT_THROW(parse({"-o", scratch / "out.pdf"}), Config::Error);
}

TEST_F(ConfigTest, MissingOutput)
{
  EXPECT_THROW(parse({"in.pdf"}), Config::Error);
}

TEST_F(ConfigTest, InputIsOutput)
{
  std::string path = scratch / "same.pdf";
  samples::write_document(path, samples::a4_pages(1));
  EXPECT_THROW(parse({"-o", path, path}), Config::Error);
}

TEST_F(ConfigTest, SeveralInputsNeedDirectory)
{
  EXPECT_THROW(parse({"-o", scratch / "out.pdf", "a.pdf", "b.pdf"}), Config::Error);
  parse({"-o", scratch.get_path(), "a.pdf", "b.pdf"});
  EXPECT_TRUE(config.output_is_directory());
  EXPECT_EQ(2u, config.filenames.size());
}

TEST_F(ConfigTest, ExportPngNeedsDirectory)
{
  EXPECT_THROW(parse({"--export-png", "-o", scratch / "out", "a.pdf"}), Config::Error);
  parse({"--export-png", "-o", scratch.get_path(), "a.pdf"});
  EXPECT_TRUE(config.get_pipeline_settings().export_png);
}

TEST_F(ConfigTest, Help)
{
  EXPECT_THROW(parse({"--help"}), Config::NeedHelp);
}

TEST_F(ConfigTest, Version)
{
  EXPECT_THROW(parse({"--version"}), Config::NeedVersion);
}

// vim:ts=2 sts=2 sw=2 et
