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

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "sample-documents.hh"
#include "system.hh"

TEST(Command, CapturesStandardOutput)
{
  Command cmd("echo");
  cmd << "hello" << 42;
  std::ostringstream stream;
  cmd(stream);
  EXPECT_EQ("hello 42\n", stream.str());
}

TEST(Command, NonZeroExitStatus)
{
  Command cmd("sh");
  cmd << "-c" << "exit 3";
  try
  {
    cmd(true);
    FAIL() << "no exception";
  }
  catch (const Command::NotFound &)
  {
    FAIL() << "unexpected NotFound";
  }
  catch (const Command::Timeout &)
  {
    FAIL() << "unexpected Timeout";
  }
  catch (const Command::CommandFailed &ex)
  {
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("exit status 3"));
  }
}

TEST(Command, MissingProgram)
{
  Command cmd("pdfdetext-test-no-such-program");
  EXPECT_THROW(cmd(true), Command::NotFound);
}

TEST(Command, TimeoutKillsTheChild)
{
  Command cmd("sleep");
  cmd << 30;
  cmd.set_timeout(0.3);
  std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  EXPECT_THROW(cmd(true), Command::Timeout);
  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed.count(), 10.0);
}

TEST(Command, TimeoutBeforeTheChildStarts)
{
  /* The deadline passes before the child can set up its process group. */
  for (int i = 0; i < 10; i++)
  {
    Command cmd("sleep");
    cmd << 5;
    cmd.set_timeout(1e-7);
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    EXPECT_THROW(cmd(true), Command::Timeout);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed.count(), 2.0) << "attempt " << i;
  }
}

TEST(Command, TimeoutKillsGrandchildren)
{
  /* The shell would keep the output pipe open through its child. */
  Command cmd("sh");
  cmd << "-c" << "sleep 30; echo done";
  cmd.set_timeout(0.3);
  std::ostringstream stream;
  EXPECT_THROW(cmd(stream, true), Command::Timeout);
  EXPECT_EQ("", stream.str());
}

TEST(TemporaryFile, RemovedUnlessPersisted)
{
  samples::ScratchDirectory scratch;
  std::string target = scratch / "result.pdf";
  std::string temporary_name;
  {
    std::unique_ptr<TemporaryFile> file = TemporaryFile::beside(target);
    temporary_name = *file;
    *file << "data";
    EXPECT_TRUE(file_exists(temporary_name));
  }
  EXPECT_FALSE(file_exists(temporary_name));
  EXPECT_FALSE(file_exists(target));
}

TEST(TemporaryFile, Persist)
{
  samples::ScratchDirectory scratch;
  std::string target = scratch / "result.pdf";
  {
    std::unique_ptr<TemporaryFile> file = TemporaryFile::beside(target);
    *file << "data";
    file->persist(target);
  }
  ASSERT_TRUE(file_exists(target));
  std::vector<std::string> names = samples::list_directory(scratch.get_path());
  ASSERT_EQ(1u, names.size());
  EXPECT_EQ("result.pdf", names[0]);
  ExistingFile file(target);
  std::string content;
  file >> content;
  EXPECT_EQ("data", content);
}

TEST(TemporaryDirectory, Persist)
{
  samples::ScratchDirectory scratch;
  std::string target = scratch / "pages";
  {
    std::unique_ptr<TemporaryDirectory> directory = TemporaryDirectory::beside(target);
    EXPECT_TRUE(is_directory(directory->get_name()));
    directory->persist(target);
  }
  EXPECT_TRUE(is_directory(target));
}

TEST(TemporaryDirectory, RemovedUnlessPersisted)
{
  samples::ScratchDirectory scratch;
  {
    std::unique_ptr<TemporaryDirectory> directory = TemporaryDirectory::beside(scratch / "pages");
  }
  EXPECT_TRUE(samples::list_directory(scratch.get_path()).empty());
}

TEST(Paths, Stem)
{
  EXPECT_EQ("report", path_stem("dir/report.pdf"));
  EXPECT_EQ("report.final", path_stem("/a/b/report.final.pdf"));
  EXPECT_EQ("README", path_stem("README"));
  EXPECT_EQ(".hidden", path_stem(".hidden"));
}

TEST(Paths, Join)
{
  EXPECT_EQ("a/b", join_path("a", "b"));
  EXPECT_EQ("a/b", join_path("a/", "b"));
  EXPECT_EQ("b", join_path("", "b"));
}

TEST(Paths, SameFile)
{
  samples::ScratchDirectory scratch;
  std::string path = scratch / "x";
  {
    File file(path);
  }
  EXPECT_TRUE(is_same_file(path, scratch.get_path() + "/./x"));
  EXPECT_FALSE(is_same_file(path, scratch / "y"));
}

// vim:ts=2 sts=2 sw=2 et
