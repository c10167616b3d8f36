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

#include <stdexcept>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "raster-store.hh"

static OutputPageSpec make_page(int index)
{
  return OutputPageSpec(100 + index, 200, raster::Image(2, 2, raster::COLOR_GRAY, index));
}

TEST(RasterPageStore, DrainsInOrder)
{
  RasterPageStore store(3);
  store.append(0, make_page(0));
  store.append(1, make_page(1));
  std::vector<OutputPageSpec> pages = store.drain();
  ASSERT_EQ(2u, pages.size());
  EXPECT_EQ(0, pages[0].get_page_index());
  EXPECT_EQ(1, pages[1].get_page_index());
  EXPECT_EQ(2, store.get_next_index());
  EXPECT_FALSE(store.is_complete());
}

TEST(RasterPageStore, HoldsPagesUntilGapIsFilled)
{
  RasterPageStore store(4);
  store.append(2, make_page(2));
  store.append(1, make_page(1));
  EXPECT_TRUE(store.drain().empty());
  EXPECT_EQ(2u, store.get_n_pending());
  store.append(0, make_page(0));
  std::vector<OutputPageSpec> pages = store.drain();
  ASSERT_EQ(3u, pages.size());
  for (int i = 0; i < 3; i++)
  {
    EXPECT_EQ(i, pages[i].get_page_index());
    EXPECT_EQ(100 + i, pages[i].width);
  }
  EXPECT_EQ(0u, store.get_n_pending());
  store.append(3, make_page(3));
  EXPECT_EQ(1u, store.drain().size());
  EXPECT_TRUE(store.is_complete());
}

TEST(RasterPageStore, SkipAdvancesPastMissingPage)
{
  RasterPageStore store(3);
  store.append(2, make_page(2));
  store.append(0, make_page(0));
  EXPECT_EQ(1u, store.drain().size());
  store.skip(1);
  std::vector<OutputPageSpec> pages = store.drain();
  ASSERT_EQ(1u, pages.size());
  EXPECT_EQ(2, pages[0].get_page_index());
  EXPECT_TRUE(store.is_complete());
}

TEST(RasterPageStore, DuplicateIndexIsRejected)
{
  RasterPageStore store(2);
  store.append(1, make_page(1));
  EXPECT_THROW(store.append(1, make_page(1)), std::logic_error);
  EXPECT_THROW(store.skip(1), std::logic_error);
}

TEST(RasterPageStore, DrainedIndexIsRejected)
{
  RasterPageStore store(2);
  store.append(0, make_page(0));
  store.drain();
  EXPECT_THROW(store.append(0, make_page(0)), std::logic_error);
}

TEST(RasterPageStore, OutOfRangeIsRejected)
{
  RasterPageStore store(2);
  EXPECT_THROW(store.append(2, make_page(2)), std::logic_error);
  EXPECT_THROW(store.append(-1, make_page(0)), std::logic_error);
}

TEST(RasterPageStore, DrainedImagesKeepTheirPixels)
{
  RasterPageStore store(1);
  OutputPageSpec page = make_page(0);
  page.image.fill(0x42);
  store.append(0, std::move(page));
  std::vector<OutputPageSpec> pages = store.drain();
  ASSERT_EQ(1u, pages.size());
  EXPECT_EQ(0x42, pages[0].image.get_row(1)[1]);
  EXPECT_EQ(0u, store.get_n_pending());
}

// vim:ts=2 sts=2 sw=2 et
