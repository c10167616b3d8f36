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

#ifndef PDFDETEXT_RASTER_STORE_HH
#define PDFDETEXT_RASTER_STORE_HH

#include <cstddef>
#include <map>
#include <vector>

#include "page-sink.hh"

/* Reorders pages that are rendered out of order.
 *
 * drain() hands out only the contiguous run of pages starting at the next
 * expected index, so pages leave the store in strictly increasing order.
 * The store keeps nothing of a page once it has been drained.
 */
class RasterPageStore
{
private:
  RasterPageStore(const RasterPageStore &) = delete;
  RasterPageStore& operator=(const RasterPageStore &) = delete;
protected:
  int n_pages;
  int next_index;
  std::map<int, OutputPageSpec> pending;
  std::map<int, bool> skipped;
  void advance();
public:
  explicit RasterPageStore(int n_pages);
  /* Throws std::logic_error if `index` was already appended, skipped or
   * drained, or is out of range.
   */
  void append(int index, OutputPageSpec &&page);
  /* Marks `index` as producing no page. */
  void skip(int index);
  std::vector<OutputPageSpec> drain();
  int get_next_index() const
  {
    return this->next_index;
  }
  size_t get_n_pending() const
  {
    return this->pending.size();
  }
  /* Every page has been drained or skipped. */
  bool is_complete() const
  {
    return this->next_index >= this->n_pages && this->pending.empty();
  }
};

#endif

// vim:ts=2 sts=2 sw=2 et
