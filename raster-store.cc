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

#include "raster-store.hh"

#include <stdexcept>
#include <utility>

#include "string-utils.hh"

RasterPageStore::RasterPageStore(int n_pages)
: n_pages(n_pages), next_index(0)
{ }

static void check_index(int index, int n_pages, int next_index, bool known)
{
  if (index < 0 || index >= n_pages)
    throw std::logic_error(string_printf("page index %d out of range", index));
  if (index < next_index || known)
    throw std::logic_error(string_printf("page index %d was already stored", index));
}

void RasterPageStore::append(int index, OutputPageSpec &&page)
{
  check_index(index, this->n_pages, this->next_index,
    this->pending.count(index) > 0 || this->skipped.count(index) > 0);
  this->pending.insert(std::make_pair(index, std::move(page)));
}

void RasterPageStore::skip(int index)
{
  check_index(index, this->n_pages, this->next_index,
    this->pending.count(index) > 0 || this->skipped.count(index) > 0);
  this->skipped[index] = true;
  this->advance();
}

void RasterPageStore::advance()
{
  while (true)
  {
    std::map<int, bool>::iterator it = this->skipped.find(this->next_index);
    if (it == this->skipped.end())
      break;
    this->skipped.erase(it);
    this->next_index++;
  }
}

std::vector<OutputPageSpec> RasterPageStore::drain()
{
  std::vector<OutputPageSpec> result;
  while (true)
  {
    this->advance();
    std::map<int, OutputPageSpec>::iterator it = this->pending.find(this->next_index);
    if (it == this->pending.end())
      break;
    result.push_back(std::move(it->second));
    this->pending.erase(it);
    this->next_index++;
  }
  return result;
}

// vim:ts=2 sts=2 sw=2 et
