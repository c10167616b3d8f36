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

#ifndef PDFDETEXT_CANCELLATION_HH
#define PDFDETEXT_CANCELLATION_HH

#include <atomic>

/* Set from a signal handler, polled by the pipeline and the renderers. */
class Cancellation
{
private:
  Cancellation(const Cancellation &) = delete;
  Cancellation& operator=(const Cancellation &) = delete;
protected:
  std::atomic<bool> requested;
public:
  Cancellation()
  : requested(false)
  { }
  void request()
  {
    this->requested = true;
  }
  bool is_requested() const
  {
    return this->requested;
  }
};

#endif

// vim:ts=2 sts=2 sw=2 et
