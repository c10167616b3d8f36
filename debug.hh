/* Copyright © 2007-2015 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDFDETEXT_DEBUG_HH
#define PDFDETEXT_DEBUG_HH

#include <atomic>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

class DebugStream;

template <typename tp>
static inline DebugStream &operator<<(DebugStream &, const tp &);

/* Messages are collected per thread and written out as whole lines,
 * so that worker threads never interleave within a line.
 */
class DebugStream
{
protected:
  std::atomic<int> level;
  std::ostream &ostream;
  std::string &line();
  void indent(std::string &line) const;
  void flush_line();
public:
  explicit DebugStream(std::ostream &ostream)
  : level(0), ostream(ostream)
  { }
  void operator ++(int) { this->level++; }
  void operator --(int) { this->level--; }
  template <typename tp>
    friend DebugStream &operator<<(DebugStream &, const tp &);
  friend DebugStream &operator<<(DebugStream &stream, std::ostream& (*)(std::ostream&));
};

DebugStream &debug(int n, int threshold);
extern DebugStream error_log;

extern std::ostream &dev_null;

static inline std::ostream &operator<<(std::ostream &stream, const std::runtime_error &error)
{
  stream << error.what();
  return stream;
}

template <typename tp>
static inline DebugStream &operator<<(DebugStream &stream, const tp &object)
{
  std::string &line = stream.line();
  if (line.empty())
    stream.indent(line);
  std::ostringstream buffer;
  buffer << object;
  line += buffer.str();
  return stream;
}

#endif

// vim:ts=2 sts=2 sw=2 et
