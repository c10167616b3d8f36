/* Copyright © 2007-2016 Jakub Wilk <jwilk@jwilk.net>
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

#include "debug.hh"

#include <iostream>
#include <map>
#include <mutex>

class DevNull : public std::ostream
{
public:
  DevNull()
  : std::ostream(nullptr)
  { }
};

static DevNull static_dev_null;
std::ostream &dev_null = static_dev_null;

DebugStream error_log(std::cerr);
static DebugStream null_debug(dev_null);
static DebugStream full_debug(std::clog);

static std::mutex output_mutex;

DebugStream &debug(int n, int threshold)
{
  if (n <= threshold)
    return full_debug;
  else
    return null_debug;
}

std::string &DebugStream::line()
{
  thread_local std::map<const DebugStream *, std::string> lines;
  return lines[this];
}

void DebugStream::indent(std::string &line) const
{
  int level = this->level;
  if (level > 0)
  {
    while (level-- > 1)
      line += "  ";
    line += "- ";
  }
}

void DebugStream::flush_line()
{
  std::string &line = this->line();
  if (&this->ostream != &dev_null)
  {
    std::lock_guard<std::mutex> lock(output_mutex);
    this->ostream << line << std::endl;
  }
  line.clear();
}

DebugStream &operator<<(DebugStream &stream, std::ostream& (*pf)(std::ostream&))
{
  if (pf == static_cast<std::ostream& (*)(std::ostream&)>(std::endl))
    stream.flush_line();
  return stream;
}

// vim:ts=2 sts=2 sw=2 et
