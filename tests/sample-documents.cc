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

#include "sample-documents.hh"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <TextOutputDev.h>

#include "pdf-backend.hh"
#include "string-utils.hh"
#include "system.hh"

std::vector<samples::PageSpec> samples::mixed_pages()
{
  std::vector<PageSpec> pages;
  pages.push_back(PageSpec(a4_width, a4_height));
  pages.push_back(PageSpec(letter_width, letter_height));
  pages.push_back(PageSpec(a4_width, a4_height, 90));
  return pages;
}

std::vector<samples::PageSpec> samples::a4_pages(int n)
{
  return std::vector<PageSpec>(n, PageSpec(a4_width, a4_height));
}

static std::string make_content(const samples::PageSpec &spec)
{
  std::string content = "0.5 g\n";
  for (int i = 0; i < spec.n_shapes; i++)
    content += string_printf("%d %d 20 20 re f\n", 36 + (i % 20) * 25, 36 + (i / 20) * 25);
  content += string_printf("0 g\nBT\n/F1 24 Tf\n72 %.2f Td\n(%s) Tj\nET\n",
    spec.height - 100, spec.text.c_str());
  return content;
}

void samples::write_document(const std::string &path, const std::vector<PageSpec> &pages)
{
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
    "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"
  ));
  QPDFPageDocumentHelper helper(pdf);
  for (const PageSpec &spec : pages)
  {
    QPDFObjectHandle page = QPDFObjectHandle::parse(
      "<< /Type /Page /Resources << /Font << >> >> /MediaBox null /Contents null >>"
    );
    QPDFObjectHandle box = QPDFObjectHandle::newArray();
    box.appendItem(QPDFObjectHandle::newInteger(0));
    box.appendItem(QPDFObjectHandle::newInteger(0));
    box.appendItem(QPDFObjectHandle::newReal(spec.width, 3));
    box.appendItem(QPDFObjectHandle::newReal(spec.height, 3));
    page.replaceKey("/MediaBox", box);
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, make_content(spec)));
    page.getKey("/Resources").getKey("/Font").replaceKey("/F1", font);
    if (spec.rotate != 0)
      page.replaceKey("/Rotate", QPDFObjectHandle::newInteger(spec.rotate));
    helper.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
  }
  QPDFWriter writer(pdf, path.c_str());
  writer.setStaticID(true);
  writer.write();
}

std::vector<samples::PageBox> samples::read_media_boxes(const std::string &path)
{
  QPDF pdf;
  pdf.processFile(path.c_str());
  std::vector<PageBox> boxes;
  for (QPDFPageObjectHelper &page : QPDFPageDocumentHelper(pdf).getAllPages())
  {
    QPDFObjectHandle box = page.getObjectHandle().getKey("/MediaBox");
    PageBox result;
    result.width = box.getArrayItem(2).getNumericValue() - box.getArrayItem(0).getNumericValue();
    result.height = box.getArrayItem(3).getNumericValue() - box.getArrayItem(1).getNumericValue();
    boxes.push_back(result);
  }
  return boxes;
}

static void append_text(void *stream, const char *text, int length)
{
  static_cast<std::string *>(stream)->append(text, length);
}

std::vector<std::string> samples::extract_text(const std::string &path)
{
  pdf::Document document(path);
  std::vector<std::string> texts;
  for (int n = 1; n <= document.getNumPages(); n++)
  {
    std::string text;
    TextOutputDev device(append_text, &text, false, 0, false);
    if (!device.isOk())
      throw std::runtime_error("TextOutputDev failed");
    document.displayPage(&device, n, 72, 72, 0, false, true, false);
    text.erase(
      std::remove_if(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); }),
      text.end()
    );
    texts.push_back(text);
  }
  return texts;
}

bool samples::has_program(const std::string &name)
{
  const char *path = getenv("PATH");
  if (path == nullptr)
    return false;
  std::string directories = path;
  size_t start = 0;
  while (start <= directories.length())
  {
    size_t end = directories.find(':', start);
    if (end == std::string::npos)
      end = directories.length();
    std::string directory = directories.substr(start, end - start);
    if (!directory.empty() && access(join_path(directory, name).c_str(), X_OK) == 0)
      return true;
    start = end + 1;
  }
  return false;
}

void samples::write_script(const std::string &path, const std::string &body)
{
  {
    std::ofstream stream(path.c_str());
    stream << "#!/bin/sh\n" << body << "\n";
    if (!stream)
      throw std::runtime_error("cannot write " + path);
  }
  if (chmod(path.c_str(), 0755) != 0)
    throw_posix_error(path);
}

std::vector<std::string> samples::list_directory(const std::string &path)
{
  std::vector<std::string> names;
  DIR *dir = opendir(path.c_str());
  if (dir == nullptr)
    throw_posix_error(path);
  while (struct dirent *entry = readdir(dir))
  {
    std::string name = entry->d_name;
    if (name != "." && name != "..")
      names.push_back(name);
  }
  closedir(dir);
  std::sort(names.begin(), names.end());
  return names;
}


/* class samples::ScratchDirectory
 * ===============================
 */

samples::ScratchDirectory::ScratchDirectory()
{
  const char *tmpdir = getenv("TMPDIR");
  std::string pattern = join_path(tmpdir != nullptr ? tmpdir : "/tmp", "pdfdetext-test.XXXXXX");
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr)
    throw_posix_error(pattern);
  this->path = buffer.data();
}

static int remove_entry(const char *path, const struct stat *, int, struct FTW *)
{
  return remove(path);
}

samples::ScratchDirectory::~ScratchDirectory()
{
  nftw(this->path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
}

std::string samples::ScratchDirectory::operator/(const std::string &name) const
{
  return join_path(this->path, name);
}

// vim:ts=2 sts=2 sw=2 et
