/* Copyright © 2007-2018 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
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

#include "autoconf.hh"
#include "system.hh"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "debug.hh"
#include "i18n.hh"
#include "string-utils.hh"

/* constants
 * =========
 */

static const char path_separator = '/';


/* class POSIXError : OSError
 * ==========================
 */

std::string POSIXError::error_message(const std::string &context)
{
  /* POSIX says that ``strerror()`` returns a locale-dependent error message.
   * No need to translate. */
  std::string message = strerror(errno);
  if (context.length())
    message = context + ": " + message;
  return message;
}

void throw_posix_error(const std::string &context)
{
  switch (errno)
  {
  case ENOTDIR:
    throw NotADirectory(context);
  case ENOENT:
    throw NoSuchFileOrDirectory(context);
  default:
    throw POSIXError(context);
  }
}

static void warn_posix_error(const std::string &context)
{
  try
  {
    throw_posix_error(context);
  }
  catch (const POSIXError &e)
  {
    error_log << string_printf(_("Warning: %s"), e.what()) << std::endl;
  }
}

static mode_t get_umask()
{
  mode_t mask = umask(0);
  umask(mask);
  return mask;
}


/* class TemporaryPathTemplate
 * ===========================
 */

class TemporaryPathTemplate
{
protected:
  std::vector<char> buffer;
public:
  static const char *temporary_directory()
  {
    const char *result = getenv("TMPDIR");
    if (result == nullptr)
      result = P_tmpdir;
    return result;
  }
  TemporaryPathTemplate(const std::string &directory, const std::string &prefix)
  : buffer(directory.length() + prefix.length() + 9)
  {
    sprintf(
      this->buffer.data(),
      "%s%c%s.XXXXXX",
      directory.c_str(),
      path_separator,
      prefix.c_str()
    );
  }
  operator char * ()
  {
    return this->buffer.data();
  }
};


/* class TemporaryDirectory : Directory
 * ====================================
 */

TemporaryDirectory::TemporaryDirectory()
: Directory(), persistent(false)
{
  TemporaryPathTemplate path_buffer(TemporaryPathTemplate::temporary_directory(), PACKAGE_NAME);
  if (mkdtemp(path_buffer) == nullptr)
    throw_posix_error(static_cast<char*>(path_buffer));
  this->name += path_buffer;
}

TemporaryDirectory::TemporaryDirectory(const std::string &directory, const std::string &prefix)
: Directory(), persistent(false)
{
  TemporaryPathTemplate path_buffer(directory, prefix);
  if (mkdtemp(path_buffer) == nullptr)
    throw_posix_error(static_cast<char*>(path_buffer));
  this->name += path_buffer;
}

std::unique_ptr<TemporaryDirectory> TemporaryDirectory::beside(const std::string &path)
{
  std::string directory_name, file_name;
  split_path(path, directory_name, file_name);
  return std::unique_ptr<TemporaryDirectory>(
    new TemporaryDirectory(directory_name, "." + file_name)
  );
}

void TemporaryDirectory::persist(const std::string &path)
{
  if (chmod(this->name.c_str(), 0777 & ~get_umask()) == -1)
    throw_posix_error(this->name);
  if (rename(this->name.c_str(), path.c_str()) == -1)
    throw_posix_error(path);
  this->name = path;
  this->persistent = true;
}

TemporaryDirectory::~TemporaryDirectory()
{
  if (this->persistent)
    return;
  if (rmdir(this->name.c_str()) == -1)
    warn_posix_error(this->name);
}


/* class File : std::fstream
 * =========================
 */

File::openmode File::get_default_open_mode()
{
  return std::fstream::trunc;
}

void File::open(const std::string &path, File::openmode mode)
{
  mode |=
    std::fstream::in |
    std::fstream::out |
    std::fstream::binary;
  this->exceptions(std::ifstream::failbit | std::ifstream::badbit);
  this->name = path;
  this->std::fstream::open(path.c_str(), mode);
  this->exceptions(std::ifstream::badbit);
}

File::File(const std::string &path)
{
  this->open(path, this->get_default_open_mode());
}

File::File(const Directory& directory, const std::string &name)
{
  this->open(join_path(directory.get_name(), name), this->get_default_open_mode());
}

void File::reopen(std::fstream::openmode mode)
{
  if (this->is_open())
    this->close();
  this->open(this->name, mode);
}

File::operator const std::string& () const
{
  return this->name;
}

std::ostream &operator<<(std::ostream &out, const File &file)
{
  return out << file.name;
}


/* class TemporaryFile : File
 * ==========================
 */

void TemporaryFile::construct(const std::string &directory, const std::string &prefix)
{
  TemporaryPathTemplate path_buffer(directory, prefix);
  int fd = mkstemp(path_buffer);
  if (fd == -1)
    throw_posix_error(static_cast<char*>(path_buffer));
  if (::close(fd) == -1)
    throw_posix_error(static_cast<char*>(path_buffer));
  this->open(std::string(path_buffer), File::trunc);
}

TemporaryFile::TemporaryFile()
: persistent(false)
{
  this->construct(TemporaryPathTemplate::temporary_directory(), PACKAGE_NAME);
}

TemporaryFile::TemporaryFile(const std::string &directory, const std::string &prefix)
: persistent(false)
{
  this->construct(directory, prefix);
}

std::unique_ptr<TemporaryFile> TemporaryFile::beside(const std::string &path)
{
  std::string directory_name, file_name;
  split_path(path, directory_name, file_name);
  return std::unique_ptr<TemporaryFile>(
    new TemporaryFile(directory_name, "." + file_name)
  );
}

void TemporaryFile::persist(const std::string &path)
{
  if (this->is_open())
    this->close();
  /* mkstemp() creates the file with mode 0600. */
  if (chmod(this->name.c_str(), 0666 & ~get_umask()) == -1)
    throw_posix_error(this->name);
  if (rename(this->name.c_str(), path.c_str()) == -1)
    throw_posix_error(path);
  this->name = path;
  this->persistent = true;
}

TemporaryFile::~TemporaryFile()
{
  if (this->is_open())
    this->close();
  if (this->persistent)
    return;
  if (unlink(this->name.c_str()) == -1)
    warn_posix_error(this->name);
}


/* class ExistingFile : File
 * =========================
 */

File::openmode ExistingFile::get_default_open_mode()
{
  return File::openmode();
}


/* utility functions
 * =================
 */

void split_path(const std::string &path, std::string &directory_name, std::string &file_name)
{
  /* POSIX-compliant ``basename()`` and ``dirname()`` would split ``/foo/bar/``
   * into ``/foo`` and ``bar``, instead of desired ``/foo/bar`` and an empty
   * string. To deal with this weirdness, a trailing ``!`` character is
   * appended to the split path.
   */
  {
    std::vector<char> buffer(path.length() + 2);
    sprintf(buffer.data(), "%s!", path.c_str());
    directory_name = ::dirname(buffer.data());
  }
  {
    std::vector<char> buffer(path.length() + 2);
    sprintf(buffer.data(), "%s!", path.c_str());
    file_name = ::basename(buffer.data());
    size_t length = file_name.length();
    if (length == 0 || file_name[length - 1] != '!')
      throw std::logic_error("split_path()");
    file_name.erase(length - 1);
  }
}

std::string absolute_path(const std::string &path, const std::string &dir_name)
{
  if (path.length() == 0)
    return path;
  if (path[0] != '.')
    return path;
  if (path.length() == 1 || path[1] == path_separator)
    return dir_name + path_separator + path.substr(std::min(static_cast<size_t>(2), path.length()));
  if (path[1] != '.')
    return path;
  if (path.length() == 2 || path[2] == path_separator)
    return dir_name + path_separator + path;
  return path;
}

std::string path_stem(const std::string &path)
{
  std::string directory_name, file_name;
  split_path(path, directory_name, file_name);
  size_t dot = file_name.rfind('.');
  if (dot == std::string::npos || dot == 0)
    return file_name;
  return file_name.substr(0, dot);
}

std::string join_path(const std::string &directory_name, const std::string &file_name)
{
  if (directory_name.empty())
    return file_name;
  if (directory_name[directory_name.length() - 1] == path_separator)
    return directory_name + file_name;
  return directory_name + path_separator + file_name;
}

bool is_directory(const std::string &path)
{
  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    return false;
  return S_ISDIR(st.st_mode);
}

bool is_same_file(const std::string &path1, const std::string &path2)
{
  struct stat st1, st2;
  int rc;
  rc = stat(path1.c_str(), &st1);
  if (rc)
    return false;
  rc = stat(path2.c_str(), &st2);
  if (rc)
    return false;
  return
    (st1.st_dev == st2.st_dev) &&
    (st1.st_ino == st2.st_ino);
}

bool file_exists(const std::string &path)
{
  struct stat st;
  return lstat(path.c_str(), &st) == 0;
}

// vim:ts=2 sts=2 sw=2 et
