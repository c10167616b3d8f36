/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDFDETEXT_SYSTEM_HH
#define PDFDETEXT_SYSTEM_HH

#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class OSError : public std::runtime_error
{
protected:
  explicit OSError(const std::string &message)
  : std::runtime_error(message)
  { }
};

class POSIXError : public OSError
{
public:
  static std::string error_message(const std::string &context);
  explicit POSIXError(const std::string &context)
  : OSError(error_message(context))
  { }
};

[[noreturn]]
void throw_posix_error(const std::string &context);

class NoSuchFileOrDirectory : public POSIXError
{
public:
  explicit NoSuchFileOrDirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class NotADirectory : public POSIXError
{
public:
  explicit NotADirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class File;

class Command
{
protected:
  std::string command;
  std::vector<std::string> argv;
  double timeout;
  std::string repr();
  void call(std::ostream *stdout_, bool stderr_);
public:
  class CommandFailed : public std::runtime_error
  {
  public:
    explicit CommandFailed(const std::string &message)
    : std::runtime_error(message)
    { }
  };
  /* The program could not be executed at all. */
  class NotFound : public CommandFailed
  {
  public:
    explicit NotFound(const std::string &message)
    : CommandFailed(message)
    { }
  };
  /* The child did not terminate in time; it has been killed and reaped. */
  class Timeout : public CommandFailed
  {
  public:
    explicit Timeout(const std::string &message)
    : CommandFailed(message)
    { }
  };
  explicit Command(const std::string& command);
  Command &operator <<(const std::string& arg);
  Command &operator <<(const File& arg);
  Command &operator <<(int i);
  /* Seconds; 0 means no limit. */
  void set_timeout(double timeout)
  {
    this->timeout = timeout;
  }
  void operator()(std::ostream &stdout_, bool quiet=false)
  {
    this->call(&stdout_, !quiet);
  }
  void operator()(bool quiet=false)
  {
    this->call(nullptr, !quiet);
  }
};

class Directory
{
protected:
  std::string name;
  Directory()
  { }
public:
  virtual ~Directory()
  { }
  const std::string &get_name() const
  {
    return this->name;
  }
};

class TemporaryDirectory : public Directory
{
private:
  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
protected:
  bool persistent;
  explicit TemporaryDirectory(const std::string &directory, const std::string &prefix);
public:
  TemporaryDirectory();
  /* Creates a uniquely named directory in the same directory as `path`,
   * so that it can be renamed onto `path` later.
   */
  static std::unique_ptr<TemporaryDirectory> beside(const std::string &path);
  /* Renames the directory to `path`. The directory is no longer removed on
   * destruction.
   */
  void persist(const std::string &path);
  virtual ~TemporaryDirectory();
};

class File : public std::fstream
{
private:
  File(const File&) = delete;
  File& operator=(const File&) = delete;
protected:
  std::string name;
  virtual File::openmode get_default_open_mode();
  void open(const std::string &path, File::openmode mode);
  File()
  { }
public:
  explicit File(const std::string &path);
  File(const Directory& directory, const std::string &name);
  virtual ~File()
  { }
  void reopen(std::fstream::openmode mode = std::fstream::openmode());
  operator const std::string& () const;
  friend std::ostream &operator<<(std::ostream &, const File &);
};

class TemporaryFile : public File
{
private:
  TemporaryFile(const TemporaryFile &) = delete;
  TemporaryFile& operator=(const TemporaryFile &) = delete;
protected:
  bool persistent;
  void construct(const std::string &directory, const std::string &prefix);
  TemporaryFile(const std::string &directory, const std::string &prefix);
public:
  TemporaryFile(const Directory& directory, const std::string &name)
  : File(directory, name), persistent(false)
  { }
  TemporaryFile();
  /* Creates a uniquely named file in the same directory as `path`. */
  static std::unique_ptr<TemporaryFile> beside(const std::string &path);
  /* Closes the file and renames it to `path`. The file is no longer removed
   * on destruction.
   */
  void persist(const std::string &path);
  virtual ~TemporaryFile();
};

class ExistingFile : public File
{
private:
  ExistingFile(const ExistingFile &) = delete;
  ExistingFile& operator=(const ExistingFile &) = delete;
protected:
  virtual File::openmode get_default_open_mode();
public:
  explicit ExistingFile(const std::string &path)
  : File(path)
  { }
  ExistingFile(const Directory& directory, const std::string &name)
  : File(directory, name)
  { }
  virtual ~ExistingFile()
  { }
};

void split_path(const std::string &path, std::string &directory_name, std::string &file_name);

std::string absolute_path(const std::string &path, const std::string &dir_name);

/* "dir/report.pdf" -> "report" */
std::string path_stem(const std::string &path);

std::string join_path(const std::string &directory_name, const std::string &file_name);

bool is_directory(const std::string &path);

bool is_same_file(const std::string &path1, const std::string &path2);

bool file_exists(const std::string &path);

#endif

// vim:ts=2 sts=2 sw=2 et
