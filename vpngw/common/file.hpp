//    vpngw -- A VPN gateway that relays OpenVPN peers through an
//             upstream WireGuard tunnel.
//
//    Copyright (C) 2012-2017 OpenVPN Inc.
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU Affero General Public License Version 3
//    as published by the Free Software Foundation.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU Affero General Public License for more details.
//
//    You should have received a copy of the GNU Affero General Public License
//    along with this program in the COPYING file.
//    If not, see <http://www.gnu.org/licenses/>.

// Basic file-handling methods.

#ifndef VPNGW_COMMON_FILE_H
#define VPNGW_COMMON_FILE_H

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>

#include <string>
#include <fstream>
#include <iterator>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/scoped_fd.hpp>
#include <vpngw/common/write.hpp>
#include <vpngw/common/path.hpp>

namespace vpngw {

  VPNGW_UNTAGGED_EXCEPTION(file_exception);
  VPNGW_UNTAGGED_EXCEPTION_INHERIT(file_exception, open_file_error);
  VPNGW_UNTAGGED_EXCEPTION_INHERIT(file_exception, write_file_error);
  VPNGW_UNTAGGED_EXCEPTION_INHERIT(file_exception, file_is_binary);

  // Read text from file via stream approach that doesn't require that we
  // establish the length of the file in advance.
  inline std::string read_text_simple(const std::string& filename)
  {
    std::ifstream ifs(filename.c_str());
    if (!ifs)
      VPNGW_THROW(open_file_error, "cannot open: " << filename);
    const std::string str((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
      VPNGW_THROW(open_file_error, "cannot read: " << filename);
    return str;
  }

  // Read a text file as a std::string, throw error if file is binary
  inline std::string read_text(const std::string& filename)
  {
    const std::string str = read_text_simple(filename);
    if (str.find('\0') != std::string::npos)
      VPNGW_THROW(file_is_binary, "file is binary: " << filename);
    return str;
  }

  inline bool file_exists(const std::string& filename)
  {
    struct stat s;
    return ::stat(filename.c_str(), &s) == 0 && S_ISREG(s.st_mode);
  }

  inline bool dir_exists(const std::string& dirname)
  {
    struct stat s;
    return ::stat(dirname.c_str(), &s) == 0 && S_ISDIR(s.st_mode);
  }

  // Return the permission bits of an existing file
  inline mode_t file_mode(const std::string& filename)
  {
    struct stat s;
    if (::stat(filename.c_str(), &s) < 0)
      {
	const int eno = errno;
	VPNGW_THROW(open_file_error, filename << " : stat error : " << std::strerror(eno));
      }
    return s.st_mode & 07777;
  }

  // Write a string to file, truncating any prior content.  Unlike
  // an atomic rename, this keeps the inode so that single-file
  // bind mounts are rewritten in place.
  inline void write_string(const std::string& filename,
			   const std::string& str,
			   const mode_t mode = S_IRUSR|S_IWUSR|S_IRGRP|S_IROTH)
  {
    ScopedFD fd(::open(filename.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, mode));
    if (!fd.defined())
      {
	const int eno = errno;
	VPNGW_THROW(write_file_error, filename << " : open error : " << std::strerror(eno));
      }
    const ssize_t len = write_retry(fd(), str.c_str(), str.length());
    if (len == -1)
      {
	const int eno = errno;
	VPNGW_THROW(write_file_error, filename << " : write error : " << std::strerror(eno));
      }
    else if (static_cast<size_t>(len) != str.length())
      VPNGW_THROW(write_file_error, filename << " : unexpected write size");
    if (!fd.close())
      {
	const int eno = errno;
	VPNGW_THROW(write_file_error, filename << " : close error : " << std::strerror(eno));
      }
  }

  // Create a directory if it does not already exist
  inline void make_dir(const std::string& dirname, const mode_t mode = 0755)
  {
    if (::mkdir(dirname.c_str(), mode) < 0)
      {
	const int eno = errno;
	if (eno != EEXIST || !dir_exists(dirname))
	  VPNGW_THROW(write_file_error, dirname << " : mkdir error : " << std::strerror(eno));
      }
  }

  // Like "mkdir -p"
  inline void make_dirs(const std::string& dirname, const mode_t mode = 0755)
  {
    if (dirname.empty() || dir_exists(dirname))
      return;
    const std::string parent = path::dirname(dirname);
    if (!parent.empty() && parent != dirname)
      make_dirs(parent, mode);
    make_dir(dirname, mode);
  }

  inline void copy_file(const std::string& from,
			const std::string& to,
			const mode_t mode)
  {
    write_string(to, read_text_simple(from), mode);
    if (::chmod(to.c_str(), mode) < 0)
      {
	const int eno = errno;
	VPNGW_THROW(write_file_error, to << " : chmod error : " << std::strerror(eno));
      }
  }

} // namespace vpngw

#endif // VPNGW_COMMON_FILE_H
