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

#ifndef VPNGW_COMMON_WRITEPRIVATE_H
#define VPNGW_COMMON_WRITEPRIVATE_H

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>     // for open()
#include <unistd.h>    // for write(), ftruncate()
#include <errno.h>
#include <cstring>

#include <string>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/scoped_fd.hpp>
#include <vpngw/common/write.hpp>

namespace vpngw {

  // Write a file readable and writable only by its owner.  The mode
  // is enforced even if the file already existed with wider access.
  inline void write_private(const std::string& path, const void *buf, size_t count)
  {
    ScopedFD fd(::open(path.c_str(), O_WRONLY|O_CREAT|O_CLOEXEC, S_IRUSR|S_IWUSR));
    if (!fd.defined())
      {
	const int eno = errno;
	VPNGW_THROW_EXCEPTION(path << " : open error : " << std::strerror(eno));
      }
    if (::fchmod(fd(), S_IRUSR|S_IWUSR) < 0)
      {
	const int eno = errno;
	VPNGW_THROW_EXCEPTION(path << " : chmod error : " << std::strerror(eno));
      }
    if (::ftruncate(fd(), 0) < 0)
      {
	const int eno = errno;
	VPNGW_THROW_EXCEPTION(path << " : truncate error : " << std::strerror(eno));
      }
    const ssize_t len = write_retry(fd(), buf, count);
    if (len == -1)
      {
	const int eno = errno;
	VPNGW_THROW_EXCEPTION(path << " : write error : " << std::strerror(eno));
      }
    else if (static_cast<size_t>(len) != count)
      VPNGW_THROW_EXCEPTION(path << " : unexpected write size");
    if (!fd.close())
      {
	const int eno = errno;
	VPNGW_THROW_EXCEPTION(path << " : close error : " << std::strerror(eno));
      }
  }

  inline void write_private(const std::string& path, const std::string& str)
  {
    write_private(path, str.c_str(), str.length());
  }

}

#endif
