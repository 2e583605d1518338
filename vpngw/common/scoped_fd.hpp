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

// A scoped file descriptor that is automatically closed by its destructor.

#ifndef VPNGW_COMMON_SCOPED_FD_H
#define VPNGW_COMMON_SCOPED_FD_H

#include <unistd.h> // for close()

#include <boost/noncopyable.hpp>

namespace vpngw {

  class ScopedFD : boost::noncopyable
  {
  public:
    typedef int base_type;

    ScopedFD() : fd(undefined()) {}

    explicit ScopedFD(const int fd_arg)
      : fd(fd_arg) {}

    ScopedFD(ScopedFD&& other) noexcept
      : fd(other.release()) {}

    ScopedFD& operator=(ScopedFD&& other) noexcept
    {
      reset(other.release());
      return *this;
    }

    static int undefined() { return -1; }

    int release()
    {
      const int ret = fd;
      fd = -1;
      return ret;
    }

    bool defined() const
    {
      return fd >= 0;
    }

    int operator()() const
    {
      return fd;
    }

    void reset(const int fd_arg)
    {
      close();
      fd = fd_arg;
    }

    // return false if close error
    bool close()
    {
      if (defined())
	{
	  const int status = ::close(fd);
	  fd = -1;
	  return status == 0;
	}
      else
	return true;
    }

    ~ScopedFD()
    {
      close();
    }

  private:
    int fd;
  };

} // namespace vpngw

#endif // VPNGW_COMMON_SCOPED_FD_H
