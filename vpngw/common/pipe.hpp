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

#ifndef VPNGW_COMMON_PIPE_H
#define VPNGW_COMMON_PIPE_H

#include <unistd.h>
#include <errno.h>
#include <cstring>

#include <string>
#include <memory>
#include <array>

#include <boost/asio.hpp>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/scoped_fd.hpp>

namespace vpngw {
  namespace Pipe {
    class SD
    {
    public:
      SD(boost::asio::io_context& io_context, ScopedFD& fd)
      {
	if (fd.defined())
	  sd.reset(new boost::asio::posix::stream_descriptor(io_context, fd.release()));
      }

      bool defined() const
      {
	return bool(sd);
      }

    protected:
      std::unique_ptr<boost::asio::posix::stream_descriptor> sd;
    };

    class SD_IN : public SD
    {
    public:
      SD_IN(boost::asio::io_context& io_context, ScopedFD& fd)
	: SD(io_context, fd)
      {
	if (defined())
	  queue_read();
      }

      const std::string& content() const
      {
	return data;
      }

    private:
      void queue_read()
      {
	sd->async_read_some(boost::asio::buffer(buf),
			    [this](const boost::system::error_code& ec, const size_t bytes_recvd) {
			      if (!ec)
				{
				  data.append(buf.data(), bytes_recvd);
				  queue_read();
				}
			      else
				{
				  sd->close();
				}
			    });
      }

      std::array<char, 2048> buf;
      std::string data;
    };

    inline void make_pipe(int fd[2])
    {
      if (::pipe(fd) < 0)
	{
	  const int eno = errno;
	  VPNGW_THROW_EXCEPTION("error creating pipe : " << std::strerror(eno));
	}
    }
  }
}

#endif
