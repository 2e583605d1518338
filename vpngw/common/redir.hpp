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

#ifndef VPNGW_COMMON_REDIR_H
#define VPNGW_COMMON_REDIR_H

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>

#include <string>

#include <boost/asio.hpp>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/scoped_fd.hpp>
#include <vpngw/common/pipe.hpp>

namespace vpngw {

  struct RedirectBase
  {
    VPNGW_EXCEPTION(redirect_std_err);
    virtual void redirect() = 0;
    virtual void close() = 0;
    virtual ~RedirectBase() {}
  };

  struct RedirectStdFD : public RedirectBase
  {
    virtual void redirect() noexcept override
    {
      // stdin
      if (in.defined())
	{
	  ::dup2(in(), 0);
	  if (in() <= 2)
	    in.release();
	}

      // stdout
      if (out.defined())
	{
	  ::dup2(out(), 1);
	  if (!err.defined() && combine_out_err)
	    ::dup2(out(), 2);
	  if (out() <= 2)
	    out.release();
	}

      // stderr
      if (err.defined())
	{
	  ::dup2(err(), 2);
	  if (err() <= 2)
	    err.release();
	}

      close();
    }

    virtual void close() override
    {
      in.close();
      out.close();
      err.close();
    }

    ScopedFD in;
    ScopedFD out;
    ScopedFD err;
    bool combine_out_err = false;
  };

  class RedirectPipe : public RedirectStdFD
  {
  public:
    struct Output
    {
      std::string out;
      std::string err;
    };

    RedirectPipe() {}

    RedirectPipe(RedirectStdFD& remote,
		 const bool combine_out_err_arg)
    {
      int fd[2];

      // stdout
      Pipe::make_pipe(fd);
      out.reset(cloexec(fd[0]));
      remote.out.reset(fd[1]);

      // stderr
      combine_out_err = remote.combine_out_err = combine_out_err_arg;
      if (!combine_out_err)
	{
	  Pipe::make_pipe(fd);
	  err.reset(cloexec(fd[0]));
	  remote.err.reset(fd[1]);
	}

      // stdin is always /dev/null
      remote.in.reset(::open("/dev/null", O_RDONLY, 0));
      if (!remote.in.defined())
	{
	  const int eno = errno;
	  VPNGW_THROW(redirect_std_err, "error opening /dev/null : " << std::strerror(eno));
	}
    }

    void transact(Output& output)
    {
      boost::asio::io_context io_context(1);
      Pipe::SD_IN recv_out(io_context, out);
      Pipe::SD_IN recv_err(io_context, err);
      io_context.run();
      output.out = recv_out.content();
      output.err = recv_err.content();
    }

  private:
    // set FD_CLOEXEC to prevent fd from being passed across execs
    static int cloexec(const int fd)
    {
      if (::fcntl(fd, F_SETFD, FD_CLOEXEC) < 0)
	{
	  const int eno = errno;
	  VPNGW_THROW(redirect_std_err, "error setting FD_CLOEXEC on pipe : " << std::strerror(eno));
	}
      return fd;
    }

  };
}

#endif
