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

#ifndef VPNGW_COMMON_TEMPFILE_H
#define VPNGW_COMMON_TEMPFILE_H

#include <stdlib.h>
#include <errno.h>
#include <cstring>     // for memcpy
#include <unistd.h>    // for write, unlink

#include <string>
#include <memory>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/scoped_fd.hpp>
#include <vpngw/common/write.hpp>

namespace vpngw {
  class TempFile
  {
  public:
    VPNGW_EXCEPTION(tempfile_exception);

    TempFile(const std::string& fn_template,
	     const bool fn_delete)
      : fn(new char[fn_template.length()+1]),
	del(fn_delete)
    {
      std::memcpy(fn.get(), fn_template.c_str(), fn_template.length()+1);
      const size_t pos = fn_template.find("XXXXXX");
      if (pos != std::string::npos)
	{
	  const int suffixlen = fn_template.length() - pos - 6;
	  if (suffixlen > 0)
	    fd.reset(::mkstemps(fn.get(), suffixlen));
	  else
	    fd.reset(::mkstemp(fn.get()));
	  if (!fd.defined())
	    {
	      const int eno = errno;
	      VPNGW_THROW(tempfile_exception, "error creating temporary file from template: " << fn_template << " : " << std::strerror(eno));
	    }
	}
      else
	VPNGW_THROW(tempfile_exception, "badly formed temporary file template: " << fn_template);
    }

    ~TempFile()
    {
      fd.close();
      delete_file();
    }

    void write(const std::string& content)
    {
      const ssize_t size = write_retry(fd(), content.c_str(), content.length());
      if (size < 0)
	{
	  const int eno = errno;
	  VPNGW_THROW(tempfile_exception, "error writing to temporary file: " << filename() << " : " << std::strerror(eno));
	}
      else if (static_cast<size_t>(size) != content.length())
	{
	  VPNGW_THROW(tempfile_exception, "incomplete write to temporary file: " << filename());
	}
    }

    std::string filename() const
    {
      if (fn)
	return fn.get();
      else
	return "";
    }

    void close_file()
    {
      if (!fd.close())
	{
	  const int eno = errno;
	  VPNGW_THROW(tempfile_exception, "error closing temporary file: " << filename() << " : " << std::strerror(eno));
	}
    }

    void delete_file()
    {
      if (fn && del)
	{
	  ::unlink(fn.get());
	  del = false;
	}
    }

    ScopedFD fd;

  private:
    std::unique_ptr<char[]> fn;
    bool del;
  };
}

#endif
