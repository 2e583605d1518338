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

// Exception class for OpenSSL errors.  The message carries the
// caller's context followed by the leading entries drained from the
// OpenSSL error queue.

#ifndef VPNGW_OPENSSL_UTIL_ERROR_H
#define VPNGW_OPENSSL_UTIL_ERROR_H

#include <string>
#include <sstream>

#include <openssl/err.h>

#include <vpngw/common/exception.hpp>

namespace vpngw {

  class OpenSSLException : public vpngw::Exception
  {
  public:
    enum {
      MAX_ERRORS = 8
    };

    explicit OpenSSLException(const std::string& error_text)
      : vpngw::Exception(error_text)
    {
      init_error(error_text.c_str());
    }

    virtual const char* what() const throw() { return errtxt.c_str(); }

    virtual ~OpenSSLException() throw() {}

  private:
    void init_error(const char *error_text)
    {
      const char *prefix = ": ";
      std::ostringstream tmp;
      char buf[256];

      tmp << error_text;

      unsigned int n_err = 0;
      while (unsigned long err = ERR_get_error())
	{
	  // drain the whole queue, report the first few
	  if (n_err++ >= MAX_ERRORS)
	    continue;
	  ERR_error_string_n(err, buf, sizeof(buf));
	  tmp << prefix << buf;
	  prefix = " / ";
	}
      errtxt = tmp.str();
    }

    std::string errtxt;
  };

} // namespace vpngw

#endif // VPNGW_OPENSSL_UTIL_ERROR_H
