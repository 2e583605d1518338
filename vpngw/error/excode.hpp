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

#ifndef VPNGW_ERROR_EXCODE_H
#define VPNGW_ERROR_EXCODE_H

#include <string>
#include <sstream>
#include <exception>

#include <vpngw/error/error.hpp>

namespace vpngw {

  // Define an exception object that allows an Error::Type code to be thrown
  class ExceptionCode : public std::exception
  {
    enum {
      FATAL_FLAG = 0x80000000
    };

  public:
    ExceptionCode(const Error::Type code, const bool fatal)
      : code_(mkcode(code, fatal)) {}

    Error::Type code() const { return Error::Type(code_ & ~FATAL_FLAG); }
    bool fatal() const { return (code_ & FATAL_FLAG) != 0; }

    virtual ~ExceptionCode() throw() {}

  private:
    static unsigned int mkcode(const Error::Type code, const bool fatal)
    {
      unsigned int ret = code;
      if (fatal)
	ret |= FATAL_FLAG;
      return ret;
    }

    unsigned int code_;
  };

  // A classified gateway failure.  Every error that reaches main is one
  // of these.  All setup errors are fatal.
  class ErrorCode : public ExceptionCode
  {
  public:
    ErrorCode(const Error::Type code, const std::string& err)
      : ExceptionCode(code, true),
	err_(err)
    {
    }

    virtual const char* what() const throw() { return err_.c_str(); }

    // CLASS: message
    std::string to_string() const
    {
      return std::string(Error::name(code())) + ": " + err_;
    }

    virtual ~ErrorCode() throw() {}

  private:
    std::string err_;
  };

}

// throw an ErrorCode with stringstream concatenation allowed
#define VPNGW_THROW_CODE(code, stuff) \
  do { \
    std::ostringstream _vpngw_exc; \
    _vpngw_exc << stuff; \
    throw vpngw::ErrorCode(vpngw::Error::code, _vpngw_exc.str()); \
  } while (0)

#endif
