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

// Basic exception handling.  Allow exception classes for specific errors
// to be easily defined, and allow exceptions to be thrown with a consise
// syntax that allows stringstream concatenation using <<

#ifndef VPNGW_COMMON_EXCEPTION_H
#define VPNGW_COMMON_EXCEPTION_H

#include <string>
#include <sstream>
#include <exception>

namespace vpngw {
  // string exception class, where the exception is described by a std::string
  class Exception : public std::exception
  {
  public:
    Exception(const std::string& err) : err_(err) {}
    virtual const char* what() const throw() { return err_.c_str(); }
    const std::string& err() const { return err_; }
    virtual ~Exception() throw() {}

  private:
    std::string err_;
  };

  // define a simple custom exception class with no extra info
# define VPNGW_SIMPLE_EXCEPTION(C) \
  class C : public std::exception { \
  public: \
    virtual const char* what() const throw() { return #C; } \
  }

  // define a custom exception class that allows extra info
# define VPNGW_EXCEPTION(C) \
  class C : public vpngw::Exception { \
  public: \
    C() : vpngw::Exception(#C) {} \
    C(std::string err) : vpngw::Exception(#C ": " + err) {} \
  }

  // define a custom exception class that allows extra info, but does not emit a tag
# define VPNGW_UNTAGGED_EXCEPTION(C) \
  class C : public vpngw::Exception { \
  public: \
    C(std::string err) : vpngw::Exception(err) {} \
  }

  // define a custom exception class that allows extra info, and inherits from a custom base,
  // but does not emit a tag
# define VPNGW_UNTAGGED_EXCEPTION_INHERIT(B, C) \
  class C : public B { \
  public: \
    C(std::string err) : B(err) {} \
  }

  // throw an Exception with stringstream concatenation allowed
# define VPNGW_THROW_EXCEPTION(stuff) \
  do { \
    std::ostringstream _vpngw_exc; \
    _vpngw_exc << stuff; \
    throw vpngw::Exception(_vpngw_exc.str()); \
  } while (0)

  // throw a VPNGW_EXCEPTION class with stringstream concatenation allowed
# define VPNGW_THROW(exc, stuff) \
  do { \
    std::ostringstream _vpngw_exc; \
    _vpngw_exc << stuff; \
    throw exc(_vpngw_exc.str()); \
  } while (0)

} // namespace vpngw

#endif // VPNGW_COMMON_EXCEPTION_H
