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

// General purpose methods for dealing with filesystem pathnames.

#ifndef VPNGW_COMMON_PATH_H
#define VPNGW_COMMON_PATH_H

#include <string>

#include <vpngw/common/string.hpp>

namespace vpngw {
  namespace path {

    const char dirsep[] = "/";

    // true if char is a directory separator
    inline bool is_dirsep(const char c)
    {
      return c == '/';
    }

    // true if path is fully qualified
    inline bool is_fully_qualified(const std::string& path)
    {
      return path.length() > 0 && is_dirsep(path[0]);
    }

    // does path refer to regular file without directory traversal
    inline bool is_flat(const std::string& path)
    {
      return path.length() > 0
	&& path != "."
	&& path != ".."
	&& path.find_first_of(dirsep) == std::string::npos;
    }

    inline std::string basename(const std::string& path)
    {
      const size_t pos = path.find_last_of(dirsep);
      if (pos != std::string::npos)
	{
	  const size_t p = pos + 1;
	  if (p >= path.length())
	    return "";
	  else
	    return path.substr(p);
	}
      else
	return path;
    }

    inline std::string dirname(const std::string& path)
    {
      const size_t pos = path.find_last_of(dirsep);
      if (pos != std::string::npos)
	{
	  if (pos == 0)
	    return "/";
	  else
	    return path.substr(0, pos);
	}
      else
	return "";
    }

    inline std::string join(const std::string& p1, const std::string& p2)
    {
      if (p1.empty() || is_fully_qualified(p2))
	return p2;
      else
	return string::add_trailing(p1, dirsep[0]) + p2;
    }

    inline std::string join(const std::string& p1,
			    const std::string& p2,
			    const std::string& p3)
    {
      return join(join(p1, p2), p3);
    }

  } // namespace path
} // namespace vpngw

#endif // VPNGW_COMMON_PATH_H
