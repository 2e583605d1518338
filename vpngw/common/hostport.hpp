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

#ifndef VPNGW_COMMON_HOSTPORT_H
#define VPNGW_COMMON_HOSTPORT_H

#include <string>

#include <vpngw/common/number.hpp>

namespace vpngw {
  namespace HostPort {

    inline bool is_valid_port(const std::string& port, unsigned int *value = nullptr)
    {
      return parse_number_validate<unsigned int>(port, 5, 1, 65535, value);
    }

    // An IP address is also considered to be a valid host
    inline bool is_valid_host_char(const char c)
    {
      return (c >= 'a' && c <= 'z')
	|| (c >= 'A' && c <= 'Z')
	|| (c >= '0' && c <= '9')
	|| c == '.'
	|| c == '-'
	|| c == ':'; // for IPv6
    }

    inline bool is_valid_host(const std::string& host)
    {
      if (!host.length() || host.length() > 256)
	return false;
      for (const auto &c : host)
	{
	  if (!is_valid_host_char(c))
	    return false;
	}
      return true;
    }

  }
}

#endif
