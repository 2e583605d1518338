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

// A collection of functions for rendering and parsing hexadecimal strings

#ifndef VPNGW_COMMON_HEXSTR_H
#define VPNGW_COMMON_HEXSTR_H

#include <string>
#include <vector>

#include <vpngw/common/exception.hpp>

namespace vpngw {

  VPNGW_EXCEPTION(parse_hex_error);

  inline char render_hex_char(const int c, const bool caps=false)
  {
    if (c < 10)
      return '0' + c;
    else if (c < 16)
      return (caps ? 'A' : 'a') - 10 + c;
    else
      return '?';
  }

  inline int parse_hex_char(const char c)
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    else if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    else
      return -1;
  }

  inline std::string render_hex(const unsigned char *data, size_t size, const bool caps=false)
  {
    if (!data)
      return "NULL";
    std::string ret;
    ret.reserve(size*2+1);
    while (size--)
      {
	const unsigned char c = *data++;
	ret += render_hex_char(c >> 4, caps);
	ret += render_hex_char(c & 0x0F, caps);
      }
    return ret;
  }

  // Append the bytes encoded by hex string str to dest
  inline void parse_hex(std::vector<unsigned char>& dest, const std::string& str)
  {
    const int len = int(str.length());
    int i;
    for (i = 0; i <= len - 2; i += 2)
      {
	const int high = parse_hex_char(str[i]);
	const int low = parse_hex_char(str[i+1]);
	if (high == -1 || low == -1)
	  throw parse_hex_error();
	dest.push_back((high<<4) + low);
      }
    if (i != len)
      throw parse_hex_error(); // straggler char
  }

} // namespace vpngw

#endif // VPNGW_COMMON_HEXSTR_H
