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

// General-purpose methods for handling numbers.

#ifndef VPNGW_COMMON_NUMBER_H
#define VPNGW_COMMON_NUMBER_H

#include <string>
#include <limits>
#include <cstdint>

namespace vpngw {

  // Parse the number of type T in str, returning
  // value in retval.  Returns true on success.
  // Overflow of T is detected and reported as failure.
  template <typename T>
  inline bool parse_number(const char *str, T& retval)
  {
    if (!str[0])
      return false; // empty string
    bool neg = false;
    size_t i = 0;
    if (std::numeric_limits<T>::min() < 0 && str[0] == '-')
      {
	neg = true;
	i = 1;
      }
    T ret = T(0);
    while (true)
      {
	const char c = str[i++];
	if (c >= '0' && c <= '9')
	  {
	    const T digit = T(c - '0');
	    if (ret > (std::numeric_limits<T>::max() - digit) / T(10))
	      return false; // overflow
	    ret *= T(10);
	    ret += digit;
	  }
	else if (!c)
	  {
	    if (i == (neg ? 2u : 1u))
	      return false; // sign without digits
	    retval = neg ? -ret : ret;
	    return true;
	  }
	else
	  return false; // non-digit
      }
  }

  // like parse_number above, but accepts std::string
  template <typename T>
  inline bool parse_number(const std::string& str, T& retval)
  {
    return parse_number<T>(str.c_str(), retval);
  }

  template <typename T>
  inline bool parse_number_validate(const std::string& numstr,
				    const size_t max_len,
				    const T minimum,
				    const T maximum,
				    T* value_return = nullptr)
  {
    if (numstr.length() <= max_len)
      {
	T value;
	if (parse_number<T>(numstr.c_str(), value))
	  {
	    if (value >= minimum && value <= maximum)
	      {
		if (value_return)
		  *value_return = value;
		return true;
	      }
	  }
      }
    return false;
  }

  // Parse an unsigned 32-bit value written either in decimal or
  // as a 0x-prefixed hex string, as accepted by ip-rule(8).
  inline bool parse_mark(const std::string& str, std::uint32_t& retval)
  {
    if (str.length() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X'))
      {
	if (str.length() > 10)
	  return false;
	std::uint32_t ret = 0;
	for (size_t i = 2; i < str.length(); ++i)
	  {
	    const char c = str[i];
	    int v;
	    if (c >= '0' && c <= '9')
	      v = c - '0';
	    else if (c >= 'a' && c <= 'f')
	      v = c - 'a' + 10;
	    else if (c >= 'A' && c <= 'F')
	      v = c - 'A' + 10;
	    else
	      return false;
	    ret = (ret << 4) | std::uint32_t(v);
	  }
	retval = ret;
	return true;
      }
    return parse_number<std::uint32_t>(str, retval);
  }

} // namespace vpngw

#endif // VPNGW_COMMON_NUMBER_H
