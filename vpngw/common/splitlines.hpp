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

// General purpose class to split a multi-line string into lines.

#ifndef VPNGW_COMMON_SPLITLINES_H
#define VPNGW_COMMON_SPLITLINES_H

#include <utility>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/string.hpp>

namespace vpngw {
  class SplitLines
  {
  public:
    VPNGW_EXCEPTION(splitlines_overflow_error);
    VPNGW_EXCEPTION(splitlines_moved_error);

    // Note: string passed to constructor is not locally stored,
    // so it must remain in scope and not be modified during the lifetime
    // of the SplitLines object.
    SplitLines(const std::string& str, const size_t max_line_len_arg = 0)
      : data(str.c_str()),
	size(str.length()),
	max_line_len(max_line_len_arg)
    {
    }

    bool operator()(const bool trim = true)
    {
      line.clear();
      overflow = false;
      line_valid = true;
      const size_t overflow_index = index + max_line_len;
      while (index < size)
	{
	  if (max_line_len && index >= overflow_index)
	    {
	      overflow = true;
	      return true;
	    }
	  const char c = data[index++];
	  line += c;
	  if (c == '\n' || index >= size)
	    {
	      if (trim)
		string::trim_crlf(line);
	      return true;
	    }
	}
      line_valid = false;
      return false;
    }

    bool line_overflow() const
    {
      return overflow;
    }

    const std::string& line_ref() const
    {
      validate();
      return line;
    }

    std::string line_move()
    {
      validate();
      line_valid = false;
      return std::move(line);
    }

  private:
    void validate() const
    {
      if (!line_valid)
	throw splitlines_moved_error();
      if (overflow)
	throw splitlines_overflow_error(line);
    }

    const char *data;
    size_t size;
    const size_t max_line_len;
    size_t index = 0;
    std::string line;
    bool line_valid = false;
    bool overflow = false;
  };
} // namespace vpngw

#endif // VPNGW_COMMON_SPLITLINES_H
