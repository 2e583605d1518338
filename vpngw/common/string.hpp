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

// General purpose string-manipulation functions.

#ifndef VPNGW_COMMON_STRING_H
#define VPNGW_COMMON_STRING_H

#include <string>
#include <vector>
#include <cstring>
#include <cctype>
#include <strings.h> // for strcasecmp

namespace vpngw {
  namespace string {
    // case insensitive compare functions
    inline int strcasecmp(const std::string& s1, const char *s2)
    {
      return ::strcasecmp(s1.c_str(), s2);
    }

    inline int strcasecmp(const std::string& s1, const std::string& s2)
    {
      return ::strcasecmp(s1.c_str(), s2.c_str());
    }

    // Add leading or trailing string (like '/') to str if not already present
    inline std::string add_trailing(const std::string& str, const char c)
    {
      const size_t len = str.length();
      if (len > 0 && str[len-1] == c)
	return str;
      else
	return str + c;
    }

    // remove trailing \r or \n chars
    inline void trim_crlf(std::string& str)
    {
      static const char crlf[] = "\r\n";
      const size_t pos = str.find_last_not_of(crlf);
      if (pos == std::string::npos)
	str = "";
      else
	{
	  const size_t p = pos + 1;
	  if (p < str.length())
	    str = str.substr(0, p);
	}
    }

    inline bool ends_with_newline(const std::string& str)
    {
      return !str.empty() && str.back() == '\n';
    }

    // Define a common interpretation of what constitutes a space character.
    // Return true if c is a space char.
    inline bool is_space(const char c)
    {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline bool is_digit(const char c)
    {
      return c >= '0' && c <= '9';
    }

    // return true if string contains at least one space char
    inline bool contains_space(const std::string& str)
    {
      for (auto &c : str)
	if (is_space(c))
	  return true;
      return false;
    }

    // Split a string on sep delimiter.  The size of the
    // returned list will be at most maxsplit + 1, unless
    // maxsplit is -1.
    inline std::vector<std::string> split(const std::string& str,
					  const char sep,
					  const int maxsplit = -1)
    {
      std::vector<std::string> ret;
      int nterms = 0;
      std::string term;

      for (auto &c : str)
	{
	  if (c == sep && (maxsplit < 0 || nterms < maxsplit))
	    {
	      ret.push_back(std::move(term));
	      ++nterms;
	      term.clear();
	    }
	  else
	    term += c;
	}
      ret.push_back(std::move(term));
      return ret;
    }

    // Split a string on whitespace, discarding empty terms.
    inline std::vector<std::string> split_by_space(const std::string& str)
    {
      std::vector<std::string> ret;
      std::string term;
      for (auto &c : str)
	{
	  if (is_space(c))
	    {
	      if (!term.empty())
		{
		  ret.push_back(std::move(term));
		  term.clear();
		}
	    }
	  else
	    term += c;
	}
      if (!term.empty())
	ret.push_back(std::move(term));
      return ret;
    }

    inline bool starts_with(const std::string& str, const std::string& prefix)
    {
      const size_t len = str.length();
      const size_t plen = prefix.length();
      if (plen <= len)
	return std::memcmp(str.c_str(), prefix.c_str(), plen) == 0;
      else
	return false;
    }

    inline bool starts_with(const std::string& str, const char *prefix)
    {
      const size_t len = str.length();
      const size_t plen = std::strlen(prefix);
      if (plen <= len)
	return std::memcmp(str.c_str(), prefix, plen) == 0;
      else
	return false;
    }

    inline bool ends_with(const std::string& str, const std::string& suffix)
    {
      const size_t len = str.length();
      const size_t slen = suffix.length();
      if (slen <= len)
	return std::memcmp(str.c_str() + (len - slen), suffix.c_str(), slen) == 0;
      else
	return false;
    }

    // return a new string with leading and trailing space chars removed
    inline std::string trim_copy(const std::string& str)
    {
      const size_t len = str.length();
      size_t first = 0;
      while (first < len && is_space(str[first]))
	++first;
      size_t last = len;
      while (last > first && is_space(str[last-1]))
	--last;
      return str.substr(first, last - first);
    }

    inline std::string to_lower_copy(const std::string& str)
    {
      std::string ret;
      ret.reserve(str.length()+1);
      for (auto &c : str)
	ret.push_back(std::tolower(static_cast<unsigned char>(c)));
      return ret;
    }

    inline void trim(std::string& str)
    {
      str = trim_copy(str);
    }

    // Join a list of strings with sep between each term
    inline std::string join(const std::vector<std::string>& strings,
			    const std::string& sep)
    {
      std::string ret;
      bool first = true;
      for (const auto &s : strings)
	{
	  if (!first)
	    ret += sep;
	  ret += s;
	  first = false;
	}
      return ret;
    }

  } // namespace string

} // namespace vpngw

#endif // VPNGW_COMMON_STRING_H
