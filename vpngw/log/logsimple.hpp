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

#ifndef VPNGW_LOG_LOGSIMPLE_H
#define VPNGW_LOG_LOGSIMPLE_H

#include <unistd.h>

#include <iostream>
#include <string>

#include <vpngw/log/logbase.hpp>

namespace vpngw {

  // Console log.  INFO/VERB lines go to stdout, WARN/ERROR lines
  // to stderr, with ANSI colored prefixes when writing to a terminal.
  class LogBaseSimple : public LogBase
  {
  public:
    LogBaseSimple()
      : color_out(::isatty(1) == 1),
	color_err(::isatty(2) == 1)
    {
    }

    virtual void log(const Log::Level level, const std::string& str) override
    {
      const bool to_err = (level <= Log::L_WARN);
      std::ostream& os = to_err ? std::cerr : std::cout;
      const bool color = to_err ? color_err : color_out;
      if (color)
	os << color_code(level) << prefix(level) << "\033[0m" << str;
      else
	os << prefix(level) << str;
      os.flush();
    }

    static const char *prefix(const Log::Level level)
    {
      switch (level)
	{
	case Log::L_ERROR:
	  return "[ERROR] ";
	case Log::L_WARN:
	  return "[WARN]  ";
	case Log::L_VERB:
	  return "[VERB]  ";
	default:
	  return "[INFO]  ";
	}
    }

  private:
    static const char *color_code(const Log::Level level)
    {
      switch (level)
	{
	case Log::L_ERROR:
	  return "\033[1;31m";
	case Log::L_WARN:
	  return "\033[1;33m";
	case Log::L_VERB:
	  return "\033[0;36m";
	default:
	  return "\033[1;32m";
	}
    }

    bool color_out;
    bool color_err;
  };

}

#endif
