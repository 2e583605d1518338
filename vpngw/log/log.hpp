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

// Logging macros.  Usage:
//
//   VPNGW_LOG_INFO("rule " << rule << " already present");
//
// The stream expression is only evaluated when the level is enabled.

#ifndef VPNGW_LOG_LOG_H
#define VPNGW_LOG_LOG_H

#include <string>
#include <sstream>

#include <vpngw/log/logbase.hpp>
#include <vpngw/log/logsimple.hpp>

namespace vpngw {
  namespace Log {
    inline void emit(const Level level, const std::string& str)
    {
      LogBase* log = Context::obj();
      if (log)
	log->log(level, str);
      else
	{
	  static LogBaseSimple console; // GLOBAL
	  console.log(level, str);
	}
    }
  }
}

#define VPNGW_LOG_LEVEL(level, args) \
  do { \
    if (vpngw::Log::enabled(level)) { \
      std::ostringstream _vpngw_log; \
      _vpngw_log << args << '\n'; \
      vpngw::Log::emit(level, _vpngw_log.str()); \
    } \
  } while (0)

#define VPNGW_LOG_ERROR(args) VPNGW_LOG_LEVEL(vpngw::Log::L_ERROR, args)
#define VPNGW_LOG_WARN(args) VPNGW_LOG_LEVEL(vpngw::Log::L_WARN, args)
#define VPNGW_LOG_INFO(args) VPNGW_LOG_LEVEL(vpngw::Log::L_INFO, args)
#define VPNGW_LOG_VERB(args) VPNGW_LOG_LEVEL(vpngw::Log::L_VERB, args)

#endif
