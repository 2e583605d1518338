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

// The logging interface.  Log lines are delivered with a severity
// level to whatever LogBase is currently installed by a Log::Context.

#ifndef VPNGW_LOG_LOGBASE_H
#define VPNGW_LOG_LOGBASE_H

#include <string>

namespace vpngw {
  namespace Log {
    enum Level {
      L_ERROR=0,
      L_WARN,
      L_INFO,
      L_VERB,
    };

    inline const char *level_name(const Level level)
    {
      switch (level)
	{
	case L_ERROR:
	  return "ERROR";
	case L_WARN:
	  return "WARN";
	case L_INFO:
	  return "INFO";
	case L_VERB:
	  return "VERB";
	default:
	  return "?";
	}
    }
  }

  struct LogBase
  {
    // str is a complete line including the trailing newline
    virtual void log(const Log::Level level, const std::string& str) = 0;
    virtual ~LogBase() {}
  };

  namespace Log {

    inline LogBase*& global_log()
    {
      static LogBase* log = nullptr; // GLOBAL
      return log;
    }

    // lines above this level are discarded before reaching the LogBase
    inline Level& threshold()
    {
      static Level level = L_INFO; // GLOBAL
      return level;
    }

    inline bool enabled(const Level level)
    {
      return level <= threshold();
    }

    // While in scope, installs cli as the global log.  Contexts
    // may nest, the previous log is restored on destruction.
    class Context
    {
      Context(const Context&) = delete;
      Context& operator=(const Context&) = delete;

    public:
      Context(LogBase* cli)
	: prev(global_log())
      {
	global_log() = cli;
      }

      ~Context()
      {
	global_log() = prev;
      }

      static bool defined()
      {
	return global_log() != nullptr;
      }

      static LogBase* obj()
      {
	return global_log();
      }

    private:
      LogBase* prev;
    };
  }
}

#endif
