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

#ifndef VPNGW_TEST_HELPER_H
#define VPNGW_TEST_HELPER_H

#include <stdlib.h>
#include <stdio.h>
#include <ftw.h>
#include <unistd.h>
#include <sys/stat.h>

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>
#include <functional>

#include <gtest/gtest.h>

#include <vpngw/log/logbase.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/common/exception.hpp>
#include <vpngw/common/file.hpp>

namespace vpngw {
  class LogOutputCollector : public LogBase
  {
  public:
    LogOutputCollector() : log_context(this)
    {
    }

    void log(const Log::Level level, const std::string& l) override
    {
      std::lock_guard<std::mutex> lock(mutex);

      if (output_log)
	std::cout << '[' << Log::level_name(level) << "] " << l;
      if (collect_log)
	out << '[' << Log::level_name(level) << "] " << l;
    }

    /**
     * Return the collected log out
     * @return the log output as string
     */
    std::string getOutput() const
    {
      return out.str();
    }

    /**
     * Changes if the logging to stdout should be done
     * @param doOutput
     */
    void setPrintOutput(bool doOutput)
    {
      output_log = doOutput;
    }

    /**
     * Return current state of stdout output
     * @return current state of output
     */
    bool isStdoutEnabled() const
    {
      return output_log;
    }

    /**
     * Starts collecting log output. This will also
     * disable stdout output and clear the collected output if there is any
     */
    void startCollecting()
    {
      collect_log = true;
      saved_output_log = output_log;
      output_log = false;
      // Reset our buffer
      out.str(std::string());
      out.clear();
    }

    /**
     * Stops collecting log output. Restores the stdout output state
     * from before startCollecting().
     * @return the output collected
     */
    std::string stopCollecting()
    {
      collect_log = false;
      output_log = saved_output_log;
      return getOutput();
    }

  private:
    bool output_log = true;
    bool collect_log = false;
    bool saved_output_log = true;
    std::stringstream out;
    std::mutex mutex{};
    Log::Context log_context;
  };

  // A scratch directory, removed with its contents on destruction
  class TempDir
  {
  public:
    TempDir()
    {
      char tmpl[] = "/tmp/vpngw-test-XXXXXX";
      if (!::mkdtemp(tmpl))
	throw Exception("mkdtemp failed");
      dir = tmpl;
    }

    ~TempDir()
    {
      ::nftw(dir.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }

    const std::string& path() const
    {
      return dir;
    }

    std::string path(const std::string& rel) const
    {
      return dir + '/' + rel;
    }

  private:
    static int remove_entry(const char *fpath, const struct stat *, int, struct FTW *)
    {
      return ::remove(fpath);
    }

    std::string dir;
  };
}

extern vpngw::LogOutputCollector* testLog;

// Run fn and return the classification of the ErrorCode it throws,
// or SUCCESS if it does not throw.
inline vpngw::Error::Type error_type_of(const std::function<void()>& fn)
{
  const bool previousOutputState = testLog->isStdoutEnabled();
  testLog->setPrintOutput(false);
  vpngw::Error::Type ret = vpngw::Error::SUCCESS;
  try {
    fn();
  }
  catch (const vpngw::ErrorCode& e)
    {
      ret = e.code();
    }
  testLog->setPrintOutput(previousOutputState);
  return ret;
}

inline mode_t mode_of(const std::string& fn)
{
  return vpngw::file_mode(fn);
}

#endif
