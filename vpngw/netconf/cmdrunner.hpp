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

// All changes to kernel state (links, addresses, rules, routes,
// packet filter, sysctl) go through a CommandRunner.

#ifndef VPNGW_NETCONF_CMDRUNNER_H
#define VPNGW_NETCONF_CMDRUNNER_H

#include <string>
#include <utility>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/process.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class CommandRunner
  {
  public:
    VPNGW_EXCEPTION(command_runner_error);

    // Log and execute argv.  Returns the exit status of the
    // program, or -1 if it could not be started or did not exit
    // normally.  If out is defined, it receives the combined
    // stdout/stderr of the program.
    int run(const Argv& argv, std::string* out = nullptr)
    {
      if (argv.empty())
	throw command_runner_error("empty argv");
      VPNGW_LOG_VERB(argv.to_string());
      std::string output;
      const int status = execute(argv, &output);
      if (status != 0 && !output.empty())
	VPNGW_LOG_VERB("exit status " << status << " : " << trim_output(output));
      if (out)
	*out = std::move(output);
      return status;
    }

    virtual ~CommandRunner() {}

  protected:
    virtual int execute(const Argv& argv, std::string* out) = 0;

  private:
    static std::string trim_output(std::string str)
    {
      while (!str.empty() && (str.back() == '\n' || str.back() == '\r'))
	str.pop_back();
      return str;
    }
  };

  // Executes argv[0] directly (no shell, no PATH search)
  class ProcessCommandRunner : public CommandRunner
  {
  protected:
    virtual int execute(const Argv& argv, std::string* out) override
    {
      RedirectPipe::Output output;
      const int status = system_cmd(argv[0], argv, nullptr, output, true);
      if (out)
	*out = std::move(output.out);
      return status;
    }
  };

}

#endif
