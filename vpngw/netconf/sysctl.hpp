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

#ifndef VPNGW_NETCONF_SYSCTL_H
#define VPNGW_NETCONF_SYSCTL_H

#include <string>

#include <vpngw/common/process.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/netconf/cmdrunner.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class Sysctl
  {
  public:
    Sysctl(CommandRunner& runner_arg, const std::string& sysctl_path_arg)
      : runner(runner_arg),
	sysctl_path(sysctl_path_arg)
    {
    }

    // sysctl -w key=value, throws SYSCTL_ERROR on failure
    void set(const std::string& key, const std::string& value)
    {
      Argv argv;
      argv.push_back(sysctl_path);
      argv.push_back("-w");
      argv.push_back(key + '=' + value);
      std::string out;
      const int status = runner.run(argv, &out);
      if (status != 0)
	VPNGW_THROW_CODE(SYSCTL_ERROR, "cannot set " << key << '=' << value << " (status=" << status << ')');
      VPNGW_LOG_INFO("sysctl " << key << " = " << value);
    }

    void enable_ipv4_forwarding()
    {
      set("net.ipv4.ip_forward", "1");
    }

  private:
    CommandRunner& runner;
    std::string sysctl_path;
  };

}

#endif
