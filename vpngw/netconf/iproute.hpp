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

// Typed wrappers around ip(8) from iproute2.  Each method builds
// the argument list, runs it and returns the exit status.

#ifndef VPNGW_NETCONF_IPROUTE_H
#define VPNGW_NETCONF_IPROUTE_H

#include <string>

#include <vpngw/common/process.hpp>
#include <vpngw/netconf/cmdrunner.hpp>

namespace vpngw {

  class IPRoute2
  {
  public:
    IPRoute2(CommandRunner& runner_arg, const std::string& ip_path_arg)
      : runner(runner_arg),
	ip_path(ip_path_arg)
    {
    }

    int link_delete(const std::string& dev)
    {
      return run({"link", "del", "dev", dev});
    }

    int link_add(const std::string& dev, const std::string& type)
    {
      return run({"link", "add", dev, "type", type});
    }

    int link_set_mtu(const std::string& dev, const unsigned int mtu)
    {
      return run({"link", "set", "mtu", std::to_string(mtu), "dev", dev});
    }

    int link_set_up(const std::string& dev)
    {
      return run({"link", "set", "up", "dev", dev});
    }

    int addr_add(const std::string& addr, const std::string& dev)
    {
      return run({"address", "add", addr, "dev", dev});
    }

    int addr_show(const std::string& dev, std::string& out)
    {
      return run({"addr", "show", dev}, &out);
    }

    int rule_show(std::string& out)
    {
      return run({"rule", "show"}, &out);
    }

    int rule_add_fwmark(const std::string& mark, const std::string& table)
    {
      return run({"rule", "add", "fwmark", mark, "table", table});
    }

    int route_show_table(const std::string& table, std::string& out)
    {
      return run({"route", "show", "table", table}, &out);
    }

    // verb is "add" or "replace"
    int route_default_dev(const std::string& verb, const std::string& dev, const std::string& table)
    {
      return run({"route", verb, "default", "dev", dev, "table", table});
    }

    int route_add_unreachable_default(const std::string& metric, const std::string& table)
    {
      return run({"route", "add", "unreachable", "default", "metric", metric, "table", table});
    }

  private:
    int run(std::initializer_list<std::string> args, std::string* out = nullptr)
    {
      Argv argv;
      argv.push_back(ip_path);
      for (const auto &a : args)
	argv.push_back(a);
      return runner.run(argv, out);
    }

    CommandRunner& runner;
    std::string ip_path;
  };

}

#endif
