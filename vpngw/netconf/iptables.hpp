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

#ifndef VPNGW_NETCONF_IPTABLES_H
#define VPNGW_NETCONF_IPTABLES_H

#include <string>
#include <vector>
#include <utility>

#include <vpngw/common/process.hpp>
#include <vpngw/common/outcome.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/netconf/cmdrunner.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class Iptables
  {
  public:
    struct Rule
    {
      Rule(const std::string& table_arg,
	   const std::string& chain_arg,
	   std::vector<std::string> spec_arg)
	: table(table_arg),
	  chain(chain_arg),
	  spec(std::move(spec_arg))
      {
      }

      std::string to_string() const
      {
	std::string ret = "-t " + table + ' ' + chain;
	for (const auto &s : spec)
	  {
	    ret += ' ';
	    ret += s;
	  }
	return ret;
      }

      std::string table;
      std::string chain;
      std::vector<std::string> spec;
    };

    Iptables(CommandRunner& runner_arg, const std::string& iptables_path_arg)
      : runner(runner_arg),
	iptables_path(iptables_path_arg)
    {
    }

    // iptables -C exits with 0 if the rule exists and 1 if it does not.
    // Any other status means the check itself failed.
    bool exists(const Rule& rule)
    {
      std::string out;
      const int status = runner.run(argv(rule, "-C"), &out);
      if (status == 0)
	return true;
      if (status == 1)
	return false;
      VPNGW_THROW_CODE(FIREWALL_ERROR, "cannot check rule [" << rule.to_string() << "] (status=" << status << ") " << first_line(out));
    }

    void append(const Rule& rule)
    {
      std::string out;
      const int status = runner.run(argv(rule, "-A"), &out);
      if (status != 0)
	VPNGW_THROW_CODE(FIREWALL_ERROR, "cannot append rule [" << rule.to_string() << "] (status=" << status << ") " << first_line(out));
    }

    Outcome::Type ensure(const Rule& rule)
    {
      if (exists(rule))
	{
	  VPNGW_LOG_INFO("iptables rule present: " << rule.to_string());
	  return Outcome::REUSED;
	}
      append(rule);
      VPNGW_LOG_INFO("iptables rule added: " << rule.to_string());
      return Outcome::CREATED;
    }

  private:
    Argv argv(const Rule& rule, const std::string& command) const
    {
      Argv a;
      a.push_back(iptables_path);
      a.push_back("-w");
      a.push_back("-t");
      a.push_back(rule.table);
      a.push_back(command);
      a.push_back(rule.chain);
      for (const auto &s : rule.spec)
	a.push_back(s);
      return a;
    }

    static std::string first_line(const std::string& str)
    {
      return str.substr(0, str.find('\n'));
    }

    CommandRunner& runner;
    std::string iptables_path;
  };

}

#endif
