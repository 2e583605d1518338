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

// Policy routing for the downstream peers.  A dedicated routing
// table holds a single default route through the upstream tunnel
// and is selected only by packets carrying the classification mark.
// The main table is never touched.

#ifndef VPNGW_NETCONF_POLICYROUTE_H
#define VPNGW_NETCONF_POLICYROUTE_H

#include <cstdint>
#include <string>
#include <vector>

#include <vpngw/common/string.hpp>
#include <vpngw/common/number.hpp>
#include <vpngw/common/splitlines.hpp>
#include <vpngw/common/outcome.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/netconf/iproute.hpp>
#include <vpngw/netconf/rttables.hpp>
#include <vpngw/netconf/classifier.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class PolicyRouter
  {
  public:
    // metric of the fail-closed unreachable route, far above any
    // metric given to a real default route
    static const char *unreachable_metric()
    {
      return "4278198272";
    }

    enum RouteState {
      ROUTE_NONE,
      ROUTE_VIA_DEV,
      ROUTE_VIA_OTHER,
    };

    struct Result
    {
      Outcome::Type table = Outcome::REUSED;
      Outcome::Type rule = Outcome::REUSED;
      Outcome::Type route = Outcome::REUSED;
      bool unreachable = false;
    };

    PolicyRouter(IPRoute2& ip_arg, RtTables& rt_tables_arg)
      : ip(ip_arg),
	rt_tables(rt_tables_arg)
    {
    }

    Result ensure_routing_domain(const std::string& name,
				 const std::uint32_t id,
				 const std::string& via_interface,
				 const std::uint32_t mark,
				 const bool fail_closed_route)
    {
      Result res;
      res.table = rt_tables.ensure(id, name);
      res.rule = ensure_rule(name, id, mark);
      res.route = ensure_route(name, via_interface);
      if (fail_closed_route)
	{
	  ensure_unreachable(name);
	  res.unreachable = true;
	}
      return res;
    }

    // Does the output of "ip rule show" contain a rule selecting
    // table name (or its numeric id) for fwmark mark?  The mask is
    // ignored.
    static bool rule_present(const std::string& rule_show,
			     const std::uint32_t mark,
			     const std::string& name,
			     const std::uint32_t id)
    {
      const std::string id_str = std::to_string(id);
      SplitLines in(rule_show);
      while (in())
	{
	  const std::vector<std::string> tok = string::split_by_space(in.line_ref());
	  bool mark_match = false;
	  bool table_match = false;
	  for (size_t i = 0; i + 1 < tok.size(); ++i)
	    {
	      if (tok[i] == "fwmark")
		{
		  const std::string m = tok[i+1].substr(0, tok[i+1].find('/'));
		  std::uint32_t value;
		  if (parse_mark(m, value) && value == mark)
		    mark_match = true;
		}
	      else if (tok[i] == "lookup" || tok[i] == "table")
		{
		  if (tok[i+1] == name || tok[i+1] == id_str)
		    table_match = true;
		}
	    }
	  if (mark_match && table_match)
	    return true;
	}
      return false;
    }

    // Classify the default route found in the output of
    // "ip route show table <name>".
    static RouteState default_route_state(const std::string& route_show,
					  const std::string& via_interface,
					  std::string* other_dev = nullptr)
    {
      RouteState ret = ROUTE_NONE;
      SplitLines in(route_show);
      while (in())
	{
	  const std::vector<std::string> tok = string::split_by_space(in.line_ref());
	  if (tok.empty() || tok[0] != "default")
	    continue;
	  std::string dev;
	  for (size_t i = 1; i + 1 < tok.size(); ++i)
	    {
	      if (tok[i] == "dev")
		dev = tok[i+1];
	    }
	  if (dev == via_interface)
	    return ROUTE_VIA_DEV;
	  ret = ROUTE_VIA_OTHER;
	  if (other_dev)
	    *other_dev = dev;
	}
      return ret;
    }

    static bool unreachable_present(const std::string& route_show)
    {
      SplitLines in(route_show);
      while (in())
	{
	  const std::vector<std::string> tok = string::split_by_space(in.line_ref());
	  if (tok.size() >= 2 && tok[0] == "unreachable" && tok[1] == "default")
	    return true;
	}
      return false;
    }

  private:
    Outcome::Type ensure_rule(const std::string& name,
			      const std::uint32_t id,
			      const std::uint32_t mark)
    {
      const std::string mark_str = PacketClassifier::mark_string(mark);
      std::string out;
      const int status = ip.rule_show(out);
      if (status != 0)
	VPNGW_THROW_CODE(ROUTING_ERROR, "cannot list policy routing rules (status=" << status << ')');
      if (rule_present(out, mark, name, id))
	{
	  VPNGW_LOG_INFO("rule fwmark " << mark_str << " lookup " << name << " reused");
	  return Outcome::REUSED;
	}
      if (ip.rule_add_fwmark(mark_str, name) != 0)
	VPNGW_THROW_CODE(ROUTING_ERROR, "cannot add rule fwmark " << mark_str << " table " << name);
      VPNGW_LOG_INFO("rule fwmark " << mark_str << " lookup " << name << " created");
      return Outcome::CREATED;
    }

    std::string show_table(const std::string& name)
    {
      std::string out;
      const int status = ip.route_show_table(name, out);
      if (status != 0)
	VPNGW_THROW_CODE(ROUTING_ERROR, "cannot list routes of table " << name << " (status=" << status << ')');
      return out;
    }

    Outcome::Type ensure_route(const std::string& name, const std::string& via_interface)
    {
      std::string other_dev;
      switch (default_route_state(show_table(name), via_interface, &other_dev))
	{
	case ROUTE_VIA_DEV:
	  VPNGW_LOG_INFO("default route via " << via_interface << " in table " << name << " reused");
	  return Outcome::REUSED;
	case ROUTE_VIA_OTHER:
	  VPNGW_LOG_WARN("table " << name << " has a default route via '" << other_dev << "', replacing it with " << via_interface);
	  if (ip.route_default_dev("replace", via_interface, name) != 0)
	    VPNGW_THROW_CODE(ROUTING_ERROR, "cannot replace default route in table " << name);
	  break;
	default:
	  if (ip.route_default_dev("add", via_interface, name) != 0)
	    VPNGW_THROW_CODE(ROUTING_ERROR, "cannot add default route via " << via_interface << " to table " << name);
	  break;
	}
      VPNGW_LOG_INFO("default route via " << via_interface << " in table " << name << " created");
      return Outcome::CREATED;
    }

    void ensure_unreachable(const std::string& name)
    {
      if (unreachable_present(show_table(name)))
	{
	  VPNGW_LOG_INFO("unreachable fallback route in table " << name << " reused");
	  return;
	}
      if (ip.route_add_unreachable_default(unreachable_metric(), name) != 0)
	VPNGW_THROW_CODE(ROUTING_ERROR, "cannot add unreachable fallback route to table " << name);
      VPNGW_LOG_INFO("unreachable fallback route in table " << name << " created");
    }

    IPRoute2& ip;
    RtTables& rt_tables;
  };

}

#endif
