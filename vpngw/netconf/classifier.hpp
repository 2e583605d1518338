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

// Mark, forward and masquerade traffic that originates in the
// downstream peer subnet.  Marked packets are picked up by the
// policy routing rule and sent through the upstream tunnel.

#ifndef VPNGW_NETCONF_CLASSIFIER_H
#define VPNGW_NETCONF_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <vector>
#include <sstream>

#include <vpngw/addr/ipv4.hpp>
#include <vpngw/common/outcome.hpp>
#include <vpngw/netconf/iptables.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class PacketClassifier
  {
  public:
    struct Result
    {
      unsigned int created = 0;
      unsigned int reused = 0;
    };

    PacketClassifier(Iptables& iptables_arg)
      : iptables(iptables_arg)
    {
    }

    static std::string mark_string(const std::uint32_t mark)
    {
      std::ostringstream os;
      os << "0x" << std::hex << mark;
      return os.str();
    }

    // Rules in installation order.  The drop rule, when enabled,
    // comes after both accept rules.
    static std::vector<Iptables::Rule> rules(const IPv4::Route& subnet,
					     const std::uint32_t mark,
					     const std::string& downstream_if,
					     const std::string& upstream_if,
					     const bool forward_drop)
    {
      const std::string net = subnet.to_string();
      std::vector<Iptables::Rule> ret;
      ret.emplace_back("mangle", "PREROUTING",
		       std::vector<std::string>{"-s", net, "-j", "MARK", "--set-mark", mark_string(mark)});
      ret.emplace_back("filter", "FORWARD",
		       std::vector<std::string>{"-i", downstream_if, "-o", upstream_if, "-s", net, "-j", "ACCEPT"});
      ret.emplace_back("filter", "FORWARD",
		       std::vector<std::string>{"-i", upstream_if, "-o", downstream_if, "-d", net, "-j", "ACCEPT"});
      if (forward_drop)
	ret.emplace_back("filter", "FORWARD",
			 std::vector<std::string>{"-i", downstream_if, "-s", net, "-j", "DROP"});
      ret.emplace_back("nat", "POSTROUTING",
		       std::vector<std::string>{"-s", net, "-o", upstream_if, "-j", "MASQUERADE"});
      return ret;
    }

    Result install_classification(const IPv4::Route& subnet,
				  const std::uint32_t mark,
				  const std::string& downstream_if,
				  const std::string& upstream_if,
				  const bool forward_drop)
    {
      VPNGW_LOG_INFO("installing packet classification for " << subnet << " (mark " << mark_string(mark) << ')');
      Result res;
      for (const auto &rule : rules(subnet, mark, downstream_if, upstream_if, forward_drop))
	{
	  if (iptables.ensure(rule) == Outcome::CREATED)
	    ++res.created;
	  else
	    ++res.reused;
	}
      VPNGW_LOG_INFO("packet classification: " << res.created << " rules added, " << res.reused << " already present");
      return res;
    }

  private:
    Iptables& iptables;
  };

}

#endif
