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

// Gateway settings.  Sources in increasing precedence: built-in
// defaults, environment, command line.  Nothing is changed on the
// host until validate() has passed.

#ifndef VPNGW_GATEWAY_CONFIG_H
#define VPNGW_GATEWAY_CONFIG_H

#include <net/if.h>   // IFNAMSIZ
#include <getopt.h>

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>
#include <algorithm>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/string.hpp>
#include <vpngw/common/number.hpp>
#include <vpngw/common/hostport.hpp>
#include <vpngw/common/path.hpp>
#include <vpngw/common/process.hpp>
#include <vpngw/addr/ipv4.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/pki/credstore.hpp>

namespace vpngw {

  struct GatewayConfig
  {
    VPNGW_SIMPLE_EXCEPTION(usage);

    GatewayConfig()
      : subnet(IPv4::Route::from_string("10.8.0.0/24")),
	dns({"1.1.1.1", "1.0.0.1"}),
	peers({"client1"})
    {
    }

    // upstream tunnel
    std::string wg_conf = "/etc/wireguard/wg0.conf";
    std::string wg_dev = "wg0";

    // downstream server
    std::string public_host;
    unsigned int port = 1194;
    std::string proto = "udp";
    std::string ovpn_dev = "tun0";
    IPv4::Route subnet;
    std::vector<std::string> dns;
    std::string server_name = "server";
    std::vector<std::string> peers;

    // persistent state
    std::string pki_dir = "/etc/openvpn/easy-rsa/pki";
    std::string tls_auth_key;   // empty: next to pki_dir
    std::string server_dir = "/etc/openvpn/server";
    std::string profile_dir = "/vpn-data";
    std::string rt_tables = "/etc/iproute2/rt_tables";
    std::string tmp_dir = "/tmp";

    // routing domain
    std::string table_name = "vpnwg";
    std::uint32_t table_id = 100;
    std::uint32_t mark = 0x1;

    // hardening
    bool forward_drop = false;
    bool fail_closed_route = false;

    bool launch = true;
    bool verbose = false;
    bool help = false;

    // external programs
    std::string ip_path = "/sbin/ip";
    std::string iptables_path = "/sbin/iptables";
    std::string wg_path = "/usr/bin/wg";
    std::string sysctl_path = "/sbin/sysctl";
    std::string openvpn_path = "/usr/sbin/openvpn";

    std::string server_conf_path() const
    {
      return path::join(server_dir, "server.conf");
    }

    CredentialStore::Config pki_config() const
    {
      CredentialStore::Config c;
      c.pki_dir = pki_dir;
      c.tls_auth_key = tls_auth_key;
      return c;
    }

    // VPN_PUBLIC_HOST, VPN_PORT, VPN_PROTO, VPN_CLIENTS, VPN_DNS.
    // VPN_CLIENTS is ignored if peers were given on the command line.
    void load_environ(const Environ& env)
    {
      const int host = env.find_index("VPN_PUBLIC_HOST");
      if (host >= 0)
	public_host = string::trim_copy(env.value(host));

      const std::string port_str = string::trim_copy(env.find("VPN_PORT"));
      if (!port_str.empty())
	{
	  if (!HostPort::is_valid_port(port_str, &port))
	    VPNGW_THROW_CODE(CONFIG_INVALID, "VPN_PORT: bad port number '" << port_str << '\'');
	}

      const std::string proto_str = string::trim_copy(env.find("VPN_PROTO"));
      if (!proto_str.empty())
	proto = string::to_lower_copy(proto_str);

      if (!peers_from_command_line)
	{
	  const int clients = env.find_index("VPN_CLIENTS");
	  if (clients >= 0)
	    peers = split_list(env.value(clients));
	}

      const int dns_idx = env.find_index("VPN_DNS");
      if (dns_idx >= 0)
	dns = split_list(env.value(dns_idx));
    }

    // Throws usage for bad arguments.  --help sets help and stops parsing.
    void parse_command_line(int argc, char *argv[])
    {
      static const struct option longopts[] = {
	{ "wg-conf",           required_argument,  nullptr,      'w' },
	{ "wg-dev",            required_argument,  nullptr,      'i' },
	{ "pki-dir",           required_argument,  nullptr,      'k' },
	{ "server-dir",        required_argument,  nullptr,      's' },
	{ "profile-dir",       required_argument,  nullptr,      'o' },
	{ "peer",              required_argument,  nullptr,      'p' },
	{ "forward-drop",      no_argument,        nullptr,      'D' },
	{ "fail-closed-route", no_argument,        nullptr,      'F' },
	{ "no-launch",         no_argument,        nullptr,      'n' },
	{ "verbose",           no_argument,        nullptr,      'v' },
	{ "help",              no_argument,        nullptr,      'h' },
	{ nullptr,             0,                  nullptr,       0  }
      };

      std::vector<std::string> cli_peers;
      int ch;
      optind = 0; // 0 forces getopt to reinitialize
      opterr = 0;
      while ((ch = getopt_long(argc, argv, "w:i:k:s:o:p:DFnvh", longopts, nullptr)) != -1)
	{
	  switch (ch)
	    {
	    case 'w':
	      wg_conf = optarg;
	      break;
	    case 'i':
	      wg_dev = optarg;
	      break;
	    case 'k':
	      pki_dir = optarg;
	      break;
	    case 's':
	      server_dir = optarg;
	      break;
	    case 'o':
	      profile_dir = optarg;
	      break;
	    case 'p':
	      cli_peers.push_back(optarg);
	      break;
	    case 'D':
	      forward_drop = true;
	      break;
	    case 'F':
	      fail_closed_route = true;
	      break;
	    case 'n':
	      launch = false;
	      break;
	    case 'v':
	      verbose = true;
	      break;
	    case 'h':
	      help = true;
	      return;
	    default:
	      throw usage();
	    }
	}
      if (optind != argc)
	throw usage();
      if (!cli_peers.empty())
	{
	  peers = std::move(cli_peers);
	  peers_from_command_line = true;
	}
    }

    static void print_usage(std::ostream& os)
    {
      os << "vpngw: relay OpenVPN peers through an upstream WireGuard tunnel" << std::endl;
      os << "usage: vpngw [options]" << std::endl;
      os << "--wg-conf, -w <file>   : upstream WireGuard descriptor (default /etc/wireguard/wg0.conf)" << std::endl;
      os << "--wg-dev, -i <dev>     : upstream interface name (default wg0)" << std::endl;
      os << "--pki-dir, -k <dir>    : PKI directory (default /etc/openvpn/easy-rsa/pki)" << std::endl;
      os << "--server-dir, -s <dir> : server directory (default /etc/openvpn/server)" << std::endl;
      os << "--profile-dir, -o <dir>: peer profile directory (default /vpn-data)" << std::endl;
      os << "--peer, -p <name>      : peer to provision, may be repeated (overrides VPN_CLIENTS)" << std::endl;
      os << "--forward-drop, -D     : drop downstream traffic not forwarded to the upstream tunnel" << std::endl;
      os << "--fail-closed-route, -F: add an unreachable fallback route to the routing domain" << std::endl;
      os << "--no-launch, -n        : provision only, do not start the server" << std::endl;
      os << "--verbose, -v          : log every external command" << std::endl;
      os << "--help, -h             : show this message" << std::endl;
      os << "environment: VPN_PUBLIC_HOST (required), VPN_PORT, VPN_PROTO, VPN_CLIENTS, VPN_DNS" << std::endl;
    }

    void validate() const
    {
      if (public_host.empty())
	VPNGW_THROW_CODE(CONFIG_MISSING, "VPN_PUBLIC_HOST is not set");
      if (!HostPort::is_valid_host(public_host))
	VPNGW_THROW_CODE(CONFIG_INVALID, "VPN_PUBLIC_HOST: bad host '" << public_host << '\'');
      if (port < 1 || port > 65535)
	VPNGW_THROW_CODE(CONFIG_INVALID, "bad port " << port);
      if (proto != "udp" && proto != "tcp" && proto != "udp6" && proto != "tcp6")
	VPNGW_THROW_CODE(CONFIG_INVALID, "VPN_PROTO: expected udp, tcp, udp6 or tcp6, got '" << proto << '\'');

      if (!subnet.is_canonical() || subnet.prefix_len < 8 || subnet.prefix_len > 30)
	VPNGW_THROW_CODE(CONFIG_INVALID, "bad downstream subnet " << subnet);
      for (const auto &d : dns)
	{
	  if (!IPv4::Addr::is_valid(d) && !(d.find(':') != std::string::npos && HostPort::is_valid_host(d)))
	    VPNGW_THROW_CODE(CONFIG_INVALID, "VPN_DNS: bad resolver address '" << d << '\'');
	}

      if (mark == 0)
	VPNGW_THROW_CODE(CONFIG_INVALID, "packet mark must not be zero");
      if (table_id == 0 || table_id == 253 || table_id == 254 || table_id == 255)
	VPNGW_THROW_CODE(CONFIG_INVALID, "routing table id " << table_id << " is reserved");
      if (!is_valid_table_name(table_name))
	VPNGW_THROW_CODE(CONFIG_INVALID, "bad routing table name '" << table_name << '\'');

      validate_ifname(wg_dev, "upstream interface");
      validate_ifname(ovpn_dev, "downstream interface");
      if (wg_dev == ovpn_dev)
	VPNGW_THROW_CODE(CONFIG_INVALID, "upstream and downstream interfaces are both '" << wg_dev << '\'');

      if (!CredentialStore::is_valid_name(server_name))
	VPNGW_THROW_CODE(CONFIG_INVALID, "bad server name '" << server_name << '\'');
      if (peers.empty())
	VPNGW_THROW_CODE(CONFIG_INVALID, "no peers configured");
      for (size_t i = 0; i < peers.size(); ++i)
	{
	  const std::string& p = peers[i];
	  if (!CredentialStore::is_valid_name(p))
	    VPNGW_THROW_CODE(CONFIG_INVALID, "bad peer name '" << p << "', expected [A-Za-z0-9_.-]");
	  if (p == server_name)
	    VPNGW_THROW_CODE(CONFIG_INVALID, "peer name '" << p << "' is the server's name");
	  if (std::find(peers.begin(), peers.begin() + i, p) != peers.begin() + i)
	    VPNGW_THROW_CODE(CONFIG_INVALID, "peer '" << p << "' given twice");
	}

      if (wg_conf.empty() || pki_dir.empty() || server_dir.empty() || profile_dir.empty())
	VPNGW_THROW_CODE(CONFIG_INVALID, "empty path");
    }

  private:
    static std::vector<std::string> split_list(const std::string& str)
    {
      std::vector<std::string> ret;
      for (auto &item : string::split(str, ','))
	{
	  string::trim(item);
	  if (!item.empty())
	    ret.push_back(std::move(item));
	}
      return ret;
    }

    static void validate_ifname(const std::string& name, const char *title)
    {
      if (name.empty() || name.length() >= IFNAMSIZ || name.find('/') != std::string::npos
	  || string::contains_space(name) || name == "." || name == "..")
	VPNGW_THROW_CODE(CONFIG_INVALID, "bad " << title << " name '" << name << '\'');
    }

    static bool is_valid_table_name(const std::string& name)
    {
      if (name.empty() || name == "main" || name == "local" || name == "default" || name == "unspec")
	return false;
      bool all_digits = true;
      for (const auto c : name)
	{
	  if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-'))
	    return false;
	  if (!string::is_digit(c))
	    all_digits = false;
	}
      return !all_digits;
    }

    bool peers_from_command_line = false;
  };

}

#endif
