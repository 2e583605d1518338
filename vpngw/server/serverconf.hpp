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

// Configuration of the downstream OpenVPN server, and staging of
// the credentials it reads into its own directory.

#ifndef VPNGW_SERVER_SERVERCONF_H
#define VPNGW_SERVER_SERVERCONF_H

#include <string>
#include <vector>
#include <sstream>

#include <vpngw/common/file.hpp>
#include <vpngw/common/path.hpp>
#include <vpngw/common/writeprivate.hpp>
#include <vpngw/addr/ipv4.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/pki/credstore.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  struct ServerConfig
  {
    ServerConfig()
      : subnet(IPv4::Addr::from_uint32(0x0a080000), 24) // 10.8.0.0/24
    {
    }

    unsigned int port = 1194;
    std::string proto = "udp";
    std::string dev = "tun0";

    // empty to keep root privileges
    std::string user = "nobody";
    std::string group = "nogroup";

    // absolute paths of the staged credentials
    std::string ca;
    std::string cert;
    std::string key;
    std::string tls_auth;

    std::string cipher = "AES-256-GCM";
    std::string auth = "SHA256";
    std::string tls_version_min = "1.2";

    IPv4::Route subnet;
    std::vector<std::string> dns;

    unsigned int keepalive_interval = 10;
    unsigned int keepalive_timeout = 120;
    unsigned int verb = 3;

    // empty to omit
    std::string status = "/var/log/openvpn-status.log";
    std::string log_append = "/var/log/openvpn.log";

    std::string render() const
    {
      std::ostringstream os;
      os << "port " << port << '\n';
      os << "proto " << proto << '\n';
      os << "dev " << dev << '\n';
      os << '\n';
      if (!user.empty())
	os << "user " << user << '\n';
      if (!group.empty())
	os << "group " << group << '\n';
      if (!user.empty() || !group.empty())
	os << '\n';
      os << "ca " << ca << '\n';
      os << "cert " << cert << '\n';
      os << "key " << key << '\n';
      os << "dh none\n";
      os << '\n';
      os << "tls-auth " << tls_auth << " 0\n";
      os << "cipher " << cipher << '\n';
      os << "auth " << auth << '\n';
      os << "tls-version-min " << tls_version_min << '\n';
      os << '\n';
      os << "server " << subnet.addr << ' ' << subnet.netmask() << '\n';
      os << "topology subnet\n";
      os << '\n';
      os << "push \"redirect-gateway def1 bypass-dhcp\"\n";
      for (const auto &d : dns)
	os << "push \"dhcp-option DNS " << d << "\"\n";
      os << '\n';
      os << "keepalive " << keepalive_interval << ' ' << keepalive_timeout << '\n';
      os << "persist-key\n";
      os << "persist-tun\n";
      os << '\n';
      os << "verb " << verb << '\n';
      if (!status.empty())
	os << "status " << status << '\n';
      if (!log_append.empty())
	os << "log-append " << log_append << '\n';
      return os.str();
    }
  };

  // Copy the server's credentials into server_dir and point conf at
  // the copies.  Overwritten on every run.
  inline void stage_credentials(const CredentialStore& store,
				const std::string& server_name,
				const std::string& server_dir,
				ServerConfig& conf)
  {
    const Credential ca = store.ca();
    const Credential server = store.issued(server_name);
    const std::string ta = store.tls_auth_key();

    conf.ca = path::join(server_dir, "ca.crt");
    conf.cert = path::join(server_dir, "server.crt");
    conf.key = path::join(server_dir, "server.key");
    conf.tls_auth = path::join(server_dir, "ta.key");
    try {
      make_dirs(server_dir);
      copy_file(ca.cert_path, conf.ca, 0644);
      copy_file(server.cert_path, conf.cert, 0644);
      write_private(conf.key, read_text(server.key_path));
      write_private(conf.tls_auth, read_text(ta));
    }
    catch (const std::exception& e)
      {
	VPNGW_THROW_CODE(SERVER_CONFIG_ERROR, "cannot stage server credentials in " << server_dir << ": " << e.what());
      }
    VPNGW_LOG_INFO("server credentials staged in " << server_dir);
  }

  inline std::string write_server_config(const ServerConfig& conf, const std::string& config_path)
  {
    try {
      make_dirs(path::dirname(config_path));
      write_string(config_path, conf.render());
    }
    catch (const std::exception& e)
      {
	VPNGW_THROW_CODE(SERVER_CONFIG_ERROR, "cannot write " << config_path << ": " << e.what());
      }
    VPNGW_LOG_INFO("server configuration written to " << config_path);
    return config_path;
  }

}

#endif
