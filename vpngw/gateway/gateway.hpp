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

// One-shot provisioning of the gateway.  Every step is idempotent,
// so a restart against the same persistent state converges on the
// same result without duplicating anything.

#ifndef VPNGW_GATEWAY_GATEWAY_H
#define VPNGW_GATEWAY_GATEWAY_H

#include <string>
#include <vector>

#include <vpngw/error/excode.hpp>
#include <vpngw/gateway/config.hpp>
#include <vpngw/netconf/cmdrunner.hpp>
#include <vpngw/netconf/iproute.hpp>
#include <vpngw/netconf/sysctl.hpp>
#include <vpngw/netconf/rttables.hpp>
#include <vpngw/netconf/policyroute.hpp>
#include <vpngw/netconf/iptables.hpp>
#include <vpngw/netconf/classifier.hpp>
#include <vpngw/wg/upstream.hpp>
#include <vpngw/pki/credstore.hpp>
#include <vpngw/server/serverconf.hpp>
#include <vpngw/server/peerprofile.hpp>
#include <vpngw/server/launch.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class Gateway
  {
  public:
    struct Result
    {
      std::string server_conf;
      std::vector<std::string> profiles;
    };

    Gateway(const GatewayConfig& config_arg, CommandRunner& runner_arg)
      : config(config_arg),
	runner(runner_arg)
    {
    }

    // Run every provisioning step in order.  Throws ErrorCode,
    // classified by the step that failed.
    Result setup()
    {
      // nothing below may change the host before this passes
      config.validate();
      UpstreamTunnel::load_descriptor(config.wg_conf);

      IPRoute2 ip(runner, config.ip_path);
      Result res;

      VPNGW_LOG_INFO("== upstream tunnel");
      std::string upstream_if;
      step(Error::IFACE_CONFIG, [&]() {
	  UpstreamTunnel upstream(runner, ip, config.wg_path, config.wg_dev, config.tmp_dir);
	  upstream_if = upstream.bring_up(config.wg_conf);
	});

      VPNGW_LOG_INFO("== IPv4 forwarding");
      step(Error::SYSCTL_ERROR, [&]() {
	  Sysctl sysctl(runner, config.sysctl_path);
	  sysctl.enable_ipv4_forwarding();
	});

      VPNGW_LOG_INFO("== credentials");
      CredentialStore store(config.pki_config());
      step(Error::PKI_ERROR, [&]() {
	  store.ensure_ca();
	  store.ensure_server_credential(config.server_name);
	  store.ensure_tls_auth_key();
	  for (const auto &peer : config.peers)
	    store.ensure_peer_credential(peer);
	});

      VPNGW_LOG_INFO("== downstream server configuration");
      step(Error::SERVER_CONFIG_ERROR, [&]() {
	  ServerConfig sc = server_config();
	  stage_credentials(store, config.server_name, config.server_dir, sc);
	  res.server_conf = write_server_config(sc, config.server_conf_path());
	});

      VPNGW_LOG_INFO("== policy routing");
      step(Error::ROUTING_ERROR, [&]() {
	  RtTables rt_tables(config.rt_tables);
	  PolicyRouter router(ip, rt_tables);
	  router.ensure_routing_domain(config.table_name, config.table_id, upstream_if,
				       config.mark, config.fail_closed_route);
	});

      VPNGW_LOG_INFO("== packet classification");
      step(Error::FIREWALL_ERROR, [&]() {
	  Iptables iptables(runner, config.iptables_path);
	  PacketClassifier classifier(iptables);
	  classifier.install_classification(config.subnet, config.mark, config.ovpn_dev,
					    upstream_if, config.forward_drop);
	});

      VPNGW_LOG_INFO("== peer profiles");
      step(Error::PROFILE_ERROR, [&]() {
	  PeerProfile emitter(store, config.profile_dir);
	  PeerProfile::Params params;
	  params.host = config.public_host;
	  params.port = config.port;
	  params.proto = config.proto;
	  for (const auto &peer : config.peers)
	    res.profiles.push_back(emitter.write_peer_profile(peer, params));
	});

      VPNGW_LOG_INFO("setup complete");
      return res;
    }

    // Does not return on success
    void launch_server(const Result& res)
    {
      launch(config.openvpn_path, res.server_conf);
    }

    ServerConfig server_config() const
    {
      ServerConfig sc;
      sc.port = config.port;
      sc.proto = config.proto;
      sc.dev = config.ovpn_dev;
      sc.subnet = config.subnet;
      sc.dns = config.dns;
      return sc;
    }

  private:
    // Run fn, reclassifying any error that is not already an
    // ErrorCode as type.
    template <typename FUNC>
    static void step(const Error::Type type, FUNC fn)
    {
      try {
	fn();
      }
      catch (const ErrorCode&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  throw ErrorCode(type, e.what());
	}
    }

    const GatewayConfig& config;
    CommandRunner& runner;
  };

}

#endif
