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

#include "test_helper.hpp"

#include <vpngw/gateway/config.hpp>

using namespace vpngw;

namespace {
  // getopt wants a mutable argv
  struct CommandLine
  {
    CommandLine(std::initializer_list<std::string> args)
      : strings(args),
	wrap(strings)
    {
    }

    int argc() const { return int(strings.size()); }
    char **argv() { return wrap.c_argv(); }

    std::vector<std::string> strings;
    ArgvWrapper wrap;
  };

  Environ environ_with(std::initializer_list<std::string> vars)
  {
    Environ env;
    for (const auto &v : vars)
      env.push_back(v);
    return env;
  }

  GatewayConfig valid_config()
  {
    GatewayConfig c;
    c.public_host = "vpn.example.net";
    return c;
  }
}

TEST(GatewayConfig, Defaults)
{
  const GatewayConfig c;
  ASSERT_EQ(c.wg_conf, "/etc/wireguard/wg0.conf");
  ASSERT_EQ(c.wg_dev, "wg0");
  ASSERT_EQ(c.port, 1194u);
  ASSERT_EQ(c.proto, "udp");
  ASSERT_EQ(c.ovpn_dev, "tun0");
  ASSERT_EQ(c.subnet.to_string(), "10.8.0.0/24");
  ASSERT_EQ(c.dns, (std::vector<std::string>{"1.1.1.1", "1.0.0.1"}));
  ASSERT_EQ(c.peers, (std::vector<std::string>{"client1"}));
  ASSERT_EQ(c.table_name, "vpnwg");
  ASSERT_EQ(c.table_id, 100u);
  ASSERT_EQ(c.mark, 1u);
  ASSERT_EQ(c.server_conf_path(), "/etc/openvpn/server/server.conf");
  ASSERT_TRUE(c.launch);
  ASSERT_FALSE(c.forward_drop);
  ASSERT_FALSE(c.fail_closed_route);
}

TEST(GatewayConfig, Environment)
{
  GatewayConfig c;
  c.load_environ(environ_with({
	"VPN_PUBLIC_HOST= vpn.example.net ",
	"VPN_PORT=443",
	"VPN_PROTO=TCP",
	"VPN_CLIENTS=alice, bob,,carol",
	"VPN_DNS=9.9.9.9",
	"UNRELATED=1",
      }));
  ASSERT_EQ(c.public_host, "vpn.example.net");
  ASSERT_EQ(c.port, 443u);
  ASSERT_EQ(c.proto, "tcp");
  ASSERT_EQ(c.peers, (std::vector<std::string>{"alice", "bob", "carol"}));
  ASSERT_EQ(c.dns, (std::vector<std::string>{"9.9.9.9"}));
  c.validate();
}

TEST(GatewayConfig, EmptyDnsDisablesPush)
{
  GatewayConfig c;
  c.load_environ(environ_with({"VPN_PUBLIC_HOST=1.2.3.4", "VPN_DNS="}));
  ASSERT_TRUE(c.dns.empty());
}

TEST(GatewayConfig, BadPort)
{
  GatewayConfig c;
  ASSERT_EQ(error_type_of([&]() { c.load_environ(environ_with({"VPN_PORT=99999"})); }), Error::CONFIG_INVALID);
  ASSERT_EQ(error_type_of([&]() { c.load_environ(environ_with({"VPN_PORT=http"})); }), Error::CONFIG_INVALID);
}

TEST(GatewayConfig, CommandLine)
{
  GatewayConfig c;
  CommandLine cl({"vpngw", "--wg-conf", "/cfg/wg1.conf", "-i", "wg1", "--peer", "alice", "-p", "bob",
	"--forward-drop", "-F", "--no-launch", "-v", "-k", "/data/pki", "-o", "/out"});
  c.parse_command_line(cl.argc(), cl.argv());
  ASSERT_EQ(c.wg_conf, "/cfg/wg1.conf");
  ASSERT_EQ(c.wg_dev, "wg1");
  ASSERT_EQ(c.pki_dir, "/data/pki");
  ASSERT_EQ(c.profile_dir, "/out");
  ASSERT_EQ(c.peers, (std::vector<std::string>{"alice", "bob"}));
  ASSERT_TRUE(c.forward_drop);
  ASSERT_TRUE(c.fail_closed_route);
  ASSERT_FALSE(c.launch);
  ASSERT_TRUE(c.verbose);

  // command line peers take precedence over VPN_CLIENTS
  c.load_environ(environ_with({"VPN_CLIENTS=carol"}));
  ASSERT_EQ(c.peers, (std::vector<std::string>{"alice", "bob"}));
}

TEST(GatewayConfig, Help)
{
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "--help"});
    ASSERT_NO_THROW(c.parse_command_line(cl.argc(), cl.argv()));
    ASSERT_TRUE(c.help);
  }
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "-n", "-h", "stray"});
    ASSERT_NO_THROW(c.parse_command_line(cl.argc(), cl.argv()));
    ASSERT_TRUE(c.help);
  }
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "-n"});
    c.parse_command_line(cl.argc(), cl.argv());
    ASSERT_FALSE(c.help);
  }
}

TEST(GatewayConfig, CommandLineErrors)
{
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "--bogus"});
    ASSERT_THROW(c.parse_command_line(cl.argc(), cl.argv()), GatewayConfig::usage);
  }
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "stray"});
    ASSERT_THROW(c.parse_command_line(cl.argc(), cl.argv()), GatewayConfig::usage);
  }
  {
    GatewayConfig c;
    CommandLine cl({"vpngw", "--peer"});
    ASSERT_THROW(c.parse_command_line(cl.argc(), cl.argv()), GatewayConfig::usage);
  }
}

TEST(GatewayConfig, Usage)
{
  std::ostringstream os;
  GatewayConfig::print_usage(os);
  ASSERT_NE(os.str().find("VPN_PUBLIC_HOST"), std::string::npos);
  ASSERT_NE(os.str().find("--fail-closed-route"), std::string::npos);
}

TEST(GatewayConfig, MissingHost)
{
  GatewayConfig c;
  ASSERT_EQ(error_type_of([&]() { c.validate(); }), Error::CONFIG_MISSING);
  c.load_environ(environ_with({"VPN_PUBLIC_HOST=  "}));
  ASSERT_EQ(error_type_of([&]() { c.validate(); }), Error::CONFIG_MISSING);
}

TEST(GatewayConfig, Validation)
{
  ASSERT_EQ(error_type_of([]() { valid_config().validate(); }), Error::SUCCESS);

  const std::vector<std::function<void(GatewayConfig&)>> invalid = {
    [](GatewayConfig& c) { c.public_host = "bad host"; },
    [](GatewayConfig& c) { c.proto = "sctp"; },
    [](GatewayConfig& c) { c.port = 0; },
    [](GatewayConfig& c) { c.subnet = IPv4::Route::from_string("10.8.0.1/24"); },
    [](GatewayConfig& c) { c.dns = {"resolver.example"}; },
    [](GatewayConfig& c) { c.mark = 0; },
    [](GatewayConfig& c) { c.table_id = 254; },
    [](GatewayConfig& c) { c.table_name = "main"; },
    [](GatewayConfig& c) { c.table_name = "123"; },
    [](GatewayConfig& c) { c.wg_dev = "averyveryverylongname"; },
    [](GatewayConfig& c) { c.wg_dev = "tun0"; },
    [](GatewayConfig& c) { c.peers.clear(); },
    [](GatewayConfig& c) { c.peers = {"../x"}; },
    [](GatewayConfig& c) { c.peers = {"server"}; },
    [](GatewayConfig& c) { c.peers = {"alice", "alice"}; },
    [](GatewayConfig& c) { c.server_name = "ca"; },
  };
  for (size_t i = 0; i < invalid.size(); ++i)
    {
      GatewayConfig c = valid_config();
      invalid[i](c);
      ASSERT_EQ(error_type_of([&]() { c.validate(); }), Error::CONFIG_INVALID) << "case " << i;
    }
}

TEST(GatewayConfig, PkiConfig)
{
  GatewayConfig c;
  c.pki_dir = "/data/easy-rsa/pki";
  const CredentialStore store(c.pki_config());
  ASSERT_EQ(store.tls_auth_key_path(), "/data/easy-rsa/ta.key");
}
