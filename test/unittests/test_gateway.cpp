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
#include "fake_runner.hpp"

#include <vpngw/gateway/gateway.hpp>

using namespace vpngw;

namespace {
  const std::string descriptor =
    "[Interface]\n"
    "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
    "Address = 10.66.0.2/32\n"
    "DNS = 10.66.0.1\n"
    "MTU = 1280\n"
    "\n"
    "[Peer]\n"
    "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
    "AllowedIPs = 0.0.0.0/0\n"
    "Endpoint = 192.0.2.10:51820\n";

  size_t count_occurrences(const std::string& text, const std::string& pattern)
  {
    size_t n = 0;
    for (size_t pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1))
      ++n;
    return n;
  }
}

class GatewayTest : public testing::Test
{
protected:
  GatewayTest()
  {
    config.public_host = "vpn.example.net";
    config.wg_conf = tmp.path("wireguard/wg0.conf");
    config.pki_dir = tmp.path("easy-rsa/pki");
    config.server_dir = tmp.path("server");
    config.profile_dir = tmp.path("vpn-data");
    config.rt_tables = tmp.path("iproute2/rt_tables");
    config.tmp_dir = tmp.path();
    config.peers = {"client1", "client2"};
    make_dirs(tmp.path("wireguard"));
    write_string(config.wg_conf, descriptor, 0600);
  }

  Gateway::Result run_setup()
  {
    Gateway gateway(config, runner);
    return gateway.setup();
  }

  TempDir tmp;
  GatewayConfig config;
  FakeRunner runner;
};

TEST_F(GatewayTest, FirstRun)
{
  const Gateway::Result res = run_setup();

  ASSERT_EQ(res.server_conf, tmp.path("server/server.conf"));
  ASSERT_EQ(res.profiles, (std::vector<std::string>{tmp.path("vpn-data/client1.ovpn"), tmp.path("vpn-data/client2.ovpn")}));

  ASSERT_TRUE(runner.links["wg0"].up);
  ASSERT_EQ(runner.sysctls["net.ipv4.ip_forward"], "1");
  ASSERT_EQ(runner.rules, (std::vector<std::string>{"fwmark 0x1 lookup vpnwg"}));
  ASSERT_EQ(runner.routes["vpnwg"], (std::vector<std::string>{"default dev wg0 scope link"}));
  ASSERT_EQ(runner.routes.count("main"), 0u);
  ASSERT_EQ(runner.iptables_rules(), 4u);
  ASSERT_NE(read_text(config.rt_tables).find("100 vpnwg\n"), std::string::npos);

  const std::string conf = read_text(res.server_conf);
  ASSERT_NE(conf.find("ca " + tmp.path("server/ca.crt") + '\n'), std::string::npos);
  ASSERT_NE(conf.find("push \"dhcp-option DNS 1.1.1.1\"\n"), std::string::npos);
  ASSERT_NE(read_text(config.wg_conf).find("Table = off\n"), std::string::npos);

  const std::string profile = read_text(res.profiles[0]);
  ASSERT_NE(profile.find("remote vpn.example.net 1194\n"), std::string::npos);
  ASSERT_EQ(mode_of(res.profiles[0]), mode_t(0600));
}

TEST_F(GatewayTest, StepOrder)
{
  run_setup();
  const auto first_index = [&](const std::string& prefix) {
    for (size_t i = 0; i < runner.commands.size(); ++i)
      if (string::starts_with(runner.commands[i], prefix))
	return i;
    return runner.commands.size();
  };
  const size_t link_up = first_index("ip link set up");
  const size_t forwarding = first_index("sysctl -w net.ipv4.ip_forward=1");
  const size_t rule = first_index("ip rule add");
  const size_t mark = first_index("iptables -w -t mangle -A PREROUTING");
  ASSERT_LT(link_up, forwarding);
  ASSERT_LT(forwarding, rule);
  ASSERT_LT(rule, mark);
  ASSERT_LT(mark, runner.commands.size());
}

TEST_F(GatewayTest, SecondRunConverges)
{
  const Gateway::Result first = run_setup();
  const std::string ca = read_text(tmp.path("easy-rsa/pki/ca.crt"));
  const std::string profile1 = read_text(first.profiles[0]);
  const std::string profile2 = read_text(first.profiles[1]);
  const std::string descriptor_after_first = read_text(config.wg_conf);
  const size_t commands_first = runner.commands.size();

  testLog->startCollecting();
  const Gateway::Result second = run_setup();
  const std::string output = testLog->stopCollecting();

  // PKI and profiles are reused byte for byte
  ASSERT_EQ(read_text(tmp.path("easy-rsa/pki/ca.crt")), ca);
  ASSERT_EQ(read_text(second.profiles[0]), profile1);
  ASSERT_EQ(read_text(second.profiles[1]), profile2);
  ASSERT_EQ(read_text(config.wg_conf), descriptor_after_first);
  ASSERT_NE(output.find("CA reused"), std::string::npos) << output;
  ASSERT_NE(output.find("peer credential client2 reused"), std::string::npos) << output;
  ASSERT_EQ(output.find("created"), std::string::npos) << output;

  // nothing duplicated
  ASSERT_EQ(runner.rules.size(), 1u);
  ASSERT_EQ(runner.routes["vpnwg"].size(), 1u);
  ASSERT_EQ(runner.iptables_rules(), 4u);
  ASSERT_EQ(count_occurrences(read_text(config.rt_tables), "vpnwg"), 1u);
  ASSERT_EQ(runner.count_prefix("ip rule add"), 1u);
  ASSERT_EQ(runner.count_prefix("iptables -w -t nat -A"), 1u);
  ASSERT_GT(runner.commands.size(), commands_first);
}

TEST_F(GatewayTest, HardeningOptions)
{
  config.forward_drop = true;
  config.fail_closed_route = true;
  run_setup();
  run_setup();
  ASSERT_EQ(runner.iptables_rules(), 5u);
  ASSERT_EQ(runner.iptables["filter FORWARD"].back(), "-i tun0 -s 10.8.0.0/24 -j DROP");
  ASSERT_EQ(runner.routes["vpnwg"].size(), 2u);
}

TEST_F(GatewayTest, MissingHostChangesNothing)
{
  config.public_host.clear();
  ASSERT_EQ(error_type_of([&]() { run_setup(); }), Error::CONFIG_MISSING);
  ASSERT_TRUE(runner.commands.empty());
  ASSERT_FALSE(dir_exists(config.pki_dir));
  ASSERT_FALSE(file_exists(config.rt_tables));
  ASSERT_EQ(read_text(config.wg_conf), descriptor);
}

TEST_F(GatewayTest, MissingDescriptorChangesNothing)
{
  config.wg_conf = tmp.path("wireguard/absent.conf");
  ASSERT_EQ(error_type_of([&]() { run_setup(); }), Error::CONFIG_FILE_MISSING);
  ASSERT_TRUE(runner.commands.empty());
  ASSERT_FALSE(dir_exists(config.pki_dir));
}

TEST_F(GatewayTest, FailureStopsLaterSteps)
{
  runner.fail("sysctl", 255);
  ASSERT_EQ(error_type_of([&]() { run_setup(); }), Error::SYSCTL_ERROR);
  ASSERT_FALSE(dir_exists(config.pki_dir));
  ASSERT_EQ(runner.count_prefix("iptables"), 0u);
}

TEST_F(GatewayTest, FirewallFailure)
{
  runner.fail("iptables -w -t nat", 3);
  ASSERT_EQ(error_type_of([&]() { run_setup(); }), Error::FIREWALL_ERROR);
  ASSERT_FALSE(file_exists(tmp.path("vpn-data/client1.ovpn")));
}

TEST_F(GatewayTest, ServerConfigFromSettings)
{
  config.port = 443;
  config.proto = "tcp";
  config.dns.clear();
  Gateway gateway(config, runner);
  const std::string text = gateway.server_config().render();
  ASSERT_NE(text.find("port 443\nproto tcp\ndev tun0\n"), std::string::npos);
  ASSERT_EQ(text.find("dhcp-option"), std::string::npos);
}
