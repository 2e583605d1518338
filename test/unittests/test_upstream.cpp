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

#include <vpngw/wg/upstream.hpp>

using namespace vpngw;

namespace {
  const std::string descriptor =
    "[Interface]\n"
    "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
    "Address = 10.66.0.2/32, fd00:66::2/128\n"
    "DNS = 10.66.0.1\n"
    "MTU = 1280\n"
    "\n"
    "[Peer]\n"
    "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
    "AllowedIPs = 0.0.0.0/0\n"
    "Endpoint = 192.0.2.10:51820\n";
}

class UpstreamTest : public testing::Test
{
protected:
  UpstreamTest()
    : ip(runner, "/sbin/ip"),
      tunnel(runner, ip, "/usr/bin/wg", "wg0", tmp.path())
  {
    conf = tmp.path("wg0.conf");
  }

  TempDir tmp;
  FakeRunner runner;
  IPRoute2 ip;
  UpstreamTunnel tunnel;
  std::string conf;
};

TEST_F(UpstreamTest, CommandOrder)
{
  write_string(conf, descriptor, 0600);
  ASSERT_EQ(tunnel.bring_up(conf), "wg0");

  ASSERT_GE(runner.commands.size(), 7u);
  ASSERT_EQ(runner.commands[0], "ip link del dev wg0");
  ASSERT_EQ(runner.commands[1], "ip link add wg0 type wireguard");
  ASSERT_TRUE(string::starts_with(runner.commands[2], "wg setconf wg0 " + tmp.path() + "/vpngw-wg-"));
  ASSERT_EQ(runner.commands[3], "ip address add 10.66.0.2/32 dev wg0");
  ASSERT_EQ(runner.commands[4], "ip address add fd00:66::2/128 dev wg0");
  ASSERT_EQ(runner.commands[5], "ip link set mtu 1280 dev wg0");
  ASSERT_EQ(runner.commands[6], "ip link set up dev wg0");

  const FakeRunner::Link& link = runner.links["wg0"];
  ASSERT_EQ(link.type, "wireguard");
  ASSERT_TRUE(link.up);
  ASSERT_EQ(link.mtu, 1280u);

  // the kernel config carries no wg-quick only keys
  ASSERT_NE(link.setconf.find("PrivateKey = yAnz5TF"), std::string::npos);
  ASSERT_NE(link.setconf.find("Endpoint = 192.0.2.10:51820"), std::string::npos);
  ASSERT_EQ(link.setconf.find("Address"), std::string::npos);
  ASSERT_EQ(link.setconf.find("DNS"), std::string::npos);
  ASSERT_EQ(link.setconf.find("Table"), std::string::npos);

  // nothing touched routes or DNS
  ASSERT_EQ(runner.count_prefix("ip route"), 0u);
  ASSERT_EQ(runner.count_prefix("resolvconf"), 0u);
}

TEST_F(UpstreamTest, TableOffWrittenOnce)
{
  write_string(conf, descriptor, 0640);
  testLog->startCollecting();
  tunnel.bring_up(conf);
  const std::string first_log = testLog->stopCollecting();
  const std::string rewritten = read_text(conf);
  ASSERT_NE(rewritten.find("MTU = 1280\nTable = off\n"), std::string::npos);
  ASSERT_EQ(mode_of(conf), mode_t(0640));
  ASSERT_NE(first_log.find("[WARN]"), std::string::npos);

  testLog->startCollecting();
  tunnel.bring_up(conf);
  const std::string second_log = testLog->stopCollecting();
  ASSERT_EQ(read_text(conf), rewritten);
  ASSERT_EQ(second_log.find("[WARN]"), std::string::npos) << second_log;

  // the stale interface was recreated on the second run
  ASSERT_EQ(runner.count_prefix("ip link add wg0"), 2u);
  ASSERT_EQ(runner.links["wg0"].addresses.size(), 2u);
}

TEST_F(UpstreamTest, MissingDescriptor)
{
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::CONFIG_FILE_MISSING);
  ASSERT_TRUE(runner.commands.empty());
}

TEST_F(UpstreamTest, MalformedDescriptor)
{
  write_string(conf, "[Interface]\nAddress = 10.66.0.2/32\n");
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::DESCRIPTOR_MALFORMED);
  ASSERT_TRUE(runner.commands.empty());
  // a descriptor that cannot be parsed is never rewritten
  ASSERT_EQ(read_text(conf), "[Interface]\nAddress = 10.66.0.2/32\n");
}

TEST_F(UpstreamTest, LinkAddFailure)
{
  write_string(conf, descriptor);
  runner.fail("ip link add", 2);
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::IFACE_CREATE);
}

TEST_F(UpstreamTest, SetconfFailure)
{
  write_string(conf, descriptor);
  runner.fail("wg setconf", 1);
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::IFACE_CONFIG);
  ASSERT_EQ(runner.count_prefix("ip address add"), 0u);
}

TEST_F(UpstreamTest, NoAddressAssigned)
{
  write_string(conf, descriptor);
  runner.fail("ip address add", 2);
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::IFACE_ADDRESS);
  ASSERT_EQ(runner.count_prefix("ip link set up"), 0u);
}

TEST_F(UpstreamTest, PartialAddressesTolerated)
{
  write_string(conf, descriptor);
  runner.fail("ip address add fd00", 2);
  testLog->startCollecting();
  tunnel.bring_up(conf);
  const std::string output = testLog->stopCollecting();
  ASSERT_EQ(runner.links["wg0"].addresses, (std::vector<std::string>{"10.66.0.2/32"}));
  ASSERT_NE(output.find("cannot assign address fd00:66::2/128"), std::string::npos);
}

TEST_F(UpstreamTest, MtuFailureIsOnlyAWarning)
{
  write_string(conf, descriptor);
  runner.fail("ip link set mtu", 2);
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::SUCCESS);
  ASSERT_TRUE(runner.links["wg0"].up);
}

TEST_F(UpstreamTest, LinkUpFailure)
{
  write_string(conf, descriptor);
  runner.fail("ip link set up", 2);
  ASSERT_EQ(error_type_of([&]() { tunnel.bring_up(conf); }), Error::IFACE_CONFIG);
}
