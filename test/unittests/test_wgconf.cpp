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

#include <vpngw/wg/wgconf.hpp>

using namespace vpngw;

namespace {
  const std::string descriptor =
    "# upstream provider\n"
    "[Interface]\n"
    "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
    "Address = 10.2.0.2/32, fd00::2/128\n"
    "DNS = 10.2.0.1\n"
    "MTU = 1280\n"
    "\n"
    "[Peer]\n"
    "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
    "PresharedKey = 6x3gVxt0yH0g7S8pP6Zc0j4xL3r8s8yM7m0w2y0t1nE=\n"
    "AllowedIPs = 0.0.0.0/0\n"
    "AllowedIPs = ::/0\n"
    "Endpoint = 198.51.100.7:51820\n"
    "PersistentKeepalive = 25\n";
}

TEST(WgConfig, Parse)
{
  const WgConfig c = WgConfig::parse(descriptor, "wg0.conf");
  ASSERT_EQ(c.private_key, "yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=");
  ASSERT_EQ(c.addresses, (std::vector<std::string>{"10.2.0.2/32", "fd00::2/128"}));
  ASSERT_EQ(c.dns, (std::vector<std::string>{"10.2.0.1"}));
  ASSERT_EQ(c.mtu, 1280u);
  ASSERT_FALSE(c.table_off());
  ASSERT_EQ(c.peers.size(), 1u);
  ASSERT_EQ(c.peers[0].public_key, "xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=");
  ASSERT_EQ(c.peers[0].allowed_ips, (std::vector<std::string>{"0.0.0.0/0", "::/0"}));
  ASSERT_EQ(c.peers[0].endpoint, "198.51.100.7:51820");
  ASSERT_EQ(c.peers[0].persistent_keepalive, "25");
}

TEST(WgConfig, KeysAreCaseInsensitive)
{
  const WgConfig c = WgConfig::parse("[interface]\nprivatekey=k\nTABLE=Off\n[PEER]\npublickey=p\n", "t");
  ASSERT_EQ(c.private_key, "k");
  ASSERT_TRUE(c.table_off());
  ASSERT_EQ(c.peers.at(0).public_key, "p");
}

TEST(WgConfig, Malformed)
{
  const std::vector<std::string> bad = {
    "PrivateKey = k\n[Interface]\n[Peer]\nPublicKey = p\n",       // key outside a section
    "[Interface]\nPrivateKey k\n[Peer]\nPublicKey = p\n",         // no '='
    "[Peer]\nPublicKey = p\n",                                     // no [Interface]
    "[Interface]\nAddress = 10.0.0.1/32\n[Peer]\nPublicKey = p\n", // no PrivateKey
    "[Interface]\nPrivateKey = k\n",                               // no [Peer]
    "[Interface]\nPrivateKey = k\n[Peer]\nEndpoint = 1.2.3.4:1\n", // peer without PublicKey
    "[Interface]\nPrivateKey = k\nMTU = big\n[Peer]\nPublicKey = p\n",
    "[Interface]\nPrivateKey = k\n[Bogus]\n[Peer]\nPublicKey = p\n",
  };
  for (const auto &text : bad)
    ASSERT_EQ(error_type_of([&]() { WgConfig::parse(text, "t"); }), Error::DESCRIPTOR_MALFORMED) << text;
}

TEST(WgConfig, TableOffInsertedAtEndOfInterface)
{
  bool changed = false;
  const std::string out = WgConfig::ensure_table_off(descriptor, changed);
  ASSERT_TRUE(changed);
  ASSERT_NE(out.find("MTU = 1280\nTable = off\n\n[Peer]\n"), std::string::npos) << out;
  ASSERT_TRUE(WgConfig::parse(out, "t").table_off());

  // applying it again changes nothing
  bool changed2 = true;
  const std::string out2 = WgConfig::ensure_table_off(out, changed2);
  ASSERT_FALSE(changed2);
  ASSERT_EQ(out, out2);
}

TEST(WgConfig, TableOffAtEndOfFile)
{
  bool changed = false;
  const std::string out = WgConfig::ensure_table_off("[Peer]\nPublicKey = p\n[Interface]\nPrivateKey = k", changed);
  ASSERT_TRUE(changed);
  ASSERT_EQ(out, "[Peer]\nPublicKey = p\n[Interface]\nPrivateKey = k\nTable = off\n");
}

TEST(WgConfig, TableValueRewritten)
{
  bool changed = false;
  const std::string out = WgConfig::ensure_table_off("[Interface]\nPrivateKey = k\nTable = 51820\n[Peer]\nPublicKey = p\n", changed);
  ASSERT_TRUE(changed);
  ASSERT_EQ(out, "[Interface]\nPrivateKey = k\nTable = off\n[Peer]\nPublicKey = p\n");
}

TEST(WgConfig, TableOffPresentLeavesTextAlone)
{
  const std::string text = "[Interface]\r\nPrivateKey = k\r\ntable = off # keep\r\n[Peer]\r\nPublicKey = p";
  bool changed = true;
  ASSERT_EQ(WgConfig::ensure_table_off(text, changed), text);
  ASSERT_FALSE(changed);
}

TEST(WgConfig, RenderSetconf)
{
  const WgConfig c = WgConfig::parse(descriptor, "t");
  const std::string out = c.render_setconf();
  ASSERT_EQ(out,
	    "[Interface]\n"
	    "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
	    "\n"
	    "[Peer]\n"
	    "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
	    "PresharedKey = 6x3gVxt0yH0g7S8pP6Zc0j4xL3r8s8yM7m0w2y0t1nE=\n"
	    "AllowedIPs = 0.0.0.0/0, ::/0\n"
	    "Endpoint = 198.51.100.7:51820\n"
	    "PersistentKeepalive = 25\n");
  // wg-quick only keys are stripped
  ASSERT_EQ(out.find("Address"), std::string::npos);
  ASSERT_EQ(out.find("DNS"), std::string::npos);
  ASSERT_EQ(out.find("MTU"), std::string::npos);
}
