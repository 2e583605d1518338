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

#include <vpngw/common/path.hpp>

using namespace vpngw;

TEST(Path, Basename)
{
  ASSERT_EQ(path::basename("/sbin/ip"), "ip");
  ASSERT_EQ(path::basename("ip"), "ip");
  ASSERT_EQ(path::basename("/etc/openvpn/"), "");
}

TEST(Path, Dirname)
{
  ASSERT_EQ(path::dirname("/etc/openvpn/easy-rsa/pki"), "/etc/openvpn/easy-rsa");
  ASSERT_EQ(path::dirname("/vpn-data"), "/");
  ASSERT_EQ(path::dirname("ta.key"), "");
}

TEST(Path, Join)
{
  ASSERT_EQ(path::join("/etc/openvpn/server", "server.conf"), "/etc/openvpn/server/server.conf");
  ASSERT_EQ(path::join("/etc/openvpn/server/", "server.conf"), "/etc/openvpn/server/server.conf");
  ASSERT_EQ(path::join("/ignored", "/abs/file"), "/abs/file");
  ASSERT_EQ(path::join("", "file"), "file");
  ASSERT_EQ(path::join("/pki", "private", "ca.key"), "/pki/private/ca.key");
}

TEST(Path, IsFlat)
{
  ASSERT_TRUE(path::is_flat("client1"));
  ASSERT_FALSE(path::is_flat("../client1"));
  ASSERT_FALSE(path::is_flat(".."));
  ASSERT_FALSE(path::is_flat(""));
}
