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

#include <vpngw/server/serverconf.hpp>
#include <vpngw/server/launch.hpp>

using namespace vpngw;

TEST(ServerConfig, RenderDefaults)
{
  ServerConfig conf;
  conf.ca = "/etc/openvpn/server/ca.crt";
  conf.cert = "/etc/openvpn/server/server.crt";
  conf.key = "/etc/openvpn/server/server.key";
  conf.tls_auth = "/etc/openvpn/server/ta.key";
  conf.dns = {"1.1.1.1", "1.0.0.1"};

  const std::string expected =
    "port 1194\n"
    "proto udp\n"
    "dev tun0\n"
    "\n"
    "user nobody\n"
    "group nogroup\n"
    "\n"
    "ca /etc/openvpn/server/ca.crt\n"
    "cert /etc/openvpn/server/server.crt\n"
    "key /etc/openvpn/server/server.key\n"
    "dh none\n"
    "\n"
    "tls-auth /etc/openvpn/server/ta.key 0\n"
    "cipher AES-256-GCM\n"
    "auth SHA256\n"
    "tls-version-min 1.2\n"
    "\n"
    "server 10.8.0.0 255.255.255.0\n"
    "topology subnet\n"
    "\n"
    "push \"redirect-gateway def1 bypass-dhcp\"\n"
    "push \"dhcp-option DNS 1.1.1.1\"\n"
    "push \"dhcp-option DNS 1.0.0.1\"\n"
    "\n"
    "keepalive 10 120\n"
    "persist-key\n"
    "persist-tun\n"
    "\n"
    "verb 3\n"
    "status /var/log/openvpn-status.log\n"
    "log-append /var/log/openvpn.log\n";
  ASSERT_EQ(conf.render(), expected);
}

TEST(ServerConfig, RenderVariations)
{
  ServerConfig conf;
  conf.port = 443;
  conf.proto = "tcp";
  conf.subnet = IPv4::Route::from_string("172.30.0.0/16");
  conf.user.clear();
  conf.group.clear();
  conf.status.clear();
  const std::string out = conf.render();
  ASSERT_NE(out.find("port 443\nproto tcp\n"), std::string::npos);
  ASSERT_NE(out.find("server 172.30.0.0 255.255.0.0\n"), std::string::npos);
  ASSERT_EQ(out.find("user "), std::string::npos);
  ASSERT_EQ(out.find("status "), std::string::npos);
  ASSERT_EQ(out.find("dhcp-option"), std::string::npos);
  ASSERT_NE(out.find("log-append "), std::string::npos);
}

class StageTest : public testing::Test
{
protected:
  StageTest()
  {
    config.pki_dir = tmp.path("easy-rsa/pki");
    config.key_bits = 1024;
  }

  TempDir tmp;
  CredentialStore::Config config;
};

TEST_F(StageTest, StageAndWrite)
{
  CredentialStore store(config);
  store.ensure_ca();
  store.ensure_server_credential("server");
  store.ensure_tls_auth_key();

  const std::string server_dir = tmp.path("server");
  ServerConfig conf;
  stage_credentials(store, "server", server_dir, conf);
  ASSERT_EQ(conf.ca, server_dir + "/ca.crt");
  ASSERT_EQ(conf.key, server_dir + "/server.key");
  ASSERT_EQ(read_text(conf.ca), read_text(store.ca_cert_path()));
  ASSERT_EQ(read_text(conf.cert), read_text(store.cert_path("server")));
  ASSERT_EQ(read_text(conf.key), read_text(store.key_path("server")));
  ASSERT_EQ(read_text(conf.tls_auth), read_text(store.tls_auth_key_path()));
  ASSERT_EQ(mode_of(conf.key), mode_t(0600));
  ASSERT_EQ(mode_of(conf.tls_auth), mode_t(0600));
  ASSERT_EQ(mode_of(conf.ca), mode_t(0644));

  // staging again overwrites in place
  stage_credentials(store, "server", server_dir, conf);
  ASSERT_EQ(read_text(conf.key), read_text(store.key_path("server")));

  const std::string fn = write_server_config(conf, server_dir + "/server.conf");
  const std::string text = read_text(fn);
  ASSERT_NE(text.find("key " + server_dir + "/server.key\n"), std::string::npos);
  ASSERT_NE(text.find("tls-auth " + server_dir + "/ta.key 0\n"), std::string::npos);
  ASSERT_EQ(text, conf.render());
}

TEST_F(StageTest, StagedKeysTightenExistingFiles)
{
  CredentialStore store(config);
  store.ensure_ca();
  store.ensure_server_credential("server");
  store.ensure_tls_auth_key();

  const std::string server_dir = tmp.path("server");
  make_dirs(server_dir);
  write_string(server_dir + "/server.key", "old\n", 0644);
  write_string(server_dir + "/ta.key", "old\n", 0666);
  ASSERT_EQ(::chmod((server_dir + "/ta.key").c_str(), 0666), 0);

  ServerConfig conf;
  stage_credentials(store, "server", server_dir, conf);
  ASSERT_EQ(mode_of(conf.key), mode_t(0600));
  ASSERT_EQ(mode_of(conf.tls_auth), mode_t(0600));
  ASSERT_EQ(read_text(conf.key), read_text(store.key_path("server")));
  ASSERT_EQ(read_text(conf.tls_auth), read_text(store.tls_auth_key_path()));
}

TEST_F(StageTest, MissingServerCredential)
{
  CredentialStore store(config);
  store.ensure_ca();
  store.ensure_tls_auth_key();
  ServerConfig conf;
  ASSERT_NE(error_type_of([&]() { stage_credentials(store, "server", tmp.path("server"), conf); }),
	    Error::SUCCESS);
  ASSERT_FALSE(file_exists(tmp.path("server/server.key")));
}

TEST_F(StageTest, UnwritableConfig)
{
  write_string(tmp.path("blocker"), "x");
  ServerConfig conf;
  ASSERT_EQ(error_type_of([&]() { write_server_config(conf, tmp.path("blocker/server.conf")); }),
	    Error::SERVER_CONFIG_ERROR);
}

TEST(Launch, Argv)
{
  ASSERT_EQ(server_argv("/usr/sbin/openvpn", "/etc/openvpn/server/server.conf").to_string(),
	    "/usr/sbin/openvpn --config /etc/openvpn/server/server.conf");
}

TEST(Launch, MissingBinary)
{
  ASSERT_EQ(error_type_of([]() { launch("/nonexistent/openvpn", "/tmp/server.conf"); }),
	    Error::LAUNCH_ERROR);
}
