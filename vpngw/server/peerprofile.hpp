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

// Self-contained .ovpn connection profiles for downstream peers,
// with the CA certificate, the peer credential and the tls-auth key
// inlined.

#ifndef VPNGW_SERVER_PEERPROFILE_H
#define VPNGW_SERVER_PEERPROFILE_H

#include <string>
#include <sstream>

#include <vpngw/common/file.hpp>
#include <vpngw/common/path.hpp>
#include <vpngw/common/writeprivate.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/pki/credstore.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class PeerProfile
  {
  public:
    struct Params
    {
      std::string host;
      unsigned int port = 1194;
      std::string proto = "udp";
      std::string cipher = "AES-256-GCM";
      std::string auth = "SHA256";
      std::string tls_version_min = "1.2";

      // 0 to omit; the defaults leave room for a 1280 byte WireGuard MTU
      unsigned int tun_mtu = 1200;
      unsigned int mssfix = 1160;
    };

    PeerProfile(const CredentialStore& store_arg, const std::string& profile_dir_arg)
      : store(store_arg),
	profile_dir(profile_dir_arg)
    {
    }

    std::string profile_path(const std::string& peer_name) const
    {
      return path::join(profile_dir, peer_name + ".ovpn");
    }

    static std::string render(const Params& p,
			      const std::string& ca,
			      const std::string& cert,
			      const std::string& key,
			      const std::string& tls_auth)
    {
      std::ostringstream os;
      os << "client\n";
      os << "dev tun\n";
      os << "proto " << p.proto << '\n';
      os << "remote " << p.host << ' ' << p.port << '\n';
      os << "resolv-retry infinite\n";
      os << "nobind\n";
      os << "persist-key\n";
      os << "persist-tun\n";
      os << '\n';
      os << "cipher " << p.cipher << '\n';
      os << "auth " << p.auth << '\n';
      os << "remote-cert-tls server\n";
      os << "tls-version-min " << p.tls_version_min << '\n';
      os << "key-direction 1\n";
      os << '\n';
      if (p.tun_mtu || p.mssfix)
	{
	  if (p.tun_mtu)
	    os << "tun-mtu " << p.tun_mtu << '\n';
	  if (p.mssfix)
	    os << "mssfix " << p.mssfix << '\n';
	  os << '\n';
	}
      os << "verb 3\n";
      inline_block(os, "ca", ca);
      inline_block(os, "cert", cert);
      inline_block(os, "key", key);
      inline_block(os, "tls-auth", tls_auth);
      return os.str();
    }

    std::string write_peer_profile(const std::string& peer_name, const Params& p) const
    {
      std::string ca, cert, key, tls_auth;
      try {
	const Credential ca_cred = store.ca();
	const Credential peer = store.issued(peer_name);
	ca = read_text(ca_cred.cert_path);
	cert = read_text(peer.cert_path);
	key = read_text(peer.key_path);
	tls_auth = read_text(store.tls_auth_key());
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(PROFILE_ERROR, "profile for '" << peer_name << "': " << e.what());
	}

      const std::string fn = profile_path(peer_name);
      try {
	make_dirs(profile_dir);
	write_private(fn, render(p, ca, cert, key, tls_auth));
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(PROFILE_ERROR, "cannot write " << fn << ": " << e.what());
	}
      VPNGW_LOG_INFO("peer profile for " << peer_name << " written to " << fn);
      return fn;
    }

  private:
    static void inline_block(std::ostream& os, const char *tag, std::string content)
    {
      while (!content.empty() && (content.back() == '\n' || content.back() == '\r'))
	content.pop_back();
      os << "\n<" << tag << ">\n" << content << "\n</" << tag << ">\n";
    }

    const CredentialStore& store;
    std::string profile_dir;
  };

}

#endif
