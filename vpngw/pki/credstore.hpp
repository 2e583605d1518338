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

// Persistent certificate authority and credential store.
//
// The on-disk layout is that of an Easy-RSA 3 PKI directory, so an
// existing volume initialized by Easy-RSA is picked up as is:
//
//   <pki_dir>/ca.crt
//   <pki_dir>/private/ca.key
//   <pki_dir>/private/<name>.key
//   <pki_dir>/reqs/<name>.req
//   <pki_dir>/issued/<name>.crt
//
// Material is created once and reused on every later run.  Nothing
// is ever deleted.

#ifndef VPNGW_PKI_CREDSTORE_H
#define VPNGW_PKI_CREDSTORE_H

#include <string>

#include <openssl/x509.h>
#include <openssl/err.h>

#include <vpngw/common/file.hpp>
#include <vpngw/common/path.hpp>
#include <vpngw/common/writeprivate.hpp>
#include <vpngw/common/outcome.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/openssl/util/error.hpp>
#include <vpngw/openssl/pki/pkey.hpp>
#include <vpngw/openssl/pki/x509.hpp>
#include <vpngw/openssl/pki/x509req.hpp>
#include <vpngw/openssl/pki/x509gen.hpp>
#include <vpngw/crypto/static_key.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  struct Credential
  {
    std::string key_path;
    std::string cert_path; // empty for the tls-auth key
  };

  struct Provisioned
  {
    Credential cred;
    Outcome::Type outcome;
  };

  class CredentialStore
  {
  public:
    struct Config
    {
      std::string pki_dir;
      std::string tls_auth_key;       // empty: <pki_dir>/../ta.key
      std::string ca_common_name = "vpngw CA";
      unsigned int key_bits = 2048;
      unsigned int ca_days = 3650;
      unsigned int leaf_days = 825;
    };

    explicit CredentialStore(const Config& config_arg)
      : config(config_arg)
    {
      if (config.tls_auth_key.empty())
	config.tls_auth_key = path::join(path::dirname(config.pki_dir), "ta.key");
    }

    // flat file name usable as certificate CN, other than "ca"
    static bool is_valid_name(const std::string& name)
    {
      if (name.empty() || name.length() > 64 || name == "." || name == ".." || name == "ca")
	return false;
      for (const auto c : name)
	{
	  if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
		|| c == '_' || c == '.' || c == '-'))
	    return false;
	}
      return true;
    }

    std::string ca_cert_path() const { return path::join(config.pki_dir, "ca.crt"); }
    std::string ca_key_path() const { return path::join(config.pki_dir, "private", "ca.key"); }
    std::string key_path(const std::string& name) const { return path::join(config.pki_dir, "private", name + ".key"); }
    std::string req_path(const std::string& name) const { return path::join(config.pki_dir, "reqs", name + ".req"); }
    std::string cert_path(const std::string& name) const { return path::join(config.pki_dir, "issued", name + ".crt"); }
    const std::string& tls_auth_key_path() const { return config.tls_auth_key; }

    Provisioned ensure_ca()
    {
      Provisioned ret;
      ret.cred.key_path = ca_key_path();
      ret.cred.cert_path = ca_cert_path();
      try {
	if (file_exists(ret.cred.cert_path))
	  {
	    if (!file_exists(ret.cred.key_path))
	      VPNGW_THROW_CODE(PKI_ERROR, "inconsistent PKI: " << ret.cred.cert_path << " exists but " << ret.cred.key_path << " is missing");
	    load_ca();
	    ret.outcome = Outcome::REUSED;
	  }
	else
	  {
	    if (file_exists(ret.cred.key_path))
	      VPNGW_LOG_WARN("CA key " << ret.cred.key_path << " has no certificate, regenerating it");
	    init_dirs();
	    ca_key = OpenSSLPKI::PKey::generate_rsa(config.key_bits);
	    ca_cert = OpenSSLPKI::X509Gen::self_signed_ca(ca_key, config.ca_common_name, config.ca_days);
	    write_private(ret.cred.key_path, ca_key.render_pem());
	    write_string(ret.cred.cert_path, ca_cert.render_pem());
	    ret.outcome = Outcome::CREATED;
	  }
      }
      catch (const ErrorCode&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(PKI_ERROR, "CA: " << e.what());
	}
      VPNGW_LOG_INFO("CA " << Outcome::name(ret.outcome) << " (" << ret.cred.cert_path << ')');
      return ret;
    }

    Provisioned ensure_server_credential(const std::string& name)
    {
      return ensure_leaf(name, OpenSSLPKI::X509Gen::SERVER, "server");
    }

    Provisioned ensure_peer_credential(const std::string& name)
    {
      return ensure_leaf(name, OpenSSLPKI::X509Gen::CLIENT, "peer");
    }

    // the pre-authentication (tls-auth) secret
    Provisioned ensure_tls_auth_key()
    {
      Provisioned ret;
      ret.cred.key_path = config.tls_auth_key;
      try {
	if (file_exists(ret.cred.key_path))
	  {
	    OpenVPNStaticKey key;
	    key.parse(read_text(ret.cred.key_path));
	    ret.outcome = Outcome::REUSED;
	  }
	else
	  {
	    OpenVPNStaticKey key;
	    key.generate();
	    make_dirs(path::dirname(ret.cred.key_path), 0700);
	    write_private(ret.cred.key_path, key.render());
	    ret.outcome = Outcome::CREATED;
	  }
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(PKI_ERROR, "tls-auth key " << ret.cred.key_path << ": " << e.what());
	}
      VPNGW_LOG_INFO("tls-auth key " << Outcome::name(ret.outcome) << " (" << ret.cred.key_path << ')');
      return ret;
    }

    // Lookups of existing material, throwing PKI_ERROR if absent

    Credential ca() const
    {
      Credential c;
      c.key_path = ca_key_path();
      c.cert_path = ca_cert_path();
      if (!file_exists(c.cert_path))
	VPNGW_THROW_CODE(PKI_ERROR, "CA certificate not found: " << c.cert_path);
      return c;
    }

    Credential issued(const std::string& name) const
    {
      Credential c;
      c.key_path = key_path(name);
      c.cert_path = cert_path(name);
      if (!file_exists(c.cert_path) || !file_exists(c.key_path))
	VPNGW_THROW_CODE(PKI_ERROR, "no credential issued for '" << name << '\'');
      return c;
    }

    std::string tls_auth_key() const
    {
      if (!file_exists(config.tls_auth_key))
	VPNGW_THROW_CODE(PKI_ERROR, "tls-auth key not found: " << config.tls_auth_key);
      return config.tls_auth_key;
    }

  private:
    void init_dirs()
    {
      make_dirs(config.pki_dir, 0700);
      make_dir(path::join(config.pki_dir, "private"), 0700);
      make_dir(path::join(config.pki_dir, "reqs"), 0755);
      make_dir(path::join(config.pki_dir, "issued"), 0755);
    }

    void load_ca()
    {
      if (ca_cert.defined() && ca_key.defined())
	return;
      ca_key.parse_pem(read_text(ca_key_path()), ca_key_path());
      ca_cert.parse_pem(read_text(ca_cert_path()));
      if (X509_check_private_key(ca_cert.obj(), ca_key.obj()) != 1)
	VPNGW_THROW_CODE(PKI_ERROR, "inconsistent PKI: " << ca_key_path() << " does not match " << ca_cert_path());
    }

    // cert must be signed by the loaded CA and carry the public half of key
    bool issued_by_ca(const OpenSSLPKI::X509& cert, const OpenSSLPKI::PKey& key) const
    {
      const bool ok = X509_verify(cert.obj(), X509_get0_pubkey(ca_cert.obj())) == 1
	&& X509_check_private_key(cert.obj(), key.obj()) == 1;
      ERR_clear_error();
      return ok;
    }

    Provisioned ensure_leaf(const std::string& name,
			    const OpenSSLPKI::X509Gen::Usage usage,
			    const char *title)
    {
      if (!is_valid_name(name))
	VPNGW_THROW_CODE(PKI_ERROR, "bad " << title << " credential name '" << name << '\'');

      Provisioned ret;
      ret.cred.key_path = key_path(name);
      ret.cred.cert_path = cert_path(name);
      try {
	bool reuse = false;
	if (file_exists(ret.cred.cert_path))
	  {
	    if (!file_exists(ret.cred.key_path))
	      VPNGW_THROW_CODE(PKI_ERROR, "inconsistent PKI: " << ret.cred.cert_path << " exists but " << ret.cred.key_path << " is missing");
	    const OpenSSLPKI::X509 cert(read_text(ret.cred.cert_path));
	    const OpenSSLPKI::PKey key(read_text(ret.cred.key_path), ret.cred.key_path);
	    load_ca();
	    reuse = issued_by_ca(cert, key);
	    if (!reuse)
	      VPNGW_LOG_WARN(title << " certificate " << ret.cred.cert_path << " was not issued by the current CA for its key, reissuing it");
	  }
	else if (file_exists(ret.cred.key_path))
	  VPNGW_LOG_WARN(title << " key " << ret.cred.key_path << " has no certificate, regenerating it");

	if (reuse)
	  ret.outcome = Outcome::REUSED;
	else
	  {
	    load_ca();
	    init_dirs();
	    const OpenSSLPKI::PKey key = OpenSSLPKI::PKey::generate_rsa(config.key_bits);
	    const OpenSSLPKI::X509Req req = OpenSSLPKI::X509Req::generate(key, name);
	    write_private(ret.cred.key_path, key.render_pem());
	    write_string(req_path(name), req.render_pem());
	    const OpenSSLPKI::X509 cert = OpenSSLPKI::X509Gen::sign_request(req, ca_cert, ca_key, usage, config.leaf_days);
	    write_string(ret.cred.cert_path, cert.render_pem());
	    ret.outcome = Outcome::CREATED;
	  }
      }
      catch (const ErrorCode&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(PKI_ERROR, title << " credential '" << name << "': " << e.what());
	}
      VPNGW_LOG_INFO(title << " credential " << name << ' ' << Outcome::name(ret.outcome) << " (" << ret.cred.cert_path << ')');
      return ret;
    }

    Config config;
    OpenSSLPKI::PKey ca_key;
    OpenSSLPKI::X509 ca_cert;
  };

}

#endif
