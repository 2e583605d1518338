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

// Issue X.509 v3 certificates: a self-signed root CA, and leaf
// certificates signed by that CA from a signing request.

#ifndef VPNGW_OPENSSL_PKI_X509GEN_H
#define VPNGW_OPENSSL_PKI_X509GEN_H

#include <string>

#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/bn.h>
#include <openssl/asn1.h>

#include <vpngw/openssl/util/error.hpp>
#include <vpngw/openssl/pki/pkey.hpp>
#include <vpngw/openssl/pki/x509.hpp>
#include <vpngw/openssl/pki/x509req.hpp>

namespace vpngw {
  namespace OpenSSLPKI {
    namespace X509Gen {

      enum Usage {
	CA,
	SERVER,
	CLIENT,
      };

      // random positive serial number of up to 128 bits
      inline void set_random_serial(::X509 *cert)
      {
	BIGNUM *bn = BN_new();
	if (!bn)
	  throw OpenSSLException("X509Gen: BN_new");
	if (BN_rand(bn, 127, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1
	    || !BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(cert)))
	  {
	    BN_free(bn);
	    throw OpenSSLException("X509Gen: serial number");
	  }
	BN_free(bn);
      }

      inline void add_ext(::X509 *cert, ::X509 *issuer, const int nid, const std::string& value)
      {
	X509V3_CTX ctx;
	X509V3_set_ctx_nodb(&ctx);
	X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
	X509_EXTENSION *ext = X509V3_EXT_nconf_nid(nullptr, &ctx, nid, value.c_str());
	if (!ext)
	  throw OpenSSLException("X509Gen: extension " + value);
	const int ret = X509_add_ext(cert, ext, -1);
	X509_EXTENSION_free(ext);
	if (ret != 1)
	  throw OpenSSLException("X509Gen: X509_add_ext " + value);
      }

      inline void add_usage_ext(::X509 *cert, ::X509 *issuer, const Usage usage, const std::string& common_name)
      {
	switch (usage)
	  {
	  case CA:
	    add_ext(cert, issuer, NID_basic_constraints, "critical,CA:TRUE");
	    add_ext(cert, issuer, NID_key_usage, "cRLSign,keyCertSign");
	    break;
	  case SERVER:
	    add_ext(cert, issuer, NID_basic_constraints, "CA:FALSE");
	    add_ext(cert, issuer, NID_key_usage, "digitalSignature,keyEncipherment");
	    add_ext(cert, issuer, NID_ext_key_usage, "serverAuth");
	    add_ext(cert, issuer, NID_subject_alt_name, "DNS:" + common_name);
	    break;
	  case CLIENT:
	    add_ext(cert, issuer, NID_basic_constraints, "CA:FALSE");
	    add_ext(cert, issuer, NID_key_usage, "digitalSignature");
	    add_ext(cert, issuer, NID_ext_key_usage, "clientAuth");
	    break;
	  }
	add_ext(cert, issuer, NID_subject_key_identifier, "hash");
	if (usage == CA)
	  add_ext(cert, issuer, NID_authority_key_identifier, "keyid:always");
	else
	  add_ext(cert, issuer, NID_authority_key_identifier, "keyid,issuer:always");
      }

      inline void set_validity(::X509 *cert, const unsigned int days)
      {
	if (!X509_gmtime_adj(X509_getm_notBefore(cert), 0)
	    || !X509_time_adj_ex(X509_getm_notAfter(cert), int(days), 0, nullptr))
	  throw OpenSSLException("X509Gen: validity");
      }

      inline X509 self_signed_ca(const PKey& pkey,
				 const std::string& common_name,
				 const unsigned int days)
      {
	X509 ret(X509_new());
	::X509 *cert = ret.obj();
	if (!cert)
	  throw OpenSSLException("X509Gen::self_signed_ca: X509_new");

	X509_NAME *name = X509_get_subject_name(cert);
	if (X509_set_version(cert, 2) != 1
	    || X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
					  reinterpret_cast<const unsigned char *>(common_name.c_str()),
					  -1, -1, 0) != 1
	    || X509_set_issuer_name(cert, name) != 1
	    || X509_set_pubkey(cert, pkey.obj()) != 1)
	  throw OpenSSLException("X509Gen::self_signed_ca: " + common_name);
	set_random_serial(cert);
	set_validity(cert, days);
	add_usage_ext(cert, cert, CA, common_name);
	if (X509_sign(cert, pkey.obj(), EVP_sha256()) <= 0)
	  throw OpenSSLException("X509Gen::self_signed_ca: X509_sign");
	return ret;
      }

      inline X509 sign_request(const X509Req& req,
			       const X509& ca_cert,
			       const PKey& ca_key,
			       const Usage usage,
			       const unsigned int days)
      {
	if (!req.verify())
	  throw OpenSSLException("X509Gen::sign_request: request signature does not verify");

	X509 ret(X509_new());
	::X509 *cert = ret.obj();
	if (!cert)
	  throw OpenSSLException("X509Gen::sign_request: X509_new");

	X509_NAME *subject = X509_REQ_get_subject_name(req.obj());
	EVP_PKEY *pub = X509_REQ_get0_pubkey(req.obj());
	if (X509_set_version(cert, 2) != 1
	    || X509_set_subject_name(cert, subject) != 1
	    || X509_set_issuer_name(cert, X509_get_subject_name(ca_cert.obj())) != 1
	    || !pub
	    || X509_set_pubkey(cert, pub) != 1)
	  throw OpenSSLException("X509Gen::sign_request");

	std::string common_name;
	{
	  char buf[256];
	  const int len = X509_NAME_get_text_by_NID(subject, NID_commonName, buf, sizeof(buf));
	  if (len > 0)
	    common_name.assign(buf, len);
	}

	set_random_serial(cert);
	set_validity(cert, days);
	add_usage_ext(cert, ca_cert.obj(), usage, common_name);
	if (X509_sign(cert, ca_key.obj(), EVP_sha256()) <= 0)
	  throw OpenSSLException("X509Gen::sign_request: X509_sign");
	return ret;
      }

    }
  }
}

#endif
