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

// Wrap an OpenSSL X509_REQ (certificate signing request) object

#ifndef VPNGW_OPENSSL_PKI_X509REQ_H
#define VPNGW_OPENSSL_PKI_X509REQ_H

#include <string>

#include <openssl/x509.h>
#include <openssl/pem.h>

#include <boost/noncopyable.hpp>

#include <vpngw/openssl/util/error.hpp>
#include <vpngw/openssl/util/bio.hpp>
#include <vpngw/openssl/pki/pkey.hpp>

namespace vpngw {
  namespace OpenSSLPKI {

    class X509Req : boost::noncopyable
    {
    public:
      X509Req() : req_(nullptr) {}

      explicit X509Req(const std::string& req_txt)
	: req_(nullptr)
      {
	parse_pem(req_txt);
      }

      X509Req(X509Req&& other) noexcept
	: req_(other.req_)
      {
	other.req_ = nullptr;
      }

      X509Req& operator=(X509Req&& other) noexcept
      {
	if (this != &other)
	  {
	    erase();
	    req_ = other.req_;
	    other.req_ = nullptr;
	  }
	return *this;
      }

      bool defined() const { return req_ != nullptr; }
      X509_REQ* obj() const { return req_; }

      // Build a request for CN=common_name signed by pkey
      static X509Req generate(const PKey& pkey, const std::string& common_name)
      {
	X509Req ret;
	ret.req_ = X509_REQ_new();
	if (!ret.req_)
	  throw OpenSSLException("X509Req::generate: X509_REQ_new");

	X509_NAME *name = X509_REQ_get_subject_name(ret.req_);
	if (X509_REQ_set_version(ret.req_, 0) != 1
	    || X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
					  reinterpret_cast<const unsigned char *>(common_name.c_str()),
					  -1, -1, 0) != 1
	    || X509_REQ_set_pubkey(ret.req_, pkey.obj()) != 1
	    || X509_REQ_sign(ret.req_, pkey.obj(), EVP_sha256()) <= 0)
	  throw OpenSSLException("X509Req::generate: " + common_name);
	return ret;
      }

      // check the self-signature of the request
      bool verify() const
      {
	if (!req_)
	  return false;
	EVP_PKEY *pub = X509_REQ_get0_pubkey(req_);
	return pub && X509_REQ_verify(req_, pub) == 1;
      }

      void parse_pem(const std::string& req_txt)
      {
	ScopedBIO bio(req_txt);
	X509_REQ *req = PEM_read_bio_X509_REQ(bio.obj(), nullptr, nullptr, nullptr);
	if (!req)
	  throw OpenSSLException("X509Req::parse_pem");

	erase();
	req_ = req;
      }

      std::string render_pem() const
      {
	if (req_)
	  {
	    ScopedBIO bio;
	    if (PEM_write_bio_X509_REQ(bio.obj(), req_) == 0)
	      throw OpenSSLException("X509Req::render_pem");
	    return bio.contents();
	  }
	else
	  return "";
      }

      void erase()
      {
	if (req_)
	  {
	    X509_REQ_free(req_);
	    req_ = nullptr;
	  }
      }

      ~X509Req()
      {
	erase();
      }

    private:
      X509_REQ *req_;
    };
  }
}

#endif
