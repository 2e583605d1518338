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

// Wrap an OpenSSL X509 object

#ifndef VPNGW_OPENSSL_PKI_X509_H
#define VPNGW_OPENSSL_PKI_X509_H

#include <string>

#include <openssl/x509.h>
#include <openssl/pem.h>

#include <vpngw/openssl/util/error.hpp>
#include <vpngw/openssl/util/bio.hpp>

namespace vpngw {
  namespace OpenSSLPKI {

    class X509
    {
    public:
      X509() : x509_(nullptr) {}

      // takes ownership
      explicit X509(::X509 *x509) : x509_(x509) {}

      explicit X509(const std::string& cert_txt)
	: x509_(nullptr)
      {
	parse_pem(cert_txt);
      }

      X509(const X509& other)
	: x509_(nullptr)
      {
	assign(other.x509_);
      }

      X509& operator=(const X509& other)
      {
	if (this != &other)
	  assign(other.x509_);
	return *this;
      }

      bool defined() const { return x509_ != nullptr; }
      ::X509* obj() const { return x509_; }

      void parse_pem(const std::string& cert_txt)
      {
	ScopedBIO bio(cert_txt);
	::X509 *cert = PEM_read_bio_X509(bio.obj(), nullptr, nullptr, nullptr);
	if (!cert)
	  throw OpenSSLException("X509::parse_pem");

	erase();
	x509_ = cert;
      }

      std::string render_pem() const
      {
	if (x509_)
	  {
	    ScopedBIO bio;
	    if (PEM_write_bio_X509(bio.obj(), x509_) == 0)
	      throw OpenSSLException("X509::render_pem");
	    return bio.contents();
	  }
	else
	  return "";
      }

      std::string subject_cn() const
      {
	if (!x509_)
	  return "";
	char buf[256];
	const int len = X509_NAME_get_text_by_NID(X509_get_subject_name(x509_), NID_commonName, buf, sizeof(buf));
	if (len < 0)
	  return "";
	return std::string(buf, len);
      }

      void erase()
      {
	if (x509_)
	  {
	    X509_free(x509_);
	    x509_ = nullptr;
	  }
      }

      ~X509()
      {
	erase();
      }

    private:
      void assign(::X509 *x509)
      {
	erase();
	if (x509 && X509_up_ref(x509) == 1)
	  x509_ = x509;
      }

      ::X509 *x509_;
    };
  }
} // namespace vpngw

#endif // VPNGW_OPENSSL_PKI_X509_H
