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

// Wrap an OpenSSL EVP_PKEY object

#ifndef VPNGW_OPENSSL_PKI_PKEY_H
#define VPNGW_OPENSSL_PKI_PKEY_H

#include <string>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <vpngw/openssl/util/error.hpp>
#include <vpngw/openssl/util/bio.hpp>

namespace vpngw {
  namespace OpenSSLPKI {

    class PKey
    {
    public:
      PKey() : pkey_(nullptr) {}

      PKey(const std::string& pkey_txt, const std::string& title)
	: pkey_(nullptr)
      {
	parse_pem(pkey_txt, title);
      }

      PKey(const PKey& other)
	: pkey_(nullptr)
      {
	assign(other.pkey_);
      }

      PKey& operator=(const PKey& other)
      {
	if (this != &other)
	  assign(other.pkey_);
	return *this;
      }

      bool defined() const { return pkey_ != nullptr; }
      EVP_PKEY* obj() const { return pkey_; }

      static PKey generate_rsa(const unsigned int bits)
      {
	EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
	if (!ctx)
	  throw OpenSSLException("PKey::generate_rsa: EVP_PKEY_CTX_new_id");
	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_keygen_init(ctx) <= 0
	    || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, int(bits)) <= 0
	    || EVP_PKEY_keygen(ctx, &pkey) <= 0)
	  {
	    EVP_PKEY_CTX_free(ctx);
	    throw OpenSSLException("PKey::generate_rsa");
	  }
	EVP_PKEY_CTX_free(ctx);
	PKey ret;
	ret.pkey_ = pkey;
	return ret;
      }

      void parse_pem(const std::string& pkey_txt, const std::string& title)
      {
	ScopedBIO bio(pkey_txt);
	EVP_PKEY *pkey = PEM_read_bio_PrivateKey(bio.obj(), nullptr, nullptr, nullptr);
	if (!pkey)
	  throw OpenSSLException(std::string("PKey::parse_pem: error in ") + title + std::string(":"));

	erase();
	pkey_ = pkey;
      }

      std::string render_pem() const
      {
	if (pkey_)
	  {
	    ScopedBIO bio;
	    if (PEM_write_bio_PrivateKey(bio.obj(), pkey_, nullptr, nullptr, 0, nullptr, nullptr) == 0)
	      throw OpenSSLException("PKey::render_pem");
	    return bio.contents();
	  }
	else
	  return "";
      }

      void erase()
      {
	if (pkey_)
	  {
	    EVP_PKEY_free(pkey_);
	    pkey_ = nullptr;
	  }
      }

      ~PKey()
      {
	erase();
      }

    private:
      void assign(EVP_PKEY *pkey)
      {
	erase();
	if (pkey && EVP_PKEY_up_ref(pkey) == 1)
	  pkey_ = pkey;
      }

      EVP_PKEY *pkey_;
    };
  }
} // namespace vpngw

#endif // VPNGW_OPENSSL_PKI_PKEY_H
