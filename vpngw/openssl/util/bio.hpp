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

#ifndef VPNGW_OPENSSL_UTIL_BIO_H
#define VPNGW_OPENSSL_UTIL_BIO_H

#include <string>

#include <openssl/bio.h>

#include <vpngw/openssl/util/error.hpp>

namespace vpngw {
  namespace OpenSSLPKI {

    // Owns a BIO for the duration of a PEM read or write
    class ScopedBIO
    {
      ScopedBIO(const ScopedBIO&) = delete;
      ScopedBIO& operator=(const ScopedBIO&) = delete;

    public:
      // memory sink
      ScopedBIO()
	: bio(BIO_new(BIO_s_mem()))
      {
	if (!bio)
	  throw OpenSSLException("BIO_new");
      }

      // read-only memory source, txt must outlive this object
      explicit ScopedBIO(const std::string& txt)
	: bio(BIO_new_mem_buf(txt.c_str(), int(txt.length())))
      {
	if (!bio)
	  throw OpenSSLException("BIO_new_mem_buf");
      }

      ~ScopedBIO()
      {
	BIO_free(bio);
      }

      BIO* obj() const { return bio; }

      std::string contents() const
      {
	char *temp;
	const long buf_len = BIO_get_mem_data(bio, &temp);
	return std::string(temp, buf_len);
      }

    private:
      BIO *bio;
    };

  }
}

#endif
