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

// The OpenVPN static key file format, used for the tls-auth
// pre-authentication secret shared by the server and every peer.

#ifndef VPNGW_CRYPTO_STATIC_KEY_H
#define VPNGW_CRYPTO_STATIC_KEY_H

#include <string>
#include <sstream>
#include <vector>

#include <boost/algorithm/string.hpp>

#include <openssl/rand.h>
#include <openssl/crypto.h>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/hexstr.hpp>
#include <vpngw/openssl/util/error.hpp>

namespace vpngw {

  class OpenVPNStaticKey
  {
    typedef std::vector<unsigned char> key_t;

  public:
    enum {
      KEY_SIZE = 256 // bytes
    };

    VPNGW_SIMPLE_EXCEPTION(static_key_parse_error);
    VPNGW_SIMPLE_EXCEPTION(static_key_bad_size);

    ~OpenVPNStaticKey()
    {
      erase();
    }

    bool defined() const { return key_data_.size() == KEY_SIZE; }

    void generate()
    {
      key_t data(KEY_SIZE);
      if (RAND_bytes(data.data(), KEY_SIZE) != 1)
	throw OpenSSLException("OpenVPNStaticKey::generate: RAND_bytes");
      erase();
      key_data_.swap(data);
    }

    void parse(const std::string& key_text)
    {
      std::stringstream in(key_text);
      key_t data;
      data.reserve(KEY_SIZE);
      std::string line;
      bool in_body = false;
      try {
	while (std::getline(in, line))
	  {
	    boost::trim(line);
	    if (line == static_key_head())
	      in_body = true;
	    else if (line == static_key_foot())
	      in_body = false;
	    else if (in_body)
	      parse_hex(data, line);
	  }
      }
      catch (const parse_hex_error&)
	{
	  throw static_key_parse_error();
	}
      if (in_body || data.size() != KEY_SIZE)
	throw static_key_parse_error();
      erase();
      key_data_.swap(data);
    }

    // same layout as "openvpn --genkey"
    std::string render() const
    {
      if (!defined())
	throw static_key_bad_size();
      std::ostringstream out;
      out << "#\n# 2048 bit OpenVPN static key\n#\n";
      out << static_key_head() << "\n";
      for (size_t i = 0; i < KEY_SIZE; i += 16)
	out << render_hex(key_data_.data() + i, 16) << "\n";
      out << static_key_foot() << "\n";
      return out.str();
    }

  private:
    void erase()
    {
      if (!key_data_.empty())
	OPENSSL_cleanse(key_data_.data(), key_data_.size());
      key_data_.clear();
    }

    static const char *static_key_head()
    {
      return "-----BEGIN OpenVPN Static key V1-----";
    }

    static const char *static_key_foot()
    {
      return "-----END OpenVPN Static key V1-----";
    }

    key_t key_data_;
  };

} // namespace vpngw

#endif // VPNGW_CRYPTO_STATIC_KEY_H
