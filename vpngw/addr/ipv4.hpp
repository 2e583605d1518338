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

#ifndef VPNGW_ADDR_IPV4_H
#define VPNGW_ADDR_IPV4_H

#include <cstdint>
#include <string>
#include <ostream>

#include <boost/asio.hpp>

#include <vpngw/common/exception.hpp>

namespace vpngw {
  namespace IPv4 {

    VPNGW_EXCEPTION(ipv4_exception);

    // An IPv4 address in host byte order.
    class Addr
    {
    public:
      enum { SIZE=32 };

      Addr()
	: u(0)
      {
      }

      static Addr from_uint32(const std::uint32_t addr)
      {
	Addr ret;
	ret.u = addr;
	return ret;
      }

      static Addr from_string(const std::string& ipstr, const char *title = nullptr)
      {
	boost::system::error_code ec;
	const boost::asio::ip::address_v4 a = boost::asio::ip::make_address_v4(ipstr, ec);
	if (ec)
	  {
	    if (!title)
	      title = "ipv4";
	    VPNGW_THROW(ipv4_exception, title << ": error parsing IPv4 address '" << ipstr << "' : " << ec.message());
	  }
	return from_uint32(a.to_uint());
      }

      static bool is_valid(const std::string& ipstr)
      {
	boost::system::error_code ec;
	boost::asio::ip::make_address_v4(ipstr, ec);
	return !ec;
      }

      static Addr netmask_from_prefix_len(const unsigned int prefix_len)
      {
	if (prefix_len > SIZE)
	  throw ipv4_exception("bad prefix len");
	return from_uint32(prefix_len ? ~std::uint32_t(0) << (SIZE - prefix_len) : 0);
      }

      std::string to_string() const
      {
	return boost::asio::ip::address_v4(u).to_string();
      }

      std::uint32_t to_uint32() const
      {
	return u;
      }

      Addr operator&(const Addr& other) const
      {
	return from_uint32(u & other.u);
      }

      bool operator==(const Addr& other) const
      {
	return u == other.u;
      }

      bool operator!=(const Addr& other) const
      {
	return u != other.u;
      }

    private:
      std::uint32_t u;
    };

    inline std::ostream& operator<<(std::ostream& os, const Addr& addr)
    {
      return os << addr.to_string();
    }

    // An IPv4 network in CIDR notation, such as 10.8.0.0/24
    struct Route
    {
      Route()
	: prefix_len(0)
      {
      }

      Route(const Addr& addr_arg, const unsigned int prefix_len_arg)
	: addr(addr_arg),
	  prefix_len(prefix_len_arg)
      {
      }

      static Route from_string(const std::string& rtstr, const char *title = nullptr)
      {
	if (!title)
	  title = "route";
	Route r;
	const size_t slash = rtstr.find('/');
	if (slash == std::string::npos)
	  {
	    r.addr = Addr::from_string(rtstr, title);
	    r.prefix_len = Addr::SIZE;
	    return r;
	  }
	r.addr = Addr::from_string(rtstr.substr(0, slash), title);
	const std::string pl = rtstr.substr(slash + 1);
	if (pl.empty() || pl.length() > 2 || pl.find_first_not_of("0123456789") != std::string::npos)
	  VPNGW_THROW(ipv4_exception, title << ": bad prefix length in '" << rtstr << '\'');
	r.prefix_len = std::stoul(pl);
	if (r.prefix_len > Addr::SIZE)
	  VPNGW_THROW(ipv4_exception, title << ": prefix length out of range in '" << rtstr << '\'');
	return r;
      }

      Addr netmask() const
      {
	return Addr::netmask_from_prefix_len(prefix_len);
      }

      // no host bits set below the prefix
      bool is_canonical() const
      {
	return (addr & netmask()) == addr;
      }

      bool contains(const Addr& a) const
      {
	return (a & netmask()) == addr;
      }

      std::string to_string() const
      {
	return addr.to_string() + '/' + std::to_string(prefix_len);
      }

      Addr addr;
      unsigned int prefix_len;
    };

    inline std::ostream& operator<<(std::ostream& os, const Route& r)
    {
      return os << r.to_string();
    }
  }
}

#endif
