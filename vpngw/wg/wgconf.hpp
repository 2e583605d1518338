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

// Parser for wg-quick(8) style upstream tunnel descriptors.
//
//   [Interface]
//   PrivateKey = ...
//   Address = 10.2.0.2/32
//   DNS = 10.2.0.1
//   Table = off
//
//   [Peer]
//   PublicKey = ...
//   AllowedIPs = 0.0.0.0/0
//   Endpoint = 1.2.3.4:51820

#ifndef VPNGW_WG_WGCONF_H
#define VPNGW_WG_WGCONF_H

#include <string>
#include <vector>

#include <vpngw/common/string.hpp>
#include <vpngw/common/number.hpp>
#include <vpngw/error/excode.hpp>

#define VPNGW_WG_MALFORMED(title, lineno, stuff) \
  VPNGW_THROW_CODE(DESCRIPTOR_MALFORMED, title << ((lineno) ? ":" + std::to_string(lineno) : std::string()) << ": " << stuff)

namespace vpngw {

  class WgConfig
  {
  public:
    struct Peer
    {
      std::string public_key;
      std::string preshared_key;
      std::vector<std::string> allowed_ips;
      std::string endpoint;
      std::string persistent_keepalive;
    };

    // [Interface]
    std::string private_key;
    std::string listen_port;
    std::string fwmark;
    std::string table;
    std::vector<std::string> addresses;
    std::vector<std::string> dns;
    unsigned int mtu = 0; // 0 if not given

    std::vector<Peer> peers;

    bool table_off() const
    {
      return string::strcasecmp(table, "off") == 0;
    }

    static WgConfig parse(const std::string& text, const std::string& title)
    {
      enum Section {
	NONE,
	INTERFACE,
	PEER,
      };

      WgConfig ret;
      Section section = NONE;
      bool have_interface = false;
      std::vector<Line> lines = split_lines(text);
      for (size_t i = 0; i < lines.size(); ++i)
	{
	  const Line& l = lines[i];
	  const unsigned int lineno = i + 1;
	  if (l.type == Line::BLANK)
	    continue;
	  if (l.type == Line::SECTION)
	    {
	      if (string::strcasecmp(l.key, "interface") == 0)
		{
		  if (have_interface)
		    VPNGW_WG_MALFORMED(title, lineno, "duplicate [Interface] section");
		  have_interface = true;
		  section = INTERFACE;
		}
	      else if (string::strcasecmp(l.key, "peer") == 0)
		{
		  ret.peers.emplace_back();
		  section = PEER;
		}
	      else
		VPNGW_WG_MALFORMED(title, lineno, "unknown section [" << l.key << ']');
	      continue;
	    }
	  if (l.type == Line::INVALID)
	    VPNGW_WG_MALFORMED(title, lineno, "expected Key = Value");
	  if (section == NONE)
	    VPNGW_WG_MALFORMED(title, lineno, "key '" << l.key << "' outside of a section");

	  const std::string key = string::to_lower_copy(l.key);
	  if (section == INTERFACE)
	    {
	      if (key == "privatekey")
		ret.private_key = l.value;
	      else if (key == "listenport")
		ret.listen_port = l.value;
	      else if (key == "fwmark")
		ret.fwmark = l.value;
	      else if (key == "table")
		ret.table = l.value;
	      else if (key == "address")
		append_list(ret.addresses, l.value);
	      else if (key == "dns")
		append_list(ret.dns, l.value);
	      else if (key == "mtu")
		{
		  if (!parse_number_validate<unsigned int>(l.value, 5, 576, 65535, &ret.mtu))
		    VPNGW_WG_MALFORMED(title, lineno, "bad MTU '" << l.value << '\'');
		}
	      // other wg-quick keys (PreUp, PostUp, SaveConfig, ...) are not used
	    }
	  else
	    {
	      Peer& p = ret.peers.back();
	      if (key == "publickey")
		p.public_key = l.value;
	      else if (key == "presharedkey")
		p.preshared_key = l.value;
	      else if (key == "allowedips")
		append_list(p.allowed_ips, l.value);
	      else if (key == "endpoint")
		p.endpoint = l.value;
	      else if (key == "persistentkeepalive")
		p.persistent_keepalive = l.value;
	    }
	}

      if (!have_interface)
	VPNGW_WG_MALFORMED(title, 0, "no [Interface] section");
      if (ret.private_key.empty())
	VPNGW_WG_MALFORMED(title, 0, "[Interface] has no PrivateKey");
      if (ret.peers.empty())
	VPNGW_WG_MALFORMED(title, 0, "no [Peer] section");
      for (size_t i = 0; i < ret.peers.size(); ++i)
	{
	  if (ret.peers[i].public_key.empty())
	    VPNGW_WG_MALFORMED(title, 0, "[Peer] #" << (i + 1) << " has no PublicKey");
	}
      return ret;
    }

    // Return text with "Table = off" in the first [Interface]
    // section, so that the interface never installs routes of its
    // own.  A Table line with another value is rewritten, otherwise
    // the line is inserted after the last setting of the section.
    // Lines are otherwise preserved as they are.
    static std::string ensure_table_off(const std::string& text, bool& changed)
    {
      changed = false;
      std::vector<Line> lines = split_lines(text);

      size_t begin = lines.size();
      for (size_t i = 0; i < lines.size(); ++i)
	{
	  if (lines[i].type == Line::SECTION && string::strcasecmp(lines[i].key, "interface") == 0)
	    {
	      begin = i;
	      break;
	    }
	}
      if (begin == lines.size())
	VPNGW_THROW_CODE(DESCRIPTOR_MALFORMED, "no [Interface] section");

      size_t insert_after = begin;
      for (size_t i = begin + 1; i < lines.size() && lines[i].type != Line::SECTION; ++i)
	{
	  Line& l = lines[i];
	  if (l.type != Line::KEYVAL)
	    continue;
	  if (string::strcasecmp(l.key, "table") == 0)
	    {
	      if (string::strcasecmp(l.value, "off") != 0)
		{
		  l.raw = "Table = off";
		  changed = true;
		}
	      return changed ? join_lines(lines) : text;
	    }
	  insert_after = i;
	}

      Line t;
      t.type = Line::KEYVAL;
      t.raw = "Table = off";
      lines.insert(lines.begin() + insert_after + 1, t);
      changed = true;
      return join_lines(lines);
    }

    // The subset understood by "wg setconf", equivalent to the
    // output of "wg-quick strip".
    std::string render_setconf() const
    {
      std::string ret = "[Interface]\n";
      ret += "PrivateKey = " + private_key + '\n';
      if (!listen_port.empty())
	ret += "ListenPort = " + listen_port + '\n';
      if (!fwmark.empty())
	ret += "FwMark = " + fwmark + '\n';
      for (const auto &p : peers)
	{
	  ret += "\n[Peer]\n";
	  ret += "PublicKey = " + p.public_key + '\n';
	  if (!p.preshared_key.empty())
	    ret += "PresharedKey = " + p.preshared_key + '\n';
	  if (!p.allowed_ips.empty())
	    ret += "AllowedIPs = " + string::join(p.allowed_ips, ", ") + '\n';
	  if (!p.endpoint.empty())
	    ret += "Endpoint = " + p.endpoint + '\n';
	  if (!p.persistent_keepalive.empty())
	    ret += "PersistentKeepalive = " + p.persistent_keepalive + '\n';
	}
      return ret;
    }

  private:
    struct Line
    {
      enum Type {
	BLANK,   // empty or comment only
	SECTION,
	KEYVAL,
	INVALID,
      };

      Type type = BLANK;
      std::string raw;
      std::string key;   // section name for SECTION
      std::string value;
    };

    static Line classify(const std::string& raw)
    {
      Line l;
      l.raw = raw;
      std::string s = raw;
      const size_t hash = s.find('#');
      if (hash != std::string::npos)
	s.resize(hash);
      string::trim(s);
      if (s.empty())
	l.type = Line::BLANK;
      else if (s.front() == '[' && s.back() == ']')
	{
	  l.type = Line::SECTION;
	  l.key = string::trim_copy(s.substr(1, s.length() - 2));
	}
      else
	{
	  const size_t eq = s.find('=');
	  if (eq == std::string::npos || eq == 0)
	    l.type = Line::INVALID;
	  else
	    {
	      l.type = Line::KEYVAL;
	      l.key = string::trim_copy(s.substr(0, eq));
	      l.value = string::trim_copy(s.substr(eq + 1));
	    }
	}
      return l;
    }

    static std::vector<Line> split_lines(const std::string& text)
    {
      std::vector<Line> ret;
      std::vector<std::string> raw = string::split(text, '\n');
      if (!raw.empty() && raw.back().empty())
	raw.pop_back();
      for (auto &r : raw)
	{
	  if (!r.empty() && r.back() == '\r')
	    r.pop_back();
	  ret.push_back(classify(r));
	}
      return ret;
    }

    static std::string join_lines(const std::vector<Line>& lines)
    {
      std::string ret;
      for (const auto &l : lines)
	{
	  ret += l.raw;
	  ret += '\n';
	}
      return ret;
    }

    static void append_list(std::vector<std::string>& list, const std::string& value)
    {
      for (auto &item : string::split(value, ','))
	{
	  string::trim(item);
	  if (!item.empty())
	    list.push_back(std::move(item));
	}
    }
  };

}

#endif
