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

// The iproute2 routing table registry, binding numeric table ids
// to names.  Entries are only ever appended, never removed or renamed.

#ifndef VPNGW_NETCONF_RTTABLES_H
#define VPNGW_NETCONF_RTTABLES_H

#include <cstdint>
#include <string>
#include <vector>

#include <vpngw/common/file.hpp>
#include <vpngw/common/path.hpp>
#include <vpngw/common/string.hpp>
#include <vpngw/common/number.hpp>
#include <vpngw/common/splitlines.hpp>
#include <vpngw/common/outcome.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class RtTables
  {
  public:
    struct Entry
    {
      std::uint32_t id;
      std::string name;
    };

    // If path does not exist but fallback does (distributions that
    // ship the defaults under /usr/share/iproute2), the defaults are
    // copied into path before our entry is appended, so that the
    // built-in names are not shadowed.
    RtTables(const std::string& path_arg,
	     const std::string& fallback_arg = "/usr/share/iproute2/rt_tables")
      : path_(path_arg),
	fallback(fallback_arg)
    {
    }

    const std::string& path() const
    {
      return path_;
    }

    static std::vector<Entry> parse(const std::string& text)
    {
      std::vector<Entry> ret;
      SplitLines in(text);
      while (in())
	{
	  std::string line = in.line_ref();
	  const size_t hash = line.find('#');
	  if (hash != std::string::npos)
	    line.resize(hash);
	  const std::vector<std::string> tok = string::split_by_space(line);
	  if (tok.size() < 2)
	    continue;
	  Entry e;
	  if (!parse_mark(tok[0], e.id))
	    continue;
	  e.name = tok[1];
	  ret.push_back(std::move(e));
	}
      return ret;
    }

    // Reuse an existing "<id> <name>" binding or append one.  Throws
    // ROUTING_ERROR if either the id or the name is already bound to
    // something else.
    Outcome::Type ensure(const std::uint32_t id, const std::string& name)
    {
      std::string text;
      try {
	if (file_exists(path_))
	  text = read_text(path_);
	else if (!fallback.empty() && file_exists(fallback))
	  text = read_text(fallback);
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(ROUTING_ERROR, "cannot read routing table registry: " << e.what());
	}

      for (const auto &e : parse(text))
	{
	  if (e.id == id && e.name == name)
	    {
	      VPNGW_LOG_INFO("routing table " << id << ' ' << name << " reused (" << path_ << ')');
	      return Outcome::REUSED;
	    }
	  if (e.id == id)
	    VPNGW_THROW_CODE(ROUTING_ERROR, "routing table id " << id << " is already bound to '" << e.name << "' in " << path_);
	  if (e.name == name)
	    VPNGW_THROW_CODE(ROUTING_ERROR, "routing table name '" << name << "' is already bound to id " << e.id << " in " << path_);
	}

      if (!text.empty() && !string::ends_with_newline(text))
	text += '\n';
      text += std::to_string(id) + ' ' + name + '\n';

      try {
	make_dirs(path::dirname(path_));
	write_string(path_, text);
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(ROUTING_ERROR, "cannot update routing table registry: " << e.what());
	}
      VPNGW_LOG_INFO("routing table " << id << ' ' << name << " created (" << path_ << ')');
      return Outcome::CREATED;
    }

  private:
    std::string path_;
    std::string fallback;
  };

}

#endif
