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

// Bring up the upstream WireGuard interface from a wg-quick style
// descriptor, without ever letting it install a default route or
// change the host's DNS configuration.

#ifndef VPNGW_WG_UPSTREAM_H
#define VPNGW_WG_UPSTREAM_H

#include <string>

#include <vpngw/common/file.hpp>
#include <vpngw/common/string.hpp>
#include <vpngw/common/tempfile.hpp>
#include <vpngw/common/process.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/netconf/cmdrunner.hpp>
#include <vpngw/netconf/iproute.hpp>
#include <vpngw/wg/wgconf.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  class UpstreamTunnel
  {
  public:
    UpstreamTunnel(CommandRunner& runner_arg,
		   IPRoute2& ip_arg,
		   const std::string& wg_path_arg,
		   const std::string& dev_arg,
		   const std::string& tmp_dir_arg = "/tmp")
      : runner(runner_arg),
	ip(ip_arg),
	wg_path(wg_path_arg),
	dev(dev_arg),
	tmp_dir(tmp_dir_arg)
    {
    }

    // Read and parse the descriptor without changing anything
    static WgConfig load_descriptor(const std::string& descriptor_path)
    {
      if (!file_exists(descriptor_path))
	VPNGW_THROW_CODE(CONFIG_FILE_MISSING, "upstream descriptor not found: " << descriptor_path);
      std::string text;
      try {
	text = read_text(descriptor_path);
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(CONFIG_FILE_MISSING, "cannot read upstream descriptor: " << e.what());
	}
      return WgConfig::parse(text, descriptor_path);
    }

    // Make sure the descriptor on disk carries "Table = off".  The
    // file is only rewritten when something had to change.
    static bool ensure_descriptor_table_off(const std::string& descriptor_path)
    {
      const std::string text = read_text(descriptor_path);
      bool changed = false;
      const std::string fixed = WgConfig::ensure_table_off(text, changed);
      if (!changed)
	{
	  VPNGW_LOG_INFO("upstream descriptor " << descriptor_path << " already has Table = off");
	  return false;
	}
      VPNGW_LOG_WARN("upstream descriptor " << descriptor_path << " lacks Table = off, adding it");
      try {
	write_string(descriptor_path, fixed, file_mode(descriptor_path));
      }
      catch (const std::exception& e)
	{
	  VPNGW_THROW_CODE(IFACE_CONFIG, "cannot rewrite upstream descriptor: " << e.what());
	}
      return true;
    }

    // Returns the name of the interface that is now up
    std::string bring_up(const std::string& descriptor_path)
    {
      load_descriptor(descriptor_path);
      ensure_descriptor_table_off(descriptor_path);
      const WgConfig conf = load_descriptor(descriptor_path);

      VPNGW_LOG_INFO("bringing up upstream interface " << dev);

      // a stale interface from an earlier run is recreated
      if (ip.link_delete(dev) == 0)
	VPNGW_LOG_INFO("removed existing interface " << dev);

      if (ip.link_add(dev, "wireguard") != 0)
	VPNGW_THROW_CODE(IFACE_CREATE, "cannot create wireguard interface " << dev);

      setconf(conf);

      unsigned int n_addr = 0;
      for (const auto &addr : conf.addresses)
	{
	  if (ip.addr_add(addr, dev) == 0)
	    ++n_addr;
	  else
	    VPNGW_LOG_WARN("cannot assign address " << addr << " to " << dev);
	}
      if (!n_addr)
	VPNGW_THROW_CODE(IFACE_ADDRESS, "no address could be assigned to " << dev);

      if (conf.mtu && ip.link_set_mtu(dev, conf.mtu) != 0)
	VPNGW_LOG_WARN("cannot set MTU " << conf.mtu << " on " << dev);

      if (ip.link_set_up(dev) != 0)
	VPNGW_THROW_CODE(IFACE_CONFIG, "cannot bring up " << dev);

      if (!conf.dns.empty())
	VPNGW_LOG_INFO("DNS servers of upstream descriptor not applied: " << string::join(conf.dns, ", "));

      diagnostics();
      VPNGW_LOG_INFO("upstream interface " << dev << " is up");
      return dev;
    }

  private:
    void setconf(const WgConfig& conf)
    {
      try {
	TempFile tmp(tmp_dir + "/vpngw-wg-XXXXXX", true);
	tmp.write(conf.render_setconf());
	tmp.close_file();

	Argv argv;
	argv.push_back(wg_path);
	argv.push_back("setconf");
	argv.push_back(dev);
	argv.push_back(tmp.filename());
	if (runner.run(argv) != 0)
	  VPNGW_THROW_CODE(IFACE_CONFIG, "wg setconf failed on " << dev);
      }
      catch (const TempFile::tempfile_exception& e)
	{
	  VPNGW_THROW_CODE(IFACE_CONFIG, "cannot stage wireguard config: " << e.what());
	}
    }

    void diagnostics()
    {
      std::string out;
      if (ip.addr_show(dev, out) == 0)
	VPNGW_LOG_VERB(out);
      Argv argv;
      argv.push_back(wg_path);
      argv.push_back("show");
      argv.push_back(dev);
      if (runner.run(argv, &out) == 0)
	VPNGW_LOG_VERB(out);
    }

    CommandRunner& runner;
    IPRoute2& ip;
    std::string wg_path;
    std::string dev;
    std::string tmp_dir;
  };

}

#endif
