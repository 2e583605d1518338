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

#ifndef VPNGW_SERVER_LAUNCH_H
#define VPNGW_SERVER_LAUNCH_H

#include <string>

#include <vpngw/common/process.hpp>
#include <vpngw/common/file.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/log/log.hpp>

namespace vpngw {

  inline Argv server_argv(const std::string& openvpn_path, const std::string& config_path)
  {
    Argv argv;
    argv.push_back(openvpn_path);
    argv.push_back("--config");
    argv.push_back(config_path);
    return argv;
  }

  // Replace this process with the downstream server.  Only returns
  // by throwing LAUNCH_ERROR.
  inline void launch(const std::string& openvpn_path, const std::string& config_path)
  {
    if (!file_exists(openvpn_path))
      VPNGW_THROW_CODE(LAUNCH_ERROR, "server binary not found: " << openvpn_path);
    const Argv argv = server_argv(openvpn_path, config_path);
    VPNGW_LOG_INFO("starting downstream server: " << argv.to_string());
    try {
      exec_replace(argv);
    }
    catch (const exec_error& e)
      {
	VPNGW_THROW_CODE(LAUNCH_ERROR, e.what());
      }
  }

}

#endif
