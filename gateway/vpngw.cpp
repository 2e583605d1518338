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

// vpngw: provision the gateway, then exec the downstream server.

#include <iostream>
#include <string>

#include <vpngw/common/process.hpp>
#include <vpngw/error/excode.hpp>
#include <vpngw/gateway/config.hpp>
#include <vpngw/gateway/gateway.hpp>
#include <vpngw/netconf/cmdrunner.hpp>
#include <vpngw/log/log.hpp>

using namespace vpngw;

int main(int argc, char *argv[])
{
  int ret = 0;

  LogBaseSimple log;
  Log::Context log_context(&log);

  try {
    GatewayConfig config;
    config.parse_command_line(argc, argv);
    if (config.help)
      {
	GatewayConfig::print_usage(std::cout);
	return 0;
      }

    Environ env;
    env.load_from_environ();
    config.load_environ(env);

    if (config.verbose)
      Log::threshold() = Log::L_VERB;

    ProcessCommandRunner runner;
    Gateway gateway(config, runner);
    const Gateway::Result res = gateway.setup();
    if (config.launch)
      gateway.launch_server(res);
    else
      VPNGW_LOG_INFO("--no-launch given, not starting the server");
  }
  catch (const GatewayConfig::usage&)
    {
      GatewayConfig::print_usage(std::cout);
      ret = 2;
    }
  catch (const ErrorCode& e)
    {
      VPNGW_LOG_ERROR(e.to_string());
      ret = 1;
    }
  catch (const std::exception& e)
    {
      VPNGW_LOG_ERROR("exception: " << e.what());
      ret = 1;
    }
  return ret;
}
