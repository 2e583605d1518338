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

// Define gateway error codes and a method to convert them to a string representation

#ifndef VPNGW_ERROR_ERROR_H
#define VPNGW_ERROR_ERROR_H

#include <cstddef>

namespace vpngw {
  namespace Error {

    enum Type {
      SUCCESS=0,            // no error
      CONFIG_MISSING,       // required configuration value not provided
      CONFIG_INVALID,       // configuration value fails validation
      CONFIG_FILE_MISSING,  // upstream tunnel descriptor not found
      DESCRIPTOR_MALFORMED, // upstream tunnel descriptor cannot be parsed
      PKI_ERROR,            // CA or credential generation/loading failed
      IFACE_CREATE,         // error creating upstream tunnel interface
      IFACE_CONFIG,         // error configuring or enabling upstream interface
      IFACE_ADDRESS,        // no address could be assigned to upstream interface
      SYSCTL_ERROR,         // kernel parameter could not be set
      ROUTING_ERROR,        // routing table, rule or route could not be ensured
      FIREWALL_ERROR,       // packet filter rule could not be checked or added
      SERVER_CONFIG_ERROR,  // downstream server configuration could not be written
      PROFILE_ERROR,        // peer profile could not be rendered or written
      LAUNCH_ERROR,         // downstream server could not be started

      N_ERRORS,

      // undefined error
      UNDEF=SUCCESS,
    };

    inline const char *name(const size_t type)
    {
      static const char *names[] = {
	"SUCCESS",
	"CONFIG_MISSING",
	"CONFIG_INVALID",
	"CONFIG_FILE_MISSING",
	"DESCRIPTOR_MALFORMED",
	"PKI_ERROR",
	"IFACE_CREATE",
	"IFACE_CONFIG",
	"IFACE_ADDRESS",
	"SYSCTL_ERROR",
	"ROUTING_ERROR",
	"FIREWALL_ERROR",
	"SERVER_CONFIG_ERROR",
	"PROFILE_ERROR",
	"LAUNCH_ERROR",
      };

      static_assert(N_ERRORS == sizeof(names) / sizeof(names[0]), "error names array inconsistency");
      if (type < N_ERRORS)
	return names[type];
      else
	return "UNKNOWN_ERROR_TYPE";
    }
  }
} // namespace vpngw

#endif // VPNGW_ERROR_ERROR_H
