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

#ifndef VPNGW_COMMON_OUTCOME_H
#define VPNGW_COMMON_OUTCOME_H

namespace vpngw {
  namespace Outcome {
    // result of an idempotent ensure operation
    enum Type {
      CREATED,
      REUSED,
    };

    inline const char *name(const Type type)
    {
      switch (type)
	{
	case CREATED:
	  return "created";
	case REUSED:
	  return "reused";
	default:
	  return "?";
	}
    }
  }
}

#endif
