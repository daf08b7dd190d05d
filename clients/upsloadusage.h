/* upsloadusage.h - usage readings and run settings of the upsload tool

   Copyright (C) 2026  upsload developers

   This program is free software; you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation; either version 2 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
*/

#ifndef UPSLOADUSAGE_HPP_SEEN
#define UPSLOADUSAGE_HPP_SEEN

#include "upsloadclient.h"
#include "upsload/upsloadconf.hpp"

#include <string>

namespace upsload
{

/** Usage data item */
typedef enum {
	USAGE_VOLTAGE_IN,
	USAGE_VOLTAGE_OUT,
	USAGE_CURRENT_OUT,
	USAGE_POWER,
} usage_type_t;

/**
 * Usage type of a command line alias ("vin", "pwr"...).
 * \return false for an unknown alias, \a type is then untouched
 */
bool parseUsageType(const std::string& str, usage_type_t& type);

/** NUT variable holding a usage item */
const char* usageVariable(usage_type_t type);

/**
 * Read a numeric variable.
 * \throw UpsloadException when the value is not a number
 */
double getNumber(Client& client, const std::string& ups, const std::string& name);

/**
 * Real output power in watts.
 * Reported by the UPS when it can, computed from the output voltage
 * and current otherwise, on the same connection.
 */
double getPower(Client& client, const std::string& ups);

/**
 * Line printed for a usage item: the raw value, or "power: <W> W" with
 * two decimals.
 */
std::string readUsage(Client& client, const std::string& ups, usage_type_t type);

/**
 * Settings given on the command line, unset when not given.
 */
struct SettingOverrides
{
	Settable<std::string> server;
	Settable<std::string> port;
	Settable<std::string> ups;
	Settable<std::string> username;
	Settable<std::string> password;
	Settable<std::string> timeout;
};

/**
 * Settings of one run.
 */
struct RunSettings
{
	std::string ups;
	ClientConfig client;
};

/**
 * Resolve the run settings: built-in defaults, then the configuration
 * global scope, then the UPS section, then the command line.
 * \throw std::invalid_argument on a bad port or timeout, or no UPS name
 */
RunSettings resolveSettings(const UpsloadConfiguration& conf, const SettingOverrides& overrides);

} /* namespace upsload */

#endif	/* UPSLOADUSAGE_HPP_SEEN */
