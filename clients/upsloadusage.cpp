/* upsloadusage.cpp - usage readings and run settings of the upsload tool

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

#include "upsloadusage.h"

#include <sstream>
#include <iomanip>
#include <stdexcept>

#include <errno.h>
#include <stdlib.h>

namespace upsload
{

static const struct {
	const char	*alias;
	usage_type_t	type;
} usage_aliases[] = {
	{ "vin",         USAGE_VOLTAGE_IN },
	{ "volt_in",     USAGE_VOLTAGE_IN },
	{ "voltage_in",  USAGE_VOLTAGE_IN },
	{ "vout",        USAGE_VOLTAGE_OUT },
	{ "volt_out",    USAGE_VOLTAGE_OUT },
	{ "voltage_out", USAGE_VOLTAGE_OUT },
	{ "cout",        USAGE_CURRENT_OUT },
	{ "cur_out",     USAGE_CURRENT_OUT },
	{ "current_out", USAGE_CURRENT_OUT },
	{ "pwr",         USAGE_POWER },
	{ "power",       USAGE_POWER },
};

bool parseUsageType(const std::string& str, usage_type_t& type)
{
	for (size_t i = 0; i < sizeof(usage_aliases) / sizeof(usage_aliases[0]); ++i) {
		if (str == usage_aliases[i].alias) {
			type = usage_aliases[i].type;
			return true;
		}
	}
	return false;
}

const char* usageVariable(usage_type_t type)
{
	switch (type) {
		case USAGE_VOLTAGE_IN:
			return "input.voltage";
		case USAGE_VOLTAGE_OUT:
			return "output.voltage";
		case USAGE_CURRENT_OUT:
			return "output.current";
		case USAGE_POWER:
			/* ups.power is apparent power (VA) */
			return "ups.realpower";
	}
	return "";
}

double getNumber(Client& client, const std::string& ups, const std::string& name)
{
	std::string value = client.getVariable(ups, name);

	char	*end = nullptr;
	errno = 0;
	double	res = strtod(value.c_str(), &end);

	if (value.empty() || 0 != errno || nullptr == end || '\0' != *end)
		throw UpsloadException("Variable " + name + " is not numeric: '" + value + "'");

	return res;
}

double getPower(Client& client, const std::string& ups)
{
	try {
		return getNumber(client, ups, usageVariable(USAGE_POWER));
	}
	catch (const ProtocolException& e) {
		if (ServerError::VAR_NOT_SUPPORTED != e.getCode())
			throw;
		upsdebugx(1, "%s: %s not supported, computing it", __func__, usageVariable(USAGE_POWER));
	}

	double voltage = getNumber(client, ups, usageVariable(USAGE_VOLTAGE_OUT));
	double current = getNumber(client, ups, usageVariable(USAGE_CURRENT_OUT));

	return voltage * current;
}

std::string readUsage(Client& client, const std::string& ups, usage_type_t type)
{
	if (USAGE_POWER != type)
		return client.getVariable(ups, usageVariable(type));

	std::ostringstream	line;

	line << "power: " << std::fixed << std::setprecision(2)
		<< getPower(client, ups) << " W";

	return line.str();
}

RunSettings resolveSettings(const UpsloadConfiguration& conf, const SettingOverrides& overrides)
{
	RunSettings	settings;

	settings.ups = overrides.ups.set() ? *overrides.ups : conf.getUpsName().value_or("");
	if (settings.ups.empty())
		throw std::invalid_argument("no UPS name given");

	const std::string& ups = settings.ups;
	Endpoint	defaults;

	std::string	host = conf.getServer(ups).value_or(defaults.getHost());
	uint16_t	port = conf.getPort(ups).value_or(defaults.getPort());
	time_t	timeout = conf.getTimeout(ups).value_or(defaults.getTimeout());
	Credentials	cred;

	cred.username = conf.getUsername(ups).value_or("");
	cred.password = conf.getPassword(ups).value_or("");

	if (overrides.server.set())
		host = *overrides.server;
	if (overrides.port.set())
		port = UpsloadConfiguration::parsePort(*overrides.port);
	if (overrides.timeout.set())
		timeout = UpsloadConfiguration::parseTimeout(*overrides.timeout);
	if (overrides.username.set())
		cred.username = *overrides.username;
	if (overrides.password.set())
		cred.password = *overrides.password;

	settings.client = ClientConfig(Endpoint(host, port, timeout), cred);

	return settings;
}

} /* namespace upsload */
