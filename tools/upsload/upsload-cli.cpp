/*
 *  Copyright (C) 2026  upsload developers
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 */

/*! \file upsload-cli.cpp
    \brief Switch UPS load on/off and read its usage over the NUT protocol
*/

#include "upsload/common.h"
#include "upsload/upsloadconf.hpp"
#include "upsloadclient.h"
#include "upsloadusage.h"

#include <iostream>
#include <list>
#include <vector>
#include <stdexcept>
#include <cstring>
#include <cstdlib>

/** Exit status on bad usage */
#define EXIT_USAGE	2


class Usage {
	private:

	/** Usage text */
	static const char * s_text[];

	/** Private constructor (no instances) */
	Usage() {}

	public:

	/** Print version and usage to stderr */
	static void print(const std::string & bin);

	/** Print version info to stdout */
	static void printVersion(const std::string & bin);

};  // end of class usage


const char * Usage::s_text[] = {
	"    -s, --server <host>         NUT server host name (default " UPSLOAD_DEFAULT_HOST ")",
	"    -p, --port <port>           NUT server TCP port (default 3493)",
	"    -u, --ups-name <name>       Name of the UPS",
	"    -n, --username <user>       NUT user allowed to run instant commands",
	"    -w, --password <pass>       Password of that user",
	"    -t, --timeout <seconds>     Network timeout, negative to wait forever (default 5)",
	"    -c, --config <file>         Read settings from <file>",
	"    -D, --debug                 Raise debugging level, the first one shows network traffic",
	"    -h, --help                  Display this help and exit",
	"    -V, --version               Display tool version on stdout and exit",
	"",
	"COMMANDS:",
	"    load-on                     Turn load on",
	"    load-off                    Turn load off",
	"    usage <type>...             Print usage data, <type> is one of:",
	"                                  vin, volt_in, voltage_in      input voltage",
	"                                  vout, volt_out, voltage_out   output voltage",
	"                                  cout, cur_out, current_out    output current",
	"                                  pwr, power                    output real power (W)",
	"",
};


void Usage::printVersion(const std::string & bin) {
	std::cout
		<< bin << " " << UPSLOAD_VERSION << std::endl;
}

/**
 * Print help text (including version info) to stderr
 */
void Usage::print(const std::string & bin) {
	std::cerr
		<< bin << " " << UPSLOAD_VERSION << std::endl
		<< std::endl
		<< "Usage: " << bin << " [OPTIONS] <COMMAND>" << std::endl
		<< std::endl
		<< "OPTIONS:" << std::endl;

	for (size_t i = 0; i < sizeof(s_text) / sizeof(char *); ++i) {
		std::cerr << s_text[i] << std::endl;
	}
}


/** Command line options */
class Options: public upsload::SettingOverrides {
	public:

	/** Arguments of the command */
	typedef std::list<std::string> Arguments;

	upsload::Settable<std::string> config;

	/** -D count */
	int debug;

	bool help;
	bool version;

	/** load-on, load-off or usage */
	std::string command;
	Arguments args;

	/** Options are valid */
	bool valid;
	/** Why they are not */
	std::string error;

	Options(char * const argv[], int argc);

	private:

	/**
	 *  \brief  Option value setter
	 *
	 *  \param  opt  Option name, as given
	 *  \param  val  Value holder
	 *  \param  arg  Value
	 */
	void set(const std::string & opt, upsload::Settable<std::string> & val, const std::string & arg);

};  // end of class Options


void Options::set(const std::string & opt, upsload::Settable<std::string> & val, const std::string & arg) {
	if (val.set()) {
		error = "Option " + opt + " given more than once";
		valid = false;
	}
	val = arg;
}


Options::Options(char * const argv[], int argc):
	debug(0), help(false), version(false), valid(true)
{
	bool opts_end = false;

	for (int i = 1; i < argc && valid; ++i) {
		std::string arg(argv[i]);

		if (opts_end || arg.empty() || '-' != arg[0] || 1 == arg.size()) {
			if (command.empty())
				command = arg;
			else
				args.push_back(arg);
			continue;
		}

		if ("--" == arg) {
			opts_end = true;
			continue;
		}

		// Flags
		if ("-h" == arg || "--help" == arg) {
			help = true;
			continue;
		}
		if ("-V" == arg || "--version" == arg) {
			version = true;
			continue;
		}
		if ("-D" == arg || "--debug" == arg) {
			++debug;
			continue;
		}
		if (arg.find_first_not_of('D', 1) == std::string::npos) {
			/* -DD... */
			debug += static_cast<int>(arg.size() - 1);
			continue;
		}

		// Options with a value, "--opt=value" accepted too
		std::string opt = arg, val;
		bool has_val = false;
		size_t eq = arg.find('=');
		if (0 == arg.compare(0, 2, "--") && eq != std::string::npos) {
			opt = arg.substr(0, eq);
			val = arg.substr(eq + 1);
			has_val = true;
		}

		upsload::Settable<std::string> * dest = nullptr;

		if ("-s" == opt || "--server" == opt)
			dest = &server;
		else if ("-p" == opt || "--port" == opt)
			dest = &port;
		else if ("-u" == opt || "--ups-name" == opt)
			dest = &ups;
		else if ("-n" == opt || "--username" == opt)
			dest = &username;
		else if ("-w" == opt || "--password" == opt)
			dest = &password;
		else if ("-t" == opt || "--timeout" == opt)
			dest = &timeout;
		else if ("-c" == opt || "--config" == opt)
			dest = &config;

		if (nullptr == dest) {
			error = "Unknown option " + opt;
			valid = false;
			break;
		}

		if (!has_val) {
			if (i + 1 >= argc) {
				error = "Option " + opt + " requires an argument";
				valid = false;
				break;
			}
			val = argv[++i];
		}

		set(opt, *dest, val);
	}
}


static int mainx(int argc, char * const argv[]) {
	const char	*prog = strrchr(argv[0], '/') ? strrchr(argv[0], '/') + 1 : argv[0];

	upsload_set_progname(prog);

	// Get options
	Options options(argv, argc);

	if (options.help) {
		Usage::print(prog);
		return 0;
	}

	if (options.version) {
		Usage::printVersion(prog);
		return 0;
	}

	if (!options.valid) {
		upslogx(LOG_ERR, "Error: %s", options.error.c_str());
		Usage::print(prog);
		return EXIT_USAGE;
	}

	upsload_debug_level = options.debug;

	// Check the command before touching the network
	std::vector<upsload::usage_type_t>	usage;
	upsload::InstantCommand	cmd = upsload::LOAD_OFF;

	if ("load-on" == options.command || "load-off" == options.command) {
		if (!options.args.empty()) {
			upslogx(LOG_ERR, "Error: %s takes no argument", options.command.c_str());
			return EXIT_USAGE;
		}
		cmd = ("load-on" == options.command) ? upsload::LOAD_ON : upsload::LOAD_OFF;
	}
	else if ("usage" == options.command) {
		if (options.args.empty()) {
			upslogx(LOG_ERR, "Error: usage requires at least one type");
			return EXIT_USAGE;
		}

		Options::Arguments::const_iterator arg = options.args.begin();
		for (; arg != options.args.end(); ++arg) {
			upsload::usage_type_t type;

			if (!upsload::parseUsageType(*arg, type)) {
				upslogx(LOG_ERR, "Error: invalid usage type '%s'", arg->c_str());
				return EXIT_USAGE;
			}
			usage.push_back(type);
		}
	}
	else if (options.command.empty()) {
		upslogx(LOG_ERR, "Error: no command given");
		Usage::print(prog);
		return EXIT_USAGE;
	}
	else {
		upslogx(LOG_ERR, "Error: unknown command '%s'", options.command.c_str());
		Usage::print(prog);
		return EXIT_USAGE;
	}

	// Settings: built-in defaults < config file < command line
	upsload::UpsloadConfiguration	conf;
	upsload::RunSettings	settings;

	try {
		if (options.config.set())
			conf.parseFromFile(*options.config);

		if (0 == options.debug)
			upsload_debug_level = conf.getDebugLevel().value_or(0);

		settings = upsload::resolveSettings(conf, options);
	}
	catch (const std::invalid_argument & e) {
		upslogx(LOG_ERR, "Error: %s", e.what());
		return EXIT_USAGE;
	}

	const std::string & ups = settings.ups;
	const upsload::Endpoint & endpoint = settings.client.endpoint;

	upsdebugx(2, "UPS %s on %s, timeout %ld", ups.c_str(), endpoint.str().c_str(),
		static_cast<long>(endpoint.getTimeout()));

	upsload::Client	client(settings.client);

	client.connect();

	if (usage.empty()) {
		if (!settings.client.credentials.empty())
			client.authenticate();

		upsload::TrackingID id = client.executeCommand(ups, cmd);
		if (!id.empty())
			upsdebugx(1, "%s: tracking ID %s", upsload::instantCommandName(cmd).c_str(), id.c_str());
	}
	else {
		std::vector<upsload::usage_type_t>::const_iterator type = usage.begin();
		for (; type != usage.end(); ++type)
			std::cout << upsload::readUsage(client, ups, *type) << std::endl;
	}

	client.disconnect();

	return 0;
}


int main(int argc, char * const argv[]) {
	try {
		return mainx(argc, argv);
	}
	catch (const std::exception & e) {
		fatalx(EXIT_FAILURE, "%s", e.what());
	}
}
