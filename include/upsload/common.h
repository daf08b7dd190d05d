/* common.h - logging and shared helpers for upsload

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

#ifndef UPSLOAD_COMMON_H_SEEN
#define UPSLOAD_COMMON_H_SEEN 1

#include <syslog.h>	/* LOG_ERR, LOG_WARNING, ... priorities for upslogx() */

#ifndef UPSLOAD_VERSION
# define UPSLOAD_VERSION "unknown"
#endif

/** @brief Default TCP port of the NUT data server (upsd). */
#define UPSLOAD_DEFAULT_PORT		3493

/** @brief Default timeout (in seconds) for network operations. */
#define UPSLOAD_DEFAULT_TIMEOUT		5

/** @brief Default host name of the NUT data server. */
#define UPSLOAD_DEFAULT_HOST		"localhost"

/* logging flags: bitmask! */
#define UPSLOG_STDERR		0x0001
#define UPSLOG_SYSLOG		0x0002

/** Current debug verbosity; upsdebugx() messages above it are dropped. */
extern int upsload_debug_level;

/** Where upslogx() messages go, see UPSLOG_* flags. */
extern int upsload_log_flags;

/* Log a message at syslog-style priority (LOG_ERR, LOG_NOTICE...) */
void upslogx(int priority, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));

/* Log a debug message if upsload_debug_level >= level */
void upsdebugx(int level, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3)));

/* Log an error and exit with given status */
void fatalx(int status, const char *fmt, ...)
	__attribute__ ((__format__ (__printf__, 2, 3))) __attribute__((noreturn));

/* Name of the program for message prefixes and syslog */
void upsload_set_progname(const char *progname);

#endif /* UPSLOAD_COMMON_H_SEEN */
