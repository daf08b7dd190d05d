/* common.cpp - logging and shared helpers for upsload

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

#include "upsload/common.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

int upsload_debug_level = 0;
int upsload_log_flags = UPSLOG_STDERR;

static const char *progname = "upsload";

/* Timestamp of the first log call, debug lines are stamped relative to it */
static struct timeval upslog_start = { 0, 0 };

#define LARGEBUF	1024

void upsload_set_progname(const char *name)
{
	if (name == nullptr || *name == '\0')
		return;

	const char *slash = strrchr(name, '/');
	progname = slash ? slash + 1 : name;
}

static void vupslog(int priority, const char *fmt, va_list va, bool stamp)
{
	char	buf[LARGEBUF];
	int	ret;

	ret = vsnprintf(buf, sizeof(buf), fmt, va);
	if (ret < 0 || static_cast<size_t>(ret) >= sizeof(buf)) {
		/* Truncated, mark it so */
		snprintf(buf + sizeof(buf) - 4, 4, "...");
	}

	if (upsload_log_flags & UPSLOG_STDERR) {
		if (stamp) {
			struct timeval	now;

			gettimeofday(&now, nullptr);
			if (upslog_start.tv_sec == 0) {
				upslog_start = now;
			}

			if (now.tv_usec < upslog_start.tv_usec) {
				now.tv_usec += 1000000;
				now.tv_sec -= 1;
			}

			fprintf(stderr, "%4.0f.%06ld\t",
				difftime(now.tv_sec, upslog_start.tv_sec),
				static_cast<long>(now.tv_usec - upslog_start.tv_usec));
		}
		fprintf(stderr, "%s\n", buf);
		fflush(stderr);
	}

	if (upsload_log_flags & UPSLOG_SYSLOG) {
		syslog(priority, "%s", buf);
	}
}

void upslogx(int priority, const char *fmt, ...)
{
	va_list va;

	va_start(va, fmt);
	vupslog(priority, fmt, va, false);
	va_end(va);
}

void upsdebugx(int level, const char *fmt, ...)
{
	va_list	va;
	char	fmt2[LARGEBUF];
	const char	*dbgfmt = fmt;

	if (upsload_debug_level < level)
		return;

	/* Prefix the level so traces of different verbosity can be told apart */
	if (level > 0) {
		int ret = snprintf(fmt2, sizeof(fmt2), "[D%d] %s", level, fmt);
		if (ret < 0 || static_cast<size_t>(ret) >= sizeof(fmt2)) {
			dbgfmt = "[D?] (debug message too long)";
		} else {
			dbgfmt = fmt2;
		}
	}

#ifdef __clang__
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wformat-nonliteral"
#endif
	va_start(va, fmt);
	vupslog(LOG_DEBUG, dbgfmt, va, true);
	va_end(va);
#ifdef __clang__
# pragma clang diagnostic pop
#endif
}

void fatalx(int status, const char *fmt, ...)
{
	va_list	va;
	char	buf[LARGEBUF];

	va_start(va, fmt);
	vsnprintf(buf, sizeof(buf), fmt, va);
	va_end(va);

	upslogx(LOG_ERR, "%s: %s", progname, buf);
	exit(status);
}
