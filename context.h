#ifndef _CONTEXT_H
#define _CONTEXT_H

/*
 * @date 2026-10-12 09:14:22
 *
 * `context.h` collection of base types and utilities
 */

/*
 *	This file is part of Tabulate, Minimal formulas for truth tables.
 *	Copyright (C) 2017-2020, xyzzy@rockingship.org
 *
 *	This program is free software: you can redistribute it and/or modify
 *	it under the terms of the GNU General Public License as published by
 *	the Free Software Foundation, either version 3 of the License, or
 *	(at your option) any later version.
 *
 *	This program is distributed in the hope that it will be useful,
 *	but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	GNU General Public License for more details.
 *
 *	You should have received a copy of the GNU General Public License
 *	along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <assert.h>
#include <signal.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <cstring>
#include <string>
#include <time.h>
#include <unistd.h>

/**
 * Which bit of formula handles is reserved to flag that the result needs to be inverted
 *
 * @constant {number} IBIT
 */
#define IBIT 0x80000000

/**
 * Maximum number of variables a formula can have.
 * Truth tables have `2^MAXVARIABLE` entries which must fit in a single 64-bit word.
 *
 * @constant {number} MAXVARIABLE
 */
#define MAXVARIABLE 5

/**
 * Maximum formula size in binary operators the generator can be asked for.
 *
 * @constant {number} MAXSIZE
 */
#define MAXSIZE 15

/**
 * @date 2026-10-12 09:16:40
 *
 * Shared run state: options common to all programs, logging helpers, tracked allocations and progress
 *
 * @typedef {object} context_t
 */
struct context_t {

	/*
	 * verbose levels
	 */
	enum {
		// @formatter:off
		VERBOSE_NONE       = 0,        // nothing
		VERBOSE_WARNING    = 1,        // incomplete or truncated results
		VERBOSE_SUMMARY    = 2,        // summary after performing an action
		VERBOSE_ACTIONS    = 3,        // tell before performing an action
		VERBOSE_TICK       = 4,        // timed progress of actions (default)
		VERBOSE_VERBOSE    = 5,        // above average verbosity
		VERBOSE_INITIALIZE = 6,        // allocations and such
		// @formatter:on
	};

	/*
	 * run constraints
	 */
	enum {
		// @formatter:off
		MAGICFLAG_PARANOID      = 0,    // Cross-check both evaluation paths

		MAGICMASK_PARANOID      = 1 << MAGICFLAG_PARANOID,
		// @formatter:on
	};

	/*
	 * Debug settings, selected with `--debug=<mask>`
	 */
	enum {
		// @formatter:off
		DEBUGFLAG_CATALOG           = 0,	// Display the challenges in `catalog_t::ingest()`
		DEBUGFLAG_GENERATOR         = 1,	// Display size class boundaries in `generator_t::generateFormulas()`

		DEBUGMASK_CATALOG           = 1 << DEBUGFLAG_CATALOG,
		DEBUGMASK_GENERATOR         = 1 << DEBUGFLAG_GENERATOR,
		// @formatter:on
	};

	enum {
		/// @constant {number} weight of the newest interval in the speed average, in percent
		SPEEDWEIGHT = 25,
	};

	/// @var {number} `MAGICMASK_*` flags
	uint32_t flags;

	/*
	 * User specified program arguments and options
	 */

	/// @var {number} --debug, `DEBUGMASK_*` flags
	unsigned opt_debug;
	/// @var {number} --timer, seconds between progress updates
	unsigned opt_timer;
	/// @var {number} --verbose, `VERBOSE_*` level
	unsigned opt_verbose;

	/// @var {number} set by SIGALRM, cleared by whoever draws the progress line
	unsigned tick;

	/*
	 * Statistics
	 */

	/// @var {number} bytes allocated by `myAlloc()`
	uint64_t totalAllocated;
	/// @var {number} index lookups
	uint64_t cntHash;
	/// @var {number} index compares, `cntCompare/cntHash` is the average chain length
	uint64_t cntCompare;

	/*
	 * Progress
	 */

	/// @var {number} work done
	uint64_t progress;
	/// @var {number} work expected, 0 if unknown
	uint64_t progressHi;
	/// @var {number} `progress` at previous update
	uint64_t progressLast;
	/// @var {number} damped average of work per interval
	double   progressSpeed;

	/**
	 * Constructor
	 */
	context_t() {
		flags          = 0;
		opt_debug      = 0;
		opt_timer      = 1;
		opt_verbose    = VERBOSE_TICK;
		tick           = 0;
		totalAllocated = 0;
		cntHash        = 0;
		cntCompare     = 0;
		progress       = 0;
		progressHi     = 0;
		progressLast   = 0;
		progressSpeed  = 0;
	}

	/**
	 * @date 2026-10-12 09:21:03
	 *
	 * Local time as log line prefix
	 *
	 * @return {string} `"YYYY-MM-DD HH:MM:SS"`, valid until next call
	 */
	const char *timeAsString(void) {
		static char tstr[64];

		time_t now = ::time(NULL);
		::strftime(tstr, sizeof(tstr), "%F %T", ::localtime(&now));

		return tstr;
	}

	/**
	 * @date 2026-10-12 09:22:51
	 *
	 * Print a JSON error and exit with status 1.
	 * Written to stdout so it shows in `--text` listings, duplicated to stderr when stdout is redirected.
	 *
	 * @param {string} format - printf format
	 */
	void __attribute__((noreturn)) __attribute__ ((format (printf, 2, 3))) fatal(const char *format, ...) {
		char    *pMessage = NULL;
		va_list ap;

		va_start(ap, format);
		int len = ::vasprintf(&pMessage, format, ap);
		va_end(ap);

		if (len < 0) {
			::fputs("{\"error\":\"fatal\"}\n", stderr);
			::exit(1);
		}

		::fputs(pMessage, stdout);
		::fflush(stdout);
		if (!::isatty(1))
			::fputs(pMessage, stderr);

		::free(pMessage);
		::exit(1);
	}

	/**
	 * @date 2026-10-12 09:24:37
	 *
	 * Allocate zeroed memory, fatal on failure
	 *
	 * @param {string} name - label for tracing
	 * @param {number} numElement - number of elements
	 * @param {number} elementSize - size of element in bytes
	 * @return {void[]} memory, NULL if zero length requested
	 */
	void *myAlloc(const char *name, size_t numElement, size_t elementSize) {
		size_t len = numElement * elementSize;

		if (len == 0)
			return NULL;

		// 32-byte aligned, length rounded to match
		len = (len + 31) & ~(size_t) 31;

		void *ret = ::aligned_alloc(32, len);
		if (ret == NULL)
			fatal("{\"error\":\"failed to allocate\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"size\":%lu}\n", __FUNCTION__, __FILE__, __LINE__, name, len);

		::memset(ret, 0, len);
		totalAllocated += len;

		if (opt_verbose >= VERBOSE_INITIALIZE)
			fprintf(stderr, "[%s] memory +%p %s %lu=%lu*%lu\n", timeAsString(), ret, name, len, numElement, elementSize);

		return ret;
	}

	/**
	 * @date 2026-10-12 09:26:02
	 *
	 * Release memory from `myAlloc()`
	 *
	 * @param {string} name - label for tracing
	 * @param {void[]} ptr - memory
	 */
	void myFree(const char *name, void *ptr) {
		if (opt_verbose >= VERBOSE_INITIALIZE)
			fprintf(stderr, "[%s] memory -%p %s\n", timeAsString(), ptr, name);

		::free(ptr);
	}

	/*
	 * Hash index sizing
	 */

	/**
	 * @date 2026-10-12 09:27:45
	 *
	 * Trial division primality test
	 *
	 * @param {number} n - candidate
	 * @return {boolean} `true` if prime
	 */
	bool isPrime(uint64_t n) {
		if (n < 2)
			return false;
		if (n < 4)
			return true;
		if (n % 2 == 0)
			return false;

		for (uint64_t i = 3; i * i <= n; i += 2) {
			if (n % i == 0)
				return false;
		}

		return true;
	}

	/**
	 * @date 2026-10-12 09:28:19
	 *
	 * Smallest prime not below `n`, used as hash index size so overflow steps cycle the whole index
	 *
	 * @param {number} n - lower bound
	 * @return {number} prime, at most the largest 32-bit prime
	 */
	unsigned nextPrime(uint64_t n) {
		if (n == 0)
			return 0;
		if (n >= 4294967291ULL)
			return 4294967291U;

		while (!isPrime(n))
			n++;

		return (unsigned) n;
	}

	/**
	 * @date 2026-10-12 09:29:56
	 *
	 * Clamp a size calculation to 31 bits, `IBIT` being reserved
	 *
	 * @param {number} d - value
	 * @return {number} clamped value
	 */
	unsigned dToMax(double d) {
		if (d <= 0)
			return 0;
		if (d >= 2147483646)
			return 2147483646;

		return (unsigned) d;
	}

	/**
	 * @date 2026-10-12 09:31:10
	 *
	 * Names of `MAGICMASK_*` flags for logging
	 *
	 * @param {number} flags - flags
	 * @return {string} `|` separated names
	 */
	std::string flagsToText(unsigned flags) {
		std::string txt;

		if (flags & MAGICMASK_PARANOID)
			txt += "PARANOID";

		return txt;
	}

	/*
	 * Progress
	 */

	/**
	 * @date 2026-10-12 09:32:48
	 *
	 * Reset progress for a new action
	 *
	 * @param {number} progressHi - expected amount of work
	 */
	void setupSpeed(uint64_t progressHi) {
		this->progress      = 0;
		this->progressHi    = progressHi;
		this->progressLast  = 0;
		this->progressSpeed = 0;
		this->tick          = 0;
	}

	/**
	 * @date 2026-10-12 09:33:30
	 *
	 * Update the damped speed average. Called once per timer tick.
	 *
	 * @return {number} work per second, at least 1
	 */
	unsigned updateSpeed(void) {
		double delta = (double) (progress - progressLast);

		progressLast = progress;

		if (progressSpeed == 0)
			progressSpeed = delta;
		else
			progressSpeed += (delta - progressSpeed) * SPEEDWEIGHT / 100;

		double perSecond = progressSpeed / (opt_timer ? opt_timer : 1);

		return perSecond < 1 ? 1 : (unsigned) perSecond;
	}

	/**
	 * @date 2026-10-12 09:35:14
	 *
	 * Remaining time at the given speed
	 *
	 * @param {number} perSecond - speed as returned by `updateSpeed()`
	 * @return {string} `"H:MM:SS"`, valid until next call
	 */
	const char *etaAsString(unsigned perSecond) {
		static char tstr[32];

		uint64_t eta = (progressHi > progress) ? (progressHi - progress) / (perSecond ? perSecond : 1) : 0;

		sprintf(tstr, "%u:%02u:%02u", (unsigned) (eta / 3600), (unsigned) (eta / 60 % 60), (unsigned) (eta % 60));

		return tstr;
	}
};

#endif
