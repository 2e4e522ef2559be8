/*
 * @date 2026-10-13 13:02:50
 *
 * `tabulate` finds the minimal formulas of every truth table over a given number of variables.
 *
 * - It creates all formulas of `--maxsize` or less binary operators (AND, OR, XOR) with free negation
 * - Of every formula it evaluates all `2^numVariable` assignments
 * - Formulas with identical truth tables are grouped, the smallest are the minimal formulas
 *
 * For 3 variables and the default ceiling of 3 operators that is 1415454 formulas.
 * With 4 or more variables enumeration becomes intractable and results are incomplete.
 *
 * Output is either a flat list of formulas or pretty printed html pages of truth tables:
 *
 *   `./tabulate 3 --output=text --outdir=out`     writes `out/formulalist.txt`
 *   `./tabulate 3 --output=html --outdir=out`     writes `out/truthtables0.htm`
 *
 * A JSON summary is written to stderr when done.
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

#include <ctype.h>
#include <errno.h>
#include <getopt.h>
#include <jansson.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include "config.h"
#include "tabulate.h"

/*
 * I/O context.
 * Needs to be global to be accessible by signal handlers.
 *
 * @global {context_t} I/O context
 */
context_t ctx;

/*
 * Application context.
 * Needs to be global to be accessible by signal handlers.
 *
 * @global {tabulateContext_t} Application context
 */
tabulateContext_t app(ctx);

/**
 * @date 2026-10-13 13:08:12
 *
 * Signal handler
 *
 * Delete partially written output file
 *
 * @param {number} sig - signal (ignored)
 */
void sigintHandler(int __attribute__ ((unused)) sig) {
	if (!app.currentFile.empty()) {
		remove(app.currentFile.c_str());
	}
	exit(1);
}

/**
 * @date 2026-10-13 13:09:40
 *
 * Signal handlers
 *
 * Bump interval timer
 *
 * @param {number} sig - signal (ignored)
 */
void sigalrmHandler(int __attribute__ ((unused)) sig) {
	if (ctx.opt_timer) {
		ctx.tick++;
		alarm(ctx.opt_timer);
	}
}

/**
 * @date 2026-10-13 13:10:55
 *
 * Program usage. Keep this directly above `main()`
 *
 * @param {string[]} argv - program arguments
 * @param {boolean} verbose - set to true for option descriptions
 */
void usage(char *argv[], bool verbose) {
	fprintf(stderr, "usage: %s [<numvar>]  -- Find minimal formulas for all truth tables\n", argv[0]);

	if (verbose) {
		fprintf(stderr, "\n");
		fprintf(stderr, "\t   --force                         Force overwriting of output files if already exist\n");
		fprintf(stderr, "\t-h --help                          This list\n");
		fprintf(stderr, "\t-n --numvar=<number>               Number of variables 1..%u [default=%u]\n", MAXVARIABLE, app.opt_numVariable);
		fprintf(stderr, "\t   --outdir=<directory>            Directory for output files [default=%s]\n", app.opt_outDir);
		fprintf(stderr, "\t   --output=text|html              Output renderer [default=%s]\n", app.opt_output == app.OUTPUT_HTML ? "html" : "text");
		fprintf(stderr, "\t-q --quiet                         Say less\n");
		fprintf(stderr, "\t   --text[=1]                      Brief accepted `foundFormula()` candidates\n");
		fprintf(stderr, "\t   --text=2                        Verbose `foundFormula()` candidates\n");
		fprintf(stderr, "\t   --text=3                        Brief catalog dump\n");
		fprintf(stderr, "\t   --text=4                        Verbose catalog dump\n");
		fprintf(stderr, "\t   --timer=<seconds>               Interval timer for verbose updates [default=%u]\n", ctx.opt_timer);
		fprintf(stderr, "\t-v --verbose                       Say more\n");
		fprintf(stderr, "\t-V --version                       Show versions\n");
		fprintf(stderr, "\nSystem options:\n");
		fprintf(stderr, "\t   --[no-]paranoid                 Expensive assertions [default=%s]\n", (ctx.flags & context_t::MAGICMASK_PARANOID) ? "enabled" : "disabled");
		fprintf(stderr, "\nGenerator options:\n");
		fprintf(stderr, "\t   --maxsize=<number>              Size ceiling in binary operators 0..%u [default=%u for %u variables]\n", MAXSIZE, app.defaultMaxSize(app.opt_numVariable), app.opt_numVariable);
		fprintf(stderr, "\t   --maxnode=<number>              Maximum number of formula nodes [default=fit --maxsize]\n");
		fprintf(stderr, "\t   --ratio=<number>                Index/data ratio [default=%.1f]\n", app.opt_ratio);
	}
}

/**
 * @date 2026-10-13 13:15:21
 *
 * Parse a number of variables
 *
 * @param {string} pText - text to parse
 * @return {number} number of variables, 0 if invalid
 */
unsigned parseNumVariable(const char *pText) {
	char *endptr;

	errno = 0; // To distinguish success/failure after call
	unsigned long n = ::strtoul(pText, &endptr, 0);

	// strip trailing spaces
	while (*endptr && isspace((unsigned char) *endptr))
		endptr++;

	// test for error
	if (errno != 0 || *endptr != '\0' || n < 1 || n > MAXVARIABLE)
		return 0;

	return (unsigned) n;
}

/**
 * @date 2026-10-13 13:19:40
 *
 * Program main entry point
 * Process all user supplied arguments to construct a application context.
 * Activate application context.
 *
 * @param  {number} argc - number of arguments
 * @param  {string[]} argv - program arguments
 * @return {number} 0 on normal return, non-zero when attention is required
 */
int main(int argc, char *argv[]) {
	setlinebuf(stdout);

	time_t timeStart = ::time(NULL);

	/*
	 *  Process program options
	 */
	for (;;) {
		// Long option shortcuts
		enum {
			// short opts
			LO_HELP    = 'h',
			LO_NUMVAR  = 'n',
			LO_QUIET   = 'q',
			LO_VERBOSE = 'v',
			LO_VERSION = 'V',
			// long opts
			LO_DEBUG   = 1,
			LO_FORCE,
			LO_OUTDIR,
			LO_OUTPUT,
			LO_TEXT,
			LO_TIMER,
			// system options
			LO_NOPARANOID,
			LO_PARANOID,
			// generator options
			LO_MAXNODE,
			LO_MAXSIZE,
			LO_RATIO,
		};

		// long option descriptions
		static struct option long_options[] = {
			/* name, has_arg, flag, val */
			// short options
			{"debug",       1, 0, LO_DEBUG},
			{"force",       0, 0, LO_FORCE},
			{"help",        0, 0, LO_HELP},
			{"numvar",      1, 0, LO_NUMVAR},
			{"quiet",       2, 0, LO_QUIET},
			{"timer",       1, 0, LO_TIMER},
			{"verbose",     2, 0, LO_VERBOSE},
			{"version",     0, 0, LO_VERSION},
			// long options
			{"outdir",      1, 0, LO_OUTDIR},
			{"output",      1, 0, LO_OUTPUT},
			{"text",        2, 0, LO_TEXT},
			// system options
			{"no-paranoid", 0, 0, LO_NOPARANOID},
			{"paranoid",    0, 0, LO_PARANOID},
			// generator options
			{"maxnode",     1, 0, LO_MAXNODE},
			{"maxsize",     1, 0, LO_MAXSIZE},
			{"ratio",       1, 0, LO_RATIO},
			//
			{NULL,          0, 0, 0}
		};

		char optstring[64];
		char *cp          = optstring;
		int  option_index = 0;

		/* construct optarg */
		for (int i = 0; long_options[i].name; i++) {
			if (isalpha(long_options[i].val)) {
				*cp++ = (char) long_options[i].val;

				if (long_options[i].has_arg != 0)
					*cp++ = ':';
				if (long_options[i].has_arg == 2)
					*cp++ = ':';
			}
		}

		*cp = '\0';

		// parse long options
		int c = getopt_long(argc, argv, optstring, long_options, &option_index);
		if (c == -1)
			break;

		switch (c) {
			/*
			 * Short options
			 */
		case LO_DEBUG:
			ctx.opt_debug = ::strtoul(optarg, NULL, 0);
			break;
		case LO_FORCE:
			app.opt_force++;
			break;
		case LO_HELP:
			usage(argv, true);
			exit(0);
		case LO_NUMVAR:
			app.opt_numVariable = parseNumVariable(optarg);
			if (app.opt_numVariable == 0) {
				fprintf(stderr, "--numvar must be 1..%u\n", MAXVARIABLE);
				exit(1);
			}
			break;
		case LO_QUIET:
			ctx.opt_verbose = optarg ? ::strtoul(optarg, NULL, 0) : ctx.opt_verbose - 1;
			break;
		case LO_TIMER:
			ctx.opt_timer = ::strtoul(optarg, NULL, 0);
			break;
		case LO_VERBOSE:
			ctx.opt_verbose = optarg ? ::strtoul(optarg, NULL, 0) : ctx.opt_verbose + 1;
			break;
		case LO_VERSION:
			printf("%s\n", PACKAGE_VERSION);
			exit(0);

			/*
			 * Long options
			 */
		case LO_OUTDIR:
			app.opt_outDir = optarg;
			break;
		case LO_OUTPUT:
			if (::strcmp(optarg, "text") == 0) {
				app.opt_output = app.OUTPUT_TEXT;
			} else if (::strcmp(optarg, "html") == 0) {
				app.opt_output = app.OUTPUT_HTML;
			} else {
				fprintf(stderr, "--output must be text or html\n");
				exit(1);
			}
			break;
		case LO_TEXT:
			app.opt_text = optarg ? ::strtoul(optarg, NULL, 0) : app.opt_text + 1;
			break;

			/*
			 * System options
			 */
		case LO_NOPARANOID:
			ctx.flags &= ~context_t::MAGICMASK_PARANOID;
			break;
		case LO_PARANOID:
			ctx.flags |= context_t::MAGICMASK_PARANOID;
			break;

			/*
			 * Generator options
			 */
		case LO_MAXNODE:
		{
			double d = ::strtod(optarg, NULL);

			if (!(d >= 64 && d <= app.MAXNODE_LIMIT)) {
				fprintf(stderr, "--maxnode must be 64..%u\n", (unsigned) app.MAXNODE_LIMIT);
				exit(1);
			}
			app.opt_maxNode = ctx.dToMax(d);
			break;
		}
		case LO_MAXSIZE:
			app.opt_maxSize = ::strtoul(optarg, NULL, 0);
			if (app.opt_maxSize > MAXSIZE) {
				fprintf(stderr, "--maxsize must be 0..%u\n", MAXSIZE);
				exit(1);
			}
			break;
		case LO_RATIO:
			app.opt_ratio = ::strtod(optarg, NULL);
			break;

		case '?':
			fprintf(stderr, "Try `%s --help' for more information.\n", argv[0]);
			exit(1);
		default:
			fprintf(stderr, "getopt_long() returned character code %d\n", c);
			exit(1);
		}
	}

	/*
	 * Program arguments
	 */
	if (argc - optind >= 1) {
		app.opt_numVariable = parseNumVariable(argv[optind++]);
		if (app.opt_numVariable == 0) {
			usage(argv, false);
			exit(1);
		}
	}

	if (argc - optind >= 1) {
		usage(argv, false);
		exit(1);
	}

	/*
	 * Validate options
	 */

	if (app.opt_ratio < 1.0) {
		fprintf(stderr, "--ratio must be at least 1.0\n");
		exit(1);
	}

	if (app.opt_text && isatty(1)) {
		fprintf(stderr, "stdout not redirected\n");
		exit(1);
	}

	// register timer handler
	if (ctx.opt_timer) {
		signal(SIGALRM, sigalrmHandler);
		::alarm(ctx.opt_timer);
	}

	if (ctx.opt_verbose >= ctx.VERBOSE_VERBOSE && ctx.flags)
		fprintf(stderr, "[%s] FLAGS [%s]\n", ctx.timeAsString(), ctx.flagsToText(ctx.flags).c_str());

	/*
	 * Create stores
	 */

	formulaPool_t pool(ctx);
	catalog_t     catalog(ctx);

	app.createStores(pool, catalog);

	if (ctx.opt_verbose >= ctx.VERBOSE_VERBOSE)
		fprintf(stderr, "[%s] Allocated %.3fG memory\n", ctx.timeAsString(), ctx.totalAllocated / 1e9);

	/*
	 * Generate and catalog
	 */

	app.formulasFromGenerator();

	if (app.opt_text == app.OPTTEXT_BRIEF || app.opt_text == app.OPTTEXT_VERBOSE)
		app.catalogToText();

	/*
	 * Render
	 */

	// unexpected termination should unlink the outputs
	signal(SIGINT, sigintHandler);
	signal(SIGHUP, sigintHandler);

	app.createOutputDirectory();

	if (app.opt_output == app.OUTPUT_HTML)
		app.writeTruthTables();
	else
		app.writeFormulaList();

	if (ctx.opt_verbose >= ctx.VERBOSE_WARNING) {
		json_t *jResult = json_object();
		json_object_set_new_nocheck(jResult, "done", json_string_nocheck(argv[0]));
		app.jsonInfo(jResult);
		json_object_set_new_nocheck(jResult, "elapsed", json_integer(::time(NULL) - timeStart));
		fprintf(stderr, "%s\n", json_dumps(jResult, JSON_PRESERVE_ORDER | JSON_COMPACT));
	}

	return 0;
}
