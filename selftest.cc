/*
 * @date 2026-10-14 09:03:37
 *
 * `selftest` validates the building blocks of `tabulate`.
 *
 *   - Footprints, notation and evaluation
 *   - Generator ordering and counts
 *   - Catalog invariants and the minimality policy
 *   - Known truth tables for 1 and 2 variables
 *   - Termination and incompleteness reporting for 5 variables
 *   - Size ceiling and capacity defaults
 *   - Text and html renderers
 *
 * Each test prints a JSON error and exits non-zero on failure.
 *
 * Contract violations are tested by modes which are expected to terminate with an error:
 *   `--duplicate`   ingest the same formula twice
 *   `--finalised`   ingest into a finalised catalog
 *   `--overwrite`   write an output file that already exists without `--force`
 *   `--storagefull` add more nodes than the pool can hold
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
#include <getopt.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "config.h"
#include "tabulate.h"

/**
 * @date 2026-10-14 09:08:12
 *
 * Selftest wrapper
 *
 * @typedef {object}
 */
struct selftestContext_t : callable_t {

	/// @var {context_t} I/O context
	context_t &ctx;

	/*
	 * User specified program arguments and options
	 */

	/// @var {number} run double ingestion test
	unsigned   opt_duplicate;
	/// @var {number} run ingestion after finalise test
	unsigned   opt_finalised;
	/// @var {number} run overwrite refusal test
	unsigned   opt_overwrite;
	/// @var {number} run pool capacity test
	unsigned   opt_storageFull;
	/// @var {string} run only this test group, NULL for all
	const char *opt_test;

	/// @var {number} number of test groups selected
	unsigned numRun;

	/*
	 * Generator callback state
	 */

	/// @var {formulaPool_t} pool the generator is filling
	formulaPool_t *pPool;
	/// @var {evaluator_t} evaluator for the pool
	evaluator_t   *pEvaluator;
	/// @var {number} size of last formula passed to callback
	unsigned      lastSize;
	/// @var {number[]} number of formulas received per size class
	uint64_t      numFound[MAXSIZE + 1];
	/// @var {number} formulas received
	uint64_t      numTotal;

	/**
	 * Constructor
	 */
	selftestContext_t(context_t &ctx) : ctx(ctx) {
		opt_duplicate   = 0;
		opt_finalised   = 0;
		opt_overwrite   = 0;
		opt_storageFull = 0;
		opt_test      = NULL;
		numRun        = 0;
		pPool         = NULL;
		pEvaluator    = NULL;
		lastSize      = 0;
		numTotal      = 0;
		::memset(numFound, 0, sizeof(numFound));
	}

	/**
	 * @date 2026-10-14 09:12:40
	 *
	 * Run the complete pipeline
	 *
	 * @param {tabulateContext_t} app - application context
	 * @param {formulaPool_t} pool - formula store
	 * @param {catalog_t} catalog - truth table catalog
	 * @param {number} numVariable - number of variables
	 * @param {number} maxSize - size ceiling
	 * @param {number} maxNode - pool capacity
	 */
	void runPipeline(tabulateContext_t &app, formulaPool_t &pool, catalog_t &catalog, unsigned numVariable, unsigned maxSize, unsigned maxNode) {
		app.opt_numVariable = numVariable;
		app.opt_maxSize     = maxSize;
		app.opt_maxNode     = maxNode;

		// suppress warnings about intractable runs
		unsigned savVerbose = ctx.opt_verbose;
		if (ctx.opt_verbose < ctx.VERBOSE_VERBOSE)
			ctx.opt_verbose = ctx.VERBOSE_NONE;

		app.createStores(pool, catalog);
		app.formulasFromGenerator();

		ctx.opt_verbose = savVerbose;
	}

	/**
	 * @date 2026-10-14 09:16:25
	 *
	 * Test if a test group is selected with `--test`
	 *
	 * @param {string} pName - test group
	 * @return {boolean} `true` if group should run
	 */
	bool wantTest(const char *pName) {
		if (opt_test && ::strcmp(opt_test, pName) != 0)
			return false;

		numRun++;
		return true;
	}

	/**
	 * @date 2026-10-14 09:18:02
	 *
	 * Test that footprints have exactly `2^numVariable` significant bits
	 */
	void performSelfTestFootprint(void) {
		char text[(1 << MAXVARIABLE) + 1];

		for (unsigned numVariable = 1; numVariable <= MAXVARIABLE; numVariable++) {
			uint64_t mask = footprint_t::mask(numVariable);

			if (__builtin_popcountll(mask) != (1 << numVariable)) {
				printf("{\"error\":\"mask has wrong length\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"encountered\":%d}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, __builtin_popcountll(mask));
				exit(1);
			}

			for (unsigned v = 0; v < numVariable; v++) {
				footprint_t footprint;
				footprint.setVariable(numVariable, v);

				if (footprint.bits[0] & ~mask) {
					printf("{\"error\":\"footprint exceeds length\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"v\":%u}\n",
					       __FUNCTION__, __FILE__, __LINE__, numVariable, v);
					exit(1);
				}
				if (__builtin_popcountll(footprint.bits[0]) != (1 << (numVariable - 1))) {
					printf("{\"error\":\"variable not balanced\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"v\":%u}\n",
					       __FUNCTION__, __FILE__, __LINE__, numVariable, v);
					exit(1);
				}
				if (::strlen(footprint.toString(numVariable, text)) != (1U << numVariable)) {
					printf("{\"error\":\"text has wrong length\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"encountered\":\"%s\"}\n",
					       __FUNCTION__, __FILE__, __LINE__, numVariable, text);
					exit(1);
				}
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 09:27:45
	 *
	 * Test that notation encoding/decoding works as expected
	 */
	void performSelfTestNotation(void) {
		formulaPool_t pool(ctx);
		pool.create(3, 100, 2.0);
		pool.addLiterals();

		static const char *tests[][2] = {
			{"a",      "a"},
			{"a~",     "~a"},
			{"ab&",    "a & b"},
			{"ab^~",   "~(a ^ b)"},
			{"a~b&",   "~a & b"},
			{"ab&c+~", "~((a & b) | c)"},
			{"ab&~c+", "~(a & b) | c"},
			{"abc^&",  "a & (b ^ c)"},
			{NULL,     NULL}
		};

		for (unsigned i = 0; tests[i][0]; i++) {
			uint32_t ref = pool.loadString(tests[i][0]);

			if (ref == 0) {
				printf("{\"error\":\"loadString failed\",\"where\":\"%s:%s:%d\",\"name\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0]);
				exit(1);
			}

			const char *pName = pool.saveString(ref);
			if (::strcmp(pName, tests[i][0]) != 0) {
				printf("{\"error\":\"saveString failed\",\"where\":\"%s:%s:%d\",\"encountered\":\"%s\",\"expected\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, pName, tests[i][0]);
				exit(1);
			}

			std::string infix = pool.infixString(ref);
			if (infix != tests[i][1]) {
				printf("{\"error\":\"infixString failed\",\"where\":\"%s:%s:%d\",\"encountered\":\"%s\",\"expected\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, infix.c_str(), tests[i][1]);
				exit(1);
			}
		}

		// structurally identical formulas share the node
		if (pool.loadString("ab&") != pool.loadString("ab&") || pool.loadString("ab&") == pool.loadString("ba&")) {
			printf("{\"error\":\"structural identity failed\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
			exit(1);
		}

		// malformed
		static const char *bad[] = {"", "ab", "a&", "ad&", "a?", "~", NULL};

		for (unsigned i = 0; bad[i]; i++) {
			if (pool.loadString(bad[i]) != 0) {
				printf("{\"error\":\"malformed notation accepted\",\"where\":\"%s:%s:%d\",\"name\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, bad[i]);
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 09:41:16
	 *
	 * Test that evaluating two variable formulas gives the expected truth tables.
	 * Tables are in assignment order, assignment 0 first.
	 */
	void performSelfTestEvaluate(void) {
		formulaPool_t pool(ctx);
		pool.create(2, 100, 2.0);
		pool.addLiterals();

		evaluator_t evaluator(ctx, pool);

		static const char *tests[][2] = {
			{"a",    "0101"},
			{"b",    "0011"},
			{"a~",   "1010"},
			{"ab&",  "0001"},
			{"ab+",  "0111"},
			{"ab^",  "0110"},
			{"ab^~", "1001"},
			{"aa^",  "0000"},
			{"aa^~", "1111"},
			{NULL,   NULL}
		};

		for (unsigned i = 0; tests[i][0]; i++) {
			uint32_t ref = pool.loadString(tests[i][0]);
			char     slowText[(1 << MAXVARIABLE) + 1];
			char     fastText[(1 << MAXVARIABLE) + 1];

			evaluator.evaluate(ref).toString(2, slowText);
			evaluator.evaluateFast(ref).toString(2, fastText);

			if (::strcmp(slowText, tests[i][1]) != 0 || ::strcmp(fastText, tests[i][1]) != 0) {
				printf("{\"error\":\"evaluate failed\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"evaluate\":\"%s\",\"evaluateFast\":\"%s\",\"expected\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0], slowText, fastText, tests[i][1]);
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 09:55:03
	 *
	 * Generator callback collecting statistics
	 *
	 * @param {number} ref - formula handle
	 * @param {number} size - formula size
	 * @return {boolean} `true` to continue
	 */
	bool foundFormula(uint32_t ref, unsigned size) {
		if (size < lastSize) {
			printf("{\"error\":\"size decreased\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"size\":%u,\"lastSize\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, pPool->saveString(ref), size, lastSize);
			exit(1);
		}
		if (size != pPool->sizeOf(ref)) {
			printf("{\"error\":\"size mismatch\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"size\":%u,\"sizeOf\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, pPool->saveString(ref), size, pPool->sizeOf(ref));
			exit(1);
		}

		footprint_t footprint = pEvaluator->evaluateFast(ref);
		if (footprint.bits[0] & ~footprint_t::mask(pPool->numVariable)) {
			printf("{\"error\":\"footprint exceeds length\",\"where\":\"%s:%s:%d\",\"name\":\"%s\"}\n",
			       __FUNCTION__, __FILE__, __LINE__, pPool->saveString(ref));
			exit(1);
		}

		// fatal on mismatch
		pEvaluator->validate(ref);

		lastSize = size;
		numFound[size]++;
		numTotal++;

		return true;
	}

	/**
	 * @date 2026-10-14 10:04:27
	 *
	 * Test that the generator emits in non-decreasing size with the expected counts per size class
	 */
	void performSelfTestGenerator(void) {

		// known counts for 3 variables
		uint64_t numFormula;
		generator_t::planSize(3, 3, 1e9, NULL, &numFormula);
		if (numFormula != 6 + 216 + 15552 + 1399680) {
			printf("{\"error\":\"expected count failed\",\"where\":\"%s:%s:%d\",\"encountered\":%lu,\"expected\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, numFormula, 6 + 216 + 15552 + 1399680);
			exit(1);
		}

		for (unsigned numVariable = 1; numVariable <= 4; numVariable++) {
			const unsigned maxSize = 2;
			uint64_t       numNode;

			formulaPool_t pool(ctx);
			generator_t   generator(ctx);
			evaluator_t   evaluator(ctx, pool);

			generator_t::planSize(numVariable, maxSize, 1e9, &numNode, &numFormula);
			pool.create(numVariable, numNode, 2.0);

			this->pPool      = &pool;
			this->pEvaluator = &evaluator;
			this->lastSize   = 0;
			this->numTotal   = 0;
			::memset(this->numFound, 0, sizeof(this->numFound));

			ctx.setupSpeed(numFormula);

			generator.initialiseGenerator(pool);
			generator.clearGenerator();
			generator.generateFormulas(maxSize, this, static_cast<generator_t::generateFormulaCallback_t>(&selftestContext_t::foundFormula));

			if (generator.truncated || generator.aborted || generator.sizeReached != maxSize) {
				printf("{\"error\":\"generator stopped early\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"truncated\":%u,\"aborted\":%u,\"sizeReached\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, generator.truncated, generator.aborted, generator.sizeReached);
				exit(1);
			}
			if (generator.skipDuplicate != 0) {
				printf("{\"error\":\"structural duplicates\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"skipDuplicate\":%lu}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, generator.skipDuplicate);
				exit(1);
			}
			if (numTotal != numFormula || ctx.progress != numFormula) {
				printf("{\"error\":\"progressHi failed\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"encountered\":%lu,\"progress\":%lu,\"expected\":%lu}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, numTotal, ctx.progress, numFormula);
				exit(1);
			}

			double nodes[MAXSIZE + 1];
			generator_t::expectedNodes(numVariable, maxSize, nodes);

			for (unsigned k = 0; k <= maxSize; k++) {
				if (numFound[k] != 2 * (uint64_t) nodes[k] || pool.numFormulaOfSize(k) != numFound[k]) {
					printf("{\"error\":\"size class count failed\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"size\":%u,\"encountered\":%lu,\"expected\":%.0f}\n",
					       __FUNCTION__, __FILE__, __LINE__, numVariable, k, numFound[k], 2 * nodes[k]);
					exit(1);
				}
			}

			// size class 0 is every literal followed by its negation
			for (unsigned v = 0; v < numVariable; v++) {
				uint32_t ref = pool.formulaOfSize(0, 2 * v);
				if (ref != formulaPool_t::KSTART + v || pool.formulaOfSize(0, 2 * v + 1) != (ref | IBIT)) {
					printf("{\"error\":\"literal order failed\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"v\":%u}\n",
					       __FUNCTION__, __FILE__, __LINE__, numVariable, v);
					exit(1);
				}
			}

			this->pPool      = NULL;
			this->pEvaluator = NULL;
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 10:31:50
	 *
	 * Find the catalog entry of a formula given in postfix notation
	 *
	 * @param {formulaPool_t} pool - formula store
	 * @param {catalog_t} catalog - truth table catalog
	 * @param {string} pName - notation
	 * @return {number} entry id, 0 if truth table not found
	 */
	uint32_t entryOfName(formulaPool_t &pool, catalog_t &catalog, const char *pName) {
		evaluator_t evaluator(ctx, pool);

		uint32_t ref = pool.loadString(pName);
		uint32_t ix  = catalog.lookupEntry(evaluator.evaluate(ref));

		return catalog.entryIndex[ix];
	}

	/**
	 * @date 2026-10-14 10:36:14
	 *
	 * Test if a formula is member of a minimal list
	 *
	 * @param {catalog_t} catalog - truth table catalog
	 * @param {number} eid - entry id
	 * @param {number} ref - formula handle
	 * @return {boolean} `true` if found
	 */
	bool isMinimal(const catalog_t &catalog, uint32_t eid, uint32_t ref) {
		const entry_t *pEntry = catalog.entries + eid;

		for (uint32_t iRef = pEntry->firstMinimal; iRef; iRef = catalog.nextOfMinimal(iRef)) {
			if (iRef == ref)
				return true;
		}
		return false;
	}

	/**
	 * @date 2026-10-14 10:40:02
	 *
	 * Test known two variable results: XOR has minimal size 1 and all 16 truth tables are found at size 1
	 */
	void performSelfTestTwoVariables(void) {
		tabulateContext_t app(ctx);
		formulaPool_t     pool(ctx);
		catalog_t         catalog(ctx);

		runPipeline(app, pool, catalog, 2, 1, 1000);

		static const char *tests[][2] = {
			{"a",   "0"},
			{"ab&", "1"},
			{"ab+", "1"},
			{"ab^", "1"},
			{NULL,  NULL}
		};

		for (unsigned i = 0; tests[i][0]; i++) {
			uint32_t eid = entryOfName(pool, catalog, tests[i][0]);

			// the node is already present, this is a lookup
			uint32_t ref = pool.loadString(tests[i][0]);

			if (eid == 0) {
				printf("{\"error\":\"truth table not found\",\"where\":\"%s:%s:%d\",\"name\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0]);
				exit(1);
			}
			if (catalog.entries[eid].minSize != (unsigned) (tests[i][1][0] - '0')) {
				printf("{\"error\":\"minimal size failed\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"encountered\":%u,\"expected\":%s}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0], catalog.entries[eid].minSize, tests[i][1]);
				exit(1);
			}
			if (catalog.entryOfFormula(ref) != eid || !isMinimal(catalog, eid, ref)) {
				printf("{\"error\":\"formula not minimal\",\"where\":\"%s:%s:%d\",\"name\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0]);
				exit(1);
			}
		}

		// ties are retained in discovery order, `ab^` is found before `ba^`
		uint32_t eid  = entryOfName(pool, catalog, "ab^");
		uint32_t refA = pool.loadString("ab^");
		uint32_t refB = pool.loadString("ba^");
		if (catalog.entries[eid].firstMinimal != refA || !isMinimal(catalog, eid, refB) || catalog.entries[eid].numMinimal < 2) {
			printf("{\"error\":\"tie order failed\",\"where\":\"%s:%s:%d\",\"first\":\"%s\"}\n",
			       __FUNCTION__, __FILE__, __LINE__, pool.saveString(catalog.entries[eid].firstMinimal));
			exit(1);
		}

		if (!catalog.isComplete() || catalog.numTable() != 16) {
			printf("{\"error\":\"incomplete\",\"where\":\"%s:%s:%d\",\"numTable\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, catalog.numTable());
			exit(1);
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 10:55:39
	 *
	 * Test single variable: all 4 truth tables at size 1, constants as `aa^` and `aa^~`
	 */
	void performSelfTestOneVariable(void) {
		tabulateContext_t app(ctx);
		formulaPool_t     pool(ctx);
		catalog_t         catalog(ctx);

		runPipeline(app, pool, catalog, 1, 1, 1000);

		if (!catalog.isComplete() || catalog.numTable() != 4) {
			printf("{\"error\":\"incomplete\",\"where\":\"%s:%s:%d\",\"numTable\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, catalog.numTable());
			exit(1);
		}

		static const char *tests[][2] = {
			{"a",    "01"},
			{"a~",   "10"},
			{"aa^",  "00"},
			{"aa^~", "11"},
			{NULL,   NULL}
		};

		for (unsigned i = 0; tests[i][0]; i++) {
			uint32_t eid = entryOfName(pool, catalog, tests[i][0]);
			uint32_t ref = pool.loadString(tests[i][0]);
			char     text[(1 << MAXVARIABLE) + 1];

			catalog.entries[eid].footprint.toString(1, text);

			if (eid == 0 || ::strcmp(text, tests[i][1]) != 0 || !isMinimal(catalog, eid, ref)) {
				printf("{\"error\":\"single variable failed\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"eid\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i][0], eid);
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 11:08:21
	 *
	 * Test catalog invariants after a complete run
	 *   - every formula has the truth table of its entry
	 *   - minimal formulas have the minimal size and none smaller exists
	 *   - every generated formula is ingested exactly once
	 *   - every truth table has exactly one entry
	 */
	void performSelfTestCatalog(void) {
		tabulateContext_t app(ctx);
		formulaPool_t     pool(ctx);
		catalog_t         catalog(ctx);

		runPipeline(app, pool, catalog, 3, 2, 100000);

		evaluator_t evaluator(ctx, pool);
		uint64_t    numTotal = 0;

		for (uint32_t iTable = 0; iTable < catalog.numTable(); iTable++) {
			const entry_t *pEntry = catalog.tableAt(iTable);
			uint32_t      iEid    = catalog_t::IDFIRST + iTable;
			unsigned      numAll  = 0;
			unsigned      numMin  = 0;

			// truth tables are unique
			if (catalog.entryIndex[catalog.lookupEntry(pEntry->footprint)] != iEid) {
				printf("{\"error\":\"truth table not unique\",\"where\":\"%s:%s:%d\",\"eid\":%u}\n", __FUNCTION__, __FILE__, __LINE__, iEid);
				exit(1);
			}

			for (uint32_t iRef = pEntry->firstFormula; iRef; iRef = catalog.nextOfFormula(iRef)) {
				if (!evaluator.evaluate(iRef).equals(pEntry->footprint) || catalog.entryOfFormula(iRef) != iEid) {
					printf("{\"error\":\"formula in wrong entry\",\"where\":\"%s:%s:%d\",\"eid\":%u,\"name\":\"%s\"}\n",
					       __FUNCTION__, __FILE__, __LINE__, iEid, pool.saveString(iRef));
					exit(1);
				}
				if (pool.sizeOf(iRef) < pEntry->minSize) {
					printf("{\"error\":\"formula smaller than minimal\",\"where\":\"%s:%s:%d\",\"eid\":%u,\"name\":\"%s\"}\n",
					       __FUNCTION__, __FILE__, __LINE__, iEid, pool.saveString(iRef));
					exit(1);
				}
				numAll++;
			}

			for (uint32_t iRef = pEntry->firstMinimal; iRef; iRef = catalog.nextOfMinimal(iRef)) {
				if (pool.sizeOf(iRef) != pEntry->minSize || catalog.entryOfFormula(iRef) != iEid) {
					printf("{\"error\":\"minimal formula failed\",\"where\":\"%s:%s:%d\",\"eid\":%u,\"name\":\"%s\"}\n",
					       __FUNCTION__, __FILE__, __LINE__, iEid, pool.saveString(iRef));
					exit(1);
				}
				numMin++;
			}

			if (numAll != pEntry->numFormula || numMin != pEntry->numMinimal || numMin == 0) {
				printf("{\"error\":\"list length failed\",\"where\":\"%s:%s:%d\",\"eid\":%u,\"numAll\":%u,\"numMin\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, iEid, numAll, numMin);
				exit(1);
			}

			numTotal += numAll;
		}

		// every generated formula is listed exactly once
		if (numTotal != catalog.numFormula || numTotal != 2 * (uint64_t) (pool.numNode - formulaPool_t::KSTART)) {
			printf("{\"error\":\"formula count failed\",\"where\":\"%s:%s:%d\",\"encountered\":%lu,\"numFormula\":%u,\"numNode\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, numTotal, catalog.numFormula, pool.numNode);
			exit(1);
		}

		// generation order of the all-formulas list
		for (uint32_t i = 0; i < catalog.numFormula; i++) {
			uint32_t expected = (formulaPool_t::KSTART + i / 2) | ((i & 1) ? IBIT : 0);
			if (catalog.formulaAt(i) != expected) {
				printf("{\"error\":\"generation order failed\",\"where\":\"%s:%s:%d\",\"index\":%u}\n", __FUNCTION__, __FILE__, __LINE__, i);
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 11:30:55
	 *
	 * Test the minimality policy with out of order ingestion
	 */
	void performSelfTestPolicy(void) {
		formulaPool_t pool(ctx);
		catalog_t     catalog(ctx);
		evaluator_t   evaluator(ctx, pool);

		pool.create(2, 100, 2.0);
		pool.addLiterals();
		catalog.create(2, pool.maxNode, 2.0);

		struct {
			const char *name;
			char       cmp;
			unsigned   minSize;
			unsigned   numMinimal;
		} tests[] = {
			{"ab&b&", '*', 2, 1},
			{"ab&",   '+', 1, 1},
			{"ba&",   '=', 1, 2},
			{"ab&a&", '-', 1, 2},
			{NULL,    0,   0, 0}
		};

		uint32_t eid = 0;
		for (unsigned i = 0; tests[i].name; i++) {
			uint32_t ref = pool.loadString(tests[i].name);
			char     cmp;

			eid = catalog.ingest(ref, pool.sizeOf(ref), evaluator.evaluate(ref), &cmp);

			const entry_t *pEntry = catalog.entries + eid;

			if (cmp != tests[i].cmp || pEntry->minSize != tests[i].minSize || pEntry->numMinimal != tests[i].numMinimal || pEntry->numFormula != i + 1) {
				printf("{\"error\":\"policy failed\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"cmp\":\"%c\",\"minSize\":%u,\"numMinimal\":%u,\"numFormula\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, tests[i].name, cmp, pEntry->minSize, pEntry->numMinimal, pEntry->numFormula);
				exit(1);
			}
		}

		// one truth table, minimal list is `ab&` then `ba&`
		const entry_t *pEntry = catalog.entries + eid;

		if (catalog.numTable() != 1 || pEntry->firstMinimal != pool.loadString("ab&") || catalog.nextOfMinimal(pEntry->firstMinimal) != pool.loadString("ba&")) {
			printf("{\"error\":\"minimal list failed\",\"where\":\"%s:%s:%d\",\"first\":\"%s\"}\n",
			       __FUNCTION__, __FILE__, __LINE__, pool.saveString(pEntry->firstMinimal));
			exit(1);
		}

		// all formulas in ingestion order
		unsigned i = 0;
		for (uint32_t iRef = pEntry->firstFormula; iRef; iRef = catalog.nextOfFormula(iRef), i++) {
			if (iRef != pool.loadString(tests[i].name)) {
				printf("{\"error\":\"formula list failed\",\"where\":\"%s:%s:%d\",\"index\":%u,\"name\":\"%s\"}\n",
				       __FUNCTION__, __FILE__, __LINE__, i, pool.saveString(iRef));
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 11:52:18
	 *
	 * Test that 5 variables terminate under a small ceiling and report incomplete.
	 * Also test that insufficient capacity truncates at a size class boundary.
	 */
	void performSelfTestBoundary(void) {
		{
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			runPipeline(app, pool, catalog, 5, 2, 1000000);

			if (catalog.isComplete() || app.generator.truncated || app.generator.sizeReached != 2 || catalog.numTable() == 0) {
				printf("{\"error\":\"ceiling failed\",\"where\":\"%s:%s:%d\",\"numTable\":%u,\"truncated\":%u,\"sizeReached\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, catalog.numTable(), app.generator.truncated, app.generator.sizeReached);
				exit(1);
			}
		}

		{
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			runPipeline(app, pool, catalog, 5, 3, 100000);

			if (catalog.isComplete() || app.generator.truncated != 3 || app.generator.sizeReached != 2) {
				printf("{\"error\":\"truncation failed\",\"where\":\"%s:%s:%d\",\"numTable\":%u,\"truncated\":%u,\"sizeReached\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, catalog.numTable(), app.generator.truncated, app.generator.sizeReached);
				exit(1);
			}

			json_t *jResult = app.jsonInfo(NULL);
			if (json_is_true(json_object_get(jResult, "complete")) || !json_is_true(json_object_get(jResult, "truncated"))) {
				printf("{\"error\":\"status failed\",\"where\":\"%s:%s:%d\",\"status\":%s}\n",
				       __FUNCTION__, __FILE__, __LINE__, json_dumps(jResult, JSON_PRESERVE_ORDER | JSON_COMPACT));
				exit(1);
			}
			json_decref(jResult);
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 12:10:44
	 *
	 * Load a file
	 *
	 * @param {string} fileName - path
	 * @return {string} contents
	 */
	std::string loadFile(const std::string &fileName) {
		std::string text;
		char        buf[4096];

		FILE *inf = ::fopen(fileName.c_str(), "r");
		if (!inf) {
			printf("{\"error\":\"fopen('r','%s')\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", fileName.c_str(), __FUNCTION__, __FILE__, __LINE__);
			exit(1);
		}

		size_t len;
		while ((len = ::fread(buf, 1, sizeof(buf), inf)) > 0)
			text.append(buf, len);
		::fclose(inf);

		return text;
	}

	/**
	 * @date 2026-10-14 12:15:02
	 *
	 * Test text and html renderers
	 */
	void performSelfTestRender(void) {
		char dirName[] = "/tmp/tabulate-selftest-XXXXXX";

		if (!::mkdtemp(dirName)) {
			printf("{\"error\":\"mkdtemp()\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", __FUNCTION__, __FILE__, __LINE__);
			exit(1);
		}

		/*
		 * Text, two variables
		 */
		{
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			app.opt_outDir = dirName;
			runPipeline(app, pool, catalog, 2, 1, 1000);
			app.writeFormulaList();

			std::string text = loadFile(app.outputPath("formulalist.txt"));

			unsigned numLine = 0;
			for (size_t i = 0; i < text.size(); i++) {
				if (text[i] == '\n')
					numLine++;
			}

			if (numLine != catalog.numFormula || text.compare(0, 6, "a\n~a\nb") != 0 || text.find("~(a & b)\n") == std::string::npos) {
				printf("{\"error\":\"formula list failed\",\"where\":\"%s:%s:%d\",\"numLine\":%u,\"numFormula\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, numLine, catalog.numFormula);
				exit(1);
			}

			// existing files are replaced with force
			app.opt_force = 1;
			app.writeFormulaList();
			::remove(app.outputPath("formulalist.txt").c_str());

			/*
			 * Html, single page
			 */
			if (app.writeTruthTables() != 1) {
				printf("{\"error\":\"expected single html page\",\"where\":\"%s:%s:%d\",\"numTable\":%u}\n", __FUNCTION__, __FILE__, __LINE__, catalog.numTable());
				exit(1);
			}

			// completed files are no longer subject to removal on interrupt
			if (!app.currentFile.empty() || app.outputFiles.size() != 3 || app.outputFiles[2] != app.outputPath("truthtables0.htm")) {
				printf("{\"error\":\"output bookkeeping failed\",\"where\":\"%s:%s:%d\",\"currentFile\":\"%s\",\"numOutput\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, app.currentFile.c_str(), (unsigned) app.outputFiles.size());
				exit(1);
			}

			std::string html = loadFile(app.outputPath("truthtables0.htm"));

			if (html.compare(0, 6, "<html>") != 0 || html.find("</body>\n</html>\n") != html.size() - 16) {
				printf("{\"error\":\"html page incomplete\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
				exit(1);
			}

			if (html.find("<h3>0110</h3>") == std::string::npos ||
			    html.find("Minimum Formula: a ^ b") == std::string::npos ||
			    html.find("<li>a &amp; b</li>") == std::string::npos ||
			    html.find("<th>a</th>") == std::string::npos) {
				printf("{\"error\":\"html page failed\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
				exit(1);
			}

			::remove(app.outputPath("truthtables0.htm").c_str());
		}

		/*
		 * Html, pagination with 4 variables
		 */
		{
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			app.opt_outDir = dirName;
			runPipeline(app, pool, catalog, 4, 2, 100000);

			unsigned numFile  = app.writeTruthTables();
			unsigned expected = (catalog.numTable() + tabulateContext_t::TABLESPERFILE - 1) / tabulateContext_t::TABLESPERFILE;

			if (numFile != expected || numFile < 2) {
				printf("{\"error\":\"pagination failed\",\"where\":\"%s:%s:%d\",\"numFile\":%u,\"expected\":%u,\"numTable\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, numFile, expected, catalog.numTable());
				exit(1);
			}

			for (unsigned iFile = 0; iFile < numFile; iFile++) {
				char name[64];
				sprintf(name, "truthtables%u.htm", iFile);

				std::string html = loadFile(app.outputPath(name));

				// count tables
				unsigned numTable = 0;
				for (size_t pos = html.find("<table"); pos != std::string::npos; pos = html.find("<table", pos + 1))
					numTable++;

				unsigned wanted = (iFile + 1 < numFile) ? (unsigned) tabulateContext_t::TABLESPERFILE : catalog.numTable() - iFile * tabulateContext_t::TABLESPERFILE;
				if (numTable != wanted) {
					printf("{\"error\":\"tables per page failed\",\"where\":\"%s:%s:%d\",\"file\":\"%s\",\"encountered\":%u,\"expected\":%u}\n",
					       __FUNCTION__, __FILE__, __LINE__, name, numTable, wanted);
					exit(1);
				}

				::remove(app.outputPath(name).c_str());
			}
		}

		::rmdir(dirName);

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}

	/**
	 * @date 2026-10-14 12:48:30
	 *
	 * Ingest the same formula twice. This must terminate with an error.
	 */
	void performSelfTestDuplicate(void) {
		formulaPool_t pool(ctx);
		catalog_t     catalog(ctx);
		evaluator_t   evaluator(ctx, pool);

		pool.create(2, 100, 2.0);
		pool.addLiterals();
		catalog.create(2, pool.maxNode, 2.0);

		uint32_t ref = pool.loadString("ab^");

		catalog.ingest(ref, pool.sizeOf(ref), evaluator.evaluate(ref));
		// should not return
		catalog.ingest(ref, pool.sizeOf(ref), evaluator.evaluate(ref));

		printf("{\"error\":\"duplicate ingestion accepted\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
	}

	/**
	 * @date 2026-10-14 12:50:17
	 *
	 * Ingest into a finalised catalog. This must terminate with an error.
	 */
	void performSelfTestFinalised(void) {
		formulaPool_t pool(ctx);
		catalog_t     catalog(ctx);
		evaluator_t   evaluator(ctx, pool);

		pool.create(2, 100, 2.0);
		pool.addLiterals();
		catalog.create(2, pool.maxNode, 2.0);

		uint32_t refA = pool.loadString("ab&");
		uint32_t refB = pool.loadString("ab+");

		catalog.ingest(refA, pool.sizeOf(refA), evaluator.evaluate(refA));
		catalog.finalise();
		// should not return
		catalog.ingest(refB, pool.sizeOf(refB), evaluator.evaluate(refB));

		printf("{\"error\":\"ingestion after finalise accepted\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
	}

	/**
	 * @date 2026-10-14 12:52:40
	 *
	 * Write an existing output file without `--force`. This must terminate with an error and leave the file intact.
	 */
	void performSelfTestOverwrite(void) {
		char dirName[] = "/tmp/tabulate-selftest-XXXXXX";

		if (!::mkdtemp(dirName)) {
			printf("{\"error\":\"mkdtemp()\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", __FUNCTION__, __FILE__, __LINE__);
			exit(1);
		}

		tabulateContext_t app(ctx);
		formulaPool_t     pool(ctx);
		catalog_t         catalog(ctx);

		app.opt_outDir = dirName;
		runPipeline(app, pool, catalog, 1, 1, 1000);

		// first write creates the file
		app.writeFormulaList();
		// should not return
		app.writeFormulaList();

		printf("{\"error\":\"existing file overwritten\",\"where\":\"%s:%s:%d\"}\n", __FUNCTION__, __FILE__, __LINE__);
	}

	/**
	 * @date 2026-10-14 12:55:03
	 *
	 * Add a node beyond pool capacity. This must terminate with an error.
	 */
	void performSelfTestStorageFull(void) {
		formulaPool_t pool(ctx);

		// room for the reserved node, 2 literals and one operator
		pool.create(2, formulaPool_t::KSTART + 2 + 1, 2.0);
		pool.addLiterals();

		if (pool.loadString("ab&") == 0) {
			printf("{\"error\":\"last node rejected\",\"where\":\"%s:%s:%d\",\"numNode\":%u,\"maxNode\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, pool.numNode, pool.maxNode);
			return;
		}

		// should not return
		pool.loadString("ab+");

		printf("{\"error\":\"storage overflow accepted\",\"where\":\"%s:%s:%d\",\"numNode\":%u}\n", __FUNCTION__, __FILE__, __LINE__, pool.numNode);
	}

	/**
	 * @date 2026-10-14 12:58:12
	 *
	 * Test that the default size ceiling completes the catalog where tractable
	 * and that the default capacity fits that ceiling.
	 */
	void performSelfTestDefaults(void) {
		static const unsigned expected[] = {0, 1, 1, 4, 3, 3};

		for (unsigned numVariable = 1; numVariable <= MAXVARIABLE; numVariable++) {
			tabulateContext_t app(ctx);

			app.opt_numVariable = numVariable;
			app.resolveDefaults();

			uint64_t numNode;
			unsigned sizePlanned = generator_t::planSize(numVariable, app.opt_maxSize, app.opt_maxNode, &numNode, NULL);

			if (app.opt_maxSize != expected[numVariable] || sizePlanned != app.opt_maxSize || numNode != app.opt_maxNode) {
				printf("{\"error\":\"defaults failed\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"maxSize\":%u,\"sizePlanned\":%u,\"maxNode\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, app.opt_maxSize, sizePlanned, app.opt_maxNode);
				exit(1);
			}

			// explicit options are kept
			app.opt_maxSize = 2;
			app.opt_maxNode = 5000;
			app.resolveDefaults();
			if (app.opt_maxSize != 2 || app.opt_maxNode != 5000) {
				printf("{\"error\":\"explicit options replaced\",\"where\":\"%s:%s:%d\",\"numVariable\":%u}\n", __FUNCTION__, __FILE__, __LINE__, numVariable);
				exit(1);
			}
		}

		// default runs for 1 and 2 variables are complete
		for (unsigned numVariable = 1; numVariable <= 2; numVariable++) {
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			app.opt_numVariable = numVariable;

			unsigned savVerbose = ctx.opt_verbose;
			if (ctx.opt_verbose < ctx.VERBOSE_VERBOSE)
				ctx.opt_verbose = ctx.VERBOSE_NONE;
			app.createStores(pool, catalog);
			app.formulasFromGenerator();
			ctx.opt_verbose = savVerbose;

			if (!catalog.isComplete() || app.generator.truncated) {
				printf("{\"error\":\"default run incomplete\",\"where\":\"%s:%s:%d\",\"numVariable\":%u,\"numTable\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, numVariable, catalog.numTable());
				exit(1);
			}
		}

		// 3 variables need size 4, size 3 misses 24 truth tables
		{
			tabulateContext_t app(ctx);
			formulaPool_t     pool(ctx);
			catalog_t         catalog(ctx);

			runPipeline(app, pool, catalog, 3, 3, 1000000);

			if (catalog.isComplete() || catalog.numTable() != 232 || app.generator.truncated) {
				printf("{\"error\":\"size 3 coverage failed\",\"where\":\"%s:%s:%d\",\"numTable\":%u,\"truncated\":%u}\n",
				       __FUNCTION__, __FILE__, __LINE__, catalog.numTable(), app.generator.truncated);
				exit(1);
			}
		}

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] %s() passed\n", ctx.timeAsString(), __FUNCTION__);
	}
};

/*
 * I/O and Application context.
 * Needs to be global to be accessible by signal handlers.
 *
 * @global {context_t} I/O context
 * @global {selftestContext_t} Application context
 */
context_t         ctx;
selftestContext_t app(ctx);

/**
 * @date 2026-10-14 12:55:11
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
 * @date 2026-10-14 12:56:02
 *
 * Program usage. Keep this directly above `main()`
 *
 * @param {string[]} argv - program arguments
 * @param {boolean} verbose - set to true for option descriptions
 */
void usage(char *argv[], bool verbose) {
	fprintf(stderr, "usage: %s\n", argv[0]);

	if (verbose) {
		fprintf(stderr, "\n");
		fprintf(stderr, "\t   --duplicate                     Run double ingestion test, expected to fail\n");
		fprintf(stderr, "\t   --finalised                     Run ingestion after finalise test, expected to fail\n");
		fprintf(stderr, "\t-h --help                          This list\n");
		fprintf(stderr, "\t   --[no-]paranoid                 Expensive assertions [default=%s]\n", (ctx.flags & context_t::MAGICMASK_PARANOID) ? "enabled" : "disabled");
		fprintf(stderr, "\t   --overwrite                     Run overwrite without --force test, expected to fail\n");
		fprintf(stderr, "\t-q --quiet                         Say less\n");
		fprintf(stderr, "\t   --storagefull                   Run pool capacity test, expected to fail\n");
		fprintf(stderr, "\t   --test=<group>                  Run only footprint|notation|evaluate|generator|small|catalog|boundary|defaults|render\n");
		fprintf(stderr, "\t   --timer=<seconds>               Interval timer for verbose updates [default=%u]\n", ctx.opt_timer);
		fprintf(stderr, "\t-v --verbose                       Say more\n");
	}
}

/**
 * @date 2026-10-14 12:58:40
 *
 * Program main entry point
 *
 * @param  {number} argc - number of arguments
 * @param  {string[]} argv - program arguments
 * @return {number} 0 on normal return, non-zero when attention is required
 */
int main(int argc, char *argv[]) {
	setlinebuf(stdout);

	/*
	 *  Process program options
	 */
	for (;;) {
		// Long option shortcuts
		enum {
			// long-only opts
			LO_DEBUG   = 1,
			LO_DUPLICATE,
			LO_FINALISED,
			LO_NOPARANOID,
			LO_OVERWRITE,
			LO_PARANOID,
			LO_STORAGEFULL,
			LO_TEST,
			LO_TIMER,
			// short opts
			LO_HELP    = 'h',
			LO_QUIET   = 'q',
			LO_VERBOSE = 'v',
		};

		// long option descriptions
		static struct option long_options[] = {
			/* name, has_arg, flag, val */
			{"debug",       1, 0, LO_DEBUG},
			{"duplicate",   0, 0, LO_DUPLICATE},
			{"finalised",   0, 0, LO_FINALISED},
			{"help",        0, 0, LO_HELP},
			{"no-paranoid", 0, 0, LO_NOPARANOID},
			{"overwrite",   0, 0, LO_OVERWRITE},
			{"paranoid",    0, 0, LO_PARANOID},
			{"quiet",       2, 0, LO_QUIET},
			{"storagefull", 0, 0, LO_STORAGEFULL},
			{"test",        1, 0, LO_TEST},
			{"timer",       1, 0, LO_TIMER},
			{"verbose",     2, 0, LO_VERBOSE},
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
		*cp        = '\0';

		// parse long options
		int c = getopt_long(argc, argv, optstring, long_options, &option_index);
		if (c == -1)
			break;

		switch (c) {
		case LO_DEBUG:
			ctx.opt_debug = ::strtoul(optarg, NULL, 0);
			break;
		case LO_DUPLICATE:
			app.opt_duplicate++;
			break;
		case LO_FINALISED:
			app.opt_finalised++;
			break;
		case LO_OVERWRITE:
			app.opt_overwrite++;
			break;
		case LO_STORAGEFULL:
			app.opt_storageFull++;
			break;
		case LO_HELP:
			usage(argv, true);
			exit(0);
		case LO_NOPARANOID:
			ctx.flags &= ~context_t::MAGICMASK_PARANOID;
			break;
		case LO_PARANOID:
			ctx.flags |= context_t::MAGICMASK_PARANOID;
			break;
		case LO_QUIET:
			ctx.opt_verbose = optarg ? ::strtoul(optarg, NULL, 0) : ctx.opt_verbose - 1;
			break;
		case LO_TEST:
			app.opt_test = optarg;
			break;
		case LO_TIMER:
			ctx.opt_timer = ::strtoul(optarg, NULL, 0);
			break;
		case LO_VERBOSE:
			ctx.opt_verbose = optarg ? ::strtoul(optarg, NULL, 0) : ctx.opt_verbose + 1;
			break;

		case '?':
			fprintf(stderr, "Try `%s --help' for more information.\n", argv[0]);
			exit(1);
		default:
			fprintf(stderr, "getopt_long() returned character code %d\n", c);
			exit(1);
		}
	}

	if (argc - optind >= 1) {
		usage(argv, false);
		exit(1);
	}

	// register timer handler
	if (ctx.opt_timer) {
		signal(SIGALRM, sigalrmHandler);
		::alarm(ctx.opt_timer);
	}

	if (app.opt_duplicate) {
		/*
		 * Test that double ingestion is a contract violation
		 */
		app.performSelfTestDuplicate();
		return 0;
	}
	if (app.opt_finalised) {
		/*
		 * Test that a finalised catalog is read-only
		 */
		app.performSelfTestFinalised();
		return 0;
	}
	if (app.opt_overwrite) {
		/*
		 * Test that existing output is not overwritten without `--force`
		 */
		app.performSelfTestOverwrite();
		return 0;
	}
	if (app.opt_storageFull) {
		/*
		 * Test that exceeding pool capacity is fatal
		 */
		app.performSelfTestStorageFull();
		return 0;
	}

	/*
	 * Test that footprints have the right length
	 */
	if (app.wantTest("footprint"))
		app.performSelfTestFootprint();

	/*
	 * Test that notation encoding/decoding works as expected
	 */
	if (app.wantTest("notation"))
		app.performSelfTestNotation();

	/*
	 * Test that evaluating formulas gives known truth tables
	 */
	if (app.wantTest("evaluate"))
		app.performSelfTestEvaluate();

	/*
	 * Test generator ordering and counts
	 */
	if (app.wantTest("generator"))
		app.performSelfTestGenerator();

	/*
	 * Test known results for small variable counts
	 */
	if (app.wantTest("small")) {
		app.performSelfTestOneVariable();
		app.performSelfTestTwoVariables();
	}

	/*
	 * Test catalog invariants and minimality policy
	 */
	if (app.wantTest("catalog")) {
		app.performSelfTestCatalog();
		app.performSelfTestPolicy();
	}

	/*
	 * Test termination and incompleteness
	 */
	if (app.wantTest("boundary"))
		app.performSelfTestBoundary();

	/*
	 * Test size ceiling and capacity defaults
	 */
	if (app.wantTest("defaults"))
		app.performSelfTestDefaults();

	/*
	 * Test renderers
	 */
	if (app.wantTest("render"))
		app.performSelfTestRender();

	if (app.numRun == 0) {
		fprintf(stderr, "unknown test group \"%s\"\n", app.opt_test);
		exit(1);
	}

	return 0;
}
