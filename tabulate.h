#ifndef _TABULATE_H
#define _TABULATE_H

/*
 * @date 2026-10-13 10:02:14
 *
 * `tabulate` enumerates all formulas over `numVariable` variables up to a size ceiling,
 * groups them by truth table and selects the minimal formulas of every group.
 *
 * Pipeline, one formula at a time:
 *   generator -> evaluator -> catalog
 *
 * After generation the catalog is finalised and rendered, either as a flat text file
 * `formulalist.txt` or as paginated html files `truthtables<N>.htm`.
 *
 * @date 2026-10-13 10:05:51
 *
 * Text modes:
 *
 * `--text[=1]` Brief mode that shows formulas that created or improved the minimal formulas of a truth table.
 *
 *              <name>
 *
 * `--text=2`   Full mode of all formulas passed to `foundFormula()`.
 *
 *              <progress> <eid> <cmp> <name> <size>
 *
 *              where:
 *                  <progress> is the formula sequence number assigned by the generator.
 *                  <eid> is the catalog entry id.
 *                  <cmp> is the result of `catalog_t::challenge()` against the minimal formulas.
 *
 *              <cmp> can be:
 *                  cmp = '*'; // new truth table
 *                  cmp = '+'; // better, minimal formulas replaced
 *                  cmp = '='; // tie, appended to minimal formulas
 *                  cmp = '-'; // worse
 *
 * `--text=3`   Brief catalog, one line per truth table in order of discovery, with its first minimal formula.
 *
 *              <table> <name>
 *
 * `--text=4`   Verbose catalog
 *
 *              <eid> <table> <minSize> <numMinimal> <numFormula> <name>[,<name>]*
 *
 * Tables are written as a string of '0'/'1' in assignment order, assignment 0 first.
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

#include <errno.h>
#include <jansson.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <string>
#include <vector>

#include "catalog.h"
#include "evaluator.h"
#include "generator.h"
#include "html.h"
#include "pool.h"

/**
 * @date 2026-10-13 10:11:27
 *
 * Main program logic as application context
 * It is contained as an independent `struct` so it can be easily included into projects/code
 *
 * @typedef {object}
 */
struct tabulateContext_t : callable_t {

	enum {
		/// @constant {number} - `--text` modes
		OPTTEXT_WON     = 1,
		OPTTEXT_COMPARE = 2,
		OPTTEXT_BRIEF   = 3,
		OPTTEXT_VERBOSE = 4,
	};

	enum {
		/// @constant {number} - `--output` modes
		OUTPUT_TEXT = 1,
		OUTPUT_HTML = 2,
	};

	enum {
		/// @constant {number} - `--maxsize` not specified
		MAXSIZE_AUTO = MAXSIZE + 1,
		/// @constant {number} - upper limit of `--maxnode`, two formula slots per node must stay below `IBIT`
		MAXNODE_LIMIT = 1 << 30,
	};

	enum {
		/// @constant {number} - truth tables per html file
		TABLESPERFILE = 256,
		/// @constant {number} - html header level of table titles
		TABLEHEADER   = 3,
		/// @constant {number} - html table border thickness
		TABLEBORDER   = 1,
	};

	/// @var {context_t} I/O context
	context_t &ctx;

	/*
	 * User specified program arguments and options
	 */

	/// @var {number} --numvar, number of variables
	unsigned   opt_numVariable;
	/// @var {number} --output, renderer
	unsigned   opt_output;
	/// @var {string} --outdir, directory for output files
	const char *opt_outDir;
	/// @var {number} --maxsize, size ceiling in binary operators, `MAXSIZE_AUTO` to select by number of variables
	unsigned   opt_maxSize;
	/// @var {number} --maxnode, pool capacity, 0 to fit the size ceiling
	unsigned   opt_maxNode;
	/// @var {number} --ratio, index/data ratio
	double     opt_ratio;
	/// @var {number} --force, overwrite existing output files
	unsigned   opt_force;
	/// @var {number} --text, textual output to stdout
	unsigned   opt_text;

	/// @var {formulaPool_t} - formula store
	formulaPool_t *pPool;
	/// @var {catalog_t} - truth table catalog
	catalog_t     *pCatalog;
	/// @var {evaluator_t} - truth table evaluator
	evaluator_t   *pEvaluator;

	/// @var {generator_t} - THE generator
	generator_t generator;

	/// @var {number} highest size class that fits the pool
	unsigned sizePlanned;
	/// @var {number} formulas expected from the generator
	uint64_t numPlanned;

	/// @var {string} output file being written, removed on interrupt
	std::string              currentFile;
	/// @var {string[]} output files written
	std::vector<std::string> outputFiles;

	/**
	 * Constructor
	 */
	tabulateContext_t(context_t &ctx) : ctx(ctx), generator(ctx) {
		// arguments and options
		opt_numVariable = 3;
		opt_output      = OUTPUT_TEXT;
		opt_outDir      = ".";
		opt_maxSize     = MAXSIZE_AUTO;
		opt_maxNode     = 0;
		opt_ratio       = 2.0;
		opt_force       = 0;
		opt_text        = 0;

		pPool       = NULL;
		pCatalog    = NULL;
		pEvaluator  = NULL;
		sizePlanned = 0;
		numPlanned  = 0;
	}

	/**
	 * @date 2026-10-13 10:16:02
	 *
	 * Smallest size ceiling at which all truth tables are found.
	 * 1 and 2 variables complete at size 1, 3 variables at size 4.
	 * 4 and more variables are intractable, settle for size 3.
	 *
	 * @param {number} numVariable - number of variables
	 * @return {number} size ceiling
	 */
	static unsigned defaultMaxSize(unsigned numVariable) {
		if (numVariable <= 2)
			return 1;
		if (numVariable == 3)
			return 4;
		return 3;
	}

	/**
	 * @date 2026-10-13 10:18:11
	 *
	 * Replace unspecified `--maxsize` and `--maxnode` by values derived from the number of variables
	 */
	void resolveDefaults(void) {
		if (opt_maxSize == MAXSIZE_AUTO)
			opt_maxSize = defaultMaxSize(opt_numVariable);

		if (opt_maxNode == 0) {
			uint64_t numNode;

			generator_t::planSize(opt_numVariable, opt_maxSize, MAXNODE_LIMIT, &numNode, NULL);
			opt_maxNode = (unsigned) numNode;
		}
	}

	/**
	 * @date 2026-10-13 10:20:36
	 *
	 * Plan and allocate storage. Only whole size classes that fit `--maxnode` are allocated.
	 * Unspecified options are resolved first.
	 *
	 * @param {formulaPool_t} pool - formula store
	 * @param {catalog_t} catalog - truth table catalog
	 */
	void createStores(formulaPool_t &pool, catalog_t &catalog) {
		uint64_t numNode;

		resolveDefaults();

		sizePlanned = generator_t::planSize(opt_numVariable, opt_maxSize, opt_maxNode, &numNode, &numPlanned);

		if (sizePlanned < opt_maxSize && ctx.opt_verbose >= ctx.VERBOSE_WARNING)
			fprintf(stderr, "[%s] WARNING: size %u does not fit --maxnode=%u, generation stops after size %u\n",
				ctx.timeAsString(), sizePlanned + 1, opt_maxNode, sizePlanned);

		pool.create(opt_numVariable, (uint32_t) numNode, opt_ratio);
		catalog.create(opt_numVariable, pool.maxNode, opt_ratio);

		pPool    = &pool;
		pCatalog = &catalog;
	}

	/**
	 * @date 2026-10-13 10:28:02
	 *
	 * Found formula. Evaluate and ingest.
	 *
	 * @param {number} ref - formula handle
	 * @param {number} size - formula size
	 * @return {boolean} return `true` to continue generating
	 */
	bool foundFormula(uint32_t ref, unsigned size) {

		if (ctx.opt_verbose >= ctx.VERBOSE_TICK && ctx.tick) {
			unsigned perSecond = ctx.updateSpeed();

			if (ctx.progressHi == 0 || ctx.progress > ctx.progressHi) {
				fprintf(stderr, "\r\e[K[%s] %lu(%7u/s) | numNode=%u(%.0f%%) numTable=%u | size=%u hash=%.3f %s",
					ctx.timeAsString(), ctx.progress, perSecond,
					pPool->numNode, pPool->numNode * 100.0 / pPool->maxNode,
					pCatalog->numTable(),
					size, (double) ctx.cntCompare / ctx.cntHash, pPool->saveString(ref));
			} else {
				fprintf(stderr, "\r\e[K[%s] %lu(%7u/s) %.5f%% eta=%s | numNode=%u(%.0f%%) numTable=%u | size=%u hash=%.3f %s",
					ctx.timeAsString(), ctx.progress, perSecond, ctx.progress * 100.0 / ctx.progressHi, ctx.etaAsString(perSecond),
					pPool->numNode, pPool->numNode * 100.0 / pPool->maxNode,
					pCatalog->numTable(),
					size, (double) ctx.cntCompare / ctx.cntHash, pPool->saveString(ref));
			}

			ctx.tick = 0;
		}

		if (ctx.flags & context_t::MAGICMASK_PARANOID)
			pEvaluator->validate(ref);

		footprint_t footprint = pEvaluator->evaluateFast(ref);

		char     cmp;
		uint32_t eid = pCatalog->ingest(ref, size, footprint, &cmp);

		if (opt_text == OPTTEXT_WON && (cmp == '*' || cmp == '+'))
			printf("%s\n", pPool->saveString(ref));
		if (opt_text == OPTTEXT_COMPARE)
			printf("%lu\t%u\t%c\t%s\t%u\n", ctx.progress, eid, cmp, pPool->saveString(ref), size);

		return true;
	}

	/**
	 * @date 2026-10-13 10:41:19
	 *
	 * Run generator and feed the catalog
	 */
	void formulasFromGenerator(void) {

		evaluator_t evaluator(ctx, *pPool);
		pEvaluator = &evaluator;

		if (opt_numVariable >= 4 && ctx.opt_verbose >= ctx.VERBOSE_WARNING)
			fprintf(stderr, "[%s] WARNING: %u variables is practically intractable, expect an incomplete catalog\n", ctx.timeAsString(), opt_numVariable);

		if (ctx.opt_verbose >= ctx.VERBOSE_ACTIONS)
			fprintf(stderr, "[%s] Generating formulas for numVariable=%u maxSize=%u\n", ctx.timeAsString(), opt_numVariable, opt_maxSize);

		// reset progress
		ctx.setupSpeed(numPlanned);
		ctx.tick = 0;

		generator.initialiseGenerator(*pPool);
		generator.clearGenerator();
		generator.generateFormulas(opt_maxSize, this, static_cast<generator_t::generateFormulaCallback_t>(&tabulateContext_t::foundFormula));

		pEvaluator = NULL;

		if (ctx.opt_verbose >= ctx.VERBOSE_TICK)
			fprintf(stderr, "\r\e[K");

		if (ctx.progress != ctx.progressHi && !generator.aborted) {
			printf("{\"error\":\"progressHi failed\",\"where\":\"%s:%s:%d\",\"encountered\":%lu,\"expected\":%lu,\"numVariable\":%u,\"maxSize\":%u}\n",
			       __FUNCTION__, __FILE__, __LINE__, ctx.progress, ctx.progressHi, opt_numVariable, opt_maxSize);
		}

		pCatalog->finalise();

		if (generator.truncated) {
			if (ctx.opt_verbose >= ctx.VERBOSE_WARNING)
				fprintf(stderr, "[%s] WARNING: Formula storage full. Truncating at size=%u progress=%lu\n",
					ctx.timeAsString(), generator.truncated, ctx.progress);
		}

		if (!pCatalog->isComplete() && ctx.opt_verbose >= ctx.VERBOSE_WARNING)
			fprintf(stderr, "[%s] WARNING: incomplete, found %u of %lu truth tables\n",
				ctx.timeAsString(), pCatalog->numTable(), catalog_t::numPossible(opt_numVariable));

		if (ctx.opt_verbose >= ctx.VERBOSE_SUMMARY)
			fprintf(stderr, "[%s] numVariable=%u sizeReached=%u numNode=%u(%.0f%%) numFormula=%u numTable=%u | skipDuplicate=%lu\n",
				ctx.timeAsString(), opt_numVariable, generator.sizeReached,
				pPool->numNode, pPool->numNode * 100.0 / pPool->maxNode,
				pCatalog->numFormula, pCatalog->numTable(),
				generator.skipDuplicate);
	}

	/**
	 * @date 2026-10-13 10:55:40
	 *
	 * Display catalog for `--text=3` and `--text=4`
	 */
	void catalogToText(void) {
		char table[(1 << MAXVARIABLE) + 1];

		for (uint32_t iTable = 0; iTable < pCatalog->numTable(); iTable++) {
			const entry_t *pEntry = pCatalog->tableAt(iTable);
			uint32_t      iEid    = catalog_t::IDFIRST + iTable;

			pEntry->footprint.toString(opt_numVariable, table);

			if (opt_text == OPTTEXT_BRIEF) {
				printf("%s\t%s\n", table, pPool->saveString(pEntry->firstMinimal));
			} else if (opt_text == OPTTEXT_VERBOSE) {
				printf("%u\t%s\t%u\t%u\t%u\t", iEid, table, pEntry->minSize, pEntry->numMinimal, pEntry->numFormula);

				for (uint32_t iRef = pEntry->firstMinimal; iRef; iRef = pCatalog->nextOfMinimal(iRef)) {
					if (iRef != pEntry->firstMinimal)
						putchar(',');
					fputs(pPool->saveString(iRef), stdout);
				}
				putchar('\n');
			}
		}
	}

	/**
	 * @date 2026-10-13 11:03:12
	 *
	 * Construct output filename
	 *
	 * @param {string} pName - basename
	 * @return {string} path
	 */
	std::string outputPath(const char *pName) const {
		std::string path = opt_outDir;

		if (!path.empty() && path[path.size() - 1] != '/')
			path += '/';
		path += pName;

		return path;
	}

	/**
	 * @date 2026-10-13 11:05:44
	 *
	 * Create output directory if missing
	 */
	void createOutputDirectory(void) {
		if (::mkdir(opt_outDir, 0777) != 0 && errno != EEXIST)
			ctx.fatal("\n{\"error\":\"mkdir('%s')\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", opt_outDir, __FUNCTION__, __FILE__, __LINE__);
	}

	/**
	 * @date 2026-10-13 11:07:30
	 *
	 * Open an output file for writing.
	 * The file is registered as `currentFile` so an interrupt removes it.
	 *
	 * @param {string} fileName - path
	 * @return {FILE} open file, to be completed with `closeFile()`
	 */
	FILE *openFile(const std::string &fileName) {
		struct stat sbuf;

		if (!opt_force && !::stat(fileName.c_str(), &sbuf))
			ctx.fatal("\n{\"error\":\"file exists, use --force to overwrite\",\"where\":\"%s:%s:%d\",\"filename\":\"%s\"}\n", __FUNCTION__, __FILE__, __LINE__, fileName.c_str());

		currentFile = fileName;

		FILE *outf = ::fopen(fileName.c_str(), "w");
		if (!outf) {
			currentFile.clear();
			ctx.fatal("\n{\"error\":\"fopen('w','%s')\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", fileName.c_str(), __FUNCTION__, __FILE__, __LINE__);
		}

		return outf;
	}

	/**
	 * @date 2026-10-13 11:10:12
	 *
	 * Complete an output file opened with `openFile()`. Any write error removes the file and is fatal.
	 *
	 * @param {FILE} outf - open file
	 */
	void closeFile(FILE *outf) {
		std::string fileName = currentFile;

		bool failed = ::ferror(outf) != 0;
		if (::fclose(outf))
			failed = true;

		if (failed) {
			::remove(fileName.c_str());
			currentFile.clear();
			ctx.fatal("\n{\"error\":\"write('%s')\",\"where\":\"%s:%s:%d\",\"return\":\"%m\"}\n", fileName.c_str(), __FUNCTION__, __FILE__, __LINE__);
		}

		currentFile.clear();
		outputFiles.push_back(fileName);

		if (ctx.opt_verbose >= ctx.VERBOSE_ACTIONS)
			fprintf(stderr, "[%s] Written %s\n", ctx.timeAsString(), fileName.c_str());
	}

	/**
	 * @date 2026-10-13 11:15:58
	 *
	 * Text renderer. Every generated formula in infix notation, one per line, in generation order.
	 */
	void writeFormulaList(void) {
		FILE *outf = openFile(outputPath("formulalist.txt"));

		for (uint32_t i = 0; i < pCatalog->numFormula; i++) {
			std::string txt = pPool->infixString(pCatalog->formulaAt(i));

			fputs(txt.c_str(), outf);
			fputc('\n', outf);
		}

		closeFile(outf);
	}

	/**
	 * @date 2026-10-13 11:19:21
	 *
	 * Add a truth table with its formulas to a html page
	 *
	 * @param {htmlPage_t} page - page to add to
	 * @param {entry_t} pEntry - catalog entry
	 */
	void addHtmlTable(htmlPage_t &page, const entry_t *pEntry) const {
		char title[(1 << MAXVARIABLE) + 1];

		pEntry->footprint.toString(opt_numVariable, title);

		page.addHeader(TABLEHEADER, title);

		// truth table
		page.tableCreate(TABLEBORDER);
		page.tableAddRow();
		for (unsigned v = 0; v < opt_numVariable; v++)
			page.tableAddHeader(std::string(1, (char) ('a' + v)));
		page.tableAddHeader(title);

		for (unsigned a = 0; a < (1U << opt_numVariable); a++) {
			page.tableAddRow();
			for (unsigned v = 0; v < opt_numVariable; v++)
				page.tableAddData((a & (1U << v)) ? "T" : "F");
			page.tableAddData(pEntry->footprint.bit(a) ? "T" : "F");
		}
		page.tableEnd();

		// minimal formulas
		std::string minimal;
		for (uint32_t iRef = pEntry->firstMinimal; iRef; iRef = pCatalog->nextOfMinimal(iRef)) {
			if (iRef != pEntry->firstMinimal)
				minimal += ", ";
			minimal += htmlPage_t::escape(pPool->infixString(iRef));
		}
		page.addParagraph("Minimum Formula: " + minimal);

		// all formulas
		page.listCreate(false);
		for (uint32_t iRef = pEntry->firstFormula; iRef; iRef = pCatalog->nextOfFormula(iRef))
			page.listAddRow(htmlPage_t::escape(pPool->infixString(iRef)));
		page.listEnd();
	}

	/**
	 * @date 2026-10-13 11:31:07
	 *
	 * Html renderer. `TABLESPERFILE` truth tables per file, in order of discovery.
	 *
	 * @return {number} number of files written
	 */
	unsigned writeTruthTables(void) {
		uint32_t numTable = pCatalog->numTable();
		unsigned numFile  = (numTable + TABLESPERFILE - 1) / TABLESPERFILE;

		for (unsigned iFile = 0; iFile < numFile; iFile++) {
			char name[64];
			sprintf(name, "truthtables%u.htm", iFile);

			FILE       *outf = openFile(outputPath(name));
			htmlPage_t page(outf);

			uint32_t first = iFile * TABLESPERFILE;
			uint32_t last  = first + TABLESPERFILE;
			if (last > numTable)
				last = numTable;

			page.begin();
			for (uint32_t iTable = first; iTable < last; iTable++)
				addHtmlTable(page, pCatalog->tableAt(iTable));
			page.end();

			closeFile(outf);
		}

		return numFile;
	}

	/**
	 * @date 2026-10-13 11:40:49
	 *
	 * Collect run statistics
	 *
	 * @param {json_t} jResult - (optional) object to add to
	 * @return {json_t} result
	 */
	json_t *jsonInfo(json_t *jResult) const {
		if (jResult == NULL)
			jResult = json_object();
		json_object_set_new_nocheck(jResult, "numVariable", json_integer(opt_numVariable));
		json_object_set_new_nocheck(jResult, "maxSize", json_integer(opt_maxSize));
		json_object_set_new_nocheck(jResult, "sizeReached", json_integer(generator.sizeReached));
		json_object_set_new_nocheck(jResult, "truncated", generator.truncated ? json_true() : json_false());
		json_object_set_new_nocheck(jResult, "skipDuplicate", json_integer(generator.skipDuplicate));
		if (pPool) {
			json_object_set_new_nocheck(jResult, "numNode", json_integer(pPool->numNode));
			json_object_set_new_nocheck(jResult, "maxNode", json_integer(pPool->maxNode));
		}
		if (pCatalog)
			pCatalog->jsonInfo(jResult);
		if (!outputFiles.empty()) {
			json_t *jFiles = json_array();
			for (unsigned i = 0; i < outputFiles.size(); i++)
				json_array_append_new(jFiles, json_string(outputFiles[i].c_str()));
			json_object_set_new_nocheck(jResult, "filenames", jFiles);
		}

		return jResult;
	}
};

#endif
