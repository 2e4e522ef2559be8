#ifndef _CATALOG_H
#define _CATALOG_H

/*
 * @date 2026-10-12 15:02:38
 *
 * `catalog_t` groups formulas by truth table.
 *
 * There is one entry per distinct truth table, created on first sighting, in order of discovery.
 * Each entry holds two lists of formula handles:
 *   - all formulas with that truth table, in order of ingestion
 *   - the minimal formulas, those with the fewest binary operators, in order of ingestion
 *
 * Lists are single linked through arrays indexed by formula slot, `(id << 1) | negated`.
 * Entries are indexed with a hash array with overflow, keyed on the footprint.
 *
 * Minimality policy, as reported by `challenge()`:
 *   '*' first formula of a new entry
 *   '+' smaller than current minimum, the minimal list is replaced
 *   '=' same size, appended to the minimal list
 *   '-' larger, only appended to the all-formulas list
 *
 * When fed by the generator '+' never happens, formulas arrive in non-decreasing size.
 * It is implemented so the catalog is correct for any ingestion order.
 *
 * Each formula may be ingested once. A second ingestion is a contract violation and fatal.
 * After `finalise()` the catalog is read-only.
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

#include <jansson.h>
#include <stdint.h>
#include <string.h>

#include "datadef.h"

/**
 * @date 2026-10-12 15:10:44
 *
 * Truth table catalog
 *
 * @typedef {object}
 */
struct catalog_t {

	enum {
		/// @constant {number} First entry id, 0 is reserved for "not found"
		IDFIRST = 1,
	};

	/// @var {context_t} I/O context
	context_t &ctx;

	/// @var {number} number of variables
	unsigned numVariable;

	/// @var {entry_t[]} entries, in order of discovery
	entry_t *entries;
	/// @var {number} number of entries, including reserved
	uint32_t numEntry;
	/// @var {number} capacity
	uint32_t maxEntry;
	/// @var {number} index size, must be prime
	uint32_t entryIndexSize;
	/// @var {number[]} hash index on footprint
	uint32_t *entryIndex;

	/// @var {number} number of formula slots, twice the number of nodes
	uint32_t maxSlot;
	/// @var {number[]} per slot, next formula in the all-formulas list
	uint32_t *nextFormula;
	/// @var {number[]} per slot, next formula in the minimal list
	uint32_t *nextMinimal;
	/// @var {number[]} per slot, entry the formula was ingested in, 0 if not yet
	uint32_t *entryOf;

	/// @var {number[]} every ingested formula, in order of ingestion
	uint32_t *formulas;
	/// @var {number} number of ingested formulas
	uint32_t numFormula;

	/// @var {number} set when no more ingestion is allowed
	unsigned finalised;

	/**
	 * Constructor
	 */
	catalog_t(context_t &ctx) : ctx(ctx) {
		numVariable    = 0;
		entries        = NULL;
		numEntry       = 0;
		maxEntry       = 0;
		entryIndexSize = 0;
		entryIndex     = NULL;
		maxSlot        = 0;
		nextFormula    = NULL;
		nextMinimal    = NULL;
		entryOf        = NULL;
		formulas       = NULL;
		numFormula     = 0;
		finalised      = 0;
	}

	/**
	 * Release resources
	 */
	~catalog_t() {
		if (entries)
			ctx.myFree("catalog_t::entries", entries);
		if (entryIndex)
			ctx.myFree("catalog_t::entryIndex", entryIndex);
		if (nextFormula)
			ctx.myFree("catalog_t::nextFormula", nextFormula);
		if (nextMinimal)
			ctx.myFree("catalog_t::nextMinimal", nextMinimal);
		if (entryOf)
			ctx.myFree("catalog_t::entryOf", entryOf);
		if (formulas)
			ctx.myFree("catalog_t::formulas", formulas);
	}

	/**
	 * @date 2026-10-12 15:16:09
	 *
	 * Number of truth tables that exist for `numVariable`, `2^(2^numVariable)`
	 *
	 * @param {number} numVariable - number of variables
	 * @return {number} number of truth tables
	 */
	static inline uint64_t numPossible(unsigned numVariable) {
		return 1ULL << (1U << numVariable);
	}

	/**
	 * @date 2026-10-12 15:18:30
	 *
	 * Allocate storage
	 *
	 * @param {number} numVariable - number of variables
	 * @param {number} maxNode - capacity of the pool the formulas come from
	 * @param {number} ratio - index/data ratio
	 */
	void create(unsigned numVariable, uint32_t maxNode, double ratio) {
		assert(numVariable >= 1 && numVariable <= MAXVARIABLE);

		this->numVariable = numVariable;
		this->maxSlot     = maxNode * 2;

		// there can not be more entries than formulas or truth tables
		uint64_t max = numPossible(numVariable);
		if (max > this->maxSlot)
			max = this->maxSlot;
		this->maxEntry = IDFIRST + max;

		this->entries        = (entry_t *) ctx.myAlloc("catalog_t::entries", this->maxEntry, sizeof(*this->entries));
		this->entryIndexSize = ctx.nextPrime(ctx.dToMax(this->maxEntry * ratio));
		this->entryIndex     = (uint32_t *) ctx.myAlloc("catalog_t::entryIndex", this->entryIndexSize, sizeof(*this->entryIndex));
		this->nextFormula    = (uint32_t *) ctx.myAlloc("catalog_t::nextFormula", this->maxSlot, sizeof(*this->nextFormula));
		this->nextMinimal    = (uint32_t *) ctx.myAlloc("catalog_t::nextMinimal", this->maxSlot, sizeof(*this->nextMinimal));
		this->entryOf        = (uint32_t *) ctx.myAlloc("catalog_t::entryOf", this->maxSlot, sizeof(*this->entryOf));
		this->formulas       = (uint32_t *) ctx.myAlloc("catalog_t::formulas", this->maxSlot, sizeof(*this->formulas));

		this->numEntry   = IDFIRST;
		this->numFormula = 0;
		this->finalised  = 0;
	}

	/**
	 * @date 2026-10-12 15:24:12
	 *
	 * Slot of a formula handle in the link arrays
	 *
	 * @param {number} ref - formula handle
	 * @return {number} slot
	 */
	inline uint32_t slotOf(uint32_t ref) const {
		return ((ref & ~IBIT) << 1) | (ref >> 31);
	}

	/**
	 * @date 2026-10-12 15:25:40
	 *
	 * Perform entry lookup
	 *
	 * Lookup key in index using a hash array with overflow.
	 * Returns the offset within the index.
	 * If contents of index is 0, then not found, otherwise it the index where to find the entry.
	 *
	 * @param {footprint_t} v - key value
	 * @return {number} offset into index
	 */
	inline uint32_t lookupEntry(const footprint_t &v) {
		ctx.cntHash++;

		// calculate starting position
		uint32_t crc32 = v.crc32();

		uint32_t ix   = crc32 % entryIndexSize;
		uint32_t bump = ix;
		if (bump == 0)
			bump = entryIndexSize - 1; // may never be zero
		if (bump > 2147000041)
			bump = 2147000041; // may never exceed last 32bit prime

		for (;;) {
			ctx.cntCompare++;
			if (this->entryIndex[ix] == 0)
				return ix; // "not-found"

			const entry_t *pEntry = this->entries + this->entryIndex[ix];

			if (pEntry->footprint.equals(v))
				return ix; // "found"

			// overflow, jump to next entry
			// if `ix` and `bump` are both 31 bit values, then the addition will never overflow
			ix += bump;
			if (ix >= entryIndexSize)
				ix -= entryIndexSize;
		}
	}

	/**
	 * @date 2026-10-12 15:29:02
	 *
	 * Add a new entry
	 *
	 * @param {footprint_t} v - key value
	 * @return {number} entry id
	 */
	inline uint32_t addEntry(const footprint_t &v) {
		entry_t *pEntry = this->entries + this->numEntry++;

		if (this->numEntry > this->maxEntry)
			ctx.fatal("\n{\"error\":\"storage full\",\"where\":\"%s:%s:%d\",\"maxEntry\":%u}\n", __FUNCTION__, __FILE__, __LINE__, this->maxEntry);

		// clear before use
		::memset(pEntry, 0, sizeof(*pEntry));

		// only populate key fields
		pEntry->footprint = v;

		return (uint32_t) (pEntry - this->entries);
	}

	/**
	 * @date 2026-10-12 15:31:47
	 *
	 * Compare a candidate against the current minimal formulas of an entry
	 *
	 * @param {entry_t} pEntry - entry
	 * @param {number} size - candidate size
	 * @return {number} '*' empty entry, '+' better, '=' tie, '-' worse
	 */
	static inline char challenge(const entry_t *pEntry, unsigned size) {
		if (pEntry->numMinimal == 0)
			return '*';
		if (size < pEntry->minSize)
			return '+';
		if (size == pEntry->minSize)
			return '=';
		return '-';
	}

	/**
	 * @date 2026-10-12 15:35:20
	 *
	 * Ingest a formula with its truth table
	 *
	 * @param {number} ref - formula handle
	 * @param {number} size - formula size
	 * @param {footprint_t} footprint - truth table of formula
	 * @param {string} pCmp - (optional) outcome of `challenge()`
	 * @return {number} entry id
	 */
	uint32_t ingest(uint32_t ref, unsigned size, const footprint_t &footprint, char *pCmp = NULL) {
		uint32_t slot = slotOf(ref);

		if (this->finalised)
			ctx.fatal("\n{\"error\":\"catalog finalised\",\"where\":\"%s:%s:%d\",\"ref\":\"%x\"}\n", __FUNCTION__, __FILE__, __LINE__, ref);
		if ((ref & ~IBIT) == 0 || slot >= this->maxSlot)
			ctx.fatal("\n{\"error\":\"formula out of range\",\"where\":\"%s:%s:%d\",\"ref\":\"%x\",\"maxSlot\":%u}\n", __FUNCTION__, __FILE__, __LINE__, ref, this->maxSlot);
		if (this->entryOf[slot] != 0)
			ctx.fatal("\n{\"error\":\"formula already ingested\",\"where\":\"%s:%s:%d\",\"ref\":\"%x\",\"eid\":%u}\n", __FUNCTION__, __FILE__, __LINE__, ref, this->entryOf[slot]);

		/*
		 * Lookup/create entry
		 */
		uint32_t ix  = lookupEntry(footprint);
		uint32_t eid = this->entryIndex[ix];

		if (eid == 0) {
			eid = addEntry(footprint);
			this->entryIndex[ix] = eid;
		}

		entry_t *pEntry = this->entries + eid;

		/*
		 * Append to all formulas
		 */
		this->entryOf[slot]     = eid;
		this->nextFormula[slot] = 0;
		if (pEntry->lastFormula)
			this->nextFormula[slotOf(pEntry->lastFormula)] = ref;
		else
			pEntry->firstFormula = ref;
		pEntry->lastFormula = ref;
		pEntry->numFormula++;

		this->formulas[this->numFormula++] = ref;

		/*
		 * Apply minimality policy
		 */
		char cmp = challenge(pEntry, size);

		if (cmp == '+') {
			// dethrone, drop current minimal list
			for (uint32_t iRef = pEntry->firstMinimal; iRef; ) {
				uint32_t next = this->nextMinimal[slotOf(iRef)];
				this->nextMinimal[slotOf(iRef)] = 0;
				iRef = next;
			}
			pEntry->firstMinimal = pEntry->lastMinimal = 0;
			pEntry->numMinimal   = 0;
		}

		if (cmp != '-') {
			this->nextMinimal[slot] = 0;
			if (pEntry->lastMinimal)
				this->nextMinimal[slotOf(pEntry->lastMinimal)] = ref;
			else
				pEntry->firstMinimal = ref;
			pEntry->lastMinimal = ref;
			pEntry->numMinimal++;
			pEntry->minSize = size;
		}

		if (ctx.opt_debug & ctx.DEBUGMASK_CATALOG)
			fprintf(stderr, "[%s] ingest ref=%x size=%u eid=%u cmp=%c minSize=%u numMinimal=%u numFormula=%u\n",
				ctx.timeAsString(), ref, size, eid, cmp, pEntry->minSize, pEntry->numMinimal, pEntry->numFormula);

		if (pCmp)
			*pCmp = cmp;

		return eid;
	}

	/**
	 * @date 2026-10-12 15:48:11
	 *
	 * Stop accepting formulas
	 */
	void finalise(void) {
		this->finalised = 1;
	}

	/*
	 * Read interface
	 */

	/**
	 * @date 2026-10-12 15:49:26
	 *
	 * Number of discovered truth tables
	 */
	inline uint32_t numTable(void) const {
		return this->numEntry - IDFIRST;
	}

	/**
	 * @date 2026-10-12 15:50:02
	 *
	 * Test if every possible truth table has been discovered
	 */
	inline bool isComplete(void) const {
		return this->numTable() == numPossible(this->numVariable);
	}

	/**
	 * @date 2026-10-12 15:50:31
	 *
	 * Formula by position in order of ingestion
	 *
	 * @param {number} pos - position, `0` .. `numFormula-1`
	 * @return {number} formula handle
	 */
	inline uint32_t formulaAt(uint32_t pos) const {
		assert(pos < this->numFormula);
		return this->formulas[pos];
	}

	/**
	 * @date 2026-10-12 15:50:48
	 *
	 * Truth table by position in order of discovery
	 *
	 * @param {number} pos - position, `0` .. `numTable()-1`
	 * @return {entry_t} catalog entry
	 */
	inline const entry_t *tableAt(uint32_t pos) const {
		assert(pos < this->numTable());
		return this->entries + IDFIRST + pos;
	}

	/**
	 * @date 2026-10-12 15:51:13
	 *
	 * Entry a formula was ingested in
	 *
	 * @param {number} ref - formula handle
	 * @return {number} entry id, 0 if not ingested
	 */
	inline uint32_t entryOfFormula(uint32_t ref) const {
		uint32_t slot = slotOf(ref);

		return slot < this->maxSlot ? this->entryOf[slot] : 0;
	}

	/**
	 * @date 2026-10-12 15:52:40
	 *
	 * Iterate the all-formulas list of an entry. `firstFormula` in `entry_t` starts the walk.
	 *
	 * @param {number} ref - current formula
	 * @return {number} next formula, 0 at end of list
	 */
	inline uint32_t nextOfFormula(uint32_t ref) const {
		return this->nextFormula[slotOf(ref)];
	}

	/**
	 * @date 2026-10-12 15:53:21
	 *
	 * Iterate the minimal list of an entry. `firstMinimal` in `entry_t` starts the walk.
	 *
	 * @param {number} ref - current formula
	 * @return {number} next formula, 0 at end of list
	 */
	inline uint32_t nextOfMinimal(uint32_t ref) const {
		return this->nextMinimal[slotOf(ref)];
	}

	/**
	 * @date 2026-10-12 15:55:34
	 *
	 * Collect catalog statistics
	 *
	 * @param {json_t} jResult - (optional) object to add to
	 * @return {json_t} result
	 */
	json_t *jsonInfo(json_t *jResult) const {
		if (jResult == NULL)
			jResult = json_object();
		json_object_set_new_nocheck(jResult, "numFormula", json_integer(this->numFormula));
		json_object_set_new_nocheck(jResult, "numEntry", json_integer(this->numEntry));
		json_object_set_new_nocheck(jResult, "entryIndexSize", json_integer(this->entryIndexSize));
		json_object_set_new_nocheck(jResult, "numTable", json_integer(this->numTable()));
		json_object_set_new_nocheck(jResult, "numPossible", json_integer((json_int_t) numPossible(this->numVariable)));
		json_object_set_new_nocheck(jResult, "complete", this->isComplete() ? json_true() : json_false());

		return jResult;
	}
};

#endif
