#ifndef _DATADEF_H
#define _DATADEF_H

/*
 * @date 2026-10-12 10:02:11
 *
 * `datadef.h` has the records shared between the formula pool, the generator and the catalog.
 *
 * - `footprint_t`, the truth table of a formula
 * - `node_t`, one binary operator or literal of the formula pool
 * - `entry_t`, the catalog record of all formulas sharing a truth table
 *
 * Formulas are referenced by a 32-bit handle: the node id with `IBIT` set when the node result is negated.
 * Negation is free, it does not add to the size of a formula.
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

#include <stdint.h>
#include "context.h"

/**
 * @date 2026-10-12 10:05:40
 *
 * struct representing a truth table of at most `2^MAXVARIABLE` bits.
 * Bit `a` holds the outcome of the formula for the assignment with binary value `a`.
 * Variable `v` takes the value of bit `v` of the assignment.
 * Bits at and above `2^numVariable` are always zero.
 *
 * Footprints are also used to compare equality of two formulas
 *
 * @typedef {number[]}
 */
struct footprint_t {
	enum {
		/// @constant {number} Size of footprint in terms of uint64_t
		QUADPERFOOTPRINT = 1
	};

	uint64_t bits[QUADPERFOOTPRINT];

	/**
	 * @date 2026-10-12 10:09:12
	 *
	 * Mask of significant bits for the given number of variables
	 *
	 * @param {number} numVariable - number of variables
	 * @return {number} mask
	 */
	static inline uint64_t mask(unsigned numVariable) {
		unsigned numBits = 1U << numVariable;

		if (numBits >= 64)
			return ~0ULL;
		return (1ULL << numBits) - 1;
	}

	/**
	 * @date 2026-10-12 10:10:31
	 *
	 * Footprint of a single variable. Bit `a` is set when bit `v` of `a` is set.
	 *
	 * @param {number} numVariable - number of variables
	 * @param {number} v - variable index
	 */
	inline void setVariable(unsigned numVariable, unsigned v) {
		this->bits[0] = 0;
		for (unsigned a = 0; a < (1U << numVariable); a++) {
			if (a & (1U << v))
				this->bits[0] |= 1ULL << a;
		}
	}

	/**
	 * @date 2026-10-12 10:12:02
	 *
	 * Test outcome for given assignment
	 *
	 * @param {number} a - assignment
	 * @return {boolean} outcome
	 */
	inline bool bit(unsigned a) const {
		return (this->bits[0] >> a) & 1;
	}

	/**
	 * @date 2026-10-12 10:13:20
	 *
	 * Compare two prints and determine if both are same
	 *
	 * @param {footprint_t} rhs - right hand side of comparison
	 * @return {boolean} `true` if same, `false` if different
	 */
	inline bool equals(const struct footprint_t &rhs) const {
		// NOTE: QUADPERFOOTPRINT tests
		return this->bits[0] == rhs.bits[0];
	}

	/**
	 * @date 2026-10-12 10:14:46
	 *
	 * Calculate the hash of a footprint
	 *
	 * It doesn't really have to be crc,  as long as the result has some linear distribution over index.
	 * crc32 was chosen because it has a single assembler instruction on x86 platforms.
	 *
	 * @return {number} - calculate crc
	 */
	inline unsigned crc32(void) const {

		// NOTE: QUADPERFOOTPRINT tests
#if defined(__SSE4_2__)
		uint32_t crc32 = 0;
		crc32 = __builtin_ia32_crc32di(crc32, this->bits[0]);
		return crc32;
#else
		uint64_t crc64 = 0;
		__asm__ __volatile__ ("crc32q %1, %0" : "+r"(crc64) : "rm"(this->bits[0]));
		return crc64;
#endif
	}

	/**
	 * @date 2026-10-12 10:17:05
	 *
	 * Render as a string of '0'/'1' in assignment order, assignment 0 first.
	 *
	 * @param {number} numVariable - number of variables
	 * @param {string} pBuffer - output, at least `2^MAXVARIABLE+1` characters
	 * @return {string} `pBuffer`
	 */
	const char *toString(unsigned numVariable, char *pBuffer) const {
		unsigned a;

		for (a = 0; a < (1U << numVariable); a++)
			pBuffer[a] = bit(a) ? '1' : '0';
		pBuffer[a] = 0;

		return pBuffer;
	}
};

/**
 * @date 2026-10-12 10:21:44
 *
 * One node of the formula pool.
 * Literals are nodes without operands, `L` holds the variable index.
 * Operands are formula handles, their `IBIT` marks a negated operand.
 *
 * @typedef {object}
 */
struct node_t {
	enum {
		OP_LITERAL = 0,
		OP_AND     = 1,
		OP_OR      = 2,
		OP_XOR     = 3,
		OP_LAST    = OP_XOR,
	};

	/// @var {number} left operand, or variable index of literal
	uint32_t L;
	/// @var {number} right operand
	uint32_t R;

	/// @var {number} operator
	uint8_t op;
	/// @var {number} size in binary operators
	uint8_t size;
};

/**
 * @date 2026-10-12 10:26:03
 *
 * Catalog record for a truth table.
 *
 * Both lists are single linked through per-formula link arrays owned by the catalog.
 * The minimal list is a subset of the all-formulas list where every member has size `minSize`.
 * Lists are terminated by handle 0, which is never a formula.
 *
 * @typedef {object}
 */
struct entry_t {
	/// @var {footprint_t} truth table
	footprint_t footprint;

	/// @var {number} first formula with this truth table
	uint32_t firstFormula;
	/// @var {number} last formula, for appending
	uint32_t lastFormula;
	/// @var {number} number of formulas
	uint32_t numFormula;

	/// @var {number} first formula of the minimal list
	uint32_t firstMinimal;
	/// @var {number} last formula of the minimal list, for appending
	uint32_t lastMinimal;
	/// @var {number} number of formulas in the minimal list
	uint32_t numMinimal;

	/// @var {number} size of the minimal formulas
	uint8_t minSize;
};

#endif
