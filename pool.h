#ifndef _POOL_H
#define _POOL_H

/*
 * @date 2026-10-12 11:03:27
 *
 * `formulaPool_t` is the arena holding every formula the generator creates.
 *
 * Nodes are appended in generation order and never change afterwards.
 * Because generation is by increasing size, each size class is a contiguous range of node ids.
 * A formula of size `k` is referenced by its position in that range, each node providing two formulas,
 * the plain and the negated result.
 *
 * Node id 0 is reserved so a zero handle can terminate lists.
 * Literals occupy ids `KSTART` .. `KSTART+numVariable-1`.
 *
 * Each node caches its footprint, evaluated once from the footprints of its operands.
 * Structurally identical nodes are detected with a hash index on `(op,L,R)`.
 *
 * Notations:
 *   - Postfix, `&` AND, `+` OR, `^` XOR, trailing `~` negation. Example: `"ab&c+~"`
 *   - Infix, `&` AND, `|` OR, `^` XOR, prefix `~`, binary operands in parentheses. Example: `"~((a & b) | c)"`
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
#include <jansson.h>
#include <stdint.h>
#include <string.h>
#include <string>

#include "datadef.h"

/**
 * @date 2026-10-12 11:10:02
 *
 * Size-class arena of formula nodes
 *
 * @typedef {object}
 */
struct formulaPool_t {

	enum {
		/// @constant {number} First literal node id
		KSTART = 1,
		/// @constant {number} Longest postfix notation: `2*MAXSIZE+1` nodes each with optional negation
		NAMELEN = (2 * MAXSIZE + 1) * 2,
	};

	/// @var {context_t} I/O context
	context_t &ctx;

	/// @var {number} number of variables
	unsigned numVariable;

	/// @var {node_t[]} nodes
	node_t *nodes;
	/// @var {footprint_t[]} cached truth table of each node
	footprint_t *footprints;
	/// @var {number} number of nodes in use, including reserved
	uint32_t numNode;
	/// @var {number} capacity
	uint32_t maxNode;
	/// @var {number} index size, must be prime
	uint32_t nodeIndexSize;
	/// @var {number[]} hash index on `(op,L,R)`
	uint32_t *nodeIndex;

	/// @var {number[]} first node id of each size class. `sizeFirst[k+1]` is the end of size class `k`
	uint32_t sizeFirst[MAXSIZE + 2];
	/// @var {number} number of completed size classes
	unsigned numSize;

	/**
	 * Constructor
	 */
	formulaPool_t(context_t &ctx) : ctx(ctx) {
		numVariable   = 0;
		nodes         = NULL;
		footprints    = NULL;
		numNode       = 0;
		maxNode       = 0;
		nodeIndexSize = 0;
		nodeIndex     = NULL;
		numSize       = 0;
		::memset(sizeFirst, 0, sizeof(sizeFirst));
	}

	/**
	 * Release resources
	 */
	~formulaPool_t() {
		if (nodes)
			ctx.myFree("formulaPool_t::nodes", nodes);
		if (footprints)
			ctx.myFree("formulaPool_t::footprints", footprints);
		if (nodeIndex)
			ctx.myFree("formulaPool_t::nodeIndex", nodeIndex);
	}

	/**
	 * @date 2026-10-12 11:16:40
	 *
	 * Allocate storage
	 *
	 * @param {number} numVariable - number of variables
	 * @param {number} maxNode - capacity, including reserved and literal nodes
	 * @param {number} ratio - index/data ratio
	 */
	void create(unsigned numVariable, uint32_t maxNode, double ratio) {
		assert(numVariable >= 1 && numVariable <= MAXVARIABLE);

		if (maxNode < KSTART + numVariable)
			maxNode = KSTART + numVariable;

		this->numVariable   = numVariable;
		this->maxNode       = maxNode;
		this->nodes         = (node_t *) ctx.myAlloc("formulaPool_t::nodes", maxNode, sizeof(*this->nodes));
		this->footprints    = (footprint_t *) ctx.myAlloc("formulaPool_t::footprints", maxNode, sizeof(*this->footprints));
		this->nodeIndexSize = ctx.nextPrime(ctx.dToMax(maxNode * ratio));
		this->nodeIndex     = (uint32_t *) ctx.myAlloc("formulaPool_t::nodeIndex", nodeIndexSize, sizeof(*this->nodeIndex));

		clear();
	}

	/**
	 * @date 2026-10-12 11:19:15
	 *
	 * Empty the pool, keeping the storage
	 */
	void clear(void) {
		this->numNode = KSTART;
		this->numSize = 0;
		::memset(this->sizeFirst, 0, sizeof(this->sizeFirst));
		::memset(this->nodeIndex, 0, sizeof(*this->nodeIndex) * this->nodeIndexSize);
	}

	/**
	 * @date 2026-10-12 11:21:50
	 *
	 * Perform node lookup
	 *
	 * Lookup key in index using a hash array with overflow.
	 * Returns the offset within the index.
	 * If contents of index is 0, then not found, otherwise it the index where to find the node.
	 *
	 * @param {number} op - operator
	 * @param {number} L - left operand
	 * @param {number} R - right operand
	 * @return {number} offset into index
	 */
	inline uint32_t lookupNode(unsigned op, uint32_t L, uint32_t R) {
		ctx.cntHash++;

		// calculate starting position
		uint32_t crc32 = 0;
		__asm__ __volatile__ ("crc32l %1, %0" : "+r"(crc32) : "rm"(op));
		__asm__ __volatile__ ("crc32l %1, %0" : "+r"(crc32) : "rm"(L));
		__asm__ __volatile__ ("crc32l %1, %0" : "+r"(crc32) : "rm"(R));

		uint32_t ix   = crc32 % nodeIndexSize;
		uint32_t bump = ix;
		if (bump == 0)
			bump = nodeIndexSize - 1; // may never be zero
		if (bump > 2147000041)
			bump = 2147000041; // may never exceed last 32bit prime

		for (;;) {
			ctx.cntCompare++;
			if (this->nodeIndex[ix] == 0)
				return ix; // "not-found"

			const node_t *pNode = this->nodes + this->nodeIndex[ix];

			if (pNode->op == op && pNode->L == L && pNode->R == R)
				return ix; // "found"

			// overflow, jump to next entry
			// if `ix` and `bump` are both 31 bit values, then the addition will never overflow
			ix += bump;
			if (ix >= nodeIndexSize)
				ix -= nodeIndexSize;
		}
	}

	/**
	 * @date 2026-10-12 11:27:33
	 *
	 * Add a node to the pool and evaluate its footprint.
	 * The caller is responsible for the index lookup, the new id is stored at `nodeIndex[ix]`.
	 *
	 * @param {number} ix - offset into index as returned by `lookupNode()`
	 * @param {number} op - operator
	 * @param {number} L - left operand
	 * @param {number} R - right operand
	 * @return {number} node id
	 */
	inline uint32_t addNode(uint32_t ix, unsigned op, uint32_t L, uint32_t R) {
		if (this->numNode >= this->maxNode)
			ctx.fatal("\n{\"error\":\"storage full\",\"where\":\"%s:%s:%d\",\"maxNode\":%u}\n", __FUNCTION__, __FILE__, __LINE__, this->maxNode);

		uint32_t id    = this->numNode++;
		node_t   *pNode = this->nodes + id;

		pNode->op = op;
		pNode->L  = L;
		pNode->R  = R;

		footprint_t *pFootprint = this->footprints + id;

		if (op == node_t::OP_LITERAL) {
			pNode->size = 0;
			pFootprint->setVariable(numVariable, L);
		} else {
			assert((L & ~IBIT) < id && (R & ~IBIT) < id);

			pNode->size = 1 + sizeOf(L) + sizeOf(R);

			footprint_t fpL = footprintOf(L);
			footprint_t fpR = footprintOf(R);

			// NOTE: QUADPERFOOTPRINT tests
			switch (op) {
			case node_t::OP_AND:
				pFootprint->bits[0] = fpL.bits[0] & fpR.bits[0];
				break;
			case node_t::OP_OR:
				pFootprint->bits[0] = fpL.bits[0] | fpR.bits[0];
				break;
			case node_t::OP_XOR:
				pFootprint->bits[0] = fpL.bits[0] ^ fpR.bits[0];
				break;
			default:
				ctx.fatal("\n{\"error\":\"unknown operator\",\"where\":\"%s:%s:%d\",\"op\":%u}\n", __FUNCTION__, __FILE__, __LINE__, op);
			}
		}

		this->nodeIndex[ix] = id;

		return id;
	}

	/**
	 * @date 2026-10-12 11:36:08
	 *
	 * Create the literal nodes, which form size class 0.
	 */
	void addLiterals(void) {
		assert(this->numNode == KSTART && this->numSize == 0);

		this->sizeFirst[0] = this->numNode;

		for (unsigned v = 0; v < numVariable; v++) {
			uint32_t ix = lookupNode(node_t::OP_LITERAL, v, 0);
			addNode(ix, node_t::OP_LITERAL, v, 0);
		}

		closeSize(0);
	}

	/**
	 * @date 2026-10-12 11:38:21
	 *
	 * Mark size class as complete
	 *
	 * @param {number} size - size class
	 */
	inline void closeSize(unsigned size) {
		assert(size == this->numSize && size <= MAXSIZE);

		this->sizeFirst[size + 1] = this->numNode;
		this->numSize             = size + 1;

		// next size class starts here
		if (size + 2 <= MAXSIZE + 1)
			this->sizeFirst[size + 2] = this->numNode;
	}

	/**
	 * @date 2026-10-12 11:40:55
	 *
	 * Size of formula in binary operators
	 *
	 * @param {number} ref - formula handle
	 * @return {number} size
	 */
	inline unsigned sizeOf(uint32_t ref) const {
		return this->nodes[ref & ~IBIT].size;
	}

	/**
	 * @date 2026-10-12 11:41:48
	 *
	 * Number of formulas in a completed size class
	 *
	 * @param {number} size - size class
	 * @return {number} number of formulas
	 */
	inline uint32_t numFormulaOfSize(unsigned size) const {
		assert(size < this->numSize);
		return 2 * (this->sizeFirst[size + 1] - this->sizeFirst[size]);
	}

	/**
	 * @date 2026-10-12 11:43:30
	 *
	 * Formula by position within its size class. Even positions are plain, odd positions negated.
	 *
	 * @param {number} size - size class
	 * @param {number} pos - position within size class
	 * @return {number} formula handle
	 */
	inline uint32_t formulaOfSize(unsigned size, uint32_t pos) const {
		return (this->sizeFirst[size] + (pos >> 1)) | ((pos & 1) ? IBIT : 0);
	}

	/**
	 * @date 2026-10-12 11:45:02
	 *
	 * Truth table of formula, using the cached node footprint
	 *
	 * @param {number} ref - formula handle
	 * @return {footprint_t} truth table
	 */
	inline footprint_t footprintOf(uint32_t ref) const {
		footprint_t ret = this->footprints[ref & ~IBIT];

		// NOTE: QUADPERFOOTPRINT tests
		if (ref & IBIT)
			ret.bits[0] ^= footprint_t::mask(numVariable);

		return ret;
	}

	/**
	 * @date 2026-10-12 11:48:16
	 *
	 * Encode formula in postfix notation
	 *
	 * @param {number} ref - formula handle
	 * @param {string} pBuffer - output, at least `NAMELEN+1` characters
	 * @return {number} number of characters written, excluding terminator
	 */
	unsigned saveString(uint32_t ref, char *pBuffer) const {
		const node_t *pNode = this->nodes + (ref & ~IBIT);
		unsigned     len    = 0;

		if (pNode->op == node_t::OP_LITERAL) {
			pBuffer[len++] = (char) ('a' + pNode->L);
		} else {
			len += saveString(pNode->L, pBuffer + len);
			len += saveString(pNode->R, pBuffer + len);

			switch (pNode->op) {
			case node_t::OP_AND:
				pBuffer[len++] = '&';
				break;
			case node_t::OP_OR:
				pBuffer[len++] = '+';
				break;
			case node_t::OP_XOR:
				pBuffer[len++] = '^';
				break;
			}
		}

		if (ref & IBIT)
			pBuffer[len++] = '~';

		pBuffer[len] = 0;
		return len;
	}

	/**
	 * @date 2026-10-12 11:52:40
	 *
	 * Encode formula in postfix notation using a static buffer
	 *
	 * @param {number} ref - formula handle
	 * @return {string} notation, valid until next call
	 */
	const char *saveString(uint32_t ref) const {
		static char staticName[NAMELEN + 1];

		saveString(ref, staticName);

		return staticName;
	}

	/**
	 * @date 2026-10-12 11:54:11
	 *
	 * Decode postfix notation.
	 * Nodes not present in the pool are added, without being assigned to a size class.
	 * Intended for testing.
	 *
	 * @param {string} pName - notation
	 * @return {number} formula handle, 0 if malformed
	 */
	uint32_t loadString(const char *pName) {
		uint32_t stack[NAMELEN];
		unsigned numStack = 0;

		for (; *pName; pName++) {
			if (islower(*pName)) {
				unsigned v = *pName - 'a';
				if (v >= numVariable || numStack >= NAMELEN)
					return 0;
				stack[numStack++] = KSTART + v;
			} else if (*pName == '~') {
				if (numStack < 1)
					return 0;
				stack[numStack - 1] ^= IBIT;
			} else {
				unsigned op;

				if (*pName == '&')
					op = node_t::OP_AND;
				else if (*pName == '+')
					op = node_t::OP_OR;
				else if (*pName == '^')
					op = node_t::OP_XOR;
				else
					return 0;

				if (numStack < 2)
					return 0;

				uint32_t R  = stack[--numStack];
				uint32_t L  = stack[--numStack];
				uint32_t ix = lookupNode(op, L, R);

				if (this->nodeIndex[ix] == 0)
					addNode(ix, op, L, R);

				stack[numStack++] = this->nodeIndex[ix];
			}
		}

		if (numStack != 1)
			return 0;

		return stack[0];
	}

	/**
	 * @date 2026-10-12 12:01:37
	 *
	 * Render formula in infix notation.
	 *
	 * @param {number} ref - formula handle
	 * @return {string} notation
	 */
	std::string infixString(uint32_t ref) const {
		const node_t *pNode = this->nodes + (ref & ~IBIT);
		std::string  txt;

		if (pNode->op == node_t::OP_LITERAL) {
			if (ref & IBIT)
				txt += '~';
			txt += (char) ('a' + pNode->L);
			return txt;
		}

		std::string lhs = infixString(pNode->L);
		std::string rhs = infixString(pNode->R);

		// operands that are plain binary operators need parentheses
		if (this->nodes[pNode->L & ~IBIT].op != node_t::OP_LITERAL && !(pNode->L & IBIT))
			lhs = "(" + lhs + ")";
		if (this->nodes[pNode->R & ~IBIT].op != node_t::OP_LITERAL && !(pNode->R & IBIT))
			rhs = "(" + rhs + ")";

		txt = lhs;
		if (pNode->op == node_t::OP_AND)
			txt += " & ";
		else if (pNode->op == node_t::OP_OR)
			txt += " | ";
		else
			txt += " ^ ";
		txt += rhs;

		if (ref & IBIT)
			txt = "~(" + txt + ")";

		return txt;
	}

	/**
	 * @date 2026-10-12 12:06:29
	 *
	 * Collect pool statistics
	 *
	 * @param {json_t} jResult - (optional) object to add to
	 * @return {json_t} result
	 */
	json_t *jsonInfo(json_t *jResult) const {
		if (jResult == NULL)
			jResult = json_object();
		json_object_set_new_nocheck(jResult, "numVariable", json_integer(this->numVariable));
		json_object_set_new_nocheck(jResult, "numNode", json_integer(this->numNode));
		json_object_set_new_nocheck(jResult, "maxNode", json_integer(this->maxNode));
		json_object_set_new_nocheck(jResult, "nodeIndexSize", json_integer(this->nodeIndexSize));
		json_object_set_new_nocheck(jResult, "numSize", json_integer(this->numSize));

		return jResult;
	}
};

#endif
