#ifndef _EVALUATOR_H
#define _EVALUATOR_H

/*
 * @date 2026-10-12 13:02:45
 *
 * `evaluator_t` computes the truth table of a formula.
 *
 * Two paths exist:
 *   - `evaluate()` walks the formula once for every assignment, `2^numVariable` times.
 *   - `evaluateFast()` returns the footprint the pool cached when the node was created,
 *     where all assignments are evaluated at once with a single word operation per node.
 *
 * Both must agree. With `--paranoid` every generated formula is checked.
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

#include "pool.h"

/**
 * @date 2026-10-12 13:06:10
 *
 * Truth table evaluator
 *
 * @typedef {object}
 */
struct evaluator_t {

	/// @var {context_t} I/O context
	context_t &ctx;

	/// @var {formulaPool_t} where the formulas live
	const formulaPool_t &pool;

	/**
	 * Constructor
	 */
	evaluator_t(context_t &ctx, const formulaPool_t &pool) : ctx(ctx), pool(pool) {
	}

	/**
	 * @date 2026-10-12 13:08:44
	 *
	 * Outcome of formula for a single assignment
	 *
	 * @param {number} ref - formula handle
	 * @param {number} a - assignment, bit `v` is the value of variable `v`
	 * @return {boolean} outcome
	 */
	bool evalAssignment(uint32_t ref, unsigned a) const {
		const node_t *pNode = pool.nodes + (ref & ~IBIT);
		bool         ret;

		switch (pNode->op) {
		case node_t::OP_LITERAL:
			ret = (a >> pNode->L) & 1;
			break;
		case node_t::OP_AND:
			ret = evalAssignment(pNode->L, a) && evalAssignment(pNode->R, a);
			break;
		case node_t::OP_OR:
			ret = evalAssignment(pNode->L, a) || evalAssignment(pNode->R, a);
			break;
		case node_t::OP_XOR:
			ret = evalAssignment(pNode->L, a) != evalAssignment(pNode->R, a);
			break;
		default:
			ctx.fatal("\n{\"error\":\"unknown operator\",\"where\":\"%s:%s:%d\",\"op\":%u}\n", __FUNCTION__, __FILE__, __LINE__, pNode->op);
		}

		return (ref & IBIT) ? !ret : ret;
	}

	/**
	 * @date 2026-10-12 13:13:27
	 *
	 * Truth table by evaluating every assignment
	 *
	 * @param {number} ref - formula handle
	 * @return {footprint_t} truth table
	 */
	footprint_t evaluate(uint32_t ref) const {
		footprint_t ret;

		::memset(&ret, 0, sizeof(ret));

		for (unsigned a = 0; a < (1U << pool.numVariable); a++) {
			if (evalAssignment(ref, a))
				ret.bits[a / 64] |= 1ULL << (a % 64);
		}

		return ret;
	}

	/**
	 * @date 2026-10-12 13:15:50
	 *
	 * Truth table from the node cache
	 *
	 * @param {number} ref - formula handle
	 * @return {footprint_t} truth table
	 */
	inline footprint_t evaluateFast(uint32_t ref) const {
		return pool.footprintOf(ref);
	}

	/**
	 * @date 2026-10-12 13:17:02
	 *
	 * Cross-check both evaluation paths, fatal on mismatch
	 *
	 * @param {number} ref - formula handle
	 */
	void validate(uint32_t ref) const {
		footprint_t slow = evaluate(ref);
		footprint_t fast = evaluateFast(ref);

		if (!slow.equals(fast)) {
			char slowText[(1 << MAXVARIABLE) + 1];
			char fastText[(1 << MAXVARIABLE) + 1];

			ctx.fatal("\n{\"error\":\"evaluator mismatch\",\"where\":\"%s:%s:%d\",\"name\":\"%s\",\"evaluate\":\"%s\",\"evaluateFast\":\"%s\"}\n",
				  __FUNCTION__, __FILE__, __LINE__, pool.saveString(ref),
				  slow.toString(pool.numVariable, slowText), fast.toString(pool.numVariable, fastText));
		}
	}
};

#endif
