#ifndef _GENERATOR_H
#define _GENERATOR_H

/*
 * @date 2026-10-12 14:01:19
 *
 * Generate all structurally distinct formulas over `numVariable` variables by increasing size.
 *
 * Size is the number of binary operators. Negation is free and is carried by `IBIT` on handles.
 *
 * Size class 0 consists of the literals, each emitted plain and negated.
 * A formula of size `k` combines a left operand of size `i` with a right operand of size `k-1-i`.
 * Emission order within a size class:
 *   - split `i` ascending
 *   - left operand, in pool order
 *   - right operand, in pool order
 *   - operator AND, OR, XOR
 *   - plain result before negated result
 *
 * Every size class only depends on smaller ones, so formulas are passed to the callback in
 * non-decreasing size. The first formula the catalog sees for a truth table is therefore minimal.
 *
 * All formulas are retained because they are the operands of larger ones.
 * This is what makes the problem intractable, the count per size class is known in advance:
 *
 *   F(0) = 2 * numVariable
 *   N(k) = 3 * sum(i=0..k-1, F(i) * F(k-1-i))      nodes of size class k
 *   F(k) = 2 * N(k)                                formulas of size class k
 *
 * for 3 variables that is 6, 216, 15552, 1399680 formulas.
 *
 * Before starting a size class the generator tests it fits the pool.
 * If not, generation stops at the boundary and `truncated` is set, so generated size classes are always complete.
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
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include "pool.h"

/*
 * @date 2026-10-12 14:08:51
 *
 * Placeholder base type for generator callbacks
 */
struct callable_t {

};

/**
 * @date 2026-10-12 14:10:03
 *
 * Formula generator
 *
 * @typedef {object}
 */
struct generator_t {

	/// @var {context_t} I/O context
	context_t &ctx;

	/// @var {formulaPool_t} pool receiving the generated nodes
	formulaPool_t *pPool;

	/// @var {number} highest size class completely generated
	unsigned sizeReached;
	/// @var {number} size class that did not fit the pool, 0 if none
	unsigned truncated;
	/// @var {number} set when the callback requested to stop
	unsigned aborted;
	/// @var {number} structurally identical nodes encountered
	uint64_t skipDuplicate;

	/**
	 * Constructor
	 */
	generator_t(context_t &ctx) : ctx(ctx) {
		pPool         = NULL;
		sizeReached   = 0;
		truncated     = 0;
		aborted       = 0;
		skipDuplicate = 0;
	}

	/**
	 * @date 2026-10-12 14:13:37
	 *
	 * Expected number of nodes for each size class.
	 * Doubles because 5 variables overflow 64 bits quickly.
	 *
	 * @param {number} numVariable - number of variables
	 * @param {number} maxSize - highest size class
	 * @param {number[]} pNodes - output, `maxSize+1` entries
	 */
	static void expectedNodes(unsigned numVariable, unsigned maxSize, double *pNodes) {
		double numFormula[MAXSIZE + 1];

		assert(maxSize <= MAXSIZE);

		pNodes[0]     = numVariable;
		numFormula[0] = 2.0 * numVariable;

		for (unsigned k = 1; k <= maxSize; k++) {
			double sum = 0;

			for (unsigned i = 0; i < k; i++)
				sum += numFormula[i] * numFormula[k - 1 - i];

			pNodes[k]     = (node_t::OP_LAST) * sum;
			numFormula[k] = 2 * pNodes[k];
		}
	}

	/**
	 * @date 2026-10-12 14:19:55
	 *
	 * Determine which size classes fit the given capacity
	 *
	 * @param {number} numVariable - number of variables
	 * @param {number} maxSize - requested size ceiling
	 * @param {number} maxNode - pool capacity, including reserved and literal nodes
	 * @param {number} pNumNode - (optional) output, nodes required including reserved node
	 * @param {number} pNumFormula - (optional) output, formulas that will be generated
	 * @return {number} highest size class that fits
	 */
	static unsigned planSize(unsigned numVariable, unsigned maxSize, double maxNode, uint64_t *pNumNode, uint64_t *pNumFormula) {
		double nodes[MAXSIZE + 1];
		double numNode = formulaPool_t::KSTART;

		expectedNodes(numVariable, maxSize, nodes);

		unsigned k;
		for (k = 0; k <= maxSize; k++) {
			if (numNode + nodes[k] > maxNode)
				break;
			numNode += nodes[k];
		}

		if (pNumNode)
			*pNumNode = (uint64_t) numNode;
		if (pNumFormula)
			*pNumFormula = 2 * ((uint64_t) numNode - formulaPool_t::KSTART);

		// size class 0 always fits
		return k ? k - 1 : 0;
	}

	/**
	 * @date 2026-10-12 14:26:31
	 *
	 * Connect generator to pool
	 *
	 * @param {formulaPool_t} pool - pool receiving nodes
	 */
	void initialiseGenerator(formulaPool_t &pool) {
		this->pPool = &pool;
	}

	/**
	 * @date 2026-10-12 14:27:12
	 *
	 * Reset the generator so it can be restarted from size 0
	 */
	void clearGenerator(void) {
		assert(pPool);

		pPool->clear();
		sizeReached   = 0;
		truncated     = 0;
		aborted       = 0;
		skipDuplicate = 0;
	}

	/**
	 * @date 2026-10-12 14:28:50
	 *
	 * Typedef of callback function to `"bool foundFormula(uint32_t ref, unsigned size)"`
	 *
	 * @typedef {callback} generateFormulaCallback_t
	 * @param {number} ref - formula handle
	 * @param {number} size - formula size
	 * @return {boolean} return `true` to continue generating
	 */
	typedef bool(callable_t::* generateFormulaCallback_t)(uint32_t ref, unsigned size);

	/**
	 * @date 2026-10-12 14:30:17
	 *
	 * Pass formula and its negation to the callback
	 *
	 * @param {number} id - node id
	 * @param {number} size - formula size
	 * @param {object} cbObject - callback object
	 * @param {object} cbMember - callback member in object
	 * @return {boolean} `false` if callback requested stop
	 */
	inline bool callFoundFormula(uint32_t id, unsigned size, callable_t *cbObject, generateFormulaCallback_t cbMember) {
		ctx.progress++;
		if (!(*cbObject.*cbMember)(id, size))
			return false;

		ctx.progress++;
		if (!(*cbObject.*cbMember)(id ^ IBIT, size))
			return false;

		return true;
	}

	/**
	 * @date 2026-10-12 14:34:02
	 *
	 * Generate all formulas up to and including `maxSize`
	 *
	 * @param {number} maxSize - size ceiling
	 * @param {object} cbObject - callback object
	 * @param {object} cbMember - callback member in object
	 */
	void generateFormulas(unsigned maxSize, callable_t *cbObject, generateFormulaCallback_t cbMember) {
		formulaPool_t &pool = *pPool;
		double        nodes[MAXSIZE + 1];

		assert(maxSize <= MAXSIZE);
		assert(pool.numNode == formulaPool_t::KSTART);

		expectedNodes(pool.numVariable, maxSize, nodes);

		/*
		 * Size class 0
		 */

		pool.addLiterals();

		for (uint32_t id = pool.sizeFirst[0]; id < pool.sizeFirst[1]; id++) {
			if (!callFoundFormula(id, 0, cbObject, cbMember)) {
				aborted = 1;
				return;
			}
		}

		sizeReached = 0;

		/*
		 * Larger size classes
		 */

		for (unsigned k = 1; k <= maxSize; k++) {

			if (pool.numNode + nodes[k] > pool.maxNode) {
				// break at size class boundary
				truncated = k;
				break;
			}

			if (ctx.opt_debug & ctx.DEBUGMASK_GENERATOR)
				fprintf(stderr, "\r\e[K[%s] size=%u first=%u expected=%.0f\n", ctx.timeAsString(), k, pool.numNode, nodes[k]);

			for (unsigned i = 0; i < k; i++) {
				unsigned j  = k - 1 - i;
				uint32_t nL = pool.numFormulaOfSize(i);
				uint32_t nR = pool.numFormulaOfSize(j);

				for (uint32_t iL = 0; iL < nL; iL++)
				for (uint32_t iR = 0; iR < nR; iR++) {
					uint32_t L = pool.formulaOfSize(i, iL);
					uint32_t R = pool.formulaOfSize(j, iR);

					for (unsigned op = node_t::OP_AND; op <= node_t::OP_LAST; op++) {
						uint32_t ix = pool.lookupNode(op, L, R);

						if (pool.nodeIndex[ix] != 0) {
							// structurally identical
							skipDuplicate++;
							continue;
						}

						uint32_t id = pool.addNode(ix, op, L, R);

						if (!callFoundFormula(id, k, cbObject, cbMember)) {
							aborted = 1;
							return;
						}
					}
				}
			}

			pool.closeSize(k);
			sizeReached = k;
		}
	}
};

#endif
