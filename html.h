#ifndef _HTML_H
#define _HTML_H

/*
 * @date 2026-10-13 09:12:05
 *
 * `htmlPage_t` writes a simple html page directly to an open file.
 *
 * Tables and lists can not be nested.
 * A page starts with `begin()` and is completed with `end()`.
 * To work with tables:
 *   - `tableCreate()`
 *   - for each row `tableAddRow()`, then `tableAddHeader()`/`tableAddData()` for each cell
 *   - `tableEnd()`
 * Lists follow the same pattern with `listCreate()`, `listAddRow()` and `listEnd()`.
 *
 * Text arguments are raw html, use `escape()` for plain text.
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

#include <stdio.h>
#include <string>

/**
 * @date 2026-10-13 09:15:33
 *
 * Html page writer
 *
 * @typedef {object}
 */
struct htmlPage_t {

	/// @var {FILE} output, owned by caller
	FILE *outf;
	/// @var {boolean} list under construction is ordered
	bool currentListOrdered;

	/**
	 * Constructor
	 */
	htmlPage_t(FILE *outf) : outf(outf) {
		currentListOrdered = false;
	}

	/**
	 * @date 2026-10-13 09:17:48
	 *
	 * Escape html special characters
	 *
	 * @param {string} text - plain text
	 * @return {string} html text
	 */
	static std::string escape(const std::string &text) {
		std::string ret;

		for (std::string::const_iterator it = text.begin(); it != text.end(); ++it) {
			switch (*it) {
			case '&':
				ret += "&amp;";
				break;
			case '<':
				ret += "&lt;";
				break;
			case '>':
				ret += "&gt;";
				break;
			case '"':
				ret += "&quot;";
				break;
			default:
				ret += *it;
			}
		}

		return ret;
	}

	/**
	 * @date 2026-10-13 09:20:02
	 *
	 * Page prologue, call once before any content
	 */
	void begin(void) {
		fputs("<html>\n<head>\n<meta charset=\"utf-8\">\n</head>\n<body>\n", outf);
	}

	/**
	 * @date 2026-10-13 09:20:40
	 *
	 * Page epilogue, call once after all content
	 */
	void end(void) {
		fputs("</body>\n</html>\n", outf);
	}

	void addHeader(unsigned level, const std::string &text) {
		fprintf(outf, "<h%u>%s</h%u>\n\n", level, text.c_str(), level);
	}

	void addParagraph(const std::string &text) {
		fprintf(outf, "<p>%s</p>\n\n", text.c_str());
	}

	/*
	 * Tables
	 */

	void tableCreate(unsigned border) {
		fprintf(outf, "<table border=\"%u\">\n", border);
	}

	void tableAddRow(void) {
		fputs("<tr>\n", outf);
	}

	void tableAddHeader(const std::string &text) {
		fprintf(outf, "<th>%s</th>\n", text.c_str());
	}

	void tableAddData(const std::string &text) {
		fprintf(outf, "<td>%s</td>\n", text.c_str());
	}

	void tableEnd(void) {
		fputs("</table>\n", outf);
	}

	/*
	 * Lists
	 */

	void listCreate(bool ordered) {
		currentListOrdered = ordered;
		fputs(ordered ? "<ol>\n" : "<ul>\n", outf);
	}

	void listAddRow(const std::string &text) {
		fprintf(outf, "<li>%s</li>\n", text.c_str());
	}

	void listEnd(void) {
		fputs(currentListOrdered ? "</ol>\n" : "</ul>\n", outf);
	}
};

#endif
