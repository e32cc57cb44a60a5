//
//  luna_preprocessor.h
//  Luna
//
//  Copyright (c) 2026 The Luna developers.  All rights reserved.
//

//	This file is part of Luna.
//
//	Luna is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by
//	the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
//
//	Luna is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
//	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.
//
//	You should have received a copy of the GNU General Public License along with Luna.  If not, see <http://www.gnu.org/licenses/>.

/*

 LunaPreprocessor turns the raw lines of a script into "logical lines": each logical line is the complete source text
 of one top-level statement, with any multi-line block (an if statement or a function declaration) joined into a
 single line.  The lexer and parser then work on one logical line at a time.

 Block structure is tracked with a simple depth count: lines that begin with a block-opening prefix increase the
 depth, and lines that are exactly "end" decrease it.  This is purely textual; in particular, the comment marker and
 single quotes are handled without regard to string literals, so "--" or ' inside a string literal is mangled.

 */

#ifndef __Luna__luna_preprocessor__
#define __Luna__luna_preprocessor__

#include <string>
#include <vector>


class LunaPreprocessor
{
public:

	LunaPreprocessor(void) = delete;											// no construction; all methods are static

	// Split a script's text into raw lines at '\n', dropping a '\r' that precedes each '\n'
	static std::vector<std::string> SplitLines(const std::string &p_script_text);

	// Replace every single quote with a double quote, then cut the line at the first "--"
	static std::string StripCommentAndNormalizeQuotes(const std::string &p_raw_line);

	// A trimmed line opens a block if it starts with "if ", "for ", "while ", "function ", or "local function"
	static bool OpensBlock(const std::string &p_trimmed_line);

	// A trimmed line closes a block if it is "end", compared case-insensitively
	static bool IsBlockEnd(const std::string &p_trimmed_line);

	// Merge raw lines into logical lines; an unterminated block at the end is flushed as-is, with no error
	static std::vector<std::string> LogicalLinesFromRawLines(const std::vector<std::string> &p_raw_lines);
};


#endif /* defined(__Luna__luna_preprocessor__) */
