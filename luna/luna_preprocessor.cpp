//
//  luna_preprocessor.cpp
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


#include "luna_preprocessor.h"
#include "luna_globals.h"

#include <algorithm>
#include <string.h>


// the literal prefixes that open a block; note the trailing spaces, except after "local function"
static const char *const gLunaBlockOpeningPrefixes[] = {"if ", "for ", "while ", "function ", "local function"};


std::vector<std::string> LunaPreprocessor::SplitLines(const std::string &p_script_text)
{
	std::vector<std::string> lines;
	size_t line_start = 0;

	while (line_start <= p_script_text.size())
	{
		size_t line_end = p_script_text.find('\n', line_start);

		if (line_end == std::string::npos)
		{
			// the last line; a script ending in a newline does not produce an extra empty line
			if (line_start < p_script_text.size())
				lines.emplace_back(p_script_text.substr(line_start));
			break;
		}

		std::string line = p_script_text.substr(line_start, line_end - line_start);

		if (line.size() && (line.back() == '\r'))
			line.pop_back();

		lines.emplace_back(std::move(line));
		line_start = line_end + 1;
	}

	return lines;
}

std::string LunaPreprocessor::StripCommentAndNormalizeQuotes(const std::string &p_raw_line)
{
	std::string line(p_raw_line);

	std::replace(line.begin(), line.end(), '\'', '"');

	size_t comment_pos = line.find("--");

	if (comment_pos != std::string::npos)
		line.erase(comment_pos);

	return line;
}

bool LunaPreprocessor::OpensBlock(const std::string &p_trimmed_line)
{
	for (const char *prefix : gLunaBlockOpeningPrefixes)
		if (p_trimmed_line.compare(0, strlen(prefix), prefix) == 0)
			return true;

	return false;
}

bool LunaPreprocessor::IsBlockEnd(const std::string &p_trimmed_line)
{
	return Luna_EqualsIgnoringCase(p_trimmed_line, gLunaStr_end);
}

std::vector<std::string> LunaPreprocessor::LogicalLinesFromRawLines(const std::vector<std::string> &p_raw_lines)
{
	std::vector<std::string> logical_lines;
	std::string block_buffer;
	int block_depth = 0;

	for (const std::string &raw_line : p_raw_lines)
	{
		std::string trimmed_line = Luna_TrimWhitespace(StripCommentAndNormalizeQuotes(raw_line));

		if (trimmed_line.empty())
			continue;

		bool opens_block = OpensBlock(trimmed_line);

		if (block_depth == 0)
		{
			if (opens_block)
			{
				// start buffering a new top-level block; it is flushed when its matching "end" is seen
				block_depth = 1;
				block_buffer.append(trimmed_line).append(" ");
			}
			else
			{
				logical_lines.emplace_back(std::move(trimmed_line));
			}

			continue;
		}

		// inside a block: nested openers deepen it, and every line (including "else") goes into the buffer
		if (opens_block)
			block_depth++;

		block_buffer.append(trimmed_line).append(" ");

		if (IsBlockEnd(trimmed_line))
		{
			block_depth--;

			if (block_depth == 0)
			{
				logical_lines.emplace_back(Luna_TrimWhitespace(block_buffer));
				block_buffer.clear();
			}
		}
	}

	// an unterminated block is flushed anyway; the parser will report whatever is missing
	if (!block_buffer.empty())
		logical_lines.emplace_back(Luna_TrimWhitespace(block_buffer));

	return logical_lines;
}
