//
//  luna_globals.cpp
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


#include "luna_globals.h"

#include <cctype>
#include <cstdio>


#pragma mark -
#pragma mark Termination handling
#pragma mark -

thread_local std::ostringstream gLunaTermination;

std::ostream &operator<<(std::ostream &p_outstream, const LunaErrorKind p_kind)
{
	switch (p_kind)
	{
		case LunaErrorKind::kLexical:				p_outstream << "LexicalError";				break;
		case LunaErrorKind::kParse:					p_outstream << "ParseError";				break;
		case LunaErrorKind::kUndefinedMutation:		p_outstream << "UndefinedMutationError";	break;
		case LunaErrorKind::kArityMismatch:			p_outstream << "ArityMismatchError";		break;
		case LunaErrorKind::kTypeCoercion:			p_outstream << "TypeCoercionError";			break;
		case LunaErrorKind::kUnknownConstruct:		p_outstream << "UnknownConstructError";		break;
	}

	return p_outstream;
}

void operator<<(std::ostream& p_out, const LunaTerminate &p_terminator)
{
	p_out.flush();

	// Take the message out of the termination stream and reset the stream for the next raise on this thread
	std::string termination_message = gLunaTermination.str();

	gLunaTermination.clear();
	gLunaTermination.str(gLunaStr_empty_string);

	// trim off newlines at the end of the raise string
	size_t endpos = termination_message.find_last_not_of("\n\r");

	if (std::string::npos != endpos)
		termination_message = termination_message.substr(0, endpos + 1);

	throw LunaRaise(p_terminator.error_kind_, termination_message);
}


#pragma mark -
#pragma mark Utility functions
#pragma mark -

std::string Luna_TrimWhitespace(const std::string &p_string)
{
	static const char *whitespace = " \t\n\r\f\v";

	size_t start = p_string.find_first_not_of(whitespace);

	if (start == std::string::npos)
		return gLunaStr_empty_string;

	size_t end = p_string.find_last_not_of(whitespace);

	return p_string.substr(start, end - start + 1);
}

bool Luna_EqualsIgnoringCase(const std::string &p_string1, const std::string &p_string2)
{
	if (p_string1.size() != p_string2.size())
		return false;

	for (size_t index = 0; index < p_string1.size(); ++index)
		if (std::tolower((unsigned char)p_string1[index]) != std::tolower((unsigned char)p_string2[index]))
			return false;

	return true;
}

std::string Luna_StringForNumber(double p_number)
{
	// %.14g gives integral values without a decimal point, and avoids printing binary representation noise
	char buffer[64];

	snprintf(buffer, sizeof(buffer), "%.14g", p_number);

	return std::string(buffer);
}


#pragma mark -
#pragma mark Global strings
#pragma mark -

const std::string gLunaStr_empty_string = "";

const std::string gLunaStr_local = "local";
const std::string gLunaStr_function = "function";
const std::string gLunaStr_return = "return";
const std::string gLunaStr_end = "end";
const std::string gLunaStr_if = "if";
const std::string gLunaStr_then = "then";
const std::string gLunaStr_else = "else";
const std::string gLunaStr_true = "true";
const std::string gLunaStr_false = "false";
const std::string gLunaStr_nil = "nil";
const std::string gLunaStr_and = "and";
const std::string gLunaStr_or = "or";
const std::string gLunaStr_not = "not";

const std::string gLunaStr_boolean = "boolean";
const std::string gLunaStr_number = "number";
const std::string gLunaStr_string = "string";
const std::string gLunaStr_multivalue = "multivalue";

const std::string gLunaStr_print = "print";
const std::string gLunaStr_sqrt = "sqrt";
const std::string gLunaStr_tostring = "tostring";
const std::string gLunaStr_type = "type";
