//
//  luna_globals.h
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

 This file contains the globals shared by all of Luna: version information, the hashing configuration switch, the
 termination (raise) machinery and its error kinds, and the uniqued strings used for language keywords.

 */

#ifndef __Luna__luna_globals__
#define __Luna__luna_globals__

#include <stdio.h>
#include <iostream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <cstdint>


// Luna version
#define LUNA_VERSION_STRING	("1.0")
#define LUNA_VERSION_FLOAT	(1.0)


// This governs whether "Robin Hood Hashing" is used instead of std::unordered_map for symbol tables, for speed.
// Robin Hood Hashing is in robin_hood.h, and is by Martin Ankerl (https://github.com/martinus/robin-hood-hashing);
// it is not bundled with Luna, so an installed copy of robin_hood.h must be on the include path when this is 1.
// The build may predefine LUNA_ROBIN_HOOD_HASHING to 0 to fall back to std::unordered_map.
// STD_UNORDERED_MAP_HASHING is the reverse flag; this just makes it easy to get an error message if this header
// is not included, following a standard usage pattern, since then neither of these defines will exist.
#ifndef LUNA_ROBIN_HOOD_HASHING
#define LUNA_ROBIN_HOOD_HASHING	1
#endif

#if LUNA_ROBIN_HOOD_HASHING
#define STD_UNORDERED_MAP_HASHING	0
#else
#define STD_UNORDERED_MAP_HASHING	1
#endif


// *******************************************************************************************************************
//
//	Termination handling
//
#pragma mark -
#pragma mark Termination handling
#pragma mark -

// The kinds of fatal error that can be raised while processing a logical line.  Each raise carries one of these, so
// that the script driver (and the self-tests) can tell a lexical error from a type error without parsing messages.
enum class LunaErrorKind : uint8_t {
	kLexical = 0,				// unrecognized character, unterminated string literal
	kParse,						// unmet grammar expectation
	kUndefinedMutation,			// assignment-by-mutation to a name absent from the whole scope chain
	kArityMismatch,				// call argument count differs from the declared parameter count
	kTypeCoercion,				// operand cannot be coerced for arithmetic/ordering/concatenation; call of a non-function
	kUnknownConstruct			// an AST node reached evaluation with no matching case; an internal error
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaErrorKind p_kind);

// The exception thrown by << LunaTerminate.  The message is the text that was sent to LUNA_TERMINATION before the
// terminator, with trailing newlines trimmed.
class LunaRaise : public std::runtime_error
{
public:
	const LunaErrorKind error_kind_;

	LunaRaise& operator=(const LunaRaise&) = delete;		// no copying
	LunaRaise(void) = delete;								// no null construction

	LunaRaise(LunaErrorKind p_kind, const std::string &p_message) : std::runtime_error(p_message), error_kind_(p_kind) { }

	inline LunaErrorKind Kind(void) const { return error_kind_; }
};

// Termination output is collected in an ostringstream, and whoever catches the LunaRaise handles the message.  The stream
// is per-thread, since the script driver runs scripts on background threads; all other Luna output goes to the streams
// given to LunaInterpreter (see ExecutionOutputStream() and ErrorOutputStream()).
extern thread_local std::ostringstream gLunaTermination;

#define LUNA_TERMINATION	(gLunaTermination)

// This little class is used as a stream manipulator that causes a raise of the given kind.  This is nice since it lets
// us log and terminate in a single line of code:
//
//		LUNA_TERMINATION << "ERROR (LunaScript::Tokenize): unterminated string literal." << LunaTerminate(LunaErrorKind::kLexical);
//
class LunaTerminate
{
public:
	LunaErrorKind error_kind_;

	LunaTerminate(void) = delete;							// no null construction; a kind is required

	explicit LunaTerminate(LunaErrorKind p_kind) : error_kind_(p_kind) { }
};

// Send a LunaTerminate object to an output stream, causing a raise.  This call does not return, so it is marked as
// noreturn as a hint to the compiler; since this is always an error case, it is also marked as cold.
void operator<<(std::ostream& p_out, const LunaTerminate &p_terminator) __attribute__((__noreturn__)) __attribute__((cold));


// *******************************************************************************************************************
//
//	Utility functions
//
#pragma mark -
#pragma mark Utility functions
#pragma mark -

// Trim spaces, tabs, and line-end characters from both ends of a string
std::string Luna_TrimWhitespace(const std::string &p_string);

// Case-insensitive comparison of two ASCII strings
bool Luna_EqualsIgnoringCase(const std::string &p_string1, const std::string &p_string2);

// The canonical text form for a number, as used by printing and by concatenation
std::string Luna_StringForNumber(double p_number);


// *******************************************************************************************************************
//
//	Global strings
//
#pragma mark -
#pragma mark Global strings
#pragma mark -

extern const std::string gLunaStr_empty_string;

// language keywords
extern const std::string gLunaStr_local;
extern const std::string gLunaStr_function;
extern const std::string gLunaStr_return;
extern const std::string gLunaStr_end;
extern const std::string gLunaStr_if;
extern const std::string gLunaStr_then;
extern const std::string gLunaStr_else;
extern const std::string gLunaStr_true;
extern const std::string gLunaStr_false;
extern const std::string gLunaStr_nil;
extern const std::string gLunaStr_and;
extern const std::string gLunaStr_or;
extern const std::string gLunaStr_not;

// value type names
extern const std::string gLunaStr_boolean;
extern const std::string gLunaStr_number;
extern const std::string gLunaStr_string;
extern const std::string gLunaStr_multivalue;

// built-in function names
extern const std::string gLunaStr_print;
extern const std::string gLunaStr_sqrt;
extern const std::string gLunaStr_tostring;
extern const std::string gLunaStr_type;


#endif /* defined(__Luna__luna_globals__) */
