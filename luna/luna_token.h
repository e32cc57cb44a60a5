//
//  luna_token.h
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


#ifndef __Luna__luna_token__
#define __Luna__luna_token__

#include <stdio.h>

#include <string>
#include <ostream>

#include "luna_globals.h"


// An enumeration for all token types
enum class LunaTokenType : int16_t {
	kTokenNone = 0,		//			no token; this type should not be in the final token stream
	kTokenEOF,			//			end of line; an EOF token is produced explicitly

	kTokenLParen,		// (		subexpression and call argument delimiter
	kTokenRParen,		// )		subexpression and call argument delimiter
	kTokenComma,		// ,		separates arguments, parameters, assignment targets, and return values
	kTokenPlus,			// +		addition operator
	kTokenMinus,		// -		subtraction operator (unary or binary)
	kTokenMult,			// *		multiplication operator
	kTokenDiv,			// /		division operator
	kTokenConcat,		// ..		string concatenation operator

	kTokenAssign,		// =		assignment
	kTokenEq,			// ==		equality test
	kTokenNotEq,		// ~=		not equals test
	kTokenLt,			// <		less than test
	kTokenLtEq,			// <=		less than or equals test
	kTokenGt,			// >		greater than test
	kTokenGtEq,			// >=		greater than or equals test

	kTokenNumber,		//			digit sequences only; the literal is a double
	kTokenString,		//			string literals are bounded by double quotes only, with no escapes
	kTokenIdentifier,	//			all valid identifiers that are not keywords

	// ----- ALL TOKENS AFTER THIS POINT SHOULD BE KEYWORDS MATCHED BY kTokenIdentifier

	kFirstIdentifierLikeToken,
	kTokenLocal,		// local	local declaration prefix
	kTokenFunction,		// function	define a user-defined function
	kTokenReturn,		// return	return values from the enclosing function
	kTokenEnd,			// end		block terminator
	kTokenIf,			// if		conditional
	kTokenThen,			// then		conditional
	kTokenElse,			// else		conditional
	kTokenTrue,			// true		boolean constant
	kTokenFalse,		// false	boolean constant
	kTokenNil,			// nil		the nil constant
	kTokenAnd,			// and		short-circuiting logical AND
	kTokenOr,			// or		short-circuiting logical OR
	kTokenNot,			// not		logical NOT
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaTokenType p_token_type);


// A class representing a single token read from a logical line
class LunaToken
{
	//	This class has its assignment operator disabled, to prevent accidental copying.

public:

	const std::string token_string_;			// the lexeme: a verbatim copy of the source characters for the token
	const LunaTokenType token_type_;			// the type of the token; one of the enumeration above
	const int32_t token_start_;					// character position within the logical line
	const int32_t token_end_;					// character position within the logical line (inclusive)

	// literal payloads; only meaningful for kTokenNumber and kTokenString respectively
	const double number_literal_;
	const std::string string_literal_;			// the string contents, without the delimiting quotes

	LunaToken(const LunaToken&) = default;				// default copy-construction, for std::vector
	LunaToken& operator=(const LunaToken&) = delete;	// no copying
	LunaToken(void) = delete;							// no null construction

	inline LunaToken(LunaTokenType p_token_type, const std::string &p_token_string, int32_t p_token_start, int32_t p_token_end) :
	token_string_(p_token_string), token_type_(p_token_type), token_start_(p_token_start), token_end_(p_token_end), number_literal_(0.0), string_literal_()
	{
	}

	inline LunaToken(LunaTokenType p_token_type, const std::string &p_token_string, int32_t p_token_start, int32_t p_token_end, double p_number_literal, const std::string &p_string_literal) :
	token_string_(p_token_string), token_type_(p_token_type), token_start_(p_token_start), token_end_(p_token_end), number_literal_(p_number_literal), string_literal_(p_string_literal)
	{
	}
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaToken &p_token);


#endif /* defined(__Luna__luna_token__) */
