//
//  luna_token.cpp
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


#include "luna_token.h"


std::ostream &operator<<(std::ostream &p_outstream, const LunaTokenType p_token_type)
{
	switch (p_token_type)
	{
		case LunaTokenType::kTokenNone:					p_outstream << "NO_TOKEN";		break;
		case LunaTokenType::kTokenEOF:					p_outstream << "EOF";			break;
		case LunaTokenType::kTokenLParen:				p_outstream << "(";				break;
		case LunaTokenType::kTokenRParen:				p_outstream << ")";				break;
		case LunaTokenType::kTokenComma:				p_outstream << ",";				break;
		case LunaTokenType::kTokenPlus:					p_outstream << "+";				break;
		case LunaTokenType::kTokenMinus:				p_outstream << "-";				break;
		case LunaTokenType::kTokenMult:					p_outstream << "*";				break;
		case LunaTokenType::kTokenDiv:					p_outstream << "/";				break;
		case LunaTokenType::kTokenConcat:				p_outstream << "..";			break;
		case LunaTokenType::kTokenAssign:				p_outstream << "=";				break;
		case LunaTokenType::kTokenEq:					p_outstream << "==";			break;
		case LunaTokenType::kTokenNotEq:				p_outstream << "~=";			break;
		case LunaTokenType::kTokenLt:					p_outstream << "<";				break;
		case LunaTokenType::kTokenLtEq:					p_outstream << "<=";			break;
		case LunaTokenType::kTokenGt:					p_outstream << ">";				break;
		case LunaTokenType::kTokenGtEq:					p_outstream << ">=";			break;
		case LunaTokenType::kTokenNumber:				p_outstream << "NUMBER";		break;
		case LunaTokenType::kTokenString:				p_outstream << "STRING";		break;
		case LunaTokenType::kTokenIdentifier:			p_outstream << "IDENTIFIER";	break;
		case LunaTokenType::kTokenLocal:				p_outstream << gLunaStr_local;		break;
		case LunaTokenType::kTokenFunction:				p_outstream << gLunaStr_function;	break;
		case LunaTokenType::kTokenReturn:				p_outstream << gLunaStr_return;		break;
		case LunaTokenType::kTokenEnd:					p_outstream << gLunaStr_end;		break;
		case LunaTokenType::kTokenIf:					p_outstream << gLunaStr_if;			break;
		case LunaTokenType::kTokenThen:					p_outstream << gLunaStr_then;		break;
		case LunaTokenType::kTokenElse:					p_outstream << gLunaStr_else;		break;
		case LunaTokenType::kTokenTrue:					p_outstream << gLunaStr_true;		break;
		case LunaTokenType::kTokenFalse:				p_outstream << gLunaStr_false;		break;
		case LunaTokenType::kTokenNil:					p_outstream << gLunaStr_nil;		break;
		case LunaTokenType::kTokenAnd:					p_outstream << gLunaStr_and;		break;
		case LunaTokenType::kTokenOr:					p_outstream << gLunaStr_or;			break;
		case LunaTokenType::kTokenNot:					p_outstream << gLunaStr_not;		break;

		case LunaTokenType::kFirstIdentifierLikeToken:	p_outstream << "???";			break;
	}

	return p_outstream;
}

std::ostream &operator<<(std::ostream &p_outstream, const LunaToken &p_token)
{
	// print strings, identifiers, numbers, and keywords with identifying marks; apart from that, print tokens as is
	if (p_token.token_type_ == LunaTokenType::kTokenString)
		p_outstream << "\"" << p_token.string_literal_ << "\"";
	else if (p_token.token_type_ == LunaTokenType::kTokenIdentifier)
		p_outstream << "@" << p_token.token_string_;
	else if (p_token.token_type_ == LunaTokenType::kTokenNumber)
		p_outstream << "#" << p_token.token_string_;
	else if (p_token.token_type_ > LunaTokenType::kFirstIdentifierLikeToken)
		p_outstream << "<" << p_token.token_string_ << ">";	// <> delimiters help distinguish keywords from identifiers
	else
		p_outstream << p_token.token_type_;

	return p_outstream;
}
