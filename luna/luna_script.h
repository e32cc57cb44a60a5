//
//  luna_script.h
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

 The class LunaScript represents one logical line of Luna source: a single top-level statement, which may be a
 whole function declaration or if statement after preprocessing.  It handles its tokenizing and parsing itself.

 Grammar, from the top down:

	statement			= "local" "function" function-decl
						| "function" function-decl
						| "local" assignment
						| if-statement
						| return-statement
						| assignment				(an identifier followed by "=" or ",")
						| expr
	function-decl		= IDENTIFIER "(" [ IDENTIFIER { "," IDENTIFIER } ] ")" block "end"
	if-statement		= "if" expr "then" block [ "else" block ] "end"
	return-statement	= "return" [ expr { "," expr } ]
	assignment			= IDENTIFIER { "," IDENTIFIER } "=" expr
	block				= { statement }				(up to "else", "end", or EOF)

	expr				= logical-or-expr
	logical-or-expr		= logical-and-expr { "or" logical-and-expr }
	logical-and-expr	= relational-expr { "and" relational-expr }
	relational-expr		= concat-expr { ( "==" | "~=" | "<" | "<=" | ">" | ">=" ) concat-expr }
	concat-expr			= add-expr { ".." add-expr }
	add-expr			= mult-expr { ( "+" | "-" ) mult-expr }
	mult-expr			= unary-expr { ( "*" | "/" ) unary-expr }
	unary-expr			= ( "not" | "-" ) unary-expr | primary-expr
	primary-expr		= NUMBER | STRING | "true" | "false" | "nil"
						| IDENTIFIER "(" [ expr { "," expr } ] ")"
						| IDENTIFIER
						| "(" expr ")"

 All binary operators are left-associative.  Any tokens left over after a complete statement are ignored.

 */

#ifndef __Luna__luna_script__
#define __Luna__luna_script__

#include <vector>
#include <string>
#include <ostream>

#include "luna_token.h"


class LunaASTNode;


// set these to true to get logging of tokens / AST / evaluation
extern bool gLunaLogTokens;
extern bool gLunaLogAST;
extern bool gLunaLogEvaluation;


// A class representing one logical line of script and all associated tokenization and parsing baggage
class LunaScript
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

protected:

	const std::string script_string_;		// the full text of the logical line

	std::vector<LunaToken> token_stream_;
	LunaASTNode *parse_root_ = nullptr;		// OWNED POINTER

	// parsing ivars, valid only during parsing
	int parse_index_;						// index into token_stream_ of the current token
	const LunaToken *current_token_;		// token_stream_[parse_index_]; owned indirectly
	LunaTokenType current_token_type_;		// token_stream_[parse_index_]->token_type_

public:

	LunaScript(const LunaScript&) = delete;									// no copying
	LunaScript& operator=(const LunaScript&) = delete;						// no copying
	LunaScript(void) = delete;												// no null construction

	explicit LunaScript(const std::string &p_script_string);
	virtual ~LunaScript(void);

	// generate token stream from script string
	void Tokenize(void);

	// generate AST from token stream for one statement; trailing tokens are ignored
	void ParseStatementToAST(void);

	void PrintTokens(std::ostream &p_outstream) const;
	void PrintAST(std::ostream &p_outstream) const;

	inline const std::string &String(void) const					{ return script_string_; }
	inline const std::vector<LunaToken> &Tokens(void) const			{ return token_stream_; }
	inline const LunaASTNode *AST(void) const						{ return parse_root_; }

	// Parsing methods; see grammar above
	void Consume(void);
	void Match(LunaTokenType p_token_type, const char *p_context_cstr);

	LunaASTNode *Parse_Statement(void);
	LunaASTNode *Parse_LocalStatement(void);
	LunaASTNode *Parse_FunctionDecl(void);
	LunaASTNode *Parse_ParamList(void);
	LunaASTNode *Parse_Block(void);
	LunaASTNode *Parse_IfStatement(void);
	LunaASTNode *Parse_ReturnStatement(void);
	LunaASTNode *Parse_Assignment(void);
	LunaASTNode *Parse_ExprStatement(void);
	LunaASTNode *Parse_Expr(void);
	LunaASTNode *Parse_LogicalOrExpr(void);
	LunaASTNode *Parse_LogicalAndExpr(void);
	LunaASTNode *Parse_RelationalExpr(void);
	LunaASTNode *Parse_ConcatExpr(void);
	LunaASTNode *Parse_AddExpr(void);
	LunaASTNode *Parse_MultExpr(void);
	LunaASTNode *Parse_UnaryExpr(void);
	LunaASTNode *Parse_PrimaryExpr(void);
	LunaASTNode *Parse_Constant(void);
	void Parse_ArgumentExprList(LunaASTNode *p_parent_node);
};


#endif /* defined(__Luna__luna_script__) */
