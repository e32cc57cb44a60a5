//
//  luna_script.cpp
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


#include "luna_script.h"
#include "luna_ast_node.h"

#include <iostream>
#include <cstdlib>


// set these to true to get logging of tokens / AST / evaluation
bool gLunaLogTokens = false;
bool gLunaLogAST = false;
bool gLunaLogEvaluation = false;


//
//	LunaScript
//
#pragma mark -
#pragma mark LunaScript
#pragma mark -

LunaScript::LunaScript(const std::string &p_script_string) : script_string_(p_script_string)
{
}

LunaScript::~LunaScript(void)
{
	delete parse_root_;
	parse_root_ = nullptr;
}

void LunaScript::Tokenize(void)
{
	// delete all existing tokens and any AST that refers to them
	token_stream_.clear();

	delete parse_root_;
	parse_root_ = nullptr;

	// chew off one token at a time from script_string_, make a Token object, and add it
	int32_t pos = 0, len = (int32_t)script_string_.length();

	while (pos < len)
	{
		int32_t token_start = pos;													// the first character position in the current token
		int32_t token_end = pos;													// the last character position in the current token
		int ch = (unsigned char)script_string_[pos];								// the current character
		int ch2 = ((pos + 1 >= len) ? 0 : (unsigned char)script_string_[pos + 1]);	// look ahead one character
		bool skip = false;															// set to true to skip creating/adding this token
		LunaTokenType token_type = LunaTokenType::kTokenNone;
		double number_literal = 0.0;
		std::string string_literal;

		switch (ch)
		{
			// cases that require just a single character to match
			case '(': token_type = LunaTokenType::kTokenLParen; break;
			case ')': token_type = LunaTokenType::kTokenRParen; break;
			case ',': token_type = LunaTokenType::kTokenComma; break;
			case '+': token_type = LunaTokenType::kTokenPlus; break;
			case '-': token_type = LunaTokenType::kTokenMinus; break;
			case '*': token_type = LunaTokenType::kTokenMult; break;
			case '/': token_type = LunaTokenType::kTokenDiv; break;

			// cases that require lookahead due to ambiguity: =, <, >, ~, .
			case '=':
				if (ch2 == '=') { token_type = LunaTokenType::kTokenEq; token_end++; }
				else { token_type = LunaTokenType::kTokenAssign; }
				break;
			case '<':
				if (ch2 == '=') { token_type = LunaTokenType::kTokenLtEq; token_end++; }
				else { token_type = LunaTokenType::kTokenLt; }
				break;
			case '>':
				if (ch2 == '=') { token_type = LunaTokenType::kTokenGtEq; token_end++; }
				else { token_type = LunaTokenType::kTokenGt; }
				break;
			case '~':	// only ~= is legal; a lone ~ is left as kTokenNone and raises below
				if (ch2 == '=') { token_type = LunaTokenType::kTokenNotEq; token_end++; }
				break;
			case '.':	// only .. is legal; a lone . is left as kTokenNone and raises below
				if (ch2 == '.') { token_type = LunaTokenType::kTokenConcat; token_end++; }
				break;

			// whitespace: any run of spaces, tabs, and line ends
			case ' ':
			case '\t':
			case '\r':
			case '\n':
				while (token_end + 1 < len)
				{
					int chn = (unsigned char)script_string_[token_end + 1];

					if ((chn == ' ') || (chn == '\t') || (chn == '\r') || (chn == '\n'))
						token_end++;
					else
						break;
				}

				skip = true;
				break;

			// cases that require scanning ahead: numbers, identifiers/keywords, string literals
			default:
				if ((ch >= '0') && (ch <= '9'))
				{
					// number: a digit sequence only, with no decimal point or exponent
					while (token_end + 1 < len)
					{
						int chn = (unsigned char)script_string_[token_end + 1];

						if ((chn >= '0') && (chn <= '9'))
							token_end++;
						else
							break;
					}

					token_type = LunaTokenType::kTokenNumber;
					number_literal = strtod(script_string_.substr(token_start, token_end - token_start + 1).c_str(), nullptr);
				}
				else if (((ch >= 'a') && (ch <= 'z')) || ((ch >= 'A') && (ch <= 'Z')) || (ch == '_'))
				{
					// identifier: regex something like this: [a-zA-Z_][a-zA-Z0-9_]*
					while (token_end + 1 < len)
					{
						int chn = (unsigned char)script_string_[token_end + 1];

						if (((chn >= 'a') && (chn <= 'z')) || ((chn >= 'A') && (chn <= 'Z')) || ((chn >= '0') && (chn <= '9')) || (chn == '_'))
							token_end++;
						else
							break;
					}

					token_type = LunaTokenType::kTokenIdentifier;
				}
				else if (ch == '"')
				{
					// string literal: bounded by double quotes, with no escapes; the preprocessor has already turned ' into "
					token_type = LunaTokenType::kTokenString;

					do
					{
						if (token_end + 1 == len)
							LUNA_TERMINATION << "ERROR (LunaScript::Tokenize): unterminated string literal." << LunaTerminate(LunaErrorKind::kLexical);

						char chn = script_string_[token_end + 1];

						token_end++;

						if (chn == '"')
							break;

						string_literal += chn;
					}
					while (true);
				}
				// else: ch does not start any token, so it will be handled by the token_type == kTokenNone case directly below
				break;
		}

		if ((token_type == LunaTokenType::kTokenNone) && !skip)
			LUNA_TERMINATION << "ERROR (LunaScript::Tokenize): unexpected character '" << (char)ch << "'." << LunaTerminate(LunaErrorKind::kLexical);

		if (!skip)
		{
			std::string token_string = script_string_.substr(token_start, token_end - token_start + 1);

			// figure out identifier-like tokens, which all get tokenized as kTokenIdentifier above
			if (token_type == LunaTokenType::kTokenIdentifier)
			{
				if (token_string.compare(gLunaStr_local) == 0) token_type = LunaTokenType::kTokenLocal;
				else if (token_string.compare(gLunaStr_function) == 0) token_type = LunaTokenType::kTokenFunction;
				else if (token_string.compare(gLunaStr_return) == 0) token_type = LunaTokenType::kTokenReturn;
				else if (token_string.compare(gLunaStr_end) == 0) token_type = LunaTokenType::kTokenEnd;
				else if (token_string.compare(gLunaStr_if) == 0) token_type = LunaTokenType::kTokenIf;
				else if (token_string.compare(gLunaStr_then) == 0) token_type = LunaTokenType::kTokenThen;
				else if (token_string.compare(gLunaStr_else) == 0) token_type = LunaTokenType::kTokenElse;
				else if (token_string.compare(gLunaStr_true) == 0) token_type = LunaTokenType::kTokenTrue;
				else if (token_string.compare(gLunaStr_false) == 0) token_type = LunaTokenType::kTokenFalse;
				else if (token_string.compare(gLunaStr_nil) == 0) token_type = LunaTokenType::kTokenNil;
				else if (token_string.compare(gLunaStr_and) == 0) token_type = LunaTokenType::kTokenAnd;
				else if (token_string.compare(gLunaStr_or) == 0) token_type = LunaTokenType::kTokenOr;
				else if (token_string.compare(gLunaStr_not) == 0) token_type = LunaTokenType::kTokenNot;
			}

			// make the token and push it
			token_stream_.emplace_back(token_type, token_string, token_start, token_end, number_literal, string_literal);
		}

		// advance to the character immediately past the end of this token
		pos = token_end + 1;
	}

	// add an EOF token at the end
	token_stream_.emplace_back(LunaTokenType::kTokenEOF, "EOF", pos, pos);

	// if logging of tokens is requested, do that
	if (gLunaLogTokens)
	{
		std::cout << "Tokens : ";
		this->PrintTokens(std::cout);
	}
}

void LunaScript::Consume(void)
{
	// consume the token unless it is an EOF; we effectively have an infinite number of EOF tokens at the end
	if (current_token_type_ != LunaTokenType::kTokenEOF)
	{
		++parse_index_;
		current_token_ = &token_stream_.at(parse_index_);
		current_token_type_ = current_token_->token_type_;
	}
}

void LunaScript::Match(LunaTokenType p_token_type, const char *p_context_cstr)
{
	if (current_token_type_ == p_token_type)
	{
		// consume the token unless it is an EOF; we effectively have an infinite number of EOF tokens at the end
		if (current_token_type_ != LunaTokenType::kTokenEOF)
		{
			++parse_index_;
			current_token_ = &token_stream_.at(parse_index_);
			current_token_type_ = current_token_->token_type_;
		}
	}
	else
	{
		LUNA_TERMINATION << "ERROR (LunaScript::Match): unexpected token '" << *current_token_ << "' in " << std::string(p_context_cstr) << "; expected '" << p_token_type << "'." << LunaTerminate(LunaErrorKind::kParse);
	}
}

LunaASTNode *LunaScript::Parse_Statement(void)
{
	if (current_token_type_ == LunaTokenType::kTokenLocal)
		return Parse_LocalStatement();
	else if (current_token_type_ == LunaTokenType::kTokenFunction)
		return Parse_FunctionDecl();
	else if (current_token_type_ == LunaTokenType::kTokenIf)
		return Parse_IfStatement();
	else if (current_token_type_ == LunaTokenType::kTokenReturn)
		return Parse_ReturnStatement();
	else if (current_token_type_ == LunaTokenType::kTokenIdentifier)
	{
		// Look ahead one token for the IDENTIFIER '=' and IDENTIFIER ',' patterns.  The token at parse_index_ + 1 will always
		// be defined, at least as an EOF, since the current token is not an EOF.
		LunaTokenType next_token_type = token_stream_.at(parse_index_ + 1).token_type_;

		if ((next_token_type == LunaTokenType::kTokenAssign) || (next_token_type == LunaTokenType::kTokenComma))
			return Parse_Assignment();
	}

	return Parse_ExprStatement();
}

LunaASTNode *LunaScript::Parse_LocalStatement(void)
{
	Match(LunaTokenType::kTokenLocal, "local declaration");

	// "local" makes no difference to the resulting node; assignments always define in the current scope anyway
	if (current_token_type_ == LunaTokenType::kTokenFunction)
		return Parse_FunctionDecl();

	return Parse_Assignment();
}

LunaASTNode *LunaScript::Parse_FunctionDecl(void)
{
	LunaASTNode *node = nullptr, *identifier, *param_list, *body;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeFunctionDecl, current_token_);

		Match(LunaTokenType::kTokenFunction, "function declaration");

		identifier = new LunaASTNode(LunaNodeType::kNodeVariable, current_token_);
		node->AddChild(identifier);
		Match(LunaTokenType::kTokenIdentifier, "function declaration");

		param_list = Parse_ParamList();
		node->AddChild(param_list);

		body = Parse_Block();
		node->AddChild(body);

		Match(LunaTokenType::kTokenEnd, "function declaration");
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_ParamList(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeBlock, current_token_);

		Match(LunaTokenType::kTokenLParen, "parameter list");

		if (current_token_type_ != LunaTokenType::kTokenRParen)
		{
			node->AddChild(new LunaASTNode(LunaNodeType::kNodeVariable, current_token_));
			Match(LunaTokenType::kTokenIdentifier, "parameter list");

			while (current_token_type_ == LunaTokenType::kTokenComma)
			{
				Consume();

				node->AddChild(new LunaASTNode(LunaNodeType::kNodeVariable, current_token_));
				Match(LunaTokenType::kTokenIdentifier, "parameter list");
			}
		}

		Match(LunaTokenType::kTokenRParen, "parameter list");
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_Block(void)
{
	LunaASTNode *node = new LunaASTNode(LunaNodeType::kNodeBlock, current_token_);

	try
	{
		// the caller matches whichever terminator ends the block
		while ((current_token_type_ != LunaTokenType::kTokenElse) && (current_token_type_ != LunaTokenType::kTokenEnd) && (current_token_type_ != LunaTokenType::kTokenEOF))
		{
			LunaASTNode *child = Parse_Statement();

			node->AddChild(child);
		}
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_IfStatement(void)
{
	LunaASTNode *node = nullptr, *test_expr, *true_block, *false_block;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeIf, current_token_);

		Match(LunaTokenType::kTokenIf, "if statement");

		test_expr = Parse_Expr();
		node->AddChild(test_expr);

		Match(LunaTokenType::kTokenThen, "if statement");

		true_block = Parse_Block();
		node->AddChild(true_block);

		if (current_token_type_ == LunaTokenType::kTokenElse)
		{
			Consume();

			false_block = Parse_Block();
			node->AddChild(false_block);
		}

		Match(LunaTokenType::kTokenEnd, "if statement");
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_ReturnStatement(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeReturn, current_token_);

		Match(LunaTokenType::kTokenReturn, "return statement");

		// a bare return, with no values, is allowed at the end of a block
		if ((current_token_type_ != LunaTokenType::kTokenElse) && (current_token_type_ != LunaTokenType::kTokenEnd) && (current_token_type_ != LunaTokenType::kTokenEOF))
		{
			node->AddChild(Parse_Expr());

			while (current_token_type_ == LunaTokenType::kTokenComma)
			{
				Consume();

				node->AddChild(Parse_Expr());
			}
		}
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_Assignment(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeAssignment, current_token_);

		node->AddChild(new LunaASTNode(LunaNodeType::kNodeVariable, current_token_));
		Match(LunaTokenType::kTokenIdentifier, "assignment");

		while (current_token_type_ == LunaTokenType::kTokenComma)
		{
			Consume();

			node->AddChild(new LunaASTNode(LunaNodeType::kNodeVariable, current_token_));
			Match(LunaTokenType::kTokenIdentifier, "assignment");
		}

		// the node is identified by its = token, not by the first target
		node->token_ = current_token_;
		Match(LunaTokenType::kTokenAssign, "assignment");

		node->AddChild(Parse_Expr());
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_ExprStatement(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		node = new LunaASTNode(LunaNodeType::kNodeExpressionStatement, current_token_);

		node->AddChild(Parse_Expr());
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_Expr(void)
{
	return Parse_LogicalOrExpr();
}

LunaASTNode *LunaScript::Parse_LogicalOrExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_LogicalAndExpr();

		while (current_token_type_ == LunaTokenType::kTokenOr)
		{
			node = new LunaASTNode(LunaNodeType::kNodeLogical, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_LogicalAndExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_LogicalAndExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_RelationalExpr();

		while (current_token_type_ == LunaTokenType::kTokenAnd)
		{
			node = new LunaASTNode(LunaNodeType::kNodeLogical, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_RelationalExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_RelationalExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_ConcatExpr();

		while ((current_token_type_ == LunaTokenType::kTokenEq) || (current_token_type_ == LunaTokenType::kTokenNotEq) ||
			   (current_token_type_ == LunaTokenType::kTokenLt) || (current_token_type_ == LunaTokenType::kTokenLtEq) ||
			   (current_token_type_ == LunaTokenType::kTokenGt) || (current_token_type_ == LunaTokenType::kTokenGtEq))
		{
			node = new LunaASTNode(LunaNodeType::kNodeBinary, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_ConcatExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_ConcatExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_AddExpr();

		while (current_token_type_ == LunaTokenType::kTokenConcat)
		{
			node = new LunaASTNode(LunaNodeType::kNodeBinary, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_AddExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_AddExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_MultExpr();

		while ((current_token_type_ == LunaTokenType::kTokenPlus) || (current_token_type_ == LunaTokenType::kTokenMinus))
		{
			node = new LunaASTNode(LunaNodeType::kNodeBinary, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_MultExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_MultExpr(void)
{
	LunaASTNode *left_expr = nullptr, *node = nullptr;

	try
	{
		left_expr = Parse_UnaryExpr();

		while ((current_token_type_ == LunaTokenType::kTokenMult) || (current_token_type_ == LunaTokenType::kTokenDiv))
		{
			node = new LunaASTNode(LunaNodeType::kNodeBinary, current_token_, left_expr);
			left_expr = nullptr;

			Consume();

			node->AddChild(Parse_UnaryExpr());

			left_expr = node;
			node = nullptr;
		}
	}
	catch (...)
	{
		delete left_expr;
		delete node;

		throw;
	}

	return left_expr;
}

LunaASTNode *LunaScript::Parse_UnaryExpr(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		if ((current_token_type_ == LunaTokenType::kTokenNot) || (current_token_type_ == LunaTokenType::kTokenMinus))
		{
			node = new LunaASTNode(LunaNodeType::kNodeUnary, current_token_);

			Consume();

			node->AddChild(Parse_UnaryExpr());
		}
		else
		{
			node = Parse_PrimaryExpr();
		}
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_PrimaryExpr(void)
{
	LunaASTNode *node = nullptr;

	try
	{
		if ((current_token_type_ == LunaTokenType::kTokenNumber) || (current_token_type_ == LunaTokenType::kTokenString) ||
			(current_token_type_ == LunaTokenType::kTokenTrue) || (current_token_type_ == LunaTokenType::kTokenFalse) || (current_token_type_ == LunaTokenType::kTokenNil))
		{
			node = Parse_Constant();
		}
		else if (current_token_type_ == LunaTokenType::kTokenLParen)
		{
			Consume();

			node = Parse_Expr();

			Match(LunaTokenType::kTokenRParen, "parenthesized expression");
		}
		else if (current_token_type_ == LunaTokenType::kTokenIdentifier)
		{
			node = new LunaASTNode(LunaNodeType::kNodeVariable, current_token_);

			Match(LunaTokenType::kTokenIdentifier, "primary identifier expression");

			// only an identifier immediately followed by ( is a call; the call node takes the variable as its first child
			if (current_token_type_ == LunaTokenType::kTokenLParen)
			{
				node = new LunaASTNode(LunaNodeType::kNodeCall, current_token_, node);

				Consume();

				if (current_token_type_ != LunaTokenType::kTokenRParen)
					Parse_ArgumentExprList(node);

				Match(LunaTokenType::kTokenRParen, "call argument list");
			}
		}
		else
		{
			LUNA_TERMINATION << "ERROR (LunaScript::Parse_PrimaryExpr): unexpected token '" << *current_token_ << "' in primary expression." << LunaTerminate(LunaErrorKind::kParse);
		}
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

LunaASTNode *LunaScript::Parse_Constant(void)
{
	LunaASTNode *node = new LunaASTNode(LunaNodeType::kNodeLiteral, current_token_);

	try
	{
		node->CacheLiteralValue();

		Consume();
	}
	catch (...)
	{
		delete node;

		throw;
	}

	return node;
}

void LunaScript::Parse_ArgumentExprList(LunaASTNode *p_parent_node)
{
	p_parent_node->AddChild(Parse_Expr());

	while (current_token_type_ == LunaTokenType::kTokenComma)
	{
		Consume();

		p_parent_node->AddChild(Parse_Expr());
	}
}

void LunaScript::ParseStatementToAST(void)
{
	// destroy the parse root
	delete parse_root_;
	parse_root_ = nullptr;

	// set up parse state
	parse_index_ = 0;
	current_token_ = &token_stream_.at(parse_index_);		// should always have at least an EOF
	current_token_type_ = current_token_->token_type_;

	// parse a new AST from our start token; anything after the statement is ignored
	parse_root_ = Parse_Statement();

	// if logging of the AST is requested, do that
	if (gLunaLogAST)
	{
		std::cout << "AST : \n";
		this->PrintAST(std::cout);
	}
}

void LunaScript::PrintTokens(std::ostream &p_outstream) const
{
	if (token_stream_.size())
	{
		for (auto &token : token_stream_)
			p_outstream << token << " ";

		p_outstream << std::endl;
	}
}

void LunaScript::PrintAST(std::ostream &p_outstream) const
{
	if (parse_root_)
	{
		parse_root_->PrintTreeWithIndent(p_outstream, 0);

		p_outstream << std::endl;
	}
}
