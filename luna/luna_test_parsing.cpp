//
//  luna_test_parsing.cpp
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



#include "luna_test.h"
#include "luna_preprocessor.h"
#include "luna_script.h"


#pragma mark tokenization
void _RunTokenizationTests(void)
{
	LunaAssertTokenTypes("x = 1", {LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenAssign, LunaTokenType::kTokenNumber});
	LunaAssertTokenTypes("a==b~=c<=d>=e<f>g", {LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenEq, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenNotEq, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenLtEq, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenGtEq, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenLt, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenGt, LunaTokenType::kTokenIdentifier});
	LunaAssertTokenTypes("(1+2)*3/4-5", {LunaTokenType::kTokenLParen, LunaTokenType::kTokenNumber, LunaTokenType::kTokenPlus, LunaTokenType::kTokenNumber, LunaTokenType::kTokenRParen, LunaTokenType::kTokenMult, LunaTokenType::kTokenNumber, LunaTokenType::kTokenDiv, LunaTokenType::kTokenNumber, LunaTokenType::kTokenMinus, LunaTokenType::kTokenNumber});
	LunaAssertTokenTypes("1..2", {LunaTokenType::kTokenNumber, LunaTokenType::kTokenConcat, LunaTokenType::kTokenNumber});
	LunaAssertTokenTypes("f(a, \"b c\")", {LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenLParen, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenComma, LunaTokenType::kTokenString, LunaTokenType::kTokenRParen});
	LunaAssertTokenTypes("local function return end if then else", {LunaTokenType::kTokenLocal, LunaTokenType::kTokenFunction, LunaTokenType::kTokenReturn, LunaTokenType::kTokenEnd, LunaTokenType::kTokenIf, LunaTokenType::kTokenThen, LunaTokenType::kTokenElse});
	LunaAssertTokenTypes("true false nil and or not", {LunaTokenType::kTokenTrue, LunaTokenType::kTokenFalse, LunaTokenType::kTokenNil, LunaTokenType::kTokenAnd, LunaTokenType::kTokenOr, LunaTokenType::kTokenNot});
	LunaAssertTokenTypes("ends If _nil2 elsewhere", {LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenIdentifier, LunaTokenType::kTokenIdentifier});
	LunaAssertTokenTypes(" \t ", {});
	LunaAssertTokenTypes("", {});

	// literal payloads and positions
	{
		LunaScript script("x = 42 .. \"hi there\"");

		script.Tokenize();

		const std::vector<LunaToken> &tokens = script.Tokens();

		LunaAssertCondition("number literal payload", (tokens[2].number_literal_ == 42.0) && (tokens[2].token_string_ == "42"));
		LunaAssertCondition("number literal positions", (tokens[2].token_start_ == 4) && (tokens[2].token_end_ == 5));
		LunaAssertCondition("string literal payload", (tokens[4].string_literal_ == "hi there") && (tokens[4].token_string_ == "\"hi there\""));
	}

	{
		LunaScript script("\"\"");

		script.Tokenize();

		LunaAssertCondition("empty string literal", (script.Tokens()[0].token_type_ == LunaTokenType::kTokenString) && script.Tokens()[0].string_literal_.empty());
	}

	// lexical errors
	LunaAssertScriptRaise("x = 1 @ 2", LunaErrorKind::kLexical, "unexpected character '@'");
	LunaAssertScriptRaise("x = 1 ~ 2", LunaErrorKind::kLexical, "unexpected character '~'");
	LunaAssertScriptRaise("x = 1.5", LunaErrorKind::kLexical, "unexpected character '.'");
	LunaAssertScriptRaise("x = {}", LunaErrorKind::kLexical, "unexpected character '{'");
	LunaAssertScriptRaise("x = \"abc", LunaErrorKind::kLexical, "unterminated string literal");
	LunaAssertScriptRaise("x = 'abc", LunaErrorKind::kLexical, "unterminated string literal");
}

#pragma mark preprocessor
void _RunPreprocessorTests(void)
{
	// line splitting
	LunaAssertCondition("SplitLines() splits at newlines", LunaPreprocessor::SplitLines("a\nb\r\nc") == std::vector<std::string>({"a", "b", "c"}));
	LunaAssertCondition("SplitLines() with a trailing newline", LunaPreprocessor::SplitLines("a\n") == std::vector<std::string>({"a"}));
	LunaAssertCondition("SplitLines() keeps empty lines", LunaPreprocessor::SplitLines("a\n\nb") == std::vector<std::string>({"a", "", "b"}));

	// comments and quotes
	LunaAssertCondition("comment stripping", LunaPreprocessor::StripCommentAndNormalizeQuotes("x = 1 -- set x") == "x = 1 ");
	LunaAssertCondition("quote normalization", LunaPreprocessor::StripCommentAndNormalizeQuotes("s = 'a'") == "s = \"a\"");
	LunaAssertCondition("comment marker inside a string", LunaPreprocessor::StripCommentAndNormalizeQuotes("s = \"a--b\"") == "s = \"a");

	// block openers
	LunaAssertCondition("if opens a block", LunaPreprocessor::OpensBlock("if x then"));
	LunaAssertCondition("function opens a block", LunaPreprocessor::OpensBlock("function f()"));
	LunaAssertCondition("local function opens a block", LunaPreprocessor::OpensBlock("local function f()"));
	LunaAssertCondition("while opens a block", LunaPreprocessor::OpensBlock("while x do"));
	LunaAssertCondition("for opens a block", LunaPreprocessor::OpensBlock("for i = 1, 3 do"));
	LunaAssertCondition("ifx does not open a block", !LunaPreprocessor::OpensBlock("ifx = 1"));
	LunaAssertCondition("local x does not open a block", !LunaPreprocessor::OpensBlock("local x = 1"));
	LunaAssertCondition("END closes a block", LunaPreprocessor::IsBlockEnd("END"));
	LunaAssertCondition("end) does not close a block", !LunaPreprocessor::IsBlockEnd("end)"));

	// logical lines
	LunaAssertLogicalLines({"x = 1", "", "   ", "-- just a comment", "  y = 2  "}, {"x = 1", "y = 2"});
	LunaAssertLogicalLines({"function f(a)", "  return a", "end", "x = f(1)"}, {"function f(a) return a end", "x = f(1)"});
	LunaAssertLogicalLines({"if x then", "  if y then", "    z = 1", "  end", "else", "  z = 2", "end"}, {"if x then if y then z = 1 end else z = 2 end"});
	LunaAssertLogicalLines({"local function g()", "  return 'q' -- quoted", "End"}, {"local function g() return \"q\" End"});
	LunaAssertLogicalLines({"if x then", "  y = 1"}, {"if x then y = 1"});
	LunaAssertLogicalLines({"x = 1", "end", "y = 2"}, {"x = 1", "end", "y = 2"});

	// a one-line block never sees a line that is exactly "end", so it swallows the rest of the script
	LunaAssertLogicalLines({"if x then y = 1 end", "z = 2"}, {"if x then y = 1 end z = 2"});

	// flat input passes through unchanged apart from trimming and comment stripping, so a second pass changes nothing
	{
		std::vector<std::string> raw_lines = {"x = 'a' -- c", "  y = x .. 'b'", "print(y)\t"};
		std::vector<std::string> once = LunaPreprocessor::LogicalLinesFromRawLines(raw_lines);
		std::vector<std::string> twice = LunaPreprocessor::LogicalLinesFromRawLines(once);

		LunaAssertCondition("flat input is trimmed and stripped", once == std::vector<std::string>({"x = \"a\"", "y = x .. \"b\"", "print(y)"}));
		LunaAssertCondition("preprocessing flat input is idempotent", once == twice);
	}

	// a multi-line block is not a fixed point, since its flattened form no longer ends with a line that is exactly "end"
	LunaAssertLogicalLines({"function f() return 1 end", "x = f()"}, {"function f() return 1 end x = f()"});
}

#pragma mark parsing
void _RunParsingTests(void)
{
	// tree shapes
	LunaAssertAST("x = 1", "(= @x #1)");
	LunaAssertAST("a, b = f()", "(=\n  @a\n  @b\n  (CALL @f)\n)");
	LunaAssertAST("f(1, 2)", "(EXPR_STATEMENT\n  (CALL @f #1 #2)\n)");
	LunaAssertAST("x = 1 + 2 * 3", "(=\n  @x\n  (+\n    #1\n    (* #2 #3)\n  )\n)");
	LunaAssertAST("x = (1 + 2) * 3", "(=\n  @x\n  (*\n    (+ #1 #2)\n    #3\n  )\n)");
	LunaAssertAST("x = 1 - 2 - 3", "(=\n  @x\n  (-\n    (- #1 #2)\n    #3\n  )\n)");
	LunaAssertAST("x = -y", "(=\n  @x\n  (NEGATE @y)\n)");
	LunaAssertAST("x = a or b and c", "(=\n  @x\n  (<or>\n    @a\n    (<and> @b @c)\n  )\n)");
	LunaAssertAST("return 1, \"a\"", "(<return> #1 \"a\")");
	LunaAssertAST("return", "<return>");
	LunaAssertAST("function f() end", "(<function> @f BLOCK BLOCK)");
	LunaAssertAST("if x then else end", "(<if> @x BLOCK BLOCK)");
	LunaAssertAST("local y = nil", "(= @y <nil>)");

	// trailing tokens after a complete statement are ignored
	LunaAssertScriptSuccess_N("x = 3 4 5\nreturn x", 3);
	LunaAssertScriptSuccess_N("return 7 )", 7);

	// parse errors
	LunaAssertScriptRaise("if x print(1) end", LunaErrorKind::kParse, "unexpected token '@print' in if statement; expected 'then'");
	LunaAssertScriptRaise("if x then\ny = 1", LunaErrorKind::kParse, "unexpected token 'EOF' in if statement; expected 'end'");
	LunaAssertScriptRaise("return (1 + 2", LunaErrorKind::kParse, "unexpected token 'EOF' in parenthesized expression; expected ')'");
	LunaAssertScriptRaise("f(1, 2", LunaErrorKind::kParse, "in call argument list; expected ')'");
	LunaAssertScriptRaise("x = ", LunaErrorKind::kParse, "unexpected token 'EOF' in primary expression");
	LunaAssertScriptRaise("return )", LunaErrorKind::kParse, "unexpected token ')' in primary expression");
	LunaAssertScriptRaise("x, = 1", LunaErrorKind::kParse, "in assignment; expected 'IDENTIFIER'");
	LunaAssertScriptRaise("x, y 1", LunaErrorKind::kParse, "in assignment; expected '='");
	LunaAssertScriptRaise("local 5", LunaErrorKind::kParse, "unexpected token '#5' in assignment");
	LunaAssertScriptRaise("function (a) end", LunaErrorKind::kParse, "in function declaration; expected 'IDENTIFIER'");
	LunaAssertScriptRaise("function f(a b) end", LunaErrorKind::kParse, "unexpected token '@b' in parameter list; expected ')'");
	LunaAssertScriptRaise("function f(a)\nreturn a", LunaErrorKind::kParse, "in function declaration; expected 'end'");
	LunaAssertScriptRaise("end", LunaErrorKind::kParse, "unexpected token '<end>' in primary expression");
	LunaAssertScriptRaise("else", LunaErrorKind::kParse, "unexpected token '<else>' in primary expression");
}
