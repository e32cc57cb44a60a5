//
//  luna_test.h
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

 This file contains code to test Luna.

 */

#ifndef __Luna__luna_test__
#define __Luna__luna_test__

#include <string>
#include <vector>

#include "luna_globals.h"
#include "luna_value.h"
#include "luna_token.h"


int RunLunaTests(void);


// Can turn on escape sequences to color test output; at present we turn these on unless LUNA_PLAIN_TEST_OUTPUT is
// defined, since terminals support these codes but some IDE consoles do not.
#ifdef LUNA_PLAIN_TEST_OUTPUT

#define LUNA_OUTPUT_FAILURE_TAG	"FAILURE"
#define LUNA_OUTPUT_SUCCESS_TAG	"SUCCESS"

#else

#define LUNA_OUTPUT_FAILURE_TAG	"\e[31mFAILURE\e[0m"
#define LUNA_OUTPUT_SUCCESS_TAG	"\e[32mSUCCESS\e[0m"

#endif


// Conceptually, all the luna_test_X.cpp stuff is a single source file, and all the details below are private.

// Helper functions for testing.  A script's result is the value of a top-level return on its last logical line (nil if
// there is none), collapsed if it holds exactly one value; scripts run through the preprocessor first, so they may span
// several lines and use single quotes.
extern void LunaAssertScriptSuccess(const std::string &p_script_string, LunaValue_SP p_correct_result);
extern void LunaAssertScriptSuccess_N(const std::string &p_script_string, double p_number);
extern void LunaAssertScriptSuccess_NV(const std::string &p_script_string, std::vector<double> p_numbers);
extern void LunaAssertScriptSuccess_S(const std::string &p_script_string, const char *p_string);
extern void LunaAssertScriptSuccess_B(const std::string &p_script_string, bool p_bool);
extern void LunaAssertScriptSuccess_NIL(const std::string &p_script_string);
extern void LunaAssertScriptOutput(const std::string &p_script_string, const std::string &p_correct_output);
extern void LunaAssertScriptRaise(const std::string &p_script_string, LunaErrorKind p_kind, const std::string &p_reason_snip);

// Lower-level helpers, for the pieces that are not whole scripts
extern void LunaAssertTokenTypes(const std::string &p_line, const std::vector<LunaTokenType> &p_correct_types);
extern void LunaAssertLogicalLines(const std::vector<std::string> &p_raw_lines, const std::vector<std::string> &p_correct_lines);
extern void LunaAssertAST(const std::string &p_line, const std::string &p_correct_tree);
extern void LunaAssertCondition(const std::string &p_description, bool p_condition);


// Test subfunction prototypes
extern void _RunTokenizationTests(void);
extern void _RunPreprocessorTests(void);
extern void _RunParsingTests(void);
extern void _RunOperatorArithmeticTests(void);
extern void _RunOperatorConcatTests(void);
extern void _RunOperatorComparisonTests(void);
extern void _RunOperatorLogicalTests(void);
extern void _RunKeywordIfTests(void);
extern void _RunKeywordReturnTests(void);
extern void _RunUserDefinedFunctionTests(void);
extern void _RunBuiltInFunctionTests(void);
extern void _RunSymbolTableTests(void);
extern void _RunScriptRunnerTests(void);


#endif /* defined(__Luna__luna_test__) */
