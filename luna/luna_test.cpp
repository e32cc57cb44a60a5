//
//  luna_test.cpp
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
#include "luna_script.h"
#include "luna_preprocessor.h"
#include "luna_interpreter.h"
#include "luna_symbol_table.h"
#include "luna_functions.h"
#include "luna_script_runner.h"
#include "luna_ast_node.h"

#include <iostream>
#include <sstream>
#include <atomic>


// Keeping records of test success / failure
static int gLunaTestSuccessCount = 0;
static int gLunaTestFailureCount = 0;


// Run a script the way LunaScriptRunner does, except that raises propagate to the caller, and return its result
static LunaValue_SP LunaRunScriptForTest(const std::string &p_script_string, std::ostream &p_outstream)
{
	LunaSymbolTable_SP root_symbols = std::make_shared<LunaSymbolTable>(nullptr);
	LunaValue_SP result = gStaticLunaValueNil;

	root_symbols->DefineBuiltInFunctions(Luna_StandardBuiltInFunctionMap());

	// top-level functions close over root_symbols, so it is emptied on the way out, raise or not
	try
	{
		for (const std::string &logical_line : LunaPreprocessor::LogicalLinesFromRawLines(LunaPreprocessor::SplitLines(p_script_string)))
		{
			std::shared_ptr<LunaScript> script = std::make_shared<LunaScript>(logical_line);

			script->Tokenize();
			script->ParseStatementToAST();

			LunaInterpreter interpreter(script, p_outstream, p_outstream);
			LunaStatementOutcome outcome = interpreter.ExecuteInterpreterStatement(root_symbols);

			result = gStaticLunaValueNil;

			if (outcome.flow_control_ == LunaFlowControl::kReturning)
			{
				if (outcome.return_values_->Count() == 1)
					result = outcome.return_values_->ValueAtIndex(0);
				else if (outcome.return_values_->Count() > 1)
					result = outcome.return_values_;
			}
		}
	}
	catch (...)
	{
		root_symbols->RemoveAllSymbols();
		throw;
	}

	root_symbols->RemoveAllSymbols();

	return result;
}

// Instantiates and runs the script, and checks that the result is of the right type and has the right value
void LunaAssertScriptSuccess(const std::string &p_script_string, LunaValue_SP p_correct_result)
{
	std::ostringstream output;
	LunaValue_SP result;

	gLunaTestFailureCount++;	// assume failure; we will fix this at the end if we succeed

	try {
		result = LunaRunScriptForTest(p_script_string, output);
	}
	catch (LunaRaise &raise)
	{
		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise during execution (" << raise.Kind() << "): " << raise.what() << std::endl;
		return;
	}

	if (result->Type() != p_correct_result->Type())
	{
		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : unexpected return type (" << result->Type() << ", expected " << p_correct_result->Type() << ")" << std::endl;
	}
	else if (!IdenticalLunaValues(*result, *p_correct_result))
	{
		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : mismatched values (" << *result << "), expected (" << *p_correct_result << ")" << std::endl;
	}
	else
	{
		gLunaTestFailureCount--;	// correct for our assumption of failure above
		gLunaTestSuccessCount++;

		//std::cerr << p_script_string << " == " << p_correct_result->Type() << "(" << *p_correct_result << ") : " << LUNA_OUTPUT_SUCCESS_TAG << std::endl;
	}
}

void LunaAssertScriptSuccess_N(const std::string &p_script_string, double p_number)
{
	LunaAssertScriptSuccess(p_script_string, LunaValue_SP(new LunaValue_Number(p_number)));
}

void LunaAssertScriptSuccess_NV(const std::string &p_script_string, std::vector<double> p_numbers)
{
	LunaValue_Multi_SP correct_result(new LunaValue_Multi());

	for (double number : p_numbers)
		correct_result->PushValue(LunaValue_SP(new LunaValue_Number(number)));

	LunaAssertScriptSuccess(p_script_string, correct_result);
}

void LunaAssertScriptSuccess_S(const std::string &p_script_string, const char *p_string)
{
	LunaAssertScriptSuccess(p_script_string, LunaValue_SP(new LunaValue_String(p_string)));
}

void LunaAssertScriptSuccess_B(const std::string &p_script_string, bool p_bool)
{
	LunaAssertScriptSuccess(p_script_string, LunaValueForBoolean(p_bool));
}

void LunaAssertScriptSuccess_NIL(const std::string &p_script_string)
{
	LunaAssertScriptSuccess(p_script_string, gStaticLunaValueNil);
}

// Runs the script through a LunaScriptRunner and checks everything it printed; no line may raise
void LunaAssertScriptOutput(const std::string &p_script_string, const std::string &p_correct_output)
{
	std::ostringstream output, errors;
	std::atomic<bool> cancel_flag(false);
	LunaScriptRunner runner(Luna_StandardBuiltInFunctionMap(), output, errors);

	runner.RunScript(p_script_string, cancel_flag);

	if (runner.Errors().size())
	{
		gLunaTestFailureCount++;

		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise during execution: " << runner.Errors()[0].message_ << std::endl;
	}
	else if (output.str() != p_correct_output)
	{
		gLunaTestFailureCount++;

		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : mismatched output \"" << output.str() << "\", expected \"" << p_correct_output << "\"" << std::endl;
	}
	else
	{
		gLunaTestSuccessCount++;
	}
}

// Instantiates and runs the script, and checks that it raises with the right kind and a message containing p_reason_snip
void LunaAssertScriptRaise(const std::string &p_script_string, LunaErrorKind p_kind, const std::string &p_reason_snip)
{
	std::ostringstream output;

	try {
		LunaRunScriptForTest(p_script_string, output);

		gLunaTestFailureCount++;

		std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : no raise during execution." << std::endl;
	}
	catch (LunaRaise &raise)
	{
		std::string raise_message(raise.what());

		if (raise.Kind() != p_kind)
		{
			gLunaTestFailureCount++;

			std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise kind mismatch (" << raise.Kind() << ", expected " << p_kind << ")." << std::endl;
			std::cerr << "   raise message: " << raise_message << std::endl;
			std::cerr << "--------------------" << std::endl << std::endl;
		}
		else if (raise_message.find(p_reason_snip) == std::string::npos)
		{
			gLunaTestFailureCount++;

			std::cerr << p_script_string << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise message mismatch (expected \"" << p_reason_snip << "\")." << std::endl;
			std::cerr << "   raise message: " << raise_message << std::endl;
			std::cerr << "--------------------" << std::endl << std::endl;
		}
		else
		{
			gLunaTestSuccessCount++;

			//std::cerr << p_script_string << " == (expected raise) " << raise_message << " : " << LUNA_OUTPUT_SUCCESS_TAG << std::endl;
		}

		// Error messages that say (internal error) should not be possible to trigger in script
		if (raise_message.find("(internal error)") != std::string::npos)
		{
			std::cerr << p_script_string << " : error message contains (internal error) erroneously" << std::endl;
			std::cerr << "   raise message: " << raise_message << std::endl;
		}
	}
}

void LunaAssertTokenTypes(const std::string &p_line, const std::vector<LunaTokenType> &p_correct_types)
{
	LunaScript script(p_line);

	try {
		script.Tokenize();
	}
	catch (LunaRaise &raise)
	{
		gLunaTestFailureCount++;

		std::cerr << p_line << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise during Tokenize(): " << raise.what() << std::endl;
		return;
	}

	// the EOF token is not listed in p_correct_types
	const std::vector<LunaToken> &tokens = script.Tokens();
	bool matched = (tokens.size() == p_correct_types.size() + 1) && (tokens.back().token_type_ == LunaTokenType::kTokenEOF);

	for (size_t token_index = 0; matched && (token_index < p_correct_types.size()); ++token_index)
		if (tokens[token_index].token_type_ != p_correct_types[token_index])
			matched = false;

	if (matched)
	{
		gLunaTestSuccessCount++;
	}
	else
	{
		gLunaTestFailureCount++;

		std::cerr << p_line << " : " << LUNA_OUTPUT_FAILURE_TAG << " : unexpected tokens: ";
		script.PrintTokens(std::cerr);
	}
}

void LunaAssertLogicalLines(const std::vector<std::string> &p_raw_lines, const std::vector<std::string> &p_correct_lines)
{
	std::vector<std::string> logical_lines = LunaPreprocessor::LogicalLinesFromRawLines(p_raw_lines);

	if (logical_lines == p_correct_lines)
	{
		gLunaTestSuccessCount++;
	}
	else
	{
		gLunaTestFailureCount++;

		std::cerr << (p_raw_lines.size() ? p_raw_lines[0] : gLunaStr_empty_string) << " ... : " << LUNA_OUTPUT_FAILURE_TAG << " : unexpected logical lines:" << std::endl;

		for (const std::string &logical_line : logical_lines)
			std::cerr << "   [" << logical_line << "]" << std::endl;
	}
}

void LunaAssertAST(const std::string &p_line, const std::string &p_correct_tree)
{
	LunaScript script(p_line);
	std::ostringstream tree;

	try {
		script.Tokenize();
		script.ParseStatementToAST();
	}
	catch (LunaRaise &raise)
	{
		gLunaTestFailureCount++;

		std::cerr << p_line << " : " << LUNA_OUTPUT_FAILURE_TAG << " : raise during parsing: " << raise.what() << std::endl;
		return;
	}

	script.AST()->PrintTreeWithIndent(tree, 0);

	if (tree.str() == p_correct_tree)
	{
		gLunaTestSuccessCount++;
	}
	else
	{
		gLunaTestFailureCount++;

		std::cerr << p_line << " : " << LUNA_OUTPUT_FAILURE_TAG << " : unexpected tree:" << std::endl << tree.str() << std::endl;
	}
}

void LunaAssertCondition(const std::string &p_description, bool p_condition)
{
	if (p_condition)
	{
		gLunaTestSuccessCount++;
	}
	else
	{
		gLunaTestFailureCount++;

		std::cerr << p_description << " : " << LUNA_OUTPUT_FAILURE_TAG << std::endl;
	}
}


int RunLunaTests(void)
{
	// Reset error counts
	gLunaTestSuccessCount = 0;
	gLunaTestFailureCount = 0;

	// Run tests
	_RunTokenizationTests();
	_RunPreprocessorTests();
	_RunParsingTests();
	_RunOperatorArithmeticTests();
	_RunOperatorConcatTests();
	_RunOperatorComparisonTests();
	_RunOperatorLogicalTests();
	_RunKeywordIfTests();
	_RunKeywordReturnTests();
	_RunUserDefinedFunctionTests();
	_RunBuiltInFunctionTests();
	_RunSymbolTableTests();
	_RunScriptRunnerTests();

	// ************************************************************************************
	//
	//	Print a summary of test results
	//
	std::cerr << std::endl;
	if (gLunaTestFailureCount)
		std::cerr << "" << LUNA_OUTPUT_FAILURE_TAG << " count: " << gLunaTestFailureCount << std::endl;
	std::cerr << LUNA_OUTPUT_SUCCESS_TAG << " count: " << gLunaTestSuccessCount << std::endl;

	return gLunaTestFailureCount;
}
