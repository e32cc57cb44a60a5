//
//  luna_test_runtime.cpp
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
#include "luna_symbol_table.h"
#include "luna_script_runner.h"
#include "luna_functions.h"
#include "luna_interpreter.h"
#include "luna_script.h"

#include <sstream>
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>


// Built-ins for testing the script runner: record() keeps the printed form of its argument, and cancel() sets the
// cancellation flag of the run it is called from
static std::vector<std::string> gLunaTestRecordedValues;
static std::atomic<bool> gLunaTestCancelFlag(false);

static LunaValue_SP Luna_TestFunction_record(const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	std::ostringstream value_stream;

	value_stream << *p_arguments[0];
	gLunaTestRecordedValues.emplace_back(value_stream.str());

	return nullptr;
}

static LunaValue_SP Luna_TestFunction_cancel(__attribute__((unused)) const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	gLunaTestCancelFlag = true;

	return nullptr;
}

// watch() keeps a weak reference to its argument, to check when values are freed; fail() throws something other than a LunaRaise
static std::weak_ptr<LunaValue> gLunaTestWatchedValue;

static LunaValue_SP Luna_TestFunction_watch(const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	gLunaTestWatchedValue = p_arguments[0];

	return nullptr;
}

static LunaValue_SP Luna_TestFunction_fail(__attribute__((unused)) const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	throw std::logic_error("fail() called");
}

static LunaFunctionMap LunaTestFunctionMap(void)
{
	LunaFunctionMap function_map = Luna_StandardBuiltInFunctionMap();

	function_map.insert(LunaFunctionMapPair("record",	LunaFunctionSignature_CSP((new LunaFunctionSignature("record",	Luna_TestFunction_record))->AddParam("x"))));
	function_map.insert(LunaFunctionMapPair("cancel",	LunaFunctionSignature_CSP(new LunaFunctionSignature("cancel",		Luna_TestFunction_cancel))));
	function_map.insert(LunaFunctionMapPair("watch",	LunaFunctionSignature_CSP((new LunaFunctionSignature("watch",	Luna_TestFunction_watch))->AddParam("x"))));
	function_map.insert(LunaFunctionMapPair("fail",		LunaFunctionSignature_CSP(new LunaFunctionSignature("fail",		Luna_TestFunction_fail))));

	return function_map;
}


#pragma mark symbol tables
void _RunSymbolTableTests(void)
{
	LunaSymbolTable_SP root = std::make_shared<LunaSymbolTable>(nullptr);
	LunaSymbolTable_SP child = std::make_shared<LunaSymbolTable>(root);
	LunaValue_SP one(new LunaValue_Number(1));
	LunaValue_SP two(new LunaValue_Number(2));
	LunaValue_SP three(new LunaValue_Number(3));

	// define and get
	root->DefineValueForSymbol("x", one);
	LunaAssertCondition("get finds a defined value", root->GetValueForSymbol("x") == one);
	LunaAssertCondition("get searches the parent chain", child->GetValueForSymbol("x") == one);
	LunaAssertCondition("get of an undefined name is nil", child->GetValueForSymbol("nope")->Type() == LunaValueType::kValueNil);
	LunaAssertCondition("ContainsSymbol() checks this table only", root->ContainsSymbol("x") && !child->ContainsSymbol("x"));
	LunaAssertCondition("ParentSymbolTable()", (child->ParentSymbolTable() == root) && !root->ParentSymbolTable());

	// define shadows, and redefinition overwrites in place
	child->DefineValueForSymbol("x", two);
	LunaAssertCondition("define in a child shadows the parent", (child->GetValueForSymbol("x") == two) && (root->GetValueForSymbol("x") == one));
	child->DefineValueForSymbol("x", three);
	LunaAssertCondition("redefinition overwrites", (child->GetValueForSymbol("x") == three) && (child->SymbolNames(false).size() == 1));

	// assign mutates the nearest table that has the name
	root->DefineValueForSymbol("y", one);
	child->AssignValueForSymbol("y", two);
	LunaAssertCondition("assign mutates the parent", (root->GetValueForSymbol("y") == two) && !child->ContainsSymbol("y"));
	child->AssignValueForSymbol("x", one);
	LunaAssertCondition("assign mutates the nearest table", (child->GetValueForSymbol("x") == one) && (root->GetValueForSymbol("x") == one));

	try {
		child->AssignValueForSymbol("zz", one);
		LunaAssertCondition("assign to an undefined name raises", false);
	}
	catch (LunaRaise &raise)
	{
		LunaAssertCondition("assign to an undefined name raises an undefined mutation", (raise.Kind() == LunaErrorKind::kUndefinedMutation) && (std::string(raise.what()).find("undefined variable 'zz'") != std::string::npos));
	}

	LunaAssertCondition("a failed assign defines nothing", !child->ContainsSymbol("zz") && !root->ContainsSymbol("zz"));

	// a multivalue never reaches a table
	try {
		root->DefineValueForSymbol("m", LunaValue_SP(new LunaValue_Multi()));
		LunaAssertCondition("defining a multivalue raises", false);
	}
	catch (LunaRaise &raise)
	{
		LunaAssertCondition("defining a multivalue raises an internal error", (raise.Kind() == LunaErrorKind::kUnknownConstruct) && (std::string(raise.what()).find("(internal error)") != std::string::npos));
	}

	try {
		root->AssignValueForSymbol("x", LunaValue_SP(new LunaValue_Multi()));
		LunaAssertCondition("assigning a multivalue raises", false);
	}
	catch (LunaRaise &raise)
	{
		LunaAssertCondition("assigning a multivalue raises an internal error", (raise.Kind() == LunaErrorKind::kUnknownConstruct) && (std::string(raise.what()).find("(internal error)") != std::string::npos));
	}

	LunaAssertCondition("a failed assign keeps the old value", root->GetValueForSymbol("x") == one);

	// symbol names
	child->DefineValueForSymbol("a", one);
	LunaAssertCondition("SymbolNames() of one table", child->SymbolNames(false) == std::vector<std::string>({"a", "x"}));
	LunaAssertCondition("SymbolNames() with parents", child->SymbolNames(true) == std::vector<std::string>({"a", "x", "y"}));

	// built-ins
	{
		LunaSymbolTable_SP builtins = std::make_shared<LunaSymbolTable>(nullptr);

		builtins->DefineBuiltInFunctions(Luna_StandardBuiltInFunctionMap());

		LunaAssertCondition("built-ins are defined", builtins->SymbolNames(false) == std::vector<std::string>({"print", "sqrt", "tostring", "type"}));

		LunaValue_SP print_value = builtins->GetValueForSymbol("print");

		LunaAssertCondition("built-ins are function values with no closure", (print_value->Type() == LunaValueType::kValueFunction) && !static_cast<LunaValue_Function &>(*print_value).Closure());
	}

	// execution logging
	{
		std::ostringstream output;
		std::shared_ptr<LunaScript> script = std::make_shared<LunaScript>("x = 1 + 2");
		LunaSymbolTable_SP symbols = std::make_shared<LunaSymbolTable>(nullptr);

		script->Tokenize();
		script->ParseStatementToAST();

		LunaInterpreter interpreter(script, output, output);

		interpreter.SetShouldLogExecution(true);
		interpreter.ExecuteInterpreterStatement(symbols);

		std::string log = interpreter.ExecutionLog();

		LunaAssertCondition("execution log records entries", log.find("Execute_Assignment() entered") != std::string::npos);
		LunaAssertCondition("execution log records results", log.find("Evaluate_Binary() : return == 3") != std::string::npos);
		LunaAssertCondition("execution log records outcomes", log.find("ExecuteInterpreterStatement() : normal") != std::string::npos);
		LunaAssertCondition("execution logging has no effect on results", symbols->GetValueForSymbol("x")->NumericValue(nullptr) == 3);
	}
}

#pragma mark script runner
void _RunScriptRunnerTests(void)
{
	// one bad line does not stop the lines after it
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		gLunaTestRecordedValues.clear();

		LunaRunResult result = runner.RunScript("record(1)\nrecord('a' + 1)\nrecord(3)", cancel_flag);

		LunaAssertCondition("fault isolation: run completes", result == LunaRunResult::kCompleted);
		LunaAssertCondition("fault isolation: later lines run", gLunaTestRecordedValues == std::vector<std::string>({"1", "3"}));
		LunaAssertCondition("fault isolation: one error recorded", runner.Errors().size() == 1);

		if (runner.Errors().size() == 1)
		{
			const LunaLineError &error = runner.Errors()[0];

			LunaAssertCondition("fault isolation: error kind", error.kind_ == LunaErrorKind::kTypeCoercion);
			LunaAssertCondition("fault isolation: error line", error.line_ == "record(\"a\" + 1)");
			LunaAssertCondition("fault isolation: error message", error.message_.find("cannot coerce the string \"a\" to a number") != std::string::npos);
		}

		LunaAssertCondition("fault isolation: error reported", errors.str().find("ERROR executing line 'record(\"a\" + 1)': ERROR (LunaValue_String::NumericValue)") == 0);
	}

	// state from earlier lines survives errors, and every kind of error is isolated
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		gLunaTestRecordedValues.clear();

		runner.RunScript("x = 1\nundefined_function()\ny = @\nsqrt(1, 2)\nrecord(x)\nif x then", cancel_flag);

		LunaAssertCondition("state survives errors", gLunaTestRecordedValues == std::vector<std::string>({"1"}));
		LunaAssertCondition("all errors recorded", runner.Errors().size() == 4);

		if (runner.Errors().size() == 4)
		{
			LunaAssertCondition("call error kind", runner.Errors()[0].kind_ == LunaErrorKind::kTypeCoercion);
			LunaAssertCondition("lexical error kind", runner.Errors()[1].kind_ == LunaErrorKind::kLexical);
			LunaAssertCondition("arity error kind", runner.Errors()[2].kind_ == LunaErrorKind::kArityMismatch);
			LunaAssertCondition("truncated block error kind", runner.Errors()[3].kind_ == LunaErrorKind::kParse);
		}
	}

	// functions outlive the line that declared them
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		gLunaTestRecordedValues.clear();

		runner.RunScript("function make(n)\nfunction get()\nreturn n * 2\nend\nreturn get\nend\ng = make(21)\nmake = nil\nrecord(g())\nreturn 5\nrecord(tostring(g))", cancel_flag);

		LunaAssertCondition("functions outlive their line", gLunaTestRecordedValues == std::vector<std::string>({"42", "function: get"}));
		LunaAssertCondition("functions outlive their line: no errors", runner.Errors().empty());
		LunaAssertCondition("RunLogicalLine() succeeds", runner.RunLogicalLine("record(1)"));
		LunaAssertCondition("RunLogicalLine() fails", !runner.RunLogicalLine("record(nil .. 1)"));
		LunaAssertCondition("RunLogicalLine() accepts a blank line", runner.RunLogicalLine("   "));
		LunaAssertCondition("root symbol table", runner.RootSymbolTable()->ContainsSymbol("g") && !runner.RootSymbolTable()->ContainsSymbol("get"));
	}

	// cancellation is polled before each line
	{
		std::ostringstream output, errors;
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		gLunaTestRecordedValues.clear();
		gLunaTestCancelFlag = true;

		LunaRunResult result = runner.RunScript("record(1)\nrecord(2)", gLunaTestCancelFlag);

		LunaAssertCondition("cancelled before the first line", (result == LunaRunResult::kCancelled) && gLunaTestRecordedValues.empty());
		LunaAssertCondition("cancellation reported", errors.str() == "script execution cancelled\n");
	}
	{
		std::ostringstream output, errors;
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		gLunaTestRecordedValues.clear();
		gLunaTestCancelFlag = false;

		LunaRunResult result = runner.RunScript("record(1)\ncancel()\nrecord(2)\nrecord(3)", gLunaTestCancelFlag);

		LunaAssertCondition("cancelled between lines", (result == LunaRunResult::kCancelled) && (gLunaTestRecordedValues == std::vector<std::string>({"1"})));

		gLunaTestRecordedValues.clear();
		gLunaTestCancelFlag = false;

		result = runner.RunScript("function f()\ncancel()\nrecord(1)\nend\nf()", gLunaTestCancelFlag);

		LunaAssertCondition("a line that has started runs to completion", (result == LunaRunResult::kCompleted) && (gLunaTestRecordedValues == std::vector<std::string>({"1"})));
		gLunaTestCancelFlag = false;
	}

	// background runs
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		std::future<LunaRunResult> run_future = runner.RunLinesInBackground({"x = 1", "function inc(v)", "return v + 1", "end", "print(inc(x) * 10)"}, cancel_flag);
		LunaRunResult result = run_future.get();

		LunaAssertCondition("background run completes", result == LunaRunResult::kCompleted);
		LunaAssertCondition("background run output", output.str() == "20\n");

		// a second run on the same runner sees the first run's state
		run_future = runner.RunLinesInBackground({"print(inc(inc(x)))", "oops(", "print('after')"}, cancel_flag);
		result = run_future.get();

		LunaAssertCondition("second background run", (result == LunaRunResult::kCompleted) && (output.str() == "20\n3\nafter\n") && (runner.Errors().size() == 1));

		cancel_flag = true;
		run_future = runner.RunLinesInBackground({"print('never')"}, cancel_flag);

		LunaAssertCondition("cancelled background run", (run_future.get() == LunaRunResult::kCancelled) && (output.str() == "20\n3\nafter\n"));
	}

	// command-line defines
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		LunaAssertCondition("defines succeed", runner.DefineConstantsFromCommandLine({"x=5", "y = 'a'"}));

		runner.RunScript("print(x .. y)", cancel_flag);

		LunaAssertCondition("defines are visible to the script", output.str() == "5a\n");
		LunaAssertCondition("a define must be an assignment", !runner.DefineConstantsFromCommandLine({"print(1)"}) && (output.str() == "5a\n"));
		LunaAssertCondition("a bad define is recorded", (runner.Errors().size() == 1) && (runner.Errors()[0].kind_ == LunaErrorKind::kParse) && (runner.Errors()[0].message_.find("must be an assignment") != std::string::npos));
		LunaAssertCondition("a define that raises fails", !runner.DefineConstantsFromCommandLine({"z = 'q' + 1"}));
		LunaAssertCondition("a define that throws fails", !runner.DefineConstantsFromCommandLine({"z = fail()"}));
		LunaAssertCondition("a define that throws is recorded", (runner.Errors().size() == 3) && (runner.Errors()[2].kind_ == LunaErrorKind::kUnknownConstruct) && (runner.Errors()[2].message_ == "fail() called"));
	}

	// environments are freed once nothing can reach them, even though functions declared in them close over them
	{
		std::weak_ptr<LunaSymbolTable> root_symbols;

		{
			std::ostringstream output, errors;
			std::atomic<bool> cancel_flag(false);
			LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

			runner.RunScript("local function f(n)\nreturn n + 1\nend\nprint(f(1))", cancel_flag);
			root_symbols = runner.RootSymbolTable();

			LunaAssertCondition("root environment lives with its runner", !root_symbols.expired() && (output.str() == "2\n"));
		}

		LunaAssertCondition("root environment is freed with its runner", root_symbols.expired());
	}
	{
		std::ostringstream output, errors;
		std::atomic<bool> cancel_flag(false);
		LunaScriptRunner runner(LunaTestFunctionMap(), output, errors);

		runner.RunScript("function outer()\nfunction inner()\nreturn 1\nend\nwatch(inner)\nreturn inner() + 1\nend\nprint(outer())", cancel_flag);

		LunaAssertCondition("a call environment is freed after the call", gLunaTestWatchedValue.expired() && (output.str() == "2\n") && runner.Errors().empty());

		runner.RunScript("function make()\nfunction get()\nreturn 7\nend\nwatch(get)\nreturn get\nend\ng = make()\nprint(g())", cancel_flag);

		LunaAssertCondition("a call environment with an escaped function survives the call", !gLunaTestWatchedValue.expired() && (output.str() == "2\n7\n") && runner.Errors().empty());

		runner.RootSymbolTable()->RemoveAllSymbols();

		LunaAssertCondition("clearing the root environment frees retained call environments", gLunaTestWatchedValue.expired());
	}
}
