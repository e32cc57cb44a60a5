//
//  luna_script_runner.cpp
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



#include "luna_script_runner.h"
#include "luna_preprocessor.h"
#include "luna_script.h"
#include "luna_interpreter.h"
#include "luna_ast_node.h"

#include <functional>
#include <iostream>


std::ostream &operator<<(std::ostream &p_outstream, const LunaRunResult p_result)
{
	switch (p_result)
	{
		case LunaRunResult::kCompleted:		p_outstream << "completed"; break;
		case LunaRunResult::kCancelled:		p_outstream << "cancelled"; break;
	}

	return p_outstream;
}


LunaScriptRunner::LunaScriptRunner(const LunaFunctionMap &p_function_map, std::ostream &p_outstream, std::ostream &p_errstream)
	: root_symbols_(std::make_shared<LunaSymbolTable>(nullptr)), execution_output_(p_outstream), error_output_(p_errstream)
{
	root_symbols_->DefineBuiltInFunctions(p_function_map);
}

LunaScriptRunner::~LunaScriptRunner(void)
{
	if (background_thread_.joinable())
		background_thread_.join();

	// top-level functions hold the root environment as their closure, so it has to be emptied to be freed
	root_symbols_->RemoveAllSymbols();
}

void LunaScriptRunner::ExecuteLogicalLine(const std::string &p_logical_line, bool p_require_assignment)
{
	// The script is shared with any functions the line declares, since their bodies live in its AST
	std::shared_ptr<LunaScript> script = std::make_shared<LunaScript>(p_logical_line);

	script->Tokenize();
	script->ParseStatementToAST();

	if (p_require_assignment && (script->AST()->node_type_ != LunaNodeType::kNodeAssignment))
		LUNA_TERMINATION << "ERROR (LunaScriptRunner::ExecuteLogicalLine): a command-line define must be an assignment, such as x=5." << LunaTerminate(LunaErrorKind::kParse);

	LunaInterpreter interpreter(script, execution_output_, error_output_);

	if (gLunaLogEvaluation)
		interpreter.SetShouldLogExecution(true);

	// a top-level return just ends the line; its values go nowhere
	interpreter.ExecuteInterpreterStatement(root_symbols_);
}

void LunaScriptRunner::RecordError(const std::string &p_logical_line, LunaErrorKind p_kind, const std::string &p_message)
{
	errors_.emplace_back(LunaLineError{p_logical_line, p_kind, p_message});

	error_output_ << "ERROR executing line '" << p_logical_line << "': " << p_message << std::endl;
}

bool LunaScriptRunner::RunLogicalLine(const std::string &p_logical_line)
{
	if (Luna_TrimWhitespace(p_logical_line).empty())
		return true;

	try
	{
		ExecuteLogicalLine(p_logical_line, false);
	}
	catch (LunaRaise &raise)
	{
		RecordError(p_logical_line, raise.Kind(), raise.what());
		return false;
	}
	catch (std::exception &e)
	{
		RecordError(p_logical_line, LunaErrorKind::kUnknownConstruct, e.what());
		return false;
	}

	return true;
}

LunaRunResult LunaScriptRunner::RunLines(const std::vector<std::string> &p_raw_lines, const std::atomic<bool> &p_cancel_flag)
{
	std::vector<std::string> logical_lines = LunaPreprocessor::LogicalLinesFromRawLines(p_raw_lines);

	for (const std::string &logical_line : logical_lines)
	{
		// cancellation is seen only between lines; a line that has started runs to completion
		if (p_cancel_flag.load())
		{
			error_output_ << "script execution cancelled" << std::endl;
			return LunaRunResult::kCancelled;
		}

		RunLogicalLine(logical_line);
	}

	return LunaRunResult::kCompleted;
}

LunaRunResult LunaScriptRunner::RunScript(const std::string &p_script_text, const std::atomic<bool> &p_cancel_flag)
{
	return RunLines(LunaPreprocessor::SplitLines(p_script_text), p_cancel_flag);
}

std::future<LunaRunResult> LunaScriptRunner::RunLinesInBackground(const std::vector<std::string> &p_raw_lines, const std::atomic<bool> &p_cancel_flag)
{
	// the previous background run, if any, has to be finished before we start another
	if (background_thread_.joinable())
		background_thread_.join();

	std::packaged_task<LunaRunResult(void)> task(std::bind(&LunaScriptRunner::RunLines, this, p_raw_lines, std::cref(p_cancel_flag)));
	std::future<LunaRunResult> result_future = task.get_future();

	background_thread_ = std::thread(std::move(task));

	return result_future;
}

bool LunaScriptRunner::DefineConstantsFromCommandLine(const std::vector<std::string> &p_definitions)
{
	bool all_succeeded = true;

	for (const std::string &definition : p_definitions)
	{
		try
		{
			// a define gets the same quote normalization as a script line
			ExecuteLogicalLine(Luna_TrimWhitespace(LunaPreprocessor::StripCommentAndNormalizeQuotes(definition)), true);
		}
		catch (LunaRaise &raise)
		{
			RecordError(definition, raise.Kind(), raise.what());
			all_succeeded = false;
		}
		catch (std::exception &e)
		{
			RecordError(definition, LunaErrorKind::kUnknownConstruct, e.what());
			all_succeeded = false;
		}
	}

	return all_succeeded;
}
