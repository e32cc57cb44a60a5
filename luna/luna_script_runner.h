//
//  luna_script_runner.h
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

 LunaScriptRunner is the embedding-facing driver: it owns the root environment, and feeds script text through the
 preprocessor, lexer, parser and interpreter one logical line at a time.  Each line is isolated from the others: a
 raise while processing a line is caught, recorded and reported, and the run continues with the next line, with any
 state established by earlier lines intact.

 A runner executes one run at a time; it is not safe to start a run while another run on the same runner is still
 executing.  Use one runner per concurrently executing script.

 */

#ifndef __Luna__luna_script_runner__
#define __Luna__luna_script_runner__

#include <string>
#include <vector>
#include <atomic>
#include <future>
#include <thread>
#include <ostream>

#include "luna_globals.h"
#include "luna_symbol_table.h"
#include "luna_function_signature.h"


enum class LunaRunResult : uint8_t {
	kCompleted = 0,			// every logical line was attempted (some may have raised)
	kCancelled				// the cancellation flag was seen set before a line, and the run stopped there
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaRunResult p_result);

// A record of one logical line that raised
struct LunaLineError
{
	std::string line_;				// the logical line, as given to RunLogicalLine()
	LunaErrorKind kind_;			// kUnknownConstruct for exceptions that are not a LunaRaise
	std::string message_;
};


class LunaScriptRunner
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

private:
	LunaSymbolTable_SP root_symbols_;					// the root environment, holding the built-ins and all top-level state
	std::vector<LunaLineError> errors_;					// every error so far, in order

	std::ostream &execution_output_;					// NOT OWNED
	std::ostream &error_output_;						// NOT OWNED

	std::thread background_thread_;						// the thread of the last RunLinesInBackground(), if any

	// the shared work of RunLogicalLine() and DefineConstantsFromCommandLine(); raises on error
	void ExecuteLogicalLine(const std::string &p_logical_line, bool p_require_assignment);
	void RecordError(const std::string &p_logical_line, LunaErrorKind p_kind, const std::string &p_message);

public:

	LunaScriptRunner(const LunaScriptRunner&) = delete;					// no copying
	LunaScriptRunner& operator=(const LunaScriptRunner&) = delete;		// no copying
	LunaScriptRunner(void) = delete;									// no null construction

	LunaScriptRunner(const LunaFunctionMap &p_function_map, std::ostream &p_outstream, std::ostream &p_errstream);
	~LunaScriptRunner(void);											// joins any background thread

	// Tokenize, parse, and execute one logical line against the root environment.  Returns false if the line raised;
	// the error has then been recorded and reported, and is not propagated.  Blank lines succeed trivially.
	bool RunLogicalLine(const std::string &p_logical_line);

	// Preprocess raw lines into logical lines and run them in order, polling p_cancel_flag before each line
	LunaRunResult RunLines(const std::vector<std::string> &p_raw_lines, const std::atomic<bool> &p_cancel_flag);
	LunaRunResult RunScript(const std::string &p_script_text, const std::atomic<bool> &p_cancel_flag);

	// RunLines() on a dedicated thread.  The runner and p_cancel_flag must remain alive until the future is ready.
	std::future<LunaRunResult> RunLinesInBackground(const std::vector<std::string> &p_raw_lines, const std::atomic<bool> &p_cancel_flag);

	// Run command-line definitions such as "x=5" before a script; each must be an assignment.  Returns false if any failed.
	bool DefineConstantsFromCommandLine(const std::vector<std::string> &p_definitions);

	inline const std::vector<LunaLineError> &Errors(void) const { return errors_; }
	inline const LunaSymbolTable_SP &RootSymbolTable(void) const { return root_symbols_; }
};


#endif /* defined(__Luna__luna_script_runner__) */
