//
//  luna_interpreter.h
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

 The class LunaInterpreter executes the AST of one LunaScript.  It keeps no symbol table of its own: every
 method takes the environment to work in as an explicit parameter, so that the same interpreter can run a function
 body in a call's child environment while the caller's environment stays untouched.

 Statements produce a LunaStatementOutcome.  A return statement produces a kReturning outcome carrying its values,
 which propagates out through enclosing blocks and if statements until a function call consumes it.

 */

#ifndef __Luna__luna_interpreter__
#define __Luna__luna_interpreter__

#include <vector>
#include <string>
#include <memory>
#include <sstream>

#include "luna_script.h"
#include "luna_value.h"
#include "luna_ast_node.h"
#include "luna_symbol_table.h"
#include "luna_function_signature.h"


enum class LunaFlowControl : uint8_t {
	kNormal = 0,		// the statement completed; continue with the next one
	kReturning			// a return statement executed; return_values_ holds its values
};

struct LunaStatementOutcome
{
	LunaFlowControl flow_control_;
	LunaValue_Multi_SP return_values_;			// nullptr unless flow_control_ is kReturning

	static inline LunaStatementOutcome Normal(void) { return LunaStatementOutcome{LunaFlowControl::kNormal, nullptr}; }
	static inline LunaStatementOutcome Returning(LunaValue_Multi_SP p_values) { return LunaStatementOutcome{LunaFlowControl::kReturning, std::move(p_values)}; }
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaStatementOutcome &p_outcome);


// A class representing the execution of one script, with its execution log and output streams
class LunaInterpreter
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

private:
	std::shared_ptr<const LunaScript> script_;		// the script whose AST we execute; shared with the functions it declares

	// flags and streams for execution logging – a trace of the DFS of the parse tree
	bool logging_execution_ = false;
	int execution_log_indent_ = 0;
	std::ostringstream *execution_log_ = nullptr;		// allocated lazily

	std::ostream &execution_output_;				// NOT OWNED: output from print() and other built-ins
	std::ostream &error_output_;					// NOT OWNED: diagnostics

public:

	LunaInterpreter(const LunaInterpreter&) = delete;					// no copying
	LunaInterpreter& operator=(const LunaInterpreter&) = delete;		// no copying
	LunaInterpreter(void) = delete;										// no null construction

	LunaInterpreter(std::shared_ptr<const LunaScript> p_script, std::ostream &p_outstream, std::ostream &p_errstream);

	inline ~LunaInterpreter(void)
	{
		if (execution_log_)
			delete execution_log_;
	}

	inline std::string IndentString(int p_indent_level) { return std::string(p_indent_level * 2, ' '); };

	void SetShouldLogExecution(bool p_log);
	bool ShouldLogExecution(void);
	std::string ExecutionLog(void);

	inline std::ostream &ExecutionOutputStream(void) { return execution_output_; }
	inline std::ostream &ErrorOutputStream(void) { return error_output_; }

	// The starting point for a logical line: execute the script's statement in the given (root) environment.  A return
	// at the top level just ends the line; its outcome is returned so the caller can see it.
	LunaStatementOutcome ExecuteInterpreterStatement(const LunaSymbolTable_SP &p_symbols);

	// Call a function value with already-evaluated, collapsed arguments; the result may be a multivalue
	LunaValue_SP CallFunction(const LunaValue_Function &p_function, const std::vector<LunaValue_SP> &p_arguments);
	LunaValue_SP DispatchUserDefinedFunction(const LunaValue_Function &p_function, const std::vector<LunaValue_SP> &p_arguments);

	// Statement execution
	LunaStatementOutcome ExecuteStatement(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaStatementOutcome ExecuteBlock(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);

	LunaStatementOutcome Execute_ExpressionStatement(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaStatementOutcome Execute_Assignment(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaStatementOutcome Execute_Return(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaStatementOutcome Execute_FunctionDecl(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaStatementOutcome Execute_If(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);

	// Expression evaluation; only Evaluate_Call() can produce a multivalue
	LunaValue_SP EvaluateNode(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);

	LunaValue_SP Evaluate_Literal(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaValue_SP Evaluate_Variable(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaValue_SP Evaluate_Unary(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaValue_SP Evaluate_Binary(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaValue_SP Evaluate_Logical(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
	LunaValue_SP Evaluate_Call(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols);
};


#endif /* defined(__Luna__luna_interpreter__) */
