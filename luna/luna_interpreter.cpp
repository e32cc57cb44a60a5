//
//  luna_interpreter.cpp
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


#include "luna_interpreter.h"

#include <iostream>


// We have a bunch of behaviors that we want to do only when logging execution.  To keep these out of the main logic,
// they are done with macros; the statement macros print the outcome, the expression macros print result_SP.
#define LUNA_ENTRY_EXECUTION_LOG(method_name)			if (logging_execution_) *execution_log_ << IndentString(execution_log_indent_++) << method_name << " entered\n";
#define LUNA_EXIT_EXECUTION_LOG(method_name)			if (logging_execution_) *execution_log_ << IndentString(--execution_log_indent_) << method_name << " : return == " << *result_SP << "\n";
#define LUNA_EXIT_STATEMENT_LOG(method_name)			if (logging_execution_) *execution_log_ << IndentString(--execution_log_indent_) << method_name << " : " << outcome << "\n";
#define LUNA_BEGIN_EXECUTION_LOG()						if (logging_execution_) execution_log_indent_ = 0;
#define LUNA_END_EXECUTION_LOG()						if (gLunaLogEvaluation) std::cout << ExecutionLog();


std::ostream &operator<<(std::ostream &p_outstream, const LunaStatementOutcome &p_outcome)
{
	if (p_outcome.flow_control_ == LunaFlowControl::kReturning)
		p_outstream << "returning (" << *p_outcome.return_values_ << ")";
	else
		p_outstream << "normal";

	return p_outstream;
}


//
//	LunaInterpreter
//
#pragma mark -
#pragma mark LunaInterpreter
#pragma mark -

LunaInterpreter::LunaInterpreter(std::shared_ptr<const LunaScript> p_script, std::ostream &p_outstream, std::ostream &p_errstream)
	: script_(std::move(p_script)), execution_output_(p_outstream), error_output_(p_errstream)
{
}

void LunaInterpreter::SetShouldLogExecution(bool p_log)
{
	logging_execution_ = p_log;

	// execution_log_ is allocated when logging execution is turned on; all use of execution_log_
	// should be inside "if (logging_execution_)", so this should suffice.
	if (logging_execution_ && !execution_log_)
		execution_log_ = new std::ostringstream();
}

bool LunaInterpreter::ShouldLogExecution(void)
{
	return logging_execution_;
}

std::string LunaInterpreter::ExecutionLog(void)
{
	return (execution_log_ ? execution_log_->str() : gLunaStr_empty_string);
}

LunaStatementOutcome LunaInterpreter::ExecuteInterpreterStatement(const LunaSymbolTable_SP &p_symbols)
{
	LUNA_BEGIN_EXECUTION_LOG();
	LUNA_ENTRY_EXECUTION_LOG("ExecuteInterpreterStatement()");

	const LunaASTNode *root_node = script_->AST();

	if (!root_node)
		LUNA_TERMINATION << "ERROR (LunaInterpreter::ExecuteInterpreterStatement): (internal error) the script has not been parsed." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	LunaStatementOutcome outcome = ExecuteStatement(root_node, p_symbols);

	LUNA_EXIT_STATEMENT_LOG("ExecuteInterpreterStatement()");
	LUNA_END_EXECUTION_LOG();
	return outcome;
}

LunaValue_SP LunaInterpreter::CallFunction(const LunaValue_Function &p_function, const std::vector<LunaValue_SP> &p_arguments)
{
	const LunaFunctionSignature &signature = *p_function.Signature();

	signature.CheckArgumentCount(p_arguments.size());

	if (signature.IsInternal())
	{
		LunaValue_SP result_SP = signature.internal_function_(p_arguments, *this);

		// an internal function may return nullptr to produce no values at all
		if (!result_SP)
			result_SP = LunaValue_SP(new LunaValue_Multi());

		return result_SP;
	}

	return DispatchUserDefinedFunction(p_function, p_arguments);
}

LunaValue_SP LunaInterpreter::DispatchUserDefinedFunction(const LunaValue_Function &p_function, const std::vector<LunaValue_SP> &p_arguments)
{
	const LunaFunctionSignature &signature = *p_function.Signature();

	if (signature.param_names_.size() != p_arguments.size())
		LUNA_TERMINATION << "ERROR (LunaInterpreter::DispatchUserDefinedFunction): (internal error) parameter count does not match argument count." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	// The call's environment is a child of the closure, not of the caller's environment
	LunaSymbolTable_SP call_symbols = std::make_shared<LunaSymbolTable>(p_function.Closure());

	for (size_t arg_index = 0; arg_index < p_arguments.size(); ++arg_index)
		call_symbols->DefineValueForSymbol(signature.param_names_[arg_index], p_arguments[arg_index]);

	// The body belongs to the script that declared the function, which may not be ours; a new interpreter runs it, so that
	// functions declared inside the body capture the right script
	LunaInterpreter interpreter(signature.body_script_, execution_output_, error_output_);

	if (logging_execution_)
	{
		interpreter.SetShouldLogExecution(true);
		interpreter.execution_log_indent_ = execution_log_indent_;
	}

	try
	{
		LunaStatementOutcome outcome = interpreter.ExecuteBlock(signature.body_node_, call_symbols);

		// Assimilate the execution log
		if (logging_execution_)
			*execution_log_ << interpreter.ExecutionLog();

		// functions declared by the body hold this environment as their closure; unless one of them escaped, that
		// cycle would keep the environment alive forever.  An environment that does outlive the call is registered
		// with its parent, so that clearing the root environment reaches it.
		if (!call_symbols->ReleaseClosureCycles(call_symbols.use_count()) && (call_symbols.use_count() > 1))
			p_function.Closure()->RetainChildTable(call_symbols);

		if (outcome.flow_control_ == LunaFlowControl::kReturning)
			return outcome.return_values_;
	}
	catch (...)
	{
		// keep the log of a failed call too, since that is where the trace is most useful
		if (logging_execution_)
			*execution_log_ << interpreter.ExecutionLog();

		if (!call_symbols->ReleaseClosureCycles(call_symbols.use_count()) && (call_symbols.use_count() > 1))
			p_function.Closure()->RetainChildTable(call_symbols);

		throw;
	}

	// falling off the end of the body produces a single nil
	LunaValue_Multi_SP result_SP(new LunaValue_Multi());

	result_SP->PushValue(gStaticLunaValueNil);

	return result_SP;
}


#pragma mark -
#pragma mark Statements
#pragma mark -

LunaStatementOutcome LunaInterpreter::ExecuteStatement(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	switch (p_node->node_type_)
	{
		case LunaNodeType::kNodeExpressionStatement:	return Execute_ExpressionStatement(p_node, p_symbols);
		case LunaNodeType::kNodeAssignment:				return Execute_Assignment(p_node, p_symbols);
		case LunaNodeType::kNodeReturn:					return Execute_Return(p_node, p_symbols);
		case LunaNodeType::kNodeFunctionDecl:			return Execute_FunctionDecl(p_node, p_symbols);
		case LunaNodeType::kNodeIf:						return Execute_If(p_node, p_symbols);
		case LunaNodeType::kNodeBlock:					return ExecuteBlock(p_node, p_symbols);
		default:
			LUNA_TERMINATION << "ERROR (LunaInterpreter::ExecuteStatement): (internal error) unexpected " << p_node->node_type_ << " node in statement position." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
	}
}

LunaStatementOutcome LunaInterpreter::ExecuteBlock(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("ExecuteBlock()");

	LunaStatementOutcome outcome = LunaStatementOutcome::Normal();

	for (const LunaASTNode *child_node : p_node->children_)
	{
		outcome = ExecuteStatement(child_node, p_symbols);

		// a return stops the block and propagates outward
		if (outcome.flow_control_ == LunaFlowControl::kReturning)
			break;
	}

	LUNA_EXIT_STATEMENT_LOG("ExecuteBlock()");
	return outcome;
}

LunaStatementOutcome LunaInterpreter::Execute_ExpressionStatement(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Execute_ExpressionStatement()");

	// the value is discarded
	EvaluateNode(p_node->children_[0], p_symbols);

	LunaStatementOutcome outcome = LunaStatementOutcome::Normal();

	LUNA_EXIT_STATEMENT_LOG("Execute_ExpressionStatement()");
	return outcome;
}

LunaStatementOutcome LunaInterpreter::Execute_Assignment(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Execute_Assignment()");

	size_t target_count = p_node->children_.size() - 1;
	LunaValue_SP rvalue = EvaluateNode(p_node->children_[target_count], p_symbols);

	if (rvalue->Type() == LunaValueType::kValueMulti)
	{
		// distribute positionally; missing values are nil and extra values are dropped
		const LunaValue_Multi &multi = static_cast<const LunaValue_Multi &>(*rvalue);

		for (size_t target_index = 0; target_index < target_count; ++target_index)
			p_symbols->DefineValueForSymbol(p_node->children_[target_index]->token_->token_string_, multi.ValueAtIndex((int)target_index));
	}
	else
	{
		p_symbols->DefineValueForSymbol(p_node->children_[0]->token_->token_string_, rvalue);

		for (size_t target_index = 1; target_index < target_count; ++target_index)
			p_symbols->DefineValueForSymbol(p_node->children_[target_index]->token_->token_string_, gStaticLunaValueNil);
	}

	LunaStatementOutcome outcome = LunaStatementOutcome::Normal();

	LUNA_EXIT_STATEMENT_LOG("Execute_Assignment()");
	return outcome;
}

LunaStatementOutcome LunaInterpreter::Execute_Return(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Execute_Return()");

	LunaValue_Multi_SP return_values(new LunaValue_Multi());
	size_t child_count = p_node->children_.size();

	// every value but the last is collapsed to one value; the last contributes all of its values
	for (size_t child_index = 0; child_index < child_count; ++child_index)
	{
		LunaValue_SP child_value = EvaluateNode(p_node->children_[child_index], p_symbols);

		if (child_index == child_count - 1)
			return_values->PushValueFlattened(child_value);
		else
			return_values->PushValue(child_value);
	}

	LunaStatementOutcome outcome = LunaStatementOutcome::Returning(return_values);

	LUNA_EXIT_STATEMENT_LOG("Execute_Return()");
	return outcome;
}

LunaStatementOutcome LunaInterpreter::Execute_FunctionDecl(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Execute_FunctionDecl()");

	const std::string &function_name = p_node->children_[0]->token_->token_string_;
	const LunaASTNode *param_list_node = p_node->children_[1];
	const LunaASTNode *body_node = p_node->children_[2];
	std::vector<std::string> param_names;

	for (const LunaASTNode *param_node : param_list_node->children_)
		param_names.emplace_back(param_node->token_->token_string_);

	// The function shares ownership of our script, which keeps body_node alive, and captures the current environment;
	// defining it in that same environment is what makes direct recursion work
	LunaFunctionSignature_CSP signature(new LunaFunctionSignature(function_name, param_names, body_node, script_));

	p_symbols->DefineValueForSymbol(function_name, LunaValue_SP(new LunaValue_Function(signature, p_symbols)));

	if (logging_execution_)
		*execution_log_ << IndentString(execution_log_indent_) << "declared " << *signature << "\n";

	LunaStatementOutcome outcome = LunaStatementOutcome::Normal();

	LUNA_EXIT_STATEMENT_LOG("Execute_FunctionDecl()");
	return outcome;
}

LunaStatementOutcome LunaInterpreter::Execute_If(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Execute_If()");

	LunaValue_SP condition_result = CollapsedLunaValue(EvaluateNode(p_node->children_[0], p_symbols));
	LunaStatementOutcome outcome = LunaStatementOutcome::Normal();

	if (condition_result->IsTruthy())
		outcome = ExecuteBlock(p_node->children_[1], p_symbols);
	else if (p_node->children_.size() > 2)
		outcome = ExecuteBlock(p_node->children_[2], p_symbols);

	LUNA_EXIT_STATEMENT_LOG("Execute_If()");
	return outcome;
}


#pragma mark -
#pragma mark Expressions
#pragma mark -

LunaValue_SP LunaInterpreter::EvaluateNode(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	switch (p_node->node_type_)
	{
		case LunaNodeType::kNodeLiteral:		return Evaluate_Literal(p_node, p_symbols);
		case LunaNodeType::kNodeVariable:		return Evaluate_Variable(p_node, p_symbols);
		case LunaNodeType::kNodeUnary:			return Evaluate_Unary(p_node, p_symbols);
		case LunaNodeType::kNodeBinary:			return Evaluate_Binary(p_node, p_symbols);
		case LunaNodeType::kNodeLogical:		return Evaluate_Logical(p_node, p_symbols);
		case LunaNodeType::kNodeCall:			return Evaluate_Call(p_node, p_symbols);
		default:
			LUNA_TERMINATION << "ERROR (LunaInterpreter::EvaluateNode): (internal error) unexpected " << p_node->node_type_ << " node in expression position." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
	}
}

LunaValue_SP LunaInterpreter::Evaluate_Literal(const LunaASTNode *p_node, __attribute__((unused)) const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Literal()");

	LunaValue_SP result_SP = p_node->cached_literal_value_;

	if (!result_SP)
		LUNA_TERMINATION << "ERROR (LunaInterpreter::Evaluate_Literal): (internal error) literal '" << *p_node->token_ << "' has no cached value." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Literal()");
	return result_SP;
}

LunaValue_SP LunaInterpreter::Evaluate_Variable(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Variable()");

	// an undefined variable is nil, not an error
	LunaValue_SP result_SP = p_symbols->GetValueForSymbol(p_node->token_->token_string_);

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Variable()");
	return result_SP;
}

LunaValue_SP LunaInterpreter::Evaluate_Unary(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Unary()");

	const LunaToken *operator_token = p_node->token_;
	LunaValue_SP operand = CollapsedLunaValue(EvaluateNode(p_node->children_[0], p_symbols));
	LunaValue_SP result_SP;

	if (operator_token->token_type_ == LunaTokenType::kTokenNot)
		result_SP = LunaValueForBoolean(!operand->IsTruthy());
	else if (operator_token->token_type_ == LunaTokenType::kTokenMinus)
		result_SP = LunaValue_SP(new LunaValue_Number(-operand->NumericValue(operator_token)));
	else
		LUNA_TERMINATION << "ERROR (LunaInterpreter::Evaluate_Unary): (internal error) unexpected unary operator '" << *operator_token << "'." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Unary()");
	return result_SP;
}

LunaValue_SP LunaInterpreter::Evaluate_Binary(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Binary()");

	const LunaToken *operator_token = p_node->token_;

	// both operands are always evaluated, left first
	LunaValue_SP left_value = EvaluateNode(p_node->children_[0], p_symbols);
	LunaValue_SP right_value = EvaluateNode(p_node->children_[1], p_symbols);
	LunaValue_SP result_SP;

	switch (operator_token->token_type_)
	{
		case LunaTokenType::kTokenPlus:
			result_SP = LunaValue_SP(new LunaValue_Number(left_value->NumericValue(operator_token) + right_value->NumericValue(operator_token)));
			break;
		case LunaTokenType::kTokenMinus:
			result_SP = LunaValue_SP(new LunaValue_Number(left_value->NumericValue(operator_token) - right_value->NumericValue(operator_token)));
			break;
		case LunaTokenType::kTokenMult:
			result_SP = LunaValue_SP(new LunaValue_Number(left_value->NumericValue(operator_token) * right_value->NumericValue(operator_token)));
			break;
		case LunaTokenType::kTokenDiv:
			// division by zero gives inf or nan, as IEEE arithmetic does
			result_SP = LunaValue_SP(new LunaValue_Number(left_value->NumericValue(operator_token) / right_value->NumericValue(operator_token)));
			break;
		case LunaTokenType::kTokenConcat:
			result_SP = LunaValue_SP(new LunaValue_String(left_value->TextualValue(operator_token) + right_value->TextualValue(operator_token)));
			break;
		case LunaTokenType::kTokenEq:
			result_SP = LunaValueForBoolean(IdenticalLunaValues(*left_value, *right_value));
			break;
		case LunaTokenType::kTokenNotEq:
			result_SP = LunaValueForBoolean(!IdenticalLunaValues(*left_value, *right_value));
			break;
		case LunaTokenType::kTokenLt:
			result_SP = LunaValueForBoolean(left_value->NumericValue(operator_token) < right_value->NumericValue(operator_token));
			break;
		case LunaTokenType::kTokenLtEq:
			result_SP = LunaValueForBoolean(left_value->NumericValue(operator_token) <= right_value->NumericValue(operator_token));
			break;
		case LunaTokenType::kTokenGt:
			result_SP = LunaValueForBoolean(left_value->NumericValue(operator_token) > right_value->NumericValue(operator_token));
			break;
		case LunaTokenType::kTokenGtEq:
			result_SP = LunaValueForBoolean(left_value->NumericValue(operator_token) >= right_value->NumericValue(operator_token));
			break;
		default:
			LUNA_TERMINATION << "ERROR (LunaInterpreter::Evaluate_Binary): (internal error) unexpected binary operator '" << *operator_token << "'." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
	}

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Binary()");
	return result_SP;
}

LunaValue_SP LunaInterpreter::Evaluate_Logical(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Logical()");

	const LunaToken *operator_token = p_node->token_;
	LunaValue_SP result_SP = CollapsedLunaValue(EvaluateNode(p_node->children_[0], p_symbols));
	bool left_truthy = result_SP->IsTruthy();

	// the result is one of the operands, not a boolean; the right operand is evaluated only if it decides the result
	if (operator_token->token_type_ == LunaTokenType::kTokenAnd)
	{
		if (left_truthy)
			result_SP = CollapsedLunaValue(EvaluateNode(p_node->children_[1], p_symbols));
	}
	else if (operator_token->token_type_ == LunaTokenType::kTokenOr)
	{
		if (!left_truthy)
			result_SP = CollapsedLunaValue(EvaluateNode(p_node->children_[1], p_symbols));
	}
	else
	{
		LUNA_TERMINATION << "ERROR (LunaInterpreter::Evaluate_Logical): (internal error) unexpected logical operator '" << *operator_token << "'." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
	}

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Logical()");
	return result_SP;
}

LunaValue_SP LunaInterpreter::Evaluate_Call(const LunaASTNode *p_node, const LunaSymbolTable_SP &p_symbols)
{
	LUNA_ENTRY_EXECUTION_LOG("Evaluate_Call()");

	const LunaASTNode *callee_node = p_node->children_[0];
	LunaValue_SP callee_value = CollapsedLunaValue(EvaluateNode(callee_node, p_symbols));

	if (callee_value->Type() != LunaValueType::kValueFunction)
		LUNA_TERMINATION << "ERROR (LunaInterpreter::Evaluate_Call): attempt to call a " << callee_value->Type() << " value ('" << callee_node->token_->token_string_ << "')." << LunaTerminate(LunaErrorKind::kTypeCoercion);

	// arguments are evaluated left to right, and each is collapsed to a single value
	std::vector<LunaValue_SP> arguments;

	arguments.reserve(p_node->children_.size() - 1);

	for (size_t child_index = 1; child_index < p_node->children_.size(); ++child_index)
		arguments.emplace_back(CollapsedLunaValue(EvaluateNode(p_node->children_[child_index], p_symbols)));

	LunaValue_SP result_SP = CallFunction(static_cast<const LunaValue_Function &>(*callee_value), arguments);

	// a single result stands for itself; zero or several results stay a multivalue for the consumer to handle
	if ((result_SP->Type() == LunaValueType::kValueMulti) && (static_cast<const LunaValue_Multi &>(*result_SP).Count() == 1))
		result_SP = static_cast<const LunaValue_Multi &>(*result_SP).ValueAtIndex(0);

	LUNA_EXIT_EXECUTION_LOG("Evaluate_Call()");
	return result_SP;
}
