//
//  luna_function_signature.h
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


#ifndef __Luna__luna_function_signature__
#define __Luna__luna_function_signature__

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <ostream>

#include "luna_value.h"


class LunaInterpreter;
class LunaASTNode;
class LunaScript;


// Prototype for a function handler that is internal to Luna.  Arguments arrive already collapsed, one value per argument.
typedef LunaValue_SP (*LunaInternalFunctionPtr)(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter);


// LunaFunctionSignature describes something callable: either a built-in function, implemented by an internal function
// pointer, or a user-defined function, implemented by a body block in the AST of some LunaScript.  Signatures are
// immutable once set up, and are shared through LunaFunctionSignature_CSP.
class LunaFunctionSignature
{
public:
	std::string call_name_;
	std::vector<std::string> param_names_;						// parameter names; for built-ins these are used only for printing
	bool has_ellipsis_ = false;									// if true, any number of arguments is accepted

	LunaInternalFunctionPtr internal_function_ = nullptr;		// set for built-in functions only

	const LunaASTNode *body_node_ = nullptr;					// a kNodeBlock; NOT OWNED, kept alive by body_script_
	std::shared_ptr<const LunaScript> body_script_;				// the script whose AST contains body_node_

	LunaFunctionSignature(const LunaFunctionSignature&) = delete;					// no copying
	LunaFunctionSignature& operator=(const LunaFunctionSignature&) = delete;		// no copying
	LunaFunctionSignature(void) = delete;											// no null construction

	// built-in functions; parameters are added with AddParam() / AddEllipsis()
	LunaFunctionSignature(const std::string &p_call_name, LunaInternalFunctionPtr p_function_ptr);

	// user-defined functions
	LunaFunctionSignature(const std::string &p_call_name, const std::vector<std::string> &p_param_names, const LunaASTNode *p_body_node, std::shared_ptr<const LunaScript> p_body_script);

	// these return this, for chaining during setup
	LunaFunctionSignature *AddParam(const std::string &p_param_name);
	LunaFunctionSignature *AddEllipsis(void);

	inline bool IsInternal(void) const { return (internal_function_ != nullptr); }

	// raise an arity mismatch unless p_argument_count is acceptable
	void CheckArgumentCount(size_t p_argument_count) const;
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaFunctionSignature &p_signature);


// The configured set of built-in functions, by name.  A std::map is used so that iteration order is stable.
typedef std::pair<std::string, LunaFunctionSignature_CSP> LunaFunctionMapPair;
typedef std::map<std::string, LunaFunctionSignature_CSP> LunaFunctionMap;


#endif /* defined(__Luna__luna_function_signature__) */
