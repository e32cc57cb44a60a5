//
//  luna_functions.h
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

 This file contains the built-in functions of Luna.  Each follows the LunaInternalFunctionPtr calling convention:
 it receives its arguments already evaluated and collapsed, and the interpreter making the call, through which it
 reaches the execution output stream.  The argument count has been checked against the signature before the call.

 */

#ifndef __Luna__luna_functions__
#define __Luna__luna_functions__

#include "luna_interpreter.h"
#include "luna_value.h"
#include "luna_function_signature.h"


// The standard set of built-ins, as a fresh map each time; hosts may add to it or remove from it before use
LunaFunctionMap Luna_StandardBuiltInFunctionMap(void);


#pragma mark -
#pragma mark Built-in functions
#pragma mark -

LunaValue_SP Luna_ExecuteFunction_print(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter);
LunaValue_SP Luna_ExecuteFunction_sqrt(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter);
LunaValue_SP Luna_ExecuteFunction_tostring(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter);
LunaValue_SP Luna_ExecuteFunction_type(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter);


#endif /* defined(__Luna__luna_functions__) */
