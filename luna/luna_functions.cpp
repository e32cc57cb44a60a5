//
//  luna_functions.cpp
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



#include "luna_functions.h"

#include <cmath>
#include <sstream>


LunaFunctionMap Luna_StandardBuiltInFunctionMap(void)
{
	LunaFunctionMap function_map;

	function_map.insert(LunaFunctionMapPair(gLunaStr_print,		LunaFunctionSignature_CSP((new LunaFunctionSignature(gLunaStr_print,		Luna_ExecuteFunction_print))->AddEllipsis())));
	function_map.insert(LunaFunctionMapPair(gLunaStr_sqrt,		LunaFunctionSignature_CSP((new LunaFunctionSignature(gLunaStr_sqrt,		Luna_ExecuteFunction_sqrt))->AddParam("x"))));
	function_map.insert(LunaFunctionMapPair(gLunaStr_tostring,	LunaFunctionSignature_CSP((new LunaFunctionSignature(gLunaStr_tostring,	Luna_ExecuteFunction_tostring))->AddParam("x"))));
	function_map.insert(LunaFunctionMapPair(gLunaStr_type,		LunaFunctionSignature_CSP((new LunaFunctionSignature(gLunaStr_type,		Luna_ExecuteFunction_type))->AddParam("x"))));

	return function_map;
}


//	(void)print(...)
LunaValue_SP Luna_ExecuteFunction_print(const std::vector<LunaValue_SP> &p_arguments, LunaInterpreter &p_interpreter)
{
	std::ostream &output_stream = p_interpreter.ExecutionOutputStream();
	bool first = true;

	for (const LunaValue_SP &argument : p_arguments)
	{
		if (!first)
			output_stream << ' ';
		first = false;

		output_stream << *argument;
	}

	output_stream << std::endl;

	// no values at all
	return LunaValue_SP(new LunaValue_Multi());
}

//	(number)sqrt(x)
LunaValue_SP Luna_ExecuteFunction_sqrt(const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	double x = p_arguments[0]->NumericValue(nullptr);

	return LunaValue_SP(new LunaValue_Number(sqrt(x)));
}

//	(string)tostring(x)
LunaValue_SP Luna_ExecuteFunction_tostring(const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	std::ostringstream string_stream;

	string_stream << *p_arguments[0];

	return LunaValue_SP(new LunaValue_String(string_stream.str()));
}

//	(string)type(x)
LunaValue_SP Luna_ExecuteFunction_type(const std::vector<LunaValue_SP> &p_arguments, __attribute__((unused)) LunaInterpreter &p_interpreter)
{
	return LunaValue_SP(new LunaValue_String(StringForLunaValueType(p_arguments[0]->Type())));
}
