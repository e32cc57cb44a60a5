//
//  luna_test_operators.cpp
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

#include <limits>


#pragma mark arithmetic
void _RunOperatorArithmeticTests(void)
{
	LunaAssertScriptSuccess_N("return 1 + 2", 3);
	LunaAssertScriptSuccess_N("return 1 + 2 * 3", 7);
	LunaAssertScriptSuccess_N("return (1 + 2) * 3", 9);
	LunaAssertScriptSuccess_N("return 3 + 4 * 2", 11);
	LunaAssertScriptSuccess_N("return (3 + 4) * 2", 14);
	LunaAssertScriptSuccess_N("return 2 - 3 - 4", -5);
	LunaAssertScriptSuccess_N("return 64 / 4 / 2", 8);
	LunaAssertScriptSuccess_N("return 10 / 4", 2.5);
	LunaAssertScriptSuccess_N("return 2 * 3 - 8 / 2", 2);
	LunaAssertScriptSuccess_N("return -3 + 5", 2);
	LunaAssertScriptSuccess_N("return - -3", 3);
	LunaAssertScriptSuccess_N("return -(2 + 3) * 2", -10);
	LunaAssertScriptSuccess_N("return 12345678901234567890", 12345678901234567890.0);
	LunaAssertScriptSuccess_N("x = 5\ny = x * 2\nreturn y - x", 5);

	// division by zero is not an error
	LunaAssertScriptSuccess_N("return 1 / 0", std::numeric_limits<double>::infinity());
	LunaAssertScriptSuccess_N("return -1 / 0", -std::numeric_limits<double>::infinity());

	// numeric coercion
	LunaAssertScriptSuccess_N("return '10' + 5", 15);
	LunaAssertScriptSuccess_N("return ' 7 ' * 2", 14);
	LunaAssertScriptSuccess_N("return '2.5' * 2", 5);
	LunaAssertScriptSuccess_N("return '-4' - 1", -5);
	LunaAssertScriptSuccess_N("return -'3'", -3);
	LunaAssertScriptSuccess_N("return true + true", 2);
	LunaAssertScriptSuccess_N("return false * 5", 0);
	LunaAssertScriptSuccess_N("return nil + 1", 1);
	LunaAssertScriptSuccess_N("return undefined_name * 3", 0);

	LunaAssertScriptRaise("return 'abc' + 1", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"abc\" to a number for operator '+'");
	LunaAssertScriptRaise("return 1 - ''", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"\" to a number for operator '-'");
	LunaAssertScriptRaise("return '12abc' * 1", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"12abc\" to a number for operator '*'");
	LunaAssertScriptRaise("return -'x'", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"x\" to a number for operator '-'");
	LunaAssertScriptRaise("return print / 2", LunaErrorKind::kTypeCoercion, "cannot coerce a function value to a number for operator '/'");
	LunaAssertScriptRaise("function two()\nreturn 1, 2\nend\nreturn two() + 1", LunaErrorKind::kTypeCoercion, "cannot coerce a multivalue value to a number for operator '+'");
}

#pragma mark concatenation
void _RunOperatorConcatTests(void)
{
	LunaAssertScriptSuccess_S("return 'a' .. 'b'", "ab");
	LunaAssertScriptSuccess_S("return 'a' .. 'b' .. 'c'", "abc");
	LunaAssertScriptSuccess_S("return 1 .. 2", "12");
	LunaAssertScriptSuccess_S("return 1..2", "12");
	LunaAssertScriptSuccess_S("return 'v' .. 10 / 4", "v2.5");
	LunaAssertScriptSuccess_S("return 'n=' .. 1 + 2", "n=3");
	LunaAssertScriptSuccess_S("return 'x' .. 1 / 3", "x0.33333333333333");
	LunaAssertScriptSuccess_S("return 'big' .. 100000000000000000000", "big1e+20");
	LunaAssertScriptSuccess_S("return 'is ' .. true", "is true");
	LunaAssertScriptSuccess_S("return false .. ''", "false");
	LunaAssertScriptSuccess_S("return '' .. ''", "");
	LunaAssertScriptSuccess_B("return 1 .. 2 == '12'", true);

	LunaAssertScriptRaise("return 'a' .. nil", LunaErrorKind::kTypeCoercion, "cannot coerce a nil value to a string for operator '..'");
	LunaAssertScriptRaise("return 'a' .. print", LunaErrorKind::kTypeCoercion, "cannot coerce a function value to a string for operator '..'");
	LunaAssertScriptRaise("return missing .. 'a'", LunaErrorKind::kTypeCoercion, "cannot coerce a nil value to a string");
}

#pragma mark comparison
void _RunOperatorComparisonTests(void)
{
	// == and ~=
	LunaAssertScriptSuccess_B("return 1 == 1", true);
	LunaAssertScriptSuccess_B("return 1 == 2", false);
	LunaAssertScriptSuccess_B("return 'a' == 'a'", true);
	LunaAssertScriptSuccess_B("return 'a' == 'A'", false);
	LunaAssertScriptSuccess_B("return '1' == 1", false);
	LunaAssertScriptSuccess_B("return true == true", true);
	LunaAssertScriptSuccess_B("return true == 1", false);
	LunaAssertScriptSuccess_B("return nil == nil", true);
	LunaAssertScriptSuccess_B("return nil == false", false);
	LunaAssertScriptSuccess_B("return undefined_name == nil", true);
	LunaAssertScriptSuccess_B("return 'a' ~= 'b'", true);
	LunaAssertScriptSuccess_B("return 3 ~= 3", false);
	LunaAssertScriptSuccess_B("return nil ~= false", true);
	LunaAssertScriptSuccess_B("return print == print", true);
	LunaAssertScriptSuccess_B("return print == type", false);
	LunaAssertScriptSuccess_B("function a()\nend\nfunction b()\nend\nreturn a == b", false);
	LunaAssertScriptSuccess_B("function a()\nend\nc = a\nreturn c == a", true);
	LunaAssertScriptSuccess_B("function two()\nreturn 1, 2\nend\nfunction also()\nreturn 1, 2\nend\nreturn two() == also()", true);
	LunaAssertScriptSuccess_B("function two()\nreturn 1, 2\nend\nfunction other()\nreturn 1, 3\nend\nreturn two() == other()", false);

	// ordering
	LunaAssertScriptSuccess_B("return 2 < 3", true);
	LunaAssertScriptSuccess_B("return 3 < 3", false);
	LunaAssertScriptSuccess_B("return 3 <= 3", true);
	LunaAssertScriptSuccess_B("return 4 > 3", true);
	LunaAssertScriptSuccess_B("return 2 >= 3", false);
	LunaAssertScriptSuccess_B("return '10' > 9", true);
	LunaAssertScriptSuccess_B("return '10' < '9'", false);
	LunaAssertScriptSuccess_B("return -1 < nil", true);
	LunaAssertScriptSuccess_B("return 1 + 1 == 2", true);
	LunaAssertScriptSuccess_B("return 1 < 2 == true", true);
	LunaAssertScriptSuccess_B("return 'a' .. 'b' == 'ab'", true);

	LunaAssertScriptRaise("return 'a' < 'b'", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"a\" to a number for operator '<'");
	LunaAssertScriptRaise("return print >= 1", LunaErrorKind::kTypeCoercion, "cannot coerce a function value to a number for operator '>='");
}

#pragma mark logical
void _RunOperatorLogicalTests(void)
{
	// and / or produce an operand, not a boolean
	LunaAssertScriptSuccess_N("return nil or 5", 5);
	LunaAssertScriptSuccess_N("return 4 or 5", 4);
	LunaAssertScriptSuccess_B("return false or false", false);
	LunaAssertScriptSuccess_NIL("return false or nil");
	LunaAssertScriptSuccess_S("return 0 and 'yes'", "yes");
	LunaAssertScriptSuccess_S("return '' or 'fallback'", "");
	LunaAssertScriptSuccess_NIL("return nil and 1");
	LunaAssertScriptSuccess_B("return false and nil", false);
	LunaAssertScriptSuccess_N("return 1 or 2 and nil", 1);
	LunaAssertScriptSuccess_N("return nil and 1 or 2", 2);
	LunaAssertScriptSuccess_N("return 1 and 2 or 3", 2);
	LunaAssertScriptSuccess_B("return 1 < 2 and 2 < 3", true);

	// the right operand is not evaluated when the left one decides
	LunaAssertScriptSuccess_B("return false and undefined_function()", false);
	LunaAssertScriptSuccess_B("return true or undefined_function()", true);
	LunaAssertScriptSuccess_N("return 7 or 'x' + 1", 7);
	LunaAssertScriptOutput("r = true or print('no')\nprint(r)", "true\n");
	LunaAssertScriptOutput("r = nil and print('no')\nprint(r)", "nil\n");
	LunaAssertScriptOutput("r = false or print('yes')\nprint(r)", "yes\nnil\n");
	LunaAssertScriptRaise("return true and undefined_function()", LunaErrorKind::kTypeCoercion, "attempt to call a nil value");

	// a multivalue operand is collapsed
	LunaAssertScriptSuccess_N("function two()\nreturn nil, 2\nend\nreturn two() or 9", 9);
	LunaAssertScriptSuccess_N("function two()\nreturn 1, 2\nend\nreturn true and two()", 1);

	// not
	LunaAssertScriptSuccess_B("return not nil", true);
	LunaAssertScriptSuccess_B("return not false", true);
	LunaAssertScriptSuccess_B("return not 0", false);
	LunaAssertScriptSuccess_B("return not ''", false);
	LunaAssertScriptSuccess_B("return not not 'x'", true);
	LunaAssertScriptSuccess_B("return not print", false);
	LunaAssertScriptSuccess_B("return not 1 == 2", false);
	LunaAssertScriptSuccess_B("return not (1 == 2)", true);
}
