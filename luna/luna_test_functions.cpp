//
//  luna_test_functions.cpp
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


#pragma mark if
void _RunKeywordIfTests(void)
{
	LunaAssertScriptSuccess_S("x = 5\nif x > 3 then\nr = 'big'\nelse\nr = 'small'\nend\nreturn r", "big");
	LunaAssertScriptSuccess_S("x = 1\nif x > 3 then\nr = 'big'\nelse\nr = 'small'\nend\nreturn r", "small");
	LunaAssertScriptSuccess_NIL("if false then\nr = 1\nend\nreturn r");
	LunaAssertScriptSuccess_N("r = 0\nif r then\nr = 10\nend\nreturn r", 10);
	LunaAssertScriptSuccess_N("r = ''\nif r then\nr = 10\nend\nreturn r", 10);
	LunaAssertScriptSuccess_N("if nil then\nr = 1\nelse\nr = 2\nend\nreturn r", 2);
	LunaAssertScriptSuccess_N("if print then\nr = 1\nend\nreturn r", 1);

	// nesting
	LunaAssertScriptSuccess_S("a = 1\nb = 2\nif a == 1 then\nif b == 3 then\nr = 'x'\nelse\nr = 'y'\nend\nelse\nr = 'z'\nend\nreturn r", "y");

	// empty bodies
	LunaAssertScriptSuccess_NIL("if true then\nend\nreturn r");
	LunaAssertScriptSuccess_NIL("if false then\nr = 1\nelse\nend\nreturn r");

	// if bodies do not open a new scope
	LunaAssertScriptSuccess_N("if true then\ninner = 42\nend\nreturn inner", 42);

	// a multivalue condition is collapsed to its first value
	LunaAssertScriptSuccess_S("function two()\nreturn false, true\nend\nif two() then\nr = 'yes'\nelse\nr = 'no'\nend\nreturn r", "no");

	// elseif is not supported; it reads as a variable, and the "then" after its condition is then out of place
	LunaAssertScriptRaise("if false then\nr = 1\nelseif true then\nr = 2\nend", LunaErrorKind::kParse, "unexpected token '<then>' in primary expression");
}

#pragma mark return
void _RunKeywordReturnTests(void)
{
	// a top-level return just ends the line
	LunaAssertScriptSuccess_N("return 3", 3);
	LunaAssertScriptSuccess_NIL("return");
	LunaAssertScriptSuccess_NV("return 1, 2, 3", {1, 2, 3});
	LunaAssertScriptSuccess_S("if 1 then return 'yes' end", "yes");
	LunaAssertScriptOutput("return print('a')\nprint('b')", "a\nb\n");

	// return propagates out through nested if statements, and stops the rest of the body
	LunaAssertScriptSuccess_S("function f(x)\nif x > 0 then\nif x > 10 then\nreturn 'huge'\nend\nreturn 'positive'\nend\nreturn 'other'\nend\nreturn f(50) .. ' ' .. f(5) .. ' ' .. f(-1)", "huge positive other");
	LunaAssertScriptOutput("function f()\nprint('before')\nreturn 1\nprint('after')\nend\nf()", "before\n");
	LunaAssertScriptOutput("function f()\nif true then\nreturn\nend\nprint('unreachable')\nend\nf()\nprint('done')", "done\n");

	// flattening: every value but the last is collapsed, and the last is expanded
	LunaAssertScriptSuccess_NV("function two()\nreturn 1, 2\nend\nreturn two()", {1, 2});
	LunaAssertScriptSuccess_NV("function two()\nreturn 1, 2\nend\nreturn two(), 10", {1, 10});
	LunaAssertScriptSuccess_NV("function two()\nreturn 1, 2\nend\nreturn 10, two()", {10, 1, 2});
	LunaAssertScriptSuccess_NV("function two()\nreturn 1, 2\nend\nfunction four()\nreturn two(), two(), two()\nend\nreturn four()", {1, 1, 1, 2});
	LunaAssertScriptSuccess_N("function none()\nreturn\nend\nreturn 5, none()", 5);

	// no return, or a bare return
	LunaAssertScriptSuccess_NIL("function f()\nx = 1\nend\nreturn f()");
	LunaAssertScriptSuccess_S("function f()\nx = 1\nend\nreturn type(f())", "nil");
	LunaAssertScriptSuccess_S("function f()\nreturn\nend\nreturn type(f())", "nil");
	LunaAssertScriptSuccess_NIL("function f()\nreturn\nend\na, b = 1, 2\na = f()\nreturn a");
}

#pragma mark user-defined functions
void _RunUserDefinedFunctionTests(void)
{
	// declaration and calls
	LunaAssertScriptSuccess_N("function add(a, b)\nreturn a + b\nend\nreturn add(2, 3)", 5);
	LunaAssertScriptSuccess_N("local function add(a, b)\nreturn a + b\nend\nreturn add(add(1, 2), add(3, 4))", 10);
	LunaAssertScriptSuccess_N("function answer()\nreturn 42\nend\nreturn answer()", 42);
	LunaAssertScriptSuccess_S("function f()\nend\nreturn tostring(f)", "function: f");
	LunaAssertScriptSuccess_S("function f()\nend\nreturn type(f)", "function");
	LunaAssertScriptSuccess_N("function f(a, a)\nreturn a\nend\nreturn f(1, 2)", 2);
	LunaAssertScriptOutput("function greet(name)\nprint('hello ' .. name)\nend\ngreet('world')\ngreet('again')", "hello world\nhello again\n");

	// redefinition replaces the earlier function
	LunaAssertScriptSuccess_N("function f()\nreturn 1\nend\nfunction f()\nreturn 2\nend\nreturn f()", 2);

	// recursion
	LunaAssertScriptSuccess_N("local function fact(n)\nif n <= 1 then\nreturn 1\nend\nreturn n * fact(n - 1)\nend\nreturn fact(5)", 120);
	LunaAssertScriptSuccess_N("local function factorial(n)\nif n == 0 then\nreturn 1\nelse\nreturn n * factorial(n - 1)\nend\nend\nreturn factorial(5)", 120);
	LunaAssertScriptSuccess_N("function fib(n)\nif n < 2 then\nreturn n\nend\nreturn fib(n - 1) + fib(n - 2)\nend\nreturn fib(15)", 610);
	LunaAssertScriptSuccess_B("function even(n)\nif n == 0 then\nreturn true\nend\nreturn odd(n - 1)\nend\nfunction odd(n)\nif n == 0 then\nreturn false\nend\nreturn even(n - 1)\nend\nreturn even(10)", true);

	// multiple assignment
	LunaAssertScriptSuccess_N("function two()\nreturn 1, 2\nend\na, b = two()\nreturn a + b", 3);
	LunaAssertScriptSuccess_NIL("function two()\nreturn 1, 2\nend\na, b, c = two()\nreturn c");
	LunaAssertScriptSuccess_N("function three()\nreturn 1, 2, 3\nend\na, b = three()\nreturn b", 2);
	LunaAssertScriptSuccess_N("a, b = 7\nreturn a", 7);
	LunaAssertScriptSuccess_NIL("a, b = 7\nreturn b");
	LunaAssertScriptSuccess_NIL("b = 5\na, b = 7\nreturn b");
	LunaAssertScriptSuccess_N("function two()\nreturn 1, 2\nend\nx = two()\nreturn x", 1);

	// lexical scoping: a call's environment is a child of the closure, not of the caller
	LunaAssertScriptSuccess_S("x = 'global'\nfunction show()\nreturn x\nend\nfunction caller()\nx = 'local'\nreturn show()\nend\nreturn caller()", "global");
	LunaAssertScriptSuccess_N("x = 1\nfunction f()\nx = 2\nreturn x\nend\ny = f()\nreturn y * 10 + x", 21);
	LunaAssertScriptSuccess_N("x = 1\nfunction f(x)\nreturn x\nend\nreturn f(5) + x", 6);
	LunaAssertScriptSuccess_NIL("function f()\nsecret = 1\nend\nf()\nreturn secret");
	LunaAssertScriptSuccess_N("x = 1\nfunction f()\nreturn x\nend\nx = 5\nreturn f()", 5);

	// closures
	LunaAssertScriptSuccess_N("function make(n)\nfunction get()\nreturn n\nend\nreturn get\nend\ng = make(42)\nreturn g()", 42);
	LunaAssertScriptSuccess_N("function make(n)\nfunction get()\nreturn n\nend\nreturn get\nend\na = make(1)\nb = make(2)\nreturn a() * 10 + b()", 12);
	LunaAssertScriptSuccess_N("function adder(n)\nlocal function add(x)\nreturn x + n\nend\nreturn add\nend\nadd5 = adder(5)\nn = 100\nreturn add5(1)", 6);
	LunaAssertScriptSuccess_B("function make()\nfunction inner()\nend\nreturn inner\nend\nreturn make() == make()", false);
	LunaAssertScriptSuccess_NIL("function make()\nfunction inner()\nend\nreturn inner\nend\nmake()\nreturn inner");

	// arity and callee errors
	LunaAssertScriptRaise("function f(a)\nreturn a\nend\nreturn f(1, 2)", LunaErrorKind::kArityMismatch, "function f() requires 1 argument(s), but 2 are supplied");
	LunaAssertScriptRaise("function f(a, b)\nreturn a\nend\nreturn f()", LunaErrorKind::kArityMismatch, "function f() requires 2 argument(s), but 0 are supplied");
	LunaAssertScriptRaise("x = 5\nreturn x()", LunaErrorKind::kTypeCoercion, "attempt to call a number value ('x')");
	LunaAssertScriptRaise("return undefined_function()", LunaErrorKind::kTypeCoercion, "attempt to call a nil value");
	LunaAssertScriptRaise("s = 'text'\ns(1)", LunaErrorKind::kTypeCoercion, "attempt to call a string value");

	// a raise inside a function body ends the whole line
	LunaAssertScriptRaise("function bad()\nreturn 'a' + 1\nend\nfunction outer()\nreturn bad()\nend\nx = outer()", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"a\" to a number");
}

#pragma mark built-in functions
void _RunBuiltInFunctionTests(void)
{
	// print
	LunaAssertScriptOutput("print('hello')", "hello\n");
	LunaAssertScriptOutput("print(1, 'a', nil, true)", "1 a nil true\n");
	LunaAssertScriptOutput("print()", "\n");
	LunaAssertScriptOutput("print(10 / 4, 1 / 3, 7)", "2.5 0.33333333333333 7\n");
	LunaAssertScriptOutput("print(print)", "function: print\n");
	LunaAssertScriptOutput("x = print('hi')\nprint(x)", "hi\nnil\n");
	LunaAssertScriptOutput("function two()\nreturn 1, 2\nend\nprint(two())\nprint(two(), two())", "1\n1 1\n");
	LunaAssertScriptSuccess_S("return type(print())", "nil");

	// sqrt
	LunaAssertScriptSuccess_N("return sqrt(16)", 4);
	LunaAssertScriptSuccess_N("return sqrt('9')", 3);
	LunaAssertScriptSuccess_N("return sqrt(2) * sqrt(2) - 2 < 1 / 1000000000 and 1 or 0", 1);
	LunaAssertScriptRaise("return sqrt()", LunaErrorKind::kArityMismatch, "function sqrt() requires 1 argument(s), but 0 are supplied");
	LunaAssertScriptRaise("return sqrt(1, 2)", LunaErrorKind::kArityMismatch, "function sqrt() requires 1 argument(s), but 2 are supplied");
	LunaAssertScriptRaise("return sqrt('x')", LunaErrorKind::kTypeCoercion, "cannot coerce the string \"x\" to a number.");
	LunaAssertScriptRaise("return sqrt(print)", LunaErrorKind::kTypeCoercion, "cannot coerce a function value to a number.");

	// tostring
	LunaAssertScriptSuccess_S("return tostring(10 / 4)", "2.5");
	LunaAssertScriptSuccess_S("return tostring(nil)", "nil");
	LunaAssertScriptSuccess_S("return tostring(true)", "true");
	LunaAssertScriptSuccess_S("return tostring('s')", "s");
	LunaAssertScriptSuccess_S("return tostring(type)", "function: type");
	LunaAssertScriptSuccess_S("return tostring(-0)", "-0");
	LunaAssertScriptRaise("return tostring()", LunaErrorKind::kArityMismatch, "function tostring() requires 1 argument(s)");

	// type
	LunaAssertScriptSuccess_S("return type(1)", "number");
	LunaAssertScriptSuccess_S("return type('1')", "string");
	LunaAssertScriptSuccess_S("return type(nil)", "nil");
	LunaAssertScriptSuccess_S("return type(not_defined)", "nil");
	LunaAssertScriptSuccess_S("return type(false)", "boolean");
	LunaAssertScriptSuccess_S("return type(type)", "function");
	LunaAssertScriptSuccess_S("return type(type(1))", "string");
	LunaAssertScriptRaise("return type(1, 2)", LunaErrorKind::kArityMismatch, "function type() requires 1 argument(s), but 2 are supplied");

	// built-ins are ordinary values, so they can be stored and shadowed
	LunaAssertScriptOutput("p = print\np('via p')", "via p\n");
	LunaAssertScriptSuccess_N("function print(x)\nreturn x * 2\nend\nreturn print(4)", 8);
	LunaAssertScriptRaise("type = 5\nreturn type(1)", LunaErrorKind::kTypeCoercion, "attempt to call a number value ('type')");
}
