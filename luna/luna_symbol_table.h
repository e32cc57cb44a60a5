//
//  luna_symbol_table.h
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

 LunaSymbolTable is one scope in a chain of scopes.  The root table of a script runner holds the built-in functions
 and the script's global definitions; each call to a user-defined function gets a new table whose parent is the
 function's closure.  Tables are shared through LunaSymbolTable_SP, since function values keep their defining scope
 alive for as long as they exist.

 There are three basic operations:

	define	(DefineValueForSymbol)	set the symbol in this table, shadowing any definition in a parent table
	get		(GetValueForSymbol)		look the symbol up through the chain; nil if it is not defined anywhere
	assign	(AssignValueForSymbol)	replace the value in the nearest table that defines the symbol; an error if none does

 */

#ifndef __Luna__luna_symbol_table__
#define __Luna__luna_symbol_table__

#include <string>
#include <vector>
#include <memory>

#include "luna_globals.h"
#include "luna_value.h"
#include "luna_function_signature.h"

#if LUNA_ROBIN_HOOD_HASHING
#include "robin_hood.h"
typedef robin_hood::unordered_flat_map<std::string, LunaValue_SP> LunaSymbolHashTable;
#elif STD_UNORDERED_MAP_HASHING
#include <unordered_map>
typedef std::unordered_map<std::string, LunaValue_SP> LunaSymbolHashTable;
#endif


class LunaSymbolTable
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

private:

	LunaSymbolHashTable symbols_;
	const LunaSymbolTable_SP parent_symbol_table_;						// nullptr for a root table
	std::vector<std::weak_ptr<LunaSymbolTable>> retained_child_tables_;	// call environments that outlived their call

public:

	LunaSymbolTable(const LunaSymbolTable&) = delete;					// no copying
	LunaSymbolTable& operator=(const LunaSymbolTable&) = delete;		// no copying
	LunaSymbolTable(void) = delete;										// no null construction; pass nullptr for a root table

	explicit LunaSymbolTable(LunaSymbolTable_SP p_parent_table);
	~LunaSymbolTable(void);

	inline const LunaSymbolTable_SP &ParentSymbolTable(void) const { return parent_symbol_table_; }

	// define: set in this table only; an existing definition in this table is overwritten
	void DefineValueForSymbol(const std::string &p_symbol_name, LunaValue_SP p_value);

	// get: search this table, then each parent in turn; nil if the symbol is undefined everywhere
	LunaValue_SP GetValueForSymbol(const std::string &p_symbol_name) const;

	// assign: replace the value in the nearest table defining the symbol; raises if no table in the chain defines it
	void AssignValueForSymbol(const std::string &p_symbol_name, LunaValue_SP p_value);

	bool ContainsSymbol(const std::string &p_symbol_name) const;		// this table only; parents are not searched
	std::vector<std::string> SymbolNames(bool p_include_parents) const;	// sorted, without duplicates

	// Function values declared in a table keep it alive as their closure, so a table holding them is part of a reference
	// cycle.  ReleaseClosureCycles() breaks it only when nothing outside the cycle refers to the table or to those functions,
	// given the table's current use count, and returns true if it cleared the table.  A call environment that is kept
	// instead is registered with RetainChildTable(), and RemoveAllSymbols() clears this table and every retained child.
	bool ReleaseClosureCycles(long p_table_use_count);
	void RetainChildTable(const LunaSymbolTable_SP &p_child_table);
	void RemoveAllSymbols(void);

	// define a function value for each entry of p_function_map; built-ins have no closure
	void DefineBuiltInFunctions(const LunaFunctionMap &p_function_map);
};


#endif /* defined(__Luna__luna_symbol_table__) */
