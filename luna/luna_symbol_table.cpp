//
//  luna_symbol_table.cpp
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


#include "luna_symbol_table.h"

#include <algorithm>


LunaSymbolTable::LunaSymbolTable(LunaSymbolTable_SP p_parent_table) : parent_symbol_table_(std::move(p_parent_table))
{
}

LunaSymbolTable::~LunaSymbolTable(void)
{
}

void LunaSymbolTable::DefineValueForSymbol(const std::string &p_symbol_name, LunaValue_SP p_value)
{
	// multivalues are collapsed at every consumer; one reaching a table is a bug somewhere upstream
	if (p_value->Type() == LunaValueType::kValueMulti)
		LUNA_TERMINATION << "ERROR (LunaSymbolTable::DefineValueForSymbol): (internal error) a multivalue cannot be stored in variable '" << p_symbol_name << "'." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	symbols_[p_symbol_name] = std::move(p_value);
}

LunaValue_SP LunaSymbolTable::GetValueForSymbol(const std::string &p_symbol_name) const
{
	const LunaSymbolTable *current_table = this;

	do
	{
		auto symbol_iter = current_table->symbols_.find(p_symbol_name);

		if (symbol_iter != current_table->symbols_.end())
			return symbol_iter->second;

		current_table = current_table->parent_symbol_table_.get();
	}
	while (current_table);

	return gStaticLunaValueNil;
}

void LunaSymbolTable::AssignValueForSymbol(const std::string &p_symbol_name, LunaValue_SP p_value)
{
	LunaSymbolTable *current_table = this;

	do
	{
		auto symbol_iter = current_table->symbols_.find(p_symbol_name);

		if (symbol_iter != current_table->symbols_.end())
		{
			if (p_value->Type() == LunaValueType::kValueMulti)
				LUNA_TERMINATION << "ERROR (LunaSymbolTable::AssignValueForSymbol): (internal error) a multivalue cannot be stored in variable '" << p_symbol_name << "'." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

			symbol_iter->second = std::move(p_value);
			return;
		}

		current_table = current_table->parent_symbol_table_.get();
	}
	while (current_table);

	LUNA_TERMINATION << "ERROR (LunaSymbolTable::AssignValueForSymbol): undefined variable '" << p_symbol_name << "'." << LunaTerminate(LunaErrorKind::kUndefinedMutation);
}

bool LunaSymbolTable::ContainsSymbol(const std::string &p_symbol_name) const
{
	return (symbols_.find(p_symbol_name) != symbols_.end());
}

std::vector<std::string> LunaSymbolTable::SymbolNames(bool p_include_parents) const
{
	std::vector<std::string> symbol_names;

	for (const LunaSymbolTable *current_table = this; current_table; current_table = current_table->parent_symbol_table_.get())
	{
		for (auto &symbol_pair : current_table->symbols_)
			symbol_names.emplace_back(symbol_pair.first);

		if (!p_include_parents)
			break;
	}

	std::sort(symbol_names.begin(), symbol_names.end());
	symbol_names.erase(std::unique(symbol_names.begin(), symbol_names.end()), symbol_names.end());

	return symbol_names;
}

void LunaSymbolTable::RetainChildTable(const LunaSymbolTable_SP &p_child_table)
{
	// drop children that have been freed already, so the list only grows with live tables
	retained_child_tables_.erase(std::remove_if(retained_child_tables_.begin(), retained_child_tables_.end(), [](const std::weak_ptr<LunaSymbolTable> &p_child) { return p_child.expired(); }), retained_child_tables_.end());

	retained_child_tables_.emplace_back(p_child_table);
}

void LunaSymbolTable::RemoveAllSymbols(void)
{
	// children are locked first; clearing our symbols may release the last outside reference to one of them
	std::vector<LunaSymbolTable_SP> child_tables;

	for (const std::weak_ptr<LunaSymbolTable> &child : retained_child_tables_)
	{
		LunaSymbolTable_SP child_table = child.lock();

		if (child_table)
			child_tables.emplace_back(std::move(child_table));
	}

	retained_child_tables_.clear();
	symbols_.clear();

	for (const LunaSymbolTable_SP &child_table : child_tables)
		child_table->RemoveAllSymbols();
}

bool LunaSymbolTable::ReleaseClosureCycles(long p_table_use_count)
{
	long closure_references = 0;

	for (auto &symbol_pair : symbols_)
	{
		const LunaValue_SP &value = symbol_pair.second;

		if (value->Type() != LunaValueType::kValueFunction)
			continue;

		if (static_cast<const LunaValue_Function &>(*value).Closure().get() != this)
			continue;

		// a function that is held anywhere else has escaped, and needs its closure intact
		if (value.use_count() != 1)
			return false;

		closure_references++;
	}

	// no cycle, or the table itself is referenced from outside: the caller's reference plus one per closure is all we allow
	if ((closure_references == 0) || (p_table_use_count != closure_references + 1))
		return false;

	// nothing can be retained here: a live retained child would hold a reference to us through its parent pointer
	symbols_.clear();
	return true;
}

void LunaSymbolTable::DefineBuiltInFunctions(const LunaFunctionMap &p_function_map)
{
	for (auto &function_pair : p_function_map)
		DefineValueForSymbol(function_pair.first, LunaValue_SP(new LunaValue_Function(function_pair.second, nullptr)));
}
