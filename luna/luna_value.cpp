//
//  luna_value.cpp
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


#include "luna_value.h"
#include "luna_function_signature.h"
#include "luna_symbol_table.h"

#include <cstdlib>
#include <cerrno>


LunaValue_SP gStaticLunaValueNil(new LunaValue_Nil());
LunaValue_SP gStaticLunaValue_True(new LunaValue_Boolean(true));
LunaValue_SP gStaticLunaValue_False(new LunaValue_Boolean(false));


const std::string &StringForLunaValueType(const LunaValueType p_type)
{
	switch (p_type)
	{
		case LunaValueType::kValueNil:			return gLunaStr_nil;
		case LunaValueType::kValueBoolean:		return gLunaStr_boolean;
		case LunaValueType::kValueNumber:		return gLunaStr_number;
		case LunaValueType::kValueString:		return gLunaStr_string;
		case LunaValueType::kValueFunction:		return gLunaStr_function;
		case LunaValueType::kValueMulti:		return gLunaStr_multivalue;
	}

	LUNA_TERMINATION << "ERROR (StringForLunaValueType): (internal error) unrecognized value type." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
}

std::ostream &operator<<(std::ostream &p_outstream, const LunaValueType p_type)
{
	p_outstream << StringForLunaValueType(p_type);

	return p_outstream;
}

bool IdenticalLunaValues(const LunaValue &p_value1, const LunaValue &p_value2)
{
	if (&p_value1 == &p_value2)
		return true;

	LunaValueType type1 = p_value1.Type();

	if (type1 != p_value2.Type())
		return false;

	switch (type1)
	{
		case LunaValueType::kValueNil:
			return true;
		case LunaValueType::kValueBoolean:
			return (static_cast<const LunaValue_Boolean &>(p_value1).BooleanValue() == static_cast<const LunaValue_Boolean &>(p_value2).BooleanValue());
		case LunaValueType::kValueNumber:
			// numeric comparison, so nan is unequal to itself
			return (p_value1.NumericValue(nullptr) == p_value2.NumericValue(nullptr));
		case LunaValueType::kValueString:
			return (static_cast<const LunaValue_String &>(p_value1).StringValue() == static_cast<const LunaValue_String &>(p_value2).StringValue());
		case LunaValueType::kValueFunction:
			// distinct function values are never equal, even with the same signature; the identity test above covers equality
			return false;
		case LunaValueType::kValueMulti:
		{
			const LunaValue_Multi &multi1 = static_cast<const LunaValue_Multi &>(p_value1);
			const LunaValue_Multi &multi2 = static_cast<const LunaValue_Multi &>(p_value2);

			if (multi1.Count() != multi2.Count())
				return false;

			for (int index = 0; index < multi1.Count(); ++index)
				if (!IdenticalLunaValues(*multi1.ValueAtIndex(index), *multi2.ValueAtIndex(index)))
					return false;

			return true;
		}
	}

	return false;
}

LunaValue_SP CollapsedLunaValue(const LunaValue_SP &p_value)
{
	if (p_value->Type() == LunaValueType::kValueMulti)
		return static_cast<const LunaValue_Multi &>(*p_value).ValueAtIndex(0);

	return p_value;
}


// *******************************************************************************************************************
//
//	LunaValue
//
#pragma mark -
#pragma mark LunaValue
#pragma mark -

LunaValue::~LunaValue(void)
{
}

void LunaValue::RaiseForCoercion(const char *p_target_description, const LunaToken *p_blame_token) const
{
	if (p_blame_token)
		LUNA_TERMINATION << "ERROR (LunaValue::RaiseForCoercion): cannot coerce a " << cached_type_ << " value to " << p_target_description << " for operator '" << p_blame_token->token_string_ << "'." << LunaTerminate(LunaErrorKind::kTypeCoercion);
	else
		LUNA_TERMINATION << "ERROR (LunaValue::RaiseForCoercion): cannot coerce a " << cached_type_ << " value to " << p_target_description << "." << LunaTerminate(LunaErrorKind::kTypeCoercion);
}

bool LunaValue::IsTruthy(void) const
{
	if (cached_type_ == LunaValueType::kValueNil)
		return false;
	if (cached_type_ == LunaValueType::kValueBoolean)
		return static_cast<const LunaValue_Boolean *>(this)->BooleanValue();

	return true;
}

double LunaValue::NumericValue(const LunaToken *p_blame_token) const
{
	RaiseForCoercion("a number", p_blame_token);
}

std::string LunaValue::TextualValue(const LunaToken *p_blame_token) const
{
	RaiseForCoercion("a string", p_blame_token);
}

std::ostream &operator<<(std::ostream &p_outstream, const LunaValue &p_value)
{
	p_value.Print(p_outstream);

	return p_outstream;
}


#pragma mark -
#pragma mark LunaValue_Nil
#pragma mark -

LunaValue_Nil::~LunaValue_Nil(void)
{
}

void LunaValue_Nil::Print(std::ostream &p_ostream) const
{
	p_ostream << gLunaStr_nil;
}

double LunaValue_Nil::NumericValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return 0.0;
}


#pragma mark -
#pragma mark LunaValue_Boolean
#pragma mark -

LunaValue_Boolean::~LunaValue_Boolean(void)
{
}

void LunaValue_Boolean::Print(std::ostream &p_ostream) const
{
	p_ostream << (value_ ? gLunaStr_true : gLunaStr_false);
}

double LunaValue_Boolean::NumericValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return (value_ ? 1.0 : 0.0);
}

std::string LunaValue_Boolean::TextualValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return (value_ ? gLunaStr_true : gLunaStr_false);
}


#pragma mark -
#pragma mark LunaValue_Number
#pragma mark -

LunaValue_Number::~LunaValue_Number(void)
{
}

void LunaValue_Number::Print(std::ostream &p_ostream) const
{
	p_ostream << Luna_StringForNumber(value_);
}

double LunaValue_Number::NumericValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return value_;
}

std::string LunaValue_Number::TextualValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return Luna_StringForNumber(value_);
}


#pragma mark -
#pragma mark LunaValue_String
#pragma mark -

LunaValue_String::~LunaValue_String(void)
{
}

void LunaValue_String::Print(std::ostream &p_ostream) const
{
	p_ostream << value_;
}

double LunaValue_String::NumericValue(const LunaToken *p_blame_token) const
{
	std::string trimmed = Luna_TrimWhitespace(value_);

	if (trimmed.length())
	{
		const char *c_str = trimmed.c_str();
		char *last_used_char = nullptr;

		errno = 0;

		double converted_value = strtod(c_str, &last_used_char);

		if (!errno && (last_used_char == c_str + trimmed.length()))
			return converted_value;
	}

	if (p_blame_token)
		LUNA_TERMINATION << "ERROR (LunaValue_String::NumericValue): cannot coerce the string \"" << value_ << "\" to a number for operator '" << p_blame_token->token_string_ << "'." << LunaTerminate(LunaErrorKind::kTypeCoercion);
	else
		LUNA_TERMINATION << "ERROR (LunaValue_String::NumericValue): cannot coerce the string \"" << value_ << "\" to a number." << LunaTerminate(LunaErrorKind::kTypeCoercion);
}

std::string LunaValue_String::TextualValue(__attribute__((unused)) const LunaToken *p_blame_token) const
{
	return value_;
}


#pragma mark -
#pragma mark LunaValue_Function
#pragma mark -

LunaValue_Function::LunaValue_Function(LunaFunctionSignature_CSP p_signature, LunaSymbolTable_SP p_closure) :
	LunaValue(LunaValueType::kValueFunction), signature_(std::move(p_signature)), closure_(std::move(p_closure))
{
}

LunaValue_Function::~LunaValue_Function(void)
{
}

void LunaValue_Function::Print(std::ostream &p_ostream) const
{
	p_ostream << "function: " << signature_->call_name_;
}


#pragma mark -
#pragma mark LunaValue_Multi
#pragma mark -

LunaValue_Multi::~LunaValue_Multi(void)
{
}

const LunaValue_SP &LunaValue_Multi::ValueAtIndex(int p_index) const
{
	if ((p_index < 0) || (p_index >= (int)values_.size()))
		return gStaticLunaValueNil;

	return values_[p_index];
}

void LunaValue_Multi::PushValue(const LunaValue_SP &p_value)
{
	values_.emplace_back(CollapsedLunaValue(p_value));
}

void LunaValue_Multi::PushValueFlattened(const LunaValue_SP &p_value)
{
	if (p_value->Type() == LunaValueType::kValueMulti)
	{
		const std::vector<LunaValue_SP> &spliced_values = static_cast<const LunaValue_Multi &>(*p_value).Values();

		values_.insert(values_.end(), spliced_values.begin(), spliced_values.end());
	}
	else
	{
		values_.emplace_back(p_value);
	}
}

void LunaValue_Multi::Print(std::ostream &p_ostream) const
{
	bool first = true;

	for (const LunaValue_SP &value : values_)
	{
		if (!first)
			p_ostream << ", ";
		first = false;

		value->Print(p_ostream);
	}
}
