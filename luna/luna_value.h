//
//  luna_value.h
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

 The class LunaValue represents any value in Luna.  There is a closed set of subclasses: nil, boolean, number,
 string, function, and the internal multivalue that carries the results of a call or a return.  Values are never
 modified after construction, so they are freely shared through LunaValue_SP; nil and the two booleans are static
 singletons.

 Coercion is explicit: NumericValue() and TextualValue() either produce the coerced value or raise a type coercion
 error naming the operator token responsible (the "blame token").

 */

#ifndef __Luna__luna_value__
#define __Luna__luna_value__

#include <memory>
#include <string>
#include <vector>
#include <ostream>

#include "luna_globals.h"
#include "luna_token.h"


class LunaValue;
class LunaValue_Nil;
class LunaValue_Boolean;
class LunaValue_Number;
class LunaValue_String;
class LunaValue_Function;
class LunaValue_Multi;

class LunaFunctionSignature;
class LunaSymbolTable;


typedef std::shared_ptr<LunaValue> LunaValue_SP;
typedef std::shared_ptr<LunaValue_Multi> LunaValue_Multi_SP;
typedef std::shared_ptr<LunaValue_Function> LunaValue_Function_SP;

typedef std::shared_ptr<const LunaFunctionSignature> LunaFunctionSignature_CSP;
typedef std::shared_ptr<LunaSymbolTable> LunaSymbolTable_SP;


// Shared values; these are immutable, so there is never any reason to make another nil, true, or false
extern LunaValue_SP gStaticLunaValueNil;
extern LunaValue_SP gStaticLunaValue_True;
extern LunaValue_SP gStaticLunaValue_False;

inline const LunaValue_SP &LunaValueForBoolean(bool p_value) { return (p_value ? gStaticLunaValue_True : gStaticLunaValue_False); }


// LunaValueType is an enum of the possible types for LunaValue objects
enum class LunaValueType : uint8_t
{
	kValueNil = 0,
	kValueBoolean,
	kValueNumber,
	kValueString,
	kValueFunction,
	kValueMulti			// internal only; never stored in a variable
};

const std::string &StringForLunaValueType(const LunaValueType p_type);
std::ostream &operator<<(std::ostream &p_outstream, const LunaValueType p_type);


// Structural equality, as used by == and ~=.  This never raises: values of different types are simply unequal.
bool IdenticalLunaValues(const LunaValue &p_value1, const LunaValue &p_value2);

// Reduce a multivalue to its first element, or to nil if it is empty; any other value is returned as is
LunaValue_SP CollapsedLunaValue(const LunaValue_SP &p_value);


// *******************************************************************************************************************
//
//	LunaValue is the abstract base class for all values
//
#pragma mark -
#pragma mark LunaValue
#pragma mark -

class LunaValue
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

protected:

	const LunaValueType cached_type_;								// allows Type() to be an inline function; cached at construction

	void RaiseForCoercion(const char *p_target_description, const LunaToken *p_blame_token) const __attribute__((__noreturn__)) __attribute__((cold));

public:

	LunaValue(const LunaValue &p_original) = delete;				// no copy-construct
	LunaValue& operator=(const LunaValue&) = delete;				// no copying
	LunaValue(void) = delete;										// no null constructor

	explicit LunaValue(LunaValueType p_value_type) : cached_type_(p_value_type) { }
	virtual ~LunaValue(void);

	inline LunaValueType Type(void) const { return cached_type_; }

	virtual void Print(std::ostream &p_ostream) const = 0;			// standard printing; same as operator<<

	// false and nil are falsy; everything else, including 0 and "", is truthy
	bool IsTruthy(void) const;

	// coercions; the base class behavior is to raise a type coercion error blaming p_blame_token
	virtual double NumericValue(const LunaToken *p_blame_token) const;
	virtual std::string TextualValue(const LunaToken *p_blame_token) const;
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaValue &p_value);


#pragma mark -
#pragma mark LunaValue_Nil
#pragma mark -

class LunaValue_Nil : public LunaValue
{
public:
	LunaValue_Nil(const LunaValue_Nil &p_original) = delete;		// no copy-construct
	LunaValue_Nil& operator=(const LunaValue_Nil&) = delete;		// no copying

	LunaValue_Nil(void) : LunaValue(LunaValueType::kValueNil) { }
	virtual ~LunaValue_Nil(void) override;

	virtual void Print(std::ostream &p_ostream) const override;
	virtual double NumericValue(const LunaToken *p_blame_token) const override;
};


#pragma mark -
#pragma mark LunaValue_Boolean
#pragma mark -

class LunaValue_Boolean : public LunaValue
{
private:
	const bool value_;

public:
	LunaValue_Boolean(const LunaValue_Boolean &p_original) = delete;	// no copy-construct
	LunaValue_Boolean& operator=(const LunaValue_Boolean&) = delete;	// no copying
	LunaValue_Boolean(void) = delete;

	explicit LunaValue_Boolean(bool p_value) : LunaValue(LunaValueType::kValueBoolean), value_(p_value) { }
	virtual ~LunaValue_Boolean(void) override;

	inline bool BooleanValue(void) const { return value_; }

	virtual void Print(std::ostream &p_ostream) const override;
	virtual double NumericValue(const LunaToken *p_blame_token) const override;
	virtual std::string TextualValue(const LunaToken *p_blame_token) const override;
};


#pragma mark -
#pragma mark LunaValue_Number
#pragma mark -

class LunaValue_Number : public LunaValue
{
private:
	const double value_;

public:
	LunaValue_Number(const LunaValue_Number &p_original) = delete;		// no copy-construct
	LunaValue_Number& operator=(const LunaValue_Number&) = delete;		// no copying
	LunaValue_Number(void) = delete;

	explicit LunaValue_Number(double p_value) : LunaValue(LunaValueType::kValueNumber), value_(p_value) { }
	virtual ~LunaValue_Number(void) override;

	virtual void Print(std::ostream &p_ostream) const override;
	virtual double NumericValue(const LunaToken *p_blame_token) const override;
	virtual std::string TextualValue(const LunaToken *p_blame_token) const override;
};


#pragma mark -
#pragma mark LunaValue_String
#pragma mark -

class LunaValue_String : public LunaValue
{
private:
	const std::string value_;

public:
	LunaValue_String(const LunaValue_String &p_original) = delete;		// no copy-construct
	LunaValue_String& operator=(const LunaValue_String&) = delete;		// no copying
	LunaValue_String(void) = delete;

	explicit LunaValue_String(const std::string &p_value) : LunaValue(LunaValueType::kValueString), value_(p_value) { }
	virtual ~LunaValue_String(void) override;

	inline const std::string &StringValue(void) const { return value_; }

	virtual void Print(std::ostream &p_ostream) const override;
	virtual double NumericValue(const LunaToken *p_blame_token) const override;		// the whole trimmed string must parse as a number
	virtual std::string TextualValue(const LunaToken *p_blame_token) const override;
};


#pragma mark -
#pragma mark LunaValue_Function
#pragma mark -

// A function value: a signature (built-in or user-defined) plus, for user-defined functions, the environment that
// was current when the declaration executed.  Calls create a child of that environment, not of the caller's.
class LunaValue_Function : public LunaValue
{
private:
	const LunaFunctionSignature_CSP signature_;
	const LunaSymbolTable_SP closure_;									// nullptr for built-in functions

public:
	LunaValue_Function(const LunaValue_Function &p_original) = delete;	// no copy-construct
	LunaValue_Function& operator=(const LunaValue_Function&) = delete;	// no copying
	LunaValue_Function(void) = delete;

	LunaValue_Function(LunaFunctionSignature_CSP p_signature, LunaSymbolTable_SP p_closure);
	virtual ~LunaValue_Function(void) override;

	inline const LunaFunctionSignature_CSP &Signature(void) const { return signature_; }
	inline const LunaSymbolTable_SP &Closure(void) const { return closure_; }

	virtual void Print(std::ostream &p_ostream) const override;
};


#pragma mark -
#pragma mark LunaValue_Multi
#pragma mark -

// The ordered results of a call or a return statement.  A multivalue never contains another multivalue; use
// PushValueFlattened() to splice one in.
class LunaValue_Multi : public LunaValue
{
private:
	std::vector<LunaValue_SP> values_;

public:
	LunaValue_Multi(const LunaValue_Multi &p_original) = delete;		// no copy-construct
	LunaValue_Multi& operator=(const LunaValue_Multi&) = delete;		// no copying

	LunaValue_Multi(void) : LunaValue(LunaValueType::kValueMulti) { }
	virtual ~LunaValue_Multi(void) override;

	inline int Count(void) const { return (int)values_.size(); }
	inline const std::vector<LunaValue_SP> &Values(void) const { return values_; }
	const LunaValue_SP &ValueAtIndex(int p_index) const;				// nil past the end

	// these are used only while a multivalue is being built, before it is shared
	void PushValue(const LunaValue_SP &p_value);						// a multivalue argument is collapsed
	void PushValueFlattened(const LunaValue_SP &p_value);				// a multivalue argument is expanded in place

	virtual void Print(std::ostream &p_ostream) const override;
};


#endif /* defined(__Luna__luna_value__) */
