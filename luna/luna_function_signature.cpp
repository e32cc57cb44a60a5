//
//  luna_function_signature.cpp
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


#include "luna_function_signature.h"
#include "luna_script.h"


LunaFunctionSignature::LunaFunctionSignature(const std::string &p_call_name, LunaInternalFunctionPtr p_function_ptr) :
	call_name_(p_call_name), internal_function_(p_function_ptr)
{
}

LunaFunctionSignature::LunaFunctionSignature(const std::string &p_call_name, const std::vector<std::string> &p_param_names, const LunaASTNode *p_body_node, std::shared_ptr<const LunaScript> p_body_script) :
	call_name_(p_call_name), param_names_(p_param_names), body_node_(p_body_node), body_script_(std::move(p_body_script))
{
}

LunaFunctionSignature *LunaFunctionSignature::AddParam(const std::string &p_param_name)
{
	if (has_ellipsis_)
		LUNA_TERMINATION << "ERROR (LunaFunctionSignature::AddParam): (internal error) parameter added after an ellipsis." << LunaTerminate(LunaErrorKind::kUnknownConstruct);

	param_names_.emplace_back(p_param_name);
	return this;
}

LunaFunctionSignature *LunaFunctionSignature::AddEllipsis(void)
{
	has_ellipsis_ = true;
	return this;
}

void LunaFunctionSignature::CheckArgumentCount(size_t p_argument_count) const
{
	if (has_ellipsis_)
	{
		if (p_argument_count < param_names_.size())
			LUNA_TERMINATION << "ERROR (LunaFunctionSignature::CheckArgumentCount): function " << call_name_ << "() requires at least " << param_names_.size() << " argument(s), but " << p_argument_count << " are supplied." << LunaTerminate(LunaErrorKind::kArityMismatch);
	}
	else if (p_argument_count != param_names_.size())
	{
		LUNA_TERMINATION << "ERROR (LunaFunctionSignature::CheckArgumentCount): function " << call_name_ << "() requires " << param_names_.size() << " argument(s), but " << p_argument_count << " are supplied." << LunaTerminate(LunaErrorKind::kArityMismatch);
	}
}

std::ostream &operator<<(std::ostream &p_outstream, const LunaFunctionSignature &p_signature)
{
	p_outstream << p_signature.call_name_ << "(";

	for (size_t param_index = 0; param_index < p_signature.param_names_.size(); ++param_index)
	{
		if (param_index > 0)
			p_outstream << ", ";

		p_outstream << p_signature.param_names_[param_index];
	}

	if (p_signature.has_ellipsis_)
		p_outstream << (p_signature.param_names_.size() ? ", ..." : "...");

	p_outstream << ")";

	return p_outstream;
}
