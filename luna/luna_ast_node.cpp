//
//  luna_ast_node.cpp
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


#include "luna_ast_node.h"


std::ostream &operator<<(std::ostream &p_outstream, const LunaNodeType p_node_type)
{
	switch (p_node_type)
	{
		case LunaNodeType::kNodeLiteral:				p_outstream << "literal";				break;
		case LunaNodeType::kNodeVariable:				p_outstream << "variable";				break;
		case LunaNodeType::kNodeUnary:					p_outstream << "unary";					break;
		case LunaNodeType::kNodeBinary:					p_outstream << "binary";				break;
		case LunaNodeType::kNodeLogical:				p_outstream << "logical";				break;
		case LunaNodeType::kNodeCall:					p_outstream << "call";					break;
		case LunaNodeType::kNodeExpressionStatement:	p_outstream << "expression statement";	break;
		case LunaNodeType::kNodeAssignment:				p_outstream << "assignment";			break;
		case LunaNodeType::kNodeReturn:					p_outstream << "return";				break;
		case LunaNodeType::kNodeFunctionDecl:			p_outstream << "function declaration";	break;
		case LunaNodeType::kNodeIf:						p_outstream << "if statement";			break;
		case LunaNodeType::kNodeBlock:					p_outstream << "block";					break;
	}

	return p_outstream;
}

LunaASTNode::~LunaASTNode(void)
{
	for (auto child : children_)
		delete child;
}

void LunaASTNode::AddChild(LunaASTNode *p_child_node)
{
	children_.emplace_back(p_child_node);
}

void LunaASTNode::CacheLiteralValue(void)
{
	switch (token_->token_type_)
	{
		case LunaTokenType::kTokenNumber:	cached_literal_value_ = LunaValue_SP(new LunaValue_Number(token_->number_literal_));	break;
		case LunaTokenType::kTokenString:	cached_literal_value_ = LunaValue_SP(new LunaValue_String(token_->string_literal_));	break;
		case LunaTokenType::kTokenTrue:		cached_literal_value_ = gStaticLunaValue_True;											break;
		case LunaTokenType::kTokenFalse:	cached_literal_value_ = gStaticLunaValue_False;											break;
		case LunaTokenType::kTokenNil:		cached_literal_value_ = gStaticLunaValueNil;											break;
		default:
			LUNA_TERMINATION << "ERROR (LunaASTNode::CacheLiteralValue): (internal error) token '" << *token_ << "' is not a literal." << LunaTerminate(LunaErrorKind::kUnknownConstruct);
	}
}

void LunaASTNode::PrintToken(std::ostream &p_outstream) const
{
	// We want to print some nodes differently from their tokens, for readability
	switch (node_type_)
	{
		case LunaNodeType::kNodeCall:					p_outstream << "CALL";				break;
		case LunaNodeType::kNodeExpressionStatement:	p_outstream << "EXPR_STATEMENT";	break;
		case LunaNodeType::kNodeBlock:					p_outstream << "BLOCK";				break;
		case LunaNodeType::kNodeUnary:
			if (token_->token_type_ == LunaTokenType::kTokenMinus)
				p_outstream << "NEGATE";
			else
				p_outstream << *token_;
			break;
		default:										p_outstream << *token_;				break;
	}
}

void LunaASTNode::PrintTreeWithIndent(std::ostream &p_outstream, int p_indent) const
{
	// If we are indented, start a new line and indent
	if (p_indent > 0)
	{
		p_outstream << "\n  ";

		for (int i = 0; i < p_indent - 1; ++i)
			p_outstream << "  ";
	}

	if (children_.size() == 0)
	{
		// Empty blocks get parentheses, so that an empty body is visible
		if (node_type_ == LunaNodeType::kNodeBlock)
		{
			p_outstream << "(";
			PrintToken(p_outstream);
			p_outstream << ")";
		}
		else
		{
			PrintToken(p_outstream);
		}
		return;
	}

	bool childWithChildren = false;

	for (auto child : children_)
	{
		if (child->children_.size() > 0)
		{
			childWithChildren = true;
			break;
		}
	}

	if (childWithChildren)
	{
		// Non-leaf children are printed on their own lines, with an incremented indent
		p_outstream << "(";
		PrintToken(p_outstream);

		for (auto child : children_)
			child->PrintTreeWithIndent(p_outstream, p_indent + 1);

		p_outstream << "\n";

		if (p_indent > 0)
		{
			p_outstream << "  ";

			for (int i = 0; i < p_indent - 1; ++i)
				p_outstream << "  ";
		}

		p_outstream << ")";
	}
	else
	{
		// Only leaves as children, so print everything on one line
		p_outstream << "(";
		PrintToken(p_outstream);

		for (auto child : children_)
		{
			p_outstream << " ";
			child->PrintToken(p_outstream);
		}

		p_outstream << ")";
	}
}
