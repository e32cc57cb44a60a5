//
//  luna_ast_node.h
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

 The AST for one logical line is a tree of LunaASTNode objects.  Each node has a node type, which selects the
 statement or expression it represents, and a token, which is the source token that best identifies it (the
 operator for binary expressions, the keyword for statements, and so forth).  The shape of each node type:

	kNodeLiteral				no children; cached_literal_value_ holds the value
	kNodeVariable				no children; the token is the identifier
	kNodeUnary					one child, the operand; the token is "not" or "-"
	kNodeBinary					two children, left and right; the token is the operator
	kNodeLogical				two children, left and right; the token is "and" or "or"
	kNodeCall					the callee (a kNodeVariable), then zero or more argument expressions; the token is "("
	kNodeExpressionStatement	one child, the expression
	kNodeAssignment				one or more kNodeVariable targets, then the value expression; the token is "="
	kNodeReturn					zero or more value expressions; the token is "return"
	kNodeFunctionDecl			the name (a kNodeVariable), a parameter kNodeBlock of kNodeVariables, a body kNodeBlock
	kNodeIf						the condition, a then kNodeBlock, and optionally an else kNodeBlock
	kNodeBlock					zero or more statements (or parameter names, in a function declaration)

 */

#ifndef __Luna__luna_ast_node__
#define __Luna__luna_ast_node__

#include <vector>
#include <ostream>

#include "luna_token.h"
#include "luna_value.h"


enum class LunaNodeType : uint8_t {
	kNodeLiteral = 0,
	kNodeVariable,
	kNodeUnary,
	kNodeBinary,
	kNodeLogical,
	kNodeCall,
	kNodeExpressionStatement,
	kNodeAssignment,
	kNodeReturn,
	kNodeFunctionDecl,
	kNodeIf,
	kNodeBlock
};

std::ostream &operator<<(std::ostream &p_outstream, const LunaNodeType p_node_type);


// A class representing a node in a parse tree for a logical line
class LunaASTNode
{
	//	This class has its copy constructor and assignment operator disabled, to prevent accidental copying.

public:

	const LunaNodeType node_type_;										// the kind of statement or expression this node represents
	const LunaToken *token_;											// not owned (owned by the LunaScript's token stream)
	std::vector<LunaASTNode *> children_;								// OWNED POINTERS

	LunaValue_SP cached_literal_value_;									// the value of a kNodeLiteral, cached at parse time

	LunaASTNode(const LunaASTNode&) = delete;							// no copying
	LunaASTNode& operator=(const LunaASTNode&) = delete;				// no copying
	LunaASTNode(void) = delete;											// no null construction

	inline LunaASTNode(LunaNodeType p_node_type, const LunaToken *p_token) : node_type_(p_node_type), token_(p_token) { }
	inline LunaASTNode(LunaNodeType p_node_type, const LunaToken *p_token, LunaASTNode *p_child_node) : node_type_(p_node_type), token_(p_token)
	{
		this->AddChild(p_child_node);
	}

	~LunaASTNode(void);													// destructor

	void AddChild(LunaASTNode *p_child_node);							// takes ownership of the passed node

	void CacheLiteralValue(void);										// make cached_literal_value_ from the token; literal nodes only

	void PrintToken(std::ostream &p_outstream) const;
	void PrintTreeWithIndent(std::ostream &p_outstream, int p_indent) const;
};


#endif /* defined(__Luna__luna_ast_node__) */
