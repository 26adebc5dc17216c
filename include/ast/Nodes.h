/**
 * @file
 * @brief Umbrella include for all AST node types.
 */
#pragma once

#include "ast/Node.h"
#include "ast/NodeKind.h"
#include "ast/Root.h"
#include "ast/RuleNode.h"
#include "ast/AttributeNode.h"
#include "ast/CommentNode.h"
#include "ast/DirectiveNode.h"
#include "ast/VariableNode.h"
#include "ast/MixinDefNode.h"
#include "ast/MixinNode.h"
#include "ast/IfNode.h"
#include "ast/WhileNode.h"
#include "ast/ForNode.h"
#include "ast/DebugNode.h"
#include "ast/FileNode.h"
#include "ast/CssImportNode.h"
