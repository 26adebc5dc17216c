/**
 * Name: Lexer headers umbrella
 * Purpose: Provide a stable include that aggregates single-declaration headers.
 * Note: Each header under include/lexer contains exactly one declaration.
 */
#pragma once

#include "lexer/LogicalLine.h"
#include "lexer/InputSource.h"
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include "lexer/Tokenizer.h"
