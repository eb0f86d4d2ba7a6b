#pragma once 

#include <iostream>
#include <string>
#include <string_view>

#include "fmt/format.h"

#include "syntax_node.hpp"


void print_tree_elt(std::ostream& out, const std::string_view elt_title, const std::string_view elt_value, const int level, const std::string lead = " ");

/**
 * @brief Print the tree under @p node, one line per node. Leaves show their
 * text, nodes holding a syntax error are flagged.
 */
void print_pascal_cst(std::ostream& out, const dfixxer::pascal::SyntaxNode* node, std::string_view source, int level = 0);
