#pragma once
#include "element.hpp"
#include "layout.hpp"
#include "lexer.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace bitwise {

void printTokens(std::ostream& out, const std::vector<Token>& tokens);

// One row per node: byte offset, bit offset, width in bits, type, name.
void printLayout(std::ostream& out, const ResolvedLayout& layout);

// Current value of a single element, e.g. 0x1F (31), "ABC", [1, 0, 1].
std::string formatValue(const Element& element);

// Every field below element, one per line, nested by indentation.
void printValues(std::ostream& out, const Element& element);

} // namespace bitwise
