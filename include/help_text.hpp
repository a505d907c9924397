#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <iostream>

/**
 * @brief Print usage and the option table grouped by category.
 */
void print_help(const char* prog, std::ostream& os = std::cout);

#endif // HELP_TEXT_HPP
