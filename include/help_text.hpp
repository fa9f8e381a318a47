#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <iosfwd>

/** Print the command line help text. */
void print_help(const char* prog, std::ostream& os);

/** Print the command line help text to stdout. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
