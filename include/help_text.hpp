#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

void print_help(const char* prog);

#endif // HELP_TEXT_HPP
