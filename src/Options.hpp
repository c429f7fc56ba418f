#pragma once
#include "App.hpp"
#include <ostream>

enum class ParseResult { Run, Help, Error };

void usage(std::ostream& os, const char* prog);

// Fills cfg from the command line. Help and usage text go to out/err.
// Numbers must be plain decimal digits; anything else is an Error.
ParseResult parseOptions(int argc, char** argv, AppConfig& cfg, std::ostream& out, std::ostream& err);
