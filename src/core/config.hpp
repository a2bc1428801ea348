#pragma once
#include "common.hpp"

// Built-in defaults, overridden by --config <file>, overridden by flags.
// Positional arguments are returned under "command".
json getConfig(int argc, char** argv);
json defaultConfig();
