#pragma once

#include <string>

#include "parse-tree.h"

// Parses the text of a .beam script. Throws ParseError on malformed input.
ScriptDocument parseScript(const std::string& text);
