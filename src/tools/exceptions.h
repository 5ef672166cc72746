#pragma once

#include <exception>
#include <string>

// Returns the message of the exception, followed by the messages of all nested exceptions.
std::string getMessage(const std::exception& e);
