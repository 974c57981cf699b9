#pragma once
#include <string>

/// Local wall-clock time as HH:MM:SS.
std::string getCurrentTimeAsString();
