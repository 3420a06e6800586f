#pragma once

#include <string_view>

namespace checksum {

// Luhn check, positions counted from 1 on the left: odd positions are
// doubled (minus 9 when above 9) and the digit sum must be a multiple of 10.
// Empty input or any non-digit character is invalid.
bool isValid(std::string_view number);
}
