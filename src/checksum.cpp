#include "checksum.hpp"

namespace checksum {

namespace {

int weighted(int digit, bool doubled) {
  if(!doubled) {
    return digit;
  }

  auto value = digit * 2;
  return value > 9 ? value - 9 : value;
}

}

bool isValid(std::string_view number) {
  if(number.empty()) {
    return false;
  }

  int sum = 0;

  for(std::size_t i = 0; i < number.size(); ++i) {
    const char c = number[i];

    if(c < '0' || c > '9') {
      return false;
    }

    // i is 0-based, so even i is an odd position
    sum += weighted(c - '0', i % 2 == 0);
  }

  return sum % 10 == 0;
}
}
