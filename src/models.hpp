#pragma once

#include <string>

namespace models {
  enum TRANSFER_OUTCOME: const unsigned char {
    SUCCESS,
    SELF_TRANSFER,
    INVALID_CARD_NUMBER,
    UNKNOWN_RECIPIENT,
    INVALID_AMOUNT,
    INSUFFICIENT_FUNDS
  };

  struct Credentials {
    std::string
      number;
    std::string
      pin;
  };
}
