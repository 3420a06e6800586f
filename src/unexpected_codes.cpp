#include "unexpected_codes.hpp"

const char *describe(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::NOT_FOUND:
      return "card not found";
    case UNEXPECTED_CODE::AUTHENTICATION_FAILED:
      return "wrong card number or PIN";
    case UNEXPECTED_CODE::INVALID_AMOUNT:
      return "amount must be positive";
    case UNEXPECTED_CODE::BALANCE_OVERFLOW:
      return "balance would overflow";
    case UNEXPECTED_CODE::SESSION_CLOSED:
      return "session is no longer active";
    case UNEXPECTED_CODE::STORAGE_UNAVAILABLE:
      return "storage unavailable";
    case UNEXPECTED_CODE::INVALID_CONFIG:
      return "invalid configuration";
    case UNEXPECTED_CODE::UNKNOWN:
      break;
  }

  return "unknown storage error";
}
