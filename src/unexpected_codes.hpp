#pragma once

enum class UNEXPECTED_CODE {
  NOT_FOUND,
  AUTHENTICATION_FAILED,
  INVALID_AMOUNT,
  BALANCE_OVERFLOW,
  SESSION_CLOSED,
  STORAGE_UNAVAILABLE,
  INVALID_CONFIG,
  UNKNOWN
};

const char *describe(UNEXPECTED_CODE code);
