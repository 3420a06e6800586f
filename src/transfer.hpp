#pragma once

#include <expected>
#include <string_view>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace transfer {

// Recipient checks in order: self-transfer, checksum, existence.
// Returns SUCCESS when the destination may receive funds from source.
std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
checkRecipient(const database::Store &store, std::string_view source, std::string_view destination);

// Runs the recipient checks, the amount checks, the debit and the credit in
// one BEGIN IMMEDIATE transaction. Rejections are returned as outcomes and
// never touch a balance; a failing debit or credit rolls everything back.
std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
execute(const database::Store &store, std::string_view source,
        std::string_view destination, long long amount);
}
