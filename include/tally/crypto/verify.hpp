#pragma once

#include <tally/schema/primitives.hpp>

namespace tally::crypto {

/// True when the linked OpenSSL provides ed25519.
bool available();

bool verify_signature(const tally::schema::bytes_view_t& message,
                      const tally::schema::signer_id_t& signer,
                      const tally::schema::signature_t& signature);

}  // namespace tally::crypto
