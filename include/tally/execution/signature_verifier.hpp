#pragma once

#include <tally/schema/primitives.hpp>
#include <functional>

namespace tally::execution {

using signature_verifier_t =
    std::function<bool(const tally::schema::bytes_view_t& message,
                       const tally::schema::signer_id_t& signer,
                       const tally::schema::signature_t& signature)>;

}  // namespace tally::execution
