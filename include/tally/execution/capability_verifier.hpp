#pragma once

#include <tally/schema/capability.hpp>
#include <tally/schema/primitives.hpp>
#include <functional>

namespace tally::execution {

/// Answers whether `signer` currently holds `capability`.
///
/// The engine consults this before every privileged operation. The default
/// implementation reads the capability roster from committed-plus-pending
/// state; hosts may install their own to delegate to an external issuer.
using capability_verifier_t =
    std::function<bool(const tally::schema::signer_id_t& signer,
                       tally::schema::capability_t capability)>;

}  // namespace tally::execution
