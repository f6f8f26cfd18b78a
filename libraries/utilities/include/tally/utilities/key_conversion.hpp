#pragma once

#include <string>
#include <fc/crypto/elliptic.hpp>
#include <fc/optional.hpp>

namespace tally { namespace utilities {

std::string                        key_to_wif(const fc::ecc::private_key& key);
fc::optional<fc::ecc::private_key> wif_to_key( const std::string& wif_key );

/** deterministic key derived from sha256( seed ) */
fc::ecc::private_key               key_from_seed( const std::string& seed );

} } // end namespace tally::utilities
