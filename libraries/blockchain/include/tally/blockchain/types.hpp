#pragma once

#include <tally/blockchain/address.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/crypto/sha512.hpp>
#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fc
{
    class path;
}

namespace tally { namespace blockchain {

    typedef fc::ripemd160               transaction_id_type;
    typedef fc::ripemd160               poll_id_type;
    typedef fc::ripemd160               ballot_id_type;
    typedef fc::sha256                  digest_type;
    typedef fc::ecc::compact_signature  signature_type;
    typedef fc::ecc::private_key        private_key_type;
    typedef uint64_t                    vote_count_type;

    using std::string;
    using std::function;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;
    using std::map;
    using std::unordered_map;
    using std::set;
    using std::unordered_set;
    using std::vector;
    using std::pair;
    using fc::path;
    using fc::sha512;
    using fc::sha256;
    using std::unique_ptr;
    using std::shared_ptr;
    using fc::time_point_sec;
    using fc::time_point;
    using fc::microseconds;
    using fc::unsigned_int;
    using fc::signed_int;

} } // tally::blockchain
