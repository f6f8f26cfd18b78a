#pragma once

#include <stdint.h>

/** @file tally/blockchain/config.hpp
 *  @brief Defines global constants that determine chain behavior
 */
#define TALLY_BLOCKCHAIN_VERSION                            1
#define TALLY_BLOCKCHAIN_DATABASE_VERSION                   1

/**
 *  The address prepended to string representation of
 *  addresses.
 *
 *  Changing these parameters will change every derived record address.
 */
#define TALLY_ADDRESS_PREFIX                                "TLY"
#define TALLY_BLOCKCHAIN_NAME                               "Tally"
#define TALLY_BLOCKCHAIN_DESCRIPTION                        "Tally poll chain"

#define TALLY_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC     (60*60*24*2)
#define TALLY_BLOCKCHAIN_DEFAULT_TRANSACTION_EXPIRATION_SEC (60*60)
#define TALLY_BLOCKCHAIN_MAX_TRANSACTION_SIZE               (1024*4) // bytes

/**
 *  Poll configuration bounds, checked when a poll is created.
 */
#define TALLY_POLL_MIN_CANDIDATES                           2
#define TALLY_POLL_MAX_CANDIDATES                           8
#define TALLY_POLL_MAX_TITLE_LENGTH                         64 // bytes
#define TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH                32 // bytes

/**
 *  Seeds mixed into the derived record addresses so that a poll and a ballot can
 *  never share an id.
 */
#define TALLY_POLL_ADDRESS_SEED                             "poll"
#define TALLY_BALLOT_ADDRESS_SEED                           "ballot"

/**
 *  Maximum packed size of a poll record:
 *     authority (20)
 *   + title (1 + 64)
 *   + candidates (1 + 8 * (1 + 32))
 *   + votes (1 + 8 * 8)
 *   + start_ts, end_ts (8 + 8)
 *
 *  Length prefixes are single byte varints since no length exceeds 127.
 */
#define TALLY_ADDRESS_PACKED_SIZE                           20
#define TALLY_POLL_RECORD_MAX_SIZE                          ( TALLY_ADDRESS_PACKED_SIZE \
                                                            + 1 + TALLY_POLL_MAX_TITLE_LENGTH \
                                                            + 1 + TALLY_POLL_MAX_CANDIDATES * (1 + TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH) \
                                                            + 1 + TALLY_POLL_MAX_CANDIDATES * 8 \
                                                            + 8 + 8 )

/**
 *  poll id (20) + wallet (20) + has_voted (1)
 *
 *  Record ids are plain hashes with no bump seed to remember, so neither record
 *  carries a derivation tag byte.
 */
#define TALLY_BALLOT_RECORD_SIZE                            ( TALLY_ADDRESS_PACKED_SIZE * 2 + 1 )
