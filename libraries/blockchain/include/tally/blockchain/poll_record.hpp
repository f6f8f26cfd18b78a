#pragma once

#include <tally/blockchain/types.hpp>

namespace tally { namespace blockchain {

enum class poll_phase : uint8_t
{
    not_started = 0,
    open        = 1,
    closed      = 2
};

struct poll_record;
typedef optional<poll_record> opoll_record;

class chain_interface;
struct poll_record
{
    static const uint32_t   max_packed_size = TALLY_POLL_RECORD_MAX_SIZE;

    address                 authority;
    string                  title;
    vector<string>          candidates;
    vector<vote_count_type> votes;
    int64_t                 start_ts = 0;
    int64_t                 end_ts = 0;

    /** ripemd160( sha512( seed | authority | title ) ) */
    static poll_id_type make_id( const address& authority, const string& title );
    poll_id_type id()const { return make_id( authority, title ); }

    /** the phase is a function of time and is never stored */
    poll_phase phase_at( const time_point_sec now )const;

    vote_count_type total_votes()const;

    /** indexes of every candidate holding the maximum tally, empty when nobody has voted */
    vector<uint8_t> leaders()const;

    void sanity_check( const chain_interface& )const;
    static opoll_record lookup( const chain_interface&, const poll_id_type& );
    static void store( chain_interface&, const poll_id_type&, const poll_record& );
};

class poll_db_interface
{
    friend struct poll_record;

    virtual opoll_record poll_lookup_by_id( const poll_id_type& )const = 0;
    virtual void poll_insert_into_id_map( const poll_id_type&, const poll_record& ) = 0;
};

} } // tally::blockchain

FC_REFLECT_ENUM( tally::blockchain::poll_phase, (not_started)(open)(closed) )
FC_REFLECT( tally::blockchain::poll_record,
            (authority)
            (title)
            (candidates)
            (votes)
            (start_ts)
            (end_ts)
            )
