#pragma once

#include <tally/blockchain/types.hpp>

namespace tally { namespace blockchain {

struct ballot_record;
typedef optional<ballot_record> oballot_record;

class chain_interface;
struct ballot_record
{
    static const uint32_t max_packed_size = TALLY_BALLOT_RECORD_SIZE;

    ballot_record(){}
    ballot_record( const poll_id_type& p, const address& w )
    :poll(p),wallet(w),has_voted(true){}

    poll_id_type    poll;
    address         wallet;
    bool            has_voted = false;

    /** ripemd160( sha512( seed | poll | wallet ) ) */
    static ballot_id_type make_id( const poll_id_type& poll, const address& wallet );
    ballot_id_type id()const { return make_id( poll, wallet ); }

    void sanity_check( const chain_interface& )const;
    static oballot_record lookup( const chain_interface&, const ballot_id_type& );
    static void store( chain_interface&, const ballot_id_type&, const ballot_record& );
};

class ballot_db_interface
{
    friend struct ballot_record;

    virtual oballot_record ballot_lookup_by_id( const ballot_id_type& )const = 0;
    virtual void ballot_insert_into_id_map( const ballot_id_type&, const ballot_record& ) = 0;
};

} } // tally::blockchain

FC_REFLECT( tally::blockchain::ballot_record, (poll)(wallet)(has_voted) )
