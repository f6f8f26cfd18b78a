#include <tally/blockchain/ballot_record.hpp>
#include <tally/blockchain/chain_interface.hpp>

#include <fc/io/raw.hpp>

namespace tally { namespace blockchain {

ballot_id_type ballot_record::make_id( const poll_id_type& poll, const address& wallet )
{
    fc::sha512::encoder enc;
    fc::raw::pack( enc, string( TALLY_BALLOT_ADDRESS_SEED ) );
    fc::raw::pack( enc, poll );
    fc::raw::pack( enc, wallet );
    return fc::ripemd160::hash( enc.result() );
}

void ballot_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( has_voted );
    FC_ASSERT( wallet != address() );
    FC_ASSERT( db.lookup<poll_record>( poll ).valid() );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oballot_record ballot_record::lookup( const chain_interface& db, const ballot_id_type& id )
{ try {
    return db.ballot_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void ballot_record::store( chain_interface& db, const ballot_id_type& id, const ballot_record& record )
{ try {
    db.ballot_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

} } // tally::blockchain
