#include <tally/blockchain/chain_interface.hpp>
#include <tally/blockchain/poll_record.hpp>

#include <fc/io/raw.hpp>

#include <algorithm>

namespace tally { namespace blockchain {

poll_id_type poll_record::make_id( const address& authority, const string& title )
{
    fc::sha512::encoder enc;
    fc::raw::pack( enc, string( TALLY_POLL_ADDRESS_SEED ) );
    fc::raw::pack( enc, authority );
    fc::raw::pack( enc, title );
    return fc::ripemd160::hash( enc.result() );
}

poll_phase poll_record::phase_at( const time_point_sec now )const
{
    const int64_t now_ts = now.sec_since_epoch();
    if( now_ts < start_ts ) return poll_phase::not_started;
    if( now_ts > end_ts ) return poll_phase::closed;
    return poll_phase::open;
}

vote_count_type poll_record::total_votes()const
{
    vote_count_type total = 0;
    for( const vote_count_type count : votes )
        total += count;
    return total;
}

vector<uint8_t> poll_record::leaders()const
{
    vector<uint8_t> result;
    if( votes.empty() ) return result;

    const vote_count_type best = *std::max_element( votes.begin(), votes.end() );
    if( best == 0 ) return result;

    for( size_t i = 0; i < votes.size(); ++i )
    {
        if( votes[ i ] == best )
            result.push_back( static_cast<uint8_t>( i ) );
    }
    return result;
}

void poll_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( authority != address() );
    FC_ASSERT( candidates.size() >= TALLY_POLL_MIN_CANDIDATES );
    FC_ASSERT( candidates.size() <= TALLY_POLL_MAX_CANDIDATES );
    FC_ASSERT( votes.size() == candidates.size() );
    FC_ASSERT( title.size() <= TALLY_POLL_MAX_TITLE_LENGTH );
    FC_ASSERT( start_ts < end_ts );
    for( const string& name : candidates )
    {
        FC_ASSERT( !name.empty() );
        FC_ASSERT( name.size() <= TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH, "", ("name",name) );
    }
} FC_CAPTURE_AND_RETHROW( (*this) ) }

opoll_record poll_record::lookup( const chain_interface& db, const poll_id_type& id )
{ try {
    return db.poll_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void poll_record::store( chain_interface& db, const poll_id_type& id, const poll_record& record )
{ try {
    db.poll_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

} } // tally::blockchain
