#include <tally/blockchain/exceptions.hpp>
#include <tally/blockchain/pending_chain_state.hpp>
#include <tally/blockchain/poll_operations.hpp>

#include <limits>

namespace tally { namespace blockchain {

void create_poll_operation::evaluate( transaction_evaluation_state& eval_state )const
{ try {
    if( NOT eval_state.check_signature( this->authority ) )
        FC_CAPTURE_AND_THROW( missing_signature, (authority) );

    if( this->candidates.size() < TALLY_POLL_MIN_CANDIDATES )
        FC_CAPTURE_AND_THROW( not_enough_candidates, (candidates.size()) );

    if( this->candidates.size() > TALLY_POLL_MAX_CANDIDATES )
        FC_CAPTURE_AND_THROW( too_many_candidates, (candidates.size()) );

    if( this->title.size() > TALLY_POLL_MAX_TITLE_LENGTH )
        FC_CAPTURE_AND_THROW( title_too_long, (title.size()) );

    if( this->start_ts >= this->end_ts )
        FC_CAPTURE_AND_THROW( bad_schedule, (start_ts)(end_ts) );

    for( const string& name : this->candidates )
    {
        if( name.empty() )
            FC_CAPTURE_AND_THROW( empty_candidate_name, (candidates) );

        if( name.size() > TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH )
            FC_CAPTURE_AND_THROW( candidate_name_too_long, (name)(name.size()) );
    }

    poll_record record;
    record.authority = this->authority;
    record.title = this->title;
    record.candidates = this->candidates;
    record.votes.resize( this->candidates.size(), 0 );
    record.start_ts = this->start_ts;
    record.end_ts = this->end_ts;

    const poll_id_type poll_id = record.id();
    eval_state.pending_state()->allocate( poll_id, record );

    dlog( "created poll ${id} '${title}' with ${n} candidates", ("id",poll_id)("title",title)("n",candidates.size()) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void cast_vote_operation::evaluate( transaction_evaluation_state& eval_state )const
{ try {
    if( NOT eval_state.check_signature( this->voter ) )
        FC_CAPTURE_AND_THROW( missing_signature, (voter) );

    opoll_record poll = eval_state.pending_state()->get_poll_record( this->poll_id );
    if( NOT poll.valid() )
        FC_CAPTURE_AND_THROW( unknown_poll, (poll_id) );

    if( this->poll_authority.valid() && *this->poll_authority != poll->authority )
        FC_CAPTURE_AND_THROW( authority_mismatch, (poll_authority)(poll->authority) );

    const int64_t now = eval_state.pending_state()->now().sec_since_epoch();
    if( now < poll->start_ts )
        FC_CAPTURE_AND_THROW( too_early, (now)(poll->start_ts) );

    if( now > poll->end_ts )
        FC_CAPTURE_AND_THROW( poll_closed, (now)(poll->end_ts) );

    if( this->candidate_idx >= poll->candidates.size() )
        FC_CAPTURE_AND_THROW( bad_candidate, (candidate_idx)(poll->candidates.size()) );

    // the new tally is computed before anything is written
    const vote_count_type current = poll->votes.at( this->candidate_idx );
    if( current == std::numeric_limits<vote_count_type>::max() )
        FC_CAPTURE_AND_THROW( addition_overflow, (poll_id)(candidate_idx)(current) );

    const ballot_record ballot( this->poll_id, this->voter );
    eval_state.pending_state()->allocate( ballot.id(), ballot );

    poll->votes[ this->candidate_idx ] = current + 1;
    eval_state.pending_state()->store_poll_record( *poll );

    dlog( "vote for candidate ${c} of poll ${id}", ("c",candidate_idx)("id",poll_id) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // tally::blockchain
