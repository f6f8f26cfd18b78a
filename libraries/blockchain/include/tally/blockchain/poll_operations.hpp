#pragma once

#include <tally/blockchain/operations.hpp>
#include <tally/blockchain/types.hpp>

namespace tally { namespace blockchain {

/**
 *  Opens a new poll owned by the signing authority.  The poll lives at an
 *  address derived from ( authority, title ) so a second poll with the same
 *  title from the same authority is rejected.
 */
struct create_poll_operation
{
    static const operation_type_enum type;

    create_poll_operation(){}
    create_poll_operation( const address& authority, const string& title,
                           const vector<string>& candidates,
                           int64_t start_ts, int64_t end_ts )
    :authority(authority),title(title),candidates(candidates),start_ts(start_ts),end_ts(end_ts){}

    address         authority;
    string          title;
    vector<string>  candidates;
    int64_t         start_ts = 0;
    int64_t         end_ts = 0;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/**
 *  Records one vote from the signing voter.  The ballot marker at
 *  ( poll_id, voter ) may only ever be allocated once.
 */
struct cast_vote_operation
{
    static const operation_type_enum type;

    cast_vote_operation(){}
    cast_vote_operation( const poll_id_type& poll_id, const address& voter, uint8_t candidate_idx,
                         const optional<address>& poll_authority = optional<address>() )
    :poll_id(poll_id),voter(voter),candidate_idx(candidate_idx),poll_authority(poll_authority){}

    poll_id_type        poll_id;
    address             voter;
    uint8_t             candidate_idx = 0;
    /** checked against the stored authority when present */
    optional<address>   poll_authority;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

} } // tally::blockchain

FC_REFLECT( tally::blockchain::create_poll_operation, (authority)(title)(candidates)(start_ts)(end_ts) )
FC_REFLECT( tally::blockchain::cast_vote_operation, (poll_id)(voter)(candidate_idx)(poll_authority) )
