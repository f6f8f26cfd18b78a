#pragma once

#include <tally/blockchain/transaction.hpp>
#include <tally/blockchain/types.hpp>

namespace tally { namespace blockchain {

class pending_chain_state;
typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

/**
*  While evaluating a transaction the signer set and the
*  pending state it writes into must be tracked.  Operations
*  only ever see the pending state, so nothing they do becomes
*  visible until the whole transaction has been evaluated and
*  the pending state is applied to its parent.
*/
struct transaction_evaluation_state
{
    transaction_evaluation_state( pending_chain_state_ptr pending_state = nullptr ) : _pending_state( pending_state ) {}

    pending_chain_state* pending_state()const
    {
        const pending_chain_state_ptr ptr = _pending_state.lock();
        FC_ASSERT( ptr );
        return ptr.get();
    }

    void evaluate( const signed_transaction& trx );
    void evaluate_operation( const operation& op );

    bool check_signature( const address& a )const;

    signed_transaction                             trx;
    set<address>                                   signed_addresses;

    optional<fc::exception>                        validation_error;

private:
    std::weak_ptr<pending_chain_state>             _pending_state;
    uint32_t                                       _current_op_index = 0;
};
typedef shared_ptr<transaction_evaluation_state> transaction_evaluation_state_ptr;

} } // tally::blockchain

FC_REFLECT( tally::blockchain::transaction_evaluation_state,
            (trx)
            (signed_addresses)
            (validation_error)
            )
