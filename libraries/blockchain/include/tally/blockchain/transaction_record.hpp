#pragma once

#include <tally/blockchain/time.hpp>
#include <tally/blockchain/transaction_evaluation_state.hpp>

namespace tally { namespace blockchain {

    struct transaction_record;
    typedef optional<transaction_record> otransaction_record;

    class chain_interface;

    /** the evaluated form of a committed transaction, kept for lookup and replay detection */
    struct transaction_record : public transaction_evaluation_state
    {
       transaction_record(){}

       explicit transaction_record( const transaction_evaluation_state& s )
       :transaction_evaluation_state(s),applied(tally::blockchain::now()){}

       /** local time at which the transaction was committed */
       time_point_sec applied;

       void sanity_check( const chain_interface& )const;
       static otransaction_record lookup( const chain_interface& db, const transaction_id_type& );
       static void store( chain_interface& db, const transaction_id_type&, const transaction_record& );
    };

    class transaction_db_interface
    {
       friend struct transaction_record;

       virtual otransaction_record transaction_lookup_by_id( const transaction_id_type& )const = 0;

       virtual void transaction_insert_into_id_map( const transaction_id_type&, const transaction_record& ) = 0;
       virtual void transaction_insert_into_unique_set( const transaction& ) = 0;
    };

} } // tally::blockchain

FC_REFLECT_DERIVED( tally::blockchain::transaction_record,
        (tally::blockchain::transaction_evaluation_state),
        (applied)
        )
