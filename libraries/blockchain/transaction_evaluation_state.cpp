#include <tally/blockchain/exceptions.hpp>
#include <tally/blockchain/operation_factory.hpp>
#include <tally/blockchain/pending_chain_state.hpp>
#include <tally/blockchain/transaction_evaluation_state.hpp>

namespace tally { namespace blockchain {

   bool transaction_evaluation_state::check_signature( const address& a )const
   { try {
      return signed_addresses.find( a ) != signed_addresses.end();
   } FC_CAPTURE_AND_RETHROW( (a) ) }

   void transaction_evaluation_state::evaluate( const signed_transaction& trx_arg )
   { try {
      trx = trx_arg;
      try {
        if( trx_arg.operations.empty() )
           FC_CAPTURE_AND_THROW( empty_transaction, (trx_arg) );

        const size_t trx_size = trx_arg.data_size();
        if( trx_size > TALLY_BLOCKCHAIN_MAX_TRANSACTION_SIZE )
           FC_CAPTURE_AND_THROW( oversized_transaction, (trx_size) );

        if( pending_state()->now() > trx_arg.expiration )
        {
           const auto expired_by_sec = (pending_state()->now() - trx_arg.expiration).to_seconds();
           FC_CAPTURE_AND_THROW( expired_transaction, (trx_arg)(pending_state()->now())(expired_by_sec) );
        }
        if( (pending_state()->now() + TALLY_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC) < trx_arg.expiration )
           FC_CAPTURE_AND_THROW( invalid_transaction_expiration, (trx_arg)(pending_state()->now()) );

        if( pending_state()->is_known_transaction( trx_arg ) )
           FC_CAPTURE_AND_THROW( duplicate_transaction, (trx.id()) );

        const auto trx_digest = trx_arg.digest( pending_state()->get_chain_id() );
        for( const auto& sig : trx_arg.signatures )
           signed_addresses.insert( address( fc::ecc::public_key( sig, trx_digest, false ) ) );

        _current_op_index = 0;
        for( const auto& op : trx_arg.operations )
        {
           evaluate_operation( op );
           ++_current_op_index;
        }

        pending_state()->store_transaction( trx.id(), transaction_record( *this ) );
      }
      catch ( const fc::exception& e )
      {
         validation_error = e;
         throw;
      }
   } FC_CAPTURE_AND_RETHROW( (trx_arg) ) }

   void transaction_evaluation_state::evaluate_operation( const operation& op )
   { try {
      operation_factory::instance().evaluate( *this, op );
   } FC_CAPTURE_AND_RETHROW( (op)(_current_op_index) ) }

} } // tally::blockchain
