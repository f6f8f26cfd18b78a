#include <tally/blockchain/exceptions.hpp>
#include <tally/blockchain/pending_chain_state.hpp>
#include <tally/blockchain/time.hpp>

namespace tally { namespace blockchain {

   pending_chain_state::pending_chain_state( chain_interface_ptr prev_state )
   : _prev_state( prev_state )
   {
   }

   fc::time_point_sec pending_chain_state::now()const
   {
      const chain_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return blockchain::now();
      return prev_state->now();
   }

   digest_type pending_chain_state::get_chain_id()const
   {
      const chain_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return digest_type();
      return prev_state->get_chain_id();
   }

   void pending_chain_state::apply_changes()const
   {
      chain_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return;

      apply_records( prev_state, _poll_id_to_record );
      apply_records( prev_state, _ballot_id_to_record );
      apply_records( prev_state, _transaction_id_to_record );
   }

   otransaction_record pending_chain_state::get_transaction( const transaction_id_type& trx_id )const
   {
       return lookup<transaction_record>( trx_id );
   }

   bool pending_chain_state::is_known_transaction( const transaction& trx )const
   { try {
       if( _transaction_digests.count( trx.digest( get_chain_id() ) ) > 0 ) return true;
       chain_interface_ptr prev_state = _prev_state.lock();
       if( prev_state ) return prev_state->is_known_transaction( trx );
       return false;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   void pending_chain_state::store_transaction( const transaction_id_type& id, const transaction_record& rec )
   {
       store( id, rec );
   }

   opoll_record pending_chain_state::poll_lookup_by_id( const poll_id_type& id )const
   {
       const auto iter = _poll_id_to_record.find( id );
       if( iter != _poll_id_to_record.end() ) return iter->second;
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return opoll_record();
       return prev_state->lookup<poll_record>( id );
   }

   void pending_chain_state::poll_insert_into_id_map( const poll_id_type& id, const poll_record& record )
   {
       _poll_id_to_record[ id ] = record;
   }

   oballot_record pending_chain_state::ballot_lookup_by_id( const ballot_id_type& id )const
   {
       const auto iter = _ballot_id_to_record.find( id );
       if( iter != _ballot_id_to_record.end() ) return iter->second;
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oballot_record();
       return prev_state->lookup<ballot_record>( id );
   }

   void pending_chain_state::ballot_insert_into_id_map( const ballot_id_type& id, const ballot_record& record )
   {
       _ballot_id_to_record[ id ] = record;
   }

   otransaction_record pending_chain_state::transaction_lookup_by_id( const transaction_id_type& id )const
   {
       const auto iter = _transaction_id_to_record.find( id );
       if( iter != _transaction_id_to_record.end() ) return iter->second;
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return otransaction_record();
       return prev_state->lookup<transaction_record>( id );
   }

   void pending_chain_state::transaction_insert_into_id_map( const transaction_id_type& id, const transaction_record& record )
   {
       _transaction_id_to_record[ id ] = record;
   }

   void pending_chain_state::transaction_insert_into_unique_set( const transaction& trx )
   {
       _transaction_digests.insert( trx.digest( get_chain_id() ) );
   }

} } // tally::blockchain
