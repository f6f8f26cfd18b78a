#pragma once
#include <tally/blockchain/chain_interface.hpp>

namespace tally { namespace blockchain {

   /**
    *  A copy-on-write overlay over a parent chain_interface.  Reads fall through to
    *  the parent for anything not touched here; writes stay here until apply_changes().
    */
   class pending_chain_state : public chain_interface, public std::enable_shared_from_this<pending_chain_state>
   {
      public:
                                        pending_chain_state( chain_interface_ptr prev_state = chain_interface_ptr() );

         virtual fc::time_point_sec     now()const override;
         virtual digest_type            get_chain_id()const override;

         virtual bool                   is_known_transaction( const transaction& trx )const override;
         virtual otransaction_record    get_transaction( const transaction_id_type& trx_id )const override;

         virtual void                   store_transaction( const transaction_id_type&, const transaction_record&  ) override;

         /** writes every record touched here into the parent state */
         void                           apply_changes()const;

         /** records were sanity checked when they were stored here */
         template<typename T>
         void apply_records( const chain_interface_ptr& prev_state, const T& store_map )const
         {
             using V = typename T::mapped_type;
             for( const auto& item : store_map ) V::store( *prev_state, item.first, item.second );
         }

         unordered_map<poll_id_type, poll_record>                           _poll_id_to_record;
         unordered_map<ballot_id_type, ballot_record>                       _ballot_id_to_record;

         unordered_map<transaction_id_type, transaction_record>             _transaction_id_to_record;
         unordered_set<digest_type>                                         _transaction_digests;

      private:
         // Not serialized
         std::weak_ptr<chain_interface>                                     _prev_state;

         virtual opoll_record poll_lookup_by_id( const poll_id_type& )const override;
         virtual void poll_insert_into_id_map( const poll_id_type&, const poll_record& )override;

         virtual oballot_record ballot_lookup_by_id( const ballot_id_type& )const override;
         virtual void ballot_insert_into_id_map( const ballot_id_type&, const ballot_record& )override;

         virtual otransaction_record transaction_lookup_by_id( const transaction_id_type& )const override;

         virtual void transaction_insert_into_id_map( const transaction_id_type&, const transaction_record& )override;
         virtual void transaction_insert_into_unique_set( const transaction& )override;
   };
   typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

} } // tally::blockchain
