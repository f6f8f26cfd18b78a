#pragma once

#include <tally/blockchain/chain_interface.hpp>
#include <tally/blockchain/pending_chain_state.hpp>
#include <tally/blockchain/transaction_evaluation_state.hpp>

namespace tally { namespace blockchain {

   namespace detail { class chain_database_impl; }

   /**
    *  LevelDB backed chain_interface.  Transactions are evaluated against a
    *  pending_chain_state layered over this database and only applied when every
    *  operation in them succeeds, and then in a single synced LevelDB write.
    *  Application is serialized and the in-memory indexes are locked, so concurrent
    *  callers never observe or produce a partially applied transaction.
    */
   class chain_database : public chain_interface, public std::enable_shared_from_this<chain_database>
   {
      public:
         chain_database();
         virtual ~chain_database()override;

         void open( const fc::path& data_dir );
         void close();
         bool is_open()const;

         /**
          *  Evaluates and commits a single transaction.  Throws the evaluation error
          *  unchanged when any operation fails, in which case nothing is written.
          */
         transaction_evaluation_state_ptr   apply_transaction( const signed_transaction& trx );

         /** commits every record of a pending state layered over this database as one write */
         void                               apply_pending_state( const pending_chain_state& state );

         virtual fc::time_point_sec         now()const override;
         virtual digest_type                get_chain_id()const override;

         virtual bool                       is_known_transaction( const transaction& trx )const override;
         virtual otransaction_record        get_transaction( const transaction_id_type& trx_id )const override;
         virtual void                       store_transaction( const transaction_id_type&,
                                                               const transaction_record& ) override;

         /** every poll ordered by poll id */
         vector<poll_record>                list_polls()const;
         vector<poll_record>                get_polls_by_authority( const address& authority )const;
         /** the poll with the greatest start time */
         opoll_record                       get_latest_poll()const;

         /** digests of unexpired committed transactions, held to reject replays */
         size_t                             get_known_transaction_count()const;

      private:
         unique_ptr<detail::chain_database_impl> my;

         virtual opoll_record poll_lookup_by_id( const poll_id_type& )const override;
         virtual void poll_insert_into_id_map( const poll_id_type&, const poll_record& )override;

         virtual oballot_record ballot_lookup_by_id( const ballot_id_type& )const override;
         virtual void ballot_insert_into_id_map( const ballot_id_type&, const ballot_record& )override;

         virtual otransaction_record transaction_lookup_by_id( const transaction_id_type& )const override;

         virtual void transaction_insert_into_id_map( const transaction_id_type&, const transaction_record& )override;
         virtual void transaction_insert_into_unique_set( const transaction& )override;
   };
   typedef std::shared_ptr<chain_database> chain_database_ptr;

} } // tally::blockchain
