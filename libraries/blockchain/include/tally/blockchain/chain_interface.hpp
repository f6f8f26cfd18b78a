#pragma once

#include <tally/blockchain/ballot_record.hpp>
#include <tally/blockchain/exceptions.hpp>
#include <tally/blockchain/poll_record.hpp>
#include <tally/blockchain/transaction_record.hpp>
#include <tally/blockchain/types.hpp>

#include <fc/io/raw.hpp>

namespace tally { namespace blockchain {

   class chain_interface
   : public poll_db_interface,
     public ballot_db_interface,
     public transaction_db_interface
   {
      public:
         virtual ~chain_interface(){};

         virtual fc::time_point_sec         now()const = 0;

         virtual digest_type                get_chain_id()const = 0;

         virtual bool                       is_known_transaction( const transaction& trx )const             = 0;

         virtual otransaction_record        get_transaction( const transaction_id_type& trx_id )const       = 0;

         virtual void                       store_transaction( const transaction_id_type&,
                                                               const transaction_record&  )                 = 0;

         opoll_record                       get_poll_record( const poll_id_type& id )const;
         opoll_record                       get_poll_record( const address& authority, const string& title )const;
         void                               store_poll_record( const poll_record& record );

         oballot_record                     get_ballot_record( const ballot_id_type& id )const;
         oballot_record                     get_ballot_record( const poll_id_type& poll_id, const address& wallet )const;
         bool                               has_voted( const poll_id_type& poll_id, const address& wallet )const;

         template<typename T, typename U>
         optional<T> lookup( const U& key )const
         { try {
             return T::lookup( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }

         template<typename T, typename U>
         void store( const U& key, const T& record )
         { try {
             record.sanity_check( *this );
             T::store( *this, key, record );
         } FC_CAPTURE_AND_RETHROW( (key)(record) ) }

         /**
          *  Stores a record at a key that must not already hold one.  This is the only
          *  way new polls and ballots come into existence, so a second allocation at the
          *  same derived id is always rejected.
          */
         template<typename T, typename U>
         void allocate( const U& key, const T& record )
         { try {
             if( lookup<T>( key ).valid() )
                 FC_CAPTURE_AND_THROW( record_already_exists, (key) );

             const size_t record_size = fc::raw::pack_size( record );
             const size_t max_size = T::max_packed_size;
             if( record_size > max_size )
                 FC_CAPTURE_AND_THROW( record_too_large, (key)(record_size)(max_size) );

             store( key, record );
         } FC_CAPTURE_AND_RETHROW( (key)(record) ) }
   };
   typedef std::shared_ptr<chain_interface> chain_interface_ptr;

} } // tally::blockchain
