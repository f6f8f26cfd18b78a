#pragma once

#include <tally/blockchain/operations.hpp>
#include <tally/blockchain/types.hpp>

#include <fc/reflect/variant.hpp>

namespace tally { namespace blockchain {

   struct transaction
   {
      fc::time_point_sec    expiration;
      /** distinguishes otherwise identical transactions so only a true replay shares a digest */
      uint64_t              nonce = 0;
      vector<operation>     operations;

      digest_type digest( const digest_type& chain_id )const;

      void set_expiration( const time_point_sec expiration_timestamp );
      void set_expiration( const time_point_sec reference_time, const uint32_t expiration_sec );

      void create_poll( const address& authority,
                        const string& title,
                        const vector<string>& candidates,
                        int64_t start_ts,
                        int64_t end_ts );

      void cast_vote( const poll_id_type& poll_id,
                      const address& voter,
                      uint8_t candidate_idx,
                      const optional<address>& poll_authority = optional<address>() );
   }; // transaction

   struct signed_transaction : public transaction
   {
      transaction_id_type   id()const;
      size_t                data_size()const;
      void                  sign( const fc::ecc::private_key& signer, const digest_type& chain_id );
      fc::ecc::public_key   get_signing_key( const size_t sig_index, const digest_type& chain_id )const;

      vector<fc::ecc::compact_signature> signatures;
   };

} } // tally::blockchain

FC_REFLECT( tally::blockchain::transaction, (expiration)(nonce)(operations) )
FC_REFLECT_DERIVED( tally::blockchain::signed_transaction, (tally::blockchain::transaction), (signatures) )
