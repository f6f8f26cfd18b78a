#include <tally/blockchain/poll_operations.hpp>
#include <tally/blockchain/time.hpp>
#include <tally/blockchain/transaction.hpp>

#include <fc/io/raw_variant.hpp>

namespace tally { namespace blockchain {

   digest_type transaction::digest( const digest_type& chain_id )const
   {
      fc::sha256::encoder enc;
      fc::raw::pack(enc,*this);
      fc::raw::pack(enc,chain_id);
      return enc.result();
   }

   transaction_id_type signed_transaction::id()const
   {
      fc::sha512::encoder enc;
      fc::raw::pack( enc, *this );
      return fc::ripemd160::hash( enc.result() );
   }

   size_t signed_transaction::data_size()const
   {
      fc::datastream<size_t> ds;
      fc::raw::pack(ds,*this);
      return ds.tellp();
   }

   void signed_transaction::sign( const fc::ecc::private_key& signer, const digest_type& chain_id )
   {
      signatures.push_back( signer.sign_compact( digest( chain_id ) ) );
   }

   fc::ecc::public_key signed_transaction::get_signing_key( const size_t sig_index, const digest_type& chain_id )const
   { try {
       return fc::ecc::public_key( signatures.at( sig_index ), this->digest( chain_id ), false );
   } FC_CAPTURE_AND_RETHROW( (sig_index)(chain_id) ) }

   void transaction::set_expiration( const time_point_sec expiration_timestamp )
   {
      expiration = expiration_timestamp;
   }

   void transaction::set_expiration( const time_point_sec reference_time, const uint32_t expiration_sec )
   {
      expiration = reference_time + expiration_sec;
   }

   void transaction::create_poll( const address& authority,
                                  const string& title,
                                  const vector<string>& candidates,
                                  int64_t start_ts,
                                  int64_t end_ts )
   { try {
      operations.emplace_back( create_poll_operation( authority, title, candidates, start_ts, end_ts ) );
   } FC_CAPTURE_AND_RETHROW( (authority)(title)(candidates)(start_ts)(end_ts) ) }

   void transaction::cast_vote( const poll_id_type& poll_id,
                                const address& voter,
                                uint8_t candidate_idx,
                                const optional<address>& poll_authority )
   { try {
      operations.emplace_back( cast_vote_operation( poll_id, voter, candidate_idx, poll_authority ) );
   } FC_CAPTURE_AND_RETHROW( (poll_id)(voter)(candidate_idx)(poll_authority) ) }

} } // tally::blockchain
