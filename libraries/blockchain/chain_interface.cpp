#include <tally/blockchain/chain_interface.hpp>
#include <tally/blockchain/exceptions.hpp>

namespace tally { namespace blockchain {

   opoll_record chain_interface::get_poll_record( const poll_id_type& id )const
   { try {
       return lookup<poll_record>( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   opoll_record chain_interface::get_poll_record( const address& authority, const string& title )const
   { try {
       return lookup<poll_record>( poll_record::make_id( authority, title ) );
   } FC_CAPTURE_AND_RETHROW( (authority)(title) ) }

   void chain_interface::store_poll_record( const poll_record& record )
   { try {
       store( record.id(), record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   oballot_record chain_interface::get_ballot_record( const ballot_id_type& id )const
   { try {
       return lookup<ballot_record>( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   oballot_record chain_interface::get_ballot_record( const poll_id_type& poll_id, const address& wallet )const
   { try {
       return lookup<ballot_record>( ballot_record::make_id( poll_id, wallet ) );
   } FC_CAPTURE_AND_RETHROW( (poll_id)(wallet) ) }

   bool chain_interface::has_voted( const poll_id_type& poll_id, const address& wallet )const
   { try {
       const oballot_record ballot = get_ballot_record( poll_id, wallet );
       return ballot.valid() && ballot->has_voted;
   } FC_CAPTURE_AND_RETHROW( (poll_id)(wallet) ) }

} } // tally::blockchain
