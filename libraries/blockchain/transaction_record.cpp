#include <tally/blockchain/chain_interface.hpp>
#include <tally/blockchain/transaction_record.hpp>

namespace tally { namespace blockchain {

    void transaction_record::sanity_check( const chain_interface& db )const
    { try {
        FC_ASSERT( !validation_error.valid(), "a failed transaction is never committed" );
        FC_ASSERT( !trx.operations.empty() );
        FC_ASSERT( trx.signatures.size() >= signed_addresses.size() );
        FC_ASSERT( !signed_addresses.empty() );
        FC_ASSERT( applied <= trx.expiration, "", ("applied",applied)("expiration",trx.expiration) );
    } FC_CAPTURE_AND_RETHROW( (*this) ) }

    otransaction_record transaction_record::lookup( const chain_interface& db, const transaction_id_type& id )
    { try {
        return db.transaction_lookup_by_id( id );
    } FC_CAPTURE_AND_RETHROW( (id) ) }

    /** the record and the digest that blocks its replay are written together */
    void transaction_record::store( chain_interface& db, const transaction_id_type& id, const transaction_record& record )
    { try {
        FC_ASSERT( id == record.trx.id(), "", ("id",id)("trx_id",record.trx.id()) );
        db.transaction_insert_into_id_map( id, record );
        db.transaction_insert_into_unique_set( record.trx );
    } FC_CAPTURE_AND_RETHROW( (id)(record) ) }

} } // tally::blockchain
