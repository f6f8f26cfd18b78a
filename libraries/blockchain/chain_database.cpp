#include <tally/blockchain/chain_database.hpp>
#include <tally/blockchain/chain_database_impl.hpp>
#include <tally/blockchain/config.hpp>
#include <tally/blockchain/exceptions.hpp>
#include <tally/blockchain/time.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/raw_variant.hpp>
#include <fc/log/logger.hpp>
#include <fc/thread/scoped_lock.hpp>
#include <fc/thread/unique_lock.hpp>

#include <exception>

namespace tally { namespace blockchain {

   namespace detail
   {
      void chain_database_impl::open_database( const fc::path& data_dir )
      { try {
          fc::create_directories( data_dir / "index" );

          _property_db.open( data_dir / "index/property_db" );
          _records.open( data_dir / "index/records" );
      } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

      void chain_database_impl::initialize_chain_id()
      { try {
          const fc::optional<variant> version = _property_db.fetch_optional( "database_version" );
          if( version.valid() )
          {
              FC_ASSERT( version->as_int64() == TALLY_BLOCKCHAIN_DATABASE_VERSION,
                         "Database version mismatch", ("stored",*version)("expected",TALLY_BLOCKCHAIN_DATABASE_VERSION) );
          }
          else
          {
              _property_db.store( "database_version", variant( TALLY_BLOCKCHAIN_DATABASE_VERSION ) );
          }

          const fc::optional<variant> chain_id = _property_db.fetch_optional( "chain_id" );
          if( chain_id.valid() )
          {
              _chain_id = chain_id->as<digest_type>();
              return;
          }

          fc::sha256::encoder enc;
          fc::raw::pack( enc, string( TALLY_BLOCKCHAIN_DESCRIPTION ) );
          fc::raw::pack( enc, uint32_t( TALLY_BLOCKCHAIN_VERSION ) );
          _chain_id = enc.result();
          _property_db.store( "chain_id", variant( _chain_id ) );
          ilog( "Initialized chain id ${id}", ("id",_chain_id) );
      } FC_CAPTURE_AND_RETHROW() }

      /** ballots are only ever looked up by id and stay on disk */
      void chain_database_impl::populate_indexes()
      { try {
          const time_point_sec now = self->now();
          for( auto iter = _records.begin(); iter.valid(); ++iter )
          {
              const record_key key = iter.key();
              if( key.kind == poll_record_kind )
              {
                  const poll_record record = fc::raw::unpack<poll_record>( iter.value() );
                  _polls[ key.id ] = record;
                  index_poll( key.id, record );
              }
              else if( key.kind == transaction_record_kind )
              {
                  const transaction_record record = fc::raw::unpack<transaction_record>( iter.value() );
                  if( record.trx.expiration >= now )
                      index_transaction( record.trx );
              }
          }
      } FC_CAPTURE_AND_RETHROW() }

      void chain_database_impl::index_poll( const poll_id_type& id, const poll_record& record )
      {
          _authority_to_poll_ids[ record.authority ].insert( id );
          _poll_start_index.insert( std::make_pair( record.start_ts, id ) );
      }

      void chain_database_impl::index_transaction( const transaction& trx )
      {
          const digest_type digest = trx.digest( _chain_id );
          if( _unique_transactions.insert( digest ).second )
              _transaction_expirations.emplace( trx.expiration, digest );
      }

      /** an expired transaction is rejected before its digest is consulted */
      void chain_database_impl::prune_expired_transactions( const time_point_sec now )
      {
          auto iter = _transaction_expirations.begin();
          while( iter != _transaction_expirations.end() && iter->first < now )
          {
              _unique_transactions.erase( iter->second );
              iter = _transaction_expirations.erase( iter );
          }
      }

      void chain_database_impl::apply_changes( const pending_chain_state& state )
      { try {
          begin_write();
          try
          {
              state.apply_changes();
              commit_write();
          }
          catch( const fc::exception& )
          {
              abort_write();
              throw;
          }
      } FC_CAPTURE_AND_RETHROW() }

      void chain_database_impl::begin_write()
      {
          FC_ASSERT( !_write_batch, "a write is already open" );
          _write_batch.reset( new record_map::write_batch( _records.create_batch( true ) ) );
      }

      /** the indexes only change once LevelDB has accepted the whole write */
      void chain_database_impl::commit_write()
      { try {
          FC_ASSERT( _write_batch );
          _write_batch->commit();
          _write_batch.reset();

          fc::scoped_lock<fc::mutex> lock( _index_mutex );
          for( const auto& item : _staged_polls )
          {
              _polls[ item.first ] = item.second;
              index_poll( item.first, item.second );
          }
          for( const transaction& trx : _staged_transactions )
              index_transaction( trx );

          _staged_polls.clear();
          _staged_transactions.clear();
      } FC_CAPTURE_AND_RETHROW() }

      void chain_database_impl::abort_write()
      {
          _write_batch.reset();
          _staged_polls.clear();
          _staged_transactions.clear();
      }

   } // detail

   chain_database::chain_database()
   :my( new detail::chain_database_impl() )
   {
      my->self = this;
   }

   chain_database::~chain_database()
   {
      try
      {
         close();
      }
      catch( const fc::exception& e )
      {
         wlog( "unexpected exception closing database\n ${e}", ("e",e.to_detail_string()) );
      }
   }

   void chain_database::open( const fc::path& data_dir )
   { try {
      std::exception_ptr error_opening_database;
      try
      {
          my->open_database( data_dir );
          my->initialize_chain_id();
          my->populate_indexes();

          ilog( "Opened chain database ${dir} with ${n} polls", ("dir",data_dir)("n",my->_polls.size()) );
      }
      catch( ... )
      {
          error_opening_database = std::current_exception();
      }

      if( error_opening_database )
      {
          elog( "Error opening database!" );
          close();
          std::rethrow_exception( error_opening_database );
      }
   } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

   void chain_database::close()
   { try {
      my->abort_write();

      my->_property_db.close();
      my->_records.close();

      fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
      my->_polls.clear();
      my->_authority_to_poll_ids.clear();
      my->_poll_start_index.clear();
      my->_unique_transactions.clear();
      my->_transaction_expirations.clear();
   } FC_CAPTURE_AND_RETHROW() }

   bool chain_database::is_open()const
   {
      return my->_records.is_open();
   }

   transaction_evaluation_state_ptr chain_database::apply_transaction( const signed_transaction& trx )
   { try {
      // only one transaction may be evaluated and committed at a time
      fc::unique_lock<fc::mutex> lock( my->_apply_transaction_mutex );

      FC_ASSERT( is_open(), "Database is not open" );

      {
         fc::scoped_lock<fc::mutex> index_lock( my->_index_mutex );
         my->prune_expired_transactions( now() );
      }

      const pending_chain_state_ptr pending_state = std::make_shared<pending_chain_state>( shared_from_this() );
      const transaction_evaluation_state_ptr eval_state = std::make_shared<transaction_evaluation_state>( pending_state );

      try
      {
         eval_state->evaluate( trx );
      }
      catch( const fc::exception& e )
      {
         fc_wlog( fc::logger::get( "chain" ), "Rejected transaction ${id}: ${e}", ("id",trx.id())("e",e.to_string()) );
         throw;
      }

      my->apply_changes( *pending_state );

      fc_ilog( fc::logger::get( "chain" ), "Applied transaction ${id} with ${n} operations",
               ("id",trx.id())("n",trx.operations.size()) );
      return eval_state;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   void chain_database::apply_pending_state( const pending_chain_state& state )
   { try {
      fc::unique_lock<fc::mutex> lock( my->_apply_transaction_mutex );
      FC_ASSERT( is_open(), "Database is not open" );
      my->apply_changes( state );
   } FC_CAPTURE_AND_RETHROW() }

   fc::time_point_sec chain_database::now()const
   {
      return blockchain::now();
   }

   digest_type chain_database::get_chain_id()const
   {
      return my->_chain_id;
   }

   bool chain_database::is_known_transaction( const transaction& trx )const
   { try {
       const digest_type digest = trx.digest( get_chain_id() );
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       return my->_unique_transactions.count( digest ) > 0;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   size_t chain_database::get_known_transaction_count()const
   {
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       return my->_unique_transactions.size();
   }

   otransaction_record chain_database::get_transaction( const transaction_id_type& trx_id )const
   { try {
       return lookup<transaction_record>( trx_id );
   } FC_CAPTURE_AND_RETHROW( (trx_id) ) }

   void chain_database::store_transaction( const transaction_id_type& record_id,
                                           const transaction_record& record_to_store )
   { try {
       store( record_id, record_to_store );
   } FC_CAPTURE_AND_RETHROW( (record_id)(record_to_store) ) }

   vector<poll_record> chain_database::list_polls()const
   { try {
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       vector<poll_record> results;
       results.reserve( my->_polls.size() );
       for( const auto& item : my->_polls )
           results.push_back( item.second );
       return results;
   } FC_CAPTURE_AND_RETHROW() }

   vector<poll_record> chain_database::get_polls_by_authority( const address& authority )const
   { try {
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       vector<poll_record> results;
       const auto iter = my->_authority_to_poll_ids.find( authority );
       if( iter == my->_authority_to_poll_ids.end() ) return results;

       for( const poll_id_type& id : iter->second )
       {
           const auto poll_iter = my->_polls.find( id );
           if( poll_iter != my->_polls.end() ) results.push_back( poll_iter->second );
       }
       return results;
   } FC_CAPTURE_AND_RETHROW( (authority) ) }

   opoll_record chain_database::get_latest_poll()const
   { try {
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       if( my->_poll_start_index.empty() ) return opoll_record();
       const auto iter = my->_polls.find( my->_poll_start_index.rbegin()->second );
       if( iter == my->_polls.end() ) return opoll_record();
       return iter->second;
   } FC_CAPTURE_AND_RETHROW() }

   opoll_record chain_database::poll_lookup_by_id( const poll_id_type& id )const
   {
       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       const auto iter = my->_polls.find( id );
       if( iter == my->_polls.end() ) return opoll_record();
       return iter->second;
   }

   void chain_database::poll_insert_into_id_map( const poll_id_type& id, const poll_record& record )
   {
       my->write_record( detail::poll_record_kind, id, record );
       if( my->_write_batch )
       {
           my->_staged_polls[ id ] = record;
           return;
       }

       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       my->_polls[ id ] = record;
       my->index_poll( id, record );
   }

   oballot_record chain_database::ballot_lookup_by_id( const ballot_id_type& id )const
   {
       return my->fetch_record<ballot_record>( detail::ballot_record_kind, id );
   }

   void chain_database::ballot_insert_into_id_map( const ballot_id_type& id, const ballot_record& record )
   {
       my->write_record( detail::ballot_record_kind, id, record );
   }

   otransaction_record chain_database::transaction_lookup_by_id( const transaction_id_type& id )const
   {
       return my->fetch_record<transaction_record>( detail::transaction_record_kind, id );
   }

   void chain_database::transaction_insert_into_id_map( const transaction_id_type& id, const transaction_record& record )
   {
       my->write_record( detail::transaction_record_kind, id, record );
   }

   void chain_database::transaction_insert_into_unique_set( const transaction& trx )
   {
       if( my->_write_batch )
       {
           my->_staged_transactions.push_back( trx );
           return;
       }

       fc::scoped_lock<fc::mutex> lock( my->_index_mutex );
       my->index_transaction( trx );
   }

} } // tally::blockchain
