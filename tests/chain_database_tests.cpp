#define BOOST_TEST_MODULE ChainDatabaseTests
#include <boost/test/unit_test.hpp>

#include "chain_fixture.hpp"

#include <tally/blockchain/pending_chain_state.hpp>

#include <fc/string.hpp>
#include <fc/thread/thread.hpp>

#include <limits>

BOOST_FIXTURE_TEST_CASE( create_and_vote, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();

      opoll_record poll = db->get_poll_record( poll_id );
      BOOST_REQUIRE( poll.valid() );
      const poll_record created = *poll;
      BOOST_CHECK( poll->authority == authority );
      BOOST_CHECK_EQUAL( poll->title, "Best language" );
      BOOST_REQUIRE_EQUAL( poll->votes.size(), 3u );
      BOOST_CHECK_EQUAL( poll->total_votes(), 0u );
      BOOST_CHECK( poll->phase_at( now() ) == poll_phase::open );
      BOOST_CHECK( db->get_poll_record( authority, "Best language" ).valid() );

      vote( poll_id, alice_key, 0 );
      vote( poll_id, bob_key, 2 );

      poll = db->get_poll_record( poll_id );
      BOOST_CHECK_EQUAL( poll->votes[0], 1u );
      BOOST_CHECK_EQUAL( poll->votes[1], 0u );
      BOOST_CHECK_EQUAL( poll->votes[2], 1u );
      BOOST_CHECK_EQUAL( poll->total_votes(), 2u );

      // voting only ever changes the tallies
      BOOST_CHECK( poll->authority == created.authority );
      BOOST_CHECK_EQUAL( poll->title, created.title );
      BOOST_CHECK( poll->candidates == created.candidates );
      BOOST_CHECK_EQUAL( poll->start_ts, created.start_ts );
      BOOST_CHECK_EQUAL( poll->end_ts, created.end_ts );

      BOOST_CHECK( db->has_voted( poll_id, alice ) );
      BOOST_CHECK( db->has_voted( poll_id, bob ) );
      BOOST_CHECK( !db->has_voted( poll_id, authority ) );

      const oballot_record ballot = db->get_ballot_record( poll_id, alice );
      BOOST_REQUIRE( ballot.valid() );
      BOOST_CHECK( ballot->poll == poll_id );
      BOOST_CHECK( ballot->wallet == alice );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( second_vote_rejected, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();
      vote( poll_id, alice_key, 1 );

      // the same vote again within the same second is a new transaction stopped by the ballot
      BOOST_CHECK_THROW( vote( poll_id, alice_key, 1 ), record_already_exists );
      BOOST_CHECK_THROW( vote( poll_id, alice_key, 2 ), record_already_exists );

      const opoll_record poll = db->get_poll_record( poll_id );
      BOOST_CHECK_EQUAL( poll->votes[1], 1u );
      BOOST_CHECK_EQUAL( poll->votes[2], 0u );
      BOOST_CHECK_EQUAL( poll->total_votes(), 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( duplicate_poll_rejected, chain_fixture )
{
   try {
      create_open_poll( "Lunch" );
      BOOST_CHECK_THROW( create_poll( "Lunch", { "a", "b" }, now_ts(), now_ts() + 60 ), record_already_exists );

      const opoll_record poll = db->get_poll_record( authority, "Lunch" );
      BOOST_REQUIRE( poll.valid() );
      BOOST_CHECK_EQUAL( poll->candidates.size(), 3u );

      // the same title from another authority lives at a different address
      signed_transaction trx = new_transaction();
      trx.create_poll( alice, "Lunch", { "a", "b" }, now_ts(), now_ts() + 60 );
      trx.sign( alice_key, db->get_chain_id() );
      db->apply_transaction( trx );
      BOOST_CHECK( db->get_poll_record( alice, "Lunch" ).valid() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( poll_configuration_errors, chain_fixture )
{
   try {
      const int64_t start = now_ts();
      const int64_t end = now_ts() + 60;

      BOOST_CHECK_THROW( create_poll( "one", { "a" }, start, end ), not_enough_candidates );
      BOOST_CHECK_THROW( create_poll( "nine", vector<string>( 9, "a" ), start, end ), too_many_candidates );
      BOOST_CHECK_THROW( create_poll( string( TALLY_POLL_MAX_TITLE_LENGTH + 1, 't' ), { "a", "b" }, start, end ), title_too_long );
      BOOST_CHECK_THROW( create_poll( "backwards", { "a", "b" }, end, start ), bad_schedule );
      BOOST_CHECK_THROW( create_poll( "instant", { "a", "b" }, start, start ), bad_schedule );
      BOOST_CHECK_THROW( create_poll( "empty", { "a", "" }, start, end ), empty_candidate_name );
      BOOST_CHECK_THROW( create_poll( "long", { "a", string( TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH + 1, 'c' ) }, start, end ),
                         candidate_name_too_long );

      // the candidate count is checked before the title
      BOOST_CHECK_THROW( create_poll( string( 100, 't' ), { "a" }, start, end ), not_enough_candidates );

      // limits themselves are accepted
      create_poll( string( TALLY_POLL_MAX_TITLE_LENGTH, 't' ),
                   vector<string>( TALLY_POLL_MAX_CANDIDATES, string( TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH, 'c' ) ),
                   start, end );

      BOOST_CHECK_EQUAL( db->list_polls().size(), 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( voting_window, chain_fixture )
{
   try {
      const poll_id_type future_poll = create_poll( "Later", { "a", "b" }, now_ts() + 100, now_ts() + 200 );
      BOOST_CHECK_THROW( vote( future_poll, alice_key, 0 ), too_early );

      advance_time( 100 );
      vote( future_poll, alice_key, 0 );

      advance_time( 100 );
      // end_ts itself is still inside the window
      vote( future_poll, bob_key, 1 );

      advance_time( 1 );
      BOOST_CHECK( db->get_poll_record( future_poll )->phase_at( now() ) == poll_phase::closed );
      BOOST_CHECK_THROW( vote( future_poll, authority_key, 1 ), poll_closed );

      BOOST_CHECK_EQUAL( db->get_poll_record( future_poll )->total_votes(), 2u );
      BOOST_CHECK( !db->has_voted( future_poll, authority ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( bad_references, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();

      BOOST_CHECK_THROW( vote( poll_id, alice_key, 3 ), bad_candidate );
      BOOST_CHECK_THROW( vote( poll_record::make_id( authority, "no such poll" ), alice_key, 0 ), unknown_poll );
      BOOST_CHECK( !db->has_voted( poll_id, alice ) );

      signed_transaction trx = new_transaction();
      trx.cast_vote( poll_id, alice, 0, bob );
      trx.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), authority_mismatch );

      trx = new_transaction();
      trx.cast_vote( poll_id, alice, 0, authority );
      trx.sign( alice_key, db->get_chain_id() );
      db->apply_transaction( trx );
      BOOST_CHECK( db->has_voted( poll_id, alice ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( signatures_required, chain_fixture )
{
   try {
      signed_transaction trx = new_transaction();
      trx.create_poll( authority, "Unsigned", { "a", "b" }, now_ts(), now_ts() + 60 );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), missing_signature );

      trx.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), missing_signature );
      BOOST_CHECK( !db->get_poll_record( authority, "Unsigned" ).valid() );

      const poll_id_type poll_id = create_open_poll();

      // bob cannot vote on behalf of alice
      trx = new_transaction();
      trx.cast_vote( poll_id, alice, 0 );
      trx.sign( bob_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), missing_signature );
      BOOST_CHECK( !db->has_voted( poll_id, alice ) );
      BOOST_CHECK( !db->has_voted( poll_id, bob ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( transaction_checks, chain_fixture )
{
   try {
      signed_transaction empty = new_transaction();
      empty.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( empty ), empty_transaction );

      const poll_id_type poll_id = create_open_poll();

      signed_transaction expired;
      expired.set_expiration( now() - 1 );
      expired.cast_vote( poll_id, alice, 0 );
      expired.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( expired ), expired_transaction );

      signed_transaction far_future;
      far_future.set_expiration( now(), TALLY_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC + 10 );
      far_future.cast_vote( poll_id, alice, 0 );
      far_future.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( far_future ), invalid_transaction_expiration );

      signed_transaction oversized = new_transaction();
      for( uint32_t i = 0; i < 120; ++i )
         oversized.cast_vote( poll_id, alice, 0 );
      oversized.sign( alice_key, db->get_chain_id() );
      BOOST_CHECK_GT( oversized.data_size(), size_t( TALLY_BLOCKCHAIN_MAX_TRANSACTION_SIZE ) );
      BOOST_CHECK_THROW( db->apply_transaction( oversized ), oversized_transaction );

      const signed_transaction trx = vote_transaction( poll_id, alice_key, 0 );
      db->apply_transaction( trx );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), duplicate_transaction );

      const otransaction_record record = db->get_transaction( trx.id() );
      BOOST_REQUIRE( record.valid() );
      BOOST_CHECK( record->trx.id() == trx.id() );
      BOOST_CHECK( record->signed_addresses.count( alice ) == 1 );
      BOOST_CHECK( record->applied == now() );
      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->total_votes(), 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( failed_transaction_is_atomic, chain_fixture )
{
   try {
      const poll_id_type poll_id = poll_record::make_id( authority, "Atomic" );

      // the second operation fails, so the poll created by the first must not exist
      signed_transaction trx = new_transaction();
      trx.create_poll( authority, "Atomic", { "a", "b" }, now_ts(), now_ts() + 60 );
      trx.cast_vote( poll_id, authority, 5 );
      trx.sign( authority_key, db->get_chain_id() );
      BOOST_CHECK_THROW( db->apply_transaction( trx ), bad_candidate );

      BOOST_CHECK( !db->get_poll_record( poll_id ).valid() );
      BOOST_CHECK( !db->get_transaction( trx.id() ).valid() );
      BOOST_CHECK( db->list_polls().empty() );

      // later operations see the writes of earlier ones
      trx = new_transaction();
      trx.create_poll( authority, "Atomic", { "a", "b" }, now_ts(), now_ts() + 60 );
      trx.cast_vote( poll_id, authority, 1 );
      trx.sign( authority_key, db->get_chain_id() );
      db->apply_transaction( trx );

      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->votes[1], 1u );
      BOOST_CHECK( db->has_voted( poll_id, authority ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( vote_count_overflow, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();

      poll_record saturated = *db->get_poll_record( poll_id );
      saturated.votes[0] = std::numeric_limits<vote_count_type>::max();
      db->store_poll_record( saturated );

      BOOST_CHECK_THROW( vote( poll_id, alice_key, 0 ), addition_overflow );
      BOOST_CHECK( !db->has_voted( poll_id, alice ) );
      BOOST_CHECK( db->get_poll_record( poll_id )->votes[0] == std::numeric_limits<vote_count_type>::max() );

      vote( poll_id, alice_key, 1 );
      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->votes[1], 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( allocate_rules, chain_fixture )
{
   try {
      const pending_chain_state_ptr pending = std::make_shared<pending_chain_state>( db );

      poll_record record;
      record.authority = authority;
      record.title = "Allocated";
      record.candidates = { "a", "b" };
      record.votes = { 0, 0 };
      record.start_ts = now_ts();
      record.end_ts = now_ts() + 60;

      pending->allocate( record.id(), record );
      BOOST_CHECK( pending->get_poll_record( record.id() ).valid() );
      BOOST_CHECK( !db->get_poll_record( record.id() ).valid() );
      BOOST_CHECK_THROW( pending->allocate( record.id(), record ), record_already_exists );

      poll_record oversized = record;
      oversized.title = "Oversized";
      oversized.candidates.assign( TALLY_POLL_MAX_CANDIDATES, string( TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH + 20, 'c' ) );
      oversized.votes.assign( TALLY_POLL_MAX_CANDIDATES, 0 );
      BOOST_CHECK_THROW( pending->allocate( oversized.id(), oversized ), record_too_large );
      BOOST_CHECK( !pending->get_poll_record( oversized.id() ).valid() );

      // a ballot can only reference an existing poll
      const ballot_record orphan( poll_record::make_id( authority, "missing" ), alice );
      BOOST_CHECK_THROW( pending->allocate( orphan.id(), orphan ), fc::exception );
      BOOST_CHECK( !pending->get_ballot_record( orphan.id() ).valid() );

      db->apply_pending_state( *pending );
      BOOST_CHECK( db->get_poll_record( record.id() ).valid() );
      BOOST_CHECK_EQUAL( db->get_polls_by_authority( authority ).size(), 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( stored_poll_is_checked, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();
      const poll_record valid = *db->get_poll_record( poll_id );

      poll_record unnamed = valid;
      unnamed.candidates[1] = "";
      BOOST_CHECK_THROW( db->store_poll_record( unnamed ), fc::exception );

      poll_record long_name = valid;
      long_name.candidates[2] = string( TALLY_POLL_MAX_CANDIDATE_NAME_LENGTH + 1, 'c' );
      BOOST_CHECK_THROW( db->store_poll_record( long_name ), fc::exception );

      poll_record mismatched = valid;
      mismatched.votes.push_back( 0 );
      BOOST_CHECK_THROW( db->store_poll_record( mismatched ), fc::exception );

      BOOST_CHECK( db->get_poll_record( poll_id )->candidates == valid.candidates );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( failed_commit_writes_nothing, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();
      BOOST_CHECK( fc::exists( dir.path() / "index/records" ) );

      const pending_chain_state_ptr pending = std::make_shared<pending_chain_state>( db );
      poll_record poll = *pending->get_poll_record( poll_id );
      poll.votes[0] += 1;
      pending->store_poll_record( poll );
      const ballot_record ballot( poll_id, alice );
      pending->allocate( ballot.id(), ballot );

      // filed under the wrong id, so the commit fails after the tally and the ballot were written to the batch
      transaction_record record;
      record.trx = vote_transaction( poll_id, alice_key, 0 );
      pending->_transaction_id_to_record[ transaction_id_type() ] = record;
      BOOST_CHECK_THROW( db->apply_pending_state( *pending ), fc::exception );

      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->votes[0], 0u );
      BOOST_CHECK( !db->has_voted( poll_id, alice ) );

      db->close();
      db->open( dir.path() );

      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->total_votes(), 0u );
      BOOST_CHECK( !db->has_voted( poll_id, alice ) );

      vote( poll_id, alice_key, 0 );
      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->votes[0], 1u );
      BOOST_CHECK( db->has_voted( poll_id, alice ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( expired_digests_pruned, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_poll( "Long", { "a", "b" }, now_ts() - 10, now_ts() + 10 * 3600 );
      const signed_transaction old_vote = vote_transaction( poll_id, alice_key, 0 );
      db->apply_transaction( old_vote );
      BOOST_CHECK_EQUAL( db->get_known_transaction_count(), 2u );

      advance_time( TALLY_BLOCKCHAIN_DEFAULT_TRANSACTION_EXPIRATION_SEC + 1 );
      vote( poll_id, bob_key, 1 );
      BOOST_CHECK_EQUAL( db->get_known_transaction_count(), 1u );

      BOOST_CHECK_THROW( db->apply_transaction( old_vote ), expired_transaction );
      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->total_votes(), 2u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( poll_queries, chain_fixture )
{
   try {
      BOOST_CHECK( db->list_polls().empty() );
      BOOST_CHECK( !db->get_latest_poll().valid() );

      const poll_id_type early = create_poll( "Early", { "a", "b" }, now_ts() - 100, now_ts() + 100 );
      const poll_id_type late = create_poll( "Late", { "a", "b" }, now_ts() + 50, now_ts() + 100 );
      const poll_id_type middle = create_poll( "Middle", { "a", "b" }, now_ts(), now_ts() + 100 );

      signed_transaction trx = new_transaction();
      trx.create_poll( alice, "Alice's", { "a", "b" }, now_ts() - 500, now_ts() + 100 );
      trx.sign( alice_key, db->get_chain_id() );
      db->apply_transaction( trx );

      const vector<poll_record> polls = db->list_polls();
      BOOST_REQUIRE_EQUAL( polls.size(), 4u );
      for( size_t i = 1; i < polls.size(); ++i )
         BOOST_CHECK( polls[i - 1].id() < polls[i].id() );

      BOOST_REQUIRE( db->get_latest_poll().valid() );
      BOOST_CHECK( db->get_latest_poll()->id() == late );

      const vector<poll_record> by_authority = db->get_polls_by_authority( authority );
      BOOST_REQUIRE_EQUAL( by_authority.size(), 3u );
      set<poll_id_type> ids;
      for( const poll_record& record : by_authority ) ids.insert( record.id() );
      BOOST_CHECK( ids.count( early ) && ids.count( middle ) && ids.count( late ) );

      BOOST_CHECK_EQUAL( db->get_polls_by_authority( alice ).size(), 1u );
      BOOST_CHECK( db->get_polls_by_authority( bob ).empty() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( reopen_database, chain_fixture )
{
   try {
      const digest_type chain_id = db->get_chain_id();
      const poll_id_type poll_id = create_open_poll();
      const signed_transaction trx = vote_transaction( poll_id, alice_key, 2 );
      db->apply_transaction( trx );

      db->close();
      BOOST_CHECK( !db->is_open() );
      BOOST_CHECK_THROW( db->apply_transaction( vote_transaction( poll_id, bob_key, 0 ) ), fc::exception );

      db->open( dir.path() );
      BOOST_CHECK( db->get_chain_id() == chain_id );

      const opoll_record poll = db->get_poll_record( poll_id );
      BOOST_REQUIRE( poll.valid() );
      BOOST_CHECK_EQUAL( poll->votes[2], 1u );
      BOOST_CHECK( db->has_voted( poll_id, alice ) );
      BOOST_CHECK( db->get_latest_poll()->id() == poll_id );
      BOOST_CHECK_EQUAL( db->get_polls_by_authority( authority ).size(), 1u );

      // replay protection survives a restart while the transaction is unexpired
      BOOST_CHECK_THROW( db->apply_transaction( trx ), duplicate_transaction );
      BOOST_CHECK_THROW( vote( poll_id, alice_key, 0 ), record_already_exists );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( concurrent_votes, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();
      const uint32_t thread_count = 8;

      vector<fc::ecc::private_key> voters;
      for( uint32_t i = 0; i < thread_count; ++i )
         voters.push_back( tally::utilities::key_from_seed( "voter" + fc::to_string( uint64_t( i ) ) ) );

      // every voter once, plus alice racing herself on every candidate
      vector<std::unique_ptr<fc::thread>> threads;
      vector<fc::future<bool>> results;
      for( uint32_t i = 0; i < thread_count; ++i )
      {
         threads.emplace_back( new fc::thread( "voter" + fc::to_string( uint64_t( i ) ) ) );
         const signed_transaction voter_trx = vote_transaction( poll_id, voters[i], i % 3 );
         const signed_transaction alice_trx = vote_transaction( poll_id, alice_key, i % 3 );
         chain_database_ptr chain = db;
         results.push_back( threads.back()->async( [chain,voter_trx,alice_trx]() -> bool
         {
            chain->apply_transaction( voter_trx );
            try
            {
               chain->apply_transaction( alice_trx );
               return true;
            }
            catch( const record_already_exists& )
            {
               return false;
            }
            catch( const duplicate_transaction& )
            {
               return false;
            }
         } ) );
      }

      uint32_t alice_successes = 0;
      for( auto& result : results )
         alice_successes += result.wait() ? 1 : 0;

      for( auto& thread : threads )
         thread->quit();

      BOOST_CHECK_EQUAL( alice_successes, 1u );
      for( const auto& key : voters )
         BOOST_CHECK( db->has_voted( poll_id, address( key.get_public_key() ) ) );
      BOOST_CHECK( db->has_voted( poll_id, alice ) );
      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->total_votes(), thread_count + 1 );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( reads_during_votes, chain_fixture )
{
   try {
      const poll_id_type poll_id = create_open_poll();
      const uint32_t voter_count = 16;

      vector<signed_transaction> votes;
      for( uint32_t i = 0; i < voter_count; ++i )
         votes.push_back( vote_transaction( poll_id, tally::utilities::key_from_seed( "reader" + fc::to_string( uint64_t( i ) ) ), i % 3 ) );

      chain_database_ptr chain = db;
      fc::thread writer_thread( "writer" );
      fc::future<void> writer = writer_thread.async( [chain,votes]()
      {
         for( const signed_transaction& trx : votes )
            chain->apply_transaction( trx );
      } );

      // readers only ever see whole votes, and the tally never goes backwards
      vector<std::unique_ptr<fc::thread>> threads;
      vector<fc::future<bool>> readers;
      for( uint32_t i = 0; i < 4; ++i )
      {
         threads.emplace_back( new fc::thread( "reader" + fc::to_string( uint64_t( i ) ) ) );
         readers.push_back( threads.back()->async( [chain,poll_id,voter_count]() -> bool
         {
            vote_count_type last_total = 0;
            for( uint32_t n = 0; n < 200; ++n )
            {
               const opoll_record poll = chain->get_poll_record( poll_id );
               if( !poll.valid() || poll->total_votes() < last_total || poll->total_votes() > voter_count )
                  return false;
               last_total = poll->total_votes();

               const vector<poll_record> polls = chain->list_polls();
               if( polls.size() != 1 || polls[0].total_votes() < last_total )
                  return false;

               if( !chain->get_latest_poll().valid() || chain->get_polls_by_authority( poll->authority ).size() != 1 )
                  return false;
            }
            return true;
         } ) );
      }

      writer.wait();
      for( auto& reader : readers )
         BOOST_CHECK( reader.wait() );

      for( auto& thread : threads )
         thread->quit();
      writer_thread.quit();

      BOOST_CHECK_EQUAL( db->get_poll_record( poll_id )->total_votes(), voter_count );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string()) );
      throw;
   }
}
