#pragma once

#include <tally/blockchain/chain_database.hpp>
#include <tally/db/level_map.hpp>
#include <fc/thread/mutex.hpp>

#include <tuple>

namespace tally { namespace blockchain {

   namespace detail
   {
      // NOTE: values are part of the stored key format, never renumber
      enum record_kind
      {
         poll_record_kind         = 1,
         ballot_record_kind       = 2,
         transaction_record_kind  = 3
      };

      /** every record lives in one LevelDB keyed by ( kind, id ) so a transaction commits in one write */
      struct record_key
      {
         record_key(){}
         record_key( record_kind k, const fc::ripemd160& i )
         :kind(k),id(i){}

         uint8_t         kind = 0;
         fc::ripemd160   id;

         friend bool operator < ( const record_key& a, const record_key& b )
         {
            return std::tie( a.kind, a.id ) < std::tie( b.kind, b.id );
         }
         friend bool operator == ( const record_key& a, const record_key& b )
         {
            return a.kind == b.kind && a.id == b.id;
         }
      };

      typedef tally::db::level_map<record_key, vector<char>>  record_map;

      class chain_database_impl
      {
         public:
            void                                        open_database( const fc::path& data_dir );
            void                                        initialize_chain_id();
            void                                        populate_indexes();

            void                                        index_poll( const poll_id_type& id, const poll_record& record );
            void                                        index_transaction( const transaction& trx );
            void                                        prune_expired_transactions( const time_point_sec now );

            template<typename RecordType>
            optional<RecordType> fetch_record( record_kind kind, const fc::ripemd160& id )const
            {
               const optional<vector<char>> data = _records.fetch_optional( record_key( kind, id ) );
               if( !data.valid() ) return optional<RecordType>();
               return fc::raw::unpack<RecordType>( *data );
            }

            /** adds to the open write, or commits on its own when none is open */
            template<typename RecordType>
            void write_record( record_kind kind, const fc::ripemd160& id, const RecordType& record )
            {
               if( _write_batch )
               {
                  _write_batch->store( record_key( kind, id ), fc::raw::pack( record ) );
                  return;
               }

               auto batch = _records.create_batch( true );
               batch.store( record_key( kind, id ), fc::raw::pack( record ) );
               batch.commit();
            }

            /** writes everything in the pending state with one synced LevelDB write */
            void                                        apply_changes( const pending_chain_state& state );

            void                                        begin_write();
            void                                        commit_write();
            void                                        abort_write();

            chain_database*                                                             self = nullptr;

            /** held while a transaction is evaluated and committed */
            fc::mutex                                                                   _apply_transaction_mutex;
            /** guards the in-memory indexes below, held only for the duration of a single read or update */
            mutable fc::mutex                                                           _index_mutex;

            digest_type                                                                 _chain_id;
            tally::db::level_map<string, variant>                                       _property_db;

            record_map                                                                  _records;
            unique_ptr<record_map::write_batch>                                         _write_batch;
            map<poll_id_type, poll_record>                                              _staged_polls;
            vector<transaction>                                                         _staged_transactions;

            map<poll_id_type, poll_record>                                              _polls;
            map<address, set<poll_id_type>>                                             _authority_to_poll_ids;
            set<pair<int64_t, poll_id_type>>                                            _poll_start_index;

            unordered_set<digest_type>                                                  _unique_transactions;
            std::multimap<time_point_sec, digest_type>                                  _transaction_expirations;
      };

  } // detail
} } // tally::blockchain

FC_REFLECT( tally::blockchain::detail::record_key, (kind)(id) )
