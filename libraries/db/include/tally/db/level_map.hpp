#pragma once
#include <leveldb/db.h>
#include <leveldb/comparator.h>
#include <leveldb/write_batch.h>

#include <fc/filesystem.hpp>
#include <fc/optional.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/io/raw.hpp>
#include <fc/exception/exception.hpp>

#include <fc/log/logger.hpp>

#include <tally/db/exception.hpp>

#include <memory>

namespace tally { namespace db {

  namespace ldb = leveldb;

  /**
   *  @brief implements a high-level API on top of Level DB that stores items using fc::raw / reflection
   *
   *  Keys are compared by unpacking them and using Key::operator<, so iteration order matches the
   *  ordering of the key type rather than the ordering of its packed bytes.
   */
  template<typename Key, typename Value>
  class level_map
  {
     public:
        void open( const fc::path& dir, bool create = true )
        { try {
           ldb::Options opts;
           opts.create_if_missing = create;
           opts.comparator = & _comparer;

           /// \warning Given path must exist to succeed toNativeAnsiPath
           fc::create_directories(dir);

           std::string ldbPath = dir.to_native_ansi_path();

           ldb::DB* ndb = nullptr;
           auto ntrxstat = ldb::DB::Open( opts, ldbPath.c_str(), &ndb );
           if( !ntrxstat.ok() )
           {
               FC_THROW_EXCEPTION( level_map_open_failure, "Unable to open database ${db}\n\t${msg}",
                    ("db",dir)
                    ("msg",ntrxstat.ToString())
                    );
           }
           _db.reset(ndb);
        } FC_CAPTURE_AND_RETHROW( (dir)(create) ) }

        bool is_open()const
        {
          return !!_db;
        }

        void close()
        {
          _db.reset();
        }

        fc::optional<Value> fetch_optional( const Key& k )const
        { try {
           check_open();
           std::vector<char> kslice = fc::raw::pack( k );
           ldb::Slice ks( kslice.data(), kslice.size() );
           std::string value;
           auto status = _db->Get( ldb::ReadOptions(), ks, &value );
           if( status.IsNotFound() )
             return fc::optional<Value>();
           if( !status.ok() )
             FC_THROW_EXCEPTION( level_map_failure, "database error: ${msg}", ("msg", status.ToString() ) );

           fc::datastream<const char*> ds( value.c_str(), value.size() );
           Value tmp;
           fc::raw::unpack( ds, tmp );
           return tmp;
        } FC_RETHROW_EXCEPTIONS( warn, "error fetching key ${key}", ("key",k) ) }

        class iterator
        {
           public:
             iterator(){}
             bool valid()const
             {
                return _it && _it->Valid();
             }

             Key key()const
             {
                 Key tmp_key;
                 fc::datastream<const char*> ds2( _it->key().data(), _it->key().size() );
                 fc::raw::unpack( ds2, tmp_key );
                 return tmp_key;
             }

             Value value()const
             {
               Value tmp_val;
               fc::datastream<const char*> ds( _it->value().data(), _it->value().size() );
               fc::raw::unpack( ds, tmp_val );
               return tmp_val;
             }

             iterator& operator++()    { _it->Next(); return *this; }

           protected:
             friend class level_map;
             iterator( ldb::Iterator* it )
             :_it(it){}

             std::shared_ptr<ldb::Iterator> _it;
        };

        iterator begin()const
        { try {
           check_open();
           iterator itr( _db->NewIterator( ldb::ReadOptions() ) );
           itr._it->SeekToFirst();

           if( !itr._it->status().ok() )
               FC_THROW_EXCEPTION( level_map_failure, "database error: ${msg}", ("msg", itr._it->status().ToString() ) );

           if( itr.valid() )
              return itr;
           return iterator();
        } FC_RETHROW_EXCEPTIONS( warn, "error seeking to first" ) }


        void store( const Key& k, const Value& v )
        { try {
           check_open();

           std::vector<char> kslice = fc::raw::pack( k );
           ldb::Slice ks( kslice.data(), kslice.size() );

           auto vec = fc::raw::pack(v);
           ldb::Slice vs( vec.data(), vec.size() );

           auto status = _db->Put( ldb::WriteOptions(), ks, vs );
           if( !status.ok() )
               FC_THROW_EXCEPTION( level_map_failure, "database error: ${msg}", ("msg", status.ToString() ) );
        } FC_RETHROW_EXCEPTIONS( warn, "error storing ${key} = ${value}", ("key",k)("value",v) ) }

        /**
         *  Collects stores and writes them to LevelDB in a single atomic Write.  Nothing
         *  reaches the database until commit() and a batch that is never committed has no effect.
         */
        class write_batch
        {
           public:
             void store( const Key& k, const Value& v )
             {
                std::vector<char> kslice = fc::raw::pack( k );
                std::vector<char> vslice = fc::raw::pack( v );
                _batch.Put( ldb::Slice( kslice.data(), kslice.size() ), ldb::Slice( vslice.data(), vslice.size() ) );
             }

             void commit()
             { try {
                _map->check_open();
                ldb::WriteOptions opts;
                opts.sync = _sync;
                auto status = _map->_db->Write( opts, &_batch );
                if( !status.ok() )
                   FC_THROW_EXCEPTION( level_map_failure, "database error: ${msg}", ("msg", status.ToString() ) );
                _batch.Clear();
             } FC_RETHROW_EXCEPTIONS( warn, "error committing write batch" ) }

           private:
             friend class level_map;
             write_batch( level_map* map, bool sync )
             :_map(map),_sync(sync){}

             level_map*       _map;
             bool             _sync;
             ldb::WriteBatch  _batch;
        };

        write_batch create_batch( bool sync = false )
        {
           check_open();
           return write_batch( this, sync );
        }

     private:
        void check_open()const
        {
           if( !_db )
              FC_THROW_EXCEPTION( level_map_closed, "database is not open" );
        }

        class key_compare : public leveldb::Comparator
        {
          public:
            int Compare( const leveldb::Slice& a, const leveldb::Slice& b )const
            {
               Key ak,bk;
               fc::datastream<const char*> dsa( a.data(), a.size() );
               fc::raw::unpack( dsa, ak );
               fc::datastream<const char*> dsb( b.data(), b.size() );
               fc::raw::unpack( dsb, bk );

               if( ak  < bk ) return -1;
               if( ak == bk ) return 0;
               return 1;
            }

            const char* Name()const { return "key_compare"; }
            void FindShortestSeparator( std::string*, const leveldb::Slice& )const{}
            void FindShortSuccessor( std::string* )const{};
        };

        key_compare                  _comparer;
        std::unique_ptr<leveldb::DB> _db;
  };

} } // tally::db
