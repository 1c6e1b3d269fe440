#pragma once
#include <leveldb/db.h>
#include <leveldb/comparator.h>

#include <fc/filesystem.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/io/raw.hpp>
#include <fc/exception/exception.hpp>
#include <fc/optional.hpp>

#include <fc/log/logger.hpp>

#include <mart/db/exception.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mart { namespace db {

  namespace ldb = leveldb;

  /**
   *  @brief a LevelDB database holding a single Key -> Value mapping
   *
   *  Keys and values are serialized with fc::raw, keys are ordered by Key::operator<.
   *  Every write goes straight to the database, there is no batching.
   */
  template<typename Key, typename Value>
  class level_map
  {
     public:
        void open( const fc::path& dir, bool create = true )
        { try {
           ldb::Options opts;
           opts.create_if_missing = create;
           opts.comparator        = &_comparer;

           fc::create_directories( dir );

           ldb::DB* ndb = nullptr;
           const auto status = ldb::DB::Open( opts, dir.to_native_ansi_path(), &ndb );
           if( !status.ok() )
              FC_THROW_EXCEPTION( level_map_open_failure, "unable to open database ${db}: ${msg}",
                                  ("db",dir)("msg",status.ToString()) );
           _db.reset( ndb );
        } FC_CAPTURE_AND_RETHROW( (dir)(create) ) }

        bool is_open()const { return !!_db; }
        void close()        { _db.reset(); }

        fc::optional<Value> fetch_optional( const Key& k )const
        { try {
           require_open( "fetch" );

           const std::vector<char> key_bytes = fc::raw::pack( k );
           std::string value_bytes;
           const auto status = _db->Get( ldb::ReadOptions(), to_slice( key_bytes ), &value_bytes );
           if( status.IsNotFound() )
              return fc::optional<Value>();
           check( status );

           fc::datastream<const char*> ds( value_bytes.data(), value_bytes.size() );
           Value v;
           fc::raw::unpack( ds, v );
           return v;
        } FC_RETHROW_EXCEPTIONS( warn, "error fetching key ${key}", ("key",k) ) }

        void store( const Key& k, const Value& v )
        { try {
           require_open( "store" );

           const std::vector<char> key_bytes   = fc::raw::pack( k );
           const std::vector<char> value_bytes = fc::raw::pack( v );
           check( _db->Put( ldb::WriteOptions(), to_slice( key_bytes ), to_slice( value_bytes ) ) );
        } FC_RETHROW_EXCEPTIONS( warn, "error storing ${key} = ${value}", ("key",k)("value",v) ) }

        /** removing a missing key is not an error */
        void remove( const Key& k )
        { try {
           require_open( "remove" );

           const std::vector<char> key_bytes = fc::raw::pack( k );
           const auto status = _db->Delete( ldb::WriteOptions(), to_slice( key_bytes ) );
           if( !status.IsNotFound() )
              check( status );
        } FC_RETHROW_EXCEPTIONS( warn, "error removing ${key}", ("key",k) ) }

     private:
        void require_open( const char* op )const
        {
           if( !is_open() )
              FC_THROW_EXCEPTION( level_map_closed, "${op} on closed database", ("op",op) );
        }

        static void check( const ldb::Status& status )
        {
           if( !status.ok() )
              FC_THROW_EXCEPTION( level_map_failure, "database error: ${msg}", ("msg",status.ToString()) );
        }

        static ldb::Slice to_slice( const std::vector<char>& bytes )
        {
           return ldb::Slice( bytes.data(), bytes.size() );
        }

        class key_compare : public leveldb::Comparator
        {
          public:
            int Compare( const leveldb::Slice& a, const leveldb::Slice& b )const
            {
               Key ak, bk;
               fc::datastream<const char*> dsa( a.data(), a.size() );
               fc::raw::unpack( dsa, ak );
               fc::datastream<const char*> dsb( b.data(), b.size() );
               fc::raw::unpack( dsb, bk );

               if( ak < bk ) return -1;
               if( bk < ak ) return 1;
               return 0;
            }

            const char* Name()const { return "mart_key_compare"; }
            void FindShortestSeparator( std::string*, const leveldb::Slice& )const{}
            void FindShortSuccessor( std::string* )const{}
        };

        key_compare                   _comparer;
        std::unique_ptr<leveldb::DB>  _db;
  };

} } // mart::db
