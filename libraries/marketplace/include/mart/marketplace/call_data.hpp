#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/types.hpp>

namespace mart { namespace marketplace {

   /** first four bytes of sha256( name ), big endian */
   method_selector_type  method_selector( const string& name );

   /**
    *  @brief encodes call arguments and results
    *
    *  Integers are written as 32 byte big endian words, addresses as their 32 raw bytes,
    *  booleans as a single byte and selectors as 4 byte big endian integers.
    */
   class call_data_writer
   {
      public:
         call_data_writer( size_t reserve = 0 ) { _data.reserve( reserve ); }

         call_data_writer&   write_selector( method_selector_type selector );
         call_data_writer&   write_uint256( const uint256& value );
         call_data_writer&   write_address( const address& value );
         call_data_writer&   write_bool( bool value );

         const bytes&        data()const { return _data; }

      private:
         void                write_word( const word_type& w );

         bytes               _data;
   };

   /**
    *  @brief decodes arguments written by call_data_writer
    *
    *  Reading past the end throws malformed_calldata; nothing is consumed in that case.
    */
   class call_data_reader
   {
      public:
         call_data_reader( const bytes& data ):_data(data),_pos(0){}

         method_selector_type read_selector();
         uint256              read_uint256();
         address              read_address();
         bool                 read_bool();

         size_t               remaining()const { return _data.size() - _pos; }

      private:
         word_type            read_word();
         void                 require( size_t n )const;

         bytes                _data;
         size_t               _pos;
   };

} } // mart::marketplace
