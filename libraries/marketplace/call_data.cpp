#include <mart/marketplace/call_data.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>

#include <fc/crypto/sha256.hpp>

#include <string.h>

namespace mart { namespace marketplace {

   method_selector_type method_selector( const string& name )
   {
      const fc::sha256 digest = fc::sha256::hash( name.c_str(), name.size() );
      const unsigned char* d = (const unsigned char*)digest.data();
      return (method_selector_type(d[0]) << 24) | (method_selector_type(d[1]) << 16)
           | (method_selector_type(d[2]) << 8)  |  method_selector_type(d[3]);
   }

   call_data_writer& call_data_writer::write_selector( method_selector_type selector )
   {
      _data.push_back( char( (selector >> 24) & 0xff ) );
      _data.push_back( char( (selector >> 16) & 0xff ) );
      _data.push_back( char( (selector >> 8)  & 0xff ) );
      _data.push_back( char(  selector        & 0xff ) );
      return *this;
   }

   call_data_writer& call_data_writer::write_uint256( const uint256& value )
   {
      write_word( to_word( value ) );
      return *this;
   }

   call_data_writer& call_data_writer::write_address( const address& value )
   {
      write_word( value.addr );
      return *this;
   }

   call_data_writer& call_data_writer::write_bool( bool value )
   {
      _data.push_back( value ? 1 : 0 );
      return *this;
   }

   void call_data_writer::write_word( const word_type& w )
   {
      _data.insert( _data.end(), w.data, w.data + MART_WORD_SIZE );
   }

   void call_data_reader::require( size_t n )const
   {
      if( remaining() < n )
         FC_THROW_EXCEPTION( malformed_calldata, "need ${n} bytes at offset ${pos}, only ${left} left",
                             ("n",n)("pos",_pos)("left",remaining()) );
   }

   method_selector_type call_data_reader::read_selector()
   {
      require( MART_SELECTOR_SIZE );
      const unsigned char* d = (const unsigned char*)_data.data() + _pos;
      _pos += MART_SELECTOR_SIZE;
      return (method_selector_type(d[0]) << 24) | (method_selector_type(d[1]) << 16)
           | (method_selector_type(d[2]) << 8)  |  method_selector_type(d[3]);
   }

   word_type call_data_reader::read_word()
   {
      require( MART_WORD_SIZE );
      word_type w;
      memcpy( w.data, _data.data() + _pos, MART_WORD_SIZE );
      _pos += MART_WORD_SIZE;
      return w;
   }

   uint256 call_data_reader::read_uint256()
   {
      uint256 value;
      from_word( read_word(), value );
      return value;
   }

   address call_data_reader::read_address()
   {
      return address( read_word() );
   }

   bool call_data_reader::read_bool()
   {
      require( 1 );
      return _data[_pos++] != 0;
   }

} } // mart::marketplace
