#include <mart/db/field_store.hpp>

#include <string.h>

namespace mart { namespace db {

   const word_type& zero_word()
   {
      static const word_type zero = [](){
         word_type w;
         memset( w.data, 0, sizeof(w.data) );
         return w;
      }();
      return zero;
   }

   bool is_zero( const word_type& w )
   {
      return w == zero_word();
   }

   word_type memory_field_store::get( const uint16_t pointer, const word_type& subkey )const
   {
      auto itr = _fields.find( field_key( pointer, subkey ) );
      if( itr == _fields.end() )
         return zero_word();
      return itr->second;
   }

   void memory_field_store::set( const uint16_t pointer, const word_type& subkey, const word_type& value )
   {
      // a zero word is indistinguishable from an unset one, no need to keep it around
      if( is_zero( value ) )
         _fields.erase( field_key( pointer, subkey ) );
      else
         _fields[ field_key( pointer, subkey ) ] = value;
   }

} } // mart::db
