#include <mart/db/level_field_store.hpp>
#include <mart/db/level_map.hpp>

namespace mart { namespace db {

   namespace detail
   {
      class level_field_store_impl
      {
         public:
            level_map<field_key, word_type>   _fields;
      };
   }

   level_field_store::level_field_store()
   :my( new detail::level_field_store_impl() )
   {
   }

   level_field_store::~level_field_store()
   {
      close();
   }

   void level_field_store::open( const fc::path& dir, bool create )
   { try {
      my->_fields.open( dir / "fields", create );
      ilog( "opened field store at ${dir}", ("dir",dir) );
   } FC_RETHROW_EXCEPTIONS( warn, "error opening field store ${dir}", ("dir",dir)("create",create) ) }

   void level_field_store::close()
   {
      my->_fields.close();
   }

   bool level_field_store::is_open()const
   {
      return my->_fields.is_open();
   }

   word_type level_field_store::get( const uint16_t pointer, const word_type& subkey )const
   { try {
      const auto value = my->_fields.fetch_optional( field_key( pointer, subkey ) );
      if( !value.valid() )
         return zero_word();
      return *value;
   } FC_CAPTURE_AND_RETHROW( (pointer)(subkey) ) }

   void level_field_store::set( const uint16_t pointer, const word_type& subkey, const word_type& value )
   { try {
      if( is_zero( value ) )
         my->_fields.remove( field_key( pointer, subkey ) );
      else
         my->_fields.store( field_key( pointer, subkey ), value );
   } FC_CAPTURE_AND_RETHROW( (pointer)(subkey)(value) ) }

} } // mart::db
