#include <mart/marketplace/address.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>

#include <fc/crypto/hex.hpp>

#include <string.h>

namespace mart { namespace marketplace {

   address::address()
   {
      memset( addr.data, 0, sizeof(addr.data) );
   }

   address::address( const word_type& bytes )
   :addr( bytes )
   {
   }

   address::address( const std::string& hex )
   {
      memset( addr.data, 0, sizeof(addr.data) );
      if( hex.size() != 2 * MART_ADDRESS_SIZE )
         FC_CAPTURE_AND_THROW( invalid_argument, (hex) );
      const size_t decoded = fc::from_hex( hex, addr.data, sizeof(addr.data) );
      if( decoded != MART_ADDRESS_SIZE )
         FC_CAPTURE_AND_THROW( invalid_argument, (hex)(decoded) );
   }

   bool address::is_null()const
   {
      return mart::db::is_zero( addr );
   }

   address::operator std::string()const
   {
      return fc::to_hex( addr.data, sizeof(addr.data) );
   }

   word_type to_word( const address& value )
   {
      return value.addr;
   }

   void from_word( const word_type& w, address& value )
   {
      value.addr = w;
   }

} } // mart::marketplace

namespace fc
{
   void to_variant( const mart::marketplace::address& var,  variant& vo )
   {
      vo = std::string( var );
   }

   void from_variant( const variant& var,  mart::marketplace::address& vo )
   {
      vo = mart::marketplace::address( var.as_string() );
   }
}
