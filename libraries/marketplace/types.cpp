#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/types.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string.h>

namespace mart { namespace marketplace {

   word_type to_word( const uint256& value )
   {
      vector<unsigned char> be;
      be.reserve( MART_WORD_SIZE );
      boost::multiprecision::export_bits( value, std::back_inserter( be ), 8 );

      word_type w;
      memset( w.data, 0, sizeof(w.data) );
      FC_ASSERT( be.size() <= MART_WORD_SIZE );
      std::copy( be.begin(), be.end(), (unsigned char*)w.data + (MART_WORD_SIZE - be.size()) );
      return w;
   }

   word_type to_word( bool value )
   {
      return to_word( uint256( value ? 1 : 0 ) );
   }

   void from_word( const word_type& w, uint256& value )
   {
      const unsigned char* begin = (const unsigned char*)w.data;
      boost::multiprecision::import_bits( value, begin, begin + MART_WORD_SIZE, 8 );
   }

   void from_word( const word_type& w, bool& value )
   {
      value = !mart::db::is_zero( w );
   }

   uint256 safe_add( const uint256& a, const uint256& b )
   {
      if( a > std::numeric_limits<uint256>::max() - b )
      {
         FC_THROW_EXCEPTION( addition_overflow, "uint256 addition overflow ${a} + ${b}",
                             ("a",a)("b",b) );
      }
      return a + b;
   }

} } // mart::marketplace

namespace fc
{
   void to_variant( const mart::marketplace::uint256& var,  variant& vo )
   {
      vo = var.str();
   }

   void from_variant( const variant& var,  mart::marketplace::uint256& vo )
   {
      vo = mart::marketplace::uint256( var.as_string().c_str() );
   }
}
