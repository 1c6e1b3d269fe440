#pragma once
#include <mart/marketplace/types.hpp>

#include <fc/reflect/reflect.hpp>

#include <string.h>

namespace mart { namespace marketplace {

   /**
    *  @brief a 32 byte account or contract identity
    *
    *  The all zero address is the null address; it never owns anything and is rejected
    *  wherever a collection or recipient is expected.  Converts to and from a hex string.
    */
   class address
   {
      public:
       address(); ///< constructs the null address
       explicit address( const word_type& bytes );
       explicit address( const std::string& hex ); ///< 64 hex characters

       bool                 is_null()const;
       explicit operator    std::string()const;

       word_type            addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

   word_type   to_word( const address& value );
   void        from_word( const word_type& w, address& value );

} } // namespace mart::marketplace

namespace fc
{
   void to_variant( const mart::marketplace::address& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  mart::marketplace::address& vo );
}

namespace std
{
   template<>
   struct hash<mart::marketplace::address>
   {
       public:
         size_t operator()(const mart::marketplace::address &a) const
         {
            size_t seed = 0;
            memcpy( &seed, a.addr.data, sizeof(seed) );
            return seed;
         }
   };
}

FC_REFLECT( mart::marketplace::address, (addr) )
