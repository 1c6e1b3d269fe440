#pragma once
#include <mart/marketplace/address.hpp>
#include <mart/marketplace/field_pointer.hpp>
#include <mart/marketplace/types.hpp>

namespace mart { namespace marketplace {

   /**
    *  @brief a single typed field kept under the zero sub-key of its pointer
    *
    *  Value must have to_word() / from_word() overloads, see types.hpp and address.hpp.
    */
   template<typename Value>
   class stored_value
   {
      public:
         stored_value( db::field_store& store, field_pointer pointer )
         :_store(store),_pointer(pointer){}

         Value get()const
         {
            Value v;
            from_word( _store.get( uint16_t(_pointer), db::zero_word() ), v );
            return v;
         }

         void set( const Value& v )
         {
            _store.set( uint16_t(_pointer), db::zero_word(), to_word( v ) );
         }

      private:
         db::field_store&  _store;
         field_pointer     _pointer;
   };

   /**
    *  @brief a typed field with one entry per key, the key becomes the sub-key
    */
   template<typename Key, typename Value>
   class stored_map
   {
      public:
         stored_map( db::field_store& store, field_pointer pointer )
         :_store(store),_pointer(pointer){}

         Value get( const Key& k )const
         {
            Value v;
            from_word( _store.get( uint16_t(_pointer), to_word( k ) ), v );
            return v;
         }

         void set( const Key& k, const Value& v )
         {
            _store.set( uint16_t(_pointer), to_word( k ), to_word( v ) );
         }

      private:
         db::field_store&  _store;
         field_pointer     _pointer;
   };

} } // mart::marketplace
