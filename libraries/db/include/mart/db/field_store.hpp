#pragma once
#include <fc/array.hpp>
#include <fc/reflect/reflect.hpp>

#include <map>
#include <memory>
#include <stdint.h>
#include <tuple>

namespace mart { namespace db {

   /** a single 32 byte storage slot, also used as the sub-key that selects a slot */
   typedef fc::array<char,32> word_type;

   const word_type& zero_word();
   bool             is_zero( const word_type& w );

   /**
    *  Every stored field is addressed by a small pointer, which names the field, and a
    *  32 byte sub-key, which selects the entry for map-like fields.  Singletons use the
    *  zero sub-key.
    */
   struct field_key
   {
      field_key(){}
      field_key( uint16_t p, const word_type& k ):pointer(p),subkey(k){}

      uint16_t    pointer = 0;
      word_type   subkey;

      friend bool operator < ( const field_key& a, const field_key& b )
      {
         return std::tie( a.pointer, a.subkey ) < std::tie( b.pointer, b.subkey );
      }
      friend bool operator == ( const field_key& a, const field_key& b )
      {
         return a.pointer == b.pointer && a.subkey == b.subkey;
      }
   };

   /**
    *  @brief key to word mapping backing all persistent contract state
    *
    *  There is no transactional rollback: a set() is visible to every subsequent get()
    *  as soon as it returns.  Keys that were never written read as the zero word.
    */
   class field_store
   {
      public:
         virtual ~field_store(){}

         virtual word_type get( const uint16_t pointer, const word_type& subkey )const = 0;
         virtual void      set( const uint16_t pointer, const word_type& subkey, const word_type& value ) = 0;
   };
   typedef std::shared_ptr<field_store> field_store_ptr;

   class memory_field_store : public field_store
   {
      public:
         virtual word_type get( const uint16_t pointer, const word_type& subkey )const override;
         virtual void      set( const uint16_t pointer, const word_type& subkey, const word_type& value ) override;

         size_t            size()const { return _fields.size(); }

      private:
         std::map<field_key, word_type> _fields;
   };

} } // mart::db

FC_REFLECT( mart::db::field_key, (pointer)(subkey) )
