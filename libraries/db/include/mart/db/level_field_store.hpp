#pragma once
#include <mart/db/field_store.hpp>

#include <fc/filesystem.hpp>

namespace mart { namespace db {

   namespace detail { class level_field_store_impl; }

   /**
    *  @brief field_store that persists every word in a LevelDB database
    *
    *  Each set() is written through immediately, so the contents survive a close()
    *  and a later open() of the same directory.
    */
   class level_field_store : public field_store
   {
      public:
         level_field_store();
         ~level_field_store();

         void              open( const fc::path& dir, bool create = true );
         void              close();
         bool              is_open()const;

         virtual word_type get( const uint16_t pointer, const word_type& subkey )const override;
         virtual void      set( const uint16_t pointer, const word_type& subkey, const word_type& value ) override;

      private:
         std::unique_ptr<detail::level_field_store_impl> my;
   };
   typedef std::shared_ptr<level_field_store> level_field_store_ptr;

} } // mart::db
