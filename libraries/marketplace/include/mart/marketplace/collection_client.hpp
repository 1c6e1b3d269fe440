#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/types.hpp>

namespace mart { namespace marketplace {

   struct call_result
   {
      bool     success = false;
      bytes    data;
   };

   /**
    *  @brief the host's synchronous cross contract call
    *
    *  A call either returns success with the callee's response, or reports failure with
    *  no effect on the callee.  Implementations may also throw.
    */
   class contract_caller
   {
      public:
         virtual ~contract_caller(){}

         virtual call_result call( const address& target, const bytes& calldata ) = 0;
   };

   /**
    *  @brief the three questions the marketplace asks of a collection contract
    *
    *  The collection is the only source of truth for ownership, nothing returned here may
    *  be cached across calls.  Every method throws remote_call_failed when the collection
    *  does not report success or its response cannot be decoded.
    */
   class collection_client
   {
      public:
         virtual ~collection_client(){}

         virtual address   owner_of( const address& collection, const token_id_type& token_id ) = 0;
         virtual bool      is_approved_for_all( const address& collection, const address& owner,
                                                const address& operator_address ) = 0;
         virtual void      transfer( const address& collection, const address& from, const address& to,
                                     const token_id_type& token_id ) = 0;
   };

   /**
    *  @brief collection_client that encodes each question as a call through the host
    */
   class remote_collection_client : public collection_client
   {
      public:
         remote_collection_client( contract_caller& caller );

         virtual address   owner_of( const address& collection, const token_id_type& token_id ) override;
         virtual bool      is_approved_for_all( const address& collection, const address& owner,
                                                const address& operator_address ) override;
         virtual void      transfer( const address& collection, const address& from, const address& to,
                                     const token_id_type& token_id ) override;

      private:
         bytes             invoke( const address& collection, const bytes& calldata, const char* method );

         contract_caller&        _caller;
         method_selector_type    _owner_of_selector;
         method_selector_type    _is_approved_for_all_selector;
         method_selector_type    _transfer_selector;
   };

} } // mart::marketplace

FC_REFLECT( mart::marketplace::call_result, (success)(data) )
