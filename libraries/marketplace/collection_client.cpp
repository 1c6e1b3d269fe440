#include <mart/marketplace/call_data.hpp>
#include <mart/marketplace/collection_client.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace mart { namespace marketplace {

   remote_collection_client::remote_collection_client( contract_caller& caller )
   :_caller( caller ),
    _owner_of_selector( method_selector( MART_COLLECTION_OWNER_OF_METHOD ) ),
    _is_approved_for_all_selector( method_selector( MART_COLLECTION_IS_APPROVED_FOR_ALL_METHOD ) ),
    _transfer_selector( method_selector( MART_COLLECTION_TRANSFER_METHOD ) )
   {
   }

   bytes remote_collection_client::invoke( const address& collection, const bytes& calldata, const char* method )
   {
      call_result result;
      try {
         result = _caller.call( collection, calldata );
      } catch ( const fc::exception& e ) {
         FC_THROW_EXCEPTION( remote_call_failed, "${method} call to ${collection} threw: ${e}",
                             ("method",method)("collection",collection)("e",e.to_detail_string()) );
      } catch ( const std::exception& e ) {
         FC_THROW_EXCEPTION( remote_call_failed, "${method} call to ${collection} threw: ${e}",
                             ("method",method)("collection",collection)("e",e.what()) );
      }

      if( !result.success )
         FC_THROW_EXCEPTION( remote_call_failed, "${method} call to ${collection} failed",
                             ("method",method)("collection",collection) );
      return result.data;
   }

   address remote_collection_client::owner_of( const address& collection, const token_id_type& token_id )
   {
      call_data_writer calldata( MART_SELECTOR_SIZE + MART_WORD_SIZE );
      calldata.write_selector( _owner_of_selector )
              .write_uint256( token_id );

      call_data_reader response( invoke( collection, calldata.data(), MART_COLLECTION_OWNER_OF_METHOD ) );
      try {
         return response.read_address();
      } catch ( const malformed_calldata& e ) {
         FC_THROW_EXCEPTION( remote_call_failed, "undecodable ownerOf response from ${collection}: ${e}",
                             ("collection",collection)("e",e.to_string()) );
      }
   }

   bool remote_collection_client::is_approved_for_all( const address& collection, const address& owner,
                                                       const address& operator_address )
   {
      call_data_writer calldata( MART_SELECTOR_SIZE + 2 * MART_ADDRESS_SIZE );
      calldata.write_selector( _is_approved_for_all_selector )
              .write_address( owner )
              .write_address( operator_address );

      call_data_reader response( invoke( collection, calldata.data(), MART_COLLECTION_IS_APPROVED_FOR_ALL_METHOD ) );
      try {
         return response.read_bool();
      } catch ( const malformed_calldata& e ) {
         FC_THROW_EXCEPTION( remote_call_failed, "undecodable isApprovedForAll response from ${collection}: ${e}",
                             ("collection",collection)("e",e.to_string()) );
      }
   }

   void remote_collection_client::transfer( const address& collection, const address& from, const address& to,
                                            const token_id_type& token_id )
   {
      call_data_writer calldata( MART_SELECTOR_SIZE + 2 * MART_ADDRESS_SIZE + MART_WORD_SIZE );
      calldata.write_selector( _transfer_selector )
              .write_address( from )
              .write_address( to )
              .write_uint256( token_id );

      invoke( collection, calldata.data(), MART_COLLECTION_TRANSFER_METHOD );
      dlog( "transferred token ${token} of ${collection} from ${from} to ${to}",
            ("token",token_id)("collection",collection)("from",from)("to",to) );
   }

} } // mart::marketplace
