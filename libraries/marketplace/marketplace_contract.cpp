#include <mart/marketplace/call_data.hpp>
#include <mart/marketplace/config.hpp>
#include <mart/marketplace/exceptions.hpp>
#include <mart/marketplace/marketplace_contract.hpp>

#include <fc/log/logger.hpp>

namespace mart { namespace marketplace {

   namespace detail
   {
      class marketplace_contract_impl
      {
         public:
            typedef bytes (marketplace_contract_impl::*method_handler)( const address& sender, call_data_reader& args );

            struct method_entry
            {
               string           name;
               method_handler   handler;
            };

            marketplace_contract_impl( const marketplace_config& cfg, db::field_store& store,
                                       contract_caller& host, event_sink& events )
            :_collection_client( host ),
             _engine( cfg, store, _collection_client, events )
            {
               register_method( "listNFT",                 &marketplace_contract_impl::list_nft );
               register_method( "cancelListing",           &marketplace_contract_impl::cancel_listing );
               register_method( "buyNFT",                  &marketplace_contract_impl::buy_nft );
               register_method( "placeBid",                &marketplace_contract_impl::place_bid );
               register_method( "cancelBid",               &marketplace_contract_impl::cancel_bid );
               register_method( "acceptBid",               &marketplace_contract_impl::accept_bid );
               register_method( "registerCollection",      &marketplace_contract_impl::register_collection );
               register_method( "setPlatformFee",          &marketplace_contract_impl::set_platform_fee );
               register_method( "setPlatformFeeRecipient", &marketplace_contract_impl::set_platform_fee_recipient );
               register_method( "updateRoyalty",           &marketplace_contract_impl::update_royalty );
               register_method( "getListing",              &marketplace_contract_impl::get_listing );
               register_method( "getBid",                  &marketplace_contract_impl::get_bid );
               register_method( "getCollectionInfo",       &marketplace_contract_impl::get_collection_info );
               register_method( "getPlatformInfo",         &marketplace_contract_impl::get_platform_info );
            }

            void register_method( const string& name, method_handler handler )
            {
               const method_selector_type selector = method_selector( name );
               FC_ASSERT( _methods.find( selector ) == _methods.end(), "selector collision for ${name}", ("name",name) );
               method_entry entry;
               entry.name    = name;
               entry.handler = handler;
               _methods[selector] = entry;
            }

            static bytes success()
            {
               call_data_writer result( 1 );
               result.write_bool( true );
               return result.data();
            }

            bytes list_nft( const address& sender, call_data_reader& args )
            {
               const address       collection = args.read_address();
               const token_id_type token_id   = args.read_uint256();
               const uint256       price      = args.read_uint256();

               call_data_writer result( MART_WORD_SIZE );
               result.write_uint256( _engine.list_nft( sender, collection, token_id, price ) );
               return result.data();
            }

            bytes cancel_listing( const address& sender, call_data_reader& args )
            {
               _engine.cancel_listing( sender, args.read_uint256() );
               return success();
            }

            bytes buy_nft( const address& sender, call_data_reader& args )
            {
               _engine.buy_nft( sender, args.read_uint256() );
               return success();
            }

            bytes place_bid( const address& sender, call_data_reader& args )
            {
               const address       collection = args.read_address();
               const token_id_type token_id   = args.read_uint256();
               const uint256       amount     = args.read_uint256();

               call_data_writer result( MART_WORD_SIZE );
               result.write_uint256( _engine.place_bid( sender, collection, token_id, amount ) );
               return result.data();
            }

            bytes cancel_bid( const address& sender, call_data_reader& args )
            {
               _engine.cancel_bid( sender, args.read_uint256() );
               return success();
            }

            bytes accept_bid( const address& sender, call_data_reader& args )
            {
               _engine.accept_bid( sender, args.read_uint256() );
               return success();
            }

            bytes register_collection( const address& sender, call_data_reader& args )
            {
               const address collection  = args.read_address();
               const uint256 royalty_bps = args.read_uint256();
               const address recipient   = args.read_address();

               _engine.register_collection( sender, collection, royalty_bps, recipient );
               return success();
            }

            bytes set_platform_fee( const address& sender, call_data_reader& args )
            {
               _engine.set_platform_fee( sender, args.read_uint256() );
               return success();
            }

            bytes set_platform_fee_recipient( const address& sender, call_data_reader& args )
            {
               _engine.set_platform_fee_recipient( sender, args.read_address() );
               return success();
            }

            bytes update_royalty( const address& sender, call_data_reader& args )
            {
               const address collection  = args.read_address();
               const uint256 royalty_bps = args.read_uint256();
               const address recipient   = args.read_address();

               _engine.update_royalty( sender, collection, royalty_bps, recipient );
               return success();
            }

            bytes get_listing( const address&, call_data_reader& args )
            {
               const listing_record listing = _engine.get_listing( args.read_uint256() );

               call_data_writer result( 5 * MART_WORD_SIZE );
               result.write_address( listing.collection )
                     .write_uint256( listing.token_id )
                     .write_address( listing.seller )
                     .write_uint256( listing.price )
                     .write_uint256( listing.active ? 1 : 0 );
               return result.data();
            }

            bytes get_bid( const address&, call_data_reader& args )
            {
               const bid_record bid = _engine.get_bid( args.read_uint256() );

               call_data_writer result( 5 * MART_WORD_SIZE );
               result.write_address( bid.collection )
                     .write_uint256( bid.token_id )
                     .write_address( bid.bidder )
                     .write_uint256( bid.amount )
                     .write_uint256( bid.active ? 1 : 0 );
               return result.data();
            }

            bytes get_collection_info( const address&, call_data_reader& args )
            {
               const collection_record info = _engine.get_collection_info( args.read_address() );

               call_data_writer result( 3 * MART_WORD_SIZE );
               result.write_uint256( info.registered ? 1 : 0 )
                     .write_uint256( info.royalty_bps )
                     .write_address( info.royalty_recipient );
               return result.data();
            }

            bytes get_platform_info( const address&, call_data_reader& )
            {
               const platform_record info = _engine.get_platform_info();

               call_data_writer result( 4 * MART_WORD_SIZE );
               result.write_uint256( info.fee_bps )
                     .write_address( info.fee_recipient )
                     .write_uint256( info.total_volume )
                     .write_uint256( info.total_listings );
               return result.data();
            }

            remote_collection_client                          _collection_client;
            marketplace_engine                                _engine;
            std::map<method_selector_type, method_entry>      _methods;
      };
   }

   marketplace_contract::marketplace_contract( const marketplace_config& cfg, db::field_store& store,
                                               contract_caller& host, event_sink& events )
   :my( new detail::marketplace_contract_impl( cfg, store, host, events ) )
   {
   }

   marketplace_contract::~marketplace_contract(){}

   void marketplace_contract::on_deployment( const address& sender, const bytes& calldata )
   { try {
      call_data_reader args( calldata );
      const address fee_recipient = args.read_address();
      const uint256 fee_bps       = args.read_uint256();

      my->_engine.initialize( sender, fee_recipient, fee_bps );
   } FC_CAPTURE_AND_RETHROW( (sender) ) }

   bytes marketplace_contract::execute( const address& sender, method_selector_type selector,
                                        const bytes& calldata )
   {
      const auto itr = my->_methods.find( selector );
      if( itr == my->_methods.end() )
         FC_THROW_EXCEPTION( unknown_method, "no method with selector ${selector}", ("selector",selector) );

      try {
         call_data_reader args( calldata );
         return (my.get()->*(itr->second.handler))( sender, args );
      } FC_RETHROW_EXCEPTIONS( warn, "${method} called by ${sender}", ("method",itr->second.name)("sender",sender) )
   }

   bytes marketplace_contract::execute( const address& sender, const bytes& input )
   {
      call_data_reader reader( input );
      const method_selector_type selector = reader.read_selector();
      return execute( sender, selector, bytes( input.begin() + MART_SELECTOR_SIZE, input.end() ) );
   }

   std::map<method_selector_type, string> marketplace_contract::methods()const
   {
      std::map<method_selector_type, string> result;
      for( const auto& item : my->_methods )
         result[item.first] = item.second.name;
      return result;
   }

   marketplace_engine& marketplace_contract::engine()
   {
      return my->_engine;
   }

} } // mart::marketplace
