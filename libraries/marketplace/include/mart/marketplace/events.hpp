#pragma once

#include <mart/marketplace/address.hpp>
#include <mart/marketplace/types.hpp>

namespace mart { namespace marketplace {

   /** a named event and its packed payload, as handed to the host */
   struct event_record
   {
      event_record(){}
      event_record( const string& n, const bytes& d ):name(n),data(d){}

      string   name;
      bytes    data;
   };

   struct listing_created_event
   {
      static const char* const name;

      listing_created_event(){}
      listing_created_event( const listing_id_type& id, const address& c, const token_id_type& t,
                             const address& s, const uint256& p )
      :listing_id(id),collection(c),token_id(t),seller(s),price(p){}

      bytes pack()const;

      listing_id_type   listing_id;
      address           collection;
      token_id_type     token_id;
      address           seller;
      uint256           price;
   };

   struct listing_cancelled_event
   {
      static const char* const name;

      listing_cancelled_event(){}
      explicit listing_cancelled_event( const listing_id_type& id ):listing_id(id){}

      bytes pack()const;

      listing_id_type   listing_id;
   };

   struct listing_sold_event
   {
      static const char* const name;

      listing_sold_event(){}
      listing_sold_event( const listing_id_type& id, const address& b, const uint256& p )
      :listing_id(id),buyer(b),price(p){}

      bytes pack()const;

      listing_id_type   listing_id;
      address           buyer;
      uint256           price;
   };

   struct bid_placed_event
   {
      static const char* const name;

      bid_placed_event(){}
      bid_placed_event( const bid_id_type& id, const address& c, const token_id_type& t,
                        const address& b, const uint256& a )
      :bid_id(id),collection(c),token_id(t),bidder(b),amount(a){}

      bytes pack()const;

      bid_id_type       bid_id;
      address           collection;
      token_id_type     token_id;
      address           bidder;
      uint256           amount;
   };

   struct bid_cancelled_event
   {
      static const char* const name;

      bid_cancelled_event(){}
      explicit bid_cancelled_event( const bid_id_type& id ):bid_id(id){}

      bytes pack()const;

      bid_id_type       bid_id;
   };

   struct bid_accepted_event
   {
      static const char* const name;

      bid_accepted_event(){}
      bid_accepted_event( const bid_id_type& id, const address& s ):bid_id(id),seller(s){}

      bytes pack()const;

      bid_id_type       bid_id;
      address           seller;
   };

   struct collection_registered_event
   {
      static const char* const name;

      collection_registered_event(){}
      collection_registered_event( const address& c, const uint256& bps ):collection(c),royalty_bps(bps){}

      bytes pack()const;

      address           collection;
      uint256           royalty_bps;
   };

   template<typename EventType>
   event_record make_event_record( const EventType& e )
   {
      return event_record( EventType::name, e.pack() );
   }

   /**
    *  @brief receives events in the order the engine emits them
    */
   class event_sink
   {
      public:
         virtual ~event_sink(){}

         virtual void emit( const event_record& e ) = 0;

         template<typename EventType>
         void emit_event( const EventType& e ) { emit( make_event_record( e ) ); }
   };

   /**
    *  @brief an event_sink that keeps everything in memory
    */
   class event_log : public event_sink
   {
      public:
         virtual void emit( const event_record& e ) override;

         const vector<event_record>&  events()const { return _events; }
         size_t                       size()const   { return _events.size(); }

         /** @pre size() > 0 */
         const event_record&          last()const;
         void                         clear()       { _events.clear(); }

      private:
         vector<event_record>         _events;
   };

} } // mart::marketplace

FC_REFLECT( mart::marketplace::event_record, (name)(data) )
FC_REFLECT( mart::marketplace::listing_created_event, (listing_id)(collection)(token_id)(seller)(price) )
FC_REFLECT( mart::marketplace::listing_cancelled_event, (listing_id) )
FC_REFLECT( mart::marketplace::listing_sold_event, (listing_id)(buyer)(price) )
FC_REFLECT( mart::marketplace::bid_placed_event, (bid_id)(collection)(token_id)(bidder)(amount) )
FC_REFLECT( mart::marketplace::bid_cancelled_event, (bid_id) )
FC_REFLECT( mart::marketplace::bid_accepted_event, (bid_id)(seller) )
FC_REFLECT( mart::marketplace::collection_registered_event, (collection)(royalty_bps) )
