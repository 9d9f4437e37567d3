#ifndef _SENDME_ORCHESTRATOR_HPP_
#define _SENDME_ORCHESTRATOR_HPP_
#include <fc/shared_ptr.hpp>
#include <fc/future.hpp>
#include <fc/time.hpp>
#include <boost/shared_ptr.hpp>
#include <sendme/ticket.hpp>
#include <sendme/path_type.hpp>

namespace sm {
  class node;
  class connection;
  class event_channel;
  struct config;

  /**
   *  @class orchestrator
   *
   *  Establishes an authenticated connection to the node named by a ticket,
   *  escalating through the cheapest path that works:
   *
   *  1. dial every address in the ticket at once, the first to authenticate wins
   *  2. if the ticket names a relay, ask it to introduce us so both sides
   *     dial each other's public endpoint at the same time
   *  3. tunnel the connection through the relay
   *
   *  Each stage is bounded by its own timeout.  A failed stage is logged
   *  and the next one is tried.  A connection that completes after its
   *  stage gave up is closed.
   */
  class orchestrator {
    public:
      typedef fc::shared_ptr<connection> connection_ptr;

      struct options {
        options();
        explicit options( const config& c );

        fc::microseconds direct_timeout;
        fc::microseconds hole_punch_timeout;
        fc::microseconds relay_timeout;
        bool             enable_direct;
        bool             enable_hole_punch;
        bool             enable_relay;
      };

      orchestrator( node& n, const options& o, event_channel* events = 0 );

      /**
       *  @throw connection_error listing every stage that was attempted
       *  @throw cancelled if cancel() was called first
       */
      connection_ptr             connect( const ticket& t );
      fc::future<connection_ptr> connect_async( const ticket& t );

      /// makes a running connect() throw cancelled, may be called from any thread
      void cancel();

    private:
      connection_ptr dial_direct( const ticket& t );
      connection_ptr hole_punch( const ticket& t, const boost::shared_ptr<connection_ptr>& relay );
      connection_ptr relayed( const ticket& t, const boost::shared_ptr<connection_ptr>& relay );

      static connection_ptr relay_connection( node& n, const ticket& t, const fc::microseconds& timeout );

      node&                    _node;
      options                  _opts;
      event_channel*           _events;
      boost::shared_ptr<bool>  _cancelled;
  };

}

#endif // _SENDME_ORCHESTRATOR_HPP_
