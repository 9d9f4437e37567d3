#include <sendme/orchestrator.hpp>
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/events.hpp>
#include <sendme/config.hpp>
#include <sendme/error.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/shared_ptr.hpp>
#include <string>
#include <vector>

namespace sm {

  namespace {
    typedef fc::promise<orchestrator::connection_ptr>::ptr connection_promise;

    /**
     *  Outcome of concurrent dials.  Only touched from the node's thread.
     *  Once the waiter gives up the race is abandoned and any connection
     *  that completes afterwards is closed.
     */
    struct dial_race {
      dial_race( uint32_t n )
      :remaining(n),done(false),abandoned(false),prom( new fc::promise<orchestrator::connection_ptr>() ){}

      void finish( const orchestrator::connection_ptr& c ) {
        --remaining;
        if( !!c ) {
          if( abandoned ) {
            slog( "closing connection that completed after its stage ended" );
            c->close();
          } else if( !done ) {
            done   = true;
            winner = c;
            prom->set_value(c);
          } else if( c.get() != winner.get() ) {
            // another address of the same node also answered
            c->close();
          }
        }
        if( !remaining && !done ) {
          done = true;
          prom->set_value( orchestrator::connection_ptr() );
        }
      }

      void abandon() {
        abandoned = true;
        if( !!winner ) {
          winner->close();
          winner.reset();
        }
      }

      uint32_t                      remaining;
      bool                          done;
      bool                          abandoned;
      connection_promise            prom;
      orchestrator::connection_ptr  winner;
    };
    typedef boost::shared_ptr<dial_race> race_ptr;

    /// the relay connection a stage opened, handed on to the next stage
    typedef boost::shared_ptr<orchestrator::connection_ptr> relay_box;

    /**
     *  Waits for a stage on the node's thread, checking for cancellation
     *  between slices.
     *
     *  @return the winning connection or null if the stage ran out of time
     *  @throw  cancelled
     */
    orchestrator::connection_ptr await( const race_ptr& race, const fc::microseconds& budget, const boost::shared_ptr<bool>& cancel_flag ) {
      fc::time_point deadline = fc::time_point::now() + budget;
      while( true ) {
        if( *cancel_flag ) {
          race->abandon();
          SENDME_THROW( cancelled, "connecting cancelled" );
        }
        try {
          return race->prom->wait( fc::milliseconds(100) );
        } catch ( const fc::future_wait_timeout& ) {
          if( fc::time_point::now() >= deadline ) {
            race->abandon();
            return orchestrator::connection_ptr();
          }
        }
      }
    }
  }

  orchestrator::options::options()
  :direct_timeout( fc::seconds(3) ),
   hole_punch_timeout( fc::seconds(5) ),
   relay_timeout( fc::seconds(5) ),
   enable_direct(true),
   enable_hole_punch(true),
   enable_relay(true){}

  orchestrator::options::options( const config& c )
  :direct_timeout( fc::milliseconds( c.direct_timeout_ms ) ),
   hole_punch_timeout( fc::milliseconds( c.hole_punch_timeout_ms ) ),
   relay_timeout( fc::milliseconds( c.relay_timeout_ms ) ),
   enable_direct( c.enable_direct ),
   enable_hole_punch( c.enable_hole_punch ),
   enable_relay( c.enable_relay ){}

  orchestrator::orchestrator( node& n, const options& o, event_channel* events )
  :_node(n),_opts(o),_events(events),_cancelled( new bool(false) ){}

  void orchestrator::cancel() {
    boost::shared_ptr<bool> flag = _cancelled;
    _node.get_thread().async( [flag](){ *flag = true; } );
  }

  orchestrator::connection_ptr orchestrator::dial_direct( const ticket& t ) {
    race_ptr race( new dial_race( t.addresses.size() ) );
    node*            n       = &_node;
    fc::sha1         id      = t.node_id;
    fc::microseconds timeout = _opts.direct_timeout;
    for( size_t i = 0; i < t.addresses.size(); ++i ) {
      fc::ip::endpoint ep = t.addresses[i];
      _node.get_thread().async( [=]() {
        connection_ptr c;
        try {
          slog( "dialing %s", fc::string(ep).c_str() );
          c = n->connect_to( ep, id, timeout, direct_path );
        } catch ( const sendme_exception& e ) {
          wlog( "direct connection to %s failed: %s", fc::string(ep).c_str(), e.what() );
        }
        race->finish(c);
      });
    }
    return await( race, timeout + fc::milliseconds(500), _cancelled );
  }

  /**
   *  Connects to the relay named by t and registers with it so it will
   *  forward packets to us.
   */
  orchestrator::connection_ptr orchestrator::relay_connection( node& n, const ticket& t, const fc::microseconds& timeout ) {
    connection_ptr r = n.connect_to( *t.relay, fc::optional<fc::sha1>(), timeout );
    r->register_with_relay( timeout );
    return r;
  }

  /**
   *  Asks the relay to introduce us, then dials the endpoint it reports
   *  while the sender dials ours.
   */
  orchestrator::connection_ptr orchestrator::hole_punch( const ticket& t, const boost::shared_ptr<connection_ptr>& relay ) {
    race_ptr         race( new dial_race(1) );
    node*            n       = &_node;
    ticket           tk      = t;
    fc::microseconds rtime   = _opts.relay_timeout;
    fc::microseconds timeout = _opts.hole_punch_timeout;
    _node.get_thread().async( [=]() {
      connection_ptr c;
      try {
        *relay = relay_connection( *n, tk, rtime );
        fc::ip::endpoint ep = (*relay)->request_introduction( tk.node_id, timeout );
        slog( "relay introduced %s at %s", fc::string(tk.node_id).c_str(), fc::string(ep).c_str() );
        c = n->connect_to( ep, tk.node_id, timeout, hole_punched_path );
      } catch ( const sendme_exception& e ) {
        wlog( "hole punching to %s failed: %s", fc::string(tk.node_id).c_str(), e.what() );
      }
      race->finish(c);
    });
    return await( race, rtime + rtime + timeout + timeout + fc::milliseconds(500), _cancelled );
  }

  orchestrator::connection_ptr orchestrator::relayed( const ticket& t, const boost::shared_ptr<connection_ptr>& relay ) {
    race_ptr         race( new dial_race(1) );
    node*            n       = &_node;
    ticket           tk      = t;
    fc::microseconds timeout = _opts.relay_timeout;
    _node.get_thread().async( [=]() {
      connection_ptr c;
      try {
        if( !*relay || (*relay)->get_state() != connection::connected )
          *relay = relay_connection( *n, tk, timeout );
        c = n->connect_relayed( *relay, tk.node_id, timeout );
      } catch ( const sendme_exception& e ) {
        wlog( "relayed connection to %s failed: %s", fc::string(tk.node_id).c_str(), e.what() );
      }
      race->finish(c);
    });
    return await( race, timeout + timeout + timeout + fc::milliseconds(500), _cancelled );
  }

  orchestrator::connection_ptr orchestrator::connect( const ticket& t ) {
    if( !_node.get_thread().is_current() ) {
      return _node.get_thread().async( [&,this](){ return connect(t); } ).wait();
    }

    std::vector<std::string> attempted;
    connection_ptr           con;
    relay_box                relay( new connection_ptr() );

    try {
      if( _opts.enable_direct && t.addresses.size() ) {
        attempted.push_back( to_string( direct_path ) );
        con = dial_direct(t);
        if( !con ) wlog( "no direct path to %s", fc::string(t.node_id).c_str() );
      }
      if( !con && _opts.enable_hole_punch && !!t.relay ) {
        attempted.push_back( to_string( hole_punched_path ) );
        con = hole_punch( t, relay );
      }
      if( !con && _opts.enable_relay && !!t.relay ) {
        attempted.push_back( to_string( relayed_path ) );
        con = relayed( t, relay );
      }
    } catch ( const cancelled& ) {
      if( !!*relay ) (*relay)->close();
      throw;
    }

    if( !con ) {
      std::string tried;
      for( size_t i = 0; i < attempted.size(); ++i )
        tried += (i ? ", " : "") + attempted[i];
      elog( "unable to reach %s, tried: %s", fc::string(t.node_id).c_str(), tried.c_str() );
      BOOST_THROW_EXCEPTION( connection_error()
          << err_msg( "unable to reach " + std::string( fc::string(t.node_id).c_str() ) + ", tried: " + (tried.size() ? tried : "nothing") )
          << attempted_paths( attempted ) );
    }

    slog( "connected to %s via %s path", fc::string(t.node_id).c_str(), to_string( con->get_path() ) );
    if( _events ) {
      event e( event::path_selected );
      e.conn_path = con->get_path();
      e.path      = to_string( con->get_path() );
      _events->post(e);
    }
    return con;
  }

  fc::future<orchestrator::connection_ptr> orchestrator::connect_async( const ticket& t ) {
    ticket copy = t;
    return _node.get_thread().async( [=](){ return connect(copy); } );
  }

}
