#include <sendme/node.hpp>
#include <sendme/channel.hpp>
#include <sendme/error.hpp>
#include "node_impl.hpp"
#include <fc/exception.hpp>
#include <fc/stream.hpp>
#include <fc/log.hpp>

namespace sm {

  void node::impl::listen( uint16_t p ) {
    _sock.open();
    _sock.set_receive_buffer_size( 3*1024*1024 );
    _sock.bind( fc::ip::endpoint( fc::ip::address(), p ) );
    slog( "listening on port %d", int(_sock.local_endpoint().port()) );
    _read_loop_complete = _thread.async( [=](){ read_loop(); } );
  }

  void node::impl::read_loop() {
    while( !_done ) {
      // allocate a new buffer for each packet... we have no idea how long it may be around
      buffer b;
      fc::ip::endpoint from;
      size_t s = 0;
      try {
        s = _sock.receive_from( b.data(), b.size(), from );
      } catch( ... ) {
        if( _done ) return;
        elog( "receive failed: %s", fc::except_str().c_str() );
        fc::usleep( fc::milliseconds(10) );
        continue;
      }
      if( !s ) continue;
      b.resize( s );
      try {
        handle_packet( b, from );
      } catch( ... ) {
        elog( "error handling packet from %s: %s", fc::string(from).c_str(), fc::except_str().c_str() );
      }
    }
  }

  connection::ptr node::impl::find_or_create( const fc::ip::endpoint& ep ) {
    ep_to_con_map::iterator itr = _ep_to_con.find(ep);
    if( itr != _ep_to_con.end() ) {
      connection::state_enum s = itr->second->get_state();
      if( s != connection::closed && s != connection::failed )
        return itr->second;
    }
    connection::ptr c( new connection( _self, ep ) );
    _ep_to_con[ep] = c;
    return c;
  }

  void node::impl::handle_packet( const buffer& b, const fc::ip::endpoint& ep ) {
    connection::ptr c = find_or_create( ep );
    c->handle_packet( b );
  }

  connection::ptr node::impl::wait_connected( const connection::ptr& con, const fc::optional<fc::sha1>& expect,
                                              const fc::microseconds& timeout, const fc::string& what ) {
    fc::time_point deadline = fc::time_point::now() + timeout;
    while( true ) { // keep waiting for the state to change
      switch( con->get_state() ) {
        case connection::connected:
          if( !!expect && con->get_remote_id() != *expect ) {
            con->close();
            SENDME_THROW( connection_error, "%1% is not node %2%", %what.c_str() %fc::string(*expect).c_str() );
          }
          return con;
        case connection::failed:
        case connection::closing:
        case connection::closed:
          SENDME_THROW( connection_error, "connection to %1% failed", %what.c_str() );
        default:
          if( fc::time_point::now() >= deadline ) {
            con->close();
            SENDME_THROW( connection_error, "timed out connecting to %1%", %what.c_str() );
          }
          con->advance();
          try {
            fc::wait( con->state_changed, fc::milliseconds(250) );
          } catch( const fc::future_wait_timeout& ) {
            // advance again
          }
      }
    }
  }

  node::node() {
    my = new node::impl( *this );
  }

  node::~node() {
    delete my;
  }

  fc::thread&          node::get_thread()const { return my->_thread;  }
  const node::id_type& node::get_id()const     { return my->_id;      }
  fc::path             node::datadir()const    { return my->_datadir; }

  void node::init( const fc::path& datadir, uint16_t port ) {
    if( !my->_thread.is_current() ) {
       my->_thread.async( [&,this](){ init( datadir, port ); } ).wait();
       return;
    }

    my->_datadir = datadir;
    fc::path kf = datadir/"identity";
    if( !fc::exists( datadir ) ) {
      slog( "creating new data directory: %s", datadir.string().c_str() );
      fc::create_directories(datadir);
    }
    if( !fc::exists(kf) ) {
      slog( "creating new node identity: %s", kf.string().c_str() );
      fc::ofstream os( kf.string().c_str(), std::ios::out | std::ios::binary );
      fc::generate_keys( my->_pub_key, my->_priv_key );
      os << my->_pub_key << my->_priv_key;
    } else {
      fc::ifstream ink;
      ink.open( kf.string().c_str(), std::ios::in | std::ios::binary );
      ink >> my->_pub_key >> my->_priv_key;
    }

    // must match how connections derive the id of an authenticated peer
    fc::sha1::encoder enc; enc << my->_pub_key;
    my->_id = enc.result();
    slog( "node id %s", fc::string(my->_id).c_str() );

    my->listen(port);
  }

  void node::shutdown() {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [this](){ shutdown(); } ).wait();
      return;
    }
    if( my->_done ) return;
    my->_done = true;

    fc::vector<connection::ptr> cons;
    for( ep_to_con_map::iterator itr = my->_ep_to_con.begin(); itr != my->_ep_to_con.end(); ++itr )
      cons.push_back( itr->second );
    for( id_to_con_map::iterator itr = my->_relayed_con.begin(); itr != my->_relayed_con.end(); ++itr )
      cons.push_back( itr->second );
    // relayed connections first while their relay can still carry the close
    for( size_t i = cons.size(); i > 0; --i )
      cons[i-1]->close();

    my->_registered.clear();
    my->_relayed_con.clear();
    my->_ep_to_con.clear();
    my->_sock.close();
  }

  node::endpoint node::local_endpoint()const {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [this](){ return local_endpoint(); } ).wait();
    }
    return my->_sock.local_endpoint();
  }

  fc::vector<node::endpoint> node::advertised_endpoints()const {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [this](){ return advertised_endpoints(); } ).wait();
    }
    uint16_t port = my->_sock.local_endpoint().port();
    fc::vector<endpoint> eps;
    try {
      fc::udp_socket lookup;
      lookup.connect( fc::ip::endpoint( fc::ip::address("74.125.228.40"), 8000 ) );
      fc::ip::address a = lookup.local_endpoint().get_address();
      if( uint32_t(a) != 0 && uint32_t(a) != 0x7f000001 )
        eps.push_back( endpoint( a, port ) );
    } catch( ... ) {
      wlog( "unable to determine outbound address: %s", fc::except_str().c_str() );
    }
    eps.push_back( endpoint( fc::ip::address("127.0.0.1"), port ) );
    return eps;
  }

  node::connection_ptr node::connect_to( const endpoint& ep, const fc::optional<id_type>& expect,
                                         const fc::microseconds& timeout, path_type p ) {
    if( !my->_thread.is_current() ) {
       return my->_thread.async( [&,this](){ return connect_to( ep, expect, timeout, p ); } ).wait();
    }
    connection::ptr con = my->find_or_create(ep);
    if( con->get_path() == direct_path ) con->set_path(p);
    if( !!expect ) {
      if( con->get_state() == connection::connected && con->get_remote_id() != *expect ) {
        SENDME_THROW( connection_error, "%1% is node %2%, expected %3%",
                      %fc::string(ep).c_str() %fc::string(con->get_remote_id()).c_str() %fc::string(*expect).c_str() );
      }
      con->expect_remote_id(*expect);
    }
    return my->wait_connected( con, expect, timeout, fc::string(ep) );
  }

  node::connection_ptr node::connect_relayed( const connection_ptr& relay, const id_type& target,
                                              const fc::microseconds& timeout ) {
    if( !my->_thread.is_current() ) {
       return my->_thread.async( [&,this](){ return connect_relayed( relay, target, timeout ); } ).wait();
    }
    if( !relay || relay->get_state() != connection::connected )
      SENDME_THROW( connection_error, "no connection to the relay" );

    connection::ptr con;
    id_to_con_map::iterator itr = my->_relayed_con.find(target);
    if( itr != my->_relayed_con.end() && itr->second->get_state() != connection::closed
                                      && itr->second->get_state() != connection::failed ) {
      con = itr->second;
    } else {
      con.reset( new connection( *this, relay, target ) );
      my->_relayed_con[target] = con;
    }
    con->expect_remote_id(target);
    return my->wait_connected( con, target, timeout, "relayed " + fc::string(target) );
  }

  channel node::open_channel( const connection_ptr& c, uint16_t remote_chan_num ) {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [&,this](){ return open_channel( c, remote_chan_num ); } ).wait();
    }
    if( !c || c->get_state() != connection::connected )
      SENDME_THROW( connection_error, "cannot open a channel on a connection that is not connected" );
    channel ch( c.get(), remote_chan_num, c->get_free_channel_num() );
    c->add_channel(ch);
    return ch;
  }

  void node::start_service( uint16_t cn, const fc::string& name, const node::new_channel_handler& cb ) {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [&,this](){ return start_service( cn, name, cb ); } ).wait();
      return;
    }
    if( !my->_services.insert( service( cn, name, cb ) ).second )
      SENDME_THROW( sendme_exception, "unable to start service '%1%' on channel %2% because it is in use", %name.c_str() %cn );
    slog( "starting service '%s' on channel %d", name.c_str(), int(cn) );
  }

  void node::close_service( uint16_t cn ) {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [&,this](){ close_service(cn); } ).wait();
      return;
    }
    my->_services.erase( cn );
  }

  void node::enable_relay( bool e ) {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [=](){ enable_relay(e); } ).wait();
      return;
    }
    my->_relay_enabled = e;
    if( !e ) my->_registered.clear();
  }

  bool node::is_relay()const {
    return my->_relay_enabled;
  }

  size_t node::connected_count()const {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [this](){ return connected_count(); } ).wait();
    }
    size_t n = 0;
    for( ep_to_con_map::const_iterator itr = my->_ep_to_con.begin(); itr != my->_ep_to_con.end(); ++itr )
      if( itr->second->get_state() == connection::connected ) ++n;
    for( id_to_con_map::const_iterator itr = my->_relayed_con.begin(); itr != my->_relayed_con.end(); ++itr )
      if( itr->second->get_state() == connection::connected ) ++n;
    return n;
  }

  size_t node::relay_peer_count()const {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [this](){ return relay_peer_count(); } ).wait();
    }
    return my->_registered.size();
  }

  /**
   *  Creates a new channel for connection if there is a service with lcn.  Otherwise it
   *  throws an error that no one is listening on that channel for new connections.
   *
   *  @param c   - the connection that packets on this channel are routed over
   *  @param rcn - remote channel number
   *  @param lcn - local channel number
   */
  channel node::create_channel( connection* c, uint16_t rcn, uint16_t lcn ) {
    service_set::iterator itr = my->_services.find( lcn );
    if( itr == my->_services.end() )
      SENDME_THROW( sendme_exception, "unable to open channel %1%, no service listening on it", %lcn );
    channel nc( c, rcn, lcn );
    itr->handler( nc );
    return nc;
  }

  void node::send( const char* d, uint32_t l, const fc::ip::endpoint& e ) {
    my->_sock.send_to( d, l, e );
  }

  fc::signature_t node::sign( const fc::sha1& h ) {
    fc::signature_t s;
    my->_priv_key.sign( h, s );
    return s;
  }

  const fc::public_key_t& node::pub_key()const {
    return my->_pub_key;
  }

  bool node::relay_register( connection* c ) {
    if( !my->_relay_enabled ) {
      wlog( "refusing relay registration from %s", fc::string(c->get_remote_id()).c_str() );
      return false;
    }
    my->_registered[c->get_remote_id()] = connection::ptr( c, true );
    slog( "registered %s at %s", fc::string(c->get_remote_id()).c_str(), fc::string(c->get_endpoint()).c_str() );
    return true;
  }

  node::connection_ptr node::relay_lookup( const id_type& id )const {
    if( !my->_relay_enabled ) return connection_ptr();
    id_to_con_map::const_iterator itr = my->_registered.find(id);
    if( itr == my->_registered.end() || itr->second->get_state() != connection::connected )
      return connection_ptr();
    return itr->second;
  }

  void node::handle_relayed_packet( const connection_ptr& relay, const id_type& src, const buffer& b ) {
    connection::ptr con;
    id_to_con_map::iterator itr = my->_relayed_con.find(src);
    if( itr != my->_relayed_con.end() && itr->second->get_state() != connection::closed
                                      && itr->second->get_state() != connection::failed ) {
      con = itr->second;
    } else {
      con.reset( new connection( *this, relay, src ) );
      my->_relayed_con[src] = con;
    }
    con->handle_packet( b );
  }

  /**
   *  The relay told us that id is trying to reach us at ep; dial it at the
   *  same time so both NATs see outbound traffic.
   */
  void node::reverse_connect( const endpoint& ep, const id_type& id ) {
    my->_thread.async( [=]() {
      try {
        connect_to( ep, id, fc::seconds(5), hole_punched_path );
        slog( "reverse connection to %s established", fc::string(ep).c_str() );
      } catch( const sendme_exception& e ) {
        wlog( "reverse connection to %s failed: %s", fc::string(ep).c_str(), e.what() );
      }
    } );
  }

  void node::connection_closed( connection* c ) {
    id_to_con_map::iterator itr = my->_registered.begin();
    while( itr != my->_registered.end() ) {
      if( itr->second.get() == c ) itr = my->_registered.erase(itr);
      else ++itr;
    }
  }

} // namespace sm
