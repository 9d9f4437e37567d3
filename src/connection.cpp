#include <sendme/connection.hpp>
#include <sendme/node.hpp>
#include <sendme/error.hpp>

#include <fc/log.hpp>
#include <fc/datastream.hpp>
#include <fc/future.hpp>
#include <fc/exception.hpp>
#include <fc/pke.hpp>
#include <fc/base64.hpp>
#include <fc/thread.hpp>
#include <fc/time.hpp>
#include <fc/sha1.hpp>
#include <fc/vector.hpp>

#include <fc/blowfish.hpp>
#include <fc/dh.hpp>
#include <fc/super_fast_hash.hpp>

#include <boost/scoped_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <map>
#include <string.h>
#include <stdlib.h>

namespace sm {

  const char* to_string( path_type p ) {
    switch( p ) {
      case direct_path:       return "direct";
      case hole_punched_path: return "hole_punched";
      case relayed_path:      return "relayed";
    }
    return "unknown";
  }

  typedef fc::promise<fc::ip::endpoint>::ptr endpoint_promise;

  class connection::impl {
    public:
      impl( node& n )
      :_node(n),_cur_state(connecting),_path(direct_path),
       _auth_verified(false),_auth_acked(false),_next_chan(1024){}

      node&                                       _node;
      boost::scoped_ptr<fc::diffie_hellman>       _dh;
      boost::scoped_ptr<fc::blowfish>             _bf;
      state_enum                                  _cur_state;
      path_type                                   _path;

      node_id                                     _remote_id;
      fc::optional<node_id>                       _expected_id;
      fc::ip::endpoint                            _remote_ep;
      connection::ptr                             _relay;
      fc::vector<char>                            _remote_dh;

      bool                                        _auth_verified;
      bool                                        _auth_acked;
      uint16_t                                    _next_chan;

      endpoint_promise                            _register_prom;
      std::map<node_id,endpoint_promise>          _intro_lookups;
      boost::unordered_map<uint32_t,channel>      _channels;
  };

  connection::connection( node& np, const fc::ip::endpoint& ep )
  :my( new impl(np) ) {
    my->_remote_ep = ep;
  }

  connection::connection( node& np, const connection::ptr& relay, const node_id& remote )
  :my( new impl(np) ) {
    my->_relay     = relay;
    my->_remote_id = remote;
    my->_path      = relayed_path;
  }

  connection::~connection() {
    delete my;
  }

  node&               connection::get_node()const        { return my->_node;      }
  fc::ip::endpoint    connection::get_endpoint()const    { return my->_remote_ep; }
  connection::node_id connection::get_remote_id()const   { return my->_remote_id; }
  connection::state_enum connection::get_state()const    { return my->_cur_state; }
  path_type           connection::get_path()const        { return my->_path;      }
  void                connection::set_path( path_type p ) { my->_path = p;        }
  bool                connection::is_relayed()const      { return !!my->_relay;   }

  void connection::expect_remote_id( const node_id& id ) {
    my->_expected_id = id;
  }

  void connection::goto_state( state_enum s ) {
    if( my->_cur_state != s ) {
      state_changed( my->_cur_state = s );
    }
  }

  bool connection::is_dh_packet( const buffer& b ) {
    return (b.size() % 8) && b.size() > 56;
  }

  /**
   *  Start of state machine, switch to the proper handler for the
   *  current state.
   */
  void connection::handle_packet( const buffer& b ) {
    switch( my->_cur_state ) {
      case failed:
      case closing:
      case closed:       return;
      case connecting:   handle_connecting(b);   return;
      case generated_dh: handle_generated_dh(b); return;
      case received_dh:  handle_received_dh(b);  return;
      case connected:    handle_connected(b);    return;
    }
  }

  /**
   *  Nothing has been exchanged.  Any packet, a key or a hole punch,
   *  is answered with a freshly generated public key.
   */
  void connection::handle_connecting( const buffer& b ) {
    generate_dh();
    send_dh();
    if( is_dh_packet(b) ) {
      if( process_dh(b) ) send_auth();
      goto_state( received_dh );
      return;
    }
    goto_state( generated_dh );
  }

  void connection::handle_generated_dh( const buffer& b ) {
    if( is_dh_packet(b) ) {
      if( process_dh(b) ) send_auth();
      goto_state( received_dh );
      return;
    }
    send_dh();
  }

  void connection::handle_received_dh( const buffer& b ) {
    if( is_dh_packet(b) ) {
      // the remote did not hear from us yet, repeat our half
      send_dh();
      if( process_dh(b) ) send_auth();
      return;
    }
    if( b.size() % 8 == 0 && !decode_packet(b) )
      wlog( "ignoring undecodable packet from %s", fc::string(my->_remote_ep).c_str() );
  }

  void connection::handle_connected( const buffer& b ) {
    if( is_dh_packet(b) ) {
      if( my->_remote_dh.size() == 56 && memcmp( &my->_remote_dh.front(), b.data(), 56 ) == 0 ) {
        // retransmitted key, our reply was probably lost
        send_dh();
        send_auth();
        return;
      }
      wlog( "%s restarted the key exchange", fc::string(my->_remote_ep).c_str() );
      close_channels();
      my->_auth_verified = false;
      my->_auth_acked    = false;
      goto_state( connecting );
      handle_connecting(b);
      return;
    }
    if( b.size() % 8 != 0 || !decode_packet(b) )
      wlog( "ignoring undecodable packet from %s", fc::string(my->_remote_ep).c_str() );
  }

  bool connection::decode_packet( const buffer& b ) {
    if( !my->_bf || b.size() < 8 ) return false;

    my->_bf->reset_chain();
    my->_bf->decrypt( (unsigned char*)b.data(), b.size(), fc::blowfish::CBC );

    uint32_t checksum = fc::super_fast_hash( (char*)b.data()+4, b.size()-4 );
    if( memcmp( &checksum, b.data(), 3 ) != 0 ) {
      elog( "decryption checksum failed" );
      return false;
    }
    uint8_t pad      = b[3] & 0x07;
    uint8_t msg_type = uint8_t(b[3]) >> 3;
    buffer  body     = b.subbuf( 4, b.size()-4-pad );

    switch( msg_type ) {
      case data_msg:             return handle_data_msg( body );
      case auth_msg:             return handle_auth_msg( body );
      case auth_resp_msg:        return handle_auth_resp_msg( body );
      case close_msg:            return handle_close_msg( body );
      case relay_register_msg:   return handle_relay_register_msg( body );
      case relay_registered_msg: return handle_relay_registered_msg( body );
      case relay_introduce_msg:  return handle_relay_introduce_msg( body );
      case relay_intro_msg:      return handle_relay_intro_msg( body );
      case req_connect_msg:      return handle_req_connect_msg( body );
      case relay_forward_msg:    return handle_relay_forward_msg( body );
      case channel_close_msg:    return handle_channel_close_msg( body );
      default:
        wlog( "unknown message type %d", int(msg_type) );
    }
    return true;
  }

  bool connection::handle_data_msg( const buffer& b ) {
    if( my->_cur_state != connected ) {
      if( !my->_auth_verified ) {
        wlog( "data message received before authentication" );
        return true;
      }
      // the remote is past the handshake so our acknowledgement got through
      my->_auth_acked = true;
      goto_state( connected );
    }
    if( b.size() < 4 ) return false;
    uint16_t src, dst;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> src >> dst;

    // locally channels are indexed by 'local' << 'remote'
    uint32_t k = (uint32_t(dst) << 16) | src;

    boost::unordered_map<uint32_t,channel>::iterator itr = my->_channels.find(k);
    if( itr != my->_channels.end() ) {
      channel ch = itr->second;
      ch.recv( b.subbuf(4) );
      return true;
    }
    try {
      channel ch = my->_node.create_channel( this, src, dst );
      my->_channels[k] = ch;
      ch.recv( b.subbuf(4) );
    } catch( const sendme_exception& e ) {
      wlog( "%s", e.what() );
    }
    return true;
  }

  /**
   *  sig pub_key utc nonce ip port
   */
  bool connection::handle_auth_msg( const buffer& b ) {
    fc::signature_t  sig;
    fc::public_key_t pubk;
    uint64_t         utc_us;
    uint64_t         nonce;
    uint32_t         rip;
    uint16_t         rport;

    if( !my->_dh || b.size() < sizeof(sig) + sizeof(pubk) + 2*sizeof(uint64_t) + 6 ) {
      wlog( "malformed auth message" );
      return false;
    }
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> sig >> pubk >> utc_us >> nonce >> rip >> rport;

    fc::sha1::encoder sha;
    sha.write( &my->_dh->shared_key.front(), my->_dh->shared_key.size() );
    sha.write( (char*)&utc_us, sizeof(utc_us) );

    if( !pubk.verify( sha.result(), sig ) ) {
      elog( "invalid authentication from %s", fc::string(my->_remote_ep).c_str() );
      send_auth_response(false);
      send_close();
      goto_state( failed );
      return false;
    }

    fc::sha1::encoder pkds; pkds << pubk;
    node_id rid = pkds.result();
    if( !!my->_expected_id && *my->_expected_id != rid ) {
      elog( "expected node %s but %s answered", fc::string(*my->_expected_id).c_str(), fc::string(rid).c_str() );
      send_auth_response(false);
      send_close();
      goto_state( failed );
      return false;
    }

    my->_remote_id     = rid;
    slog( "%s sees us at %s", fc::string(rid).c_str(),
          fc::string( fc::ip::endpoint( fc::ip::address(rip), rport ) ).c_str() );
    my->_auth_verified = true;
    send_auth_response(true);
    if( my->_auth_acked ) goto_state( connected );
    return true;
  }

  bool connection::handle_auth_resp_msg( const buffer& b ) {
    if( b.size() < 1 ) return false;
    if( !b[0] ) {
      elog( "%s rejected our authentication", fc::string(my->_remote_ep).c_str() );
      goto_state( failed );
      return false;
    }
    my->_auth_acked = true;
    if( my->_auth_verified ) goto_state( connected );
    return true;
  }

  bool connection::handle_close_msg( const buffer& b ) {
    slog( "%s closed the connection", fc::string(my->_remote_id).c_str() );
    close_channels();
    goto_state( closed );
    my->_node.connection_closed( this );
    return true;
  }

  void connection::close() {
    if( my->_cur_state == closing || my->_cur_state == closed ) return;
    if( my->_cur_state >= received_dh && my->_bf )
      send_close();
    goto_state( closing );
    close_channels();
    goto_state( closed );
    my->_node.connection_closed( this );
  }

  void connection::close_channels() {
    boost::unordered_map<uint32_t,channel> chans;
    chans.swap( my->_channels );
    buffer b; b.resize(0);
    boost::unordered_map<uint32_t,channel>::iterator itr = chans.begin();
    while( itr != chans.end() ) {
      channel ch = itr->second;
      ch.reset();
      ch.recv( b, channel::closed );
      ++itr;
    }
  }

  void connection::send_close() {
    char c = 1;
    send( &c, sizeof(c), close_msg );
  }

  void connection::send_auth_response( bool ok ) {
    char c = ok ? 1 : 0;
    send( &c, sizeof(c), auth_resp_msg );
  }

  void connection::generate_dh() {
    my->_dh.reset( new fc::diffie_hellman() );
    static std::string decode_param =
          fc::base64_decode( "lyIvBWa2SzbSeqb4HgBASJEj3SJrYFAIaErwx5GMt71CtFE4FYXDrVw1bPTBaRX4GTDAIBQM8Rs=" );
    my->_dh->p.clear();
    my->_dh->g = 5;
    my->_dh->p.insert( my->_dh->p.begin(), decode_param.begin(), decode_param.end() );
    my->_dh->pub_key.reserve(63);
    do {
      my->_dh->generate_pub_key();
    } while( my->_dh->pub_key.size() != 56 );
  }

  /**
   *  Public keys are sent in the clear padded to a length that is not a
   *  multiple of 8, which is how they are told apart from encrypted packets.
   */
  void connection::send_dh() {
    if( !my->_dh ) generate_dh();
    int init_size = my->_dh->pub_key.size();
    my->_dh->pub_key.resize( init_size + rand()%7 + 1 );
    send_raw( &my->_dh->pub_key.front(), my->_dh->pub_key.size() );
    my->_dh->pub_key.resize( init_size );
  }

  bool connection::process_dh( const buffer& b ) {
    if( !my->_dh ) generate_dh();
    my->_dh->compute_shared_key( b.data(), 56 );
    while( my->_dh->shared_key.size() < 56 )
      my->_dh->shared_key.push_back('\0');

    my->_remote_dh.resize(56);
    memcpy( &my->_remote_dh.front(), b.data(), 56 );

    my->_bf.reset( new fc::blowfish() );
    my->_bf->start( (unsigned char*)&my->_dh->shared_key.front(), 56 );
    return true;
  }

  /**
   *  Proves that we own the public key our node id is derived from and
   *  tells the remote which endpoint we see it at.
   *
   *  sign( sha1(shared_key + utc) ) + pub_key + utc + nonce + uint32_t(ip) + uint16_t(port)
   */
  void connection::send_auth() {
    uint64_t utc_us = fc::time_point::now().time_since_epoch().count();

    fc::sha1::encoder sha;
    sha.write( &my->_dh->shared_key.front(), my->_dh->shared_key.size() );
    sha.write( (char*)&utc_us, sizeof(utc_us) );

    fc::signature_t s = my->_node.sign( sha.result() );
    uint64_t nonce = (uint64_t(rand()) << 32) | uint64_t(rand());

    char buf[sizeof(s)+sizeof(fc::public_key_t)+2*sizeof(uint64_t)+6];
    fc::datastream<char*> ds( buf, sizeof(buf) );
    ds << s << my->_node.pub_key() << utc_us << nonce;
    ds << uint32_t(my->_remote_ep.get_address()) << uint16_t(my->_remote_ep.port());
    send( buf, sizeof(buf), auth_msg );
  }

  /**
   *  All data is encrypted, so the packet must be a multiple of 8 bytes
   *  long and carry its pad length and a checksum to validate decryption.
   *
   *  uint24_t  checksum;
   *  uint5     type;
   *  uint3     pad_bytes;
   *  data+pad
   */
  void connection::send( const char* buf, uint32_t size, connection::proto_message_type t ) {
    // header and up to 7 bytes of padding
    if( size + 11 > max_packet_size )
      SENDME_THROW( sendme_exception, "message of %1% bytes does not fit a packet", %size );
    if( !my->_bf ) {
      wlog( "dropping message type %d sent before key exchange", int(t) );
      return;
    }

    unsigned char  buffer[max_packet_size];
    unsigned char* data = buffer+4;
    uint8_t pad = 8 - ((size + 4) % 8);
    if( pad == 8 ) pad = 0;

    memcpy( data, buf, size );
    if( pad ) memset( data + size, 0, pad );
    uint32_t check = fc::super_fast_hash( (char*)data, size + pad );
    memcpy( buffer, (char*)&check, 3 );
    buffer[3] = pad | (uint8_t(t) << 3);

    uint32_t buf_len = size + pad + 4;
    my->_bf->reset_chain();
    my->_bf->encrypt( buffer, buf_len, fc::blowfish::CBC );
    send_raw( (char*)buffer, buf_len );
  }

  void connection::send_raw( const char* d, uint32_t l ) {
    if( my->_relay ) {
      if( my->_relay->get_state() != connected ) {
        wlog( "relay connection is gone, dropping packet for %s", fc::string(my->_remote_id).c_str() );
        return;
      }
      my->_relay->forward( true, my->_remote_id, d, l );
    } else {
      my->_node.send( d, l, my->_remote_ep );
    }
  }

  void connection::send( const channel& c, const buffer& b ) {
    if( !my->_node.get_thread().is_current() ) {
      connection::ptr self(this,true);
      my->_node.get_thread().async( [=]() { self->send(c,b); } );
      return;
    }
    if( b.size() > max_channel_data )
      SENDME_THROW( sendme_exception, "channel packet of %1% bytes exceeds %2%", %b.size() %int(max_channel_data) );
    char buf[max_message_size];
    fc::datastream<char*> ds( buf, sizeof(buf) );
    ds << c.local_channel_num() << c.remote_channel_num();
    ds.write( b.data(), b.size() );
    send( buf, ds.tellp(), data_msg );
  }

  /**
   *  Sends the message the current state calls for.  Called periodically
   *  by whoever is waiting for the connection to come up.
   */
  void connection::advance() {
    switch( my->_cur_state ) {
      case failed:
      case closing:
      case closed:
        return;
      case connecting:
        generate_dh();
        send_dh();
        goto_state( generated_dh );
        return;
      case generated_dh:
        send_dh();
        return;
      case received_dh:
        send_dh();
        send_auth();
        if( my->_auth_verified ) send_auth_response(true);
        return;
      case connected:
        return;
    }
  }

  uint16_t connection::get_free_channel_num() {
    while( true ) {
      uint16_t n = my->_next_chan++;
      if( n < 1024 ) continue;
      bool used = false;
      boost::unordered_map<uint32_t,channel>::const_iterator itr = my->_channels.begin();
      for( ; itr != my->_channels.end(); ++itr ) {
        if( (itr->first >> 16) == n ) { used = true; break; }
      }
      if( !used ) return n;
    }
  }

  void connection::add_channel( const channel& ch ) {
    uint32_t k = (uint32_t(ch.local_channel_num()) << 16) | ch.remote_channel_num();
    my->_channels[k] = ch;
  }

  void connection::close_channel( const channel& ch ) {
    if( !my->_node.get_thread().is_current() ) {
      my->_node.get_thread().async( [&,this](){ close_channel(ch); } ).wait();
      return;
    }
    uint32_t k = (uint32_t(ch.local_channel_num()) << 16) | ch.remote_channel_num();
    if( !my->_channels.erase(k) ) return;
    if( my->_cur_state != connected ) return;
    char buf[4];
    fc::datastream<char*> ds( buf, sizeof(buf) );
    ds << ch.local_channel_num() << ch.remote_channel_num();
    send( buf, sizeof(buf), channel_close_msg );
  }

  /**
   *  src dst, numbered the way the remote sees the channel
   */
  bool connection::handle_channel_close_msg( const buffer& b ) {
    if( b.size() < 4 ) return false;
    uint16_t src, dst;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> src >> dst;
    uint32_t k = (uint32_t(dst) << 16) | src;

    boost::unordered_map<uint32_t,channel>::iterator itr = my->_channels.find(k);
    if( itr == my->_channels.end() ) return true;
    channel ch = itr->second;
    my->_channels.erase(itr);
    ch.reset();
    buffer e; e.resize(0);
    ch.recv( e, channel::closed );
    ch.close();
    return true;
  }

  fc::ip::endpoint connection::register_with_relay( const fc::microseconds& timeout ) {
    if( !my->_node.get_thread().is_current() ) {
      return my->_node.get_thread().async( [&,this](){ return register_with_relay(timeout); } ).wait();
    }
    endpoint_promise prom( new fc::promise<fc::ip::endpoint>() );
    my->_register_prom = prom;

    fc::time_point deadline = fc::time_point::now() + timeout;
    fc::ip::endpoint ep;
    while( true ) {
      char c = 1;
      send( &c, sizeof(c), relay_register_msg );
      try {
        ep = prom->wait( fc::milliseconds(250) );
        break;
      } catch( const fc::future_wait_timeout& ) {
        if( fc::time_point::now() >= deadline ) {
          my->_register_prom.reset();
          SENDME_THROW( connection_error, "relay %1% did not answer registration", %fc::string(my->_remote_ep).c_str() );
        }
      }
    }
    if( ep == fc::ip::endpoint() )
      SENDME_THROW( connection_error, "%1% does not provide a relay service", %fc::string(my->_remote_ep).c_str() );
    slog( "registered with relay %s as %s", fc::string(my->_remote_ep).c_str(), fc::string(ep).c_str() );
    return ep;
  }

  fc::ip::endpoint connection::request_introduction( const node_id& target, const fc::microseconds& timeout ) {
    if( !my->_node.get_thread().is_current() ) {
      return my->_node.get_thread().async( [&,this](){ return request_introduction(target,timeout); } ).wait();
    }
    endpoint_promise prom( new fc::promise<fc::ip::endpoint>() );
    my->_intro_lookups[target] = prom;

    fc::time_point deadline = fc::time_point::now() + timeout;
    fc::ip::endpoint ep;
    while( true ) {
      char buf[sizeof(target)];
      fc::datastream<char*> ds( buf, sizeof(buf) );
      ds << target;
      send( buf, sizeof(buf), relay_introduce_msg );
      try {
        ep = prom->wait( fc::milliseconds(250) );
        break;
      } catch( const fc::future_wait_timeout& ) {
        if( fc::time_point::now() >= deadline ) {
          my->_intro_lookups.erase(target);
          SENDME_THROW( connection_error, "relay did not answer introduction to %1%", %fc::string(target).c_str() );
        }
      }
    }
    if( ep == fc::ip::endpoint() )
      SENDME_THROW( connection_error, "%1% is not registered with the relay", %fc::string(target).c_str() );
    return ep;
  }

  void connection::forward( bool to_relay, const node_id& peer, const char* d, uint32_t l ) {
    char buf[max_packet_size];
    if( l + 1 + sizeof(peer) > sizeof(buf) )
      SENDME_THROW( sendme_exception, "relayed packet of %1% bytes is too large", %l );
    fc::datastream<char*> ds( buf, sizeof(buf) );
    ds << uint8_t( to_relay ? 0 : 1 ) << peer;
    ds.write( d, l );
    send( buf, ds.tellp(), relay_forward_msg );
  }

  void connection::send_req_connect( const node_id& id, const fc::ip::endpoint& ep ) {
    char buf[sizeof(id)+6];
    fc::datastream<char*> ds( buf, sizeof(buf) );
    ds << id << uint32_t(ep.get_address()) << uint16_t(ep.port());
    send( buf, sizeof(buf), req_connect_msg );
  }

  bool connection::handle_relay_register_msg( const buffer& b ) {
    char buf[7];
    fc::datastream<char*> ds( buf, sizeof(buf) );
    if( my->_cur_state == connected && my->_node.relay_register( this ) ) {
      ds << uint8_t(1) << uint32_t(my->_remote_ep.get_address()) << uint16_t(my->_remote_ep.port());
    } else {
      ds << uint8_t(0) << uint32_t(0) << uint16_t(0);
    }
    send( buf, sizeof(buf), relay_registered_msg );
    return true;
  }

  bool connection::handle_relay_registered_msg( const buffer& b ) {
    if( b.size() < 7 ) return false;
    uint8_t ok; uint32_t ip; uint16_t port;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> ok >> ip >> port;
    if( my->_register_prom ) {
      endpoint_promise p = my->_register_prom;
      my->_register_prom.reset();
      p->set_value( ok ? fc::ip::endpoint( ip, port ) : fc::ip::endpoint() );
    }
    return true;
  }

  bool connection::handle_relay_introduce_msg( const buffer& b ) {
    node_id target;
    if( b.size() < sizeof(target) ) return false;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> target;

    connection::ptr t = my->_node.relay_lookup( target );
    char buf[sizeof(target)+7];
    fc::datastream<char*> out( buf, sizeof(buf) );
    out << target;
    if( t && my->_cur_state == connected ) {
      fc::ip::endpoint tep = t->get_endpoint();
      out << uint8_t(1) << uint32_t(tep.get_address()) << uint16_t(tep.port());
    } else {
      out << uint8_t(0) << uint32_t(0) << uint16_t(0);
    }
    send( buf, sizeof(buf), relay_intro_msg );

    if( t && my->_cur_state == connected ) {
      slog( "introducing %s to %s", fc::string(my->_remote_id).c_str(), fc::string(target).c_str() );
      t->send_req_connect( my->_remote_id, my->_remote_ep );
    }
    return true;
  }

  bool connection::handle_relay_intro_msg( const buffer& b ) {
    node_id target; uint8_t found; uint32_t ip; uint16_t port;
    if( b.size() < sizeof(target) + 7 ) return false;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> target >> found >> ip >> port;

    std::map<node_id,endpoint_promise>::iterator itr = my->_intro_lookups.find(target);
    if( itr == my->_intro_lookups.end() ) return true;
    endpoint_promise p = itr->second;
    my->_intro_lookups.erase(itr);
    p->set_value( found ? fc::ip::endpoint( ip, port ) : fc::ip::endpoint() );
    return true;
  }

  bool connection::handle_req_connect_msg( const buffer& b ) {
    node_id id; uint32_t ip; uint16_t port;
    if( b.size() < sizeof(id) + 6 ) return false;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> id >> ip >> port;
    fc::ip::endpoint ep( ip, port );
    slog( "relay asks us to connect to %s at %s", fc::string(id).c_str(), fc::string(ep).c_str() );
    my->_node.reverse_connect( ep, id );
    return true;
  }

  bool connection::handle_relay_forward_msg( const buffer& b ) {
    uint8_t dir; node_id peer;
    if( b.size() < 1 + sizeof(peer) || my->_cur_state != connected ) return false;
    fc::datastream<const char*> ds( b.data(), b.size() );
    ds >> dir >> peer;
    buffer payload = b.subbuf( 1 + sizeof(peer) );

    if( dir == 0 ) {
      connection::ptr t = my->_node.relay_lookup( peer );
      if( !t ) {
        wlog( "no registered peer %s to forward to", fc::string(peer).c_str() );
        return true;
      }
      t->forward( false, my->_remote_id, payload.data(), payload.size() );
    } else {
      my->_node.handle_relayed_packet( connection::ptr(this,true), peer, payload );
    }
    return true;
  }

} // namespace sm
