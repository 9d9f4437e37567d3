#include <gtest/gtest.h>
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/channel.hpp>
#include <sendme/error.hpp>
#include <fc/future.hpp>
#include <fc/thread.hpp>
#include <boost/shared_ptr.hpp>
#include <string>
#include "test_util.hpp"

using namespace sm;

namespace {
  const uint16_t echo_port = 100;

  node::ptr start_node( const test::temp_dir& dir, const std::string& name ) {
    node::ptr n( new node() );
    n->init( dir.sub( "node-" + name ), 0 );
    return n;
  }

  fc::ip::endpoint address_of( const node::ptr& n ) {
    return test::loopback( n->local_endpoint().port() );
  }

  void start_echo( const node::ptr& n ) {
    n->start_service( echo_port, "echo", []( const channel& c ) {
      channel ch(c);
      ch.on_recv( [ch]( const buffer& b, channel::error_code ec ) mutable {
        if( ec == channel::ok ) ch.send(b);
      });
    });
  }

  std::string echo( const node::ptr& n, const node::connection_ptr& con, const std::string& msg ) {
    fc::promise<std::string>::ptr reply( new fc::promise<std::string>() );
    boost::shared_ptr<bool>       answered( new bool(false) );
    channel ch = n->open_channel( con, echo_port );
    ch.on_recv( [reply,answered]( const buffer& b, channel::error_code ec ) {
      if( ec != channel::ok || *answered ) return;
      *answered = true;
      reply->set_value( std::string( b.data(), b.size() ) );
    });
    ch.send( buffer( msg.data(), uint32_t(msg.size()) ) );
    std::string r = reply->wait( fc::seconds(5) );
    ch.close();
    return r;
  }
}

TEST( connection, direct_authenticates_both_ends ) {
  test::temp_dir dir;
  node::ptr a = start_node( dir, "a" );
  node::ptr b = start_node( dir, "b" );
  EXPECT_NE( a->get_id(), b->get_id() );

  node::connection_ptr con = a->connect_to( address_of(b), b->get_id(), fc::seconds(3) );
  ASSERT_TRUE( !!con );
  EXPECT_EQ( b->get_id(), con->get_remote_id() );
  EXPECT_EQ( direct_path, con->get_path() );
  EXPECT_FALSE( con->is_relayed() );

  a->shutdown();
  b->shutdown();
}

TEST( connection, identity_survives_restart ) {
  test::temp_dir dir;
  fc::sha1 first;
  {
    node::ptr a = start_node( dir, "a" );
    first = a->get_id();
    a->shutdown();
  }
  node::ptr a = start_node( dir, "a" );
  EXPECT_EQ( first, a->get_id() );
  a->shutdown();
}

TEST( connection, rejects_unexpected_identity ) {
  test::temp_dir dir;
  node::ptr a = start_node( dir, "a" );
  node::ptr b = start_node( dir, "b" );

  EXPECT_THROW( a->connect_to( address_of(b), fc::sha1::hash( "impostor", 8 ), fc::seconds(2) ), connection_error );

  a->shutdown();
  b->shutdown();
}

TEST( connection, unreachable_peer_times_out ) {
  test::temp_dir dir;
  node::ptr a = start_node( dir, "a" );
  EXPECT_THROW( a->connect_to( test::loopback(1), fc::optional<fc::sha1>(), fc::milliseconds(500) ), connection_error );
  a->shutdown();
}

TEST( connection, channel_carries_datagrams ) {
  test::temp_dir dir;
  node::ptr a = start_node( dir, "a" );
  node::ptr b = start_node( dir, "b" );
  start_echo( b );

  node::connection_ptr con = a->connect_to( address_of(b), b->get_id(), fc::seconds(3) );
  EXPECT_EQ( std::string("hello"), echo( a, con, "hello" ) );

  std::string big( connection::max_channel_data, 'x' );
  EXPECT_EQ( big, echo( a, con, big ) );

  a->shutdown();
  b->shutdown();
}

TEST( connection, relay_forwards_between_registered_peers ) {
  test::temp_dir dir;
  node::ptr r = start_node( dir, "relay" );
  node::ptr a = start_node( dir, "a" );
  node::ptr b = start_node( dir, "b" );
  r->enable_relay( true );
  start_echo( b );

  node::connection_ptr b_relay = b->connect_to( address_of(r), r->get_id(), fc::seconds(3) );
  b_relay->register_with_relay( fc::seconds(3) );

  node::connection_ptr a_relay = a->connect_to( address_of(r), r->get_id(), fc::seconds(3) );
  a_relay->register_with_relay( fc::seconds(3) );
  EXPECT_EQ( 2u, r->relay_peer_count() );

  node::connection_ptr con = a->connect_relayed( a_relay, b->get_id(), fc::seconds(3) );
  ASSERT_TRUE( !!con );
  EXPECT_TRUE( con->is_relayed() );
  EXPECT_EQ( relayed_path, con->get_path() );
  EXPECT_EQ( b->get_id(), con->get_remote_id() );
  EXPECT_EQ( std::string("through the relay"), echo( a, con, "through the relay" ) );

  a->shutdown();
  b->shutdown();
  r->shutdown();
}

TEST( connection, relay_refuses_when_disabled ) {
  test::temp_dir dir;
  node::ptr r = start_node( dir, "relay" );
  node::ptr a = start_node( dir, "a" );

  node::connection_ptr a_relay = a->connect_to( address_of(r), r->get_id(), fc::seconds(3) );
  EXPECT_THROW( a_relay->register_with_relay( fc::seconds(1) ), connection_error );

  a->shutdown();
  r->shutdown();
}
