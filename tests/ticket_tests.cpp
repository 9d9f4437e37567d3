#include <gtest/gtest.h>
#include <sendme/ticket.hpp>
#include <sendme/error.hpp>
#include <fc/base58.hpp>
#include <string.h>
#include <string>

using namespace sm;

namespace {
  ticket sample( bool with_relay ) {
    ticket t;
    t.node_id   = fc::sha1::hash( "node", 4 );
    t.root_hash = fc::sha1::hash( "root", 4 );
    t.addresses.push_back( fc::ip::endpoint( fc::ip::address("192.168.1.20"), 4500 ) );
    t.addresses.push_back( fc::ip::endpoint( fc::ip::address("10.0.0.7"), 65535 ) );
    if( with_relay )
      t.relay = fc::ip::endpoint( fc::ip::address("203.0.113.9"), 9000 );
    return t;
  }

  std::string raw_bytes( const fc::string& text ) {
    char buf[512];
    size_t len = fc::from_base58( text, buf, sizeof(buf) );
    return std::string( buf, len );
  }

  fc::string with_checksum( std::string body ) {
    fc::sha1 check = fc::sha1::hash( body.data(), body.size() );
    body.append( check.data(), 4 );
    return fc::to_base58( body.data(), body.size() );
  }

  ticket_parse_error::reason_enum reason_of( const fc::string& text ) {
    try {
      ticket::decode( text );
    } catch( const ticket_parse_error& e ) {
      return e.reason();
    }
    ADD_FAILURE() << "ticket decoded";
    return ticket_parse_error::malformed;
  }
}

TEST( ticket, decode_restores_every_field ) {
  ticket t = sample( false );
  ticket r = ticket::decode( t.encode() );
  EXPECT_TRUE( t == r );
  EXPECT_FALSE( !!r.relay );
  ASSERT_EQ( 2u, r.addresses.size() );
  EXPECT_EQ( 4500, r.addresses[0].port() );
  EXPECT_EQ( 65535, r.addresses[1].port() );
}

TEST( ticket, carries_relay ) {
  ticket t = sample( true );
  ticket r = ticket::decode( t.encode() );
  EXPECT_TRUE( t == r );
  ASSERT_TRUE( !!r.relay );
  EXPECT_EQ( 9000, r.relay->port() );
}

TEST( ticket, relay_only ) {
  ticket t = sample( true );
  t.addresses.clear();
  EXPECT_TRUE( t == ticket::decode( t.encode() ) );
}

TEST( ticket, encode_limits ) {
  ticket t = sample( false );
  for( int i = 0; i < 20; ++i )
    t.addresses.push_back( fc::ip::endpoint( fc::ip::address("10.1.1.1"), 1000 + i ) );
  EXPECT_THROW( t.encode(), sendme_exception );

  ticket none = sample( false );
  none.addresses.clear();
  EXPECT_THROW( none.encode(), sendme_exception );
}

TEST( ticket, encode_refuses_what_decode_rejects ) {
  ticket zero_port = sample( false );
  zero_port.addresses[1] = fc::ip::endpoint( fc::ip::address("10.0.0.7"), 0 );
  EXPECT_THROW( zero_port.encode(), sendme_exception );

  ticket zero_ip = sample( false );
  zero_ip.addresses[0] = fc::ip::endpoint( fc::ip::address("0.0.0.0"), 4500 );
  EXPECT_THROW( zero_ip.encode(), sendme_exception );

  ticket bad_relay = sample( true );
  bad_relay.relay = fc::ip::endpoint( fc::ip::address("0.0.0.0"), 0 );
  EXPECT_THROW( bad_relay.encode(), sendme_exception );
}

TEST( ticket, detects_corruption ) {
  std::string b = raw_bytes( sample( true ).encode() );
  b[b.size()-1] ^= 0x01;
  EXPECT_EQ( ticket_parse_error::bad_checksum, reason_of( fc::to_base58( b.data(), b.size() ) ) );

  std::string c = raw_bytes( sample( true ).encode() );
  c[5] ^= 0x40;
  EXPECT_EQ( ticket_parse_error::bad_checksum, reason_of( fc::to_base58( c.data(), c.size() ) ) );
}

TEST( ticket, detects_truncation ) {
  std::string b = raw_bytes( sample( true ).encode() );
  std::string cut = b.substr( 0, b.size() - 5 );
  EXPECT_EQ( ticket_parse_error::truncated, reason_of( fc::to_base58( cut.data(), cut.size() ) ) );

  std::string head = b.substr( 0, 10 );
  EXPECT_EQ( ticket_parse_error::truncated, reason_of( fc::to_base58( head.data(), head.size() ) ) );

  EXPECT_EQ( ticket_parse_error::truncated, reason_of( "" ) );
}

TEST( ticket, rejects_unknown_version ) {
  std::string b = raw_bytes( sample( false ).encode() );
  std::string body = b.substr( 0, b.size() - 4 );
  body[0] = 2;
  EXPECT_EQ( ticket_parse_error::unknown_version, reason_of( with_checksum( body ) ) );
}

TEST( ticket, rejects_malformed_text ) {
  EXPECT_THROW( ticket::decode( "not a ticket 0OIl" ), ticket_parse_error );

  std::string b = raw_bytes( sample( false ).encode() );
  std::string body = b.substr( 0, b.size() - 4 ) + std::string( "x" );
  EXPECT_EQ( ticket_parse_error::malformed, reason_of( with_checksum( body ) ) );

  // a zero port cannot be dialed
  std::string z = b.substr( 0, b.size() - 4 );
  z[22+4] = 0;
  z[22+5] = 0;
  EXPECT_EQ( ticket_parse_error::malformed, reason_of( with_checksum( z ) ) );
}
