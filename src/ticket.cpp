#include <sendme/ticket.hpp>
#include <sendme/error.hpp>
#include <fc/base58.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <string.h>

namespace sm {

  namespace {
    enum {
      endpoint_size = 6,
      checksum_size = 4,
      max_ticket_size = 1 + 20 + 1 + ticket::max_addresses*endpoint_size + 1 + endpoint_size + 20 + checksum_size
    };

    void put_endpoint( char* p, const fc::ip::endpoint& ep ) {
      uint32_t ip = uint32_t( ep.get_address() );
      uint16_t port = ep.port();
      p[0] = char( ip >> 24 ); p[1] = char( ip >> 16 ); p[2] = char( ip >> 8 ); p[3] = char( ip );
      p[4] = char( port >> 8 ); p[5] = char( port );
    }

    fc::ip::endpoint get_endpoint( const unsigned char* p ) {
      uint32_t ip   = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
      uint16_t port = uint16_t( (uint32_t(p[4]) << 8) | p[5] );
      return fc::ip::endpoint( ip, port );
    }

    bool is_routable( const fc::ip::endpoint& ep ) {
      return uint32_t( ep.get_address() ) != 0 && ep.port() != 0;
    }

    void throw_parse( ticket_parse_error::reason_enum r, const std::string& msg ) {
      BOOST_THROW_EXCEPTION( ticket_parse_error() << err_msg( msg ) << parse_reason( int(r) ) );
    }
  }

  fc::string encode( const fc::sha1& node_id, const fc::vector<fc::ip::endpoint>& addresses,
                     const fc::optional<fc::ip::endpoint>& relay, const fc::sha1& root_hash ) {
    if( addresses.size() > ticket::max_addresses )
      SENDME_THROW( sendme_exception, "ticket holds at most %1% addresses, got %2%", %int(ticket::max_addresses) %addresses.size() );
    if( addresses.empty() && !relay )
      SENDME_THROW( sendme_exception, "ticket needs at least one address or a relay" );
    for( size_t i = 0; i < addresses.size(); ++i )
      if( !is_routable( addresses[i] ) )
        SENDME_THROW( sendme_exception, "ticket address %1% has a zero ip or port", %fc::string(addresses[i]).c_str() );
    if( !!relay && !is_routable( *relay ) )
      SENDME_THROW( sendme_exception, "relay address %1% has a zero ip or port", %fc::string(*relay).c_str() );

    char buf[max_ticket_size];
    char* p = buf;
    *p++ = char( ticket::current_version );
    memcpy( p, node_id.data(), sizeof(node_id) ); p += sizeof(node_id);
    *p++ = char( addresses.size() );
    for( size_t i = 0; i < addresses.size(); ++i ) {
      put_endpoint( p, addresses[i] );
      p += endpoint_size;
    }
    if( !!relay ) {
      *p++ = char( endpoint_size );
      put_endpoint( p, *relay );
      p += endpoint_size;
    } else {
      *p++ = 0;
    }
    memcpy( p, root_hash.data(), sizeof(root_hash) ); p += sizeof(root_hash);

    fc::sha1 check = fc::sha1::hash( buf, p - buf );
    memcpy( p, check.data(), checksum_size ); p += checksum_size;

    return fc::to_base58( buf, p - buf );
  }

  fc::string ticket::encode()const {
    if( version != current_version )
      SENDME_THROW( sendme_exception, "cannot encode ticket version %1%", %int(version) );
    return sm::encode( node_id, addresses, relay, root_hash );
  }

  ticket ticket::decode( const fc::string& text ) {
    if( text.size() == 0 )
      throw_parse( ticket_parse_error::truncated, "empty ticket" );
    // base58 expands by about 1.37, anything longer cannot fit
    if( text.size() > max_ticket_size * 2 )
      throw_parse( ticket_parse_error::malformed, "ticket text is too long" );

    char raw[max_ticket_size * 2];
    size_t len = 0;
    try {
      len = fc::from_base58( text, raw, sizeof(raw) );
    } catch( ... ) {
      throw_parse( ticket_parse_error::malformed, std::string("invalid ticket text: ") + fc::except_str().c_str() );
    }
    const unsigned char* b = (const unsigned char*)raw;

    if( len < 1 )
      throw_parse( ticket_parse_error::truncated, "empty ticket" );
    if( b[0] != current_version )
      throw_parse( ticket_parse_error::unknown_version, (boost::format( "unknown ticket version %1%" ) % int(b[0])).str() );

    // walk the variable length fields to find the expected size
    size_t need = 1 + 20 + 1;
    if( len < need ) throw_parse( ticket_parse_error::truncated, "ticket ends inside node id" );
    uint32_t naddr = b[21];
    if( naddr > max_addresses )
      throw_parse( ticket_parse_error::malformed, (boost::format( "ticket lists %1% addresses" ) % naddr).str() );
    need += naddr * endpoint_size + 1;
    if( len < need ) throw_parse( ticket_parse_error::truncated, "ticket ends inside address list" );
    uint32_t rlen = b[need-1];
    if( rlen != 0 && rlen != endpoint_size )
      throw_parse( ticket_parse_error::malformed, (boost::format( "bad relay length %1%" ) % rlen).str() );
    need += rlen + 20 + checksum_size;
    if( len < need ) throw_parse( ticket_parse_error::truncated, "ticket is truncated" );
    if( len > need ) throw_parse( ticket_parse_error::malformed, "trailing bytes after ticket" );

    fc::sha1 check = fc::sha1::hash( raw, len - checksum_size );
    if( memcmp( check.data(), raw + len - checksum_size, checksum_size ) != 0 )
      throw_parse( ticket_parse_error::bad_checksum, "ticket checksum does not match" );

    ticket t;
    t.version = b[0];
    memcpy( t.node_id.data(), raw + 1, sizeof(t.node_id) );
    const unsigned char* p = b + 22;
    for( uint32_t i = 0; i < naddr; ++i ) {
      fc::ip::endpoint ep = get_endpoint(p);
      if( !is_routable(ep) )
        throw_parse( ticket_parse_error::malformed, "ticket address with zero ip or port" );
      t.addresses.push_back( ep );
      p += endpoint_size;
    }
    ++p;
    if( rlen ) {
      fc::ip::endpoint ep = get_endpoint(p);
      if( !is_routable(ep) )
        throw_parse( ticket_parse_error::malformed, "relay address with zero ip or port" );
      t.relay = ep;
      p += endpoint_size;
    }
    if( t.addresses.empty() && !t.relay )
      throw_parse( ticket_parse_error::malformed, "ticket has no address and no relay" );
    memcpy( t.root_hash.data(), p, sizeof(t.root_hash) );
    return t;
  }

  bool ticket::operator==( const ticket& t )const {
    if( version != t.version || node_id != t.node_id || root_hash != t.root_hash ) return false;
    if( addresses.size() != t.addresses.size() ) return false;
    for( size_t i = 0; i < addresses.size(); ++i )
      if( !(addresses[i] == t.addresses[i]) ) return false;
    if( !!relay != !!t.relay ) return false;
    return !relay || *relay == *t.relay;
  }

} // namespace sm
