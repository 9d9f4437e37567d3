#include <sendme/transfer_messages.hpp>
#include <sendme/connection.hpp>
#include <sendme/error.hpp>
#include <fc/reflect_impl.hpp>
#include <fc/reflect_vector.hpp>
#include <fc/raw.hpp>
#include <fc/exception.hpp>
#include <string.h>

FC_REFLECT( sm::size_request, (hash) )
FC_REFLECT( sm::size_response, (hash)(size)(result) )
FC_REFLECT( sm::chunk_request, (hash)(index)(count)(flags) )
FC_REFLECT( sm::chunk_response, (hash)(index)(result)(flags)(data)(siblings) )

namespace sm {

  namespace {
    template<typename T>
    buffer pack_message( uint8_t type, const T& m ) {
      fc::vector<char> body = fc::raw::pack( m );
      if( body.size() + 1 > connection::max_channel_data )
        SENDME_THROW( sendme_exception, "message of %1% bytes does not fit a datagram", %body.size() );
      buffer b( uint32_t(body.size() + 1) );
      b[0] = char(type);
      if( body.size() ) memcpy( b.data() + 1, body.data(), body.size() );
      return b;
    }

    template<typename T>
    void unpack_message( const buffer& b, uint8_t type, T& m ) {
      if( message_type(b) != type )
        SENDME_THROW( sendme_exception, "expected message type %1%, got %2%", %int(type) %int(message_type(b)) );
      try {
        fc::datastream<const char*> ds( b.data() + 1, b.size() - 1 );
        fc::raw::unpack( ds, m );
      } catch ( ... ) {
        SENDME_THROW( sendme_exception, "malformed message of type %1%: %2%", %int(type) %fc::except_str().c_str() );
      }
    }
  }

  buffer encode_message( const size_request& m )   { return pack_message( size_request_msg, m );   }
  buffer encode_message( const size_response& m )  { return pack_message( size_response_msg, m );  }
  buffer encode_message( const chunk_request& m )  { return pack_message( chunk_request_msg, m );  }
  buffer encode_message( const chunk_response& m ) { return pack_message( chunk_response_msg, m ); }

  uint8_t message_type( const buffer& b ) {
    return b.size() ? uint8_t(b[0]) : 0;
  }

  void decode_message( const buffer& b, size_request& m )   { unpack_message( b, size_request_msg, m );   }
  void decode_message( const buffer& b, size_response& m )  { unpack_message( b, size_response_msg, m );  }
  void decode_message( const buffer& b, chunk_request& m )  { unpack_message( b, chunk_request_msg, m );  }
  void decode_message( const buffer& b, chunk_response& m ) { unpack_message( b, chunk_response_msg, m ); }

}
