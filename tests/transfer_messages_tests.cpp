#include <gtest/gtest.h>
#include <sendme/transfer_messages.hpp>
#include <sendme/connection.hpp>
#include <sendme/hash_tree.hpp>
#include <sendme/error.hpp>

using namespace sm;

TEST( transfer_messages, chunk_request ) {
  chunk_request req( fc::sha1::hash( "blob", 4 ), 17, 32, chunk_request::proof_only );
  buffer b = encode_message( req );
  EXPECT_EQ( chunk_request_msg, message_type(b) );

  chunk_request r;
  decode_message( b, r );
  EXPECT_EQ( req.hash, r.hash );
  EXPECT_EQ( 17u, r.index );
  EXPECT_EQ( 32u, r.count );
  EXPECT_EQ( uint8_t(chunk_request::proof_only), r.flags );
}

TEST( transfer_messages, size_response_result ) {
  size_response rsp;
  rsp.hash   = fc::sha1::hash( "x", 1 );
  rsp.result = transfer_result::unknown_blob;

  size_response r;
  decode_message( encode_message( rsp ), r );
  EXPECT_EQ( rsp.hash, r.hash );
  EXPECT_EQ( 0u, r.size );
  EXPECT_EQ( int8_t(transfer_result::unknown_blob), r.result );
}

TEST( transfer_messages, wrong_type_is_rejected ) {
  buffer b = encode_message( size_request( fc::sha1::hash( "x", 1 ) ) );
  chunk_response r;
  EXPECT_THROW( decode_message( b, r ), sendme_exception );

  EXPECT_EQ( 0, message_type( buffer() ) );
  size_request s;
  EXPECT_THROW( decode_message( buffer(), s ), sendme_exception );
}

TEST( transfer_messages, garbage_body_is_rejected ) {
  buffer b( 3 );
  b[0] = char(chunk_response_msg);
  b[1] = 1;
  b[2] = 2;
  chunk_response r;
  EXPECT_THROW( decode_message( b, r ), sendme_exception );
}

TEST( transfer_messages, full_chunk_with_deep_proof_fits_one_datagram ) {
  chunk_response rsp;
  rsp.hash  = fc::sha1::hash( "big", 3 );
  rsp.index = 0xfffffffe;
  rsp.data.resize( chunk_size );
  for( uint32_t i = 0; i < chunk_size; ++i ) rsp.data[i] = char(i);
  for( int i = 0; i < 32; ++i ) rsp.siblings.push_back( fc::sha1::hash( (const char*)&i, sizeof(i) ) );

  buffer b = encode_message( rsp );
  EXPECT_LE( b.size(), size_t(connection::max_channel_data) );

  chunk_response r;
  decode_message( b, r );
  EXPECT_EQ( rsp.index, r.index );
  ASSERT_EQ( size_t(chunk_size), r.data.size() );
  EXPECT_EQ( char(200), r.data[200] );
  ASSERT_EQ( 32u, r.siblings.size() );
  EXPECT_EQ( rsp.siblings[31], r.siblings[31] );
}
