#include <sendme/buffer.hpp>
#include <sendme/error.hpp>
#include <boost/make_shared.hpp>
#include <string.h>

namespace sm {

  buffer::buffer()
  :_block( boost::make_shared<block>() ) {
    start = _block->c_array();
    len   = _block->size();
  }

  buffer::buffer( uint32_t l )
  :_block( boost::make_shared<block>() ) {
    if( l > max_packet_size )
      SENDME_THROW( sendme_exception, "buffer of %1% bytes exceeds packet size", %l );
    start = _block->c_array();
    len   = l;
  }

  buffer::buffer( const char* d, uint32_t dl )
  :_block( boost::make_shared<block>() ) {
    if( dl > max_packet_size )
      SENDME_THROW( sendme_exception, "buffer of %1% bytes exceeds packet size", %dl );
    start = _block->c_array();
    memcpy( start, d, dl );
    len   = dl;
  }

  buffer buffer::subbuf( uint32_t s, uint32_t l )const {
    if( s > len )
      SENDME_THROW( sendme_exception, "sub buffer start %1% past end %2%", %s %len );
    buffer b(*this);
    b.start += s;
    if( l == uint32_t(-1) || l > len - s )
      b.len = len - s;
    else
      b.len = l;
    return b;
  }

  void buffer::move_start( uint32_t sdif ) {
    if( sdif > len ) sdif = len;
    start += sdif;
    len   -= sdif;
  }

  void buffer::resize( uint32_t s ) {
    if( s > len )
      SENDME_THROW( sendme_exception, "attempt to grow buffer from %1% to %2%", %len %s );
    len = s;
  }

} // namespace sm
