#ifndef _SENDME_BUFFER_HPP_
#define _SENDME_BUFFER_HPP_
#include <stdint.h>
#include <stddef.h>
#include <boost/shared_ptr.hpp>
#include <boost/array.hpp>

namespace sm {

  enum {
    /// largest datagram the node will send or receive
    max_packet_size = 2048
  };

  /**
   *  A view into a reference counted packet sized block.  Copies
   *  and sub buffers share the block so a packet can be handed from
   *  the socket to a connection and on to a channel without copying.
   */
  class buffer {
    public:
      buffer();
      explicit buffer( uint32_t len );
      buffer( const char* d, uint32_t dl );

      buffer subbuf( uint32_t s, uint32_t l = uint32_t(-1) )const;

      void move_start( uint32_t sdif );
      void resize( uint32_t s );

      const char& operator[](uint32_t i)const { return start[i]; }
      char&       operator[](uint32_t i)      { return start[i]; }

      const char* data()const { return start; }
      char*       data()      { return start; }
      size_t      size()const { return len;   }

    private:
      typedef boost::array<char,max_packet_size> block;

      boost::shared_ptr<block> _block;
      char*                    start;
      uint32_t                 len;
  };

} // namespace sm

#endif // _SENDME_BUFFER_HPP_
