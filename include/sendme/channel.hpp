#ifndef _SENDME_CHANNEL_HPP_
#define _SENDME_CHANNEL_HPP_
#include <functional>
#include <fc/shared_ptr.hpp>
#include <fc/sha1.hpp>
#include <sendme/buffer.hpp>

namespace sm {
  class node;
  class connection;

  /**
   *  @class channel
   *
   *  One logical stream of datagrams inside a connection.  Each side
   *  names the channel by its own number; the pair (local, remote)
   *  identifies it within the connection so concurrent streams never mix.
   *  Delivery and order are not guaranteed, the protocol on top of the
   *  channel handles loss.
   *
   *  Data is delivered to the handler from the node's thread.  Handlers
   *  must not block.
   *
   *  Channels are handles to shared state; copies refer to the same
   *  channel.  Calling close invalidates every copy.
   */
  class channel {
    public:
      enum error_code {
        ok     = 0,
        closed = 1
      };
      typedef fc::sha1                                                node_id;
      typedef std::function<void(const sm::buffer&,error_code)>      recv_handler;

      channel();
      channel( const channel& c );
      ~channel();

      channel& operator=( const channel& c );
      bool operator==( const channel& c )const;
      operator bool()const;

      node_id  remote_node()const;
      uint16_t local_channel_num()const;
      uint16_t remote_channel_num()const;

      /// after calling this the receive handler will no longer be called
      void     close();
      void     send( const sm::buffer& buf );
      void     on_recv( const recv_handler& cb );

      node&    get_node()const;

    private:
      friend class node;
      channel( connection* c, uint16_t r, uint16_t l );

      friend class connection;
      void recv( const sm::buffer& b, error_code ec = channel::ok );
      void reset();

      class impl;
      fc::shared_ptr<impl> my;
  };

} // namespace sm

#endif // _SENDME_CHANNEL_HPP_
