#ifndef _SENDME_CONNECTION_HPP_
#define _SENDME_CONNECTION_HPP_
#include <fc/shared_ptr.hpp>
#include <fc/sha1.hpp>
#include <fc/ip.hpp>
#include <fc/optional.hpp>
#include <fc/signals.hpp>
#include <sendme/channel.hpp>
#include <sendme/path_type.hpp>

namespace sm {
  class node;
  class buffer;

  /**
   *  Manages the secure session with one remote node.
   *
   *  A connection runs a Diffie-Hellman exchange, proves the identity of
   *  both ends by signing the shared key, and then encrypts every message
   *  with Blowfish.  Channels are multiplexed on top of it.
   *
   *  Usually the connection talks to a UDP endpoint.  A relayed connection
   *  instead hands its encrypted packets to an established connection with
   *  a relay node which forwards them to the remote peer, so the relay
   *  never sees plain text.
   *
   *  All methods must be called from the node's thread.
   */
  class connection : public fc::retainable {
    public:
        enum state_enum {
          failed        = -1, // the handshake failed or the remote is not who we expected
          connecting    = 0,  // nothing has been exchanged yet
          generated_dh  = 1,  // we have generated and sent a dh pub key
          received_dh   = 2,  // we have received a dh key, sent a dh key, and sent an auth
          connected     = 3,  // both sides have authenticated
          closing       = 4,
          closed        = 5
        };

        // max 5 bits
        enum proto_message_type {
          data_msg                 = 0,
          auth_msg                 = 1,
          auth_resp_msg            = 2,
          close_msg                = 3,
          relay_register_msg       = 4,
          relay_registered_msg     = 5,
          relay_introduce_msg      = 6,
          relay_intro_msg          = 7,
          req_connect_msg          = 8,
          relay_forward_msg        = 9,
          channel_close_msg        = 10
        };

        enum {
          /// largest channel message, small enough to be wrapped for a relay
          max_message_size  = 2000,
          /// largest buffer a channel may send
          max_channel_data  = max_message_size - 4
        };

        typedef fc::shared_ptr<connection> ptr;
        typedef fc::sha1                   node_id;

        connection( node& np, const fc::ip::endpoint& ep );
        connection( node& np, const connection::ptr& relay, const node_id& remote );
        ~connection();

        node&            get_node()const;
        fc::ip::endpoint get_endpoint()const;
        node_id          get_remote_id()const;
        state_enum       get_state()const;
        path_type        get_path()const;
        void             set_path( path_type p );
        bool             is_relayed()const;

        /// fail authentication unless the remote proves this identity
        void       expect_remote_id( const node_id& id );

        /// send the message the current state calls for
        void       advance();
        void       close();
        void       close_channels();

        void       handle_packet( const buffer& b );

        void       send( const channel& c, const buffer& b );
        void       send( const char* d, uint32_t l, proto_message_type t );

        uint16_t   get_free_channel_num();
        void       add_channel( const channel& c );
        /// forget the channel and tell the remote end it is closed
        void       close_channel( const channel& c );

        /**
         *  Ask the relay at the other end of this connection to accept
         *  forwarded traffic for us.
         *
         *  @return our endpoint as seen by the relay
         *  @throw  connection_error if the relay refuses or does not answer
         */
        fc::ip::endpoint register_with_relay( const fc::microseconds& timeout );

        /**
         *  Ask the relay where target is.  The relay also tells target to
         *  connect back to us so both sides punch holes at the same time.
         *
         *  @throw connection_error if target is not registered or no answer
         */
        fc::ip::endpoint request_introduction( const node_id& target, const fc::microseconds& timeout );

        /// wraps an encrypted packet of a relayed connection for the relay
        void       forward( bool to_relay, const node_id& peer, const char* d, uint32_t l );

        boost::signal<void(state_enum)> state_changed;

    private:
        void  goto_state( state_enum s );
        void  send_raw( const char* d, uint32_t l );

        void handle_connecting( const buffer& b );
        void handle_generated_dh( const buffer& b );
        void handle_received_dh( const buffer& b );
        void handle_connected( const buffer& b );

        bool decode_packet( const buffer& b );
        bool handle_data_msg( const buffer& b );
        bool handle_auth_msg( const buffer& b );
        bool handle_auth_resp_msg( const buffer& b );
        bool handle_close_msg( const buffer& b );
        bool handle_relay_register_msg( const buffer& b );
        bool handle_relay_registered_msg( const buffer& b );
        bool handle_relay_introduce_msg( const buffer& b );
        bool handle_relay_intro_msg( const buffer& b );
        bool handle_req_connect_msg( const buffer& b );
        bool handle_relay_forward_msg( const buffer& b );
        bool handle_channel_close_msg( const buffer& b );

        static bool is_dh_packet( const buffer& b );
        void generate_dh();
        bool process_dh( const buffer& b );
        void send_dh();
        void send_auth();
        void send_auth_response( bool ok );
        void send_close();
        void send_req_connect( const node_id& id, const fc::ip::endpoint& ep );

        class impl;
        impl* my;
  };

} // namespace sm

#endif // _SENDME_CONNECTION_HPP_
