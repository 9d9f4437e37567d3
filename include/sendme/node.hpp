#ifndef _SENDME_NODE_HPP_
#define _SENDME_NODE_HPP_
#include <functional>
#include <fc/shared_ptr.hpp>
#include <fc/vector.hpp>
#include <fc/sha1.hpp>
#include <fc/ip.hpp>
#include <fc/optional.hpp>
#include <fc/pke.hpp>
#include <fc/time.hpp>
#include <sendme/path_type.hpp>

namespace fc {
  class thread;
  class string;
  class path;
}

namespace sm {
  class channel;
  class connection;
  class buffer;

  /**
   *  @class node
   *
   *  @brief Owns the UDP socket and identity of one peer, hosts services
   *         and manages connections to other nodes.
   *
   *  The node is protocol neutral and only deals with data channels.  All
   *  network state lives on the node's thread; public methods called from
   *  other threads are marshalled onto it and block until done.
   *
   *  A node may also act as a relay: peers register with it, it introduces
   *  them to each other for hole punching and forwards encrypted packets
   *  between registered peers that cannot reach each other directly.
   */
  class node : public fc::retainable {
    public:
      typedef fc::shared_ptr<node>                ptr;
      typedef fc::sha1                            id_type;
      typedef fc::ip::endpoint                    endpoint;
      typedef fc::shared_ptr<connection>          connection_ptr;
      typedef std::function<void(const channel&)> new_channel_handler;

      node();
      ~node();

      const id_type& get_id()const;
      fc::thread&    get_thread()const;
      fc::path       datadir()const;

      /**
       * @param ddir - data directory where identity information is stored.
       * @param port - send/recv messages via this port, 0 picks a free one.
       */
      void     init( const fc::path& ddir, uint16_t port );
      void     shutdown();

      /// the address the socket is bound to
      endpoint local_endpoint()const;

      /**
       *  Endpoints other nodes may be able to reach us at: the address of
       *  the interface used for outbound traffic and the loopback address,
       *  both with our port.
       */
      fc::vector<endpoint> advertised_endpoints()const;

      /**
       *  Connect to ep and wait until both sides are authenticated.
       *
       *  @param expect  - if set, fail unless the remote proves this identity
       *  @param timeout - give up after this long
       *  @param p       - recorded on the connection as the path it uses
       *
       *  @throw connection_error on timeout, failure or identity mismatch
       */
      connection_ptr connect_to( const endpoint& ep, const fc::optional<id_type>& expect,
                                 const fc::microseconds& timeout, path_type p = direct_path );

      /**
       *  Open a connection to target tunneled through an established
       *  connection with a relay both of us are registered with.
       */
      connection_ptr connect_relayed( const connection_ptr& relay, const id_type& target,
                                      const fc::microseconds& timeout );

      /**
       *  Create a new channel to remote_chan_num over c.
       */
      channel open_channel( const connection_ptr& c, uint16_t remote_chan_num );

      /**
       *  Every time a new channel is created to this service_chan_num, @param on_new_channel is called.
       *  @param service_chan_num - the port accepting new channels
       *  @param service_name - the name of the service running on port
       *  @param on_new_channel - called from the node's thread when a new channel
       *                          is created on service_chan_num
       */
      void start_service( uint16_t service_chan_num, const fc::string& service_name, const new_channel_handler& on_new_channel );

      /**
       *  Stop accepting new channels on service_port, does not close
       *  any open channels.
       */
      void close_service( uint16_t service_channel_num );

      /// connections, direct or relayed, that are currently authenticated
      size_t connected_count()const;

      /// accept relay registrations from other nodes
      void   enable_relay( bool e );
      bool   is_relay()const;
      size_t relay_peer_count()const;

    private:
      friend class connection;
      channel                  create_channel( connection* c, uint16_t rcn, uint16_t lcn );
      void                     send( const char* d, uint32_t l, const fc::ip::endpoint& );
      fc::signature_t          sign( const fc::sha1& h );
      const fc::public_key_t&  pub_key()const;

      bool                     relay_register( connection* c );
      connection_ptr           relay_lookup( const id_type& id )const;
      void                     handle_relayed_packet( const connection_ptr& relay, const id_type& src, const buffer& b );
      void                     reverse_connect( const endpoint& ep, const id_type& id );
      void                     connection_closed( connection* c );

      class impl;
      impl* my;
  };

} // namespace sm

#endif // _SENDME_NODE_HPP_
