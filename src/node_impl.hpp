#ifndef _SENDME_NODE_IMPL_HPP_
#define _SENDME_NODE_IMPL_HPP_
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/buffer.hpp>
#include <fc/thread.hpp>
#include <fc/future.hpp>
#include <fc/udp_socket.hpp>
#include <fc/filesystem.hpp>
#include <boost/unordered_map.hpp>
#include <map>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace fc { namespace ip {
inline std::size_t hash_value( const fc::ip::endpoint& ep ) {
  std::size_t seed = 0;
  boost::hash_combine( seed, uint32_t(ep.get_address()) );
  boost::hash_combine( seed, ep.port() );
  return seed;
}
} }

namespace sm {
  using namespace boost::multi_index;
  typedef boost::unordered_map<fc::ip::endpoint,connection::ptr>  ep_to_con_map;
  typedef std::map<fc::sha1,connection::ptr>                      id_to_con_map;

  struct service {
    service(){}
    service( uint16_t p, const fc::string& n, const node::new_channel_handler& c )
    :port(p),name(n),handler(c){}

    uint16_t                  port;
    fc::string                name;
    node::new_channel_handler handler;
  };

  typedef multi_index_container<
    service,
    indexed_by< ordered_unique< member<service, uint16_t, &service::port > > >
  > service_set;

  class node::impl {
    public:
      impl( node& s )
      :_self(s),_thread("node"),_done(false),_relay_enabled(false){}

      ~impl() {
        _thread.quit();
      }

      node&                           _self;
      fc::thread                      _thread;
      fc::sha1                        _id;
      fc::private_key_t               _priv_key;
      fc::public_key_t                _pub_key;
      service_set                     _services;
      fc::udp_socket                  _sock;
      fc::future<void>                _read_loop_complete;
      bool                            _done;
      bool                            _relay_enabled;
      fc::path                        _datadir;

      ep_to_con_map                   _ep_to_con;

      /// connections tunneled through a relay, by remote node id
      id_to_con_map                   _relayed_con;

      /// peers registered with us while acting as a relay
      id_to_con_map                   _registered;

      void listen( uint16_t p );
      void read_loop();
      void handle_packet( const buffer& b, const fc::ip::endpoint& ep );

      /// the live connection to ep, replacing one that closed or failed
      connection::ptr find_or_create( const fc::ip::endpoint& ep );

      /**
       *  Advance con until it is connected, fails or timeout expires.
       */
      connection::ptr wait_connected( const connection::ptr& con, const fc::optional<fc::sha1>& expect,
                                      const fc::microseconds& timeout, const fc::string& what );
  };

} // namespace sm

#endif // _SENDME_NODE_IMPL_HPP_
