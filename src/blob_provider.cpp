#include <sendme/blob_provider.hpp>
#include <sendme/service_ports.hpp>
#include <sendme/node.hpp>
#include <sendme/channel.hpp>
#include <sendme/error.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/shared_ptr.hpp>
#include <map>
#include <vector>

namespace sm {

  class provider_connection : virtual public fc::retainable {
    public:
      typedef fc::shared_ptr<provider_connection> ptr;

      provider_connection( const channel& c, blob_provider::impl& p )
      :_prov(p),_chan(c){}

      void handle( const buffer& b );
      void close() {
        _readers.clear();
        _chan.close();
      }

      size_response  size( const size_request& r );
      chunk_response chunk( const chunk_request& r, uint32_t index );

      blob_store::reader& reader_for( const fc::sha1& h );

      blob_provider::impl&                                         _prov;
      channel                                                      _chan;
      std::map<fc::sha1, boost::shared_ptr<blob_store::reader> >   _readers;
  };

  class blob_provider::impl {
    public:
      impl( node& n, const blob_store::ptr& s )
      :_node(n),_store(s),_started(false){}

      node&                              _node;
      blob_store::ptr                    _store;
      bool                               _started;
      response_filter                    _filter;
      request_observer                   _observer;
      std::vector<provider_connection::ptr> _cons;

      void on_new_channel( const channel& c ) {
        provider_connection::ptr pc( new provider_connection( c, *this ) );
        _cons.push_back(pc);
        provider_connection* raw = pc.get();
        channel ch = c;
        ch.on_recv( [this,raw]( const buffer& b, channel::error_code ec ) {
          if( ec == channel::closed ) {
            remove(raw);
            return;
          }
          raw->handle(b);
        });
      }

      void remove( provider_connection* pc ) {
        for( size_t i = 0; i < _cons.size(); ++i ) {
          if( _cons[i].get() == pc ) {
            _cons.erase( _cons.begin() + i );
            return;
          }
        }
      }
  };

  blob_store::reader& provider_connection::reader_for( const fc::sha1& h ) {
    std::map<fc::sha1, boost::shared_ptr<blob_store::reader> >::iterator itr = _readers.find(h);
    if( itr != _readers.end() ) return *itr->second;
    boost::shared_ptr<blob_store::reader> r( new blob_store::reader( *_prov._store, h ) );
    _readers[h] = r;
    return *r;
  }

  size_response provider_connection::size( const size_request& r ) {
    size_response rep;
    rep.hash = r.hash;
    if( !_prov._store->contains( r.hash ) ) {
      rep.result = transfer_result::unknown_blob;
      return rep;
    }
    rep.size = _prov._store->get( r.hash ).tree.blob_size();
    return rep;
  }

  chunk_response provider_connection::chunk( const chunk_request& r, uint32_t index ) {
    chunk_response rep;
    rep.hash  = r.hash;
    rep.index = index;
    rep.flags = r.flags;
    if( !_prov._store->contains( r.hash ) ) {
      rep.result = transfer_result::unknown_blob;
      return rep;
    }
    blob_store::reader& rd = reader_for( r.hash );
    if( index >= chunk_count( rd.size() ) ) {
      rep.result = transfer_result::invalid_range;
      return rep;
    }
    if( !(r.flags & chunk_request::proof_only) ) {
      rep.data.resize( chunk_length( rd.size(), index ) );
      if( rep.data.size() )
        rd.read( index, rep.data.data() );
    }
    rep.siblings = rd.proof( index );
    // the receiver asks for chunks in order, the last one ends the blob
    if( index + 1 == chunk_count( rd.size() ) )
      _readers.erase( r.hash );
    return rep;
  }

  void provider_connection::handle( const buffer& b ) {
    try {
      switch( message_type(b) ) {
        case size_request_msg: {
          size_request r;
          decode_message( b, r );
          _chan.send( encode_message( size(r) ) );
          return;
        }
        case chunk_request_msg: {
          chunk_request r;
          decode_message( b, r );
          if( _prov._observer ) _prov._observer( r );

          uint32_t n = r.count;
          if( n > blob_provider::max_chunks_per_request ) n = blob_provider::max_chunks_per_request;
          for( uint32_t i = 0; i < n; ++i ) {
            chunk_response rep = chunk( r, r.index + i );
            bool bad = rep.result != transfer_result::ok;
            if( _prov._filter && !_prov._filter( rep ) ) continue;
            _chan.send( encode_message( rep ) );
            if( bad ) break;
          }
          return;
        }
        default:
          wlog( "unexpected message type %d on blob channel", int(message_type(b)) );
      }
    } catch ( const io_error& e ) {
      elog( "unable to serve blob data: %s", e.what() );
    } catch ( const sendme_exception& e ) {
      wlog( "bad request from %s: %s", fc::string(_chan.remote_node()).c_str(), e.what() );
    }
  }

  blob_provider::blob_provider( node& n, const blob_store::ptr& s )
  :my( new impl( n, s ) ) {}

  blob_provider::~blob_provider() {
    try {
      stop();
    } catch ( const sendme_exception& e ) {
      elog( "error stopping blob provider: %s", e.what() );
    }
    delete my;
  }

  void blob_provider::start() {
    if( !my->_node.get_thread().is_current() ) {
      my->_node.get_thread().async( [this](){ start(); } ).wait();
      return;
    }
    if( my->_started ) return;
    my->_node.start_service( blob_service_port, "blob", [this]( const channel& c ) { my->on_new_channel(c); } );
    my->_started = true;
  }

  void blob_provider::stop() {
    if( !my->_node.get_thread().is_current() ) {
      my->_node.get_thread().async( [this](){ stop(); } ).wait();
      return;
    }
    if( !my->_started ) return;
    my->_node.close_service( blob_service_port );
    std::vector<provider_connection::ptr> cons;
    std::swap( cons, my->_cons );
    for( size_t i = 0; i < cons.size(); ++i )
      cons[i]->close();
    my->_started = false;
  }

  void blob_provider::set_response_filter( const response_filter& f )  { my->_filter = f;   }
  void blob_provider::set_request_observer( const request_observer& o ) { my->_observer = o; }

  size_t blob_provider::connection_count()const {
    if( !my->_node.get_thread().is_current() )
      return my->_node.get_thread().async( [this](){ return connection_count(); } ).wait();
    return my->_cons.size();
  }

  size_t blob_provider::open_readers()const {
    if( !my->_node.get_thread().is_current() )
      return my->_node.get_thread().async( [this](){ return open_readers(); } ).wait();
    size_t n = 0;
    for( size_t i = 0; i < my->_cons.size(); ++i )
      n += my->_cons[i]->_readers.size();
    return n;
  }

}
