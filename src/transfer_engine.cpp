#include <sendme/transfer_engine.hpp>
#include <sendme/transfer_messages.hpp>
#include <sendme/blob_provider.hpp>
#include <sendme/blob_sink.hpp>
#include <sendme/service_ports.hpp>
#include <sendme/hash_tree.hpp>
#include <sendme/connection.hpp>
#include <sendme/channel.hpp>
#include <sendme/node.hpp>
#include <sendme/error.hpp>
#include <sendme/db/resume.hpp>
#include <fc/thread.hpp>
#include <fc/future.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/thread_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <algorithm>
#include <deque>
#include <map>
#include <string>

namespace sm {

  namespace {
    /// how long a worker waits for a packet before checking for cancellation and timeouts
    const int64_t  poll_interval_ms     = 50;

    /// resume records are written after this many newly verified chunks
    const uint32_t resume_save_interval = 256;

    /// a blob_progress event is posted after this many verified chunks
    const uint32_t progress_interval    = 64;

    /// refuse manifests larger than this
    const uint64_t max_manifest_size    = 64*1024*1024;

    const uint64_t unknown_size         = uint64_t(-1);
  }

  /**
   *  Packets of one blob channel, pushed from the node's thread and
   *  popped by the worker fetching the blob.
   */
  class response_queue {
    public:
      typedef boost::shared_ptr<response_queue> ptr;

      response_queue():_closed(false){}

      void push( const buffer& b ) {
        {
          boost::unique_lock<boost::mutex> lock(_mtx);
          _queue.push_back(b);
        }
        _cond.notify_one();
      }

      void close() {
        {
          boost::unique_lock<boost::mutex> lock(_mtx);
          _closed = true;
        }
        _cond.notify_all();
      }

      bool is_closed() {
        boost::unique_lock<boost::mutex> lock(_mtx);
        return _closed;
      }

      /// false if nothing arrived within timeout_ms
      bool pop( buffer& b, int64_t timeout_ms ) {
        boost::unique_lock<boost::mutex> lock(_mtx);
        boost::system_time deadline = boost::get_system_time() + boost::posix_time::milliseconds( timeout_ms );
        while( _queue.empty() ) {
          if( _closed ) return false;
          if( !_cond.timed_wait( lock, deadline ) && _queue.empty() ) return false;
        }
        b = _queue.front();
        _queue.pop_front();
        return true;
      }

    private:
      boost::mutex              _mtx;
      boost::condition_variable _cond;
      std::deque<buffer>        _queue;
      bool                      _closed;
  };

  class transfer_engine::impl {
    public:
      impl( node& n, const connection::ptr& c, const transfer_config& cfg, event_channel* e, db::resume* r )
      :_node(n),_con(c),_cfg(cfg),_events(e),_rdb(r),_cancelled(false),_next_job(0){}

      node&             _node;
      connection::ptr   _con;
      transfer_config   _cfg;
      event_channel*    _events;
      db::resume*       _rdb;

      boost::mutex      _mtx;
      bool              _cancelled;
      size_t            _next_job;

      bool cancelled() {
        boost::unique_lock<boost::mutex> lock(_mtx);
        return _cancelled;
      }

      void post( const event& e ) {
        if( _events ) _events->post(e);
      }

      size_t take_job() {
        boost::unique_lock<boost::mutex> lock(_mtx);
        return _next_job++;
      }

      void fetch_entry( std::vector<transfer>& ts, const std::vector<size_t>& idx, const fc::path& dest );
      void fail( std::vector<transfer>& ts, const std::vector<size_t>& idx, failure::reason_enum r, const fc::string& msg );
  };

  /**
   *  Fetches one blob on its own channel.  Runs on a worker thread, the
   *  channel handler only queues packets for it.
   */
  class blob_fetch {
    public:
      blob_fetch( transfer_engine::impl& e, const fc::sha1& h, uint64_t size, blob_sink& s,
                  const fc::string& path, const fc::string& part, transfer* t )
      :_eng(e),_hash(h),_size(size),_sink(s),_path(path),_part(part),_t(t),
       _queue( new response_queue() ),_next(0),_verified_bytes(0),_unsaved(0){}

      ~blob_fetch() {
        try {
          close_channel();
        } catch ( const sendme_exception& e ) {
          wlog( "error closing blob channel: %s", e.what() );
        }
      }

      /**
       *  Brings the sink up to date with the blob.
       *
       *  @return failure::none when every chunk verified, otherwise why it stopped
       *  @throw  io_error if the sink fails, sendme_exception if the channel does
       */
      failure::reason_enum run( fc::string& msg );

      /// record how far the part file has been verified
      void save_resume();

      uint64_t size()const { return _size; }

    private:
      void                 open_channel();
      void                 close_channel();
      failure::reason_enum fetch_size( fc::string& msg );
      failure::reason_enum fetch_range( uint32_t end, bool proof, fc::string& msg );
      void                 post_progress();

      transfer_engine::impl& _eng;
      fc::sha1               _hash;
      uint64_t               _size;
      blob_sink&             _sink;
      fc::string             _path;
      fc::string             _part;
      transfer*              _t;
      channel                _chan;
      response_queue::ptr    _queue;
      uint32_t               _next;
      uint64_t               _verified_bytes;
      uint32_t               _unsaved;
  };

  void blob_fetch::open_channel() {
    _chan = _eng._node.open_channel( _eng._con, blob_service_port );
    response_queue::ptr q = _queue;
    _chan.on_recv( [q]( const buffer& b, channel::error_code ec ) {
      if( ec == channel::closed ) q->close();
      else q->push(b);
    });
  }

  void blob_fetch::close_channel() {
    if( _chan ) _chan.close();
    _queue->close();
  }

  void blob_fetch::post_progress() {
    if( _t ) _t->bytes_verified = _verified_bytes;
    if( !_t ) return;
    event e( event::blob_progress );
    e.hash        = _hash;
    e.path        = _path;
    e.bytes_done  = _verified_bytes;
    e.bytes_total = _size;
    _eng.post(e);
  }

  void blob_fetch::save_resume() {
    _unsaved = 0;
    if( !_eng._rdb || !_part.size() || _size == unknown_size ) return;
    db::resume::record rec;
    rec.part_path = _part;
    rec.blob_size = _size;
    if( _next ) rec.verified.push_back( db::resume::range( 0, _next ) );
    _eng._rdb->store( _hash, rec );
  }

  failure::reason_enum blob_fetch::fetch_size( fc::string& msg ) {
    uint32_t       losses = 0;
    fc::time_point sent   = fc::time_point::now();
    _chan.send( encode_message( size_request( _hash ) ) );
    while( true ) {
      if( _eng.cancelled() ) return failure::cancelled;
      buffer b;
      if( !_queue->pop( b, poll_interval_ms ) ) {
        if( _queue->is_closed() ) return failure::connection_lost;
        if( fc::time_point::now() - sent >= _eng._cfg.chunk_timeout ) {
          if( ++losses > _eng._cfg.max_loss_retries ) {
            msg = "no answer to size request";
            return failure::connection_lost;
          }
          sent = fc::time_point::now();
          _chan.send( encode_message( size_request( _hash ) ) );
        }
        continue;
      }
      if( message_type(b) != size_response_msg ) continue;
      size_response r;
      try {
        decode_message( b, r );
      } catch ( const sendme_exception& e ) {
        wlog( "%s", e.what() );
        continue;
      }
      if( r.hash != _hash ) continue;
      if( r.result != transfer_result::ok ) {
        msg = "sender does not have " + fc::string(_hash);
        return failure::hash_mismatch;
      }
      _size = r.size;
      return failure::none;
    }
  }

  /**
   *  Advances _next to end.  Requests are kept request_window chunks ahead
   *  of _next and responses are verified strictly in index order.
   *
   *  With proof set the chunk bytes come from the sink instead of the
   *  network and the first chunk that does not verify ends the range early.
   */
  failure::reason_enum blob_fetch::fetch_range( uint32_t end, bool proof, fc::string& msg ) {
    const transfer_config& cfg = _eng._cfg;
    const uint8_t  flags   = proof ? uint8_t(chunk_request::proof_only) : uint8_t(0);
    const uint32_t window  = std::max( cfg.request_window, uint32_t(1) );

    std::map<uint32_t,chunk_response> pending;
    uint32_t       next_req      = _next;
    uint32_t       losses        = 0;
    uint32_t       corrupt       = 0;
    fc::time_point last_progress = fc::time_point::now();
    char           local[chunk_size];

    while( _next < end ) {
      if( _eng.cancelled() ) return failure::cancelled;

      uint32_t limit = std::min( end, _next + window );
      while( next_req < limit ) {
        uint32_t n = std::min( limit - next_req, uint32_t(blob_provider::max_chunks_per_request) );
        _chan.send( encode_message( chunk_request( _hash, next_req, n, flags ) ) );
        next_req += n;
      }

      buffer b;
      if( !_queue->pop( b, poll_interval_ms ) ) {
        if( _queue->is_closed() ) {
          msg = "channel closed";
          return failure::connection_lost;
        }
        if( fc::time_point::now() - last_progress >= cfg.chunk_timeout ) {
          if( ++losses > cfg.max_loss_retries ) {
            msg = "sender stopped answering";
            return failure::connection_lost;
          }
          wlog( "no response for chunk %d of %s, requesting it again", _next, _path.c_str() );
          next_req      = _next;
          last_progress = fc::time_point::now();
        }
        continue;
      }

      if( message_type(b) != chunk_response_msg ) continue;
      chunk_response r;
      try {
        decode_message( b, r );
      } catch ( const sendme_exception& e ) {
        wlog( "%s", e.what() );
        continue;
      }
      if( r.hash != _hash || r.index < _next || r.index >= end || r.flags != flags ) continue;
      if( r.result != transfer_result::ok ) {
        msg = "sender refused chunk " + fc::string( boost::lexical_cast<std::string>(r.index).c_str() );
        return failure::hash_mismatch;
      }
      pending[r.index] = r;

      std::map<uint32_t,chunk_response>::iterator itr;
      while( (itr = pending.find(_next)) != pending.end() ) {
        const chunk_response& c   = itr->second;
        uint32_t              len = chunk_length( _size, _next );
        const char*           d   = local;
        bool                  ok  = true;
        if( proof ) {
          if( len ) _sink.read( uint64_t(_next) * chunk_size, local, len );
        } else {
          ok = c.data.size() == len;
          if( ok && len ) d = c.data.data();
        }
        ok = ok && hash_tree::verify( _hash, _size, _next, hash_tree::hash_leaf( d, len ), c.siblings );

        if( !ok ) {
          pending.clear();
          if( proof ) return failure::none;
          if( ++corrupt > cfg.max_corrupt_retries ) {
            elog( "chunk %d of %s failed verification %d times", _next, _path.c_str(), corrupt );
            msg = "chunk " + fc::string( boost::lexical_cast<std::string>(_next).c_str() ) + " failed verification";
            return failure::hash_mismatch;
          }
          wlog( "chunk %d of %s failed verification, requesting it again", _next, _path.c_str() );
          next_req = _next;
          break;
        }

        if( !proof ) _sink.append( d, len );
        pending.erase(itr);
        ++_next;
        _verified_bytes += len;
        corrupt       = 0;
        losses        = 0;
        last_progress = fc::time_point::now();

        if( !proof && ++_unsaved >= resume_save_interval ) save_resume();
        if( _next % progress_interval == 0 || _next == end ) post_progress();
      }
    }
    return failure::none;
  }

  failure::reason_enum blob_fetch::run( fc::string& msg ) {
    open_channel();

    failure::reason_enum r;
    if( _size == unknown_size ) {
      r = fetch_size( msg );
      if( r != failure::none ) return r;
      if( _size > max_manifest_size ) {
        msg = "blob of " + fc::string( boost::lexical_cast<std::string>(_size).c_str() ) + " bytes is too large";
        return failure::hash_mismatch;
      }
    }
    uint32_t total = chunk_count( _size );

    uint32_t prefix = 0;
    if( _eng._rdb && _part.size() ) {
      db::resume::record rec;
      if( _eng._rdb->fetch( _hash, rec ) && rec.blob_size == _size && rec.part_path == _part )
        prefix = std::min( rec.verified_prefix(), total );
      uint64_t have = _sink.size();
      uint32_t whole = have >= _size ? total : uint32_t( have / chunk_size );
      prefix = std::min( prefix, whole );
    }

    if( prefix ) {
      slog( "resuming %s, checking %d chunks received earlier", _path.c_str(), prefix );
      r = fetch_range( prefix, true, msg );
      if( r != failure::none ) return r;
      if( _next < prefix )
        wlog( "local copy of %s differs from chunk %d on, fetching it again", _path.c_str(), _next );
    }
    _sink.truncate( std::min( uint64_t(_next) * chunk_size, _size ) );
    _verified_bytes = std::min( uint64_t(_next) * chunk_size, _size );
    if( _next ) post_progress();

    return fetch_range( total, false, msg );
  }

  void transfer_engine::impl::fail( std::vector<transfer>& ts, const std::vector<size_t>& idx,
                                    failure::reason_enum r, const fc::string& msg ) {
    for( size_t i = 0; i < idx.size(); ++i ) {
      transfer& t = ts[idx[i]];
      t.state   = transfer::failed;
      t.failure = r;
      event e( event::blob_failed );
      e.hash        = t.hash;
      e.path        = t.path;
      e.bytes_done  = t.bytes_verified;
      e.bytes_total = t.bytes_total;
      e.reason      = r;
      e.message     = msg;
      post(e);
    }
  }

  /**
   *  Fetches the blob of ts[idx[0]] and, once verified, copies it to the
   *  other entries with the same content.
   */
  void transfer_engine::impl::fetch_entry( std::vector<transfer>& ts, const std::vector<size_t>& idx, const fc::path& dest ) {
    transfer& t = ts[idx[0]];
    if( cancelled() ) {
      fail( ts, idx, failure::cancelled, "cancelled" );
      return;
    }
    for( size_t i = 0; i < idx.size(); ++i ) ts[idx[i]].state = transfer::in_progress;

    fc::string           msg;
    failure::reason_enum r = failure::none;
    fc::string           part = file_sink::part_path( dest, t.hash ).string();
    file_sink            sink( dest, t.path, t.hash );
    {
      blob_fetch f( *this, t.hash, t.bytes_total, sink, t.path, part, &t );
      try {
        r = f.run( msg );
        if( r == failure::none ) sink.commit();
      } catch ( const io_error& e ) {
        elog( "%s: %s", t.path.c_str(), e.what() );
        r   = failure::io;
        msg = e.what();
      } catch ( const sendme_exception& e ) {
        wlog( "%s: %s", t.path.c_str(), e.what() );
        r   = failure::connection_lost;
        msg = e.what();
      }

      try {
        if( r == failure::connection_lost || r == failure::cancelled ) {
          f.save_resume();
        } else {
          if( r != failure::none ) sink.discard();
          if( _rdb ) _rdb->remove( t.hash );
        }
      } catch ( const io_error& e ) {
        elog( "unable to update resume state of %s: %s", t.path.c_str(), e.what() );
      }
    }

    if( r != failure::none ) {
      if( msg.size() == 0 ) msg = failure::name(r);
      wlog( "%s failed: %s", t.path.c_str(), msg.c_str() );
      fail( ts, idx, r, msg );
      return;
    }

    for( size_t i = 0; i < idx.size(); ++i ) {
      transfer& d = ts[idx[i]];
      if( i ) {
        boost::filesystem::path to = boost::filesystem::path( dest.string().c_str() ) / d.path.c_str();
        try {
          if( !boost::filesystem::exists( to.parent_path() ) )
            boost::filesystem::create_directories( to.parent_path() );
          boost::filesystem::copy_file( sink.final(), to, boost::filesystem::copy_option::overwrite_if_exists );
        } catch ( const boost::filesystem::filesystem_error& e ) {
          elog( "unable to write %s: %s", to.string().c_str(), e.what() );
          std::vector<size_t> one( 1, idx[i] );
          fail( ts, one, failure::io, e.what() );
          continue;
        }
      }
      d.state          = transfer::verified;
      d.bytes_verified = d.bytes_total;
      event e( event::blob_verified );
      e.hash        = d.hash;
      e.path        = d.path;
      e.bytes_done  = d.bytes_total;
      e.bytes_total = d.bytes_total;
      post(e);
    }
  }

  transfer_engine::transfer_engine( node& n, const connection::ptr& con, const transfer_config& cfg,
                                    event_channel* events, db::resume* rdb )
  :my( new impl( n, con, cfg, events, rdb ) ) {}

  transfer_engine::~transfer_engine() {
    delete my;
  }

  void transfer_engine::cancel() {
    boost::unique_lock<boost::mutex> lock(my->_mtx);
    if( !my->_cancelled ) slog( "cancelling transfers" );
    my->_cancelled = true;
  }

  bool transfer_engine::is_cancelled()const {
    return my->cancelled();
  }

  std::vector<char> transfer_engine::fetch_blob( const fc::sha1& h ) {
    memory_sink          sink;
    fc::string           msg;
    failure::reason_enum r;
    {
      blob_fetch f( *my, h, unknown_size, sink, fc::string(h), fc::string(), 0 );
      r = f.run( msg );
    }
    switch( r ) {
      case failure::none:
        sink.commit();
        return sink.data();
      case failure::cancelled:
        SENDME_THROW( cancelled, "fetch of %1% cancelled", %fc::string(h).c_str() );
      case failure::hash_mismatch:
        SENDME_THROW( hash_mismatch, "%1%: %2%", %fc::string(h).c_str() %msg.c_str() );
      case failure::io:
        SENDME_THROW( io_error, "%1%: %2%", %fc::string(h).c_str() %msg.c_str() );
      default:
        SENDME_THROW( connection_error, "%1%: %2%", %fc::string(h).c_str() %msg.c_str() );
    }
  }

  manifest transfer_engine::fetch_manifest( const fc::sha1& root ) {
    std::vector<char> d = fetch_blob( root );
    manifest m;
    try {
      m = manifest::deserialize( d.size() ? d.data() : 0, d.size() );
      m.validate();
    } catch ( const sendme_exception& e ) {
      SENDME_THROW( hash_mismatch, "invalid manifest %1%: %2%", %fc::string(root).c_str() %e.what() );
    }
    if( m.root_hash() != root )
      SENDME_THROW( hash_mismatch, "manifest does not hash to %1%", %fc::string(root).c_str() );
    slog( "manifest %s: %d entries, %lld bytes", fc::string(root).c_str(), int(m.entries.size()), (long long)m.total_size() );
    return m;
  }

  std::vector<transfer> transfer_engine::run( const manifest& m, const fc::path& dest ) {
    std::vector<transfer> ts( m.entries.size() );
    std::map<fc::sha1, std::vector<size_t> > by_hash;
    std::vector<fc::sha1>                    jobs;
    for( size_t i = 0; i < m.entries.size(); ++i ) {
      ts[i].hash        = m.entries[i].hash;
      ts[i].path        = m.entries[i].path;
      ts[i].bytes_total = m.entries[i].size;
      std::vector<size_t>& idx = by_hash[ts[i].hash];
      if( idx.empty() ) jobs.push_back( ts[i].hash );
      idx.push_back(i);
    }
    if( jobs.empty() ) return ts;

    {
      boost::unique_lock<boost::mutex> lock(my->_mtx);
      my->_next_job = 0;
    }

    uint32_t n = std::min( std::max( my->_cfg.max_concurrent_blobs, uint32_t(1) ), uint32_t(jobs.size()) );
    slog( "fetching %d blobs, %d at a time", int(jobs.size()), int(n) );

    std::vector< boost::shared_ptr<fc::thread> > workers;
    std::vector< fc::future<void> >              done;
    for( uint32_t i = 0; i < n; ++i ) {
      std::string name = "fetch" + boost::lexical_cast<std::string>(i);
      workers.push_back( boost::shared_ptr<fc::thread>( new fc::thread( name.c_str() ) ) );
      done.push_back( workers.back()->async( [&]() {
        size_t j;
        while( (j = my->take_job()) < jobs.size() )
          my->fetch_entry( ts, by_hash.find(jobs[j])->second, dest );
      }));
    }
    for( size_t i = 0; i < done.size(); ++i ) {
      try {
        done[i].wait();
      } catch ( ... ) {
        elog( "fetch worker failed: %s", fc::except_str().c_str() );
      }
    }
    for( size_t i = 0; i < workers.size(); ++i )
      workers[i]->quit();

    // anything a failed worker left behind
    for( std::map<fc::sha1, std::vector<size_t> >::iterator itr = by_hash.begin(); itr != by_hash.end(); ++itr ) {
      if( ts[itr->second[0]].state == transfer::pending || ts[itr->second[0]].state == transfer::in_progress )
        my->fail( ts, itr->second, my->cancelled() ? failure::cancelled : failure::io, "not fetched" );
    }
    return ts;
  }

}
