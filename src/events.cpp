#include <sendme/events.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/thread_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/format.hpp>

namespace sm {

  const char* failure::name( reason_enum r ) {
    switch( r ) {
      case none:            return "none";
      case hash_mismatch:   return "hash mismatch";
      case cancelled:       return "cancelled";
      case connection_lost: return "connection lost";
      case io:              return "io error";
    }
    return "unknown";
  }

  event::event( type_enum t )
  :type(t),bytes_done(0),bytes_total(0),conn_path(direct_path),reason(failure::none){}

  fc::string event::to_string()const {
    std::string s;
    switch( type ) {
      case session_started:
        s = "session started";
        break;
      case path_selected:
        s = (boost::format( "connected via %1% path" ) % sm::to_string(conn_path)).str();
        break;
      case import_progress:
        s = (boost::format( "hashing %1% %2%/%3%" ) % path.c_str() % bytes_done % bytes_total).str();
        break;
      case blob_progress:
        s = (boost::format( "receiving %1% %2%/%3%" ) % path.c_str() % bytes_done % bytes_total).str();
        break;
      case blob_verified:
        s = (boost::format( "verified %1% (%2% bytes)" ) % path.c_str() % bytes_total).str();
        break;
      case blob_failed:
        s = (boost::format( "failed %1%: %2%" ) % path.c_str() % failure::name(reason)).str();
        break;
      case session_complete:
        s = "transfer complete";
        break;
      case session_failed:
        s = (boost::format( "transfer failed: %1%" ) % message.c_str()).str();
        break;
    }
    return s.c_str();
  }

  event_channel::event_channel()
  :_closed(false){}

  void event_channel::post( const event& e ) {
    {
      boost::unique_lock<boost::mutex> lock(_mtx);
      if( _closed ) return;
      _queue.push_back(e);
    }
    _cond.notify_one();
  }

  bool event_channel::next( event& e, const fc::microseconds& timeout ) {
    boost::unique_lock<boost::mutex> lock(_mtx);
    boost::system_time deadline = boost::get_system_time() + boost::posix_time::microseconds( timeout.count() );
    while( _queue.empty() ) {
      if( _closed ) return false;
      if( !_cond.timed_wait( lock, deadline ) && _queue.empty() ) return false;
    }
    e = _queue.front();
    _queue.pop_front();
    return true;
  }

  bool event_channel::try_next( event& e ) {
    boost::unique_lock<boost::mutex> lock(_mtx);
    if( _queue.empty() ) return false;
    e = _queue.front();
    _queue.pop_front();
    return true;
  }

  void event_channel::close() {
    {
      boost::unique_lock<boost::mutex> lock(_mtx);
      _closed = true;
    }
    _cond.notify_all();
  }

  bool event_channel::is_closed()const {
    boost::unique_lock<boost::mutex> lock(_mtx);
    return _closed;
  }

  size_t event_channel::size()const {
    boost::unique_lock<boost::mutex> lock(_mtx);
    return _queue.size();
  }

} // namespace sm
