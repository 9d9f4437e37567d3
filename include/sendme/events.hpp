#ifndef _SENDME_EVENTS_HPP_
#define _SENDME_EVENTS_HPP_
#include <stdint.h>
#include <deque>
#include <fc/sha1.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <sendme/path_type.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>

namespace sm {

  struct failure {
    enum reason_enum {
      none            = 0,
      hash_mismatch   = 1,
      cancelled       = 2,
      connection_lost = 3,
      io              = 4
    };
    static const char* name( reason_enum r );
  };

  /**
   *  Progress and outcome notifications produced by the core and consumed
   *  by whatever renders them.  Which fields are meaningful depends on type.
   */
  struct event {
    enum type_enum {
      session_started  = 0, ///< receive session began
      path_selected    = 1, ///< path
      import_progress  = 2, ///< path, bytes_done, bytes_total while hashing
      blob_progress    = 3, ///< hash, path, bytes_done, bytes_total
      blob_verified    = 4, ///< hash, path, bytes_total
      blob_failed      = 5, ///< hash, path, reason
      session_complete = 6,
      session_failed   = 7  ///< message
    };

    event( type_enum t = session_started );

    type_enum           type;
    fc::sha1            hash;
    fc::string          path;
    uint64_t            bytes_done;
    uint64_t            bytes_total;
    path_type           conn_path;
    failure::reason_enum reason;
    fc::string          message;

    /// single line description suitable for a terminal
    fc::string to_string()const;
  };

  /**
   *  @class event_channel
   *
   *  Unidirectional queue from the core to the UI.  Events are posted from
   *  the node and hashing threads and read from any other thread; order is
   *  preserved.  After close() posting is ignored and next() drains what is
   *  left before returning false.
   */
  class event_channel {
    public:
      event_channel();

      void post( const event& e );

      /// blocks up to timeout, returns false on timeout or when closed and empty
      bool next( event& e, const fc::microseconds& timeout );
      bool try_next( event& e );

      void   close();
      bool   is_closed()const;
      size_t size()const;

    private:
      mutable boost::mutex       _mtx;
      boost::condition_variable  _cond;
      std::deque<event>          _queue;
      bool                       _closed;
  };

} // namespace sm

#endif // _SENDME_EVENTS_HPP_
