#ifndef _SENDME_RECEIVE_SESSION_HPP_
#define _SENDME_RECEIVE_SESSION_HPP_
#include <vector>
#include <fc/shared_ptr.hpp>
#include <fc/filesystem.hpp>
#include <fc/time.hpp>
#include <sendme/ticket.hpp>
#include <sendme/manifest.hpp>
#include <sendme/transfer_engine.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>

namespace sm {
  class context;
  class connection;
  class orchestrator;

  /**
   *  @class receive_session
   *
   *  Fetches the share named by a ticket: connects to the sender, fetches
   *  and verifies the manifest, then every file.  Progress is reported on
   *  the context's event channel.
   */
  class receive_session {
    public:
      receive_session( context& ctx );
      ~receive_session();

      /**
       *  Blocks until every file is verified or failed.  Per file failures
       *  are reported in the returned transfers.
       *
       *  @throw ticket_parse_error, connection_error, hash_mismatch (manifest)
       *         or cancelled if the session ends before files are fetched
       */
      std::vector<transfer> run( const fc::string& ticket_text, const fc::path& dest );
      std::vector<transfer> run( const ticket& t, const fc::path& dest );

      /**
       *  Ask run() to stop, does not block.  Works while connecting too.
       *  Destroying the session cancels it and waits for run() to return.
       */
      void cancel();

      /// true if run() returned within timeout
      bool wait_stopped( const fc::microseconds& timeout );

      const manifest& get_manifest()const { return _manifest; }

    private:
      std::vector<transfer> fetch( const ticket& t, const fc::path& dest );
      void                  finish( bool ok, const fc::string& msg );
      bool                  is_cancelled();

      context&                    _ctx;
      manifest                    _manifest;

      boost::mutex                _mtx;
      boost::condition_variable   _cond;
      bool                        _cancelled;
      bool                        _running;
      orchestrator*               _orch;
      transfer_engine*            _engine;
  };

}

#endif // _SENDME_RECEIVE_SESSION_HPP_
