#include <sendme/receive_session.hpp>
#include <sendme/context.hpp>
#include <sendme/orchestrator.hpp>
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <sendme/db/resume.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/thread_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/format.hpp>

namespace sm {

  namespace {
    /// exposes the orchestrator to cancel() for as long as it connects
    class connecting {
      public:
        connecting( boost::mutex& m, orchestrator*& slot, orchestrator& o )
        :_mtx(m),_slot(slot) {
          boost::unique_lock<boost::mutex> lock(_mtx);
          _slot = &o;
        }
        ~connecting() {
          boost::unique_lock<boost::mutex> lock(_mtx);
          _slot = 0;
        }

      private:
        boost::mutex&   _mtx;
        orchestrator*&  _slot;
    };

    /**
     *  Detaches the engine from the session and closes the connection
     *  however fetch() ends.
     */
    class fetch_cleanup {
      public:
        fetch_cleanup( node& n, boost::mutex& m, transfer_engine*& e, const fc::shared_ptr<connection>& c )
        :_node(n),_mtx(m),_engine(e),_con(c){}

        ~fetch_cleanup() {
          {
            boost::unique_lock<boost::mutex> lock(_mtx);
            _engine = 0;
          }
          fc::shared_ptr<connection> c = _con;
          try {
            _node.get_thread().async( [=](){ c->close(); } ).wait();
          } catch ( ... ) {
            elog( "error closing connection: %s", fc::except_str().c_str() );
          }
        }

      private:
        node&                       _node;
        boost::mutex&               _mtx;
        transfer_engine*&           _engine;
        fc::shared_ptr<connection>  _con;
    };
  }

  receive_session::receive_session( context& ctx )
  :_ctx(ctx),_cancelled(false),_running(false),_orch(0),_engine(0){}

  /**
   *  run() may still be using the members, so wait for it to return.  The
   *  cancellation makes that take no longer than the grace period plus the
   *  slice a connection stage waits between checks.
   */
  receive_session::~receive_session() {
    cancel();
    if( !wait_stopped( fc::milliseconds( _ctx.get_config().cancel_grace_ms ) ) ) {
      wlog( "receive did not stop within the grace period, still waiting" );
      boost::unique_lock<boost::mutex> lock(_mtx);
      while( _running ) _cond.wait( lock );
    }
  }

  void receive_session::cancel() {
    boost::unique_lock<boost::mutex> lock(_mtx);
    _cancelled = true;
    if( _orch )   _orch->cancel();
    if( _engine ) _engine->cancel();
  }

  bool receive_session::is_cancelled() {
    boost::unique_lock<boost::mutex> lock(_mtx);
    return _cancelled;
  }

  bool receive_session::wait_stopped( const fc::microseconds& timeout ) {
    boost::unique_lock<boost::mutex> lock(_mtx);
    boost::system_time deadline = boost::get_system_time() + boost::posix_time::microseconds( timeout.count() );
    while( _running ) {
      if( !_cond.timed_wait( lock, deadline ) && _running ) return false;
    }
    return true;
  }

  void receive_session::finish( bool ok, const fc::string& msg ) {
    event e( ok ? event::session_complete : event::session_failed );
    e.message = msg;
    _ctx.events().post(e);
    if( ok ) slog( "transfer complete" );
    else     elog( "transfer failed: %s", msg.c_str() );

    boost::unique_lock<boost::mutex> lock(_mtx);
    _running = false;
    _cond.notify_all();
  }

  std::vector<transfer> receive_session::run( const fc::string& ticket_text, const fc::path& dest ) {
    ticket t;
    try {
      t = ticket::decode( ticket_text );
    } catch ( const ticket_parse_error& e ) {
      event ev( event::session_failed );
      ev.message = e.what();
      _ctx.events().post(ev);
      throw;
    }
    return run( t, dest );
  }

  std::vector<transfer> receive_session::run( const ticket& t, const fc::path& dest ) {
    {
      boost::unique_lock<boost::mutex> lock(_mtx);
      _running = true;
    }
    event e( event::session_started );
    e.hash = t.root_hash;
    _ctx.events().post(e);

    try {
      _ctx.start();
      std::vector<transfer> ts = fetch( t, dest );

      size_t failed = 0;
      for( size_t i = 0; i < ts.size(); ++i )
        if( ts[i].state != transfer::verified ) ++failed;
      if( failed )
        finish( false, (boost::format( "%1% of %2% files failed" ) % failed % ts.size()).str().c_str() );
      else
        finish( true, fc::string() );
      return ts;
    } catch ( const sendme_exception& ex ) {
      finish( false, ex.what() );
      throw;
    } catch ( ... ) {
      finish( false, fc::except_str() );
      throw;
    }
  }

  std::vector<transfer> receive_session::fetch( const ticket& t, const fc::path& dest ) {
    if( is_cancelled() )
      SENDME_THROW( cancelled, "receive cancelled before connecting" );

    const config& cfg = _ctx.get_config();
    node&         n   = _ctx.get_node();

    orchestrator o( n, orchestrator::options(cfg), &_ctx.events() );
    fc::shared_ptr<connection> con;
    {
      connecting reg( _mtx, _orch, o );
      if( is_cancelled() ) o.cancel();
      con = o.connect(t);
    }

    transfer_engine eng( n, con, cfg.transfer(), &_ctx.events(), &_ctx.resume_db() );
    fetch_cleanup   cleanup( n, _mtx, _engine, con );
    {
      boost::unique_lock<boost::mutex> lock(_mtx);
      _engine = &eng;
      if( _cancelled ) eng.cancel();
    }

    _manifest = eng.fetch_manifest( t.root_hash );

    try {
      if( !fc::exists(dest) ) fc::create_directories(dest);
    } catch ( ... ) {
      SENDME_THROW( io_error, "unable to create %1%: %2%", %dest.string().c_str() %fc::except_str().c_str() );
    }
    return eng.run( _manifest, dest );
  }

}
