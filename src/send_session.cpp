#include <sendme/send_session.hpp>
#include <sendme/context.hpp>
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>

namespace sm {

  send_session::send_session( context& ctx )
  :_ctx(ctx),
   _builder( ctx.get_config().hash_workers ),
   _store( new blob_store() ) {
    _provider.reset( new blob_provider( ctx.get_node(), _store ) );
  }

  send_session::~send_session() {
    try {
      stop();
    } catch ( const sendme_exception& e ) {
      elog( "error stopping send session: %s", e.what() );
    }
  }

  void send_session::add( const fc::path& p ) {
    _builder.add(p);
  }

  /**
   *  Registers with the first configured relay that answers.
   */
  fc::optional<fc::ip::endpoint> send_session::register_with_relay() {
    const config& cfg = _ctx.get_config();
    fc::microseconds timeout = fc::milliseconds( cfg.relay_timeout_ms );
    for( size_t i = 0; i < cfg.relays.size(); ++i ) {
      try {
        fc::ip::endpoint ep = fc::ip::endpoint::from_string( cfg.relays[i] );
        fc::shared_ptr<connection> r = _ctx.get_node().connect_to( ep, fc::optional<fc::sha1>(), timeout );
        fc::ip::endpoint pub = r->register_with_relay( timeout );
        slog( "registered with relay %s, public endpoint %s", cfg.relays[i].c_str(), fc::string(pub).c_str() );
        _relay = r;
        return ep;
      } catch ( const connection_error& e ) {
        wlog( "unable to use relay %s: %s", cfg.relays[i].c_str(), e.what() );
      } catch ( ... ) {
        wlog( "unable to use relay %s: %s", cfg.relays[i].c_str(), fc::except_str().c_str() );
      }
    }
    if( cfg.relays.size() )
      wlog( "no relay answered, receivers will need a direct path" );
    return fc::optional<fc::ip::endpoint>();
  }

  ticket send_session::start() {
    _ctx.start();
    _manifest = _builder.build( *_store, &_ctx.events() );

    fc::vector<fc::ip::endpoint> eps = _ctx.get_node().advertised_endpoints();
    if( eps.size() > ticket::max_addresses ) eps.resize( ticket::max_addresses );

    _ticket.node_id   = _ctx.get_node().get_id();
    _ticket.addresses = eps;
    _ticket.relay     = register_with_relay();
    _ticket.root_hash = _manifest.root_hash();

    _provider->start();
    slog( "sharing %d files, %lld bytes", int(_manifest.entries.size()), (long long)_manifest.total_size() );
    return _ticket;
  }

  void send_session::stop() {
    _provider->stop();
    if( !!_relay ) {
      fc::shared_ptr<connection> r = _relay;
      _relay.reset();
      _ctx.get_node().get_thread().async( [=](){ r->close(); } ).wait();
    }
  }

}
