#include <sendme/context.hpp>
#include <sendme/node.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <sendme/db/resume.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>

namespace sm {

  class context::impl {
    public:
      impl( const config& c ):_cfg(c),_started(false){}

      config            _cfg;
      bool              _started;
      node::ptr         _node;
      event_channel     _events;
      db::resume::ptr   _resume;
  };

  context::context( const config& c )
  :my( new impl(c) ) {
    my->_node.reset( new node() );
  }

  context::~context() {
    try {
      shutdown();
    } catch ( const sendme_exception& e ) {
      elog( "error during shutdown: %s", e.what() );
    }
    delete my;
  }

  void context::start() {
    if( my->_started ) return;
    my->_node->init( fc::path( my->_cfg.data_dir.c_str() ), my->_cfg.port );
    my->_started = true;
  }

  void context::shutdown() {
    my->_events.close();
    if( !!my->_resume ) {
      my->_resume->close();
      my->_resume.reset();
    }
    if( my->_started ) {
      my->_node->shutdown();
      my->_started = false;
    }
  }

  const config&  context::get_config()const { return my->_cfg;    }
  node&          context::get_node()const   { return *my->_node;  }
  event_channel& context::events()const     { return my->_events; }

  db::resume& context::resume_db() {
    if( !my->_resume ) {
      db::resume::ptr r( new db::resume( fc::path( my->_cfg.data_dir.c_str() ) / "resume" ) );
      r->init();
      my->_resume = r;
    }
    return *my->_resume;
  }

}
