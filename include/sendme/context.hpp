#ifndef _SENDME_CONTEXT_HPP_
#define _SENDME_CONTEXT_HPP_
#include <fc/shared_ptr.hpp>
#include <sendme/config.hpp>

namespace sm {
  class node;
  class event_channel;
  namespace db { class resume; }

  /**
   *  @class context
   *
   *  Everything one sender, receiver or relay needs: its configuration,
   *  node, event channel and resume database.  Several contexts may live
   *  in one process; nothing is shared between them.
   */
  class context : public fc::retainable {
    public:
      typedef fc::shared_ptr<context> ptr;

      explicit context( const config& c );
      ~context();

      /// load the identity and start listening
      void start();

      /// close the event channel, resume database and node
      void shutdown();

      const config&         get_config()const;
      node&                 get_node()const;
      event_channel&        events()const;

      /// opened on first use
      db::resume&           resume_db();

    private:
      class impl;
      impl* my;
  };

}

#endif // _SENDME_CONTEXT_HPP_
