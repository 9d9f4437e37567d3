#ifndef _SENDME_SEND_SESSION_HPP_
#define _SENDME_SEND_SESSION_HPP_
#include <fc/shared_ptr.hpp>
#include <fc/filesystem.hpp>
#include <sendme/manifest_builder.hpp>
#include <sendme/blob_store.hpp>
#include <sendme/blob_provider.hpp>
#include <sendme/ticket.hpp>

namespace sm {
  class context;
  class connection;

  /**
   *  @class send_session
   *
   *  Shares a set of files: hashes them, registers with a relay when one
   *  is configured and serves the blobs until stopped.
   */
  class send_session {
    public:
      send_session( context& ctx );
      ~send_session();

      void add( const fc::path& p );

      /**
       *  @return the ticket receivers need
       *  @throw  io_error if the inputs cannot be read
       */
      ticket start();
      void   stop();

      const manifest&   get_manifest()const { return _manifest; }
      const ticket&     get_ticket()const   { return _ticket;   }
      blob_provider&    provider()          { return *_provider; }

    private:
      fc::optional<fc::ip::endpoint> register_with_relay();

      context&                    _ctx;
      manifest_builder            _builder;
      blob_store::ptr             _store;
      blob_provider::ptr          _provider;
      manifest                    _manifest;
      ticket                      _ticket;
      fc::shared_ptr<connection>  _relay;
  };

}

#endif // _SENDME_SEND_SESSION_HPP_
