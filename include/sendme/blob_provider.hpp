#ifndef _SENDME_BLOB_PROVIDER_HPP_
#define _SENDME_BLOB_PROVIDER_HPP_
#include <functional>
#include <fc/shared_ptr.hpp>
#include <sendme/blob_store.hpp>
#include <sendme/transfer_messages.hpp>

namespace sm {
  class node;
  class provider_connection;

  /**
   *  @class blob_provider
   *
   *  Serves the blobs of a blob_store on blob_service_port.  Each channel
   *  opened by a receiver gets its own provider connection which answers
   *  size and chunk requests with the chunk bytes and their proof.
   */
  class blob_provider : public fc::retainable {
    public:
      typedef fc::shared_ptr<blob_provider>              ptr;

      /// return false to drop the response, may modify it before it is sent
      typedef std::function<bool(chunk_response&)>       response_filter;
      typedef std::function<void(const chunk_request&)>  request_observer;

      enum { max_chunks_per_request = 64 };

      blob_provider( node& n, const blob_store::ptr& s );
      ~blob_provider();

      void start();
      void stop();

      /**
       *  Hooks for diagnostics.  Set them before start(); they are called
       *  from the node's thread.
       */
      void set_response_filter( const response_filter& f );
      void set_request_observer( const request_observer& o );

      /// channels currently served and the blob files they hold open
      size_t connection_count()const;
      size_t open_readers()const;

    private:
      friend class provider_connection;
      class impl;
      impl* my;
  };

}

#endif // _SENDME_BLOB_PROVIDER_HPP_
