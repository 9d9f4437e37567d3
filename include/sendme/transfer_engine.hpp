#ifndef _SENDME_TRANSFER_ENGINE_HPP_
#define _SENDME_TRANSFER_ENGINE_HPP_
#include <stdint.h>
#include <vector>
#include <fc/shared_ptr.hpp>
#include <fc/sha1.hpp>
#include <fc/string.hpp>
#include <fc/filesystem.hpp>
#include <fc/time.hpp>
#include <sendme/events.hpp>
#include <sendme/manifest.hpp>

namespace sm {
  class node;
  class connection;
  class blob_sink;
  namespace db { class resume; }

  /**
   *  Progress and outcome of fetching one manifest entry.
   */
  struct transfer {
    enum state_enum {
      pending     = 0,
      in_progress = 1,
      verified    = 2,
      failed      = 3
    };

    transfer():bytes_verified(0),bytes_total(0),state(pending),failure(failure::none){}

    fc::sha1             hash;
    fc::string           path;
    uint64_t             bytes_verified;
    uint64_t             bytes_total;
    state_enum           state;
    failure::reason_enum failure;
  };

  struct transfer_config {
    transfer_config()
    :max_concurrent_blobs(4),
     request_window(32),
     chunk_timeout(fc::milliseconds(500)),
     max_loss_retries(20),
     max_corrupt_retries(2){}

    uint32_t          max_concurrent_blobs;
    uint32_t          request_window;       ///< chunks requested ahead of the verified prefix
    fc::microseconds  chunk_timeout;        ///< re-request when nothing verifies for this long
    uint32_t          max_loss_retries;     ///< consecutive timeouts before giving up
    uint32_t          max_corrupt_retries;  ///< re-requests of a chunk that failed verification
  };

  /**
   *  @class transfer_engine
   *
   *  Receiver side of the blob protocol over one authenticated connection.
   *
   *  Each blob is fetched on its own channel by one of a bounded pool of
   *  worker threads.  Chunks are requested a window at a time, buffered by
   *  index and verified against the blob hash strictly in order; only
   *  verified bytes reach the sink.  Progress is recorded in the resume
   *  database so an interrupted blob continues where it stopped after its
   *  local bytes are checked again with proof only requests.
   *
   *  Failures of one blob never affect the others and never throw out of
   *  run(); they are reported in the returned transfers and as events.
   */
  class transfer_engine {
    public:
      transfer_engine( node& n, const fc::shared_ptr<connection>& con, const transfer_config& cfg,
                       event_channel* events = 0, db::resume* rdb = 0 );
      ~transfer_engine();

      /**
       *  Fetches the serialized manifest named by root, checks its structure
       *  and that it hashes back to root.
       *
       *  @throw hash_mismatch if the bytes do not verify
       *  @throw connection_error if the sender stops answering
       *  @throw cancelled
       */
      manifest fetch_manifest( const fc::sha1& root );

      /// fetch a whole blob into memory, throws like fetch_manifest
      std::vector<char> fetch_blob( const fc::sha1& h );

      /**
       *  Fetches every entry of m into dest, at most max_concurrent_blobs at a time.
       *  Blocks until each transfer is verified or failed.
       */
      std::vector<transfer> run( const manifest& m, const fc::path& dest );

      /// stop all workers, in flight transfers end failed(cancelled)
      void cancel();
      bool is_cancelled()const;

    private:
      class impl;
      impl* my;
  };

}

#endif // _SENDME_TRANSFER_ENGINE_HPP_
