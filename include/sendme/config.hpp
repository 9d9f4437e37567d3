#ifndef _SENDME_CONFIG_HPP_
#define _SENDME_CONFIG_HPP_
#include <stdint.h>
#include <fc/string.hpp>
#include <fc/vector.hpp>
#include <fc/filesystem.hpp>
#include <fc/reflect.hpp>
#include <sendme/transfer_engine.hpp>

namespace sm {

  /**
   *  Settings shared by the send, receive and relay commands.  Stored as
   *  JSON; durations are in milliseconds.
   */
  struct config {
    config();

    uint16_t                 port;                   ///< 0 picks a free port
    fc::string               data_dir;               ///< identity and resume database
    fc::vector<fc::string>   relays;                 ///< HOST:PORT of relay nodes

    int64_t                  direct_timeout_ms;
    int64_t                  hole_punch_timeout_ms;
    int64_t                  relay_timeout_ms;
    bool                     enable_direct;
    bool                     enable_hole_punch;
    bool                     enable_relay;

    uint32_t                 max_concurrent_blobs;
    uint32_t                 request_window;
    int64_t                  chunk_timeout_ms;
    uint32_t                 max_loss_retries;
    uint32_t                 max_corrupt_retries;

    uint32_t                 hash_workers;           ///< 0 for one per core
    int64_t                  cancel_grace_ms;

    transfer_config transfer()const;

    /// @throw sendme_exception if the file cannot be read or parsed
    static config load( const fc::path& p );
  };

} // namespace sm

FC_REFLECT( sm::config,
  (port)(data_dir)(relays)
  (direct_timeout_ms)(hole_punch_timeout_ms)(relay_timeout_ms)
  (enable_direct)(enable_hole_punch)(enable_relay)
  (max_concurrent_blobs)(request_window)(chunk_timeout_ms)(max_loss_retries)(max_corrupt_retries)
  (hash_workers)(cancel_grace_ms) )

#endif // _SENDME_CONFIG_HPP_
