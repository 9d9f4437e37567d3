#include <sendme/config.hpp>
#include <sendme/error.hpp>
#include <fc/reflect_impl.hpp>
#include <fc/reflect_vector.hpp>
#include <fc/json.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>

FC_REFLECT( sm::config,
  (port)
  (data_dir)
  (relays)
  (direct_timeout_ms)
  (hole_punch_timeout_ms)
  (relay_timeout_ms)
  (enable_direct)
  (enable_hole_punch)
  (enable_relay)
  (max_concurrent_blobs)
  (request_window)
  (chunk_timeout_ms)
  (max_loss_retries)
  (max_corrupt_retries)
  (hash_workers)
  (cancel_grace_ms)
)

namespace sm {

  config::config()
  :port(0),
   data_dir("sendme_data"),
   direct_timeout_ms(3000),
   hole_punch_timeout_ms(5000),
   relay_timeout_ms(5000),
   enable_direct(true),
   enable_hole_punch(true),
   enable_relay(true),
   max_concurrent_blobs(4),
   request_window(32),
   chunk_timeout_ms(500),
   max_loss_retries(20),
   max_corrupt_retries(2),
   hash_workers(0),
   cancel_grace_ms(3000){}

  transfer_config config::transfer()const {
    transfer_config t;
    t.max_concurrent_blobs = max_concurrent_blobs;
    t.request_window       = request_window;
    t.chunk_timeout        = fc::milliseconds( chunk_timeout_ms );
    t.max_loss_retries     = max_loss_retries;
    t.max_corrupt_retries  = max_corrupt_retries;
    return t;
  }

  config config::load( const fc::path& p ) {
    if( !fc::exists(p) )
      SENDME_THROW( sendme_exception, "config file %1% does not exist", %p.string().c_str() );
    try {
      config c = fc::json::from_file<config>( p.string() );
      slog( "loaded %s", fc::json::to_string(c).c_str() );
      return c;
    } catch ( ... ) {
      SENDME_THROW( sendme_exception, "unable to parse %1%: %2%", %p.string().c_str() %fc::except_str().c_str() );
    }
  }

} // namespace sm
