#ifndef _SENDME_TICKET_HPP_
#define _SENDME_TICKET_HPP_
#include <stdint.h>
#include <fc/sha1.hpp>
#include <fc/ip.hpp>
#include <fc/optional.hpp>
#include <fc/string.hpp>
#include <fc/vector.hpp>

namespace sm {

  /**
   *  @class ticket
   *
   *  Everything a receiver needs to find, authenticate and fetch a share.
   *  The text form is base58 of
   *
   *    version:u8 | node_id:20 | n:u8 | n * (ipv4:u32, port:u16) |
   *    relay_len:u8 (0 or 6) | relay (ipv4:u32, port:u16) |
   *    root_hash:20 | checksum:4
   *
   *  with integers big endian and checksum the first 4 bytes of the sha1
   *  of everything before it.
   */
  struct ticket {
    enum {
      current_version = 1,
      max_addresses   = 16
    };

    ticket():version(current_version){}

    uint8_t                          version;
    fc::sha1                         node_id;
    fc::vector<fc::ip::endpoint>     addresses;
    fc::optional<fc::ip::endpoint>   relay;
    fc::sha1                         root_hash;

    fc::string encode()const;

    /// @throw ticket_parse_error
    static ticket decode( const fc::string& text );

    bool operator==( const ticket& t )const;
    bool operator!=( const ticket& t )const { return !(*this == t); }
  };

  fc::string encode( const fc::sha1& node_id, const fc::vector<fc::ip::endpoint>& addresses,
                     const fc::optional<fc::ip::endpoint>& relay, const fc::sha1& root_hash );

} // namespace sm

#endif // _SENDME_TICKET_HPP_
