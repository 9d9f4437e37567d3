#ifndef _SENDME_TEST_UTIL_HPP_
#define _SENDME_TEST_UTIL_HPP_
#include <stdint.h>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <fc/filesystem.hpp>
#include <fc/ip.hpp>
#include <sendme/config.hpp>
#include <sendme/events.hpp>
#include <sendme/ticket.hpp>

namespace sm { namespace test {

  /// a fresh directory removed with everything in it on destruction
  class temp_dir {
    public:
      temp_dir();
      ~temp_dir();

      const boost::filesystem::path& path()const { return _path; }
      fc::path                       fpath()const;
      fc::path                       sub( const std::string& name )const;

    private:
      boost::filesystem::path _path;
  };

  /// pseudo random but reproducible contents
  void        write_file( const boost::filesystem::path& p, uint64_t size, uint32_t seed );
  std::string read_file( const boost::filesystem::path& p );
  bool        same_contents( const boost::filesystem::path& a, const boost::filesystem::path& b );

  /// a config with its own data dir under root and timeouts short enough for tests
  config test_config( const temp_dir& root, const std::string& name );

  /// every event currently queued
  std::vector<event> drain( event_channel& events );
  size_t             count( const std::vector<event>& events, event::type_enum t );

  fc::ip::endpoint loopback( uint16_t port );

} } // sm::test

#endif // _SENDME_TEST_UTIL_HPP_
