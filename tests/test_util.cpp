#include "test_util.hpp"
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <stdexcept>
#include <iterator>

namespace sm { namespace test {

  namespace bfs = boost::filesystem;

  temp_dir::temp_dir()
  :_path( bfs::temp_directory_path() / bfs::unique_path( "sendme-test-%%%%-%%%%-%%%%" ) ) {
    bfs::create_directories( _path );
  }

  temp_dir::~temp_dir() {
    boost::system::error_code ec;
    bfs::remove_all( _path, ec );
  }

  fc::path temp_dir::fpath()const {
    return fc::path( _path.string().c_str() );
  }

  fc::path temp_dir::sub( const std::string& name )const {
    return fc::path( (_path / name).string().c_str() );
  }

  void write_file( const bfs::path& p, uint64_t size, uint32_t seed ) {
    if( !p.parent_path().empty() && !bfs::exists( p.parent_path() ) )
      bfs::create_directories( p.parent_path() );
    bfs::ofstream out( p, std::ios::out | std::ios::binary | std::ios::trunc );
    if( !out ) throw std::runtime_error( "unable to create " + p.string() );

    uint32_t x = seed * 2654435761u + 1;
    char     buf[4096];
    while( size ) {
      size_t n = size < sizeof(buf) ? size_t(size) : sizeof(buf);
      for( size_t i = 0; i < n; ++i ) {
        x = x * 1664525u + 1013904223u;
        buf[i] = char( x >> 24 );
      }
      out.write( buf, n );
      size -= n;
    }
  }

  std::string read_file( const bfs::path& p ) {
    bfs::ifstream in( p, std::ios::in | std::ios::binary );
    if( !in ) throw std::runtime_error( "unable to open " + p.string() );
    return std::string( std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() );
  }

  bool same_contents( const bfs::path& a, const bfs::path& b ) {
    if( !bfs::exists(a) || !bfs::exists(b) ) return false;
    return read_file(a) == read_file(b);
  }

  config test_config( const temp_dir& root, const std::string& name ) {
    config c;
    c.data_dir              = (root.path() / ("node-" + name)).string().c_str();
    c.port                  = 0;
    c.direct_timeout_ms     = 1000;
    c.hole_punch_timeout_ms = 2000;
    c.relay_timeout_ms      = 2000;
    c.chunk_timeout_ms      = 200;
    c.max_loss_retries      = 10;
    c.hash_workers          = 2;
    return c;
  }

  std::vector<event> drain( event_channel& events ) {
    std::vector<event> all;
    event e;
    while( events.try_next(e) ) all.push_back(e);
    return all;
  }

  size_t count( const std::vector<event>& events, event::type_enum t ) {
    size_t n = 0;
    for( size_t i = 0; i < events.size(); ++i )
      if( events[i].type == t ) ++n;
    return n;
  }

  fc::ip::endpoint loopback( uint16_t port ) {
    return fc::ip::endpoint( fc::ip::address("127.0.0.1"), port );
  }

} } // sm::test
