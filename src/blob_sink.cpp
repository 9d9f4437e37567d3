#include <sendme/blob_sink.hpp>
#include <sendme/error.hpp>
#include <fc/log.hpp>
#include <boost/filesystem/operations.hpp>
#include <string.h>
#include <string>

namespace sm {

  namespace bfs = boost::filesystem;

  fc::path file_sink::part_path( const fc::path& dest, const fc::sha1& h ) {
    std::string name = std::string(".sendme-") + fc::string(h).c_str() + ".part";
    return fc::path( ( bfs::path( dest.string().c_str() ) / name ).string().c_str() );
  }

  file_sink::file_sink( const fc::path& dest, const fc::string& rel_path, const fc::sha1& h )
  :_part( part_path( dest, h ).string().c_str() ),
   _final( bfs::path( dest.string().c_str() ) / rel_path.c_str() ),
   _size(0) {
    boost::system::error_code ec;
    if( bfs::exists( _part, ec ) ) {
      _size = bfs::file_size( _part, ec );
      if( ec ) _size = 0;
    }
  }

  file_sink::~file_sink() {
    if( _file.is_open() ) _file.close();
  }

  void file_sink::open() {
    if( _file.is_open() ) return;
    try {
      if( !bfs::exists( _part.parent_path() ) )
        bfs::create_directories( _part.parent_path() );
      if( !bfs::exists( _part ) ) {
        bfs::ofstream create( _part, std::ios::out | std::ios::binary );
        if( !create )
          SENDME_THROW( io_error, "unable to create %1%", %_part.string() );
        _size = 0;
      }
    } catch ( const bfs::filesystem_error& e ) {
      SENDME_THROW( io_error, "unable to create %1%: %2%", %_part.string() %e.what() );
    }
    _file.open( _part, std::ios::in | std::ios::out | std::ios::binary );
    if( !_file.is_open() )
      SENDME_THROW( io_error, "unable to open %1%", %_part.string() );
  }

  uint64_t file_sink::size() {
    return _size;
  }

  void file_sink::append( const char* d, uint32_t len ) {
    open();
    _file.clear();
    _file.seekp( _size );
    _file.write( d, len );
    if( !_file )
      SENDME_THROW( io_error, "error writing %1%", %_part.string() );
    _size += len;
  }

  void file_sink::read( uint64_t off, char* d, uint32_t len ) {
    open();
    _file.flush();
    _file.clear();
    _file.seekg( off );
    _file.read( d, len );
    if( uint32_t(_file.gcount()) != len )
      SENDME_THROW( io_error, "short read of %1% bytes at %2% from %3%", %len %off %_part.string() );
  }

  void file_sink::truncate( uint64_t s ) {
    if( _file.is_open() ) _file.close();
    try {
      if( bfs::exists( _part ) )
        bfs::resize_file( _part, s );
    } catch ( const bfs::filesystem_error& e ) {
      SENDME_THROW( io_error, "unable to truncate %1%: %2%", %_part.string() %e.what() );
    }
    _size = s;
  }

  void file_sink::commit() {
    open();
    _file.flush();
    _file.close();
    try {
      if( !bfs::exists( _final.parent_path() ) )
        bfs::create_directories( _final.parent_path() );
      bfs::rename( _part, _final );
    } catch ( const bfs::filesystem_error& e ) {
      SENDME_THROW( io_error, "unable to move %1% to %2%: %3%", %_part.string() %_final.string() %e.what() );
    }
    slog( "wrote %s", _final.string().c_str() );
  }

  void file_sink::discard() {
    if( _file.is_open() ) _file.close();
    boost::system::error_code ec;
    bfs::remove( _part, ec );
    if( ec ) wlog( "unable to remove %s: %s", _part.string().c_str(), ec.message().c_str() );
    _size = 0;
  }

  void memory_sink::append( const char* d, uint32_t len ) {
    _data.insert( _data.end(), d, d + len );
  }

  void memory_sink::read( uint64_t off, char* d, uint32_t len ) {
    if( off + len > _data.size() )
      SENDME_THROW( io_error, "read past the end of a %1% byte buffer", %_data.size() );
    memcpy( d, _data.data() + off, len );
  }

  void memory_sink::truncate( uint64_t s ) {
    if( s < _data.size() ) _data.resize( s );
  }

}
