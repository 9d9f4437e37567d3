#include <sendme/blob_store.hpp>
#include <sendme/error.hpp>
#include <fc/log.hpp>
#include <string.h>

namespace sm {

  void blob_store::add_file( const fc::path& p, const hash_tree& t ) {
    source& s = _blobs[t.root()];
    s.path      = p;
    s.tree      = t;
    s.in_memory = false;
  }

  void blob_store::add_data( const fc::vector<char>& d, const hash_tree& t ) {
    source& s = _blobs[t.root()];
    s.data      = d;
    s.tree      = t;
    s.in_memory = true;
  }

  bool blob_store::contains( const fc::sha1& h )const {
    return _blobs.find(h) != _blobs.end();
  }

  const blob_store::source& blob_store::get( const fc::sha1& h )const {
    std::map<fc::sha1,source>::const_iterator itr = _blobs.find(h);
    if( itr == _blobs.end() )
      SENDME_THROW( sendme_exception, "unknown blob %1%", %fc::string(h).c_str() );
    return itr->second;
  }

  blob_store::reader::reader( const blob_store& s, const fc::sha1& h )
  :_hash(h),_src(&s.get(h)) {}

  uint64_t blob_store::reader::size()const {
    return _src->tree.blob_size();
  }

  fc::vector<fc::sha1> blob_store::reader::proof( uint32_t index )const {
    return _src->tree.proof(index);
  }

  uint32_t blob_store::reader::read( uint32_t index, char* out ) {
    uint32_t len = chunk_length( _src->tree.blob_size(), index );
    if( len == 0 ) return 0;
    uint64_t off = uint64_t(index) * chunk_size;

    if( _src->in_memory ) {
      memcpy( out, _src->data.data() + off, len );
      return len;
    }

    if( !_in ) {
      _in.reset( new boost::filesystem::ifstream( boost::filesystem::path( _src->path.string().c_str() ),
                                                  std::ios::in | std::ios::binary ) );
      if( !*_in ) {
        _in.reset();
        SENDME_THROW( io_error, "unable to open %1%", %_src->path.string().c_str() );
      }
    }
    _in->clear();
    _in->seekg( off );
    _in->read( out, len );
    if( uint32_t(_in->gcount()) != len ) {
      elog( "short read of chunk %d from %s", index, _src->path.string().c_str() );
      SENDME_THROW( io_error, "short read of chunk %1% from %2%", %index %_src->path.string().c_str() );
    }
    return len;
  }

} // namespace sm
