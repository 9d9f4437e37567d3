#include <sendme/hash_tree.hpp>
#include <sendme/error.hpp>
#include <fc/log.hpp>

namespace sm {

  uint32_t chunk_count( uint64_t blob_size ) {
    if( blob_size == 0 ) return 1;
    uint64_t n = (blob_size + chunk_size - 1) / chunk_size;
    if( n > 0xffffffffull )
      SENDME_THROW( io_error, "blob of %1% bytes has too many chunks", %blob_size );
    return uint32_t(n);
  }

  uint32_t chunk_length( uint64_t blob_size, uint32_t index ) {
    uint64_t off = uint64_t(index) * chunk_size;
    if( off >= blob_size ) return 0;
    uint64_t rem = blob_size - off;
    return rem < chunk_size ? uint32_t(rem) : uint32_t(chunk_size);
  }

  fc::sha1 hash_tree::hash_leaf( const char* d, uint32_t len ) {
    fc::sha1::encoder enc;
    char tag = 0;
    enc.write( &tag, 1 );
    if( len ) enc.write( d, len );
    return enc.result();
  }

  fc::sha1 hash_tree::hash_parent( const fc::sha1& l, const fc::sha1& r ) {
    fc::sha1::encoder enc;
    char tag = 1;
    enc.write( &tag, 1 );
    enc.write( l.data(), sizeof(l) );
    enc.write( r.data(), sizeof(r) );
    return enc.result();
  }

  fc::sha1 hash_tree::hash_blob( const fc::sha1& tree_root, uint64_t blob_size ) {
    fc::sha1::encoder enc;
    char tag = 2;
    enc.write( &tag, 1 );
    enc.write( tree_root.data(), sizeof(tree_root) );
    char sz[8];
    for( int i = 0; i < 8; ++i ) sz[i] = char( (blob_size >> (8*i)) & 0xff );
    enc.write( sz, sizeof(sz) );
    return enc.result();
  }

  hash_tree::hash_tree()
  :_size(0) {
    _nodes.push_back( hash_leaf( 0, 0 ) );
    _offsets.push_back(0);
    _blob_hash = hash_blob( _nodes.front(), 0 );
  }

  hash_tree::hash_tree( const fc::vector<fc::sha1>& leaves, uint64_t blob_size )
  :_size(blob_size) {
    if( leaves.size() != chunk_count(blob_size) ) {
      SENDME_THROW( sendme_exception, "expected %1% leaves for %2% bytes but got %3%",
                    %chunk_count(blob_size) %blob_size %leaves.size() );
    }
    // a full binary tree over n leaves has fewer than 2n nodes
    _nodes.reserve( leaves.size() * 2 );
    _nodes.insert( _nodes.end(), leaves.begin(), leaves.end() );
    _offsets.push_back(0);

    uint32_t n   = leaves.size();
    uint32_t off = 0;
    while( n > 1 ) {
      uint32_t next_off = _nodes.size();
      for( uint32_t i = 0; i < n; i += 2 ) {
        if( i + 1 < n ) _nodes.push_back( hash_parent( _nodes[off+i], _nodes[off+i+1] ) );
        else            _nodes.push_back( _nodes[off+i] );
      }
      _offsets.push_back(next_off);
      off = next_off;
      n   = (n + 1) / 2;
    }
    _blob_hash = hash_blob( _nodes.back(), _size );
  }

  hash_tree hash_tree::from_data( const char* d, uint64_t len ) {
    uint32_t n = chunk_count(len);
    fc::vector<fc::sha1> leaves(n);
    for( uint32_t i = 0; i < n; ++i )
      leaves[i] = hash_leaf( d + uint64_t(i)*chunk_size, chunk_length( len, i ) );
    return hash_tree( leaves, len );
  }

  uint32_t hash_tree::leaf_count()const {
    return _offsets.size() > 1 ? _offsets[1] : _nodes.size();
  }

  const fc::sha1& hash_tree::leaf( uint32_t index )const {
    if( index >= leaf_count() )
      SENDME_THROW( sendme_exception, "leaf %1% out of range", %index );
    return _nodes[index];
  }

  fc::vector<fc::sha1> hash_tree::proof( uint32_t index )const {
    if( index >= leaf_count() )
      SENDME_THROW( sendme_exception, "proof for leaf %1% out of range", %index );

    fc::vector<fc::sha1> sib;
    sib.reserve( _offsets.size() );
    uint32_t n = leaf_count();
    for( uint32_t lvl = 0; n > 1; ++lvl ) {
      uint32_t s = index ^ 1;
      if( s < n ) sib.push_back( _nodes[ _offsets[lvl] + s ] );
      index >>= 1;
      n = (n + 1) / 2;
    }
    return sib;
  }

  bool hash_tree::verify( const fc::sha1& blob_hash, uint64_t blob_size, uint32_t index,
                          const fc::sha1& leaf_hash, const fc::vector<fc::sha1>& siblings ) {
    if( blob_size > uint64_t(0xffffffffull) * chunk_size ) return false;
    uint32_t n = chunk_count(blob_size);
    if( index >= n ) return false;

    fc::sha1 h = leaf_hash;
    uint32_t k = 0;
    while( n > 1 ) {
      uint32_t s = index ^ 1;
      if( s < n ) {
        if( k >= siblings.size() ) return false;
        h = (index & 1) ? hash_parent( siblings[k], h ) : hash_parent( h, siblings[k] );
        ++k;
      }
      index >>= 1;
      n = (n + 1) / 2;
    }
    return k == siblings.size() && hash_blob( h, blob_size ) == blob_hash;
  }

} // namespace sm
