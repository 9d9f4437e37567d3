#ifndef _SENDME_HASH_TREE_HPP_
#define _SENDME_HASH_TREE_HPP_
#include <stdint.h>
#include <fc/sha1.hpp>
#include <fc/vector.hpp>

namespace sm {

  enum {
    chunk_size = 1024
  };

  /// number of chunks in a blob of blob_size bytes, an empty blob has one empty chunk
  uint32_t chunk_count( uint64_t blob_size );

  /// number of bytes in chunk index of a blob of blob_size bytes
  uint32_t chunk_length( uint64_t blob_size, uint32_t index );

  /**
   *  @class hash_tree
   *
   *  Binary hash tree over the chunks of a blob.  All levels live in
   *  one arena with the leaves first; level L starts at _offsets[L] and
   *  the sibling of node i on any level is i^1.  When a level has an odd
   *  number of nodes the last one is carried up unchanged, so proofs skip
   *  levels where a node has no sibling.
   *
   *  The blob hash commits to both the tree root and the blob size:
   *
   *    leaf   = sha1( 0x00 | chunk )
   *    parent = sha1( 0x01 | left | right )
   *    blob   = sha1( 0x02 | root | uint64 size )
   */
  class hash_tree {
    public:
      hash_tree();

      /**
       *  @param leaves    - leaf hashes in chunk order, must equal chunk_count(blob_size)
       *  @param blob_size - total size of the blob in bytes
       */
      hash_tree( const fc::vector<fc::sha1>& leaves, uint64_t blob_size );

      static fc::sha1 hash_leaf( const char* d, uint32_t len );
      static fc::sha1 hash_parent( const fc::sha1& l, const fc::sha1& r );
      static fc::sha1 hash_blob( const fc::sha1& tree_root, uint64_t blob_size );

      /// convenience for small in memory blobs such as the manifest
      static hash_tree from_data( const char* d, uint64_t len );

      const fc::sha1& root()const       { return _blob_hash; }
      uint64_t        blob_size()const  { return _size;      }
      uint32_t        leaf_count()const;
      const fc::sha1& leaf( uint32_t index )const;

      /// sibling hashes from the leaf up to the root
      fc::vector<fc::sha1> proof( uint32_t index )const;

      /**
       *  Checks that leaf_hash is chunk index of the blob identified by
       *  blob_hash.  Does not allocate.
       */
      static bool verify( const fc::sha1& blob_hash, uint64_t blob_size, uint32_t index,
                          const fc::sha1& leaf_hash, const fc::vector<fc::sha1>& siblings );

    private:
      fc::vector<fc::sha1>  _nodes;
      fc::vector<uint32_t>  _offsets;
      uint64_t              _size;
      fc::sha1              _blob_hash;
  };

} // namespace sm

#endif // _SENDME_HASH_TREE_HPP_
