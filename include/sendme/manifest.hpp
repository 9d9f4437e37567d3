#ifndef _SENDME_MANIFEST_HPP_
#define _SENDME_MANIFEST_HPP_
#include <stdint.h>
#include <fc/static_reflect.hpp>
#include <fc/reflect_fwd.hpp>
#include <fc/sha1.hpp>
#include <fc/string.hpp>
#include <fc/vector.hpp>

namespace sm {

  /**
   *  One shared file.  Path is relative to the share root, uses '/'
   *  separators and never contains '.' or '..' components.
   */
  struct manifest_entry {
    manifest_entry():size(0){}
    manifest_entry( const fc::string& p, const fc::sha1& h, uint64_t s )
    :path(p),hash(h),size(s){}

    fc::string  path;
    fc::sha1    hash;
    uint64_t    size;
  };

  /**
   *  @class manifest
   *
   *  The ordered list of files in a share.  Entries are sorted by path so
   *  the serialized form, and therefore the root hash, only depends on the
   *  set of (path, content) pairs.
   *
   *  The serialized manifest is itself a blob: the root hash is its blob
   *  hash and receivers fetch it through the same chunk protocol as any
   *  file.
   */
  struct manifest {
    enum { current_version = 1 };

    manifest():version(current_version){}

    uint8_t                     version;
    fc::vector<manifest_entry>  entries;

    void     sort();

    /// throws sendme_exception if entries are unsorted, duplicated or unsafe
    void     validate()const;

    uint64_t total_size()const;

    fc::vector<char> serialize()const;
    static manifest  deserialize( const char* d, size_t len );

    /// blob hash of serialize()
    fc::sha1 root_hash()const;
  };

  /// byte wise ordering used for manifest paths
  bool path_less( const fc::string& a, const fc::string& b );

  /// true if p is a non empty relative path without '.', '..' or empty components
  bool is_safe_relative_path( const fc::string& p );

} // namespace sm

FC_STATIC_REFLECT( sm::manifest_entry, (path)(hash)(size) )
FC_STATIC_REFLECT( sm::manifest, (version)(entries) )
FC_REFLECTABLE( sm::manifest_entry )
FC_REFLECTABLE( sm::manifest )

#endif // _SENDME_MANIFEST_HPP_
