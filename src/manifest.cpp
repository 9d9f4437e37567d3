#include <sendme/manifest.hpp>
#include <sendme/hash_tree.hpp>
#include <sendme/error.hpp>
#include <fc/reflect_impl.hpp>
#include <fc/reflect_vector.hpp>
#include <fc/raw.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <algorithm>
#include <string.h>

FC_REFLECT( sm::manifest_entry, (path)(hash)(size) )
FC_REFLECT( sm::manifest, (version)(entries) )

namespace sm {

  bool path_less( const fc::string& a, const fc::string& b ) {
    return strcmp( a.c_str(), b.c_str() ) < 0;
  }

  bool is_safe_relative_path( const fc::string& p ) {
    const char* s = p.c_str();
    size_t      n = strlen(s);
    if( n == 0 || s[0] == '/' || n != p.size() ) return false;

    size_t b = 0;
    for( size_t i = 0; i <= n; ++i ) {
      if( i < n && s[i] == '\\' ) return false;
      if( i == n || s[i] == '/' ) {
        size_t len = i - b;
        if( len == 0 ) return false;
        if( len == 1 && s[b] == '.' ) return false;
        if( len == 2 && s[b] == '.' && s[b+1] == '.' ) return false;
        b = i + 1;
      }
    }
    return true;
  }

  static bool entry_less( const manifest_entry& a, const manifest_entry& b ) {
    return path_less( a.path, b.path );
  }

  void manifest::sort() {
    std::sort( entries.begin(), entries.end(), &entry_less );
  }

  void manifest::validate()const {
    if( version != current_version )
      SENDME_THROW( sendme_exception, "unsupported manifest version %1%", %int(version) );
    for( size_t i = 0; i < entries.size(); ++i ) {
      if( !is_safe_relative_path( entries[i].path ) )
        SENDME_THROW( sendme_exception, "unsafe manifest path '%1%'", %entries[i].path.c_str() );
      if( i && !path_less( entries[i-1].path, entries[i].path ) )
        SENDME_THROW( sendme_exception, "manifest entries out of order at '%1%'", %entries[i].path.c_str() );
    }
  }

  uint64_t manifest::total_size()const {
    uint64_t t = 0;
    for( size_t i = 0; i < entries.size(); ++i ) t += entries[i].size;
    return t;
  }

  fc::vector<char> manifest::serialize()const {
    return fc::raw::pack( *this );
  }

  manifest manifest::deserialize( const char* d, size_t len ) {
    manifest m;
    try {
      fc::datastream<const char*> ds( d, len );
      fc::raw::unpack( ds, m );
      if( ds.remaining() )
        SENDME_THROW( sendme_exception, "%1% trailing bytes after manifest", %ds.remaining() );
    } catch( const sendme_exception& ) {
      throw;
    } catch( ... ) {
      SENDME_THROW( sendme_exception, "unable to decode manifest: %1%", %fc::except_str().c_str() );
    }
    return m;
  }

  fc::sha1 manifest::root_hash()const {
    fc::vector<char> d = serialize();
    return hash_tree::from_data( d.size() ? d.data() : 0, d.size() ).root();
  }

} // namespace sm
