#ifndef _SENDME_DB_RESUME_HPP_
#define _SENDME_DB_RESUME_HPP_
#include <stdint.h>
#include <fc/static_reflect.hpp>
#include <fc/reflect_fwd.hpp>
#include <fc/sha1.hpp>
#include <fc/string.hpp>
#include <fc/vector.hpp>
#include <fc/filesystem.hpp>
#include <fc/shared_ptr.hpp>

namespace sm { namespace db {

  /**
   *  @class db::resume
   *
   *  Provides a dedicated thread for accessing the resume database.
   *
   *  For each blob hash that was partially received store where the part
   *  file lives and which chunk ranges of it have been verified, so an
   *  interrupted transfer can continue without fetching those bytes again.
   */
  class resume : public fc::retainable {
    public:
      typedef fc::shared_ptr<resume> ptr;
      typedef fc::sha1 id;

      struct range {
        range( uint32_t s = 0, uint32_t c = 0 ):start(s),count(c){}
        uint32_t start;  // first chunk index
        uint32_t count;  // number of chunks
      };

      struct record {
        record():blob_size(0){}

        fc::string          part_path;
        uint64_t            blob_size;
        fc::vector<range>   verified;

        /// number of chunks verified from the start of the blob
        uint32_t verified_prefix()const;
      };

      resume( const fc::path& dir );
      ~resume();

      void     init();
      void     close();
      uint32_t count();

      bool fetch( const id& blob, record& r );
      void store( const id& blob, const record& r );
      void remove( const id& blob );

    private:
      class resume_private* my;
  };

} } // sm::db

FC_STATIC_REFLECT( sm::db::resume::range, (start)(count) )
FC_STATIC_REFLECT( sm::db::resume::record, (part_path)(blob_size)(verified) )
FC_REFLECTABLE( sm::db::resume::range )
FC_REFLECTABLE( sm::db::resume::record )

#endif // _SENDME_DB_RESUME_HPP_
