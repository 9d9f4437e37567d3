#ifndef _SENDME_BLOB_STORE_HPP_
#define _SENDME_BLOB_STORE_HPP_
#include <map>
#include <fc/shared_ptr.hpp>
#include <fc/filesystem.hpp>
#include <fc/sha1.hpp>
#include <fc/vector.hpp>
#include <sendme/hash_tree.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/filesystem/fstream.hpp>

namespace sm {

  /**
   *  @class blob_store
   *
   *  Sender side index from blob hash to where the bytes live.  File blobs
   *  are read from their source path on demand; small blobs such as the
   *  serialized manifest are held in memory.
   *
   *  Populated before serving starts and read only afterwards.
   */
  class blob_store : public fc::retainable {
    public:
      typedef fc::shared_ptr<blob_store> ptr;

      struct source {
        fc::path          path;
        hash_tree         tree;
        fc::vector<char>  data;
        bool              in_memory;
      };

      /**
       *  Reads chunks of one blob, keeping the file open between calls.
       */
      class reader {
        public:
          reader( const blob_store& s, const fc::sha1& h );

          const fc::sha1& hash()const { return _hash; }
          uint64_t        size()const;

          /// copies chunk index into out, which must hold chunk_size bytes
          uint32_t read( uint32_t index, char* out );
          fc::vector<fc::sha1> proof( uint32_t index )const;

        private:
          fc::sha1                                          _hash;
          const source*                                     _src;
          boost::shared_ptr<boost::filesystem::ifstream>    _in;
      };

      void add_file( const fc::path& p, const hash_tree& t );
      void add_data( const fc::vector<char>& d, const hash_tree& t );

      bool          contains( const fc::sha1& h )const;
      const source& get( const fc::sha1& h )const;
      size_t        count()const { return _blobs.size(); }

    private:
      std::map<fc::sha1,source> _blobs;
  };

} // namespace sm

#endif // _SENDME_BLOB_STORE_HPP_
