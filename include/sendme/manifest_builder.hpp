#ifndef _SENDME_MANIFEST_BUILDER_HPP_
#define _SENDME_MANIFEST_BUILDER_HPP_
#include <string>
#include <fc/filesystem.hpp>
#include <fc/vector.hpp>
#include <sendme/manifest.hpp>

namespace sm {
  class blob_store;
  class event_channel;

  /**
   *  @class manifest_builder
   *
   *  Turns a list of files and directories into a manifest.  Directories
   *  are expanded recursively and each regular file becomes one entry
   *  named relative to the parent of the path it was found under, so
   *  adding "photos" yields "photos/a.jpg", "photos/2012/b.jpg" and so on.
   *  Symbolic links inside directories are skipped.
   *
   *  Hashing is spread over a pool of worker threads; large files are
   *  split into chunk ranges.  Results are merged by path so the manifest
   *  does not depend on the number of workers or the order of add().
   */
  class manifest_builder {
    public:
      /**
       *  @param workers - number of hashing threads, 0 for one per core
       */
      explicit manifest_builder( uint32_t workers = 0 );

      void add( const fc::path& p );

      /**
       *  Hashes every input and registers the files and the serialized
       *  manifest with store.
       *
       *  @throw io_error if there is nothing to share, a path is missing or
       *         unreadable, or two inputs map to the same relative path.
       */
      manifest build( blob_store& store, event_channel* events = 0 );

    private:
      struct input_file {
        fc::path     path;
        std::string  rel;
        uint64_t     size;
      };
      void collect( const fc::path& p, const std::string& rel, bool top, fc::vector<input_file>& out );

      fc::vector<fc::path> _inputs;
      uint32_t             _workers;
  };

} // namespace sm

#endif // _SENDME_MANIFEST_BUILDER_HPP_
