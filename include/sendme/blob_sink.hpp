#ifndef _SENDME_BLOB_SINK_HPP_
#define _SENDME_BLOB_SINK_HPP_
#include <stdint.h>
#include <vector>
#include <fc/filesystem.hpp>
#include <fc/sha1.hpp>
#include <fc/string.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/fstream.hpp>

namespace sm {

  /**
   *  Destination of the verified bytes of one blob.  Bytes are only ever
   *  appended in order; truncate() is used when resuming finds a bad chunk.
   */
  class blob_sink {
    public:
      virtual ~blob_sink(){}

      /// number of bytes held
      virtual uint64_t size() = 0;
      virtual void     append( const char* d, uint32_t len ) = 0;
      virtual void     read( uint64_t off, char* d, uint32_t len ) = 0;
      virtual void     truncate( uint64_t s ) = 0;

      /// the blob is complete, publish it
      virtual void     commit() = 0;

      /// drop the partial data
      virtual void     discard() = 0;
  };

  /**
   *  Writes to dest/.sendme-<hash>.part and renames it to dest/rel_path
   *  on commit so a file only shows up under its final name when it is
   *  complete and verified.
   */
  class file_sink : public blob_sink {
    public:
      file_sink( const fc::path& dest, const fc::string& rel_path, const fc::sha1& h );
      ~file_sink();

      static fc::path part_path( const fc::path& dest, const fc::sha1& h );

      const boost::filesystem::path& part()const  { return _part;  }
      const boost::filesystem::path& final()const { return _final; }

      virtual uint64_t size();
      virtual void     append( const char* d, uint32_t len );
      virtual void     read( uint64_t off, char* d, uint32_t len );
      virtual void     truncate( uint64_t s );
      virtual void     commit();
      virtual void     discard();

    private:
      void open();

      boost::filesystem::path    _part;
      boost::filesystem::path    _final;
      boost::filesystem::fstream _file;
      uint64_t                   _size;
  };

  class memory_sink : public blob_sink {
    public:
      memory_sink():_committed(false){}

      const std::vector<char>& data()const { return _data; }
      bool committed()const { return _committed; }

      virtual uint64_t size() { return _data.size(); }
      virtual void     append( const char* d, uint32_t len );
      virtual void     read( uint64_t off, char* d, uint32_t len );
      virtual void     truncate( uint64_t s );
      virtual void     commit()  { _committed = true; }
      virtual void     discard() { _data.clear(); }

    private:
      std::vector<char> _data;
      bool              _committed;
  };

}

#endif // _SENDME_BLOB_SINK_HPP_
