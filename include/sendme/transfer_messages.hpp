#ifndef _SENDME_TRANSFER_MESSAGES_HPP_
#define _SENDME_TRANSFER_MESSAGES_HPP_
#include <stdint.h>
#include <fc/static_reflect.hpp>
#include <fc/reflect_fwd.hpp>
#include <fc/sha1.hpp>
#include <fc/vector.hpp>
#include <sendme/buffer.hpp>

namespace sm {

    /**
     *  Every message on a blob channel is one datagram: a type byte
     *  followed by the fc::raw encoding of the message.
     */
    enum transfer_message_type {
      size_request_msg   = 1,
      size_response_msg  = 2,
      chunk_request_msg  = 3,
      chunk_response_msg = 4
    };

    struct transfer_result {
        enum result_enum {
          ok             = 0,
          unknown_blob   = 1,
          invalid_range  = 2
        };
    };

    struct size_request {
      size_request(){}
      size_request( const fc::sha1& h ):hash(h){}

      fc::sha1 hash;
    };

    struct size_response {
      size_response():size(0),result(transfer_result::ok){}

      fc::sha1  hash;
      uint64_t  size;
      int8_t    result; ///!< see transfer_result::result_enum
    };

    struct chunk_request {
      enum flag_enum {
        proof_only = 0x01  ///< reply with siblings only, the receiver already has the bytes
      };

      chunk_request():index(0),count(0),flags(0){}
      chunk_request( const fc::sha1& h, uint32_t i, uint32_t c, uint8_t f = 0 )
      :hash(h),index(i),count(c),flags(f){}

      fc::sha1  hash;
      uint32_t  index;  ///< first chunk
      uint32_t  count;  ///< number of chunks, each answered by its own response
      uint8_t   flags;
    };

    struct chunk_response {
      chunk_response():index(0),result(transfer_result::ok),flags(0){}

      fc::sha1              hash;
      uint32_t              index;
      int8_t                result;   ///!< see transfer_result::result_enum
      uint8_t               flags;    ///!< copied from the request
      fc::vector<char>      data;     ///!< chunk bytes, empty for proof_only
      fc::vector<fc::sha1>  siblings; ///!< proof from the leaf to the root
    };

    buffer encode_message( const size_request& m );
    buffer encode_message( const size_response& m );
    buffer encode_message( const chunk_request& m );
    buffer encode_message( const chunk_response& m );

    /// the type byte of b, 0 for an empty buffer
    uint8_t message_type( const buffer& b );

    /// @throw sendme_exception if the body does not decode as the requested message
    void decode_message( const buffer& b, size_request& m );
    void decode_message( const buffer& b, size_response& m );
    void decode_message( const buffer& b, chunk_request& m );
    void decode_message( const buffer& b, chunk_response& m );

}

FC_STATIC_REFLECT( sm::size_request, (hash) )
FC_STATIC_REFLECT( sm::size_response, (hash)(size)(result) )
FC_STATIC_REFLECT( sm::chunk_request, (hash)(index)(count)(flags) )
FC_STATIC_REFLECT( sm::chunk_response, (hash)(index)(result)(flags)(data)(siblings) )
FC_REFLECTABLE( sm::size_request )
FC_REFLECTABLE( sm::size_response )
FC_REFLECTABLE( sm::chunk_request )
FC_REFLECTABLE( sm::chunk_response )
#endif // _SENDME_TRANSFER_MESSAGES_HPP_
