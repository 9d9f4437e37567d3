#ifndef _SENDME_ERROR_HPP_
#define _SENDME_ERROR_HPP_
#include <boost/exception/all.hpp>
#include <boost/format.hpp>
#include <string>
#include <vector>

namespace sm {

  typedef boost::error_info<struct err_msg_,std::string>                       err_msg;
  typedef boost::error_info<struct parse_reason_,int>                          parse_reason;
  typedef boost::error_info<struct attempted_paths_,std::vector<std::string> > attempted_paths;

  struct sendme_exception : public virtual boost::exception, public virtual std::exception {
    const char* what()const throw() {
      const std::string* m = boost::get_error_info<err_msg>(*this);
      return m ? m->c_str() : "sendme_exception";
    }
    std::string message()const {
      const std::string* m = boost::get_error_info<err_msg>(*this);
      return m ? *m : std::string();
    }
  };

  /// Local file could not be read, written or renamed.
  struct io_error : public virtual sendme_exception {};

  /**
   *  Ticket text could not be decoded.  The reason() tells which
   *  check rejected it.
   */
  struct ticket_parse_error : public virtual sendme_exception {
    enum reason_enum {
      malformed       = 0,
      truncated       = 1,
      bad_checksum    = 2,
      unknown_version = 3
    };
    reason_enum reason()const {
      const int* r = boost::get_error_info<parse_reason>(*this);
      return r ? reason_enum(*r) : malformed;
    }
  };

  /// Every connection stage failed; attempted() lists them in order.
  struct connection_error : public virtual sendme_exception {
    std::vector<std::string> attempted()const {
      const std::vector<std::string>* a = boost::get_error_info<attempted_paths>(*this);
      return a ? *a : std::vector<std::string>();
    }
  };

  struct hash_mismatch : public virtual sendme_exception {};
  struct cancelled     : public virtual sendme_exception {};

} // namespace sm

/**
 *  Helper macro for throwing exceptions with a message:
 *
 *  SENDME_THROW( sm::io_error, "unable to open %1%: %2%", %path %why )
 */
#define SENDME_THROW( EXCEPTION, MSG, ... ) \
  do { \
    BOOST_THROW_EXCEPTION( EXCEPTION() << sm::err_msg( (boost::format( MSG ) __VA_ARGS__ ).str() ) );\
  } while(0)

#endif // _SENDME_ERROR_HPP_
