#ifndef _SENDME_PATH_TYPE_HPP_
#define _SENDME_PATH_TYPE_HPP_

namespace sm {

  /// how the bytes of a connection travel between the two peers
  enum path_type {
    direct_path       = 0,
    hole_punched_path = 1,
    relayed_path      = 2
  };

  const char* to_string( path_type p );

} // namespace sm

#endif // _SENDME_PATH_TYPE_HPP_
