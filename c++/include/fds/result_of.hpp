#ifndef FDS_RESULT_OF_HPP
#define FDS_RESULT_OF_HPP

#include <boost/utility/result_of.hpp>
#include <type_traits>

namespace fds {

// Decayed return type of calling F with Args.
template <typename F, typename... Args>
using ResultOf = typename std::decay<typename boost::result_of<F(Args...)>::type>::type;

} // namespace fds

#endif
