#ifndef FDS_ERRORS_HPP
#define FDS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace fds {

class EmptyListError : public std::runtime_error {
public:
    EmptyListError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace fds

#endif
