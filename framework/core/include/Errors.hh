/* -- C++ -- */
/**
 *  @file  core/include/Errors.hh
 *
 *  @brief Exception types raised when a data, mapping, or join operation is
 *         called with arguments or collaborators it cannot work with.
 */
#ifndef EVE_CORE_ERRORS_H
#define EVE_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace eve
{

class InvalidArgument : public std::invalid_argument
{
  public:
    explicit InvalidArgument(const std::string &what) : std::invalid_argument(what) {}
};

// A required collaborator (scan file, timestamp table) is absent.
class MissingDependency : public InvalidArgument
{
  public:
    explicit MissingDependency(const std::string &what) : InvalidArgument(what) {}
};

} // namespace eve

#endif // EVE_CORE_ERRORS_H
