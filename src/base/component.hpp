#ifndef QSTORE_BASE_COMPONENT_HPP
#define QSTORE_BASE_COMPONENT_HPP

#include <string>

namespace qstore::base {

  /**
   * Named component of the node, the name is used in logs
   */
  class Component {
   public:
    virtual ~Component() = default;
    virtual std::string GetName() = 0;
  };

}  // namespace qstore::base

#endif  // QSTORE_BASE_COMPONENT_HPP
