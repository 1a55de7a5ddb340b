#ifndef QSTORE_APPLICATION_PT_UTIL_HPP
#define QSTORE_APPLICATION_PT_UTIL_HPP

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "application/impl/config_reader/error.hpp"

namespace qstore::application {

  template <typename T>
  outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt_entry) {
    if (!opt_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    return opt_entry.value();
  }

  /**
   * Read an optional entry, falling back to a default when it is absent
   * @return INVALID_VALUE if the entry is present but does not convert to T
   */
  template <typename T>
  outcome::result<T> optionalEntry(const boost::property_tree::ptree &tree,
                                   const std::string &path,
                                   T default_value) {
    auto child = tree.get_child_optional(path);
    if (!child) {
      return default_value;
    }
    auto value = child->get_value_optional<T>();
    if (!value) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return value.value();
  }

}  // namespace qstore::application

#endif  // QSTORE_APPLICATION_PT_UTIL_HPP
