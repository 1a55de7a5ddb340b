#include "base/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::base, BlobError, e) {
  using qstore::base::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace qstore::base {

  template class Blob<20ul>;
  template class Blob<32ul>;
  template class Blob<64ul>;

}  // namespace qstore::base
