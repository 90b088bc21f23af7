#include "InformationSource.h"

td::Status QueryContext::check() const {
  if (cancellation_token) {
    return td::Status::Error(ErrorCode::CANCELLED, "query cancelled");
  }
  if (deadline && deadline.is_in_past()) {
    return td::Status::Error(ErrorCode::TIMEOUT, "query deadline exceeded");
  }
  return td::Status::OK();
}
