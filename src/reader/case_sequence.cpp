/**
 * @file case_sequence.cpp
 * @brief Lazy case sequence
 */

#include "reader/case_sequence.h"

namespace casereader::reader {

utils::Expected<bool, utils::Error> CaseSequence::Next() {
  if (position_ >= plan_.size()) {
    current_.reset();
    return false;
  }
  auto fetched = fetch_(plan_[position_]);
  if (!fetched) {
    return utils::MakeUnexpected(fetched.error());
  }
  ++position_;
  current_ = std::move(*fetched);
  return true;
}

utils::Expected<std::vector<cases::CasePtr>, utils::Error> CaseSequence::Collect() {
  std::vector<cases::CasePtr> collected;
  collected.reserve(plan_.size() - position_);
  while (true) {
    auto more = Next();
    if (!more) {
      return utils::MakeUnexpected(more.error());
    }
    if (!*more) {
      break;
    }
    collected.push_back(current_);
  }
  return collected;
}

}  // namespace casereader::reader
