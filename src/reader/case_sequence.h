/**
 * @file case_sequence.h
 * @brief Lazy, restartable sequence of cases
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "cases/case.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::reader {

/**
 * @brief Forward-only sequence over a planned list of case keys
 *
 * The key list is fixed when the sequence is created; each case is fetched
 * and decoded only when Next() reaches it. A sequence must not outlive the
 * CaseReader that produced it.
 *
 * @code
 * auto cases = reader->GetCases("driver");
 * while (true) {
 *   auto more = cases->Next();
 *   if (!more) { return MakeUnexpected(more.error()); }
 *   if (!*more) { break; }
 *   Use(cases->Current());
 * }
 * @endcode
 */
class CaseSequence {
 public:
  struct Entry {
    cases::Category category;
    std::string key;
  };

  using Fetcher = std::function<utils::Expected<cases::CasePtr, utils::Error>(const Entry&)>;

  CaseSequence(std::vector<Entry> plan, Fetcher fetch) : plan_(std::move(plan)), fetch_(std::move(fetch)) {}

  /**
   * @brief Fetch the next case
   * @return false when the sequence is exhausted
   */
  utils::Expected<bool, utils::Error> Next();

  [[nodiscard]] const cases::CasePtr& Current() const { return current_; }

  /// Rewind to the first case
  void Restart() {
    position_ = 0;
    current_.reset();
  }

  /// Number of cases in the sequence
  [[nodiscard]] size_t Size() const { return plan_.size(); }

  [[nodiscard]] const std::vector<Entry>& Plan() const { return plan_; }

  /**
   * @brief Fetch every remaining case
   */
  utils::Expected<std::vector<cases::CasePtr>, utils::Error> Collect();

 private:
  std::vector<Entry> plan_;
  Fetcher fetch_;
  size_t position_ = 0;
  cases::CasePtr current_;
};

}  // namespace casereader::reader
