#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::db {

/*
  Run fn(tx) and commit, retrying the whole unit of work when the
  backend reports a conflicting concurrent writer. Any other exception
  escapes and the transaction rolls back in its destructor.
*/
template <typename Fn>
auto RunInTransaction(Repository& repository, Fn&& fn, int max_attempts = 8) {
  using R = std::invoke_result_t<Fn&, Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const TransactionConflict& e) {
      if (attempt >= max_attempts) {
        throw util::TransientIo(std::string("transaction retries exhausted: ") + e.what());
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
  }
}

/*
  Read-only view. The transaction is dropped (rolled back) afterwards.
*/
template <typename Fn>
auto ReadInTransaction(Repository& repository, Fn&& fn) {
  auto tx = repository.Begin();
  return fn(*tx);
}

} // namespace vidpipe::db
